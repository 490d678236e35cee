#pragma once

#include <cstddef>
#include <memory>

namespace mediaforge::registry { class TaskRegistry; }
namespace mediaforge::probe { class FormatProber; }
namespace mediaforge::download { class DownloadExecutor; }
namespace mediaforge::audio { class AudioEditExecutor; }
namespace mediaforge::asset { class AssetStore; }
namespace mediaforge::cleanup { class CleanupManager; }

namespace mediaforge::service {

/*
  Dependency container for the request-boundary facade.
*/
struct ServiceContext {
  std::shared_ptr<registry::TaskRegistry>     registry;
  std::shared_ptr<probe::FormatProber>        prober;
  std::shared_ptr<download::DownloadExecutor> downloads;
  std::shared_ptr<audio::AudioEditExecutor>   edits;
  std::shared_ptr<asset::AssetStore>          assets;
  std::shared_ptr<cleanup::CleanupManager>    cleanup;

  std::size_t artifact_chunk_bytes = 1024 * 1024;
};

} // namespace mediaforge::service
