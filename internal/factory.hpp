#pragma once

#include <memory>

#include "internal/config/settings.hpp"

namespace mediaforge::registry { class TaskRegistry; }
namespace mediaforge::process { class ProcessRunner; }
namespace mediaforge::storage { class Workspace; }
namespace mediaforge::probe { class FormatProber; }
namespace mediaforge::worker { class TaskDispatcher; }
namespace mediaforge::asset { class AssetStore; }
namespace mediaforge::cleanup { class CleanupManager; }
namespace mediaforge::service { class MediaService; }

namespace mediaforge::factory {

/*
  Application

  Owns every long-lived component. Nothing here is a global; the
  transport layer receives the service facade from this struct.

  Workers reference the executors held by `service`, so destruction
  joins them first. A moved-from Application owns nothing.
*/
struct Application {
  Application() = default;
  ~Application();

  Application(Application&&)            = default;
  Application& operator=(Application&&) = default;
  Application(const Application&)            = delete;
  Application& operator=(const Application&) = delete;

  config::Settings settings;

  std::shared_ptr<registry::TaskRegistry>   registry;
  std::shared_ptr<process::ProcessRunner>   runner;
  std::shared_ptr<storage::Workspace>       workspace;
  std::shared_ptr<probe::FormatProber>      prober;
  std::shared_ptr<worker::TaskDispatcher>   dispatcher;
  std::shared_ptr<asset::AssetStore>        assets;
  std::shared_ptr<cleanup::CleanupManager>  cleanup;
  std::shared_ptr<service::MediaService>    service;

  // Stops the sweep and joins every worker. Safe to call more than once.
  void Shutdown();
};

/*
  Build

  Composition root. Creates the storage layout and starts the retention
  sweep. A non-null prober replaces the yt-dlp one.
*/
Application Build(const config::Settings& settings, std::shared_ptr<probe::FormatProber> prober = nullptr);

} // namespace mediaforge::factory
