#include "asset_store.hpp"

#include <fstream>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace mediaforge::asset {

namespace fs = std::filesystem;

using observability::BoolField;
using observability::DoubleField;
using observability::StringField;

AssetStore::AssetStore(std::shared_ptr<storage::Workspace> workspace, std::shared_ptr<MediaInspector> inspector)
    : workspace_(std::move(workspace)), inspector_(std::move(inspector)) {
}

model::MediaAsset AssetStore::Import(std::string_view original_name, std::string_view data) {
  if (data.empty()) {
    throw util::InvalidSource("upload is empty");
  }

  model::MediaAsset asset;
  asset.id            = util::NewId();
  asset.original_name = storage::SanitizeFileName(original_name);
  asset.created_at    = util::Now();

  auto ext = storage::SanitizeExtension(fs::path(asset.original_name).extension().string());
  if (ext.empty()) ext = "bin";

  const auto dir    = workspace_->EnsureAssetDir(asset.id);
  asset.stored_path = dir / ("source." + ext);

  try {
    {
      std::ofstream out(asset.stored_path, std::ios::binary | std::ios::trunc);
      out.write(data.data(), static_cast<std::streamsize>(data.size()));
      if (!out) {
        throw util::IOFailure("write " + asset.stored_path.string() + " failed");
      }
    }

    const auto info = inspector_->Inspect(asset.stored_path);
    if (!info.has_audio) {
      throw util::InvalidSource("upload has no audio stream");
    }
    asset.duration_seconds = info.duration_seconds;
    asset.is_container     = info.has_video;
  } catch (const std::exception&) {
    workspace_->RemoveAssetDir(asset.id);
    throw;
  }

  {
    std::unique_lock lock(mutex_);
    assets_.emplace(asset.id, asset);
  }

  MEDIAFORGE_LOG_INFO("asset stored", {StringField("asset_id", asset.id), StringField("name", asset.original_name),
                                       DoubleField("duration_s", asset.duration_seconds), BoolField("container", asset.is_container)});
  return asset;
}

model::MediaAsset AssetStore::Get(const std::string& asset_id) const {
  auto asset = Find(asset_id);
  if (!asset) {
    throw util::NotFound("asset not found: " + asset_id);
  }
  return std::move(*asset);
}

std::optional<model::MediaAsset> AssetStore::Find(const std::string& asset_id) const {
  std::shared_lock lock(mutex_);
  auto             it = assets_.find(asset_id);
  if (it == assets_.end()) return std::nullopt;
  return it->second;
}

void AssetStore::RecordExtraction(const std::string& asset_id, const fs::path& audio_path) {
  std::unique_lock lock(mutex_);
  auto             it = assets_.find(asset_id);
  if (it == assets_.end()) {
    throw util::NotFound("asset not found: " + asset_id);
  }
  it->second.extracted_audio_path = audio_path;
}

bool AssetStore::Remove(const std::string& asset_id) {
  // Holding the lease keeps a new edit from starting while files go away.
  const auto holder = "remove-" + util::NewId();
  if (!leases_.TryAcquire(asset_id, holder)) {
    throw util::Busy("asset is being edited: " + asset_id);
  }
  lease::EditLease lease(leases_, asset_id, holder);

  {
    std::unique_lock lock(mutex_);
    if (assets_.erase(asset_id) == 0) return false;
  }
  workspace_->RemoveAssetDir(asset_id);

  MEDIAFORGE_LOG_INFO("asset removed", {StringField("asset_id", asset_id)});
  return true;
}

std::vector<model::MediaAsset> AssetStore::List() const {
  std::shared_lock lock(mutex_);

  std::vector<model::MediaAsset> out;
  out.reserve(assets_.size());
  for (const auto& [_, asset] : assets_) out.push_back(asset);
  return out;
}

} // namespace mediaforge::asset
