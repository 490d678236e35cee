#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/asset/media_inspector.hpp"
#include "internal/lease/edit_lease_table.hpp"
#include "internal/model/media_asset.hpp"
#include "internal/storage/workspace.hpp"

namespace mediaforge::asset {

/*
  Uploaded media assets and their per-asset edit lease.

  Asset records live in memory only; files live under the workspace's
  asset directory and are removed with the record.
*/
class AssetStore {
 public:
  AssetStore(std::shared_ptr<storage::Workspace> workspace, std::shared_ptr<MediaInspector> inspector);

  // Stores the bytes, inspects them and records the asset.
  // Throws util::InvalidSource for empty or unreadable media.
  model::MediaAsset Import(std::string_view original_name, std::string_view data);

  // Throws util::NotFound.
  model::MediaAsset Get(const std::string& asset_id) const;

  std::optional<model::MediaAsset> Find(const std::string& asset_id) const;

  void RecordExtraction(const std::string& asset_id, const std::filesystem::path& audio_path);

  // Throws util::Busy while an edit holds the asset. Unknown ids are ignored.
  bool Remove(const std::string& asset_id);

  std::vector<model::MediaAsset> List() const;

  lease::EditLeaseTable& leases() {
    return leases_;
  }

 private:
  std::shared_ptr<storage::Workspace> workspace_;
  std::shared_ptr<MediaInspector>     inspector_;

  lease::EditLeaseTable leases_;

  mutable std::shared_mutex                          mutex_;
  std::unordered_map<std::string, model::MediaAsset> assets_;
};

} // namespace mediaforge::asset
