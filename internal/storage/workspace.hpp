#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace mediaforge::storage {

// Throws std::invalid_argument unless id is a single, non-relative path component.
void ValidateId(const std::string& id);

// Lowercase alphanumerics only, at most 8 characters; empty when nothing survives.
std::string SanitizeExtension(std::string_view ext);

// Keeps [A-Za-z0-9._-], collapses the rest to '_', strips leading dots.
std::string SanitizeFileName(std::string_view name);

/*
  Core-owned on-disk layout:

    <root>/tasks/<task_id>/    artifacts of one fetch or edit task
    <root>/assets/<asset_id>/  one uploaded asset plus its extractions

  Every id is validated before it becomes a path component.
*/
class Workspace {
 public:
  explicit Workspace(std::filesystem::path root);

  const std::filesystem::path& Root() const {
    return root_;
  }

  // Creates <root>/tasks and <root>/assets; throws util::IOFailure.
  void EnsureLayout() const;

  std::filesystem::path TaskDir(const std::string& task_id) const;
  std::filesystem::path AssetDir(const std::string& asset_id) const;

  // Creates the directory if needed; throws util::IOFailure.
  std::filesystem::path EnsureTaskDir(const std::string& task_id) const;
  std::filesystem::path EnsureAssetDir(const std::string& asset_id) const;

  // Recursive remove; missing directories are fine. Returns bytes freed.
  uint64_t RemoveTaskDir(const std::string& task_id) const;
  uint64_t RemoveAssetDir(const std::string& asset_id) const;

  // "/download/<task_id>/<file name>"
  static std::string DownloadReference(const std::string& task_id, const std::filesystem::path& artifact);

 private:
  uint64_t RemoveTree(const std::filesystem::path& dir) const;
  std::filesystem::path Ensure(const std::filesystem::path& dir) const;

  std::filesystem::path root_;
};

} // namespace mediaforge::storage
