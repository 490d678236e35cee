#include "workspace.hpp"

#include <cctype>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mediaforge::storage {

namespace fs = std::filesystem;

void ValidateId(const std::string& id) {
  if (id.empty()) {
    throw std::invalid_argument("id must not be empty");
  }
  for (char c : id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("id contains invalid character");
    }
  }
  if (id == "." || id == "..") {
    throw std::invalid_argument("id must not be a relative path component");
  }
}

std::string SanitizeExtension(std::string_view ext) {
  if (!ext.empty() && ext.front() == '.') ext.remove_prefix(1);

  std::string out;
  for (char c : ext) {
    if (!std::isalnum(static_cast<unsigned char>(c))) return {};
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (out.size() > 8) return {};
  return out;
}

std::string SanitizeFileName(std::string_view name) {
  // Only the last component of whatever the client sent.
  if (auto slash = name.find_last_of("/\\"); slash != std::string_view::npos) {
    name.remove_prefix(slash + 1);
  }

  std::string out;
  bool        last_was_sub = false;
  for (char c : name) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) || c == '.' || c == '-' || c == '_') {
      out.push_back(c);
      last_was_sub = false;
    } else if (!last_was_sub) {
      out.push_back('_');
      last_was_sub = true;
    }
  }

  const auto first = out.find_first_not_of('.');
  out              = first == std::string::npos ? std::string{} : out.substr(first);
  if (out.size() > 128) out.resize(128);
  return out.empty() ? "upload" : out;
}

Workspace::Workspace(fs::path root) : root_(std::move(root)) {
}

void Workspace::EnsureLayout() const {
  Ensure(root_ / "tasks");
  Ensure(root_ / "assets");
}

fs::path Workspace::TaskDir(const std::string& task_id) const {
  ValidateId(task_id);
  return root_ / "tasks" / task_id;
}

fs::path Workspace::AssetDir(const std::string& asset_id) const {
  ValidateId(asset_id);
  return root_ / "assets" / asset_id;
}

fs::path Workspace::EnsureTaskDir(const std::string& task_id) const {
  return Ensure(TaskDir(task_id));
}

fs::path Workspace::EnsureAssetDir(const std::string& asset_id) const {
  return Ensure(AssetDir(asset_id));
}

fs::path Workspace::Ensure(const fs::path& dir) const {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw util::IOFailure("create " + dir.string() + ": " + ec.message());
  }
  return dir;
}

uint64_t Workspace::RemoveTaskDir(const std::string& task_id) const {
  return RemoveTree(TaskDir(task_id));
}

uint64_t Workspace::RemoveAssetDir(const std::string& asset_id) const {
  return RemoveTree(AssetDir(asset_id));
}

uint64_t Workspace::RemoveTree(const fs::path& dir) const {
  std::error_code ec;
  if (!fs::exists(dir, ec)) return 0;

  uint64_t freed = 0;
  for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    std::error_code size_ec;
    if (it->is_regular_file(size_ec)) {
      const auto size = it->file_size(size_ec);
      if (!size_ec) freed += size;
    }
  }

  fs::remove_all(dir, ec);
  if (ec) {
    throw util::IOFailure("remove " + dir.string() + ": " + ec.message());
  }

  MEDIAFORGE_LOG_DEBUG("removed directory", {observability::StringField("path", dir.string()),
                                             observability::IntField("bytes", static_cast<std::int64_t>(freed))});
  return freed;
}

std::string Workspace::DownloadReference(const std::string& task_id, const fs::path& artifact) {
  return "/download/" + task_id + "/" + artifact.filename().string();
}

} // namespace mediaforge::storage
