#include "cleanup_manager.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mediaforge::cleanup {

using observability::IntField;
using observability::StringField;

CleanupManager::CleanupManager(std::shared_ptr<registry::TaskRegistry> registry, std::shared_ptr<storage::Workspace> workspace,
                               std::shared_ptr<asset::AssetStore> assets, std::chrono::milliseconds retention,
                               std::chrono::milliseconds sweep_interval)
    : registry_(std::move(registry)),
      workspace_(std::move(workspace)),
      assets_(std::move(assets)),
      retention_(retention),
      sweep_interval_(sweep_interval) {
}

CleanupManager::~CleanupManager() {
  Stop();
}

bool CleanupManager::Cleanup(const std::string& task_id) {
  std::lock_guard remove_lock(remove_mutex_);

  const auto record = registry_->Find(task_id);
  if (!record) {
    MEDIAFORGE_LOG_DEBUG("cleanup of unknown task", {StringField("task_id", task_id)});
    return false;
  }
  if (!model::IsTerminal(record->status)) {
    throw util::Busy("task " + task_id + " is still " + std::string(model::TaskStatusName(record->status)));
  }

  const auto freed = workspace_->RemoveTaskDir(task_id);
  registry_->Delete(task_id);

  MEDIAFORGE_LOG_INFO("task cleaned up", {StringField("task_id", task_id), IntField("bytes", static_cast<std::int64_t>(freed))});
  return true;
}

SweepStats CleanupManager::Sweep(util::TimePoint now) {
  std::lock_guard remove_lock(remove_mutex_);

  SweepStats stats;
  for (const auto& record : registry_->List()) {
    if (!model::IsTerminal(record.status)) continue;
    if (now - record.created_at < retention_) continue;

    try {
      stats.bytes_freed += workspace_->RemoveTaskDir(record.id);
    } catch (const util::IOFailure& e) {
      // Keep the record so the next sweep retries the directory.
      MEDIAFORGE_LOG_WARN("sweep could not remove task files", {StringField("task_id", record.id), StringField("error", e.what())});
      continue;
    }
    registry_->Delete(record.id);
    ++stats.tasks_removed;
  }

  if (assets_) {
    for (const auto& asset : assets_->List()) {
      if (now - asset.created_at < retention_) continue;
      if (assets_->leases().IsHeld(asset.id)) continue;

      try {
        if (assets_->Remove(asset.id)) ++stats.assets_removed;
      } catch (const util::MediaError& e) {
        // Busy (an edit started meanwhile) or IOFailure: retry next sweep.
        MEDIAFORGE_LOG_WARN("sweep skipped asset", {StringField("asset_id", asset.id), StringField("error", e.what())});
      }
    }
  }

  if (stats.tasks_removed || stats.assets_removed) {
    MEDIAFORGE_LOG_INFO("retention sweep", {IntField("tasks", static_cast<std::int64_t>(stats.tasks_removed)),
                                            IntField("assets", static_cast<std::int64_t>(stats.assets_removed)),
                                            IntField("bytes", static_cast<std::int64_t>(stats.bytes_freed))});
  }
  return stats;
}

void CleanupManager::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&CleanupManager::Run, this);
}

void CleanupManager::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void CleanupManager::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, sweep_interval_, [&] { return !running_; })) break;

    lock.unlock();
    try {
      Sweep(util::Now());
    } catch (const std::exception& e) {
      MEDIAFORGE_LOG_ERROR("retention sweep failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace mediaforge::cleanup
