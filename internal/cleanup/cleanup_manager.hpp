#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/asset/asset_store.hpp"
#include "internal/registry/task_registry.hpp"
#include "internal/storage/workspace.hpp"

namespace mediaforge::cleanup {

struct SweepStats {
  std::size_t tasks_removed  = 0;
  std::size_t assets_removed = 0;
  uint64_t    bytes_freed    = 0;
};

/*
  Removes task records and their artifacts.

  Two triggers:
    Cleanup(task_id)  client confirmed it has the artifact
    Sweep()           retention expiry, run periodically by Start()

  Both are idempotent. A QUEUED or RUNNING task is never removed:
  explicit cleanup throws util::Busy, the sweep skips it. The sweep also
  expires uploaded assets not under an edit lease. Retention is measured
  from creation time.
*/
class CleanupManager {
 public:
  CleanupManager(std::shared_ptr<registry::TaskRegistry> registry, std::shared_ptr<storage::Workspace> workspace,
                 std::shared_ptr<asset::AssetStore> assets, std::chrono::milliseconds retention, std::chrono::milliseconds sweep_interval);
  ~CleanupManager();

  // Unknown ids succeed. Returns whether a record was removed.
  bool Cleanup(const std::string& task_id);

  SweepStats Sweep(util::TimePoint now);

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<registry::TaskRegistry> registry_;
  std::shared_ptr<storage::Workspace>     workspace_;
  std::shared_ptr<asset::AssetStore>      assets_;
  std::chrono::milliseconds               retention_;
  std::chrono::milliseconds               sweep_interval_;

  // Serializes removal so a sweep and an explicit cleanup never race on one directory.
  std::mutex remove_mutex_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace mediaforge::cleanup
