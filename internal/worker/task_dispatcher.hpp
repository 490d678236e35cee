#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "internal/registry/task_registry.hpp"

namespace mediaforge::worker {

// Drives one task to completion; must call TaskRegistry::Complete on success.
using TaskJob = std::function<void(const std::string& task_id)>;

/*
  One worker thread per accepted task.

  The worker marks its task RUNNING before the job starts. Anything the
  job throws becomes a terminal ERROR on that task: MediaError keeps its
  kind, other exceptions are INTERNAL. A job that returns without a
  terminal state is failed as INTERNAL.

  Finished threads are joined lazily on the next Dispatch, and all of
  them on Shutdown.
*/
class TaskDispatcher {
 public:
  explicit TaskDispatcher(std::shared_ptr<registry::TaskRegistry> registry);
  ~TaskDispatcher();

  TaskDispatcher(const TaskDispatcher&)            = delete;
  TaskDispatcher& operator=(const TaskDispatcher&) = delete;

  // Throws util::InvalidState after Shutdown.
  void Dispatch(const std::string& task_id, TaskJob job);

  // Blocks until no worker is running.
  void WaitIdle();

  void Shutdown();

  std::size_t Running() const;

 private:
  struct Worker {
    std::thread                        thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void RunJob(const std::string& task_id, const TaskJob& job);
  void ReapLocked();

  std::shared_ptr<registry::TaskRegistry> registry_;

  mutable std::mutex      mutex_;
  std::condition_variable idle_cv_;
  std::list<Worker>       workers_;
  std::size_t             running_  = 0;
  bool                    shutdown_ = false;
};

} // namespace mediaforge::worker
