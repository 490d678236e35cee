#include "task_dispatcher.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mediaforge::worker {

using observability::StringField;

TaskDispatcher::TaskDispatcher(std::shared_ptr<registry::TaskRegistry> registry) : registry_(std::move(registry)) {
}

TaskDispatcher::~TaskDispatcher() {
  Shutdown();
}

void TaskDispatcher::Dispatch(const std::string& task_id, TaskJob job) {
  std::unique_lock lock(mutex_);
  if (shutdown_) {
    lock.unlock();
    registry_->Fail(task_id, {util::ErrorKind::kInternal, "server is shutting down"});
    throw util::InvalidState("dispatcher is shut down");
  }
  ReapLocked();

  auto        done = std::make_shared<std::atomic<bool>>(false);
  std::thread thread;
  try {
    // The worker cannot decrement running_ before we count it: we hold mutex_.
    thread = std::thread([this, task_id, job = std::move(job), done] {
      RunJob(task_id, job);
      {
        std::lock_guard inner(mutex_);
        --running_;
        done->store(true);
      }
      idle_cv_.notify_all();
    });
  } catch (const std::system_error& e) {
    lock.unlock();
    MEDIAFORGE_LOG_ERROR("worker thread not started", {StringField("task_id", task_id), StringField("error", e.what())});
    registry_->Fail(task_id, {util::ErrorKind::kInternal, std::string("worker not started: ") + e.what()});
    throw;
  }
  ++running_;
  workers_.push_back(Worker{std::move(thread), done});
}

void TaskDispatcher::RunJob(const std::string& task_id, const TaskJob& job) {
  std::optional<model::TaskError> failure;

  try {
    registry_->MarkRunning(task_id, "running");
    job(task_id);
  } catch (const util::MediaError& e) {
    failure = model::TaskError{e.kind(), e.what()};
  } catch (const std::exception& e) {
    failure = model::TaskError{util::ErrorKind::kInternal, e.what()};
  } catch (...) {
    failure = model::TaskError{util::ErrorKind::kInternal, "worker threw a non-standard exception"};
  }

  auto record = registry_->Find(task_id);
  if (!record || model::IsTerminal(record->status)) {
    if (failure) {
      MEDIAFORGE_LOG_ERROR("worker failed after task settled", {StringField("task_id", task_id), StringField("error", failure->detail)});
    }
    return;
  }

  if (!failure) {
    failure = model::TaskError{util::ErrorKind::kInternal, "worker finished without a result"};
  }
  registry_->Fail(task_id, std::move(*failure));
}

void TaskDispatcher::ReapLocked() {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (it->done->load()) {
      it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void TaskDispatcher::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_cv_.wait(lock, [&] { return running_ == 0; });
}

void TaskDispatcher::Shutdown() {
  std::list<Worker> workers;
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
    workers.swap(workers_);
  }
  for (auto& w : workers) {
    if (w.thread.joinable()) w.thread.join();
  }
}

std::size_t TaskDispatcher::Running() const {
  std::lock_guard lock(mutex_);
  return running_;
}

} // namespace mediaforge::worker
