#include "task_registry.hpp"

#include <algorithm>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace mediaforge::registry {

using model::TaskStatus;
using observability::IntField;
using observability::StringField;

model::TaskRecord& TaskRegistry::MutableLocked(const std::string& task_id, TaskStatus next) {
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) {
    throw util::NotFound("task not found: " + task_id);
  }
  const auto current = it->second.status;
  if (!model::CanTransition(current, next)) {
    throw util::InvalidState("task " + task_id + " cannot go from " + std::string(model::TaskStatusName(current)) + " to " +
                             std::string(model::TaskStatusName(next)));
  }
  return it->second;
}

std::string TaskRegistry::Create(model::TaskKind kind, std::optional<std::string> owner) {
  model::TaskRecord record;
  record.id         = util::NewId();
  record.kind       = kind;
  record.status     = TaskStatus::kQueued;
  record.message    = "queued";
  record.created_at = util::Now();
  record.updated_at = record.created_at;
  record.owner      = std::move(owner);

  const std::string id = record.id;
  {
    std::unique_lock lock(mutex_);
    tasks_.emplace(id, std::move(record));
  }

  MEDIAFORGE_LOG_DEBUG("task created", {StringField("task_id", id), StringField("kind", model::TaskKindName(kind))});
  return id;
}

void TaskRegistry::MarkRunning(const std::string& task_id, const std::string& message) {
  {
    std::unique_lock lock(mutex_);
    auto&            record = MutableLocked(task_id, TaskStatus::kRunning);
    record.status           = TaskStatus::kRunning;
    record.message          = message;
    record.updated_at       = util::Now();
  }
  MEDIAFORGE_LOG_INFO("task running", {StringField("task_id", task_id)});
}

void TaskRegistry::Update(const std::string& task_id, int progress, const std::string& message) {
  std::unique_lock lock(mutex_);
  // Progress is reported by a worker that already moved the task to RUNNING.
  auto& record = MutableLocked(task_id, TaskStatus::kRunning);

  record.progress = std::clamp(progress, record.progress, std::max(record.progress, 99));
  if (!message.empty()) {
    record.message = message;
  }
  record.updated_at = util::Now();
}

void TaskRegistry::Complete(const std::string& task_id, model::TaskResult result) {
  const auto size = result.size_bytes;
  {
    std::unique_lock lock(mutex_);
    auto&            record = MutableLocked(task_id, TaskStatus::kReady);
    record.status           = TaskStatus::kReady;
    record.progress         = 100;
    record.message          = "ready";
    record.result           = std::move(result);
    record.updated_at       = util::Now();
  }
  MEDIAFORGE_LOG_INFO("task ready", {StringField("task_id", task_id), IntField("size_bytes", static_cast<std::int64_t>(size))});
}

void TaskRegistry::Fail(const std::string& task_id, model::TaskError error) {
  const auto kind = error.kind;
  {
    std::unique_lock lock(mutex_);
    auto&            record = MutableLocked(task_id, TaskStatus::kError);
    record.status           = TaskStatus::kError;
    record.message          = error.detail;
    record.error            = std::move(error);
    record.updated_at       = util::Now();
  }
  MEDIAFORGE_LOG_WARN("task failed", {StringField("task_id", task_id), StringField("error_kind", util::ErrorKindName(kind))});
}

model::TaskRecord TaskRegistry::Get(const std::string& task_id) const {
  auto record = Find(task_id);
  if (!record) {
    throw util::NotFound("task not found: " + task_id);
  }
  return std::move(*record);
}

std::optional<model::TaskRecord> TaskRegistry::Find(const std::string& task_id) const {
  std::shared_lock lock(mutex_);
  auto             it = tasks_.find(task_id);
  if (it == tasks_.end()) return std::nullopt;
  return it->second;
}

bool TaskRegistry::Delete(const std::string& task_id) {
  std::unique_lock lock(mutex_);
  return tasks_.erase(task_id) > 0;
}

std::vector<model::TaskRecord> TaskRegistry::List() const {
  std::shared_lock lock(mutex_);

  std::vector<model::TaskRecord> out;
  out.reserve(tasks_.size());
  for (const auto& [_, record] : tasks_) {
    out.push_back(record);
  }
  return out;
}

std::size_t TaskRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return tasks_.size();
}

} // namespace mediaforge::registry
