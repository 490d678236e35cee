#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/task.hpp"

namespace mediaforge::registry {

/*
  In-memory task table.

  Each task id has exactly one writer (its worker); status pollers read
  concurrently. Reads take a shared lock, writes an exclusive one. No I/O
  happens under the lock.

  Ephemeral: nothing survives a restart.
*/
class TaskRegistry {
 public:
  std::string Create(model::TaskKind kind, std::optional<std::string> owner = std::nullopt);

  void MarkRunning(const std::string& task_id, const std::string& message);

  // Progress is clamped to [current, 99]; only Complete reaches 100.
  void Update(const std::string& task_id, int progress, const std::string& message);

  void Complete(const std::string& task_id, model::TaskResult result);

  void Fail(const std::string& task_id, model::TaskError error);

  // Throws util::NotFound.
  model::TaskRecord Get(const std::string& task_id) const;

  std::optional<model::TaskRecord> Find(const std::string& task_id) const;

  // Idempotent; returns whether a record was removed.
  bool Delete(const std::string& task_id);

  std::vector<model::TaskRecord> List() const;

  std::size_t Size() const;

 private:
  // Throws NotFound, or InvalidState unless the record may move to `next`.
  model::TaskRecord& MutableLocked(const std::string& task_id, model::TaskStatus next);

  mutable std::shared_mutex                          mutex_;
  std::unordered_map<std::string, model::TaskRecord> tasks_;
};

} // namespace mediaforge::registry
