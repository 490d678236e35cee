#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "internal/model/task_state.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace mediaforge::model {

struct TaskResult {
  std::filesystem::path artifact_path;
  std::string           extension;  // without the dot, e.g. "mp4"
  uint64_t              size_bytes = 0;
  std::string           download_reference;
};

struct TaskError {
  util::ErrorKind kind = util::ErrorKind::kInternal;
  std::string     detail;
};

/*
  One unit of asynchronous fetch-or-edit work.

  Invariants (kept by TaskRegistry):
  - status READY xor ERROR once terminal
  - progress == 100 iff status == READY
  - progress never decreases
*/
struct TaskRecord {
  std::string id;
  TaskKind    kind   = TaskKind::kFetch;
  TaskStatus  status = TaskStatus::kQueued;
  int         progress = 0;
  std::string message;

  util::TimePoint created_at;
  util::TimePoint updated_at;

  std::optional<TaskResult> result;
  std::optional<TaskError>  error;

  // Asset id for edit tasks.
  std::optional<std::string> owner;
};

} // namespace mediaforge::model
