#pragma once

#include <cstdint>
#include <string_view>

namespace mediaforge::model {

enum class TaskKind : std::uint8_t {
  kFetch     = 1,
  kAudioEdit = 2,
};

enum class TaskStatus : std::uint8_t {
  kQueued  = 1,
  kRunning = 2,
  kReady   = 3,
  kError   = 4,
};

constexpr bool IsTerminal(TaskStatus status) {
  return status == TaskStatus::kReady || status == TaskStatus::kError;
}

/*
  QUEUED -> RUNNING -> {READY, ERROR}

  QUEUED may fail directly (a worker that dies before it starts its
  process). Terminal states never transition again.
*/
constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (to) {
    case TaskStatus::kQueued:
      return false;
    case TaskStatus::kRunning:
      return from == TaskStatus::kQueued || from == TaskStatus::kRunning;
    case TaskStatus::kReady:
      return from == TaskStatus::kRunning;
    case TaskStatus::kError:
      return true;
  }
  return false;
}

constexpr std::string_view TaskStatusName(TaskStatus status) {
  switch (status) {
    case TaskStatus::kQueued:
      return "queued";
    case TaskStatus::kRunning:
      return "running";
    case TaskStatus::kReady:
      return "ready";
    case TaskStatus::kError:
      return "error";
  }
  return "unknown";
}

constexpr std::string_view TaskKindName(TaskKind kind) {
  return kind == TaskKind::kFetch ? "fetch" : "audio-edit";
}

} // namespace mediaforge::model
