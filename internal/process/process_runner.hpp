#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "internal/process/progress_parser.hpp"

namespace mediaforge::process {

struct Invocation {
  std::string              program;
  std::vector<std::string> args;

  ProgressConvention progress         = ProgressConvention::kNone;
  double             expected_seconds = 0.0;  // ffmpeg convention only

  // Zero uses the runner default.
  std::chrono::milliseconds timeout{0};

  // Count time spent waiting for a slot against timeout. Short metadata
  // queries set this so they fail instead of queueing behind transfers.
  bool timeout_includes_wait = false;

  // Keep stdout for the caller (probe JSON); otherwise it is only scanned for progress.
  bool capture_stdout = false;

  // Logging context.
  std::string task_id;
  std::string label;
};

struct ProcessResult {
  int         exit_code = -1;
  bool        timed_out = false;
  std::string stdout_data;
  std::string stderr_tail;

  std::chrono::milliseconds elapsed{0};

  bool ok() const {
    return !timed_out && exit_code == 0;
  }
};

// Called with non-decreasing percentages in [0, 100].
using ProgressCallback = std::function<void(int)>;

struct RunnerOptions {
  std::size_t               max_concurrent = 4;
  std::chrono::milliseconds default_timeout{std::chrono::minutes(30)};
  std::chrono::milliseconds kill_grace{std::chrono::seconds(5)};
  std::size_t               stderr_tail_bytes = 4096;
  std::size_t               max_stdout_bytes  = 64u * 1024u * 1024u;
};

/*
  Runs external tools as child processes.

  - at most max_concurrent children at once; excess callers wait for a slot
  - each child runs in its own process group so a timeout reaps helpers too
    (yt-dlp forks ffmpeg for merges)
  - timeout: SIGTERM, then SIGKILL after kill_grace; an invocation that
    runs out of time while still waiting for a slot is never spawned
  - stderr keeps only the last stderr_tail_bytes

  Run() throws util::ToolFailure when the program cannot be spawned. A
  non-zero exit or timeout is reported in the result, not thrown; use
  RunChecked() for that.
*/
class ProcessRunner {
 public:
  explicit ProcessRunner(RunnerOptions options);

  ProcessResult Run(const Invocation& invocation, const ProgressCallback& on_progress = {});

  // Throws util::Timeout or util::ToolFailure (stderr tail as detail) unless ok().
  ProcessResult RunChecked(const Invocation& invocation, const ProgressCallback& on_progress = {});

  std::size_t Active() const;
  std::size_t PeakActive() const;

  const RunnerOptions& options() const {
    return options_;
  }

 private:
  class Slot;

  ProcessResult Execute(const Invocation& invocation, const ProgressCallback& on_progress,
                        std::chrono::steady_clock::time_point started, std::chrono::steady_clock::time_point deadline);

  RunnerOptions options_;

  mutable std::mutex      mutex_;
  std::condition_variable slot_cv_;
  std::size_t             active_ = 0;
  std::size_t             peak_   = 0;
};

} // namespace mediaforge::process
