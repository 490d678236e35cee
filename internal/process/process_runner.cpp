#include "process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <optional>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

extern char** environ;

namespace mediaforge::process {

using observability::IntField;
using observability::StringField;
using SteadyClock = std::chrono::steady_clock;

namespace {

constexpr std::size_t kMaxLineBytes = 64 * 1024;

class FdGuard {
 public:
  FdGuard() = default;
  explicit FdGuard(int fd) : fd_(fd) {
  }
  ~FdGuard() {
    Close();
  }

  FdGuard(const FdGuard&)            = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const {
    return fd_;
  }
  bool open() const {
    return fd_ >= 0;
  }
  void Reset(int fd) {
    Close();
    fd_ = fd;
  }
  void Close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }

 private:
  int fd_ = -1;
};

/*
  Owns a spawned child until it has been reaped. If the runner unwinds
  early the whole process group is killed.
*/
class Child {
 public:
  explicit Child(pid_t pid) : pid_(pid) {
  }
  ~Child() {
    if (reaped_) return;
    ::kill(-pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
  }

  Child(const Child&)            = delete;
  Child& operator=(const Child&) = delete;

  pid_t pid() const {
    return pid_;
  }

  bool TryReap() {
    const auto rc = ::waitpid(pid_, &status_, WNOHANG);
    if (rc == pid_ || (rc < 0 && errno == ECHILD)) reaped_ = true;
    return reaped_;
  }

  void Reap() {
    while (!reaped_) {
      const auto rc = ::waitpid(pid_, &status_, 0);
      if (rc == pid_ || (rc < 0 && errno != EINTR)) reaped_ = true;
    }
  }

  void Signal(int sig) const {
    ::kill(-pid_, sig);
  }

  int ExitCode() const {
    if (WIFEXITED(status_)) return WEXITSTATUS(status_);
    if (WIFSIGNALED(status_)) return 128 + WTERMSIG(status_);
    return -1;
  }

 private:
  pid_t pid_;
  int   status_ = 0;
  bool  reaped_ = false;
};

void AppendTail(std::string& tail, const char* data, std::size_t n, std::size_t limit) {
  tail.append(data, n);
  if (tail.size() > limit) tail.erase(0, tail.size() - limit);
}

pid_t Spawn(const Invocation& invocation, int stdout_fd, int stderr_fd) {
  std::vector<char*> argv;
  argv.reserve(invocation.args.size() + 2);
  argv.push_back(const_cast<char*>(invocation.program.c_str()));
  for (const auto& arg : invocation.args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
  posix_spawn_file_actions_adddup2(&actions, stdout_fd, STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, stderr_fd, STDERR_FILENO);

  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t defaults;
  sigemptyset(&defaults);
  sigaddset(&defaults, SIGPIPE);
  sigaddset(&defaults, SIGTERM);
  sigaddset(&defaults, SIGINT);
  posix_spawnattr_setsigdefault(&attr, &defaults);
  posix_spawnattr_setpgroup(&attr, 0);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF);

  pid_t pid = -1;
  const int rc = ::posix_spawnp(&pid, invocation.program.c_str(), &actions, &attr, argv.data(), environ);

  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);

  if (rc != 0) {
    throw util::ToolFailure("failed to spawn " + invocation.program + ": " + std::strerror(rc));
  }
  return pid;
}

} // namespace

// ------------------------------------------------------------
// Slot: bounded number of simultaneous children
// ------------------------------------------------------------

class ProcessRunner::Slot {
 public:
  // Waits until a slot frees up or, when set, until deadline passes.
  Slot(ProcessRunner& runner, std::optional<SteadyClock::time_point> deadline) : runner_(runner) {
    std::unique_lock lock(runner_.mutex_);
    const auto       limit = std::max<std::size_t>(1, runner_.options_.max_concurrent);
    auto             free  = [&] { return runner_.active_ < limit; };
    if (deadline) {
      if (!runner_.slot_cv_.wait_until(lock, *deadline, free)) return;
    } else {
      runner_.slot_cv_.wait(lock, free);
    }
    acquired_ = true;
    ++runner_.active_;
    runner_.peak_ = std::max(runner_.peak_, runner_.active_);
  }

  ~Slot() {
    if (!acquired_) return;
    {
      std::lock_guard lock(runner_.mutex_);
      --runner_.active_;
    }
    runner_.slot_cv_.notify_one();
  }

  Slot(const Slot&)            = delete;
  Slot& operator=(const Slot&) = delete;

  bool acquired() const {
    return acquired_;
  }

 private:
  ProcessRunner& runner_;
  bool           acquired_ = false;
};

ProcessRunner::ProcessRunner(RunnerOptions options) : options_(std::move(options)) {
}

std::size_t ProcessRunner::Active() const {
  std::lock_guard lock(mutex_);
  return active_;
}

std::size_t ProcessRunner::PeakActive() const {
  std::lock_guard lock(mutex_);
  return peak_;
}

ProcessResult ProcessRunner::Run(const Invocation& invocation, const ProgressCallback& on_progress) {
  const auto timeout  = invocation.timeout.count() > 0 ? invocation.timeout : options_.default_timeout;
  const auto queued   = SteadyClock::now();
  const auto deadline = queued + timeout;

  Slot slot(*this, invocation.timeout_includes_wait ? std::optional<SteadyClock::time_point>(deadline) : std::nullopt);
  if (!slot.acquired()) {
    ProcessResult result;
    result.timed_out = true;
    result.elapsed   = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - queued);
    MEDIAFORGE_LOG_WARN("process timed out waiting for a slot", {StringField("task_id", invocation.task_id), StringField("label", invocation.label),
                                                                 StringField("program", invocation.program), IntField("timeout_ms", timeout.count())});
    return result;
  }

  if (invocation.timeout_includes_wait) {
    return Execute(invocation, on_progress, queued, deadline);
  }
  const auto started = SteadyClock::now();
  return Execute(invocation, on_progress, started, started + timeout);
}

ProcessResult ProcessRunner::RunChecked(const Invocation& invocation, const ProgressCallback& on_progress) {
  auto result = Run(invocation, on_progress);
  if (result.timed_out) {
    throw util::Timeout(invocation.program + " exceeded its time limit after " + std::to_string(result.elapsed.count()) + "ms");
  }
  if (result.exit_code != 0) {
    std::string detail = invocation.program + " exited with code " + std::to_string(result.exit_code);
    if (!result.stderr_tail.empty()) detail += ": " + result.stderr_tail;
    throw util::ToolFailure(detail);
  }
  return result;
}

ProcessResult ProcessRunner::Execute(const Invocation& invocation, const ProgressCallback& on_progress, SteadyClock::time_point started,
                                     SteadyClock::time_point deadline) {
  int out_pipe[2];
  int err_pipe[2];
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    throw util::IOFailure(std::string("pipe: ") + std::strerror(errno));
  }
  FdGuard out_read(out_pipe[0]);
  FdGuard out_write(out_pipe[1]);
  if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
    throw util::IOFailure(std::string("pipe: ") + std::strerror(errno));
  }
  FdGuard err_read(err_pipe[0]);
  FdGuard err_write(err_pipe[1]);

  const auto timeout = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - started);

  Child child(Spawn(invocation, out_write.get(), err_write.get()));
  out_write.Close();
  err_write.Close();

  MEDIAFORGE_LOG_INFO("process started", {StringField("task_id", invocation.task_id), StringField("label", invocation.label),
                                          StringField("program", invocation.program), IntField("pid", child.pid())});

  ProcessResult  result;
  ProgressParser parser(invocation.progress, invocation.expected_seconds);
  std::string    line;
  int            last_progress = -1;

  auto emit = [&](int pct) {
    if (pct <= last_progress) return;
    last_progress = pct;
    if (on_progress) on_progress(pct);
  };

  auto consume_stdout = [&](const char* data, std::size_t n) {
    if (invocation.capture_stdout) {
      const auto room = options_.max_stdout_bytes - std::min(options_.max_stdout_bytes, result.stdout_data.size());
      result.stdout_data.append(data, std::min(room, n));
    }
    if (invocation.progress == ProgressConvention::kNone) return;

    for (std::size_t i = 0; i < n; ++i) {
      const char c = data[i];
      if (c == '\n' || c == '\r') {
        if (auto pct = parser.Feed(line)) emit(*pct);
        line.clear();
      } else if (line.size() < kMaxLineBytes) {
        line.push_back(c);
      }
    }
  };

  char buf[8192];
  while (out_read.open() || err_read.open()) {
    const auto now = SteadyClock::now();
    if (now >= deadline) {
      result.timed_out = true;
      break;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

    pollfd fds[2];
    FdGuard* guards[2];
    nfds_t   count = 0;
    for (FdGuard* g : {&out_read, &err_read}) {
      if (!g->open()) continue;
      fds[count]      = pollfd{g->get(), POLLIN, 0};
      guards[count++] = g;
    }

    const int ready = ::poll(fds, count, static_cast<int>(std::min<long long>(remaining, 200)));
    if (ready < 0) {
      if (errno == EINTR) continue;
      throw util::IOFailure(std::string("poll: ") + std::strerror(errno));
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) continue;

      const auto n = ::read(fds[i].fd, buf, sizeof(buf));
      if (n < 0 && (errno == EINTR || errno == EAGAIN)) continue;
      if (n <= 0) {
        guards[i]->Close();
        continue;
      }

      if (guards[i] == &out_read) {
        consume_stdout(buf, static_cast<std::size_t>(n));
      } else {
        AppendTail(result.stderr_tail, buf, static_cast<std::size_t>(n), options_.stderr_tail_bytes);
      }
    }
  }
  if (!line.empty()) {
    if (auto pct = parser.Feed(line)) emit(*pct);
  }

  // Pipes closed; the child may still be exiting.
  while (!result.timed_out && !child.TryReap()) {
    if (SteadyClock::now() >= deadline) {
      result.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  if (result.timed_out) {
    MEDIAFORGE_LOG_WARN("process timed out", {StringField("task_id", invocation.task_id), StringField("label", invocation.label),
                                              IntField("timeout_ms", timeout.count())});
    child.Signal(SIGTERM);
    const auto grace_deadline = SteadyClock::now() + options_.kill_grace;
    while (!child.TryReap() && SteadyClock::now() < grace_deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    child.Signal(SIGKILL);
    child.Reap();
  }

  result.exit_code = child.ExitCode();
  result.elapsed   = std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - started);

  if (result.ok() && invocation.progress != ProgressConvention::kNone) emit(100);

  MEDIAFORGE_LOG_INFO("process exited", {StringField("task_id", invocation.task_id), StringField("label", invocation.label),
                                         IntField("exit_code", result.exit_code), IntField("elapsed_ms", result.elapsed.count()),
                                         observability::BoolField("timed_out", result.timed_out)});
  return result;
}

} // namespace mediaforge::process
