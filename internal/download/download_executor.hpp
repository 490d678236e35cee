#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "internal/model/audio_options.hpp"
#include "internal/model/format.hpp"
#include "internal/probe/format_prober.hpp"
#include "internal/process/process_runner.hpp"
#include "internal/registry/task_registry.hpp"
#include "internal/storage/workspace.hpp"
#include "internal/worker/task_dispatcher.hpp"

namespace mediaforge::download {

struct DownloadOptions {
  std::string               ytdlp_path  = "yt-dlp";
  std::string               ffmpeg_path = "ffmpeg";
  std::chrono::milliseconds timeout{std::chrono::minutes(30)};
};

/*
  Fetch tasks.

  Submit() re-probes the source and resolves the requested format id
  before any task exists, so InvalidSource, UnreachableSource and
  FormatNotFound reach the caller directly. The accepted task then runs
  on its own worker:

    video: yt-dlp download + mp4 merge            0-90%
    audio: yt-dlp audio stream download           0-60%
           ffmpeg transcode with AudioOptions     60-90%
    finalize: verify output, set READY            90-100%
*/
class DownloadExecutor {
 public:
  DownloadExecutor(std::shared_ptr<registry::TaskRegistry> registry, std::shared_ptr<probe::FormatProber> prober,
                   std::shared_ptr<process::ProcessRunner> runner, std::shared_ptr<storage::Workspace> workspace,
                   std::shared_ptr<worker::TaskDispatcher> dispatcher, DownloadOptions options);

  std::string Submit(const model::DownloadRequest& request);

 private:
  struct Job {
    model::DownloadRequest                 request;
    std::optional<model::FormatDescriptor> format;  // unset: best available
    double                                 duration_seconds = 0.0;
  };

  void Run(const std::string& task_id, const Job& job);
  void RunVideo(const std::string& task_id, const Job& job, const std::filesystem::path& dir);
  void RunAudio(const std::string& task_id, const Job& job, const std::filesystem::path& dir);
  void Finalize(const std::string& task_id, const std::filesystem::path& dir, const std::string& stem);

  // Runs yt-dlp, reporting its progress mapped onto [from, to].
  void Fetch(const std::string& task_id, const Job& job, const std::string& selector, const std::filesystem::path& output_template,
             int from, int to, const std::string& message);

  std::shared_ptr<registry::TaskRegistry>  registry_;
  std::shared_ptr<probe::FormatProber>     prober_;
  std::shared_ptr<process::ProcessRunner>  runner_;
  std::shared_ptr<storage::Workspace>      workspace_;
  std::shared_ptr<worker::TaskDispatcher>  dispatcher_;
  DownloadOptions                          options_;
};

// Picks the finished "<stem>.<ext>" file in dir, ignoring partial downloads.
std::optional<std::filesystem::path> FindArtifact(const std::filesystem::path& dir, const std::string& stem);

// Scales a 0-100 stage percentage onto [from, to].
int MapProgress(int pct, int from, int to);

} // namespace mediaforge::download
