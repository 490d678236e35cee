#include "download_executor.hpp"

#include <algorithm>
#include <system_error>

#include "internal/audio/codec.hpp"
#include "internal/audio/ffmpeg_args.hpp"
#include "internal/observability/logging.hpp"
#include "internal/process/tool_errors.hpp"
#include "internal/util/errors.hpp"

namespace mediaforge::download {

namespace fs = std::filesystem;

using observability::StringField;

int MapProgress(int pct, int from, int to) {
  pct = std::clamp(pct, 0, 100);
  return from + (to - from) * pct / 100;
}

std::optional<fs::path> FindArtifact(const fs::path& dir, const std::string& stem) {
  std::error_code ec;
  for (const auto& entry : fs::directory_iterator(dir, ec)) {
    if (!entry.is_regular_file(ec)) continue;

    const auto name = entry.path().filename().string();
    if (name.rfind(stem + ".", 0) != 0) continue;

    const auto ext = entry.path().extension().string();
    if (ext == ".part" || ext == ".ytdl" || ext == ".temp") continue;
    // yt-dlp keeps per-stream files as <stem>.f<id>.<ext> until the merge.
    if (name.find('.', stem.size() + 1) != std::string::npos) continue;

    return entry.path();
  }
  return std::nullopt;
}

DownloadExecutor::DownloadExecutor(std::shared_ptr<registry::TaskRegistry> registry, std::shared_ptr<probe::FormatProber> prober,
                                   std::shared_ptr<process::ProcessRunner> runner, std::shared_ptr<storage::Workspace> workspace,
                                   std::shared_ptr<worker::TaskDispatcher> dispatcher, DownloadOptions options)
    : registry_(std::move(registry)),
      prober_(std::move(prober)),
      runner_(std::move(runner)),
      workspace_(std::move(workspace)),
      dispatcher_(std::move(dispatcher)),
      options_(std::move(options)) {
}

std::string DownloadExecutor::Submit(const model::DownloadRequest& request) {
  if (request.kind == model::FetchKind::kAudio) {
    audio::ValidateAudioOptions(request.audio);
  }

  // Client-held descriptors may be stale; only the id is trusted.
  const auto probe = prober_->Probe(request.url);

  Job job;
  job.request          = request;
  job.duration_seconds = probe.duration_seconds;

  if (!request.format_id.empty()) {
    auto it = std::find_if(probe.formats.begin(), probe.formats.end(),
                           [&](const model::FormatDescriptor& f) { return f.format_id == request.format_id; });
    if (it == probe.formats.end()) {
      throw util::FormatNotFound("format " + request.format_id + " is not offered by the source");
    }
    job.format = *it;
  }

  const auto task_id = registry_->Create(model::TaskKind::kFetch);
  MEDIAFORGE_LOG_INFO("fetch accepted", {StringField("task_id", task_id), StringField("format_id", request.format_id),
                                         StringField("kind", request.kind == model::FetchKind::kAudio ? "audio" : "video")});

  dispatcher_->Dispatch(task_id, [this, job = std::move(job)](const std::string& id) { Run(id, job); });
  return task_id;
}

void DownloadExecutor::Run(const std::string& task_id, const Job& job) {
  const auto dir = workspace_->EnsureTaskDir(task_id);
  if (job.request.kind == model::FetchKind::kAudio) {
    RunAudio(task_id, job, dir);
    Finalize(task_id, dir, "audio");
  } else {
    RunVideo(task_id, job, dir);
    Finalize(task_id, dir, "media");
  }
}

void DownloadExecutor::Fetch(const std::string& task_id, const Job& job, const std::string& selector, const fs::path& output_template,
                             int from, int to, const std::string& message) {
  process::Invocation inv;
  inv.program  = options_.ytdlp_path;
  inv.args     = {"--newline", "--no-playlist", "--no-warnings", "-f", selector};
  inv.progress = process::ProgressConvention::kYtDlp;
  inv.timeout  = options_.timeout;
  inv.task_id  = task_id;
  inv.label    = message;

  if (job.request.kind == model::FetchKind::kVideo) {
    inv.args.insert(inv.args.end(), {"--merge-output-format", "mp4"});
  }
  inv.args.insert(inv.args.end(), {"-o", output_template.string(), "--", job.request.url});

  registry_->Update(task_id, from, message);
  auto result = runner_->Run(inv, [&](int pct) { registry_->Update(task_id, MapProgress(pct, from, to), message); });
  if (!result.ok()) {
    process::ThrowToolError(inv, result);
  }
}

void DownloadExecutor::RunVideo(const std::string& task_id, const Job& job, const fs::path& dir) {
  std::string selector = "bestvideo+bestaudio/best";
  if (job.format) {
    selector = job.format->format_id;
    // Video-only streams get the best audio muxed in.
    if (job.format->has_video && !job.format->has_audio) {
      selector += "+bestaudio/" + job.format->format_id;
    }
  }
  Fetch(task_id, job, selector, dir / "media.%(ext)s", 0, 90, "downloading");
}

void DownloadExecutor::RunAudio(const std::string& task_id, const Job& job, const fs::path& dir) {
  const std::string selector = job.format ? job.format->format_id : "bestaudio/best";
  Fetch(task_id, job, selector, dir / "source.%(ext)s", 0, 60, "downloading audio");

  const auto source = FindArtifact(dir, "source");
  if (!source) {
    throw util::IOFailure("downloaded audio stream is missing");
  }

  const auto& opts = job.request.audio;

  process::Invocation inv;
  inv.program          = options_.ffmpeg_path;
  inv.args             = {"-hide_banner", "-nostdin", "-y", "-i", source->string(), "-vn", "-map", "0:a:0"};
  inv.progress         = process::ProgressConvention::kFfmpeg;
  inv.expected_seconds = job.duration_seconds;
  inv.timeout          = options_.timeout;
  inv.task_id          = task_id;
  inv.label            = "transcoding";

  fs::path output;
  if (opts.codec == "copy") {
    const std::string acodec = job.format ? job.format->acodec : std::string{};
    output                   = dir / ("audio." + audio::CopyExtension(acodec));
    inv.args.insert(inv.args.end(), {"-c:a", "copy"});
  } else {
    const auto* codec = audio::FindFetchCodec(opts.codec);
    if (!codec) {
      throw util::InvalidEditSpec("unsupported audio codec: " + opts.codec);
    }
    const int sample_rate = codec->forced_sample_rate ? codec->forced_sample_rate : opts.sample_rate;
    inv.args.insert(inv.args.end(), {"-ac", std::to_string(opts.channels), "-ar", std::to_string(sample_rate)});
    if (const auto volume = audio::VolumeFilter(opts.volume); !volume.empty()) {
      inv.args.insert(inv.args.end(), {"-af", volume});
    }
    const auto encoder = audio::EncoderArgs(*codec, opts.bitrate, opts.qscale);
    inv.args.insert(inv.args.end(), encoder.begin(), encoder.end());
    output = dir / ("audio." + std::string(codec->extension));
  }
  inv.args.insert(inv.args.end(), {"-progress", "pipe:1", "-nostats", output.string()});

  registry_->Update(task_id, 60, "transcoding");
  auto result = runner_->Run(inv, [&](int pct) { registry_->Update(task_id, MapProgress(pct, 60, 90), "transcoding"); });
  if (!result.ok()) {
    process::ThrowToolError(inv, result);
  }

  std::error_code ec;
  fs::remove(*source, ec);
}

void DownloadExecutor::Finalize(const std::string& task_id, const fs::path& dir, const std::string& stem) {
  registry_->Update(task_id, 90, "finalizing");

  const auto artifact = FindArtifact(dir, stem);
  if (!artifact) {
    throw util::IOFailure("output file was not produced");
  }

  std::error_code ec;
  const auto      size = fs::file_size(*artifact, ec);
  if (ec) {
    throw util::IOFailure("stat " + artifact->string() + ": " + ec.message());
  }
  if (size == 0) {
    throw util::IOFailure("output file is empty");
  }

  model::TaskResult result;
  result.artifact_path      = *artifact;
  result.extension          = storage::SanitizeExtension(artifact->extension().string());
  result.size_bytes         = size;
  result.download_reference = storage::Workspace::DownloadReference(task_id, *artifact);
  registry_->Complete(task_id, std::move(result));
}

} // namespace mediaforge::download
