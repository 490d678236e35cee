#include "internal/service/media_service.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using mediaforge::testing::FakeProber;
using mediaforge::testing::TempDir;
using mediaforge::testing::WaitForTerminal;
using mediaforge::testing::WriteTool;
namespace v1 = mediaforge::v1;
namespace fs = std::filesystem;

struct Runtime {
  explicit Runtime(const std::string& name) : tmp(name) {
    const auto bin = tmp.path() / "bin";
    fs::create_directories(bin);

    mediaforge::config::Settings settings;
    settings.storage_root = tmp.path() / "data";
    settings.ytdlp_path   = WriteTool(bin, "yt-dlp", R"sh(out=""
while [ $# -gt 0 ]; do
  case "$1" in
    -o) out="$2"; shift 2 ;;
    *) shift ;;
  esac
done
echo "[download]  50.0% of 1.00KiB"
printf 'video-bytes' > "$(printf '%s' "$out" | sed 's/%(ext)s/mp4/')"
)sh");
    settings.ffmpeg_path  = WriteTool(bin, "ffmpeg", "for last; do :; done\necho 'progress=end'\nprintf 'edited-audio' > \"$last\"\n");
    settings.ffprobe_path =
        WriteTool(bin, "ffprobe", "echo '{\"format\":{\"duration\":\"10.0\"},\"streams\":[{\"codec_type\":\"audio\"}]}'\n");
    settings.process_timeout = std::chrono::seconds(20);

    prober = std::make_shared<FakeProber>(mediaforge::testing::SampleProbe());
    app    = mediaforge::factory::Build(settings, prober);
  }

  ~Runtime() {
    app.Shutdown();
  }

  TempDir                                tmp;
  std::shared_ptr<FakeProber>            prober;
  mediaforge::factory::Application       app;
};

v1::StatusResponse Status(Runtime& rt, const std::string& id) {
  v1::StatusRequest req;
  req.set_task_id(id);
  return rt.app.service->Status(req);
}

void TestAnalyzeReturnsFormats() {
  Runtime rt("service_analyze");

  v1::AnalyzeRequest req;
  req.set_url("https://www.youtube.com/watch?v=abc");
  const auto resp = rt.app.service->Analyze(req);

  assert(resp.title() == "Sample clip");
  assert(resp.formats_size() == 3);
  assert(resp.formats(0).format_id() == "137");
  assert(resp.formats(0).quality() == "1080p");
  assert(resp.formats(2).has_audio());
  assert(!resp.formats(2).has_video());

  req.set_url("javascript:alert(1)");
  bool threw = false;
  try {
    (void)rt.app.service->Analyze(req);
  } catch (const mediaforge::util::InvalidSource&) {
    threw = true;
  }
  assert(threw);
}

void TestDownloadStatusFetchCleanup() {
  Runtime rt("service_download");

  v1::DownloadRequest req;
  req.set_url("https://www.youtube.com/watch?v=abc");
  req.set_format_id("22");
  req.set_kind(v1::FETCH_KIND_VIDEO);
  const auto id = rt.app.service->Download(req).task_id();
  assert(!id.empty());

  WaitForTerminal(*rt.app.registry, id);
  const auto status = Status(rt, id);
  assert(status.status() == v1::TASK_STATUS_READY);
  assert(status.ready());
  assert(status.progress() == 100);
  assert(status.kind() == v1::TASK_KIND_FETCH);
  assert(status.extension() == "mp4");
  assert(status.download_reference() == "/download/" + id + "/media.mp4");
  assert(status.error_kind().empty());

  std::vector<v1::ArtifactChunk> chunks;
  v1::FetchArtifactRequest       fetch;
  fetch.set_task_id(id);
  rt.app.service->FetchArtifact(fetch, [&](const v1::ArtifactChunk& chunk) {
    chunks.push_back(chunk);
    return true;
  });
  assert(chunks.size() == 1);
  assert(chunks[0].file_name() == "media.mp4");
  assert(chunks[0].total_bytes() == std::string("video-bytes").size());
  assert(chunks[0].data() == "video-bytes");

  int calls = 0;
  rt.app.service->FetchArtifact(fetch, [&](const v1::ArtifactChunk&) {
    ++calls;
    return false;
  });
  assert(calls == 1);

  v1::CleanupRequest cleanup;
  cleanup.set_task_id(id);
  rt.app.service->Cleanup(cleanup);
  rt.app.service->Cleanup(cleanup);

  bool threw = false;
  try {
    (void)Status(rt, id);
  } catch (const mediaforge::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestStaleFormatIsRejected() {
  Runtime rt("service_stale_format");

  v1::DownloadRequest req;
  req.set_url("https://www.youtube.com/watch?v=abc");
  req.set_format_id("144p");

  bool threw = false;
  try {
    (void)rt.app.service->Download(req);
  } catch (const mediaforge::util::FormatNotFound&) {
    threw = true;
  }
  assert(threw);
  assert(rt.app.registry->Size() == 0);
}

void TestUploadAndProcess() {
  Runtime rt("service_edit");

  v1::UploadRequest upload;
  upload.set_filename("voice.wav");
  upload.set_data("RIFF....WAVEfmt ");
  const auto uploaded = rt.app.service->Upload(upload);
  assert(!uploaded.asset_id().empty());
  assert(uploaded.duration_seconds() == 10.0);
  assert(!uploaded.is_container());

  v1::ProcessRequest req;
  req.set_asset_id(uploaded.asset_id());
  auto* spec = req.mutable_spec();
  spec->set_codec("flac");
  spec->mutable_trim()->set_start("0:00");
  spec->mutable_trim()->set_end("0:10");
  spec->mutable_cut_middle()->set_start("0:02");
  spec->mutable_cut_middle()->set_end("0:03");
  spec->mutable_cut_middle()->set_crossfade_seconds(0.5);
  spec->mutable_fade_in()->set_enabled(true);
  spec->mutable_fade_in()->set_duration_seconds(1.0);
  spec->mutable_fade_out()->set_enabled(true);
  spec->mutable_fade_out()->set_duration_seconds(1.0);

  const auto id = rt.app.service->Process(req).task_id();
  WaitForTerminal(*rt.app.registry, id);

  const auto status = Status(rt, id);
  assert(status.status() == v1::TASK_STATUS_READY);
  assert(status.kind() == v1::TASK_KIND_AUDIO_EDIT);
  assert(status.extension() == "flac");

  spec->mutable_trim()->set_end("0:99");
  bool threw = false;
  try {
    (void)rt.app.service->Process(req);
  } catch (const mediaforge::util::InvalidEditSpec&) {
    threw = true;
  }
  assert(threw);
}

void TestFetchBeforeReadyIsRejected() {
  Runtime    rt("service_not_ready");
  const auto id = rt.app.registry->Create(mediaforge::model::TaskKind::kFetch);

  v1::FetchArtifactRequest fetch;
  fetch.set_task_id(id);
  bool threw = false;
  try {
    rt.app.service->FetchArtifact(fetch, [](const v1::ArtifactChunk&) { return true; });
  } catch (const mediaforge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  v1::CleanupRequest cleanup;
  cleanup.set_task_id(id);
  threw = false;
  try {
    rt.app.service->Cleanup(cleanup);
  } catch (const mediaforge::util::Busy&) {
    threw = true;
  }
  assert(threw);
}

void TestDestroyWithFetchInFlightJoinsWorker() {
  TempDir    tmp("service_teardown");
  const auto bin = tmp.path() / "bin";
  fs::create_directories(bin);

  mediaforge::config::Settings settings;
  settings.storage_root = tmp.path() / "data";
  settings.ytdlp_path   = WriteTool(bin, "yt-dlp", R"sh(out=""
while [ $# -gt 0 ]; do
  case "$1" in
    -o) out="$2"; shift 2 ;;
    *) shift ;;
  esac
done
echo "[download]  10.0% of 1.00KiB"
sleep 1
echo "[download]  90.0% of 1.00KiB"
printf 'video-bytes' > "$(printf '%s' "$out" | sed 's/%(ext)s/mp4/')"
)sh");

  std::shared_ptr<mediaforge::registry::TaskRegistry> registry;
  std::string                                         id;
  {
    auto app = mediaforge::factory::Build(settings, std::make_shared<FakeProber>(mediaforge::testing::SampleProbe()));
    registry = app.registry;

    v1::DownloadRequest req;
    req.set_url("https://www.youtube.com/watch?v=abc");
    req.set_format_id("22");
    id = app.service->Download(req).task_id();
    // No Shutdown(): leaving scope must still wait for the worker.
  }

  const auto record = registry->Get(id);
  assert(record.status == mediaforge::model::TaskStatus::kReady);
  assert(record.progress == 100);
}

} // namespace

int main() {
  TestAnalyzeReturnsFormats();
  TestDownloadStatusFetchCleanup();
  TestStaleFormatIsRejected();
  TestUploadAndProcess();
  TestFetchBeforeReadyIsRejected();
  TestDestroyWithFetchInFlightJoinsWorker();

  std::cout << "mediaforge_unit_media_service: pass\n";
  return 0;
}
