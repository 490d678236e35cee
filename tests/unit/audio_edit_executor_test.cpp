#include "internal/audio/audio_edit_executor.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/asset/asset_store.hpp"
#include "internal/asset/media_inspector.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using mediaforge::asset::AssetStore;
using mediaforge::asset::MediaInspector;
using mediaforge::audio::AudioEditExecutor;
using mediaforge::model::AudioEditSpec;
using mediaforge::model::CutMiddleSpec;
using mediaforge::model::TaskStatus;
using mediaforge::model::TimeWindow;
using mediaforge::testing::ReadFile;
using mediaforge::testing::TempDir;
using mediaforge::testing::WaitForTerminal;
using mediaforge::testing::WriteTool;
using mediaforge::util::ErrorKind;

namespace fs = std::filesystem;

// ffprobe stand-in keyed on the file extension.
std::string FakeFfprobe(const fs::path& dir) {
  return WriteTool(dir, "ffprobe", R"(for last; do :; done
case "$last" in
  *.mp4)
    echo '{"format":{"duration":"10.000000"},"streams":[{"codec_type":"video"},{"codec_type":"audio"}]}'
    ;;
  *.mkv)
    echo '{"format":{"duration":"10.000000"},"streams":[{"codec_type":"video"}]}'
    ;;
  *.bin)
    echo "$last: Invalid data found when processing input" >&2
    exit 1
    ;;
  *)
    echo '{"format":{"duration":"10.000000"},"streams":[{"codec_type":"audio"},{"codec_type":"video","disposition":{"attached_pic":1}}]}'
    ;;
esac
)");
}

// ffmpeg stand-in: logs one line per run and writes the output after a short delay.
std::string FakeFfmpeg(const fs::path& dir, const std::string& name, const std::string& delay, int exit_code = 0) {
  return WriteTool(dir, name, "for last; do :; done\necho \"$last\" >> '" + (dir / (name + ".log")).string() + "'\nsleep " + delay +
                                  "\necho 'out_time_us=1000000'\necho 'progress=end'\n" +
                                  (exit_code == 0 ? std::string("printf 'edited' > \"$last\"\n")
                                                  : "echo 'Error while filtering' >&2\nexit " + std::to_string(exit_code) + "\n"));
}

int CountLines(const std::string& text) {
  int                count = 0;
  std::istringstream in(text);
  for (std::string line; std::getline(in, line);) ++count;
  return count;
}

struct Harness {
  explicit Harness(const std::string& name) : tmp(name) {
    fs::create_directories(bin());
    registry = std::make_shared<mediaforge::registry::TaskRegistry>();

    mediaforge::process::RunnerOptions options;
    options.default_timeout = std::chrono::seconds(20);
    options.kill_grace      = std::chrono::milliseconds(200);
    runner                  = std::make_shared<mediaforge::process::ProcessRunner>(options);

    workspace = std::make_shared<mediaforge::storage::Workspace>(tmp.path() / "data");
    workspace->EnsureLayout();
    dispatcher = std::make_shared<mediaforge::worker::TaskDispatcher>(registry);

    auto inspector = std::make_shared<MediaInspector>(runner, FakeFfprobe(bin()), std::chrono::seconds(10));
    assets         = std::make_shared<AssetStore>(workspace, inspector);
  }

  ~Harness() {
    dispatcher->Shutdown();
  }

  std::unique_ptr<AudioEditExecutor> Executor(const std::string& ffmpeg) {
    return std::make_unique<AudioEditExecutor>(registry, assets, runner, workspace, dispatcher, ffmpeg, std::chrono::seconds(20));
  }

  fs::path bin() const {
    return tmp.path() / "bin";
  }

  TempDir                                             tmp;
  std::shared_ptr<mediaforge::registry::TaskRegistry> registry;
  std::shared_ptr<mediaforge::process::ProcessRunner> runner;
  std::shared_ptr<mediaforge::storage::Workspace>     workspace;
  std::shared_ptr<mediaforge::worker::TaskDispatcher> dispatcher;
  std::shared_ptr<AssetStore>                         assets;
};

AudioEditSpec SpliceSpec() {
  AudioEditSpec spec;
  spec.trim                      = TimeWindow{0.0, 10.0};
  spec.cut_middle                = CutMiddleSpec{TimeWindow{2.0, 3.0}, 0.5};
  spec.fade_in.enabled           = true;
  spec.fade_in.duration_seconds  = 1.0;
  spec.fade_out.enabled          = true;
  spec.fade_out.duration_seconds = 1.0;
  return spec;
}

void TestImportInspectsUploads() {
  Harness h("asset_import");

  const auto song = h.assets->Import("../My Song.MP3", "id3-and-frames");
  assert(song.original_name == "My_Song.MP3");
  assert(song.stored_path.filename() == "source.mp3");
  assert(song.duration_seconds == 10.0);
  assert(!song.is_container);
  assert(ReadFile(song.stored_path) == "id3-and-frames");

  const auto clip = h.assets->Import("clip.mp4", "ftyp-and-boxes");
  assert(clip.is_container);

  const std::vector<std::pair<std::string, std::string>> rejected{{"silent.mkv", "x"}, {"notes", "x"}, {"empty.mp3", ""}};
  for (const auto& [name, data] : rejected) {
    bool threw = false;
    try {
      (void)h.assets->Import(name, data);
    } catch (const mediaforge::util::InvalidSource&) {
      threw = true;
    }
    assert(threw);
  }

  // rejected uploads leave nothing behind
  assert(h.assets->List().size() == 2);
  std::size_t dirs = 0;
  for (const auto& entry : fs::directory_iterator(h.tmp.path() / "data" / "assets")) {
    (void)entry;
    ++dirs;
  }
  assert(dirs == 2);
}

void TestEditProducesArtifact() {
  Harness    h("edit_success");
  auto       executor = h.Executor(FakeFfmpeg(h.bin(), "ffmpeg", "0"));
  const auto asset    = h.assets->Import("song.mp3", "frames");

  const auto id     = executor->Process(asset.id, SpliceSpec());
  const auto record = WaitForTerminal(*h.registry, id);

  assert(record.status == TaskStatus::kReady);
  assert(record.progress == 100);
  assert(record.owner.value() == asset.id);
  assert(record.result->extension == "mp3");
  assert(record.result->download_reference == "/download/" + id + "/audio.mp3");
  assert(ReadFile(record.result->artifact_path) == "edited");

  // crossfade edits run three ffmpeg passes and drop their intermediates
  assert(CountLines(ReadFile(h.bin() / "ffmpeg.log")) == 3);
  assert(!fs::exists(h.workspace->TaskDir(id) / "segment_a.wav"));
  assert(!fs::exists(h.workspace->TaskDir(id) / "segment_b.wav"));
  assert(!h.assets->leases().IsHeld(asset.id));
}

void TestConcurrentEditOnSameAssetIsBusy() {
  Harness    h("edit_busy");
  auto       executor = h.Executor(FakeFfmpeg(h.bin(), "ffmpeg", "0.5"));
  const auto asset    = h.assets->Import("song.mp3", "frames");
  const auto other    = h.assets->Import("other.mp3", "frames");

  const auto first = executor->Process(asset.id, SpliceSpec());

  bool threw = false;
  try {
    (void)executor->Process(asset.id, SpliceSpec());
  } catch (const mediaforge::util::Busy&) {
    threw = true;
  }
  assert(threw);
  assert(h.registry->Size() == 1);

  // other assets are not blocked
  const auto parallel = executor->Process(other.id, AudioEditSpec{});

  // the asset cannot be removed mid-edit
  threw = false;
  try {
    (void)h.assets->Remove(asset.id);
  } catch (const mediaforge::util::Busy&) {
    threw = true;
  }
  assert(threw);

  assert(WaitForTerminal(*h.registry, first).status == TaskStatus::kReady);
  assert(WaitForTerminal(*h.registry, parallel).status == TaskStatus::kReady);

  // released once the first edit settled
  const auto next = executor->Process(asset.id, AudioEditSpec{});
  assert(WaitForTerminal(*h.registry, next).status == TaskStatus::kReady);
}

void TestInvalidSpecCreatesNoTask() {
  Harness    h("edit_invalid");
  auto       executor = h.Executor(FakeFfmpeg(h.bin(), "ffmpeg", "0"));
  const auto asset    = h.assets->Import("song.mp3", "frames");

  auto spec       = SpliceSpec();
  spec.cut_middle = CutMiddleSpec{TimeWindow{1.0, 3.0}, 1.0};

  bool threw = false;
  try {
    (void)executor->Process(asset.id, spec);
  } catch (const mediaforge::util::InvalidEditSpec&) {
    threw = true;
  }
  assert(threw);
  assert(h.registry->Size() == 0);
  assert(!h.assets->leases().IsHeld(asset.id));

  threw = false;
  try {
    (void)executor->Process("missing-asset", AudioEditSpec{});
  } catch (const mediaforge::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestContainerExtractionIsReused() {
  Harness    h("edit_container");
  auto       executor = h.Executor(FakeFfmpeg(h.bin(), "ffmpeg", "0"));
  const auto clip     = h.assets->Import("clip.mp4", "boxes");

  const auto first = executor->Process(clip.id, AudioEditSpec{});
  assert(WaitForTerminal(*h.registry, first).status == TaskStatus::kReady);
  assert(CountLines(ReadFile(h.bin() / "ffmpeg.log")) == 2);

  const auto updated = h.assets->Get(clip.id);
  assert(updated.extracted_audio_path.has_value());
  assert(fs::exists(*updated.extracted_audio_path));

  const auto second = executor->Process(clip.id, AudioEditSpec{});
  assert(WaitForTerminal(*h.registry, second).status == TaskStatus::kReady);
  assert(CountLines(ReadFile(h.bin() / "ffmpeg.log")) == 3);
}

void TestToolFailureReleasesLease() {
  Harness    h("edit_failure");
  auto       executor = h.Executor(FakeFfmpeg(h.bin(), "ffmpeg-broken", "0", 1));
  const auto asset    = h.assets->Import("song.mp3", "frames");

  const auto record = WaitForTerminal(*h.registry, executor->Process(asset.id, AudioEditSpec{}));
  assert(record.status == TaskStatus::kError);
  assert(record.error->kind == ErrorKind::kToolFailure);
  assert(!record.result);

  h.dispatcher->WaitIdle();
  assert(!h.assets->leases().IsHeld(asset.id));
}

void TestRemoveRacingEditNeverBreaksTheEdit() {
  Harness h("edit_remove_race");
  auto    executor = h.Executor(FakeFfmpeg(h.bin(), "ffmpeg", "0"));

  for (int round = 0; round < 20; ++round) {
    const auto clip = h.assets->Import("clip.mp4", "boxes");

    std::thread remover([&] {
      try {
        (void)h.assets->Remove(clip.id);
      } catch (const mediaforge::util::Busy&) {
      }
    });

    std::string id;
    try {
      id = executor->Process(clip.id, AudioEditSpec{});
    } catch (const mediaforge::util::Busy&) {
    } catch (const mediaforge::util::NotFound&) {
    }
    remover.join();

    // An edit that got its task keeps its files until it settles.
    if (!id.empty()) {
      const auto record = WaitForTerminal(*h.registry, id);
      assert(record.status == TaskStatus::kReady);
    }
  }

  h.dispatcher->WaitIdle();
  for (const auto& asset : h.assets->List()) {
    assert(!h.assets->leases().IsHeld(asset.id));
  }
}

void TestRemoveHoldsAndReleasesTheLease() {
  Harness    h("edit_remove_lease");
  auto       executor = h.Executor(FakeFfmpeg(h.bin(), "ffmpeg", "0"));
  const auto asset    = h.assets->Import("song.mp3", "frames");

  // A held lease blocks removal and keeps its holder.
  assert(h.assets->leases().TryAcquire(asset.id, "task-1"));
  bool threw = false;
  try {
    (void)h.assets->Remove(asset.id);
  } catch (const mediaforge::util::Busy&) {
    threw = true;
  }
  assert(threw);
  assert(h.assets->leases().Holder(asset.id).value() == "task-1");
  assert(fs::exists(h.workspace->AssetDir(asset.id)));
  h.assets->leases().Release(asset.id, "task-1");

  assert(h.assets->Remove(asset.id));
  assert(!h.assets->leases().IsHeld(asset.id));
  assert(!fs::exists(h.workspace->AssetDir(asset.id)));
  assert(!h.assets->Remove(asset.id));

  threw = false;
  try {
    (void)executor->Process(asset.id, AudioEditSpec{});
  } catch (const mediaforge::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(h.registry->Size() == 0);
}

} // namespace

int main() {
  TestImportInspectsUploads();
  TestEditProducesArtifact();
  TestConcurrentEditOnSameAssetIsBusy();
  TestInvalidSpecCreatesNoTask();
  TestContainerExtractionIsReused();
  TestToolFailureReleasesLease();
  TestRemoveHoldsAndReleasesTheLease();
  TestRemoveRacingEditNeverBreaksTheEdit();

  std::cout << "mediaforge_unit_audio_edit_executor: pass\n";
  return 0;
}
