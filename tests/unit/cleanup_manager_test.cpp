#include "internal/cleanup/cleanup_manager.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/asset/media_inspector.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using mediaforge::cleanup::CleanupManager;
using mediaforge::model::TaskKind;
using mediaforge::model::TaskResult;
using mediaforge::registry::TaskRegistry;
using mediaforge::storage::Workspace;
using mediaforge::testing::TempDir;
using mediaforge::testing::WriteFile;
using mediaforge::testing::WriteTool;

namespace fs = std::filesystem;

struct Harness {
  explicit Harness(const std::string& name, std::chrono::milliseconds retention = std::chrono::hours(1),
                   std::chrono::milliseconds interval = std::chrono::minutes(5))
      : tmp(name) {
    registry  = std::make_shared<TaskRegistry>();
    workspace = std::make_shared<Workspace>(tmp.path() / "data");
    workspace->EnsureLayout();

    const auto ffprobe = WriteTool(tmp.path(), "ffprobe",
                                   "echo '{\"format\":{\"duration\":\"3.5\"},\"streams\":[{\"codec_type\":\"audio\"}]}'\n");
    mediaforge::process::RunnerOptions options;
    options.default_timeout = std::chrono::seconds(10);
    auto runner             = std::make_shared<mediaforge::process::ProcessRunner>(options);
    assets = std::make_shared<mediaforge::asset::AssetStore>(
        workspace, std::make_shared<mediaforge::asset::MediaInspector>(runner, ffprobe, std::chrono::seconds(10)));

    cleanup = std::make_unique<CleanupManager>(registry, workspace, assets, retention, interval);
  }

  // A finished fetch task with one artifact on disk.
  std::string ReadyTask() {
    const auto id = registry->Create(TaskKind::kFetch);
    registry->MarkRunning(id, "running");
    const auto dir = workspace->EnsureTaskDir(id);
    WriteFile(dir / "media.mp4", std::string(100, 'm'));

    TaskResult result;
    result.artifact_path = dir / "media.mp4";
    result.size_bytes    = 100;
    registry->Complete(id, result);
    return id;
  }

  TempDir                                        tmp;
  std::shared_ptr<TaskRegistry>                  registry;
  std::shared_ptr<Workspace>                     workspace;
  std::shared_ptr<mediaforge::asset::AssetStore> assets;
  std::unique_ptr<CleanupManager>                cleanup;
};

void TestExplicitCleanupRemovesArtifacts() {
  Harness    h("cleanup_explicit");
  const auto id = h.ReadyTask();

  assert(h.cleanup->Cleanup(id));
  assert(!h.registry->Find(id));
  assert(!fs::exists(h.workspace->TaskDir(id)));

  // repeated and unknown ids are fine
  assert(!h.cleanup->Cleanup(id));
  assert(!h.cleanup->Cleanup("never-existed"));
}

void TestActiveTaskIsNotRemoved() {
  Harness    h("cleanup_active");
  const auto id = h.registry->Create(TaskKind::kFetch);
  h.registry->MarkRunning(id, "downloading");
  h.workspace->EnsureTaskDir(id);

  bool threw = false;
  try {
    (void)h.cleanup->Cleanup(id);
  } catch (const mediaforge::util::Busy&) {
    threw = true;
  }
  assert(threw);
  assert(h.registry->Find(id));
  assert(fs::exists(h.workspace->TaskDir(id)));

  const auto stats = h.cleanup->Sweep(mediaforge::util::Now() + std::chrono::hours(3));
  assert(stats.tasks_removed == 0);
  assert(h.registry->Find(id));
}

void TestSweepHonoursRetention() {
  Harness    h("cleanup_sweep");
  const auto done   = h.ReadyTask();
  const auto failed = h.registry->Create(TaskKind::kAudioEdit);
  h.registry->Fail(failed, {mediaforge::util::ErrorKind::kToolFailure, "ffmpeg failed"});

  // too young
  auto stats = h.cleanup->Sweep(mediaforge::util::Now());
  assert(stats.tasks_removed == 0);
  assert(h.registry->Size() == 2);

  stats = h.cleanup->Sweep(mediaforge::util::Now() + std::chrono::hours(2));
  assert(stats.tasks_removed == 2);
  assert(stats.bytes_freed == 100u);
  assert(h.registry->Size() == 0);
  assert(!fs::exists(h.workspace->TaskDir(done)));
}

void TestSweepSkipsLeasedAssets() {
  Harness    h("cleanup_assets");
  const auto idle   = h.assets->Import("idle.mp3", "frames");
  const auto edited = h.assets->Import("edited.mp3", "frames");
  assert(h.assets->leases().TryAcquire(edited.id, "task-1"));

  const auto stats = h.cleanup->Sweep(mediaforge::util::Now() + std::chrono::hours(2));
  assert(stats.assets_removed == 1);
  assert(!h.assets->Find(idle.id));
  assert(!fs::exists(h.workspace->AssetDir(idle.id)));
  assert(h.assets->Find(edited.id));

  h.assets->leases().Release(edited.id, "task-1");
  assert(h.cleanup->Sweep(mediaforge::util::Now() + std::chrono::hours(2)).assets_removed == 1);
}

void TestBackgroundSweep() {
  Harness    h("cleanup_background", std::chrono::milliseconds(1), std::chrono::milliseconds(20));
  const auto id = h.ReadyTask();

  h.cleanup->Start();
  const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (h.registry->Find(id) && std::chrono::steady_clock::now() < until) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  h.cleanup->Stop();

  assert(!h.registry->Find(id));
  assert(!fs::exists(h.workspace->TaskDir(id)));
}

} // namespace

int main() {
  TestExplicitCleanupRemovesArtifacts();
  TestActiveTaskIsNotRemoved();
  TestSweepHonoursRetention();
  TestSweepSkipsLeasedAssets();
  TestBackgroundSweep();

  std::cout << "mediaforge_unit_cleanup_manager: pass\n";
  return 0;
}
