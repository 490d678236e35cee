#include "internal/registry/task_registry.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

using mediaforge::model::TaskError;
using mediaforge::model::TaskKind;
using mediaforge::model::TaskResult;
using mediaforge::model::TaskStatus;
using mediaforge::registry::TaskRegistry;
using mediaforge::util::ErrorKind;

void TestCreateStartsQueued() {
  TaskRegistry registry;
  const auto   id = registry.Create(TaskKind::kFetch);

  const auto record = registry.Get(id);
  assert(record.id == id);
  assert(record.kind == TaskKind::kFetch);
  assert(record.status == TaskStatus::kQueued);
  assert(record.progress == 0);
  assert(!record.result);
  assert(!record.error);
  assert(registry.Size() == 1);
}

void TestIdsAreUnique() {
  TaskRegistry registry;
  const auto   a = registry.Create(TaskKind::kFetch);
  const auto   b = registry.Create(TaskKind::kAudioEdit, std::string("asset-1"));
  assert(a != b);
  assert(registry.Get(b).owner.value() == "asset-1");
}

void TestProgressIsMonotonicAndCappedBelowReady() {
  TaskRegistry registry;
  const auto   id = registry.Create(TaskKind::kFetch);
  registry.MarkRunning(id, "downloading");

  registry.Update(id, 40, "downloading");
  assert(registry.Get(id).progress == 40);

  registry.Update(id, 10, "");
  assert(registry.Get(id).progress == 40);
  assert(registry.Get(id).message == "downloading");

  registry.Update(id, 100, "finishing");
  assert(registry.Get(id).progress == 99);
  assert(registry.Get(id).status == TaskStatus::kRunning);
}

void TestCompleteSetsReadyAndHundred() {
  TaskRegistry registry;
  const auto   id = registry.Create(TaskKind::kFetch);
  registry.MarkRunning(id, "running");

  TaskResult result;
  result.extension          = "mp4";
  result.size_bytes         = 42;
  result.download_reference = "/download/" + id + "/media.mp4";
  registry.Complete(id, result);

  const auto record = registry.Get(id);
  assert(record.status == TaskStatus::kReady);
  assert(record.progress == 100);
  assert(record.result->size_bytes == 42);
  assert(!record.error);
}

void TestCompleteRequiresRunning() {
  TaskRegistry registry;
  const auto   id = registry.Create(TaskKind::kFetch);

  bool threw = false;
  try {
    registry.Complete(id, TaskResult{});
  } catch (const mediaforge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(registry.Get(id).status == TaskStatus::kQueued);
}

void TestTerminalRecordRejectsWrites() {
  TaskRegistry registry;
  const auto   id = registry.Create(TaskKind::kAudioEdit);
  registry.MarkRunning(id, "running");
  registry.Fail(id, TaskError{ErrorKind::kToolFailure, "ffmpeg exited with 1"});

  const auto failed = registry.Get(id);
  assert(failed.status == TaskStatus::kError);
  assert(failed.error->kind == ErrorKind::kToolFailure);
  assert(failed.progress < 100);

  bool threw = false;
  try {
    registry.Update(id, 50, "late");
  } catch (const mediaforge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    registry.MarkRunning(id, "again");
  } catch (const mediaforge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(registry.Get(id).status == TaskStatus::kError);
}

void TestTransitionTable() {
  using mediaforge::model::CanTransition;

  static_assert(CanTransition(TaskStatus::kQueued, TaskStatus::kRunning));
  static_assert(CanTransition(TaskStatus::kQueued, TaskStatus::kError));
  static_assert(!CanTransition(TaskStatus::kQueued, TaskStatus::kReady));
  static_assert(CanTransition(TaskStatus::kRunning, TaskStatus::kReady));
  static_assert(!CanTransition(TaskStatus::kRunning, TaskStatus::kQueued));
  static_assert(!CanTransition(TaskStatus::kReady, TaskStatus::kError));
  static_assert(!CanTransition(TaskStatus::kError, TaskStatus::kReady));

  // The registry enforces the same table: a READY task cannot be failed.
  TaskRegistry registry;
  const auto   id = registry.Create(TaskKind::kFetch);
  registry.MarkRunning(id, "running");
  registry.Complete(id, TaskResult{});

  bool threw = false;
  try {
    registry.Fail(id, TaskError{ErrorKind::kInternal, "late failure"});
  } catch (const mediaforge::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  const auto record = registry.Get(id);
  assert(record.status == TaskStatus::kReady);
  assert(!record.error);
}

void TestQueuedMayFailDirectly() {
  TaskRegistry registry;
  const auto   id = registry.Create(TaskKind::kFetch);
  registry.Fail(id, TaskError{ErrorKind::kInternal, "worker lost"});
  assert(registry.Get(id).status == TaskStatus::kError);
}

void TestUnknownIdIsNotFound() {
  TaskRegistry registry;
  bool         threw = false;
  try {
    (void)registry.Get("missing");
  } catch (const mediaforge::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(!registry.Find("missing"));
  assert(!registry.Delete("missing"));
}

void TestDeleteIsIdempotent() {
  TaskRegistry registry;
  const auto   id = registry.Create(TaskKind::kFetch);
  assert(registry.Delete(id));
  assert(!registry.Delete(id));
  assert(registry.Size() == 0);
}

void TestConcurrentReadersSeeConsistentSnapshots() {
  TaskRegistry registry;
  const auto   id = registry.Create(TaskKind::kFetch);
  registry.MarkRunning(id, "running");

  std::thread writer([&] {
    for (int p = 1; p <= 99; ++p) {
      registry.Update(id, p, "step");
    }
    registry.Complete(id, TaskResult{});
  });

  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      int last = 0;
      for (int i = 0; i < 500; ++i) {
        const auto record = registry.Get(id);
        assert(record.progress >= last);
        assert((record.progress == 100) == (record.status == TaskStatus::kReady));
        last = record.progress;
      }
    });
  }

  writer.join();
  for (auto& t : readers) t.join();
  assert(registry.Get(id).status == TaskStatus::kReady);
}

} // namespace

int main() {
  TestCreateStartsQueued();
  TestIdsAreUnique();
  TestProgressIsMonotonicAndCappedBelowReady();
  TestCompleteSetsReadyAndHundred();
  TestCompleteRequiresRunning();
  TestTerminalRecordRejectsWrites();
  TestTransitionTable();
  TestQueuedMayFailDirectly();
  TestUnknownIdIsNotFound();
  TestDeleteIsIdempotent();
  TestConcurrentReadersSeeConsistentSnapshots();

  std::cout << "mediaforge_unit_task_registry: pass\n";
  return 0;
}
