#include "audio_edit_executor.hpp"

#include <system_error>

#include "internal/lease/edit_lease_table.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace mediaforge::audio {

namespace fs = std::filesystem;

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

AudioEditExecutor::AudioEditExecutor(std::shared_ptr<registry::TaskRegistry> registry, std::shared_ptr<asset::AssetStore> assets,
                                     std::shared_ptr<process::ProcessRunner> runner, std::shared_ptr<storage::Workspace> workspace,
                                     std::shared_ptr<worker::TaskDispatcher> dispatcher, std::string ffmpeg_path,
                                     std::chrono::milliseconds timeout)
    : registry_(std::move(registry)),
      assets_(std::move(assets)),
      runner_(std::move(runner)),
      workspace_(std::move(workspace)),
      dispatcher_(std::move(dispatcher)),
      compiler_(std::move(ffmpeg_path)),
      timeout_(timeout) {
}

std::string AudioEditExecutor::Process(const std::string& asset_id, const model::AudioEditSpec& spec) {
  const auto asset = assets_->Get(asset_id);
  ValidateEditSpec(spec, asset.duration_seconds);

  // Held under a placeholder until the task id exists.
  const auto reservation = "reserve-" + util::NewId();
  if (!assets_->leases().TryAcquire(asset_id, reservation)) {
    throw util::Busy("asset " + asset_id + " already has an edit in progress");
  }
  auto lease = std::make_shared<lease::EditLease>(assets_->leases(), asset_id, reservation);

  // A removal may have finished between Get() and the lease.
  if (!assets_->Find(asset_id)) {
    throw util::NotFound("asset not found: " + asset_id);
  }

  const auto task_id = registry_->Create(model::TaskKind::kAudioEdit, asset_id);
  lease->Transfer(task_id);

  std::shared_ptr<const EditPlan> plan;
  try {
    plan = std::make_shared<const EditPlan>(
        compiler_.Compile(spec, asset, workspace_->TaskDir(task_id), workspace_->AssetDir(asset_id) / "extracted.flac"));
  } catch (const util::MediaError& e) {
    registry_->Fail(task_id, {e.kind(), e.what()});
    throw;
  } catch (const std::exception& e) {
    registry_->Fail(task_id, {util::ErrorKind::kInternal, e.what()});
    throw;
  }

  MEDIAFORGE_LOG_INFO("edit accepted", {StringField("task_id", task_id), StringField("asset_id", asset_id),
                                        IntField("invocations", static_cast<std::int64_t>(plan->invocations().size())),
                                        DoubleField("final_s", plan->timeline().final_length)});

  dispatcher_->Dispatch(task_id, [this, asset_id, lease, plan](const std::string& id) mutable {
    auto held = std::move(lease);
    Run(id, asset_id, *plan, *held);
  });
  return task_id;
}

void AudioEditExecutor::Run(const std::string& task_id, const std::string& asset_id, const EditPlan& plan, lease::EditLease& lease) {
  workspace_->EnsureTaskDir(task_id);

  const auto& invocations = plan.invocations();
  const int   count       = static_cast<int>(invocations.size());

  for (int i = 0; i < count; ++i) {
    const auto& step = invocations[static_cast<std::size_t>(i)];
    const int   from = 90 * i / count;
    const int   to   = 90 * (i + 1) / count;

    process::Invocation inv;
    inv.program          = compiler_.ffmpeg_path();
    inv.args             = step.args;
    inv.progress         = process::ProgressConvention::kFfmpeg;
    inv.expected_seconds = step.expected_seconds;
    inv.timeout          = timeout_;
    inv.task_id          = task_id;
    inv.label            = step.label;

    registry_->Update(task_id, from, step.label);
    runner_->RunChecked(inv, [&](int pct) { registry_->Update(task_id, from + (to - from) * pct / 100, step.label); });

    if (plan.extracts_audio() && i == 0) {
      assets_->RecordExtraction(asset_id, plan.extraction_path());
    }
  }

  registry_->Update(task_id, 90, "finalizing");

  std::error_code ec;
  for (const auto& path : plan.intermediates()) {
    fs::remove(path, ec);
  }

  const auto size = fs::file_size(plan.output(), ec);
  if (ec) {
    throw util::IOFailure("edit output missing: " + ec.message());
  }
  if (size == 0) {
    throw util::IOFailure("edit output is empty");
  }

  model::TaskResult result;
  result.artifact_path      = plan.output();
  result.extension          = storage::SanitizeExtension(plan.output().extension().string());
  result.size_bytes         = size;
  result.download_reference = storage::Workspace::DownloadReference(task_id, plan.output());

  // Free the asset before READY is observable.
  lease.Release();
  registry_->Complete(task_id, std::move(result));
}

} // namespace mediaforge::audio
