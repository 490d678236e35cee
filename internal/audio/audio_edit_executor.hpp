#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "internal/asset/asset_store.hpp"
#include "internal/lease/edit_lease_table.hpp"
#include "internal/audio/audio_edit_compiler.hpp"
#include "internal/model/audio_edit_spec.hpp"
#include "internal/process/process_runner.hpp"
#include "internal/registry/task_registry.hpp"
#include "internal/storage/workspace.hpp"
#include "internal/worker/task_dispatcher.hpp"

namespace mediaforge::audio {

/*
  Edit tasks.

  Process() validates and compiles synchronously (InvalidEditSpec), then
  takes the asset's edit lease (Busy when another edit holds it) before
  the task exists. The worker runs the plan's invocations in order with
  progress split evenly over 0-90%, verifies the output, and the lease
  is released whatever the outcome.
*/
class AudioEditExecutor {
 public:
  AudioEditExecutor(std::shared_ptr<registry::TaskRegistry> registry, std::shared_ptr<asset::AssetStore> assets,
                    std::shared_ptr<process::ProcessRunner> runner, std::shared_ptr<storage::Workspace> workspace,
                    std::shared_ptr<worker::TaskDispatcher> dispatcher, std::string ffmpeg_path, std::chrono::milliseconds timeout);

  std::string Process(const std::string& asset_id, const model::AudioEditSpec& spec);

 private:
  void Run(const std::string& task_id, const std::string& asset_id, const EditPlan& plan, lease::EditLease& lease);

  std::shared_ptr<registry::TaskRegistry>  registry_;
  std::shared_ptr<asset::AssetStore>       assets_;
  std::shared_ptr<process::ProcessRunner>  runner_;
  std::shared_ptr<storage::Workspace>      workspace_;
  std::shared_ptr<worker::TaskDispatcher>  dispatcher_;
  AudioEditCompiler                        compiler_;
  std::chrono::milliseconds                timeout_;
};

} // namespace mediaforge::audio
