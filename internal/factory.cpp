#include "factory.hpp"

#include "internal/asset/asset_store.hpp"
#include "internal/asset/media_inspector.hpp"
#include "internal/audio/audio_edit_executor.hpp"
#include "internal/cleanup/cleanup_manager.hpp"
#include "internal/download/download_executor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/ytdlp_prober.hpp"
#include "internal/process/process_runner.hpp"
#include "internal/registry/task_registry.hpp"
#include "internal/service/media_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/workspace.hpp"
#include "internal/worker/task_dispatcher.hpp"

namespace mediaforge::factory {

Application::~Application() {
  Shutdown();
}

void Application::Shutdown() {
  if (cleanup) cleanup->Stop();
  if (dispatcher) dispatcher->Shutdown();
}

Application Build(const config::Settings& settings, std::shared_ptr<probe::FormatProber> prober) {
  Application app;
  app.settings = settings;

  // ------------------------------------------------------------------
  // Leaves
  // ------------------------------------------------------------------
  process::RunnerOptions runner_options;
  runner_options.max_concurrent    = settings.max_concurrent_processes;
  runner_options.default_timeout   = settings.process_timeout;
  runner_options.kill_grace        = settings.kill_grace;
  runner_options.stderr_tail_bytes = settings.stderr_tail_bytes;

  app.registry  = std::make_shared<registry::TaskRegistry>();
  app.runner    = std::make_shared<process::ProcessRunner>(runner_options);
  app.workspace = std::make_shared<storage::Workspace>(settings.storage_root);
  app.workspace->EnsureLayout();

  if (prober) {
    app.prober = std::move(prober);
  } else {
    probe::YtDlpProberOptions probe_options;
    probe_options.ytdlp_path  = settings.ytdlp_path;
    probe_options.timeout     = settings.probe_timeout;
    probe_options.max_formats = settings.max_formats;
    app.prober                = std::make_shared<probe::YtDlpProber>(app.runner, probe_options);
  }

  // ------------------------------------------------------------------
  // Task execution
  // ------------------------------------------------------------------
  app.dispatcher = std::make_shared<worker::TaskDispatcher>(app.registry);

  auto inspector = std::make_shared<asset::MediaInspector>(app.runner, settings.ffprobe_path, settings.probe_timeout);
  app.assets     = std::make_shared<asset::AssetStore>(app.workspace, inspector);

  download::DownloadOptions download_options;
  download_options.ytdlp_path  = settings.ytdlp_path;
  download_options.ffmpeg_path = settings.ffmpeg_path;
  download_options.timeout     = settings.process_timeout;
  auto downloads = std::make_shared<download::DownloadExecutor>(app.registry, app.prober, app.runner, app.workspace, app.dispatcher,
                                                                download_options);

  auto edits = std::make_shared<audio::AudioEditExecutor>(app.registry, app.assets, app.runner, app.workspace, app.dispatcher,
                                                          settings.ffmpeg_path, settings.process_timeout);

  app.cleanup = std::make_shared<cleanup::CleanupManager>(app.registry, app.workspace, app.assets, settings.retention, settings.sweep_interval);
  app.cleanup->Start();

  // ------------------------------------------------------------------
  // Service facade
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry  = app.registry;
  ctx.prober    = app.prober;
  ctx.downloads = downloads;
  ctx.edits     = edits;
  ctx.assets    = app.assets;
  ctx.cleanup   = app.cleanup;

  app.service = std::make_shared<service::MediaService>(ctx);

  MEDIAFORGE_LOG_INFO("runtime built", {observability::StringField("storage_root", settings.storage_root.string()),
                                        observability::IntField("max_concurrent", settings.max_concurrent_processes)});
  return app;
}

} // namespace mediaforge::factory
