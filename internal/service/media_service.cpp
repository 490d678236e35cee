#include "media_service.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <type_traits>
#include <vector>

#include "internal/asset/asset_store.hpp"
#include "internal/audio/audio_edit_executor.hpp"
#include "internal/cleanup/cleanup_manager.hpp"
#include "internal/download/download_executor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/format_prober.hpp"
#include "internal/registry/task_registry.hpp"
#include "internal/service/proto_convert.hpp"
#include "internal/util/errors.hpp"

namespace mediaforge::service {

using namespace mediaforge::v1;

namespace {

std::string_view KindOf(const std::exception& ex) {
  if (const auto* media = dynamic_cast<const util::MediaError*>(&ex)) {
    return util::ErrorKindName(media->kind());
  }
  if (dynamic_cast<const util::InvalidState*>(&ex)) return "INVALID_STATE";
  return "INTERNAL";
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      MEDIAFORGE_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::DoubleField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      MEDIAFORGE_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::DoubleField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    MEDIAFORGE_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("subject", subject),
                                        observability::StringField("error_kind", KindOf(ex)), observability::StringField("error", ex.what()),
                                        observability::DoubleField("latency_ms", elapsed_ms())});
    throw;
  }
}

} // namespace

MediaService::MediaService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

AnalyzeResponse MediaService::Analyze(const AnalyzeRequest& req) {
  return ObserveRpc("MediaService.Analyze", req.url(), [&] { return ToProto(ctx_.prober->Probe(req.url())); });
}

TaskHandle MediaService::Download(const DownloadRequest& req) {
  return ObserveRpc("MediaService.Download", req.url(), [&] {
    TaskHandle handle;
    handle.set_task_id(ctx_.downloads->Submit(FromProto(req)));
    return handle;
  });
}

StatusResponse MediaService::Status(const StatusRequest& req) {
  return ObserveRpc("MediaService.Status", req.task_id(), [&] { return ToProto(ctx_.registry->Get(req.task_id())); });
}

void MediaService::Cleanup(const CleanupRequest& req) {
  ObserveRpc("MediaService.Cleanup", req.task_id(), [&] { ctx_.cleanup->Cleanup(req.task_id()); });
}

UploadResponse MediaService::Upload(const UploadRequest& req) {
  return ObserveRpc("MediaService.Upload", req.filename(), [&] {
    const auto asset = ctx_.assets->Import(req.filename(), req.data());

    UploadResponse resp;
    resp.set_asset_id(asset.id);
    resp.set_duration_seconds(asset.duration_seconds);
    resp.set_is_container(asset.is_container);
    return resp;
  });
}

TaskHandle MediaService::Process(const ProcessRequest& req) {
  return ObserveRpc("MediaService.Process", req.asset_id(), [&] {
    TaskHandle handle;
    handle.set_task_id(ctx_.edits->Process(req.asset_id(), FromProto(req.spec())));
    return handle;
  });
}

void MediaService::FetchArtifact(const FetchArtifactRequest& req, const ChunkSink& sink) {
  ObserveRpc("MediaService.FetchArtifact", req.task_id(), [&] {
    const auto record = ctx_.registry->Get(req.task_id());
    if (record.status != model::TaskStatus::kReady || !record.result) {
      throw util::InvalidState("task " + req.task_id() + " has no artifact yet");
    }

    const auto& result = *record.result;
    std::ifstream in(result.artifact_path, std::ios::binary);
    if (!in) {
      throw util::IOFailure("artifact unreadable: " + result.artifact_path.filename().string());
    }

    const auto        chunk_bytes = std::max<std::size_t>(1, ctx_.artifact_chunk_bytes);
    std::vector<char> buf(chunk_bytes);
    bool              first = true;

    while (true) {
      in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
      const auto n = in.gcount();
      if (n <= 0 && !first) break;

      ArtifactChunk chunk;
      if (first) {
        chunk.set_file_name(result.artifact_path.filename().string());
        chunk.set_total_bytes(result.size_bytes);
        first = false;
      }
      chunk.set_data(buf.data(), static_cast<std::size_t>(n));
      if (!sink(chunk)) return;
      if (n < static_cast<std::streamsize>(buf.size())) break;
    }
    if (in.bad()) {
      throw util::IOFailure("artifact read failed: " + result.artifact_path.filename().string());
    }
  });
}

} // namespace mediaforge::service
