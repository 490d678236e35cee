#pragma once

#include <functional>

#include "internal/service/service_context.hpp"
#include "mediaforge/v1/media_service.pb.h"

namespace mediaforge::service {

// Receives artifact chunks in order; returning false stops the transfer.
using ChunkSink = std::function<bool(const mediaforge::v1::ArtifactChunk&)>;

/*
  Request-boundary facade.

  Transport-independent: the gRPC adapter and tests call it directly.
  Every call is logged on failure with its route and error kind, then
  rethrown for the transport to map.
*/
class MediaService {
 public:
  explicit MediaService(ServiceContext ctx);

  mediaforge::v1::AnalyzeResponse Analyze(const mediaforge::v1::AnalyzeRequest& req);

  mediaforge::v1::TaskHandle Download(const mediaforge::v1::DownloadRequest& req);

  mediaforge::v1::StatusResponse Status(const mediaforge::v1::StatusRequest& req);

  void Cleanup(const mediaforge::v1::CleanupRequest& req);

  mediaforge::v1::UploadResponse Upload(const mediaforge::v1::UploadRequest& req);

  mediaforge::v1::TaskHandle Process(const mediaforge::v1::ProcessRequest& req);

  // Throws util::NotFound for unknown tasks, util::InvalidState unless READY.
  void FetchArtifact(const mediaforge::v1::FetchArtifactRequest& req, const ChunkSink& sink);

 private:
  ServiceContext ctx_;
};

} // namespace mediaforge::service
