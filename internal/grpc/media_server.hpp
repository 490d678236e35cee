#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/media_service.hpp"
#include "mediaforge/v1/media_service.grpc.pb.h"

namespace mediaforge::grpc {

class MediaServer final : public mediaforge::v1::MediaService::Service {
 public:
  explicit MediaServer(std::shared_ptr<mediaforge::service::MediaService> svc);

  ::grpc::Status Analyze(::grpc::ServerContext* ctx, const mediaforge::v1::AnalyzeRequest* req,
                         mediaforge::v1::AnalyzeResponse* resp) override;

  ::grpc::Status Download(::grpc::ServerContext* ctx, const mediaforge::v1::DownloadRequest* req,
                          mediaforge::v1::TaskHandle* resp) override;

  ::grpc::Status Status(::grpc::ServerContext* ctx, const mediaforge::v1::StatusRequest* req,
                        mediaforge::v1::StatusResponse* resp) override;

  ::grpc::Status Cleanup(::grpc::ServerContext* ctx, const mediaforge::v1::CleanupRequest* req,
                         mediaforge::v1::CleanupResponse* resp) override;

  ::grpc::Status Upload(::grpc::ServerContext* ctx, const mediaforge::v1::UploadRequest* req,
                        mediaforge::v1::UploadResponse* resp) override;

  ::grpc::Status Process(::grpc::ServerContext* ctx, const mediaforge::v1::ProcessRequest* req,
                         mediaforge::v1::TaskHandle* resp) override;

  ::grpc::Status FetchArtifact(::grpc::ServerContext* ctx, const mediaforge::v1::FetchArtifactRequest* req,
                               ::grpc::ServerWriter<mediaforge::v1::ArtifactChunk>* writer) override;

 private:
  std::shared_ptr<mediaforge::service::MediaService> service_;
};

} // namespace mediaforge::grpc
