#include "media_server.hpp"

#include "grpc_error.hpp"

namespace mediaforge::grpc {

using namespace mediaforge::v1;

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

MediaServer::MediaServer(std::shared_ptr<mediaforge::service::MediaService> svc) : service_(std::move(svc)) {
}

::grpc::Status MediaServer::Analyze(::grpc::ServerContext*, const AnalyzeRequest* req, AnalyzeResponse* resp) {
  return Handle([&] { *resp = service_->Analyze(*req); });
}

::grpc::Status MediaServer::Download(::grpc::ServerContext*, const DownloadRequest* req, TaskHandle* resp) {
  return Handle([&] { *resp = service_->Download(*req); });
}

::grpc::Status MediaServer::Status(::grpc::ServerContext*, const StatusRequest* req, StatusResponse* resp) {
  return Handle([&] { *resp = service_->Status(*req); });
}

::grpc::Status MediaServer::Cleanup(::grpc::ServerContext*, const CleanupRequest* req, CleanupResponse*) {
  return Handle([&] { service_->Cleanup(*req); });
}

::grpc::Status MediaServer::Upload(::grpc::ServerContext*, const UploadRequest* req, UploadResponse* resp) {
  return Handle([&] { *resp = service_->Upload(*req); });
}

::grpc::Status MediaServer::Process(::grpc::ServerContext*, const ProcessRequest* req, TaskHandle* resp) {
  return Handle([&] { *resp = service_->Process(*req); });
}

::grpc::Status MediaServer::FetchArtifact(::grpc::ServerContext* ctx, const FetchArtifactRequest* req,
                                          ::grpc::ServerWriter<ArtifactChunk>* writer) {
  return Handle([&] {
    service_->FetchArtifact(*req, [&](const ArtifactChunk& chunk) { return !ctx->IsCancelled() && writer->Write(chunk); });
  });
}

} // namespace mediaforge::grpc
