#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/factory.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/media_server.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using mediaforge::grpc::MediaServer;
using mediaforge::grpc::ToStatus;
using mediaforge::grpc::ToStatusCode;
using mediaforge::testing::FakeProber;
using mediaforge::testing::TempDir;
using mediaforge::testing::WriteTool;
using mediaforge::util::ErrorKind;

struct Runtime {
  explicit Runtime(const std::string& name) : tmp(name) {
    mediaforge::config::Settings settings;
    settings.storage_root = tmp.path() / "data";
    settings.ffprobe_path =
        WriteTool(tmp.path(), "ffprobe", "echo '{\"format\":{\"duration\":\"10.0\"},\"streams\":[{\"codec_type\":\"audio\"}]}'\n");
    app = mediaforge::factory::Build(settings, std::make_shared<FakeProber>(mediaforge::testing::SampleProbe()));
  }

  ~Runtime() {
    app.Shutdown();
  }

  TempDir                          tmp;
  mediaforge::factory::Application app;
};

void TestErrorKindMapping() {
  assert(ToStatusCode(ErrorKind::kNotFound) == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatusCode(ErrorKind::kInvalidSource) == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatusCode(ErrorKind::kFormatNotFound) == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatusCode(ErrorKind::kInvalidEditSpec) == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatusCode(ErrorKind::kUnreachableSource) == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatusCode(ErrorKind::kTimeout) == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(ToStatusCode(ErrorKind::kBusy) == ::grpc::StatusCode::ABORTED);
  assert(ToStatusCode(ErrorKind::kToolFailure) == ::grpc::StatusCode::INTERNAL);
  assert(ToStatusCode(ErrorKind::kIOFailure) == ::grpc::StatusCode::INTERNAL);

  const auto status = ToStatus(mediaforge::util::FormatNotFound("format 144p is not offered"));
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_details() == "FORMAT_NOT_FOUND");

  assert(ToStatus(mediaforge::util::InvalidState("not ready")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(std::invalid_argument("bad id")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestStatusForUnknownTaskIsNotFound() {
  Runtime     rt("grpc_not_found");
  MediaServer server(rt.app.service);

  mediaforge::v1::StatusRequest req;
  req.set_task_id("missing-task");
  mediaforge::v1::StatusResponse resp;
  ::grpc::ServerContext          ctx;

  const auto status = server.Status(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestStaleFormatIsInvalidArgument() {
  Runtime     rt("grpc_stale_format");
  MediaServer server(rt.app.service);

  mediaforge::v1::DownloadRequest req;
  req.set_url("https://www.youtube.com/watch?v=abc");
  req.set_format_id("144p");
  mediaforge::v1::TaskHandle resp;
  ::grpc::ServerContext      ctx;

  const auto status = server.Download(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(resp.task_id().empty());
}

void TestEditOnLeasedAssetIsAborted() {
  Runtime     rt("grpc_busy");
  MediaServer server(rt.app.service);

  const auto asset = rt.app.assets->Import("song.mp3", "frames");
  assert(rt.app.assets->leases().TryAcquire(asset.id, "other-task"));

  mediaforge::v1::ProcessRequest req;
  req.set_asset_id(asset.id);
  mediaforge::v1::TaskHandle resp;
  ::grpc::ServerContext      ctx;

  const auto status = server.Process(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::ABORTED);
  assert(status.error_details() == "BUSY");
}

} // namespace

int main() {
  TestErrorKindMapping();
  TestStatusForUnknownTaskIsNotFound();
  TestStaleFormatIsInvalidArgument();
  TestEditOnLeasedAssetIsAborted();

  std::cout << "mediaforge_unit_grpc_status: pass\n";
  return 0;
}
