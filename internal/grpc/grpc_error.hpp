#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace mediaforge::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/

::grpc::StatusCode ToStatusCode(util::ErrorKind kind);

::grpc::Status ToStatus(const std::exception& e);

} // namespace mediaforge::grpc
