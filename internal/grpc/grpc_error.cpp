#include "grpc_error.hpp"

#include <stdexcept>

namespace mediaforge::grpc {

::grpc::StatusCode ToStatusCode(util::ErrorKind kind) {
  using util::ErrorKind;

  switch (kind) {
    case ErrorKind::kNotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case ErrorKind::kInvalidSource:
    case ErrorKind::kFormatNotFound:
    case ErrorKind::kInvalidEditSpec:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case ErrorKind::kUnreachableSource:
      return ::grpc::StatusCode::UNAVAILABLE;
    case ErrorKind::kTimeout:
      return ::grpc::StatusCode::DEADLINE_EXCEEDED;
    case ErrorKind::kBusy:
      return ::grpc::StatusCode::ABORTED;
    case ErrorKind::kToolFailure:
    case ErrorKind::kIOFailure:
    case ErrorKind::kInternal:
      break;
  }
  return ::grpc::StatusCode::INTERNAL;
}

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* media = dynamic_cast<const util::MediaError*>(&e)) {
    // Keep the machine-readable kind for clients.
    return {ToStatusCode(media->kind()), e.what(), std::string(util::ErrorKindName(media->kind()))};
  }
  if (dynamic_cast<const util::InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace mediaforge::grpc
