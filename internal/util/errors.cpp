#include "errors.hpp"

namespace mediaforge::util {

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kUnreachableSource:
      return "UNREACHABLE_SOURCE";
    case ErrorKind::kInvalidSource:
      return "INVALID_SOURCE";
    case ErrorKind::kFormatNotFound:
      return "FORMAT_NOT_FOUND";
    case ErrorKind::kInvalidEditSpec:
      return "INVALID_EDIT_SPEC";
    case ErrorKind::kToolFailure:
      return "TOOL_FAILURE";
    case ErrorKind::kTimeout:
      return "TIMEOUT";
    case ErrorKind::kBusy:
      return "BUSY";
    case ErrorKind::kNotFound:
      return "NOT_FOUND";
    case ErrorKind::kIOFailure:
      return "IO_FAILURE";
    case ErrorKind::kInternal:
      break;
  }
  return "INTERNAL";
}

bool IsTransient(ErrorKind kind) {
  return kind == ErrorKind::kTimeout || kind == ErrorKind::kToolFailure;
}

void Throw(ErrorKind kind, const std::string& msg) {
  switch (kind) {
    case ErrorKind::kUnreachableSource:
      throw UnreachableSource(msg);
    case ErrorKind::kInvalidSource:
      throw InvalidSource(msg);
    case ErrorKind::kFormatNotFound:
      throw FormatNotFound(msg);
    case ErrorKind::kInvalidEditSpec:
      throw InvalidEditSpec(msg);
    case ErrorKind::kToolFailure:
      throw ToolFailure(msg);
    case ErrorKind::kTimeout:
      throw Timeout(msg);
    case ErrorKind::kBusy:
      throw Busy(msg);
    case ErrorKind::kNotFound:
      throw NotFound(msg);
    case ErrorKind::kIOFailure:
      throw IOFailure(msg);
    case ErrorKind::kInternal:
      break;
  }
  throw MediaError(ErrorKind::kInternal, msg);
}

} // namespace mediaforge::util
