#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace mediaforge::util {

/*
  Central error types.

  Every failure a caller can observe carries a machine-readable ErrorKind.
  Validation kinds are thrown synchronously from submit paths; execution
  kinds are recorded on the task record by its worker. The gRPC adapter
  translates kinds to status codes.
*/

enum class ErrorKind {
  kUnreachableSource,
  kInvalidSource,
  kFormatNotFound,
  kInvalidEditSpec,
  kToolFailure,
  kTimeout,
  kBusy,
  kNotFound,
  kIOFailure,
  kInternal,
};

// Stable code used on the wire and in logs, e.g. "FORMAT_NOT_FOUND".
std::string_view ErrorKindName(ErrorKind kind);

// Timeout and ToolFailure may succeed on a fresh submission; the rest need an input fix.
bool IsTransient(ErrorKind kind);

class MediaError : public std::runtime_error {
 public:
  MediaError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ErrorKind kind() const {
    return kind_;
  }

 private:
  ErrorKind kind_;
};

class UnreachableSource : public MediaError {
 public:
  explicit UnreachableSource(const std::string& msg) : MediaError(ErrorKind::kUnreachableSource, msg) {
  }
};

class InvalidSource : public MediaError {
 public:
  explicit InvalidSource(const std::string& msg) : MediaError(ErrorKind::kInvalidSource, msg) {
  }
};

class FormatNotFound : public MediaError {
 public:
  explicit FormatNotFound(const std::string& msg) : MediaError(ErrorKind::kFormatNotFound, msg) {
  }
};

class InvalidEditSpec : public MediaError {
 public:
  explicit InvalidEditSpec(const std::string& msg) : MediaError(ErrorKind::kInvalidEditSpec, msg) {
  }
};

class ToolFailure : public MediaError {
 public:
  explicit ToolFailure(const std::string& msg) : MediaError(ErrorKind::kToolFailure, msg) {
  }
};

class Timeout : public MediaError {
 public:
  explicit Timeout(const std::string& msg) : MediaError(ErrorKind::kTimeout, msg) {
  }
};

class Busy : public MediaError {
 public:
  explicit Busy(const std::string& msg) : MediaError(ErrorKind::kBusy, msg) {
  }
};

class NotFound : public MediaError {
 public:
  explicit NotFound(const std::string& msg) : MediaError(ErrorKind::kNotFound, msg) {
  }
};

class IOFailure : public MediaError {
 public:
  explicit IOFailure(const std::string& msg) : MediaError(ErrorKind::kIOFailure, msg) {
  }
};

// Programming/lifecycle misuse, e.g. writing to a terminal task record.
class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Throws the MediaError subclass matching kind.
[[noreturn]] void Throw(ErrorKind kind, const std::string& msg);

} // namespace mediaforge::util
