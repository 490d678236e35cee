#include "tool_errors.hpp"

#include <array>
#include <utility>

namespace mediaforge::process {

namespace {

using util::ErrorKind;

bool Contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

// First match wins.
constexpr std::array<std::pair<std::string_view, ErrorKind>, 18> kPatterns{{
    {"Requested format is not available", ErrorKind::kFormatNotFound},
    {"Unsupported URL", ErrorKind::kInvalidSource},
    {"is not a valid URL", ErrorKind::kInvalidSource},
    {"Video unavailable", ErrorKind::kInvalidSource},
    {"Private video", ErrorKind::kInvalidSource},
    {"This video is not available", ErrorKind::kInvalidSource},
    {"No space left on device", ErrorKind::kIOFailure},
    {"Permission denied", ErrorKind::kIOFailure},
    {"Read-only file system", ErrorKind::kIOFailure},
    {"Unable to download webpage", ErrorKind::kUnreachableSource},
    {"Failed to resolve", ErrorKind::kUnreachableSource},
    {"Name or service not known", ErrorKind::kUnreachableSource},
    {"Temporary failure in name resolution", ErrorKind::kUnreachableSource},
    {"Connection refused", ErrorKind::kUnreachableSource},
    {"Connection reset", ErrorKind::kUnreachableSource},
    {"Network is unreachable", ErrorKind::kUnreachableSource},
    {"timed out", ErrorKind::kUnreachableSource},
    {"HTTP Error", ErrorKind::kUnreachableSource},
}};

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\n' || s.front() == '\r' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\n' || s.back() == '\r' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

} // namespace

util::ErrorKind ClassifyToolError(std::string_view stderr_tail) {
  for (const auto& [needle, kind] : kPatterns) {
    if (Contains(stderr_tail, needle)) return kind;
  }
  return ErrorKind::kToolFailure;
}

std::string ToolErrorDetail(std::string_view stderr_tail) {
  if (auto pos = stderr_tail.rfind("ERROR:"); pos != std::string_view::npos) {
    auto line = stderr_tail.substr(pos);
    line      = line.substr(0, line.find('\n'));
    return std::string(Trim(line));
  }
  return std::string(Trim(stderr_tail));
}

void ThrowToolError(const Invocation& invocation, const ProcessResult& result) {
  if (result.timed_out) {
    throw util::Timeout(invocation.label + " timed out after " + std::to_string(result.elapsed.count()) + "ms");
  }

  auto detail = ToolErrorDetail(result.stderr_tail);
  if (detail.empty()) detail = invocation.program + " exited with code " + std::to_string(result.exit_code);
  util::Throw(ClassifyToolError(result.stderr_tail), detail);
}

} // namespace mediaforge::process
