#pragma once

#include <string>
#include <string_view>

#include "internal/process/process_runner.hpp"
#include "internal/util/errors.hpp"

namespace mediaforge::process {

/*
  Maps a failed extractor/transcoder run onto the error taxonomy by
  scanning its stderr tail. Unrecognised output is ToolFailure.
*/
util::ErrorKind ClassifyToolError(std::string_view stderr_tail);

// Last "ERROR:" line when present, else the trimmed tail.
std::string ToolErrorDetail(std::string_view stderr_tail);

// Throws the classified MediaError for a result that is not ok().
[[noreturn]] void ThrowToolError(const Invocation& invocation, const ProcessResult& result);

} // namespace mediaforge::process
