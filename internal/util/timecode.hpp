#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace mediaforge::util {

/*
  Timecode helpers for edit windows.

  Accepted forms: "HH:MM:SS[.fff]", "MM:SS[.fff]", "SS[.fff]".
  Minutes and seconds fields after the first must be < 60.
*/
std::optional<double> ParseTimecode(std::string_view text);

// Fixed three-decimal seconds, the form handed to ffmpeg filters ("12.500").
std::string FormatSeconds(double seconds);

} // namespace mediaforge::util
