#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "internal/model/format.hpp"

namespace mediaforge::probe {

// "12.3 MB"; "Unknown" for 0.
std::string FormatSize(uint64_t bytes);

/*
  Parses the document printed by `yt-dlp -J`.

  Video formats (height set, vcodec not "none") are labelled "<h>p" or
  "<h>p <fps>fps" above 30fps, de-duplicated by label and ordered by
  height descending. Audio-only formats follow, ordered by bitrate
  descending. Each category keeps at most max_per_category entries.

  Throws util::InvalidSource for malformed JSON or a document without a
  usable format.
*/
model::ProbeResult ParseProbeJson(std::string_view json, std::size_t max_per_category);

} // namespace mediaforge::probe
