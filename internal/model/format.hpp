#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace mediaforge::model {

/*
  One selectable stream option from a single probe.

  Snapshot only: a fetch re-probes and matches on format_id alone.
*/
struct FormatDescriptor {
  std::string format_id;
  std::string quality;  // "1080p", "720p 60fps", "128kbps"
  bool        has_video = false;
  bool        has_audio = false;
  std::string resolution;  // "1920x1080", empty for audio-only
  uint32_t    fps = 0;
  std::string ext;
  std::string vcodec;
  std::string acodec;
  uint64_t    approx_size_bytes = 0;  // 0 when unknown
  std::string size_label;             // "12.3 MB" or "Unknown"
};

struct ProbeResult {
  std::string                   title;
  double                        duration_seconds = 0.0;
  std::string                   thumbnail;
  std::string                   source;  // extractor name, e.g. "Youtube"
  std::vector<FormatDescriptor> formats;
};

} // namespace mediaforge::model
