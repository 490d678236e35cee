#pragma once

#include <optional>
#include <string>

namespace mediaforge::model {

struct TimeWindow {
  double start_seconds = 0.0;
  double end_seconds   = 0.0;
};

struct FadeSpec {
  bool   enabled          = false;
  double duration_seconds = 0.0;
};

struct CutMiddleSpec {
  TimeWindow window;
  double     crossfade_seconds = 0.0;  // 0 joins the segments directly
};

/*
  Edit request against one uploaded asset.

  All times are seconds on the source timeline. The compiler rebases them
  onto the trimmed range.
*/
struct AudioEditSpec {
  std::string codec   = "mp3";  // mp3 | m4a | opus | wma | flac | wav
  std::string bitrate = "192k";  // ignored for lossless codecs

  std::optional<TimeWindow>    trim;
  FadeSpec                     fade_in;
  FadeSpec                     fade_out;
  std::optional<CutMiddleSpec> cut_middle;

  int    channels    = 2;
  int    sample_rate = 44100;
  double volume      = 1.0;
};

} // namespace mediaforge::model
