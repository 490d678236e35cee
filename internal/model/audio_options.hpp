#pragma once

#include <optional>
#include <string>

namespace mediaforge::model {

enum class FetchKind {
  kVideo,
  kAudio,
};

/*
  Basic transcode parameters applied after an audio fetch.

  codec "copy" keeps the extracted stream untouched and ignores the
  remaining fields. qscale (0-9, mp3 only) selects VBR instead of bitrate.
*/
struct AudioOptions {
  std::string        codec   = "mp3";
  std::string        bitrate = "192k";
  std::optional<int> qscale;
  int                channels    = 2;
  int                sample_rate = 44100;
  double             volume      = 1.0;
};

struct DownloadRequest {
  std::string  url;
  std::string  format_id;
  FetchKind    kind = FetchKind::kVideo;
  AudioOptions audio;
};

} // namespace mediaforge::model
