#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace mediaforge::model {

struct MediaAsset {
  std::string           id;
  std::filesystem::path stored_path;
  std::string           original_name;  // sanitized, display only

  double duration_seconds = 0.0;  // 0 when unknown

  // Upload carried a video stream; edits must extract audio first.
  bool is_container = false;

  // Set once an edit has extracted the audio-only stream of a container.
  std::optional<std::filesystem::path> extracted_audio_path;

  util::TimePoint created_at;
};

} // namespace mediaforge::model
