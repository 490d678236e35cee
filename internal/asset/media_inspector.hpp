#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include "internal/process/process_runner.hpp"

namespace mediaforge::asset {

struct MediaInfo {
  double duration_seconds = 0.0;
  bool   has_audio        = false;
  bool   has_video        = false;  // cover art does not count
};

// Parses `ffprobe -of json -show_format -show_streams` output.
MediaInfo ParseMediaInfo(const std::string& json);

class MediaInspector {
 public:
  MediaInspector(std::shared_ptr<process::ProcessRunner> runner, std::string ffprobe_path, std::chrono::milliseconds timeout);

  // Throws util::InvalidSource when ffprobe cannot read the file.
  MediaInfo Inspect(const std::filesystem::path& file) const;

 private:
  std::shared_ptr<process::ProcessRunner> runner_;
  std::string                             ffprobe_path_;
  std::chrono::milliseconds               timeout_;
};

} // namespace mediaforge::asset
