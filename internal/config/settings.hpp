#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

#include "config/config.pb.h"

namespace mediaforge::config {

/*
  Effective runtime settings.

  RuntimeConfig leaves every field optional; Resolve() applies the
  documented defaults so components never see a zero timeout or an
  empty tool path.
*/
struct Settings {
  std::string bind_address      = "0.0.0.0:50061";
  uint32_t    max_message_bytes = 256u * 1024u * 1024u;

  std::filesystem::path storage_root = "/var/lib/mediaforge";

  std::string ytdlp_path   = "yt-dlp";
  std::string ffmpeg_path  = "ffmpeg";
  std::string ffprobe_path = "ffprobe";

  uint32_t                  max_concurrent_processes = 4;
  std::chrono::milliseconds process_timeout{std::chrono::minutes(30)};
  std::chrono::milliseconds probe_timeout{std::chrono::seconds(60)};
  std::chrono::milliseconds kill_grace{std::chrono::seconds(5)};
  std::size_t               stderr_tail_bytes = 4096;

  std::chrono::milliseconds retention{std::chrono::hours(1)};
  std::chrono::milliseconds sweep_interval{std::chrono::minutes(5)};

  uint32_t max_formats = 10;

  static Settings Resolve(const mediaforge::runtime::config::RuntimeConfig& config);
};

} // namespace mediaforge::config
