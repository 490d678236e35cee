#include "settings.hpp"

#include "internal/util/time.hpp"

namespace mediaforge::config {

namespace {

void SetIfPresent(std::string* dst, const std::string& value) {
  if (!value.empty()) {
    *dst = value;
  }
}

} // namespace

Settings Settings::Resolve(const mediaforge::runtime::config::RuntimeConfig& config) {
  Settings s;

  SetIfPresent(&s.bind_address, config.server().bind_address());
  if (config.server().max_message_bytes() > 0) {
    s.max_message_bytes = config.server().max_message_bytes();
  }

  if (!config.storage().root_dir().empty()) {
    s.storage_root = config.storage().root_dir();
  }

  SetIfPresent(&s.ytdlp_path, config.tools().ytdlp_path());
  SetIfPresent(&s.ffmpeg_path, config.tools().ffmpeg_path());
  SetIfPresent(&s.ffprobe_path, config.tools().ffprobe_path());

  const auto& process = config.process();
  if (process.max_concurrent() > 0) {
    s.max_concurrent_processes = process.max_concurrent();
  }
  if (process.stderr_tail_bytes() > 0) {
    s.stderr_tail_bytes = process.stderr_tail_bytes();
  }
  s.process_timeout = util::FromProto(process.timeout(), s.process_timeout);
  s.probe_timeout   = util::FromProto(process.probe_timeout(), s.probe_timeout);
  s.kill_grace      = util::FromProto(process.kill_grace(), s.kill_grace);

  s.retention      = util::FromProto(config.cleanup().retention(), s.retention);
  s.sweep_interval = util::FromProto(config.cleanup().sweep_interval(), s.sweep_interval);

  if (config.probe().max_formats() > 0) {
    s.max_formats = config.probe().max_formats();
  }

  return s;
}

} // namespace mediaforge::config
