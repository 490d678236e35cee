#include "ffmpeg_args.hpp"

#include <cstdio>

#include "internal/util/timecode.hpp"

namespace mediaforge::audio {

using util::FormatSeconds;

std::string TrimFilter(double start, double end) {
  std::string f = "atrim=start=" + FormatSeconds(start);
  if (end > 0.0) f += ":end=" + FormatSeconds(end);
  return f + ",asetpts=PTS-STARTPTS";
}

std::string FadeInFilter(double duration) {
  return "afade=t=in:st=0:d=" + FormatSeconds(duration);
}

std::string FadeOutFilter(double start, double duration) {
  return "afade=t=out:st=" + FormatSeconds(start) + ":d=" + FormatSeconds(duration);
}

std::string VolumeFilter(double volume) {
  if (volume == 1.0) return {};
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", volume);
  return "volume=" + std::string(buf);
}

std::string ConvertFilter(int channels, int sample_rate, double volume) {
  const std::string format =
      "aformat=sample_rates=" + std::to_string(sample_rate) + ":channel_layouts=" + (channels == 1 ? "mono" : "stereo");
  return Chain({format, VolumeFilter(volume)});
}

std::string Chain(const std::vector<std::string>& filters) {
  std::string out;
  for (const auto& f : filters) {
    if (f.empty()) continue;
    if (!out.empty()) out += ',';
    out += f;
  }
  return out;
}

FfmpegCommand& FfmpegCommand::Input(const std::filesystem::path& path) {
  inputs_.insert(inputs_.end(), {"-i", path.string()});
  return *this;
}

FfmpegCommand& FfmpegCommand::FilterComplex(const std::string& graph, const std::string& out_label) {
  filter_ = {"-filter_complex", graph, "-map", "[" + out_label + "]"};
  return *this;
}

FfmpegCommand& FfmpegCommand::Args(const std::vector<std::string>& args) {
  args_.insert(args_.end(), args.begin(), args.end());
  return *this;
}

std::vector<std::string> FfmpegCommand::Build(const std::filesystem::path& output) const {
  std::vector<std::string> out{"-hide_banner", "-nostdin", "-y"};
  out.insert(out.end(), inputs_.begin(), inputs_.end());
  out.insert(out.end(), filter_.begin(), filter_.end());
  out.insert(out.end(), args_.begin(), args_.end());
  out.insert(out.end(), {"-progress", "pipe:1", "-nostats", output.string()});
  return out;
}

} // namespace mediaforge::audio
