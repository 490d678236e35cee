#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace mediaforge::audio {

// atrim + asetpts; end <= 0 leaves the end open.
std::string TrimFilter(double start, double end);

std::string FadeInFilter(double duration);
std::string FadeOutFilter(double start, double duration);

// "volume=<gain>" with two decimals; empty when gain == 1.
std::string VolumeFilter(double volume);

// aformat (rate + layout) plus volume when gain != 1.
std::string ConvertFilter(int channels, int sample_rate, double volume);

// Joins non-empty filters with ','.
std::string Chain(const std::vector<std::string>& filters);

/*
  Argument list for one ffmpeg run.

  Every command is non-interactive, overwrites its output and reports
  progress on stdout (-progress pipe:1).
*/
class FfmpegCommand {
 public:
  FfmpegCommand& Input(const std::filesystem::path& path);
  FfmpegCommand& FilterComplex(const std::string& graph, const std::string& out_label);
  FfmpegCommand& Args(const std::vector<std::string>& args);

  std::vector<std::string> Build(const std::filesystem::path& output) const;

 private:
  std::vector<std::string> inputs_;
  std::vector<std::string> filter_;
  std::vector<std::string> args_;
};

} // namespace mediaforge::audio
