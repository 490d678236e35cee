#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

#include "internal/probe/format_prober.hpp"
#include "internal/process/process_runner.hpp"

namespace mediaforge::probe {

struct YtDlpProberOptions {
  std::string               ytdlp_path = "yt-dlp";
  std::chrono::milliseconds timeout{std::chrono::seconds(60)};
  std::size_t               max_formats = 10;
};

/*
  FormatProber backed by `yt-dlp -J --no-playlist`.
*/
class YtDlpProber final : public FormatProber {
 public:
  YtDlpProber(std::shared_ptr<process::ProcessRunner> runner, YtDlpProberOptions options);

  model::ProbeResult Probe(const std::string& url) override;

 private:
  std::shared_ptr<process::ProcessRunner> runner_;
  YtDlpProberOptions                      options_;
};

} // namespace mediaforge::probe
