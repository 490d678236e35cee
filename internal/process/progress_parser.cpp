#include "progress_parser.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <regex>
#include <string>

namespace mediaforge::process {

namespace {

std::optional<long long> ParseValue(std::string_view line, std::string_view key) {
  if (line.substr(0, key.size()) != key) return std::nullopt;
  line.remove_prefix(key.size());

  long long value = 0;
  auto [ptr, ec]  = std::from_chars(line.data(), line.data() + line.size(), value);
  if (ec != std::errc{} || ptr == line.data()) return std::nullopt;
  return value;
}

int ToPercent(double value) {
  if (!std::isfinite(value)) return 0;
  return static_cast<int>(std::clamp(value, 0.0, 100.0));
}

} // namespace

std::optional<double> ParseYtDlpPercent(std::string_view line) {
  static const std::regex re(R"(\[download\]\s+(\d+(?:\.\d+)?)%)");

  std::match_results<std::string_view::const_iterator> m;
  if (!std::regex_search(line.begin(), line.end(), m, re)) return std::nullopt;
  return std::stod(m[1].str());
}

ProgressParser::ProgressParser(ProgressConvention convention, double expected_seconds)
    : convention_(convention), expected_seconds_(expected_seconds) {
}

std::optional<int> ProgressParser::Feed(std::string_view line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.remove_suffix(1);

  switch (convention_) {
    case ProgressConvention::kNone:
      return std::nullopt;

    case ProgressConvention::kYtDlp: {
      auto pct = ParseYtDlpPercent(line);
      if (!pct) return std::nullopt;
      return ToPercent(*pct);
    }

    case ProgressConvention::kFfmpeg: {
      if (line == "progress=end") return 100;
      if (expected_seconds_ <= 0.0) return std::nullopt;

      // Older ffmpeg builds report microseconds under out_time_ms too.
      auto us = ParseValue(line, "out_time_us=");
      if (!us) us = ParseValue(line, "out_time_ms=");
      if (!us) return std::nullopt;

      const double seconds = static_cast<double>(*us) / 1'000'000.0;
      // 100 is reserved for progress=end.
      return std::min(99, ToPercent(seconds / expected_seconds_ * 100.0));
    }
  }
  return std::nullopt;
}

} // namespace mediaforge::process
