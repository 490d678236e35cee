#pragma once

#include <optional>
#include <string_view>

namespace mediaforge::process {

enum class ProgressConvention {
  kNone,
  kYtDlp,   // "[download]  42.0% of ..." with --newline
  kFfmpeg,  // "-progress pipe:1": out_time_us=..., progress=end
};

/*
  Line-oriented progress extraction for one invocation.

  Feed() returns a percentage (0-100) when the line carries one.
  Monotonicity is the runner's job, not the parser's.
*/
class ProgressParser {
 public:
  ProgressParser(ProgressConvention convention, double expected_seconds);

  std::optional<int> Feed(std::string_view line);

 private:
  ProgressConvention convention_;
  double             expected_seconds_;
};

std::optional<double> ParseYtDlpPercent(std::string_view line);

} // namespace mediaforge::process
