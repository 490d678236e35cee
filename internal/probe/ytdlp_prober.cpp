#include "ytdlp_prober.hpp"

#include "internal/observability/logging.hpp"
#include "internal/probe/probe_parser.hpp"
#include "internal/process/tool_errors.hpp"
#include "internal/util/errors.hpp"

namespace mediaforge::probe {

using observability::IntField;
using observability::StringField;

YtDlpProber::YtDlpProber(std::shared_ptr<process::ProcessRunner> runner, YtDlpProberOptions options)
    : runner_(std::move(runner)), options_(std::move(options)) {
}

model::ProbeResult YtDlpProber::Probe(const std::string& url) {
  ValidateSourceUrl(url);

  process::Invocation inv;
  inv.program               = options_.ytdlp_path;
  inv.args                  = {"-J", "--no-playlist", "--no-warnings", "--", url};
  inv.timeout               = options_.timeout;
  inv.capture_stdout        = true;
  inv.label                 = "probe";
  inv.timeout_includes_wait = true;

  auto result = runner_->Run(inv);
  if (!result.ok()) {
    // A probe that cannot finish in time is indistinguishable from an unreachable host.
    if (result.timed_out) {
      throw util::UnreachableSource("probe timed out for " + url);
    }
    process::ThrowToolError(inv, result);
  }

  auto probe = ParseProbeJson(result.stdout_data, options_.max_formats);
  MEDIAFORGE_LOG_INFO("probe complete", {StringField("source", probe.source), IntField("formats", static_cast<std::int64_t>(probe.formats.size()))});
  return probe;
}

} // namespace mediaforge::probe
