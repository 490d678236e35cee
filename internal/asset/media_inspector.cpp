#include "media_inspector.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cmath>
#include <cstdlib>

#include "internal/process/tool_errors.hpp"
#include "internal/util/errors.hpp"

namespace mediaforge::asset {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

const Value* Field(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  return it == s.fields().end() ? nullptr : &it->second;
}

// ffprobe prints durations as strings ("12.345000").
double Seconds(const Value* v) {
  if (!v) return 0.0;
  double out = 0.0;
  if (v->kind_case() == Value::kNumberValue) out = v->number_value();
  if (v->kind_case() == Value::kStringValue) out = std::strtod(v->string_value().c_str(), nullptr);
  return std::isfinite(out) && out > 0.0 ? out : 0.0;
}

} // namespace

MediaInfo ParseMediaInfo(const std::string& json) {
  Struct doc;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &doc);
  if (!status.ok()) {
    throw util::InvalidSource("unreadable ffprobe output: " + std::string(status.message()));
  }

  MediaInfo info;
  if (const auto* format = Field(doc, "format"); format && format->kind_case() == Value::kStructValue) {
    info.duration_seconds = Seconds(Field(format->struct_value(), "duration"));
  }

  const auto* streams = Field(doc, "streams");
  if (!streams || streams->kind_case() != Value::kListValue) return info;

  for (const auto& item : streams->list_value().values()) {
    if (item.kind_case() != Value::kStructValue) continue;
    const auto& stream = item.struct_value();

    const auto* type = Field(stream, "codec_type");
    if (!type || type->kind_case() != Value::kStringValue) continue;

    if (type->string_value() == "audio") {
      info.has_audio = true;
      if (info.duration_seconds == 0.0) info.duration_seconds = Seconds(Field(stream, "duration"));
      continue;
    }
    if (type->string_value() != "video") continue;

    bool attached_pic = false;
    if (const auto* disp = Field(stream, "disposition"); disp && disp->kind_case() == Value::kStructValue) {
      const auto* pic = Field(disp->struct_value(), "attached_pic");
      attached_pic    = pic && pic->kind_case() == Value::kNumberValue && pic->number_value() != 0.0;
    }
    if (!attached_pic) info.has_video = true;
  }
  return info;
}

MediaInspector::MediaInspector(std::shared_ptr<process::ProcessRunner> runner, std::string ffprobe_path, std::chrono::milliseconds timeout)
    : runner_(std::move(runner)), ffprobe_path_(std::move(ffprobe_path)), timeout_(timeout) {
}

MediaInfo MediaInspector::Inspect(const std::filesystem::path& file) const {
  process::Invocation inv;
  inv.program               = ffprobe_path_;
  inv.args                  = {"-v", "error", "-of", "json", "-show_format", "-show_streams", file.string()};
  inv.timeout               = timeout_;
  inv.capture_stdout        = true;
  inv.label                 = "inspect";
  inv.timeout_includes_wait = true;

  auto result = runner_->Run(inv);
  if (result.timed_out) {
    throw util::Timeout("ffprobe timed out on " + file.filename().string());
  }
  if (result.exit_code != 0) {
    throw util::InvalidSource("not a readable media file: " + process::ToolErrorDetail(result.stderr_tail));
  }
  return ParseMediaInfo(result.stdout_data);
}

} // namespace mediaforge::asset
