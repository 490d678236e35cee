#include "probe_parser.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <unordered_set>
#include <vector>

#include "internal/util/errors.hpp"

namespace mediaforge::probe {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

const Value* Field(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end() || it->second.kind_case() == Value::kNullValue) return nullptr;
  return &it->second;
}

std::string String(const Struct& s, const std::string& key, std::string fallback = {}) {
  const auto* v = Field(s, key);
  if (!v || v->kind_case() != Value::kStringValue) return fallback;
  return v->string_value();
}

double Number(const Struct& s, const std::string& key) {
  const auto* v = Field(s, key);
  if (!v || v->kind_case() != Value::kNumberValue || !std::isfinite(v->number_value())) return 0.0;
  return v->number_value();
}

// Negative or oversized values saturate instead of overflowing the cast.
uint32_t Dimension(const Struct& s, const std::string& key) {
  const double v = std::round(Number(s, key));
  if (v <= 0.0) return 0;
  if (v >= static_cast<double>(std::numeric_limits<uint32_t>::max())) return std::numeric_limits<uint32_t>::max();
  return static_cast<uint32_t>(v);
}

uint64_t ByteCount(double v) {
  if (v <= 0.0) return 0;
  // 2^64 is exactly representable; anything at or above it saturates.
  if (v >= 18446744073709551616.0) return std::numeric_limits<uint64_t>::max();
  return static_cast<uint64_t>(v);
}

struct Candidate {
  model::FormatDescriptor desc;
  double                  rank = 0.0;  // height or audio bitrate
};

} // namespace

std::string FormatSize(uint64_t bytes) {
  if (bytes == 0) return "Unknown";

  static constexpr const char* kUnits[] = {"B", "KB", "MB", "GB"};
  double value = static_cast<double>(bytes);
  for (const char* unit : kUnits) {
    if (value < 1024.0) {
      char buf[32];
      std::snprintf(buf, sizeof(buf), "%.1f %s", value, unit);
      return buf;
    }
    value /= 1024.0;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f TB", value);
  return buf;
}

model::ProbeResult ParseProbeJson(std::string_view json, std::size_t max_per_category) {
  Struct doc;
  auto   status = google::protobuf::util::JsonStringToMessage(std::string(json), &doc);
  if (!status.ok()) {
    throw util::InvalidSource("unreadable probe output: " + std::string(status.message()));
  }

  model::ProbeResult result;
  result.title            = String(doc, "title", "Unknown");
  result.duration_seconds = Number(doc, "duration");
  result.thumbnail        = String(doc, "thumbnail");
  result.source           = String(doc, "extractor_key", String(doc, "extractor", "Unknown"));

  std::vector<Candidate> video;
  std::vector<Candidate> audio;

  const auto* formats = Field(doc, "formats");
  if (formats && formats->kind_case() == Value::kListValue) {
    for (const auto& item : formats->list_value().values()) {
      if (item.kind_case() != Value::kStructValue) continue;
      const auto& f = item.struct_value();

      model::FormatDescriptor d;
      d.format_id = String(f, "format_id");
      if (d.format_id.empty()) continue;

      d.ext    = String(f, "ext", "mp4");
      d.vcodec = String(f, "vcodec", "none");
      d.acodec = String(f, "acodec", "none");

      const double size = Number(f, "filesize") > 0 ? Number(f, "filesize") : Number(f, "filesize_approx");
      d.approx_size_bytes = ByteCount(size);
      d.size_label        = FormatSize(d.approx_size_bytes);

      const auto height = Dimension(f, "height");
      if (height > 0 && d.vcodec != "none") {
        d.has_video  = true;
        d.has_audio  = d.acodec != "none";
        d.fps        = Dimension(f, "fps");
        d.resolution = std::to_string(Dimension(f, "width")) + "x" + std::to_string(height);
        d.quality    = std::to_string(height) + "p";
        if (d.fps > 30) d.quality += " " + std::to_string(d.fps) + "fps";
        video.push_back({std::move(d), static_cast<double>(height)});
        continue;
      }

      if (d.acodec != "none" && d.vcodec == "none") {
        d.has_audio      = true;
        const double abr = Number(f, "abr") > 0 ? Number(f, "abr") : Number(f, "tbr");
        if (abr > 0) {
          d.quality = std::to_string(std::lround(abr)) + "kbps";
        } else {
          d.quality = String(f, "format_note", "audio");
        }
        audio.push_back({std::move(d), abr});
      }
    }
  }

  // Stable so the first format listed for a label wins.
  std::stable_sort(video.begin(), video.end(), [](const Candidate& a, const Candidate& b) { return a.rank > b.rank; });
  std::stable_sort(audio.begin(), audio.end(), [](const Candidate& a, const Candidate& b) { return a.rank > b.rank; });

  std::unordered_set<std::string> seen;
  std::size_t                     kept = 0;
  for (auto& c : video) {
    if (kept >= max_per_category) break;
    if (!seen.insert(c.desc.quality).second) continue;
    result.formats.push_back(std::move(c.desc));
    ++kept;
  }

  kept = 0;
  for (auto& c : audio) {
    if (kept >= max_per_category) break;
    result.formats.push_back(std::move(c.desc));
    ++kept;
  }

  if (result.formats.empty()) {
    throw util::InvalidSource("source exposes no downloadable formats");
  }
  return result;
}

} // namespace mediaforge::probe
