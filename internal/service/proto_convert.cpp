#include "proto_convert.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/timecode.hpp"

namespace mediaforge::service {

namespace v1 = mediaforge::v1;

namespace {

double Timecode(const std::string& text, const char* field) {
  auto seconds = util::ParseTimecode(text);
  if (!seconds) {
    throw util::InvalidEditSpec(std::string("invalid ") + field + " timecode: '" + text + "'");
  }
  return *seconds;
}

v1::TaskStatus ToProto(model::TaskStatus status) {
  switch (status) {
    case model::TaskStatus::kQueued:
      return v1::TASK_STATUS_QUEUED;
    case model::TaskStatus::kRunning:
      return v1::TASK_STATUS_RUNNING;
    case model::TaskStatus::kReady:
      return v1::TASK_STATUS_READY;
    case model::TaskStatus::kError:
      return v1::TASK_STATUS_ERROR;
  }
  return v1::TASK_STATUS_UNSPECIFIED;
}

double Volume(uint32_t percent) {
  return percent == 0 ? 1.0 : static_cast<double>(percent) / 100.0;
}

} // namespace

v1::AnalyzeResponse ToProto(const model::ProbeResult& probe) {
  v1::AnalyzeResponse resp;
  resp.set_title(probe.title);
  resp.set_duration_seconds(probe.duration_seconds);
  resp.set_thumbnail(probe.thumbnail);
  resp.set_source(probe.source);

  for (const auto& f : probe.formats) {
    auto* out = resp.add_formats();
    out->set_format_id(f.format_id);
    out->set_quality(f.quality);
    out->set_has_video(f.has_video);
    out->set_has_audio(f.has_audio);
    out->set_resolution(f.resolution);
    out->set_fps(f.fps);
    out->set_ext(f.ext);
    out->set_vcodec(f.vcodec);
    out->set_acodec(f.acodec);
    out->set_approx_size_bytes(f.approx_size_bytes);
    out->set_size_label(f.size_label);
  }
  return resp;
}

v1::StatusResponse ToProto(const model::TaskRecord& record) {
  v1::StatusResponse resp;
  resp.set_task_id(record.id);
  resp.set_kind(record.kind == model::TaskKind::kFetch ? v1::TASK_KIND_FETCH : v1::TASK_KIND_AUDIO_EDIT);
  resp.set_status(ToProto(record.status));
  resp.set_progress(static_cast<uint32_t>(record.progress));
  resp.set_message(record.message);
  resp.set_ready(record.status == model::TaskStatus::kReady);

  if (record.result) {
    resp.set_download_reference(record.result->download_reference);
    resp.set_extension(record.result->extension);
    resp.set_size_bytes(record.result->size_bytes);
  }
  if (record.error) {
    resp.set_error_kind(std::string(util::ErrorKindName(record.error->kind)));
    resp.set_error(record.error->detail);
  }
  return resp;
}

model::DownloadRequest FromProto(const v1::DownloadRequest& req) {
  model::DownloadRequest out;
  out.url       = req.url();
  out.format_id = req.format_id();
  out.kind      = req.kind() == v1::FETCH_KIND_AUDIO ? model::FetchKind::kAudio : model::FetchKind::kVideo;

  const auto& opts = req.audio_options();
  if (!opts.codec().empty()) out.audio.codec = opts.codec();
  if (!opts.bitrate().empty()) out.audio.bitrate = opts.bitrate();
  if (opts.has_qscale()) out.audio.qscale = static_cast<int>(opts.qscale());
  if (opts.channels() != 0) out.audio.channels = static_cast<int>(opts.channels());
  if (opts.sample_rate() != 0) out.audio.sample_rate = static_cast<int>(opts.sample_rate());
  out.audio.volume = Volume(opts.volume_percent());
  return out;
}

model::AudioEditSpec FromProto(const v1::AudioEditSpec& spec) {
  model::AudioEditSpec out;
  if (!spec.codec().empty()) out.codec = spec.codec();
  if (!spec.bitrate().empty()) out.bitrate = spec.bitrate();

  if (spec.has_trim() && (!spec.trim().start().empty() || !spec.trim().end().empty())) {
    model::TimeWindow w;
    w.start_seconds = spec.trim().start().empty() ? 0.0 : Timecode(spec.trim().start(), "trim start");
    w.end_seconds   = Timecode(spec.trim().end(), "trim end");
    out.trim        = w;
  }

  out.fade_in  = {spec.fade_in().enabled(), spec.fade_in().duration_seconds()};
  out.fade_out = {spec.fade_out().enabled(), spec.fade_out().duration_seconds()};

  if (spec.has_cut_middle() && (!spec.cut_middle().start().empty() || !spec.cut_middle().end().empty())) {
    model::CutMiddleSpec cut;
    cut.window.start_seconds = Timecode(spec.cut_middle().start(), "cut start");
    cut.window.end_seconds   = Timecode(spec.cut_middle().end(), "cut end");
    cut.crossfade_seconds    = spec.cut_middle().crossfade_seconds();
    out.cut_middle           = cut;
  }

  if (spec.channels() != 0) out.channels = static_cast<int>(spec.channels());
  if (spec.sample_rate() != 0) out.sample_rate = static_cast<int>(spec.sample_rate());
  out.volume = Volume(spec.volume_percent());
  return out;
}

} // namespace mediaforge::service
