#include "audio_edit_compiler.hpp"

#include <algorithm>
#include <cmath>

#include "internal/audio/codec.hpp"
#include "internal/audio/ffmpeg_args.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/timecode.hpp"

namespace mediaforge::audio {

namespace fs = std::filesystem;

using util::FormatSeconds;
using util::InvalidEditSpec;

namespace {

bool Finite(double v) {
  return std::isfinite(v);
}

void ValidateFade(const model::FadeSpec& fade, const char* name, double timeline) {
  if (!fade.enabled) return;
  if (!Finite(fade.duration_seconds) || fade.duration_seconds <= 0.0) {
    throw InvalidEditSpec(std::string(name) + " duration must be positive");
  }
  if (fade.duration_seconds > timeline) {
    throw InvalidEditSpec(std::string(name) + " of " + FormatSeconds(fade.duration_seconds) + "s exceeds the " + FormatSeconds(timeline) +
                          "s output");
  }
}

} // namespace

Timeline ValidateEditSpec(const model::AudioEditSpec& spec, double source_length) {
  const auto* codec = FindEditCodec(spec.codec);
  if (!codec) {
    throw InvalidEditSpec("unsupported codec: " + spec.codec);
  }
  if (!codec->lossless && !IsValidBitrate(spec.bitrate)) {
    throw InvalidEditSpec("invalid bitrate: " + spec.bitrate);
  }
  if (spec.channels != 1 && spec.channels != 2) {
    throw InvalidEditSpec("channels must be 1 or 2");
  }
  if (!IsSupportedSampleRate(spec.sample_rate)) {
    throw InvalidEditSpec("unsupported sample rate: " + std::to_string(spec.sample_rate));
  }
  if (!(spec.volume >= 0.0 && spec.volume <= 2.0)) {
    throw InvalidEditSpec("volume must be within 0.0-2.0");
  }

  const bool known = Finite(source_length) && source_length > 0.0;

  Timeline t;
  t.source_length = known ? source_length : 0.0;

  if (spec.trim) {
    const auto& w = *spec.trim;
    if (!Finite(w.start_seconds) || !Finite(w.end_seconds) || w.start_seconds < 0.0 || w.end_seconds <= w.start_seconds) {
      throw InvalidEditSpec("trim window must satisfy 0 <= start < end");
    }
    if (known && w.end_seconds > source_length + 1e-3) {
      throw InvalidEditSpec("trim end " + FormatSeconds(w.end_seconds) + "s is past the " + FormatSeconds(source_length) + "s asset");
    }
    t.trim_start = w.start_seconds;
    t.trim_end   = known ? std::min(w.end_seconds, source_length) : w.end_seconds;
  } else {
    if (!known) {
      throw InvalidEditSpec("asset duration is unknown; a trim window is required");
    }
    t.trim_start = 0.0;
    t.trim_end   = source_length;
  }
  t.trimmed_length = t.trim_end - t.trim_start;
  t.final_length   = t.trimmed_length;

  if (spec.cut_middle) {
    const auto& cut = *spec.cut_middle;
    const auto& w   = cut.window;
    if (!Finite(w.start_seconds) || !Finite(w.end_seconds) || w.end_seconds <= w.start_seconds) {
      throw InvalidEditSpec("cut window must satisfy start < end");
    }
    if (w.start_seconds <= t.trim_start || w.end_seconds >= t.trim_end) {
      throw InvalidEditSpec("cut window must lie strictly inside [" + FormatSeconds(t.trim_start) + ", " + FormatSeconds(t.trim_end) + "]");
    }

    t.cut_start = w.start_seconds - t.trim_start;
    t.cut_end   = w.end_seconds - t.trim_start;
    t.segment_a = t.cut_start;
    t.segment_b = t.trimmed_length - t.cut_end;

    if (!Finite(cut.crossfade_seconds) || cut.crossfade_seconds < 0.0) {
      throw InvalidEditSpec("crossfade must not be negative");
    }
    if (cut.crossfade_seconds > 0.0 && (cut.crossfade_seconds >= t.segment_a || cut.crossfade_seconds >= t.segment_b)) {
      throw InvalidEditSpec("crossfade of " + FormatSeconds(cut.crossfade_seconds) + "s must be shorter than both segments (" +
                            FormatSeconds(t.segment_a) + "s, " + FormatSeconds(t.segment_b) + "s)");
    }
    t.crossfade    = cut.crossfade_seconds;
    t.final_length = t.segment_a + t.segment_b - t.crossfade;
  }

  ValidateFade(spec.fade_in, "fade-in", t.final_length);
  ValidateFade(spec.fade_out, "fade-out", t.final_length);
  return t;
}

AudioEditCompiler::AudioEditCompiler(std::string ffmpeg_path) : ffmpeg_path_(std::move(ffmpeg_path)) {
}

EditPlan AudioEditCompiler::Compile(const model::AudioEditSpec& spec, const model::MediaAsset& asset, const fs::path& work_dir,
                                    const fs::path& extraction_path) const {
  const auto  timeline = ValidateEditSpec(spec, asset.duration_seconds);
  const auto* codec    = FindEditCodec(spec.codec);

  EditPlanBuilder builder(timeline);

  // 1. audio-only source
  fs::path input = asset.stored_path;
  if (asset.is_container) {
    if (asset.extracted_audio_path) {
      input = *asset.extracted_audio_path;
    } else {
      builder.AddStage({StageKind::kExtractAudio, 0.0, timeline.source_length, extraction_path.filename().string()});
      builder.Extraction(extraction_path);
      builder.AddInvocation({"extract",
                             FfmpegCommand().Input(asset.stored_path).Args({"-vn", "-map", "0:a:0", "-c:a", "flac"}).Build(extraction_path),
                             timeline.source_length, extraction_path});
      input = extraction_path;
    }
  }

  // 2. trim
  if (spec.trim) {
    builder.AddStage({StageKind::kTrim, timeline.trim_start, timeline.trimmed_length, ""});
  }

  // 3. splice
  const bool cut       = spec.cut_middle.has_value();
  const bool crossfade = cut && timeline.crossfade > 0.0;
  if (cut) {
    builder.AddStage({StageKind::kSplit, timeline.cut_start, timeline.cut_end - timeline.cut_start,
                      "A=" + FormatSeconds(timeline.segment_a) + " B=" + FormatSeconds(timeline.segment_b)});
    if (crossfade) {
      builder.AddStage({StageKind::kCrossfade, timeline.segment_a - timeline.crossfade, timeline.crossfade, "tri"});
    } else {
      builder.AddStage({StageKind::kConcat, timeline.segment_a, 0.0, ""});
    }
  }

  // 4. fades on the final timeline
  std::vector<std::string> tail;
  if (spec.fade_in.enabled) {
    builder.AddStage({StageKind::kFadeIn, 0.0, spec.fade_in.duration_seconds, ""});
    tail.push_back(FadeInFilter(spec.fade_in.duration_seconds));
  }
  if (spec.fade_out.enabled) {
    const double start = timeline.final_length - spec.fade_out.duration_seconds;
    builder.AddStage({StageKind::kFadeOut, start, spec.fade_out.duration_seconds, ""});
    tail.push_back(FadeOutFilter(start, spec.fade_out.duration_seconds));
  }

  // 5. conversion
  const int sample_rate = codec->forced_sample_rate ? codec->forced_sample_rate : spec.sample_rate;
  builder.AddStage({StageKind::kConvert, 0.0, timeline.final_length,
                    std::to_string(spec.channels) + "ch " + std::to_string(sample_rate) + "Hz"});
  tail.push_back(ConvertFilter(spec.channels, sample_rate, spec.volume));

  // 6. encode
  builder.AddStage({StageKind::kEncode, 0.0, timeline.final_length, std::string(codec->encoder)});
  const auto encoder = EncoderArgs(*codec, spec.bitrate);
  const auto output  = work_dir / ("audio." + std::string(codec->extension));
  builder.Output(output);

  const double src_end = spec.trim ? timeline.trim_end : 0.0;

  if (!crossfade) {
    std::string graph;
    if (cut) {
      const double a_end   = timeline.trim_start + timeline.segment_a;
      const double b_start = timeline.trim_start + timeline.cut_end;
      graph = "[0:a]" + Chain({spec.trim ? TrimFilter(timeline.trim_start, timeline.trim_end) : "", "asplit=2[s0][s1]"}) + ";";
      graph += "[s0]" + TrimFilter(0.0, a_end - timeline.trim_start) + "[a];";
      graph += "[s1]" + TrimFilter(b_start - timeline.trim_start, 0.0) + "[b];";
      graph += "[a][b]concat=n=2:v=0:a=1," + Chain(tail) + "[out]";
    } else {
      graph = "[0:a]" + Chain({spec.trim ? TrimFilter(timeline.trim_start, src_end) : "", Chain(tail)}) + "[out]";
    }
    builder.AddInvocation({"edit", FfmpegCommand().Input(input).FilterComplex(graph, "out").Args(encoder).Build(output), timeline.final_length, output});
    return std::move(builder).Build();
  }

  // Crossfade: render both segments losslessly, then join.
  const auto seg_a = work_dir / "segment_a.wav";
  const auto seg_b = work_dir / "segment_b.wav";
  const std::vector<std::string> pcm{"-c:a", "pcm_s16le"};

  const double a_start = timeline.trim_start;
  const double a_end   = timeline.trim_start + timeline.segment_a;
  const double b_start = timeline.trim_start + timeline.cut_end;
  const double b_end   = timeline.trim_end;

  builder.Intermediate(seg_a).Intermediate(seg_b);
  builder.AddInvocation({"segment-a", FfmpegCommand().Input(input).FilterComplex("[0:a]" + TrimFilter(a_start, a_end) + "[out]", "out").Args(pcm).Build(seg_a),
                         timeline.segment_a, seg_a});
  builder.AddInvocation({"segment-b", FfmpegCommand().Input(input).FilterComplex("[0:a]" + TrimFilter(b_start, b_end) + "[out]", "out").Args(pcm).Build(seg_b),
                         timeline.segment_b, seg_b});

  const auto graph = "[0:a][1:a]acrossfade=d=" + FormatSeconds(timeline.crossfade) + ":c1=tri:c2=tri," + Chain(tail) + "[out]";
  builder.AddInvocation({"crossfade", FfmpegCommand().Input(seg_a).Input(seg_b).FilterComplex(graph, "out").Args(encoder).Build(output),
                         timeline.final_length, output});
  return std::move(builder).Build();
}

} // namespace mediaforge::audio
