#pragma once

#include <filesystem>
#include <string>

#include "internal/audio/edit_plan.hpp"
#include "internal/model/audio_edit_spec.hpp"
#include "internal/model/media_asset.hpp"

namespace mediaforge::audio {

/*
  Checks an edit request against the asset and computes its timeline.
  Throws util::InvalidEditSpec; never touches the filesystem.
*/
Timeline ValidateEditSpec(const model::AudioEditSpec& spec, double source_length);

/*
  Compiles an edit request into an EditPlan.

  Fixed stage order: extract audio (containers without a prior
  extraction), trim, split + crossfade/concat, fade-in, fade-out,
  convert (channels, rate, gain), encode. Fades apply to the final
  spliced timeline.

  Without a crossfade the edit is a single filter_complex run. With one,
  both segments are rendered to WAV and a third run joins them with
  acrossfade before the remaining stages.
*/
class AudioEditCompiler {
 public:
  explicit AudioEditCompiler(std::string ffmpeg_path);

  // work_dir receives intermediates and the output; extraction_path is
  // where a container's audio-only copy goes.
  EditPlan Compile(const model::AudioEditSpec& spec, const model::MediaAsset& asset, const std::filesystem::path& work_dir,
                   const std::filesystem::path& extraction_path) const;

  const std::string& ffmpeg_path() const {
    return ffmpeg_path_;
  }

 private:
  std::string ffmpeg_path_;
};

} // namespace mediaforge::audio
