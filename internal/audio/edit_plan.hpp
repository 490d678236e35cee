#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mediaforge::audio {

// Order of declaration is the order stages must appear in a plan.
enum class StageKind {
  kExtractAudio,
  kTrim,
  kSplit,
  kCrossfade,
  kConcat,
  kFadeIn,
  kFadeOut,
  kConvert,
  kEncode,
};

std::string_view StageName(StageKind kind);

struct Stage {
  StageKind kind;
  double    start    = 0.0;  // seconds on the timeline the stage sees
  double    duration = 0.0;
  std::string detail;
};

/*
  Lengths in seconds. Trim bounds are on the source timeline; everything
  else is relative to the trimmed range.
*/
struct Timeline {
  double source_length  = 0.0;
  double trim_start     = 0.0;
  double trim_end       = 0.0;
  double trimmed_length = 0.0;
  double cut_start      = 0.0;
  double cut_end        = 0.0;
  double segment_a      = 0.0;
  double segment_b      = 0.0;
  double crossfade      = 0.0;
  double final_length   = 0.0;
};

struct FfmpegInvocation {
  std::string              label;
  std::vector<std::string> args;
  double                   expected_seconds = 0.0;
  std::filesystem::path    output;
};

/*
  Immutable result of compiling one edit request.

  Invocations run in order; when extracts_audio() is set the first one
  produces the asset's audio-only copy at extraction_path().
*/
class EditPlan {
 public:
  const std::vector<Stage>& stages() const {
    return stages_;
  }
  const Timeline& timeline() const {
    return timeline_;
  }
  const std::vector<FfmpegInvocation>& invocations() const {
    return invocations_;
  }
  const std::filesystem::path& output() const {
    return output_;
  }
  const std::vector<std::filesystem::path>& intermediates() const {
    return intermediates_;
  }
  bool extracts_audio() const {
    return extracts_audio_;
  }
  const std::filesystem::path& extraction_path() const {
    return extraction_path_;
  }

  bool Has(StageKind kind) const;

 private:
  friend class EditPlanBuilder;

  std::vector<Stage>                 stages_;
  Timeline                           timeline_;
  std::vector<FfmpegInvocation>      invocations_;
  std::filesystem::path              output_;
  std::vector<std::filesystem::path> intermediates_;
  bool                               extracts_audio_ = false;
  std::filesystem::path              extraction_path_;
};

/*
  Accumulates stages and invocations; Build() hands the plan over once.
  Stages must be appended in StageKind order.
*/
class EditPlanBuilder {
 public:
  explicit EditPlanBuilder(Timeline timeline);

  EditPlanBuilder& AddStage(Stage stage);
  EditPlanBuilder& AddInvocation(FfmpegInvocation invocation);
  EditPlanBuilder& Intermediate(std::filesystem::path path);
  EditPlanBuilder& Extraction(std::filesystem::path path);
  EditPlanBuilder& Output(std::filesystem::path path);

  EditPlan Build() &&;

 private:
  EditPlan plan_;
};

} // namespace mediaforge::audio
