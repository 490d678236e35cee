#include "edit_plan.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace mediaforge::audio {

std::string_view StageName(StageKind kind) {
  switch (kind) {
    case StageKind::kExtractAudio:
      return "extract-audio";
    case StageKind::kTrim:
      return "trim";
    case StageKind::kSplit:
      return "split";
    case StageKind::kCrossfade:
      return "crossfade";
    case StageKind::kConcat:
      return "concat";
    case StageKind::kFadeIn:
      return "fade-in";
    case StageKind::kFadeOut:
      return "fade-out";
    case StageKind::kConvert:
      return "convert";
    case StageKind::kEncode:
      return "encode";
  }
  return "unknown";
}

bool EditPlan::Has(StageKind kind) const {
  return std::any_of(stages_.begin(), stages_.end(), [&](const Stage& s) { return s.kind == kind; });
}

EditPlanBuilder::EditPlanBuilder(Timeline timeline) {
  plan_.timeline_ = timeline;
}

EditPlanBuilder& EditPlanBuilder::AddStage(Stage stage) {
  if (!plan_.stages_.empty() && plan_.stages_.back().kind >= stage.kind) {
    throw util::InvalidState("edit stage " + std::string(StageName(stage.kind)) + " out of order");
  }
  plan_.stages_.push_back(std::move(stage));
  return *this;
}

EditPlanBuilder& EditPlanBuilder::AddInvocation(FfmpegInvocation invocation) {
  plan_.invocations_.push_back(std::move(invocation));
  return *this;
}

EditPlanBuilder& EditPlanBuilder::Intermediate(std::filesystem::path path) {
  plan_.intermediates_.push_back(std::move(path));
  return *this;
}

EditPlanBuilder& EditPlanBuilder::Extraction(std::filesystem::path path) {
  plan_.extracts_audio_  = true;
  plan_.extraction_path_ = std::move(path);
  return *this;
}

EditPlanBuilder& EditPlanBuilder::Output(std::filesystem::path path) {
  plan_.output_ = std::move(path);
  return *this;
}

EditPlan EditPlanBuilder::Build() && {
  if (plan_.invocations_.empty() || plan_.output_.empty()) {
    throw util::InvalidState("edit plan has nothing to run");
  }
  return std::move(plan_);
}

} // namespace mediaforge::audio
