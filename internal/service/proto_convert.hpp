#pragma once

#include "internal/model/audio_edit_spec.hpp"
#include "internal/model/audio_options.hpp"
#include "internal/model/format.hpp"
#include "internal/model/task.hpp"
#include "mediaforge/v1/media_service.pb.h"

namespace mediaforge::service {

/*
  Wire <-> model conversion. Zero/empty wire values select defaults;
  malformed timecodes throw util::InvalidEditSpec.
*/

mediaforge::v1::AnalyzeResponse ToProto(const model::ProbeResult& probe);

mediaforge::v1::StatusResponse ToProto(const model::TaskRecord& record);

model::DownloadRequest FromProto(const mediaforge::v1::DownloadRequest& req);

model::AudioEditSpec FromProto(const mediaforge::v1::AudioEditSpec& spec);

} // namespace mediaforge::service
