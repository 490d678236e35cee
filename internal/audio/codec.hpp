#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/audio_options.hpp"

namespace mediaforge::audio {

struct CodecInfo {
  std::string_view name;       // request value, e.g. "m4a"
  std::string_view encoder;    // ffmpeg encoder
  std::string_view extension;  // output file extension
  bool             lossless = false;
  int              forced_sample_rate = 0;  // encoder accepts only this rate when set
};

// Edit codecs: mp3, m4a, opus, wma, flac, wav.
const CodecInfo* FindEditCodec(std::string_view name);

// Fetch codecs: mp3, m4a, opus. "copy" is handled by the caller.
const CodecInfo* FindFetchCodec(std::string_view name);

// "<n>k" with n in [8, 512].
bool IsValidBitrate(std::string_view bitrate);

bool IsSupportedSampleRate(int hz);

// Encoder arguments for one output: -c:a plus bitrate or VBR quality.
std::vector<std::string> EncoderArgs(const CodecInfo& codec, const std::string& bitrate, std::optional<int> qscale = std::nullopt);

// Extension for a stream-copied audio track, keyed by source codec name.
std::string CopyExtension(std::string_view acodec);

// Throws util::InvalidEditSpec.
void ValidateAudioOptions(const model::AudioOptions& options);

} // namespace mediaforge::audio
