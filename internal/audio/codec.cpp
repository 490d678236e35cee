#include "codec.hpp"

#include <array>
#include <charconv>

#include "internal/util/errors.hpp"

namespace mediaforge::audio {

namespace {

constexpr std::array<CodecInfo, 6> kEditCodecs{{
    {"mp3", "libmp3lame", "mp3", false, 0},
    {"m4a", "aac", "m4a", false, 0},
    {"opus", "libopus", "opus", false, 48000},
    {"wma", "wmav2", "wma", false, 0},
    {"flac", "flac", "flac", true, 0},
    {"wav", "pcm_s16le", "wav", true, 0},
}};

constexpr std::array<int, 9> kSampleRates{8000, 11025, 16000, 22050, 24000, 32000, 44100, 48000, 96000};

bool StartsWith(std::string_view s, std::string_view prefix) {
  return s.substr(0, prefix.size()) == prefix;
}

} // namespace

const CodecInfo* FindEditCodec(std::string_view name) {
  for (const auto& codec : kEditCodecs) {
    if (codec.name == name) return &codec;
  }
  return nullptr;
}

const CodecInfo* FindFetchCodec(std::string_view name) {
  if (name != "mp3" && name != "m4a" && name != "opus") return nullptr;
  return FindEditCodec(name);
}

bool IsValidBitrate(std::string_view bitrate) {
  if (bitrate.size() < 2 || bitrate.back() != 'k') return false;
  bitrate.remove_suffix(1);

  int kbps       = 0;
  auto [ptr, ec] = std::from_chars(bitrate.data(), bitrate.data() + bitrate.size(), kbps);
  return ec == std::errc{} && ptr == bitrate.data() + bitrate.size() && kbps >= 8 && kbps <= 512;
}

bool IsSupportedSampleRate(int hz) {
  for (int rate : kSampleRates) {
    if (rate == hz) return true;
  }
  return false;
}

std::vector<std::string> EncoderArgs(const CodecInfo& codec, const std::string& bitrate, std::optional<int> qscale) {
  std::vector<std::string> args{"-c:a", std::string(codec.encoder)};
  if (codec.lossless) return args;

  if (qscale) {
    args.insert(args.end(), {"-q:a", std::to_string(*qscale)});
  } else {
    args.insert(args.end(), {"-b:a", bitrate});
  }
  if (codec.name == "m4a") {
    args.insert(args.end(), {"-movflags", "+faststart"});
  }
  return args;
}

std::string CopyExtension(std::string_view acodec) {
  if (StartsWith(acodec, "mp4a") || StartsWith(acodec, "aac")) return "m4a";
  if (StartsWith(acodec, "opus")) return "opus";
  if (StartsWith(acodec, "mp3")) return "mp3";
  if (StartsWith(acodec, "vorbis")) return "ogg";
  if (StartsWith(acodec, "flac")) return "flac";
  return "mka";
}

void ValidateAudioOptions(const model::AudioOptions& options) {
  if (options.codec == "copy") return;

  if (!FindFetchCodec(options.codec)) {
    throw util::InvalidEditSpec("unsupported audio codec: " + options.codec);
  }
  if (options.qscale) {
    if (options.codec != "mp3") {
      throw util::InvalidEditSpec("qscale applies to mp3 only");
    }
    if (*options.qscale < 0 || *options.qscale > 9) {
      throw util::InvalidEditSpec("qscale must be within 0-9");
    }
  } else if (!IsValidBitrate(options.bitrate)) {
    throw util::InvalidEditSpec("invalid bitrate: " + options.bitrate);
  }
  if (options.channels != 1 && options.channels != 2) {
    throw util::InvalidEditSpec("channels must be 1 or 2");
  }
  if (!IsSupportedSampleRate(options.sample_rate)) {
    throw util::InvalidEditSpec("unsupported sample rate: " + std::to_string(options.sample_rate));
  }
  if (!(options.volume >= 0.0 && options.volume <= 2.0)) {
    throw util::InvalidEditSpec("volume must be within 0.0-2.0");
  }
}

} // namespace mediaforge::audio
