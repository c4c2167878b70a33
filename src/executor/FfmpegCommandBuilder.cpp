// Repository: Encodefarm
// Component: FFmpeg Command Builder
// Copyright (c) 2025 RetroVue

#include "encodefarm/executor/FfmpegCommandBuilder.hpp"

#include <cctype>
#include <cstdlib>
#include <map>

#include "encodefarm/util/Subprocess.hpp"

namespace encodefarm::executor {

namespace {

struct CodecInfo {
  const char* encoder;
  const char* pix_fmt;
};

const std::map<std::string, std::string>& ResolutionMap() {
  static const std::map<std::string, std::string> kMap = {
      {"4K", "3840:2160"},  {"2160p", "3840:2160"}, {"1080p", "1920:1080"},
      {"720p", "1280:720"}, {"480p", "854:480"},    {"SD", "640:480"},
  };
  return kMap;
}

const std::map<std::string, CodecInfo>& CodecMap() {
  static const std::map<std::string, CodecInfo> kMap = {
      {"libx265", {"libx265", "yuv420p10le"}},
      {"libx264", {"libx264", "yuv420p"}},
      {"libsvtav1", {"libsvtav1", "yuv420p10le"}},
      {"hevc_nvenc", {"hevc_nvenc", "p010le"}},
      {"h264_nvenc", {"h264_nvenc", "yuv420p"}},
      {"av1_nvenc", {"av1_nvenc", "p010le"}},
      {"hevc_videotoolbox", {"hevc_videotoolbox", "nv12"}},
      {"h264_videotoolbox", {"h264_videotoolbox", "nv12"}},
      {"hevc_qsv", {"hevc_qsv", "nv12"}},
  };
  return kMap;
}

const std::map<std::string, std::vector<std::string>>& HwAccelInputArgs() {
  static const std::map<std::string, std::vector<std::string>> kMap = {
      {"nvenc", {"-hwaccel", "cuda", "-hwaccel_output_format", "cuda"}},
      {"videotoolbox", {"-hwaccel", "videotoolbox"}},
      {"qsv", {"-hwaccel", "qsv"}},
  };
  return kMap;
}

constexpr const char* kTonemapFilter =
    "zscale=t=linear:npl=100,format=gbrpf32le,zscale=p=bt709:t=bt709:m=bt709:r=tv,"
    "format=yuv420p";

// "8M" -> "16M". Empty when the rate has no leading number.
std::string DoubledBufferSize(const std::string& bitrate) {
  char* end = nullptr;
  long value = std::strtol(bitrate.c_str(), &end, 10);
  if (end == bitrate.c_str() || value <= 0) return "";
  return std::to_string(value * 2) + "M";
}

}  // namespace

std::string ConfigValue(const model::EncodeConfig& config, const std::string& key,
                        const std::string& fallback) {
  auto it = config.find(key);
  if (it == config.end() || it->second.empty()) return fallback;
  return it->second;
}

std::string ContainerOf(const model::EncodeConfig& config) {
  return ConfigValue(config, "container", "mkv");
}

std::vector<std::string> SplitCommandLine(const std::string& text) {
  std::vector<std::string> words;
  std::string current;
  bool in_word = false;
  char quote = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (quote == '\'') {
      if (c == '\'') {
        quote = 0;
      } else {
        current += c;
      }
      continue;
    }
    if (quote == '"') {
      if (c == '"') {
        quote = 0;
      } else if (c == '\\' && i + 1 < text.size() &&
                 (text[i + 1] == '"' || text[i + 1] == '\\')) {
        current += text[++i];
      } else {
        current += c;
      }
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(c))) {
      if (in_word) {
        words.push_back(current);
        current.clear();
        in_word = false;
      }
      continue;
    }
    in_word = true;
    if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == '\\' && i + 1 < text.size()) {
      current += text[++i];
    } else {
      current += c;
    }
  }
  if (in_word) words.push_back(current);
  return words;
}

std::string FfmpegCommandBuilder::OutputPathFor(const model::EncodeConfig& config,
                                                const std::string& input_path) const {
  std::string base = input_path;
  size_t slash = base.find_last_of('/');
  size_t dot = base.find_last_of('.');
  if (dot != std::string::npos && (slash == std::string::npos || dot > slash + 1)) {
    base.erase(dot);
  }
  return base + ".encodefarm." + ContainerOf(config);
}

EncoderCommand FfmpegCommandBuilder::Build(const model::EncodeConfig& config,
                                           const std::string& input_path,
                                           const std::string& output_path,
                                           const std::string& program) const {
  EncoderCommand out;
  out.output_path = output_path;
  std::vector<std::string>& args = out.argv;
  args.push_back(program.empty() ? "ffmpeg" : program);
  args.push_back("-y");

  auto hw = HwAccelInputArgs().find(ConfigValue(config, "hw_accel"));
  if (hw != HwAccelInputArgs().end()) {
    args.insert(args.end(), hw->second.begin(), hw->second.end());
  }
  args.push_back("-i");
  args.push_back(input_path);

  AppendVideoArgs(config, &args);
  AppendAudioArgs(config, &args);
  AppendSubtitleArgs(config, &args);

  for (auto& word : SplitCommandLine(ConfigValue(config, "custom_flags"))) {
    args.push_back(std::move(word));
  }
  args.push_back(output_path);

  for (const auto& arg : args) {
    if (!out.command.empty()) out.command += ' ';
    out.command += util::ShellQuote(arg);
  }
  return out;
}

void FfmpegCommandBuilder::AppendVideoArgs(const model::EncodeConfig& config,
                                           std::vector<std::string>* args) {
  const std::string codec = ConfigValue(config, "video_codec", "libx265");
  auto known = CodecMap().find(codec);
  const std::string encoder = known != CodecMap().end() ? known->second.encoder : codec;
  const std::string pix_fmt = known != CodecMap().end() ? known->second.pix_fmt : "yuv420p";

  args->push_back("-c:v");
  args->push_back(encoder);

  const bool tonemap = ConfigValue(config, "hdr_mode", "preserve") == "tonemap";
  std::string filter = tonemap ? kTonemapFilter : "";
  auto res = ResolutionMap().find(ConfigValue(config, "target_resolution"));
  if (res != ResolutionMap().end()) {
    std::string scale = "scale=" + res->second + ":flags=lanczos";
    filter = filter.empty() ? scale : filter + "," + scale;
  }
  if (!filter.empty()) {
    args->push_back("-vf");
    args->push_back(filter);
  }
  args->push_back("-pix_fmt");
  args->push_back(tonemap ? "yuv420p" : pix_fmt);

  const std::string mode = ConfigValue(config, "bitrate_mode", "crf");
  if (mode == "crf") {
    args->push_back("-crf");
    args->push_back(ConfigValue(config, "crf_value", "23"));
  } else if (mode == "cbr") {
    const std::string rate = ConfigValue(config, "target_bitrate", "8M");
    args->insert(args->end(), {"-b:v", rate, "-maxrate", rate});
    std::string bufsize = DoubledBufferSize(rate);
    if (!bufsize.empty()) args->insert(args->end(), {"-bufsize", bufsize});
  } else if (mode == "vbr") {
    args->insert(args->end(), {"-b:v", ConfigValue(config, "target_bitrate", "8M")});
  }

  const std::string tune = ConfigValue(config, "encoder_tune");
  if (!tune.empty()) args->insert(args->end(), {"-tune", tune});
}

void FfmpegCommandBuilder::AppendAudioArgs(const model::EncodeConfig& config,
                                           std::vector<std::string>* args) {
  const std::string mode = ConfigValue(config, "audio_mode", "copy");
  if (mode == "copy") {
    args->insert(args->end(), {"-c:a", "copy"});
  } else if (mode == "transcode") {
    const std::string codec = ConfigValue(config, "audio_codec", "aac");
    args->insert(args->end(), {"-c:a", codec});
    if (codec == "aac") {
      args->insert(args->end(), {"-b:a", "192k"});
    } else if (codec == "libopus") {
      args->insert(args->end(), {"-b:a", "128k"});
    }
  } else if (mode == "downmix") {
    args->insert(args->end(), {"-c:a", "aac", "-ac", "2", "-b:a", "192k"});
  }
}

void FfmpegCommandBuilder::AppendSubtitleArgs(const model::EncodeConfig& config,
                                              std::vector<std::string>* args) {
  const std::string mode = ConfigValue(config, "subtitle_mode", "copy");
  if (mode == "copy") {
    args->insert(args->end(), {"-c:s", "copy"});
  } else if (mode == "remove") {
    args->push_back("-sn");
  }
}

}  // namespace encodefarm::executor
