// Repository: Encodefarm
// Component: FFmpeg Command Builder
// Purpose: Turns an opaque encode configuration into an ffmpeg invocation
//          and the deterministic output path next to the input.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_EXECUTOR_FFMPEG_COMMAND_BUILDER_HPP_
#define ENCODEFARM_EXECUTOR_FFMPEG_COMMAND_BUILDER_HPP_

#include <string>
#include <vector>

#include "encodefarm/model/JobTypes.hpp"

namespace encodefarm::executor {

struct EncoderCommand {
  std::vector<std::string> argv;
  // argv joined with shell quoting; what a remote shell runs.
  std::string command;
  std::string output_path;
};

class IEncoderCommandFactory {
 public:
  virtual ~IEncoderCommandFactory() = default;

  // "<input without extension>.encodefarm.<container>".
  virtual std::string OutputPathFor(const model::EncodeConfig& config,
                                    const std::string& input_path) const = 0;

  // program is the encoder executable as the executing host names it.
  virtual EncoderCommand Build(const model::EncodeConfig& config,
                               const std::string& input_path,
                               const std::string& output_path,
                               const std::string& program) const = 0;
};

// Recognized keys: video_codec, hw_accel, encoder_tune, container, hdr_mode,
// target_resolution, bitrate_mode, crf_value, target_bitrate, audio_mode,
// audio_codec, subtitle_mode, custom_flags. Unknown keys are ignored and an
// empty value counts as unset.
class FfmpegCommandBuilder : public IEncoderCommandFactory {
 public:
  FfmpegCommandBuilder() = default;

  std::string OutputPathFor(const model::EncodeConfig& config,
                            const std::string& input_path) const override;
  EncoderCommand Build(const model::EncodeConfig& config, const std::string& input_path,
                       const std::string& output_path,
                       const std::string& program) const override;

 private:
  static void AppendVideoArgs(const model::EncodeConfig& config, std::vector<std::string>* args);
  static void AppendAudioArgs(const model::EncodeConfig& config, std::vector<std::string>* args);
  static void AppendSubtitleArgs(const model::EncodeConfig& config,
                                 std::vector<std::string>* args);
};

// Value for key, or fallback when absent or empty.
std::string ConfigValue(const model::EncodeConfig& config, const std::string& key,
                        const std::string& fallback = "");

// "mkv" unless the config names a container.
std::string ContainerOf(const model::EncodeConfig& config);

// Shell-style word splitting with single/double quotes and backslash escapes.
std::vector<std::string> SplitCommandLine(const std::string& text);

}  // namespace encodefarm::executor

#endif  // ENCODEFARM_EXECUTOR_FFMPEG_COMMAND_BUILDER_HPP_
