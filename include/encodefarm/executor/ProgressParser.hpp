// Repository: Encodefarm
// Component: Encoder Progress Parser
// Purpose: Extracts frame / fps / time / speed from encoder status lines
//          and derives percent complete and ETA.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_EXECUTOR_PROGRESS_PARSER_HPP_
#define ENCODEFARM_EXECUTOR_PROGRESS_PARSER_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace encodefarm::executor {

struct EncoderProgress {
  int64_t frame = 0;
  double fps = 0.0;
  std::string size;
  double time_s = 0.0;
  double speed = 0.0;
  // Only set when the source duration is known.
  std::optional<double> percent;
  std::optional<int64_t> eta_seconds;
};

// Parses lines like
//   frame= 1234 fps= 48 q=28.0 size=  10240kB time=00:00:51.40 bitrate=... speed=2.0x
// Returns nullopt for any other line.
std::optional<EncoderProgress> ParseProgressLine(const std::string& line,
                                                 std::optional<double> duration_s);

// "HH:MM:SS.ff" -> seconds; nullopt when malformed.
std::optional<double> ParseClockSeconds(const std::string& text);

}  // namespace encodefarm::executor

#endif  // ENCODEFARM_EXECUTOR_PROGRESS_PARSER_HPP_
