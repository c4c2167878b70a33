// Repository: Encodefarm
// Component: Encoder Progress Parser
// Copyright (c) 2025 RetroVue

#include "encodefarm/executor/ProgressParser.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <regex>

namespace encodefarm::executor {

namespace {

const std::regex& ProgressPattern() {
  static const std::regex kPattern(
      R"(frame=\s*(\d+).*?fps=\s*([\d.]+).*?size=\s*(\d+\w+).*?time=(\d+:\d+:\d+\.\d+).*?speed=\s*([\d.]+)x)");
  return kPattern;
}

}  // namespace

std::optional<double> ParseClockSeconds(const std::string& text) {
  int h = 0;
  int m = 0;
  double s = 0.0;
  char tail = 0;
  if (std::sscanf(text.c_str(), "%d:%d:%lf%c", &h, &m, &s, &tail) != 3) return std::nullopt;
  if (h < 0 || m < 0 || m >= 60 || s < 0.0) return std::nullopt;
  return h * 3600.0 + m * 60.0 + s;
}

std::optional<EncoderProgress> ParseProgressLine(const std::string& line,
                                                 std::optional<double> duration_s) {
  std::smatch match;
  if (!std::regex_search(line, match, ProgressPattern())) return std::nullopt;

  EncoderProgress p;
  p.frame = std::stoll(match[1].str());
  p.fps = std::stod(match[2].str());
  p.size = match[3].str();
  auto t = ParseClockSeconds(match[4].str());
  if (!t) return std::nullopt;
  p.time_s = *t;
  p.speed = std::stod(match[5].str());

  if (duration_s && *duration_s > 0.0) {
    double pct = std::min(100.0, p.time_s / *duration_s * 100.0);
    p.percent = std::round(pct * 10.0) / 10.0;
    if (p.fps > 0.0) {
      // fps relative to a nominal 24 fps source approximates playback speed.
      double remaining = std::max(0.0, *duration_s - p.time_s);
      p.eta_seconds = static_cast<int64_t>(remaining / std::max(p.fps / 24.0, 0.01));
    } else {
      p.eta_seconds = 0;
    }
  }
  return p;
}

}  // namespace encodefarm::executor
