// Repository: Encodefarm
// Component: Encoder Runner
// Purpose: Runs the encoder on a worker over its transport's streaming
//          command channel, parses progress, keeps the diagnostic tail and
//          walks the hardware fallback tiers until an attempt succeeds.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_EXECUTOR_ENCODER_RUNNER_HPP_
#define ENCODEFARM_EXECUTOR_ENCODER_RUNNER_HPP_

#include <deque>
#include <functional>
#include <optional>
#include <string>

#include "encodefarm/executor/FfmpegCommandBuilder.hpp"
#include "encodefarm/executor/HardwareFallback.hpp"
#include "encodefarm/executor/ProgressParser.hpp"
#include "encodefarm/transfer/ITransport.hpp"

namespace encodefarm::executor {

// Last N diagnostic lines of a job, oldest first.
class DiagnosticTail {
 public:
  explicit DiagnosticTail(size_t max_lines = 100) : max_lines_(max_lines) {}

  void Add(const std::string& line);
  void Clear() { lines_.clear(); }
  bool empty() const { return lines_.empty(); }
  std::string Text() const;

 private:
  size_t max_lines_;
  std::deque<std::string> lines_;
};

struct EncodeRequest {
  transfer::ITransport* transport = nullptr;
  std::string input_path;
  std::string output_path;
  // Encoder executable as the worker names it.
  std::string program = "ffmpeg";
  std::optional<double> duration_s;
  const util::CancellationToken* cancel = nullptr;
};

struct EncodeOutcome {
  bool ok = false;
  bool cancelled = false;
  int exit_status = -1;
  int attempts = 0;
  // Command of the last attempt.
  std::string command;
  // Configuration the last attempt ran with.
  model::EncodeConfig config;
  std::optional<double> avg_fps;
};

class EncoderRunner {
 public:
  using ProgressFn = std::function<void(const EncoderProgress&)>;
  // Called before each retry with the step taken, the fallback note and the
  // command about to run.
  using FallbackFn =
      std::function<void(FallbackStep, const std::string& note, const std::string& command)>;
  using CommandFn = std::function<void(const std::string& command)>;

  explicit EncoderRunner(const IEncoderCommandFactory& commands) : commands_(commands) {}

  // Each attempt's output goes into tail; on_command fires before the first
  // attempt.
  EncodeOutcome Run(const EncodeRequest& request, HardwareFallback& fallback,
                    DiagnosticTail& tail, const CommandFn& on_command,
                    const ProgressFn& on_progress, const FallbackFn& on_fallback);

 private:
  const IEncoderCommandFactory& commands_;
};

}  // namespace encodefarm::executor

#endif  // ENCODEFARM_EXECUTOR_ENCODER_RUNNER_HPP_
