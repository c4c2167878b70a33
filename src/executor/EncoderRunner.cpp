// Repository: Encodefarm
// Component: Encoder Runner
// Copyright (c) 2025 RetroVue

#include "encodefarm/executor/EncoderRunner.hpp"

#include "encodefarm/util/Logger.hpp"

namespace encodefarm::executor {

void DiagnosticTail::Add(const std::string& line) {
  lines_.push_back(line);
  while (lines_.size() > max_lines_) lines_.pop_front();
}

std::string DiagnosticTail::Text() const {
  std::string out;
  for (const auto& line : lines_) {
    out += line;
    out += '\n';
  }
  return out;
}

EncodeOutcome EncoderRunner::Run(const EncodeRequest& request, HardwareFallback& fallback,
                                 DiagnosticTail& tail, const CommandFn& on_command,
                                 const ProgressFn& on_progress, const FallbackFn& on_fallback) {
  EncodeOutcome outcome;
  if (request.transport == nullptr) {
    tail.Add("no transport for encoder");
    return outcome;
  }

  EncoderCommand command = commands_.Build(fallback.config(), request.input_path,
                                           request.output_path, request.program);
  if (on_command) on_command(command.command);

  for (;;) {
    ++outcome.attempts;
    outcome.command = command.command;
    outcome.config = fallback.config();

    if (util::IsCancelled(request.cancel)) {
      outcome.cancelled = true;
      return outcome;
    }

    // This attempt's lines only; used for failure-marker matching.
    std::string attempt_text;
    double fps_sum = 0.0;
    int fps_samples = 0;
    util::Logger::Info("[EncoderRunner] " + request.transport->Describe() + " attempt " +
                       std::to_string(outcome.attempts) + ": " + command.command);

    transfer::CommandResult r = request.transport->RunCommandStreaming(
        command.command,
        [&](const std::string& line) {
          if (auto p = ParseProgressLine(line, request.duration_s)) {
            if (p->fps > 0.0) {
              fps_sum += p->fps;
              ++fps_samples;
            }
            if (on_progress) on_progress(*p);
            return;
          }
          tail.Add(line);
          attempt_text += line;
          attempt_text += '\n';
        },
        request.cancel);

    outcome.exit_status = r.exit_status;
    if (fps_samples > 0) outcome.avg_fps = fps_sum / fps_samples;
    if (r.cancelled || util::IsCancelled(request.cancel)) {
      outcome.cancelled = true;
      return outcome;
    }
    if (r.ok()) {
      outcome.ok = true;
      return outcome;
    }
    if (!r.stderr_text.empty() && attempt_text.empty()) attempt_text = r.stderr_text;

    FallbackStep step = fallback.Next(attempt_text);
    if (step == FallbackStep::kNone) {
      util::Logger::Warn("[EncoderRunner] encoder exited " + std::to_string(r.exit_status) +
                         " with no fallback left");
      return outcome;
    }
    command = commands_.Build(fallback.config(), request.input_path, request.output_path,
                              request.program);
    util::Logger::Warn("[EncoderRunner] " + fallback.last_note());
    tail.Add("[fallback] " + fallback.last_note());
    if (on_fallback) on_fallback(step, fallback.last_note(), command.command);
  }
}

}  // namespace encodefarm::executor
