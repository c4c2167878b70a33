// Repository: Encodefarm
// Component: Process-backed byte streams and transport status helpers
// Copyright (c) 2025 RetroVue

#include "transfer/ProcessStreams.hpp"

#include <signal.h>

#include <algorithm>
#include <cctype>

#include "encodefarm/util/Logger.hpp"

namespace encodefarm::transfer {

const char* PrimitiveStatusToString(PrimitiveStatus status) {
  switch (status) {
    case PrimitiveStatus::kOk:          return "ok";
    case PrimitiveStatus::kFailed:      return "failed";
    case PrimitiveStatus::kUnsupported: return "unsupported";
    case PrimitiveStatus::kCancelled:   return "cancelled";
  }
  return "unknown";
}

PrimitiveResult ClassifyIoFailure(const std::string& diagnostics) {
  std::string lower = diagnostics;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  // SMB/NFS shares reject seeking writes and large block sizes this way.
  static const char* kUnsupportedMarkers[] = {
      "operation not supported",
      "not supported",
      "errno 45",
      "errno 95",
      "eopnotsupp",
      "invalid argument",
  };
  for (const char* marker : kUnsupportedMarkers) {
    if (lower.find(marker) != std::string::npos) {
      return PrimitiveResult::Unsupported(diagnostics);
    }
  }
  return PrimitiveResult::Failed(diagnostics);
}

// ---------------------------------------------------------------------------
// ProcessByteReader
// ---------------------------------------------------------------------------

std::unique_ptr<ProcessByteReader> ProcessByteReader::Start(
    const std::vector<std::string>& argv) {
  std::unique_ptr<ProcessByteReader> reader(new ProcessByteReader());
  util::Subprocess::StartOptions options;
  options.drain_stderr_in_background = true;
  std::string error;
  if (!reader->proc_.Start(argv, options, &error)) {
    util::Logger::Warn("[ProcessByteReader] Cannot start " + argv.front() + ": " + error);
    return nullptr;
  }
  return reader;
}

int64_t ProcessByteReader::Read(char* buf, size_t len) {
  return static_cast<int64_t>(proc_.ReadStdout(buf, len));
}

PrimitiveResult ProcessByteReader::Finish() {
  if (finished_) return PrimitiveResult::Ok();
  finished_ = true;
  int code = proc_.Wait();
  if (code == 0) return PrimitiveResult::Ok();
  return ClassifyIoFailure("reader exited " + std::to_string(code) + ": " +
                           proc_.CollectedStderr());
}

// ---------------------------------------------------------------------------
// ProcessByteWriter
// ---------------------------------------------------------------------------

std::unique_ptr<ProcessByteWriter> ProcessByteWriter::Start(
    const std::vector<std::string>& argv) {
  // A writer whose remote end died must fail on write(), not kill us.
  signal(SIGPIPE, SIG_IGN);
  std::unique_ptr<ProcessByteWriter> writer(new ProcessByteWriter());
  util::Subprocess::StartOptions options;
  options.pipe_stdin = true;
  options.drain_stderr_in_background = true;
  std::string error;
  if (!writer->proc_.Start(argv, options, &error)) {
    util::Logger::Warn("[ProcessByteWriter] Cannot start " + argv.front() + ": " + error);
    return nullptr;
  }
  return writer;
}

bool ProcessByteWriter::Write(const char* data, size_t len) {
  return proc_.WriteAll(data, len);
}

PrimitiveResult ProcessByteWriter::Finish() {
  if (finished_) return PrimitiveResult::Ok();
  finished_ = true;
  proc_.CloseStdin();
  int code = proc_.Wait();
  if (code == 0) return PrimitiveResult::Ok();
  return ClassifyIoFailure("writer exited " + std::to_string(code) + ": " +
                           proc_.CollectedStderr());
}

void ProcessByteWriter::Abort() {
  if (finished_) return;
  finished_ = true;
  proc_.CloseStdin();
  proc_.Terminate(500);
}

}  // namespace encodefarm::transfer
