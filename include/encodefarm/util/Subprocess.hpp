// Repository: Encodefarm
// Component: Subprocess
// Purpose: fork/exec wrapper used for the encoder, ssh, rsync and dd.
//          Children run in their own process group so a kill reaches every
//          stage of a shell pipeline.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_UTIL_SUBPROCESS_HPP_
#define ENCODEFARM_UTIL_SUBPROCESS_HPP_

#include <sys/types.h>

#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace encodefarm::util {

// Splits a byte stream into lines on '\r' or '\n'. Encoders rewrite their
// status line with '\r', so both terminate a line. Empty lines are dropped.
class LineSplitter {
 public:
  using LineFn = std::function<void(const std::string&)>;

  void Feed(const char* data, size_t len, const LineFn& on_line);
  void Flush(const LineFn& on_line);

 private:
  std::string pending_;
};

// Single child process with piped stdout/stderr and optional piped stdin.
class Subprocess {
 public:
  struct StartOptions {
    bool pipe_stdin = false;
    // Collect stderr on a background thread (keeps the last 64 KiB) so a
    // caller that only reads stdout cannot deadlock on a full stderr pipe.
    bool drain_stderr_in_background = false;
  };

  Subprocess() = default;
  ~Subprocess();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  bool Start(const std::vector<std::string>& argv, const StartOptions& options,
             std::string* error);

  bool WriteAll(const char* data, size_t len);
  void CloseStdin();

  // Blocking read from stdout: bytes read, 0 at EOF, -1 on error.
  ssize_t ReadStdout(char* buf, size_t len);

  // Reaps the child. Returns the exit code, or 128 + signal number.
  int Wait();

  // SIGTERM to the process group, SIGKILL after grace_ms if still alive.
  void Terminate(int grace_ms = 2000);

  pid_t pid() const { return pid_; }
  int stdout_fd() const { return stdout_fd_; }
  int stderr_fd() const { return stderr_fd_; }

  // Background-drained stderr (drain_stderr_in_background only).
  std::string CollectedStderr() const;

 private:
  void DrainStderr();
  void CloseFd(int* fd);

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  int stderr_fd_ = -1;
  bool reaped_ = false;
  int exit_code_ = -1;

  std::thread stderr_thread_;
  mutable std::mutex stderr_mutex_;
  std::string stderr_text_;  // Guarded by stderr_mutex_
};

struct SubprocessResult {
  int exit_code = -1;
  bool spawn_failed = false;
  bool stopped = false;  // should_stop fired and the child was terminated
  std::string stdout_text;
  std::string stderr_text;
  std::string error;

  bool ok() const { return !spawn_failed && !stopped && exit_code == 0; }
};

struct RunOptions {
  // Every stdout/stderr line, in arrival order, on the calling thread.
  std::function<void(const std::string&)> on_line;
  // Polled about every 100 ms; returning true terminates the child.
  std::function<bool()> should_stop;
  // Invoked once the child is running.
  std::function<void(pid_t)> on_spawn;
  bool capture_output = true;
  size_t capture_limit = 1 << 20;
};

// Runs argv to completion on the calling thread.
SubprocessResult RunSubprocess(const std::vector<std::string>& argv,
                               const RunOptions& options = RunOptions());

// Runs `bash -o pipefail -c <script>`.
SubprocessResult RunShell(const std::string& script,
                          const RunOptions& options = RunOptions());

// Single-quotes s for POSIX shells.
std::string ShellQuote(const std::string& s);

}  // namespace encodefarm::util

#endif  // ENCODEFARM_UTIL_SUBPROCESS_HPP_
