// Repository: Encodefarm
// Component: Subprocess
// Purpose: fork/exec wrapper with line streaming and cooperative stop.
// Copyright (c) 2025 RetroVue

#include "encodefarm/util/Subprocess.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>

namespace encodefarm::util {

namespace {

constexpr size_t kStderrKeepBytes = 64 * 1024;

void AppendCapped(std::string* out, const char* data, size_t len, size_t limit) {
  out->append(data, len);
  if (out->size() > limit) {
    out->erase(0, out->size() - limit);
  }
}

}  // namespace

// ---------------------------------------------------------------------------
// LineSplitter
// ---------------------------------------------------------------------------

void LineSplitter::Feed(const char* data, size_t len, const LineFn& on_line) {
  for (size_t i = 0; i < len; ++i) {
    char c = data[i];
    if (c == '\n' || c == '\r') {
      if (!pending_.empty()) {
        if (on_line) on_line(pending_);
        pending_.clear();
      }
      continue;
    }
    pending_ += c;
  }
}

void LineSplitter::Flush(const LineFn& on_line) {
  if (!pending_.empty()) {
    if (on_line) on_line(pending_);
    pending_.clear();
  }
}

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

Subprocess::~Subprocess() {
  if (pid_ > 0 && !reaped_) {
    Terminate(500);
  }
  CloseFd(&stdin_fd_);
  CloseFd(&stdout_fd_);
  if (stderr_thread_.joinable()) {
    stderr_thread_.join();
  }
  CloseFd(&stderr_fd_);
}

void Subprocess::CloseFd(int* fd) {
  if (*fd >= 0) {
    close(*fd);
    *fd = -1;
  }
}

bool Subprocess::Start(const std::vector<std::string>& argv,
                       const StartOptions& options, std::string* error) {
  if (argv.empty()) {
    if (error) *error = "empty argv";
    return false;
  }

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  if ((options.pipe_stdin && pipe2(in_pipe, O_CLOEXEC) != 0) ||
      pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0) {
    if (error) *error = std::string("pipe: ") + std::strerror(errno);
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
      if (fd >= 0) close(fd);
    }
    return false;
  }

  // argv must be built before fork: the child may only call async-signal-safe
  // functions.
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& a : argv) c_argv.push_back(const_cast<char*>(a.c_str()));
  c_argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    if (error) *error = std::string("fork: ") + std::strerror(errno);
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1], err_pipe[0], err_pipe[1]}) {
      if (fd >= 0) close(fd);
    }
    return false;
  }

  if (pid == 0) {
    setpgid(0, 0);
    if (options.pipe_stdin) {
      dup2(in_pipe[0], STDIN_FILENO);
    } else {
      int devnull = open("/dev/null", O_RDONLY);
      if (devnull >= 0) dup2(devnull, STDIN_FILENO);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execvp(c_argv[0], c_argv.data());
    _exit(127);
  }

  setpgid(pid, pid);
  pid_ = pid;
  reaped_ = false;
  if (options.pipe_stdin) {
    close(in_pipe[0]);
    stdin_fd_ = in_pipe[1];
  }
  close(out_pipe[1]);
  close(err_pipe[1]);
  stdout_fd_ = out_pipe[0];
  stderr_fd_ = err_pipe[0];

  if (options.drain_stderr_in_background) {
    stderr_thread_ = std::thread(&Subprocess::DrainStderr, this);
  }
  return true;
}

void Subprocess::DrainStderr() {
  char buf[4096];
  while (true) {
    ssize_t n = read(stderr_fd_, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    AppendCapped(&stderr_text_, buf, static_cast<size_t>(n), kStderrKeepBytes);
  }
}

std::string Subprocess::CollectedStderr() const {
  std::lock_guard<std::mutex> lock(stderr_mutex_);
  return stderr_text_;
}

bool Subprocess::WriteAll(const char* data, size_t len) {
  if (stdin_fd_ < 0) return false;
  size_t written = 0;
  while (written < len) {
    ssize_t n = write(stdin_fd_, data + written, len - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

void Subprocess::CloseStdin() {
  CloseFd(&stdin_fd_);
}

ssize_t Subprocess::ReadStdout(char* buf, size_t len) {
  if (stdout_fd_ < 0) return -1;
  while (true) {
    ssize_t n = read(stdout_fd_, buf, len);
    if (n < 0 && errno == EINTR) continue;
    return n;
  }
}

int Subprocess::Wait() {
  if (pid_ <= 0) return -1;
  if (reaped_) return exit_code_;
  int status = 0;
  while (waitpid(pid_, &status, 0) < 0) {
    if (errno != EINTR) {
      reaped_ = true;
      exit_code_ = -1;
      return exit_code_;
    }
  }
  reaped_ = true;
  if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = 128 + WTERMSIG(status);
  } else {
    exit_code_ = -1;
  }
  if (stderr_thread_.joinable()) {
    stderr_thread_.join();
  }
  return exit_code_;
}

void Subprocess::Terminate(int grace_ms) {
  if (pid_ <= 0 || reaped_) return;
  kill(-pid_, SIGTERM);
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
      reaped_ = true;
      exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status)
                                     : (WIFSIGNALED(status) ? 128 + WTERMSIG(status) : -1);
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  kill(-pid_, SIGKILL);
  Wait();
}

// ---------------------------------------------------------------------------
// RunSubprocess
// ---------------------------------------------------------------------------

SubprocessResult RunSubprocess(const std::vector<std::string>& argv,
                               const RunOptions& options) {
  SubprocessResult result;
  Subprocess proc;
  Subprocess::StartOptions start;
  if (!proc.Start(argv, start, &result.error)) {
    result.spawn_failed = true;
    return result;
  }
  if (options.on_spawn) options.on_spawn(proc.pid());

  LineSplitter out_lines;
  LineSplitter err_lines;
  pollfd fds[2];
  fds[0].fd = proc.stdout_fd();
  fds[0].events = POLLIN;
  fds[1].fd = proc.stderr_fd();
  fds[1].events = POLLIN;
  int open_fds = 2;
  char buf[8192];

  while (open_fds > 0) {
    if (options.should_stop && options.should_stop()) {
      proc.Terminate();
      result.stopped = true;
      break;
    }
    int r = poll(fds, 2, 100);
    if (r < 0) {
      if (errno == EINTR) continue;
      result.error = std::string("poll: ") + std::strerror(errno);
      break;
    }
    if (r == 0) continue;
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0) continue;
      if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
      ssize_t n = read(fds[i].fd, buf, sizeof(buf));
      if (n < 0 && errno == EINTR) continue;
      if (n <= 0) {
        fds[i].fd = -1;
        --open_fds;
        continue;
      }
      std::string* capture = (i == 0) ? &result.stdout_text : &result.stderr_text;
      if (options.capture_output) {
        AppendCapped(capture, buf, static_cast<size_t>(n), options.capture_limit);
      }
      LineSplitter& splitter = (i == 0) ? out_lines : err_lines;
      splitter.Feed(buf, static_cast<size_t>(n), options.on_line);
    }
  }
  out_lines.Flush(options.on_line);
  err_lines.Flush(options.on_line);

  result.exit_code = proc.Wait();
  if (result.exit_code == 127 && result.stderr_text.empty() && !result.stopped) {
    result.error = "failed to execute " + argv[0];
  }
  return result;
}

SubprocessResult RunShell(const std::string& script, const RunOptions& options) {
  return RunSubprocess({"bash", "-o", "pipefail", "-c", script}, options);
}

std::string ShellQuote(const std::string& s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += "'";
  return out;
}

}  // namespace encodefarm::util
