// Repository: Encodefarm
// Component: SSH Transport
// Purpose: OpenSSH/rsync subprocess implementation of ITransport.
// Copyright (c) 2025 RetroVue

#include "encodefarm/transfer/SshTransport.hpp"

#include <cctype>
#include <sstream>

#include "encodefarm/util/Logger.hpp"
#include "encodefarm/util/Subprocess.hpp"
#include "transfer/ProcessStreams.hpp"

namespace encodefarm::transfer {

using util::ShellQuote;

namespace {

constexpr int kSshConnectFailure = 255;

CommandResult ToCommandResult(const util::SubprocessResult& r) {
  CommandResult out;
  out.exit_status = r.spawn_failed ? -1 : r.exit_code;
  out.stdout_text = r.stdout_text;
  out.stderr_text = r.spawn_failed ? r.error : r.stderr_text;
  out.cancelled = r.stopped;
  return out;
}

std::optional<int64_t> ParseLeadingInt(const std::string& text) {
  std::istringstream in(text);
  long long value = 0;
  if (!(in >> value)) return std::nullopt;
  return static_cast<int64_t>(value);
}

}  // namespace

std::optional<int64_t> ParseRsyncProgressBytes(const std::string& line) {
  size_t i = 0;
  while (i < line.size() && line[i] == ' ') ++i;
  if (i >= line.size() || !std::isdigit(static_cast<unsigned char>(line[i]))) {
    return std::nullopt;
  }
  int64_t value = 0;
  bool any_digit = false;
  for (; i < line.size(); ++i) {
    char c = line[i];
    if (std::isdigit(static_cast<unsigned char>(c))) {
      value = value * 10 + (c - '0');
      any_digit = true;
    } else if (c == ',' || c == '.') {
      continue;  // thousands separators depend on locale
    } else {
      break;
    }
  }
  // The counter must be followed by the percentage column.
  if (!any_digit || line.find('%', i) == std::string::npos) return std::nullopt;
  return value;
}

std::optional<int64_t> ParseDdCopiedBytes(const std::string& diagnostics) {
  std::optional<int64_t> found;
  std::istringstream in(diagnostics);
  std::string line;
  while (std::getline(in, line)) {
    const size_t pos = line.find(" bytes");
    if (pos == std::string::npos || line.find("copied", pos) == std::string::npos) continue;
    if (auto value = ParseLeadingInt(line.substr(0, pos))) found = value;
  }
  return found;
}

SshTransport::SshTransport(SshEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

std::string SshTransport::Describe() const {
  return Destination() + ":" + std::to_string(endpoint_.port);
}

std::string SshTransport::Destination() const {
  return endpoint_.user.empty() ? endpoint_.host : endpoint_.user + "@" + endpoint_.host;
}

std::vector<std::string> SshTransport::SshArgv(bool force_tty, bool with_destination) const {
  std::vector<std::string> argv = {
      "ssh",
      "-p", std::to_string(endpoint_.port),
      "-o", "BatchMode=yes",
      "-o", "StrictHostKeyChecking=accept-new",
      "-o", "ConnectTimeout=" + std::to_string(endpoint_.connect_timeout_s),
      "-o", "ServerAliveInterval=15",
      "-o", "ServerAliveCountMax=4",
  };
  if (!endpoint_.key_path.empty()) {
    argv.push_back("-i");
    argv.push_back(endpoint_.key_path);
  }
  // A forced tty makes the remote side receive SIGHUP when we kill ssh, so a
  // cancelled encode does not keep running on the worker.
  if (force_tty) argv.push_back("-tt");
  if (with_destination) argv.push_back(Destination());
  return argv;
}

std::string SshTransport::SshShellPrefix(bool with_destination) const {
  std::string out;
  for (const auto& arg : SshArgv(false, with_destination)) {
    if (!out.empty()) out += ' ';
    out += ShellQuote(arg);
  }
  return out;
}

bool SshTransport::TestConnection() {
  auto r = RunCommand("echo ok");
  return r.ok() && r.stdout_text.find("ok") != std::string::npos;
}

CommandResult SshTransport::RunCommand(const std::string& command) {
  auto argv = SshArgv(false);
  argv.push_back(command);
  auto result = ToCommandResult(util::RunSubprocess(argv));
  if (result.exit_status == kSshConnectFailure) {
    util::Logger::Warn("[SshTransport] " + Describe() + " connection failed: " +
                       result.stderr_text);
  }
  return result;
}

CommandResult SshTransport::RunCommandStreaming(const std::string& command,
                                                const LineCallback& on_line,
                                                const util::CancellationToken* cancel) {
  auto argv = SshArgv(true);
  argv.push_back(command);
  util::RunOptions options;
  options.on_line = on_line;
  options.should_stop = [cancel] { return util::IsCancelled(cancel); };
  return ToCommandResult(util::RunSubprocess(argv, options));
}

PrimitiveResult SshTransport::RunRsync(const std::string& from, const std::string& to,
                                       const BytesProgressFn& progress,
                                       const util::CancellationToken* cancel) {
  std::vector<std::string> argv = {
      "rsync", "--partial", "--inplace", "--info=progress2", "--no-inc-recursive",
      "-e", SshShellPrefix(false),
      from, to,
  };
  util::RunOptions options;
  options.on_line = [&progress](const std::string& line) {
    if (!progress) return;
    if (auto bytes = ParseRsyncProgressBytes(line)) progress(*bytes);
  };
  options.should_stop = [cancel] { return util::IsCancelled(cancel); };
  options.capture_limit = 64 * 1024;
  auto r = util::RunSubprocess(argv, options);
  if (r.stopped) return PrimitiveResult::Cancelled();
  if (r.ok()) return PrimitiveResult::Ok();
  if (r.spawn_failed) return PrimitiveResult::Failed("rsync: " + r.error);
  return ClassifyIoFailure("rsync exited " + std::to_string(r.exit_code) + ": " +
                           r.stderr_text);
}

PrimitiveResult SshTransport::UploadFile(const std::string& local_path,
                                         const std::string& remote_path,
                                         const BytesProgressFn& progress,
                                         const util::CancellationToken* cancel) {
  return RunRsync(local_path, Destination() + ":" + remote_path, progress, cancel);
}

PrimitiveResult SshTransport::DownloadFile(const std::string& remote_path,
                                           const std::string& local_path,
                                           const BytesProgressFn& progress,
                                           const util::CancellationToken* cancel) {
  return RunRsync(Destination() + ":" + remote_path, local_path, progress, cancel);
}

PrimitiveResult SshTransport::UploadRange(const std::string& local_path,
                                          const std::string& remote_path,
                                          int64_t offset, int64_t length) {
  std::ostringstream script;
  script << "dd if=" << ShellQuote(local_path) << " bs=1M skip=" << offset
         << " count=" << length << " iflag=skip_bytes,count_bytes status=none | "
         << SshShellPrefix() << ' '
         << ShellQuote("dd of=" + ShellQuote(remote_path) + " bs=1M seek=" +
                       std::to_string(offset) + " oflag=seek_bytes conv=notrunc");
  auto r = util::RunShell(script.str());
  if (!r.ok()) {
    return ClassifyIoFailure("range upload exited " + std::to_string(r.exit_code) + ": " +
                             r.stderr_text + r.error);
  }
  PrimitiveResult ok = PrimitiveResult::Ok();
  ok.bytes = ParseDdCopiedBytes(r.stderr_text).value_or(-1);
  return ok;
}

PrimitiveResult SshTransport::DownloadRange(const std::string& remote_path,
                                            const std::string& local_path,
                                            int64_t offset, int64_t length) {
  std::ostringstream script;
  script << SshShellPrefix() << ' '
         << ShellQuote("dd if=" + ShellQuote(remote_path) + " bs=1M skip=" +
                       std::to_string(offset) + " count=" + std::to_string(length) +
                       " iflag=skip_bytes,count_bytes status=none")
         << " | dd of=" << ShellQuote(local_path) << " bs=1M seek=" << offset
         << " oflag=seek_bytes conv=notrunc";
  auto r = util::RunShell(script.str());
  if (!r.ok()) {
    return ClassifyIoFailure("range download exited " + std::to_string(r.exit_code) + ": " +
                             r.stderr_text + r.error);
  }
  PrimitiveResult ok = PrimitiveResult::Ok();
  ok.bytes = ParseDdCopiedBytes(r.stderr_text).value_or(-1);
  return ok;
}

std::unique_ptr<IByteReader> SshTransport::OpenReader(const std::string& remote_path) {
  auto argv = SshArgv(false);
  argv.push_back("cat " + ShellQuote(remote_path));
  return ProcessByteReader::Start(argv);
}

std::unique_ptr<IByteWriter> SshTransport::OpenWriter(const std::string& remote_path) {
  auto argv = SshArgv(false);
  argv.push_back("cat > " + ShellQuote(remote_path));
  return ProcessByteWriter::Start(argv);
}

std::optional<int64_t> SshTransport::FileSize(const std::string& remote_path) {
  const std::string q = ShellQuote(remote_path);
  auto r = RunCommand("stat -c %s " + q + " 2>/dev/null || stat -f %z " + q);
  if (!r.ok()) return std::nullopt;
  return ParseLeadingInt(r.stdout_text);
}

std::optional<int64_t> SshTransport::AllocatedBytes(const std::string& remote_path) {
  const std::string q = ShellQuote(remote_path);
  auto r = RunCommand("stat -c '%b %B' " + q + " 2>/dev/null || stat -f '%b 512' " + q);
  if (!r.ok()) return std::nullopt;
  std::istringstream in(r.stdout_text);
  long long blocks = 0;
  long long block_size = 0;
  if (!(in >> blocks >> block_size)) return std::nullopt;
  return static_cast<int64_t>(blocks * block_size);
}

PrimitiveResult SshTransport::Preallocate(const std::string& remote_path, int64_t size) {
  auto r = RunCommand("truncate -s " + std::to_string(size) + " " + ShellQuote(remote_path));
  if (r.ok()) return PrimitiveResult::Ok();
  return ClassifyIoFailure("truncate: " + r.stderr_text);
}

bool SshTransport::RemoveFile(const std::string& remote_path) {
  return RunCommand("rm -f " + ShellQuote(remote_path)).ok();
}

bool SshTransport::MakeDirectory(const std::string& remote_path) {
  return RunCommand("mkdir -p " + ShellQuote(remote_path)).ok();
}

}  // namespace encodefarm::transfer
