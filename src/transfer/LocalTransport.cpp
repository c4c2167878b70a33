// Repository: Encodefarm
// Component: Local Transport
// Copyright (c) 2025 RetroVue

#include "encodefarm/transfer/LocalTransport.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <vector>

#include "encodefarm/util/Subprocess.hpp"
#include "transfer/ProcessStreams.hpp"

namespace encodefarm::transfer {

using util::ShellQuote;

namespace {

constexpr size_t kCopyChunkBytes = 1024 * 1024;

CommandResult ToCommandResult(const util::SubprocessResult& r) {
  CommandResult out;
  out.exit_status = r.spawn_failed ? -1 : r.exit_code;
  out.stdout_text = r.stdout_text;
  out.stderr_text = r.spawn_failed ? r.error : r.stderr_text;
  out.cancelled = r.stopped;
  return out;
}

}  // namespace

CommandResult LocalTransport::RunCommand(const std::string& command) {
  return ToCommandResult(util::RunShell(command));
}

CommandResult LocalTransport::RunCommandStreaming(const std::string& command,
                                                  const LineCallback& on_line,
                                                  const util::CancellationToken* cancel) {
  util::RunOptions options;
  options.on_line = on_line;
  options.should_stop = [cancel] { return util::IsCancelled(cancel); };
  return ToCommandResult(util::RunShell(command, options));
}

PrimitiveResult LocalTransport::Copy(const std::string& from, const std::string& to,
                                     const BytesProgressFn& progress,
                                     const util::CancellationToken* cancel) {
  std::ifstream in(from, std::ios::binary);
  if (!in) return PrimitiveResult::Failed("cannot open " + from + ": " + std::strerror(errno));
  std::ofstream out(to, std::ios::binary | std::ios::trunc);
  if (!out) {
    const int err = errno;
    if (err == EOPNOTSUPP || err == ENOTSUP) {
      return PrimitiveResult::Unsupported("cannot create " + to + ": " + std::strerror(err));
    }
    return PrimitiveResult::Failed("cannot create " + to + ": " + std::strerror(err));
  }

  std::vector<char> buf(kCopyChunkBytes);
  int64_t copied = 0;
  while (in) {
    if (util::IsCancelled(cancel)) return PrimitiveResult::Cancelled();
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize got = in.gcount();
    if (got <= 0) break;
    if (!out.write(buf.data(), got)) {
      const int err = errno;
      if (err == EOPNOTSUPP || err == ENOTSUP) {
        return PrimitiveResult::Unsupported("write " + to + ": " + std::strerror(err));
      }
      return PrimitiveResult::Failed("write " + to + ": " + std::strerror(err));
    }
    copied += got;
    if (progress) progress(copied);
  }
  if (in.bad()) return PrimitiveResult::Failed("read " + from + " failed");
  out.close();
  if (!out) return PrimitiveResult::Failed("close " + to + " failed");
  return PrimitiveResult::Ok();
}

PrimitiveResult LocalTransport::UploadFile(const std::string& local_path,
                                           const std::string& remote_path,
                                           const BytesProgressFn& progress,
                                           const util::CancellationToken* cancel) {
  return Copy(local_path, remote_path, progress, cancel);
}

PrimitiveResult LocalTransport::DownloadFile(const std::string& remote_path,
                                             const std::string& local_path,
                                             const BytesProgressFn& progress,
                                             const util::CancellationToken* cancel) {
  return Copy(remote_path, local_path, progress, cancel);
}

PrimitiveResult LocalTransport::CopyRange(const std::string& from, const std::string& to,
                                          int64_t offset, int64_t length) {
  const int in = open(from.c_str(), O_RDONLY);
  if (in < 0) return PrimitiveResult::Failed("cannot open " + from + ": " + std::strerror(errno));
  const int out = open(to.c_str(), O_WRONLY);
  if (out < 0) {
    const int err = errno;
    close(in);
    return PrimitiveResult::Failed("cannot open " + to + ": " + std::strerror(err));
  }

  std::vector<char> buf(
      static_cast<size_t>(std::min<int64_t>(length, static_cast<int64_t>(kCopyChunkBytes))));
  PrimitiveResult result = PrimitiveResult::Ok();
  int64_t copied = 0;
  bool failed = false;
  while (copied < length && !failed) {
    const size_t want = static_cast<size_t>(std::min<int64_t>(
        length - copied, static_cast<int64_t>(buf.size())));
    const ssize_t got = pread(in, buf.data(), want, static_cast<off_t>(offset + copied));
    if (got < 0) {
      if (errno == EINTR) continue;
      result = PrimitiveResult::Failed("read " + from + ": " + std::strerror(errno));
      break;
    }
    if (got == 0) break;  // source ends inside the range

    ssize_t written = 0;
    while (written < got) {
      const ssize_t w = pwrite(out, buf.data() + written, static_cast<size_t>(got - written),
                               static_cast<off_t>(offset + copied + written));
      if (w < 0) {
        const int err = errno;
        if (err == EINTR) continue;
        result = (err == EOPNOTSUPP || err == ENOTSUP)
                     ? PrimitiveResult::Unsupported("write " + to + ": " + std::strerror(err))
                     : PrimitiveResult::Failed("write " + to + ": " + std::strerror(err));
        failed = true;
        break;
      }
      written += w;
    }
    copied += written;
  }

  close(in);
  if (close(out) != 0 && result.ok()) {
    result = PrimitiveResult::Failed("close " + to + ": " + std::strerror(errno));
  }
  result.bytes = copied;
  return result;
}

PrimitiveResult LocalTransport::UploadRange(const std::string& local_path,
                                            const std::string& remote_path,
                                            int64_t offset, int64_t length) {
  return CopyRange(local_path, remote_path, offset, length);
}

PrimitiveResult LocalTransport::DownloadRange(const std::string& remote_path,
                                              const std::string& local_path,
                                              int64_t offset, int64_t length) {
  return CopyRange(remote_path, local_path, offset, length);
}

std::unique_ptr<IByteReader> LocalTransport::OpenReader(const std::string& path) {
  return ProcessByteReader::Start({"cat", path});
}

std::unique_ptr<IByteWriter> LocalTransport::OpenWriter(const std::string& path) {
  return ProcessByteWriter::Start({"bash", "-c", "cat > " + ShellQuote(path)});
}

std::optional<int64_t> LocalTransport::FileSize(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return std::nullopt;
  return static_cast<int64_t>(st.st_size);
}

std::optional<int64_t> LocalTransport::AllocatedBytes(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) return std::nullopt;
  // st_blocks is always in 512-byte units.
  return static_cast<int64_t>(st.st_blocks) * 512;
}

PrimitiveResult LocalTransport::Preallocate(const std::string& path, int64_t size) {
  if (truncate(path.c_str(), static_cast<off_t>(size)) == 0) return PrimitiveResult::Ok();
  if (errno == ENOENT) {
    // truncate(2) does not create; make the file first.
    FILE* f = std::fopen(path.c_str(), "wb");
    if (f != nullptr) {
      std::fclose(f);
      if (truncate(path.c_str(), static_cast<off_t>(size)) == 0) return PrimitiveResult::Ok();
    }
  }
  int err = errno;
  if (err == EOPNOTSUPP || err == EINVAL) {
    return PrimitiveResult::Unsupported(std::string("truncate: ") + std::strerror(err));
  }
  return PrimitiveResult::Failed(std::string("truncate: ") + std::strerror(err));
}

bool LocalTransport::RemoveFile(const std::string& path) {
  return unlink(path.c_str()) == 0 || errno == ENOENT;
}

bool LocalTransport::MakeDirectory(const std::string& path) {
  return util::RunSubprocess({"mkdir", "-p", path}).ok();
}

}  // namespace encodefarm::transfer
