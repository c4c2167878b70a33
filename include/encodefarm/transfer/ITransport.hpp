// Repository: Encodefarm
// Component: Transport Interface
// Purpose: Single-operation I/O against one host: commands, whole-file and
//          byte-range copies, streaming reader/writer, remote file stats.
//          One ITransport instance is one connection; callers that need
//          independent channels (segments, prefetch) create more instances.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_TRANSFER_ITRANSPORT_HPP_
#define ENCODEFARM_TRANSFER_ITRANSPORT_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "encodefarm/model/JobTypes.hpp"
#include "encodefarm/util/CancellationToken.hpp"

namespace encodefarm::transfer {

struct CommandResult {
  int exit_status = -1;
  std::string stdout_text;
  std::string stderr_text;
  bool cancelled = false;

  bool ok() const { return exit_status == 0 && !cancelled; }
};

enum class PrimitiveStatus {
  kOk,
  kFailed,
  // The destination filesystem rejected the operation (EOPNOTSUPP class).
  kUnsupported,
  kCancelled,
};

const char* PrimitiveStatusToString(PrimitiveStatus status);

struct PrimitiveResult {
  PrimitiveStatus status = PrimitiveStatus::kOk;
  std::string message;
  // Bytes moved by a range copy; negative when the tool does not say.
  int64_t bytes = -1;

  bool ok() const { return status == PrimitiveStatus::kOk; }

  static PrimitiveResult Ok() { return PrimitiveResult{}; }
  static PrimitiveResult Failed(std::string message) {
    return PrimitiveResult{PrimitiveStatus::kFailed, std::move(message)};
  }
  static PrimitiveResult Unsupported(std::string message) {
    return PrimitiveResult{PrimitiveStatus::kUnsupported, std::move(message)};
  }
  static PrimitiveResult Cancelled() {
    return PrimitiveResult{PrimitiveStatus::kCancelled, "cancelled"};
  }
};

// Maps tool stderr to kUnsupported when it carries an "operation not
// supported" class error, otherwise kFailed.
PrimitiveResult ClassifyIoFailure(const std::string& diagnostics);

using LineCallback = std::function<void(const std::string&)>;
// Cumulative bytes moved so far.
using BytesProgressFn = std::function<void(int64_t bytes_done)>;

class IByteReader {
 public:
  virtual ~IByteReader() = default;
  // Bytes read, 0 at end of stream, negative on error.
  virtual int64_t Read(char* buf, size_t len) = 0;
  virtual PrimitiveResult Finish() = 0;
};

class IByteWriter {
 public:
  virtual ~IByteWriter() = default;
  virtual bool Write(const char* data, size_t len) = 0;
  // Flushes and closes; the result reflects the remote side's exit.
  virtual PrimitiveResult Finish() = 0;
  virtual void Abort() = 0;
};

class ITransport {
 public:
  virtual ~ITransport() = default;

  // "user@host:port" or "local".
  virtual std::string Describe() const = 0;
  virtual bool IsLocal() const = 0;

  virtual bool TestConnection() = 0;
  virtual CommandResult RunCommand(const std::string& command) = 0;
  // Each stdout/stderr line (split on \r or \n) goes to on_line. A fired
  // token terminates the command.
  virtual CommandResult RunCommandStreaming(const std::string& command,
                                            const LineCallback& on_line,
                                            const util::CancellationToken* cancel) = 0;

  // Whole-file copy with the host's bulk tool.
  virtual PrimitiveResult UploadFile(const std::string& local_path,
                                     const std::string& remote_path,
                                     const BytesProgressFn& progress,
                                     const util::CancellationToken* cancel) = 0;
  virtual PrimitiveResult DownloadFile(const std::string& remote_path,
                                       const std::string& local_path,
                                       const BytesProgressFn& progress,
                                       const util::CancellationToken* cancel) = 0;

  // Byte-range copies into an existing, already sized destination. The
  // result carries the bytes actually copied, which is short of length when
  // the source ends inside the range.
  virtual PrimitiveResult UploadRange(const std::string& local_path,
                                      const std::string& remote_path,
                                      int64_t offset, int64_t length) = 0;
  virtual PrimitiveResult DownloadRange(const std::string& remote_path,
                                        const std::string& local_path,
                                        int64_t offset, int64_t length) = 0;

  virtual std::unique_ptr<IByteReader> OpenReader(const std::string& remote_path) = 0;
  virtual std::unique_ptr<IByteWriter> OpenWriter(const std::string& remote_path) = 0;

  // nullopt when the file does not exist or cannot be stat'ed.
  virtual std::optional<int64_t> FileSize(const std::string& remote_path) = 0;
  // Bytes actually backed by storage (not the apparent size).
  virtual std::optional<int64_t> AllocatedBytes(const std::string& remote_path) = 0;
  // Sizes the destination to size bytes without writing data.
  virtual PrimitiveResult Preallocate(const std::string& remote_path, int64_t size) = 0;
  virtual bool RemoveFile(const std::string& remote_path) = 0;
  virtual bool MakeDirectory(const std::string& remote_path) = 0;
};

// Creates fresh connections. Every call returns an independent transport.
class ITransportFactory {
 public:
  virtual ~ITransportFactory() = default;
  virtual std::unique_ptr<ITransport> ForWorker(const model::Worker& worker) = 0;
  // The media origin (catalog host). nullptr when it exposes no SSH.
  virtual std::unique_ptr<ITransport> ForOrigin() = 0;
  virtual bool OriginHasSsh() const = 0;
};

}  // namespace encodefarm::transfer

#endif  // ENCODEFARM_TRANSFER_ITRANSPORT_HPP_
