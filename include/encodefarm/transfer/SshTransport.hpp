// Repository: Encodefarm
// Component: SSH Transport
// Purpose: ITransport over the OpenSSH client tools (ssh, rsync) and
//          coreutils on the remote side (dd, cat, stat, truncate).
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_TRANSFER_SSH_TRANSPORT_HPP_
#define ENCODEFARM_TRANSFER_SSH_TRANSPORT_HPP_

#include <string>
#include <vector>

#include "encodefarm/transfer/ITransport.hpp"

namespace encodefarm::transfer {

struct SshEndpoint {
  std::string host;
  int port = 22;
  std::string user;
  std::string key_path;  // empty: agent / default identity
  int connect_timeout_s = 10;
};

class SshTransport : public ITransport {
 public:
  explicit SshTransport(SshEndpoint endpoint);

  std::string Describe() const override;
  bool IsLocal() const override { return false; }

  bool TestConnection() override;
  CommandResult RunCommand(const std::string& command) override;
  CommandResult RunCommandStreaming(const std::string& command,
                                    const LineCallback& on_line,
                                    const util::CancellationToken* cancel) override;

  PrimitiveResult UploadFile(const std::string& local_path,
                             const std::string& remote_path,
                             const BytesProgressFn& progress,
                             const util::CancellationToken* cancel) override;
  PrimitiveResult DownloadFile(const std::string& remote_path,
                               const std::string& local_path,
                               const BytesProgressFn& progress,
                               const util::CancellationToken* cancel) override;
  PrimitiveResult UploadRange(const std::string& local_path,
                              const std::string& remote_path,
                              int64_t offset, int64_t length) override;
  PrimitiveResult DownloadRange(const std::string& remote_path,
                                const std::string& local_path,
                                int64_t offset, int64_t length) override;

  std::unique_ptr<IByteReader> OpenReader(const std::string& remote_path) override;
  std::unique_ptr<IByteWriter> OpenWriter(const std::string& remote_path) override;

  std::optional<int64_t> FileSize(const std::string& remote_path) override;
  std::optional<int64_t> AllocatedBytes(const std::string& remote_path) override;
  PrimitiveResult Preallocate(const std::string& remote_path, int64_t size) override;
  bool RemoveFile(const std::string& remote_path) override;
  bool MakeDirectory(const std::string& remote_path) override;

  const SshEndpoint& endpoint() const { return endpoint_; }

 private:
  // ssh argv up to and including the destination, ready for a command.
  std::vector<std::string> SshArgv(bool force_tty, bool with_destination = true) const;
  // The same invocation as one shell-quoted string (rsync -e, pipelines).
  std::string SshShellPrefix(bool with_destination = true) const;
  std::string Destination() const;
  PrimitiveResult RunRsync(const std::string& from, const std::string& to,
                           const BytesProgressFn& progress,
                           const util::CancellationToken* cancel);

  SshEndpoint endpoint_;
};

// Parses the cumulative byte counter from an rsync --info=progress2 line,
// e.g. "  1,048,576  12%  10.00MB/s  0:00:07". nullopt for other lines.
std::optional<int64_t> ParseRsyncProgressBytes(const std::string& line);

// Byte count from the last "N bytes ... copied" summary dd wrote to stderr.
std::optional<int64_t> ParseDdCopiedBytes(const std::string& diagnostics);

}  // namespace encodefarm::transfer

#endif  // ENCODEFARM_TRANSFER_SSH_TRANSPORT_HPP_
