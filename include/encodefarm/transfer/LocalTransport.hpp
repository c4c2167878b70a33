// Repository: Encodefarm
// Component: Local Transport
// Purpose: ITransport on the controller host itself. Used for the local
//          worker (encoder runs as a local subprocess) and for filesystem
//          operations on the controller side of a transfer.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_TRANSFER_LOCAL_TRANSPORT_HPP_
#define ENCODEFARM_TRANSFER_LOCAL_TRANSPORT_HPP_

#include <string>

#include "encodefarm/transfer/ITransport.hpp"

namespace encodefarm::transfer {

class LocalTransport : public ITransport {
 public:
  LocalTransport() = default;

  std::string Describe() const override { return "local"; }
  bool IsLocal() const override { return true; }

  bool TestConnection() override { return true; }
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

  std::unique_ptr<IByteReader> OpenReader(const std::string& path) override;
  std::unique_ptr<IByteWriter> OpenWriter(const std::string& path) override;

  std::optional<int64_t> FileSize(const std::string& path) override;
  std::optional<int64_t> AllocatedBytes(const std::string& path) override;
  PrimitiveResult Preallocate(const std::string& path, int64_t size) override;
  bool RemoveFile(const std::string& path) override;
  bool MakeDirectory(const std::string& path) override;

 private:
  PrimitiveResult Copy(const std::string& from, const std::string& to,
                       const BytesProgressFn& progress,
                       const util::CancellationToken* cancel);
  PrimitiveResult CopyRange(const std::string& from, const std::string& to,
                            int64_t offset, int64_t length);
};

}  // namespace encodefarm::transfer

#endif  // ENCODEFARM_TRANSFER_LOCAL_TRANSPORT_HPP_
