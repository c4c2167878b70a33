// Repository: Encodefarm
// Component: Process-backed byte streams
// Purpose: IByteReader / IByteWriter over a child process's stdout / stdin
//          (`ssh host cat f`, `ssh host 'cat > f'`, or the local equivalents).
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_TRANSFER_PROCESS_STREAMS_HPP_
#define ENCODEFARM_TRANSFER_PROCESS_STREAMS_HPP_

#include <memory>
#include <string>
#include <vector>

#include "encodefarm/transfer/ITransport.hpp"
#include "encodefarm/util/Subprocess.hpp"

namespace encodefarm::transfer {

class ProcessByteReader : public IByteReader {
 public:
  // Returns nullptr when the process cannot be started.
  static std::unique_ptr<ProcessByteReader> Start(const std::vector<std::string>& argv);

  int64_t Read(char* buf, size_t len) override;
  PrimitiveResult Finish() override;

 private:
  ProcessByteReader() = default;

  util::Subprocess proc_;
  bool finished_ = false;
};

class ProcessByteWriter : public IByteWriter {
 public:
  static std::unique_ptr<ProcessByteWriter> Start(const std::vector<std::string>& argv);

  bool Write(const char* data, size_t len) override;
  PrimitiveResult Finish() override;
  void Abort() override;

 private:
  ProcessByteWriter() = default;

  util::Subprocess proc_;
  bool finished_ = false;
};

}  // namespace encodefarm::transfer

#endif  // ENCODEFARM_TRANSFER_PROCESS_STREAMS_HPP_
