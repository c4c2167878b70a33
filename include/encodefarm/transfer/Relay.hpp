// Repository: Encodefarm
// Component: Relay
// Purpose: Streams a file from one remote host to another through the
//          controller when the two hosts cannot reach each other directly.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_TRANSFER_RELAY_HPP_
#define ENCODEFARM_TRANSFER_RELAY_HPP_

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "encodefarm/transfer/ITransport.hpp"
#include "encodefarm/transfer/TransferEngine.hpp"

namespace encodefarm::transfer {

// Bounded FIFO between the relay reader and writer. A null chunk is the
// end-of-stream sentinel.
class ChunkQueue {
 public:
  explicit ChunkQueue(size_t capacity) : capacity_(capacity) {}

  // Blocks while full. False once the consumer has closed the queue.
  bool Push(std::unique_ptr<std::string> chunk);
  // Blocks while empty.
  std::unique_ptr<std::string> Pop();
  // Consumer side: wakes and rejects any blocked or future Push.
  void Close();

 private:
  const size_t capacity_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::unique_ptr<std::string>> chunks_;
  bool closed_ = false;
};

struct RelayOptions {
  size_t queue_chunks = 8;
  size_t chunk_bytes = 1024 * 1024;
  int progress_interval_ms = 500;
};

// Reads src_path on src and writes dst_path on dst. A reader error is
// reported after the writer drains what was queued; a writer error stops the
// reader. size_hint only feeds progress percentages.
TransferResult RelayFile(ITransport& src, const std::string& src_path, ITransport& dst,
                         const std::string& dst_path, int64_t size_hint,
                         const TransferProgressFn& progress,
                         const util::CancellationToken* cancel,
                         const RelayOptions& options = RelayOptions());

}  // namespace encodefarm::transfer

#endif  // ENCODEFARM_TRANSFER_RELAY_HPP_
