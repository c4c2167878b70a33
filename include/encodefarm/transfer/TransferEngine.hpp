// Repository: Encodefarm
// Component: Transfer Engine
// Purpose: Moves one file between the controller and a remote host with a
//          strategy ladder (parallel segmented, bulk copy, chunked stream)
//          and throttled progress reporting.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_TRANSFER_TRANSFER_ENGINE_HPP_
#define ENCODEFARM_TRANSFER_TRANSFER_ENGINE_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "encodefarm/transfer/ITransport.hpp"
#include "encodefarm/transfer/LocalTransport.hpp"

namespace encodefarm::transfer {

enum class TransferDirection {
  kUpload,    // controller -> remote
  kDownload,  // remote -> controller
};

enum class TransferStrategy {
  kNone,
  kSegmented,
  kBulk,
  kChunked,
  kRelay,
};

const char* TransferDirectionToString(TransferDirection direction);
const char* TransferStrategyToString(TransferStrategy strategy);

struct TransferProgress {
  TransferDirection direction = TransferDirection::kUpload;
  int64_t bytes_done = 0;
  int64_t total_bytes = 0;
  double percent = 0.0;
  double speed_bps = 0.0;
  // Negative when the speed is not yet known.
  double eta_seconds = -1.0;
};

using TransferProgressFn = std::function<void(const TransferProgress&)>;
using ConnectFn = std::function<std::unique_ptr<ITransport>()>;

struct TransferRequest {
  TransferDirection direction = TransferDirection::kUpload;
  std::string local_path;
  std::string remote_path;
  // Expected source size, if known. The source is stat'ed regardless and a
  // mismatching hint is logged.
  int64_t size_hint = 0;
  // Primary connection to the remote host (bulk, chunked, stats).
  ITransport* transport = nullptr;
  // Opens extra independent connections for segments. Segmented transfer is
  // skipped when unset.
  ConnectFn connect;
  TransferProgressFn progress;
  const util::CancellationToken* cancel = nullptr;
};

struct TransferResult {
  bool ok = false;
  bool cancelled = false;
  TransferStrategy strategy = TransferStrategy::kNone;
  int64_t bytes = 0;
  std::string error;
};

// Rate-limits progress callbacks; the final 100% always goes through.
class ProgressThrottle {
 public:
  ProgressThrottle(TransferDirection direction, int64_t total_bytes,
                   TransferProgressFn sink, int interval_ms);

  // Cumulative bytes; emitted at most once per interval.
  void Update(int64_t bytes_done);
  void Complete();

 private:
  void Emit(int64_t bytes_done);

  TransferDirection direction_;
  int64_t total_bytes_;
  TransferProgressFn sink_;
  std::chrono::milliseconds interval_;
  std::chrono::steady_clock::time_point started_;
  std::chrono::steady_clock::time_point last_emit_;
  bool emitted_any_ = false;
};

class TransferEngine {
 public:
  struct Options {
    int64_t segmented_threshold_bytes = 100LL * 1024 * 1024;
    int segment_count = 4;
    int64_t chunk_bytes = 1024 * 1024;
    int allocation_poll_ms = 500;
    int progress_interval_ms = 500;
  };

  TransferEngine();
  explicit TransferEngine(Options options);

  // Tries each strategy in turn; the first success wins. A cancelled token
  // ends the ladder immediately.
  TransferResult Transfer(const TransferRequest& request);

 private:
  PrimitiveResult RunSegmented(const TransferRequest& request, int64_t total,
                               ProgressThrottle& throttle);
  PrimitiveResult RunBulk(const TransferRequest& request, int64_t total,
                          ProgressThrottle& throttle);
  PrimitiveResult RunChunked(const TransferRequest& request, int64_t total,
                             ProgressThrottle& throttle);
  PrimitiveResult VerifyDestination(const TransferRequest& request, int64_t total,
                                    const char* strategy);

  std::optional<int64_t> SourceSize(const TransferRequest& request);
  std::optional<int64_t> DestinationSize(const TransferRequest& request);
  std::optional<int64_t> DestinationAllocated(const TransferRequest& request);

  Options options_;
  LocalTransport local_;
};

}  // namespace encodefarm::transfer

#endif  // ENCODEFARM_TRANSFER_TRANSFER_ENGINE_HPP_
