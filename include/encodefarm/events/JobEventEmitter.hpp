// Repository: Encodefarm
// Component: Job Event Emitter
// Purpose: Wraps job and server events into sequenced envelopes (UUID, UTC
//          timestamp, flat JSON payload) and fans them out to sinks.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_EVENTS_JOB_EVENT_EMITTER_HPP_
#define ENCODEFARM_EVENTS_JOB_EVENT_EMITTER_HPP_

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "encodefarm/events/IEventSink.hpp"
#include "encodefarm/model/JobTypes.hpp"
#include "encodefarm/time/ITimeSource.hpp"

namespace encodefarm::events {

struct ProgressPayload {
  double percent = 0.0;
  double fps = 0.0;
  int64_t eta_seconds = 0;
  int64_t frame = 0;
};

struct TransferProgressPayload {
  std::string direction;  // "upload" / "download"
  std::string leg;        // "source" / "output"
  double percent = 0.0;
  int64_t bytes_done = 0;
  int64_t total_bytes = 0;
  double speed_bps = 0.0;
  double eta_seconds = -1.0;
};

class JobEventEmitter {
 public:
  explicit JobEventEmitter(std::shared_ptr<time::ITimeSource> clock);

  void AddSink(std::shared_ptr<IEventSink> sink);

  void EmitStatusChanged(int64_t job_id, model::JobStatus status);
  void EmitProgress(int64_t job_id, const ProgressPayload& p);
  void EmitTransferProgress(int64_t job_id, const TransferProgressPayload& p);
  void EmitLog(int64_t job_id, const std::string& message);
  void EmitRetryScheduled(int64_t job_id, int retry_count, int64_t backoff_seconds,
                          model::ErrorCategory category, const std::string& reason);
  // diagnostics is the clipped tail of encoder and transfer output.
  void EmitFailed(int64_t job_id, model::ErrorCategory category, const std::string& reason,
                  const std::string& diagnostics);
  void EmitCompleted(int64_t job_id, int64_t output_size, std::optional<double> size_reduction);
  void EmitCancelled(int64_t job_id);
  void EmitStuck(int64_t job_id, int64_t minutes_since_update);
  void EmitPrestaged(int64_t job_id, int64_t worker_id, const std::string& path);
  void EmitServerStatus(int64_t worker_id, model::WorkerStatus status,
                        const std::string& detail);
  void EmitServerAutoDisabled(int64_t worker_id, int consecutive_failures);

  uint64_t CurrentSequence() const { return sequence_.load(std::memory_order_relaxed); }

  static std::string FormatIso8601(int64_t utc_ms);
  static std::string GenerateUuidV4();

 private:
  void Publish(const char* name, std::optional<int64_t> job_id,
               std::optional<int64_t> worker_id, std::string payload_json);

  std::shared_ptr<time::ITimeSource> clock_;
  std::atomic<uint64_t> sequence_{0};
  std::mutex sinks_mutex_;
  std::vector<std::shared_ptr<IEventSink>> sinks_;
};

}  // namespace encodefarm::events

#endif  // ENCODEFARM_EVENTS_JOB_EVENT_EMITTER_HPP_
