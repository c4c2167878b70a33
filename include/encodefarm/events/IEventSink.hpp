// Repository: Encodefarm
// Component: Event Sink Interface
// Purpose: Fire-and-forget delivery of job and server events.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_EVENTS_IEVENT_SINK_HPP_
#define ENCODEFARM_EVENTS_IEVENT_SINK_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace encodefarm::events {

// Event names on the wire.
inline constexpr const char kJobStatusChanged[] = "job.status_changed";
inline constexpr const char kJobProgress[] = "job.progress";
inline constexpr const char kJobTransferProgress[] = "job.transfer_progress";
inline constexpr const char kJobLog[] = "job.log";
inline constexpr const char kJobRetryScheduled[] = "job.retry_scheduled";
inline constexpr const char kJobFailed[] = "job.failed";
inline constexpr const char kJobCompleted[] = "job.completed";
inline constexpr const char kJobCancelled[] = "job.cancelled";
inline constexpr const char kJobStuck[] = "job.stuck";
inline constexpr const char kJobPrestaged[] = "job.prestaged";
inline constexpr const char kServerStatus[] = "server.status";
inline constexpr const char kServerAutoDisabled[] = "server.auto_disabled";

struct JobEvent {
  uint64_t sequence = 0;
  std::string event_uuid;
  std::string emitted_utc;  // ISO 8601, millisecond precision
  int64_t emitted_utc_ms = 0;
  std::string name;
  std::optional<int64_t> job_id;
  std::optional<int64_t> worker_id;
  std::string payload_json = "{}";
};

// Implementations must be thread-safe and must not block the caller on I/O.
class IEventSink {
 public:
  virtual ~IEventSink() = default;
  virtual void Deliver(const JobEvent& event) = 0;
};

}  // namespace encodefarm::events

#endif  // ENCODEFARM_EVENTS_IEVENT_SINK_HPP_
