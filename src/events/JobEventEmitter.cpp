// Repository: Encodefarm
// Component: Job Event Emitter
// Copyright (c) 2025 RetroVue

#include "encodefarm/events/JobEventEmitter.hpp"

#include <cstdio>
#include <ctime>
#include <random>

#include "encodefarm/util/FlatJson.hpp"

namespace encodefarm::events {

using util::JsonObjectWriter;

JobEventEmitter::JobEventEmitter(std::shared_ptr<time::ITimeSource> clock)
    : clock_(std::move(clock)) {}

void JobEventEmitter::AddSink(std::shared_ptr<IEventSink> sink) {
  if (!sink) return;
  std::lock_guard<std::mutex> lock(sinks_mutex_);
  sinks_.push_back(std::move(sink));
}

std::string JobEventEmitter::FormatIso8601(int64_t utc_ms) {
  time_t s = static_cast<time_t>(utc_ms / 1000);
  int frac_ms = static_cast<int>(utc_ms % 1000);
  struct tm tm;
  if (gmtime_r(&s, &tm) == nullptr) return "";
  char buf[64];
  int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                   tm.tm_hour, tm.tm_min, tm.tm_sec, frac_ms);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

std::string JobEventEmitter::GenerateUuidV4() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  static thread_local std::uniform_int_distribution<int> dis(0, 15);
  const char* hexdig = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) out += '-';
    if (i == 12) out += '4';
    else if (i == 16) out += hexdig[8 + dis(gen) % 4];
    else out += hexdig[dis(gen)];
  }
  return out;
}

void JobEventEmitter::Publish(const char* name, std::optional<int64_t> job_id,
                              std::optional<int64_t> worker_id, std::string payload_json) {
  JobEvent event;
  event.sequence = sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
  event.event_uuid = GenerateUuidV4();
  event.emitted_utc_ms = clock_->NowUtcMs();
  event.emitted_utc = FormatIso8601(event.emitted_utc_ms);
  event.name = name;
  event.job_id = job_id;
  event.worker_id = worker_id;
  event.payload_json = payload_json.empty() ? "{}" : std::move(payload_json);

  std::vector<std::shared_ptr<IEventSink>> sinks;
  {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    sinks = sinks_;
  }
  for (const auto& sink : sinks) sink->Deliver(event);
}

void JobEventEmitter::EmitStatusChanged(int64_t job_id, model::JobStatus status) {
  JsonObjectWriter w;
  w.Add("job_id", job_id).Add("status", model::JobStatusToString(status));
  Publish(kJobStatusChanged, job_id, std::nullopt, w.Str());
}

void JobEventEmitter::EmitProgress(int64_t job_id, const ProgressPayload& p) {
  JsonObjectWriter w;
  w.Add("job_id", job_id)
      .Add("progress", p.percent)
      .Add("fps", p.fps)
      .Add("eta_seconds", p.eta_seconds)
      .Add("frame", p.frame);
  Publish(kJobProgress, job_id, std::nullopt, w.Str());
}

void JobEventEmitter::EmitTransferProgress(int64_t job_id, const TransferProgressPayload& p) {
  JsonObjectWriter w;
  w.Add("job_id", job_id)
      .Add("direction", p.direction)
      .Add("leg", p.leg)
      .Add("progress", p.percent)
      .Add("bytes_done", p.bytes_done)
      .Add("total_bytes", p.total_bytes)
      .Add("speed_bps", p.speed_bps);
  if (p.eta_seconds >= 0.0) {
    w.Add("eta_seconds", static_cast<int64_t>(p.eta_seconds));
  } else {
    w.AddNull("eta_seconds");
  }
  Publish(kJobTransferProgress, job_id, std::nullopt, w.Str());
}

void JobEventEmitter::EmitLog(int64_t job_id, const std::string& message) {
  JsonObjectWriter w;
  w.Add("job_id", job_id).Add("message", message);
  Publish(kJobLog, job_id, std::nullopt, w.Str());
}

void JobEventEmitter::EmitRetryScheduled(int64_t job_id, int retry_count,
                                         int64_t backoff_seconds,
                                         model::ErrorCategory category,
                                         const std::string& reason) {
  JsonObjectWriter w;
  w.Add("job_id", job_id)
      .Add("retry_count", retry_count)
      .Add("backoff_seconds", backoff_seconds)
      .Add("category", model::ErrorCategoryToString(category))
      .Add("reason", reason);
  Publish(kJobRetryScheduled, job_id, std::nullopt, w.Str());
}

void JobEventEmitter::EmitFailed(int64_t job_id, model::ErrorCategory category,
                                 const std::string& reason, const std::string& diagnostics) {
  JsonObjectWriter w;
  w.Add("job_id", job_id)
      .Add("category", model::ErrorCategoryToString(category))
      .Add("error", reason)
      .Add("diagnostics", diagnostics);
  Publish(kJobFailed, job_id, std::nullopt, w.Str());
}

void JobEventEmitter::EmitCompleted(int64_t job_id, int64_t output_size,
                                    std::optional<double> size_reduction) {
  JsonObjectWriter w;
  w.Add("job_id", job_id).Add("output_size", output_size);
  if (size_reduction) {
    w.Add("size_reduction", *size_reduction);
  } else {
    w.AddNull("size_reduction");
  }
  Publish(kJobCompleted, job_id, std::nullopt, w.Str());
}

void JobEventEmitter::EmitCancelled(int64_t job_id) {
  JsonObjectWriter w;
  w.Add("job_id", job_id);
  Publish(kJobCancelled, job_id, std::nullopt, w.Str());
}

void JobEventEmitter::EmitStuck(int64_t job_id, int64_t minutes_since_update) {
  JsonObjectWriter w;
  w.Add("job_id", job_id).Add("minutes_since_update", minutes_since_update);
  Publish(kJobStuck, job_id, std::nullopt, w.Str());
}

void JobEventEmitter::EmitPrestaged(int64_t job_id, int64_t worker_id,
                                    const std::string& path) {
  JsonObjectWriter w;
  w.Add("job_id", job_id).Add("worker_id", worker_id).Add("path", path);
  Publish(kJobPrestaged, job_id, worker_id, w.Str());
}

void JobEventEmitter::EmitServerStatus(int64_t worker_id, model::WorkerStatus status,
                                       const std::string& detail) {
  JsonObjectWriter w;
  w.Add("server_id", worker_id).Add("status", model::WorkerStatusToString(status));
  if (!detail.empty()) w.Add("detail", detail);
  Publish(kServerStatus, std::nullopt, worker_id, w.Str());
}

void JobEventEmitter::EmitServerAutoDisabled(int64_t worker_id, int consecutive_failures) {
  JsonObjectWriter w;
  w.Add("server_id", worker_id).Add("consecutive_failures", consecutive_failures);
  Publish(kServerAutoDisabled, std::nullopt, worker_id, w.Str());
}

}  // namespace encodefarm::events
