// Repository: Encodefarm
// Component: Retry Policy
// Copyright (c) 2025 RetroVue

#include "encodefarm/recovery/RetryPolicy.hpp"

#include "encodefarm/util/Logger.hpp"

namespace encodefarm::recovery {

using model::ErrorCategory;
using model::JobStatus;

namespace {

constexpr int64_t kBackoffScheduleSeconds[] = {60, 5 * 60, 15 * 60};
constexpr size_t kScheduleLength = sizeof(kBackoffScheduleSeconds) / sizeof(int64_t);

}  // namespace

const char* RetryDecisionToString(RetryDecision decision) {
  switch (decision) {
    case RetryDecision::kRequeued:
      return "requeued";
    case RetryDecision::kFailed:
      return "failed";
    case RetryDecision::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

bool IsRetryable(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::kSourceNotAccessible:
    case ErrorCategory::kTransferFailed:
    case ErrorCategory::kEncodeFailed:
    case ErrorCategory::kStuck:
      return true;
    case ErrorCategory::kValidationFailed:
    case ErrorCategory::kWorkerUnavailable:
    case ErrorCategory::kCancelled:
      return false;
  }
  return false;
}

bool CountsAgainstWorker(ErrorCategory category) {
  return category == ErrorCategory::kTransferFailed ||
         category == ErrorCategory::kEncodeFailed || category == ErrorCategory::kStuck;
}

int64_t BackoffSeconds(int retry_count) {
  if (retry_count < 1) retry_count = 1;
  size_t index = static_cast<size_t>(retry_count - 1);
  if (index >= kScheduleLength) index = kScheduleLength - 1;
  return kBackoffScheduleSeconds[index];
}

void RetryPolicy::Persist(const model::Job& job) {
  if (!store_.UpdateJob(job)) {
    util::Logger::Warn("[RetryPolicy] Job " + std::to_string(job.id) + " vanished from the store");
  }
}

RetryOutcome RetryPolicy::HandleFailure(model::Job& job, const FailureReport& failure) {
  RetryOutcome outcome;
  const int64_t now = clock_->NowUtcMs();

  if (job.assigned_worker_id && CountsAgainstWorker(failure.category)) {
    if (!store_.IncrementWorkerFailures(*job.assigned_worker_id)) {
      util::Logger::Warn("[RetryPolicy] Worker " + std::to_string(*job.assigned_worker_id) +
                         " no longer exists");
    }
  }
  if (!failure.diagnostics.empty()) job.diagnostic_log = failure.diagnostics;
  job.failure_reason = failure.reason;

  if (failure.category == ErrorCategory::kCancelled) {
    job.status = JobStatus::kCancelled;
    job.ClearTelemetry();
    job.completed_at_ms = now;
    Persist(job);
    events_.EmitStatusChanged(job.id, job.status);
    events_.EmitCancelled(job.id);
    util::Logger::Info("[RetryPolicy] Job " + std::to_string(job.id) + " cancelled");
    outcome.decision = RetryDecision::kCancelled;
    outcome.retry_count = job.retry_count;
    return outcome;
  }

  if (IsRetryable(failure.category) && job.retry_count < job.max_retries) {
    job.retry_count += 1;
    outcome.backoff_seconds = BackoffSeconds(job.retry_count);
    job.ClearAssignment();
    job.ClearTelemetry();
    job.status = JobStatus::kQueued;
    job.scheduled_after_ms = now + outcome.backoff_seconds * 1000;
    Persist(job);
    events_.EmitStatusChanged(job.id, job.status);
    events_.EmitRetryScheduled(job.id, job.retry_count, outcome.backoff_seconds,
                               failure.category, failure.reason);
    util::Logger::Warn("[RetryPolicy] Job " + std::to_string(job.id) + " " +
                       model::ErrorCategoryToString(failure.category) + " (" + failure.reason +
                       "); retry " + std::to_string(job.retry_count) + "/" +
                       std::to_string(job.max_retries) + " in " +
                       std::to_string(outcome.backoff_seconds) + "s");
    outcome.decision = RetryDecision::kRequeued;
    outcome.retry_count = job.retry_count;
    return outcome;
  }

  job.status = JobStatus::kFailed;
  job.completed_at_ms = now;
  store_.AppendJobLog(model::MakeJobLog(job, JobStatus::kFailed, now, failure.avg_fps));
  job.ClearTelemetry();
  Persist(job);
  events_.EmitStatusChanged(job.id, job.status);
  events_.EmitFailed(job.id, failure.category, failure.reason, failure.diagnostics);
  util::Logger::Error("[RetryPolicy] Job " + std::to_string(job.id) + " failed: " +
                      model::ErrorCategoryToString(failure.category) + " (" + failure.reason +
                      ") after " + std::to_string(job.retry_count) + " retries");
  outcome.decision = RetryDecision::kFailed;
  outcome.retry_count = job.retry_count;
  return outcome;
}

}  // namespace encodefarm::recovery
