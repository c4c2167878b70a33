// Repository: Encodefarm
// Component: Retry Policy
// Purpose: Routes a failed job either back to the queue with an escalating
//          backoff or into a terminal state.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_RECOVERY_RETRY_POLICY_HPP_
#define ENCODEFARM_RECOVERY_RETRY_POLICY_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "encodefarm/events/JobEventEmitter.hpp"
#include "encodefarm/model/JobTypes.hpp"
#include "encodefarm/store/IRecordStore.hpp"
#include "encodefarm/time/ITimeSource.hpp"

namespace encodefarm::recovery {

struct FailureReport {
  model::ErrorCategory category = model::ErrorCategory::kEncodeFailed;
  std::string reason;
  // Clipped diagnostic tail.
  std::string diagnostics;
  std::optional<double> avg_fps;
};

enum class RetryDecision {
  kRequeued,
  kFailed,     // terminal: retries exhausted or non-retryable category
  kCancelled,  // terminal: operator cancel
};

const char* RetryDecisionToString(RetryDecision decision);

struct RetryOutcome {
  RetryDecision decision = RetryDecision::kFailed;
  int retry_count = 0;
  int64_t backoff_seconds = 0;
};

bool IsRetryable(model::ErrorCategory category);

// Failures that count against the worker's consecutive_failures.
bool CountsAgainstWorker(model::ErrorCategory category);

// Backoff after the retry_count-th retry (1-based): 60, 300, 900 seconds,
// repeating the last value.
int64_t BackoffSeconds(int retry_count);

class RetryPolicy {
 public:
  RetryPolicy(store::IRecordStore& store, events::JobEventEmitter& events,
              std::shared_ptr<time::ITimeSource> clock)
      : store_(store), events_(events), clock_(std::move(clock)) {}

  // Mutates job, persists it and emits the matching events. A JobLog row is
  // written on the terminal failed transition.
  RetryOutcome HandleFailure(model::Job& job, const FailureReport& failure);

 private:
  void Persist(const model::Job& job);

  store::IRecordStore& store_;
  events::JobEventEmitter& events_;
  std::shared_ptr<time::ITimeSource> clock_;
};

}  // namespace encodefarm::recovery

#endif  // ENCODEFARM_RECOVERY_RETRY_POLICY_HPP_
