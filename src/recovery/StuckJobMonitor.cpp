// Repository: Encodefarm
// Component: Stuck Job Monitor
// Copyright (c) 2025 RetroVue

#include "encodefarm/recovery/StuckJobMonitor.hpp"

#include "encodefarm/util/Logger.hpp"

namespace encodefarm::recovery {

StuckJobMonitor::StuckJobMonitor(store::IRecordStore& store,
                                 util::CancellationRegistry& pipelines, RetryPolicy& retry,
                                 events::JobEventEmitter& events,
                                 std::shared_ptr<time::ITimeSource> clock, int64_t timeout_ms)
    : store_(store),
      pipelines_(pipelines),
      retry_(retry),
      events_(events),
      clock_(std::move(clock)),
      timeout_ms_(timeout_ms) {}

std::vector<int64_t> StuckJobMonitor::Sweep() {
  std::vector<int64_t> flagged;
  const int64_t now = clock_->NowUtcMs();

  for (auto& job : store_.ListJobsByStatus(model::JobStatus::kTranscoding)) {
    const int64_t age_ms = now - job.updated_at_ms;
    if (age_ms <= timeout_ms_) continue;

    const int64_t minutes = age_ms / 60000;
    flagged.push_back(job.id);
    events_.EmitStuck(job.id, minutes);

    if (pipelines_.Cancel(job.id, util::CancelReason::kStuck)) {
      util::Logger::Warn("[StuckJobMonitor] Job " + std::to_string(job.id) +
                         " has not reported for " + std::to_string(minutes) +
                         " min; stopping its encoder");
      continue;
    }

    util::Logger::Warn("[StuckJobMonitor] Job " + std::to_string(job.id) +
                       " has not reported for " + std::to_string(minutes) +
                       " min and has no live pipeline");
    FailureReport failure;
    failure.category = model::ErrorCategory::kStuck;
    failure.reason = "no progress for " + std::to_string(minutes) + " minutes";
    retry_.HandleFailure(job, failure);
  }
  return flagged;
}

}  // namespace encodefarm::recovery
