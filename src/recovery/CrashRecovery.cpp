// Repository: Encodefarm
// Component: Crash Recovery
// Copyright (c) 2025 RetroVue

#include "encodefarm/recovery/CrashRecovery.hpp"

#include "encodefarm/util/Logger.hpp"

namespace encodefarm::recovery {

using model::JobStatus;

std::vector<int64_t> RecoverInterruptedJobs(store::IRecordStore& store,
                                            events::JobEventEmitter* events) {
  static constexpr JobStatus kInterrupted[] = {
      JobStatus::kTransferring,
      JobStatus::kTranscoding,
      JobStatus::kVerifying,
      JobStatus::kReplacing,
  };

  std::vector<int64_t> requeued;
  for (JobStatus status : kInterrupted) {
    for (auto& job : store.ListJobsByStatus(status)) {
      job.status = JobStatus::kQueued;
      job.ClearTelemetry();
      job.ClearAssignment();
      if (!store.UpdateJob(job)) continue;
      requeued.push_back(job.id);
      util::Logger::Info("[CrashRecovery] Job " + std::to_string(job.id) + " was " +
                         model::JobStatusToString(status) + "; re-queued");
      if (events != nullptr) events->EmitStatusChanged(job.id, job.status);
    }
  }
  if (!requeued.empty()) {
    util::Logger::Warn("[CrashRecovery] Re-queued " + std::to_string(requeued.size()) +
                       " interrupted job(s)");
  }
  return requeued;
}

}  // namespace encodefarm::recovery
