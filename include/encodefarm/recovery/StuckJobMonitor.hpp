// Repository: Encodefarm
// Component: Stuck Job Monitor
// Purpose: Periodic sweep that treats a transcoding job with stale
//          telemetry as failed.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_RECOVERY_STUCK_JOB_MONITOR_HPP_
#define ENCODEFARM_RECOVERY_STUCK_JOB_MONITOR_HPP_

#include <cstdint>
#include <memory>
#include <vector>

#include "encodefarm/events/JobEventEmitter.hpp"
#include "encodefarm/recovery/RetryPolicy.hpp"
#include "encodefarm/store/IRecordStore.hpp"
#include "encodefarm/time/ITimeSource.hpp"
#include "encodefarm/util/CancellationToken.hpp"

namespace encodefarm::recovery {

class StuckJobMonitor {
 public:
  StuckJobMonitor(store::IRecordStore& store, util::CancellationRegistry& pipelines,
                  RetryPolicy& retry, events::JobEventEmitter& events,
                  std::shared_ptr<time::ITimeSource> clock, int64_t timeout_ms);

  // Flags every transcoding job whose updated_at is older than the timeout.
  // A live pipeline is cancelled with reason kStuck and reports the failure
  // itself; a job with no pipeline goes straight through the retry policy.
  // Returns the flagged job ids.
  std::vector<int64_t> Sweep();

  int64_t timeout_ms() const { return timeout_ms_; }

 private:
  store::IRecordStore& store_;
  util::CancellationRegistry& pipelines_;
  RetryPolicy& retry_;
  events::JobEventEmitter& events_;
  std::shared_ptr<time::ITimeSource> clock_;
  int64_t timeout_ms_;
};

}  // namespace encodefarm::recovery

#endif  // ENCODEFARM_RECOVERY_STUCK_JOB_MONITOR_HPP_
