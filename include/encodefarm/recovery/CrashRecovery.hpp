// Repository: Encodefarm
// Component: Crash Recovery
// Purpose: Startup pass that re-queues jobs left mid-flight by a previous
//          scheduler process.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_RECOVERY_CRASH_RECOVERY_HPP_
#define ENCODEFARM_RECOVERY_CRASH_RECOVERY_HPP_

#include <cstdint>
#include <vector>

#include "encodefarm/events/JobEventEmitter.hpp"
#include "encodefarm/store/IRecordStore.hpp"

namespace encodefarm::recovery {

// Every job in transferring, transcoding, verifying or replacing goes back
// to queued with no telemetry, no prestaged source and no worker. Returns
// the ids of the re-queued jobs. events may be null.
std::vector<int64_t> RecoverInterruptedJobs(store::IRecordStore& store,
                                            events::JobEventEmitter* events);

}  // namespace encodefarm::recovery

#endif  // ENCODEFARM_RECOVERY_CRASH_RECOVERY_HPP_
