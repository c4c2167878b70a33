// Repository: Encodefarm
// Component: Health Monitor
// Purpose: Periodic worker reachability checks, online/offline transitions,
//          auto-disable after repeated failures, and the metrics snapshot
//          the scheduler reads.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_RUNTIME_HEALTH_MONITOR_HPP_
#define ENCODEFARM_RUNTIME_HEALTH_MONITOR_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "encodefarm/events/JobEventEmitter.hpp"
#include "encodefarm/model/JobTypes.hpp"
#include "encodefarm/store/IRecordStore.hpp"
#include "encodefarm/time/ITimeSource.hpp"
#include "encodefarm/transfer/ITransport.hpp"

namespace encodefarm::runtime {

struct WorkerMetrics {
  int64_t worker_id = 0;
  model::WorkerStatus status = model::WorkerStatus::kOffline;
  int64_t checked_at_ms = 0;
  // Host load figures; unset when the host did not report them.
  std::optional<double> load_1m;
  std::optional<double> ram_used_gb;
  std::optional<double> ram_total_gb;
  std::optional<double> gpu_percent;
  std::optional<double> gpu_temp_c;
};

// Written by the health loop, read by everyone else.
class WorkerMetricsTable {
 public:
  void Update(const WorkerMetrics& metrics);
  void Remove(int64_t worker_id);
  std::optional<WorkerMetrics> Get(int64_t worker_id) const;
  std::map<int64_t, WorkerMetrics> Snapshot() const;

 private:
  mutable std::mutex mutex_;
  std::map<int64_t, WorkerMetrics> rows_;
};

class HealthMonitor {
 public:
  static constexpr int kDefaultAutoDisableFailures = 5;

  HealthMonitor(store::IRecordStore& store, transfer::ITransportFactory& transports,
                events::JobEventEmitter& events, std::shared_ptr<time::ITimeSource> clock,
                int auto_disable_failures = kDefaultAutoDisableFailures);

  // One pass over every enabled worker.
  void CheckAll();

  // Probes one worker and persists the result. Returns the updated record.
  model::Worker Check(model::Worker worker);

  const WorkerMetricsTable& metrics() const { return metrics_; }

 private:
  void HandleFailure(model::Worker& worker, const std::string& detail);
  WorkerMetrics Collect(transfer::ITransport& transport, const model::Worker& worker);
  void Persist(const model::Worker& worker);

  store::IRecordStore& store_;
  transfer::ITransportFactory& transports_;
  events::JobEventEmitter& events_;
  std::shared_ptr<time::ITimeSource> clock_;
  int auto_disable_failures_;
  WorkerMetricsTable metrics_;
};

// "0.52 0.58 0.59 1/123 4567" -> 0.52
std::optional<double> ParseLoadAverage(const std::string& text);

// "12.5 3.0" (used GiB, total GiB) from the free/awk probe.
bool ParseMemory(const std::string& text, double* used_gb, double* total_gb);

// "37, 61" from nvidia-smi csv,noheader,nounits.
bool ParseGpu(const std::string& text, double* percent, double* temp_c);

}  // namespace encodefarm::runtime

#endif  // ENCODEFARM_RUNTIME_HEALTH_MONITOR_HPP_
