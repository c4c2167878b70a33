// Repository: Encodefarm
// Component: Health Monitor
// Copyright (c) 2025 RetroVue

#include "encodefarm/runtime/HealthMonitor.hpp"

#include <cstdio>

#include "encodefarm/util/Logger.hpp"

namespace encodefarm::runtime {

using model::WorkerStatus;

namespace {

constexpr const char* kLoadCommand = "cat /proc/loadavg";
constexpr const char* kMemoryCommand =
    "free -b | awk '/^Mem:/{printf \"%.2f %.2f\", $3/1073741824, $2/1073741824}'";
constexpr const char* kGpuCommand =
    "nvidia-smi --query-gpu=utilization.gpu,temperature.gpu "
    "--format=csv,noheader,nounits 2>/dev/null";

}  // namespace

// =============================================================================
// Parsers
// =============================================================================

std::optional<double> ParseLoadAverage(const std::string& text) {
  double load = 0.0;
  if (std::sscanf(text.c_str(), "%lf", &load) != 1) return std::nullopt;
  return load;
}

bool ParseMemory(const std::string& text, double* used_gb, double* total_gb) {
  return std::sscanf(text.c_str(), "%lf %lf", used_gb, total_gb) == 2;
}

bool ParseGpu(const std::string& text, double* percent, double* temp_c) {
  return std::sscanf(text.c_str(), "%lf , %lf", percent, temp_c) == 2;
}

// =============================================================================
// WorkerMetricsTable
// =============================================================================

void WorkerMetricsTable::Update(const WorkerMetrics& metrics) {
  std::lock_guard<std::mutex> lock(mutex_);
  rows_[metrics.worker_id] = metrics;
}

void WorkerMetricsTable::Remove(int64_t worker_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  rows_.erase(worker_id);
}

std::optional<WorkerMetrics> WorkerMetricsTable::Get(int64_t worker_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rows_.find(worker_id);
  if (it == rows_.end()) return std::nullopt;
  return it->second;
}

std::map<int64_t, WorkerMetrics> WorkerMetricsTable::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rows_;
}

// =============================================================================
// HealthMonitor
// =============================================================================

HealthMonitor::HealthMonitor(store::IRecordStore& store, transfer::ITransportFactory& transports,
                             events::JobEventEmitter& events,
                             std::shared_ptr<time::ITimeSource> clock, int auto_disable_failures)
    : store_(store),
      transports_(transports),
      events_(events),
      clock_(std::move(clock)),
      auto_disable_failures_(auto_disable_failures) {}

void HealthMonitor::CheckAll() {
  for (auto& worker : store_.ListWorkers()) {
    if (!worker.is_enabled) {
      metrics_.Remove(worker.id);
      continue;
    }
    Check(std::move(worker));
  }
}

model::Worker HealthMonitor::Check(model::Worker worker) {
  const WorkerStatus before = worker.status;
  std::unique_ptr<transfer::ITransport> transport = transports_.ForWorker(worker);

  // The controller host is always reachable from itself.
  const bool reachable = worker.is_local || (transport && transport->TestConnection());
  if (!reachable) {
    HandleFailure(worker, transport ? "connection test failed" : "no transport");
    return worker;
  }

  worker.status = WorkerStatus::kOnline;
  worker.last_heartbeat_ms = clock_->NowUtcMs();
  worker.consecutive_failures = 0;
  Persist(worker);

  if (transport) {
    metrics_.Update(Collect(*transport, worker));
  } else {
    WorkerMetrics bare;
    bare.worker_id = worker.id;
    bare.status = worker.status;
    bare.checked_at_ms = *worker.last_heartbeat_ms;
    metrics_.Update(bare);
  }

  if (before != WorkerStatus::kOnline) {
    util::Logger::Info("[HealthMonitor] Worker " + worker.name + " online");
    events_.EmitServerStatus(worker.id, worker.status, "reachable");
  }
  return worker;
}

void HealthMonitor::HandleFailure(model::Worker& worker, const std::string& detail) {
  if (worker.status != WorkerStatus::kOffline) {
    worker.status = WorkerStatus::kOffline;
    util::Logger::Warn("[HealthMonitor] Worker " + worker.name + " offline: " + detail);
    events_.EmitServerStatus(worker.id, worker.status, detail);
  }
  worker.consecutive_failures += 1;
  metrics_.Remove(worker.id);

  if (worker.consecutive_failures >= auto_disable_failures_ && worker.is_enabled) {
    worker.is_enabled = false;
    util::Logger::Warn("[HealthMonitor] Worker " + worker.name + " auto-disabled after " +
                       std::to_string(worker.consecutive_failures) + " consecutive failures");
    events_.EmitServerAutoDisabled(worker.id, worker.consecutive_failures);
  }
  Persist(worker);
}

WorkerMetrics HealthMonitor::Collect(transfer::ITransport& transport,
                                     const model::Worker& worker) {
  WorkerMetrics m;
  m.worker_id = worker.id;
  m.status = worker.status;
  m.checked_at_ms = worker.last_heartbeat_ms.value_or(clock_->NowUtcMs());

  transfer::CommandResult load = transport.RunCommand(kLoadCommand);
  if (load.ok()) m.load_1m = ParseLoadAverage(load.stdout_text);

  transfer::CommandResult memory = transport.RunCommand(kMemoryCommand);
  double used = 0.0;
  double total = 0.0;
  if (memory.ok() && ParseMemory(memory.stdout_text, &used, &total)) {
    m.ram_used_gb = used;
    m.ram_total_gb = total;
  }

  if (worker.HasCapability(model::EncoderFamily::kNvenc)) {
    transfer::CommandResult gpu = transport.RunCommand(kGpuCommand);
    double percent = 0.0;
    double temp = 0.0;
    if (gpu.ok() && ParseGpu(gpu.stdout_text, &percent, &temp)) {
      m.gpu_percent = percent;
      m.gpu_temp_c = temp;
    }
  }
  return m;
}

void HealthMonitor::Persist(const model::Worker& worker) {
  if (!store_.UpdateWorker(worker)) {
    util::Logger::Warn("[HealthMonitor] Worker " + std::to_string(worker.id) +
                       " vanished from the store");
  }
}

}  // namespace encodefarm::runtime
