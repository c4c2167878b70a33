// Repository: Encodefarm
// Component: Farm Scheduler
// Copyright (c) 2025 RetroVue

#include "encodefarm/runtime/FarmScheduler.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <set>

#include "encodefarm/recovery/CrashRecovery.hpp"
#include "encodefarm/util/Logger.hpp"

namespace encodefarm::runtime {

using model::JobStatus;

FarmScheduler::FarmScheduler(store::IRecordStore& store, transfer::ITransportFactory& transports,
                             executor::JobExecutor& executor, HealthMonitor& health,
                             recovery::StuckJobMonitor& stuck,
                             prefetch::PrefetchRegistry& prefetch,
                             util::CancellationRegistry& pipelines,
                             events::JobEventEmitter& events,
                             std::shared_ptr<time::ITimeSource> clock, SchedulerOptions options)
    : store_(store),
      executor_(executor),
      health_(health),
      stuck_(stuck),
      prefetch_(prefetch),
      pipelines_(pipelines),
      events_(events),
      clock_(std::move(clock)),
      options_(options),
      placement_(transports.OriginHasSsh()) {}

FarmScheduler::~FarmScheduler() {
  Stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

void FarmScheduler::Start() {
  if (running_.exchange(true)) return;

  std::vector<int64_t> recovered = recovery::RecoverInterruptedJobs(store_, &events_);
  util::Logger::Info("[FarmScheduler] Starting; " + std::to_string(recovered.size()) +
                     " interrupted job(s) re-queued");

  health_thread_ = std::thread(&FarmScheduler::HealthLoop, this);
  dequeue_thread_ = std::thread(&FarmScheduler::DequeueLoop, this);
  stuck_thread_ = std::thread(&FarmScheduler::StuckLoop, this);
}

void FarmScheduler::Stop() {
  if (!running_.exchange(false)) return;
  util::Logger::Info("[FarmScheduler] Stopping");
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    wait_cv_.notify_all();
  }
  if (dequeue_thread_.joinable()) dequeue_thread_.join();
  if (stuck_thread_.joinable()) stuck_thread_.join();
  if (health_thread_.joinable()) health_thread_.join();

  prefetch_.CancelAll();
  pipelines_.CancelAll(util::CancelReason::kShutdown);
  WaitForPipelines();
  util::Logger::Info("[FarmScheduler] Stopped");
}

bool FarmScheduler::WaitFor(int ms) {
  std::unique_lock<std::mutex> lock(wait_mutex_);
  wait_cv_.wait_for(lock, std::chrono::milliseconds(ms),
                    [this] { return !running_.load(std::memory_order_acquire); });
  return running_.load(std::memory_order_acquire);
}

void FarmScheduler::DequeueLoop() {
  while (running_.load(std::memory_order_acquire)) {
    try {
      DequeueOnce();
      if (options_.prefetch_enabled) TriggerPrefetch();
    } catch (const std::exception& e) {
      util::Logger::Error(std::string("[FarmScheduler] Dequeue pass failed: ") + e.what());
    }
    if (!WaitFor(options_.poll_ms)) break;
  }
}

void FarmScheduler::StuckLoop() {
  while (WaitFor(options_.stuck_sweep_ms)) {
    try {
      stuck_.Sweep();
    } catch (const std::exception& e) {
      util::Logger::Error(std::string("[FarmScheduler] Stuck sweep failed: ") + e.what());
    }
  }
}

void FarmScheduler::HealthLoop() {
  do {
    try {
      health_.CheckAll();
    } catch (const std::exception& e) {
      util::Logger::Error(std::string("[FarmScheduler] Health pass failed: ") + e.what());
    }
  } while (WaitFor(options_.health_ms));
}

// =============================================================================
// Dequeue
// Order: priority desc, created_at asc. Jobs in backoff are filtered by the
// store; in-flight prefetch and workers at capacity are skipped here. A stale assignment (worker gone, disabled or
// offline) is dropped and the job placed again.
// =============================================================================

std::vector<int64_t> FarmScheduler::DequeueOnce() {
  std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);
  ReapFinished();

  std::vector<int64_t> dispatched;
  const int64_t now = clock_->NowUtcMs();
  std::vector<model::Worker> workers = store_.ListWorkers();
  std::map<int64_t, int> active = store_.CountActiveJobsByWorker();

  auto find_worker = [&workers](int64_t id) -> const model::Worker* {
    for (const auto& w : workers) {
      if (w.id == id) return &w;
    }
    return nullptr;
  };

  for (model::Job& job : store_.ListDispatchableJobs(now, options_.dequeue_scan)) {
    if (dispatched.size() >= options_.dequeue_batch) break;
    if (prefetch_.IsPrefetching(job.id)) continue;
    {
      // A pipeline that re-queued its job may still be unwinding.
      std::lock_guard<std::mutex> lock(threads_mutex_);
      if (pipeline_threads_.count(job.id) > 0) continue;
    }

    bool changed = false;
    if (job.assigned_worker_id) {
      const model::Worker* current = find_worker(*job.assigned_worker_id);
      if (current == nullptr || !current->IsEligible()) {
        util::Logger::Info("[FarmScheduler] Job " + std::to_string(job.id) +
                           ": assigned worker unavailable; placing again");
        job.ClearAssignment();
        changed = true;
      }
    }
    if (!job.assigned_worker_id) {
      std::optional<scheduler::Assignment> placed = placement_.Assign(job, workers, active);
      if (!placed) {
        if (changed) PersistJob(job);
        continue;
      }
      scheduler::ApplyAssignment(*placed, &job);
      changed = true;
    }

    const model::Worker* worker = find_worker(*job.assigned_worker_id);
    if (worker == nullptr) continue;
    if (active[worker->id] >= std::max(worker->max_concurrent_jobs, 1)) {
      if (changed) PersistJob(job);
      continue;
    }

    job.status = executor::InitialStatusFor(job);
    PersistJob(job);
    events_.EmitStatusChanged(job.id, job.status);
    active[worker->id] += 1;
    dispatched.push_back(job.id);
    Dispatch(std::move(job), *worker);
  }
  return dispatched;
}

void FarmScheduler::Dispatch(model::Job job, const model::Worker& worker) {
  std::shared_ptr<util::CancellationToken> token = pipelines_.Register(job.id);
  const int64_t job_id = job.id;
  util::Logger::Info("[FarmScheduler] Dispatching job " + std::to_string(job_id) + " to " +
                     worker.name);
  std::lock_guard<std::mutex> lock(threads_mutex_);
  pipeline_threads_[job_id] =
      std::thread(&FarmScheduler::RunPipeline, this, std::move(job), worker, token);
}

void FarmScheduler::RunPipeline(model::Job job, model::Worker worker,
                                std::shared_ptr<util::CancellationToken> token) {
  const int64_t job_id = job.id;
  try {
    executor::ExecutionResult result = executor_.Execute(std::move(job), worker, *token);
    util::Logger::Debug("[FarmScheduler] Job " + std::to_string(job_id) + " pipeline ended: " +
                        model::JobStatusToString(result.final_status));
  } catch (const std::exception& e) {
    util::Logger::Error("[FarmScheduler] Job " + std::to_string(job_id) +
                        " pipeline aborted: " + e.what());
  }
  pipelines_.Remove(job_id);

  std::lock_guard<std::mutex> lock(threads_mutex_);
  finished_.push_back(job_id);
  threads_cv_.notify_all();
}

void FarmScheduler::ReapFinished() {
  std::vector<std::thread> done;
  {
    std::lock_guard<std::mutex> lock(threads_mutex_);
    for (int64_t id : finished_) {
      auto it = pipeline_threads_.find(id);
      if (it == pipeline_threads_.end()) continue;
      done.push_back(std::move(it->second));
      pipeline_threads_.erase(it);
    }
    finished_.clear();
  }
  for (auto& t : done) {
    if (t.joinable()) t.join();
  }
}

void FarmScheduler::WaitForPipelines() {
  {
    std::unique_lock<std::mutex> lock(threads_mutex_);
    threads_cv_.wait(lock, [this] { return finished_.size() >= pipeline_threads_.size(); });
  }
  ReapFinished();
}

size_t FarmScheduler::RunningPipelines() const {
  std::lock_guard<std::mutex> lock(threads_mutex_);
  return pipeline_threads_.size() - std::min(finished_.size(), pipeline_threads_.size());
}

// =============================================================================
// Prefetch
// =============================================================================

void FarmScheduler::TriggerPrefetch() {
  std::set<int64_t> busy;
  for (const auto& job : store_.ListJobsByStatus(JobStatus::kTranscoding)) {
    if (job.assigned_worker_id) busy.insert(*job.assigned_worker_id);
  }
  if (busy.empty()) return;

  std::vector<model::Job> queued = store_.ListQueuedJobs(options_.dequeue_batch * 4);
  for (int64_t worker_id : busy) {
    if (prefetch_.IsWorkerBusy(worker_id)) continue;
    std::optional<model::Worker> worker = store_.GetWorker(worker_id);
    if (!worker || !worker->IsEligible() || worker->is_local) continue;
    std::optional<model::Job> candidate = prefetch::PickPrefetchCandidate(queued, worker_id);
    if (!candidate) continue;
    if (prefetch_.StartFor(*candidate, *worker)) {
      util::Logger::Info("[FarmScheduler] Prefetching job " + std::to_string(candidate->id) +
                         " onto " + worker->name);
    }
  }
}

// =============================================================================
// Operator cancel
// =============================================================================

bool FarmScheduler::CancelJob(int64_t job_id) {
  std::lock_guard<std::mutex> dispatch_lock(dispatch_mutex_);
  prefetch_.CancelJob(job_id);
  if (pipelines_.Cancel(job_id, util::CancelReason::kOperator)) {
    util::Logger::Info("[FarmScheduler] Cancel requested for running job " +
                       std::to_string(job_id));
    return true;
  }

  std::optional<model::Job> job = store_.GetJob(job_id);
  if (!job || model::IsTerminalStatus(job->status)) return false;

  job->status = JobStatus::kCancelled;
  job->ClearTelemetry();
  job->completed_at_ms = clock_->NowUtcMs();
  job->failure_reason = "cancelled by operator";
  PersistJob(*job);
  events_.EmitStatusChanged(job_id, job->status);
  events_.EmitCancelled(job_id);
  util::Logger::Info("[FarmScheduler] Job " + std::to_string(job_id) + " cancelled");
  return true;
}

void FarmScheduler::PersistJob(const model::Job& job) {
  if (!store_.UpdateJob(job)) {
    util::Logger::Warn("[FarmScheduler] Job " + std::to_string(job.id) +
                       " vanished from the store");
  }
}

}  // namespace encodefarm::runtime
