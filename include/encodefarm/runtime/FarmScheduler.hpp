// Repository: Encodefarm
// Component: Farm Scheduler
// Purpose: Owns the scheduler's background threads: the dequeue loop that
//          assigns and dispatches queued jobs, the stuck sweep, the worker
//          health loop, one pipeline thread per running job, and prefetch
//          triggering.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_RUNTIME_FARM_SCHEDULER_HPP_
#define ENCODEFARM_RUNTIME_FARM_SCHEDULER_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "encodefarm/events/JobEventEmitter.hpp"
#include "encodefarm/executor/JobExecutor.hpp"
#include "encodefarm/prefetch/Prefetcher.hpp"
#include "encodefarm/recovery/StuckJobMonitor.hpp"
#include "encodefarm/runtime/HealthMonitor.hpp"
#include "encodefarm/scheduler/WorkerScheduler.hpp"
#include "encodefarm/store/IRecordStore.hpp"
#include "encodefarm/time/ITimeSource.hpp"
#include "encodefarm/util/CancellationToken.hpp"

namespace encodefarm::runtime {

struct SchedulerOptions {
  int poll_ms = 2000;
  // Most jobs dispatched per tick.
  size_t dequeue_batch = 10;
  // Most ready queued jobs examined per tick. Jobs held for a busy worker
  // stay in this window without blocking the ones behind them.
  size_t dequeue_scan = 500;
  int stuck_sweep_ms = 60 * 1000;
  int health_ms = 30 * 1000;
  bool prefetch_enabled = true;
};

class FarmScheduler {
 public:
  FarmScheduler(store::IRecordStore& store, transfer::ITransportFactory& transports,
                executor::JobExecutor& executor, HealthMonitor& health,
                recovery::StuckJobMonitor& stuck, prefetch::PrefetchRegistry& prefetch,
                util::CancellationRegistry& pipelines, events::JobEventEmitter& events,
                std::shared_ptr<time::ITimeSource> clock,
                SchedulerOptions options = SchedulerOptions());
  ~FarmScheduler();

  FarmScheduler(const FarmScheduler&) = delete;
  FarmScheduler& operator=(const FarmScheduler&) = delete;

  // Resets jobs interrupted by a previous run, then starts the loops.
  void Start();

  // Cancels running pipelines with reason kShutdown (their jobs return to
  // the queue), cancels prefetches and joins every thread. Idempotent.
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  // One dequeue pass. Returns the ids of the jobs dispatched.
  std::vector<int64_t> DequeueOnce();

  // Starts a prefetch on every worker that is transcoding and idle on the
  // prefetch side.
  void TriggerPrefetch();

  // Operator cancel. A queued job is cancelled in place, a running one
  // through its token. False when the job is unknown or already terminal.
  bool CancelJob(int64_t job_id);

  // Blocks until no pipeline thread is running.
  void WaitForPipelines();
  size_t RunningPipelines() const;

 private:
  void DequeueLoop();
  void StuckLoop();
  void HealthLoop();
  // Sleeps for ms or until Stop(); false when stopping.
  bool WaitFor(int ms);

  void Dispatch(model::Job job, const model::Worker& worker);
  void RunPipeline(model::Job job, model::Worker worker,
                   std::shared_ptr<util::CancellationToken> token);
  void ReapFinished();
  void PersistJob(const model::Job& job);

  store::IRecordStore& store_;
  executor::JobExecutor& executor_;
  HealthMonitor& health_;
  recovery::StuckJobMonitor& stuck_;
  prefetch::PrefetchRegistry& prefetch_;
  util::CancellationRegistry& pipelines_;
  events::JobEventEmitter& events_;
  std::shared_ptr<time::ITimeSource> clock_;
  SchedulerOptions options_;
  scheduler::WorkerScheduler placement_;

  std::atomic<bool> running_{false};
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  std::thread dequeue_thread_;
  std::thread stuck_thread_;
  std::thread health_thread_;

  // Serializes dispatch against operator cancels.
  std::mutex dispatch_mutex_;

  mutable std::mutex threads_mutex_;
  std::condition_variable threads_cv_;
  std::map<int64_t, std::thread> pipeline_threads_;  // Guarded by threads_mutex_
  std::vector<int64_t> finished_;                     // Guarded by threads_mutex_
};

}  // namespace encodefarm::runtime

#endif  // ENCODEFARM_RUNTIME_FARM_SCHEDULER_HPP_
