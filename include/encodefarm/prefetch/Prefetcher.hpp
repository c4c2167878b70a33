// Repository: Encodefarm
// Component: Prefetcher
// Purpose: Background staging of the next ssh_transfer source onto a worker
//          while that worker is busy encoding, so the job's pipeline can skip
//          its upload leg.
// Copyright (c) 2025 RetroVue
//
// One Prefetcher stages one job at a time on its own transport connection.
// PrefetchRegistry holds at most one Prefetcher per worker.

#ifndef ENCODEFARM_PREFETCH_PREFETCHER_HPP_
#define ENCODEFARM_PREFETCH_PREFETCHER_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "encodefarm/events/JobEventEmitter.hpp"
#include "encodefarm/model/JobTypes.hpp"
#include "encodefarm/store/IRecordStore.hpp"
#include "encodefarm/transfer/ITransport.hpp"
#include "encodefarm/transfer/TransferEngine.hpp"
#include "encodefarm/util/CancellationToken.hpp"

namespace encodefarm::prefetch {

enum class PrefetchState {
  kIdle,
  kRunning,
  kStaged,     // source on the worker and recorded on the job
  kFailed,
  kCancelled,  // partial file removed
};

const char* PrefetchStateToString(PrefetchState state);

// Next queued ssh_transfer job on worker_id that is not yet staged.
// queued_jobs must already be in dequeue order.
std::optional<model::Job> PickPrefetchCandidate(const std::vector<model::Job>& queued_jobs,
                                                int64_t worker_id);

class Prefetcher {
 public:
  // Test hook: runs on the prefetch thread before the copy starts.
  using DelayHookFn = std::function<void(const util::CancellationToken&)>;

  Prefetcher(store::IRecordStore& store, transfer::ITransportFactory& transports,
             events::JobEventEmitter& events,
             transfer::TransferEngine::Options transfer_options = {});
  ~Prefetcher();

  Prefetcher(const Prefetcher&) = delete;
  Prefetcher& operator=(const Prefetcher&) = delete;

  // Stages job's source onto worker on a background thread. Cancels any
  // in-progress prefetch first.
  void Start(const model::Job& job, const model::Worker& worker);

  bool IsRunning() const;
  PrefetchState state() const;
  // Job currently (or last) being staged.
  std::optional<int64_t> job_id() const;

  // Cancels the copy, removes the partial file and joins the thread.
  // Idempotent.
  void Cancel();

  // Joins a finished thread; no-op while running.
  void Reap();

  void SetDelayHook(DelayHookFn hook);

 private:
  void Worker(model::Job job, model::Worker worker,
              std::shared_ptr<util::CancellationToken> cancel);
  void Finish(PrefetchState state);
  void JoinThread();

  store::IRecordStore& store_;
  transfer::ITransportFactory& transports_;
  events::JobEventEmitter& events_;
  transfer::TransferEngine::Options transfer_options_;

  std::thread thread_;
  mutable std::mutex mutex_;
  std::shared_ptr<util::CancellationToken> cancel_;
  PrefetchState state_ = PrefetchState::kIdle;  // Guarded by mutex_
  std::optional<int64_t> job_id_;               // Guarded by mutex_

  DelayHookFn delay_hook_;  // Test-only
};

class PrefetchRegistry {
 public:
  PrefetchRegistry(store::IRecordStore& store, transfer::ITransportFactory& transports,
                   events::JobEventEmitter& events,
                   transfer::TransferEngine::Options transfer_options = {});
  ~PrefetchRegistry();

  // Starts staging job on worker. False when the worker already has a
  // prefetch running.
  bool StartFor(const model::Job& job, const model::Worker& worker);

  bool IsWorkerBusy(int64_t worker_id) const;
  bool IsPrefetching(int64_t job_id) const;

  // Cancels whichever prefetch is staging job_id. False when none is.
  bool CancelJob(int64_t job_id);
  void CancelAll();

  // Test hook applied to every Prefetcher created after the call.
  void SetDelayHook(Prefetcher::DelayHookFn hook);

 private:
  Prefetcher& ForWorker(int64_t worker_id);

  store::IRecordStore& store_;
  transfer::ITransportFactory& transports_;
  events::JobEventEmitter& events_;
  transfer::TransferEngine::Options transfer_options_;

  mutable std::mutex mutex_;
  std::map<int64_t, std::unique_ptr<Prefetcher>> by_worker_;
  Prefetcher::DelayHookFn delay_hook_;
};

}  // namespace encodefarm::prefetch

#endif  // ENCODEFARM_PREFETCH_PREFETCHER_HPP_
