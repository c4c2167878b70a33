// Repository: Encodefarm
// Component: Prefetcher
// Copyright (c) 2025 RetroVue

#include "encodefarm/prefetch/Prefetcher.hpp"

#include <exception>

#include "encodefarm/executor/JobExecutor.hpp"
#include "encodefarm/transfer/LocalTransport.hpp"
#include "encodefarm/transfer/Relay.hpp"
#include "encodefarm/util/Logger.hpp"

namespace encodefarm::prefetch {

const char* PrefetchStateToString(PrefetchState state) {
  switch (state) {
    case PrefetchState::kIdle:
      return "idle";
    case PrefetchState::kRunning:
      return "running";
    case PrefetchState::kStaged:
      return "staged";
    case PrefetchState::kFailed:
      return "failed";
    case PrefetchState::kCancelled:
      return "cancelled";
  }
  return "unknown";
}

std::optional<model::Job> PickPrefetchCandidate(const std::vector<model::Job>& queued_jobs,
                                                int64_t worker_id) {
  for (const auto& job : queued_jobs) {
    if (job.status != model::JobStatus::kQueued) continue;
    if (job.assigned_worker_id != worker_id) continue;
    if (job.transfer_mode != model::TransferMode::kSshTransfer) continue;
    if (job.source_prestaged) continue;
    return job;
  }
  return std::nullopt;
}

// =============================================================================
// Prefetcher
// =============================================================================

Prefetcher::Prefetcher(store::IRecordStore& store, transfer::ITransportFactory& transports,
                       events::JobEventEmitter& events,
                       transfer::TransferEngine::Options transfer_options)
    : store_(store),
      transports_(transports),
      events_(events),
      transfer_options_(transfer_options) {}

Prefetcher::~Prefetcher() {
  Cancel();
}

void Prefetcher::JoinThread() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void Prefetcher::Start(const model::Job& job, const model::Worker& worker) {
  Cancel();

  auto token = std::make_shared<util::CancellationToken>();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_ = token;
    state_ = PrefetchState::kRunning;
    job_id_ = job.id;
  }
  thread_ = std::thread(&Prefetcher::Worker, this, job, worker, token);
}

bool Prefetcher::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == PrefetchState::kRunning;
}

PrefetchState Prefetcher::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::optional<int64_t> Prefetcher::job_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return job_id_;
}

void Prefetcher::Cancel() {
  std::shared_ptr<util::CancellationToken> token;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    token = cancel_;
  }
  if (token) token->Cancel(util::CancelReason::kOperator);
  JoinThread();
}

void Prefetcher::Reap() {
  if (IsRunning()) return;
  JoinThread();
}

void Prefetcher::SetDelayHook(DelayHookFn hook) {
  delay_hook_ = std::move(hook);
}

void Prefetcher::Finish(PrefetchState state) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_ = state;
}

// =============================================================================
// Worker: runs on the background thread
// Uploads a controller-visible source, otherwise relays it from the origin.
// Anything short of a recorded prestage removes the remote file.
// =============================================================================

void Prefetcher::Worker(model::Job job, model::Worker worker,
                        std::shared_ptr<util::CancellationToken> cancel) {
  const std::string tag = "[Prefetcher] Job " + std::to_string(job.id) + " -> " + worker.name;
  if (delay_hook_) delay_hook_(*cancel);
  if (cancel->IsCancelled()) {
    Finish(PrefetchState::kCancelled);
    return;
  }

  std::unique_ptr<transfer::ITransport> transport = transports_.ForWorker(worker);
  if (!transport) {
    util::Logger::Warn(tag + ": no transport");
    Finish(PrefetchState::kFailed);
    return;
  }
  const std::string remote = executor::RemoteStagingPath(worker, job);

  try {
    if (!transport->MakeDirectory(worker.working_directory)) {
      util::Logger::Warn(tag + ": cannot create " + worker.working_directory);
      Finish(PrefetchState::kFailed);
      return;
    }

    transfer::TransferResult result;
    transfer::LocalTransport local;
    std::optional<int64_t> local_size = local.FileSize(job.source_path);
    if (local_size) {
      transfer::TransferEngine engine(transfer_options_);
      transfer::TransferRequest request;
      request.direction = transfer::TransferDirection::kUpload;
      request.local_path = job.source_path;
      request.remote_path = remote;
      request.size_hint = *local_size;
      request.transport = transport.get();
      request.connect = [this, worker] { return transports_.ForWorker(worker); };
      request.cancel = cancel.get();
      result = engine.Transfer(request);
    } else if (transports_.OriginHasSsh()) {
      std::unique_ptr<transfer::ITransport> origin = transports_.ForOrigin();
      if (!origin) {
        util::Logger::Warn(tag + ": origin connection unavailable");
        Finish(PrefetchState::kFailed);
        return;
      }
      result = transfer::RelayFile(*origin, job.source_path, *transport, remote, job.source_size,
                                   nullptr, cancel.get());
    } else {
      util::Logger::Warn(tag + ": source not reachable from the controller");
      Finish(PrefetchState::kFailed);
      return;
    }

    if (!result.ok || cancel->IsCancelled()) {
      if (!transport->RemoveFile(remote)) {
        util::Logger::Warn(tag + ": could not remove partial " + remote);
      }
      if (result.cancelled || cancel->IsCancelled()) {
        util::Logger::Info(tag + ": cancelled");
        Finish(PrefetchState::kCancelled);
      } else {
        util::Logger::Warn(tag + ": " + result.error);
        Finish(PrefetchState::kFailed);
      }
      return;
    }

    if (!store_.MarkSourcePrestaged(job.id, worker.id, remote)) {
      util::Logger::Info(tag + ": job left the queue; discarding staged copy");
      if (!transport->RemoveFile(remote)) {
        util::Logger::Warn(tag + ": could not remove " + remote);
      }
      Finish(PrefetchState::kCancelled);
      return;
    }
  } catch (const std::exception& e) {
    util::Logger::Error(tag + ": " + e.what());
    Finish(PrefetchState::kFailed);
    return;
  }

  events_.EmitPrestaged(job.id, worker.id, remote);
  util::Logger::Info(tag + ": staged " + remote);
  Finish(PrefetchState::kStaged);
}

// =============================================================================
// PrefetchRegistry
// =============================================================================

PrefetchRegistry::PrefetchRegistry(store::IRecordStore& store,
                                   transfer::ITransportFactory& transports,
                                   events::JobEventEmitter& events,
                                   transfer::TransferEngine::Options transfer_options)
    : store_(store),
      transports_(transports),
      events_(events),
      transfer_options_(transfer_options) {}

PrefetchRegistry::~PrefetchRegistry() {
  CancelAll();
}

Prefetcher& PrefetchRegistry::ForWorker(int64_t worker_id) {
  auto it = by_worker_.find(worker_id);
  if (it == by_worker_.end()) {
    auto prefetcher =
        std::make_unique<Prefetcher>(store_, transports_, events_, transfer_options_);
    if (delay_hook_) prefetcher->SetDelayHook(delay_hook_);
    it = by_worker_.emplace(worker_id, std::move(prefetcher)).first;
  }
  return *it->second;
}

bool PrefetchRegistry::StartFor(const model::Job& job, const model::Worker& worker) {
  std::lock_guard<std::mutex> lock(mutex_);
  Prefetcher& prefetcher = ForWorker(worker.id);
  if (prefetcher.IsRunning()) return false;
  prefetcher.Reap();
  prefetcher.Start(job, worker);
  return true;
}

bool PrefetchRegistry::IsWorkerBusy(int64_t worker_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_worker_.find(worker_id);
  return it != by_worker_.end() && it->second->IsRunning();
}

bool PrefetchRegistry::IsPrefetching(int64_t job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : by_worker_) {
    if (entry.second->IsRunning() && entry.second->job_id() == job_id) return true;
  }
  return false;
}

bool PrefetchRegistry::CancelJob(int64_t job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& entry : by_worker_) {
    if (entry.second->IsRunning() && entry.second->job_id() == job_id) {
      entry.second->Cancel();
      return true;
    }
  }
  return false;
}

void PrefetchRegistry::CancelAll() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& entry : by_worker_) entry.second->Cancel();
}

void PrefetchRegistry::SetDelayHook(Prefetcher::DelayHookFn hook) {
  std::lock_guard<std::mutex> lock(mutex_);
  delay_hook_ = std::move(hook);
}

}  // namespace encodefarm::prefetch
