// Repository: Encodefarm
// Component: Cancellation Token
// Purpose: Explicit cancellation handle passed into every suspendable call
//          (transfers, encoder runs, prefetch), plus the per-job registry
//          the scheduler and the stuck sweep use to reach a live pipeline.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_UTIL_CANCELLATION_TOKEN_HPP_
#define ENCODEFARM_UTIL_CANCELLATION_TOKEN_HPP_

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>

namespace encodefarm::util {

enum class CancelReason : int {
  kNone = 0,
  kOperator = 1,  // Operator cancelled the job
  kStuck = 2,     // Stuck sweep gave up on the job
  kShutdown = 3,  // Scheduler stopping; job is re-queued on next start
};

const char* CancelReasonToString(CancelReason reason);

class CancellationToken {
 public:
  // First reason wins; later calls are ignored.
  void Cancel(CancelReason reason);
  bool IsCancelled() const { return reason_.load(std::memory_order_acquire) != 0; }
  CancelReason Reason() const {
    return static_cast<CancelReason>(reason_.load(std::memory_order_acquire));
  }

 private:
  std::atomic<int> reason_{0};
};

// True when token is non-null and cancelled.
inline bool IsCancelled(const CancellationToken* token) {
  return token != nullptr && token->IsCancelled();
}

class CancellationRegistry {
 public:
  // Replaces any token previously registered for job_id.
  std::shared_ptr<CancellationToken> Register(int64_t job_id);
  std::shared_ptr<CancellationToken> Find(int64_t job_id) const;
  // False when no pipeline is registered for job_id.
  bool Cancel(int64_t job_id, CancelReason reason);
  void CancelAll(CancelReason reason);
  void Remove(int64_t job_id);

 private:
  mutable std::mutex mutex_;
  std::map<int64_t, std::shared_ptr<CancellationToken>> tokens_;
};

}  // namespace encodefarm::util

#endif  // ENCODEFARM_UTIL_CANCELLATION_TOKEN_HPP_
