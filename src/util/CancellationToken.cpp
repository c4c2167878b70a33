// Repository: Encodefarm
// Component: Cancellation Token
// Copyright (c) 2025 RetroVue

#include "encodefarm/util/CancellationToken.hpp"

namespace encodefarm::util {

const char* CancelReasonToString(CancelReason reason) {
  switch (reason) {
    case CancelReason::kNone:     return "none";
    case CancelReason::kOperator: return "operator";
    case CancelReason::kStuck:    return "stuck";
    case CancelReason::kShutdown: return "shutdown";
  }
  return "unknown";
}

void CancellationToken::Cancel(CancelReason reason) {
  int expected = 0;
  reason_.compare_exchange_strong(expected, static_cast<int>(reason),
                                  std::memory_order_acq_rel);
}

std::shared_ptr<CancellationToken> CancellationRegistry::Register(int64_t job_id) {
  auto token = std::make_shared<CancellationToken>();
  std::lock_guard<std::mutex> lock(mutex_);
  tokens_[job_id] = token;
  return token;
}

std::shared_ptr<CancellationToken> CancellationRegistry::Find(int64_t job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tokens_.find(job_id);
  return it == tokens_.end() ? nullptr : it->second;
}

bool CancellationRegistry::Cancel(int64_t job_id, CancelReason reason) {
  auto token = Find(job_id);
  if (!token) return false;
  token->Cancel(reason);
  return true;
}

void CancellationRegistry::CancelAll(CancelReason reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [id, token] : tokens_) {
    token->Cancel(reason);
  }
}

void CancellationRegistry::Remove(int64_t job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  tokens_.erase(job_id);
}

}  // namespace encodefarm::util
