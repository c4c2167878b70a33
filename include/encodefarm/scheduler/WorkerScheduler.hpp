// Repository: Encodefarm
// Component: Worker Scheduler
// Purpose: Composite scoring of eligible workers with a capacity gate.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_SCHEDULER_WORKER_SCHEDULER_HPP_
#define ENCODEFARM_SCHEDULER_WORKER_SCHEDULER_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "encodefarm/model/JobTypes.hpp"
#include "encodefarm/scheduler/ModeResolver.hpp"

namespace encodefarm::scheduler {

// Weights of the composite score. Lower score is better.
constexpr double kTransferWeight = 0.35;
constexpr double kPerformanceWeight = 0.30;
constexpr double kLoadWeight = 0.35;
constexpr double kDefaultPerformanceScore = 50.0;

struct WorkerScore {
  int64_t worker_id = 0;
  ModeResolution resolution;
  double transfer_cost = 0.0;
  double perf_cost = 0.0;
  double load_cost = 0.0;
  double score = 0.0;
  bool at_capacity = false;
};

struct Assignment {
  int64_t worker_id = 0;
  ModeResolution resolution;
  double score = 0.0;
  bool over_capacity = false;  // chosen by the capacity-ignoring second pass
};

double LoadCost(int active_jobs, int max_concurrent_jobs);
double CompositeScore(double transfer_cost, double perf_cost, double load_cost);

class WorkerScheduler {
 public:
  explicit WorkerScheduler(bool origin_has_ssh) : origin_has_ssh_(origin_has_ssh) {}

  // active_counts: jobs in transferring/transcoding/verifying/replacing per
  // worker id. Returns nullopt when no worker is enabled and online.
  std::optional<Assignment> Assign(const model::Job& job,
                                   const std::vector<model::Worker>& candidates,
                                   const std::map<int64_t, int>& active_counts,
                                   std::optional<int64_t> preferred_worker_id = std::nullopt) const;

  WorkerScore Score(const model::Job& job, const model::Worker& worker, int active_jobs) const;

  ModeResolution ResolveFor(const model::Job& job, const model::Worker& worker) const;

 private:
  bool origin_has_ssh_;
};

// Writes worker, mode and the worker-visible input path into the job.
void ApplyAssignment(const Assignment& assignment, model::Job* job);

}  // namespace encodefarm::scheduler

#endif  // ENCODEFARM_SCHEDULER_WORKER_SCHEDULER_HPP_
