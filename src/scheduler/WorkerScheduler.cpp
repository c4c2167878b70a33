// Repository: Encodefarm
// Component: Worker Scheduler
// Copyright (c) 2025 RetroVue

#include "encodefarm/scheduler/WorkerScheduler.hpp"

#include <algorithm>
#include <sstream>

#include "encodefarm/util/Logger.hpp"

namespace encodefarm::scheduler {

using model::Job;
using model::Worker;

double LoadCost(int active_jobs, int max_concurrent_jobs) {
  return 100.0 * static_cast<double>(active_jobs) /
         static_cast<double>(std::max(max_concurrent_jobs, 1));
}

double CompositeScore(double transfer_cost, double perf_cost, double load_cost) {
  return kTransferWeight * transfer_cost + kPerformanceWeight * perf_cost +
         kLoadWeight * load_cost;
}

ModeResolution WorkerScheduler::ResolveFor(const Job& job, const Worker& worker) const {
  return ResolveTransferMode(job.source_path, worker.is_local, worker.path_mappings,
                             origin_has_ssh_);
}

WorkerScore WorkerScheduler::Score(const Job& job, const Worker& worker, int active_jobs) const {
  WorkerScore s;
  s.worker_id = worker.id;
  s.resolution = ResolveFor(job, worker);
  s.transfer_cost = TransferCost(s.resolution.mode);
  s.perf_cost = 100.0 - worker.performance_score.value_or(kDefaultPerformanceScore);
  s.load_cost = LoadCost(active_jobs, worker.max_concurrent_jobs);
  s.score = CompositeScore(s.transfer_cost, s.perf_cost, s.load_cost);
  s.at_capacity = active_jobs >= worker.max_concurrent_jobs;
  return s;
}

std::optional<Assignment> WorkerScheduler::Assign(const Job& job,
                                                  const std::vector<Worker>& candidates,
                                                  const std::map<int64_t, int>& active_counts,
                                                  std::optional<int64_t> preferred_worker_id) const {
  auto active_for = [&active_counts](int64_t worker_id) {
    auto it = active_counts.find(worker_id);
    return it == active_counts.end() ? 0 : it->second;
  };

  if (preferred_worker_id) {
    for (const auto& w : candidates) {
      if (w.id == *preferred_worker_id && w.IsEligible()) {
        Assignment a;
        a.worker_id = w.id;
        a.resolution = ResolveFor(job, w);
        a.over_capacity = active_for(w.id) >= w.max_concurrent_jobs;
        return a;
      }
    }
    util::Logger::Debug("[WorkerScheduler] Preferred worker " +
                        std::to_string(*preferred_worker_id) +
                        " not eligible for job " + std::to_string(job.id) +
                        ", scoring all workers");
  }

  std::vector<WorkerScore> scores;
  for (const auto& w : candidates) {
    if (!w.IsEligible()) continue;
    scores.push_back(Score(job, w, active_for(w.id)));
  }
  if (scores.empty()) {
    return std::nullopt;
  }

  // Lower score wins; ties go to the lower worker id.
  auto better = [](const WorkerScore& a, const WorkerScore& b) {
    if (a.score != b.score) return a.score < b.score;
    return a.worker_id < b.worker_id;
  };

  const WorkerScore* best = nullptr;
  for (const auto& s : scores) {
    if (s.at_capacity) continue;
    if (best == nullptr || better(s, *best)) best = &s;
  }

  bool over_capacity = false;
  if (best == nullptr) {
    over_capacity = true;
    for (const auto& s : scores) {
      if (best == nullptr || better(s, *best)) best = &s;
    }
  }

  std::ostringstream oss;
  oss << "[WorkerScheduler] job=" << job.id << " → worker=" << best->worker_id
      << " mode=" << model::TransferModeToString(best->resolution.mode)
      << " score=" << best->score << " (transfer=" << best->transfer_cost
      << " perf=" << best->perf_cost << " load=" << best->load_cost << ")"
      << (over_capacity ? " all workers at capacity" : "");
  util::Logger::Debug(oss.str());

  Assignment a;
  a.worker_id = best->worker_id;
  a.resolution = best->resolution;
  a.score = best->score;
  a.over_capacity = over_capacity;
  return a;
}

void ApplyAssignment(const Assignment& assignment, Job* job) {
  job->assigned_worker_id = assignment.worker_id;
  job->transfer_mode = assignment.resolution.mode;
  job->worker_input_path = assignment.resolution.resolved_path;
  job->worker_output_path.reset();
  job->source_prestaged = false;
}

}  // namespace encodefarm::scheduler
