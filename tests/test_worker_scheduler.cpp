// Repository: Encodefarm
// Component: Worker Scheduler tests
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <map>
#include <vector>

#include "encodefarm/scheduler/WorkerScheduler.hpp"

namespace encodefarm::scheduler {
namespace {

using model::Job;
using model::TransferMode;
using model::Worker;
using model::WorkerStatus;

Worker MakeWorker(int64_t id, bool local, std::optional<double> perf, int max_jobs) {
  Worker w;
  w.id = id;
  w.name = "w" + std::to_string(id);
  w.is_local = local;
  w.status = WorkerStatus::kOnline;
  w.performance_score = perf;
  w.max_concurrent_jobs = max_jobs;
  return w;
}

Job MakeJob(const std::string& source) {
  Job job;
  job.id = 7;
  job.source_path = source;
  return job;
}

TEST(WorkerSchedulerTest, LoadCostMonotonicInActiveJobs) {
  for (int max_jobs = 0; max_jobs <= 4; ++max_jobs) {
    double previous = -1.0;
    for (int active = 0; active <= 6; ++active) {
      double cost = LoadCost(active, max_jobs);
      EXPECT_GE(cost, previous) << "active=" << active << " max=" << max_jobs;
      previous = cost;
    }
  }
  EXPECT_DOUBLE_EQ(LoadCost(1, 2), 50.0);
  EXPECT_DOUBLE_EQ(LoadCost(3, 0), 300.0);
}

TEST(WorkerSchedulerTest, CompositeScoreMonotonicInEachTerm) {
  const double values[] = {0.0, 25.0, 50.0, 75.0, 100.0};
  for (double fixed_a : values) {
    for (double fixed_b : values) {
      double prev_t = -1.0;
      double prev_p = -1.0;
      double prev_l = -1.0;
      for (double v : values) {
        double t = CompositeScore(v, fixed_a, fixed_b);
        double p = CompositeScore(fixed_a, v, fixed_b);
        double l = CompositeScore(fixed_a, fixed_b, v);
        EXPECT_GE(t, prev_t);
        EXPECT_GE(p, prev_p);
        EXPECT_GE(l, prev_l);
        prev_t = t;
        prev_p = p;
        prev_l = l;
      }
    }
  }
}

TEST(WorkerSchedulerTest, ScoreUsesDefaultPerformanceWhenAbsent) {
  WorkerScheduler scheduler(false);
  Worker w = MakeWorker(1, true, std::nullopt, 1);
  WorkerScore s = scheduler.Score(MakeJob("/srv/a.mkv"), w, 0);
  EXPECT_EQ(s.resolution.mode, TransferMode::kLocal);
  EXPECT_DOUBLE_EQ(s.perf_cost, 50.0);
  EXPECT_DOUBLE_EQ(s.score, 0.30 * 50.0);
}

// Scenario A: the mapped worker with spare capacity beats the faster-scoring
// candidate that is already full.
TEST(WorkerSchedulerTest, AtCapacityWorkerExcluded) {
  Worker w1 = MakeWorker(1, false, 80.0, 2);
  w1.path_mappings = {{"/media", "/mnt/media"}};
  Worker w2 = MakeWorker(2, false, 50.0, 1);

  WorkerScheduler scheduler(true);
  std::map<int64_t, int> active = {{1, 0}, {2, 1}};
  auto a = scheduler.Assign(MakeJob("/media/a.mkv"), {w1, w2}, active);
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->worker_id, 1);
  EXPECT_EQ(a->resolution.mode, TransferMode::kMapped);
  EXPECT_FALSE(a->over_capacity);
}

TEST(WorkerSchedulerTest, AllAtCapacityPicksBestScoreAnyway) {
  Worker w1 = MakeWorker(1, false, 90.0, 1);
  Worker w2 = MakeWorker(2, false, 10.0, 1);
  WorkerScheduler scheduler(false);
  auto a = scheduler.Assign(MakeJob("/srv/a.mkv"), {w1, w2}, {{1, 1}, {2, 1}});
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->worker_id, 1);
  EXPECT_TRUE(a->over_capacity);
}

TEST(WorkerSchedulerTest, IneligibleWorkersSkipped) {
  Worker disabled = MakeWorker(1, true, 100.0, 4);
  disabled.is_enabled = false;
  Worker offline = MakeWorker(2, true, 100.0, 4);
  offline.status = WorkerStatus::kOffline;
  WorkerScheduler scheduler(false);
  EXPECT_FALSE(scheduler.Assign(MakeJob("/srv/a.mkv"), {disabled, offline}, {}).has_value());
  EXPECT_FALSE(scheduler.Assign(MakeJob("/srv/a.mkv"), {}, {}).has_value());
}

TEST(WorkerSchedulerTest, TiesBreakOnLowerWorkerId) {
  Worker w5 = MakeWorker(5, false, 60.0, 1);
  Worker w3 = MakeWorker(3, false, 60.0, 1);
  WorkerScheduler scheduler(false);
  auto a = scheduler.Assign(MakeJob("/srv/a.mkv"), {w5, w3}, {});
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->worker_id, 3);
}

TEST(WorkerSchedulerTest, LocalTransferCostOutweighsPerformance) {
  Worker local = MakeWorker(1, true, 40.0, 1);
  Worker remote = MakeWorker(2, false, 60.0, 1);
  WorkerScheduler scheduler(false);
  auto a = scheduler.Assign(MakeJob("/srv/a.mkv"), {remote, local}, {});
  ASSERT_TRUE(a.has_value());
  // local: 0.30*60 = 18; remote: 0.35*75 + 0.30*40 = 38.25
  EXPECT_EQ(a->worker_id, 1);
  EXPECT_EQ(a->resolution.mode, TransferMode::kLocal);
}

TEST(WorkerSchedulerTest, PreferredWorkerAssignedDirectly) {
  Worker fast = MakeWorker(1, true, 100.0, 4);
  Worker slow = MakeWorker(2, false, 5.0, 1);
  WorkerScheduler scheduler(false);
  auto a = scheduler.Assign(MakeJob("/srv/a.mkv"), {fast, slow}, {{2, 1}}, 2);
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->worker_id, 2);
  EXPECT_EQ(a->resolution.mode, TransferMode::kSshTransfer);
  EXPECT_TRUE(a->over_capacity);
}

TEST(WorkerSchedulerTest, IneligiblePreferredWorkerFallsBackToScoring) {
  Worker fast = MakeWorker(1, true, 100.0, 4);
  Worker preferred = MakeWorker(2, false, 50.0, 1);
  preferred.is_enabled = false;
  WorkerScheduler scheduler(false);
  auto a = scheduler.Assign(MakeJob("/srv/a.mkv"), {fast, preferred}, {}, 2);
  ASSERT_TRUE(a.has_value());
  EXPECT_EQ(a->worker_id, 1);
}

TEST(WorkerSchedulerTest, ApplyAssignmentResetsWorkerSideState) {
  Job job = MakeJob("/srv/a.mkv");
  job.worker_output_path = "/old/out.mkv";
  job.source_prestaged = true;

  Assignment a;
  a.worker_id = 4;
  a.resolution.mode = TransferMode::kMapped;
  a.resolution.resolved_path = "/mnt/a.mkv";
  ApplyAssignment(a, &job);

  EXPECT_EQ(job.assigned_worker_id, 4);
  EXPECT_EQ(job.transfer_mode, TransferMode::kMapped);
  EXPECT_EQ(job.worker_input_path, "/mnt/a.mkv");
  EXPECT_FALSE(job.worker_output_path.has_value());
  EXPECT_FALSE(job.source_prestaged);
}

}  // namespace
}  // namespace encodefarm::scheduler
