// Repository: Encodefarm
// Component: SQLite record store tests
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "encodefarm/store/SqliteRecordStore.hpp"
#include "support/DeterministicTimeSource.hpp"
#include "support/ScratchDir.hpp"

namespace encodefarm::store {
namespace {

using model::EncoderFamily;
using model::Job;
using model::JobStatus;
using model::TransferMode;
using model::Worker;
using model::WorkerStatus;

class SqliteRecordStoreTest : public ::testing::Test {
 protected:
  SqliteRecordStoreTest()
      : clock_(std::make_shared<encodefarm::testing::DeterministicTimeSource>()),
        store_(":memory:", clock_) {}

  Job NewJob(const std::string& source, int priority = 0) {
    Job job;
    job.source_path = source;
    job.priority = priority;
    job.source_size = 1000;
    return job;
  }

  std::shared_ptr<encodefarm::testing::DeterministicTimeSource> clock_;
  SqliteRecordStore store_;
};

TEST_F(SqliteRecordStoreTest, CreateAndGetJobRoundTripsColumns) {
  Job job = NewJob("/media/a.mkv", 5);
  job.media_item_id = 77;
  job.config = {{"video_codec", "libx265"}, {"crf", "20"}};
  job.source_duration_s = 321.5;
  job.max_retries = 2;
  job.is_manual = true;

  int64_t id = store_.CreateJob(job);
  ASSERT_GT(id, 0);
  auto loaded = store_.GetJob(id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->id, id);
  EXPECT_EQ(loaded->status, JobStatus::kQueued);
  EXPECT_EQ(loaded->source_path, "/media/a.mkv");
  EXPECT_EQ(loaded->priority, 5);
  EXPECT_EQ(loaded->media_item_id, 77);
  EXPECT_EQ(loaded->config, job.config);
  ASSERT_TRUE(loaded->source_duration_s.has_value());
  EXPECT_DOUBLE_EQ(*loaded->source_duration_s, 321.5);
  EXPECT_EQ(loaded->max_retries, 2);
  EXPECT_TRUE(loaded->is_manual);
  EXPECT_EQ(loaded->created_at_ms, clock_->NowUtcMs());
  EXPECT_EQ(loaded->updated_at_ms, clock_->NowUtcMs());
  EXPECT_FALSE(loaded->assigned_worker_id.has_value());
  EXPECT_FALSE(loaded->progress_percent.has_value());
}

TEST_F(SqliteRecordStoreTest, MissingRecordsReportNotFound) {
  EXPECT_FALSE(store_.GetJob(999).has_value());
  EXPECT_FALSE(store_.GetWorker(999).has_value());
  Job ghost = NewJob("/x");
  ghost.id = 999;
  EXPECT_FALSE(store_.UpdateJob(ghost));
  EXPECT_FALSE(store_.UpdateJobTelemetry(999, JobTelemetry{}));
  EXPECT_FALSE(store_.IncrementWorkerFailures(999));
}

TEST_F(SqliteRecordStoreTest, UpdateJobStampsUpdatedAt) {
  int64_t id = store_.CreateJob(NewJob("/media/a.mkv"));
  auto job = store_.GetJob(id);
  clock_->AdvanceMs(5000);

  job->status = JobStatus::kTranscoding;
  job->assigned_worker_id = 3;
  job->transfer_mode = TransferMode::kSshTransfer;
  job->worker_input_path = "/tmp/encodefarm/job-1-a.mkv";
  job->encoder_command = "ffmpeg -y -i in out";
  ASSERT_TRUE(store_.UpdateJob(*job));

  auto loaded = store_.GetJob(id);
  EXPECT_EQ(loaded->status, JobStatus::kTranscoding);
  EXPECT_EQ(loaded->assigned_worker_id, 3);
  EXPECT_EQ(loaded->transfer_mode, TransferMode::kSshTransfer);
  EXPECT_EQ(loaded->worker_input_path, "/tmp/encodefarm/job-1-a.mkv");
  EXPECT_EQ(loaded->encoder_command, "ffmpeg -y -i in out");
  EXPECT_EQ(loaded->updated_at_ms, clock_->NowUtcMs());
  EXPECT_LT(loaded->created_at_ms, loaded->updated_at_ms);
}

TEST_F(SqliteRecordStoreTest, TelemetryWriteBumpsUpdatedAt) {
  int64_t id = store_.CreateJob(NewJob("/media/a.mkv"));
  clock_->AdvanceMs(1234);
  JobTelemetry t;
  t.progress_percent = 42.5;
  t.current_fps = 48.0;
  t.eta_seconds = 90;
  t.checkpoint_frame = 2400;
  ASSERT_TRUE(store_.UpdateJobTelemetry(id, t));

  auto loaded = store_.GetJob(id);
  EXPECT_DOUBLE_EQ(*loaded->progress_percent, 42.5);
  EXPECT_DOUBLE_EQ(*loaded->current_fps, 48.0);
  EXPECT_EQ(loaded->eta_seconds, 90);
  EXPECT_EQ(loaded->checkpoint_frame, 2400);
  EXPECT_EQ(loaded->updated_at_ms, clock_->NowUtcMs());
}

TEST_F(SqliteRecordStoreTest, QueuedJobsOrderedByPriorityThenAge) {
  int64_t low = store_.CreateJob(NewJob("/low", 0));
  clock_->AdvanceMs(10);
  int64_t high_old = store_.CreateJob(NewJob("/high-old", 10));
  clock_->AdvanceMs(10);
  int64_t high_new = store_.CreateJob(NewJob("/high-new", 10));
  Job running = NewJob("/running", 100);
  int64_t running_id = store_.CreateJob(running);
  auto r = store_.GetJob(running_id);
  r->status = JobStatus::kTranscoding;
  store_.UpdateJob(*r);

  auto queued = store_.ListQueuedJobs(10);
  ASSERT_EQ(queued.size(), 3u);
  EXPECT_EQ(queued[0].id, high_old);
  EXPECT_EQ(queued[1].id, high_new);
  EXPECT_EQ(queued[2].id, low);

  auto limited = store_.ListQueuedJobs(1);
  ASSERT_EQ(limited.size(), 1u);
  EXPECT_EQ(limited[0].id, high_old);

  auto transcoding = store_.ListJobsByStatus(JobStatus::kTranscoding);
  ASSERT_EQ(transcoding.size(), 1u);
  EXPECT_EQ(transcoding[0].id, running_id);
}

TEST_F(SqliteRecordStoreTest, DispatchableJobsSkipBackoffBeforeLimit) {
  const int64_t now = clock_->NowUtcMs();
  for (int i = 0; i < 3; ++i) {
    Job deferred = NewJob("/deferred" + std::to_string(i), 5);
    deferred.scheduled_after_ms = now + 15 * 60'000;
    store_.CreateJob(deferred);
  }
  Job due = NewJob("/due", 5);
  due.scheduled_after_ms = now;
  int64_t due_id = store_.CreateJob(due);
  int64_t plain = store_.CreateJob(NewJob("/plain", 0));

  auto ready = store_.ListDispatchableJobs(now, 2);
  ASSERT_EQ(ready.size(), 2u);
  EXPECT_EQ(ready[0].id, due_id);
  EXPECT_EQ(ready[1].id, plain);

  EXPECT_EQ(store_.ListDispatchableJobs(now + 15 * 60'000, 10).size(), 5u);
  EXPECT_EQ(store_.ListQueuedJobs(10).size(), 5u);
}

TEST_F(SqliteRecordStoreTest, ActiveCountsOnlyActiveStatuses) {
  auto place = [this](JobStatus status, int64_t worker) {
    int64_t id = store_.CreateJob(NewJob("/j"));
    auto job = store_.GetJob(id);
    job->status = status;
    job->assigned_worker_id = worker;
    store_.UpdateJob(*job);
  };
  place(JobStatus::kTransferring, 1);
  place(JobStatus::kTranscoding, 1);
  place(JobStatus::kVerifying, 2);
  place(JobStatus::kReplacing, 2);
  place(JobStatus::kQueued, 2);
  place(JobStatus::kCompleted, 1);
  place(JobStatus::kFailed, 3);

  auto counts = store_.CountActiveJobsByWorker();
  EXPECT_EQ(counts[1], 2);
  EXPECT_EQ(counts[2], 2);
  EXPECT_EQ(counts.count(3), 0u);
}

TEST_F(SqliteRecordStoreTest, PrestagedAppliesOnlyToQueuedJobOnSameWorker) {
  int64_t id = store_.CreateJob(NewJob("/media/a.mkv"));
  auto job = store_.GetJob(id);
  job->assigned_worker_id = 4;
  store_.UpdateJob(*job);

  EXPECT_FALSE(store_.MarkSourcePrestaged(id, 5, "/w/a.mkv"));
  EXPECT_FALSE(store_.GetJob(id)->source_prestaged);

  ASSERT_TRUE(store_.MarkSourcePrestaged(id, 4, "/w/a.mkv"));
  auto staged = store_.GetJob(id);
  EXPECT_TRUE(staged->source_prestaged);
  EXPECT_EQ(staged->worker_input_path, "/w/a.mkv");

  staged->status = JobStatus::kTransferring;
  staged->source_prestaged = false;
  store_.UpdateJob(*staged);
  EXPECT_FALSE(store_.MarkSourcePrestaged(id, 4, "/w/a.mkv"));
}

TEST_F(SqliteRecordStoreTest, WorkerRoundTripsMappingsAndCapabilities) {
  Worker w;
  w.name = "gpu-1";
  w.hostname = "10.0.0.5";
  w.port = 2222;
  w.ssh_username = "encode";
  w.status = WorkerStatus::kOnline;
  w.max_concurrent_jobs = 2;
  w.performance_score = 80.0;
  w.path_mappings = {{"/media/tv", "/mnt/tv"}, {"/media", "/mnt/media"}};
  w.hardware_encode_capabilities = {EncoderFamily::kNvenc, EncoderFamily::kQsv};
  w.working_directory = "/scratch";

  int64_t id = store_.CreateWorker(w);
  auto loaded = store_.GetWorker(id);
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->name, "gpu-1");
  EXPECT_EQ(loaded->port, 2222);
  EXPECT_EQ(loaded->status, WorkerStatus::kOnline);
  EXPECT_EQ(loaded->max_concurrent_jobs, 2);
  EXPECT_DOUBLE_EQ(*loaded->performance_score, 80.0);
  ASSERT_EQ(loaded->path_mappings.size(), 2u);
  EXPECT_EQ(loaded->path_mappings[0].source_prefix, "/media/tv");
  EXPECT_EQ(loaded->path_mappings[1].target_prefix, "/mnt/media");
  EXPECT_TRUE(loaded->HasCapability(EncoderFamily::kNvenc));
  EXPECT_TRUE(loaded->HasCapability(EncoderFamily::kQsv));
  EXPECT_FALSE(loaded->HasCapability(EncoderFamily::kVideoToolbox));
  EXPECT_EQ(loaded->working_directory, "/scratch");

  loaded->path_mappings = {{"/other", "/x"}};
  loaded->is_enabled = false;
  ASSERT_TRUE(store_.UpdateWorker(*loaded));
  auto updated = store_.GetWorker(id);
  ASSERT_EQ(updated->path_mappings.size(), 1u);
  EXPECT_EQ(updated->path_mappings[0].source_prefix, "/other");
  EXPECT_FALSE(updated->is_enabled);
  ASSERT_EQ(store_.ListWorkers().size(), 1u);
}

TEST_F(SqliteRecordStoreTest, IncrementWorkerFailuresAccumulates) {
  int64_t id = store_.CreateWorker(Worker{});
  ASSERT_TRUE(store_.IncrementWorkerFailures(id));
  ASSERT_TRUE(store_.IncrementWorkerFailures(id));
  EXPECT_EQ(store_.GetWorker(id)->consecutive_failures, 2);
}

TEST_F(SqliteRecordStoreTest, JobLogsAppendInOrder) {
  Job job = NewJob("/media/a.mkv");
  job.id = store_.CreateJob(job);
  job.output_size = 400;
  job.assigned_worker_id = 2;
  job.started_at_ms = clock_->NowUtcMs();
  clock_->AdvanceMs(30'000);

  store_.AppendJobLog(model::MakeJobLog(job, JobStatus::kCompleted, clock_->NowUtcMs(), 60.0));
  job.failure_reason = "boom";
  store_.AppendJobLog(model::MakeJobLog(job, JobStatus::kFailed, clock_->NowUtcMs()));

  auto logs = store_.ListJobLogs(job.id);
  ASSERT_EQ(logs.size(), 2u);
  EXPECT_EQ(logs[0].status, JobStatus::kCompleted);
  EXPECT_EQ(logs[0].target_size, 400);
  ASSERT_TRUE(logs[0].size_reduction.has_value());
  EXPECT_NEAR(*logs[0].size_reduction, 0.6, 1e-9);
  EXPECT_DOUBLE_EQ(logs[0].duration_seconds, 30.0);
  EXPECT_EQ(logs[0].worker_id, 2);
  EXPECT_EQ(logs[1].status, JobStatus::kFailed);
  EXPECT_EQ(logs[1].failure_reason, "boom");
  EXPECT_FALSE(logs[1].size_reduction.has_value());
  EXPECT_TRUE(store_.ListJobLogs(job.id + 100).empty());
}

TEST(SqliteRecordStoreFileTest, RecordsSurviveReopen) {
  encodefarm::testing::ScratchDir dir("store");
  auto clock = std::make_shared<encodefarm::testing::DeterministicTimeSource>();
  const std::string path = dir.Join("farm.db");
  int64_t id = 0;
  {
    SqliteRecordStore store(path, clock);
    Job job;
    job.source_path = "/media/persist.mkv";
    id = store.CreateJob(job);
  }
  SqliteRecordStore reopened(path, clock);
  auto job = reopened.GetJob(id);
  ASSERT_TRUE(job.has_value());
  EXPECT_EQ(job->source_path, "/media/persist.mkv");
}

TEST(SqliteRecordStoreFileTest, UnopenablePathThrows) {
  auto clock = std::make_shared<encodefarm::testing::DeterministicTimeSource>();
  EXPECT_THROW(SqliteRecordStore("/nonexistent-dir/encodefarm/farm.db", clock),
               std::runtime_error);
}

}  // namespace
}  // namespace encodefarm::store
