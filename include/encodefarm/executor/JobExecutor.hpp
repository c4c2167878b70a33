// Repository: Encodefarm
// Component: Job Executor
// Purpose: Drives one job through its transfer-mode specific state machine
//          (transfer, encode, verify, replace) and hands any failure to the
//          retry policy.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_EXECUTOR_JOB_EXECUTOR_HPP_
#define ENCODEFARM_EXECUTOR_JOB_EXECUTOR_HPP_

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "encodefarm/events/JobEventEmitter.hpp"
#include "encodefarm/executor/EncoderRunner.hpp"
#include "encodefarm/executor/FfmpegCommandBuilder.hpp"
#include "encodefarm/model/JobTypes.hpp"
#include "encodefarm/probe/IMediaProbe.hpp"
#include "encodefarm/recovery/OutputValidator.hpp"
#include "encodefarm/recovery/RetryPolicy.hpp"
#include "encodefarm/store/IRecordStore.hpp"
#include "encodefarm/time/ITimeSource.hpp"
#include "encodefarm/transfer/ITransport.hpp"
#include "encodefarm/transfer/TransferEngine.hpp"
#include "encodefarm/util/CancellationToken.hpp"

namespace encodefarm::executor {

// Raised by a pipeline leg; caught once at the Execute() boundary.
class JobFailure : public std::runtime_error {
 public:
  JobFailure(model::ErrorCategory category, const std::string& reason)
      : std::runtime_error(reason), category_(category) {}

  model::ErrorCategory category() const { return category_; }

 private:
  model::ErrorCategory category_;
};

struct ExecutorOptions {
  // Encoder executable on the controller (local worker).
  std::string local_encoder = "ffmpeg";
  // Encoder executable on remote workers (resolved through their PATH).
  std::string remote_encoder = "ffmpeg";
  // Controller-side staging directory for ssh_pull sources and outputs.
  std::string local_work_dir = "/tmp/encodefarm";
  int telemetry_store_interval_ms = 1000;
  int progress_event_interval_ms = 500;
  transfer::TransferEngine::Options transfer;
};

struct ExecutionResult {
  model::JobStatus final_status = model::JobStatus::kFailed;
  std::optional<model::ErrorCategory> failure;
  std::optional<recovery::RetryOutcome> retry;
};

// Where a job's source is staged on a remote worker. The prefetcher stages
// to the same place.
std::string RemoteStagingPath(const model::Worker& worker, const model::Job& job);

// Controller-side staging path for ssh_pull.
std::string LocalStagingPath(const std::string& work_dir, const model::Job& job);

// Status a dequeued job enters before its pipeline starts.
model::JobStatus InitialStatusFor(const model::Job& job);

class JobExecutor {
 public:
  JobExecutor(store::IRecordStore& store, transfer::ITransportFactory& transports,
              const IEncoderCommandFactory& commands, probe::IMediaProbe& probe,
              recovery::OutputValidator& validator, recovery::RetryPolicy& retry,
              events::JobEventEmitter& events, std::shared_ptr<time::ITimeSource> clock,
              ExecutorOptions options = ExecutorOptions());
  ~JobExecutor();

  JobExecutor(const JobExecutor&) = delete;
  JobExecutor& operator=(const JobExecutor&) = delete;

  // Runs job (already assigned and moved out of queued) on worker until it
  // completes, fails, is cancelled or goes back to the queue. Never throws
  // JobFailure; store errors propagate as std::runtime_error.
  ExecutionResult Execute(model::Job job, const model::Worker& worker,
                          const util::CancellationToken& cancel);

  transfer::TransferEngine& transfer_engine() { return engine_; }

 private:
  struct RunState;

  void RunLocal(RunState& run);
  void RunMapped(RunState& run);
  void RunSshPull(RunState& run);
  void RunSshTransfer(RunState& run);

  // Encodes input -> output on transport, walking the hardware fallback.
  void Encode(RunState& run, transfer::ITransport& transport, const std::string& program,
              const std::string& input, const std::string& output);
  // Validates a controller-visible output; sets validation_status.
  void VerifyLocal(RunState& run, const std::string& output);
  // Size-only check for outputs the controller cannot probe.
  void VerifyRemoteSize(RunState& run, transfer::ITransport& transport,
                        const std::string& output);
  void Transfer(RunState& run, transfer::TransferDirection direction,
                transfer::ITransport& transport, const transfer::ConnectFn& connect,
                const std::string& local_path, const std::string& remote_path,
                int64_t size_hint, const char* leg);
  void Relay(RunState& run, transfer::ITransport& src, const std::string& src_path,
             transfer::ITransport& dst, const std::string& dst_path, int64_t size_hint,
             const char* leg);
  void Complete(RunState& run, const std::string& final_path, int64_t output_size);

  // Back to queued and unassigned without consuming a retry.
  void Requeue(RunState& run, const std::string& reason);
  void SetStatus(RunState& run, model::JobStatus status);
  void Persist(RunState& run);
  void CheckCancelled(RunState& run);
  void Log(RunState& run, const std::string& message);
  void ProbeSourceDuration(RunState& run, const std::string& controller_path);

  // Removes temporaries, and partial outputs unless the job completed.
  void Cleanup(RunState& run, bool completed);

  store::IRecordStore& store_;
  transfer::ITransportFactory& transports_;
  const IEncoderCommandFactory& commands_;
  probe::IMediaProbe& probe_;
  recovery::OutputValidator& validator_;
  recovery::RetryPolicy& retry_;
  events::JobEventEmitter& events_;
  std::shared_ptr<time::ITimeSource> clock_;
  ExecutorOptions options_;
  transfer::TransferEngine engine_;
  EncoderRunner runner_;
};

}  // namespace encodefarm::executor

#endif  // ENCODEFARM_EXECUTOR_JOB_EXECUTOR_HPP_
