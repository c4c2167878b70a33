// Repository: Encodefarm
// Component: Job Executor
// Copyright (c) 2025 RetroVue

#include "encodefarm/executor/JobExecutor.hpp"

#include <chrono>
#include <utility>
#include <vector>

#include "encodefarm/executor/InPlaceReplacer.hpp"
#include "encodefarm/transfer/LocalTransport.hpp"
#include "encodefarm/transfer/Relay.hpp"
#include "encodefarm/util/Logger.hpp"

namespace encodefarm::executor {

using model::ErrorCategory;
using model::JobStatus;
using model::TransferMode;
using transfer::TransferDirection;

namespace {

std::string BaseName(const std::string& path) {
  size_t slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string StagingName(const model::Job& job) {
  return "job-" + std::to_string(job.id) + "-" + BaseName(job.source_path);
}

transfer::TransferProgressFn TransferSink(events::JobEventEmitter& events, int64_t job_id,
                                          const char* leg, const char* direction_label) {
  std::string leg_name = leg;
  std::string label = direction_label != nullptr ? direction_label : "";
  return [&events, job_id, leg_name, label](const transfer::TransferProgress& p) {
    events::TransferProgressPayload payload;
    payload.direction = label.empty() ? transfer::TransferDirectionToString(p.direction) : label;
    payload.leg = leg_name;
    payload.percent = p.percent;
    payload.bytes_done = p.bytes_done;
    payload.total_bytes = p.total_bytes;
    payload.speed_bps = p.speed_bps;
    payload.eta_seconds = p.eta_seconds;
    events.EmitTransferProgress(job_id, payload);
  };
}

}  // namespace

std::string RemoteStagingPath(const model::Worker& worker, const model::Job& job) {
  std::string dir = worker.working_directory.empty() ? "/tmp/encodefarm" : worker.working_directory;
  if (dir.back() != '/') dir += '/';
  return dir + StagingName(job);
}

std::string LocalStagingPath(const std::string& work_dir, const model::Job& job) {
  std::string dir = work_dir;
  if (!dir.empty() && dir.back() != '/') dir += '/';
  return dir + StagingName(job);
}

JobStatus InitialStatusFor(const model::Job& job) {
  if (!job.transfer_mode) return JobStatus::kTranscoding;
  switch (*job.transfer_mode) {
    case TransferMode::kSshPull:
      return JobStatus::kTransferring;
    case TransferMode::kSshTransfer:
      return job.source_prestaged ? JobStatus::kTranscoding : JobStatus::kTransferring;
    case TransferMode::kLocal:
    case TransferMode::kMapped:
      return JobStatus::kTranscoding;
  }
  return JobStatus::kTranscoding;
}

// =============================================================================
// RunState: everything one Execute() call owns
// =============================================================================

struct JobExecutor::RunState {
  struct CleanupEntry {
    transfer::ITransport* transport;
    std::string path;
    // Partial outputs survive a completed job; temporaries never do.
    bool partial;
  };

  RunState(model::Job j, const model::Worker& w, const util::CancellationToken& c)
      : job(std::move(j)), worker(w), cancel(c) {}

  model::Job job;
  const model::Worker& worker;
  const util::CancellationToken& cancel;

  model::EncodeConfig config;
  std::unique_ptr<transfer::ITransport> worker_transport;
  std::unique_ptr<transfer::ITransport> origin_transport;
  transfer::LocalTransport local;

  DiagnosticTail tail;
  std::vector<CleanupEntry> cleanup;
  std::optional<double> avg_fps;

  std::optional<std::chrono::steady_clock::time_point> last_store_write;
  std::optional<std::chrono::steady_clock::time_point> last_progress_event;
};

JobExecutor::JobExecutor(store::IRecordStore& store, transfer::ITransportFactory& transports,
                         const IEncoderCommandFactory& commands, probe::IMediaProbe& probe,
                         recovery::OutputValidator& validator, recovery::RetryPolicy& retry,
                         events::JobEventEmitter& events,
                         std::shared_ptr<time::ITimeSource> clock, ExecutorOptions options)
    : store_(store),
      transports_(transports),
      commands_(commands),
      probe_(probe),
      validator_(validator),
      retry_(retry),
      events_(events),
      clock_(std::move(clock)),
      options_(std::move(options)),
      engine_(options_.transfer),
      runner_(commands) {}

JobExecutor::~JobExecutor() = default;

ExecutionResult JobExecutor::Execute(model::Job job, const model::Worker& worker,
                                     const util::CancellationToken& cancel) {
  RunState run(std::move(job), worker, cancel);
  ExecutionResult result;
  if (!run.job.started_at_ms) run.job.started_at_ms = clock_->NowUtcMs();

  std::string note;
  run.config = PrepareForWorker(run.job.config, worker, &note);
  if (!note.empty()) Log(run, note);

  try {
    if (!run.job.transfer_mode) {
      throw JobFailure(ErrorCategory::kWorkerUnavailable, "job has no transfer mode");
    }
    run.worker_transport = transports_.ForWorker(worker);
    if (!run.worker_transport) {
      throw JobFailure(ErrorCategory::kWorkerUnavailable, "no transport for worker " + worker.name);
    }
    util::Logger::Info("[JobExecutor] Job " + std::to_string(run.job.id) + " starting on " +
                       worker.name + " (" + model::TransferModeToString(*run.job.transfer_mode) +
                       ")");

    switch (*run.job.transfer_mode) {
      case TransferMode::kLocal:
        RunLocal(run);
        break;
      case TransferMode::kMapped:
        RunMapped(run);
        break;
      case TransferMode::kSshPull:
        RunSshPull(run);
        break;
      case TransferMode::kSshTransfer:
        RunSshTransfer(run);
        break;
    }
    Cleanup(run, true);
    result.final_status = JobStatus::kCompleted;
    return result;
  } catch (const JobFailure& failure) {
    Cleanup(run, false);
    result.failure = failure.category();

    if (run.cancel.Reason() == util::CancelReason::kShutdown) {
      Requeue(run, "scheduler shutting down");
      result.final_status = JobStatus::kQueued;
      return result;
    }
    if (failure.category() == ErrorCategory::kWorkerUnavailable) {
      Requeue(run, failure.what());
      result.final_status = JobStatus::kQueued;
      return result;
    }

    recovery::FailureReport report;
    report.category = failure.category();
    report.reason = failure.what();
    report.diagnostics = run.tail.Text();
    report.avg_fps = run.avg_fps;
    result.retry = retry_.HandleFailure(run.job, report);
    result.final_status = run.job.status;
    return result;
  }
}

// =============================================================================
// Mode pipelines
// =============================================================================

void JobExecutor::RunLocal(RunState& run) {
  const std::string input = run.job.worker_input_path.value_or(run.job.source_path);
  std::optional<int64_t> size = run.local.FileSize(input);
  if (!size) {
    throw JobFailure(ErrorCategory::kSourceNotAccessible, "source not readable: " + input);
  }
  if (run.job.source_size <= 0) run.job.source_size = *size;
  ProbeSourceDuration(run, input);

  const std::string output = commands_.OutputPathFor(run.config, input);
  run.cleanup.push_back({&run.local, output, true});

  SetStatus(run, JobStatus::kTranscoding);
  Encode(run, *run.worker_transport, options_.local_encoder, input, output);

  SetStatus(run, JobStatus::kVerifying);
  VerifyLocal(run, output);
  const int64_t output_size = run.local.FileSize(output).value_or(0);

  std::string final_path = output;
  if (!run.job.is_manual) {
    SetStatus(run, JobStatus::kReplacing);
    ReplaceResult replaced = ReplaceLocal(input, output, ContainerOf(run.config));
    if (!replaced.ok) {
      run.tail.Add("[replace] " + replaced.error);
      throw JobFailure(ErrorCategory::kTransferFailed, "in-place replace failed: " + replaced.error);
    }
    final_path = replaced.final_path;
  }
  Complete(run, final_path, output_size);
}

void JobExecutor::RunMapped(RunState& run) {
  if (!run.job.worker_input_path) {
    throw JobFailure(ErrorCategory::kSourceNotAccessible, "mapped job has no worker path");
  }
  transfer::ITransport& worker = *run.worker_transport;
  const std::string input = *run.job.worker_input_path;
  if (!worker.FileSize(input)) {
    throw JobFailure(ErrorCategory::kSourceNotAccessible,
                     "mapped source not visible on " + worker.Describe() + ": " + input);
  }
  ProbeSourceDuration(run, run.job.source_path);

  const std::string worker_output = commands_.OutputPathFor(run.config, input);
  run.job.worker_output_path = worker_output;
  run.cleanup.push_back({&worker, worker_output, true});

  SetStatus(run, JobStatus::kTranscoding);
  Encode(run, worker, run.worker.is_local ? options_.local_encoder : options_.remote_encoder, input,
         worker_output);

  SetStatus(run, JobStatus::kVerifying);
  const std::string controller_output = commands_.OutputPathFor(run.config, run.job.source_path);
  int64_t output_size = 0;
  if (run.local.FileSize(controller_output)) {
    VerifyLocal(run, controller_output);
    output_size = run.local.FileSize(controller_output).value_or(0);
  } else {
    util::Logger::Warn("[JobExecutor] Job " + std::to_string(run.job.id) + ": " +
                       controller_output + " not visible here; checking size on the worker only");
    VerifyRemoteSize(run, worker, worker_output);
    output_size = worker.FileSize(worker_output).value_or(0);
  }

  const std::string container = ContainerOf(run.config);
  std::string final_path = controller_output;
  if (!run.job.is_manual) {
    SetStatus(run, JobStatus::kReplacing);
    ReplaceResult replaced = worker.IsLocal()
                                 ? ReplaceLocal(input, worker_output, container)
                                 : ReplaceRemote(worker, input, worker_output, container);
    if (!replaced.ok) {
      run.tail.Add("[replace] " + replaced.error);
      throw JobFailure(ErrorCategory::kTransferFailed, "in-place replace failed: " + replaced.error);
    }
    final_path = FinalPathFor(run.job.source_path, container);
  }
  Complete(run, final_path, output_size);
}

void JobExecutor::RunSshPull(RunState& run) {
  run.origin_transport = transports_.ForOrigin();
  if (!run.origin_transport) {
    throw JobFailure(ErrorCategory::kSourceNotAccessible, "origin exposes no SSH access");
  }
  transfer::ITransport& origin = *run.origin_transport;
  std::optional<int64_t> size = origin.FileSize(run.job.source_path);
  if (!size) {
    throw JobFailure(ErrorCategory::kSourceNotAccessible,
                     "source not found on " + origin.Describe() + ": " + run.job.source_path);
  }
  if (run.job.source_size <= 0) run.job.source_size = *size;

  const std::string work_dir =
      run.worker.working_directory.empty() ? options_.local_work_dir : run.worker.working_directory;
  if (!run.local.MakeDirectory(work_dir)) {
    throw JobFailure(ErrorCategory::kTransferFailed, "cannot create staging directory " + work_dir);
  }
  const transfer::ConnectFn connect_origin = [this] { return transports_.ForOrigin(); };

  const std::string staged = LocalStagingPath(work_dir, run.job);
  run.cleanup.push_back({&run.local, staged, false});
  SetStatus(run, JobStatus::kTransferring);
  Transfer(run, TransferDirection::kDownload, origin, connect_origin, staged, run.job.source_path,
           *size, "source");
  ProbeSourceDuration(run, staged);

  const std::string local_output = commands_.OutputPathFor(run.config, staged);
  run.cleanup.push_back({&run.local, local_output, false});
  SetStatus(run, JobStatus::kTranscoding);
  Encode(run, *run.worker_transport, options_.local_encoder, staged, local_output);

  SetStatus(run, JobStatus::kVerifying);
  VerifyLocal(run, local_output);
  const int64_t output_size = run.local.FileSize(local_output).value_or(0);

  const std::string origin_output = commands_.OutputPathFor(run.config, run.job.source_path);
  run.cleanup.push_back({&origin, origin_output, true});
  SetStatus(run, JobStatus::kTransferring);
  Transfer(run, TransferDirection::kUpload, origin, connect_origin, local_output, origin_output,
           output_size, "output");

  std::string final_path = origin_output;
  if (!run.job.is_manual) {
    SetStatus(run, JobStatus::kReplacing);
    ReplaceResult replaced =
        ReplaceRemote(origin, run.job.source_path, origin_output, ContainerOf(run.config));
    if (!replaced.ok) {
      run.tail.Add("[replace] " + replaced.error);
      throw JobFailure(ErrorCategory::kTransferFailed, "in-place replace failed: " + replaced.error);
    }
    final_path = replaced.final_path;
  }
  Complete(run, final_path, output_size);
}

void JobExecutor::RunSshTransfer(RunState& run) {
  transfer::ITransport& worker = *run.worker_transport;
  const std::string remote_input =
      run.job.worker_input_path.value_or(RemoteStagingPath(run.worker, run.job));
  run.job.worker_input_path = remote_input;

  std::optional<int64_t> local_size = run.local.FileSize(run.job.source_path);
  const bool locally_visible = local_size.has_value();
  int64_t source_size = local_size.value_or(run.job.source_size);
  transfer::ITransport* origin = nullptr;
  if (locally_visible) {
    ProbeSourceDuration(run, run.job.source_path);
  } else {
    if (transports_.OriginHasSsh()) run.origin_transport = transports_.ForOrigin();
    if (!run.origin_transport) {
      throw JobFailure(ErrorCategory::kSourceNotAccessible,
                       "source is neither local nor reachable on the origin: " +
                           run.job.source_path);
    }
    origin = run.origin_transport.get();
    std::optional<int64_t> origin_size = origin->FileSize(run.job.source_path);
    if (!origin_size) {
      throw JobFailure(ErrorCategory::kSourceNotAccessible,
                       "source not found on " + origin->Describe() + ": " + run.job.source_path);
    }
    source_size = *origin_size;
  }
  if (run.job.source_size <= 0) run.job.source_size = source_size;
  run.cleanup.push_back({&worker, remote_input, false});

  bool staged = false;
  if (run.job.source_prestaged) {
    std::optional<int64_t> remote_size = worker.FileSize(remote_input);
    if (remote_size && (source_size <= 0 || *remote_size == source_size)) {
      staged = true;
      Log(run, "using prestaged source " + remote_input);
    } else {
      run.job.source_prestaged = false;
      Log(run, "prestaged source missing or incomplete; uploading again");
    }
  }

  const transfer::ConnectFn connect_worker = [this, &run] {
    return transports_.ForWorker(run.worker);
  };
  if (!staged) {
    SetStatus(run, JobStatus::kTransferring);
    if (!worker.MakeDirectory(run.worker.working_directory)) {
      throw JobFailure(ErrorCategory::kTransferFailed,
                       "cannot create " + run.worker.working_directory + " on " + worker.Describe());
    }
    if (locally_visible) {
      Transfer(run, TransferDirection::kUpload, worker, connect_worker, run.job.source_path,
               remote_input, source_size, "source");
    } else {
      Relay(run, *origin, run.job.source_path, worker, remote_input, source_size, "source");
    }
  }

  const std::string remote_output = commands_.OutputPathFor(run.config, remote_input);
  run.job.worker_output_path = remote_output;
  run.cleanup.push_back({&worker, remote_output, false});
  SetStatus(run, JobStatus::kTranscoding);
  Encode(run, worker, options_.remote_encoder, remote_input, remote_output);

  std::optional<int64_t> output_size = worker.FileSize(remote_output);
  if (!output_size) {
    throw JobFailure(ErrorCategory::kEncodeFailed,
                     "encoder exited cleanly but " + remote_output + " is missing");
  }

  const std::string container = ContainerOf(run.config);
  const std::string controller_output = commands_.OutputPathFor(run.config, run.job.source_path);
  std::string final_path = controller_output;
  SetStatus(run, JobStatus::kTransferring);

  if (locally_visible) {
    run.cleanup.push_back({&run.local, controller_output, true});
    Transfer(run, TransferDirection::kDownload, worker, connect_worker, controller_output,
             remote_output, *output_size, "output");
    SetStatus(run, JobStatus::kVerifying);
    VerifyLocal(run, controller_output);
    if (!run.job.is_manual) {
      SetStatus(run, JobStatus::kReplacing);
      ReplaceResult replaced = ReplaceLocal(run.job.source_path, controller_output, container);
      if (!replaced.ok) {
        run.tail.Add("[replace] " + replaced.error);
        throw JobFailure(ErrorCategory::kTransferFailed,
                         "in-place replace failed: " + replaced.error);
      }
      final_path = replaced.final_path;
    }
  } else {
    run.cleanup.push_back({origin, controller_output, true});
    Relay(run, worker, remote_output, *origin, controller_output, *output_size, "output");
    VerifyRemoteSize(run, *origin, controller_output);
    if (!run.job.is_manual) {
      SetStatus(run, JobStatus::kReplacing);
      ReplaceResult replaced =
          ReplaceRemote(*origin, run.job.source_path, controller_output, container);
      if (!replaced.ok) {
        run.tail.Add("[replace] " + replaced.error);
        throw JobFailure(ErrorCategory::kTransferFailed,
                         "in-place replace failed: " + replaced.error);
      }
      final_path = replaced.final_path;
    }
  }
  Complete(run, final_path, *output_size);
}

// =============================================================================
// Legs
// =============================================================================

void JobExecutor::Encode(RunState& run, transfer::ITransport& transport,
                         const std::string& program, const std::string& input,
                         const std::string& output) {
  CheckCancelled(run);

  HardwareFallback fallback(run.config, run.worker);
  EncodeRequest request;
  request.transport = &transport;
  request.input_path = input;
  request.output_path = output;
  request.program = program;
  request.duration_s = run.job.source_duration_s;
  request.cancel = &run.cancel;

  const auto store_interval = std::chrono::milliseconds(options_.telemetry_store_interval_ms);
  const auto event_interval = std::chrono::milliseconds(options_.progress_event_interval_ms);

  EncodeOutcome outcome = runner_.Run(
      request, fallback, run.tail,
      [&](const std::string& command) {
        run.job.encoder_command = command;
        Persist(run);
      },
      [&](const EncoderProgress& p) {
        if (p.percent) run.job.progress_percent = p.percent;
        run.job.current_fps = p.fps;
        if (p.eta_seconds) run.job.eta_seconds = p.eta_seconds;
        run.job.checkpoint_frame = p.frame;

        const auto now = std::chrono::steady_clock::now();
        if (!run.last_store_write || now - *run.last_store_write >= store_interval) {
          run.last_store_write = now;
          store::JobTelemetry telemetry;
          telemetry.progress_percent = run.job.progress_percent;
          telemetry.current_fps = run.job.current_fps;
          telemetry.eta_seconds = run.job.eta_seconds;
          telemetry.checkpoint_frame = run.job.checkpoint_frame;
          if (!store_.UpdateJobTelemetry(run.job.id, telemetry)) {
            util::Logger::Warn("[JobExecutor] Job " + std::to_string(run.job.id) +
                               " telemetry write found no row");
          }
        }
        if (!run.last_progress_event || now - *run.last_progress_event >= event_interval) {
          run.last_progress_event = now;
          events::ProgressPayload payload;
          payload.percent = run.job.progress_percent.value_or(0.0);
          payload.fps = p.fps;
          payload.eta_seconds = run.job.eta_seconds.value_or(0);
          payload.frame = p.frame;
          events_.EmitProgress(run.job.id, payload);
        }
      },
      [&](FallbackStep step, const std::string& fallback_note, const std::string& command) {
        run.job.ClearTelemetry();
        run.job.encoder_command = command;
        run.last_store_write.reset();
        run.last_progress_event.reset();
        Persist(run);
        Log(run, std::string("fallback ") + FallbackStepToString(step) + ": " + fallback_note);
      });

  run.config = outcome.config;
  if (outcome.avg_fps) run.avg_fps = outcome.avg_fps;
  if (outcome.cancelled) CheckCancelled(run);
  if (!outcome.ok) {
    throw JobFailure(ErrorCategory::kEncodeFailed,
                     "encoder exited with status " + std::to_string(outcome.exit_status) +
                         " after " + std::to_string(outcome.attempts) + " attempt(s)");
  }
  CheckCancelled(run);
}

void JobExecutor::VerifyLocal(RunState& run, const std::string& output) {
  CheckCancelled(run);
  recovery::ValidationResult v = validator_.Validate(output, run.job.source_duration_s);
  if (!v.passed) {
    run.job.validation_status = model::ValidationStatus::kFailed;
    run.tail.Add("[verify] " + v.reason);
    throw JobFailure(ErrorCategory::kValidationFailed, v.reason);
  }
  run.job.validation_status = model::ValidationStatus::kPassed;
  Log(run, "output verified: " + output);
}

void JobExecutor::VerifyRemoteSize(RunState& run, transfer::ITransport& transport,
                                   const std::string& output) {
  CheckCancelled(run);
  std::optional<int64_t> size = transport.FileSize(output);
  if (!size) {
    run.job.validation_status = model::ValidationStatus::kFailed;
    throw JobFailure(ErrorCategory::kValidationFailed,
                     "output missing on " + transport.Describe() + ": " + output);
  }
  if (*size <= validator_.policy().min_output_bytes) {
    run.job.validation_status = model::ValidationStatus::kFailed;
    throw JobFailure(ErrorCategory::kValidationFailed,
                     "output too small (" + std::to_string(*size) + " bytes)");
  }
}

void JobExecutor::Transfer(RunState& run, TransferDirection direction,
                           transfer::ITransport& transport, const transfer::ConnectFn& connect,
                           const std::string& local_path, const std::string& remote_path,
                           int64_t size_hint, const char* leg) {
  CheckCancelled(run);
  transfer::TransferRequest request;
  request.direction = direction;
  request.local_path = local_path;
  request.remote_path = remote_path;
  request.size_hint = size_hint;
  request.transport = &transport;
  request.connect = connect;
  request.progress = TransferSink(events_, run.job.id, leg, nullptr);
  request.cancel = &run.cancel;

  transfer::TransferResult r = engine_.Transfer(request);
  if (r.cancelled) CheckCancelled(run);
  if (!r.ok) {
    run.tail.Add(std::string("[transfer] ") + leg + ": " + r.error);
    throw JobFailure(ErrorCategory::kTransferFailed,
                     std::string(leg) + " " + transfer::TransferDirectionToString(direction) +
                         " failed: " + r.error);
  }
  Log(run, std::string(leg) + " " + transfer::TransferDirectionToString(direction) + " done via " +
               transfer::TransferStrategyToString(r.strategy) + " (" + std::to_string(r.bytes) +
               " bytes)");
}

void JobExecutor::Relay(RunState& run, transfer::ITransport& src, const std::string& src_path,
                        transfer::ITransport& dst, const std::string& dst_path, int64_t size_hint,
                        const char* leg) {
  CheckCancelled(run);
  transfer::RelayOptions relay_options;
  relay_options.chunk_bytes = static_cast<size_t>(options_.transfer.chunk_bytes);
  relay_options.progress_interval_ms = options_.transfer.progress_interval_ms;

  transfer::TransferResult r =
      transfer::RelayFile(src, src_path, dst, dst_path, size_hint,
                          TransferSink(events_, run.job.id, leg, "relay"), &run.cancel,
                          relay_options);
  if (r.cancelled) CheckCancelled(run);
  if (!r.ok) {
    run.tail.Add(std::string("[relay] ") + leg + ": " + r.error);
    throw JobFailure(ErrorCategory::kTransferFailed,
                     std::string(leg) + " relay failed: " + r.error);
  }
  Log(run, std::string(leg) + " relayed " + src.Describe() + " -> " + dst.Describe() + " (" +
               std::to_string(r.bytes) + " bytes)");
}

void JobExecutor::Complete(RunState& run, const std::string& final_path, int64_t output_size) {
  const int64_t now = clock_->NowUtcMs();
  run.job.status = JobStatus::kCompleted;
  run.job.output_path = final_path;
  run.job.output_size = output_size;
  run.job.progress_percent = 100.0;
  run.job.eta_seconds = 0;
  run.job.completed_at_ms = now;
  run.job.failure_reason.clear();

  model::JobLog log = model::MakeJobLog(run.job, JobStatus::kCompleted, now, run.avg_fps);
  store_.AppendJobLog(log);
  Persist(run);
  events_.EmitStatusChanged(run.job.id, run.job.status);
  events_.EmitCompleted(run.job.id, output_size, log.size_reduction);
  util::Logger::Info("[JobExecutor] Job " + std::to_string(run.job.id) + " completed: " +
                     final_path + " (" + std::to_string(output_size) + " bytes)");
}

// =============================================================================
// Helpers
// =============================================================================

void JobExecutor::Requeue(RunState& run, const std::string& reason) {
  run.job.status = JobStatus::kQueued;
  run.job.ClearAssignment();
  run.job.ClearTelemetry();
  Persist(run);
  events_.EmitStatusChanged(run.job.id, run.job.status);
  util::Logger::Info("[JobExecutor] Job " + std::to_string(run.job.id) + " back to queue: " +
                     reason);
}

void JobExecutor::SetStatus(RunState& run, JobStatus status) {
  if (run.job.status == status) return;
  run.job.status = status;
  Persist(run);
  events_.EmitStatusChanged(run.job.id, status);
}

void JobExecutor::Persist(RunState& run) {
  if (!store_.UpdateJob(run.job)) {
    util::Logger::Warn("[JobExecutor] Job " + std::to_string(run.job.id) +
                       " vanished from the store");
  }
}

void JobExecutor::CheckCancelled(RunState& run) {
  if (!run.cancel.IsCancelled()) return;
  switch (run.cancel.Reason()) {
    case util::CancelReason::kStuck:
      throw JobFailure(ErrorCategory::kStuck, "no progress within the stuck timeout");
    case util::CancelReason::kShutdown:
      throw JobFailure(ErrorCategory::kCancelled, "scheduler shutting down");
    case util::CancelReason::kOperator:
    case util::CancelReason::kNone:
      break;
  }
  throw JobFailure(ErrorCategory::kCancelled, "cancelled by operator");
}

void JobExecutor::Log(RunState& run, const std::string& message) {
  util::Logger::Info("[JobExecutor] Job " + std::to_string(run.job.id) + ": " + message);
  events_.EmitLog(run.job.id, message);
}

void JobExecutor::ProbeSourceDuration(RunState& run, const std::string& controller_path) {
  if (run.job.source_duration_s) return;
  if (!run.local.FileSize(controller_path)) return;
  std::optional<probe::MediaInfo> info = probe_.Probe(controller_path);
  if (!info) {
    util::Logger::Warn("[JobExecutor] Job " + std::to_string(run.job.id) + ": cannot probe " +
                       controller_path + "; progress percent unavailable");
    return;
  }
  run.job.source_duration_s = info->duration_s;
  if (run.job.source_size <= 0) run.job.source_size = info->size_bytes;
}

void JobExecutor::Cleanup(RunState& run, bool completed) {
  for (const auto& entry : run.cleanup) {
    if (entry.partial && completed) continue;
    if (!entry.transport->FileSize(entry.path)) continue;
    if (!entry.transport->RemoveFile(entry.path)) {
      util::Logger::Warn("[JobExecutor] Job " + std::to_string(run.job.id) + ": could not remove " +
                         entry.transport->Describe() + ":" + entry.path);
    }
  }
  run.cleanup.clear();
}

}  // namespace encodefarm::executor
