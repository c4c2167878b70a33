// Repository: Encodefarm
// Component: Job / Worker Record Types
// Purpose: Enum string conversions and record helpers.
// Copyright (c) 2025 RetroVue

#include "encodefarm/model/JobTypes.hpp"

namespace encodefarm::model {

const char* JobStatusToString(JobStatus status) {
  switch (status) {
    case JobStatus::kQueued:       return "queued";
    case JobStatus::kTransferring: return "transferring";
    case JobStatus::kTranscoding:  return "transcoding";
    case JobStatus::kVerifying:    return "verifying";
    case JobStatus::kReplacing:    return "replacing";
    case JobStatus::kCompleted:    return "completed";
    case JobStatus::kFailed:       return "failed";
    case JobStatus::kCancelled:    return "cancelled";
  }
  return "unknown";
}

bool JobStatusFromString(const std::string& text, JobStatus* out) {
  static const JobStatus kAll[] = {
      JobStatus::kQueued,    JobStatus::kTransferring, JobStatus::kTranscoding,
      JobStatus::kVerifying, JobStatus::kReplacing,    JobStatus::kCompleted,
      JobStatus::kFailed,    JobStatus::kCancelled,
  };
  for (JobStatus s : kAll) {
    if (text == JobStatusToString(s)) {
      *out = s;
      return true;
    }
  }
  return false;
}

bool IsActiveStatus(JobStatus status) {
  switch (status) {
    case JobStatus::kTransferring:
    case JobStatus::kTranscoding:
    case JobStatus::kVerifying:
    case JobStatus::kReplacing:
      return true;
    case JobStatus::kQueued:
    case JobStatus::kCompleted:
    case JobStatus::kFailed:
    case JobStatus::kCancelled:
      return false;
  }
  return false;
}

bool IsTerminalStatus(JobStatus status) {
  return status == JobStatus::kCompleted || status == JobStatus::kFailed ||
         status == JobStatus::kCancelled;
}

const char* TransferModeToString(TransferMode mode) {
  switch (mode) {
    case TransferMode::kLocal:       return "local";
    case TransferMode::kMapped:      return "mapped";
    case TransferMode::kSshPull:     return "ssh_pull";
    case TransferMode::kSshTransfer: return "ssh_transfer";
  }
  return "unknown";
}

bool TransferModeFromString(const std::string& text, TransferMode* out) {
  if (text == "local") { *out = TransferMode::kLocal; return true; }
  if (text == "mapped") { *out = TransferMode::kMapped; return true; }
  if (text == "ssh_pull") { *out = TransferMode::kSshPull; return true; }
  if (text == "ssh_transfer") { *out = TransferMode::kSshTransfer; return true; }
  return false;
}

const char* ValidationStatusToString(ValidationStatus status) {
  switch (status) {
    case ValidationStatus::kPassed: return "passed";
    case ValidationStatus::kFailed: return "failed";
  }
  return "unknown";
}

bool ValidationStatusFromString(const std::string& text, ValidationStatus* out) {
  if (text == "passed") { *out = ValidationStatus::kPassed; return true; }
  if (text == "failed") { *out = ValidationStatus::kFailed; return true; }
  return false;
}

const char* WorkerStatusToString(WorkerStatus status) {
  switch (status) {
    case WorkerStatus::kOffline:      return "offline";
    case WorkerStatus::kOnline:       return "online";
    case WorkerStatus::kProvisioning: return "provisioning";
    case WorkerStatus::kSetupFailed:  return "setup_failed";
  }
  return "unknown";
}

bool WorkerStatusFromString(const std::string& text, WorkerStatus* out) {
  if (text == "offline") { *out = WorkerStatus::kOffline; return true; }
  if (text == "online") { *out = WorkerStatus::kOnline; return true; }
  if (text == "provisioning") { *out = WorkerStatus::kProvisioning; return true; }
  if (text == "setup_failed") { *out = WorkerStatus::kSetupFailed; return true; }
  return false;
}

const char* EncoderFamilyToString(EncoderFamily family) {
  switch (family) {
    case EncoderFamily::kNvenc:        return "nvenc";
    case EncoderFamily::kQsv:          return "qsv";
    case EncoderFamily::kVideoToolbox: return "videotoolbox";
  }
  return "unknown";
}

bool EncoderFamilyFromString(const std::string& text, EncoderFamily* out) {
  if (text == "nvenc") { *out = EncoderFamily::kNvenc; return true; }
  if (text == "qsv") { *out = EncoderFamily::kQsv; return true; }
  if (text == "videotoolbox") { *out = EncoderFamily::kVideoToolbox; return true; }
  return false;
}

const char* ErrorCategoryToString(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::kSourceNotAccessible: return "SourceNotAccessible";
    case ErrorCategory::kTransferFailed:      return "TransferFailed";
    case ErrorCategory::kEncodeFailed:        return "EncodeFailed";
    case ErrorCategory::kValidationFailed:    return "ValidationFailed";
    case ErrorCategory::kWorkerUnavailable:   return "WorkerUnavailable";
    case ErrorCategory::kCancelled:           return "Cancelled";
    case ErrorCategory::kStuck:               return "Stuck";
  }
  return "Unknown";
}

void Job::ClearTelemetry() {
  progress_percent.reset();
  current_fps.reset();
  eta_seconds.reset();
  checkpoint_frame.reset();
}

void Job::ClearAssignment() {
  assigned_worker_id.reset();
  transfer_mode.reset();
  worker_input_path.reset();
  worker_output_path.reset();
  source_prestaged = false;
}

JobLog MakeJobLog(const Job& job, JobStatus status, int64_t now_ms,
                  std::optional<double> avg_fps) {
  JobLog log;
  log.job_id = job.id;
  log.worker_id = job.assigned_worker_id;
  log.media_item_id = job.media_item_id;
  log.status = status;
  log.source_size = job.source_size;
  log.target_size = status == JobStatus::kCompleted ? job.output_size : 0;
  if (status == JobStatus::kCompleted && job.source_size > 0 && job.output_size > 0) {
    log.size_reduction = 1.0 - static_cast<double>(job.output_size) /
                                   static_cast<double>(job.source_size);
  }
  const int64_t started = job.started_at_ms.value_or(job.created_at_ms);
  log.duration_seconds = now_ms > started ? static_cast<double>(now_ms - started) / 1000.0 : 0.0;
  log.avg_fps = avg_fps ? avg_fps : job.current_fps;
  log.failure_reason = status == JobStatus::kFailed ? job.failure_reason : "";
  log.created_at_ms = now_ms;
  return log;
}

}  // namespace encodefarm::model
