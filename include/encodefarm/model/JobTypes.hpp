// Repository: Encodefarm
// Component: Job / Worker Record Types
// Purpose: Durable record shapes shared by the scheduler, the executor and
//          failure recovery, plus the closed enums they switch on.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_MODEL_JOB_TYPES_HPP_
#define ENCODEFARM_MODEL_JOB_TYPES_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace encodefarm::model {

// =============================================================================
// Job Status
// queued → transferring* → transcoding → verifying → replacing → completed
// Any non-terminal state may move to cancelled or failed.
// =============================================================================

enum class JobStatus {
  kQueued,
  kTransferring,
  kTranscoding,
  kVerifying,
  kReplacing,
  kCompleted,
  kFailed,
  kCancelled,
};

const char* JobStatusToString(JobStatus status);
bool JobStatusFromString(const std::string& text, JobStatus* out);

// Statuses counted against a worker's max_concurrent_jobs.
bool IsActiveStatus(JobStatus status);
bool IsTerminalStatus(JobStatus status);

// =============================================================================
// Transfer Mode
// How the source reaches the encoder and how the output returns.
// =============================================================================

enum class TransferMode {
  kLocal,        // Source path readable as-is by the controller host
  kMapped,       // Source path rewritten through a worker path mapping
  kSshPull,      // Local worker pulls the source from the origin over SSH
  kSshTransfer,  // Source pushed to a remote worker, output pulled back
};

const char* TransferModeToString(TransferMode mode);
bool TransferModeFromString(const std::string& text, TransferMode* out);

enum class ValidationStatus {
  kPassed,
  kFailed,
};

const char* ValidationStatusToString(ValidationStatus status);
bool ValidationStatusFromString(const std::string& text, ValidationStatus* out);

enum class WorkerStatus {
  kOffline,
  kOnline,
  kProvisioning,
  kSetupFailed,
};

const char* WorkerStatusToString(WorkerStatus status);
bool WorkerStatusFromString(const std::string& text, WorkerStatus* out);

// Hardware encoder families a worker can advertise.
enum class EncoderFamily {
  kNvenc,
  kQsv,
  kVideoToolbox,
};

const char* EncoderFamilyToString(EncoderFamily family);
bool EncoderFamilyFromString(const std::string& text, EncoderFamily* out);

// =============================================================================
// Error Category
// =============================================================================

enum class ErrorCategory {
  kSourceNotAccessible,
  kTransferFailed,
  kEncodeFailed,
  kValidationFailed,
  kWorkerUnavailable,
  kCancelled,
  kStuck,
};

const char* ErrorCategoryToString(ErrorCategory category);

// =============================================================================
// Records
// =============================================================================

// Opaque encode configuration produced upstream (video_codec, hw_accel, ...).
using EncodeConfig = std::map<std::string, std::string>;

struct PathMapping {
  std::string source_prefix;
  std::string target_prefix;
};

struct Job {
  int64_t id = 0;
  std::optional<int64_t> media_item_id;
  EncodeConfig config;
  JobStatus status = JobStatus::kQueued;
  int priority = 0;

  // Live telemetry. Null until the encoder reports.
  std::optional<double> progress_percent;
  std::optional<double> current_fps;
  std::optional<int64_t> eta_seconds;
  std::optional<int64_t> checkpoint_frame;

  std::string source_path;
  int64_t source_size = 0;
  std::optional<double> source_duration_s;
  std::optional<std::string> output_path;
  int64_t output_size = 0;

  // Meaningful only once assigned_worker_id is set.
  std::optional<TransferMode> transfer_mode;
  std::optional<std::string> worker_input_path;
  std::optional<std::string> worker_output_path;
  std::optional<int64_t> assigned_worker_id;
  bool source_prestaged = false;

  int retry_count = 0;
  int max_retries = 3;
  std::optional<ValidationStatus> validation_status;
  std::optional<int64_t> scheduled_after_ms;
  bool is_manual = false;

  std::string encoder_command;
  std::string diagnostic_log;
  std::string failure_reason;

  int64_t created_at_ms = 0;
  int64_t updated_at_ms = 0;
  std::optional<int64_t> started_at_ms;
  std::optional<int64_t> completed_at_ms;

  void ClearTelemetry();
  // Drops the worker, the mode, both worker-side paths and the prestaged flag.
  void ClearAssignment();
};

struct Worker {
  int64_t id = 0;
  std::string name;
  std::string hostname;
  int port = 22;
  std::string ssh_username;
  std::string ssh_key_path;
  bool is_local = false;
  bool is_enabled = true;
  WorkerStatus status = WorkerStatus::kOffline;
  int max_concurrent_jobs = 1;
  std::optional<double> performance_score;
  int consecutive_failures = 0;
  std::vector<PathMapping> path_mappings;
  std::set<EncoderFamily> hardware_encode_capabilities;
  std::string working_directory = "/tmp/encodefarm";
  std::optional<int64_t> last_heartbeat_ms;

  bool IsEligible() const {
    return is_enabled && status == WorkerStatus::kOnline;
  }
  bool HasCapability(EncoderFamily family) const {
    return hardware_encode_capabilities.count(family) > 0;
  }
};

// Written once per terminal completed/failed transition.
struct JobLog {
  int64_t id = 0;
  int64_t job_id = 0;
  std::optional<int64_t> worker_id;
  std::optional<int64_t> media_item_id;
  JobStatus status = JobStatus::kCompleted;
  int64_t source_size = 0;
  int64_t target_size = 0;
  std::optional<double> size_reduction;  // 1 - target/source
  double duration_seconds = 0.0;
  std::optional<double> avg_fps;
  std::string failure_reason;
  int64_t created_at_ms = 0;
};

// Summary row for a job entering status (completed or failed) at now_ms.
JobLog MakeJobLog(const Job& job, JobStatus status, int64_t now_ms,
                  std::optional<double> avg_fps = std::nullopt);

}  // namespace encodefarm::model

#endif  // ENCODEFARM_MODEL_JOB_TYPES_HPP_
