// Repository: Encodefarm
// Component: Record Store Interface
// Purpose: Durable single-writer store for Job, Worker and JobLog records.
//          Every component mutates state only through this interface; there
//          is no other shared mutable job state.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_STORE_IRECORD_STORE_HPP_
#define ENCODEFARM_STORE_IRECORD_STORE_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "encodefarm/model/JobTypes.hpp"

namespace encodefarm::store {

struct JobTelemetry {
  std::optional<double> progress_percent;
  std::optional<double> current_fps;
  std::optional<int64_t> eta_seconds;
  std::optional<int64_t> checkpoint_frame;
};

// Implementations throw std::runtime_error when the backing store fails;
// "not found" is reported through std::nullopt / false.
class IRecordStore {
 public:
  virtual ~IRecordStore() = default;

  // ---- Jobs -------------------------------------------------------------

  // Inserts the job, stamps created_at/updated_at and returns the new id.
  virtual int64_t CreateJob(const model::Job& job) = 0;
  virtual std::optional<model::Job> GetJob(int64_t job_id) = 0;

  // Writes every column of the job row and bumps updated_at.
  virtual bool UpdateJob(const model::Job& job) = 0;

  // Telemetry-only write; bumps updated_at (stuck detection reads it).
  virtual bool UpdateJobTelemetry(int64_t job_id, const JobTelemetry& telemetry) = 0;

  // Prefetch result. Applied only while the job is still queued on the
  // same worker; returns false otherwise.
  virtual bool MarkSourcePrestaged(int64_t job_id, int64_t worker_id,
                                   const std::string& worker_input_path) = 0;

  virtual std::vector<model::Job> ListJobsByStatus(model::JobStatus status) = 0;

  // Queued jobs in dequeue order: priority descending, creation ascending.
  virtual std::vector<model::Job> ListQueuedJobs(size_t limit) = 0;
  // Queued jobs whose backoff has elapsed at now_ms, in dequeue order.
  virtual std::vector<model::Job> ListDispatchableJobs(int64_t now_ms, size_t limit) = 0;

  // Active-state job counts keyed by assigned worker id.
  virtual std::map<int64_t, int> CountActiveJobsByWorker() = 0;

  // ---- Workers ----------------------------------------------------------

  virtual int64_t CreateWorker(const model::Worker& worker) = 0;
  virtual std::optional<model::Worker> GetWorker(int64_t worker_id) = 0;
  virtual std::vector<model::Worker> ListWorkers() = 0;
  virtual bool UpdateWorker(const model::Worker& worker) = 0;
  virtual bool IncrementWorkerFailures(int64_t worker_id) = 0;

  // ---- Job logs ---------------------------------------------------------

  virtual int64_t AppendJobLog(const model::JobLog& log) = 0;
  virtual std::vector<model::JobLog> ListJobLogs(int64_t job_id) = 0;
};

}  // namespace encodefarm::store

#endif  // ENCODEFARM_STORE_IRECORD_STORE_HPP_
