// Repository: Encodefarm
// Component: SQLite Record Store
// Purpose: IRecordStore on a single SQLite connection guarded by one mutex.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_STORE_SQLITE_RECORD_STORE_HPP_
#define ENCODEFARM_STORE_SQLITE_RECORD_STORE_HPP_

#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "encodefarm/store/IRecordStore.hpp"
#include "encodefarm/time/ITimeSource.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace encodefarm::store {

class SqliteRecordStore : public IRecordStore {
 public:
  // path may be ":memory:". Creates the schema when missing.
  // Throws std::runtime_error when the database cannot be opened.
  SqliteRecordStore(const std::string& path,
                    std::shared_ptr<time::ITimeSource> time_source);
  ~SqliteRecordStore() override;

  SqliteRecordStore(const SqliteRecordStore&) = delete;
  SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

  int64_t CreateJob(const model::Job& job) override;
  std::optional<model::Job> GetJob(int64_t job_id) override;
  bool UpdateJob(const model::Job& job) override;
  bool UpdateJobTelemetry(int64_t job_id, const JobTelemetry& telemetry) override;
  bool MarkSourcePrestaged(int64_t job_id, int64_t worker_id,
                           const std::string& worker_input_path) override;
  std::vector<model::Job> ListJobsByStatus(model::JobStatus status) override;
  std::vector<model::Job> ListQueuedJobs(size_t limit) override;
  std::vector<model::Job> ListDispatchableJobs(int64_t now_ms, size_t limit) override;
  std::map<int64_t, int> CountActiveJobsByWorker() override;

  int64_t CreateWorker(const model::Worker& worker) override;
  std::optional<model::Worker> GetWorker(int64_t worker_id) override;
  std::vector<model::Worker> ListWorkers() override;
  bool UpdateWorker(const model::Worker& worker) override;
  bool IncrementWorkerFailures(int64_t worker_id) override;

  int64_t AppendJobLog(const model::JobLog& log) override;
  std::vector<model::JobLog> ListJobLogs(int64_t job_id) override;

 private:
  class Statement;

  void Exec(const std::string& sql);
  void CreateSchema();
  std::vector<model::Job> QueryJobs(const std::string& where_clause,
                                    const std::function<void(Statement&)>& bind);
  static model::Job ReadJobRow(const Statement& s);
  std::vector<model::PathMapping> LoadPathMappings(int64_t worker_id);
  void SavePathMappings(int64_t worker_id, const std::vector<model::PathMapping>& mappings);

  sqlite3* db_ = nullptr;
  std::shared_ptr<time::ITimeSource> time_source_;
  std::mutex mutex_;
};

}  // namespace encodefarm::store

#endif  // ENCODEFARM_STORE_SQLITE_RECORD_STORE_HPP_
