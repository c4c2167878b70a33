// Repository: Encodefarm
// Component: SQLite Record Store
// Purpose: Job / Worker / JobLog persistence on SQLite.
// Copyright (c) 2025 RetroVue

#include "encodefarm/store/SqliteRecordStore.hpp"

#include <sqlite3.h>

#include <sstream>
#include <stdexcept>

#include "encodefarm/util/FlatJson.hpp"
#include "encodefarm/util/Logger.hpp"

namespace encodefarm::store {

using model::Job;
using model::JobLog;
using model::JobStatus;
using model::PathMapping;
using model::Worker;

// =============================================================================
// Statement: RAII prepared statement with sequential binding
// =============================================================================

class SqliteRecordStore::Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
      throw std::runtime_error("[SqliteRecordStore] prepare failed: " +
                               std::string(sqlite3_errmsg(db)) + " sql=" + sql);
    }
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& Bind(int64_t v) {
    Check(sqlite3_bind_int64(stmt_, ++index_, v));
    return *this;
  }
  Statement& Bind(int v) { return Bind(static_cast<int64_t>(v)); }
  Statement& Bind(bool v) { return Bind(static_cast<int64_t>(v ? 1 : 0)); }
  Statement& Bind(double v) {
    Check(sqlite3_bind_double(stmt_, ++index_, v));
    return *this;
  }
  Statement& Bind(const std::string& v) {
    Check(sqlite3_bind_text(stmt_, ++index_, v.c_str(), static_cast<int>(v.size()),
                            SQLITE_TRANSIENT));
    return *this;
  }
  Statement& Bind(const char* v) { return Bind(std::string(v)); }
  Statement& BindNull() {
    Check(sqlite3_bind_null(stmt_, ++index_));
    return *this;
  }
  template <typename T>
  Statement& Bind(const std::optional<T>& v) {
    if (!v.has_value()) return BindNull();
    return Bind(*v);
  }

  // True when a row is available.
  bool Step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error("[SqliteRecordStore] step failed: " +
                             std::string(sqlite3_errmsg(db_)));
  }

  void Run() { Step(); }

  bool IsNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
  int64_t Int64(int col, int64_t def = 0) const {
    return IsNull(col) ? def : sqlite3_column_int64(stmt_, col);
  }
  int Int(int col, int def = 0) const {
    return IsNull(col) ? def : sqlite3_column_int(stmt_, col);
  }
  double Double(int col, double def = 0.0) const {
    return IsNull(col) ? def : sqlite3_column_double(stmt_, col);
  }
  std::string Text(int col) const {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col));
    return text ? text : "";
  }
  std::optional<int64_t> OptInt64(int col) const {
    if (IsNull(col)) return std::nullopt;
    return sqlite3_column_int64(stmt_, col);
  }
  std::optional<double> OptDouble(int col) const {
    if (IsNull(col)) return std::nullopt;
    return sqlite3_column_double(stmt_, col);
  }
  std::optional<std::string> OptText(int col) const {
    if (IsNull(col)) return std::nullopt;
    return Text(col);
  }

 private:
  void Check(int rc) {
    if (rc != SQLITE_OK) {
      throw std::runtime_error("[SqliteRecordStore] bind failed: " +
                               std::string(sqlite3_errmsg(db_)));
    }
  }

  sqlite3* db_;
  sqlite3_stmt* stmt_ = nullptr;
  int index_ = 0;
};

namespace {

constexpr const char* kJobColumns =
    "id, media_item_id, config, status, priority, "
    "progress_percent, current_fps, eta_seconds, checkpoint_frame, "
    "source_path, source_size, source_duration_s, output_path, output_size, "
    "transfer_mode, worker_input_path, worker_output_path, assigned_worker_id, "
    "source_prestaged, retry_count, max_retries, validation_status, "
    "scheduled_after_ms, is_manual, encoder_command, diagnostic_log, "
    "failure_reason, created_at_ms, updated_at_ms, started_at_ms, completed_at_ms";

std::string JoinCapabilities(const std::set<model::EncoderFamily>& caps) {
  std::string out;
  for (auto family : caps) {
    if (!out.empty()) out += ',';
    out += model::EncoderFamilyToString(family);
  }
  return out;
}

std::set<model::EncoderFamily> SplitCapabilities(const std::string& text) {
  std::set<model::EncoderFamily> caps;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    model::EncoderFamily family;
    if (model::EncoderFamilyFromString(item, &family)) {
      caps.insert(family);
    } else if (!item.empty()) {
      util::Logger::Warn("[SqliteRecordStore] Ignoring unknown encoder family: " + item);
    }
  }
  return caps;
}

}  // namespace

// =============================================================================
// Lifecycle
// =============================================================================

SqliteRecordStore::SqliteRecordStore(const std::string& path,
                                     std::shared_ptr<time::ITimeSource> time_source)
    : time_source_(std::move(time_source)) {
  if (!time_source_) {
    time_source_ = std::make_shared<time::SystemTimeSource>();
  }
  int rc = sqlite3_open_v2(path.c_str(), &db_,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  if (rc != SQLITE_OK) {
    std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("[SqliteRecordStore] Cannot open " + path + ": " + message);
  }
  sqlite3_busy_timeout(db_, 5000);
  Exec("PRAGMA foreign_keys = ON");
  if (path != ":memory:") {
    Exec("PRAGMA journal_mode = WAL");
  }
  CreateSchema();
}

SqliteRecordStore::~SqliteRecordStore() {
  if (db_) sqlite3_close(db_);
}

void SqliteRecordStore::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string message = err ? err : "unknown error";
    sqlite3_free(err);
    throw std::runtime_error("[SqliteRecordStore] exec failed: " + message);
  }
}

void SqliteRecordStore::CreateSchema() {
  Exec(R"SQL(
    CREATE TABLE IF NOT EXISTS workers (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      name TEXT NOT NULL,
      hostname TEXT NOT NULL DEFAULT '',
      port INTEGER NOT NULL DEFAULT 22,
      ssh_username TEXT NOT NULL DEFAULT '',
      ssh_key_path TEXT NOT NULL DEFAULT '',
      is_local INTEGER NOT NULL DEFAULT 0,
      is_enabled INTEGER NOT NULL DEFAULT 1,
      status TEXT NOT NULL DEFAULT 'offline',
      max_concurrent_jobs INTEGER NOT NULL DEFAULT 1,
      performance_score REAL,
      consecutive_failures INTEGER NOT NULL DEFAULT 0,
      hw_capabilities TEXT NOT NULL DEFAULT '',
      working_directory TEXT NOT NULL DEFAULT '/tmp/encodefarm',
      last_heartbeat_ms INTEGER
    );
    CREATE TABLE IF NOT EXISTS worker_path_mappings (
      worker_id INTEGER NOT NULL REFERENCES workers(id) ON DELETE CASCADE,
      position INTEGER NOT NULL,
      source_prefix TEXT NOT NULL,
      target_prefix TEXT NOT NULL,
      PRIMARY KEY (worker_id, position)
    );
    CREATE TABLE IF NOT EXISTS jobs (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      media_item_id INTEGER,
      config TEXT NOT NULL DEFAULT '{}',
      status TEXT NOT NULL DEFAULT 'queued',
      priority INTEGER NOT NULL DEFAULT 0,
      progress_percent REAL,
      current_fps REAL,
      eta_seconds INTEGER,
      checkpoint_frame INTEGER,
      source_path TEXT NOT NULL,
      source_size INTEGER NOT NULL DEFAULT 0,
      source_duration_s REAL,
      output_path TEXT,
      output_size INTEGER NOT NULL DEFAULT 0,
      transfer_mode TEXT,
      worker_input_path TEXT,
      worker_output_path TEXT,
      assigned_worker_id INTEGER,
      source_prestaged INTEGER NOT NULL DEFAULT 0,
      retry_count INTEGER NOT NULL DEFAULT 0,
      max_retries INTEGER NOT NULL DEFAULT 3,
      validation_status TEXT,
      scheduled_after_ms INTEGER,
      is_manual INTEGER NOT NULL DEFAULT 0,
      encoder_command TEXT NOT NULL DEFAULT '',
      diagnostic_log TEXT NOT NULL DEFAULT '',
      failure_reason TEXT NOT NULL DEFAULT '',
      created_at_ms INTEGER NOT NULL,
      updated_at_ms INTEGER NOT NULL,
      started_at_ms INTEGER,
      completed_at_ms INTEGER
    );
    CREATE INDEX IF NOT EXISTS idx_jobs_status ON jobs(status);
    CREATE INDEX IF NOT EXISTS idx_jobs_dequeue ON jobs(status, priority DESC, created_at_ms ASC);
    CREATE INDEX IF NOT EXISTS idx_jobs_worker ON jobs(assigned_worker_id, status);
    CREATE TABLE IF NOT EXISTS job_logs (
      id INTEGER PRIMARY KEY AUTOINCREMENT,
      job_id INTEGER NOT NULL,
      worker_id INTEGER,
      media_item_id INTEGER,
      status TEXT NOT NULL,
      source_size INTEGER NOT NULL DEFAULT 0,
      target_size INTEGER NOT NULL DEFAULT 0,
      size_reduction REAL,
      duration_seconds REAL NOT NULL DEFAULT 0,
      avg_fps REAL,
      failure_reason TEXT NOT NULL DEFAULT '',
      created_at_ms INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_job_logs_job ON job_logs(job_id);
  )SQL");
}

// =============================================================================
// Jobs
// =============================================================================

int64_t SqliteRecordStore::CreateJob(const Job& job) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t now = time_source_->NowUtcMs();
  Statement s(db_,
              "INSERT INTO jobs (media_item_id, config, status, priority, source_path, "
              "source_size, source_duration_s, output_path, transfer_mode, "
              "worker_input_path, worker_output_path, assigned_worker_id, "
              "source_prestaged, retry_count, max_retries, scheduled_after_ms, is_manual, "
              "created_at_ms, updated_at_ms) "
              "VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)");
  s.Bind(job.media_item_id)
      .Bind(util::EncodeFlatObject(job.config))
      .Bind(model::JobStatusToString(job.status))
      .Bind(job.priority)
      .Bind(job.source_path)
      .Bind(job.source_size)
      .Bind(job.source_duration_s)
      .Bind(job.output_path);
  if (job.transfer_mode) {
    s.Bind(model::TransferModeToString(*job.transfer_mode));
  } else {
    s.BindNull();
  }
  s.Bind(job.worker_input_path)
      .Bind(job.worker_output_path)
      .Bind(job.assigned_worker_id)
      .Bind(job.source_prestaged)
      .Bind(job.retry_count)
      .Bind(job.max_retries)
      .Bind(job.scheduled_after_ms)
      .Bind(job.is_manual)
      .Bind(job.created_at_ms > 0 ? job.created_at_ms : now)
      .Bind(now);
  s.Run();
  return sqlite3_last_insert_rowid(db_);
}

std::optional<Job> SqliteRecordStore::GetJob(int64_t job_id) {
  auto rows = QueryJobs("WHERE id = ?", [job_id](Statement& s) { s.Bind(job_id); });
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

bool SqliteRecordStore::UpdateJob(const Job& job) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement s(db_,
              "UPDATE jobs SET media_item_id=?, config=?, status=?, priority=?, "
              "progress_percent=?, current_fps=?, eta_seconds=?, checkpoint_frame=?, "
              "source_path=?, source_size=?, source_duration_s=?, output_path=?, "
              "output_size=?, transfer_mode=?, worker_input_path=?, worker_output_path=?, "
              "assigned_worker_id=?, source_prestaged=?, retry_count=?, max_retries=?, "
              "validation_status=?, scheduled_after_ms=?, is_manual=?, encoder_command=?, "
              "diagnostic_log=?, failure_reason=?, updated_at_ms=?, started_at_ms=?, "
              "completed_at_ms=? WHERE id=?");
  s.Bind(job.media_item_id)
      .Bind(util::EncodeFlatObject(job.config))
      .Bind(model::JobStatusToString(job.status))
      .Bind(job.priority)
      .Bind(job.progress_percent)
      .Bind(job.current_fps)
      .Bind(job.eta_seconds)
      .Bind(job.checkpoint_frame)
      .Bind(job.source_path)
      .Bind(job.source_size)
      .Bind(job.source_duration_s)
      .Bind(job.output_path)
      .Bind(job.output_size);
  if (job.transfer_mode) {
    s.Bind(model::TransferModeToString(*job.transfer_mode));
  } else {
    s.BindNull();
  }
  s.Bind(job.worker_input_path)
      .Bind(job.worker_output_path)
      .Bind(job.assigned_worker_id)
      .Bind(job.source_prestaged)
      .Bind(job.retry_count)
      .Bind(job.max_retries);
  if (job.validation_status) {
    s.Bind(model::ValidationStatusToString(*job.validation_status));
  } else {
    s.BindNull();
  }
  s.Bind(job.scheduled_after_ms)
      .Bind(job.is_manual)
      .Bind(job.encoder_command)
      .Bind(job.diagnostic_log)
      .Bind(job.failure_reason)
      .Bind(time_source_->NowUtcMs())
      .Bind(job.started_at_ms)
      .Bind(job.completed_at_ms)
      .Bind(job.id);
  s.Run();
  return sqlite3_changes(db_) > 0;
}

bool SqliteRecordStore::UpdateJobTelemetry(int64_t job_id, const JobTelemetry& t) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement s(db_,
              "UPDATE jobs SET progress_percent=?, current_fps=?, eta_seconds=?, "
              "checkpoint_frame=?, updated_at_ms=? WHERE id=?");
  s.Bind(t.progress_percent)
      .Bind(t.current_fps)
      .Bind(t.eta_seconds)
      .Bind(t.checkpoint_frame)
      .Bind(time_source_->NowUtcMs())
      .Bind(job_id);
  s.Run();
  return sqlite3_changes(db_) > 0;
}

bool SqliteRecordStore::MarkSourcePrestaged(int64_t job_id, int64_t worker_id,
                                            const std::string& worker_input_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement s(db_,
              "UPDATE jobs SET source_prestaged=1, worker_input_path=?, updated_at_ms=? "
              "WHERE id=? AND status='queued' AND assigned_worker_id=?");
  s.Bind(worker_input_path).Bind(time_source_->NowUtcMs()).Bind(job_id).Bind(worker_id);
  s.Run();
  return sqlite3_changes(db_) > 0;
}

std::vector<Job> SqliteRecordStore::ListJobsByStatus(JobStatus status) {
  return QueryJobs("WHERE status = ? ORDER BY priority DESC, created_at_ms ASC, id ASC",
                   [status](Statement& s) { s.Bind(model::JobStatusToString(status)); });
}

std::vector<Job> SqliteRecordStore::ListQueuedJobs(size_t limit) {
  return QueryJobs(
      "WHERE status = 'queued' ORDER BY priority DESC, created_at_ms ASC, id ASC LIMIT ?",
      [limit](Statement& s) { s.Bind(static_cast<int64_t>(limit)); });
}

std::vector<Job> SqliteRecordStore::ListDispatchableJobs(int64_t now_ms, size_t limit) {
  return QueryJobs(
      "WHERE status = 'queued' AND (scheduled_after_ms IS NULL OR scheduled_after_ms <= ?) "
      "ORDER BY priority DESC, created_at_ms ASC, id ASC LIMIT ?",
      [now_ms, limit](Statement& s) { s.Bind(now_ms).Bind(static_cast<int64_t>(limit)); });
}

std::map<int64_t, int> SqliteRecordStore::CountActiveJobsByWorker() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement s(db_,
              "SELECT assigned_worker_id, COUNT(*) FROM jobs "
              "WHERE assigned_worker_id IS NOT NULL AND status IN "
              "('transferring','transcoding','verifying','replacing') "
              "GROUP BY assigned_worker_id");
  std::map<int64_t, int> counts;
  while (s.Step()) {
    counts[s.Int64(0)] = s.Int(1);
  }
  return counts;
}

std::vector<Job> SqliteRecordStore::QueryJobs(const std::string& where_clause,
                                              const std::function<void(Statement&)>& bind) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement s(db_, std::string("SELECT ") + kJobColumns + " FROM jobs " + where_clause);
  if (bind) bind(s);
  std::vector<Job> jobs;
  while (s.Step()) {
    jobs.push_back(ReadJobRow(s));
  }
  return jobs;
}

Job SqliteRecordStore::ReadJobRow(const Statement& s) {
  Job job;
  job.id = s.Int64(0);
  job.media_item_id = s.OptInt64(1);
  if (!util::DecodeFlatObject(s.Text(2), &job.config)) {
    util::Logger::Warn("[SqliteRecordStore] Job " + std::to_string(job.id) +
                       " has an unreadable config column");
  }
  if (!model::JobStatusFromString(s.Text(3), &job.status)) {
    util::Logger::Warn("[SqliteRecordStore] Job " + std::to_string(job.id) +
                       " has unknown status '" + s.Text(3) + "'");
  }
  job.priority = s.Int(4);
  job.progress_percent = s.OptDouble(5);
  job.current_fps = s.OptDouble(6);
  job.eta_seconds = s.OptInt64(7);
  job.checkpoint_frame = s.OptInt64(8);
  job.source_path = s.Text(9);
  job.source_size = s.Int64(10);
  job.source_duration_s = s.OptDouble(11);
  job.output_path = s.OptText(12);
  job.output_size = s.Int64(13);
  if (auto mode_text = s.OptText(14)) {
    model::TransferMode mode;
    if (model::TransferModeFromString(*mode_text, &mode)) job.transfer_mode = mode;
  }
  job.worker_input_path = s.OptText(15);
  job.worker_output_path = s.OptText(16);
  job.assigned_worker_id = s.OptInt64(17);
  job.source_prestaged = s.Int(18) != 0;
  job.retry_count = s.Int(19);
  job.max_retries = s.Int(20, 3);
  if (auto validation = s.OptText(21)) {
    model::ValidationStatus v;
    if (model::ValidationStatusFromString(*validation, &v)) job.validation_status = v;
  }
  job.scheduled_after_ms = s.OptInt64(22);
  job.is_manual = s.Int(23) != 0;
  job.encoder_command = s.Text(24);
  job.diagnostic_log = s.Text(25);
  job.failure_reason = s.Text(26);
  job.created_at_ms = s.Int64(27);
  job.updated_at_ms = s.Int64(28);
  job.started_at_ms = s.OptInt64(29);
  job.completed_at_ms = s.OptInt64(30);
  return job;
}

// =============================================================================
// Workers
// =============================================================================

int64_t SqliteRecordStore::CreateWorker(const Worker& w) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement s(db_,
              "INSERT INTO workers (name, hostname, port, ssh_username, ssh_key_path, "
              "is_local, is_enabled, status, max_concurrent_jobs, performance_score, "
              "consecutive_failures, hw_capabilities, working_directory, last_heartbeat_ms) "
              "VALUES (?,?,?,?,?,?,?,?,?,?,?,?,?,?)");
  s.Bind(w.name)
      .Bind(w.hostname)
      .Bind(w.port)
      .Bind(w.ssh_username)
      .Bind(w.ssh_key_path)
      .Bind(w.is_local)
      .Bind(w.is_enabled)
      .Bind(model::WorkerStatusToString(w.status))
      .Bind(w.max_concurrent_jobs)
      .Bind(w.performance_score)
      .Bind(w.consecutive_failures)
      .Bind(JoinCapabilities(w.hardware_encode_capabilities))
      .Bind(w.working_directory)
      .Bind(w.last_heartbeat_ms);
  s.Run();
  const int64_t id = sqlite3_last_insert_rowid(db_);
  SavePathMappings(id, w.path_mappings);
  return id;
}

std::optional<Worker> SqliteRecordStore::GetWorker(int64_t worker_id) {
  for (auto& w : ListWorkers()) {
    if (w.id == worker_id) return w;
  }
  return std::nullopt;
}

std::vector<Worker> SqliteRecordStore::ListWorkers() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Worker> workers;
  {
    Statement s(db_,
                "SELECT id, name, hostname, port, ssh_username, ssh_key_path, is_local, "
                "is_enabled, status, max_concurrent_jobs, performance_score, "
                "consecutive_failures, hw_capabilities, working_directory, "
                "last_heartbeat_ms FROM workers ORDER BY id");
    while (s.Step()) {
      Worker w;
      w.id = s.Int64(0);
      w.name = s.Text(1);
      w.hostname = s.Text(2);
      w.port = s.Int(3, 22);
      w.ssh_username = s.Text(4);
      w.ssh_key_path = s.Text(5);
      w.is_local = s.Int(6) != 0;
      w.is_enabled = s.Int(7) != 0;
      if (!model::WorkerStatusFromString(s.Text(8), &w.status)) {
        w.status = model::WorkerStatus::kOffline;
      }
      w.max_concurrent_jobs = s.Int(9, 1);
      w.performance_score = s.OptDouble(10);
      w.consecutive_failures = s.Int(11);
      w.hardware_encode_capabilities = SplitCapabilities(s.Text(12));
      w.working_directory = s.Text(13);
      w.last_heartbeat_ms = s.OptInt64(14);
      workers.push_back(std::move(w));
    }
  }
  for (auto& w : workers) {
    w.path_mappings = LoadPathMappings(w.id);
  }
  return workers;
}

bool SqliteRecordStore::UpdateWorker(const Worker& w) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement s(db_,
              "UPDATE workers SET name=?, hostname=?, port=?, ssh_username=?, "
              "ssh_key_path=?, is_local=?, is_enabled=?, status=?, max_concurrent_jobs=?, "
              "performance_score=?, consecutive_failures=?, hw_capabilities=?, "
              "working_directory=?, last_heartbeat_ms=? WHERE id=?");
  s.Bind(w.name)
      .Bind(w.hostname)
      .Bind(w.port)
      .Bind(w.ssh_username)
      .Bind(w.ssh_key_path)
      .Bind(w.is_local)
      .Bind(w.is_enabled)
      .Bind(model::WorkerStatusToString(w.status))
      .Bind(w.max_concurrent_jobs)
      .Bind(w.performance_score)
      .Bind(w.consecutive_failures)
      .Bind(JoinCapabilities(w.hardware_encode_capabilities))
      .Bind(w.working_directory)
      .Bind(w.last_heartbeat_ms)
      .Bind(w.id);
  s.Run();
  if (sqlite3_changes(db_) == 0) return false;
  SavePathMappings(w.id, w.path_mappings);
  return true;
}

bool SqliteRecordStore::IncrementWorkerFailures(int64_t worker_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement s(db_,
              "UPDATE workers SET consecutive_failures = consecutive_failures + 1 "
              "WHERE id=?");
  s.Bind(worker_id);
  s.Run();
  return sqlite3_changes(db_) > 0;
}

// Caller holds mutex_.
std::vector<PathMapping> SqliteRecordStore::LoadPathMappings(int64_t worker_id) {
  Statement s(db_,
              "SELECT source_prefix, target_prefix FROM worker_path_mappings "
              "WHERE worker_id=? ORDER BY position");
  s.Bind(worker_id);
  std::vector<PathMapping> mappings;
  while (s.Step()) {
    mappings.push_back(PathMapping{s.Text(0), s.Text(1)});
  }
  return mappings;
}

// Caller holds mutex_.
void SqliteRecordStore::SavePathMappings(int64_t worker_id,
                                         const std::vector<PathMapping>& mappings) {
  {
    Statement del(db_, "DELETE FROM worker_path_mappings WHERE worker_id=?");
    del.Bind(worker_id);
    del.Run();
  }
  int position = 0;
  for (const auto& m : mappings) {
    Statement ins(db_,
                  "INSERT INTO worker_path_mappings (worker_id, position, source_prefix, "
                  "target_prefix) VALUES (?,?,?,?)");
    ins.Bind(worker_id).Bind(position++).Bind(m.source_prefix).Bind(m.target_prefix);
    ins.Run();
  }
}

// =============================================================================
// Job logs
// =============================================================================

int64_t SqliteRecordStore::AppendJobLog(const JobLog& log) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement s(db_,
              "INSERT INTO job_logs (job_id, worker_id, media_item_id, status, source_size, "
              "target_size, size_reduction, duration_seconds, avg_fps, failure_reason, "
              "created_at_ms) VALUES (?,?,?,?,?,?,?,?,?,?,?)");
  s.Bind(log.job_id)
      .Bind(log.worker_id)
      .Bind(log.media_item_id)
      .Bind(model::JobStatusToString(log.status))
      .Bind(log.source_size)
      .Bind(log.target_size)
      .Bind(log.size_reduction)
      .Bind(log.duration_seconds)
      .Bind(log.avg_fps)
      .Bind(log.failure_reason)
      .Bind(log.created_at_ms > 0 ? log.created_at_ms : time_source_->NowUtcMs());
  s.Run();
  return sqlite3_last_insert_rowid(db_);
}

std::vector<JobLog> SqliteRecordStore::ListJobLogs(int64_t job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement s(db_,
              "SELECT id, job_id, worker_id, media_item_id, status, source_size, "
              "target_size, size_reduction, duration_seconds, avg_fps, failure_reason, "
              "created_at_ms FROM job_logs WHERE job_id=? ORDER BY id");
  s.Bind(job_id);
  std::vector<JobLog> logs;
  while (s.Step()) {
    JobLog log;
    log.id = s.Int64(0);
    log.job_id = s.Int64(1);
    log.worker_id = s.OptInt64(2);
    log.media_item_id = s.OptInt64(3);
    if (!model::JobStatusFromString(s.Text(4), &log.status)) {
      log.status = JobStatus::kFailed;
    }
    log.source_size = s.Int64(5);
    log.target_size = s.Int64(6);
    log.size_reduction = s.OptDouble(7);
    log.duration_seconds = s.Double(8);
    log.avg_fps = s.OptDouble(9);
    log.failure_reason = s.Text(10);
    log.created_at_ms = s.Int64(11);
    logs.push_back(std::move(log));
  }
  return logs;
}

}  // namespace encodefarm::store
