// Repository: Encodefarm
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the scheduler, pipelines,
//          transfer threads and the health loop, with a level threshold.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_UTIL_LOGGER_HPP_
#define ENCODEFARM_UTIL_LOGGER_HPP_

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace encodefarm::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelToString(LogLevel level);
// "debug", "info", "warn" (or "warning"), "error"; nullopt otherwise.
std::optional<LogLevel> ParseLogLevel(const std::string& name);

// Logger writes one complete line per call under a single static mutex so
// lines from the dequeue loop, pipeline threads, segment threads and the
// prefetch workers never interleave.
//
// Debug, Info → stdout
// Warn, Error → stderr
//
// Lines below the threshold are dropped. The threshold starts from
// ENCODEFARM_LOG_LEVEL; ENCODEFARM_DEBUG alone lowers it to debug.
//
// Sinks receive every Info()/Warn()/Error() line that passes the threshold,
// in addition to the stream, so tests can assert on what was reported.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetLevel(LogLevel level);
  static LogLevel Level();
  static bool Enabled(LogLevel level) { return level >= Level(); }

  // Call with nullptr to clear.
  static void SetErrorSink(Sink sink);
  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);

 private:
  static void Emit(LogLevel level, const std::string& line, const Sink* sink);
  static LogLevel LevelFromEnvironment();

  static std::mutex mutex_;
  // -1 until first use resolves it from the environment.
  static std::atomic<int> level_;
  static Sink error_sink_;
  static Sink info_sink_;
  static Sink warn_sink_;
};

}  // namespace encodefarm::util

#endif  // ENCODEFARM_UTIL_LOGGER_HPP_
