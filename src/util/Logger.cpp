// Repository: Encodefarm
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission with a level threshold.
// Copyright (c) 2025 RetroVue

#include "encodefarm/util/Logger.hpp"

#include <cctype>
#include <cstdlib>
#include <iostream>

namespace encodefarm::util {

std::mutex Logger::mutex_;
std::atomic<int> Logger::level_{-1};
Logger::Sink Logger::error_sink_;
Logger::Sink Logger::info_sink_;
Logger::Sink Logger::warn_sink_;

const char* LogLevelToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "unknown";
}

std::optional<LogLevel> ParseLogLevel(const std::string& name) {
  std::string lower;
  for (char c : name) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (lower == "debug") return LogLevel::kDebug;
  if (lower == "info") return LogLevel::kInfo;
  if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
  if (lower == "error") return LogLevel::kError;
  return std::nullopt;
}

LogLevel Logger::LevelFromEnvironment() {
  if (const char* name = std::getenv("ENCODEFARM_LOG_LEVEL")) {
    if (auto level = ParseLogLevel(name)) return *level;
  }
  return std::getenv("ENCODEFARM_DEBUG") != nullptr ? LogLevel::kDebug : LogLevel::kInfo;
}

void Logger::SetLevel(LogLevel level) { level_.store(static_cast<int>(level)); }

LogLevel Logger::Level() {
  int level = level_.load();
  if (level < 0) {
    int resolved = static_cast<int>(LevelFromEnvironment());
    // A concurrent SetLevel wins over the environment.
    if (!level_.compare_exchange_strong(level, resolved)) return static_cast<LogLevel>(level);
    level = resolved;
  }
  return static_cast<LogLevel>(level);
}

void Logger::SetErrorSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetInfoSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::SetWarnSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::Emit(LogLevel level, const std::string& line, const Sink* sink) {
  if (!Enabled(level)) return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (sink != nullptr && *sink) {
    (*sink)(line);
  }
  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

void Logger::Info(const std::string& line) { Emit(LogLevel::kInfo, line, &info_sink_); }

void Logger::Debug(const std::string& line) { Emit(LogLevel::kDebug, line, nullptr); }

void Logger::Warn(const std::string& line) { Emit(LogLevel::kWarn, line, &warn_sink_); }

void Logger::Error(const std::string& line) { Emit(LogLevel::kError, line, &error_sink_); }

}  // namespace encodefarm::util
