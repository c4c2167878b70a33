// Repository: Encodefarm
// Component: Farm Configuration
// Purpose: Daemon settings with defaults, environment overrides and the
//          command line parser.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_RUNTIME_FARM_CONFIG_HPP_
#define ENCODEFARM_RUNTIME_FARM_CONFIG_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "encodefarm/transfer/SshTransport.hpp"
#include "encodefarm/util/Logger.hpp"

namespace encodefarm::runtime {

struct FarmConfig {
  std::string db_path = "encodefarm.db";
  // Encoder executable on the controller; remote workers use their PATH.
  std::string ffmpeg = "ffmpeg";
  std::string remote_ffmpeg = "ffmpeg";
  std::string work_dir = "/tmp/encodefarm";

  int poll_ms = 2000;
  size_t dequeue_batch = 10;
  int stuck_timeout_min = 30;
  int stuck_sweep_s = 60;
  int health_s = 30;
  int auto_disable_failures = 5;

  // host:port of a JobEventService; empty logs events only.
  std::string event_sink;

  // Media origin SSH endpoint; empty host means the origin has no SSH.
  std::string origin_host;
  int origin_port = 22;
  std::string origin_user;
  std::string origin_key;

  int64_t min_output_bytes = 1024 * 1024;
  double duration_tolerance_s = 2.0;

  // Unset keeps the logger's own default.
  std::optional<util::LogLevel> log_level;

  bool show_help = false;
  std::string error;
};

// Reads ENCODEFARM_DB, ENCODEFARM_EVENT_SINK, ENCODEFARM_FFMPEG and
// ENCODEFARM_LOG_LEVEL. Empty or unparsable values are ignored.
void ApplyEnvironment(FarmConfig& config);

// Defaults, then the environment, then flags. Problems land in error.
FarmConfig ParseArgs(int argc, char* argv[]);

void PrintUsage(const char* program_name);

std::optional<transfer::SshEndpoint> OriginEndpoint(const FarmConfig& config);

}  // namespace encodefarm::runtime

#endif  // ENCODEFARM_RUNTIME_FARM_CONFIG_HPP_
