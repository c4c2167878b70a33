// Repository: Encodefarm
// Component: Farm Configuration
// Copyright (c) 2025 RetroVue

#include "encodefarm/runtime/FarmConfig.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

namespace encodefarm::runtime {

namespace {

void ReadEnv(const char* name, std::string& target) {
  const char* value = std::getenv(name);
  if (value != nullptr && value[0] != '\0') target = value;
}

}  // namespace

void ApplyEnvironment(FarmConfig& config) {
  ReadEnv("ENCODEFARM_DB", config.db_path);
  ReadEnv("ENCODEFARM_EVENT_SINK", config.event_sink);
  ReadEnv("ENCODEFARM_FFMPEG", config.ffmpeg);
  std::string level;
  ReadEnv("ENCODEFARM_LOG_LEVEL", level);
  if (auto parsed = util::ParseLogLevel(level)) config.log_level = parsed;
}

void PrintUsage(const char* program_name) {
  std::cout << "Usage: " << program_name << " [options]\n"
            << "\n"
            << "Options:\n"
            << "  --db PATH                 SQLite database (default: encodefarm.db)\n"
            << "  --ffmpeg PATH             Encoder on the controller (default: ffmpeg)\n"
            << "  --work-dir DIR            Controller staging directory\n"
            << "  --poll-ms MS              Dequeue interval (default: 2000)\n"
            << "  --stuck-timeout-min N     Minutes without progress before a job is stuck\n"
            << "  --stuck-sweep-s N         Stuck sweep interval (default: 60)\n"
            << "  --health-s N              Worker health check interval (default: 30)\n"
            << "  --event-sink HOST:PORT    Stream job events to a JobEventService\n"
            << "  --origin-host HOST        Media origin reachable over SSH\n"
            << "  --origin-port N           Origin SSH port (default: 22)\n"
            << "  --origin-user USER        Origin SSH user\n"
            << "  --origin-key PATH         Origin SSH private key\n"
            << "  --min-output-bytes N      Smallest acceptable output (default: 1048576)\n"
            << "  --duration-tolerance-s S  Allowed duration drift (default: 2.0)\n"
            << "  --log-level LEVEL         debug, info, warn or error (default: info)\n"
            << "  --help                    Show this help message\n"
            << "\n"
            << "Environment: ENCODEFARM_DB, ENCODEFARM_EVENT_SINK, ENCODEFARM_FFMPEG,\n"
            << "             ENCODEFARM_LOG_LEVEL\n";
}

FarmConfig ParseArgs(int argc, char* argv[]) {
  FarmConfig config;
  ApplyEnvironment(config);

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    try {
      if (arg == "--help" || arg == "-h") {
        config.show_help = true;
        return config;
      } else if (arg == "--db" && has_value) {
        config.db_path = argv[++i];
      } else if (arg == "--ffmpeg" && has_value) {
        config.ffmpeg = argv[++i];
      } else if (arg == "--work-dir" && has_value) {
        config.work_dir = argv[++i];
      } else if (arg == "--poll-ms" && has_value) {
        config.poll_ms = std::stoi(argv[++i]);
      } else if (arg == "--stuck-timeout-min" && has_value) {
        config.stuck_timeout_min = std::stoi(argv[++i]);
      } else if (arg == "--stuck-sweep-s" && has_value) {
        config.stuck_sweep_s = std::stoi(argv[++i]);
      } else if (arg == "--health-s" && has_value) {
        config.health_s = std::stoi(argv[++i]);
      } else if (arg == "--event-sink" && has_value) {
        config.event_sink = argv[++i];
      } else if (arg == "--origin-host" && has_value) {
        config.origin_host = argv[++i];
      } else if (arg == "--origin-port" && has_value) {
        config.origin_port = std::stoi(argv[++i]);
      } else if (arg == "--origin-user" && has_value) {
        config.origin_user = argv[++i];
      } else if (arg == "--origin-key" && has_value) {
        config.origin_key = argv[++i];
      } else if (arg == "--min-output-bytes" && has_value) {
        config.min_output_bytes = std::stoll(argv[++i]);
      } else if (arg == "--duration-tolerance-s" && has_value) {
        config.duration_tolerance_s = std::stod(argv[++i]);
      } else if (arg == "--log-level" && has_value) {
        config.log_level = util::ParseLogLevel(argv[++i]);
        if (!config.log_level) {
          config.error = "Invalid value for --log-level: " + std::string(argv[i]);
          return config;
        }
      } else {
        config.error = "Unknown or incomplete argument: " + arg;
        return config;
      }
    } catch (const std::logic_error&) {
      config.error = "Invalid value for " + arg + ": " + argv[i];
      return config;
    }
  }

  if (config.poll_ms <= 0) {
    config.error = "--poll-ms must be positive";
  } else if (config.stuck_timeout_min <= 0 || config.stuck_sweep_s <= 0 || config.health_s <= 0) {
    config.error = "intervals and timeouts must be positive";
  } else if (config.origin_port <= 0 || config.origin_port > 65535) {
    config.error = "--origin-port out of range";
  } else if (config.min_output_bytes < 0 || config.duration_tolerance_s < 0.0) {
    config.error = "validation thresholds must not be negative";
  }
  return config;
}

std::optional<transfer::SshEndpoint> OriginEndpoint(const FarmConfig& config) {
  if (config.origin_host.empty()) return std::nullopt;
  transfer::SshEndpoint endpoint;
  endpoint.host = config.origin_host;
  endpoint.port = config.origin_port;
  endpoint.user = config.origin_user;
  endpoint.key_path = config.origin_key;
  return endpoint;
}

}  // namespace encodefarm::runtime
