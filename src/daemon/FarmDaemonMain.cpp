// Repository: Encodefarm
// Component: Farm Daemon
// Purpose: encodefarmd entry point. Wires the record store, transports,
//          executor, recovery, prefetch and health loops into one scheduler
//          and runs it until SIGINT/SIGTERM.
// Copyright (c) 2025 RetroVue

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <thread>

#include "encodefarm/events/JobEventEmitter.hpp"
#include "encodefarm/events/LoggingEventSink.hpp"
#include "encodefarm/executor/FfmpegCommandBuilder.hpp"
#include "encodefarm/executor/JobExecutor.hpp"
#include "encodefarm/prefetch/Prefetcher.hpp"
#include "encodefarm/probe/FfmpegMediaProbe.hpp"
#include "encodefarm/recovery/OutputValidator.hpp"
#include "encodefarm/recovery/RetryPolicy.hpp"
#include "encodefarm/recovery/StuckJobMonitor.hpp"
#include "encodefarm/runtime/FarmConfig.hpp"
#include "encodefarm/runtime/FarmScheduler.hpp"
#include "encodefarm/runtime/HealthMonitor.hpp"
#include "encodefarm/store/SqliteRecordStore.hpp"
#include "encodefarm/transfer/TransportFactory.hpp"
#include "encodefarm/util/CancellationToken.hpp"
#include "encodefarm/util/Logger.hpp"
#include "events/GrpcEventClient.hpp"

using namespace encodefarm;

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  (void)signal;
  g_termination_requested.store(true, std::memory_order_release);
}

int Run(const runtime::FarmConfig& config) {
  auto clock = std::make_shared<time::SystemTimeSource>();
  store::SqliteRecordStore store(config.db_path, clock);

  events::JobEventEmitter events(clock);
  events.AddSink(std::make_shared<events::LoggingEventSink>());
  if (!config.event_sink.empty()) {
    events.AddSink(std::make_shared<events::GrpcEventClient>(config.event_sink));
    util::Logger::Info("[encodefarmd] Streaming events to " + config.event_sink);
  }

  transfer::DefaultTransportFactory transports(runtime::OriginEndpoint(config));
  executor::FfmpegCommandBuilder commands;
  probe::FfmpegMediaProbe probe;

  recovery::ValidationPolicy policy;
  policy.min_output_bytes = config.min_output_bytes;
  policy.duration_tolerance_s = config.duration_tolerance_s;
  recovery::OutputValidator validator(probe, policy);
  recovery::RetryPolicy retry(store, events, clock);

  executor::ExecutorOptions executor_options;
  executor_options.local_encoder = config.ffmpeg;
  executor_options.remote_encoder = config.remote_ffmpeg;
  executor_options.local_work_dir = config.work_dir;
  executor::JobExecutor executor(store, transports, commands, probe, validator, retry, events,
                                 clock, executor_options);

  util::CancellationRegistry pipelines;
  recovery::StuckJobMonitor stuck(store, pipelines, retry, events, clock,
                                  static_cast<int64_t>(config.stuck_timeout_min) * 60 * 1000);
  prefetch::PrefetchRegistry prefetch(store, transports, events);
  runtime::HealthMonitor health(store, transports, events, clock, config.auto_disable_failures);

  runtime::SchedulerOptions options;
  options.poll_ms = config.poll_ms;
  options.dequeue_batch = config.dequeue_batch;
  options.stuck_sweep_ms = config.stuck_sweep_s * 1000;
  options.health_ms = config.health_s * 1000;

  runtime::FarmScheduler scheduler(store, transports, executor, health, stuck, prefetch,
                                   pipelines, events, clock, options);
  scheduler.Start();
  util::Logger::Info("[encodefarmd] Running (db=" + config.db_path + ")");

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  util::Logger::Info("[encodefarmd] Termination requested");
  scheduler.Stop();
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  runtime::FarmConfig config = runtime::ParseArgs(argc, argv);

  if (config.show_help) {
    runtime::PrintUsage(argv[0]);
    return 0;
  }
  if (!config.error.empty()) {
    std::cerr << "Error: " << config.error << "\n\n";
    runtime::PrintUsage(argv[0]);
    return 1;
  }
  if (config.log_level) util::Logger::SetLevel(*config.log_level);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  try {
    return Run(config);
  } catch (const std::exception& e) {
    util::Logger::Error(std::string("[encodefarmd] Fatal: ") + e.what());
    return 1;
  }
}
