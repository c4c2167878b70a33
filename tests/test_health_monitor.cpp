// Repository: Encodefarm
// Component: Health monitor tests
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <memory>

#include "encodefarm/runtime/HealthMonitor.hpp"
#include "encodefarm/store/SqliteRecordStore.hpp"
#include "fixtures/FakeTransport.h"
#include "fixtures/RecordingEventSink.h"
#include "support/DeterministicTimeSource.hpp"

namespace encodefarm::runtime {
namespace {

using model::Worker;
using model::WorkerStatus;
using tests::fixtures::FakeTransportFactory;
using tests::fixtures::PayloadField;
using tests::fixtures::RecordingEventSink;

// Canned answers for the three metric probes.
std::optional<transfer::CommandResult> MetricsResponder(const std::string& command) {
  transfer::CommandResult r;
  r.exit_status = 0;
  if (command.find("/proc/loadavg") != std::string::npos) {
    r.stdout_text = "1.25 0.90 0.70 2/345 6789\n";
  } else if (command.find("free -b") != std::string::npos) {
    r.stdout_text = "12.50 31.25";
  } else if (command.find("nvidia-smi") != std::string::npos) {
    r.stdout_text = "37, 61\n";
  } else {
    return std::nullopt;
  }
  return r;
}

class HealthMonitorTest : public ::testing::Test {
 protected:
  HealthMonitorTest()
      : clock_(std::make_shared<encodefarm::testing::DeterministicTimeSource>()),
        store_(":memory:", clock_),
        events_(clock_),
        sink_(std::make_shared<RecordingEventSink>()),
        monitor_(store_, transports_, events_, clock_, 3) {
    events_.AddSink(sink_);
  }

  int64_t AddWorker(const std::string& name, WorkerStatus status, bool gpu = false) {
    Worker w;
    w.name = name;
    w.status = status;
    if (gpu) w.hardware_encode_capabilities = {model::EncoderFamily::kNvenc};
    return store_.CreateWorker(w);
  }

  std::shared_ptr<encodefarm::testing::DeterministicTimeSource> clock_;
  store::SqliteRecordStore store_;
  events::JobEventEmitter events_;
  std::shared_ptr<RecordingEventSink> sink_;
  FakeTransportFactory transports_;
  HealthMonitor monitor_;
};

TEST(HealthParsersTest, LoadMemoryGpu) {
  EXPECT_DOUBLE_EQ(*ParseLoadAverage("0.52 0.58 0.59 1/123 4567"), 0.52);
  EXPECT_FALSE(ParseLoadAverage("").has_value());

  double used = 0;
  double total = 0;
  ASSERT_TRUE(ParseMemory("12.5 31.0", &used, &total));
  EXPECT_DOUBLE_EQ(used, 12.5);
  EXPECT_DOUBLE_EQ(total, 31.0);
  EXPECT_FALSE(ParseMemory("12.5", &used, &total));

  double pct = 0;
  double temp = 0;
  ASSERT_TRUE(ParseGpu("37, 61", &pct, &temp));
  EXPECT_DOUBLE_EQ(pct, 37.0);
  EXPECT_DOUBLE_EQ(temp, 61.0);
  EXPECT_FALSE(ParseGpu("[N/A]", &pct, &temp));
}

TEST_F(HealthMonitorTest, ReachableWorkerComesOnlineWithMetrics) {
  int64_t id = AddWorker("gpu-1", WorkerStatus::kOffline, true);
  auto host = transports_.AddWorkerHost(id, "gpu-1");
  host->responder = MetricsResponder;

  monitor_.CheckAll();

  Worker w = *store_.GetWorker(id);
  EXPECT_EQ(w.status, WorkerStatus::kOnline);
  EXPECT_EQ(w.last_heartbeat_ms, clock_->NowUtcMs());
  EXPECT_EQ(w.consecutive_failures, 0);

  auto m = monitor_.metrics().Get(id);
  ASSERT_TRUE(m.has_value());
  EXPECT_DOUBLE_EQ(*m->load_1m, 1.25);
  EXPECT_DOUBLE_EQ(*m->ram_used_gb, 12.5);
  EXPECT_DOUBLE_EQ(*m->ram_total_gb, 31.25);
  EXPECT_DOUBLE_EQ(*m->gpu_percent, 37.0);
  EXPECT_DOUBLE_EQ(*m->gpu_temp_c, 61.0);

  auto status = sink_->Events();
  ASSERT_EQ(status.size(), 1u);
  EXPECT_EQ(status[0].name, events::kServerStatus);
  EXPECT_EQ(PayloadField(status[0], "status"), "online");
}

TEST_F(HealthMonitorTest, CpuWorkerSkipsGpuProbe) {
  int64_t id = AddWorker("cpu-1", WorkerStatus::kOnline);
  auto host = transports_.AddWorkerHost(id, "cpu-1");
  host->responder = MetricsResponder;

  monitor_.CheckAll();
  for (const auto& command : host->Commands()) {
    EXPECT_EQ(command.find("nvidia-smi"), std::string::npos);
  }
  EXPECT_FALSE(monitor_.metrics().Get(id)->gpu_percent.has_value());
  // Already online: no transition event.
  EXPECT_TRUE(sink_->Events().empty());
}

TEST_F(HealthMonitorTest, UnreachableWorkerGoesOfflineOnce) {
  int64_t id = AddWorker("flaky", WorkerStatus::kOnline);
  auto host = transports_.AddWorkerHost(id, "flaky");
  host->reachable = false;

  monitor_.CheckAll();
  monitor_.CheckAll();

  Worker w = *store_.GetWorker(id);
  EXPECT_EQ(w.status, WorkerStatus::kOffline);
  EXPECT_EQ(w.consecutive_failures, 2);
  EXPECT_TRUE(w.is_enabled);
  EXPECT_EQ(sink_->Count(events::kServerStatus), 1u);
  EXPECT_FALSE(monitor_.metrics().Get(id).has_value());
}

TEST_F(HealthMonitorTest, AutoDisableAtThreshold) {
  int64_t id = AddWorker("dead", WorkerStatus::kOnline);
  transports_.AddWorkerHost(id, "dead")->reachable = false;

  monitor_.CheckAll();
  monitor_.CheckAll();
  EXPECT_TRUE(store_.GetWorker(id)->is_enabled);
  monitor_.CheckAll();

  Worker w = *store_.GetWorker(id);
  EXPECT_FALSE(w.is_enabled);
  EXPECT_EQ(w.consecutive_failures, 3);
  auto disabled = sink_->Events();
  ASSERT_EQ(sink_->Count(events::kServerAutoDisabled), 1u);
  EXPECT_EQ(disabled.back().name, events::kServerAutoDisabled);
  EXPECT_EQ(PayloadField(disabled.back(), "consecutive_failures"), "3");

  // Disabled workers are no longer probed.
  monitor_.CheckAll();
  EXPECT_EQ(store_.GetWorker(id)->consecutive_failures, 3);
}

TEST_F(HealthMonitorTest, RecoveryResetsFailureCount) {
  int64_t id = AddWorker("flaky", WorkerStatus::kOnline);
  auto host = transports_.AddWorkerHost(id, "flaky");
  host->reachable = false;
  monitor_.CheckAll();
  monitor_.CheckAll();

  host->reachable = true;
  host->responder = MetricsResponder;
  clock_->AdvanceMs(30'000);
  monitor_.CheckAll();

  Worker w = *store_.GetWorker(id);
  EXPECT_EQ(w.status, WorkerStatus::kOnline);
  EXPECT_EQ(w.consecutive_failures, 0);
  EXPECT_EQ(sink_->Count(events::kServerStatus), 2u);
}

TEST_F(HealthMonitorTest, LocalWorkerWithoutTransportIsOnline) {
  Worker w;
  w.name = "controller";
  w.is_local = true;
  int64_t id = store_.CreateWorker(w);

  Worker checked = monitor_.Check(*store_.GetWorker(id));
  EXPECT_EQ(checked.status, WorkerStatus::kOnline);
  auto m = monitor_.metrics().Get(id);
  ASSERT_TRUE(m.has_value());
  EXPECT_FALSE(m->load_1m.has_value());
}

TEST_F(HealthMonitorTest, RemoteWorkerWithoutTransportFails) {
  int64_t id = AddWorker("ghost", WorkerStatus::kOnline);
  Worker checked = monitor_.Check(*store_.GetWorker(id));
  EXPECT_EQ(checked.status, WorkerStatus::kOffline);
  EXPECT_EQ(PayloadField(sink_->Events().at(0), "detail"), "no transport");
}

}  // namespace
}  // namespace encodefarm::runtime
