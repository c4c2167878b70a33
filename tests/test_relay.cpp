// Repository: Encodefarm
// Component: Relay tests
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "encodefarm/transfer/Relay.hpp"
#include "fixtures/FakeTransport.h"
#include "support/ScratchDir.hpp"

namespace encodefarm::transfer {
namespace {

using encodefarm::testing::FileExists;
using encodefarm::testing::PatternBytes;
using encodefarm::testing::ReadFileText;
using encodefarm::testing::ScratchDir;
using tests::fixtures::FakeHost;
using tests::fixtures::FakeTransport;

TEST(ChunkQueueTest, DeliversInOrderThenSentinel) {
  ChunkQueue queue(2);
  std::thread producer([&queue] {
    for (int i = 0; i < 5; ++i) {
      ASSERT_TRUE(queue.Push(std::make_unique<std::string>(std::to_string(i))));
    }
    queue.Push(nullptr);
  });
  std::vector<std::string> got;
  for (;;) {
    auto chunk = queue.Pop();
    if (!chunk) break;
    got.push_back(*chunk);
  }
  producer.join();
  EXPECT_EQ(got, (std::vector<std::string>{"0", "1", "2", "3", "4"}));
}

TEST(ChunkQueueTest, CloseReleasesBlockedProducer) {
  ChunkQueue queue(1);
  ASSERT_TRUE(queue.Push(std::make_unique<std::string>("fill")));
  bool accepted = true;
  std::thread producer([&] { accepted = queue.Push(std::make_unique<std::string>("blocked")); });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.Close();
  producer.join();
  EXPECT_FALSE(accepted);
  EXPECT_FALSE(queue.Push(std::make_unique<std::string>("late")));
}

class RelayTest : public ::testing::Test {
 protected:
  RelayTest()
      : dir_("relay"),
        worker_host_(std::make_shared<FakeHost>("worker", false)),
        origin_host_(std::make_shared<FakeHost>("origin", false)),
        worker_(worker_host_),
        origin_(origin_host_) {}

  RelayOptions SmallChunks() const {
    RelayOptions o;
    o.queue_chunks = 2;
    o.chunk_bytes = 4096;
    o.progress_interval_ms = 0;
    return o;
  }

  ScratchDir dir_;
  std::shared_ptr<FakeHost> worker_host_;
  std::shared_ptr<FakeHost> origin_host_;
  FakeTransport worker_;
  FakeTransport origin_;
};

TEST_F(RelayTest, StreamsBetweenHostsThroughController) {
  const std::string data = PatternBytes(100'000);
  const std::string src = dir_.Write("worker/out.mkv", data);
  const std::string dst = dir_.Join("origin.mkv");
  std::vector<TransferProgress> progress;

  TransferResult r = RelayFile(
      worker_, src, origin_, dst, static_cast<int64_t>(data.size()),
      [&progress](const TransferProgress& p) { progress.push_back(p); }, nullptr, SmallChunks());

  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.strategy, TransferStrategy::kRelay);
  EXPECT_EQ(r.bytes, 100'000);
  EXPECT_EQ(ReadFileText(dst), data);
  EXPECT_EQ(worker_host_->readers.load(), 1);
  EXPECT_EQ(origin_host_->writers.load(), 1);
  ASSERT_FALSE(progress.empty());
  EXPECT_DOUBLE_EQ(progress.back().percent, 100.0);
}

TEST_F(RelayTest, UnknownSizeStillCompletesProgress) {
  const std::string src = dir_.Write("worker/out.mkv", PatternBytes(9000));
  std::vector<TransferProgress> progress;
  TransferResult r = RelayFile(
      worker_, src, origin_, dir_.Join("origin.mkv"), 0,
      [&progress](const TransferProgress& p) { progress.push_back(p); }, nullptr, SmallChunks());
  ASSERT_TRUE(r.ok);
  ASSERT_FALSE(progress.empty());
  EXPECT_EQ(progress.back().bytes_done, 9000);
  EXPECT_DOUBLE_EQ(progress.back().percent, 100.0);
}

TEST_F(RelayTest, MissingSourceReportsReaderError) {
  TransferResult r = RelayFile(worker_, dir_.Join("worker/missing.mkv"), origin_,
                               dir_.Join("origin.mkv"), 0, nullptr, nullptr, SmallChunks());
  EXPECT_FALSE(r.ok);
  EXPECT_FALSE(r.cancelled);
  EXPECT_FALSE(r.error.empty());
}

TEST_F(RelayTest, UnwritableDestinationFails) {
  const std::string src = dir_.Write("worker/out.mkv", PatternBytes(50'000));
  TransferResult r = RelayFile(worker_, src, origin_, dir_.Join("no/such/dir/origin.mkv"), 0,
                               nullptr, nullptr, SmallChunks());
  EXPECT_FALSE(r.ok);
  EXPECT_FALSE(r.cancelled);
}

TEST_F(RelayTest, CancelledBeforeStartOpensNothing) {
  const std::string src = dir_.Write("worker/out.mkv", PatternBytes(1000));
  util::CancellationToken token;
  token.Cancel(util::CancelReason::kShutdown);
  TransferResult r =
      RelayFile(worker_, src, origin_, dir_.Join("origin.mkv"), 1000, nullptr, &token);
  EXPECT_FALSE(r.ok);
  EXPECT_TRUE(r.cancelled);
  EXPECT_EQ(worker_host_->readers.load(), 0);
  EXPECT_FALSE(FileExists(dir_.Join("origin.mkv")));
}

}  // namespace
}  // namespace encodefarm::transfer
