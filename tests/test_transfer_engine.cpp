// Repository: Encodefarm
// Component: Transfer Engine tests
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "encodefarm/transfer/LocalTransport.hpp"
#include "encodefarm/transfer/SshTransport.hpp"
#include "encodefarm/transfer/TransferEngine.hpp"
#include "fixtures/FakeTransport.h"
#include "support/ScratchDir.hpp"

namespace encodefarm::transfer {
namespace {

using encodefarm::testing::FileExists;
using encodefarm::testing::FileSizeOf;
using encodefarm::testing::PatternBytes;
using encodefarm::testing::ReadFileText;
using encodefarm::testing::ScratchDir;
using tests::fixtures::FakeHost;
using tests::fixtures::FakeTransport;

class TransferEngineTest : public ::testing::Test {
 protected:
  TransferEngineTest()
      : dir_("transfer"), host_(std::make_shared<FakeHost>("worker-a", false)), remote_(host_) {
    dir_.MakeDir("local");
    dir_.MakeDir("remote");
  }

  TransferEngine::Options SmallOptions() const {
    TransferEngine::Options o;
    o.segmented_threshold_bytes = 64 * 1024;
    o.segment_count = 4;
    o.chunk_bytes = 16 * 1024;
    o.allocation_poll_ms = 20;
    o.progress_interval_ms = 0;
    return o;
  }

  TransferRequest Upload(const std::string& local, const std::string& remote) {
    TransferRequest r;
    r.direction = TransferDirection::kUpload;
    r.local_path = local;
    r.remote_path = remote;
    r.transport = &remote_;
    r.progress = [this](const TransferProgress& p) { progress_.push_back(p); };
    return r;
  }

  ConnectFn Connect() {
    auto host = host_;
    return [host]() -> std::unique_ptr<ITransport> { return std::make_unique<FakeTransport>(host); };
  }

  ScratchDir dir_;
  std::shared_ptr<FakeHost> host_;
  FakeTransport remote_;
  std::vector<TransferProgress> progress_;
};

TEST_F(TransferEngineTest, SmallFileUsesBulkCopy) {
  const std::string data = PatternBytes(10'000);
  const std::string src = dir_.Write("local/a.mkv", data);
  const std::string dst = dir_.Join("remote/a.mkv");

  TransferEngine engine(SmallOptions());
  TransferRequest req = Upload(src, dst);
  req.connect = Connect();
  TransferResult r = engine.Transfer(req);

  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.strategy, TransferStrategy::kBulk);
  EXPECT_EQ(r.bytes, 10'000);
  EXPECT_EQ(ReadFileText(dst), data);
  EXPECT_EQ(host_->uploads.load(), 1);
  EXPECT_EQ(host_->range_copies.load(), 0);
}

TEST_F(TransferEngineTest, LargeFileSegmentedToExactSize) {
  // Not a multiple of the segment count, so the last segment takes the tail.
  const int64_t size = 300'001;
  const std::string data = PatternBytes(size);
  const std::string src = dir_.Write("local/big.mkv", data);
  const std::string dst = dir_.Join("remote/big.mkv");

  TransferEngine engine(SmallOptions());
  TransferRequest req = Upload(src, dst);
  req.connect = Connect();
  TransferResult r = engine.Transfer(req);

  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.strategy, TransferStrategy::kSegmented);
  EXPECT_EQ(FileSizeOf(dst), size);
  EXPECT_EQ(ReadFileText(dst), data);
  EXPECT_EQ(host_->range_copies.load(), 4);
  EXPECT_EQ(host_->uploads.load(), 0);
}

TEST_F(TransferEngineTest, StaleSizeHintStillCopiesExactSourceSize) {
  const std::string data = PatternBytes(100'000);
  const std::string src = dir_.Write("local/stale.mkv", data);
  const std::string dst = dir_.Join("remote/stale.mkv");

  TransferEngine engine(SmallOptions());
  TransferRequest req = Upload(src, dst);
  req.size_hint = 150'000;
  req.connect = Connect();
  TransferResult r = engine.Transfer(req);

  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.strategy, TransferStrategy::kSegmented);
  EXPECT_EQ(r.bytes, 100'000);
  EXPECT_EQ(FileSizeOf(dst), 100'000);
  EXPECT_EQ(ReadFileText(dst), data);
}

TEST_F(TransferEngineTest, OneFailingSegmentFailsSegmentedTier) {
  const int64_t size = 300'001;
  const std::string data = PatternBytes(size);
  const std::string src = dir_.Write("local/big.mkv", data);
  const std::string dst = dir_.Join("remote/big.mkv");
  host_->range_hook = [](int64_t offset, int64_t) -> std::optional<PrimitiveResult> {
    if (offset == 150'000) return PrimitiveResult::Failed("dd: error writing: Broken pipe");
    return std::nullopt;
  };

  TransferEngine engine(SmallOptions());
  TransferRequest req = Upload(src, dst);
  req.connect = Connect();
  TransferResult r = engine.Transfer(req);

  // The segmented tier has no partial success; the bulk copy redoes the file.
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.strategy, TransferStrategy::kBulk);
  EXPECT_EQ(host_->range_copies.load(), 4);
  EXPECT_EQ(host_->uploads.load(), 1);
  EXPECT_EQ(ReadFileText(dst), data);
}

TEST_F(TransferEngineTest, ShortSegmentFailsSegmentedTier) {
  const int64_t size = 300'001;
  const std::string data = PatternBytes(size);
  const std::string src = dir_.Write("local/big.mkv", data);
  const std::string dst = dir_.Join("remote/big.mkv");
  host_->range_hook = [](int64_t offset, int64_t length) -> std::optional<PrimitiveResult> {
    if (offset != 75'000) return std::nullopt;
    PrimitiveResult shorted = PrimitiveResult::Ok();
    shorted.bytes = length - 4096;
    return shorted;
  };

  TransferEngine engine(SmallOptions());
  TransferRequest req = Upload(src, dst);
  req.connect = Connect();
  TransferResult r = engine.Transfer(req);

  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.strategy, TransferStrategy::kBulk);
  EXPECT_EQ(ReadFileText(dst), data);
}

TEST_F(TransferEngineTest, FailingSegmentAndBulkReportFailure) {
  host_->bulk_failure = PrimitiveStatus::kFailed;
  host_->range_hook = [](int64_t offset, int64_t) -> std::optional<PrimitiveResult> {
    if (offset == 0) return PrimitiveResult::Failed("connection reset");
    return std::nullopt;
  };
  const std::string src = dir_.Write("local/big.mkv", PatternBytes(200'000));

  TransferEngine engine(SmallOptions());
  TransferRequest req = Upload(src, dir_.Join("remote/big.mkv"));
  req.connect = Connect();
  TransferResult r = engine.Transfer(req);

  EXPECT_FALSE(r.ok);
  EXPECT_FALSE(r.cancelled);
  EXPECT_NE(r.error.find("bulk copy failed"), std::string::npos);
}

TEST_F(TransferEngineTest, ThrowingSegmentConnectFallsBackToBulk) {
  const std::string data = PatternBytes(200'000);
  const std::string src = dir_.Write("local/big.mkv", data);
  const std::string dst = dir_.Join("remote/big.mkv");

  TransferEngine engine(SmallOptions());
  TransferRequest req = Upload(src, dst);
  req.connect = []() -> std::unique_ptr<ITransport> {
    throw std::runtime_error("database is locked");
  };
  TransferResult r = engine.Transfer(req);

  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.strategy, TransferStrategy::kBulk);
  EXPECT_EQ(host_->range_copies.load(), 0);
  EXPECT_EQ(ReadFileText(dst), data);
}

TEST_F(TransferEngineTest, SegmentedDownloadToExactSize) {
  const int64_t size = 200'003;
  const std::string data = PatternBytes(size);
  const std::string remote = dir_.Write("remote/out.mkv", data);
  const std::string local = dir_.Join("local/out.mkv");

  TransferEngine engine(SmallOptions());
  TransferRequest req;
  req.direction = TransferDirection::kDownload;
  req.local_path = local;
  req.remote_path = remote;
  req.transport = &remote_;
  req.connect = Connect();
  TransferResult r = engine.Transfer(req);

  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.strategy, TransferStrategy::kSegmented);
  EXPECT_EQ(ReadFileText(local), data);
}

TEST_F(TransferEngineTest, NoConnectFactorySkipsSegments) {
  const std::string src = dir_.Write("local/big.mkv", PatternBytes(200'000));
  TransferEngine engine(SmallOptions());
  TransferResult r = engine.Transfer(Upload(src, dir_.Join("remote/big.mkv")));
  ASSERT_TRUE(r.ok);
  EXPECT_EQ(r.strategy, TransferStrategy::kBulk);
  EXPECT_EQ(host_->range_copies.load(), 0);
}

TEST_F(TransferEngineTest, UnsupportedBulkFallsBackToChunkedStream) {
  host_->bulk_failure = PrimitiveStatus::kUnsupported;
  const std::string data = PatternBytes(50'000);
  const std::string src = dir_.Write("local/a.mkv", data);
  const std::string dst = dir_.Join("remote/a.mkv");

  TransferEngine engine(SmallOptions());
  TransferResult r = engine.Transfer(Upload(src, dst));

  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.strategy, TransferStrategy::kChunked);
  EXPECT_EQ(ReadFileText(dst), data);
  EXPECT_EQ(host_->writers.load(), 1);
}

TEST_F(TransferEngineTest, ChunkedDownloadAfterUnsupportedBulk) {
  host_->bulk_failure = PrimitiveStatus::kUnsupported;
  const std::string data = PatternBytes(40'000);
  const std::string remote = dir_.Write("remote/out.mkv", data);
  const std::string local = dir_.Join("local/out.mkv");

  TransferEngine engine(SmallOptions());
  TransferRequest req;
  req.direction = TransferDirection::kDownload;
  req.local_path = local;
  req.remote_path = remote;
  req.transport = &remote_;
  TransferResult r = engine.Transfer(req);

  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.strategy, TransferStrategy::kChunked);
  EXPECT_EQ(ReadFileText(local), data);
  EXPECT_EQ(host_->readers.load(), 1);
}

TEST_F(TransferEngineTest, HardBulkFailureDoesNotTryChunked) {
  host_->bulk_failure = PrimitiveStatus::kFailed;
  const std::string src = dir_.Write("local/a.mkv", PatternBytes(1000));
  TransferEngine engine(SmallOptions());
  TransferResult r = engine.Transfer(Upload(src, dir_.Join("remote/a.mkv")));

  EXPECT_FALSE(r.ok);
  EXPECT_FALSE(r.cancelled);
  EXPECT_EQ(r.strategy, TransferStrategy::kBulk);
  EXPECT_NE(r.error.find("bulk copy failed"), std::string::npos);
  EXPECT_EQ(host_->writers.load(), 0);
}

TEST_F(TransferEngineTest, MissingSourceFails) {
  TransferEngine engine(SmallOptions());
  TransferResult r =
      engine.Transfer(Upload(dir_.Join("local/missing.mkv"), dir_.Join("remote/x.mkv")));
  EXPECT_FALSE(r.ok);
  EXPECT_NE(r.error.find("source not found"), std::string::npos);
  EXPECT_EQ(host_->uploads.load(), 0);
}

TEST_F(TransferEngineTest, CancelledTokenStopsBeforeAnyCopy) {
  const std::string src = dir_.Write("local/a.mkv", PatternBytes(1000));
  util::CancellationToken token;
  token.Cancel(util::CancelReason::kOperator);

  TransferEngine engine(SmallOptions());
  TransferRequest req = Upload(src, dir_.Join("remote/a.mkv"));
  req.cancel = &token;
  TransferResult r = engine.Transfer(req);

  EXPECT_FALSE(r.ok);
  EXPECT_TRUE(r.cancelled);
  EXPECT_EQ(host_->uploads.load(), 0);
  EXPECT_FALSE(FileExists(dir_.Join("remote/a.mkv")));
}

TEST_F(TransferEngineTest, ProgressEndsAtOneHundredPercent) {
  const std::string src = dir_.Write("local/a.mkv", PatternBytes(70'000));
  TransferEngine engine(SmallOptions());
  TransferResult r = engine.Transfer(Upload(src, dir_.Join("remote/a.mkv")));
  ASSERT_TRUE(r.ok);
  ASSERT_FALSE(progress_.empty());
  EXPECT_DOUBLE_EQ(progress_.back().percent, 100.0);
  EXPECT_EQ(progress_.back().bytes_done, 70'000);
  EXPECT_EQ(progress_.back().direction, TransferDirection::kUpload);
  for (size_t i = 1; i < progress_.size(); ++i) {
    EXPECT_GE(progress_[i].bytes_done, progress_[i - 1].bytes_done);
  }
}

TEST(ProgressThrottleTest, SuppressesUpdatesWithinInterval) {
  std::vector<TransferProgress> seen;
  ProgressThrottle throttle(TransferDirection::kDownload, 1000,
                            [&seen](const TransferProgress& p) { seen.push_back(p); }, 60'000);
  throttle.Update(100);
  throttle.Update(200);
  throttle.Update(300);
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].bytes_done, 100);
  EXPECT_DOUBLE_EQ(seen[0].percent, 10.0);

  throttle.Complete();
  ASSERT_EQ(seen.size(), 2u);
  EXPECT_EQ(seen[1].bytes_done, 1000);
  EXPECT_DOUBLE_EQ(seen[1].percent, 100.0);
}

TEST(ProgressThrottleTest, ClampsBytesToTotal) {
  std::vector<TransferProgress> seen;
  ProgressThrottle throttle(TransferDirection::kUpload, 500,
                            [&seen](const TransferProgress& p) { seen.push_back(p); }, 0);
  throttle.Update(900);
  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].bytes_done, 500);
}

TEST(SshTransportParseTest, DdCopiedBytesTakesTheSummaryLine) {
  EXPECT_EQ(ParseDdCopiedBytes("0+1 records in\n0+1 records out\n"
                               "75000 bytes (75 kB, 73 KiB) copied, 0.0012 s, 62 MB/s\n"),
            75'000);
  EXPECT_EQ(ParseDdCopiedBytes("12 bytes copied, 0.0001 s, 120 kB/s"), 12);
  EXPECT_FALSE(ParseDdCopiedBytes("dd: failed to open 'x': Permission denied").has_value());
  EXPECT_FALSE(ParseDdCopiedBytes("").has_value());
}

TEST(SshTransportParseTest, RsyncProgressCounter) {
  EXPECT_EQ(ParseRsyncProgressBytes("      1,048,576  12%   10.00MB/s    0:00:07"), 1'048'576);
  EXPECT_FALSE(ParseRsyncProgressBytes("sending incremental file list").has_value());
}

TEST(LocalTransportTest, RangeCopyWritesIntoPreallocatedFile) {
  ScratchDir dir("local_range");
  const std::string data = PatternBytes(10'000);
  const std::string src = dir.Write("src.bin", data);
  const std::string dst = dir.Join("dst.bin");

  LocalTransport local;
  ASSERT_TRUE(local.Preallocate(dst, 10'000).ok());
  EXPECT_EQ(local.FileSize(dst), 10'000);
  PrimitiveResult tail = local.UploadRange(src, dst, 6'000, 4'000);
  ASSERT_TRUE(tail.ok());
  EXPECT_EQ(tail.bytes, 4'000);
  ASSERT_TRUE(local.UploadRange(src, dst, 0, 6'000).ok());
  EXPECT_EQ(ReadFileText(dst), data);
}

TEST(LocalTransportTest, RangePastEndOfSourceReportsShortCount) {
  ScratchDir dir("local_range_short");
  const std::string src = dir.Write("src.bin", PatternBytes(10'000));
  const std::string dst = dir.Join("dst.bin");

  LocalTransport local;
  ASSERT_TRUE(local.Preallocate(dst, 12'000).ok());
  PrimitiveResult r = local.UploadRange(src, dst, 8'000, 4'000);
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.bytes, 2'000);
}

TEST(LocalTransportTest, FileOperations) {
  ScratchDir dir("local_ops");
  LocalTransport local;
  EXPECT_FALSE(local.FileSize(dir.Join("none")).has_value());
  EXPECT_TRUE(local.RemoveFile(dir.Join("none")));

  ASSERT_TRUE(local.MakeDirectory(dir.Join("a/b/c")));
  const std::string f = dir.Write("a/b/c/f.txt", "hello");
  EXPECT_EQ(local.FileSize(f), 5);
  EXPECT_TRUE(local.RemoveFile(f));
  EXPECT_FALSE(FileExists(f));

  CommandResult r = local.RunCommand("echo hi; exit 4");
  EXPECT_EQ(r.exit_status, 4);
  EXPECT_EQ(r.stdout_text, "hi\n");
}

}  // namespace
}  // namespace encodefarm::transfer
