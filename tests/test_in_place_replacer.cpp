// Repository: Encodefarm
// Component: In-place replacer tests
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include <memory>

#include "encodefarm/executor/InPlaceReplacer.hpp"
#include "fixtures/FakeTransport.h"
#include "support/ScratchDir.hpp"

namespace encodefarm::executor {
namespace {

using encodefarm::testing::FileExists;
using encodefarm::testing::ReadFileText;
using encodefarm::testing::ScratchDir;
using tests::fixtures::FakeHost;
using tests::fixtures::FakeTransport;

TEST(InPlaceReplacerTest, PathNaming) {
  EXPECT_EQ(FinalPathFor("/media/a.avi", "mkv"), "/media/a.mkv");
  EXPECT_EQ(FinalPathFor("/media/a.mkv", "mkv"), "/media/a.mkv");
  EXPECT_EQ(FinalPathFor("/media/v2.0/noext", "mp4"), "/media/v2.0/noext.mp4");
  EXPECT_EQ(BackupPathFor("/media/a.avi"), "/media/a.avi.original");
}

TEST(InPlaceReplacerTest, LocalSwapSameExtension) {
  ScratchDir dir("replace_local");
  const std::string original = dir.Write("a.mkv", "original");
  const std::string output = dir.Write("a.encodefarm.mkv", "encoded");

  ReplaceResult r = ReplaceLocal(original, output, "mkv");
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.final_path, original);
  EXPECT_EQ(ReadFileText(original), "encoded");
  EXPECT_FALSE(FileExists(output));
  EXPECT_FALSE(FileExists(BackupPathFor(original)));
}

TEST(InPlaceReplacerTest, LocalSwapChangesExtension) {
  ScratchDir dir("replace_ext");
  const std::string original = dir.Write("show.avi", "original");
  const std::string output = dir.Write("show.encodefarm.mkv", "encoded");

  ReplaceResult r = ReplaceLocal(original, output, "mkv");
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.final_path, dir.Join("show.mkv"));
  EXPECT_EQ(ReadFileText(r.final_path), "encoded");
  EXPECT_FALSE(FileExists(original));
  EXPECT_FALSE(FileExists(BackupPathFor(original)));
}

TEST(InPlaceReplacerTest, LocalMissingOutputRestoresOriginal) {
  ScratchDir dir("replace_restore");
  const std::string original = dir.Write("a.mkv", "original");

  ReplaceResult r = ReplaceLocal(original, dir.Join("missing.mkv"), "mkv");
  EXPECT_FALSE(r.ok);
  EXPECT_TRUE(r.restored);
  EXPECT_EQ(ReadFileText(original), "original");
  EXPECT_FALSE(FileExists(BackupPathFor(original)));
}

TEST(InPlaceReplacerTest, LocalMissingOriginalFailsBeforeTouchingOutput) {
  ScratchDir dir("replace_noorig");
  const std::string output = dir.Write("a.encodefarm.mkv", "encoded");
  ReplaceResult r = ReplaceLocal(dir.Join("a.mkv"), output, "mkv");
  EXPECT_FALSE(r.ok);
  EXPECT_FALSE(r.restored);
  EXPECT_TRUE(FileExists(output));
}

TEST(InPlaceReplacerTest, RemoteSwapRunsOnTransport) {
  ScratchDir dir("replace_remote");
  const std::string original = dir.Write("ep 1 (it's).avi", "original");
  const std::string output = dir.Write("ep 1 (it's).encodefarm.mkv", "encoded");
  auto host = std::make_shared<FakeHost>("origin", false);
  FakeTransport transport(host);

  ReplaceResult r = ReplaceRemote(transport, original, output, "mkv");
  ASSERT_TRUE(r.ok) << r.error;
  EXPECT_EQ(r.final_path, dir.Join("ep 1 (it's).mkv"));
  EXPECT_EQ(ReadFileText(r.final_path), "encoded");
  EXPECT_FALSE(FileExists(original));
  EXPECT_FALSE(FileExists(BackupPathFor(original)));
  EXPECT_EQ(host->Commands().size(), 1u);
}

TEST(InPlaceReplacerTest, RemoteMissingOutputRestoresOriginal) {
  ScratchDir dir("replace_remote_restore");
  const std::string original = dir.Write("a.mkv", "original");
  FakeTransport transport(std::make_shared<FakeHost>("origin", false));

  ReplaceResult r = ReplaceRemote(transport, original, dir.Join("missing.mkv"), "mkv");
  EXPECT_FALSE(r.ok);
  EXPECT_TRUE(r.restored);
  EXPECT_EQ(ReadFileText(original), "original");
  EXPECT_FALSE(FileExists(BackupPathFor(original)));
}

TEST(InPlaceReplacerTest, RemoteMissingOriginalReportsBackupFailure) {
  ScratchDir dir("replace_remote_noorig");
  const std::string output = dir.Write("a.encodefarm.mkv", "encoded");
  FakeTransport transport(std::make_shared<FakeHost>("origin", false));

  ReplaceResult r = ReplaceRemote(transport, dir.Join("a.mkv"), output, "mkv");
  EXPECT_FALSE(r.ok);
  EXPECT_FALSE(r.restored);
  EXPECT_NE(r.error.find("backup"), std::string::npos);
  EXPECT_TRUE(FileExists(output));
}

TEST(InPlaceReplacerTest, UnreachableHostFails) {
  auto host = std::make_shared<FakeHost>("origin", false);
  host->reachable = false;
  FakeTransport transport(host);
  ReplaceResult r = ReplaceRemote(transport, "/media/a.mkv", "/media/a.encodefarm.mkv", "mkv");
  EXPECT_FALSE(r.ok);
  EXPECT_FALSE(r.restored);
  EXPECT_NE(r.error.find("255"), std::string::npos);
}

}  // namespace
}  // namespace encodefarm::executor
