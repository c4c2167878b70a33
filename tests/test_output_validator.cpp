// Repository: Encodefarm
// Component: Output validator tests
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include "encodefarm/recovery/OutputValidator.hpp"
#include "fixtures/FakeMediaProbe.h"

namespace encodefarm::recovery {
namespace {

using tests::fixtures::FakeMediaProbe;

probe::MediaInfo GoodOutput(double duration_s, int64_t size_bytes) {
  probe::MediaInfo info;
  info.duration_s = duration_s;
  info.size_bytes = size_bytes;
  info.has_video = true;
  info.has_audio = true;
  info.video_codec = "hevc";
  info.video_decodable = true;
  return info;
}

class OutputValidatorTest : public ::testing::Test {
 protected:
  OutputValidatorTest() : validator_(probe_, ValidationPolicy{1000, 2.0}) {}

  FakeMediaProbe probe_;
  OutputValidator validator_;
};

TEST_F(OutputValidatorTest, PassesWithinTolerance) {
  probe_.Set("/out.mkv", GoodOutput(601.5, 5000));
  ValidationResult r = validator_.Validate("/out.mkv", 600.0);
  EXPECT_TRUE(r.passed) << r.reason;
  EXPECT_TRUE(r.reason.empty());
  ASSERT_TRUE(r.info.has_value());
  EXPECT_EQ(r.info->size_bytes, 5000);
}

TEST_F(OutputValidatorTest, ToleranceBoundaryIsInclusive) {
  probe_.Set("/out.mkv", GoodOutput(602.0, 5000));
  EXPECT_TRUE(validator_.Validate("/out.mkv", 600.0).passed);
}

TEST_F(OutputValidatorTest, DurationMismatchBeyondTolerance) {
  probe_.Set("/out.mkv", GoodOutput(590.0, 5000));
  ValidationResult r = validator_.Validate("/out.mkv", 600.0);
  EXPECT_FALSE(r.passed);
  EXPECT_NE(r.reason.find("duration mismatch"), std::string::npos);
}

TEST_F(OutputValidatorTest, UnknownSourceDurationSkipsDurationCheck) {
  probe_.Set("/out.mkv", GoodOutput(10.0, 5000));
  EXPECT_TRUE(validator_.Validate("/out.mkv", std::nullopt).passed);
  EXPECT_TRUE(validator_.Validate("/out.mkv", 0.0).passed);
}

TEST_F(OutputValidatorTest, OutputWithoutDurationFailsWhenSourceKnown) {
  probe::MediaInfo info = GoodOutput(0.0, 5000);
  info.duration_s.reset();
  probe_.Set("/out.mkv", info);
  ValidationResult r = validator_.Validate("/out.mkv", 600.0);
  EXPECT_FALSE(r.passed);
  EXPECT_NE(r.reason.find("no duration"), std::string::npos);
}

TEST_F(OutputValidatorTest, UnprobeableOutputFails) {
  ValidationResult r = validator_.Validate("/does/not/exist.mkv", 600.0);
  EXPECT_FALSE(r.passed);
  EXPECT_FALSE(r.info.has_value());
  EXPECT_NE(r.reason.find("could not be probed"), std::string::npos);
}

TEST_F(OutputValidatorTest, ChecksRunInOrder) {
  // Several problems at once: the first failing check names the reason.
  probe::MediaInfo no_video = GoodOutput(1.0, 10);
  no_video.has_video = false;
  no_video.video_decodable = false;
  probe_.Set("/a.mkv", no_video);
  EXPECT_EQ(validator_.Validate("/a.mkv", 600.0).reason, "output has no video stream");

  probe::MediaInfo undecodable = GoodOutput(1.0, 10);
  undecodable.video_decodable = false;
  undecodable.video_codec = "weird";
  probe_.Set("/b.mkv", undecodable);
  EXPECT_NE(validator_.Validate("/b.mkv", 600.0).reason.find("not decodable"),
            std::string::npos);

  probe_.Set("/c.mkv", GoodOutput(1.0, 10));
  EXPECT_NE(validator_.Validate("/c.mkv", 600.0).reason.find("byte floor"), std::string::npos);
}

TEST_F(OutputValidatorTest, SizeAtFloorFails) {
  probe_.Set("/out.mkv", GoodOutput(600.0, 1000));
  EXPECT_FALSE(validator_.Validate("/out.mkv", 600.0).passed);
  probe_.Set("/out.mkv", GoodOutput(600.0, 1001));
  EXPECT_TRUE(validator_.Validate("/out.mkv", 600.0).passed);
}

}  // namespace
}  // namespace encodefarm::recovery
