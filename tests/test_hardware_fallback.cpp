// Repository: Encodefarm
// Component: Hardware encoder fallback tests
// Copyright (c) 2025 RetroVue

#include <gtest/gtest.h>

#include "encodefarm/executor/HardwareFallback.hpp"

namespace encodefarm::executor {
namespace {

using model::EncodeConfig;
using model::EncoderFamily;
using model::Worker;

Worker GpuWorker() {
  Worker w;
  w.id = 1;
  w.name = "gpu-box";
  w.hardware_encode_capabilities = {EncoderFamily::kNvenc};
  return w;
}

Worker CpuWorker() {
  Worker w;
  w.id = 2;
  w.name = "cpu-box";
  return w;
}

TEST(HardwareFallbackTest, FamilyAndEquivalentLookups) {
  EXPECT_EQ(HardwareFamilyOfEncoder("hevc_nvenc"), EncoderFamily::kNvenc);
  EXPECT_EQ(HardwareFamilyOfEncoder("h264_qsv"), EncoderFamily::kQsv);
  EXPECT_EQ(HardwareFamilyOfEncoder("hevc_videotoolbox"), EncoderFamily::kVideoToolbox);
  EXPECT_FALSE(HardwareFamilyOfEncoder("libx265").has_value());
  EXPECT_EQ(HardwareFamilyOfAccel("nvenc"), EncoderFamily::kNvenc);
  EXPECT_FALSE(HardwareFamilyOfAccel("").has_value());
  EXPECT_FALSE(HardwareFamilyOfAccel("vaapi").has_value());

  EXPECT_EQ(SoftwareEquivalent("hevc_nvenc"), "libx265");
  EXPECT_EQ(SoftwareEquivalent("h264_videotoolbox"), "libx264");
  EXPECT_FALSE(SoftwareEquivalent("libx265").has_value());
  EXPECT_EQ(NvencEquivalent("libsvtav1"), "av1_nvenc");
  EXPECT_FALSE(NvencEquivalent("hevc_qsv").has_value());
}

TEST(HardwareFallbackTest, FailureMarkersPerFamily) {
  EXPECT_TRUE(IsHardwareEncoderFailure(
      EncoderFamily::kNvenc,
      "[hevc_nvenc @ 0x55] Driver does not support the required nvenc API version.\n"
      "The minimum required Nvidia driver for nvenc is 520.56.06 or newer"));
  EXPECT_TRUE(IsHardwareEncoderFailure(EncoderFamily::kNvenc, "CUDA_ERROR_NO_DEVICE"));
  EXPECT_FALSE(IsHardwareEncoderFailure(EncoderFamily::kNvenc, "No such file or directory"));
  EXPECT_TRUE(IsHardwareEncoderFailure(EncoderFamily::kQsv, "MFX_ERR_UNSUPPORTED"));
  EXPECT_FALSE(IsHardwareEncoderFailure(EncoderFamily::kQsv, "CUDA_ERROR"));
}

TEST(HardwareFallbackTest, PrepareUpgradesSoftwareCodecOnNvencWorker) {
  std::string note;
  EncodeConfig out =
      PrepareForWorker({{"video_codec", "libx265"}, {"encoder_tune", "grain"}}, GpuWorker(), &note);
  EXPECT_EQ(out["video_codec"], "hevc_nvenc");
  EXPECT_EQ(out.count("encoder_tune"), 0u);
  EXPECT_EQ(out.count("hw_accel"), 0u);
  EXPECT_NE(note.find("hevc_nvenc"), std::string::npos);
}

TEST(HardwareFallbackTest, PrepareKeepsNvencTuneOnUpgrade) {
  EncodeConfig out =
      PrepareForWorker({{"video_codec", "libx264"}, {"encoder_tune", "hq"}}, GpuWorker(), nullptr);
  EXPECT_EQ(out["video_codec"], "h264_nvenc");
  EXPECT_EQ(out["encoder_tune"], "hq");
}

TEST(HardwareFallbackTest, PrepareDowngradesUnadvertisedHardware) {
  std::string note;
  EncodeConfig out = PrepareForWorker(
      {{"video_codec", "hevc_nvenc"}, {"hw_accel", "nvenc"}, {"encoder_tune", "ll"}},
      CpuWorker(), &note);
  EXPECT_EQ(out["video_codec"], "libx265");
  EXPECT_EQ(out.count("hw_accel"), 0u);
  EXPECT_EQ(out.count("encoder_tune"), 0u);
  EXPECT_FALSE(note.empty());
}

TEST(HardwareFallbackTest, PrepareLeavesMatchingConfigAlone) {
  std::string note = "stale";
  EncodeConfig in = {{"video_codec", "libx265"}, {"crf_value", "20"}};
  EncodeConfig out = PrepareForWorker(in, CpuWorker(), &note);
  EXPECT_EQ(out, in);
  EXPECT_TRUE(note.empty());
}

TEST(HardwareFallbackTest, DecodeTierThenEncodeTier) {
  HardwareFallback fallback({{"video_codec", "hevc_nvenc"}, {"hw_accel", "nvenc"},
                             {"encoder_tune", "hq"}},
                            GpuWorker());

  EXPECT_EQ(fallback.Next("Impossible to convert between the formats"),
            FallbackStep::kSoftwareDecode);
  EXPECT_EQ(fallback.config().count("hw_accel"), 0u);
  EXPECT_EQ(fallback.config().at("video_codec"), "hevc_nvenc");

  // After tier 1 the next failure drops to software without a marker.
  EXPECT_EQ(fallback.Next("something unrelated"), FallbackStep::kSoftwareEncode);
  EXPECT_EQ(fallback.config().at("video_codec"), "libx265");
  EXPECT_EQ(fallback.config().count("encoder_tune"), 0u);
  EXPECT_FALSE(fallback.last_note().empty());

  EXPECT_EQ(fallback.Next("still failing"), FallbackStep::kNone);
}

TEST(HardwareFallbackTest, EncodeTierNeedsMarkerWithoutDecodeTier) {
  HardwareFallback fallback({{"video_codec", "hevc_nvenc"}}, GpuWorker());
  EXPECT_EQ(fallback.Next("Invalid data found when processing input"), FallbackStep::kNone);
  EXPECT_EQ(fallback.config().at("video_codec"), "hevc_nvenc");

  HardwareFallback with_marker({{"video_codec", "hevc_nvenc"}}, GpuWorker());
  EXPECT_EQ(with_marker.Next("The minimum required Nvidia driver for nvenc is 520"),
            FallbackStep::kSoftwareEncode);
  EXPECT_EQ(with_marker.config().at("video_codec"), "libx265");
  EXPECT_EQ(with_marker.Next("The minimum required Nvidia driver for nvenc is 520"),
            FallbackStep::kNone);
}

TEST(HardwareFallbackTest, SoftwareConfigHasNoTiers) {
  HardwareFallback fallback({{"video_codec", "libx265"}}, GpuWorker());
  EXPECT_EQ(fallback.Next("CUDA_ERROR"), FallbackStep::kNone);
}

TEST(HardwareFallbackTest, StepNames) {
  EXPECT_STREQ(FallbackStepToString(FallbackStep::kNone), "none");
  EXPECT_STREQ(FallbackStepToString(FallbackStep::kSoftwareDecode), "software_decode");
  EXPECT_STREQ(FallbackStepToString(FallbackStep::kSoftwareEncode), "software_encode");
}

}  // namespace
}  // namespace encodefarm::executor
