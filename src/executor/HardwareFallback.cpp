// Repository: Encodefarm
// Component: Hardware Encoder Fallback
// Copyright (c) 2025 RetroVue

#include "encodefarm/executor/HardwareFallback.hpp"

#include <map>
#include <vector>

#include "encodefarm/executor/FfmpegCommandBuilder.hpp"

namespace encodefarm::executor {

using model::EncoderFamily;
using model::EncodeConfig;

namespace {

const std::map<std::string, std::string>& SoftwareMap() {
  static const std::map<std::string, std::string> kMap = {
      {"hevc_nvenc", "libx265"},        {"h264_nvenc", "libx264"},
      {"av1_nvenc", "libsvtav1"},       {"hevc_qsv", "libx265"},
      {"h264_qsv", "libx264"},          {"hevc_videotoolbox", "libx265"},
      {"h264_videotoolbox", "libx264"},
  };
  return kMap;
}

const std::map<std::string, std::string>& NvencMap() {
  static const std::map<std::string, std::string> kMap = {
      {"libx265", "hevc_nvenc"},
      {"libx264", "h264_nvenc"},
      {"libsvtav1", "av1_nvenc"},
  };
  return kMap;
}

const std::vector<std::string>& FailureMarkers(EncoderFamily family) {
  static const std::vector<std::string> kNvenc = {
      "no CUDA-capable device",
      "CUDA_ERROR",
      "nvenc API version",
      "minimum required Nvidia driver",
      "Cannot load libcuda",
      "device type cuda needed",
  };
  static const std::vector<std::string> kQsv = {
      "Error initializing an internal MFX session",
      "MFX_ERR",
      "Failed to create a QSV device",
  };
  static const std::vector<std::string> kVideoToolbox = {
      "cannot create compression session",
      "Error while opening encoder",
  };
  switch (family) {
    case EncoderFamily::kNvenc:
      return kNvenc;
    case EncoderFamily::kQsv:
      return kQsv;
    case EncoderFamily::kVideoToolbox:
      return kVideoToolbox;
  }
  return kNvenc;
}

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void StripHardwareTune(EncodeConfig* config) {
  if (IsNvencOnlyTune(ConfigValue(*config, "encoder_tune"))) config->erase("encoder_tune");
}

}  // namespace

std::optional<EncoderFamily> HardwareFamilyOfEncoder(const std::string& encoder) {
  if (EndsWith(encoder, "_nvenc")) return EncoderFamily::kNvenc;
  if (EndsWith(encoder, "_qsv")) return EncoderFamily::kQsv;
  if (EndsWith(encoder, "_videotoolbox")) return EncoderFamily::kVideoToolbox;
  return std::nullopt;
}

std::optional<EncoderFamily> HardwareFamilyOfAccel(const std::string& hw_accel) {
  if (hw_accel.empty()) return std::nullopt;
  EncoderFamily family = EncoderFamily::kNvenc;
  if (model::EncoderFamilyFromString(hw_accel, &family)) return family;
  return std::nullopt;
}

std::optional<std::string> SoftwareEquivalent(const std::string& encoder) {
  auto it = SoftwareMap().find(encoder);
  if (it == SoftwareMap().end()) return std::nullopt;
  return it->second;
}

std::optional<std::string> NvencEquivalent(const std::string& encoder) {
  auto it = NvencMap().find(encoder);
  if (it == NvencMap().end()) return std::nullopt;
  return it->second;
}

bool IsHardwareEncoderFailure(EncoderFamily family, const std::string& diagnostics) {
  for (const auto& marker : FailureMarkers(family)) {
    if (diagnostics.find(marker) != std::string::npos) return true;
  }
  return false;
}

bool IsNvencOnlyTune(const std::string& tune) {
  return tune == "hq" || tune == "ll" || tune == "ull" || tune == "lossless";
}

EncodeConfig PrepareForWorker(const EncodeConfig& config, const model::Worker& worker,
                              std::string* note) {
  EncodeConfig out = config;
  std::string changes;
  const std::string codec = ConfigValue(config, "video_codec", "libx265");

  auto accel = HardwareFamilyOfAccel(ConfigValue(config, "hw_accel"));
  if (accel && !worker.HasCapability(*accel)) {
    out.erase("hw_accel");
    changes += std::string("hardware decode (") + model::EncoderFamilyToString(*accel) +
               ") not available on " + worker.name + "; ";
  }

  auto family = HardwareFamilyOfEncoder(codec);
  if (family && !worker.HasCapability(*family)) {
    auto software = SoftwareEquivalent(codec);
    if (software) {
      out["video_codec"] = *software;
      StripHardwareTune(&out);
      changes += codec + " -> " + *software + " (" + worker.name + " has no " +
                 model::EncoderFamilyToString(*family) + "); ";
    }
  } else if (!family && worker.HasCapability(EncoderFamily::kNvenc)) {
    auto nvenc = NvencEquivalent(codec);
    if (nvenc) {
      out["video_codec"] = *nvenc;
      const std::string tune = ConfigValue(out, "encoder_tune");
      if (!tune.empty() && !IsNvencOnlyTune(tune)) out.erase("encoder_tune");
      changes += codec + " -> " + *nvenc + " (GPU on " + worker.name + "); ";
    }
  }

  if (note != nullptr) {
    if (changes.size() >= 2) changes.resize(changes.size() - 2);
    *note = changes;
  }
  return out;
}

const char* FallbackStepToString(FallbackStep step) {
  switch (step) {
    case FallbackStep::kNone:
      return "none";
    case FallbackStep::kSoftwareDecode:
      return "software_decode";
    case FallbackStep::kSoftwareEncode:
      return "software_encode";
  }
  return "unknown";
}

HardwareFallback::HardwareFallback(EncodeConfig config, const model::Worker& worker)
    : config_(std::move(config)), worker_families_(worker.hardware_encode_capabilities) {}

bool HardwareFallback::WorkerAdvertises(const std::optional<EncoderFamily>& family) const {
  return family && worker_families_.count(*family) > 0;
}

FallbackStep HardwareFallback::Next(const std::string& diagnostics) {
  last_note_.clear();
  const std::string codec = ConfigValue(config_, "video_codec", "libx265");
  auto encode_family = HardwareFamilyOfEncoder(codec);
  auto decode_family = HardwareFamilyOfAccel(ConfigValue(config_, "hw_accel"));

  if (!decode_tier_used_ && WorkerAdvertises(decode_family)) {
    decode_tier_used_ = true;
    config_.erase("hw_accel");
    last_note_ = "retrying with software decode and " + codec;
    return FallbackStep::kSoftwareDecode;
  }

  if (!encode_tier_used_ && WorkerAdvertises(encode_family)) {
    // After a software-decode retry the next failure falls back regardless
    // of what the encoder printed.
    if (decode_tier_used_ || IsHardwareEncoderFailure(*encode_family, diagnostics)) {
      auto software = SoftwareEquivalent(codec);
      if (software) {
        encode_tier_used_ = true;
        config_["video_codec"] = *software;
        config_.erase("hw_accel");
        StripHardwareTune(&config_);
        last_note_ = "hardware encoder " + codec + " unavailable; retrying with " + *software;
        return FallbackStep::kSoftwareEncode;
      }
    }
  }
  return FallbackStep::kNone;
}

}  // namespace encodefarm::executor
