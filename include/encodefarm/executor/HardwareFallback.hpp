// Repository: Encodefarm
// Component: Hardware Encoder Fallback
// Purpose: Adapts an encode configuration to the assigned worker's hardware
//          and walks the fallback tiers when a hardware-backed encode fails:
//          tier 1 drops hardware decode, tier 2 swaps in the software codec.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_EXECUTOR_HARDWARE_FALLBACK_HPP_
#define ENCODEFARM_EXECUTOR_HARDWARE_FALLBACK_HPP_

#include <optional>
#include <string>

#include "encodefarm/model/JobTypes.hpp"

namespace encodefarm::executor {

// Family of a hardware encoder name (hevc_nvenc -> nvenc); nullopt for
// software encoders.
std::optional<model::EncoderFamily> HardwareFamilyOfEncoder(const std::string& encoder);

// Family named by a hw_accel config value ("nvenc", "qsv", "videotoolbox").
std::optional<model::EncoderFamily> HardwareFamilyOfAccel(const std::string& hw_accel);

// 1:1 software replacement (hevc_nvenc -> libx265). nullopt when unmapped.
std::optional<std::string> SoftwareEquivalent(const std::string& encoder);

// NVENC equivalent of a software encoder (libx265 -> hevc_nvenc).
std::optional<std::string> NvencEquivalent(const std::string& encoder);

// True when the encoder output carries a known driver/SDK failure for the
// given family.
bool IsHardwareEncoderFailure(model::EncoderFamily family, const std::string& diagnostics);

// Tune values only the NVENC encoders accept.
bool IsNvencOnlyTune(const std::string& tune);

// Rewrites config for the worker it is about to run on:
//  - NVENC worker + software codec with an NVENC twin: upgrade the codec and
//    drop tunes NVENC rejects (hardware decode stays off).
//  - hardware codec or hw_accel the worker does not advertise: downgrade to
//    software and drop hardware-only tunes.
// note receives a human-readable line when anything changed.
model::EncodeConfig PrepareForWorker(const model::EncodeConfig& config,
                                     const model::Worker& worker, std::string* note);

enum class FallbackStep {
  kNone,            // nothing left to try
  kSoftwareDecode,  // tier 1: hw_accel removed, hardware encoder kept
  kSoftwareEncode,  // tier 2: software codec, no hardware at all
};

const char* FallbackStepToString(FallbackStep step);

class HardwareFallback {
 public:
  HardwareFallback(model::EncodeConfig config, const model::Worker& worker);

  // Configuration for the next attempt.
  const model::EncodeConfig& config() const { return config_; }

  // Called after a failed attempt with its diagnostics. Advances config to
  // the next tier and returns the step taken, or kNone when the failure is
  // final.
  FallbackStep Next(const std::string& diagnostics);

  // Human-readable description of the last step.
  const std::string& last_note() const { return last_note_; }

 private:
  bool WorkerAdvertises(const std::optional<model::EncoderFamily>& family) const;

  model::EncodeConfig config_;
  std::set<model::EncoderFamily> worker_families_;
  bool decode_tier_used_ = false;
  bool encode_tier_used_ = false;
  std::string last_note_;
};

}  // namespace encodefarm::executor

#endif  // ENCODEFARM_EXECUTOR_HARDWARE_FALLBACK_HPP_
