// Repository: Encodefarm
// Component: Output Validator
// Purpose: Decides whether an encode produced a usable file before it is
//          allowed anywhere near the original.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_RECOVERY_OUTPUT_VALIDATOR_HPP_
#define ENCODEFARM_RECOVERY_OUTPUT_VALIDATOR_HPP_

#include <cstdint>
#include <optional>
#include <string>

#include "encodefarm/probe/IMediaProbe.hpp"

namespace encodefarm::recovery {

struct ValidationPolicy {
  // Outputs at or below this size are rejected.
  int64_t min_output_bytes = 1024 * 1024;
  // Allowed |output - source| duration difference.
  double duration_tolerance_s = 2.0;
};

struct ValidationResult {
  bool passed = false;
  std::string reason;
  std::optional<probe::MediaInfo> info;
};

class OutputValidator {
 public:
  OutputValidator(probe::IMediaProbe& probe, ValidationPolicy policy)
      : probe_(probe), policy_(policy) {}

  // Checks, in order: the probe returns a result, a decodable video stream
  // is present, the size is above the floor, and (when source_duration_s is
  // known) the durations agree within the tolerance.
  ValidationResult Validate(const std::string& output_path,
                            std::optional<double> source_duration_s);

  const ValidationPolicy& policy() const { return policy_; }

 private:
  probe::IMediaProbe& probe_;
  ValidationPolicy policy_;
};

}  // namespace encodefarm::recovery

#endif  // ENCODEFARM_RECOVERY_OUTPUT_VALIDATOR_HPP_
