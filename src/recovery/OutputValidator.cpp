// Repository: Encodefarm
// Component: Output Validator
// Copyright (c) 2025 RetroVue

#include "encodefarm/recovery/OutputValidator.hpp"

#include <cmath>
#include <cstdio>

#include "encodefarm/util/Logger.hpp"

namespace encodefarm::recovery {

namespace {

std::string Seconds(double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2fs", value);
  return buf;
}

}  // namespace

ValidationResult OutputValidator::Validate(const std::string& output_path,
                                           std::optional<double> source_duration_s) {
  ValidationResult result;
  result.info = probe_.Probe(output_path);
  if (!result.info) {
    result.reason = "output could not be probed: " + output_path;
  } else if (!result.info->has_video) {
    result.reason = "output has no video stream";
  } else if (!result.info->video_decodable) {
    result.reason = "output video stream (" + result.info->video_codec + ") is not decodable";
  } else if (result.info->size_bytes <= policy_.min_output_bytes) {
    result.reason = "output size " + std::to_string(result.info->size_bytes) +
                    " bytes is below the " + std::to_string(policy_.min_output_bytes) +
                    " byte floor";
  } else if (source_duration_s && *source_duration_s > 0.0) {
    if (!result.info->duration_s) {
      result.reason = "output reports no duration";
    } else {
      double delta = std::fabs(*result.info->duration_s - *source_duration_s);
      if (delta > policy_.duration_tolerance_s) {
        result.reason = "duration mismatch: output " + Seconds(*result.info->duration_s) +
                        " vs source " + Seconds(*source_duration_s) + " (tolerance " +
                        Seconds(policy_.duration_tolerance_s) + ")";
      }
    }
  }

  result.passed = result.reason.empty();
  if (!result.passed) {
    util::Logger::Warn("[OutputValidator] " + output_path + ": " + result.reason);
  }
  return result;
}

}  // namespace encodefarm::recovery
