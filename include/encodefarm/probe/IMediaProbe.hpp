// Repository: Encodefarm
// Component: Media Probe Interface
// Purpose: Inspects a media file for the facts output validation and
//          progress reporting need.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_PROBE_IMEDIA_PROBE_HPP_
#define ENCODEFARM_PROBE_IMEDIA_PROBE_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace encodefarm::probe {

struct MediaInfo {
  std::string path;
  // Container duration; nullopt when the container does not report one.
  std::optional<double> duration_s;
  int64_t size_bytes = 0;
  bool has_video = false;
  bool has_audio = false;
  std::string video_codec;
  // A decoder for the first video stream is available in this build.
  bool video_decodable = false;
};

class IMediaProbe {
 public:
  virtual ~IMediaProbe() = default;
  // nullopt when the file cannot be opened or parsed as media.
  virtual std::optional<MediaInfo> Probe(const std::string& path) = 0;
};

}  // namespace encodefarm::probe

#endif  // ENCODEFARM_PROBE_IMEDIA_PROBE_HPP_
