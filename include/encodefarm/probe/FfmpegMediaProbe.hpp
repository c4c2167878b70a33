// Repository: Encodefarm
// Component: FFmpeg Media Probe
// Purpose: IMediaProbe on libavformat / libavcodec.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_PROBE_FFMPEG_MEDIA_PROBE_HPP_
#define ENCODEFARM_PROBE_FFMPEG_MEDIA_PROBE_HPP_

#include "encodefarm/probe/IMediaProbe.hpp"

namespace encodefarm::probe {

class FfmpegMediaProbe : public IMediaProbe {
 public:
  FfmpegMediaProbe() = default;

  std::optional<MediaInfo> Probe(const std::string& path) override;
};

}  // namespace encodefarm::probe

#endif  // ENCODEFARM_PROBE_FFMPEG_MEDIA_PROBE_HPP_
