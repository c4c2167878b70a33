// Repository: Encodefarm
// Component: FFmpeg Media Probe
// Copyright (c) 2025 RetroVue

#include "encodefarm/probe/FfmpegMediaProbe.hpp"

#include <sys/stat.h>

#include <chrono>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include "encodefarm/util/Logger.hpp"

namespace encodefarm::probe {

namespace {

std::string AvErrorString(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

}  // namespace

std::optional<MediaInfo> FfmpegMediaProbe::Probe(const std::string& path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    util::Logger::Warn("[FfmpegMediaProbe] Missing file: " + path);
    return std::nullopt;
  }

  AVFormatContext* fmt_ctx = nullptr;
  auto start = std::chrono::steady_clock::now();
  int rc = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
  if (rc < 0) {
    util::Logger::Warn("[FfmpegMediaProbe] Failed to open " + path + ": " + AvErrorString(rc));
    return std::nullopt;
  }
  rc = avformat_find_stream_info(fmt_ctx, nullptr);
  if (rc < 0) {
    avformat_close_input(&fmt_ctx);
    util::Logger::Warn("[FfmpegMediaProbe] Failed to find stream info " + path + ": " +
                       AvErrorString(rc));
    return std::nullopt;
  }

  MediaInfo info;
  info.path = path;
  info.size_bytes = static_cast<int64_t>(st.st_size);
  if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0) {
    info.duration_s = static_cast<double>(fmt_ctx->duration) / AV_TIME_BASE;
  }

  for (unsigned i = 0; i < fmt_ctx->nb_streams; ++i) {
    const AVCodecParameters* par = fmt_ctx->streams[i]->codecpar;
    if (par->codec_type == AVMEDIA_TYPE_VIDEO && !info.has_video) {
      // Cover art is a single attached picture, not a video track.
      if (fmt_ctx->streams[i]->disposition & AV_DISPOSITION_ATTACHED_PIC) continue;
      info.has_video = true;
      info.video_codec = avcodec_get_name(par->codec_id);
      info.video_decodable = avcodec_find_decoder(par->codec_id) != nullptr;
    } else if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
      info.has_audio = true;
    }
  }
  avformat_close_input(&fmt_ctx);

  auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start)
                        .count();
  util::Logger::Debug("[FfmpegMediaProbe] " + path + " video=" + info.video_codec +
                      " duration_s=" +
                      (info.duration_s ? std::to_string(*info.duration_s) : "?") +
                      " probe_ms=" + std::to_string(elapsed_ms));
  return info;
}

}  // namespace encodefarm::probe
