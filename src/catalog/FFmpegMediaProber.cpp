// Repository: Loopcast
// Component: FFmpeg Media Prober
// Purpose: In-process probe using libavformat (open + find_stream_info).
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/catalog/FFmpegMediaProber.h"

#include <chrono>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
}

namespace {

// Opaque for interrupt callback.
struct ProbeDeadline {
  std::chrono::steady_clock::time_point deadline;
  bool expired = false;
};

// FFmpeg interrupt callback: return non-zero to abort I/O.
int InterruptCallback(void* opaque) {
  auto* d = static_cast<ProbeDeadline*>(opaque);
  if (std::chrono::steady_clock::now() >= d->deadline) {
    d->expired = true;
    return 1;
  }
  return 0;
}

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

}  // namespace

namespace loopcast::catalog {

FFmpegMediaProber::FFmpegMediaProber() {
  // Probe failures are reported through ProbeResult; libav's own chatter
  // about damaged files would only duplicate them.
  av_log_set_level(AV_LOG_FATAL);
}

ProbeResult FFmpegMediaProber::Probe(const std::string& path,
                                     std::chrono::milliseconds timeout) {
  ProbeResult result;
  ProbeDeadline deadline;
  deadline.deadline = std::chrono::steady_clock::now() + timeout;

  AVFormatContext* format_ctx = avformat_alloc_context();
  if (!format_ctx) {
    result.error = "failed to allocate format context";
    return result;
  }
  format_ctx->interrupt_callback.callback = InterruptCallback;
  format_ctx->interrupt_callback.opaque = &deadline;

  // On failure avformat_open_input frees the context and nulls the pointer.
  int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    result.timed_out = deadline.expired;
    result.error = deadline.expired ? "probe timed out" : "open_input: " + AvErrorString(ret);
    return result;
  }

  ret = avformat_find_stream_info(format_ctx, nullptr);
  if (ret < 0) {
    result.timed_out = deadline.expired;
    result.error = deadline.expired ? "probe timed out" : "find_stream_info: " + AvErrorString(ret);
    avformat_close_input(&format_ctx);
    return result;
  }

  bool has_video = false;
  for (unsigned i = 0; i < format_ctx->nb_streams; ++i) {
    if (format_ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
      has_video = true;
      break;
    }
  }
  if (!has_video) {
    result.error = "no video stream";
    avformat_close_input(&format_ctx);
    return result;
  }

  if (format_ctx->duration != AV_NOPTS_VALUE && format_ctx->duration > 0) {
    result.duration_seconds =
        static_cast<double>(format_ctx->duration) / static_cast<double>(AV_TIME_BASE);
  }
  avformat_close_input(&format_ctx);

  result.ok = true;
  return result;
}

}  // namespace loopcast::catalog
