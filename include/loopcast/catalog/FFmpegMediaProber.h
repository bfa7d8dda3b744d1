// Repository: Loopcast
// Component: FFmpeg Media Prober
// Purpose: In-process probe using libavformat (open + find_stream_info).
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_CATALOG_FFMPEG_MEDIA_PROBER_H_
#define LOOPCAST_CATALOG_FFMPEG_MEDIA_PROBER_H_

#include "loopcast/catalog/IMediaProber.h"

namespace loopcast::catalog {

// FFmpegMediaProber opens the file with avformat_open_input, reads stream
// info, and reports the container duration. A file is decodable when both
// calls succeed and at least one video stream exists.
//
// Timeout: an AVIOInterruptCB aborts blocking demuxer I/O once the deadline
// passes; the result is then !ok with timed_out set.
//
// Thread Safety: stateless; Probe() may be called from any thread.
class FFmpegMediaProber : public IMediaProber {
 public:
  FFmpegMediaProber();

  ProbeResult Probe(const std::string& path,
                    std::chrono::milliseconds timeout) override;
};

}  // namespace loopcast::catalog

#endif  // LOOPCAST_CATALOG_FFMPEG_MEDIA_PROBER_H_
