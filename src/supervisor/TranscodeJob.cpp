// Repository: Loopcast
// Component: Transcode Job
// Purpose: Encoder invocation description and ffmpeg argv construction for
//          both playback strategies.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/supervisor/TranscodeJob.hpp"

#include <filesystem>

namespace loopcast::supervisor {

namespace fs = std::filesystem;

const char* ToString(StreamMode mode) {
  switch (mode) {
    case StreamMode::kPerItem:
      return "per-item";
    case StreamMode::kManifestLoop:
      return "manifest";
  }
  return "unknown";
}

EncoderSettings EncoderSettings::ForMode(StreamMode mode) {
  EncoderSettings s;
  if (mode == StreamMode::kPerItem) {
    s.preset = "veryfast";
    s.crf = 26;
    s.gop = 60;
    s.audio_bitrate = "128k";
    s.hls_time = 6;
    s.hls_list_size = 10;
    s.hls_flags = "independent_segments";
    s.loglevel = "warning";
  } else {
    // Low-latency settings; the concat loop never restarts the encoder
    // between items so encode speed must stay well above realtime.
    s.preset = "ultrafast";
    s.tune = "zerolatency";
    s.crf = 28;
    s.gop = 30;
    s.audio_bitrate = "96k";
    s.hls_time = 4;
    s.hls_list_size = 12;
    s.hls_flags = "delete_segments+independent_segments";
    s.hls_start_number = 1;
    // libavformat logs "Opening '<entry>' for reading" at debug level when
    // the concat demuxer opens each entry. The level tag lets the classifier
    // keep the rest of the debug output out of the warnings.
    s.loglevel = "level+debug";
  }
  return s;
}

std::string PlaylistPath(const std::string& output_dir) {
  return (fs::path(output_dir) / kPlaylistFileName).string();
}

std::vector<std::string> BuildTranscoderArgs(const TranscodeJob& job) {
  const EncoderSettings s = EncoderSettings::ForMode(job.mode);
  const std::string loglevel = job.loglevel.empty() ? s.loglevel : job.loglevel;

  std::vector<std::string> args = {job.ffmpeg_path, "-hide_banner", "-nostdin",
                                   "-loglevel", loglevel, "-stats", "-re"};

  if (job.mode == StreamMode::kManifestLoop) {
    args.insert(args.end(), {"-f", "concat", "-safe", "0", "-stream_loop", "-1"});
  }
  args.insert(args.end(), {"-i", job.input});

  args.insert(args.end(), {"-c:v", "libx264", "-preset", s.preset});
  if (!s.tune.empty()) {
    args.insert(args.end(), {"-tune", s.tune});
  }
  args.insert(args.end(), {"-crf", std::to_string(s.crf),
                           "-g", std::to_string(s.gop),
                           "-keyint_min", std::to_string(s.gop),
                           "-sc_threshold", "0"});

  args.insert(args.end(), {"-c:a", "aac", "-b:a", s.audio_bitrate,
                           "-ar", std::to_string(s.audio_rate)});

  const fs::path out(job.output_dir);
  args.insert(args.end(), {"-f", "hls",
                           "-hls_time", std::to_string(s.hls_time),
                           "-hls_list_size", std::to_string(s.hls_list_size),
                           "-hls_flags", s.hls_flags,
                           "-hls_segment_type", "mpegts",
                           "-hls_allow_cache", "0"});
  if (s.hls_start_number >= 0) {
    args.insert(args.end(), {"-start_number", std::to_string(s.hls_start_number)});
  }
  args.push_back("-hls_segment_filename");
  args.push_back((out / (std::string(kSegmentPrefix) + "%d" + kSegmentExtension)).string());
  args.push_back(PlaylistPath(job.output_dir));
  return args;
}

}  // namespace loopcast::supervisor
