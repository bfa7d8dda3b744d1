// Repository: Loopcast
// Component: Transcode Job
// Purpose: Encoder invocation description and ffmpeg argv construction for
//          both playback strategies.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_SUPERVISOR_TRANSCODE_JOB_HPP_
#define LOOPCAST_SUPERVISOR_TRANSCODE_JOB_HPP_

#include <string>
#include <vector>

namespace loopcast::supervisor {

enum class StreamMode {
  kPerItem = 0,       // One encoder per media item.
  kManifestLoop = 1,  // One long-lived encoder over a concat manifest.
};

const char* ToString(StreamMode mode);

// HLS output names. The playlist survives purges; segments do not.
inline constexpr const char* kPlaylistFileName = "stream.m3u8";
inline constexpr const char* kSegmentPrefix = "stream";
inline constexpr const char* kSegmentExtension = ".ts";

struct EncoderSettings {
  std::string preset;
  std::string tune;  // Empty: no -tune.
  int crf = 26;
  int gop = 60;      // -g and -keyint_min; scene-cut keyframes are off.
  std::string audio_bitrate;
  int audio_rate = 44100;
  int hls_time = 6;
  int hls_list_size = 10;
  std::string hls_flags;
  int hls_start_number = -1;  // -1: ffmpeg default.
  std::string loglevel;

  static EncoderSettings ForMode(StreamMode mode);
};

struct TranscodeJob {
  StreamMode mode = StreamMode::kPerItem;
  // Media file (per-item) or manifest path (manifest loop).
  std::string input;
  std::string output_dir;
  std::string ffmpeg_path = "ffmpeg";
  // Overrides the mode's log level when non-empty.
  std::string loglevel;
};

// Full argv, argv[0] included.
std::vector<std::string> BuildTranscoderArgs(const TranscodeJob& job);

std::string PlaylistPath(const std::string& output_dir);

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_TRANSCODE_JOB_HPP_
