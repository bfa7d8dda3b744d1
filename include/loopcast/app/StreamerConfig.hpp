// Repository: Loopcast
// Component: Streamer Configuration
// Purpose: Runtime settings, command-line parsing and environment fallbacks.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_APP_STREAMER_CONFIG_HPP_
#define LOOPCAST_APP_STREAMER_CONFIG_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "loopcast/supervisor/TranscodeJob.hpp"

namespace loopcast::app {

struct StreamerConfig {
  std::string media_dir = "/media";
  std::string hls_dir = "/app/hls";
  std::string listen_address = "0.0.0.0";
  unsigned short port = 8090;
  supervisor::StreamMode mode = supervisor::StreamMode::kManifestLoop;

  std::string denylist_path = "/app/denylist.txt";
  std::string manifest_path = "/tmp/playlist.txt";

  uint64_t min_size_bytes = 1024 * 1024;
  double min_duration_seconds = 60.0;
  std::chrono::milliseconds probe_timeout{std::chrono::seconds(10)};

  std::chrono::milliseconds liveness_window{std::chrono::seconds(45)};
  std::chrono::milliseconds grace_period{std::chrono::seconds(5)};
  std::chrono::milliseconds idle_gap{std::chrono::seconds(2)};
  std::chrono::milliseconds status_interval{std::chrono::seconds(60)};
  std::chrono::milliseconds output_interval{std::chrono::seconds(5)};
  std::chrono::milliseconds ready_timeout{std::chrono::seconds(30)};

  std::string ffmpeg_path = "ffmpeg";
  std::string ffmpeg_loglevel;  // Empty: the mode's default.
  uint32_t seed = 0;            // 0: random shuffle seed.

  std::string control_address;  // Empty: StreamControl disabled.
};

struct ParseResult {
  StreamerConfig config;
  bool help = false;
  bool valid = false;
  std::string error;
};

// Returns the value of an environment variable, or nullopt.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup ProcessEnvironment();

// Environment fallbacks (MEDIA_DIR, HLS_DIR, DYNAMIC_MODE=true,
// LOOPCAST_PORT) are applied first; flags override them. `args` excludes
// the program name. On error `valid` is false and `error` says why.
ParseResult ParseArgs(const std::vector<std::string>& args, const EnvLookup& env);

void PrintUsage(std::ostream& out, const char* program_name);

}  // namespace loopcast::app

#endif  // LOOPCAST_APP_STREAMER_CONFIG_HPP_
