// Repository: Loopcast
// Component: Streamer Configuration
// Purpose: Runtime settings, command-line parsing and environment fallbacks.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/app/StreamerConfig.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace loopcast::app {

namespace {

bool ParseUnsigned(const std::string& text, uint64_t max, uint64_t& out) {
  if (text.empty() || text.front() == '-' || text.front() == '+') return false;
  errno = 0;
  char* end = nullptr;
  const unsigned long long value = std::strtoull(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0' || value > max) return false;
  out = value;
  return true;
}

bool ParseNonNegative(const std::string& text, double& out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (errno != 0 || end == text.c_str() || *end != '\0' || !std::isfinite(value) ||
      value < 0.0) {
    return false;
  }
  out = value;
  return true;
}

bool ParsePort(const std::string& text, unsigned short& out) {
  uint64_t value = 0;
  if (!ParseUnsigned(text, std::numeric_limits<unsigned short>::max(), value)) {
    return false;
  }
  out = static_cast<unsigned short>(value);
  return true;
}

bool ParseSeconds(const std::string& text, bool allow_zero,
                  std::chrono::milliseconds& out) {
  double seconds = 0.0;
  if (!ParseNonNegative(text, seconds)) return false;
  if (!allow_zero && seconds <= 0.0) return false;
  out = std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
  return true;
}

bool ParseMode(const std::string& text, supervisor::StreamMode& out) {
  if (text == "per-item") {
    out = supervisor::StreamMode::kPerItem;
    return true;
  }
  if (text == "manifest") {
    out = supervisor::StreamMode::kManifestLoop;
    return true;
  }
  return false;
}

}  // namespace

EnvLookup ProcessEnvironment() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
  };
}

ParseResult ParseArgs(const std::vector<std::string>& args, const EnvLookup& env) {
  ParseResult result;
  StreamerConfig& config = result.config;

  if (env) {
    if (auto v = env("MEDIA_DIR"); v && !v->empty()) config.media_dir = *v;
    if (auto v = env("HLS_DIR"); v && !v->empty()) config.hls_dir = *v;
    if (auto v = env("DYNAMIC_MODE"); v && *v == "true") {
      config.mode = supervisor::StreamMode::kPerItem;
    }
    if (auto v = env("LOOPCAST_PORT"); v && !v->empty()) {
      if (!ParsePort(*v, config.port)) {
        result.error = "Invalid LOOPCAST_PORT: " + *v;
        return result;
      }
    }
  }

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];

    if (arg == "--help" || arg == "-h") {
      result.help = true;
      result.valid = true;
      return result;
    }

    const bool has_value = i + 1 < args.size();
    auto invalid = [&](const std::string& value) {
      result.error = "Invalid value for " + arg + ": " + value;
      return result;
    };

    if (arg == "--media-dir" && has_value) {
      config.media_dir = args[++i];
    } else if (arg == "--hls-dir" && has_value) {
      config.hls_dir = args[++i];
    } else if (arg == "--port" && has_value) {
      if (!ParsePort(args[++i], config.port)) return invalid(args[i]);
    } else if (arg == "--mode" && has_value) {
      if (!ParseMode(args[++i], config.mode)) return invalid(args[i]);
    } else if (arg == "--denylist" && has_value) {
      config.denylist_path = args[++i];
    } else if (arg == "--manifest" && has_value) {
      config.manifest_path = args[++i];
    } else if (arg == "--min-size-mb" && has_value) {
      double mb = 0.0;
      if (!ParseNonNegative(args[++i], mb)) return invalid(args[i]);
      config.min_size_bytes = static_cast<uint64_t>(mb * 1024.0 * 1024.0);
    } else if (arg == "--min-duration" && has_value) {
      if (!ParseNonNegative(args[++i], config.min_duration_seconds)) {
        return invalid(args[i]);
      }
    } else if (arg == "--probe-timeout" && has_value) {
      if (!ParseSeconds(args[++i], false, config.probe_timeout)) return invalid(args[i]);
    } else if (arg == "--liveness" && has_value) {
      if (!ParseSeconds(args[++i], false, config.liveness_window)) return invalid(args[i]);
    } else if (arg == "--grace" && has_value) {
      if (!ParseSeconds(args[++i], true, config.grace_period)) return invalid(args[i]);
    } else if (arg == "--status-interval" && has_value) {
      if (!ParseSeconds(args[++i], false, config.status_interval)) {
        return invalid(args[i]);
      }
    } else if (arg == "--output-interval" && has_value) {
      if (!ParseSeconds(args[++i], false, config.output_interval)) {
        return invalid(args[i]);
      }
    } else if (arg == "--ready-timeout" && has_value) {
      if (!ParseSeconds(args[++i], false, config.ready_timeout)) return invalid(args[i]);
    } else if (arg == "--ffmpeg" && has_value) {
      config.ffmpeg_path = args[++i];
    } else if (arg == "--loglevel" && has_value) {
      config.ffmpeg_loglevel = args[++i];
    } else if (arg == "--seed" && has_value) {
      uint64_t seed = 0;
      if (!ParseUnsigned(args[++i], std::numeric_limits<uint32_t>::max(), seed)) {
        return invalid(args[i]);
      }
      config.seed = static_cast<uint32_t>(seed);
    } else if (arg == "--control-address" && has_value) {
      config.control_address = args[++i];
    } else if (!has_value && arg.rfind("--", 0) == 0) {
      result.error = "Missing value for " + arg;
      return result;
    } else {
      result.error = "Unknown argument: " + arg;
      return result;
    }
  }

  if (config.media_dir.empty() || config.hls_dir.empty()) {
    result.error = "--media-dir and --hls-dir must not be empty";
    return result;
  }
  if (config.mode == supervisor::StreamMode::kManifestLoop &&
      config.manifest_path.empty()) {
    result.error = "--manifest must not be empty in manifest mode";
    return result;
  }

  result.valid = true;
  return result;
}

void PrintUsage(std::ostream& out, const char* program_name) {
  out << "Usage: " << program_name << " [OPTIONS]\n"
      << "\n"
      << "Streams a directory of video files as a continuous HLS feed.\n"
      << "\n"
      << "INPUT / OUTPUT:\n"
      << "  --media-dir DIR        Media root, scanned recursively (env MEDIA_DIR; default /media)\n"
      << "  --hls-dir DIR          Segment/playlist output (env HLS_DIR; default /app/hls)\n"
      << "  --port N               HTTP port (env LOOPCAST_PORT; default 8090)\n"
      << "  --mode MODE            per-item | manifest (DYNAMIC_MODE=true selects per-item;\n"
      << "                         default manifest)\n"
      << "  --denylist PATH        Persistent bad-file list (default /app/denylist.txt)\n"
      << "  --manifest PATH        concat manifest for manifest mode (default /tmp/playlist.txt)\n"
      << "\n"
      << "VALIDATION:\n"
      << "  --min-size-mb N        Minimum file size in MiB (default 1)\n"
      << "  --min-duration SEC     Minimum duration (default 60)\n"
      << "  --probe-timeout SEC    Per-file probe timeout (default 10)\n"
      << "\n"
      << "SUPERVISION:\n"
      << "  --liveness SEC         Silence before an encoder is considered hung (default 45)\n"
      << "  --grace SEC            SIGTERM to SIGKILL grace period (default 5)\n"
      << "  --status-interval SEC  Status log interval (default 60)\n"
      << "  --output-interval SEC  HLS output check interval (default 5)\n"
      << "  --ready-timeout SEC    Wait for the first playlist (default 30)\n"
      << "  --ffmpeg PATH          Encoder executable (default ffmpeg)\n"
      << "  --loglevel LEVEL       Encoder log level (default: per mode)\n"
      << "  --seed N               Shuffle seed (default: random)\n"
      << "\n"
      << "CONTROL:\n"
      << "  --control-address ADDR Serve the StreamControl gRPC API (e.g. 127.0.0.1:50071)\n"
      << "  --help                 Show this help message\n";
}

}  // namespace loopcast::app
