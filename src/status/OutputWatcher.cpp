// Repository: Loopcast
// Component: Output Watcher
// Purpose: Startup readiness check and change log for the HLS output
//          directory.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/status/OutputWatcher.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "loopcast/supervisor/OutputHousekeeping.hpp"
#include "loopcast/supervisor/TranscodeJob.hpp"
#include "loopcast/util/Logger.hpp"

namespace loopcast::status {

namespace fs = std::filesystem;

OutputSnapshot ScanOutput(const std::string& output_dir) {
  OutputSnapshot snapshot;
  std::error_code ec;

  const fs::path playlist = fs::path(output_dir) / supervisor::kPlaylistFileName;
  const uintmax_t playlist_bytes = fs::file_size(playlist, ec);
  if (!ec) {
    snapshot.playlist_exists = true;
    snapshot.playlist_bytes = playlist_bytes;
  }

  fs::directory_iterator it(output_dir, ec);
  if (ec) return snapshot;

  fs::file_time_type latest_time{};
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    const std::string name = it->path().filename().string();
    if (!supervisor::IsSegmentFileName(name)) continue;

    // The encoder may delete a segment between listing and stat.
    std::error_code stat_ec;
    const auto mtime = fs::last_write_time(it->path(), stat_ec);
    if (stat_ec) continue;
    const uintmax_t bytes = fs::file_size(it->path(), stat_ec);
    if (stat_ec) continue;

    ++snapshot.segment_count;
    if (snapshot.latest_segment.empty() || mtime > latest_time ||
        (mtime == latest_time && name > snapshot.latest_segment)) {
      latest_time = mtime;
      snapshot.latest_segment = name;
      snapshot.latest_segment_bytes = bytes;
    }
  }
  return snapshot;
}

std::string FormatOutputLine(const OutputSnapshot& snapshot) {
  std::ostringstream oss;
  oss << "HLS: segments=" << snapshot.segment_count << " playlist=";
  if (snapshot.playlist_exists) {
    oss << snapshot.playlist_bytes << " bytes";
  } else {
    oss << "missing";
  }
  if (!snapshot.latest_segment.empty()) {
    oss << " latest=" << snapshot.latest_segment << " ("
        << snapshot.latest_segment_bytes << " bytes)";
  }
  return oss.str();
}

OutputWatcher::OutputWatcher(std::string output_dir, OutputWatcherOptions options,
                             const util::StopToken& stop)
    : output_dir_(std::move(output_dir)), options_(options), stop_(stop) {}

OutputWatcher::~OutputWatcher() {
  Join();
}

void OutputWatcher::Start() {
  if (thread_.joinable()) return;
  thread_ = std::thread(&OutputWatcher::Loop, this);
}

void OutputWatcher::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool OutputWatcher::WaitForPlaylist() {
  const auto started = std::chrono::steady_clock::now();
  const auto deadline = started + options_.readiness_timeout;
  const fs::path playlist = fs::path(output_dir_) / supervisor::kPlaylistFileName;

  while (true) {
    std::error_code ec;
    if (fs::exists(playlist, ec)) {
      const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      util::Logger::Info("[Output] Playlist ready after " +
                         std::to_string(waited.count()) + "ms: " + playlist.string());
      return true;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      util::Logger::Error("[Output] No playlist at " + playlist.string() + " after " +
                          std::to_string(options_.readiness_timeout.count()) +
                          "ms; the encoder is not producing output");
      return false;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    if (stop_.WaitFor(std::min(options_.readiness_poll, remaining))) {
      return false;
    }
  }
}

bool OutputWatcher::CheckOnce() {
  const OutputSnapshot current = ScanOutput(output_dir_);
  if (current.SameShape(last_)) return false;
  last_ = current;
  util::Logger::Info("[Output] " + FormatOutputLine(current));
  return true;
}

void OutputWatcher::Loop() {
  WaitForPlaylist();
  if (stop_.StopRequested()) return;
  CheckOnce();
  while (!stop_.WaitFor(options_.interval)) {
    CheckOnce();
  }
}

}  // namespace loopcast::status
