// Repository: Loopcast
// Component: Output Watcher
// Purpose: Startup readiness check and change log for the HLS output
//          directory.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_STATUS_OUTPUT_WATCHER_HPP_
#define LOOPCAST_STATUS_OUTPUT_WATCHER_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

#include "loopcast/util/StopToken.hpp"

namespace loopcast::status {

struct OutputSnapshot {
  size_t segment_count = 0;
  bool playlist_exists = false;
  uintmax_t playlist_bytes = 0;
  std::string latest_segment;  // File name; empty without segments.
  uintmax_t latest_segment_bytes = 0;

  // Compares what the change log reports: segment count and playlist size.
  bool SameShape(const OutputSnapshot& other) const {
    return segment_count == other.segment_count &&
           playlist_exists == other.playlist_exists &&
           playlist_bytes == other.playlist_bytes;
  }
};

// Lists segment files and the playlist in `output_dir`. A missing or
// unreadable directory yields an empty snapshot.
OutputSnapshot ScanOutput(const std::string& output_dir);

//   HLS: segments=N playlist=B bytes latest=stream12.ts (S bytes)
std::string FormatOutputLine(const OutputSnapshot& snapshot);

struct OutputWatcherOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(5)};
  std::chrono::milliseconds readiness_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds readiness_poll{std::chrono::seconds(1)};
};

// OutputWatcher gives the operator direct evidence that the encoder is
// producing output. Its thread first waits for the playlist to appear
// (an error is logged if it does not within readiness_timeout; watching
// continues), then logs a line whenever the segment count or playlist
// size changes.
class OutputWatcher {
 public:
  OutputWatcher(std::string output_dir, OutputWatcherOptions options,
                const util::StopToken& stop);
  ~OutputWatcher();

  OutputWatcher(const OutputWatcher&) = delete;
  OutputWatcher& operator=(const OutputWatcher&) = delete;

  void Start();
  // Joins the worker. The shared token must already be stopped.
  void Join();

  // Polls until the playlist exists. Returns false on timeout or stop.
  bool WaitForPlaylist();

  // Logs when the output changed since the previous call. Returns true if
  // a line was logged.
  bool CheckOnce();

 private:
  void Loop();

  std::string output_dir_;
  OutputWatcherOptions options_;
  const util::StopToken& stop_;
  OutputSnapshot last_;
  std::thread thread_;
};

}  // namespace loopcast::status

#endif  // LOOPCAST_STATUS_OUTPUT_WATCHER_HPP_
