// Repository: Loopcast
// Component: Status Reporter
// Purpose: Periodic aggregate playback log line.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_STATUS_STATUS_REPORTER_HPP_
#define LOOPCAST_STATUS_STATUS_REPORTER_HPP_

#include <chrono>
#include <functional>
#include <string>
#include <thread>

#include "loopcast/playback/PlaybackSequencer.hpp"
#include "loopcast/supervisor/TranscodeSupervisor.hpp"
#include "loopcast/util/StopToken.hpp"

namespace loopcast::status {

// Point-in-time view shared by the reporter and the control service.
struct StreamStatus {
  playback::PlaybackSequencer::Snapshot sequence;
  supervisor::SupervisorStats supervisor;
};

using StatusSource = std::function<StreamStatus()>;

// Renders the one-line summary:
//   STATUS: played=N cycle=C order=K state=S recent=[a, b] runs=.. ...
std::string FormatStatusLine(const StreamStatus& status);

// StatusReporter logs FormatStatusLine every `interval` on its own thread.
// A failing source is logged and the next tick tried again. Stop() wakes the
// thread immediately through the shared token.
class StatusReporter {
 public:
  StatusReporter(StatusSource source, std::chrono::milliseconds interval,
                 const util::StopToken& stop);
  ~StatusReporter();

  StatusReporter(const StatusReporter&) = delete;
  StatusReporter& operator=(const StatusReporter&) = delete;

  void Start();
  // Joins the worker. The shared token must already be stopped.
  void Join();

  // One report, synchronously. Returns false if the source failed.
  bool ReportOnce();

 private:
  void Loop();

  StatusSource source_;
  std::chrono::milliseconds interval_;
  const util::StopToken& stop_;
  std::thread thread_;
};

}  // namespace loopcast::status

#endif  // LOOPCAST_STATUS_STATUS_REPORTER_HPP_
