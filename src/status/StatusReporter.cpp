// Repository: Loopcast
// Component: Status Reporter
// Purpose: Periodic aggregate playback log line.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/status/StatusReporter.hpp"

#include <exception>
#include <sstream>

#include "loopcast/catalog/MediaItem.hpp"
#include "loopcast/util/Logger.hpp"

namespace loopcast::status {

std::string FormatStatusLine(const StreamStatus& status) {
  const auto& seq = status.sequence;
  const auto& sup = status.supervisor;

  std::ostringstream oss;
  oss << "STATUS: played=" << seq.played_total
      << " cycle=" << seq.cycle_count
      << " order=" << seq.order_size
      << " state=" << playback::ToString(seq.state)
      << " recent=[";
  for (size_t i = 0; i < seq.recent.size(); ++i) {
    if (i > 0) oss << ", ";
    oss << catalog::DisplayName(seq.recent[i]);
  }
  oss << "]"
      << " runs=" << sup.runs_started
      << " clean=" << sup.clean_exits
      << " failed=" << sup.failed_exits
      << " critical=" << sup.critical_errors
      << " hung=" << sup.hung_restarts
      << " spawn_failures=" << sup.spawn_failures
      << " denylisted=" << sup.denylisted;
  if (!sup.now_playing.empty()) {
    oss << " now=" << catalog::DisplayName(sup.now_playing);
  }
  return oss.str();
}

StatusReporter::StatusReporter(StatusSource source,
                               std::chrono::milliseconds interval,
                               const util::StopToken& stop)
    : source_(std::move(source)), interval_(interval), stop_(stop) {}

StatusReporter::~StatusReporter() {
  Join();
}

void StatusReporter::Start() {
  if (thread_.joinable()) return;
  thread_ = std::thread(&StatusReporter::Loop, this);
}

void StatusReporter::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool StatusReporter::ReportOnce() {
  try {
    util::Logger::Info("[Status] " + FormatStatusLine(source_()));
    return true;
  } catch (const std::exception& e) {
    util::Logger::Warn(std::string("[Status] Report failed: ") + e.what());
    return false;
  }
}

void StatusReporter::Loop() {
  while (!stop_.WaitFor(interval_)) {
    ReportOnce();
  }
}

}  // namespace loopcast::status
