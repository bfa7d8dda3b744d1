// Repository: Loopcast
// Component: Output Housekeeping
// Purpose: Segment directory preparation between encoder runs.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/supervisor/OutputHousekeeping.hpp"

#include <filesystem>
#include <system_error>

#include "loopcast/supervisor/TranscodeJob.hpp"
#include "loopcast/util/Logger.hpp"

namespace loopcast::supervisor {

namespace fs = std::filesystem;

bool EnsureOutputDirectory(const std::string& output_dir) {
  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    util::Logger::Error("[Output] Cannot create " + output_dir + ": " + ec.message());
    return false;
  }
  return true;
}

bool IsSegmentFileName(const std::string& name) {
  const std::string prefix = kSegmentPrefix;
  const std::string ext = kSegmentExtension;
  return name.size() >= prefix.size() + ext.size() &&
         name.compare(0, prefix.size(), prefix) == 0 &&
         name.compare(name.size() - ext.size(), ext.size(), ext) == 0;
}

size_t PurgeSegments(const std::string& output_dir) {
  std::error_code ec;
  fs::directory_iterator it(output_dir, ec);
  if (ec) {
    util::Logger::Warn("[Output] Cannot list " + output_dir + ": " + ec.message());
    return 0;
  }

  size_t removed = 0;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    const fs::path& p = it->path();
    if (!IsSegmentFileName(p.filename().string())) continue;
    std::error_code rm_ec;
    if (fs::remove(p, rm_ec)) {
      ++removed;
    } else if (rm_ec) {
      util::Logger::Warn("[Output] Cannot remove " + p.string() + ": " + rm_ec.message());
    }
  }
  if (ec) {
    util::Logger::Warn("[Output] Listing " + output_dir + " stopped: " + ec.message());
  }
  if (removed > 0) {
    util::Logger::Debug("[Output] Purged " + std::to_string(removed) + " segment(s)");
  }
  return removed;
}

}  // namespace loopcast::supervisor
