// Repository: Loopcast
// Component: Inventory Validator
// Purpose: Scan the media root and keep only files the encoder can play.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/catalog/InventoryValidator.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "loopcast/util/Logger.hpp"
#include "loopcast/util/StreamErrors.hpp"

namespace fs = std::filesystem;

namespace loopcast::catalog {

using util::Logger;

std::string DisplayName(const std::string& path) {
  return fs::path(path).filename().string();
}

InventoryValidator::InventoryValidator(IMediaProber& prober, InventoryOptions options)
    : prober_(prober), options_(std::move(options)) {}

bool InventoryValidator::HasSupportedExtension(const std::string& path) const {
  std::string ext = fs::path(path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return options_.extensions.count(ext) > 0;
}

std::vector<Candidate> InventoryValidator::FindCandidates(const std::string& root_dir,
                                                          uint64_t min_size_bytes) const {
  std::vector<Candidate> candidates;
  std::error_code ec;

  fs::recursive_directory_iterator it(
      root_dir, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    Logger::Error("[InventoryValidator] Cannot scan " + root_dir + ": " + ec.message());
    return candidates;
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      // The iterator is not guaranteed to advance past a failed entry.
      Logger::Warn("[InventoryValidator] Scan of " + root_dir + " stopped early: " +
                   ec.message());
      break;
    }
    const fs::directory_entry& entry = *it;
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec) || entry_ec) continue;

    const std::string path = entry.path().string();
    if (!HasSupportedExtension(path)) continue;

    const uintmax_t size = entry.file_size(entry_ec);
    if (entry_ec) {
      Logger::Warn("[InventoryValidator] Error accessing " + DisplayName(path) + ": " +
                   entry_ec.message());
      continue;
    }
    if (size < min_size_bytes) {
      Logger::Debug("[InventoryValidator] Skipping small file: " + DisplayName(path) +
                    " (" + std::to_string(size) + "B)");
      continue;
    }
    candidates.push_back(Candidate{path, static_cast<uint64_t>(size)});
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const Candidate& a, const Candidate& b) { return a.path < b.path; });
  return candidates;
}

ValidatedInventory InventoryValidator::BuildInventory(const std::string& root_dir,
                                                      uint64_t min_size_bytes,
                                                      double min_duration_seconds) {
  Logger::Info("[InventoryValidator] Scanning for media files in: " + root_dir);

  const std::vector<Candidate> candidates = FindCandidates(root_dir, min_size_bytes);
  if (candidates.empty()) {
    throw NoMediaFoundError("no media files of at least " + std::to_string(min_size_bytes) +
                            " bytes found under " + root_dir);
  }
  Logger::Info("[InventoryValidator] Found " + std::to_string(candidates.size()) +
               " candidate files. Probing...");

  ValidatedInventory inventory;
  for (size_t i = 0; i < candidates.size(); ++i) {
    const Candidate& c = candidates[i];
    const std::string name = DisplayName(c.path);
    Logger::Info("[InventoryValidator] Testing " + std::to_string(i + 1) + "/" +
                 std::to_string(candidates.size()) + ": " + name);

    const ProbeResult probe = prober_.Probe(c.path, options_.probe_timeout);
    if (!probe.ok) {
      Logger::Warn("[InventoryValidator]   Invalid file: " + name + " (" +
                   (probe.timed_out ? std::string("probe timed out") : probe.error) + ")");
      continue;
    }
    if (!probe.duration_seconds || *probe.duration_seconds < min_duration_seconds) {
      std::ostringstream msg;
      msg << "[InventoryValidator]   Skipping short file: " << name << " (";
      if (probe.duration_seconds) {
        msg << std::fixed << std::setprecision(1) << *probe.duration_seconds << "s";
      } else {
        msg << "unknown duration";
      }
      msg << ")";
      Logger::Info(msg.str());
      continue;
    }

    MediaItem item;
    item.path = c.path;
    item.size_bytes = c.size_bytes;
    item.duration_seconds = probe.duration_seconds;
    inventory.push_back(std::move(item));
  }

  Logger::Info("[InventoryValidator] Valid files: " + std::to_string(inventory.size()) +
               " out of " + std::to_string(candidates.size()));
  if (inventory.empty()) {
    throw NoMediaFoundError("none of the " + std::to_string(candidates.size()) +
                            " candidate files under " + root_dir + " passed probing");
  }
  return inventory;
}

}  // namespace loopcast::catalog
