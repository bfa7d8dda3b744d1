// Repository: Loopcast
// Component: Inventory Validator
// Purpose: Scan the media root and keep only files the encoder can play.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_CATALOG_INVENTORY_VALIDATOR_HPP_
#define LOOPCAST_CATALOG_INVENTORY_VALIDATOR_HPP_

#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "loopcast/catalog/IMediaProber.h"
#include "loopcast/catalog/MediaItem.hpp"

namespace loopcast::catalog {

struct InventoryOptions {
  // Lower-case, with leading dot.
  std::set<std::string> extensions = {".mp4", ".m4v", ".mkv", ".mov"};
  std::chrono::milliseconds probe_timeout{10'000};
};

// A file that survived the extension/size filter, before probing.
struct Candidate {
  std::string path;
  uint64_t size_bytes = 0;
};

class InventoryValidator {
 public:
  InventoryValidator(IMediaProber& prober, InventoryOptions options = {});

  // Runs the full scan → filter → probe pipeline.
  // Throws NoMediaFoundError if no candidate passes the filter, or if no
  // candidate passes probing. Probe failures themselves are never fatal.
  ValidatedInventory BuildInventory(const std::string& root_dir,
                                    uint64_t min_size_bytes,
                                    double min_duration_seconds);

  // Recursive walk + extension + size filter. Sorted by path.
  // Unreadable directories and files are logged and skipped.
  std::vector<Candidate> FindCandidates(const std::string& root_dir,
                                        uint64_t min_size_bytes) const;

  bool HasSupportedExtension(const std::string& path) const;

 private:
  IMediaProber& prober_;
  InventoryOptions options_;
};

}  // namespace loopcast::catalog

#endif  // LOOPCAST_CATALOG_INVENTORY_VALIDATOR_HPP_
