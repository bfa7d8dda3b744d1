// Repository: Loopcast
// Component: Media Item
// Purpose: Immutable description of one validated input file.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_CATALOG_MEDIA_ITEM_HPP_
#define LOOPCAST_CATALOG_MEDIA_ITEM_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace loopcast::catalog {

// Identity is `path`; two items with the same path are the same item.
struct MediaItem {
  std::string path;
  uint64_t size_bytes = 0;
  std::optional<double> duration_seconds;

  bool operator==(const MediaItem& other) const { return path == other.path; }
  bool operator!=(const MediaItem& other) const { return path != other.path; }
};

// Sorted by path. Handed to the sequencer by value.
using ValidatedInventory = std::vector<MediaItem>;

// Final path component, for log lines ("Next episode: foo.mp4").
std::string DisplayName(const std::string& path);

}  // namespace loopcast::catalog

#endif  // LOOPCAST_CATALOG_MEDIA_ITEM_HPP_
