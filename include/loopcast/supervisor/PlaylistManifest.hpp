// Repository: Loopcast
// Component: Playlist Manifest
// Purpose: concat-demuxer manifest for the manifest-looped strategy.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_SUPERVISOR_PLAYLIST_MANIFEST_HPP_
#define LOOPCAST_SUPERVISOR_PLAYLIST_MANIFEST_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "loopcast/catalog/MediaItem.hpp"

namespace loopcast::supervisor {

// Quotes `path` for one `file '<...>'` line. Inside single quotes ffmpeg
// takes everything literally except the closing quote, so each ' becomes
// '\'' and each \ becomes '\\' (close, escaped char, reopen).
std::string EscapeManifestPath(const std::string& path);

// One `file` line per item, in order, each followed by a `# N. name`
// comment for operators.
std::string RenderManifest(const std::vector<catalog::MediaItem>& items);

// CRC-32 (zlib) of the rendered content.
uint32_t ManifestFingerprint(const std::string& content);

// Writes `content` to `<path>.tmp.<pid>` and renames it over `path`, so the
// encoder never sees a partial manifest. Returns false (and logs) on error;
// the temp file is removed.
bool WriteManifestAtomically(const std::string& path, const std::string& content);

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_PLAYLIST_MANIFEST_HPP_
