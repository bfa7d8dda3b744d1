// Repository: Loopcast
// Component: Playlist Manifest
// Purpose: concat-demuxer manifest for the manifest-looped strategy.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/supervisor/PlaylistManifest.hpp"

#include <unistd.h>
#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>

#include "loopcast/util/Logger.hpp"

namespace loopcast::supervisor {

std::string EscapeManifestPath(const std::string& path) {
  std::string out;
  out.reserve(path.size() + 2);
  out.push_back('\'');
  for (char c : path) {
    if (c == '\'') {
      out += "'\\''";
    } else if (c == '\\') {
      out += "'\\\\'";
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

std::string RenderManifest(const std::vector<catalog::MediaItem>& items) {
  std::string content;
  for (size_t i = 0; i < items.size(); ++i) {
    content += "file ";
    content += EscapeManifestPath(items[i].path);
    content += '\n';

    // The concat demuxer skips '#' lines.
    std::string name = catalog::DisplayName(items[i].path);
    std::replace(name.begin(), name.end(), '\n', ' ');
    content += "# " + std::to_string(i + 1) + ". " + name + '\n';
  }
  return content;
}

uint32_t ManifestFingerprint(const std::string& content) {
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, reinterpret_cast<const Bytef*>(content.data()),
              static_cast<uInt>(content.size()));
  return static_cast<uint32_t>(crc);
}

bool WriteManifestAtomically(const std::string& path, const std::string& content) {
  const std::string tmp_path =
      path + ".tmp." + std::to_string(static_cast<unsigned long>(getpid()));
  {
    std::ofstream of(tmp_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!of) {
      util::Logger::Error("[Manifest] Cannot create " + tmp_path + ": " +
                          std::strerror(errno));
      return false;
    }
    of << content;
    of.flush();
    of.close();
    if (!of) {
      util::Logger::Error("[Manifest] Write failed for " + tmp_path);
      (void)unlink(tmp_path.c_str());
      return false;
    }
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    util::Logger::Error("[Manifest] Rename " + tmp_path + " -> " + path +
                        " failed: " + std::strerror(errno));
    (void)unlink(tmp_path.c_str());
    return false;
  }
  return true;
}

}  // namespace loopcast::supervisor
