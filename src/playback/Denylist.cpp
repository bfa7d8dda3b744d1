// Repository: Loopcast
// Component: Denylist
// Purpose: Durable, append-only set of media paths known to break the encoder.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/playback/Denylist.hpp"

#include <fstream>

#include "loopcast/catalog/MediaItem.hpp"
#include "loopcast/util/Logger.hpp"

namespace loopcast::playback {

using util::Logger;

Denylist::Denylist(std::string file_path) : file_path_(std::move(file_path)) {
  std::lock_guard<std::mutex> lock(mutex_);
  LoadLocked();
}

void Denylist::LoadLocked() {
  std::ifstream in(file_path_);
  if (!in) {
    Logger::Info("[Denylist] No denylist at " + file_path_ + " (starting empty)");
    return;
  }
  std::string line;
  while (std::getline(in, line)) {
    // getline sets eof without fail only when the last line had no '\n'.
    if (in.eof() && !line.empty()) unterminated_tail_ = true;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;
    entries_.insert(line);
  }
  Logger::Info("[Denylist] Loaded " + std::to_string(entries_.size()) + " entries from " +
               file_path_);
}

DenylistAddStatus Denylist::Add(const std::string& media_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (media_path.empty()) return DenylistAddStatus::kAlreadyPresent;
  if (!entries_.insert(media_path).second) {
    return DenylistAddStatus::kAlreadyPresent;
  }

  if (media_path.find('\n') != std::string::npos) {
    Logger::Warn("[Denylist] Path contains a newline; denylisted for this run only: " +
                 catalog::DisplayName(media_path));
    return DenylistAddStatus::kPersistFailed;
  }

  std::ofstream out(file_path_, std::ios::app);
  if (out) {
    if (unterminated_tail_) {
      out << '\n';
      unterminated_tail_ = false;
    }
    out << media_path << '\n';
    out.flush();
  }
  if (!out) {
    Logger::Error("[Denylist] Failed to append to " + file_path_ + "; " +
                  catalog::DisplayName(media_path) + " denylisted for this run only");
    return DenylistAddStatus::kPersistFailed;
  }
  Logger::Warn("[Denylist] Added " + media_path);
  return DenylistAddStatus::kAdded;
}

bool Denylist::Contains(const std::string& media_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(media_path) > 0;
}

std::set<std::string> Denylist::Entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

size_t Denylist::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace loopcast::playback
