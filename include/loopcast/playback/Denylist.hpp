// Repository: Loopcast
// Component: Denylist
// Purpose: Durable, append-only set of media paths known to break the encoder.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_PLAYBACK_DENYLIST_HPP_
#define LOOPCAST_PLAYBACK_DENYLIST_HPP_

#include <mutex>
#include <set>
#include <string>

namespace loopcast::playback {

enum class DenylistAddStatus {
  kAdded,
  kAlreadyPresent,
  kPersistFailed,  // Kept in memory for this process; not written to disk.
};

// Denylist file format: one absolute path per line, UTF-8, '\n' separated.
// Blank lines and a trailing partial line are tolerated on load.
//
// The set only grows. Add() is idempotent: a path already present (loaded
// from disk or added earlier) is not written again. Entries are never
// removed automatically; an operator edits the file to forgive a path.
//
// Thread-safe: all operations take one mutex.
class Denylist {
 public:
  // Loads `file_path` if it exists. A missing file is an empty denylist;
  // the file is created on the first Add().
  explicit Denylist(std::string file_path);

  Denylist(const Denylist&) = delete;
  Denylist& operator=(const Denylist&) = delete;

  DenylistAddStatus Add(const std::string& media_path);
  bool Contains(const std::string& media_path) const;
  std::set<std::string> Entries() const;
  size_t Size() const;

  const std::string& FilePath() const { return file_path_; }

 private:
  void LoadLocked();

  std::string file_path_;
  mutable std::mutex mutex_;
  std::set<std::string> entries_;
  bool unterminated_tail_ = false;  // Last line on disk had no '\n'.
};

}  // namespace loopcast::playback

#endif  // LOOPCAST_PLAYBACK_DENYLIST_HPP_
