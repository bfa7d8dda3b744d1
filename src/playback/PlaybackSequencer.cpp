// Repository: Loopcast
// Component: Playback Sequencer
// Purpose: Shuffled, non-repeating play order over the validated inventory.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/playback/PlaybackSequencer.hpp"

#include <algorithm>

#include "loopcast/util/Logger.hpp"
#include "loopcast/util/StreamErrors.hpp"

namespace loopcast::playback {

using catalog::DisplayName;
using catalog::MediaItem;
using util::Logger;

namespace {

constexpr size_t kOrderPreviewCount = 10;

}  // namespace

const char* ToString(PlaybackSequencer::State state) {
  switch (state) {
    case PlaybackSequencer::State::kReady:
      return "ready";
    case PlaybackSequencer::State::kExhausted:
      return "exhausted";
    case PlaybackSequencer::State::kEmpty:
      return "empty";
  }
  return "unknown";
}

PlaybackSequencer::PlaybackSequencer(catalog::ValidatedInventory inventory,
                                     std::shared_ptr<Denylist> denylist,
                                     SequencerOptions options)
    : denylist_(std::move(denylist)),
      options_(options),
      rng_(options.seed != 0 ? options.seed : std::random_device{}()) {
  size_t excluded = 0;
  for (auto& item : inventory) {
    if (denylist_ && denylist_->Contains(item.path)) {
      ++excluded;
      continue;
    }
    order_.push_back(std::move(item));
  }
  cursor_ = order_.size();

  Logger::Info("[PlaybackSequencer] " + std::to_string(order_.size()) + " playable items (" +
               std::to_string(excluded) + " excluded by denylist)");
  if (order_.empty()) {
    Logger::Error("[PlaybackSequencer] Every validated item is denylisted");
  }
}

PlaybackSequencer::State PlaybackSequencer::StateLocked() const {
  if (order_.empty()) return State::kEmpty;
  return cursor_ < order_.size() ? State::kReady : State::kExhausted;
}

PlaybackSequencer::State PlaybackSequencer::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return StateLocked();
}

void PlaybackSequencer::AdvanceCycleLocked() {
  std::shuffle(order_.begin(), order_.end(), rng_);
  cursor_ = 0;
  ++cycle_count_;
  if (options_.clear_history_on_reshuffle) {
    history_.clear();
  }

  Logger::Info("[PlaybackSequencer] Shuffled cycle " + std::to_string(cycle_count_) + " (" +
               std::to_string(order_.size()) + " items)");
  const size_t preview = std::min(order_.size(), kOrderPreviewCount);
  for (size_t i = 0; i < preview; ++i) {
    Logger::Debug("[PlaybackSequencer]   " + std::to_string(i + 1) + ". " +
                  DisplayName(order_[i].path));
  }
  if (order_.size() > preview) {
    Logger::Debug("[PlaybackSequencer]   ... and " + std::to_string(order_.size() - preview) +
                  " more");
  }
}

void PlaybackSequencer::RecordHistoryLocked(const std::string& path) {
  history_.push_back(path);
  while (options_.history_limit > 0 && history_.size() > options_.history_limit) {
    history_.pop_front();
  }
  ++played_total_;
}

MediaItem PlaybackSequencer::Next() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (order_.empty()) {
    throw NoPlayableMediaError("all media items are denylisted");
  }
  if (cursor_ >= order_.size()) {
    AdvanceCycleLocked();
  }

  MediaItem item = order_[cursor_];
  ++cursor_;
  RecordHistoryLocked(item.path);

  Logger::Info("[PlaybackSequencer] Next item (" + std::to_string(cursor_) + "/" +
               std::to_string(order_.size()) + ", cycle " + std::to_string(cycle_count_) +
               "): " + DisplayName(item.path));
  return item;
}

void PlaybackSequencer::ReportBad(const std::string& path) {
  // Persist first: the denylist is the durable record even if the path is
  // not (or no longer) in the live order.
  if (denylist_) {
    denylist_->Add(path);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  size_t removed = 0;
  size_t removed_before_cursor = 0;
  std::vector<MediaItem> kept;
  kept.reserve(order_.size());
  for (size_t i = 0; i < order_.size(); ++i) {
    if (order_[i].path == path) {
      ++removed;
      if (i < cursor_) ++removed_before_cursor;
      continue;
    }
    kept.push_back(std::move(order_[i]));
  }
  order_ = std::move(kept);
  cursor_ -= removed_before_cursor;

  if (removed == 0) {
    Logger::Debug("[PlaybackSequencer] ReportBad: " + DisplayName(path) +
                  " not in live order");
    return;
  }
  Logger::Warn("[PlaybackSequencer] Dropped " + DisplayName(path) + " from rotation (" +
               std::to_string(order_.size()) + " items remain)");
  if (order_.empty()) {
    Logger::Error("[PlaybackSequencer] No playable media left");
  }
}

std::vector<MediaItem> PlaybackSequencer::BeginManifestCycle() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (order_.empty()) {
    throw NoPlayableMediaError("all media items are denylisted");
  }
  AdvanceCycleLocked();
  cursor_ = order_.size();
  return order_;
}

void PlaybackSequencer::NotePlaying(const std::string& path) {
  std::lock_guard<std::mutex> lock(mutex_);
  RecordHistoryLocked(path);
}

PlaybackSequencer::Snapshot PlaybackSequencer::GetSnapshot(size_t recent_count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot snap;
  snap.state = StateLocked();
  snap.cycle_count = cycle_count_;
  snap.cursor = cursor_;
  snap.order_size = order_.size();
  snap.played_total = played_total_;
  const size_t n = std::min(recent_count, history_.size());
  snap.recent.assign(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
  return snap;
}

std::vector<MediaItem> PlaybackSequencer::Order() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return order_;
}

std::vector<std::string> PlaybackSequencer::History() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::string>(history_.begin(), history_.end());
}

}  // namespace loopcast::playback
