// Repository: Loopcast
// Component: Playback Sequencer
// Purpose: Shuffled, non-repeating play order over the validated inventory.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_PLAYBACK_PLAYBACK_SEQUENCER_HPP_
#define LOOPCAST_PLAYBACK_PLAYBACK_SEQUENCER_HPP_

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "loopcast/catalog/MediaItem.hpp"
#include "loopcast/playback/Denylist.hpp"

namespace loopcast::playback {

struct SequencerOptions {
  // Oldest history entries are dropped past this size.
  size_t history_limit = 500;
  // When true, history is cleared at every reshuffle.
  bool clear_history_on_reshuffle = false;
  // 0 selects a random seed.
  uint32_t seed = 0;
};

// PlaybackSequencer owns the PlaybackSequence: a shuffled order, a cursor
// into it, a capped history, and a cycle counter.
//
// States:
//   kReady:     cursor < order.size(); Next() hands out order[cursor].
//   kExhausted: cursor == order.size(); Next() reshuffles first.
//   kEmpty:     every item has been reported bad; Next() throws
//                NoPlayableMediaError. Terminal.
//
// Construction removes already-denylisted items and leaves the sequence
// exhausted, so the first Next() performs the first shuffle (cycle 1).
//
// Thread-safe: one mutex serializes everything. In practice only the
// supervisor's run loop mutates; the reporter and control service call
// Snapshot().
class PlaybackSequencer {
 public:
  enum class State {
    kReady = 0,
    kExhausted = 1,
    kEmpty = 2,
  };

  struct Snapshot {
    State state = State::kExhausted;
    uint64_t cycle_count = 0;
    size_t cursor = 0;
    size_t order_size = 0;
    uint64_t played_total = 0;
    std::vector<std::string> recent;  // Oldest first.
  };

  PlaybackSequencer(catalog::ValidatedInventory inventory,
                    std::shared_ptr<Denylist> denylist,
                    SequencerOptions options = {});

  PlaybackSequencer(const PlaybackSequencer&) = delete;
  PlaybackSequencer& operator=(const PlaybackSequencer&) = delete;

  // Returns the next item, reshuffling first if the cycle is exhausted.
  // Throws NoPlayableMediaError in kEmpty.
  catalog::MediaItem Next();

  // Removes every occurrence of `path` from the live order and persists it
  // to the denylist. Unknown paths are still denylisted. Idempotent.
  void ReportBad(const std::string& path);

  // Manifest mode: reshuffle now and return the whole new order. The cursor
  // is left at the end (the encoder consumes the cycle, not Next()).
  // Throws NoPlayableMediaError in kEmpty.
  std::vector<catalog::MediaItem> BeginManifestCycle();

  // Manifest mode: record an item the encoder was observed opening.
  void NotePlaying(const std::string& path);

  State state() const;
  Snapshot GetSnapshot(size_t recent_count = 5) const;

  // Current order (copy). Test and diagnostic use.
  std::vector<catalog::MediaItem> Order() const;
  std::vector<std::string> History() const;

 private:
  void AdvanceCycleLocked();
  void RecordHistoryLocked(const std::string& path);
  State StateLocked() const;

  mutable std::mutex mutex_;
  std::shared_ptr<Denylist> denylist_;
  SequencerOptions options_;
  std::mt19937 rng_;

  std::vector<catalog::MediaItem> order_;
  size_t cursor_ = 0;
  std::deque<std::string> history_;
  uint64_t cycle_count_ = 0;
  uint64_t played_total_ = 0;
};

const char* ToString(PlaybackSequencer::State state);

}  // namespace loopcast::playback

#endif  // LOOPCAST_PLAYBACK_PLAYBACK_SEQUENCER_HPP_
