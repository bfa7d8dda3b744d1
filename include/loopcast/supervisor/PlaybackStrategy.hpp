// Repository: Loopcast
// Component: Playback Strategy
// Purpose: Per-item and manifest-looped ways of feeding the encoder.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_SUPERVISOR_PLAYBACK_STRATEGY_HPP_
#define LOOPCAST_SUPERVISOR_PLAYBACK_STRATEGY_HPP_

#include <optional>
#include <string>
#include <vector>

#include "loopcast/playback/PlaybackSequencer.hpp"
#include "loopcast/supervisor/TranscodeJob.hpp"

namespace loopcast::supervisor {

// Unit of supervision: what one encoder run consumes.
struct RunUnit {
  // Media file (per-item) or manifest path (manifest loop).
  std::string target;
  std::vector<std::string> argv;
  // Input known before the encoder logs anything.
  std::optional<std::string> initial_input;
  // Item charged with a critical failure that no diagnostic line
  // attributed. Per-item: the run's own file. Manifest: none.
  std::optional<std::string> fallback_attribution;
};

enum class PrepareReason {
  kFresh = 0,          // Startup, clean exit, or skip after repeated hangs.
  kAfterBadInput = 1,  // An input was just reported bad.
  kRetrySame = 2,      // Restart the previous unit unchanged.
};

struct StrategyOptions {
  std::string output_dir;
  std::string manifest_path;  // Manifest loop only.
  std::string ffmpeg_path = "ffmpeg";
  std::string loglevel;       // Empty: the mode's default.
};

// Both strategies purge prior segments before handing out a unit.
// Prepare() throws NoPlayableMediaError when the sequencer is empty.
class PlaybackStrategy {
 public:
  virtual ~PlaybackStrategy() = default;

  virtual StreamMode mode() const = 0;

  // `previous` is required for kRetrySame.
  virtual RunUnit Prepare(PrepareReason reason, const RunUnit* previous) = 0;

  // The encoder was seen opening `path`.
  virtual void OnInputOpened(const std::string& path) = 0;
};

// Mode A: one encoder per item, advancing the sequencer on every fresh unit.
class PerItemStrategy : public PlaybackStrategy {
 public:
  PerItemStrategy(playback::PlaybackSequencer& sequencer, StrategyOptions options);

  StreamMode mode() const override { return StreamMode::kPerItem; }
  RunUnit Prepare(PrepareReason reason, const RunUnit* previous) override;
  void OnInputOpened(const std::string& path) override;

 private:
  playback::PlaybackSequencer& sequencer_;
  StrategyOptions options_;
};

// Mode B: one looping encoder over a manifest of the whole shuffled order.
// Fresh units start a new shuffle cycle; after a bad input the manifest is
// rewritten from the sequencer's current order.
class ManifestLoopStrategy : public PlaybackStrategy {
 public:
  ManifestLoopStrategy(playback::PlaybackSequencer& sequencer, StrategyOptions options);

  StreamMode mode() const override { return StreamMode::kManifestLoop; }
  RunUnit Prepare(PrepareReason reason, const RunUnit* previous) override;
  void OnInputOpened(const std::string& path) override;

 private:
  RunUnit WriteManifestUnit(const std::vector<catalog::MediaItem>& order);

  playback::PlaybackSequencer& sequencer_;
  StrategyOptions options_;
};

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_PLAYBACK_STRATEGY_HPP_
