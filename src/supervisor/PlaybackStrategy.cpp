// Repository: Loopcast
// Component: Playback Strategy
// Purpose: Per-item and manifest-looped ways of feeding the encoder.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/supervisor/PlaybackStrategy.hpp"

#include <cstdio>
#include <stdexcept>

#include "loopcast/supervisor/OutputHousekeeping.hpp"
#include "loopcast/supervisor/PlaylistManifest.hpp"
#include "loopcast/util/Logger.hpp"
#include "loopcast/util/StreamErrors.hpp"

namespace loopcast::supervisor {

namespace {

std::string HexCrc(uint32_t crc) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%08x", crc);
  return std::string(buf);
}

}  // namespace

// ======================================================================
// PerItemStrategy
// ======================================================================

PerItemStrategy::PerItemStrategy(playback::PlaybackSequencer& sequencer,
                                 StrategyOptions options)
    : sequencer_(sequencer), options_(std::move(options)) {}

RunUnit PerItemStrategy::Prepare(PrepareReason reason, const RunUnit* previous) {
  PurgeSegments(options_.output_dir);

  if (reason == PrepareReason::kRetrySame && previous != nullptr) {
    return *previous;
  }

  const catalog::MediaItem item = sequencer_.Next();

  TranscodeJob job;
  job.mode = StreamMode::kPerItem;
  job.input = item.path;
  job.output_dir = options_.output_dir;
  job.ffmpeg_path = options_.ffmpeg_path;
  job.loglevel = options_.loglevel;

  RunUnit unit;
  unit.target = item.path;
  unit.argv = BuildTranscoderArgs(job);
  unit.initial_input = item.path;
  unit.fallback_attribution = item.path;
  return unit;
}

void PerItemStrategy::OnInputOpened(const std::string& /*path*/) {
  // Next() already recorded the item.
}

// ======================================================================
// ManifestLoopStrategy
// ======================================================================

ManifestLoopStrategy::ManifestLoopStrategy(playback::PlaybackSequencer& sequencer,
                                           StrategyOptions options)
    : sequencer_(sequencer), options_(std::move(options)) {
  if (options_.manifest_path.empty()) {
    throw std::invalid_argument("manifest mode requires a manifest path");
  }
}

RunUnit ManifestLoopStrategy::WriteManifestUnit(
    const std::vector<catalog::MediaItem>& order) {
  const std::string content = RenderManifest(order);
  if (!WriteManifestAtomically(options_.manifest_path, content)) {
    throw ProcessSpawnError("cannot write manifest " + options_.manifest_path);
  }
  util::Logger::Info("[Manifest] Wrote " + std::to_string(order.size()) +
                     " entries to " + options_.manifest_path + " crc32=" +
                     HexCrc(ManifestFingerprint(content)));

  TranscodeJob job;
  job.mode = StreamMode::kManifestLoop;
  job.input = options_.manifest_path;
  job.output_dir = options_.output_dir;
  job.ffmpeg_path = options_.ffmpeg_path;
  job.loglevel = options_.loglevel;

  RunUnit unit;
  unit.target = options_.manifest_path;
  unit.argv = BuildTranscoderArgs(job);
  return unit;
}

RunUnit ManifestLoopStrategy::Prepare(PrepareReason reason, const RunUnit* previous) {
  PurgeSegments(options_.output_dir);

  switch (reason) {
    case PrepareReason::kRetrySame:
      if (previous != nullptr) return *previous;
      break;
    case PrepareReason::kAfterBadInput: {
      if (sequencer_.state() == playback::PlaybackSequencer::State::kEmpty) {
        throw NoPlayableMediaError("every item has been denylisted");
      }
      return WriteManifestUnit(sequencer_.Order());
    }
    case PrepareReason::kFresh:
      break;
  }

  return WriteManifestUnit(sequencer_.BeginManifestCycle());
}

void ManifestLoopStrategy::OnInputOpened(const std::string& path) {
  // Only media entries; the manifest itself is logged as opened too.
  if (path == options_.manifest_path) return;
  sequencer_.NotePlaying(path);
}

}  // namespace loopcast::supervisor
