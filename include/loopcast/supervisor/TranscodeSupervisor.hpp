// Repository: Loopcast
// Component: Transcode Supervisor
// Purpose: Owns the encoder lifecycle; turns health signals into restart,
//          skip and denylist decisions.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_SUPERVISOR_TRANSCODE_SUPERVISOR_HPP_
#define LOOPCAST_SUPERVISOR_TRANSCODE_SUPERVISOR_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "loopcast/playback/PlaybackSequencer.hpp"
#include "loopcast/supervisor/ITranscoderProcess.h"
#include "loopcast/supervisor/PlaybackStrategy.hpp"
#include "loopcast/supervisor/SupervisedRun.hpp"
#include "loopcast/util/BackoffPolicy.hpp"
#include "loopcast/util/StopToken.hpp"

namespace loopcast::supervisor {

struct SupervisorOptions {
  // No progress line for this long while the process is alive: hung.
  std::chrono::milliseconds liveness_window{std::chrono::seconds(45)};
  // SIGTERM to SIGKILL.
  std::chrono::milliseconds grace_period{std::chrono::seconds(5)};
  // Pause between a finished unit and the next.
  std::chrono::milliseconds idle_gap{std::chrono::seconds(2)};
  // How long one wait on the signal queue may block.
  std::chrono::milliseconds signal_poll{std::chrono::milliseconds(200)};

  int critical_error_threshold = 1;
  int max_spawn_attempts = 5;
  int max_hang_restarts = 3;

  std::chrono::milliseconds backoff_base{std::chrono::seconds(1)};
  std::chrono::milliseconds backoff_max{std::chrono::seconds(30)};
  std::chrono::milliseconds backoff_jitter{std::chrono::milliseconds(500)};
  uint32_t backoff_seed = 0;  // 0: random.
};

struct SupervisorStats {
  StreamMode mode = StreamMode::kPerItem;
  uint64_t runs_started = 0;
  uint64_t clean_exits = 0;
  uint64_t failed_exits = 0;
  uint64_t critical_errors = 0;
  uint64_t hung_restarts = 0;
  uint64_t spawn_failures = 0;
  uint64_t denylisted = 0;
  std::string current_target;  // Empty between runs.
  std::string now_playing;     // Last input the encoder opened.
};

// Outcome of watching one run until it must end.
struct RunOutcome {
  enum class Kind {
    kStopped = 0,       // Shutdown requested.
    kCleanExit = 1,
    kFailedExit = 2,    // Non-zero exit, no critical signal.
    kCriticalError = 3,
    kHung = 4,
  };
  Kind kind = Kind::kStopped;
  int exit_code = 0;
  std::optional<std::string> input;  // Attributed input, best effort.
};

const char* ToString(RunOutcome::Kind kind);

// TranscodeSupervisor runs one SupervisedRun at a time. Run() is a bounded
// loop: each iteration prepares a unit, starts it, watches it, stops it, and
// picks the next PrepareReason from the outcome.
//
// Failure policy:
//   critical decode error  -> stop, denylist + ReportBad the attributed
//                             input, continue with the next unit. With no
//                             attributable input, back off and restart.
//   non-zero exit          -> back off, retry the same unit once; a second
//                             failure counts as a critical error against
//                             the input the encoder had open.
//   silence (hung)         -> no progress line for liveness_window, even if
//                             other output keeps arriving.
//                             Kill, back off, restart the same unit; after
//                             max_hang_restarts consecutive hangs, skip it.
//   spawn failure          -> back off and retry; fatal after
//                             max_spawn_attempts in a row.
//   clean exit             -> idle gap, next unit.
class TranscodeSupervisor {
 public:
  TranscodeSupervisor(std::unique_ptr<PlaybackStrategy> strategy,
                      playback::PlaybackSequencer& sequencer,
                      ITranscoderLauncher& launcher,
                      SupervisorOptions options = {});

  TranscodeSupervisor(const TranscodeSupervisor&) = delete;
  TranscodeSupervisor& operator=(const TranscodeSupervisor&) = delete;

  // Returns when `stop` is requested. Throws NoPlayableMediaError when the
  // catalog is exhausted, ProcessSpawnError after repeated spawn failures.
  void Run(const util::StopToken& stop);

  // Spawns the encoder for `unit` and starts its reader.
  // Throws ProcessSpawnError.
  std::unique_ptr<SupervisedRun> StartRun(const RunUnit& unit);

  // Graceful stop with forced kill after the grace period. Returns the
  // exit code.
  int StopRun(SupervisedRun& run);

  // Consumes signals until the run must end.
  RunOutcome Watch(SupervisedRun& run, const util::StopToken& stop);

  SupervisorStats GetStats() const;

 private:
  // Returns false when no input could be blamed.
  bool HandleBadInput(const std::optional<std::string>& attributed,
                      const RunUnit& unit);

  std::unique_ptr<PlaybackStrategy> strategy_;
  playback::PlaybackSequencer& sequencer_;
  ITranscoderLauncher& launcher_;
  SupervisorOptions options_;
  util::BackoffPolicy backoff_;

  mutable std::mutex stats_mutex_;
  SupervisorStats stats_;
};

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_TRANSCODE_SUPERVISOR_HPP_
