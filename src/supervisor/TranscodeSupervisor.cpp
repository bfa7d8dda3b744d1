// Repository: Loopcast
// Component: Transcode Supervisor
// Purpose: Owns the encoder lifecycle; turns health signals into restart,
//          skip and denylist decisions.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/supervisor/TranscodeSupervisor.hpp"

#include <random>

#include "loopcast/catalog/MediaItem.hpp"
#include "loopcast/util/Logger.hpp"
#include "loopcast/util/StreamErrors.hpp"

namespace loopcast::supervisor {

namespace {

uint32_t SeedOrRandom(uint32_t seed) {
  return seed != 0 ? seed : std::random_device{}();
}

std::string JoinArgs(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) out += ' ';
    out += arg;
  }
  return out;
}

}  // namespace

const char* ToString(RunOutcome::Kind kind) {
  switch (kind) {
    case RunOutcome::Kind::kStopped:
      return "stopped";
    case RunOutcome::Kind::kCleanExit:
      return "clean_exit";
    case RunOutcome::Kind::kFailedExit:
      return "failed_exit";
    case RunOutcome::Kind::kCriticalError:
      return "critical_error";
    case RunOutcome::Kind::kHung:
      return "hung";
  }
  return "unknown";
}

TranscodeSupervisor::TranscodeSupervisor(std::unique_ptr<PlaybackStrategy> strategy,
                                         playback::PlaybackSequencer& sequencer,
                                         ITranscoderLauncher& launcher,
                                         SupervisorOptions options)
    : strategy_(std::move(strategy)),
      sequencer_(sequencer),
      launcher_(launcher),
      options_(options),
      backoff_(options.backoff_base, options.backoff_max, options.backoff_jitter,
               SeedOrRandom(options.backoff_seed)) {
  stats_.mode = strategy_->mode();
}

std::unique_ptr<SupervisedRun> TranscodeSupervisor::StartRun(const RunUnit& unit) {
  util::Logger::Debug("[Supervisor] exec: " + JoinArgs(unit.argv));

  std::unique_ptr<ITranscoderProcess> process = launcher_.Launch(unit.argv);
  if (!process) {
    throw ProcessSpawnError("launcher returned no process for " + unit.target);
  }
  auto run = std::make_unique<SupervisedRun>(unit.target, std::move(process),
                                             unit.initial_input);
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.runs_started;
    stats_.current_target = unit.target;
    stats_.now_playing = unit.initial_input.value_or("");
  }
  util::Logger::Info("[Supervisor] Encoder pid=" + std::to_string(run->pid()) +
                     " started for " + catalog::DisplayName(unit.target));
  return run;
}

int TranscodeSupervisor::StopRun(SupervisedRun& run) {
  const int code = run.Stop(options_.grace_period);
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_.current_target.clear();
  }
  util::Logger::Info("[Supervisor] Encoder pid=" + std::to_string(run.pid()) +
                     " ended (exit code " + std::to_string(code) + ")");
  return code;
}

RunOutcome TranscodeSupervisor::Watch(SupervisedRun& run, const util::StopToken& stop) {
  int critical_count = 0;

  while (true) {
    if (stop.StopRequested()) {
      return RunOutcome{RunOutcome::Kind::kStopped, 0, run.current_input()};
    }

    std::optional<HealthSignal> signal = run.NextSignal(options_.signal_poll);
    if (signal) {
      switch (signal->kind) {
        case HealthSignal::Kind::kProgress:
        case HealthSignal::Kind::kInfo:
          util::Logger::Debug("[Transcoder] " + signal->line);
          break;

        case HealthSignal::Kind::kWarning:
          util::Logger::Warn("[Transcoder] " + signal->line);
          break;

        case HealthSignal::Kind::kInputOpened:
          if (signal->opened_path != run.target()) {
            util::Logger::Info("[Supervisor] Now playing: " +
                               catalog::DisplayName(signal->opened_path));
            strategy_->OnInputOpened(signal->opened_path);
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.now_playing = signal->opened_path;
          }
          break;

        case HealthSignal::Kind::kCriticalDecodeError:
          util::Logger::Error("[Supervisor] Critical decode error (input: " +
                              signal->input_path.value_or("unknown") + "): " +
                              signal->line);
          if (++critical_count >= options_.critical_error_threshold) {
            return RunOutcome{RunOutcome::Kind::kCriticalError, 0,
                              signal->input_path};
          }
          break;

        case HealthSignal::Kind::kProcessExited:
          if (signal->exit_code == 0) {
            return RunOutcome{RunOutcome::Kind::kCleanExit, 0, signal->input_path};
          }
          return RunOutcome{RunOutcome::Kind::kFailedExit, signal->exit_code,
                            signal->input_path};
      }
    }

    if (run.state() == SupervisedRun::State::kExited) {
      // kProcessExited is already queued.
      continue;
    }
    // Checked after every signal: warnings and other chatter are not progress.
    const auto silent_for = SupervisedRun::Clock::now() - run.last_healthy_signal_at();
    if (silent_for >= options_.liveness_window) {
      util::Logger::Warn(
          "[Supervisor] No progress from pid=" + std::to_string(run.pid()) +
          " for " +
          std::to_string(
              std::chrono::duration_cast<std::chrono::milliseconds>(silent_for).count()) +
          "ms; treating as hung");
      return RunOutcome{RunOutcome::Kind::kHung, 0, run.current_input()};
    }
  }
}

bool TranscodeSupervisor::HandleBadInput(const std::optional<std::string>& attributed,
                                         const RunUnit& unit) {
  std::optional<std::string> path = attributed;
  // In manifest mode the manifest itself is the first input opened.
  if (path && *path == unit.target && unit.fallback_attribution != path) {
    path.reset();
  }
  if (!path) {
    path = unit.fallback_attribution;
  }
  if (!path) {
    util::Logger::Warn("[Supervisor] Failure not attributable to an input; "
                       "restarting without denylisting");
    return false;
  }

  util::Logger::Warn("[Supervisor] Denylisting " + *path);
  sequencer_.ReportBad(*path);
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.denylisted;
  return true;
}

void TranscodeSupervisor::Run(const util::StopToken& stop) {
  util::Logger::Info(std::string("[Supervisor] Starting in ") +
                     ToString(strategy_->mode()) + " mode");

  PrepareReason reason = PrepareReason::kFresh;
  std::optional<RunUnit> unit;
  int spawn_attempts = 0;
  int unit_failures = 0;
  int unit_hangs = 0;

  while (!stop.StopRequested()) {
    if (reason != PrepareReason::kRetrySame) {
      unit_failures = 0;
      unit_hangs = 0;
    }

    std::unique_ptr<SupervisedRun> run;
    bool prepared = false;
    try {
      unit = strategy_->Prepare(reason, unit ? &*unit : nullptr);
      prepared = true;
      run = StartRun(*unit);
      spawn_attempts = 0;
    } catch (const ProcessSpawnError& e) {
      ++spawn_attempts;
      {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++stats_.spawn_failures;
      }
      if (spawn_attempts >= options_.max_spawn_attempts) {
        util::Logger::Error("[Supervisor] Giving up after " +
                            std::to_string(spawn_attempts) +
                            " spawn failures: " + e.what());
        throw;
      }
      const auto delay = backoff_.DelayFor(static_cast<uint32_t>(spawn_attempts - 1));
      util::Logger::Warn("[Supervisor] Spawn failed (" + std::string(e.what()) +
                         "); retry " + std::to_string(spawn_attempts) + "/" +
                         std::to_string(options_.max_spawn_attempts - 1) + " in " +
                         std::to_string(delay.count()) + "ms");
      if (stop.WaitFor(delay)) break;
      if (prepared) reason = PrepareReason::kRetrySame;
      continue;
    }

    const RunOutcome outcome = Watch(*run, stop);
    StopRun(*run);
    run.reset();

    switch (outcome.kind) {
      case RunOutcome::Kind::kStopped:
        util::Logger::Info("[Supervisor] Stop requested");
        return;

      case RunOutcome::Kind::kCleanExit: {
        {
          std::lock_guard<std::mutex> lock(stats_mutex_);
          ++stats_.clean_exits;
        }
        util::Logger::Info("[Supervisor] Finished " + catalog::DisplayName(unit->target));
        reason = PrepareReason::kFresh;
        if (stop.WaitFor(options_.idle_gap)) return;
        break;
      }

      case RunOutcome::Kind::kCriticalError: {
        {
          std::lock_guard<std::mutex> lock(stats_mutex_);
          ++stats_.critical_errors;
        }
        if (HandleBadInput(outcome.input, *unit)) {
          reason = PrepareReason::kAfterBadInput;
          break;
        }
        // Nothing to skip: restart the same unit, backing off while it keeps
        // failing.
        ++unit_failures;
        const auto delay = backoff_.DelayFor(static_cast<uint32_t>(unit_failures - 1));
        if (stop.WaitFor(delay)) return;
        reason = PrepareReason::kRetrySame;
        break;
      }

      case RunOutcome::Kind::kFailedExit: {
        {
          std::lock_guard<std::mutex> lock(stats_mutex_);
          ++stats_.failed_exits;
        }
        ++unit_failures;
        reason = PrepareReason::kRetrySame;
        if (unit_failures >= 2) {
          util::Logger::Error("[Supervisor] " + catalog::DisplayName(unit->target) +
                              " failed again (exit code " +
                              std::to_string(outcome.exit_code) + ")");
          {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            ++stats_.critical_errors;
          }
          if (HandleBadInput(outcome.input, *unit)) {
            reason = PrepareReason::kAfterBadInput;
          }
        }
        const auto delay = backoff_.DelayFor(static_cast<uint32_t>(unit_failures - 1));
        util::Logger::Warn("[Supervisor] Encoder exited with code " +
                           std::to_string(outcome.exit_code) + "; restarting in " +
                           std::to_string(delay.count()) + "ms");
        if (stop.WaitFor(delay)) return;
        break;
      }

      case RunOutcome::Kind::kHung: {
        {
          std::lock_guard<std::mutex> lock(stats_mutex_);
          ++stats_.hung_restarts;
        }
        ++unit_hangs;
        if (unit_hangs >= options_.max_hang_restarts) {
          util::Logger::Warn("[Supervisor] " + catalog::DisplayName(unit->target) +
                             " hung " + std::to_string(unit_hangs) +
                             " times in a row; moving on");
          reason = PrepareReason::kFresh;
        } else {
          reason = PrepareReason::kRetrySame;
        }
        const auto delay = backoff_.DelayFor(static_cast<uint32_t>(unit_hangs - 1));
        if (stop.WaitFor(delay)) return;
        break;
      }
    }
  }
}

SupervisorStats TranscodeSupervisor::GetStats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

}  // namespace loopcast::supervisor
