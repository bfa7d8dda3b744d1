// Repository: Loopcast
// Component: Supervised Run
// Purpose: One active encoder: the process handle, its diagnostic reader
//          worker, and the signal queue the supervisor consumes.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_SUPERVISOR_SUPERVISED_RUN_HPP_
#define LOOPCAST_SUPERVISOR_SUPERVISED_RUN_HPP_

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "loopcast/supervisor/HealthSignal.hpp"
#include "loopcast/supervisor/ITranscoderProcess.h"
#include "loopcast/util/BlockingQueue.hpp"

namespace loopcast::supervisor {

// SupervisedRun starts its reader thread on construction. The reader turns
// each diagnostic line into a HealthSignal tagged with the input the encoder
// had open, pushes it to the queue, and after EOF reaps the child and
// pushes a final kProcessExited.
//
// Stop() must be called before destruction to honour the grace period; the
// destructor falls back to an immediate kill.
class SupervisedRun {
 public:
  enum class State {
    kRunning = 0,
    kStopping = 1,  // Terminate sent, waiting for exit.
    kExited = 2,    // Child reaped; reader may still be draining.
  };

  using Clock = std::chrono::steady_clock;

  // `initial_input` seeds attribution before the encoder logs any input
  // (per-item runs know their file up front).
  SupervisedRun(std::string target,
                std::unique_ptr<ITranscoderProcess> process,
                std::optional<std::string> initial_input);
  ~SupervisedRun();

  SupervisedRun(const SupervisedRun&) = delete;
  SupervisedRun& operator=(const SupervisedRun&) = delete;

  // Next signal, or nullopt after `timeout`.
  std::optional<HealthSignal> NextSignal(std::chrono::milliseconds timeout);

  // SIGTERM, wait up to `grace`, then SIGKILL and wait for the reap. Joins
  // the reader. Returns the exit code. Idempotent.
  int Stop(std::chrono::milliseconds grace);

  const std::string& target() const { return target_; }
  int pid() const { return pid_; }
  Clock::time_point started_at() const { return started_at_; }

  State state() const;
  Clock::time_point last_healthy_signal_at() const;
  std::optional<std::string> current_input() const;
  std::optional<int> exit_code() const;

 private:
  void ReaderLoop();
  bool WaitForExit(std::chrono::milliseconds timeout);

  const std::string target_;
  std::unique_ptr<ITranscoderProcess> process_;
  const int pid_;
  const Clock::time_point started_at_;

  util::BlockingQueue<HealthSignal> signals_;

  mutable std::mutex mutex_;
  std::condition_variable exited_cv_;
  State state_ = State::kRunning;
  Clock::time_point last_healthy_at_;
  std::optional<std::string> current_input_;
  std::optional<int> exit_code_;

  std::thread reader_;
};

const char* ToString(SupervisedRun::State state);

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_SUPERVISED_RUN_HPP_
