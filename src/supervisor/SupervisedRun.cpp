// Repository: Loopcast
// Component: Supervised Run
// Purpose: One active encoder: the process handle, its diagnostic reader
//          worker, and the signal queue the supervisor consumes.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/supervisor/SupervisedRun.hpp"

#include "loopcast/supervisor/LineClassifier.hpp"
#include "loopcast/util/Logger.hpp"

namespace loopcast::supervisor {

namespace {

// Bounded poll so process exit without EOF (a grandchild holding the pipe)
// is still observed.
constexpr std::chrono::milliseconds kReadPollInterval{100};

// After SIGKILL the reap is normally immediate; log if it is not.
constexpr std::chrono::seconds kKillConfirmInterval{5};

}  // namespace

const char* ToString(SupervisedRun::State state) {
  switch (state) {
    case SupervisedRun::State::kRunning:
      return "running";
    case SupervisedRun::State::kStopping:
      return "stopping";
    case SupervisedRun::State::kExited:
      return "exited";
  }
  return "unknown";
}

SupervisedRun::SupervisedRun(std::string target,
                             std::unique_ptr<ITranscoderProcess> process,
                             std::optional<std::string> initial_input)
    : target_(std::move(target)),
      process_(std::move(process)),
      pid_(process_->Pid()),
      started_at_(Clock::now()),
      last_healthy_at_(started_at_),
      current_input_(std::move(initial_input)) {
  reader_ = std::thread(&SupervisedRun::ReaderLoop, this);
}

SupervisedRun::~SupervisedRun() {
  if (reader_.joinable()) {
    Stop(std::chrono::milliseconds(0));
  }
}

void SupervisedRun::ReaderLoop() {
  std::string line;
  std::optional<int> code;

  while (!code) {
    const auto status = process_->ReadLine(line, kReadPollInterval);
    if (status == ITranscoderProcess::ReadStatus::kLine) {
      HealthSignal signal = ClassifyLine(line);
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (signal.kind == HealthSignal::Kind::kInputOpened) {
          current_input_ = signal.opened_path;
        } else if (signal.kind == HealthSignal::Kind::kProgress) {
          last_healthy_at_ = Clock::now();
        }
        signal.input_path = current_input_;
      }
      signals_.Push(std::move(signal));
      continue;
    }
    if (status == ITranscoderProcess::ReadStatus::kEof) {
      code = process_->Wait();
      break;
    }
    // Timeout: the child may be gone while something else holds the pipe.
    code = process_->TryWait();
  }

  std::optional<std::string> input;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = State::kExited;
    exit_code_ = code;
    input = current_input_;
  }
  exited_cv_.notify_all();
  signals_.Push(HealthSignal::Exited(*code, std::move(input)));
}

std::optional<HealthSignal> SupervisedRun::NextSignal(
    std::chrono::milliseconds timeout) {
  return signals_.PopFor(timeout);
}

bool SupervisedRun::WaitForExit(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return exited_cv_.wait_for(lock, timeout,
                             [this] { return state_ == State::kExited; });
}

int SupervisedRun::Stop(std::chrono::milliseconds grace) {
  bool exited = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    exited = state_ == State::kExited;
    if (!exited) state_ = State::kStopping;
  }

  if (!exited) {
    if (grace.count() > 0) {
      process_->Terminate();
      exited = WaitForExit(grace);
    }
    if (!exited) {
      if (grace.count() > 0) {
        util::Logger::Warn("[Supervisor] pid=" + std::to_string(pid_) +
                           " ignored SIGTERM for " +
                           std::to_string(grace.count()) + "ms; killing");
      }
      process_->Kill();
      while (!WaitForExit(kKillConfirmInterval)) {
        util::Logger::Warn("[Supervisor] Waiting for pid=" +
                           std::to_string(pid_) + " to exit after SIGKILL");
        process_->Kill();
      }
    }
  }

  if (reader_.joinable()) {
    reader_.join();
  }
  signals_.Close();

  std::lock_guard<std::mutex> lock(mutex_);
  return exit_code_.value_or(-1);
}

SupervisedRun::State SupervisedRun::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

SupervisedRun::Clock::time_point SupervisedRun::last_healthy_signal_at() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_healthy_at_;
}

std::optional<std::string> SupervisedRun::current_input() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_input_;
}

std::optional<int> SupervisedRun::exit_code() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return exit_code_;
}

}  // namespace loopcast::supervisor
