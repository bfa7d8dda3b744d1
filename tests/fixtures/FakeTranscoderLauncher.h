// Repository: Loopcast
// Component: Fake Transcoder Launcher
// Purpose: Scripted encoder processes for supervisor tests. Each Launch()
//          consumes the next FakeRunScript (or the default one).
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_TESTS_FIXTURES_FAKE_TRANSCODER_LAUNCHER_H_
#define LOOPCAST_TESTS_FIXTURES_FAKE_TRANSCODER_LAUNCHER_H_

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "loopcast/supervisor/ITranscoderProcess.h"
#include "loopcast/util/StreamErrors.hpp"

namespace loopcast::tests {

struct FakeRunScript {
  enum class End {
    kExit = 0,              // Exit with exit_code once `lines` are read.
    kHang = 1,              // Stay alive and silent until signalled.
    kHangIgnoringTerm = 2,  // Like kHang, but only SIGKILL ends it.
    kHealthy = 3,           // Stay alive emitting progress until signalled.
    kChatter = 4,           // Stay alive repeating chatter_line, never progress.
  };

  std::vector<std::string> lines;
  End end = End::kHealthy;
  int exit_code = 0;
  std::string chatter_line;

  static FakeRunScript Healthy() { return FakeRunScript{}; }

  static FakeRunScript ExitWith(int code, std::vector<std::string> lines = {}) {
    FakeRunScript s;
    s.lines = std::move(lines);
    s.end = End::kExit;
    s.exit_code = code;
    return s;
  }

  static FakeRunScript Hang(std::vector<std::string> lines = {}) {
    FakeRunScript s;
    s.lines = std::move(lines);
    s.end = End::kHang;
    return s;
  }

  static FakeRunScript Chatter(std::string line) {
    FakeRunScript s;
    s.end = End::kChatter;
    s.chatter_line = std::move(line);
    return s;
  }

  static FakeRunScript CriticalAfter(std::vector<std::string> lines,
                                     const std::string& critical_line) {
    FakeRunScript s;
    s.lines = std::move(lines);
    s.lines.push_back(critical_line);
    s.end = End::kHealthy;
    return s;
  }
};

class FakeTranscoderProcess : public supervisor::ITranscoderProcess {
 public:
  FakeTranscoderProcess(int pid, FakeRunScript script)
      : pid_(pid), script_(std::move(script)),
        pending_(script_.lines.begin(), script_.lines.end()) {}

  int Pid() const override { return pid_; }

  ReadStatus ReadLine(std::string& line, std::chrono::milliseconds timeout) override {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!pending_.empty() && !exit_code_) {
      line = pending_.front();
      pending_.pop_front();
      return ReadStatus::kLine;
    }
    if (script_.end == FakeRunScript::End::kExit && !exit_code_) {
      exit_code_ = script_.exit_code;
      cv_.notify_all();
    }
    if (exit_code_) return ReadStatus::kEof;

    if (script_.end == FakeRunScript::End::kHealthy) {
      const auto step = std::min(timeout, std::chrono::milliseconds(20));
      cv_.wait_for(lock, step, [this] { return exit_code_.has_value(); });
      if (exit_code_) return ReadStatus::kEof;
      line = "frame=  100 fps= 30 q=28.0 size=    512kB time=00:00:03.33 bitrate=1258.3kbits/s speed=1x";
      return ReadStatus::kLine;
    }
    if (script_.end == FakeRunScript::End::kChatter) {
      const auto step = std::min(timeout, std::chrono::milliseconds(2));
      cv_.wait_for(lock, step, [this] { return exit_code_.has_value(); });
      if (exit_code_) return ReadStatus::kEof;
      line = script_.chatter_line;
      return ReadStatus::kLine;
    }
    cv_.wait_for(lock, timeout, [this] { return exit_code_.has_value(); });
    return exit_code_ ? ReadStatus::kEof : ReadStatus::kTimeout;
  }

  void Terminate() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++terminate_calls_;
    if (exit_code_ || script_.end == FakeRunScript::End::kHangIgnoringTerm) return;
    exit_code_ = -15;
    cv_.notify_all();
  }

  void Kill() override {
    std::lock_guard<std::mutex> lock(mutex_);
    ++kill_calls_;
    if (exit_code_) return;
    exit_code_ = -9;
    cv_.notify_all();
  }

  std::optional<int> TryWait() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
  }

  int Wait() override {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return exit_code_.has_value(); });
    return *exit_code_;
  }

  int terminate_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminate_calls_;
  }

  int kill_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kill_calls_;
  }

 private:
  const int pid_;
  const FakeRunScript script_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> pending_;
  std::optional<int> exit_code_;
  int terminate_calls_ = 0;
  int kill_calls_ = 0;
};

// Records every argv it is asked to launch. The first `fail_next` launches
// throw ProcessSpawnError.
class FakeTranscoderLauncher : public supervisor::ITranscoderLauncher {
 public:
  std::unique_ptr<supervisor::ITranscoderProcess> Launch(
      const std::vector<std::string>& argv) override {
    std::lock_guard<std::mutex> lock(mutex_);
    attempts_.push_back(argv);
    cv_.notify_all();
    if (fail_next_ > 0) {
      --fail_next_;
      throw ProcessSpawnError("scripted spawn failure");
    }
    FakeRunScript script = default_script_;
    if (!scripts_.empty()) {
      script = std::move(scripts_.front());
      scripts_.pop_front();
    }
    launches_.push_back(argv);
    cv_.notify_all();
    return std::make_unique<FakeTranscoderProcess>(next_pid_++, std::move(script));
  }

  void Enqueue(FakeRunScript script) {
    std::lock_guard<std::mutex> lock(mutex_);
    scripts_.push_back(std::move(script));
  }

  void SetDefault(FakeRunScript script) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_script_ = std::move(script);
  }

  void FailNext(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_next_ = count;
  }

  // Successful launches.
  std::vector<std::vector<std::string>> launches() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return launches_;
  }

  size_t attempt_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return attempts_.size();
  }

  bool WaitForLaunches(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return launches_.size() >= count; });
  }

  // Value following "-i" in a recorded argv.
  static std::string InputOf(const std::vector<std::string>& argv) {
    for (size_t i = 0; i + 1 < argv.size(); ++i) {
      if (argv[i] == "-i") return argv[i + 1];
    }
    return std::string();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<FakeRunScript> scripts_;
  FakeRunScript default_script_ = FakeRunScript::Healthy();
  std::vector<std::vector<std::string>> attempts_;
  std::vector<std::vector<std::string>> launches_;
  int fail_next_ = 0;
  int next_pid_ = 1000;
};

}  // namespace loopcast::tests

#endif  // LOOPCAST_TESTS_FIXTURES_FAKE_TRANSCODER_LAUNCHER_H_
