// Repository: Loopcast
// Component: Stop Token
// Purpose: Shared cancellation flag with interruptible waits.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_UTIL_STOP_TOKEN_HPP_
#define LOOPCAST_UTIL_STOP_TOKEN_HPP_

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace loopcast::util {

// StopToken is handed to every worker at construction. Workers never sleep
// with std::this_thread::sleep_for; they call WaitFor() so that a shutdown
// request wakes them immediately.
//
// RequestStop() is idempotent and safe from any thread (but not from an
// async signal handler; use asio::signal_set or a self-pipe for that).
class StopToken {
 public:
  StopToken() = default;

  StopToken(const StopToken&) = delete;
  StopToken& operator=(const StopToken&) = delete;

  void RequestStop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stop_requested_ = true;
    }
    cv_.notify_all();
  }

  bool StopRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stop_requested_;
  }

  // Blocks for up to `timeout`. Returns true if stop was requested (either
  // before or during the wait), false if the full timeout elapsed.
  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return stop_requested_; });
  }

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool stop_requested_ = false;
};

}  // namespace loopcast::util

#endif  // LOOPCAST_UTIL_STOP_TOKEN_HPP_
