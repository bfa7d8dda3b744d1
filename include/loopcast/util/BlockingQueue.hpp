// Repository: Loopcast
// Component: Blocking Queue
// Purpose: Unbounded MPSC hand-off between workers (mutex + condvar).
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_UTIL_BLOCKING_QUEUE_HPP_
#define LOOPCAST_UTIL_BLOCKING_QUEUE_HPP_

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace loopcast::util {

template <typename T>
class BlockingQueue {
 public:
  BlockingQueue() = default;

  BlockingQueue(const BlockingQueue&) = delete;
  BlockingQueue& operator=(const BlockingQueue&) = delete;

  // Returns false if the queue was closed; the item is dropped.
  bool Push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) return false;
      items_.push_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  // Waits up to `timeout` for an item. Returns nullopt on timeout, or when
  // the queue is closed and drained.
  template <typename Rep, typename Period>
  std::optional<T> PopFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
    if (items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  std::optional<T> TryPop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) return std::nullopt;
    T item = std::move(items_.front());
    items_.pop_front();
    return item;
  }

  // After Close(), Push() fails and waiting consumers wake up. Items already
  // queued can still be popped.
  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_ = false;
};

}  // namespace loopcast::util

#endif  // LOOPCAST_UTIL_BLOCKING_QUEUE_HPP_
