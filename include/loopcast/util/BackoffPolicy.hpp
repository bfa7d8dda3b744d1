// Repository: Loopcast
// Component: Backoff Policy
// Purpose: Bounded exponential retry delay with jitter.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_UTIL_BACKOFF_POLICY_HPP_
#define LOOPCAST_UTIL_BACKOFF_POLICY_HPP_

#include <chrono>
#include <cstdint>
#include <random>

namespace loopcast::util {

// Delay for attempt n (0-based) is min(max, base * 2^n) plus a uniform
// jitter in [0, jitter]. The result never exceeds max + jitter.
class BackoffPolicy {
 public:
  BackoffPolicy(std::chrono::milliseconds base,
                std::chrono::milliseconds max,
                std::chrono::milliseconds jitter,
                uint32_t seed = std::random_device{}())
      : base_(base), max_(max), jitter_(jitter), rng_(seed) {}

  std::chrono::milliseconds DelayFor(uint32_t attempt) {
    int64_t delay = base_.count();
    for (uint32_t i = 0; i < attempt && delay < max_.count(); ++i) {
      delay *= 2;
    }
    if (delay > max_.count()) delay = max_.count();
    if (jitter_.count() > 0) {
      std::uniform_int_distribution<int64_t> dist(0, jitter_.count());
      delay += dist(rng_);
    }
    return std::chrono::milliseconds(delay);
  }

  std::chrono::milliseconds Max() const { return max_ + jitter_; }

 private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds max_;
  std::chrono::milliseconds jitter_;
  std::mt19937 rng_;
};

}  // namespace loopcast::util

#endif  // LOOPCAST_UTIL_BACKOFF_POLICY_HPP_
