// Repository: Loopcast
// Component: Stream Errors
// Purpose: Fatal error taxonomy. Per-item failures are not exceptions; they
//          are absorbed by the supervisor and turned into skip/retry
//          decisions. Only the conditions below end the process.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_UTIL_STREAM_ERRORS_HPP_
#define LOOPCAST_UTIL_STREAM_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace loopcast {

// Inventory scan produced no candidates, or none survived probing.
class NoMediaFoundError : public std::runtime_error {
 public:
  explicit NoMediaFoundError(const std::string& what) : std::runtime_error(what) {}
};

// Every validated item has been denylisted; the operator must refresh the
// input set.
class NoPlayableMediaError : public std::runtime_error {
 public:
  explicit NoPlayableMediaError(const std::string& what) : std::runtime_error(what) {}
};

// fork/exec of the encoder failed (or the executable could not be run).
class ProcessSpawnError : public std::runtime_error {
 public:
  explicit ProcessSpawnError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace loopcast

#endif  // LOOPCAST_UTIL_STREAM_ERRORS_HPP_
