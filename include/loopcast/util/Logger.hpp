// Repository: Loopcast
// Component: Thread-Safe Logger
// Purpose: Mutex-protected line logging shared by every worker thread.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_UTIL_LOGGER_HPP_
#define LOOPCAST_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace loopcast::util {

// One static mutex serializes every line, so output from the supervisor
// run loop, the diagnostic reader, the status reporter and the HTTP
// handlers never interleaves. Every call writes one line and flushes.
//
// Info:  stdout, normal operation.
// Debug: stdout, only when LOOPCAST_DEBUG is set (encoder chatter, argv).
// Warn:  stderr, recoverable problems (bad item, restart, probe failure).
// Error: stderr, failed runs and fatal conditions.
//
// Tests install per-level sinks that see each line before it is written.
// Pass nullptr to remove a sink.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

 private:
  static std::mutex mutex_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace loopcast::util

#endif  // LOOPCAST_UTIL_LOGGER_HPP_
