// Repository: Loopcast
// Component: Health Signal
// Purpose: Typed events derived from the encoder's diagnostic stream.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_SUPERVISOR_HEALTH_SIGNAL_HPP_
#define LOOPCAST_SUPERVISOR_HEALTH_SIGNAL_HPP_

#include <optional>
#include <string>

namespace loopcast::supervisor {

struct HealthSignal {
  enum class Kind {
    kInfo = 0,                 // Anything unclassified.
    kProgress = 1,             // Frame/throughput report; resets liveness.
    kWarning = 2,              // Non-fatal; logged.
    kCriticalDecodeError = 3,  // Decoder-level corruption; input is suspect.
    kInputOpened = 4,          // Encoder opened an input file for reading.
    kProcessExited = 5,        // Emitted by the reader after EOF + reap.
  };

  Kind kind = Kind::kInfo;
  std::string line;         // Source line (empty for kProcessExited).
  std::string opened_path;  // kInputOpened only.
  // Input the encoder had open when this line was read. Best effort: under
  // demuxer read-ahead it can lag by one item.
  std::optional<std::string> input_path;
  int exit_code = 0;        // kProcessExited only.

  static HealthSignal Exited(int code, std::optional<std::string> input) {
    HealthSignal s;
    s.kind = Kind::kProcessExited;
    s.exit_code = code;
    s.input_path = std::move(input);
    return s;
  }
};

const char* ToString(HealthSignal::Kind kind);

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_HEALTH_SIGNAL_HPP_
