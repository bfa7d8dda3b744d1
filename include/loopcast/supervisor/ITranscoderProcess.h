// Repository: Loopcast
// Component: Transcoder Process Interface
// Purpose: Seam between the supervisor and a running encoder child.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_SUPERVISOR_ITRANSCODER_PROCESS_H_
#define LOOPCAST_SUPERVISOR_ITRANSCODER_PROCESS_H_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace loopcast::supervisor {

// ITranscoderProcess is one running encoder with its merged diagnostic
// stream. Threading contract:
//   - ReadLine / TryWait / Wait are called only by the run's reader thread.
//     The reader is the only thread that reaps the child.
//   - Terminate / Kill may be called from the supervisor thread at any time,
//     including after the child has exited (then they are no-ops).
class ITranscoderProcess {
 public:
  enum class ReadStatus {
    kLine = 0,     // `line` holds one line, terminator stripped.
    kTimeout = 1,  // Nothing complete within the timeout.
    kEof = 2,      // Stream closed and buffer drained.
  };

  virtual ~ITranscoderProcess() = default;

  virtual int Pid() const = 0;

  // Lines end at '\n' or '\r' (ffmpeg's stats line is rewritten with '\r').
  // Empty lines are skipped.
  virtual ReadStatus ReadLine(std::string& line,
                              std::chrono::milliseconds timeout) = 0;

  // Graceful stop request (SIGTERM).
  virtual void Terminate() = 0;
  // Forced stop (SIGKILL).
  virtual void Kill() = 0;

  // Non-blocking reap. Returns the exit code once the child is gone.
  // Exit code: status for a normal exit, negative signal number otherwise.
  virtual std::optional<int> TryWait() = 0;
  // Blocking reap. Idempotent.
  virtual int Wait() = 0;
};

// Spawns encoder processes. Throws ProcessSpawnError when the executable
// cannot be started.
class ITranscoderLauncher {
 public:
  virtual ~ITranscoderLauncher() = default;

  virtual std::unique_ptr<ITranscoderProcess> Launch(
      const std::vector<std::string>& argv) = 0;
};

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_ITRANSCODER_PROCESS_H_
