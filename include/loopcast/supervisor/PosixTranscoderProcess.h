// Repository: Loopcast
// Component: POSIX Transcoder Process
// Purpose: fork/exec child with stdout+stderr merged into one pipe.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_SUPERVISOR_POSIX_TRANSCODER_PROCESS_H_
#define LOOPCAST_SUPERVISOR_POSIX_TRANSCODER_PROCESS_H_

#include <sys/types.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "loopcast/supervisor/ITranscoderProcess.h"

namespace loopcast::supervisor {

// The child runs in its own process group; signals go to the whole group so
// helpers it forks cannot keep the pipe open after a kill.
//
// The destructor force-kills and reaps a child that is still running.
class PosixTranscoderProcess : public ITranscoderProcess {
 public:
  // Throws ProcessSpawnError if pipe/fork fails or execvp fails in the child.
  static std::unique_ptr<PosixTranscoderProcess> Spawn(
      const std::vector<std::string>& argv);

  ~PosixTranscoderProcess() override;

  PosixTranscoderProcess(const PosixTranscoderProcess&) = delete;
  PosixTranscoderProcess& operator=(const PosixTranscoderProcess&) = delete;

  int Pid() const override { return static_cast<int>(pid_); }

  ReadStatus ReadLine(std::string& line,
                      std::chrono::milliseconds timeout) override;

  void Terminate() override;
  void Kill() override;

  std::optional<int> TryWait() override;
  int Wait() override;

 private:
  PosixTranscoderProcess(pid_t pid, int read_fd);

  bool TakeBufferedLine(std::string& line);
  void SignalGroup(int signo);
  void RecordExit(int status);

  const pid_t pid_;
  int read_fd_;
  std::string buffer_;
  bool eof_ = false;

  // Guards reaped_/exit_code_ against concurrent signalling.
  std::mutex state_mutex_;
  bool reaped_ = false;
  int exit_code_ = 0;
};

class PosixTranscoderLauncher : public ITranscoderLauncher {
 public:
  std::unique_ptr<ITranscoderProcess> Launch(
      const std::vector<std::string>& argv) override;
};

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_POSIX_TRANSCODER_PROCESS_H_
