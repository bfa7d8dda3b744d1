// Repository: Loopcast
// Component: POSIX Transcoder Process
// Purpose: fork/exec child with stdout+stderr merged into one pipe.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/supervisor/PosixTranscoderProcess.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "loopcast/util/Logger.hpp"
#include "loopcast/util/StreamErrors.hpp"

namespace loopcast::supervisor {

namespace {

// A line longer than this without a terminator is emitted as-is.
constexpr size_t kMaxLineBytes = 64 * 1024;

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

std::string ErrnoText(int err) { return std::string(std::strerror(err)); }

}  // namespace

std::unique_ptr<PosixTranscoderProcess> PosixTranscoderProcess::Spawn(
    const std::vector<std::string>& argv) {
  if (argv.empty() || argv.front().empty()) {
    throw ProcessSpawnError("empty transcoder command line");
  }

  // Everything the child touches is prepared before fork().
  std::vector<char*> c_argv;
  c_argv.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    c_argv.push_back(const_cast<char*>(arg.c_str()));
  }
  c_argv.push_back(nullptr);

  int out_pipe[2] = {-1, -1};
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    throw ProcessSpawnError("pipe failed: " + ErrnoText(errno));
  }
  // Reports execvp failure from the child; closes on successful exec.
  int exec_pipe[2] = {-1, -1};
  if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    const int err = errno;
    CloseFd(out_pipe[0]);
    CloseFd(out_pipe[1]);
    throw ProcessSpawnError("pipe failed: " + ErrnoText(err));
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const int err = errno;
    CloseFd(out_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(exec_pipe[0]);
    CloseFd(exec_pipe[1]);
    throw ProcessSpawnError("fork failed: " + ErrnoText(err));
  }

  if (pid == 0) {
    // Child: async-signal-safe calls only.
    ::setpgid(0, 0);
    ::signal(SIGPIPE, SIG_DFL);
    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    sigset_t empty;
    sigemptyset(&empty);
    ::sigprocmask(SIG_SETMASK, &empty, nullptr);

    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::close(devnull);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(out_pipe[1], STDERR_FILENO);

    ::execvp(c_argv[0], c_argv.data());

    const int err = errno;
    ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  // Parent. Also set the group here so signalling right after Spawn()
  // returns cannot race the child's own setpgid().
  ::setpgid(pid, pid);
  CloseFd(out_pipe[1]);
  CloseFd(exec_pipe[1]);

  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    CloseFd(out_pipe[0]);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    throw ProcessSpawnError("exec " + argv.front() + " failed: " +
                            ErrnoText(child_errno));
  }

  util::Logger::Debug("[Transcoder] Spawned pid=" + std::to_string(pid) +
                      " cmd=" + argv.front());
  return std::unique_ptr<PosixTranscoderProcess>(
      new PosixTranscoderProcess(pid, out_pipe[0]));
}

PosixTranscoderProcess::PosixTranscoderProcess(pid_t pid, int read_fd)
    : pid_(pid), read_fd_(read_fd) {}

PosixTranscoderProcess::~PosixTranscoderProcess() {
  bool reaped = false;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    reaped = reaped_;
  }
  if (!reaped) {
    SignalGroup(SIGKILL);
    Wait();
  }
  CloseFd(read_fd_);
}

bool PosixTranscoderProcess::TakeBufferedLine(std::string& line) {
  while (true) {
    const size_t pos = buffer_.find_first_of("\r\n");
    if (pos == std::string::npos) {
      if (buffer_.size() >= kMaxLineBytes) {
        line.swap(buffer_);
        buffer_.clear();
        return true;
      }
      return false;
    }
    line.assign(buffer_, 0, pos);
    buffer_.erase(0, pos + 1);
    if (!line.empty()) return true;
  }
}

ITranscoderProcess::ReadStatus PosixTranscoderProcess::ReadLine(
    std::string& line, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    if (TakeBufferedLine(line)) return ReadStatus::kLine;
    if (eof_) {
      if (!buffer_.empty()) {
        line.swap(buffer_);
        buffer_.clear();
        return ReadStatus::kLine;
      }
      return ReadStatus::kEof;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0) remaining = std::chrono::milliseconds(0);

    pollfd pfd{};
    pfd.fd = read_fd_;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      util::Logger::Warn("[Transcoder] poll failed: " + ErrnoText(errno));
      eof_ = true;
      continue;
    }
    if (rc == 0) return ReadStatus::kTimeout;

    char chunk[4096];
    const ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
    if (n > 0) {
      buffer_.append(chunk, static_cast<size_t>(n));
    } else if (n == 0) {
      eof_ = true;
    } else if (errno != EINTR && errno != EAGAIN) {
      util::Logger::Warn("[Transcoder] read failed: " + ErrnoText(errno));
      eof_ = true;
    }
  }
}

void PosixTranscoderProcess::SignalGroup(int signo) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (reaped_) return;
  if (::kill(-pid_, signo) != 0 && errno == ESRCH) {
    ::kill(pid_, signo);
  }
}

void PosixTranscoderProcess::Terminate() { SignalGroup(SIGTERM); }

void PosixTranscoderProcess::Kill() { SignalGroup(SIGKILL); }

void PosixTranscoderProcess::RecordExit(int status) {
  if (WIFEXITED(status)) {
    exit_code_ = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    exit_code_ = -WTERMSIG(status);
  } else {
    exit_code_ = -1;
  }
  reaped_ = true;
}

std::optional<int> PosixTranscoderProcess::TryWait() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (reaped_) return exit_code_;
  int status = 0;
  const pid_t rc = ::waitpid(pid_, &status, WNOHANG);
  if (rc == pid_) {
    RecordExit(status);
    return exit_code_;
  }
  if (rc < 0 && errno == ECHILD) {
    // Reaped elsewhere; nothing left to wait for.
    exit_code_ = -1;
    reaped_ = true;
    return exit_code_;
  }
  return std::nullopt;
}

int PosixTranscoderProcess::Wait() {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (reaped_) return exit_code_;
  }
  int status = 0;
  pid_t rc = 0;
  do {
    rc = ::waitpid(pid_, &status, 0);
  } while (rc < 0 && errno == EINTR);

  std::lock_guard<std::mutex> lock(state_mutex_);
  if (rc == pid_) {
    RecordExit(status);
  } else {
    exit_code_ = -1;
    reaped_ = true;
  }
  return exit_code_;
}

std::unique_ptr<ITranscoderProcess> PosixTranscoderLauncher::Launch(
    const std::vector<std::string>& argv) {
  return PosixTranscoderProcess::Spawn(argv);
}

}  // namespace loopcast::supervisor
