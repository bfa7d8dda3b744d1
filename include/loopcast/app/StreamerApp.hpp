// Repository: Loopcast
// Component: Streamer Application
// Purpose: Wires validator, sequencer, supervisor, reporter and servers;
//          owns startup, the main-thread event loop, and shutdown.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_APP_STREAMER_APP_HPP_
#define LOOPCAST_APP_STREAMER_APP_HPP_

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "loopcast/app/StreamerConfig.hpp"
#include "loopcast/catalog/IMediaProber.h"
#include "loopcast/control/StreamControlService.h"
#include "loopcast/http/SegmentServer.hpp"
#include "loopcast/playback/PlaybackSequencer.hpp"
#include "loopcast/status/OutputWatcher.hpp"
#include "loopcast/status/StatusReporter.hpp"
#include "loopcast/supervisor/ITranscoderProcess.h"
#include "loopcast/supervisor/TranscodeSupervisor.hpp"
#include "loopcast/util/BlockingQueue.hpp"
#include "loopcast/util/StopToken.hpp"

namespace loopcast::app {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;

// Completion report from a worker thread.
struct WorkerExit {
  std::string worker;
  bool ok = true;
  std::string error;
};

// StreamerApp runs the whole service. Run() blocks the calling thread in
// the HTTP io_context until shutdown, then joins every worker.
//
// Shutdown sources: SIGINT/SIGTERM (after InstallSignalHandlers()),
// RequestShutdown() from any thread, or the supervisor ending (fatal error).
class StreamerApp {
 public:
  StreamerApp(StreamerConfig config, catalog::IMediaProber& prober,
              supervisor::ITranscoderLauncher& launcher);
  ~StreamerApp();

  StreamerApp(const StreamerApp&) = delete;
  StreamerApp& operator=(const StreamerApp&) = delete;

  void InstallSignalHandlers();

  // Returns kExitOk after a requested shutdown, kExitFatal on startup
  // failure or a fatal supervisor error.
  int Run();

  // Thread-safe.
  void RequestShutdown();

  // 0 until the HTTP server is listening.
  unsigned short http_port() const { return http_port_.load(); }

  // Valid while Run() is executing past startup.
  status::StreamStatus CurrentStatus() const;

 private:
  bool Startup();
  void Shutdown();
  void SupervisorMain();
  int JoinWorkers();

  StreamerConfig config_;
  catalog::IMediaProber& prober_;
  supervisor::ITranscoderLauncher& launcher_;

  boost::asio::io_context ioc_;
  std::unique_ptr<boost::asio::signal_set> signals_;
  util::StopToken stop_;
  util::BlockingQueue<WorkerExit> exits_;

  std::unique_ptr<playback::PlaybackSequencer> sequencer_;
  std::unique_ptr<supervisor::TranscodeSupervisor> supervisor_;
  std::unique_ptr<http::SegmentServer> server_;
  std::unique_ptr<control::ControlServer> control_;
  std::unique_ptr<status::StatusReporter> reporter_;
  std::unique_ptr<status::OutputWatcher> output_watcher_;
  std::thread supervisor_thread_;

  std::atomic<unsigned short> http_port_{0};
};

}  // namespace loopcast::app

#endif  // LOOPCAST_APP_STREAMER_APP_HPP_
