// Repository: Loopcast
// Component: Streamer Application
// Purpose: Wires validator, sequencer, supervisor, reporter and servers;
//          owns startup, the main-thread event loop, and shutdown.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/app/StreamerApp.hpp"

#include <csignal>
#include <exception>
#include <stdexcept>

#include <boost/asio/post.hpp>

#include "loopcast/catalog/InventoryValidator.hpp"
#include "loopcast/playback/Denylist.hpp"
#include "loopcast/supervisor/OutputHousekeeping.hpp"
#include "loopcast/supervisor/PlaybackStrategy.hpp"
#include "loopcast/util/Logger.hpp"
#include "loopcast/util/StreamErrors.hpp"

namespace loopcast::app {

namespace net = boost::asio;

StreamerApp::StreamerApp(StreamerConfig config, catalog::IMediaProber& prober,
                         supervisor::ITranscoderLauncher& launcher)
    : config_(std::move(config)), prober_(prober), launcher_(launcher) {}

StreamerApp::~StreamerApp() {
  stop_.RequestStop();
  JoinWorkers();
}

void StreamerApp::InstallSignalHandlers() {
  signals_ = std::make_unique<net::signal_set>(ioc_, SIGINT, SIGTERM);
  signals_->async_wait([this](const boost::system::error_code& ec, int signo) {
    if (ec) return;
    util::Logger::Info("[Loopcast] Received signal " + std::to_string(signo) +
                       ", shutting down");
    stop_.RequestStop();
    Shutdown();
  });
}

void StreamerApp::RequestShutdown() {
  stop_.RequestStop();
  net::post(ioc_, [this] { Shutdown(); });
}

void StreamerApp::Shutdown() {
  if (server_) server_->Stop();
  if (signals_) {
    boost::system::error_code ec;
    signals_->cancel(ec);
  }
  // Also abandons idle keep-alive sessions.
  ioc_.stop();
}

status::StreamStatus StreamerApp::CurrentStatus() const {
  status::StreamStatus status;
  if (sequencer_) status.sequence = sequencer_->GetSnapshot();
  if (supervisor_) status.supervisor = supervisor_->GetStats();
  return status;
}

bool StreamerApp::Startup() {
  try {
    util::Logger::Info(std::string("[Loopcast] Starting: media=") + config_.media_dir +
                       " hls=" + config_.hls_dir + " mode=" +
                       supervisor::ToString(config_.mode));

    if (!supervisor::EnsureOutputDirectory(config_.hls_dir)) {
      return false;
    }

    auto denylist = std::make_shared<playback::Denylist>(config_.denylist_path);
    if (denylist->Size() > 0) {
      util::Logger::Info("[Loopcast] Loaded " + std::to_string(denylist->Size()) +
                         " denylisted path(s) from " + config_.denylist_path);
    }

    catalog::InventoryOptions inventory_options;
    inventory_options.probe_timeout = config_.probe_timeout;
    catalog::InventoryValidator validator(prober_, inventory_options);
    catalog::ValidatedInventory inventory = validator.BuildInventory(
        config_.media_dir, config_.min_size_bytes, config_.min_duration_seconds);

    playback::SequencerOptions sequencer_options;
    sequencer_options.seed = config_.seed;
    sequencer_ = std::make_unique<playback::PlaybackSequencer>(
        std::move(inventory), denylist, sequencer_options);
    if (sequencer_->state() == playback::PlaybackSequencer::State::kEmpty) {
      throw NoPlayableMediaError("every validated file is denylisted");
    }

    supervisor::StrategyOptions strategy_options;
    strategy_options.output_dir = config_.hls_dir;
    strategy_options.manifest_path = config_.manifest_path;
    strategy_options.ffmpeg_path = config_.ffmpeg_path;
    strategy_options.loglevel = config_.ffmpeg_loglevel;

    std::unique_ptr<supervisor::PlaybackStrategy> strategy;
    if (config_.mode == supervisor::StreamMode::kPerItem) {
      strategy = std::make_unique<supervisor::PerItemStrategy>(*sequencer_, strategy_options);
    } else {
      strategy = std::make_unique<supervisor::ManifestLoopStrategy>(*sequencer_,
                                                                    strategy_options);
    }

    supervisor::SupervisorOptions supervisor_options;
    supervisor_options.liveness_window = config_.liveness_window;
    supervisor_options.grace_period = config_.grace_period;
    supervisor_options.idle_gap = config_.idle_gap;
    supervisor_ = std::make_unique<supervisor::TranscodeSupervisor>(
        std::move(strategy), *sequencer_, launcher_, supervisor_options);

    server_ = std::make_unique<http::SegmentServer>(ioc_, config_.hls_dir,
                                                    config_.listen_address, config_.port);
    server_->Start();
    http_port_.store(server_->port());

    if (!config_.control_address.empty()) {
      control::StatusProviders providers;
      providers.sequence = [this](size_t recent) { return sequencer_->GetSnapshot(recent); };
      providers.supervisor = [this] { return supervisor_->GetStats(); };
      control_ = std::make_unique<control::ControlServer>(config_.control_address,
                                                           std::move(providers));
      control_->Start();
    }
    return true;
  } catch (const NoMediaFoundError& e) {
    util::Logger::Error(std::string("[Loopcast] No media: ") + e.what());
  } catch (const NoPlayableMediaError& e) {
    util::Logger::Error(std::string("[Loopcast] No playable media: ") + e.what());
  } catch (const std::runtime_error& e) {
    util::Logger::Error(std::string("[Loopcast] Startup failed: ") + e.what());
  } catch (const std::invalid_argument& e) {
    util::Logger::Error(std::string("[Loopcast] Invalid configuration: ") + e.what());
  }
  return false;
}

void StreamerApp::SupervisorMain() {
  WorkerExit exit{"supervisor", true, ""};
  try {
    supervisor_->Run(stop_);
  } catch (const std::exception& e) {
    exit.ok = false;
    exit.error = e.what();
    util::Logger::Error(std::string("[Loopcast] Supervisor stopped: ") + e.what());
  }
  exits_.Push(std::move(exit));
  // The server must not outlive the stream.
  RequestShutdown();
}

int StreamerApp::JoinWorkers() {
  if (supervisor_thread_.joinable()) supervisor_thread_.join();
  if (reporter_) reporter_->Join();
  if (output_watcher_) output_watcher_->Join();
  if (control_) control_->Shutdown();

  int code = kExitOk;
  while (auto exit = exits_.TryPop()) {
    if (!exit->ok) {
      util::Logger::Error("[Loopcast] Worker '" + exit->worker + "' failed: " + exit->error);
      code = kExitFatal;
    }
  }
  return code;
}

int StreamerApp::Run() {
  if (!Startup()) {
    if (control_) control_->Shutdown();
    return kExitFatal;
  }

  reporter_ = std::make_unique<status::StatusReporter>(
      [this] { return CurrentStatus(); }, config_.status_interval, stop_);
  reporter_->Start();

  status::OutputWatcherOptions watcher_options;
  watcher_options.interval = config_.output_interval;
  watcher_options.readiness_timeout = config_.ready_timeout;
  output_watcher_ = std::make_unique<status::OutputWatcher>(config_.hls_dir,
                                                            watcher_options, stop_);
  output_watcher_->Start();
  supervisor_thread_ = std::thread(&StreamerApp::SupervisorMain, this);

  ioc_.run();

  stop_.RequestStop();
  const int code = JoinWorkers();
  util::Logger::Info("[Loopcast] Exiting with code " + std::to_string(code));
  return code;
}

}  // namespace loopcast::app
