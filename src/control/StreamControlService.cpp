// Repository: Loopcast
// Component: StreamControl gRPC Service Implementation
// Purpose: Serves the StreamControl service from live status snapshots.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/control/StreamControlService.h"

#include <exception>
#include <stdexcept>

#include "loopcast/util/Logger.hpp"

namespace loopcast::control {

namespace {

constexpr size_t kDefaultRecentCount = 5;
constexpr size_t kMaxRecentCount = 500;

}  // namespace

StreamControlImpl::StreamControlImpl(StatusProviders providers)
    : providers_(std::move(providers)) {}

grpc::Status StreamControlImpl::GetStatus(grpc::ServerContext* /*context*/,
                                          const GetStatusRequest* request,
                                          StreamStatus* response) {
  if (!providers_.sequence || !providers_.supervisor) {
    return grpc::Status(grpc::StatusCode::UNAVAILABLE, "status not available");
  }

  size_t recent = request->recent_count();
  if (recent == 0) recent = kDefaultRecentCount;
  if (recent > kMaxRecentCount) recent = kMaxRecentCount;

  playback::PlaybackSequencer::Snapshot seq;
  supervisor::SupervisorStats sup;
  try {
    seq = providers_.sequence(recent);
    sup = providers_.supervisor();
  } catch (const std::exception& e) {
    util::Logger::Warn(std::string("[GetStatus] Snapshot failed: ") + e.what());
    return grpc::Status(grpc::StatusCode::INTERNAL, "status snapshot failed");
  }

  response->set_mode(supervisor::ToString(sup.mode));
  response->set_sequencer_state(playback::ToString(seq.state));
  response->set_cycle_count(seq.cycle_count);
  response->set_played_total(seq.played_total);
  response->set_order_size(seq.order_size);
  for (const auto& path : seq.recent) {
    response->add_recent_history(path);
  }

  SupervisorCounters* counters = response->mutable_supervisor();
  counters->set_runs_started(sup.runs_started);
  counters->set_clean_exits(sup.clean_exits);
  counters->set_failed_exits(sup.failed_exits);
  counters->set_critical_errors(sup.critical_errors);
  counters->set_hung_restarts(sup.hung_restarts);
  counters->set_spawn_failures(sup.spawn_failures);
  counters->set_denylisted(sup.denylisted);

  response->set_current_target(sup.current_target);
  response->set_now_playing(sup.now_playing);

  util::Logger::Debug("[GetStatus] played=" + std::to_string(seq.played_total) +
                      " cycle=" + std::to_string(seq.cycle_count));
  return grpc::Status::OK;
}

grpc::Status StreamControlImpl::GetVersion(grpc::ServerContext* /*context*/,
                                           const ApiVersionRequest* /*request*/,
                                           ApiVersion* response) {
  response->set_version(kApiVersion);
  util::Logger::Debug(std::string("[GetVersion] Returning version: ") + kApiVersion);
  return grpc::Status::OK;
}

ControlServer::ControlServer(std::string address, StatusProviders providers)
    : address_(std::move(address)), service_(std::move(providers)) {}

ControlServer::~ControlServer() {
  Shutdown();
}

void ControlServer::Start() {
  grpc::ServerBuilder builder;
  builder.AddListeningPort(address_, grpc::InsecureServerCredentials(), &selected_port_);
  builder.RegisterService(&service_);
  server_ = builder.BuildAndStart();
  if (!server_ || selected_port_ == 0) {
    server_.reset();
    throw std::runtime_error("cannot start control service on " + address_);
  }
  util::Logger::Info("[Control] StreamControl listening on " + address_ +
                     " (port " + std::to_string(selected_port_) +
                     ", API version " + kApiVersion + ")");
}

void ControlServer::Shutdown() {
  if (!server_) return;
  server_->Shutdown();
  server_->Wait();
  server_.reset();
  util::Logger::Info("[Control] StreamControl stopped");
}

}  // namespace loopcast::control
