// Repository: Loopcast
// Component: StreamControl gRPC Service Implementation
// Purpose: Serves the StreamControl service from live status snapshots.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_CONTROL_STREAM_CONTROL_SERVICE_H_
#define LOOPCAST_CONTROL_STREAM_CONTROL_SERVICE_H_

#include <functional>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "stream_control.grpc.pb.h"
#include "stream_control.pb.h"
#include "loopcast/playback/PlaybackSequencer.hpp"
#include "loopcast/supervisor/TranscodeSupervisor.hpp"

namespace loopcast::control {

constexpr char kApiVersion[] = "1.0.0";

// Snapshot accessors; called on gRPC threads.
struct StatusProviders {
  std::function<playback::PlaybackSequencer::Snapshot(size_t recent_count)> sequence;
  std::function<supervisor::SupervisorStats()> supervisor;
};

// StreamControlImpl is a thin read-only adapter: it copies snapshots into
// the response and never mutates playback.
class StreamControlImpl final : public StreamControl::Service {
 public:
  explicit StreamControlImpl(StatusProviders providers);

  StreamControlImpl(const StreamControlImpl&) = delete;
  StreamControlImpl& operator=(const StreamControlImpl&) = delete;

  grpc::Status GetStatus(grpc::ServerContext* context,
                         const GetStatusRequest* request,
                         StreamStatus* response) override;

  grpc::Status GetVersion(grpc::ServerContext* context,
                          const ApiVersionRequest* request,
                          ApiVersion* response) override;

 private:
  StatusProviders providers_;
};

// Owns the grpc::Server hosting StreamControlImpl.
class ControlServer {
 public:
  ControlServer(std::string address, StatusProviders providers);
  ~ControlServer();

  ControlServer(const ControlServer&) = delete;
  ControlServer& operator=(const ControlServer&) = delete;

  // Throws std::runtime_error if the server cannot be started.
  void Start();
  void Shutdown();

  // Port chosen by gRPC (for addresses ending in ":0").
  int port() const { return selected_port_; }

 private:
  std::string address_;
  StreamControlImpl service_;
  std::unique_ptr<grpc::Server> server_;
  int selected_port_ = 0;
};

}  // namespace loopcast::control

#endif  // LOOPCAST_CONTROL_STREAM_CONTROL_SERVICE_H_
