// Repository: Loopcast
// Component: Segment Server
// Purpose: Static HTTP responder for the HLS output directory (Boost.Beast).
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_HTTP_SEGMENT_SERVER_HPP_
#define LOOPCAST_HTTP_SEGMENT_SERVER_HPP_

#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>

namespace loopcast::http {

// Plain file name inside the output directory: non-empty, no path
// separators, not "." or "..", no leading dot, no NUL.
bool IsSafeFileName(const std::string& name);

// application/vnd.apple.mpegurl, video/mp2t, or application/octet-stream.
const char* ContentTypeFor(const std::string& name);

// SegmentServer accepts connections on the caller's io_context and serves
// GET/HEAD for files directly under `root_dir`. Every response, including
// errors and OPTIONS preflights, disables caching and allows any origin.
// Error bodies are generic.
//
// Not thread-safe: Start() and Stop() run on the io_context's thread, or
// before it runs.
class SegmentServer {
 public:
  SegmentServer(boost::asio::io_context& ioc, std::string root_dir,
                std::string address, unsigned short port);
  ~SegmentServer();

  SegmentServer(const SegmentServer&) = delete;
  SegmentServer& operator=(const SegmentServer&) = delete;

  // Binds and starts accepting. Throws std::runtime_error if the address
  // cannot be bound.
  void Start();

  // Closes the acceptor. In-flight sessions finish on their own.
  void Stop();

  // Bound port (useful when constructed with port 0).
  unsigned short port() const { return bound_port_; }

 private:
  void DoAccept();
  void OnAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const std::string> root_dir_;
  std::string address_;
  unsigned short port_;
  unsigned short bound_port_ = 0;
  bool running_ = false;
};

}  // namespace loopcast::http

#endif  // LOOPCAST_HTTP_SEGMENT_SERVER_HPP_
