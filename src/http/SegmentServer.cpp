// Repository: Loopcast
// Component: Segment Server
// Purpose: Static HTTP responder for the HLS output directory (Boost.Beast).
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/http/SegmentServer.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <tuple>
#include <utility>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "loopcast/util/Logger.hpp"

namespace loopcast::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net = boost::asio;
namespace fs = std::filesystem;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr std::chrono::seconds kSessionTimeout{30};

bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

template <class Body>
void ApplyStreamHeaders(bhttp::response<Body>& res) {
  res.set(bhttp::field::server, "Loopcast");
  res.set(bhttp::field::access_control_allow_origin, "*");
  res.set(bhttp::field::access_control_allow_methods, "GET, HEAD, OPTIONS");
  res.set(bhttp::field::access_control_allow_headers, "Content-Type");
  res.set(bhttp::field::cache_control, "no-cache, no-store, must-revalidate");
  res.set(bhttp::field::pragma, "no-cache");
  res.set(bhttp::field::expires, "0");
}

bhttp::response<bhttp::string_body> MakeTextResponse(
    const bhttp::request<bhttp::string_body>& req, bhttp::status status,
    const std::string& body) {
  bhttp::response<bhttp::string_body> res{status, req.version()};
  ApplyStreamHeaders(res);
  res.set(bhttp::field::content_type, "text/plain");
  res.keep_alive(req.keep_alive());
  if (req.method() != bhttp::verb::head) {
    res.body() = body;
  }
  res.prepare_payload();
  if (req.method() == bhttp::verb::head) {
    res.content_length(body.size());
  }
  return res;
}

void LogAccess(const std::string& client,
               const bhttp::request<bhttp::string_body>& req, unsigned status) {
  util::Logger::Info("HTTP: " + client + " \"" + std::string(req.method_string()) +
                     " " + std::string(req.target()) + "\" " +
                     std::to_string(status));
}

// Produces a response for `req` and hands it to `send`.
template <class Send>
void HandleRequest(const std::string& root, const std::string& client,
                   bhttp::request<bhttp::string_body>&& req, Send&& send) {
  const bhttp::verb method = req.method();

  if (method == bhttp::verb::options) {
    bhttp::response<bhttp::empty_body> res{bhttp::status::ok, req.version()};
    ApplyStreamHeaders(res);
    res.keep_alive(req.keep_alive());
    res.content_length(0);
    LogAccess(client, req, 200);
    return send(std::move(res));
  }

  if (method != bhttp::verb::get && method != bhttp::verb::head) {
    auto res = MakeTextResponse(req, bhttp::status::method_not_allowed,
                                "Method Not Allowed");
    res.set(bhttp::field::allow, "GET, HEAD, OPTIONS");
    LogAccess(client, req, 405);
    return send(std::move(res));
  }

  std::string target(req.target());
  const size_t query = target.find_first_of("?#");
  if (query != std::string::npos) target.resize(query);

  const std::string name = target.empty() ? std::string() : target.substr(1);
  if (target.empty() || target.front() != '/' || !IsSafeFileName(name)) {
    LogAccess(client, req, 404);
    return send(MakeTextResponse(req, bhttp::status::not_found, "Not Found"));
  }

  const std::string path = (fs::path(root) / name).string();
  std::error_code fs_ec;
  if (!fs::is_regular_file(path, fs_ec)) {
    LogAccess(client, req, 404);
    return send(MakeTextResponse(req, bhttp::status::not_found, "Not Found"));
  }

  bhttp::file_body::value_type body;
  beast::error_code ec;
  body.open(path.c_str(), beast::file_mode::scan, ec);
  if (ec) {
    // Segment rotated away between the check and the open.
    LogAccess(client, req, 404);
    return send(MakeTextResponse(req, bhttp::status::not_found, "Not Found"));
  }
  const auto size = body.size();

  if (method == bhttp::verb::head) {
    bhttp::response<bhttp::empty_body> res{bhttp::status::ok, req.version()};
    ApplyStreamHeaders(res);
    res.set(bhttp::field::content_type, ContentTypeFor(name));
    res.content_length(size);
    res.keep_alive(req.keep_alive());
    LogAccess(client, req, 200);
    return send(std::move(res));
  }

  bhttp::response<bhttp::file_body> res{
      std::piecewise_construct, std::make_tuple(std::move(body)),
      std::make_tuple(bhttp::status::ok, req.version())};
  ApplyStreamHeaders(res);
  res.set(bhttp::field::content_type, ContentTypeFor(name));
  res.content_length(size);
  res.keep_alive(req.keep_alive());
  LogAccess(client, req, 200);
  return send(std::move(res));
}

// One client connection; reads requests until the peer closes or times out.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(tcp::socket&& socket, std::shared_ptr<const std::string> root)
      : stream_(std::move(socket)), root_(std::move(root)) {
    beast::error_code ec;
    const auto endpoint = stream_.socket().remote_endpoint(ec);
    client_ = ec ? std::string("unknown")
                 : endpoint.address().to_string() + ":" +
                       std::to_string(endpoint.port());
  }

  void Run() {
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::DoRead, shared_from_this()));
  }

 private:
  void DoRead() {
    req_ = {};
    stream_.expires_after(kSessionTimeout);
    bhttp::async_read(stream_, buffer_, req_,
                      beast::bind_front_handler(&HttpSession::OnRead, shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t /*bytes*/) {
    if (ec == bhttp::error::end_of_stream) {
      return DoClose();
    }
    if (ec) {
      if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
        util::Logger::Debug("[HTTP] read from " + client_ + ": " + ec.message());
      }
      return;
    }
    HandleRequest(*root_, client_, std::move(req_),
                  [this](auto&& response) { Send(std::move(response)); });
  }

  template <bool isRequest, class Body, class Fields>
  void Send(bhttp::message<isRequest, Body, Fields>&& msg) {
    auto sp = std::make_shared<bhttp::message<isRequest, Body, Fields>>(std::move(msg));
    res_ = sp;
    bhttp::async_write(stream_, *sp,
                       beast::bind_front_handler(&HttpSession::OnWrite,
                                                 shared_from_this(), sp->need_eof()));
  }

  void OnWrite(bool close, beast::error_code ec, std::size_t /*bytes*/) {
    if (ec) {
      util::Logger::Debug("[HTTP] write to " + client_ + ": " + ec.message());
      return;
    }
    if (close) {
      return DoClose();
    }
    res_ = nullptr;
    DoRead();
  }

  void DoClose() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::shared_ptr<const std::string> root_;
  std::string client_;
  bhttp::request<bhttp::string_body> req_;
  std::shared_ptr<void> res_;
};

}  // namespace

bool IsSafeFileName(const std::string& name) {
  if (name.empty() || name == "." || name == "..") return false;
  if (name.front() == '.') return false;
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') return false;
  }
  return true;
}

const char* ContentTypeFor(const std::string& name) {
  if (EndsWith(name, ".m3u8")) return "application/vnd.apple.mpegurl";
  if (EndsWith(name, ".ts")) return "video/mp2t";
  return "application/octet-stream";
}

SegmentServer::SegmentServer(net::io_context& ioc, std::string root_dir,
                             std::string address, unsigned short port)
    : ioc_(ioc),
      acceptor_(net::make_strand(ioc)),
      root_dir_(std::make_shared<const std::string>(std::move(root_dir))),
      address_(std::move(address)),
      port_(port) {}

SegmentServer::~SegmentServer() {
  beast::error_code ec;
  acceptor_.close(ec);
}

void SegmentServer::Start() {
  beast::error_code ec;
  const auto address = net::ip::make_address(address_, ec);
  if (ec) {
    throw std::runtime_error("invalid listen address '" + address_ + "': " + ec.message());
  }
  const tcp::endpoint endpoint{address, port_};

  acceptor_.open(endpoint.protocol(), ec);
  if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
  if (!ec) acceptor_.bind(endpoint, ec);
  if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
  if (ec) {
    acceptor_.close();
    throw std::runtime_error("cannot listen on " + address_ + ":" +
                             std::to_string(port_) + ": " + ec.message());
  }
  bound_port_ = acceptor_.local_endpoint().port();
  running_ = true;
  util::Logger::Info("[HTTP] Serving " + *root_dir_ + " on " + address_ + ":" +
                     std::to_string(bound_port_));
  DoAccept();
}

void SegmentServer::Stop() {
  if (!running_) return;
  running_ = false;
  beast::error_code ec;
  acceptor_.close(ec);
  util::Logger::Info("[HTTP] Stopped accepting");
}

void SegmentServer::DoAccept() {
  acceptor_.async_accept(
      net::make_strand(ioc_),
      beast::bind_front_handler(&SegmentServer::OnAccept, this));
}

void SegmentServer::OnAccept(beast::error_code ec, tcp::socket socket) {
  if (ec) {
    if (ec == net::error::operation_aborted || !running_) return;
    util::Logger::Warn("[HTTP] accept: " + ec.message());
  } else {
    std::make_shared<HttpSession>(std::move(socket), root_dir_)->Run();
  }
  if (running_) DoAccept();
}

}  // namespace loopcast::http
