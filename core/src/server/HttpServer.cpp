#include "sa/server/HttpServer.hpp"
#include "sa/server/HttpMessage.hpp"
#include "sa/api/ResponseWriter.hpp"
#include "sa/api/Router.hpp"
#include "sa/log/Log.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http.hpp>

#include <unistd.h>

#include <chrono>

namespace sa {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
using tcp = asio::ip::tcp;

HttpServer::HttpServer(const HttpServerConfig& config, Router& router)
    : config_(config), router_(router), acceptor_(ioc_),
      connections_(config.maxPendingConnections) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start() {
  if (running_.load()) return true;

  beast::error_code ec;
  auto address = asio::ip::make_address_v4(config_.host, ec);
  if (ec) {
    SA_LOG_ERROR("HttpServer", "invalid IPv4 host '%s'", config_.host.c_str());
    return false;
  }
  tcp::endpoint endpoint(address, config_.port);

  beast::error_code ignored;
  acceptor_.open(endpoint.protocol(), ec);
  if (ec) {
    SA_LOG_ERROR("HttpServer", "open: %s", ec.message().c_str());
    return false;
  }
  acceptor_.set_option(tcp::acceptor::reuse_address(true), ignored);

  acceptor_.bind(endpoint, ec);
  if (ec) {
    SA_LOG_ERROR("HttpServer", "bind %s:%u: %s", config_.host.c_str(),
                 static_cast<unsigned>(config_.port), ec.message().c_str());
    acceptor_.close(ignored);
    return false;
  }
  acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if (!ec) acceptor_.non_blocking(true, ec);
  if (ec) {
    SA_LOG_ERROR("HttpServer", "listen: %s", ec.message().c_str());
    acceptor_.close(ignored);
    return false;
  }

  auto local = acceptor_.local_endpoint(ec);
  boundPort_ = ec ? config_.port : local.port();

  connections_.reopen();
  running_.store(true);

  int n = config_.workerThreads > 0 ? config_.workerThreads : 1;
  for (int i = 0; i < n; i++) {
    workers_.emplace_back(&HttpServer::workerLoop, this);
  }
  acceptThread_ = std::thread(&HttpServer::acceptLoop, this);

  SA_LOG_INFO("HttpServer", "listening on %s:%u with %d workers",
              config_.host.c_str(), static_cast<unsigned>(boundPort_), n);
  return true;
}

void HttpServer::stop() {
  bool wasRunning = running_.exchange(false);
  if (acceptThread_.joinable()) acceptThread_.join();

  connections_.close();
  for (auto& t : workers_) {
    if (t.joinable()) t.join();
  }
  workers_.clear();

  // Connections queued after the workers left
  beast::error_code ignored;
  tcp::socket pending(ioc_);
  while (connections_.tryPop(pending)) pending.close(ignored);

  if (acceptor_.is_open()) acceptor_.close(ignored);
  if (wasRunning) {
    SA_LOG_INFO("HttpServer", "stopped after %llu requests",
                static_cast<unsigned long long>(served_.load()));
  }
}

void HttpServer::acceptLoop() {
  while (running_.load()) {
    tcp::socket peer(ioc_);
    beast::error_code ec;
    acceptor_.accept(peer, ec);

    if (ec == asio::error::would_block || ec == asio::error::try_again) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      continue;
    }
    if (ec) {
      if (ec != asio::error::connection_aborted && ec != asio::error::interrupted) {
        SA_LOG_WARN("HttpServer", "accept: %s", ec.message().c_str());
      }
      continue;
    }

    if (!connections_.push(std::move(peer))) rejectBusy(peer);
  }
}

void HttpServer::rejectBusy(tcp::socket& peer) {
  SA_LOG_WARN("HttpServer", "work queue full (%zu pending), answering 503",
              connections_.size());

  ApiResponse busy;
  busy.status = 503;
  busy.body = writeErrorJson("Server busy");
  auto res = makeHttpResponse(busy);

  beast::error_code ec;
  http::write(peer, res, ec);
  peer.shutdown(tcp::socket::shutdown_send, ec);
  peer.close(ec);
}

void HttpServer::workerLoop() {
  asio::io_context ioc;
  tcp::socket accepted(ioc_);

  while (connections_.pop(accepted)) {
    // Move the descriptor onto this worker's io_context so reads can time out.
    beast::error_code ec;
    auto fd = accepted.release(ec);
    if (ec) {
      SA_LOG_WARN("HttpServer", "release: %s", ec.message().c_str());
      accepted.close(ec);
      continue;
    }

    beast::tcp_stream stream(ioc);
    stream.socket().assign(tcp::v4(), fd, ec);
    if (ec) {
      SA_LOG_WARN("HttpServer", "assign: %s", ec.message().c_str());
      ::close(fd);
      continue;
    }

    serveConnection(stream, ioc);
    stream.socket().close(ec);
  }
}

void HttpServer::serveConnection(beast::tcp_stream& stream, asio::io_context& ioc) {
  beast::flat_buffer buffer;
  http::request_parser<http::string_body> parser;
  parser.header_limit(static_cast<std::uint32_t>(config_.maxRequestBytes));
  parser.body_limit(static_cast<std::uint64_t>(config_.maxRequestBytes));

  beast::error_code ec;
  stream.expires_after(std::chrono::milliseconds(config_.readTimeoutMs));
  http::async_read(stream, buffer, parser,
                   [&ec](beast::error_code e, std::size_t) { ec = e; });
  ioc.restart();
  ioc.run();
  stream.expires_never();

  const bool tooLarge = ec == http::error::header_limit ||
                        ec == http::error::body_limit ||
                        ec == http::error::buffer_overflow;
  if (ec && !tooLarge && !parser.got_some()) return; // client went away

  ApiResponse resp;
  unsigned version = 11;
  if (tooLarge) {
    resp.status = 413;
    resp.body = writeErrorJson("Request too large");
  } else if (ec) {
    resp.status = 400;
    resp.body = writeErrorJson("Malformed request");
  } else {
    const HttpRequest& req = parser.get();
    ApiRequest api;
    if (!toApiRequest(req, api)) {
      resp.status = 400;
      resp.body = writeErrorJson("Malformed request");
    } else {
      version = req.version();
      resp = router_.handle(api);
      SA_LOG_DEBUG("HttpServer", "%s %s -> %d", api.method.c_str(),
                   api.path.c_str(), resp.status);
    }
  }

  auto res = makeHttpResponse(resp, version);
  beast::error_code writeEc;
  http::write(stream, res, writeEc);
  if (writeEc) {
    SA_LOG_DEBUG("HttpServer", "write: %s", writeEc.message().c_str());
  }
  served_.fetch_add(1);

  // Unread request bytes would turn close() into a reset that can discard
  // the reply before the client reads it.
  if (tooLarge) drainInput(stream, ioc);
}

void HttpServer::drainInput(beast::tcp_stream& stream, asio::io_context& ioc) {
  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_send, ec);
  char buf[2048];
  for (int i = 0; i < 64 && !ec; i++) {
    stream.expires_after(std::chrono::milliseconds(50));
    stream.async_read_some(asio::buffer(buf),
                           [&ec](beast::error_code e, std::size_t) { ec = e; });
    ioc.restart();
    ioc.run();
  }
  stream.expires_never();
}

} // namespace sa
