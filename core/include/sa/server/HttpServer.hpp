#pragma once
#include "sa/server/WorkQueue.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

namespace sa {

class Router;

struct HttpServerConfig {
  std::string host{"0.0.0.0"};
  std::uint16_t port{8000};        // 0 = ephemeral
  int workerThreads{4};
  std::size_t maxRequestBytes{8192};
  std::size_t maxPendingConnections{128};
  int readTimeoutMs{5000};
};

// One-request-per-connection HTTP/1.1 front end for a Router.
// The accept thread polls a non-blocking acceptor so stop() takes effect
// within one poll interval; accepted sockets go to a worker pool. A
// connection that finds the pool's queue full is answered with 503.
// stop() followed by start() serves again on a fresh listening socket.
class HttpServer {
public:
  HttpServer(const HttpServerConfig& config, Router& router);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and starts threads. False (and logged) on socket errors.
  bool start();
  void stop();
  bool isRunning() const { return running_.load(); }

  // Actual port after start(); useful with port 0.
  std::uint16_t boundPort() const { return boundPort_; }

  std::uint64_t requestsServed() const { return served_.load(); }

private:
  void acceptLoop();
  void workerLoop();
  void serveConnection(boost::beast::tcp_stream& stream, boost::asio::io_context& ioc);
  void rejectBusy(boost::asio::ip::tcp::socket& peer);
  static void drainInput(boost::beast::tcp_stream& stream, boost::asio::io_context& ioc);

  HttpServerConfig config_;
  Router& router_;

  // Owns the acceptor and queued sockets; never run. Each worker reads
  // through its own io_context.
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::uint16_t boundPort_{0};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> served_{0};

  WorkQueue<boost::asio::ip::tcp::socket> connections_;
  std::thread acceptThread_;
  std::vector<std::thread> workers_;
};

} // namespace sa
