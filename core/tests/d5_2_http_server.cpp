// D5.2 — HTTP server over loopback

#include "sa/api/Router.hpp"
#include "sa/data/FakeHistorySource.hpp"
#include "sa/log/Log.hpp"
#include "sa/server/HttpServer.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

// Sends `request`, returns the whole response (server closes the socket).
static std::string roundTrip(std::uint16_t port, const std::string& request) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return {};
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    ::close(fd);
    return {};
  }
  ::send(fd, request.data(), request.size(), 0);

  std::string out;
  char buf[4096];
  ssize_t n;
  while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
    out.append(buf, static_cast<std::size_t>(n));
  }
  ::close(fd);
  return out;
}

static int connectTo(std::uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return -1;
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  ::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    ::close(fd);
    return -1;
  }
  return fd;
}

static std::string readAll(int fd) {
  std::string out;
  char buf[4096];
  ssize_t n;
  while ((n = ::recv(fd, buf, sizeof(buf), 0)) > 0) {
    out.append(buf, static_cast<std::size_t>(n));
  }
  return out;
}

int main() {
  sa::setLogLevel(sa::LogLevel::Warn);

  sa::FakeHistorySourceConfig fakeCfg;
  fakeCfg.endDate = "2024-06-28";
  sa::FakeHistorySource fake(fakeCfg);
  sa::RouterConfig routerCfg;
  sa::Router router(fake, routerCfg);

  sa::HttpServerConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = 0;
  cfg.workerThreads = 3;
  cfg.maxRequestBytes = 1024;
  sa::HttpServer server(cfg, router);
  requireTrue(server.start(), "server starts");
  requireTrue(server.boundPort() != 0, "ephemeral port bound");
  const std::uint16_t port = server.boundPort();

  // ---- Test 1: root + stock ----
  {
    std::string r = roundTrip(port, "GET / HTTP/1.1\r\nHost: x\r\n\r\n");
    requireTrue(r.rfind("HTTP/1.1 200 OK\r\n", 0) == 0, "root 200");
    requireTrue(r.find("Stock Analyzer API is running") != std::string::npos, "root body");

    std::string s = roundTrip(port, "GET /api/stock/aapl?period=7d HTTP/1.1\r\n\r\n");
    requireTrue(s.rfind("HTTP/1.1 200 OK\r\n", 0) == 0, "stock 200");
    requireTrue(s.find("\"timeseries\"") != std::string::npos, "stock body");
    requireTrue(s.find("Access-Control-Allow-Origin: *") != std::string::npos, "CORS header");
    std::printf("  Test 1 (GET): PASS\n");
  }

  // ---- Test 2: error statuses ----
  {
    std::string bad = roundTrip(port, "NONSENSE\r\n\r\n");
    requireTrue(bad.rfind("HTTP/1.1 400 ", 0) == 0, "malformed 400");

    std::string big = "GET /" + std::string(4000, 'a') + " HTTP/1.1\r\n\r\n";
    std::string tooBig = roundTrip(port, big);
    requireTrue(tooBig.rfind("HTTP/1.1 413 ", 0) == 0, "oversized 413");

    std::string period = roundTrip(port, "GET /api/stock/X?period=1d HTTP/1.1\r\n\r\n");
    requireTrue(period.rfind("HTTP/1.1 422 ", 0) == 0, "bad period 422");

    std::string pre = roundTrip(port, "OPTIONS /api/stock/X HTTP/1.1\r\n\r\n");
    requireTrue(pre.rfind("HTTP/1.1 204 ", 0) == 0, "preflight 204");
    std::printf("  Test 2 (errors): PASS\n");
  }

  // ---- Test 3: concurrent clients ----
  {
    std::atomic<int> ok{0};
    std::vector<std::thread> clients;
    for (int i = 0; i < 8; i++) {
      clients.emplace_back([&ok, port, i]() {
        std::string path = "/api/stock/T" + std::to_string(i) + "?period=6mo";
        std::string r = roundTrip(port, "GET " + path + " HTTP/1.1\r\n\r\n");
        if (r.rfind("HTTP/1.1 200 OK\r\n", 0) == 0) ok.fetch_add(1);
      });
    }
    for (auto& t : clients) t.join();
    requireTrue(ok.load() == 8, "all concurrent requests served");
    std::printf("  Test 3 (concurrency): PASS\n");
  }

  std::uint64_t served = server.requestsServed();
  server.stop();
  requireTrue(!server.isRunning(), "stopped");
  requireTrue(served >= 14, "request counter");
  requireTrue(roundTrip(port, "GET / HTTP/1.1\r\n\r\n").empty(), "closed after stop");

  // ---- Test 4: start again after stop ----
  {
    requireTrue(server.start(), "restart");
    requireTrue(server.isRunning(), "running again");
    std::string r = roundTrip(server.boundPort(), "GET / HTTP/1.1\r\n\r\n");
    requireTrue(r.rfind("HTTP/1.1 200 OK\r\n", 0) == 0, "served after restart");
    server.stop();
    std::printf("  Test 4 (restart): PASS\n");
  }

  // ---- Test 5: full queue answers 503 ----
  {
    sa::HttpServerConfig tight;
    tight.host = "127.0.0.1";
    tight.port = 0;
    tight.workerThreads = 1;
    tight.maxPendingConnections = 1;
    tight.readTimeoutMs = 3000;
    sa::HttpServer busy(tight, router);
    requireTrue(busy.start(), "tight server starts");
    const std::uint16_t busyPort = busy.boundPort();

    // Occupies the only worker with a request that never completes.
    int held = connectTo(busyPort);
    requireTrue(held >= 0, "held connection");
    const char partial[] = "GET / HTTP/1.1\r\n";
    ::send(held, partial, sizeof(partial) - 1, 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    // Fills the one queue slot.
    int queued = connectTo(busyPort);
    requireTrue(queued >= 0, "queued connection");
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    int rejected = connectTo(busyPort);
    requireTrue(rejected >= 0, "third connection");
    std::string reply = readAll(rejected);
    ::close(rejected);
    requireTrue(reply.rfind("HTTP/1.1 503 ", 0) == 0, "503 when queue is full");
    requireTrue(reply.find("Server busy") != std::string::npos, "busy detail");

    ::close(held);
    ::close(queued);
    busy.stop();
    std::printf("  Test 5 (queue full): PASS\n");
  }

  // ---- Test 6: bind failure ----
  {
    sa::HttpServerConfig badCfg;
    badCfg.host = "not-an-ip";
    sa::HttpServer badServer(badCfg, router);
    requireTrue(!badServer.start(), "invalid host fails");
    std::printf("  Test 6 (bind failure): PASS\n");
  }

  std::printf("D5.2 HTTP server: ALL PASS\n");
  return 0;
}
