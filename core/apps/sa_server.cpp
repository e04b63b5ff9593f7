// StockAnalyzer HTTP server.
// Usage: sa_server [--config file.json] [--port N] [--host ADDR]
//                  [--data-dir DIR] [--fake] [--log-level LEVEL]
// Flags override values from the config file.

#include "sa/api/Router.hpp"
#include "sa/config/ServiceConfig.hpp"
#include "sa/log/Log.hpp"
#include "sa/server/HttpServer.hpp"

#include <chrono>
#include <csignal>
#include <cstdio>
#include <string>
#include <thread>

static volatile std::sig_atomic_t gStop = 0;

static void onSignal(int) { gStop = 1; }

static void usage(const char* argv0) {
  std::fprintf(stderr,
               "usage: %s [--config FILE] [--port N] [--host ADDR] "
               "[--data-dir DIR] [--fake] [--log-level debug|info|warn|error]\n",
               argv0);
}

int main(int argc, char* argv[]) {
  sa::ServiceConfig cfg;
  std::string error;

  // First pass: config file, so later flags win regardless of order.
  for (int i = 1; i < argc; i++) {
    if (std::string(argv[i]) == "--config" && i + 1 < argc) {
      if (!sa::loadServiceConfigFile(argv[i + 1], cfg, error)) {
        std::fprintf(stderr, "[sa_server] %s\n", error.c_str());
        return 2;
      }
    }
  }

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      ++i;
    } else if (arg == "--port" && i + 1 < argc) {
      if (!sa::parsePort(argv[++i], cfg.server.port)) {
        std::fprintf(stderr, "[sa_server] bad port '%s'\n", argv[i]);
        return 2;
      }
    } else if (arg == "--host" && i + 1 < argc) {
      cfg.server.host = argv[++i];
    } else if (arg == "--data-dir" && i + 1 < argc) {
      cfg.source.kind = sa::SourceKind::Csv;
      cfg.source.dataDir = argv[++i];
    } else if (arg == "--fake") {
      cfg.source.kind = sa::SourceKind::Fake;
    } else if (arg == "--log-level" && i + 1 < argc) {
      if (!sa::parseLogLevel(argv[++i], cfg.logLevel)) {
        std::fprintf(stderr, "[sa_server] bad log level '%s'\n", argv[i]);
        return 2;
      }
    } else if (arg == "--help" || arg == "-h") {
      usage(argv[0]);
      return 0;
    } else {
      usage(argv[0]);
      return 2;
    }
  }

  sa::setLogLevel(cfg.logLevel);

  auto source = sa::makeHistorySource(cfg.source);
  sa::Router router(*source, cfg.router);
  sa::HttpServer server(cfg.server, router);

  SA_LOG_INFO("sa_server", "history source: %s", source->name());
  if (!server.start()) return 1;

  std::signal(SIGINT, onSignal);
  std::signal(SIGTERM, onSignal);

  while (!gStop && server.isRunning()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  server.stop();
  return 0;
}
