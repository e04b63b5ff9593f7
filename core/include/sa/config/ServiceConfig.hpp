#pragma once
#include "sa/api/Router.hpp"
#include "sa/data/FakeHistorySource.hpp"
#include "sa/log/Log.hpp"
#include "sa/server/HttpServer.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace sa {

enum class SourceKind { Csv, Fake };

struct SourceConfig {
  SourceKind kind{SourceKind::Csv};
  std::string dataDir{"data"};
  FakeHistorySourceConfig fake;
};

// Everything the server binary needs, loadable from one JSON file:
// {
//   "server":     {"host","port","workerThreads","maxRequestBytes"},
//   "source":     {"kind":"csv"|"fake","dataDir","fakeEndDate",
//                  "fakeStartPrice","fakeVolatility"},
//   "indicators": {"fastWindow","slowWindow","maMinPeriods","rsiPeriod",
//                  "rsiSmoothing":"simple"|"wilder","overbought","oversold"},
//   "defaultPeriod": "1mo",
//   "logLevel": "info"
// }
struct ServiceConfig {
  HttpServerConfig server;
  SourceConfig source;
  RouterConfig router;
  LogLevel logLevel{LogLevel::Info};
};

// Missing keys keep their current value in `out`. On failure `error` names
// the offending key and `out` is left unchanged.
bool loadServiceConfig(const std::string& json, ServiceConfig& out, std::string& error);
bool loadServiceConfigFile(const std::string& path, ServiceConfig& out, std::string& error);

std::string serializeServiceConfig(const ServiceConfig& cfg);

// Whole decimal number in [0, 65535]; rejects empty text and trailing junk.
bool parsePort(const char* text, std::uint16_t& out);

std::unique_ptr<HistorySource> makeHistorySource(const SourceConfig& cfg);

} // namespace sa
