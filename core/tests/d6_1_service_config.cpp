// D6.1 — service configuration

#include "sa/config/ServiceConfig.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: defaults ----
  {
    sa::ServiceConfig cfg;
    requireTrue(cfg.server.port == 8000, "port 8000");
    requireTrue(cfg.server.host == "0.0.0.0", "all interfaces");
    requireTrue(cfg.source.kind == sa::SourceKind::Csv, "csv source");
    requireTrue(cfg.router.indicators.fastWindow == 50 &&
                cfg.router.indicators.slowWindow == 200, "50/200");
    requireTrue(cfg.router.indicators.rsiPeriod == 14, "rsi 14");
    requireTrue(cfg.router.indicators.overbought == 70.0 &&
                cfg.router.indicators.oversold == 30.0, "70/30");
    requireTrue(cfg.router.defaultPeriod == sa::TimePeriod::Month, "1mo");
    std::printf("  Test 1 (defaults): PASS\n");
  }

  // ---- Test 2: partial override ----
  {
    sa::ServiceConfig cfg;
    std::string err;
    const char* json = R"({
      "server": {"port": 9090, "workerThreads": 8},
      "source": {"kind": "fake", "fakeEndDate": "2024-06-28"},
      "indicators": {"rsiPeriod": 9, "rsiSmoothing": "wilder"},
      "defaultPeriod": "6mo",
      "logLevel": "debug"
    })";
    requireTrue(sa::loadServiceConfig(json, cfg, err), "load ok");
    requireTrue(cfg.server.port == 9090 && cfg.server.workerThreads == 8, "server");
    requireTrue(cfg.server.host == "0.0.0.0", "host kept");
    requireTrue(cfg.source.kind == sa::SourceKind::Fake, "fake");
    requireTrue(cfg.source.fake.endDate == "2024-06-28", "end date");
    requireTrue(cfg.router.indicators.rsiPeriod == 9, "rsi period");
    requireTrue(cfg.router.indicators.rsiSmoothing == sa::RsiSmoothing::Wilder, "wilder");
    requireTrue(cfg.router.indicators.fastWindow == 50, "fast window kept");
    requireTrue(cfg.router.defaultPeriod == sa::TimePeriod::HalfYear, "6mo");
    requireTrue(cfg.logLevel == sa::LogLevel::Debug, "debug");

    auto src = sa::makeHistorySource(cfg.source);
    requireTrue(std::strcmp(src->name(), "fake") == 0, "fake source built");
    std::printf("  Test 2 (override): PASS\n");
  }

  // ---- Test 3: rejected values leave config untouched ----
  {
    struct Case { const char* json; const char* keyInError; };
    Case cases[] = {
      {R"({"server": {"port": 70000}})", "server.port"},
      {R"({"server": {"port": "80"}})", "server.port"},
      {R"({"server": []})", "server"},
      {R"({"source": {"kind": "yahoo"}})", "source.kind"},
      {R"({"source": {"fakeEndDate": "June"}})", "source.fakeEndDate"},
      {R"({"indicators": {"rsiSmoothing": "ema"}})", "indicators.rsiSmoothing"},
      {R"({"indicators": {"overbought": 20, "oversold": 40}})", "indicators.oversold"},
      {R"({"defaultPeriod": "3mo"})", "defaultPeriod"},
      {R"({"logLevel": "loud"})", "logLevel"},
      {R"([1,2])", "JSON object"},
    };
    for (const auto& c : cases) {
      sa::ServiceConfig cfg;
      std::string err;
      requireTrue(!sa::loadServiceConfig(c.json, cfg, err), c.json);
      requireTrue(err.find(c.keyInError) != std::string::npos, c.keyInError);
      requireTrue(cfg.server.port == 8000 && cfg.source.kind == sa::SourceKind::Csv,
                  "unchanged after failure");
    }
    std::printf("  Test 3 (rejections): PASS\n");
  }

  // ---- Test 4: serialized form loads back ----
  {
    sa::ServiceConfig a;
    a.server.port = 1234;
    a.source.kind = sa::SourceKind::Fake;
    a.source.dataDir = "/srv/history";
    a.router.indicators.oversold = 25.0;
    a.router.defaultPeriod = sa::TimePeriod::TwoYears;
    a.logLevel = sa::LogLevel::Warn;

    sa::ServiceConfig b;
    std::string err;
    requireTrue(sa::loadServiceConfig(sa::serializeServiceConfig(a), b, err), err.c_str());
    requireTrue(b.server.port == 1234 && b.source.kind == sa::SourceKind::Fake &&
                b.source.dataDir == "/srv/history" &&
                b.router.indicators.oversold == 25.0 &&
                b.router.defaultPeriod == sa::TimePeriod::TwoYears &&
                b.logLevel == sa::LogLevel::Warn, "fields survive");
    std::printf("  Test 4 (serialize): PASS\n");
  }

  // ---- Test 5: missing file ----
  {
    sa::ServiceConfig cfg;
    std::string err;
    requireTrue(!sa::loadServiceConfigFile("/nonexistent/sa.json", cfg, err), "missing file");
    requireTrue(err.find("/nonexistent/sa.json") != std::string::npos, "path in error");
    std::printf("  Test 5 (file): PASS\n");
  }

  // ---- Test 6: port text ----
  {
    std::uint16_t port = 1;
    requireTrue(sa::parsePort("8080", port) && port == 8080, "plain port");
    requireTrue(sa::parsePort("0", port) && port == 0, "ephemeral port");
    requireTrue(sa::parsePort("65535", port) && port == 65535, "max port");
    port = 42;
    requireTrue(!sa::parsePort("abc", port), "letters rejected");
    requireTrue(!sa::parsePort("80x", port), "trailing junk rejected");
    requireTrue(!sa::parsePort("", port), "empty rejected");
    requireTrue(!sa::parsePort("65536", port), "too large rejected");
    requireTrue(!sa::parsePort("-1", port), "negative rejected");
    requireTrue(port == 42, "unchanged on rejection");
    std::printf("  Test 6 (port text): PASS\n");
  }

  std::printf("D6.1 service config: ALL PASS\n");
  return 0;
}
