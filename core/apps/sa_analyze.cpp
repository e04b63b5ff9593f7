// One-shot analysis: prints the /api/stock JSON document for a ticker.
// Usage: sa_analyze TICKER [--period 1mo] [--data-dir DIR | --fake]
//                          [--config FILE] [--debug]

#include "sa/api/Router.hpp"
#include "sa/config/ServiceConfig.hpp"
#include "sa/log/Log.hpp"

#include <cstdio>
#include <string>

int main(int argc, char* argv[]) {
  sa::ServiceConfig cfg;
  cfg.logLevel = sa::LogLevel::Warn;
  std::string error;
  std::string ticker;
  std::string period;
  bool debug = false;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      if (!sa::loadServiceConfigFile(argv[++i], cfg, error)) {
        std::fprintf(stderr, "[sa_analyze] %s\n", error.c_str());
        return 2;
      }
    } else if (arg == "--period" && i + 1 < argc) {
      period = argv[++i];
    } else if (arg == "--data-dir" && i + 1 < argc) {
      cfg.source.kind = sa::SourceKind::Csv;
      cfg.source.dataDir = argv[++i];
    } else if (arg == "--fake") {
      cfg.source.kind = sa::SourceKind::Fake;
    } else if (arg == "--debug") {
      debug = true;
    } else if (!arg.empty() && arg[0] != '-' && ticker.empty()) {
      ticker = arg;
    } else {
      std::fprintf(stderr,
                   "usage: %s TICKER [--period P] [--data-dir DIR | --fake] "
                   "[--config FILE] [--debug]\n", argv[0]);
      return 2;
    }
  }
  if (ticker.empty()) {
    std::fprintf(stderr, "[sa_analyze] missing TICKER\n");
    return 2;
  }

  sa::setLogLevel(cfg.logLevel);
  auto source = sa::makeHistorySource(cfg.source);
  sa::Router router(*source, cfg.router);

  sa::ApiRequest req;
  req.path = std::string(debug ? "/api/debug/" : "/api/stock/") + ticker;
  if (!period.empty()) req.query["period"] = period;

  sa::ApiResponse resp = router.handle(req);
  std::printf("%s\n", resp.body.c_str());
  return resp.status == 200 ? 0 : 1;
}
