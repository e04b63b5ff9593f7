#pragma once
#include "sa/analysis/IndicatorFrame.hpp"
#include "sa/data/HistorySource.hpp"
#include "sa/data/TimePeriod.hpp"

#include <map>
#include <string>

namespace sa {

inline constexpr const char* kApiVersion = "1.0.0";

struct ApiRequest {
  std::string method{"GET"};
  std::string path;                          // decoded, without query
  std::map<std::string, std::string> query;  // decoded
};

struct ApiResponse {
  int status{200};
  std::string body;  // JSON; empty for 204
};

struct RouterConfig {
  IndicatorSettings indicators;
  TimePeriod defaultPeriod{kDefaultTimePeriod};
};

// Maps requests onto the analysis endpoints:
//   GET /                       service info
//   GET /api/stock/{ticker}     indicators + analysis (?period=7d|1mo|...)
//   GET /api/debug/{ticker}     last rows + latest values, 1mo window
// Safe to call from several threads if the HistorySource is.
class Router {
public:
  Router(HistorySource& source, const RouterConfig& config);

  ApiResponse handle(const ApiRequest& req);

  const RouterConfig& config() const { return config_; }

private:
  ApiResponse handleRoot();
  ApiResponse handleStock(const std::string& ticker, const ApiRequest& req);
  ApiResponse handleDebug(const std::string& ticker);

  static ApiResponse fail(int status, const std::string& detail);

  HistorySource& source_;
  RouterConfig config_;
};

} // namespace sa
