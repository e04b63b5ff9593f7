#include "sa/api/Router.hpp"
#include "sa/api/ResponseWriter.hpp"
#include "sa/log/Log.hpp"

#include <exception>
#include <string>

namespace sa {

static const char* kStockPrefix = "/api/stock/";
static const char* kDebugPrefix = "/api/debug/";

static bool startsWith(const std::string& s, const char* prefix) {
  return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

// "/api/stock/AAPL" -> "AAPL"; empty when the remainder is empty or nested.
static std::string tailSegment(const std::string& path, const char* prefix) {
  std::string rest = path.substr(std::char_traits<char>::length(prefix));
  if (!rest.empty() && rest.back() == '/') rest.pop_back();
  if (rest.find('/') != std::string::npos) return {};
  return rest;
}

Router::Router(HistorySource& source, const RouterConfig& config)
    : source_(source), config_(config) {}

ApiResponse Router::fail(int status, const std::string& detail) {
  ApiResponse r;
  r.status = status;
  r.body = writeErrorJson(detail);
  return r;
}

ApiResponse Router::handle(const ApiRequest& req) {
  if (req.method == "OPTIONS") {
    ApiResponse r;
    r.status = 204;
    return r;
  }
  if (req.method != "GET") {
    return fail(405, "Method Not Allowed");
  }

  if (req.path == "/" || req.path.empty()) return handleRoot();

  if (startsWith(req.path, kStockPrefix)) {
    std::string ticker = tailSegment(req.path, kStockPrefix);
    if (!ticker.empty()) return handleStock(ticker, req);
  } else if (startsWith(req.path, kDebugPrefix)) {
    std::string ticker = tailSegment(req.path, kDebugPrefix);
    if (!ticker.empty()) return handleDebug(ticker);
  }

  return fail(404, "Not Found");
}

ApiResponse Router::handleRoot() {
  ApiResponse r;
  r.body = writeRootJson(kApiVersion);
  return r;
}

ApiResponse Router::handleStock(const std::string& ticker, const ApiRequest& req) {
  TimePeriod period = config_.defaultPeriod;
  auto it = req.query.find("period");
  if (it != req.query.end() && !parseTimePeriod(it->second, period)) {
    std::string allowed;
    for (TimePeriod p : allTimePeriods()) {
      if (!allowed.empty()) allowed += ", ";
      allowed += timePeriodName(p);
    }
    return fail(422, "Invalid period '" + it->second + "'; expected one of: " + allowed);
  }

  SA_LOG_INFO("Router", "processing request for %s with period %s",
              ticker.c_str(), timePeriodName(period));

  try {
    HistoryResult history = source_.fetchHistory(ticker, period);
    if (!history.ok && history.err.code != "NO_DATA") {
      return fail(500, "Error processing request: " + history.err.message);
    }
    if (history.bars.empty()) {
      return fail(404, "No data found for ticker " + ticker);
    }

    StockInfo info;
    if (!source_.fetchInfo(ticker, info)) {
      SA_LOG_WARN("Router", "could not fetch info for %s", ticker.c_str());
      info = StockInfo{};
      info.symbol = ticker;
    }

    SA_LOG_DEBUG("Router", "calculating indicators for %zu data points",
                 history.bars.size());
    IndicatorFrame frame = computeIndicators(std::move(history.bars), config_.indicators);
    AnalysisSnapshot snap = summarize(frame, config_.indicators);

    SA_LOG_DEBUG("Router", "%s latest: close=%.2f ma%d=%.2f ma%d=%.2f rsi=%.2f vwap=%.2f",
                 ticker.c_str(), snap.latestPrice,
                 config_.indicators.fastWindow, snap.latestFastMa,
                 config_.indicators.slowWindow, snap.latestSlowMa,
                 snap.latestRsi, snap.latestVwap);

    ApiResponse r;
    r.body = writeStockJson(frame, snap, info);
    return r;
  } catch (const std::exception& e) {
    SA_LOG_ERROR("Router", "error processing %s: %s", ticker.c_str(), e.what());
    return fail(500, std::string("Error processing request: ") + e.what());
  }
}

ApiResponse Router::handleDebug(const std::string& ticker) {
  try {
    HistoryResult history = source_.fetchHistory(ticker, TimePeriod::Month);
    if (!history.ok && history.err.code != "NO_DATA") {
      return fail(500, history.err.message);
    }
    if (history.bars.empty()) {
      return fail(500, "No data found for ticker " + ticker);
    }

    IndicatorFrame frame = computeIndicators(std::move(history.bars), config_.indicators);
    ApiResponse r;
    r.body = writeDebugJson(frame);
    return r;
  } catch (const std::exception& e) {
    SA_LOG_ERROR("Router", "debug %s: %s", ticker.c_str(), e.what());
    return fail(500, e.what());
  }
}

} // namespace sa
