#pragma once
#include <string>
#include <vector>

namespace sa {

// One daily OHLCV row. `date` is "YYYY-MM-DD".
struct Bar {
  std::string date;
  double open{0};
  double high{0};
  double low{0};
  double close{0};
  double volume{0};
};

// Descriptive fields for a ticker. Empty means unknown.
struct StockInfo {
  std::string symbol;
  std::string longName;
  std::string sector;
  std::string industry;
};

struct SourceError {
  std::string code;     // e.g. "NO_DATA", "CSV_MISSING_COLUMN"
  std::string message;
};

struct HistoryResult {
  bool ok{true};
  SourceError err{};
  std::vector<Bar> bars;
};

inline HistoryResult historyFail(const std::string& code, const std::string& message) {
  HistoryResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  return r;
}

// Column views over a bar vector.
std::vector<double> closesOf(const std::vector<Bar>& bars);
std::vector<double> volumesOf(const std::vector<Bar>& bars);

} // namespace sa
