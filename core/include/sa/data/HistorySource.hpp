#pragma once
#include "sa/data/Bar.hpp"
#include "sa/data/TimePeriod.hpp"

#include <string>

namespace sa {

// Supplies daily history and descriptive info per ticker.
// Implementations must be callable from several worker threads at once.
class HistorySource {
public:
  virtual ~HistorySource() = default;

  // Bars within `period`, date-ascending. An unknown ticker gives
  // ok=false with code NO_DATA.
  virtual HistoryResult fetchHistory(const std::string& ticker, TimePeriod period) = 0;

  // Returns false when no info is available.
  virtual bool fetchInfo(const std::string& ticker, StockInfo& out) = 0;

  virtual const char* name() const = 0;
};

// [A-Za-z0-9.^=-]{1,16}
bool isValidTicker(const std::string& ticker);
std::string normalizeTicker(const std::string& ticker);

} // namespace sa
