#pragma once
#include "sa/data/HistorySource.hpp"
#include "sa/data/CalendarDate.hpp"

#include <cstdint>
#include <string>

namespace sa {

struct FakeHistorySourceConfig {
  std::string endDate;        // "YYYY-MM-DD"; empty = today (UTC)
  double startPrice{100.0};
  double volatility{0.02};    // daily return spread (fraction of price)
  double baseVolume{1.0e6};
  std::uint32_t historyDays{3700}; // calendar days generated before endDate
};

// Deterministic random-walk history. The walk is seeded from the ticker,
// so repeated requests for one ticker return identical bars.
class FakeHistorySource : public HistorySource {
public:
  explicit FakeHistorySource(const FakeHistorySourceConfig& config);

  HistoryResult fetchHistory(const std::string& ticker, TimePeriod period) override;
  bool fetchInfo(const std::string& ticker, StockInfo& out) override;
  const char* name() const override { return "fake"; }

  // Full generated series (weekdays only), before period slicing.
  std::vector<Bar> generate(const std::string& ticker) const;

  static std::uint32_t seedFor(const std::string& ticker);

private:
  FakeHistorySourceConfig config_;
  CalendarDate end_;
};

} // namespace sa
