#pragma once
#include "sa/data/HistorySource.hpp"

#include <string>

namespace sa {

// Reads <dataDir>/<TICKER>.csv for history and <dataDir>/<TICKER>.json
// ({"symbol","longName","sector","industry"}) for info.
class CsvHistorySource : public HistorySource {
public:
  explicit CsvHistorySource(std::string dataDir);

  HistoryResult fetchHistory(const std::string& ticker, TimePeriod period) override;
  bool fetchInfo(const std::string& ticker, StockInfo& out) override;
  const char* name() const override { return "csv"; }

private:
  std::string pathFor(const std::string& ticker, const char* ext) const;

  std::string dataDir_;
};

} // namespace sa
