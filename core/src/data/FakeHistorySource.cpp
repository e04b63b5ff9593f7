#include "sa/data/FakeHistorySource.hpp"
#include "sa/log/Log.hpp"

#include <algorithm>
#include <cmath>

namespace sa {

FakeHistorySource::FakeHistorySource(const FakeHistorySourceConfig& config)
    : config_(config) {
  if (config_.endDate.empty() || !parseCalendarDate(config_.endDate, end_)) {
    if (!config_.endDate.empty()) {
      SA_LOG_WARN("FakeHistorySource", "bad endDate '%s', using today",
                  config_.endDate.c_str());
    }
    end_ = todayUtc();
  }
}

std::uint32_t FakeHistorySource::seedFor(const std::string& ticker) {
  // FNV-1a
  std::uint32_t h = 2166136261u;
  for (char c : normalizeTicker(ticker)) {
    h ^= static_cast<std::uint8_t>(c);
    h *= 16777619u;
  }
  return h;
}

std::vector<Bar> FakeHistorySource::generate(const std::string& ticker) const {
  std::uint32_t seed = seedFor(ticker);

  // RNG: simple LCG, uniform in [0, 1]
  auto rng = [&seed]() -> double {
    seed = seed * 1103515245u + 12345u;
    return static_cast<double>((seed >> 16) & 0x7FFF) / 32767.0;
  };

  std::vector<Bar> bars;
  bars.reserve(config_.historyDays * 5 / 7 + 1);

  double price = config_.startPrice;
  const CalendarDate first = addDays(end_, -static_cast<std::int64_t>(config_.historyDays));
  for (std::uint32_t i = 0; i <= config_.historyDays; i++) {
    CalendarDate d = addDays(first, i);
    int wd = weekday(d);
    if (wd == 0 || wd == 6) continue;

    double ret = (rng() - 0.5) * config_.volatility * 2.0;
    double open = price;
    double close = std::max(0.01, price * (1.0 + ret));
    double spread = std::fabs(close - open) + price * config_.volatility * 0.5 * rng();

    Bar b;
    b.date = formatCalendarDate(d);
    b.open = open;
    b.close = close;
    b.high = std::max(open, close) + spread * 0.5;
    b.low = std::max(0.005, std::min(open, close) - spread * 0.5);
    b.volume = std::floor(config_.baseVolume * (0.5 + rng()));
    bars.push_back(b);

    price = close;
  }
  return bars;
}

HistoryResult FakeHistorySource::fetchHistory(const std::string& ticker, TimePeriod period) {
  if (!isValidTicker(ticker)) {
    return historyFail("NO_DATA", "invalid ticker symbol");
  }
  HistoryResult r;
  r.bars = sliceToPeriod(generate(ticker), period);
  return r;
}

bool FakeHistorySource::fetchInfo(const std::string& ticker, StockInfo& out) {
  if (!isValidTicker(ticker)) return false;
  const std::string sym = normalizeTicker(ticker);
  out.symbol = sym;
  out.longName = sym + " Synthetic Corp";
  out.sector = "Synthetic";
  out.industry = "Random Walk";
  return true;
}

} // namespace sa
