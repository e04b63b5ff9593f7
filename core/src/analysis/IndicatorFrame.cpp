#include "sa/analysis/IndicatorFrame.hpp"
#include "sa/math/MovingAverage.hpp"

#include <stdexcept>

namespace sa {

IndicatorFrame computeIndicators(std::vector<Bar> bars, const IndicatorSettings& settings) {
  IndicatorFrame f;
  f.bars = std::move(bars);

  const int n = static_cast<int>(f.bars.size());
  std::vector<double> highs, lows, closes, volumes;
  highs.reserve(f.bars.size());
  lows.reserve(f.bars.size());
  closes.reserve(f.bars.size());
  volumes.reserve(f.bars.size());
  for (const auto& b : f.bars) {
    highs.push_back(b.high);
    lows.push_back(b.low);
    closes.push_back(b.close);
    volumes.push_back(b.volume);
  }

  f.fastMa = computeSma(closes.data(), n, settings.fastWindow, settings.maMinPeriods);
  f.slowMa = computeSma(closes.data(), n, settings.slowWindow, settings.maMinPeriods);
  f.rsi = computeRSI(closes.data(), n, settings.rsiPeriod, settings.rsiSmoothing);
  f.vwap = computeVWAP(highs.data(), lows.data(), closes.data(), volumes.data(), n);
  f.crosses = detectCrosses(f.fastMa.data(), f.slowMa.data(), n);
  return f;
}

AnalysisSnapshot summarize(const IndicatorFrame& frame, const IndicatorSettings& settings) {
  if (frame.size() == 0) {
    throw std::invalid_argument("summarize: empty indicator frame");
  }
  const std::size_t last = frame.size() - 1;

  AnalysisSnapshot s;
  s.latestPrice = frame.bars[last].close;
  s.latestFastMa = frame.fastMa[last];
  s.latestSlowMa = frame.slowMa[last];
  s.latestRsi = frame.rsi[last];
  s.latestVwap = frame.vwap[last];

  // Relational operators on NaN are false, which is the required result.
  s.isGoldenCross = s.latestFastMa > s.latestSlowMa;
  s.priceAboveFastMa = s.latestPrice > s.latestFastMa;
  s.priceAboveSlowMa = s.latestPrice > s.latestSlowMa;
  s.isOverbought = s.latestRsi > settings.overbought;
  s.isOversold = s.latestRsi < settings.oversold;
  s.priceAboveVwap = s.latestPrice > s.latestVwap;

  if (!frame.crosses.empty()) {
    s.hasLastCross = true;
    s.lastCross = frame.crosses.back();
  }
  return s;
}

} // namespace sa
