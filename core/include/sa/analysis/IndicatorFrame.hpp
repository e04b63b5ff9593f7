#pragma once
#include "sa/data/Bar.hpp"
#include "sa/math/Crossover.hpp"
#include "sa/math/Indicators.hpp"

#include <vector>

namespace sa {

struct IndicatorSettings {
  int fastWindow{50};
  int slowWindow{200};
  int maMinPeriods{1};
  int rsiPeriod{14};
  RsiSmoothing rsiSmoothing{RsiSmoothing::Simple};
  double overbought{70.0};
  double oversold{30.0};
};

// Bars plus every derived series, index-aligned with `bars`.
struct IndicatorFrame {
  std::vector<Bar> bars;
  std::vector<double> fastMa;
  std::vector<double> slowMa;
  std::vector<double> rsi;
  std::vector<double> vwap;
  std::vector<CrossEvent> crosses;

  std::size_t size() const { return bars.size(); }
};

IndicatorFrame computeIndicators(std::vector<Bar> bars, const IndicatorSettings& settings);

// Latest-bar view used by the API. Comparisons involving NaN are false.
struct AnalysisSnapshot {
  double latestPrice{0};
  double latestFastMa{0};
  double latestSlowMa{0};
  double latestRsi{0};
  double latestVwap{0};

  bool isGoldenCross{false};     // fastMa > slowMa
  bool priceAboveFastMa{false};
  bool priceAboveSlowMa{false};
  bool isOverbought{false};
  bool isOversold{false};
  bool priceAboveVwap{false};

  bool hasLastCross{false};
  CrossEvent lastCross{};
};

// Requires frame.size() > 0.
AnalysisSnapshot summarize(const IndicatorFrame& frame, const IndicatorSettings& settings);

} // namespace sa
