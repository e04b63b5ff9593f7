// D3.1 — indicator frame and latest-bar analysis

#include "sa/analysis/IndicatorFrame.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireClose(double a, double b, double tol, const char* msg) {
  if (std::fabs(a - b) > tol) {
    std::fprintf(stderr, "ASSERT FAIL: %s (%.6f vs %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static std::vector<sa::Bar> barsFromCloses(const std::vector<double>& closes) {
  std::vector<sa::Bar> bars;
  int day = 1;
  for (double c : closes) {
    sa::Bar b;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "2024-01-%02d", day++);
    b.date = buf;
    b.open = b.high = b.low = b.close = c;
    b.volume = 1000;
    bars.push_back(b);
  }
  return bars;
}

int main() {
  // ---- Test 1: rising series ----
  {
    std::vector<double> closes;
    for (int i = 0; i < 20; i++) closes.push_back(10.0 + i);

    sa::IndicatorSettings s;
    s.fastWindow = 3;
    s.slowWindow = 5;
    s.rsiPeriod = 4;
    auto frame = sa::computeIndicators(barsFromCloses(closes), s);
    requireTrue(frame.size() == 20, "20 bars");
    requireTrue(frame.fastMa.size() == 20 && frame.slowMa.size() == 20 &&
                frame.rsi.size() == 20 && frame.vwap.size() == 20, "aligned series");

    requireClose(frame.fastMa[19], 28.0, 1e-9, "fast MA = mean(27,28,29)");
    requireClose(frame.slowMa[19], 27.0, 1e-9, "slow MA = mean(25..29)");
    requireClose(frame.vwap[19], 19.5, 1e-9, "uniform volume vwap = mean close");

    // Both averages agree until the fast window fills, then fast pulls ahead.
    requireTrue(frame.crosses.size() == 1, "one cross");
    requireTrue(frame.crosses[0].index == 3, "golden cross at index 3");
    requireTrue(frame.crosses[0].kind == sa::CrossKind::Golden, "golden");

    auto snap = sa::summarize(frame, s);
    requireClose(snap.latestPrice, 29.0, 1e-12, "latest price");
    requireTrue(snap.isGoldenCross, "fast > slow");
    requireTrue(snap.priceAboveFastMa && snap.priceAboveSlowMa, "price above MAs");
    requireClose(snap.latestRsi, 100.0, 1e-9, "all gains");
    requireTrue(snap.isOverbought && !snap.isOversold, "overbought");
    requireTrue(snap.priceAboveVwap, "price above vwap");
    requireTrue(snap.hasLastCross && snap.lastCross.index == 3, "last cross");
    std::printf("  Test 1 (rising): PASS\n");
  }

  // ---- Test 2: falling series ----
  {
    std::vector<double> closes;
    for (int i = 0; i < 30; i++) closes.push_back(100.0 - i);

    sa::IndicatorSettings s;
    s.fastWindow = 5;
    s.slowWindow = 10;
    auto frame = sa::computeIndicators(barsFromCloses(closes), s);
    auto snap = sa::summarize(frame, s);
    requireTrue(!snap.isGoldenCross, "fast below slow");
    requireTrue(!snap.priceAboveFastMa, "price below fast MA");
    requireClose(snap.latestRsi, 0.0, 1e-9, "all losses");
    requireTrue(snap.isOversold && !snap.isOverbought, "oversold");
    requireTrue(snap.hasLastCross && snap.lastCross.kind == sa::CrossKind::Death, "death cross");
    std::printf("  Test 2 (falling): PASS\n");
  }

  // ---- Test 3: too little history ----
  {
    sa::IndicatorSettings s;
    auto frame = sa::computeIndicators(barsFromCloses({50.0}), s);
    auto snap = sa::summarize(frame, s);
    requireTrue(std::isnan(snap.latestRsi), "RSI undefined");
    requireTrue(!snap.isOverbought && !snap.isOversold, "NaN compares false");
    requireClose(snap.latestFastMa, 50.0, 1e-12, "partial MA");
    requireTrue(!snap.isGoldenCross, "equal MAs are not a golden cross");
    requireTrue(!snap.hasLastCross, "no crosses");
    std::printf("  Test 3 (short): PASS\n");
  }

  // ---- Test 4: empty frame ----
  {
    sa::IndicatorSettings s;
    auto frame = sa::computeIndicators({}, s);
    requireTrue(frame.size() == 0, "empty frame");
    bool threw = false;
    try {
      sa::summarize(frame, s);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "summarize rejects empty frame");
    std::printf("  Test 4 (empty): PASS\n");
  }

  std::printf("D3.1 indicator frame: ALL PASS\n");
  return 0;
}
