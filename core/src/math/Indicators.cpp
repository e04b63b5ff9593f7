#include "sa/math/Indicators.hpp"

#include <cstring>
#include <limits>

namespace sa {

static const double kNaN = std::numeric_limits<double>::quiet_NaN();

bool parseRsiSmoothing(const char* text, RsiSmoothing& out) {
  if (std::strcmp(text, "simple") == 0) { out = RsiSmoothing::Simple; return true; }
  if (std::strcmp(text, "wilder") == 0) { out = RsiSmoothing::Wilder; return true; }
  return false;
}

const char* rsiSmoothingName(RsiSmoothing s) {
  return s == RsiSmoothing::Wilder ? "wilder" : "simple";
}

static double rsiFromAverages(double avgGain, double avgLoss) {
  if (avgLoss == 0.0) {
    return avgGain > 0.0 ? 100.0 : kNaN;
  }
  double rs = avgGain / avgLoss;
  return 100.0 - 100.0 / (1.0 + rs);
}

static std::vector<double> rsiSimple(const double* closes, int count, int period) {
  std::vector<double> rsi(static_cast<std::size_t>(count), kNaN);
  if (count < period) return rsi;

  std::vector<double> gains(static_cast<std::size_t>(count), 0.0);
  std::vector<double> losses(static_cast<std::size_t>(count), 0.0);
  for (int i = 1; i < count; i++) {
    double change = closes[i] - closes[i - 1];
    if (change > 0) gains[static_cast<std::size_t>(i)] = change;
    else if (change < 0) losses[static_cast<std::size_t>(i)] = -change;
  }

  const double inv = 1.0 / static_cast<double>(period);
  for (int i = period - 1; i < count; i++) {
    double sumGain = 0.0, sumLoss = 0.0;
    for (int j = i - period + 1; j <= i; j++) {
      sumGain += gains[static_cast<std::size_t>(j)];
      sumLoss += losses[static_cast<std::size_t>(j)];
    }
    rsi[static_cast<std::size_t>(i)] = rsiFromAverages(sumGain * inv, sumLoss * inv);
  }
  return rsi;
}

static std::vector<double> rsiWilder(const double* closes, int count, int period) {
  std::vector<double> rsi(static_cast<std::size_t>(count), kNaN);
  if (count < period + 1) return rsi;

  // Seed: mean gain/loss over the first `period` changes
  double avgGain = 0.0, avgLoss = 0.0;
  for (int i = 1; i <= period; i++) {
    double change = closes[i] - closes[i - 1];
    if (change > 0) avgGain += change;
    else avgLoss -= change;
  }
  avgGain /= static_cast<double>(period);
  avgLoss /= static_cast<double>(period);
  rsi[static_cast<std::size_t>(period)] = rsiFromAverages(avgGain, avgLoss);

  const double inv = 1.0 / static_cast<double>(period);
  for (int i = period + 1; i < count; i++) {
    double change = closes[i] - closes[i - 1];
    double gain = (change > 0) ? change : 0.0;
    double loss = (change < 0) ? -change : 0.0;

    avgGain = (avgGain * (static_cast<double>(period) - 1.0) + gain) * inv;
    avgLoss = (avgLoss * (static_cast<double>(period) - 1.0) + loss) * inv;
    rsi[static_cast<std::size_t>(i)] = rsiFromAverages(avgGain, avgLoss);
  }
  return rsi;
}

std::vector<double> computeRSI(const double* closes, int count, int period,
                               RsiSmoothing smoothing) {
  if (count <= 0) return {};
  if (period < 1) return std::vector<double>(static_cast<std::size_t>(count), kNaN);
  return smoothing == RsiSmoothing::Wilder ? rsiWilder(closes, count, period)
                                           : rsiSimple(closes, count, period);
}

std::vector<double> computeTypicalPrice(const double* highs, const double* lows,
                                        const double* closes, int count) {
  std::vector<double> out;
  if (count <= 0) return out;
  out.reserve(static_cast<std::size_t>(count));
  for (int i = 0; i < count; i++) {
    out.push_back((highs[i] + lows[i] + closes[i]) / 3.0);
  }
  return out;
}

std::vector<double> computeVWAP(const double* highs, const double* lows,
                                const double* closes, const double* volumes,
                                int count, const std::int32_t* sessionIds) {
  std::vector<double> vwap(static_cast<std::size_t>(count > 0 ? count : 0), kNaN);
  const std::vector<double> typical = computeTypicalPrice(highs, lows, closes, count);
  double cumPV = 0.0, cumVol = 0.0;

  for (int i = 0; i < count; i++) {
    if (sessionIds && i > 0 && sessionIds[i] != sessionIds[i - 1]) {
      cumPV = 0.0;
      cumVol = 0.0;
    }
    cumPV += typical[static_cast<std::size_t>(i)] * volumes[i];
    cumVol += volumes[i];
    if (cumVol > 0.0) {
      vwap[static_cast<std::size_t>(i)] = cumPV / cumVol;
    }
  }
  return vwap;
}

} // namespace sa
