#pragma once
#include <cstdint>
#include <vector>

namespace sa {

enum class RsiSmoothing {
  // Rolling mean of gains and losses over the last `period` changes. The
  // first bar contributes a zero change, so the first value lands at index
  // period-1.
  Simple,
  // Wilder's smoothing seeded with the mean of the first `period` changes.
  // First value at index `period`.
  Wilder
};

bool parseRsiSmoothing(const char* text, RsiSmoothing& out);
const char* rsiSmoothingName(RsiSmoothing s);

// RSI = 100 - 100 / (1 + avgGain / avgLoss), in [0, 100].
// avgLoss == 0 gives 100 when avgGain > 0 and NaN when both are 0.
// Indices without enough history are NaN.
std::vector<double> computeRSI(const double* closes, int count, int period = 14,
                               RsiSmoothing smoothing = RsiSmoothing::Simple);

std::vector<double> computeTypicalPrice(const double* highs, const double* lows,
                                        const double* closes, int count);

// Cumulative volume-weighted typical price. NaN while cumulative volume is 0.
// If `sessionIds` is non-null, the running sums restart whenever the id
// changes from the previous bar.
std::vector<double> computeVWAP(const double* highs, const double* lows,
                                const double* closes, const double* volumes,
                                int count, const std::int32_t* sessionIds = nullptr);

} // namespace sa
