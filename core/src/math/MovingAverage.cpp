#include "sa/math/MovingAverage.hpp"

#include <algorithm>
#include <limits>

namespace sa {

std::vector<double> computeSma(const double* input, int count, int window,
                               int minPeriods) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  std::vector<double> out(static_cast<std::size_t>(std::max(count, 0)), nan);
  if (count <= 0 || window < 1) return out;
  if (minPeriods < 1) minPeriods = 1;
  if (minPeriods > window) minPeriods = window;

  double sum = 0.0;
  for (int i = 0; i < count; i++) {
    sum += input[i];
    if (i >= window) sum -= input[i - window];

    int n = std::min(i + 1, window);
    if (n >= minPeriods) {
      out[static_cast<std::size_t>(i)] = sum / static_cast<double>(n);
    }

    // Re-anchor the running sum once per full window to bound drift
    if (window > 1 && i >= window && (i % window) == 0) {
      sum = 0.0;
      for (int j = i - window + 1; j <= i; j++) sum += input[j];
    }
  }
  return out;
}

} // namespace sa
