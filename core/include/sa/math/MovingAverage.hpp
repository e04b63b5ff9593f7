#pragma once
#include <vector>

namespace sa {

// Trailing simple moving average.
// output[i] = mean(input[max(0, i-window+1) .. i]) when that span holds at
// least `minPeriods` values, NaN otherwise. With minPeriods == 1 the early
// values average whatever history exists.
// window < 1 yields all NaN.
std::vector<double> computeSma(const double* input, int count, int window,
                               int minPeriods = 1);

} // namespace sa
