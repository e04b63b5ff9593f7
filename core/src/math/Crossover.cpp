#include "sa/math/Crossover.hpp"

#include <cmath>

namespace sa {

const char* crossKindName(CrossKind k) {
  return k == CrossKind::Golden ? "golden_cross" : "death_cross";
}

std::vector<CrossEvent> detectCrosses(const double* fast, const double* slow, int count) {
  std::vector<CrossEvent> events;
  for (int i = 1; i < count; i++) {
    if (std::isnan(fast[i - 1]) || std::isnan(slow[i - 1]) ||
        std::isnan(fast[i]) || std::isnan(slow[i])) {
      continue;
    }
    bool wasAbove = fast[i - 1] > slow[i - 1];
    bool isAbove = fast[i] > slow[i];
    bool wasBelow = fast[i - 1] < slow[i - 1];
    bool isBelow = fast[i] < slow[i];

    if (!wasAbove && isAbove) {
      events.push_back({static_cast<std::size_t>(i), CrossKind::Golden});
    } else if (!wasBelow && isBelow) {
      events.push_back({static_cast<std::size_t>(i), CrossKind::Death});
    }
  }
  return events;
}

} // namespace sa
