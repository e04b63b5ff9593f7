#pragma once
#include <cstddef>
#include <vector>

namespace sa {

enum class CrossKind {
  Golden, // fast moves above slow
  Death   // fast moves below slow
};

struct CrossEvent {
  std::size_t index{0};
  CrossKind kind{CrossKind::Golden};
};

const char* crossKindName(CrossKind k);

// Scans consecutive pairs. Golden at i when fast[i-1] <= slow[i-1] and
// fast[i] > slow[i]; Death is the mirror. Pairs touching NaN are skipped.
std::vector<CrossEvent> detectCrosses(const double* fast, const double* slow, int count);

} // namespace sa
