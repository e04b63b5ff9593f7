#include "sa/data/Bar.hpp"

namespace sa {

std::vector<double> closesOf(const std::vector<Bar>& bars) {
  std::vector<double> out;
  out.reserve(bars.size());
  for (const auto& b : bars) out.push_back(b.close);
  return out;
}

std::vector<double> volumesOf(const std::vector<Bar>& bars) {
  std::vector<double> out;
  out.reserve(bars.size());
  for (const auto& b : bars) out.push_back(b.volume);
  return out;
}

} // namespace sa
