#include "sa/data/TimePeriod.hpp"

namespace sa {

const char* timePeriodName(TimePeriod p) {
  switch (p) {
    case TimePeriod::Week:      return "7d";
    case TimePeriod::Month:     return "1mo";
    case TimePeriod::HalfYear:  return "6mo";
    case TimePeriod::TwoYears:  return "2y";
    case TimePeriod::FiveYears: return "5y";
    case TimePeriod::TenYears:  return "10y";
  }
  return "1mo";
}

bool parseTimePeriod(const std::string& text, TimePeriod& out) {
  for (TimePeriod p : allTimePeriods()) {
    if (text == timePeriodName(p)) {
      out = p;
      return true;
    }
  }
  return false;
}

const std::vector<TimePeriod>& allTimePeriods() {
  static const std::vector<TimePeriod> kAll = {
    TimePeriod::Week, TimePeriod::Month, TimePeriod::HalfYear,
    TimePeriod::TwoYears, TimePeriod::FiveYears, TimePeriod::TenYears};
  return kAll;
}

CalendarDate subtractPeriod(const CalendarDate& end, TimePeriod p) {
  switch (p) {
    case TimePeriod::Week:      return addDays(end, -7);
    case TimePeriod::Month:     return subtractMonths(end, 1);
    case TimePeriod::HalfYear:  return subtractMonths(end, 6);
    case TimePeriod::TwoYears:  return subtractMonths(end, 24);
    case TimePeriod::FiveYears: return subtractMonths(end, 60);
    case TimePeriod::TenYears:  return subtractMonths(end, 120);
  }
  return end;
}

std::vector<Bar> sliceToPeriod(const std::vector<Bar>& bars, TimePeriod p) {
  if (bars.empty()) return {};

  CalendarDate last;
  if (!parseCalendarDate(bars.back().date, last)) return bars;
  const std::string first = formatCalendarDate(subtractPeriod(last, p));

  // ISO dates compare lexicographically
  std::size_t start = 0;
  while (start < bars.size() && bars[start].date < first) start++;
  return std::vector<Bar>(bars.begin() + static_cast<std::ptrdiff_t>(start), bars.end());
}

} // namespace sa
