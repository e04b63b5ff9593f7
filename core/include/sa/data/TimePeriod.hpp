#pragma once
#include "sa/data/Bar.hpp"
#include "sa/data/CalendarDate.hpp"

#include <string>
#include <vector>

namespace sa {

// Look-back windows accepted by the API.
enum class TimePeriod {
  Week,      // "7d"
  Month,     // "1mo"
  HalfYear,  // "6mo"
  TwoYears,  // "2y"
  FiveYears, // "5y"
  TenYears   // "10y"
};

inline constexpr TimePeriod kDefaultTimePeriod = TimePeriod::Month;

const char* timePeriodName(TimePeriod p);
bool parseTimePeriod(const std::string& text, TimePeriod& out);
const std::vector<TimePeriod>& allTimePeriods();

// First date (inclusive) covered by `p` when the window ends on `end`.
CalendarDate subtractPeriod(const CalendarDate& end, TimePeriod p);

// Keeps bars dated on or after subtractPeriod(lastBarDate, p).
// Input must be date-ascending.
std::vector<Bar> sliceToPeriod(const std::vector<Bar>& bars, TimePeriod p);

} // namespace sa
