#pragma once
#include <cstdint>
#include <string>

namespace sa {

struct CalendarDate {
  int year{1970};
  int month{1};  // 1..12
  int day{1};    // 1..31
};

bool isLeapYear(int year);
int daysInMonth(int year, int month);

// Days since 1970-01-01 (proleptic Gregorian).
std::int64_t daysFromCivil(const CalendarDate& d);
CalendarDate civilFromDays(std::int64_t days);

// 0 = Sunday ... 6 = Saturday
int weekday(const CalendarDate& d);

// Strict "YYYY-MM-DD". Rejects impossible dates such as 2023-02-29.
bool parseCalendarDate(const std::string& text, CalendarDate& out);
std::string formatCalendarDate(const CalendarDate& d);

CalendarDate addDays(const CalendarDate& d, std::int64_t days);

// Calendar-month arithmetic; the day is clamped to the target month's length.
CalendarDate subtractMonths(const CalendarDate& d, int months);

// Current UTC date.
CalendarDate todayUtc();

inline bool operator<(const CalendarDate& a, const CalendarDate& b) {
  return daysFromCivil(a) < daysFromCivil(b);
}

} // namespace sa
