#include "sa/data/CalendarDate.hpp"

#include <cstdio>
#include <ctime>

namespace sa {

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) return 0;
  if (month == 2 && isLeapYear(year)) return 29;
  return kDays[month - 1];
}

// Howard Hinnant's days_from_civil / civil_from_days.
std::int64_t daysFromCivil(const CalendarDate& d) {
  std::int64_t y = d.year;
  const unsigned m = static_cast<unsigned>(d.month);
  const unsigned dd = static_cast<unsigned>(d.day);
  y -= m <= 2 ? 1 : 0;
  const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + dd - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CalendarDate civilFromDays(std::int64_t z) {
  z += 719468;
  const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;

  CalendarDate out;
  out.year = static_cast<int>(y + (m <= 2 ? 1 : 0));
  out.month = static_cast<int>(m);
  out.day = static_cast<int>(d);
  return out;
}

int weekday(const CalendarDate& d) {
  std::int64_t z = daysFromCivil(d);
  // 1970-01-01 was a Thursday (4)
  std::int64_t w = (z + 4) % 7;
  if (w < 0) w += 7;
  return static_cast<int>(w);
}

bool parseCalendarDate(const std::string& text, CalendarDate& out) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return false;
  for (std::size_t i = 0; i < text.size(); i++) {
    if (i == 4 || i == 7) continue;
    if (text[i] < '0' || text[i] > '9') return false;
  }
  auto num = [&text](std::size_t pos, std::size_t len) {
    int v = 0;
    for (std::size_t i = pos; i < pos + len; i++) v = v * 10 + (text[i] - '0');
    return v;
  };
  CalendarDate d;
  d.year = num(0, 4);
  d.month = num(5, 2);
  d.day = num(8, 2);
  if (d.month < 1 || d.month > 12) return false;
  if (d.day < 1 || d.day > daysInMonth(d.year, d.month)) return false;
  out = d;
  return true;
}

std::string formatCalendarDate(const CalendarDate& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
  return buf;
}

CalendarDate addDays(const CalendarDate& d, std::int64_t days) {
  return civilFromDays(daysFromCivil(d) + days);
}

CalendarDate subtractMonths(const CalendarDate& d, int months) {
  int total = d.year * 12 + (d.month - 1) - months;
  CalendarDate out;
  out.year = total / 12;
  out.month = total % 12 + 1;
  int maxDay = daysInMonth(out.year, out.month);
  out.day = d.day > maxDay ? maxDay : d.day;
  return out;
}

CalendarDate todayUtc() {
  std::time_t now = std::time(nullptr);
  std::tm tm;
#ifdef _WIN32
  gmtime_s(&tm, &now);
#else
  gmtime_r(&now, &tm);
#endif
  CalendarDate d;
  d.year = tm.tm_year + 1900;
  d.month = tm.tm_mon + 1;
  d.day = tm.tm_mday;
  return d;
}

} // namespace sa
