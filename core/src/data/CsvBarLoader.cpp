#include "sa/data/CsvBarLoader.hpp"
#include "sa/data/CalendarDate.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <map>
#include <sstream>
#include <vector>

namespace sa {

static std::string trim(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
  std::string out = s.substr(b, e - b);
  if (out.size() >= 2 && out.front() == '"' && out.back() == '"')
    out = out.substr(1, out.size() - 2);
  return out;
}

static std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

static std::vector<std::string> splitFields(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool quoted = false;
  for (char c : line) {
    if (c == '"') quoted = !quoted;
    if (c == ',' && !quoted) {
      out.push_back(trim(field));
      field.clear();
    } else {
      field += c;
    }
  }
  out.push_back(trim(field));
  return out;
}

static bool isMissing(const std::string& f) {
  if (f.empty()) return true;
  std::string l = lower(f);
  return l == "nan" || l == "null" || l == "none";
}

// Returns false on garbage; `f` must be non-missing.
static bool parseNumber(const std::string& f, double& out) {
  const char* begin = f.c_str();
  char* end = nullptr;
  errno = 0;
  double v = std::strtod(begin, &end);
  if (end == begin || *end != '\0' || errno == ERANGE) return false;
  out = v;
  return true;
}

HistoryResult loadBarsCsv(const std::string& text) {
  std::istringstream in(text);
  std::string line;

  // Header (skip leading blank lines)
  std::vector<std::string> header;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;
    header = splitFields(line);
    break;
  }
  if (header.empty()) return historyFail("CSV_EMPTY", "CSV input has no header row");

  int colDate = -1, colOpen = -1, colHigh = -1, colLow = -1, colClose = -1, colVolume = -1;
  for (std::size_t i = 0; i < header.size(); i++) {
    std::string h = lower(header[i]);
    int idx = static_cast<int>(i);
    if (h == "date" || h == "datetime") colDate = idx;
    else if (h == "open") colOpen = idx;
    else if (h == "high") colHigh = idx;
    else if (h == "low") colLow = idx;
    else if (h == "close") colClose = idx;
    else if (h == "volume") colVolume = idx;
  }

  const char* missing = nullptr;
  if (colDate < 0) missing = "Date";
  else if (colOpen < 0) missing = "Open";
  else if (colHigh < 0) missing = "High";
  else if (colLow < 0) missing = "Low";
  else if (colClose < 0) missing = "Close";
  if (missing) {
    return historyFail("CSV_MISSING_COLUMN",
                       std::string("CSV header has no '") + missing + "' column");
  }

  std::map<std::string, Bar> byDate;
  int lineNo = 1;
  while (std::getline(in, line)) {
    lineNo++;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (trim(line).empty()) continue;

    auto fields = splitFields(line);
    auto field = [&fields](int col) -> std::string {
      if (col < 0 || static_cast<std::size_t>(col) >= fields.size()) return {};
      return fields[static_cast<std::size_t>(col)];
    };

    std::string closeText = field(colClose);
    if (isMissing(closeText)) continue;

    std::string dateText = field(colDate);
    CalendarDate date;
    if (dateText.size() < 10 || !parseCalendarDate(dateText.substr(0, 10), date)) {
      return historyFail("CSV_BAD_ROW",
                         "line " + std::to_string(lineNo) + ": bad date '" + dateText + "'");
    }

    Bar bar;
    bar.date = formatCalendarDate(date);
    if (!parseNumber(closeText, bar.close)) {
      return historyFail("CSV_BAD_ROW",
                         "line " + std::to_string(lineNo) + ": bad Close '" + closeText + "'");
    }

    // Missing open/high/low fall back to the close; missing volume is 0.
    struct Slot { int col; double* dst; const char* name; };
    Slot slots[] = {{colOpen, &bar.open, "Open"}, {colHigh, &bar.high, "High"},
                    {colLow, &bar.low, "Low"}};
    for (auto& s : slots) {
      std::string f = field(s.col);
      if (isMissing(f)) { *s.dst = bar.close; continue; }
      if (!parseNumber(f, *s.dst)) {
        return historyFail("CSV_BAD_ROW", "line " + std::to_string(lineNo) +
                           ": bad " + s.name + " '" + f + "'");
      }
    }
    std::string volText = field(colVolume);
    if (!isMissing(volText) && !parseNumber(volText, bar.volume)) {
      return historyFail("CSV_BAD_ROW",
                         "line " + std::to_string(lineNo) + ": bad Volume '" + volText + "'");
    }
    if (bar.volume < 0) bar.volume = 0;

    byDate[bar.date] = bar;
  }

  HistoryResult r;
  r.bars.reserve(byDate.size());
  for (auto& kv : byDate) r.bars.push_back(std::move(kv.second));
  return r;
}

HistoryResult loadBarsCsvFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    return historyFail("IO_ERROR", "cannot open " + path + ": " + std::strerror(errno));
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  return loadBarsCsv(ss.str());
}

} // namespace sa
