#pragma once
#include "sa/data/Bar.hpp"

#include <string>

namespace sa {

// Parses daily OHLCV history in the layout price downloaders export:
//   Date,Open,High,Low,Close,Adj Close,Volume
//   2024-01-02 00:00:00-05:00,187.15,188.44,183.89,185.64,185.40,82488700
// Header names are matched case-insensitively; unknown columns are ignored.
// Rows without a close are skipped. Output is sorted by date, and a later
// row for the same date replaces the earlier one.
HistoryResult loadBarsCsv(const std::string& text);

// Reads the file, then loadBarsCsv. Fails with IO_ERROR if unreadable.
HistoryResult loadBarsCsvFile(const std::string& path);

} // namespace sa
