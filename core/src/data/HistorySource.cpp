#include "sa/data/HistorySource.hpp"

#include <cctype>

namespace sa {

bool isValidTicker(const std::string& ticker) {
  if (ticker.empty() || ticker.size() > 16) return false;
  for (char c : ticker) {
    if (std::isalnum(static_cast<unsigned char>(c))) continue;
    if (c == '.' || c == '^' || c == '=' || c == '-') continue;
    return false;
  }
  // "." and ".." would name directories
  return ticker.find_first_not_of('.') != std::string::npos;
}

std::string normalizeTicker(const std::string& ticker) {
  std::string out = ticker;
  for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

} // namespace sa
