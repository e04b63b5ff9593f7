#include "sa/data/CsvHistorySource.hpp"
#include "sa/data/CsvBarLoader.hpp"
#include "sa/log/Log.hpp"

#include <rapidjson/document.h>

#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace sa {

CsvHistorySource::CsvHistorySource(std::string dataDir)
    : dataDir_(std::move(dataDir)) {
  if (dataDir_.empty()) dataDir_ = ".";
}

std::string CsvHistorySource::pathFor(const std::string& ticker, const char* ext) const {
  std::string path = dataDir_;
  if (path.back() != '/') path += '/';
  return path + normalizeTicker(ticker) + ext;
}

HistoryResult CsvHistorySource::fetchHistory(const std::string& ticker, TimePeriod period) {
  if (!isValidTicker(ticker)) {
    return historyFail("NO_DATA", "invalid ticker symbol");
  }

  const std::string path = pathFor(ticker, ".csv");
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return historyFail("NO_DATA", "no history file for " + normalizeTicker(ticker));
  }

  auto result = loadBarsCsvFile(path);
  if (!result.ok) {
    SA_LOG_WARN("CsvHistorySource", "%s: %s (%s)", path.c_str(),
                result.err.message.c_str(), result.err.code.c_str());
    return result;
  }

  result.bars = sliceToPeriod(result.bars, period);
  SA_LOG_DEBUG("CsvHistorySource", "%s: %zu bars for %s", path.c_str(),
               result.bars.size(), timePeriodName(period));
  return result;
}

bool CsvHistorySource::fetchInfo(const std::string& ticker, StockInfo& out) {
  if (!isValidTicker(ticker)) return false;

  std::ifstream f(pathFor(ticker, ".json"), std::ios::binary);
  if (!f) return false;
  std::ostringstream ss;
  ss << f.rdbuf();

  rapidjson::Document doc;
  doc.Parse(ss.str().c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    SA_LOG_WARN("CsvHistorySource", "info file for %s is not a JSON object",
                normalizeTicker(ticker).c_str());
    return false;
  }

  StockInfo info;
  if (doc.HasMember("symbol") && doc["symbol"].IsString())
    info.symbol = doc["symbol"].GetString();
  if (doc.HasMember("longName") && doc["longName"].IsString())
    info.longName = doc["longName"].GetString();
  if (doc.HasMember("sector") && doc["sector"].IsString())
    info.sector = doc["sector"].GetString();
  if (doc.HasMember("industry") && doc["industry"].IsString())
    info.industry = doc["industry"].GetString();

  if (info.symbol.empty()) info.symbol = normalizeTicker(ticker);
  out = info;
  return true;
}

} // namespace sa
