#include "sa/config/ServiceConfig.hpp"
#include "sa/data/CsvHistorySource.hpp"

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

namespace sa {

namespace {

// Small typed readers; each returns false and sets `err` on a type or
// range violation. Absent keys leave the destination untouched.
struct Reader {
  std::string& err;

  bool section(const rapidjson::Value& obj, const char* key,
               const rapidjson::Value*& out) {
    out = nullptr;
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return true;
    if (!it->value.IsObject()) {
      err = std::string("'") + key + "' must be an object";
      return false;
    }
    out = &it->value;
    return true;
  }

  bool integer(const rapidjson::Value& obj, const char* path, const char* key,
               int minV, int maxV, int& dst) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return true;
    if (!it->value.IsInt() || it->value.GetInt() < minV || it->value.GetInt() > maxV) {
      err = std::string(path) + key + " must be an integer in [" +
            std::to_string(minV) + ", " + std::to_string(maxV) + "]";
      return false;
    }
    dst = it->value.GetInt();
    return true;
  }

  bool number(const rapidjson::Value& obj, const char* path, const char* key,
              double minV, double maxV, double& dst) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return true;
    if (!it->value.IsNumber() || it->value.GetDouble() < minV ||
        it->value.GetDouble() > maxV) {
      err = std::string(path) + key + " must be a number in [" +
            std::to_string(minV) + ", " + std::to_string(maxV) + "]";
      return false;
    }
    dst = it->value.GetDouble();
    return true;
  }

  bool text(const rapidjson::Value& obj, const char* path, const char* key,
              std::string& dst) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) return true;
    if (!it->value.IsString()) {
      err = std::string(path) + key + " must be a string";
      return false;
    }
    dst = it->value.GetString();
    return true;
  }
};

} // namespace

bool loadServiceConfig(const std::string& json, ServiceConfig& out, std::string& error) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) {
    error = "config is not a JSON object";
    return false;
  }

  ServiceConfig cfg = out;
  Reader rd{error};

  // ---- server ----
  const rapidjson::Value* server = nullptr;
  if (!rd.section(doc, "server", server)) return false;
  if (server) {
    int port = cfg.server.port;
    int maxBytes = static_cast<int>(cfg.server.maxRequestBytes);
    if (!rd.text(*server, "server.", "host", cfg.server.host)) return false;
    if (!rd.integer(*server, "server.", "port", 0, 65535, port)) return false;
    if (!rd.integer(*server, "server.", "workerThreads", 1, 256, cfg.server.workerThreads))
      return false;
    if (!rd.integer(*server, "server.", "maxRequestBytes", 512, 1 << 20, maxBytes))
      return false;
    cfg.server.port = static_cast<std::uint16_t>(port);
    cfg.server.maxRequestBytes = static_cast<std::size_t>(maxBytes);
  }

  // ---- source ----
  const rapidjson::Value* source = nullptr;
  if (!rd.section(doc, "source", source)) return false;
  if (source) {
    std::string kind = cfg.source.kind == SourceKind::Fake ? "fake" : "csv";
    if (!rd.text(*source, "source.", "kind", kind)) return false;
    if (kind == "csv") cfg.source.kind = SourceKind::Csv;
    else if (kind == "fake") cfg.source.kind = SourceKind::Fake;
    else {
      error = "source.kind must be \"csv\" or \"fake\"";
      return false;
    }
    if (!rd.text(*source, "source.", "dataDir", cfg.source.dataDir)) return false;
    if (!rd.text(*source, "source.", "fakeEndDate", cfg.source.fake.endDate)) return false;
    if (!cfg.source.fake.endDate.empty()) {
      CalendarDate d;
      if (!parseCalendarDate(cfg.source.fake.endDate, d)) {
        error = "source.fakeEndDate must be YYYY-MM-DD";
        return false;
      }
    }
    if (!rd.number(*source, "source.", "fakeStartPrice", 0.01, 1e9,
                   cfg.source.fake.startPrice))
      return false;
    if (!rd.number(*source, "source.", "fakeVolatility", 0.0, 1.0,
                   cfg.source.fake.volatility))
      return false;
  }

  // ---- indicators ----
  const rapidjson::Value* ind = nullptr;
  if (!rd.section(doc, "indicators", ind)) return false;
  if (ind) {
    IndicatorSettings& s = cfg.router.indicators;
    if (!rd.integer(*ind, "indicators.", "fastWindow", 1, 10000, s.fastWindow)) return false;
    if (!rd.integer(*ind, "indicators.", "slowWindow", 1, 10000, s.slowWindow)) return false;
    if (!rd.integer(*ind, "indicators.", "maMinPeriods", 1, 10000, s.maMinPeriods))
      return false;
    if (!rd.integer(*ind, "indicators.", "rsiPeriod", 1, 1000, s.rsiPeriod)) return false;
    std::string smoothing = rsiSmoothingName(s.rsiSmoothing);
    if (!rd.text(*ind, "indicators.", "rsiSmoothing", smoothing)) return false;
    if (!parseRsiSmoothing(smoothing.c_str(), s.rsiSmoothing)) {
      error = "indicators.rsiSmoothing must be \"simple\" or \"wilder\"";
      return false;
    }
    if (!rd.number(*ind, "indicators.", "overbought", 0.0, 100.0, s.overbought)) return false;
    if (!rd.number(*ind, "indicators.", "oversold", 0.0, 100.0, s.oversold)) return false;
    if (s.oversold > s.overbought) {
      error = "indicators.oversold must not exceed indicators.overbought";
      return false;
    }
  }

  // ---- top level ----
  std::string period = timePeriodName(cfg.router.defaultPeriod);
  if (!rd.text(doc, "", "defaultPeriod", period)) return false;
  if (!parseTimePeriod(period, cfg.router.defaultPeriod)) {
    error = "defaultPeriod '" + period + "' is not a known period";
    return false;
  }

  std::string level = logLevelName(cfg.logLevel);
  if (!rd.text(doc, "", "logLevel", level)) return false;
  if (!parseLogLevel(level, cfg.logLevel)) {
    error = "logLevel must be debug, info, warn or error";
    return false;
  }

  out = cfg;
  return true;
}

bool loadServiceConfigFile(const std::string& path, ServiceConfig& out, std::string& error) {
  std::ifstream f(path, std::ios::binary);
  if (!f) {
    error = "cannot open " + path + ": " + std::strerror(errno);
    return false;
  }
  std::ostringstream ss;
  ss << f.rdbuf();
  if (!loadServiceConfig(ss.str(), out, error)) {
    error = path + ": " + error;
    return false;
  }
  return true;
}

std::string serializeServiceConfig(const ServiceConfig& cfg) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  rapidjson::Value server(rapidjson::kObjectType);
  server.AddMember("host", rapidjson::Value(cfg.server.host.c_str(), alloc), alloc);
  server.AddMember("port", static_cast<int>(cfg.server.port), alloc);
  server.AddMember("workerThreads", cfg.server.workerThreads, alloc);
  server.AddMember("maxRequestBytes",
                   static_cast<std::uint64_t>(cfg.server.maxRequestBytes), alloc);
  doc.AddMember("server", server, alloc);

  rapidjson::Value source(rapidjson::kObjectType);
  source.AddMember("kind", rapidjson::StringRef(
                       cfg.source.kind == SourceKind::Fake ? "fake" : "csv"), alloc);
  source.AddMember("dataDir", rapidjson::Value(cfg.source.dataDir.c_str(), alloc), alloc);
  source.AddMember("fakeEndDate",
                   rapidjson::Value(cfg.source.fake.endDate.c_str(), alloc), alloc);
  source.AddMember("fakeStartPrice", cfg.source.fake.startPrice, alloc);
  source.AddMember("fakeVolatility", cfg.source.fake.volatility, alloc);
  doc.AddMember("source", source, alloc);

  const IndicatorSettings& s = cfg.router.indicators;
  rapidjson::Value ind(rapidjson::kObjectType);
  ind.AddMember("fastWindow", s.fastWindow, alloc);
  ind.AddMember("slowWindow", s.slowWindow, alloc);
  ind.AddMember("maMinPeriods", s.maMinPeriods, alloc);
  ind.AddMember("rsiPeriod", s.rsiPeriod, alloc);
  ind.AddMember("rsiSmoothing", rapidjson::StringRef(rsiSmoothingName(s.rsiSmoothing)), alloc);
  ind.AddMember("overbought", s.overbought, alloc);
  ind.AddMember("oversold", s.oversold, alloc);
  doc.AddMember("indicators", ind, alloc);

  doc.AddMember("defaultPeriod",
                rapidjson::StringRef(timePeriodName(cfg.router.defaultPeriod)), alloc);
  doc.AddMember("logLevel", rapidjson::StringRef(logLevelName(cfg.logLevel)), alloc);

  rapidjson::StringBuffer sb;
  rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool parsePort(const char* text, std::uint16_t& out) {
  if (!text || !*text) return false;
  char* end = nullptr;
  errno = 0;
  long v = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || errno == ERANGE || v < 0 || v > 65535) return false;
  out = static_cast<std::uint16_t>(v);
  return true;
}

std::unique_ptr<HistorySource> makeHistorySource(const SourceConfig& cfg) {
  if (cfg.kind == SourceKind::Fake) {
    return std::make_unique<FakeHistorySource>(cfg.fake);
  }
  return std::make_unique<CsvHistorySource>(cfg.dataDir);
}

} // namespace sa
