#include "sa/api/ResponseWriter.hpp"
#include "sa/data/TimePeriod.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <cstdint>

namespace sa {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

static void writeNumber(JsonWriter& w, double v) {
  if (std::isnan(v) || std::isinf(v)) w.Null();
  else w.Double(v);
}

// Share counts are whole numbers; write them as JSON integers.
static void writeVolume(JsonWriter& w, double v) {
  if (std::isfinite(v) && v == std::floor(v) && std::fabs(v) < 9.0e15) {
    w.Int64(static_cast<std::int64_t>(v));
  } else {
    writeNumber(w, v);
  }
}

static void writeString(JsonWriter& w, const std::string& s) {
  w.String(s.c_str(), static_cast<rapidjson::SizeType>(s.size()));
}

static void writeSeries(JsonWriter& w, const char* key, const std::vector<double>& values) {
  w.Key(key);
  w.StartArray();
  for (double v : values) writeNumber(w, v);
  w.EndArray();
}

std::string writeRootJson(const char* version) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("message");
  w.String("Stock Analyzer API is running");
  w.Key("version");
  w.String(version);
  w.Key("available_periods");
  w.StartArray();
  for (TimePeriod p : allTimePeriods()) w.String(timePeriodName(p));
  w.EndArray();
  w.EndObject();
  return sb.GetString();
}

std::string writeStockJson(const IndicatorFrame& frame, const AnalysisSnapshot& snap,
                           const StockInfo& info) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();

  // ---- metadata ----
  w.Key("metadata");
  w.StartObject();
  w.Key("ticker");
  writeString(w, info.symbol);
  w.Key("company_name");
  writeString(w, info.longName);
  w.Key("sector");
  writeString(w, info.sector.empty() ? std::string("N/A") : info.sector);
  w.Key("industry");
  writeString(w, info.industry.empty() ? std::string("N/A") : info.industry);
  w.Key("data_points");
  w.Uint64(frame.size());
  w.Key("start_date");
  writeString(w, frame.bars.front().date);
  w.Key("end_date");
  writeString(w, frame.bars.back().date);
  w.EndObject();

  // ---- timeseries ----
  w.Key("timeseries");
  w.StartObject();
  w.Key("dates");
  w.StartArray();
  for (const auto& b : frame.bars) writeString(w, b.date);
  w.EndArray();
  writeSeries(w, "price", closesOf(frame.bars));
  w.Key("volume");
  w.StartArray();
  for (double v : volumesOf(frame.bars)) writeVolume(w, v);
  w.EndArray();
  writeSeries(w, "fifty_ma", frame.fastMa);
  writeSeries(w, "twohundred_ma", frame.slowMa);
  writeSeries(w, "rsi", frame.rsi);
  writeSeries(w, "vwap", frame.vwap);
  w.EndObject();

  // ---- analysis ----
  w.Key("analysis");
  w.StartObject();

  w.Key("moving_averages");
  w.StartObject();
  w.Key("latest_price");
  writeNumber(w, snap.latestPrice);
  w.Key("latest_50ma");
  writeNumber(w, snap.latestFastMa);
  w.Key("latest_200ma");
  writeNumber(w, snap.latestSlowMa);
  w.Key("is_golden_cross");
  w.Bool(snap.isGoldenCross);
  w.Key("price_above_50ma");
  w.Bool(snap.priceAboveFastMa);
  w.Key("price_above_200ma");
  w.Bool(snap.priceAboveSlowMa);
  w.Key("last_cross");
  if (snap.hasLastCross && snap.lastCross.index < frame.size()) {
    w.StartObject();
    w.Key("type");
    w.String(crossKindName(snap.lastCross.kind));
    w.Key("date");
    writeString(w, frame.bars[snap.lastCross.index].date);
    w.EndObject();
  } else {
    w.Null();
  }
  w.EndObject();

  w.Key("rsi");
  w.StartObject();
  w.Key("current_rsi");
  writeNumber(w, snap.latestRsi);
  w.Key("is_overbought");
  w.Bool(snap.isOverbought);
  w.Key("is_oversold");
  w.Bool(snap.isOversold);
  w.EndObject();

  w.Key("vwap");
  w.StartObject();
  w.Key("current_vwap");
  writeNumber(w, snap.latestVwap);
  w.Key("price_above_vwap");
  w.Bool(snap.priceAboveVwap);
  w.EndObject();

  w.EndObject(); // analysis
  w.EndObject();
  return sb.GetString();
}

std::string writeDebugJson(const IndicatorFrame& frame, std::size_t tailRows) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();

  const std::size_t n = frame.size();
  const std::size_t start = n > tailRows ? n - tailRows : 0;

  w.Key("last_5_days");
  w.StartArray();
  for (std::size_t i = start; i < n; i++) {
    const Bar& b = frame.bars[i];
    w.StartObject();
    w.Key("Date");
    writeString(w, b.date);
    w.Key("Open");
    writeNumber(w, b.open);
    w.Key("High");
    writeNumber(w, b.high);
    w.Key("Low");
    writeNumber(w, b.low);
    w.Key("Close");
    writeNumber(w, b.close);
    w.Key("Volume");
    writeVolume(w, b.volume);
    w.Key("50_MA");
    writeNumber(w, frame.fastMa[i]);
    w.Key("200_MA");
    writeNumber(w, frame.slowMa[i]);
    w.Key("RSI");
    writeNumber(w, frame.rsi[i]);
    w.Key("VWAP");
    writeNumber(w, frame.vwap[i]);
    w.EndObject();
  }
  w.EndArray();

  const std::size_t last = n - 1;
  w.Key("calculations_sample");
  w.StartObject();
  w.Key("close");
  writeNumber(w, frame.bars[last].close);
  w.Key("50_ma");
  writeNumber(w, frame.fastMa[last]);
  w.Key("200_ma");
  writeNumber(w, frame.slowMa[last]);
  w.Key("rsi");
  writeNumber(w, frame.rsi[last]);
  w.Key("vwap");
  writeNumber(w, frame.vwap[last]);
  w.EndObject();

  w.EndObject();
  return sb.GetString();
}

std::string writeErrorJson(const std::string& detail) {
  rapidjson::StringBuffer sb;
  JsonWriter w(sb);
  w.StartObject();
  w.Key("detail");
  writeString(w, detail);
  w.EndObject();
  return sb.GetString();
}

} // namespace sa
