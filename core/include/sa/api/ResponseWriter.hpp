#pragma once
#include "sa/analysis/IndicatorFrame.hpp"
#include "sa/data/Bar.hpp"

#include <string>

namespace sa {

// JSON documents served by the API. NaN values are written as null.

// {"message","version","available_periods"}
std::string writeRootJson(const char* version);

// {"metadata","timeseries","analysis"}; frame must be non-empty.
std::string writeStockJson(const IndicatorFrame& frame, const AnalysisSnapshot& snap,
                           const StockInfo& info);

// {"last_5_days":[...], "calculations_sample":{...}}; frame must be non-empty.
std::string writeDebugJson(const IndicatorFrame& frame, std::size_t tailRows = 5);

// {"detail": "<text>"}
std::string writeErrorJson(const std::string& detail);

} // namespace sa
