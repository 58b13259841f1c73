#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace stratlab {
namespace backtest {

class DataHistory {
public:
    // Load daily bars from a CSV file.
    // Columns by header name when a header row is present (date, open, high, low,
    // close, volume; others ignored), otherwise date,open,high,low,close,volume.
    // The date column may be ISO (YYYY-MM-DD) or a unix timestamp in s or ms.
    static PriceSeries loadCSV(const std::string& file_path);

    // Load daily bars from a JSON array (or an object with a "bars" array)
    static PriceSeries loadJSON(const std::string& file_path);

    // Bars with start <= date <= end
    static PriceSeries filterByDate(const PriceSeries& bars, const Date& start, const Date& end);

    static Date dateFromTimestamp(long long ts);
};

} // namespace backtest
} // namespace stratlab
