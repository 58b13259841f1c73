#pragma once

#include <string>
#include "common/Types.h"

namespace stratlab {
namespace data {

// Source of daily bars. Implementations throw SymbolNotFoundError for unknown
// symbols and DataUnavailableError when the source cannot be read.
class IPriceSeriesProvider {
public:
    virtual ~IPriceSeriesProvider() = default;

    // Bars with start <= date <= end, ascending by date
    virtual PriceSeries getPriceSeries(const std::string& symbol, const Date& start, const Date& end) = 0;
};

} // namespace data
} // namespace stratlab
