#pragma once

#include <map>
#include <mutex>
#include "data/IPriceSeriesProvider.h"

namespace stratlab {
namespace data {

class InMemoryPriceSeriesProvider : public IPriceSeriesProvider {
public:
    void setSeries(const std::string& symbol, PriceSeries bars);
    PriceSeries getPriceSeries(const std::string& symbol, const Date& start, const Date& end) override;

private:
    std::map<std::string, PriceSeries> series_;
    std::mutex mutex_;
};

} // namespace data
} // namespace stratlab
