#include "data/InMemoryPriceSeriesProvider.h"
#include "backtest/DataHistory.h"
#include "common/Errors.h"

namespace stratlab {
namespace data {

void InMemoryPriceSeriesProvider::setSeries(const std::string& symbol, PriceSeries bars) {
    std::lock_guard<std::mutex> lock(mutex_);
    series_[symbol] = std::move(bars);
}

PriceSeries InMemoryPriceSeriesProvider::getPriceSeries(const std::string& symbol,
                                                        const Date& start, const Date& end) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = series_.find(symbol);
    if (it == series_.end()) {
        throw SymbolNotFoundError(symbol);
    }
    return backtest::DataHistory::filterByDate(it->second, start, end);
}

} // namespace data
} // namespace stratlab
