#include "data/RateLimitedPriceSeriesProvider.h"
#include <stdexcept>

namespace stratlab {
namespace data {

RateLimitedPriceSeriesProvider::RateLimitedPriceSeriesProvider(
    std::shared_ptr<IPriceSeriesProvider> inner, int max_per_second)
    : inner_(std::move(inner))
    , limiter_(max_per_second)
{
    if (!inner_) {
        throw std::invalid_argument("RateLimitedPriceSeriesProvider requires an inner provider");
    }
}

PriceSeries RateLimitedPriceSeriesProvider::getPriceSeries(const std::string& symbol,
                                                           const Date& start, const Date& end) {
    std::lock_guard<std::mutex> lock(call_mutex_);
    limiter_.acquire();
    return inner_->getPriceSeries(symbol, start, end);
}

} // namespace data
} // namespace stratlab
