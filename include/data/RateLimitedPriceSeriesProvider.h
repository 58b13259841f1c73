#pragma once

#include <memory>
#include <mutex>
#include "data/IPriceSeriesProvider.h"
#include "execution/RateLimiter.h"

namespace stratlab {
namespace data {

// Serializes calls to an inner provider and spaces them through a RateLimiter
class RateLimitedPriceSeriesProvider : public IPriceSeriesProvider {
public:
    RateLimitedPriceSeriesProvider(std::shared_ptr<IPriceSeriesProvider> inner, int max_per_second);

    PriceSeries getPriceSeries(const std::string& symbol, const Date& start, const Date& end) override;

    execution::RateLimiter::Stats getStats() const { return limiter_.getStats(); }

private:
    std::shared_ptr<IPriceSeriesProvider> inner_;
    execution::RateLimiter limiter_;
    std::mutex call_mutex_;
};

} // namespace data
} // namespace stratlab
