#include "data/IPairAnalyticsProvider.h"

namespace stratlab {
namespace data {

void StaticPairAnalyticsProvider::setPair(const PairAnalytics& analytics) {
    std::lock_guard<std::mutex> lock(mutex_);
    pairs_[{analytics.primary, analytics.secondary}] = analytics;
}

std::optional<PairAnalytics> StaticPairAnalyticsProvider::getPairAnalytics(const std::string& primary,
                                                                           const std::string& secondary) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pairs_.find({primary, secondary});
    if (it != pairs_.end()) {
        return it->second;
    }
    return std::nullopt;
}

} // namespace data
} // namespace stratlab
