#include "execution/CostModel.h"

#include <algorithm>
#include <cmath>

namespace stratlab {
namespace execution {

CostBreakdown CostModel::compute(TradeType type, double quantity, double notional, long long days_held) const {
    CostBreakdown costs;
    const double units = std::abs(quantity);
    costs.commission = units * profile_.commission;
    costs.exchange_fee = units * profile_.exchange_fee;
    costs.clearing_fee = units * profile_.clearing_fee;

    const bool closing = (type == TradeType::SELL_CLOSE || type == TradeType::BUY_COVER);
    if (closing && days_held > 0) {
        costs.financing_accrued = std::abs(notional) * profile_.overnight_rate * static_cast<double>(days_held);
    }
    return costs;
}

MapCostProfileStore::MapCostProfileStore(std::map<std::string, CostProfile> profiles,
                                         const CostProfile& fallback)
    : profiles_(std::move(profiles))
    , fallback_(fallback)
{}

CostProfile MapCostProfileStore::getCostProfile(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(symbol);
    if (it != profiles_.end()) return it->second;
    it = profiles_.find("ALL");
    if (it != profiles_.end()) return it->second;
    return fallback_;
}

void MapCostProfileStore::setProfile(const std::string& symbol, const CostProfile& profile) {
    std::lock_guard<std::mutex> lock(mutex_);
    profiles_[symbol] = profile;
}

} // namespace execution
} // namespace stratlab
