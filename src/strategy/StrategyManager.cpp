#include "strategy/StrategyManager.h"
#include "strategy/BuyHoldStrategy.h"
#include "strategy/SmaCrossoverStrategy.h"
#include "strategy/RsiStrategy.h"
#include "strategy/MacdStrategy.h"
#include "strategy/BollingerBandsStrategy.h"
#include "strategy/MomentumStrategy.h"
#include "strategy/MonthlySeasonalStrategy.h"
#include "strategy/PairMeanReversionStrategy.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include <algorithm>
#include <cctype>
#include <map>

namespace stratlab {
namespace strategy {

std::string StrategyManager::normalizeStrategyId(const std::string& id) {
    std::string s;
    for (char c : id) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    std::replace(s.begin(), s.end(), '-', '_');

    // camelCase ids used by the web front end
    static const std::map<std::string, std::string> aliases = {
        {"buyhold", "buy_hold"},
        {"buy_and_hold", "buy_hold"},
        {"smacrossover", "sma_crossover"},
        {"sma", "sma_crossover"},
        {"bollingerbands", "bollinger_bands"},
        {"bollinger", "bollinger_bands"},
        {"monthlyseasonal", "monthly_seasonal"},
        {"seasonal", "monthly_seasonal"},
        {"pairmeanreversion", "pair_mean_reversion"},
        {"mean_reversion", "pair_mean_reversion"},
        {"ratiotrading", "ratio_trading"},
        {"ratio", "ratio_trading"}
    };
    auto it = aliases.find(s);
    return (it != aliases.end()) ? it->second : s;
}

std::unique_ptr<StrategyManager> StrategyManager::createDefault() {
    auto manager = std::make_unique<StrategyManager>();
    manager->registerStrategy(std::make_shared<BuyHoldStrategy>());
    manager->registerStrategy(std::make_shared<SmaCrossoverStrategy>());
    manager->registerStrategy(std::make_shared<RsiStrategy>());
    manager->registerStrategy(std::make_shared<MacdStrategy>());
    manager->registerStrategy(std::make_shared<BollingerBandsStrategy>());
    manager->registerStrategy(std::make_shared<MomentumStrategy>());
    manager->registerStrategy(std::make_shared<MonthlySeasonalStrategy>());
    manager->registerStrategy(std::make_shared<PairMeanReversionStrategy>(PairMode::SPREAD));
    manager->registerStrategy(std::make_shared<PairMeanReversionStrategy>(PairMode::RATIO));
    return manager;
}

void StrategyManager::registerStrategy(std::shared_ptr<IStrategy> strategy) {
    if (!strategy) return;
    std::lock_guard<std::mutex> lock(mutex_);

    const auto info = strategy->getInfo();
    auto it = std::find_if(strategies_.begin(), strategies_.end(),
                           [&](const std::shared_ptr<IStrategy>& s) { return s->getInfo().id == info.id; });
    if (it != strategies_.end()) {
        *it = strategy;
    } else {
        strategies_.push_back(strategy);
    }

    LOG_DEBUG("Strategy registered: {} ({}, risk: {})", info.id, info.category, info.risk_level);
}

std::shared_ptr<IStrategy> StrategyManager::getStrategy(const std::string& id) const {
    const std::string key = normalizeStrategyId(id);
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& strategy : strategies_) {
        if (strategy->getInfo().id == key) {
            return strategy;
        }
    }
    return nullptr;
}

std::shared_ptr<IStrategy> StrategyManager::requireStrategy(const std::string& id) const {
    auto strategy = getStrategy(id);
    if (!strategy) {
        throw UnknownStrategyError(id);
    }
    return strategy;
}

std::vector<std::shared_ptr<IStrategy>> StrategyManager::getStrategies() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strategies_;
}

std::vector<std::string> StrategyManager::getStrategyIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(strategies_.size());
    for (const auto& strategy : strategies_) {
        ids.push_back(strategy->getInfo().id);
    }
    return ids;
}

} // namespace strategy
} // namespace stratlab
