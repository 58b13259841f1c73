#pragma once

#include "strategy/IStrategy.h"
#include <vector>
#include <memory>
#include <mutex>
#include <string>

namespace stratlab {
namespace strategy {

// Registry of available policies, keyed by StrategyInfo::id
class StrategyManager {
public:
    StrategyManager() = default;

    // Registers every built-in policy
    static std::unique_ptr<StrategyManager> createDefault();

    // Replaces an existing policy with the same id
    void registerStrategy(std::shared_ptr<IStrategy> strategy);

    // Accepts display ids and camelCase aliases ("smaCrossover"); nullptr when unknown
    std::shared_ptr<IStrategy> getStrategy(const std::string& id) const;
    // Throws UnknownStrategyError
    std::shared_ptr<IStrategy> requireStrategy(const std::string& id) const;

    std::vector<std::shared_ptr<IStrategy>> getStrategies() const;
    std::vector<std::string> getStrategyIds() const;

    static std::string normalizeStrategyId(const std::string& id);

private:
    std::vector<std::shared_ptr<IStrategy>> strategies_;
    mutable std::mutex mutex_;
};

} // namespace strategy
} // namespace stratlab
