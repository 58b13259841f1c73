#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "execution/CostModel.h"
#include "strategy/StrategyConfig.h"

namespace stratlab {

class Config {
public:
    static Config& getInstance();

    // Resets to defaults, then applies the file. A missing file keeps the defaults.
    void load(const std::string& config_path);

    engine::EngineConfig getEngineConfig() const { return engine_config_; }
    void setInitialCapital(double v) { engine_config_.initial_capital = v; }
    void setEnabledStrategies(const std::vector<std::string>& v) { engine_config_.enabled_strategies = v; }

    // Built-in defaults for the id, then the global risk section, then strategies.<id>
    strategy::StrategyParameters getStrategyParameters(const std::string& strategy_id) const;
    std::vector<std::string> getConfiguredStrategyIds() const;

    std::map<std::string, execution::CostProfile> getCostProfiles() const { return cost_profiles_; }
    std::vector<PairAnalytics> getPairs() const { return pairs_; }
    // primary -> secondary
    std::map<std::string, std::string> getPairSymbols() const { return pair_symbols_; }

private:
    Config() = default;
    void reset();

    void loadEngine(const nlohmann::json& e);
    void loadStrategy(const std::string& id, const nlohmann::json& s);
    void loadCostProfiles(const nlohmann::json& c);
    void loadPairs(const nlohmann::json& p);

    engine::EngineConfig engine_config_;
    nlohmann::json global_risk_;
    std::map<std::string, strategy::StrategyParameters> strategy_params_;
    std::map<std::string, execution::CostProfile> cost_profiles_;
    std::vector<PairAnalytics> pairs_;
    std::map<std::string, std::string> pair_symbols_;
};

} // namespace stratlab
