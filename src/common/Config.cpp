#include "common/Config.h"
#include "common/Logger.h"
#include "common/PathUtils.h"
#include "strategy/StrategyManager.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace stratlab {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

std::string normalizeStrategyName(const std::string& name) {
    return strategy::StrategyManager::normalizeStrategyId(trimCopy(name));
}

std::vector<int> readMonths(const nlohmann::json& list, const std::string& key) {
    std::vector<int> months;
    if (!list.is_array()) {
        LOG_WARN("Config: {} must be a list of months", key);
        return months;
    }
    for (const auto& item : list) {
        int month = 0;
        if (item.is_number_integer()) {
            month = item.get<int>();
        } else if (item.is_string()) {
            month = parseMonth(item.get<std::string>());
        }
        if (month < 1 || month > 12) {
            LOG_WARN("Config: ignoring invalid month in {}: {}", key, item.dump());
            continue;
        }
        months.push_back(month);
    }
    std::sort(months.begin(), months.end());
    months.erase(std::unique(months.begin(), months.end()), months.end());
    return months;
}

// Only keys present in `r` override `risk`
void applyRisk(const nlohmann::json& r, risk::RiskConfig& risk) {
    if (!r.is_object()) return;

    if (r.contains("stop_loss_method")) {
        const std::string name = r.value("stop_loss_method", std::string());
        risk::StopLossMethod method = risk.stop_loss_method;
        if (parseStopLossMethod(name, method)) {
            risk.stop_loss_method = method;
        } else {
            LOG_WARN("Config: unknown stop_loss_method '{}', keeping {}", name,
                     risk::stopLossMethodToString(risk.stop_loss_method));
        }
    }
    risk.stop_loss_value = r.value("stop_loss_value", risk.stop_loss_value);
    risk.atr_period = r.value("atr_period", risk.atr_period);
    risk.volatility_lookback = r.value("volatility_lookback", risk.volatility_lookback);
    risk.trailing_activation_pct = r.value("trailing_activation_pct", risk.trailing_activation_pct);
    risk.trailing_distance_pct = r.value("trailing_distance_pct", risk.trailing_distance_pct);
    risk.take_profit_pct = r.value("take_profit_pct", risk.take_profit_pct);
    risk.worst_month_exit = r.value("worst_month_exit", risk.worst_month_exit);

    if (risk.stop_loss_value < 0.0) {
        LOG_WARN("Config: negative stop_loss_value ignored");
        risk.stop_loss_value = 0.0;
        risk.stop_loss_method = risk::StopLossMethod::NONE;
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::reset() {
    engine_config_ = engine::EngineConfig();
    global_risk_ = nlohmann::json::object();
    strategy_params_.clear();
    cost_profiles_.clear();
    pairs_.clear();
    pair_symbols_.clear();
}

void Config::load(const std::string& path) {
    reset();

    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
    }

    if (!std::filesystem::exists(config_path)) {
        LOG_WARN("Config file not found: {} (using defaults)", config_path.string());
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_WARN("Config file could not be opened: {} (using defaults)", config_path.string());
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        LOG_ERROR("Config parse error in {}: {}", config_path.string(), e.what());
        throw std::runtime_error("Invalid config file " + config_path.string() + ": " + e.what());
    }

    if (j.contains("engine")) {
        loadEngine(j["engine"]);
    }
    if (j.contains("risk") && j["risk"].is_object()) {
        global_risk_ = j["risk"];
    }
    if (j.contains("strategies") && j["strategies"].is_object()) {
        for (auto it = j["strategies"].begin(); it != j["strategies"].end(); ++it) {
            loadStrategy(normalizeStrategyName(it.key()), it.value());
        }
    }
    if (j.contains("cost_profiles")) {
        loadCostProfiles(j["cost_profiles"]);
    }
    if (j.contains("pairs")) {
        loadPairs(j["pairs"]);
    }

    LOG_INFO("Config loaded from {}: capital={:.2f}, years={}, buy_first={}, {} cost profile(s), {} pair(s)",
             config_path.string(), engine_config_.initial_capital, engine_config_.years,
             engine_config_.enforce_buy_first, cost_profiles_.size(), pairs_.size());
}

void Config::loadEngine(const nlohmann::json& e) {
    const engine::EngineConfig defaults;

    engine_config_.initial_capital = e.value("initial_capital", defaults.initial_capital);
    if (engine_config_.initial_capital <= 0.0) {
        LOG_WARN("Config: initial_capital must be positive, using {:.2f}", defaults.initial_capital);
        engine_config_.initial_capital = defaults.initial_capital;
    }
    engine_config_.years = e.value("years", defaults.years);
    if (engine_config_.years <= 0) {
        LOG_WARN("Config: years must be positive, using {}", defaults.years);
        engine_config_.years = defaults.years;
    }
    engine_config_.enforce_buy_first = e.value("enforce_buy_first", defaults.enforce_buy_first);
    engine_config_.fractional_quantity = e.value("fractional_quantity", defaults.fractional_quantity);
    engine_config_.worker_threads = std::max(0, e.value("worker_threads", defaults.worker_threads));
    engine_config_.compare_budget_ms = std::max(0LL, e.value("compare_budget_ms", defaults.compare_budget_ms));
    engine_config_.data_dir = e.value("data_dir", defaults.data_dir);
    engine_config_.provider_max_requests_per_second =
        std::max(0, e.value("provider_max_requests_per_second", defaults.provider_max_requests_per_second));
    engine_config_.log_dir = e.value("log_dir", defaults.log_dir);
    engine_config_.log_level = e.value("log_level", defaults.log_level);

    const std::string as_of = trimCopy(e.value("as_of", std::string()));
    if (!as_of.empty()) {
        try {
            engine_config_.as_of = Date::parse(as_of);
        } catch (const std::invalid_argument& ex) {
            LOG_WARN("Config: invalid as_of '{}' ({}), using today", as_of, ex.what());
        }
    }

    if (e.contains("enabled_strategies")) {
        engine_config_.enabled_strategies = e["enabled_strategies"].get<std::vector<std::string>>();
        for (auto& strategy_name : engine_config_.enabled_strategies) {
            strategy_name = normalizeStrategyName(strategy_name);
        }
    }
    if (e.contains("sweep_capitals")) {
        std::vector<double> capitals;
        for (double c : e["sweep_capitals"].get<std::vector<double>>()) {
            if (c > 0.0) capitals.push_back(c);
            else LOG_WARN("Config: ignoring non-positive sweep capital {}", c);
        }
        engine_config_.sweep_capitals = capitals;
    }
}

void Config::loadStrategy(const std::string& id, const nlohmann::json& s) {
    if (!s.is_object()) {
        LOG_WARN("Config: strategies.{} must be an object", id);
        return;
    }

    strategy::StrategyParameters params = strategy::defaultParametersFor(id);

    if (id == "sma_crossover") {
        params.sma.fast_period = s.value("fast_period", params.sma.fast_period);
        params.sma.slow_period = s.value("slow_period", params.sma.slow_period);
        if (params.sma.fast_period <= 0 || params.sma.fast_period >= params.sma.slow_period) {
            LOG_WARN("Config: sma_crossover fast_period must be positive and below slow_period, using 50/200");
            params.sma = strategy::SmaCrossoverConfig();
        }
    }

    if (id == "rsi") {
        params.rsi.period = s.value("period", params.rsi.period);
        params.rsi.oversold = s.value("oversold", params.rsi.oversold);
        params.rsi.overbought = s.value("overbought", params.rsi.overbought);
    }

    if (id == "macd") {
        params.macd.fast_period = s.value("fast_period", params.macd.fast_period);
        params.macd.slow_period = s.value("slow_period", params.macd.slow_period);
        params.macd.signal_period = s.value("signal_period", params.macd.signal_period);
    }

    if (id == "bollinger_bands") {
        params.bollinger.period = s.value("period", params.bollinger.period);
        params.bollinger.std_dev_mult = s.value("std_dev_mult", params.bollinger.std_dev_mult);
    }

    if (id == "momentum") {
        params.momentum.lookback = s.value("lookback", params.momentum.lookback);
    }

    if (id == "monthly_seasonal") {
        if (s.contains("favorable_months")) {
            params.seasonal.favorable_months = readMonths(s["favorable_months"], "favorable_months");
        }
        if (s.contains("unfavorable_months")) {
            params.seasonal.unfavorable_months = readMonths(s["unfavorable_months"], "unfavorable_months");
        }
        params.seasonal.entry_window_days = s.value("entry_window_days", params.seasonal.entry_window_days);
        params.seasonal.trend_ma_period = s.value("trend_ma_period", params.seasonal.trend_ma_period);
        params.seasonal.favorable_count = s.value("favorable_count", params.seasonal.favorable_count);
        params.seasonal.unfavorable_count = s.value("unfavorable_count", params.seasonal.unfavorable_count);
    }

    if (id == "pair_mean_reversion" || id == "ratio_trading") {
        params.pair.secondary_symbol = s.value("secondary_symbol", params.pair.secondary_symbol);
        params.pair.lookback = s.value("lookback", params.pair.lookback);
        params.pair.entry_z = s.value("entry_z", params.pair.entry_z);
        params.pair.exit_z = s.value("exit_z", params.pair.exit_z);
        params.pair.max_holding_bars = s.value("max_holding_bars", params.pair.max_holding_bars);
        if (params.pair.exit_z >= params.pair.entry_z) {
            LOG_WARN("Config: {} exit_z must be below entry_z, using 2.0/0.5", id);
            params.pair.entry_z = 2.0;
            params.pair.exit_z = 0.5;
        }
    }

    applyRisk(global_risk_, params.risk);
    if (s.contains("risk")) {
        applyRisk(s["risk"], params.risk);
    }

    strategy_params_[id] = params;
}

void Config::loadCostProfiles(const nlohmann::json& c) {
    if (!c.is_object()) {
        LOG_WARN("Config: cost_profiles must be an object keyed by symbol");
        return;
    }
    for (auto it = c.begin(); it != c.end(); ++it) {
        const auto& p = it.value();
        execution::CostProfile profile = execution::CostProfile::defaults();
        profile.commission = p.value("commission", profile.commission);
        profile.exchange_fee = p.value("exchange_fee", profile.exchange_fee);
        profile.clearing_fee = p.value("clearing_fee", profile.clearing_fee);
        profile.overnight_rate = p.value("overnight_rate", profile.overnight_rate);
        if (profile.perUnitFees() < 0.0 || profile.overnight_rate < 0.0) {
            LOG_WARN("Config: negative costs for {} ignored", it.key());
            continue;
        }
        cost_profiles_[it.key()] = profile;
    }
}

void Config::loadPairs(const nlohmann::json& p) {
    if (!p.is_array()) {
        LOG_WARN("Config: pairs must be a list");
        return;
    }
    for (const auto& entry : p) {
        PairAnalytics pair;
        pair.primary = entry.value("primary", std::string());
        pair.secondary = entry.value("secondary", std::string());
        if (pair.primary.empty() || pair.secondary.empty()) {
            LOG_WARN("Config: pair entry without primary/secondary ignored");
            continue;
        }
        // The secondary is still useful for a strategy without pre-computed statistics
        if (pair_symbols_.find(pair.primary) == pair_symbols_.end()) {
            pair_symbols_[pair.primary] = pair.secondary;
        }
        if (!entry.contains("is_stationary_pair")) continue;

        pair.pearson_correlation = entry.value("pearson_correlation", 0.0);
        pair.cointegration_score = entry.value("cointegration_score", 0.0);
        pair.is_stationary_pair = entry.value("is_stationary_pair", false);
        pair.optimal_ratio = entry.value("optimal_ratio", 1.0);
        if (entry.contains("half_life") && entry["half_life"].is_number()) {
            pair.half_life = entry["half_life"].get<double>();
        }
        pairs_.push_back(pair);
    }
}

strategy::StrategyParameters Config::getStrategyParameters(const std::string& strategy_id) const {
    const std::string id = normalizeStrategyName(strategy_id);
    auto it = strategy_params_.find(id);
    if (it != strategy_params_.end()) return it->second;

    strategy::StrategyParameters params = strategy::defaultParametersFor(id);
    applyRisk(global_risk_, params.risk);
    return params;
}

std::vector<std::string> Config::getConfiguredStrategyIds() const {
    std::vector<std::string> ids;
    for (const auto& kv : strategy_params_) ids.push_back(kv.first);
    return ids;
}

} // namespace stratlab
