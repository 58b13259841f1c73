#pragma once

#include <string>
#include <vector>
#include "risk/RiskConfig.h"

namespace stratlab {
namespace strategy {

struct SmaCrossoverConfig {
    int fast_period = 50;
    int slow_period = 200;
};

struct RsiConfig {
    int period = 14;
    double oversold = 30.0;
    double overbought = 70.0;
};

struct MacdConfig {
    int fast_period = 12;
    int slow_period = 26;
    int signal_period = 9;
};

struct BollingerConfig {
    int period = 20;
    double std_dev_mult = 2.0;
};

struct MomentumConfig {
    int lookback = 20;          // breakout above the prior N-bar high, exit below the prior N-bar low
};

struct SeasonalConfig {
    // Empty sets are calibrated from the series before the run
    std::vector<int> favorable_months;
    std::vector<int> unfavorable_months;
    int entry_window_days = 5;  // first K trading days of a favorable month
    int trend_ma_period = 20;
    int favorable_count = 4;    // used by calibration
    int unfavorable_count = 3;
};

enum class PairMode {
    SPREAD,   // primary - ratio * secondary
    RATIO     // primary / secondary
};

struct PairConfig {
    std::string secondary_symbol;
    int lookback = 20;
    double entry_z = 2.0;
    double exit_z = 0.5;
    int max_holding_bars = 0;   // 0 = 2 x half-life, or 30 when unknown
    int default_max_holding_bars = 30;
};

// Immutable per run
struct StrategyParameters {
    SmaCrossoverConfig sma;
    RsiConfig rsi;
    MacdConfig macd;
    BollingerConfig bollinger;
    MomentumConfig momentum;
    SeasonalConfig seasonal;
    PairConfig pair;
    risk::RiskConfig risk;
};

// Built-in parameters for a registered strategy id
inline StrategyParameters defaultParametersFor(const std::string& id) {
    StrategyParameters params;
    if (id == "momentum") {
        params.risk.stop_loss_method = risk::StopLossMethod::PERCENTAGE;
        params.risk.stop_loss_value = 0.08;
    } else if (id == "monthly_seasonal") {
        params.risk.stop_loss_method = risk::StopLossMethod::PERCENTAGE;
        params.risk.stop_loss_value = 0.08;
        params.risk.trailing_activation_pct = 0.10;
        params.risk.trailing_distance_pct = 0.05;
        params.risk.worst_month_exit = true;
    }
    return params;
}

} // namespace strategy
} // namespace stratlab
