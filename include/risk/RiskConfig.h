#pragma once

#include <string>

namespace stratlab {
namespace risk {

enum class StopLossMethod {
    NONE,
    PERCENTAGE,   // value = fraction of entry (0.08 = 8%)
    ATR,          // value = ATR multiple
    VOLATILITY,   // value = multiple of annualized volatility
    FIXED         // value = absolute price distance
};

// Fractions throughout: 0.10 means 10%. Zero disables a rule.
struct RiskConfig {
    StopLossMethod stop_loss_method = StopLossMethod::NONE;
    double stop_loss_value = 0.0;
    int atr_period = 14;
    int volatility_lookback = 20;

    double trailing_activation_pct = 0.0;
    double trailing_distance_pct = 0.0;

    double take_profit_pct = 0.0;

    bool worst_month_exit = false;
};

inline const char* stopLossMethodToString(StopLossMethod method) {
    switch (method) {
        case StopLossMethod::NONE: return "none";
        case StopLossMethod::PERCENTAGE: return "percentage";
        case StopLossMethod::ATR: return "atr";
        case StopLossMethod::VOLATILITY: return "volatility";
        case StopLossMethod::FIXED: return "fixed";
    }
    return "none";
}

// Returns false for unknown names and leaves `out` untouched
inline bool parseStopLossMethod(const std::string& name, StopLossMethod& out) {
    if (name == "none") { out = StopLossMethod::NONE; return true; }
    if (name == "percentage" || name == "percent") { out = StopLossMethod::PERCENTAGE; return true; }
    if (name == "atr") { out = StopLossMethod::ATR; return true; }
    if (name == "volatility") { out = StopLossMethod::VOLATILITY; return true; }
    if (name == "fixed") { out = StopLossMethod::FIXED; return true; }
    return false;
}

} // namespace risk
} // namespace stratlab
