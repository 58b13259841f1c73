#include "strategy/PairMeanReversionStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>

namespace stratlab {
namespace strategy {

PairMeanReversionStrategy::PairMeanReversionStrategy(PairMode mode)
    : mode_(mode)
{}

StrategyInfo PairMeanReversionStrategy::getInfo() const {
    StrategyInfo info;
    if (mode_ == PairMode::RATIO) {
        info.id = "ratio_trading";
        info.name = "Ratio Trading";
        info.description = "Trade deviations of the price ratio between two instruments";
    } else {
        info.id = "pair_mean_reversion";
        info.name = "Pair Mean Reversion";
        info.description = "Trade deviations of the hedged spread between two cointegrated instruments";
    }
    info.category = "Statistical Arbitrage";
    info.risk_level = "Medium";
    return info;
}

size_t PairMeanReversionStrategy::warmupBars(const StrategyParameters& params) const {
    return static_cast<size_t>(std::max(params.pair.lookback - 1, 1));
}

void PairMeanReversionStrategy::validate(const StrategyParameters& params, const PriceSeries* secondary,
                                         const PairAnalytics* pair) const {
    if (secondary == nullptr || secondary->empty()) {
        throw DataUnavailableError("Pair strategy requires a secondary series (" +
                                   params.pair.secondary_symbol + ")");
    }
    if (pair == nullptr || !pair->is_stationary_pair) {
        const std::string name = pair ? (pair->primary + "/" + pair->secondary) : params.pair.secondary_symbol;
        throw NonStationaryPairError("Pair " + name + " is not stationary; spread trading disabled");
    }
}

std::optional<double> PairMeanReversionStrategy::zScore(const std::vector<double>& primary,
                                                        const std::vector<double>& secondary,
                                                        size_t index, int lookback, double ratio) const {
    if (lookback < 2 || index + 1 < static_cast<size_t>(lookback) ||
        index >= primary.size() || index >= secondary.size()) {
        return std::nullopt;
    }

    std::vector<double> window;
    window.reserve(lookback);
    for (size_t j = index + 1 - lookback; j <= index; ++j) {
        if (mode_ == PairMode::RATIO) {
            if (secondary[j] == 0.0) return std::nullopt;
            window.push_back(primary[j] / secondary[j]);
        } else {
            window.push_back(primary[j] - ratio * secondary[j]);
        }
    }

    const double mean = analytics::TechnicalIndicators::calculateMean(window);
    const double stdev = analytics::TechnicalIndicators::calculateStandardDeviation(window, mean);
    if (stdev < 1e-12) return std::nullopt;
    return (window.back() - mean) / stdev;
}

int PairMeanReversionStrategy::maxHoldingBars(const StrategyParameters& params, const PairAnalytics* pair) const {
    if (params.pair.max_holding_bars > 0) return params.pair.max_holding_bars;
    if (pair != nullptr && pair->half_life && *pair->half_life > 0.0) {
        return std::max(1, static_cast<int>(std::lround(2.0 * *pair->half_life)));
    }
    return params.pair.default_max_holding_bars;
}

Decision PairMeanReversionStrategy::evaluate(const StrategyContext& context) const {
    if (context.secondary_closes == nullptr) return Decision::hold();

    const auto& cfg = context.params.pair;
    const double ratio = context.pair ? context.pair->optimal_ratio : 1.0;
    const auto z = zScore(context.closes, *context.secondary_closes, context.index, cfg.lookback, ratio);
    if (!z) return Decision::hold();

    const auto& position = context.position;
    if (position.isFlat()) {
        if (*z <= -cfg.entry_z) {
            return Decision(SignalType::ENTER_LONG, fmt::format("Spread below mean (z={:.2f})", *z));
        }
        if (*z >= cfg.entry_z) {
            return Decision(SignalType::ENTER_SHORT, fmt::format("Spread above mean (z={:.2f})", *z));
        }
        return Decision::hold();
    }

    const SignalType close_signal = (position.status == PositionStatus::LONG) ? SignalType::EXIT : SignalType::COVER;
    if (std::abs(*z) <= cfg.exit_z) {
        return Decision(close_signal, fmt::format("Spread reverted (z={:.2f})", *z));
    }
    const size_t held = context.index - position.entry_index;
    if (held > static_cast<size_t>(maxHoldingBars(context.params, context.pair))) {
        return Decision(close_signal, "Max holding period reached");
    }
    return Decision::hold();
}

} // namespace strategy
} // namespace stratlab
