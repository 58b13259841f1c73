#include "risk/RiskManager.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>

namespace stratlab {
namespace risk {

RiskManager::RiskManager(const RiskConfig& config, bool enforce_buy_first,
                         std::vector<int> unfavorable_months)
    : config_(config)
    , enforce_buy_first_(enforce_buy_first)
    , unfavorable_months_(std::move(unfavorable_months))
{}

bool RiskManager::isUnfavorableMonth(int month) const {
    return std::find(unfavorable_months_.begin(), unfavorable_months_.end(), month) != unfavorable_months_.end();
}

double RiskManager::calculateStopLoss(PositionStatus side, double entry_price,
                                      const PriceSeries& bars, size_t index) const {
    if (side == PositionStatus::FLAT || entry_price <= 0.0) return 0.0;
    const double dir = (side == PositionStatus::LONG) ? 1.0 : -1.0;

    double distance = 0.0;
    switch (config_.stop_loss_method) {
        case StopLossMethod::NONE:
            return 0.0;
        case StopLossMethod::PERCENTAGE:
            distance = entry_price * config_.stop_loss_value;
            break;
        case StopLossMethod::ATR: {
            const size_t end = std::min(index + 1, bars.size());
            const PriceSeries history(bars.begin(), bars.begin() + end);
            const double atr = analytics::TechnicalIndicators::calculateATR(history, config_.atr_period);
            distance = config_.stop_loss_value * atr;
            break;
        }
        case StopLossMethod::VOLATILITY: {
            std::vector<double> closes;
            const size_t end = std::min(index + 1, bars.size());
            closes.reserve(end);
            for (size_t i = 0; i < end; ++i) closes.push_back(bars[i].close);
            const double vol_pct = analytics::TechnicalIndicators::calculateAnnualizedVolatility(
                closes, config_.volatility_lookback);
            distance = entry_price * config_.stop_loss_value * vol_pct / 10000.0;
            break;
        }
        case StopLossMethod::FIXED:
            distance = config_.stop_loss_value;
            break;
    }

    if (distance <= 0.0) return 0.0;
    const double stop = entry_price - dir * distance;
    return std::max(stop, 0.0);
}

RiskDecision RiskManager::evaluate(const strategy::Decision& decision, PositionState& position,
                                   const PriceSeries& bars, size_t index) {
    const PriceBar& bar = bars[index];
    if (position.isFlat()) {
        return evaluateFlat(decision, bar);
    }
    return evaluateOpen(decision, position, bar);
}

RiskDecision RiskManager::evaluateFlat(const strategy::Decision& decision, const PriceBar& bar) {
    using strategy::SignalType;
    switch (decision.signal) {
        case SignalType::HOLD:
            return RiskDecision();
        case SignalType::ENTER_LONG:
            return RiskDecision(RiskAction::OPEN_LONG, decision.reason);
        case SignalType::ENTER_SHORT:
            if (enforce_buy_first_) {
                ++skipped_signals_;
                LOG_DEBUG("{} buy-first: short entry skipped ({})", bar.date.toString(), decision.reason);
                return RiskDecision();
            }
            return RiskDecision(RiskAction::OPEN_SHORT, decision.reason);
        case SignalType::EXIT:
        case SignalType::COVER:
            ++skipped_signals_;
            LOG_DEBUG("{} exit signal while flat skipped ({})", bar.date.toString(), decision.reason);
            return RiskDecision();
    }
    return RiskDecision();
}

RiskDecision RiskManager::evaluateOpen(const strategy::Decision& decision, PositionState& position,
                                       const PriceBar& bar) {
    using strategy::SignalType;
    const bool is_long = (position.status == PositionStatus::LONG);
    const double price = bar.close;

    // 1. Stop-loss
    if (position.stop_loss_price > 0.0) {
        const bool hit = is_long ? (price <= position.stop_loss_price) : (price >= position.stop_loss_price);
        if (hit) {
            return RiskDecision(RiskAction::CLOSE, "Stop loss triggered", true);
        }
    }

    // 2. Worst month
    if (config_.worst_month_exit && isUnfavorableMonth(bar.date.month)) {
        return RiskDecision(RiskAction::CLOSE,
                            std::string("Unfavorable month (") + monthName(bar.date.month) + ")", true);
    }

    // 3. Trailing stop
    if (is_long) {
        position.peak_price_since_entry = std::max(position.peak_price_since_entry, price);
    } else {
        position.peak_price_since_entry = (position.peak_price_since_entry > 0.0)
            ? std::min(position.peak_price_since_entry, price)
            : price;
    }

    if (config_.trailing_activation_pct > 0.0 && config_.trailing_distance_pct > 0.0 &&
        position.entry_price > 0.0) {
        const double peak = position.peak_price_since_entry;
        const double excursion = is_long
            ? (peak - position.entry_price) / position.entry_price
            : (position.entry_price - peak) / position.entry_price;
        if (!position.trailing_stop_active && excursion >= config_.trailing_activation_pct) {
            position.trailing_stop_active = true;
            LOG_DEBUG("{} trailing stop armed at peak {:.4f}", bar.date.toString(), peak);
        }
        if (position.trailing_stop_active && peak > 0.0) {
            const double retrace = is_long ? (peak - price) / peak : (price - peak) / peak;
            if (retrace >= config_.trailing_distance_pct) {
                return RiskDecision(RiskAction::CLOSE, "Trailing stop triggered", true);
            }
        }
    }

    // 4. Take-profit
    if (config_.take_profit_pct > 0.0 && position.entry_price > 0.0) {
        const double gain = is_long
            ? (price - position.entry_price) / position.entry_price
            : (position.entry_price - price) / position.entry_price;
        if (gain >= config_.take_profit_pct) {
            return RiskDecision(RiskAction::CLOSE, "Take profit reached", true);
        }
    }

    // 5. Policy exit
    if ((is_long && decision.signal == SignalType::EXIT) ||
        (!is_long && decision.signal == SignalType::COVER)) {
        return RiskDecision(RiskAction::CLOSE, decision.reason);
    }

    return RiskDecision();
}

} // namespace risk
} // namespace stratlab
