#include "backtest/TradeSimulator.h"
#include "analytics/PairStatistics.h"
#include "analytics/PerformanceAnalytics.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "risk/RiskManager.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace stratlab {
namespace backtest {

namespace {
double markToMarket(double cash, const PositionState& position, double price) {
    switch (position.status) {
        case PositionStatus::FLAT:
            return cash;
        case PositionStatus::LONG:
            return cash + position.quantity * price;
        case PositionStatus::SHORT: {
            const double unrealized = std::max(position.quantity * (position.entry_price - price),
                                               -position.collateral);
            return std::max(cash + position.collateral + unrealized, 0.0);
        }
    }
    return cash;
}

// Mutable state of one walk
struct RunState {
    double cash = 0.0;
    PositionState position;
    std::vector<Trade> ledger;
    int unfunded_entries = 0;
};

void recordTrade(const SimulationRequest& request, const std::string& strategy_id, const Trade& trade) {
    LOG_DEBUG("[{}|{}] {} {} qty={:.4f} @ {:.4f} ({})", request.symbol, strategy_id,
              trade.date.toString(), tradeTypeToString(trade.type), trade.quantity, trade.price, trade.reason);
    Logger::getInstance().logTrade(request.symbol, strategy_id, trade.date.toString(),
                                   tradeTypeToString(trade.type), trade.price, trade.quantity,
                                   trade.pnl.value_or(0.0), trade.reason);
}

bool openPosition(RunState& state, const SimulationRequest& request, const std::string& strategy_id,
                  const execution::CostModel& costs, const risk::RiskManager& risk,
                  PositionStatus side, size_t index, const std::string& reason) {
    const PriceBar& bar = request.bars[index];
    const double price = bar.close;
    const double per_unit = costs.profile().perUnitFees();

    double quantity = state.cash / (price + per_unit);
    if (!request.fractional_quantity) {
        quantity = std::floor(quantity);
    }
    if (!(quantity > 0.0)) {
        state.unfunded_entries++;
        LOG_WARN("[{}|{}] {} entry skipped: cash {:.2f} cannot fund one unit at {:.4f}",
                 request.symbol, strategy_id, bar.date.toString(), state.cash, price);
        return false;
    }

    const TradeType type = (side == PositionStatus::LONG) ? TradeType::BUY_OPEN : TradeType::SELL_SHORT;
    const double notional = quantity * price;
    const auto fees = costs.compute(type, quantity, notional, 0);

    PositionState& pos = state.position;
    pos.status = side;
    pos.entry_price = price;
    pos.entry_date = bar.date;
    pos.entry_index = index;
    pos.quantity = quantity;
    pos.stop_loss_price = risk.calculateStopLoss(side, price, request.bars, index);
    pos.peak_price_since_entry = price;
    pos.trailing_stop_active = false;
    pos.entry_costs = fees.total();
    pos.collateral = (side == PositionStatus::SHORT) ? notional : 0.0;

    // Short proceeds stay posted as collateral
    state.cash -= notional + fees.total();
    if (state.cash < 0.0) state.cash = 0.0;

    Trade trade;
    trade.date = bar.date;
    trade.type = type;
    trade.price = price;
    trade.quantity = quantity;
    trade.reason = reason;
    trade.commission = fees.commission;
    trade.exchange_fee = fees.exchange_fee;
    trade.clearing_fee = fees.clearing_fee;
    trade.financing_accrued = fees.financing_accrued;
    state.ledger.push_back(trade);
    recordTrade(request, strategy_id, trade);
    return true;
}

void closePosition(RunState& state, const SimulationRequest& request, const std::string& strategy_id,
                   const execution::CostModel& costs, size_t index, const std::string& reason) {
    const PriceBar& bar = request.bars[index];
    const double price = bar.close;
    PositionState& pos = state.position;
    const bool is_long = (pos.status == PositionStatus::LONG);

    const TradeType type = is_long ? TradeType::SELL_CLOSE : TradeType::BUY_COVER;
    const long long days_held = Date::daysBetween(pos.entry_date, bar.date);
    const double notional = pos.quantity * price;
    const auto fees = costs.compute(type, pos.quantity, notional, days_held);

    double gross = 0.0;
    if (is_long) {
        gross = pos.quantity * (price - pos.entry_price);
        state.cash += notional - fees.total();
    } else {
        // A short cannot lose more than its collateral
        gross = std::max(pos.quantity * (pos.entry_price - price), -pos.collateral);
        state.cash += pos.collateral + gross - fees.total();
    }
    if (state.cash < 0.0) {
        LOG_WARN("[{}|{}] {} costs exceeded remaining equity; cash floored at 0",
                 request.symbol, strategy_id, bar.date.toString());
        state.cash = 0.0;
    }

    Trade trade;
    trade.date = bar.date;
    trade.type = type;
    trade.price = price;
    trade.quantity = pos.quantity;
    trade.reason = reason;
    trade.pnl = gross - pos.entry_costs - fees.total();
    trade.commission = fees.commission;
    trade.exchange_fee = fees.exchange_fee;
    trade.clearing_fee = fees.clearing_fee;
    trade.financing_accrued = fees.financing_accrued;
    state.ledger.push_back(trade);
    recordTrade(request, strategy_id, trade);

    pos = PositionState();
}
}

TradeSimulator::TradeSimulator(std::shared_ptr<const strategy::IStrategy> strategy)
    : strategy_(std::move(strategy))
{
    if (!strategy_) {
        throw std::invalid_argument("TradeSimulator requires a strategy");
    }
}

void TradeSimulator::validateSeries(const PriceSeries& bars) {
    for (size_t i = 0; i < bars.size(); ++i) {
        const auto& bar = bars[i];
        const double fields[4] = {bar.open, bar.high, bar.low, bar.close};
        for (double v : fields) {
            if (!std::isfinite(v) || v <= 0.0) {
                throw MalformedPriceSeriesError("Invalid price on " + bar.date.toString());
            }
        }
        if (bar.high < bar.low) {
            throw MalformedPriceSeriesError("High below low on " + bar.date.toString());
        }
        if (!std::isfinite(bar.volume) || bar.volume < 0.0) {
            throw MalformedPriceSeriesError("Invalid volume on " + bar.date.toString());
        }
        if (i > 0 && !(bars[i - 1].date < bar.date)) {
            throw MalformedPriceSeriesError("Dates not strictly increasing at " + bar.date.toString());
        }
    }
}

// First signal bar plus one more: entries are not taken on the terminal bar
size_t TradeSimulator::requiredBars(const strategy::StrategyParameters& params) const {
    return strategy_->warmupBars(params) + 2;
}

BacktestResult TradeSimulator::run(const SimulationRequest& request) const {
    const auto info = strategy_->getInfo();
    validateSeries(request.bars);

    // Pair policies walk only the dates both instruments share
    SimulationRequest aligned_request;
    const SimulationRequest* req = &request;
    std::vector<double> secondary_closes;
    if (strategy_->requiresPair()) {
        if (!request.secondary.empty()) {
            validateSeries(request.secondary);
            aligned_request = request;
            auto aligned = analytics::PairStatistics::alignByDate(request.bars, request.secondary);
            aligned_request.bars = std::move(aligned.first);
            aligned_request.secondary = std::move(aligned.second);
            req = &aligned_request;
            secondary_closes = analytics::TechnicalIndicators::extractClosePrices(req->secondary);
        }
        strategy_->validate(request.params, req->secondary.empty() ? nullptr : &req->secondary,
                            request.pair ? &*request.pair : nullptr);
    }

    const PriceSeries& bars = req->bars;
    const size_t required = requiredBars(request.params);
    if (bars.size() < required) {
        throw InsufficientDataError(
            fmt::format("{} needs at least {} bars, {} available", info.name, required, bars.size()),
            bars.size(), required);
    }

    LOG_INFO("[{}|{}] backtest start: {} bars {} .. {}, capital {:.2f}", request.symbol, info.id,
             bars.size(), bars.front().date.toString(), bars.back().date.toString(), request.initial_capital);

    const size_t warmup = strategy_->warmupBars(request.params);
    const std::vector<double> closes = analytics::TechnicalIndicators::extractClosePrices(bars);
    risk::RiskManager risk(request.params.risk, request.enforce_buy_first,
                           strategy_->unfavorableMonths(request.params));
    const execution::CostModel costs(request.cost_profile);

    RunState state;
    state.cash = request.initial_capital;

    BacktestResult result;
    result.symbol = request.symbol;
    result.strategy_id = info.id;
    result.strategy_name = info.name;
    result.initial_capital = request.initial_capital;
    result.enforce_buy_first = request.enforce_buy_first;
    result.start_date = bars.front().date;
    result.end_date = bars.back().date;
    result.equity_curve.reserve(bars.size());

    for (size_t i = 0; i < bars.size(); ++i) {
        if (request.cancel != nullptr && request.cancel->isCancelled()) {
            throw BacktestCancelledError();
        }

        const bool last_bar = (i + 1 == bars.size());
        strategy::Decision decision;
        if (i >= warmup) {
            strategy::StrategyContext context(bars, closes, i, state.position, request.params);
            if (!secondary_closes.empty()) {
                context.secondary = &req->secondary;
                context.secondary_closes = &secondary_closes;
            }
            context.pair = request.pair ? &*request.pair : nullptr;
            decision = strategy_->evaluate(context);
        }

        const auto action = risk.evaluate(decision, state.position, bars, i);
        switch (action.action) {
            case risk::RiskAction::OPEN_LONG:
                if (!last_bar) {
                    openPosition(state, *req, info.id, costs, risk, PositionStatus::LONG, i, action.reason);
                }
                break;
            case risk::RiskAction::OPEN_SHORT:
                if (!last_bar) {
                    openPosition(state, *req, info.id, costs, risk, PositionStatus::SHORT, i, action.reason);
                }
                break;
            case risk::RiskAction::CLOSE:
                closePosition(state, *req, info.id, costs, i, action.reason);
                break;
            case risk::RiskAction::HOLD:
                break;
        }

        if (last_bar && !state.position.isFlat()) {
            closePosition(state, *req, info.id, costs, i, "End of period");
        }

        result.equity_curve.emplace_back(bars[i].date, markToMarket(state.cash, state.position, bars[i].close));
    }

    result.final_value = state.cash;
    result.trade_ledger = std::move(state.ledger);
    result.skipped_signals = risk.skippedSignals();
    if (result.skipped_signals > 0) {
        result.notes.push_back(fmt::format("{} signal(s) skipped by buy-first and position rules",
                                           result.skipped_signals));
    }
    if (state.unfunded_entries > 0) {
        result.notes.push_back(fmt::format("{} entry signal(s) skipped for insufficient cash",
                                           state.unfunded_entries));
    }

    analytics::PerformanceAnalytics::summarize(result);

    LOG_INFO("[{}|{}] backtest done: final {:.2f} ({:+.2f}%), {} trades, max drawdown {:.2f}%",
             request.symbol, info.id, result.final_value, result.total_return_pct,
             result.total_trades, result.max_drawdown_pct);
    return result;
}

} // namespace backtest
} // namespace stratlab
