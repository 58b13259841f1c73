#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace stratlab {
namespace backtest {

inline nlohmann::json optionalToJson(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

inline nlohmann::json toJson(const Trade& trade) {
    nlohmann::json line;
    line["date"] = trade.date.toString();
    line["type"] = tradeTypeToString(trade.type);
    line["price"] = trade.price;
    line["quantity"] = trade.quantity;
    line["reason"] = trade.reason;
    line["pnl"] = optionalToJson(trade.pnl);
    line["commission"] = trade.commission;
    line["exchange_fee"] = trade.exchange_fee;
    line["clearing_fee"] = trade.clearing_fee;
    line["financing_accrued"] = trade.financing_accrued;
    return line;
}

inline nlohmann::json toJson(const EquityPoint& point) {
    return nlohmann::json{
        {"date", point.date.toString()},
        {"portfolio_value", point.portfolio_value}
    };
}

// Ledger and curve are omitted when include_series is false
inline nlohmann::json toJson(const BacktestResult& result, bool include_series = true) {
    nlohmann::json out;
    out["symbol"] = result.symbol;
    out["strategy_id"] = result.strategy_id;
    out["strategy_name"] = result.strategy_name;
    out["status"] = resultStatusToString(result.status);
    out["notes"] = result.notes;
    out["initial_capital"] = result.initial_capital;
    out["final_value"] = result.final_value;
    out["total_return_pct"] = result.total_return_pct;
    out["annual_return_pct"] = optionalToJson(result.annual_return_pct);
    out["max_drawdown_pct"] = result.max_drawdown_pct;
    out["win_rate_pct"] = optionalToJson(result.win_rate_pct);
    out["total_trades"] = result.total_trades;
    out["closed_trades"] = result.closed_trades;
    out["winning_trades"] = result.winning_trades;
    out["losing_trades"] = result.losing_trades;
    out["avg_win"] = result.avg_win;
    out["avg_loss"] = result.avg_loss;
    out["profit_factor"] = optionalToJson(result.profit_factor);
    out["sharpe_ratio"] = result.sharpe_ratio;
    out["sortino_ratio"] = result.sortino_ratio;
    out["risk_reward_ratio"] = result.risk_reward_ratio;
    out["total_costs"] = result.total_costs;
    out["skipped_signals"] = result.skipped_signals;
    out["enforce_buy_first"] = result.enforce_buy_first;
    out["start_date"] = result.start_date.toString();
    out["end_date"] = result.end_date.toString();

    if (!result.monthly_stats.empty() || !result.favorable_months.empty()) {
        nlohmann::json stats = nlohmann::json::array();
        for (const auto& m : result.monthly_stats) {
            stats.push_back({
                {"month", m.month},
                {"month_name", monthName(m.month)},
                {"avg_return_pct", m.avg_return_pct},
                {"samples", m.samples}
            });
        }
        out["seasonality"] = {
            {"favorable_months", result.favorable_months},
            {"unfavorable_months", result.unfavorable_months},
            {"monthly_stats", std::move(stats)}
        };
    }

    if (include_series) {
        nlohmann::json ledger = nlohmann::json::array();
        for (const auto& trade : result.trade_ledger) {
            ledger.push_back(toJson(trade));
        }
        nlohmann::json curve = nlohmann::json::array();
        for (const auto& point : result.equity_curve) {
            curve.push_back(toJson(point));
        }
        out["trade_ledger"] = std::move(ledger);
        out["equity_curve"] = std::move(curve);
    }
    return out;
}

inline nlohmann::json toJson(const CalculatorRow& row) {
    nlohmann::json out;
    out["capital"] = row.capital;
    out["final_value"] = row.final_value;
    out["profit"] = row.profit;
    out["total_return_pct"] = row.total_return_pct;
    out["win_rate_pct"] = optionalToJson(row.win_rate_pct);
    out["total_trades"] = row.total_trades;
    return out;
}

inline nlohmann::json toJson(const ComparisonResult& comparison, bool include_series = false) {
    nlohmann::json out;
    out["symbol"] = comparison.symbol;
    out["capital"] = comparison.capital;
    out["years"] = comparison.years;
    out["enforce_buy_first"] = comparison.enforce_buy_first;
    out["best_strategy"] = comparison.best_strategy.empty()
        ? nlohmann::json(nullptr) : nlohmann::json(comparison.best_strategy);
    out["cancelled"] = comparison.cancelled;

    nlohmann::json results = nlohmann::json::array();
    for (const auto& r : comparison.results) {
        results.push_back(toJson(r, include_series));
    }
    out["results"] = std::move(results);
    return out;
}

inline nlohmann::json toJson(const SweepResult& sweep) {
    nlohmann::json out;
    out["symbol"] = sweep.symbol;
    out["strategy_id"] = sweep.strategy_id;
    out["years"] = sweep.years;

    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : sweep.rows) {
        rows.push_back(toJson(row));
    }
    out["rows"] = std::move(rows);
    return out;
}

} // namespace backtest
} // namespace stratlab
