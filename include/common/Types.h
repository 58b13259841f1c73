#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <optional>

#include "common/Date.h"

namespace stratlab {

struct PriceBar {
    Date date;
    double open;
    double high;
    double low;
    double close;
    double volume;

    PriceBar() : open(0), high(0), low(0), close(0), volume(0) {}

    PriceBar(const Date& d, double o, double h, double l, double c, double v)
        : date(d), open(o), high(h), low(l), close(c), volume(v) {}
};

using PriceSeries = std::vector<PriceBar>;

enum class PositionStatus { FLAT, LONG, SHORT };

enum class TradeType { BUY_OPEN, SELL_CLOSE, SELL_SHORT, BUY_COVER };

inline const char* positionStatusToString(PositionStatus status) {
    switch (status) {
        case PositionStatus::FLAT: return "FLAT";
        case PositionStatus::LONG: return "LONG";
        case PositionStatus::SHORT: return "SHORT";
    }
    return "UNKNOWN";
}

inline const char* tradeTypeToString(TradeType type) {
    switch (type) {
        case TradeType::BUY_OPEN: return "BUY_OPEN";
        case TradeType::SELL_CLOSE: return "SELL_CLOSE";
        case TradeType::SELL_SHORT: return "SELL_SHORT";
        case TradeType::BUY_COVER: return "BUY_COVER";
    }
    return "UNKNOWN";
}

struct PositionState {
    PositionStatus status = PositionStatus::FLAT;
    double entry_price = 0.0;
    Date entry_date;
    size_t entry_index = 0;
    double quantity = 0.0;
    double stop_loss_price = 0.0;       // 0 = no stop
    double peak_price_since_entry = 0.0; // highest for LONG, lowest for SHORT
    bool trailing_stop_active = false;
    double entry_costs = 0.0;
    double collateral = 0.0;            // cash posted against a short

    bool isFlat() const { return status == PositionStatus::FLAT; }
};

struct Trade {
    Date date;
    TradeType type = TradeType::BUY_OPEN;
    double price = 0.0;
    double quantity = 0.0;
    std::string reason;
    std::optional<double> pnl;          // closing trades only, net of all costs
    double commission = 0.0;
    double exchange_fee = 0.0;
    double clearing_fee = 0.0;
    double financing_accrued = 0.0;

    double totalCosts() const {
        return commission + exchange_fee + clearing_fee + financing_accrued;
    }
    bool isClosing() const {
        return type == TradeType::SELL_CLOSE || type == TradeType::BUY_COVER;
    }
};

struct EquityPoint {
    Date date;
    double portfolio_value = 0.0;

    EquityPoint() = default;
    EquityPoint(const Date& d, double v) : date(d), portfolio_value(v) {}
};

// Statistics of a two-instrument relationship, as produced by a pair analytics provider
struct PairAnalytics {
    std::string primary;
    std::string secondary;
    double pearson_correlation = 0.0;
    double cointegration_score = 0.0;   // 0..1, higher is stronger
    bool is_stationary_pair = false;
    std::optional<double> half_life;    // bars; absent when the spread does not revert
    double optimal_ratio = 1.0;         // hedge ratio of primary on secondary
};

// Calendar-month return profile entry
struct MonthlyStat {
    int month = 0;               // 1-12
    double avg_return_pct = 0.0; // average daily return of bars falling in the month
    int samples = 0;
};

// PAIR_DATA_UNAVAILABLE: the paired instrument could not be fetched or failed validation
enum class ResultStatus { COMPLETED, INSUFFICIENT_DATA, NON_STATIONARY_PAIR, PAIR_DATA_UNAVAILABLE, CANCELLED };

inline const char* resultStatusToString(ResultStatus status) {
    switch (status) {
        case ResultStatus::COMPLETED: return "COMPLETED";
        case ResultStatus::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        case ResultStatus::NON_STATIONARY_PAIR: return "NON_STATIONARY_PAIR";
        case ResultStatus::PAIR_DATA_UNAVAILABLE: return "PAIR_DATA_UNAVAILABLE";
        case ResultStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

struct BacktestResult {
    std::string symbol;
    std::string strategy_id;
    std::string strategy_name;
    ResultStatus status = ResultStatus::COMPLETED;
    std::vector<std::string> notes;

    double initial_capital = 0.0;
    double final_value = 0.0;
    double total_return_pct = 0.0;
    std::optional<double> annual_return_pct;
    double max_drawdown_pct = 0.0;      // <= 0
    std::optional<double> win_rate_pct;
    int total_trades = 0;               // ledger entries
    int closed_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
    double avg_win = 0.0;
    double avg_loss = 0.0;              // <= 0
    std::optional<double> profit_factor;
    double sharpe_ratio = 0.0;
    double sortino_ratio = 0.0;
    double risk_reward_ratio = 0.0;
    double total_costs = 0.0;
    int skipped_signals = 0;
    bool enforce_buy_first = true;

    Date start_date;
    Date end_date;
    std::vector<Trade> trade_ledger;
    std::vector<EquityPoint> equity_curve;

    // Seasonal policy only: month sets used and the ranked profile of the series
    std::vector<int> favorable_months;
    std::vector<int> unfavorable_months;
    std::vector<MonthlyStat> monthly_stats;
};

struct CalculatorRow {
    double capital = 0.0;
    double final_value = 0.0;
    double profit = 0.0;
    double total_return_pct = 0.0;
    std::optional<double> win_rate_pct;
    int total_trades = 0;
};

struct ComparisonResult {
    std::string symbol;
    double capital = 0.0;
    int years = 0;
    bool enforce_buy_first = true;
    std::vector<BacktestResult> results;  // ranked by total return, best first
    std::string best_strategy;            // empty when no run completed
    bool cancelled = false;
};

struct SweepResult {
    std::string symbol;
    std::string strategy_id;
    int years = 0;
    std::vector<CalculatorRow> rows;
};

} // namespace stratlab
