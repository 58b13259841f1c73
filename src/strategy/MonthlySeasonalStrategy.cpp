#include "strategy/MonthlySeasonalStrategy.h"
#include "analytics/SeasonalAnalyzer.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>

namespace stratlab {
namespace strategy {

namespace {
bool contains(const std::vector<int>& months, int month) {
    return std::find(months.begin(), months.end(), month) != months.end();
}

std::string joinMonths(const std::vector<int>& months) {
    std::string out;
    for (int m : months) {
        if (!out.empty()) out += ", ";
        out += monthShortName(m);
    }
    return out;
}
}

StrategyInfo MonthlySeasonalStrategy::getInfo() const {
    StrategyInfo info;
    info.id = "monthly_seasonal";
    info.name = "Monthly Seasonal Pattern";
    info.description = "Hold during historically favorable months, stay out of unfavorable ones";
    info.category = "Seasonal";
    info.risk_level = "Low";
    return info;
}

size_t MonthlySeasonalStrategy::warmupBars(const StrategyParameters& params) const {
    return static_cast<size_t>(std::max(params.seasonal.trend_ma_period - 1, 0));
}

std::vector<int> MonthlySeasonalStrategy::unfavorableMonths(const StrategyParameters& params) const {
    return params.seasonal.unfavorable_months;
}

StrategyParameters MonthlySeasonalStrategy::calibrate(const StrategyParameters& params, const PriceSeries& bars,
                                                      std::vector<std::string>& notes) const {
    StrategyParameters out = params;
    auto& cfg = out.seasonal;
    if (!cfg.favorable_months.empty() && !cfg.unfavorable_months.empty()) {
        return out;
    }

    const auto ranked = analytics::SeasonalAnalyzer::monthlyStats(bars);
    if (cfg.favorable_months.empty()) {
        cfg.favorable_months = analytics::SeasonalAnalyzer::bestMonths(ranked, cfg.favorable_count);
    }
    if (cfg.unfavorable_months.empty()) {
        for (int m : analytics::SeasonalAnalyzer::worstMonths(ranked, cfg.unfavorable_count)) {
            if (!contains(cfg.favorable_months, m)) {
                cfg.unfavorable_months.push_back(m);
            }
        }
    }

    // In-sample: the ranking uses the same bars the run trades on
    notes.push_back("Seasonal months ranked from this series: favorable [" +
                    joinMonths(cfg.favorable_months) + "], unfavorable [" +
                    joinMonths(cfg.unfavorable_months) + "]");
    LOG_INFO("Seasonal calibration: favorable [{}], unfavorable [{}]",
             joinMonths(cfg.favorable_months), joinMonths(cfg.unfavorable_months));
    return out;
}

int MonthlySeasonalStrategy::tradingDayOfMonth(const PriceSeries& bars, size_t index) {
    const Date& d = bars[index].date;
    int day = 1;
    for (size_t j = index; j > 0; --j) {
        const Date& prev = bars[j - 1].date;
        if (prev.year != d.year || prev.month != d.month) break;
        ++day;
    }
    return day;
}

Decision MonthlySeasonalStrategy::evaluate(const StrategyContext& context) const {
    const auto& cfg = context.params.seasonal;
    const Date& date = context.bar().date;
    const bool favorable = contains(cfg.favorable_months, date.month);

    if (context.position.isFlat()) {
        if (!favorable) return Decision::hold();
        if (tradingDayOfMonth(context.bars, context.index) > cfg.entry_window_days) {
            return Decision::hold();
        }
        const double trend = analytics::TechnicalIndicators::calculateSMAAt(
            context.closes, context.index, cfg.trend_ma_period);
        if (trend <= 0.0 || context.price() <= trend) return Decision::hold();

        return Decision(SignalType::ENTER_LONG, fmt::format("Favorable Month ({})", monthName(date.month)));
    }

    if (context.position.status == PositionStatus::LONG && !favorable) {
        const Date& entry = context.position.entry_date;
        if (entry.year != date.year || entry.month != date.month) {
            return Decision(SignalType::EXIT, "End of Favorable Month");
        }
    }
    return Decision::hold();
}

} // namespace strategy
} // namespace stratlab
