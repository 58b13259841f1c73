#include "analytics/SeasonalAnalyzer.h"

#include <algorithm>

namespace stratlab {
namespace analytics {

std::vector<MonthlyStat> SeasonalAnalyzer::monthlyStats(const PriceSeries& bars) {
    double sums[12] = {0};
    int counts[12] = {0};

    for (size_t i = 1; i < bars.size(); ++i) {
        if (bars[i - 1].close <= 0.0) continue;
        const double daily_return = (bars[i].close / bars[i - 1].close - 1.0) * 100.0;
        const int m = bars[i].date.month - 1;
        sums[m] += daily_return;
        counts[m] += 1;
    }

    std::vector<MonthlyStat> stats;
    for (int m = 0; m < 12; ++m) {
        if (counts[m] == 0) continue;
        MonthlyStat s;
        s.month = m + 1;
        s.avg_return_pct = sums[m] / counts[m];
        s.samples = counts[m];
        stats.push_back(s);
    }

    // Stable so ties keep calendar order
    std::stable_sort(stats.begin(), stats.end(), [](const MonthlyStat& a, const MonthlyStat& b) {
        return a.avg_return_pct > b.avg_return_pct;
    });
    return stats;
}

std::vector<int> SeasonalAnalyzer::bestMonths(const std::vector<MonthlyStat>& ranked, int count) {
    std::vector<int> months;
    for (const auto& s : ranked) {
        if (static_cast<int>(months.size()) >= count) break;
        months.push_back(s.month);
    }
    std::sort(months.begin(), months.end());
    return months;
}

std::vector<int> SeasonalAnalyzer::worstMonths(const std::vector<MonthlyStat>& ranked, int count) {
    std::vector<int> months;
    for (auto it = ranked.rbegin(); it != ranked.rend(); ++it) {
        if (static_cast<int>(months.size()) >= count) break;
        months.push_back(it->month);
    }
    std::sort(months.begin(), months.end());
    return months;
}

} // namespace analytics
} // namespace stratlab
