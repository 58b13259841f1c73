#pragma once

#include <vector>
#include "common/Types.h"

namespace stratlab {
namespace analytics {

// Calendar-month return profile of a series
class SeasonalAnalyzer {
public:
    // One entry per month that has data, sorted by avg_return_pct descending
    static std::vector<MonthlyStat> monthlyStats(const PriceSeries& bars);

    static std::vector<int> bestMonths(const std::vector<MonthlyStat>& ranked, int count);
    static std::vector<int> worstMonths(const std::vector<MonthlyStat>& ranked, int count);
};

} // namespace analytics
} // namespace stratlab
