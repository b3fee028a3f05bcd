#ifndef SCHOOLGOV_RISK_TREND_HPP
#define SCHOOLGOV_RISK_TREND_HPP

#include "derived_tables.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace schoolgov {

struct TrendThresholds {
    static constexpr double IMPROVING_BELOW = -0.10;
    static constexpr double DETERIORATING_ABOVE = 0.10;
    static constexpr double VOLATILE_ABOVE = 0.25;
};

// BASELINE when there is no delta (first observed year)
TrendDirection classify_trend(const std::optional<double>& delta);

// Trend rows for one school; history must be chronological and non-empty.
// Deltas, directions and running averages are computed for the whole history
// before the chronic and volatile flags, which look back at earlier rows.
std::vector<RiskTrendRow> track_school_trend(const std::vector<const RiskRow*>& history);

// Recompute every school's trend from the full risk history. Result is keyed by
// academic year; each year's rows are ordered by school id.
std::map<std::string, std::vector<RiskTrendRow>> compute_risk_trends(const YearPartitionedTable<RiskRow>& risk);

} // namespace schoolgov

#endif // SCHOOLGOV_RISK_TREND_HPP
