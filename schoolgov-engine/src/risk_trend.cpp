#include "risk_trend.hpp"
#include "norms.hpp"
#include <cmath>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace schoolgov {

TrendDirection classify_trend(const std::optional<double>& delta) {
    if (!delta) {
        return TrendDirection::Baseline;
    }
    if (*delta < TrendThresholds::IMPROVING_BELOW) {
        return TrendDirection::Improving;
    }
    if (*delta > TrendThresholds::DETERIORATING_ABOVE) {
        return TrendDirection::Deteriorating;
    }
    return TrendDirection::Stable;
}

std::vector<RiskTrendRow> track_school_trend(const std::vector<const RiskRow*>& history) {
    if (history.empty()) {
        throw std::invalid_argument("track_school_trend: empty history");
    }

    std::vector<RiskTrendRow> rows(history.size());

    // Pass 1: lag, delta, direction, sequence, running mean
    double running_sum = 0.0;
    for (size_t i = 0; i < history.size(); ++i) {
        const RiskRow& current = *history[i];
        RiskTrendRow& row = rows[i];

        row.school_id = current.school_id;
        row.academic_year = current.academic_year;
        row.risk_score = current.risk_score;
        row.risk_level = current.risk_level;
        row.year_sequence = static_cast<int64_t>(i) + 1;

        if (i > 0) {
            row.prev_risk_score = history[i - 1]->risk_score;
            row.risk_delta = round_to(current.risk_score - *row.prev_risk_score, 4);
        }
        row.trend_direction = classify_trend(row.risk_delta);

        running_sum += current.risk_score;
        row.cumulative_avg_risk = running_sum / static_cast<double>(i + 1);
    }

    // Pass 2: flags over the values pass 1 produced
    for (size_t i = 0; i < rows.size(); ++i) {
        RiskTrendRow& row = rows[i];

        row.chronic = i >= 2 &&
                      is_high_or_critical(rows[i].risk_level) &&
                      is_high_or_critical(rows[i - 1].risk_level) &&
                      is_high_or_critical(rows[i - 2].risk_level);

        auto swings = [](const std::optional<double>& delta) {
            return delta && std::fabs(*delta) > TrendThresholds::VOLATILE_ABOVE;
        };
        row.is_volatile = swings(row.risk_delta) || (i > 0 && swings(rows[i - 1].risk_delta));
    }

    return rows;
}

std::map<std::string, std::vector<RiskTrendRow>> compute_risk_trends(const YearPartitionedTable<RiskRow>& risk) {
    // Group each school's rows chronologically; years() is ascending
    std::map<SchoolId, std::vector<const RiskRow*>> by_school;
    for (const auto& year : risk.years()) {
        for (const auto& row : risk.rows(year)) {
            by_school[row.school_id].push_back(&row);
        }
    }

    std::vector<const std::vector<const RiskRow*>*> histories;
    histories.reserve(by_school.size());
    for (const auto& entry : by_school) {
        histories.push_back(&entry.second);
    }

    std::vector<std::vector<RiskTrendRow>> per_school(histories.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(dynamic, 256)
#endif
    for (size_t i = 0; i < histories.size(); ++i) {
        per_school[i] = track_school_trend(*histories[i]);
    }

    // Schools were visited in id order, so each year's partition stays sorted
    std::map<std::string, std::vector<RiskTrendRow>> by_year;
    for (const auto& year : risk.years()) {
        by_year[year];
    }
    for (auto& school_rows : per_school) {
        for (auto& row : school_rows) {
            by_year[row.academic_year].push_back(std::move(row));
        }
    }
    return by_year;
}

} // namespace schoolgov
