#ifndef SCHOOLGOV_FORECASTER_HPP
#define SCHOOLGOV_FORECASTER_HPP

#include "derived_tables.hpp"
#include "school.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace schoolgov {

struct ForecastModel {
    static constexpr int HORIZON = 3;
    static constexpr double GROWTH_CLIP = 0.30;
    // Weights of the most recent, one-before and two-before transitions
    static constexpr double WEIGHTS[3] = {3.0, 2.0, 1.0};
};

double clip_growth(double growth);

// 3:2:1 weighted mean of the last three transitions of a chronological
// enrolment series, each normalised by the enrolment at its start. Transitions
// that do not exist or start at 0 drop out of numerator and denominator.
// Result is clipped to +/-0.30; 0 when no transition qualifies.
double weighted_growth_rate(const std::vector<int64_t>& enrolments);

// max(0, round(base * (1 + growth)^years_ahead))
int64_t project_enrolment(int64_t base_enrolment, double growth, int years_ahead);

/**
 * @brief Growth-rate estimator used by the forecaster.
 *
 * Receives every school's chronological enrolment series (ending at the base
 * year) at once so estimators can calibrate against the whole panel.
 */
class GrowthEstimator {
public:
    virtual ~GrowthEstimator() = default;

    virtual std::string name() const = 0;

    // One clipped growth rate per series, same order
    virtual std::vector<double> estimate(const std::vector<std::vector<int64_t>>& series) const = 0;
};

class WeightedMovingAverageEstimator : public GrowthEstimator {
public:
    std::string name() const override { return "weighted_moving_average"; }
    std::vector<double> estimate(const std::vector<std::vector<int64_t>>& series) const override;
};

// Shifts a base estimator's predictions so their mean equals the mean observed
// (clipped) year-over-year growth across the panel, then re-clips.
class BiasCorrectedEstimator : public GrowthEstimator {
public:
    explicit BiasCorrectedEstimator(std::unique_ptr<GrowthEstimator> base);

    std::string name() const override { return "bias_corrected"; }
    std::vector<double> estimate(const std::vector<std::vector<int64_t>>& series) const override;

private:
    std::unique_ptr<GrowthEstimator> base_;
};

// "weighted_moving_average" or "bias_corrected"; throws std::invalid_argument otherwise
std::unique_ptr<GrowthEstimator> make_growth_estimator(const std::string& name);

// Project every school with a YearlyMetric row in base_year one to three years
// ahead. Current capacity comes from the base year's gap rows.
// Rows are ordered by school id, then horizon.
std::vector<ForecastRow> forecast_enrolment(const FactTables& facts,
                                            const std::vector<ClassroomGapRow>& base_classroom_gaps,
                                            const std::vector<TeacherGapRow>& base_teacher_gaps,
                                            const std::string& base_year,
                                            const GrowthEstimator& estimator);

} // namespace schoolgov

#endif // SCHOOLGOV_FORECASTER_HPP
