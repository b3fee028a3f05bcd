#include "forecaster.hpp"
#include "academic_year.hpp"
#include "gap_resolver.hpp"
#include "norms.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace schoolgov {

// ============================================================================
// Growth helpers
// ============================================================================

double clip_growth(double growth) {
    return std::max(-ForecastModel::GROWTH_CLIP, std::min(growth, ForecastModel::GROWTH_CLIP));
}

double weighted_growth_rate(const std::vector<int64_t>& enrolments) {
    const int n = static_cast<int>(enrolments.size());
    double numerator = 0.0;
    double denominator = 0.0;

    for (int j = 0; j < 3; ++j) {
        const int end = n - 1 - j;
        const int start = end - 1;
        if (start < 0) {
            break;
        }
        const int64_t from = enrolments[static_cast<size_t>(start)];
        const int64_t to = enrolments[static_cast<size_t>(end)];
        if (from == 0) {
            continue;
        }
        const double weight = ForecastModel::WEIGHTS[j];
        numerator += weight * static_cast<double>(to - from) / static_cast<double>(from);
        denominator += weight;
    }

    if (denominator == 0.0) {
        return 0.0;
    }
    return clip_growth(numerator / denominator);
}

int64_t project_enrolment(int64_t base_enrolment, double growth, int years_ahead) {
    const double projected = static_cast<double>(base_enrolment) * std::pow(1.0 + growth, years_ahead);
    return std::max<int64_t>(0, static_cast<int64_t>(std::round(projected)));
}

// ============================================================================
// Estimators
// ============================================================================

std::vector<double> WeightedMovingAverageEstimator::estimate(
    const std::vector<std::vector<int64_t>>& series) const {
    std::vector<double> result(series.size());
    for (size_t i = 0; i < series.size(); ++i) {
        result[i] = weighted_growth_rate(series[i]);
    }
    return result;
}

BiasCorrectedEstimator::BiasCorrectedEstimator(std::unique_ptr<GrowthEstimator> base)
    : base_(std::move(base)) {
    if (!base_) {
        throw std::invalid_argument("BiasCorrectedEstimator requires a base estimator");
    }
}

std::vector<double> BiasCorrectedEstimator::estimate(
    const std::vector<std::vector<int64_t>>& series) const {
    std::vector<double> predictions = base_->estimate(series);
    if (predictions.empty()) {
        return predictions;
    }

    // Mean of every observed transition in the panel
    double observed_sum = 0.0;
    size_t observed_count = 0;
    for (const auto& s : series) {
        for (size_t k = 1; k < s.size(); ++k) {
            if (s[k - 1] == 0) {
                continue;
            }
            observed_sum += clip_growth(static_cast<double>(s[k] - s[k - 1]) / static_cast<double>(s[k - 1]));
            ++observed_count;
        }
    }
    const double target_mean = observed_count > 0 ? observed_sum / static_cast<double>(observed_count) : 0.0;

    double predicted_sum = 0.0;
    for (double p : predictions) {
        predicted_sum += p;
    }
    const double shift = target_mean - predicted_sum / static_cast<double>(predictions.size());

    for (double& p : predictions) {
        p = clip_growth(p + shift);
    }
    return predictions;
}

std::unique_ptr<GrowthEstimator> make_growth_estimator(const std::string& name) {
    if (name.empty() || name == "weighted_moving_average") {
        return std::make_unique<WeightedMovingAverageEstimator>();
    }
    if (name == "bias_corrected") {
        return std::make_unique<BiasCorrectedEstimator>(std::make_unique<WeightedMovingAverageEstimator>());
    }
    throw std::invalid_argument("Unknown growth estimator: " + name +
                                " (expected weighted_moving_average or bias_corrected)");
}

// ============================================================================
// Forecast
// ============================================================================

std::vector<ForecastRow> forecast_enrolment(const FactTables& facts,
                                            const std::vector<ClassroomGapRow>& base_classroom_gaps,
                                            const std::vector<TeacherGapRow>& base_teacher_gaps,
                                            const std::string& base_year,
                                            const GrowthEstimator& estimator) {
    const auto base_metrics = facts.metrics_for_year(base_year);

    std::vector<std::vector<int64_t>> series(base_metrics.size());
    for (size_t i = 0; i < base_metrics.size(); ++i) {
        for (const YearlyMetric* m : facts.enrolment_history(base_metrics[i]->school_id)) {
            if (m->academic_year > base_year) {
                break;
            }
            series[i].push_back(m->total_enrolment);
        }
    }

    const std::vector<double> growth = estimator.estimate(series);
    if (growth.size() != series.size()) {
        throw std::logic_error("Growth estimator " + estimator.name() + " returned " +
                               std::to_string(growth.size()) + " rates for " +
                               std::to_string(series.size()) + " schools");
    }

    std::vector<std::string> forecast_years;
    for (int k = 1; k <= ForecastModel::HORIZON; ++k) {
        forecast_years.push_back(shift_academic_year(base_year, k));
    }

    const std::string estimator_name = estimator.name();
    std::vector<ForecastRow> rows(base_metrics.size() * ForecastModel::HORIZON);

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (size_t i = 0; i < base_metrics.size(); ++i) {
        const YearlyMetric& base = *base_metrics[i];
        const int category = category_of(facts, base.school_id);
        const int classroom_norm = CapacityNorms::classroom_norm(category);
        const int teacher_norm = CapacityNorms::pupil_teacher_norm(category);

        int64_t current_classrooms = 0;
        int64_t current_teachers = 0;
        if (const ClassroomGapRow* c = find_school_row(base_classroom_gaps, base.school_id)) {
            current_classrooms = c->usable_class_rooms;
        }
        if (const TeacherGapRow* t = find_school_row(base_teacher_gaps, base.school_id)) {
            current_teachers = t->total_teachers;
        }

        for (int k = 1; k <= ForecastModel::HORIZON; ++k) {
            ForecastRow& row = rows[i * ForecastModel::HORIZON + static_cast<size_t>(k - 1)];
            row.school_id = base.school_id;
            row.base_year = base_year;
            row.forecast_year = forecast_years[static_cast<size_t>(k - 1)];
            row.years_ahead = k;
            row.school_category = category;
            row.base_enrolment = base.total_enrolment;
            row.growth_rate = growth[i];
            row.projected_enrolment = project_enrolment(base.total_enrolment, growth[i], k);
            row.current_classrooms = current_classrooms;
            row.current_teachers = current_teachers;
            row.projected_required_classrooms = CapacityNorms::required_capacity(row.projected_enrolment, classroom_norm);
            row.projected_classroom_gap = CapacityNorms::shortfall(row.projected_required_classrooms, current_classrooms);
            row.projected_required_teachers = CapacityNorms::required_capacity(row.projected_enrolment, teacher_norm);
            row.projected_teacher_gap = CapacityNorms::shortfall(row.projected_required_teachers, current_teachers);
            row.estimator = estimator_name;
        }
    }

    return rows;
}

} // namespace schoolgov
