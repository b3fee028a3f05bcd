#include "risk_scorer.hpp"
#include "norms.hpp"
#include <algorithm>
#include <cmath>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace schoolgov {

double enrolment_growth_rate(const FactTables& facts, SchoolId school_id, const std::string& year) {
    const auto history = facts.enrolment_history(school_id);

    const YearlyMetric* previous = nullptr;
    const YearlyMetric* current = nullptr;
    for (const YearlyMetric* metric : history) {
        if (metric->academic_year == year) {
            current = metric;
            break;
        }
        previous = metric;
    }

    if (!current || !previous || previous->total_enrolment == 0) {
        return 0.0;
    }

    return static_cast<double>(current->total_enrolment - previous->total_enrolment) /
           static_cast<double>(previous->total_enrolment);
}

double composite_risk_score(double teacher_deficit_ratio,
                            double classroom_deficit_ratio,
                            double enrolment_growth_rate) {
    const double growth_scaled = std::min(std::fabs(enrolment_growth_rate), RiskModel::GROWTH_CAP);
    const double raw = RiskModel::TEACHER_WEIGHT * teacher_deficit_ratio
                     + RiskModel::CLASSROOM_WEIGHT * classroom_deficit_ratio
                     + RiskModel::GROWTH_WEIGHT * growth_scaled;
    return round_to(raw, 4);
}

std::vector<RiskRow> score_risk(const FactTables& facts,
                                const std::vector<ClassroomGapRow>& classroom_gaps,
                                const std::vector<TeacherGapRow>& teacher_gaps,
                                const std::string& year) {
    std::vector<RiskRow> rows(classroom_gaps.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (size_t i = 0; i < classroom_gaps.size(); ++i) {
        const ClassroomGapRow& cgap = classroom_gaps[i];
        RiskRow& row = rows[i];

        row.school_id = cgap.school_id;
        row.academic_year = year;
        row.classroom_deficit_ratio = capped_ratio(cgap.classroom_gap, cgap.required_classrooms);

        // Unknown teacher requirement scores as zero deficit
        const TeacherGapRow* tgap = find_school_row(teacher_gaps, cgap.school_id);
        row.teacher_deficit_ratio = tgap ? capped_ratio(tgap->teacher_gap, tgap->required_teachers) : 0.0;

        row.enrolment_growth_rate = enrolment_growth_rate(facts, cgap.school_id, year);
        row.risk_score = composite_risk_score(row.teacher_deficit_ratio,
                                              row.classroom_deficit_ratio,
                                              row.enrolment_growth_rate);
        row.risk_level = RiskModel::classify(row.risk_score);
    }

    return rows;
}

} // namespace schoolgov
