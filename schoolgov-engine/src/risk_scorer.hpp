#ifndef SCHOOLGOV_RISK_SCORER_HPP
#define SCHOOLGOV_RISK_SCORER_HPP

#include "derived_tables.hpp"
#include "school.hpp"
#include <string>
#include <vector>

namespace schoolgov {

// (enrolment_t - enrolment_prev) / enrolment_prev against the school's chronological
// predecessor in its own history. 0 for the first observed year or a zero predecessor.
double enrolment_growth_rate(const FactTables& facts, SchoolId school_id, const std::string& year);

// round(0.45*tdr + 0.35*cdr + 0.20*min(|growth|, 0.5), 4)
double composite_risk_score(double teacher_deficit_ratio,
                            double classroom_deficit_ratio,
                            double enrolment_growth_rate);

// Score every school-year resolved by both gap resolvers for the year.
// Inputs must be the same year's gap rows, ordered by school id.
std::vector<RiskRow> score_risk(const FactTables& facts,
                                const std::vector<ClassroomGapRow>& classroom_gaps,
                                const std::vector<TeacherGapRow>& teacher_gaps,
                                const std::string& year);

} // namespace schoolgov

#endif // SCHOOLGOV_RISK_SCORER_HPP
