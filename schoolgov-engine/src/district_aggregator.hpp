#ifndef SCHOOLGOV_DISTRICT_AGGREGATOR_HPP
#define SCHOOLGOV_DISTRICT_AGGREGATOR_HPP

#include "derived_tables.hpp"
#include "school.hpp"
#include <string>
#include <vector>

namespace schoolgov {

// Upper bounds (inclusive) on average risk for each grade; anything above D is F
struct GradeBands {
    static constexpr double A = 0.15;
    static constexpr double B = 0.30;
    static constexpr double C = 0.50;
    static constexpr double D = 0.75;
};

char compliance_grade(double avg_risk_score);

struct DistrictAggregation {
    std::vector<DistrictScoreRow> rows;   // ordered by district
    size_t unassigned_rows = 0;           // risk rows skipped for lack of a school record
};

// First pass: group one year's school rows by district. district_rank and
// yoy_risk_improvement are left unset until finalize_district_rankings runs.
DistrictAggregation aggregate_districts(const FactTables& facts,
                                        const std::vector<RiskRow>& risk,
                                        const std::vector<ClassroomGapRow>& classroom_gaps,
                                        const std::vector<TeacherGapRow>& teacher_gaps,
                                        const std::string& year);

// Second pass over the fully populated table: per-year rank by average risk
// (highest first) and change against the district's previous year.
void finalize_district_rankings(YearPartitionedTable<DistrictScoreRow>& table);

} // namespace schoolgov

#endif // SCHOOLGOV_DISTRICT_AGGREGATOR_HPP
