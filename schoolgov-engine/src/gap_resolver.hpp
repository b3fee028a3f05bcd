#ifndef SCHOOLGOV_GAP_RESOLVER_HPP
#define SCHOOLGOV_GAP_RESOLVER_HPP

#include "derived_tables.hpp"
#include "school.hpp"
#include <string>
#include <vector>

namespace schoolgov {

// Required classrooms and classroom shortfall for every YearlyMetric row of the year.
// A school-year with no infrastructure record has zero usable classrooms.
// Rows are ordered by school id.
std::vector<ClassroomGapRow> resolve_classroom_gaps(const FactTables& facts, const std::string& year);

// Required teachers and teacher shortfall, same row set as resolve_classroom_gaps.
// A school-year with no teacher record has zero teachers.
std::vector<TeacherGapRow> resolve_teacher_gaps(const FactTables& facts, const std::string& year);

// Category of a school, 0 when the school has no reference record
int category_of(const FactTables& facts, SchoolId school_id);

} // namespace schoolgov

#endif // SCHOOLGOV_GAP_RESOLVER_HPP
