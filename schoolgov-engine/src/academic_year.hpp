#ifndef SCHOOLGOV_ACADEMIC_YEAR_HPP
#define SCHOOLGOV_ACADEMIC_YEAR_HPP

#include <string>
#include <vector>

namespace schoolgov {

// Academic year labels have the form "YYYY-YY" and sort chronologically as strings.

bool is_academic_year(const std::string& label);

// "2023-24" shifted by 2 -> "2025-26". Throws std::invalid_argument on a malformed label.
std::string shift_academic_year(const std::string& label, int years);

// Parse a comma-separated list, e.g. "2019-20,2020-21". Result is sorted and de-duplicated.
std::vector<std::string> parse_academic_year_list(const std::string& csv);

} // namespace schoolgov

#endif // SCHOOLGOV_ACADEMIC_YEAR_HPP
