#ifndef SCHOOLGOV_PRIORITISATION_HPP
#define SCHOOLGOV_PRIORITISATION_HPP

#include "derived_tables.hpp"
#include "school.hpp"
#include <string>
#include <vector>

namespace schoolgov {

// Percentile bucket bounds (inclusive), checked in this order
struct PriorityBuckets {
    static constexpr double TOP_5 = 0.05;
    static constexpr double TOP_10 = 0.10;
    static constexpr double TOP_20 = 0.20;
};

// Standard competition rank, highest score first: ties share a rank and the
// next distinct score skips ahead (1, 1, 3).
std::vector<int64_t> rank_descending(const std::vector<double>& scores);

// (rank - 1) / (n - 1); 0 for a single-row set
double percent_rank(int64_t rank, size_t row_count);

PriorityBucket bucket_for_percent_rank(double pct_rank);

// The school's risk rows in chronological order, up to and including year
std::vector<const RiskRow*> risk_history(const YearPartitionedTable<RiskRow>& risk,
                                         SchoolId school_id,
                                         const std::string& year);

// True when the last three rows of a chronological history are all HIGH or CRITICAL
bool sustained_high_risk(const std::vector<const RiskRow*>& history);

// Rank the year's risk rows state-wide and per district.
// Rows come back ordered by school id; a school with no reference record
// ranks under an empty district.
std::vector<PriorityRow> rank_priorities(const FactTables& facts,
                                         const YearPartitionedTable<RiskRow>& risk,
                                         const std::string& year);

} // namespace schoolgov

#endif // SCHOOLGOV_PRIORITISATION_HPP
