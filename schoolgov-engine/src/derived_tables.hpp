#ifndef SCHOOLGOV_DERIVED_TABLES_HPP
#define SCHOOLGOV_DERIVED_TABLES_HPP

#include "norms.hpp"
#include "school.hpp"
#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace schoolgov {

// ============================================================================
// Row types, one per derived table
// ============================================================================

struct ClassroomGapRow {
    SchoolId school_id = 0;
    std::string academic_year;
    int school_category = 0;
    int64_t total_enrolment = 0;
    int classroom_norm = 0;
    int64_t total_class_rooms = 0;
    int64_t usable_class_rooms = 0;
    int64_t required_classrooms = 0;
    int64_t classroom_gap = 0;
    bool has_infrastructure_record = false;
};

struct TeacherGapRow {
    SchoolId school_id = 0;
    std::string academic_year;
    int school_category = 0;
    int64_t total_enrolment = 0;
    int pupil_teacher_norm = 0;
    int64_t total_teachers = 0;
    int64_t required_teachers = 0;
    int64_t teacher_gap = 0;
    bool has_teacher_record = false;
};

struct RiskRow {
    SchoolId school_id = 0;
    std::string academic_year;
    double teacher_deficit_ratio = 0.0;
    double classroom_deficit_ratio = 0.0;
    double enrolment_growth_rate = 0.0;
    double risk_score = 0.0;
    RiskLevel risk_level = RiskLevel::Low;
};

enum class PriorityBucket : uint8_t {
    Top5 = 0,
    Top10 = 1,
    Top20 = 2,
    Standard = 3
};

std::string to_string(PriorityBucket bucket);

struct PriorityRow {
    SchoolId school_id = 0;
    std::string academic_year;
    std::string district;
    double risk_score = 0.0;
    RiskLevel risk_level = RiskLevel::Low;
    int64_t state_rank = 0;
    int64_t district_rank = 0;
    double percent_rank = 0.0;
    PriorityBucket priority_bucket = PriorityBucket::Standard;
    bool persistent_high_risk = false;
};

enum class TrendDirection : uint8_t {
    Baseline = 0,
    Improving = 1,
    Stable = 2,
    Deteriorating = 3
};

std::string to_string(TrendDirection direction);

struct RiskTrendRow {
    SchoolId school_id = 0;
    std::string academic_year;
    double risk_score = 0.0;
    RiskLevel risk_level = RiskLevel::Low;
    std::optional<double> prev_risk_score;
    std::optional<double> risk_delta;
    TrendDirection trend_direction = TrendDirection::Baseline;
    int64_t year_sequence = 0;
    double cumulative_avg_risk = 0.0;
    bool chronic = false;
    bool is_volatile = false;
};

struct DistrictScoreRow {
    std::string district;
    std::string academic_year;
    int64_t total_schools = 0;
    int64_t critical_schools = 0;
    int64_t high_risk_schools = 0;
    double avg_risk_score = 0.0;
    double pct_high_critical = 0.0;
    int64_t total_classroom_deficit = 0;
    int64_t total_teacher_deficit = 0;
    int64_t total_enrolment = 0;
    std::optional<double> avg_classroom_condition;
    char compliance_grade = 'A';
    int64_t district_rank = 0;
    std::optional<double> yoy_risk_improvement;
};

enum class AllocationStatus : uint8_t {
    Funded = 0,
    PartiallyFunded = 1,
    Unfunded = 2
};

std::string to_string(AllocationStatus status);

struct BudgetRow {
    SchoolId school_id = 0;
    std::string academic_year;
    std::string district;
    RiskLevel risk_level = RiskLevel::Low;
    double risk_score = 0.0;
    int64_t classroom_gap = 0;
    int64_t teacher_gap = 0;
    int64_t allocation_priority = 0;
    int64_t classrooms_allocated = 0;
    int64_t teachers_allocated = 0;
    bool classroom_resolved = false;
    bool teacher_resolved = false;
    AllocationStatus allocation_status = AllocationStatus::Unfunded;
};

struct ForecastRow {
    SchoolId school_id = 0;
    std::string base_year;
    std::string forecast_year;
    int years_ahead = 0;
    int school_category = 0;
    int64_t base_enrolment = 0;
    double growth_rate = 0.0;
    int64_t projected_enrolment = 0;
    int64_t current_classrooms = 0;
    int64_t current_teachers = 0;
    int64_t projected_required_classrooms = 0;
    int64_t projected_classroom_gap = 0;
    int64_t projected_required_teachers = 0;
    int64_t projected_teacher_gap = 0;
    std::string estimator;
};

enum class ProposalDecision : uint8_t {
    Accepted = 0,
    Flagged = 1,
    Rejected = 2
};

std::string to_string(ProposalDecision decision);

struct ProposalValidationRow {
    int64_t proposal_id = 0;
    SchoolId school_id = 0;
    std::string academic_year;
    int64_t requested_classrooms = 0;
    int64_t requested_teachers = 0;
    std::optional<int64_t> actual_classroom_gap;
    std::optional<int64_t> actual_teacher_gap;
    std::optional<double> classroom_ratio;
    std::optional<double> teacher_ratio;
    ProposalDecision decision = ProposalDecision::Rejected;
    std::string reason_code;
    double confidence = 0.0;
    std::string submitted_by;
};

// ============================================================================
// Year-partitioned store
// ============================================================================

/**
 * @brief Derived rows grouped by academic year.
 *
 * A stage computes a year's complete row set before calling replace_year, which
 * swaps the partition in one step. Readers never observe a half-written year.
 */
template <typename Row>
class YearPartitionedTable {
public:
    void replace_year(const std::string& year, std::vector<Row> rows) {
        partitions_[year].swap(rows);
    }

    void append(const std::string& year, const std::vector<Row>& rows) {
        auto& partition = partitions_[year];
        partition.insert(partition.end(), rows.begin(), rows.end());
    }

    bool has_year(const std::string& year) const {
        return partitions_.count(year) > 0;
    }

    // Empty when the year was never populated
    const std::vector<Row>& rows(const std::string& year) const {
        static const std::vector<Row> empty;
        auto it = partitions_.find(year);
        return it == partitions_.end() ? empty : it->second;
    }

    std::vector<std::string> years() const {
        std::vector<std::string> result;
        result.reserve(partitions_.size());
        for (const auto& entry : partitions_) {
            result.push_back(entry.first);
        }
        return result;
    }

    // All rows, year ascending
    std::vector<Row> all_rows() const {
        std::vector<Row> result;
        for (const auto& entry : partitions_) {
            result.insert(result.end(), entry.second.begin(), entry.second.end());
        }
        return result;
    }

    size_t size() const {
        size_t total = 0;
        for (const auto& entry : partitions_) {
            total += entry.second.size();
        }
        return total;
    }

    bool empty() const { return partitions_.empty(); }
    void clear() { partitions_.clear(); }

private:
    std::map<std::string, std::vector<Row>> partitions_;
};

// Binary search in rows sorted by school_id; nullptr when absent
template <typename Row>
const Row* find_school_row(const std::vector<Row>& rows, SchoolId school_id) {
    auto it = std::lower_bound(rows.begin(), rows.end(), school_id,
                               [](const Row& row, SchoolId id) { return row.school_id < id; });
    if (it == rows.end() || it->school_id != school_id) {
        return nullptr;
    }
    return &*it;
}

// Every derived table the pipeline maintains
struct DerivedTables {
    YearPartitionedTable<ClassroomGapRow> classroom_gaps;
    YearPartitionedTable<TeacherGapRow> teacher_gaps;
    YearPartitionedTable<RiskRow> risk_scores;
    YearPartitionedTable<PriorityRow> priority_index;
    YearPartitionedTable<RiskTrendRow> risk_trends;
    YearPartitionedTable<DistrictScoreRow> district_scores;
    YearPartitionedTable<BudgetRow> budget_simulation;
    YearPartitionedTable<ForecastRow> enrolment_forecasts;  // partitioned by base year
    YearPartitionedTable<ProposalValidationRow> proposal_validations;
};

} // namespace schoolgov

#endif // SCHOOLGOV_DERIVED_TABLES_HPP
