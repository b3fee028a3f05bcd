#ifndef SCHOOLGOV_BUDGET_ALLOCATOR_HPP
#define SCHOOLGOV_BUDGET_ALLOCATOR_HPP

#include "derived_tables.hpp"
#include "norms.hpp"
#include "school.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace schoolgov {

// Parameters of a committed allocation run
struct BudgetConfig {
    int64_t classroom_budget;     // currency units
    int64_t cost_per_classroom;   // currency units per classroom
    int64_t teacher_posts;        // teacher-post cap

    // Number of classrooms the budget funds (integer division)
    int64_t classroom_cap() const;

    // Throws std::invalid_argument on a negative budget or cap, or a non-positive cost
    void validate() const;

    BudgetConfig();
};

// One shortfall row waiting for allocation
struct AllocationCandidate {
    SchoolId school_id = 0;
    std::string district;
    RiskLevel risk_level = RiskLevel::Low;
    double risk_score = 0.0;
    int64_t classroom_gap = 0;
    int64_t teacher_gap = 0;
};

// 1 = CRITICAL ... 4 = LOW
int risk_tier(RiskLevel level);

// Scored school-years of one year in allocation order: risk tier, then risk
// score descending, then school id. Position i carries allocation_priority i+1.
std::vector<AllocationCandidate> priority_order(const FactTables& facts,
                                                const std::vector<RiskRow>& risk,
                                                const std::vector<ClassroomGapRow>& classroom_gaps,
                                                const std::vector<TeacherGapRow>& teacher_gaps);

// Greedy prefix scan: each demand is granted in full while the running total of
// demands stays within cap, the straddling demand gets the remaining headroom,
// and everything after it gets 0.
std::vector<int64_t> allocate_against_cap(const std::vector<int64_t>& demands, int64_t cap);

AllocationStatus allocation_status(bool classroom_resolved, bool teacher_resolved,
                                   int64_t classrooms_allocated, int64_t teachers_allocated);

// Allocate both resources independently along the given order
std::vector<BudgetRow> allocate_budget(const std::vector<AllocationCandidate>& ordered,
                                       const std::string& year,
                                       int64_t classroom_cap,
                                       int64_t teacher_cap);

struct DistrictAllocation {
    std::string district;
    int64_t classrooms = 0;
    int64_t teachers = 0;
    double cost = 0.0;
    int64_t schools_served = 0;
};

// Result of a dry run; the committed budget table is left as it is
struct BudgetSimulationReport {
    std::string academic_year;
    double total_budget;
    double cost_per_unit;
    int64_t max_teachers;
    int64_t classroom_cap;

    int64_t funded;
    int64_t partially_funded;
    int64_t unfunded;
    int64_t total_schools;
    int64_t classrooms_allocated;
    int64_t teachers_allocated;
    double total_cost;
    double budget_utilisation_pct;

    std::vector<DistrictAllocation> by_district;  // classrooms descending, at most MAX_DISTRICTS
    std::vector<BudgetRow> allocations;

    static constexpr size_t MAX_DISTRICTS = 15;

    BudgetSimulationReport();
};

// Dry-run allocation against an arbitrary budget. Needs the year's risk and gap rows.
BudgetSimulationReport simulate_budget(const FactTables& facts,
                                       const DerivedTables& tables,
                                       const std::string& year,
                                       double total_budget,
                                       double cost_per_unit,
                                       int64_t max_teachers);

} // namespace schoolgov

#endif // SCHOOLGOV_BUDGET_ALLOCATOR_HPP
