#include "budget_allocator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>

namespace schoolgov {

// ============================================================================
// BudgetConfig
// ============================================================================

BudgetConfig::BudgetConfig()
    : classroom_budget(500000000),
      cost_per_classroom(500000),
      teacher_posts(10000) {}

int64_t BudgetConfig::classroom_cap() const {
    return classroom_budget / cost_per_classroom;
}

void BudgetConfig::validate() const {
    if (classroom_budget < 0) {
        throw std::invalid_argument("classroom_budget must be non-negative, got " +
                                    std::to_string(classroom_budget));
    }
    if (cost_per_classroom <= 0) {
        throw std::invalid_argument("cost_per_classroom must be positive, got " +
                                    std::to_string(cost_per_classroom));
    }
    if (teacher_posts < 0) {
        throw std::invalid_argument("teacher_posts must be non-negative, got " +
                                    std::to_string(teacher_posts));
    }
}

// ============================================================================
// Priority ordering
// ============================================================================

int risk_tier(RiskLevel level) {
    switch (level) {
        case RiskLevel::Critical: return 1;
        case RiskLevel::High: return 2;
        case RiskLevel::Moderate: return 3;
        case RiskLevel::Low: return 4;
    }
    return 5;
}

std::vector<AllocationCandidate> priority_order(const FactTables& facts,
                                                const std::vector<RiskRow>& risk,
                                                const std::vector<ClassroomGapRow>& classroom_gaps,
                                                const std::vector<TeacherGapRow>& teacher_gaps) {
    std::vector<AllocationCandidate> candidates;
    candidates.reserve(risk.size());

    for (const RiskRow& r : risk) {
        const TeacherGapRow* t = find_school_row(teacher_gaps, r.school_id);
        if (!t) {
            continue;
        }
        AllocationCandidate c;
        c.school_id = r.school_id;
        c.risk_level = r.risk_level;
        c.risk_score = r.risk_score;
        c.teacher_gap = t->teacher_gap;
        if (const ClassroomGapRow* g = find_school_row(classroom_gaps, r.school_id)) {
            c.classroom_gap = g->classroom_gap;
        }
        if (const School* school = facts.find_school(r.school_id)) {
            c.district = school->district;
        }
        candidates.push_back(std::move(c));
    }

    std::sort(candidates.begin(), candidates.end(),
              [](const AllocationCandidate& a, const AllocationCandidate& b) {
                  int ta = risk_tier(a.risk_level);
                  int tb = risk_tier(b.risk_level);
                  if (ta != tb) return ta < tb;
                  if (a.risk_score != b.risk_score) return a.risk_score > b.risk_score;
                  return a.school_id < b.school_id;
              });

    return candidates;
}

// ============================================================================
// Allocation
// ============================================================================

std::vector<int64_t> allocate_against_cap(const std::vector<int64_t>& demands, int64_t cap) {
    std::vector<int64_t> allocated(demands.size(), 0);
    int64_t requested_before = 0;

    for (size_t i = 0; i < demands.size(); ++i) {
        const int64_t demand = std::max<int64_t>(demands[i], 0);
        const int64_t requested_after = requested_before + demand;

        if (requested_after <= cap) {
            allocated[i] = demand;
        } else if (cap - requested_before > 0) {
            allocated[i] = cap - requested_before;
        }

        requested_before = requested_after;
    }

    return allocated;
}

AllocationStatus allocation_status(bool classroom_resolved, bool teacher_resolved,
                                   int64_t classrooms_allocated, int64_t teachers_allocated) {
    if (classroom_resolved && teacher_resolved) {
        return AllocationStatus::Funded;
    }
    if (classroom_resolved || teacher_resolved || classrooms_allocated > 0 || teachers_allocated > 0) {
        return AllocationStatus::PartiallyFunded;
    }
    return AllocationStatus::Unfunded;
}

std::vector<BudgetRow> allocate_budget(const std::vector<AllocationCandidate>& ordered,
                                       const std::string& year,
                                       int64_t classroom_cap,
                                       int64_t teacher_cap) {
    std::vector<int64_t> classroom_demand;
    std::vector<int64_t> teacher_demand;
    classroom_demand.reserve(ordered.size());
    teacher_demand.reserve(ordered.size());
    for (const auto& c : ordered) {
        classroom_demand.push_back(c.classroom_gap);
        teacher_demand.push_back(c.teacher_gap);
    }

    // The two resources are scanned independently
    const auto classrooms = allocate_against_cap(classroom_demand, classroom_cap);
    const auto teachers = allocate_against_cap(teacher_demand, teacher_cap);

    std::vector<BudgetRow> rows(ordered.size());
    for (size_t i = 0; i < ordered.size(); ++i) {
        const AllocationCandidate& c = ordered[i];
        BudgetRow& row = rows[i];

        row.school_id = c.school_id;
        row.academic_year = year;
        row.district = c.district;
        row.risk_level = c.risk_level;
        row.risk_score = c.risk_score;
        row.classroom_gap = c.classroom_gap;
        row.teacher_gap = c.teacher_gap;
        row.allocation_priority = static_cast<int64_t>(i) + 1;
        row.classrooms_allocated = classrooms[i];
        row.teachers_allocated = teachers[i];
        row.classroom_resolved = row.classrooms_allocated >= row.classroom_gap;
        row.teacher_resolved = row.teachers_allocated >= row.teacher_gap;
        row.allocation_status = allocation_status(row.classroom_resolved, row.teacher_resolved,
                                                  row.classrooms_allocated, row.teachers_allocated);
    }

    return rows;
}

// ============================================================================
// Dry run
// ============================================================================

BudgetSimulationReport::BudgetSimulationReport()
    : total_budget(0.0),
      cost_per_unit(0.0),
      max_teachers(0),
      classroom_cap(0),
      funded(0),
      partially_funded(0),
      unfunded(0),
      total_schools(0),
      classrooms_allocated(0),
      teachers_allocated(0),
      total_cost(0.0),
      budget_utilisation_pct(0.0) {}

BudgetSimulationReport simulate_budget(const FactTables& facts,
                                       const DerivedTables& tables,
                                       const std::string& year,
                                       double total_budget,
                                       double cost_per_unit,
                                       int64_t max_teachers) {
    if (!(total_budget >= 0.0) || !std::isfinite(total_budget)) {
        throw std::invalid_argument("total_budget must be a finite non-negative amount");
    }
    if (!(cost_per_unit > 0.0) || !std::isfinite(cost_per_unit)) {
        throw std::invalid_argument("cost_per_unit must be a finite positive amount");
    }
    if (max_teachers < 0) {
        throw std::invalid_argument("max_teachers must be non-negative");
    }
    if (!tables.risk_scores.has_year(year)) {
        throw std::out_of_range("No risk scores for academic year " + year);
    }

    BudgetSimulationReport report;
    report.academic_year = year;
    report.total_budget = total_budget;
    report.cost_per_unit = cost_per_unit;
    report.max_teachers = max_teachers;
    // Saturate caps too large for int64
    const double cap = std::floor(total_budget / cost_per_unit);
    constexpr int64_t max_cap = std::numeric_limits<int64_t>::max();
    report.classroom_cap = cap >= static_cast<double>(max_cap) ? max_cap : static_cast<int64_t>(cap);

    const auto ordered = priority_order(facts,
                                        tables.risk_scores.rows(year),
                                        tables.classroom_gaps.rows(year),
                                        tables.teacher_gaps.rows(year));
    report.allocations = allocate_budget(ordered, year, report.classroom_cap, max_teachers);

    std::map<std::string, DistrictAllocation> districts;
    for (const BudgetRow& row : report.allocations) {
        switch (row.allocation_status) {
            case AllocationStatus::Funded: ++report.funded; break;
            case AllocationStatus::PartiallyFunded: ++report.partially_funded; break;
            case AllocationStatus::Unfunded: ++report.unfunded; break;
        }
        report.classrooms_allocated += row.classrooms_allocated;
        report.teachers_allocated += row.teachers_allocated;

        if (row.classrooms_allocated > 0 || row.teachers_allocated > 0) {
            DistrictAllocation& d = districts[row.district];
            d.district = row.district;
            d.classrooms += row.classrooms_allocated;
            d.teachers += row.teachers_allocated;
            d.cost += static_cast<double>(row.classrooms_allocated) * cost_per_unit;
            ++d.schools_served;
        }
    }

    report.total_schools = static_cast<int64_t>(report.allocations.size());
    report.total_cost = static_cast<double>(report.classrooms_allocated) * cost_per_unit;
    report.budget_utilisation_pct = total_budget > 0.0
        ? round_to(report.total_cost / total_budget * 100.0, 1)
        : 0.0;

    for (auto& entry : districts) {
        report.by_district.push_back(std::move(entry.second));
    }
    std::stable_sort(report.by_district.begin(), report.by_district.end(),
                     [](const DistrictAllocation& a, const DistrictAllocation& b) {
                         return a.classrooms > b.classrooms;
                     });
    if (report.by_district.size() > BudgetSimulationReport::MAX_DISTRICTS) {
        report.by_district.resize(BudgetSimulationReport::MAX_DISTRICTS);
    }

    return report;
}

} // namespace schoolgov
