#include "district_aggregator.hpp"
#include "norms.hpp"
#include "prioritisation.hpp"
#include <map>
#include <set>

namespace schoolgov {

char compliance_grade(double avg_risk_score) {
    if (avg_risk_score <= GradeBands::A) return 'A';
    if (avg_risk_score <= GradeBands::B) return 'B';
    if (avg_risk_score <= GradeBands::C) return 'C';
    if (avg_risk_score <= GradeBands::D) return 'D';
    return 'F';
}

namespace {

struct DistrictAccumulator {
    std::set<SchoolId> schools;
    int64_t scored = 0;
    int64_t critical = 0;
    int64_t high = 0;
    double risk_sum = 0.0;
    int64_t classroom_deficit = 0;
    int64_t teacher_deficit = 0;
    int64_t enrolment = 0;
    double condition_sum = 0.0;
    int64_t condition_count = 0;
};

} // anonymous namespace

DistrictAggregation aggregate_districts(const FactTables& facts,
                                        const std::vector<RiskRow>& risk,
                                        const std::vector<ClassroomGapRow>& classroom_gaps,
                                        const std::vector<TeacherGapRow>& teacher_gaps,
                                        const std::string& year) {
    DistrictAggregation result;
    std::map<std::string, DistrictAccumulator> districts;

    for (const RiskRow& r : risk) {
        const School* school = facts.find_school(r.school_id);
        if (!school || school->district.empty()) {
            ++result.unassigned_rows;
            continue;
        }

        DistrictAccumulator& acc = districts[school->district];
        acc.schools.insert(r.school_id);
        ++acc.scored;
        acc.risk_sum += r.risk_score;
        if (r.risk_level == RiskLevel::Critical) ++acc.critical;
        if (r.risk_level == RiskLevel::High) ++acc.high;

        if (const ClassroomGapRow* c = find_school_row(classroom_gaps, r.school_id)) {
            acc.classroom_deficit += c->classroom_gap;
            acc.enrolment += c->total_enrolment;
        }
        if (const TeacherGapRow* t = find_school_row(teacher_gaps, r.school_id)) {
            acc.teacher_deficit += t->teacher_gap;
        }
        if (const InfrastructureFact* infra = facts.find_infrastructure(r.school_id, year)) {
            if (infra->classroom_condition_score) {
                acc.condition_sum += *infra->classroom_condition_score;
                ++acc.condition_count;
            }
        }
    }

    result.rows.reserve(districts.size());
    for (const auto& [district, acc] : districts) {
        DistrictScoreRow row;
        row.district = district;
        row.academic_year = year;
        row.total_schools = static_cast<int64_t>(acc.schools.size());
        row.critical_schools = acc.critical;
        row.high_risk_schools = acc.high;
        // Graded on the unrounded mean; only the stored column is rounded
        const double mean_risk = acc.risk_sum / static_cast<double>(acc.scored);
        row.avg_risk_score = round_to(mean_risk, 4);
        row.pct_high_critical = round_to(100.0 * static_cast<double>(acc.critical + acc.high) /
                                         static_cast<double>(acc.scored), 2);
        row.total_classroom_deficit = acc.classroom_deficit;
        row.total_teacher_deficit = acc.teacher_deficit;
        row.total_enrolment = acc.enrolment;
        if (acc.condition_count > 0) {
            row.avg_classroom_condition = round_to(acc.condition_sum / static_cast<double>(acc.condition_count), 4);
        }
        row.compliance_grade = compliance_grade(mean_risk);
        result.rows.push_back(std::move(row));
    }

    return result;
}

void finalize_district_rankings(YearPartitionedTable<DistrictScoreRow>& table) {
    std::map<std::string, std::vector<DistrictScoreRow>> updated;
    std::map<std::string, double> previous_avg;  // district -> avg of its latest earlier year

    for (const auto& year : table.years()) {
        std::vector<DistrictScoreRow> rows = table.rows(year);

        std::vector<double> averages;
        averages.reserve(rows.size());
        for (const auto& row : rows) {
            averages.push_back(row.avg_risk_score);
        }
        const auto ranks = rank_descending(averages);

        for (size_t i = 0; i < rows.size(); ++i) {
            DistrictScoreRow& row = rows[i];
            row.district_rank = ranks[i];

            auto prev = previous_avg.find(row.district);
            if (prev != previous_avg.end()) {
                row.yoy_risk_improvement = round_to(row.avg_risk_score - prev->second, 4);
            } else {
                row.yoy_risk_improvement.reset();
            }
        }
        for (const auto& row : rows) {
            previous_avg[row.district] = row.avg_risk_score;
        }

        updated[year] = std::move(rows);
    }

    for (auto& [year, rows] : updated) {
        table.replace_year(year, std::move(rows));
    }
}

} // namespace schoolgov
