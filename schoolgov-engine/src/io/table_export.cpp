#include "table_export.hpp"
#include <functional>

namespace schoolgov {
namespace io {

namespace {

template <typename Row>
TableData make_table(const std::string& name,
                     std::vector<TableColumn> columns,
                     const std::vector<Row>& rows,
                     const std::function<std::vector<CellValue>(const Row&)>& to_cells) {
    TableData table;
    table.name = name;
    table.columns = std::move(columns);
    table.rows.reserve(rows.size());
    for (const Row& row : rows) {
        table.rows.push_back(to_cells(row));
    }
    return table;
}

template <typename T>
CellValue nullable(const std::optional<T>& value) {
    if (!value) {
        return std::monostate{};
    }
    return *value;
}

CellValue text(const std::string& s) {
    return s;
}

constexpr ColumnType INT = ColumnType::Int64;
constexpr ColumnType REAL = ColumnType::Float64;
constexpr ColumnType FLAG = ColumnType::Bool;
constexpr ColumnType TEXT = ColumnType::String;

} // anonymous namespace

TableData to_table(const std::vector<ClassroomGapRow>& rows) {
    return make_table<ClassroomGapRow>("classroom_gaps", {
        {"school_id", INT}, {"academic_year", TEXT}, {"school_category", INT}, {"total_enrolment", INT},
        {"classroom_norm", INT}, {"total_class_rooms", INT}, {"usable_class_rooms", INT},
        {"required_classrooms", INT}, {"classroom_gap", INT}, {"has_infrastructure_record", FLAG}
    }, rows, [](const ClassroomGapRow& r) {
        return std::vector<CellValue>{
            r.school_id, text(r.academic_year), int64_t{r.school_category}, r.total_enrolment,
            int64_t{r.classroom_norm}, r.total_class_rooms, r.usable_class_rooms,
            r.required_classrooms, r.classroom_gap, r.has_infrastructure_record
        };
    });
}

TableData to_table(const std::vector<TeacherGapRow>& rows) {
    return make_table<TeacherGapRow>("teacher_gaps", {
        {"school_id", INT}, {"academic_year", TEXT}, {"school_category", INT}, {"total_enrolment", INT},
        {"pupil_teacher_norm", INT}, {"total_teachers", INT}, {"required_teachers", INT},
        {"teacher_gap", INT}, {"has_teacher_record", FLAG}
    }, rows, [](const TeacherGapRow& r) {
        return std::vector<CellValue>{
            r.school_id, text(r.academic_year), int64_t{r.school_category}, r.total_enrolment,
            int64_t{r.pupil_teacher_norm}, r.total_teachers, r.required_teachers,
            r.teacher_gap, r.has_teacher_record
        };
    });
}

TableData to_table(const std::vector<RiskRow>& rows) {
    return make_table<RiskRow>("risk_scores", {
        {"school_id", INT}, {"academic_year", TEXT}, {"teacher_deficit_ratio", REAL},
        {"classroom_deficit_ratio", REAL}, {"enrolment_growth_rate", REAL}, {"risk_score", REAL},
        {"risk_level", TEXT}
    }, rows, [](const RiskRow& r) {
        return std::vector<CellValue>{
            r.school_id, text(r.academic_year), r.teacher_deficit_ratio,
            r.classroom_deficit_ratio, r.enrolment_growth_rate, r.risk_score,
            to_string(r.risk_level)
        };
    });
}

TableData to_table(const std::vector<PriorityRow>& rows) {
    return make_table<PriorityRow>("priority_index", {
        {"school_id", INT}, {"academic_year", TEXT}, {"district", TEXT}, {"risk_score", REAL},
        {"risk_level", TEXT}, {"state_rank", INT}, {"district_rank", INT}, {"percent_rank", REAL},
        {"priority_bucket", TEXT}, {"persistent_high_risk", FLAG}
    }, rows, [](const PriorityRow& r) {
        return std::vector<CellValue>{
            r.school_id, text(r.academic_year), text(r.district), r.risk_score,
            to_string(r.risk_level), r.state_rank, r.district_rank, r.percent_rank,
            to_string(r.priority_bucket), r.persistent_high_risk
        };
    });
}

TableData to_table(const std::vector<RiskTrendRow>& rows) {
    return make_table<RiskTrendRow>("risk_trends", {
        {"school_id", INT}, {"academic_year", TEXT}, {"risk_score", REAL}, {"risk_level", TEXT},
        {"prev_risk_score", REAL}, {"risk_delta", REAL}, {"trend_direction", TEXT},
        {"year_sequence", INT}, {"cumulative_avg_risk", REAL}, {"is_chronic", FLAG}, {"is_volatile", FLAG}
    }, rows, [](const RiskTrendRow& r) {
        return std::vector<CellValue>{
            r.school_id, text(r.academic_year), r.risk_score, to_string(r.risk_level),
            nullable(r.prev_risk_score), nullable(r.risk_delta), to_string(r.trend_direction),
            r.year_sequence, r.cumulative_avg_risk, r.chronic, r.is_volatile
        };
    });
}

TableData to_table(const std::vector<DistrictScoreRow>& rows) {
    return make_table<DistrictScoreRow>("district_compliance", {
        {"district", TEXT}, {"academic_year", TEXT}, {"total_schools", INT}, {"critical_schools", INT},
        {"high_risk_schools", INT}, {"avg_risk_score", REAL}, {"pct_high_critical", REAL},
        {"total_classroom_deficit", INT}, {"total_teacher_deficit", INT}, {"total_enrolment", INT},
        {"avg_classroom_condition", REAL}, {"compliance_grade", TEXT}, {"district_rank", INT},
        {"yoy_risk_improvement", REAL}
    }, rows, [](const DistrictScoreRow& r) {
        return std::vector<CellValue>{
            text(r.district), text(r.academic_year), r.total_schools, r.critical_schools,
            r.high_risk_schools, r.avg_risk_score, r.pct_high_critical,
            r.total_classroom_deficit, r.total_teacher_deficit, r.total_enrolment,
            nullable(r.avg_classroom_condition), std::string(1, r.compliance_grade), r.district_rank,
            nullable(r.yoy_risk_improvement)
        };
    });
}

TableData to_table(const std::vector<BudgetRow>& rows) {
    return make_table<BudgetRow>("budget_simulation", {
        {"school_id", INT}, {"academic_year", TEXT}, {"district", TEXT}, {"risk_level", TEXT},
        {"risk_score", REAL}, {"classroom_gap", INT}, {"teacher_gap", INT}, {"allocation_priority", INT},
        {"classrooms_allocated", INT}, {"teachers_allocated", INT}, {"classroom_resolved", FLAG},
        {"teacher_resolved", FLAG}, {"allocation_status", TEXT}
    }, rows, [](const BudgetRow& r) {
        return std::vector<CellValue>{
            r.school_id, text(r.academic_year), text(r.district), to_string(r.risk_level),
            r.risk_score, r.classroom_gap, r.teacher_gap, r.allocation_priority,
            r.classrooms_allocated, r.teachers_allocated, r.classroom_resolved,
            r.teacher_resolved, to_string(r.allocation_status)
        };
    });
}

TableData to_table(const std::vector<ForecastRow>& rows) {
    return make_table<ForecastRow>("enrolment_forecasts", {
        {"school_id", INT}, {"base_year", TEXT}, {"forecast_year", TEXT}, {"years_ahead", INT},
        {"school_category", INT}, {"base_enrolment", INT}, {"growth_rate", REAL},
        {"projected_enrolment", INT}, {"current_classrooms", INT}, {"current_teachers", INT},
        {"projected_required_classrooms", INT}, {"projected_classroom_gap", INT},
        {"projected_required_teachers", INT}, {"projected_teacher_gap", INT}, {"estimator", TEXT}
    }, rows, [](const ForecastRow& r) {
        return std::vector<CellValue>{
            r.school_id, text(r.base_year), text(r.forecast_year), int64_t{r.years_ahead},
            int64_t{r.school_category}, r.base_enrolment, r.growth_rate,
            r.projected_enrolment, r.current_classrooms, r.current_teachers,
            r.projected_required_classrooms, r.projected_classroom_gap,
            r.projected_required_teachers, r.projected_teacher_gap, text(r.estimator)
        };
    });
}

TableData to_table(const std::vector<ProposalValidationRow>& rows) {
    return make_table<ProposalValidationRow>("proposal_validations", {
        {"proposal_id", INT}, {"school_id", INT}, {"academic_year", TEXT},
        {"requested_classrooms", INT}, {"requested_teachers", INT},
        {"actual_classroom_gap", INT}, {"actual_teacher_gap", INT},
        {"classroom_ratio", REAL}, {"teacher_ratio", REAL}, {"decision", TEXT},
        {"reason_code", TEXT}, {"confidence", REAL}, {"submitted_by", TEXT}
    }, rows, [](const ProposalValidationRow& r) {
        return std::vector<CellValue>{
            r.proposal_id, r.school_id, text(r.academic_year),
            r.requested_classrooms, r.requested_teachers,
            nullable(r.actual_classroom_gap), nullable(r.actual_teacher_gap),
            nullable(r.classroom_ratio), nullable(r.teacher_ratio), to_string(r.decision),
            text(r.reason_code), r.confidence, text(r.submitted_by)
        };
    });
}

std::vector<TableData> export_tables(const DerivedTables& tables) {
    std::vector<TableData> result;

    auto add = [&result](const auto& table) {
        if (!table.empty()) {
            result.push_back(to_table(table.all_rows()));
        }
    };

    add(tables.classroom_gaps);
    add(tables.teacher_gaps);
    add(tables.risk_scores);
    add(tables.priority_index);
    add(tables.risk_trends);
    add(tables.district_scores);
    add(tables.budget_simulation);
    add(tables.enrolment_forecasts);
    add(tables.proposal_validations);

    return result;
}

} // namespace io
} // namespace schoolgov
