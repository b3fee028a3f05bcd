#include "gap_resolver.hpp"
#include "norms.hpp"
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace schoolgov {

int category_of(const FactTables& facts, SchoolId school_id) {
    const School* school = facts.find_school(school_id);
    return school ? school->school_category : 0;
}

std::vector<ClassroomGapRow> resolve_classroom_gaps(const FactTables& facts, const std::string& year) {
    const auto metrics = facts.metrics_for_year(year);
    std::vector<ClassroomGapRow> rows(metrics.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (size_t i = 0; i < metrics.size(); ++i) {
        const YearlyMetric& metric = *metrics[i];
        ClassroomGapRow& row = rows[i];

        row.school_id = metric.school_id;
        row.academic_year = year;
        row.school_category = category_of(facts, metric.school_id);
        row.total_enrolment = metric.total_enrolment;
        row.classroom_norm = CapacityNorms::classroom_norm(row.school_category);

        if (const InfrastructureFact* infra = facts.find_infrastructure(metric.school_id, year)) {
            row.total_class_rooms = infra->total_class_rooms;
            row.usable_class_rooms = infra->usable_class_rooms;
            row.has_infrastructure_record = true;
        }

        row.required_classrooms = CapacityNorms::required_capacity(row.total_enrolment, row.classroom_norm);
        row.classroom_gap = CapacityNorms::shortfall(row.required_classrooms, row.usable_class_rooms);
    }

    return rows;
}

std::vector<TeacherGapRow> resolve_teacher_gaps(const FactTables& facts, const std::string& year) {
    const auto metrics = facts.metrics_for_year(year);
    std::vector<TeacherGapRow> rows(metrics.size());

#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (size_t i = 0; i < metrics.size(); ++i) {
        const YearlyMetric& metric = *metrics[i];
        TeacherGapRow& row = rows[i];

        row.school_id = metric.school_id;
        row.academic_year = year;
        row.school_category = category_of(facts, metric.school_id);
        row.total_enrolment = metric.total_enrolment;
        row.pupil_teacher_norm = CapacityNorms::pupil_teacher_norm(row.school_category);

        if (const TeacherFact* teachers = facts.find_teacher_metric(metric.school_id, year)) {
            row.total_teachers = teachers->total_teachers;
            row.has_teacher_record = true;
        }

        row.required_teachers = CapacityNorms::required_capacity(row.total_enrolment, row.pupil_teacher_norm);
        row.teacher_gap = CapacityNorms::shortfall(row.required_teachers, row.total_teachers);
    }

    return rows;
}

} // namespace schoolgov
