#ifndef SCHOOLGOV_SCHOOL_HPP
#define SCHOOLGOV_SCHOOL_HPP

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace schoolgov {

using SchoolId = int64_t;

// Identity record; immutable reference data
struct School {
    SchoolId school_id = 0;
    std::string school_name;
    std::string district;
    std::string block;
    int school_category = 0;  // 1-11, grade span; 0 when unknown
    std::string management_type;
};

struct YearlyMetric {
    SchoolId school_id = 0;
    std::string academic_year;
    int64_t total_enrolment = 0;
};

struct InfrastructureFact {
    SchoolId school_id = 0;
    std::string academic_year;
    int64_t total_class_rooms = 0;
    int64_t usable_class_rooms = 0;
    std::optional<double> classroom_condition_score;
};

struct TeacherFact {
    SchoolId school_id = 0;
    std::string academic_year;
    int64_t total_teachers = 0;
};

// File locations of the four fact tables
struct FactSourcePaths {
    std::string schools;
    std::string yearly_metrics;
    std::string infrastructure;
    std::string teacher_metrics;

    // schools.csv, yearly_metrics.csv, infrastructure.csv, teacher_metrics.csv under dir
    static FactSourcePaths in_directory(const std::string& dir);
};

// Throws std::invalid_argument naming source:line unless value is a canonical
// non-negative integer
SchoolId parse_school_id(const std::string& value, const std::string& source, size_t line);

/**
 * Committed facts supplied by ingestion, keyed by school and (school, academic year).
 *
 * Read-only once loaded: every pipeline stage computes from these tables and
 * never writes back. Duplicate keys are rejected on insert.
 */
class FactTables {
public:
    using Key = std::pair<SchoolId, std::string>;

    void add_school(School school);
    void add_yearly_metric(YearlyMetric metric);
    void add_infrastructure(InfrastructureFact fact);
    void add_teacher_metric(TeacherFact fact);

    // nullptr when absent
    const School* find_school(SchoolId school_id) const;
    const YearlyMetric* find_yearly_metric(SchoolId school_id, const std::string& year) const;
    const InfrastructureFact* find_infrastructure(SchoolId school_id, const std::string& year) const;
    const TeacherFact* find_teacher_metric(SchoolId school_id, const std::string& year) const;

    // Distinct academic years present in YearlyMetric, ascending
    std::vector<std::string> academic_years() const;
    std::optional<std::string> latest_year() const;

    // YearlyMetric rows of one year, ordered by school id
    std::vector<const YearlyMetric*> metrics_for_year(const std::string& year) const;

    // The school's YearlyMetric rows in chronological order
    std::vector<const YearlyMetric*> enrolment_history(SchoolId school_id) const;

    size_t school_count() const { return schools_.size(); }
    size_t yearly_metric_count() const { return yearly_metrics_.size(); }
    size_t infrastructure_count() const { return infrastructure_.size(); }
    size_t teacher_metric_count() const { return teacher_metrics_.size(); }
    bool empty() const { return yearly_metrics_.empty(); }

    // CSV ingestion adapters. source_name is used in error messages.
    void load_schools_csv(std::istream& is, const std::string& source_name = "schools.csv");
    void load_yearly_metrics_csv(std::istream& is, const std::string& source_name = "yearly_metrics.csv");
    void load_infrastructure_csv(std::istream& is, const std::string& source_name = "infrastructure.csv");
    void load_teacher_metrics_csv(std::istream& is, const std::string& source_name = "teacher_metrics.csv");

    static FactTables load(const FactSourcePaths& paths);
    static FactTables load_from_directory(const std::string& dir);

private:
    std::map<SchoolId, School> schools_;
    std::map<Key, YearlyMetric> yearly_metrics_;
    std::map<Key, InfrastructureFact> infrastructure_;
    std::map<Key, TeacherFact> teacher_metrics_;
};

} // namespace schoolgov

#endif // SCHOOLGOV_SCHOOL_HPP
