#include "school.hpp"
#include "academic_year.hpp"
#include "io/csv_reader.hpp"
#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>

namespace schoolgov {

namespace {

std::string location(const std::string& source, size_t line) {
    return source + ":" + std::to_string(line);
}

int required_column(const std::vector<std::string>& header, const std::string& name,
                    const std::string& source) {
    int idx = CsvReader::column_index(header, name);
    if (idx < 0) {
        throw std::runtime_error(source + ": missing required column '" + name + "'");
    }
    return idx;
}

std::string cell(const std::vector<std::string>& row, int idx) {
    if (idx < 0 || static_cast<size_t>(idx) >= row.size()) {
        return {};
    }
    return row[static_cast<size_t>(idx)];
}

// Integer count; an empty cell is an absent value and reads as 0
int64_t parse_count(const std::string& value, const std::string& column,
                    const std::string& source, size_t line) {
    if (value.empty()) {
        return 0;
    }
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != value.size()) {
        // Accept "12.0" style exports from spreadsheets
        try {
            double d = std::stod(value, &consumed);
            if (consumed == value.size() && d == static_cast<double>(static_cast<long long>(d))) {
                parsed = static_cast<long long>(d);
            } else {
                consumed = 0;
            }
        } catch (const std::exception&) {
            consumed = 0;
        }
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(location(source, line) + ": non-numeric value '" + value +
                                    "' in column '" + column + "'");
    }
    if (parsed < 0) {
        throw std::invalid_argument(location(source, line) + ": negative value " + value +
                                    " in column '" + column + "'");
    }
    return static_cast<int64_t>(parsed);
}


std::string parse_year(const std::string& value, const std::string& source, size_t line) {
    if (!is_academic_year(value)) {
        throw std::invalid_argument(location(source, line) + ": invalid academic_year '" + value + "'");
    }
    return value;
}

std::optional<double> parse_optional_score(const std::string& value, const std::string& column,
                                           const std::string& source, size_t line) {
    if (value.empty()) {
        return std::nullopt;
    }
    size_t consumed = 0;
    double parsed = 0.0;
    try {
        parsed = std::stod(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(location(source, line) + ": non-numeric value '" + value +
                                    "' in column '" + column + "'");
    }
    return parsed;
}

std::string duplicate_message(const std::string& what, SchoolId id, const std::string& year) {
    return "Duplicate " + what + " for school " + std::to_string(id) +
           (year.empty() ? std::string() : ", year " + year);
}

template <typename Loader>
void load_file(const std::string& path, Loader&& loader) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    loader(file, path);
}

} // anonymous namespace

SchoolId parse_school_id(const std::string& value, const std::string& source, size_t line) {
    if (value.empty()) {
        throw std::invalid_argument(location(source, line) + ": empty school_id");
    }
    size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed != value.size()) {
        throw std::invalid_argument(location(source, line) + ": invalid school_id '" + value + "'");
    }
    // Ids are stored as integers; a code that would not read back unchanged
    // (leading zeros, sign, padding) is rejected rather than silently merged
    if (parsed < 0 || std::to_string(parsed) != value) {
        throw std::invalid_argument(location(source, line) + ": school_id '" + value +
                                    "' is not a canonical non-negative integer");
    }
    return static_cast<SchoolId>(parsed);
}

// ============================================================================
// FactSourcePaths
// ============================================================================

FactSourcePaths FactSourcePaths::in_directory(const std::string& dir) {
    std::string base = dir;
    if (!base.empty() && base.back() != '/') {
        base += '/';
    }
    FactSourcePaths paths;
    paths.schools = base + "schools.csv";
    paths.yearly_metrics = base + "yearly_metrics.csv";
    paths.infrastructure = base + "infrastructure.csv";
    paths.teacher_metrics = base + "teacher_metrics.csv";
    return paths;
}

// ============================================================================
// FactTables
// ============================================================================

void FactTables::add_school(School school) {
    SchoolId id = school.school_id;
    if (!schools_.emplace(id, std::move(school)).second) {
        throw std::invalid_argument(duplicate_message("school record", id, ""));
    }
}

void FactTables::add_yearly_metric(YearlyMetric metric) {
    Key key{metric.school_id, metric.academic_year};
    if (!yearly_metrics_.emplace(key, std::move(metric)).second) {
        throw std::invalid_argument(duplicate_message("yearly metric", key.first, key.second));
    }
}

void FactTables::add_infrastructure(InfrastructureFact fact) {
    Key key{fact.school_id, fact.academic_year};
    if (!infrastructure_.emplace(key, std::move(fact)).second) {
        throw std::invalid_argument(duplicate_message("infrastructure record", key.first, key.second));
    }
}

void FactTables::add_teacher_metric(TeacherFact fact) {
    Key key{fact.school_id, fact.academic_year};
    if (!teacher_metrics_.emplace(key, std::move(fact)).second) {
        throw std::invalid_argument(duplicate_message("teacher metric", key.first, key.second));
    }
}

const School* FactTables::find_school(SchoolId school_id) const {
    auto it = schools_.find(school_id);
    return it == schools_.end() ? nullptr : &it->second;
}

const YearlyMetric* FactTables::find_yearly_metric(SchoolId school_id, const std::string& year) const {
    auto it = yearly_metrics_.find(Key{school_id, year});
    return it == yearly_metrics_.end() ? nullptr : &it->second;
}

const InfrastructureFact* FactTables::find_infrastructure(SchoolId school_id, const std::string& year) const {
    auto it = infrastructure_.find(Key{school_id, year});
    return it == infrastructure_.end() ? nullptr : &it->second;
}

const TeacherFact* FactTables::find_teacher_metric(SchoolId school_id, const std::string& year) const {
    auto it = teacher_metrics_.find(Key{school_id, year});
    return it == teacher_metrics_.end() ? nullptr : &it->second;
}

std::vector<std::string> FactTables::academic_years() const {
    std::set<std::string> years;
    for (const auto& [key, metric] : yearly_metrics_) {
        years.insert(key.second);
    }
    return std::vector<std::string>(years.begin(), years.end());
}

std::optional<std::string> FactTables::latest_year() const {
    std::optional<std::string> latest;
    for (const auto& [key, metric] : yearly_metrics_) {
        if (!latest || key.second > *latest) {
            latest = key.second;
        }
    }
    return latest;
}

std::vector<const YearlyMetric*> FactTables::metrics_for_year(const std::string& year) const {
    // Map order is (school_id, year), so the result comes out sorted by school id
    std::vector<const YearlyMetric*> result;
    for (const auto& [key, metric] : yearly_metrics_) {
        if (key.second == year) {
            result.push_back(&metric);
        }
    }
    return result;
}

std::vector<const YearlyMetric*> FactTables::enrolment_history(SchoolId school_id) const {
    std::vector<const YearlyMetric*> history;
    for (auto it = yearly_metrics_.lower_bound(Key{school_id, std::string()});
         it != yearly_metrics_.end() && it->first.first == school_id; ++it) {
        history.push_back(&it->second);
    }
    return history;
}

// ============================================================================
// CSV ingestion
// ============================================================================

void FactTables::load_schools_csv(std::istream& is, const std::string& source_name) {
    CsvReader reader(is);
    auto header = reader.read_row();
    if (header.empty()) {
        return;
    }

    const int id_col = required_column(header, "school_id", source_name);
    const int name_col = CsvReader::column_index(header, "school_name");
    const int district_col = required_column(header, "district", source_name);
    const int block_col = CsvReader::column_index(header, "block");
    const int category_col = required_column(header, "school_category", source_name);
    const int management_col = CsvReader::column_index(header, "management_type");

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) {
            continue;
        }
        const size_t line = reader.line_number();

        School s;
        s.school_id = parse_school_id(cell(row, id_col), source_name, line);
        s.school_name = cell(row, name_col);
        s.district = cell(row, district_col);
        s.block = cell(row, block_col);
        s.school_category = static_cast<int>(parse_count(cell(row, category_col), "school_category",
                                                         source_name, line));
        s.management_type = cell(row, management_col);
        add_school(std::move(s));
    }
}

void FactTables::load_yearly_metrics_csv(std::istream& is, const std::string& source_name) {
    CsvReader reader(is);
    auto header = reader.read_row();
    if (header.empty()) {
        return;
    }

    const int id_col = required_column(header, "school_id", source_name);
    const int year_col = required_column(header, "academic_year", source_name);
    const int enrolment_col = required_column(header, "total_enrolment", source_name);

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) {
            continue;
        }
        const size_t line = reader.line_number();

        YearlyMetric m;
        m.school_id = parse_school_id(cell(row, id_col), source_name, line);
        m.academic_year = parse_year(cell(row, year_col), source_name, line);
        m.total_enrolment = parse_count(cell(row, enrolment_col), "total_enrolment", source_name, line);
        add_yearly_metric(std::move(m));
    }
}

void FactTables::load_infrastructure_csv(std::istream& is, const std::string& source_name) {
    CsvReader reader(is);
    auto header = reader.read_row();
    if (header.empty()) {
        return;
    }

    const int id_col = required_column(header, "school_id", source_name);
    const int year_col = required_column(header, "academic_year", source_name);
    const int total_col = required_column(header, "total_class_rooms", source_name);
    const int usable_col = required_column(header, "usable_class_rooms", source_name);
    const int condition_col = CsvReader::column_index(header, "classroom_condition_score");

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) {
            continue;
        }
        const size_t line = reader.line_number();

        InfrastructureFact f;
        f.school_id = parse_school_id(cell(row, id_col), source_name, line);
        f.academic_year = parse_year(cell(row, year_col), source_name, line);
        f.total_class_rooms = parse_count(cell(row, total_col), "total_class_rooms", source_name, line);
        f.usable_class_rooms = parse_count(cell(row, usable_col), "usable_class_rooms", source_name, line);
        f.classroom_condition_score = parse_optional_score(cell(row, condition_col),
                                                           "classroom_condition_score", source_name, line);
        add_infrastructure(std::move(f));
    }
}

void FactTables::load_teacher_metrics_csv(std::istream& is, const std::string& source_name) {
    CsvReader reader(is);
    auto header = reader.read_row();
    if (header.empty()) {
        return;
    }

    const int id_col = required_column(header, "school_id", source_name);
    const int year_col = required_column(header, "academic_year", source_name);
    const int teachers_col = required_column(header, "total_teachers", source_name);

    while (reader.has_more()) {
        auto row = reader.read_row();
        if (row.empty()) {
            continue;
        }
        const size_t line = reader.line_number();

        TeacherFact t;
        t.school_id = parse_school_id(cell(row, id_col), source_name, line);
        t.academic_year = parse_year(cell(row, year_col), source_name, line);
        t.total_teachers = parse_count(cell(row, teachers_col), "total_teachers", source_name, line);
        add_teacher_metric(std::move(t));
    }
}

FactTables FactTables::load(const FactSourcePaths& paths) {
    FactTables facts;
    load_file(paths.schools, [&facts](std::istream& is, const std::string& src) {
        facts.load_schools_csv(is, src);
    });
    load_file(paths.yearly_metrics, [&facts](std::istream& is, const std::string& src) {
        facts.load_yearly_metrics_csv(is, src);
    });
    load_file(paths.infrastructure, [&facts](std::istream& is, const std::string& src) {
        facts.load_infrastructure_csv(is, src);
    });
    load_file(paths.teacher_metrics, [&facts](std::istream& is, const std::string& src) {
        facts.load_teacher_metrics_csv(is, src);
    });
    return facts;
}

FactTables FactTables::load_from_directory(const std::string& dir) {
    return load(FactSourcePaths::in_directory(dir));
}

} // namespace schoolgov
