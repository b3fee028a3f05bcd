#include "json_writer.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace schoolgov {
namespace io {

std::string escape_json(const std::string& s) {
    std::ostringstream oss;
    for (char c : s) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    oss << buf;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

namespace {

void write_number(std::ostream& os, double value) {
    if (!std::isfinite(value)) {
        os << "null";
        return;
    }
    os << value;
}

void write_cell(std::ostream& os, const CellValue& cell) {
    switch (cell.index()) {
        case 0: os << "null"; break;
        case 1: os << std::get<int64_t>(cell); break;
        case 2: write_number(os, std::get<double>(cell)); break;
        case 3: os << (std::get<bool>(cell) ? "true" : "false"); break;
        case 4: os << "\"" << escape_json(std::get<std::string>(cell)) << "\""; break;
    }
}

} // anonymous namespace

void write_table_json(std::ostream& os, const TableData& table, bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    os << std::fixed << std::setprecision(6);

    os << "[";
    for (size_t r = 0; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        if (row.size() != table.columns.size()) {
            throw std::runtime_error("Table " + table.name + ": row " + std::to_string(r) + " has " +
                                     std::to_string(row.size()) + " cells, expected " +
                                     std::to_string(table.columns.size()));
        }

        os << (r > 0 ? "," : "") << newline << indent << "{";
        for (size_t c = 0; c < row.size(); ++c) {
            os << (c > 0 ? "," : "") << newline << indent << indent
               << "\"" << table.columns[c].name << "\":" << space;
            write_cell(os, row[c]);
        }
        os << newline << indent << "}";
    }
    if (!table.rows.empty()) {
        os << newline;
    }
    os << "]" << newline;
}

void write_table_json(const std::string& filepath, const TableData& table, bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_table_json(file, table, pretty_print);
    if (!file) {
        throw std::runtime_error("Failed to write output file: " + filepath);
    }
}

void write_budget_report_json(std::ostream& os, const BudgetSimulationReport& report,
                              bool pretty_print) {
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";

    os << std::fixed << std::setprecision(2);

    os << "{" << newline;

    // Parameters
    os << indent << "\"academic_year\":" << space << "\"" << escape_json(report.academic_year) << "\"," << newline;
    os << indent << "\"total_budget\":" << space << report.total_budget << "," << newline;
    os << indent << "\"cost_per_unit\":" << space << report.cost_per_unit << "," << newline;
    os << indent << "\"max_teachers\":" << space << report.max_teachers << "," << newline;
    os << indent << "\"classroom_cap\":" << space << report.classroom_cap << "," << newline;

    // Outcome
    os << indent << "\"summary\":" << space << "{" << newline;
    os << indent << indent << "\"funded\":" << space << report.funded << "," << newline;
    os << indent << indent << "\"partially_funded\":" << space << report.partially_funded << "," << newline;
    os << indent << indent << "\"unfunded\":" << space << report.unfunded << "," << newline;
    os << indent << indent << "\"total_schools\":" << space << report.total_schools << "," << newline;
    os << indent << indent << "\"classrooms_allocated\":" << space << report.classrooms_allocated << "," << newline;
    os << indent << indent << "\"teachers_allocated\":" << space << report.teachers_allocated << "," << newline;
    os << indent << indent << "\"total_cost\":" << space << report.total_cost << "," << newline;
    os << indent << indent << "\"budget_utilisation_pct\":" << space << std::setprecision(1)
       << report.budget_utilisation_pct << newline;
    os << std::setprecision(2);
    os << indent << "}," << newline;

    // Per district
    os << indent << "\"by_district\":" << space << "[";
    for (size_t i = 0; i < report.by_district.size(); ++i) {
        const auto& d = report.by_district[i];
        os << (i > 0 ? "," : "") << newline << indent << indent << "{"
           << "\"district\":" << space << "\"" << escape_json(d.district) << "\"," << space
           << "\"classrooms\":" << space << d.classrooms << "," << space
           << "\"teachers\":" << space << d.teachers << "," << space
           << "\"cost\":" << space << d.cost << "," << space
           << "\"schools_served\":" << space << d.schools_served << "}";
    }
    if (!report.by_district.empty()) {
        os << newline << indent;
    }
    os << "]," << newline;

    // Allocations, one compact object per row
    os << indent << "\"allocations\":" << space;
    std::ostringstream rows;
    write_table_json(rows, to_table(report.allocations), false);
    std::string rendered = rows.str();
    if (!rendered.empty() && rendered.back() == '\n') {
        rendered.pop_back();
    }
    os << rendered << newline;

    os << "}" << newline;
}

} // namespace io
} // namespace schoolgov
