#ifndef SCHOOLGOV_IO_JSON_WRITER_HPP
#define SCHOOLGOV_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "table_export.hpp"
#include "../budget_allocator.hpp"

namespace schoolgov {
namespace io {

// Write a derived table as a JSON array of row objects.
// Null cells and non-finite numbers are written as null.
void write_table_json(std::ostream& os, const TableData& table, bool pretty_print = true);

// Write a derived table to <filepath>
void write_table_json(const std::string& filepath, const TableData& table, bool pretty_print = true);

// Write a budget dry-run report: totals, per-district breakdown and the allocations
void write_budget_report_json(std::ostream& os, const BudgetSimulationReport& report,
                              bool pretty_print = true);

std::string escape_json(const std::string& s);

} // namespace io
} // namespace schoolgov

#endif // SCHOOLGOV_IO_JSON_WRITER_HPP
