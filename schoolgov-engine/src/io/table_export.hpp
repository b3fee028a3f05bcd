#ifndef SCHOOLGOV_IO_TABLE_EXPORT_HPP
#define SCHOOLGOV_IO_TABLE_EXPORT_HPP

#include "../derived_tables.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace schoolgov {
namespace io {

enum class ColumnType : uint8_t {
    Int64 = 0,
    Float64 = 1,
    Bool = 2,
    String = 3
};

// monostate is a null cell
using CellValue = std::variant<std::monostate, int64_t, double, bool, std::string>;

struct TableColumn {
    std::string name;
    ColumnType type;
};

// Row-major rendering of a derived table, shared by the JSON and Parquet writers
struct TableData {
    std::string name;
    std::vector<TableColumn> columns;
    std::vector<std::vector<CellValue>> rows;
};

TableData to_table(const std::vector<ClassroomGapRow>& rows);
TableData to_table(const std::vector<TeacherGapRow>& rows);
TableData to_table(const std::vector<RiskRow>& rows);
TableData to_table(const std::vector<PriorityRow>& rows);
TableData to_table(const std::vector<RiskTrendRow>& rows);
TableData to_table(const std::vector<DistrictScoreRow>& rows);
TableData to_table(const std::vector<BudgetRow>& rows);
TableData to_table(const std::vector<ForecastRow>& rows);
TableData to_table(const std::vector<ProposalValidationRow>& rows);

// Every populated derived table, all years. Unpopulated tables are left out.
std::vector<TableData> export_tables(const DerivedTables& tables);

} // namespace io
} // namespace schoolgov

#endif // SCHOOLGOV_IO_TABLE_EXPORT_HPP
