#include "parquet_writer.hpp"
#include <cmath>
#include <stdexcept>

#ifdef HAVE_ARROW
#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/writer.h>
#endif

namespace schoolgov {

#ifdef HAVE_ARROW

namespace {

void check(const arrow::Status& status, const std::string& what) {
    if (!status.ok()) {
        throw std::runtime_error(what + ": " + status.ToString());
    }
}

std::shared_ptr<arrow::DataType> arrow_type(io::ColumnType type) {
    switch (type) {
        case io::ColumnType::Int64: return arrow::int64();
        case io::ColumnType::Float64: return arrow::float64();
        case io::ColumnType::Bool: return arrow::boolean();
        case io::ColumnType::String: return arrow::utf8();
    }
    return arrow::utf8();
}

std::shared_ptr<arrow::Array> build_column(const io::TableData& table, size_t col) {
    const io::TableColumn& column = table.columns[col];
    const std::string context = "Column " + table.name + "." + column.name;
    std::shared_ptr<arrow::Array> array;

    switch (column.type) {
        case io::ColumnType::Int64: {
            arrow::Int64Builder builder;
            check(builder.Reserve(static_cast<int64_t>(table.rows.size())), context);
            for (const auto& row : table.rows) {
                const auto* v = std::get_if<int64_t>(&row[col]);
                check(v ? builder.Append(*v) : builder.AppendNull(), context);
            }
            check(builder.Finish(&array), context);
            break;
        }
        case io::ColumnType::Float64: {
            arrow::DoubleBuilder builder;
            check(builder.Reserve(static_cast<int64_t>(table.rows.size())), context);
            for (const auto& row : table.rows) {
                const auto* v = std::get_if<double>(&row[col]);
                check(v && std::isfinite(*v) ? builder.Append(*v) : builder.AppendNull(), context);
            }
            check(builder.Finish(&array), context);
            break;
        }
        case io::ColumnType::Bool: {
            arrow::BooleanBuilder builder;
            check(builder.Reserve(static_cast<int64_t>(table.rows.size())), context);
            for (const auto& row : table.rows) {
                const auto* v = std::get_if<bool>(&row[col]);
                check(v ? builder.Append(*v) : builder.AppendNull(), context);
            }
            check(builder.Finish(&array), context);
            break;
        }
        case io::ColumnType::String: {
            arrow::StringBuilder builder;
            for (const auto& row : table.rows) {
                const auto* v = std::get_if<std::string>(&row[col]);
                check(v ? builder.Append(*v) : builder.AppendNull(), context);
            }
            check(builder.Finish(&array), context);
            break;
        }
    }
    return array;
}

} // anonymous namespace

void ParquetWriter::write_table(const io::TableData& table, const std::string& filepath) {
    arrow::FieldVector fields;
    arrow::ArrayVector arrays;

    for (size_t c = 0; c < table.columns.size(); ++c) {
        fields.push_back(arrow::field(table.columns[c].name, arrow_type(table.columns[c].type)));
    }
    for (size_t r = 0; r < table.rows.size(); ++r) {
        if (table.rows[r].size() != table.columns.size()) {
            throw std::runtime_error("Table " + table.name + ": row " + std::to_string(r) +
                                     " does not match the column count");
        }
    }
    for (size_t c = 0; c < table.columns.size(); ++c) {
        arrays.push_back(build_column(table, c));
    }

    auto arrow_table = arrow::Table::Make(arrow::schema(fields), arrays);

    auto opened = arrow::io::FileOutputStream::Open(filepath);
    if (!opened.ok()) {
        throw std::runtime_error("Cannot open Parquet file for writing: " + filepath + " - " +
                                 opened.status().ToString());
    }
    std::shared_ptr<arrow::io::FileOutputStream> outfile = *opened;

    check(parquet::arrow::WriteTable(*arrow_table, arrow::default_memory_pool(), outfile, 1024 * 1024),
          "Failed to write Parquet table " + table.name);
    check(outfile->Close(), "Failed to close Parquet file " + filepath);
}

bool ParquetWriter::available() {
    return true;
}

#else // !HAVE_ARROW

void ParquetWriter::write_table(const io::TableData& /* table */, const std::string& /* filepath */) {
    throw std::runtime_error("Apache Arrow not available. Rebuild with -DHAVE_ARROW to enable Parquet support.");
}

bool ParquetWriter::available() {
    return false;
}

#endif // HAVE_ARROW

} // namespace schoolgov
