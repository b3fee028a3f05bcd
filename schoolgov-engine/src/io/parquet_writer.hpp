#ifndef SCHOOLGOV_PARQUET_WRITER_HPP
#define SCHOOLGOV_PARQUET_WRITER_HPP

#include "table_export.hpp"
#include <string>

namespace schoolgov {

class ParquetWriter {
public:
    /**
     * Write a derived table to a Parquet file.
     *
     * Column types map Int64 -> int64, Float64 -> float64, Bool -> boolean,
     * String -> utf8. Null cells and non-finite numbers are written as nulls.
     *
     * @param table Rendered table
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the file cannot be written, or when built without Arrow
     */
    static void write_table(const io::TableData& table, const std::string& filepath);

    // False when built without Apache Arrow
    static bool available();
};

} // namespace schoolgov

#endif // SCHOOLGOV_PARQUET_WRITER_HPP
