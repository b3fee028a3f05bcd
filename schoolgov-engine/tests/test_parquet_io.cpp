#include <catch2/catch_test_macros.hpp>
#include "io/parquet_writer.hpp"
#include "io/table_export.hpp"
#include <filesystem>

using namespace schoolgov;

namespace {

std::vector<RiskRow> sample_risk_rows(size_t count) {
    std::vector<RiskRow> rows;
    for (size_t i = 0; i < count; ++i) {
        RiskRow r;
        r.school_id = static_cast<SchoolId>(i + 1);
        r.academic_year = "2023-24";
        r.risk_score = static_cast<double>(i % 10) / 10.0;
        r.risk_level = RiskModel::classify(r.risk_score);
        rows.push_back(r);
    }
    return rows;
}

} // anonymous namespace

#ifdef HAVE_ARROW

TEST_CASE("Parquet export of derived tables", "[parquet][io]") {
    REQUIRE(ParquetWriter::available());

    SECTION("Risk table is written") {
        auto path = std::filesystem::temp_directory_path() / "schoolgov_test_risk_scores.parquet";
        ParquetWriter::write_table(io::to_table(sample_risk_rows(500)), path.string());

        REQUIRE(std::filesystem::exists(path));
        REQUIRE(std::filesystem::file_size(path) > 0);
        std::filesystem::remove(path);
    }

    SECTION("Nullable columns are written") {
        RiskTrendRow baseline;
        baseline.school_id = 1;
        baseline.academic_year = "2023-24";

        auto path = std::filesystem::temp_directory_path() / "schoolgov_test_risk_trends.parquet";
        ParquetWriter::write_table(io::to_table(std::vector<RiskTrendRow>{baseline}), path.string());
        REQUIRE(std::filesystem::exists(path));
        std::filesystem::remove(path);
    }

    SECTION("Unwritable path") {
        REQUIRE_THROWS_AS(
            ParquetWriter::write_table(io::to_table(sample_risk_rows(1)), "/nonexistent/dir/out.parquet"),
            std::runtime_error);
    }

    SECTION("Ragged rows") {
        auto table = io::to_table(sample_risk_rows(2));
        table.rows[1].pop_back();
        auto path = std::filesystem::temp_directory_path() / "schoolgov_test_ragged.parquet";
        REQUIRE_THROWS_AS(ParquetWriter::write_table(table, path.string()), std::runtime_error);
    }
}

#else // !HAVE_ARROW

TEST_CASE("Parquet export not available without Arrow", "[parquet]") {
    REQUIRE_FALSE(ParquetWriter::available());
    REQUIRE_THROWS_AS(ParquetWriter::write_table(io::to_table(sample_risk_rows(1)), "out.parquet"),
                      std::runtime_error);
}

#endif // HAVE_ARROW
