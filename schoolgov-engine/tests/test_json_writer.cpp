#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include "io/json_writer.hpp"
#include "io/table_export.hpp"

using namespace schoolgov;
using json = nlohmann::json;
using Catch::Matchers::WithinAbs;

TEST_CASE("JSON string escaping", "[json][io]") {
    REQUIRE(io::escape_json("plain") == "plain");
    REQUIRE(io::escape_json("a\"b") == "a\\\"b");
    REQUIRE(io::escape_json("back\\slash") == "back\\\\slash");
    REQUIRE(io::escape_json("line\nbreak\t") == "line\\nbreak\\t");
    REQUIRE(io::escape_json(std::string(1, '\x01')) == "\\u0001");
}

TEST_CASE("Derived table as JSON rows", "[json][io]") {
    RiskTrendRow first;
    first.school_id = 7;
    first.academic_year = "2022-23";
    first.risk_score = 0.4;
    first.risk_level = RiskLevel::Moderate;
    first.year_sequence = 1;
    first.cumulative_avg_risk = 0.4;

    RiskTrendRow second = first;
    second.academic_year = "2023-24";
    second.risk_score = 0.8;
    second.risk_level = RiskLevel::Critical;
    second.prev_risk_score = 0.4;
    second.risk_delta = 0.4;
    second.trend_direction = TrendDirection::Deteriorating;
    second.year_sequence = 2;
    second.cumulative_avg_risk = 0.6;
    second.is_volatile = true;

    auto table = io::to_table(std::vector<RiskTrendRow>{first, second});
    REQUIRE(table.name == "risk_trends");

    std::ostringstream out;
    io::write_table_json(out, table);
    json parsed = json::parse(out.str());

    REQUIRE(parsed.is_array());
    REQUIRE(parsed.size() == 2);

    SECTION("Absent values are null") {
        REQUIRE(parsed[0]["prev_risk_score"].is_null());
        REQUIRE(parsed[0]["risk_delta"].is_null());
        REQUIRE(parsed[0]["trend_direction"] == "BASELINE");
    }

    SECTION("Values keep their column types") {
        REQUIRE(parsed[1]["school_id"] == 7);
        REQUIRE(parsed[1]["academic_year"] == "2023-24");
        REQUIRE(parsed[1]["risk_level"] == "CRITICAL");
        REQUIRE(parsed[1]["is_volatile"] == true);
        REQUIRE(parsed[1]["is_chronic"] == false);
        REQUIRE_THAT(parsed[1]["risk_delta"].get<double>(), WithinAbs(0.4, 1e-9));
    }

    SECTION("Compact output parses to the same rows") {
        std::ostringstream compact;
        io::write_table_json(compact, table, false);
        REQUIRE(compact.str().find('\n') == std::string::npos);
        REQUIRE(json::parse(compact.str()) == parsed);
    }
}

TEST_CASE("Non-finite ratios are written as null", "[json][io]") {
    ProposalValidationRow row;
    row.proposal_id = 1;
    row.school_id = 3;
    row.academic_year = "2023-24";
    row.classroom_ratio = std::numeric_limits<double>::infinity();
    row.reason_code = "CLASSROOM_OVER_REQUEST";

    std::ostringstream out;
    io::write_table_json(out, io::to_table(std::vector<ProposalValidationRow>{row}));
    json parsed = json::parse(out.str());

    REQUIRE(parsed[0]["classroom_ratio"].is_null());
    REQUIRE(parsed[0]["teacher_ratio"].is_null());
    REQUIRE(parsed[0]["decision"] == "REJECTED");
}

TEST_CASE("Malformed table data is rejected", "[json][io]") {
    io::TableData table;
    table.name = "broken";
    table.columns = {{"a", io::ColumnType::Int64}, {"b", io::ColumnType::String}};
    table.rows = {{int64_t{1}}};

    std::ostringstream out;
    REQUIRE_THROWS_AS(io::write_table_json(out, table), std::runtime_error);
}

TEST_CASE("Empty tables", "[json][io]") {
    std::ostringstream out;
    io::write_table_json(out, io::to_table(std::vector<RiskRow>{}));
    REQUIRE(json::parse(out.str()).empty());

    DerivedTables tables;
    REQUIRE(io::export_tables(tables).empty());

    RiskRow r;
    r.school_id = 1;
    r.academic_year = "2023-24";
    tables.risk_scores.replace_year("2023-24", {r});
    auto exported = io::export_tables(tables);
    REQUIRE(exported.size() == 1);
    REQUIRE(exported[0].name == "risk_scores");
}

TEST_CASE("JSON table files", "[json][io]") {
    auto path = std::filesystem::temp_directory_path() / "schoolgov_test_classroom_gaps.json";

    ClassroomGapRow row;
    row.school_id = 1;
    row.academic_year = "2023-24";
    row.required_classrooms = 30;
    row.classroom_gap = 5;
    io::write_table_json(path.string(), io::to_table(std::vector<ClassroomGapRow>{row}));

    std::ifstream in(path);
    json parsed = json::parse(in);
    REQUIRE(parsed[0]["classroom_gap"] == 5);
    std::filesystem::remove(path);

    REQUIRE_THROWS_WITH(
        io::write_table_json("/nonexistent/dir/out.json", io::to_table(std::vector<ClassroomGapRow>{row})),
        Catch::Matchers::ContainsSubstring("Failed to open output file")
    );
}

TEST_CASE("Budget dry-run report", "[json][io][budget]") {
    BudgetSimulationReport report;
    report.academic_year = "2023-24";
    report.total_budget = 1000000.0;
    report.cost_per_unit = 500000.0;
    report.max_teachers = 3;
    report.classroom_cap = 2;
    report.funded = 1;
    report.total_schools = 1;
    report.classrooms_allocated = 2;
    report.total_cost = 1000000.0;
    report.budget_utilisation_pct = 100.0;

    DistrictAllocation d;
    d.district = "North";
    d.classrooms = 2;
    d.cost = 1000000.0;
    d.schools_served = 1;
    report.by_district.push_back(d);

    BudgetRow row;
    row.school_id = 4;
    row.academic_year = "2023-24";
    row.district = "North";
    row.classroom_gap = 2;
    row.allocation_priority = 1;
    row.classrooms_allocated = 2;
    row.classroom_resolved = true;
    row.teacher_resolved = true;
    row.allocation_status = AllocationStatus::Funded;
    report.allocations.push_back(row);

    for (bool pretty : {true, false}) {
        std::ostringstream out;
        io::write_budget_report_json(out, report, pretty);
        json parsed = json::parse(out.str());

        REQUIRE(parsed["academic_year"] == "2023-24");
        REQUIRE(parsed["classroom_cap"] == 2);
        REQUIRE(parsed["summary"]["funded"] == 1);
        REQUIRE_THAT(parsed["summary"]["budget_utilisation_pct"].get<double>(), WithinAbs(100.0, 1e-9));
        REQUIRE(parsed["by_district"].size() == 1);
        REQUIRE(parsed["by_district"][0]["district"] == "North");
        REQUIRE(parsed["allocations"].size() == 1);
        REQUIRE(parsed["allocations"][0]["allocation_status"] == "FUNDED");
    }
}
