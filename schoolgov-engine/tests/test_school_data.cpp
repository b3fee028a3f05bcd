#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <sstream>
#include "school.hpp"
#include "io/csv_reader.hpp"

using namespace schoolgov;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("CSV reader splits quoted fields", "[csv]") {
    std::istringstream in("a, b ,\"c,d\",\"say \"\"hi\"\"\"\n\n1,2\n");
    CsvReader reader(in);

    auto first = reader.read_row();
    REQUIRE(first == std::vector<std::string>{"a", "b", "c,d", "say \"hi\""});
    REQUIRE(reader.line_number() == 1);

    REQUIRE(CsvReader::column_index(first, "B") == 1);
    REQUIRE(CsvReader::column_index(first, "missing") == -1);
}

TEST_CASE("Loading fact tables from CSV", "[school][csv]") {
    FactTables facts;

    std::istringstream schools(
        "school_id,school_name,district,block,school_category,management_type\n"
        "101,Hill School,North,B1,1,Government\n"
        "102,\"River, Upper\",South,B2,5,Aided\n");
    facts.load_schools_csv(schools);

    std::istringstream metrics(
        "school_id,academic_year,total_enrolment\n"
        "101,2022-23,850\n"
        "101,2023-24,900\n"
        "102,2023-24,12.0\n");
    facts.load_yearly_metrics_csv(metrics);

    std::istringstream infra(
        "school_id,academic_year,total_class_rooms,usable_class_rooms,classroom_condition_score\n"
        "101,2023-24,27,25,0.75\n"
        "102,2023-24,3,3,\n");
    facts.load_infrastructure_csv(infra);

    std::istringstream teachers("school_id,academic_year,total_teachers\n101,2023-24,20\n");
    facts.load_teacher_metrics_csv(teachers);

    REQUIRE(facts.school_count() == 2);
    REQUIRE(facts.yearly_metric_count() == 3);
    REQUIRE(facts.find_school(102)->school_name == "River, Upper");
    REQUIRE(facts.find_school(102)->school_category == 5);
    REQUIRE(facts.find_yearly_metric(102, "2023-24")->total_enrolment == 12);
    REQUIRE(facts.find_infrastructure(101, "2023-24")->classroom_condition_score == 0.75);
    REQUIRE_FALSE(facts.find_infrastructure(102, "2023-24")->classroom_condition_score.has_value());
    REQUIRE(facts.find_teacher_metric(102, "2023-24") == nullptr);

    SECTION("Years and histories") {
        REQUIRE(facts.academic_years() == std::vector<std::string>{"2022-23", "2023-24"});
        REQUIRE(facts.latest_year() == "2023-24");
        REQUIRE(facts.metrics_for_year("2023-24").size() == 2);
        auto history = facts.enrolment_history(101);
        REQUIRE(history.size() == 2);
        REQUIRE(history[0]->academic_year == "2022-23");
    }
}

TEST_CASE("Malformed fact CSV is rejected", "[school][csv]") {
    FactTables facts;

    SECTION("Missing required column") {
        std::istringstream in("school_id,academic_year\n1,2023-24\n");
        REQUIRE_THROWS_AS(facts.load_yearly_metrics_csv(in), std::runtime_error);
    }

    SECTION("Non-numeric count names the file and line") {
        std::istringstream in("school_id,academic_year,total_enrolment\n1,2023-24,many\n");
        try {
            facts.load_yearly_metrics_csv(in, "metrics.csv");
            FAIL("Expected std::invalid_argument");
        } catch (const std::invalid_argument& e) {
            REQUIRE(std::string(e.what()).find("metrics.csv:2") != std::string::npos);
        }
    }

    SECTION("Negative count") {
        std::istringstream in("school_id,academic_year,total_teachers\n1,2023-24,-4\n");
        REQUIRE_THROWS_AS(facts.load_teacher_metrics_csv(in), std::invalid_argument);
    }

    SECTION("School ids must read back unchanged") {
        std::istringstream padded("school_id,academic_year,total_enrolment\n00123,2023-24,10\n");
        REQUIRE_THROWS_WITH(facts.load_yearly_metrics_csv(padded, "metrics.csv"),
                            ContainsSubstring("metrics.csv:2") && ContainsSubstring("'00123'"));

        std::istringstream coded("school_id,academic_year,total_enrolment\nKA-0042,2023-24,10\n");
        REQUIRE_THROWS_AS(facts.load_yearly_metrics_csv(coded), std::invalid_argument);

        std::istringstream plain("school_id,academic_year,total_enrolment\n123,2023-24,10\n");
        REQUIRE_NOTHROW(facts.load_yearly_metrics_csv(plain));
        REQUIRE(facts.find_yearly_metric(123, "2023-24") != nullptr);
    }

    SECTION("Malformed academic year") {
        std::istringstream in("school_id,academic_year,total_enrolment\n1,2023,10\n");
        REQUIRE_THROWS_AS(facts.load_yearly_metrics_csv(in), std::invalid_argument);
    }

    SECTION("Duplicate school-year") {
        std::istringstream in("school_id,academic_year,total_enrolment\n1,2023-24,10\n1,2023-24,11\n");
        REQUIRE_THROWS_AS(facts.load_yearly_metrics_csv(in), std::invalid_argument);
    }

    SECTION("Duplicate school record") {
        facts.add_school(School{});
        REQUIRE_THROWS_AS(facts.add_school(School{}), std::invalid_argument);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(FactTables::load_from_directory("/nonexistent/data"), std::runtime_error);
    }
}

TEST_CASE("Fact source paths", "[school]") {
    auto paths = FactSourcePaths::in_directory("data");
    REQUIRE(paths.schools == "data/schools.csv");
    REQUIRE(paths.teacher_metrics == "data/teacher_metrics.csv");
    REQUIRE(FactSourcePaths::in_directory("data/").yearly_metrics == "data/yearly_metrics.csv");
}
