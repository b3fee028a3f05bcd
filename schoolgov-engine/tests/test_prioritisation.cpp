#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "prioritisation.hpp"

using namespace schoolgov;
using Catch::Matchers::WithinAbs;

namespace {

RiskRow risk_row(SchoolId id, const std::string& year, double score) {
    RiskRow row;
    row.school_id = id;
    row.academic_year = year;
    row.risk_score = score;
    row.risk_level = RiskModel::classify(score);
    return row;
}

void add_school(FactTables& facts, SchoolId id, const std::string& district) {
    School s;
    s.school_id = id;
    s.district = district;
    s.school_category = 1;
    facts.add_school(s);
}

} // anonymous namespace

TEST_CASE("Competition ranking", "[prioritisation]") {
    SECTION("Ties share a rank and the next score skips ahead") {
        auto ranks = rank_descending({0.8, 0.8, 0.5});
        REQUIRE(ranks == std::vector<int64_t>{1, 1, 3});
    }

    SECTION("Input order is preserved") {
        auto ranks = rank_descending({0.1, 0.9, 0.5, 0.9});
        REQUIRE(ranks == std::vector<int64_t>{4, 1, 3, 1});
    }

    SECTION("Empty input") {
        REQUIRE(rank_descending({}).empty());
    }
}

TEST_CASE("Percent rank and buckets", "[prioritisation]") {
    REQUIRE(percent_rank(1, 1) == 0.0);
    REQUIRE(percent_rank(1, 21) == 0.0);
    REQUIRE_THAT(percent_rank(3, 21), WithinAbs(0.10, 1e-12));
    REQUIRE(percent_rank(21, 21) == 1.0);

    REQUIRE(bucket_for_percent_rank(0.0) == PriorityBucket::Top5);
    REQUIRE(bucket_for_percent_rank(0.05) == PriorityBucket::Top5);
    REQUIRE(bucket_for_percent_rank(0.06) == PriorityBucket::Top10);
    REQUIRE(bucket_for_percent_rank(0.10) == PriorityBucket::Top10);
    REQUIRE(bucket_for_percent_rank(0.20) == PriorityBucket::Top20);
    REQUIRE(bucket_for_percent_rank(0.21) == PriorityBucket::Standard);
}

TEST_CASE("State and district ranks", "[prioritisation]") {
    FactTables facts;
    add_school(facts, 1, "North");
    add_school(facts, 2, "North");
    add_school(facts, 3, "South");

    YearPartitionedTable<RiskRow> risk;
    risk.replace_year("2023-24", {risk_row(1, "2023-24", 0.30),
                                  risk_row(2, "2023-24", 0.60),
                                  risk_row(3, "2023-24", 0.45),
                                  risk_row(4, "2023-24", 0.10)});

    auto rows = rank_priorities(facts, risk, "2023-24");
    REQUIRE(rows.size() == 4);

    REQUIRE(rows[0].school_id == 1);
    REQUIRE(rows[0].state_rank == 3);
    REQUIRE(rows[0].district_rank == 2);
    REQUIRE(rows[1].state_rank == 1);
    REQUIRE(rows[1].district_rank == 1);
    REQUIRE(rows[1].priority_bucket == PriorityBucket::Top5);
    REQUIRE(rows[2].district == "South");
    REQUIRE(rows[2].district_rank == 1);

    SECTION("Schools without a reference record rank under an empty district") {
        REQUIRE(rows[3].district.empty());
        REQUIRE(rows[3].district_rank == 1);
        REQUIRE(rows[3].state_rank == 4);
        REQUIRE(rows[3].percent_rank == 1.0);
        REQUIRE(rows[3].priority_bucket == PriorityBucket::Standard);
    }

    SECTION("Single-row year sits in the top bucket") {
        YearPartitionedTable<RiskRow> single;
        single.replace_year("2023-24", {risk_row(1, "2023-24", 0.05)});
        auto one = rank_priorities(facts, single, "2023-24");
        REQUIRE(one[0].percent_rank == 0.0);
        REQUIRE(one[0].priority_bucket == PriorityBucket::Top5);
    }
}

TEST_CASE("Persistent high risk needs three consecutive HIGH or CRITICAL years", "[prioritisation]") {
    FactTables facts;
    add_school(facts, 1, "North");

    YearPartitionedTable<RiskRow> risk;
    risk.replace_year("2020-21", {risk_row(1, "2020-21", 0.10)});
    risk.replace_year("2021-22", {risk_row(1, "2021-22", 0.60)});
    risk.replace_year("2022-23", {risk_row(1, "2022-23", 0.80)});
    risk.replace_year("2023-24", {risk_row(1, "2023-24", 0.55)});

    REQUIRE_FALSE(rank_priorities(facts, risk, "2022-23")[0].persistent_high_risk);
    REQUIRE(rank_priorities(facts, risk, "2023-24")[0].persistent_high_risk);

    SECTION("History stops at the ranked year") {
        auto history = risk_history(risk, 1, "2022-23");
        REQUIRE(history.size() == 3);
        REQUIRE(history.back()->academic_year == "2022-23");
    }

    SECTION("Fewer than three observed years is never persistent") {
        auto history = risk_history(risk, 1, "2021-22");
        REQUIRE_FALSE(sustained_high_risk(history));
    }
}
