#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "risk_scorer.hpp"
#include "gap_resolver.hpp"

using namespace schoolgov;
using Catch::Matchers::WithinAbs;

namespace {

void add_school_year(FactTables& facts, SchoolId id, const std::string& year, int64_t enrolment,
                     int64_t usable_rooms, int64_t teachers) {
    if (!facts.find_school(id)) {
        School s;
        s.school_id = id;
        s.district = "North";
        s.school_category = 1;
        facts.add_school(s);
    }
    facts.add_yearly_metric({id, year, enrolment});
    InfrastructureFact infra;
    infra.school_id = id;
    infra.academic_year = year;
    infra.total_class_rooms = usable_rooms;
    infra.usable_class_rooms = usable_rooms;
    facts.add_infrastructure(infra);
    facts.add_teacher_metric({id, year, teachers});
}

std::vector<RiskRow> score_year(const FactTables& facts, const std::string& year) {
    return score_risk(facts, resolve_classroom_gaps(facts, year), resolve_teacher_gaps(facts, year), year);
}

} // anonymous namespace

TEST_CASE("Risk level thresholds are exclusive lower bounds", "[risk]") {
    REQUIRE(RiskModel::classify(0.0) == RiskLevel::Low);
    REQUIRE(RiskModel::classify(0.20) == RiskLevel::Low);
    REQUIRE(RiskModel::classify(0.2001) == RiskLevel::Moderate);
    REQUIRE(RiskModel::classify(0.50) == RiskLevel::Moderate);
    REQUIRE(RiskModel::classify(0.5001) == RiskLevel::High);
    REQUIRE(RiskModel::classify(0.75) == RiskLevel::High);
    REQUIRE(RiskModel::classify(0.7501) == RiskLevel::Critical);
    REQUIRE(RiskModel::classify(1.0) == RiskLevel::Critical);
}

TEST_CASE("Risk level names", "[risk]") {
    REQUIRE(to_string(RiskLevel::Critical) == "CRITICAL");
    REQUIRE(parse_risk_level("MODERATE") == RiskLevel::Moderate);
    REQUIRE_THROWS_AS(parse_risk_level("SEVERE"), std::invalid_argument);
}

TEST_CASE("Composite risk score", "[risk]") {
    SECTION("Weights and rounding") {
        REQUIRE_THAT(composite_risk_score(1.0, 1.0, 0.5), WithinAbs(0.90, 1e-12));
        REQUIRE_THAT(composite_risk_score(1.0 / 3.0, 1.0 / 6.0, 0.0), WithinAbs(0.2083, 1e-12));
    }

    SECTION("Growth contributes by magnitude and is capped") {
        REQUIRE_THAT(composite_risk_score(0.0, 0.0, -0.25), WithinAbs(0.05, 1e-12));
        REQUIRE_THAT(composite_risk_score(0.0, 0.0, 3.0), WithinAbs(0.10, 1e-12));
    }

    SECTION("Score stays within [0, 0.9]") {
        REQUIRE(composite_risk_score(0.0, 0.0, 0.0) == 0.0);
        REQUIRE(composite_risk_score(1.0, 1.0, -10.0) <= 0.9);
    }
}

TEST_CASE("Reference school scores MODERATE", "[risk]") {
    FactTables facts;
    add_school_year(facts, 1, "2023-24", 900, 25, 20);

    auto rows = score_year(facts, "2023-24");
    REQUIRE(rows.size() == 1);
    REQUIRE_THAT(rows[0].teacher_deficit_ratio, WithinAbs(1.0 / 3.0, 1e-9));
    REQUIRE_THAT(rows[0].classroom_deficit_ratio, WithinAbs(1.0 / 6.0, 1e-9));
    REQUIRE(rows[0].enrolment_growth_rate == 0.0);
    REQUIRE_THAT(rows[0].risk_score, WithinAbs(0.2083, 1e-12));
    REQUIRE(rows[0].risk_level == RiskLevel::Moderate);
}

TEST_CASE("Enrolment growth uses the chronological predecessor", "[risk]") {
    FactTables facts;
    add_school_year(facts, 1, "2021-22", 500, 20, 20);
    add_school_year(facts, 1, "2023-24", 600, 20, 20);
    add_school_year(facts, 2, "2022-23", 0, 1, 1);
    add_school_year(facts, 2, "2023-24", 300, 10, 10);

    SECTION("First observed year has zero growth") {
        REQUIRE(enrolment_growth_rate(facts, 1, "2021-22") == 0.0);
    }

    SECTION("A missing year in between does not break the lag") {
        REQUIRE_THAT(enrolment_growth_rate(facts, 1, "2023-24"), WithinAbs(0.2, 1e-12));
    }

    SECTION("Zero predecessor enrolment gives zero growth") {
        REQUIRE(enrolment_growth_rate(facts, 2, "2023-24") == 0.0);
    }

    SECTION("Unknown school-year gives zero growth") {
        REQUIRE(enrolment_growth_rate(facts, 3, "2023-24") == 0.0);
    }
}

TEST_CASE("Full deficits score CRITICAL", "[risk]") {
    FactTables facts;
    add_school_year(facts, 1, "2022-23", 300, 0, 0);
    add_school_year(facts, 1, "2023-24", 600, 0, 0);

    auto rows = score_year(facts, "2023-24");
    REQUIRE(rows[0].teacher_deficit_ratio == 1.0);
    REQUIRE(rows[0].classroom_deficit_ratio == 1.0);
    REQUIRE_THAT(rows[0].risk_score, WithinAbs(0.90, 1e-12));
    REQUIRE(rows[0].risk_level == RiskLevel::Critical);
}

TEST_CASE("Zero enrolment scores zero deficits", "[risk]") {
    FactTables facts;
    add_school_year(facts, 1, "2023-24", 0, 0, 0);

    auto rows = score_year(facts, "2023-24");
    REQUIRE(rows[0].teacher_deficit_ratio == 0.0);
    REQUIRE(rows[0].classroom_deficit_ratio == 0.0);
    REQUIRE(rows[0].risk_level == RiskLevel::Low);
}
