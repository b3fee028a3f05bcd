#include <catch2/catch_test_macros.hpp>
#include "gap_resolver.hpp"
#include "norms.hpp"

using namespace schoolgov;

namespace {

void add_school_year(FactTables& facts, SchoolId id, int category, int64_t enrolment,
                     int64_t usable_rooms, int64_t teachers, const std::string& year = "2023-24") {
    if (!facts.find_school(id)) {
        School s;
        s.school_id = id;
        s.school_name = "School " + std::to_string(id);
        s.district = "North";
        s.school_category = category;
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

} // anonymous namespace

TEST_CASE("Capacity norm tables", "[gap_resolver][norms]") {
    SECTION("Classroom and teacher tables are looked up separately") {
        REQUIRE(CapacityNorms::classroom_norm(1) == 30);
        REQUIRE(CapacityNorms::classroom_norm(4) == 35);
        REQUIRE(CapacityNorms::classroom_norm(5) == 35);
        REQUIRE(CapacityNorms::classroom_norm(7) == 35);
        REQUIRE(CapacityNorms::classroom_norm(8) == 40);
        REQUIRE(CapacityNorms::pupil_teacher_norm(4) == 35);
        REQUIRE(CapacityNorms::pupil_teacher_norm(5) == 30);
        REQUIRE(CapacityNorms::pupil_teacher_norm(7) == 30);
        REQUIRE(CapacityNorms::pupil_teacher_norm(8) == 30);
    }

    SECTION("Unmapped categories fall back to 30") {
        REQUIRE(CapacityNorms::classroom_norm(0) == 30);
        REQUIRE(CapacityNorms::classroom_norm(9) == 30);
        REQUIRE(CapacityNorms::classroom_norm(42) == 30);
        REQUIRE(CapacityNorms::pupil_teacher_norm(-1) == 30);
        REQUIRE_FALSE(CapacityNorms::is_mapped_classroom_category(9));
        REQUIRE(CapacityNorms::is_mapped_teacher_category(11));
    }

    SECTION("Required capacity rounds up") {
        REQUIRE(CapacityNorms::required_capacity(900, 30) == 30);
        REQUIRE(CapacityNorms::required_capacity(901, 30) == 31);
        REQUIRE(CapacityNorms::required_capacity(0, 30) == 0);
        REQUIRE_THROWS_AS(CapacityNorms::required_capacity(10, 0), std::invalid_argument);
    }
}

TEST_CASE("Classroom and teacher gaps for the reference school", "[gap_resolver]") {
    FactTables facts;
    add_school_year(facts, 1, 1, 900, 25, 20);

    auto classrooms = resolve_classroom_gaps(facts, "2023-24");
    auto teachers = resolve_teacher_gaps(facts, "2023-24");

    REQUIRE(classrooms.size() == 1);
    REQUIRE(classrooms[0].required_classrooms == 30);
    REQUIRE(classrooms[0].classroom_gap == 5);
    REQUIRE(classrooms[0].has_infrastructure_record);

    REQUIRE(teachers.size() == 1);
    REQUIRE(teachers[0].required_teachers == 30);
    REQUIRE(teachers[0].teacher_gap == 10);
    REQUIRE(teachers[0].has_teacher_record);
}

TEST_CASE("Gaps are never negative", "[gap_resolver]") {
    FactTables facts;
    add_school_year(facts, 1, 1, 100, 50, 40);

    auto classrooms = resolve_classroom_gaps(facts, "2023-24");
    auto teachers = resolve_teacher_gaps(facts, "2023-24");

    REQUIRE(classrooms[0].required_classrooms == 4);
    REQUIRE(classrooms[0].classroom_gap == 0);
    REQUIRE(teachers[0].teacher_gap == 0);
}

TEST_CASE("Missing counterpart facts resolve as zero capacity", "[gap_resolver]") {
    FactTables facts;
    School s;
    s.school_id = 7;
    s.district = "South";
    s.school_category = 5;
    facts.add_school(s);
    facts.add_yearly_metric({7, "2023-24", 350});

    auto classrooms = resolve_classroom_gaps(facts, "2023-24");
    auto teachers = resolve_teacher_gaps(facts, "2023-24");

    REQUIRE(classrooms.size() == 1);
    REQUIRE_FALSE(classrooms[0].has_infrastructure_record);
    REQUIRE(classrooms[0].usable_class_rooms == 0);
    REQUIRE(classrooms[0].required_classrooms == 10);   // ceil(350 / 35)
    REQUIRE(classrooms[0].classroom_gap == 10);

    REQUIRE_FALSE(teachers[0].has_teacher_record);
    REQUIRE(teachers[0].required_teachers == 12);       // ceil(350 / 30)
    REQUIRE(teachers[0].teacher_gap == 12);
}

TEST_CASE("Schools without a reference record use the default norm", "[gap_resolver]") {
    FactTables facts;
    facts.add_yearly_metric({99, "2023-24", 61});

    auto classrooms = resolve_classroom_gaps(facts, "2023-24");
    REQUIRE(classrooms[0].school_category == 0);
    REQUIRE(classrooms[0].classroom_norm == 30);
    REQUIRE(classrooms[0].required_classrooms == 3);
    REQUIRE(category_of(facts, 99) == 0);
}

TEST_CASE("Gap rows cover exactly the year's enrolment rows, ordered by school", "[gap_resolver]") {
    FactTables facts;
    add_school_year(facts, 30, 1, 300, 5, 5);
    add_school_year(facts, 10, 1, 300, 5, 5);
    add_school_year(facts, 20, 1, 300, 5, 5, "2022-23");

    auto rows = resolve_classroom_gaps(facts, "2023-24");
    REQUIRE(rows.size() == 2);
    REQUIRE(rows[0].school_id == 10);
    REQUIRE(rows[1].school_id == 30);

    REQUIRE(resolve_teacher_gaps(facts, "2019-20").empty());
}
