/**
 * @file attendance_repository_test.cpp
 * @brief Unit tests for attendance_repository
 */

#include <catch2/catch_test_macros.hpp>

#include "../fixtures/checkin_fixture.hpp"

#include <checkin/compat/time.hpp>

#include <chrono>

using namespace checkin;
using namespace checkin::storage;
using namespace std::chrono_literals;

namespace {

struct attendance_env {
    testing::checkin_fixture fx;
    std::int64_t person = fx.add_person("Ada", "Lovelace");
    std::int64_t other = fx.add_person("Alan", "Turing");
    std::int64_t room = fx.add_location("Room A", 10);
    std::int64_t schedule = fx.add_schedule();

    auto open_attendance(std::int64_t person_id, const occurrence_record& occurrence)
        -> Result<std::int64_t> {
        attendance_record record;
        record.person_id = person_id;
        record.occurrence_id = occurrence.pk;
        record.start_time = fx.clock.now();
        return fx.attendance.insert_attendance(record);
    }
};

}  // namespace

TEST_CASE("attendance_repository occurrences", "[attendance_repository][occurrence]") {
    attendance_env env;

    auto first = env.fx.attendance.get_or_create_occurrence(env.room, env.schedule,
                                                            "2026-03-01");
    REQUIRE(first.is_ok());
    CHECK(first.value().occurrence_date == "2026-03-01");

    SECTION("same key returns the same occurrence") {
        auto again = env.fx.attendance.get_or_create_occurrence(env.room, env.schedule,
                                                                "2026-03-01");
        REQUIRE(again.is_ok());
        CHECK(again.value().pk == first.value().pk);
    }

    SECTION("another date creates another occurrence") {
        auto next = env.fx.attendance.get_or_create_occurrence(env.room, env.schedule,
                                                               "2026-03-08");
        REQUIRE(next.is_ok());
        CHECK(next.value().pk != first.value().pk);
    }

    SECTION("find_occurrence reads without creating") {
        auto found = env.fx.attendance.find_occurrence(env.room, env.schedule, "2026-03-01");
        REQUIRE(found.is_ok());
        REQUIRE(found.value().has_value());
        CHECK(found.value()->pk == first.value().pk);

        auto missing = env.fx.attendance.find_occurrence(env.room, env.schedule, "2026-03-08");
        REQUIRE(missing.is_ok());
        CHECK_FALSE(missing.value().has_value());

        auto still_missing = env.fx.attendance.find_occurrence(env.room, env.schedule,
                                                               "2026-03-08");
        REQUIRE(still_missing.is_ok());
        CHECK_FALSE(still_missing.value().has_value());
    }
}

TEST_CASE("attendance_repository open attendances", "[attendance_repository][attendance]") {
    attendance_env env;
    auto occurrence = env.fx.attendance.get_or_create_occurrence(env.room, env.schedule,
                                                                 "2026-03-01");
    REQUIRE(occurrence.is_ok());

    auto id = env.open_attendance(env.person, occurrence.value());
    REQUIRE(id.is_ok());

    SECTION("counts and lookups see the open row") {
        CHECK(env.fx.attendance.count_open_for_location(env.room, "2026-03-01").value() == 1);
        CHECK(env.fx.attendance.has_open_attendance(env.person, occurrence.value().pk).value());
        CHECK(env.fx.attendance.has_attended_location(env.person, env.room).value());
        CHECK_FALSE(env.fx.attendance.has_attended_location(env.other, env.room).value());

        auto found = env.fx.attendance.find_by_id(id.value());
        REQUIRE(found.is_ok());
        REQUIRE(found.value().has_value());
        CHECK(found.value()->is_open());
        CHECK(found.value()->location_id == env.room);
    }

    SECTION("a second open row for the same occurrence is a duplicate") {
        auto duplicate = env.open_attendance(env.person, occurrence.value());
        REQUIRE(duplicate.is_err());
        CHECK(duplicate.error().code == error_codes::duplicate_entry);
    }

    SECTION("a dangling occurrence is a constraint violation, not a duplicate") {
        occurrence_record dangling;
        dangling.pk = 9999;
        auto orphan = env.open_attendance(env.other, dangling);
        REQUIRE(orphan.is_err());
        CHECK(orphan.error().code == error_codes::database_constraint_violation);
    }

    SECTION("close succeeds once") {
        auto closed = env.fx.attendance.close_attendance(id.value(), env.fx.clock.now());
        REQUIRE(closed.is_ok());
        CHECK(closed.value());

        auto again = env.fx.attendance.close_attendance(id.value(), env.fx.clock.now());
        REQUIRE(again.is_ok());
        CHECK_FALSE(again.value());

        CHECK(env.fx.attendance.count_open_for_location(env.room, "2026-03-01").value() == 0);

        SECTION("a closed row allows a new open one") {
            CHECK(env.open_attendance(env.person, occurrence.value()).is_ok());
        }
    }

    SECTION("closing an unknown attendance returns false") {
        auto closed = env.fx.attendance.close_attendance(9999, env.fx.clock.now());
        REQUIRE(closed.is_ok());
        CHECK_FALSE(closed.value());
    }
}

TEST_CASE("attendance_repository occupant order and history",
          "[attendance_repository][query]") {
    attendance_env env;
    auto zoe = env.fx.add_person("Zoe", "Adams");
    auto occurrence = env.fx.attendance.get_or_create_occurrence(env.room, env.schedule,
                                                                 "2026-03-01");
    REQUIRE(occurrence.is_ok());

    REQUIRE(env.open_attendance(env.other, occurrence.value()).is_ok());
    env.fx.clock.advance(1min);
    REQUIRE(env.open_attendance(zoe, occurrence.value()).is_ok());
    env.fx.clock.advance(1min);
    REQUIRE(env.open_attendance(env.person, occurrence.value()).is_ok());

    auto open = env.fx.attendance.find_open_by_location(env.room, "2026-03-01");
    REQUIRE(open.is_ok());
    REQUIRE(open.value().size() == 3);
    CHECK(open.value()[0].person_id == zoe);         // Adams
    CHECK(open.value()[1].person_id == env.person);  // Lovelace
    CHECK(open.value()[2].person_id == env.other);   // Turing

    auto history = env.fx.attendance.find_history(env.person, env.fx.clock.now() - 1h);
    REQUIRE(history.is_ok());
    REQUIRE(history.value().size() == 1);
    CHECK(history.value()[0].occurrence_date == "2026-03-01");

    auto none = env.fx.attendance.find_history(env.person, env.fx.clock.now() + 1h);
    REQUIRE(none.is_ok());
    CHECK(none.value().empty());
}

TEST_CASE("attendance_repository security codes", "[attendance_repository][codes]") {
    attendance_env env;
    auto now = env.fx.clock.now();

    auto stored = env.fx.attendance.insert_security_code("2026-03-01", "K7P2", now);
    REQUIRE(stored.is_ok());
    REQUIRE(stored.value().has_value());
    CHECK(stored.value()->code == "K7P2");

    SECTION("same code on the same date is refused") {
        auto again = env.fx.attendance.insert_security_code("2026-03-01", "K7P2", now);
        REQUIRE(again.is_ok());
        CHECK_FALSE(again.value().has_value());
    }

    SECTION("same code on another date is accepted") {
        auto tomorrow = env.fx.attendance.insert_security_code("2026-03-02", "K7P2", now);
        REQUIRE(tomorrow.is_ok());
        CHECK(tomorrow.value().has_value());
    }

    CHECK(env.fx.attendance.count_codes_for_date("2026-03-01").value() == 1);
    CHECK(env.fx.attendance.list_codes_for_date("2026-03-01").value() ==
          std::vector<std::string>{"K7P2"});
}
