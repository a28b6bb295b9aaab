/**
 * @file pickup_repository_test.cpp
 * @brief Unit tests for pickup_repository
 */

#include <catch2/catch_test_macros.hpp>

#include "../fixtures/checkin_fixture.hpp"

#include <chrono>

using namespace checkin;
using namespace checkin::storage;
using namespace std::chrono_literals;

namespace {

struct pickup_env {
    testing::checkin_fixture fx;
    std::int64_t child = fx.add_person("Sam", "Doe");
    std::int64_t parent = fx.add_person("Pat", "Doe");

    auto authorization(pickup_person person, authorization_level level)
        -> authorized_pickup_record {
        authorized_pickup_record record;
        record.child_person_id = child;
        record.person = std::move(person);
        record.relationship = pickup_relationship::grandparent;
        record.level = level;
        record.created_at = fx.clock.now();
        record.modified_at = record.created_at;
        return record;
    }
};

}  // namespace

TEST_CASE("pickup_repository authorizations", "[pickup_repository][authorization]") {
    pickup_env env;

    auto id = env.fx.pickups.insert_authorization(
        env.authorization(known_person{env.parent}, authorization_level::always));
    REQUIRE(id.is_ok());

    SECTION("stored row carries the directory name") {
        auto found = env.fx.pickups.find_by_id(id.value());
        REQUIRE(found.is_ok());
        REQUIRE(found.value().has_value());
        CHECK(found.value()->display_name == "Pat Doe");
        CHECK(found.value()->level == authorization_level::always);
        CHECK(std::get<known_person>(found.value()->person).person_id == env.parent);
    }

    SECTION("second active row for the same pair is a duplicate") {
        auto duplicate = env.fx.pickups.insert_authorization(
            env.authorization(known_person{env.parent}, authorization_level::never));
        REQUIRE(duplicate.is_err());
        CHECK(duplicate.error().code == error_codes::duplicate_entry);
    }

    SECTION("deactivation frees the pair") {
        auto deactivated = env.fx.pickups.deactivate(id.value(), env.fx.clock.now());
        REQUIRE(deactivated.is_ok());
        CHECK(deactivated.value());

        auto again = env.fx.pickups.deactivate(id.value(), env.fx.clock.now());
        REQUIRE(again.is_ok());
        CHECK_FALSE(again.value());

        CHECK(env.fx.pickups.find_active_for_child(env.child).value().empty());
        CHECK(env.fx.pickups
                  .insert_authorization(env.authorization(known_person{env.parent},
                                                          authorization_level::always))
                  .is_ok());
    }

    SECTION("update changes level") {
        auto record = *env.fx.pickups.find_by_id(id.value()).value();
        record.level = authorization_level::emergency_only;
        record.phone_number = "555-0100";
        auto updated = env.fx.pickups.update_authorization(record);
        REQUIRE(updated.is_ok());
        CHECK(updated.value());

        auto found = env.fx.pickups.find_by_id(id.value());
        CHECK(found.value()->level == authorization_level::emergency_only);
        CHECK(found.value()->phone_number == "555-0100");
    }
}

TEST_CASE("pickup_repository insert_if_absent", "[pickup_repository][upsert]") {
    pickup_env env;
    auto now = env.fx.clock.now();

    auto first = env.fx.pickups.insert_if_absent(env.child, env.parent,
                                                 pickup_relationship::parent,
                                                 authorization_level::always, now);
    REQUIRE(first.is_ok());
    CHECK(first.value());

    auto second = env.fx.pickups.insert_if_absent(env.child, env.parent,
                                                  pickup_relationship::parent,
                                                  authorization_level::always, now);
    REQUIRE(second.is_ok());
    CHECK_FALSE(second.value());
    CHECK(env.fx.pickups.find_active_for_child(env.child).value().size() == 1);
}

TEST_CASE("pickup_repository find_active_match", "[pickup_repository][match]") {
    pickup_env env;
    REQUIRE(env.fx.pickups
                .insert_authorization(env.authorization(named_person{"Grandma Rose"},
                                                        authorization_level::emergency_only))
                .is_ok());

    SECTION("named people match case-insensitively") {
        auto match = env.fx.pickups.find_active_match(env.child, named_person{"grandma rose"});
        REQUIRE(match.is_ok());
        REQUIRE(match.value().has_value());
        CHECK(match.value()->level == authorization_level::emergency_only);
        CHECK(match.value()->display_name == "Grandma Rose");
    }

    SECTION("a known person does not match a named authorization") {
        auto match = env.fx.pickups.find_active_match(env.child, known_person{env.parent});
        REQUIRE(match.is_ok());
        CHECK_FALSE(match.value().has_value());
    }

    SECTION("other children are not affected") {
        auto other_child = env.fx.add_person("Max", "Roe");
        auto match = env.fx.pickups.find_active_match(other_child, named_person{"Grandma Rose"});
        REQUIRE(match.is_ok());
        CHECK_FALSE(match.value().has_value());
    }
}

TEST_CASE("pickup_repository log is append-only", "[pickup_repository][log]") {
    pickup_env env;
    auto room = env.fx.add_location("Room A");
    auto schedule = env.fx.add_schedule();
    auto admitted = env.fx.admit(env.child, room, schedule);
    auto attendance_id = *env.fx.codec.decode(admitted.attendance_id);

    pickup_log_record log;
    log.attendance_id = attendance_id;
    log.child_person_id = env.child;
    log.person = known_person{env.parent};
    log.was_authorized = true;
    log.checkout_time = env.fx.clock.now();

    auto first = env.fx.pickups.insert_log(log);
    REQUIRE(first.is_ok());

    env.fx.clock.advance(2h);
    log.checkout_time = env.fx.clock.now();
    log.person = named_person{"Uncle Bob"};
    REQUIRE(env.fx.pickups.insert_log(log).is_ok());

    SECTION("newest first") {
        auto logs = env.fx.pickups.find_logs(env.child, std::nullopt, std::nullopt);
        REQUIRE(logs.is_ok());
        REQUIRE(logs.value().size() == 2);
        CHECK(std::holds_alternative<named_person>(logs.value()[0].person));
        CHECK(logs.value()[1].pk == first.value());
    }

    SECTION("bounded by from") {
        auto logs = env.fx.pickups.find_logs(env.child, env.fx.clock.now() - 1h, std::nullopt);
        REQUIRE(logs.is_ok());
        CHECK(logs.value().size() == 1);
    }

    SECTION("bounded by to") {
        auto logs = env.fx.pickups.find_logs(env.child, std::nullopt, env.fx.clock.now() - 1h);
        REQUIRE(logs.is_ok());
        CHECK(logs.value().size() == 1);
    }

    SECTION("rows can not be changed") {
        CHECK(env.fx.db->execute("UPDATE pickup_logs SET notes = 'x';").is_err());
        CHECK(env.fx.db->execute("DELETE FROM pickup_logs;").is_err());
        CHECK(env.fx.pickups.count_logs_for_attendance(attendance_id).value() == 2);
    }
}
