/**
 * @file checkin_service_test.cpp
 * @brief Unit tests for checkin_service
 */

#include <catch2/catch_test_macros.hpp>

#include "../fixtures/checkin_fixture.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <stop_token>
#include <thread>
#include <vector>

using namespace checkin;
using namespace checkin::services;
using namespace std::chrono_literals;

namespace {

struct service_env {
    explicit service_env(services::checkin_service_config config = {})
        : fx({}, {}, config) {}

    testing::checkin_fixture fx;
    std::int64_t child = fx.add_person("Sam", "Doe");
    std::int64_t room = fx.add_location("Toddler Room", 10, 8);
    std::int64_t schedule = fx.add_schedule();

    auto check_in(std::int64_t person) -> checkin_result {
        auto result = fx.checkin.check_in(fx.request(person, room, schedule));
        REQUIRE(result.is_ok());
        return result.value();
    }
};

}  // namespace

// ============================================================================
// Admission Tests
// ============================================================================

TEST_CASE("checkin_service admits an eligible person", "[checkin_service][check_in]") {
    service_env env;

    auto result = env.check_in(env.child);

    CHECK(result.success);
    CHECK(result.failure == checkin_failure::none);
    CHECK(result.message == "Sam Doe checked in to Toddler Room");
    CHECK(result.person.full_name == "Sam Doe");
    CHECK(result.location.name == "Toddler Room");
    CHECK(result.check_in_time == env.fx.clock.now());
    CHECK(result.is_first_time);
    CHECK_FALSE(result.capacity_warning);
    REQUIRE(result.security_code.has_value());
    CHECK(result.security_code->size() == 4);

    auto stored = env.fx.attendance.find_by_id(*env.fx.codec.decode(result.attendance_id));
    REQUIRE(stored.is_ok());
    REQUIRE(stored.value().has_value());
    CHECK(stored.value()->is_open());
    CHECK(stored.value()->security_code == *result.security_code);
}

TEST_CASE("checkin_service security code is optional", "[checkin_service][check_in]") {
    service_env env;
    auto request = env.fx.request(env.child, env.room, env.schedule);
    request.options.generate_security_code = false;

    auto result = env.fx.checkin.check_in(request);
    REQUIRE(result.is_ok());
    CHECK(result.value().success);
    CHECK_FALSE(result.value().security_code.has_value());
}

TEST_CASE("checkin_service rejects ineligible requests", "[checkin_service][check_in]") {
    service_env env;

    SECTION("malformed person id") {
        auto request = env.fx.request(env.child, env.room, env.schedule);
        request.person_id = "not-a-number";
        auto result = env.fx.checkin.check_in(request);
        REQUIRE(result.is_ok());
        CHECK(result.value().failure == checkin_failure::invalid_person_id);
    }

    SECTION("malformed location id") {
        auto request = env.fx.request(env.child, env.room, env.schedule);
        request.location_id = "";
        auto result = env.fx.checkin.check_in(request);
        REQUIRE(result.is_ok());
        CHECK(result.value().failure == checkin_failure::invalid_location_or_schedule_id);
    }

    SECTION("unknown person") {
        auto result = env.fx.checkin.check_in(env.fx.request(9999, env.room, env.schedule));
        REQUIRE(result.is_ok());
        CHECK(result.value().failure == checkin_failure::person_not_found);
    }

    SECTION("deceased person") {
        auto person = env.fx.add_person("Old", "Timer", true, true);
        auto result = env.fx.checkin.check_in(env.fx.request(person, env.room, env.schedule));
        REQUIRE(result.is_ok());
        CHECK(result.value().failure == checkin_failure::person_deceased);
    }

    SECTION("inactive person") {
        auto person = env.fx.add_person("Gone", "Away", false);
        auto result = env.fx.checkin.check_in(env.fx.request(person, env.room, env.schedule));
        REQUIRE(result.is_ok());
        CHECK(result.value().failure == checkin_failure::person_inactive);
    }

    SECTION("unknown location") {
        auto result = env.fx.checkin.check_in(env.fx.request(env.child, 9999, env.schedule));
        REQUIRE(result.is_ok());
        CHECK(result.value().failure == checkin_failure::location_not_found);
    }

    SECTION("inactive location") {
        auto closed = env.fx.add_location("Closed Room", 5, std::nullopt, false);
        auto result = env.fx.checkin.check_in(env.fx.request(env.child, closed, env.schedule));
        REQUIRE(result.is_ok());
        CHECK(result.value().failure == checkin_failure::location_inactive);
    }

    SECTION("unknown schedule") {
        auto result = env.fx.checkin.check_in(env.fx.request(env.child, env.room, 9999));
        REQUIRE(result.is_ok());
        CHECK(result.value().failure == checkin_failure::schedule_not_found);
    }

    SECTION("outside the check-in window") {
        storage::schedule_record saturday;
        saturday.name = "Saturday Evening";
        saturday.weekly_day_of_week = 6;
        saturday.weekly_time_minutes = 18 * 60;
        auto id = env.fx.directory.save_schedule(saturday);
        REQUIRE(id.is_ok());

        // The test clock sits on a Sunday morning
        auto result = env.fx.checkin.check_in(env.fx.request(env.child, env.room, id.value()));
        REQUIRE(result.is_ok());
        CHECK(result.value().failure == checkin_failure::outside_schedule);
    }

    SECTION("already checked in") {
        REQUIRE(env.check_in(env.child).success);
        auto again = env.check_in(env.child);
        CHECK_FALSE(again.success);
        CHECK(again.failure == checkin_failure::already_checked_in);
    }

    CHECK(env.fx.attendance.count_open_for_location(env.room, "2026-03-01").value() <= 1);
}

TEST_CASE("checkin_service weekly schedule window", "[checkin_service][schedule]") {
    service_env env;
    storage::schedule_record sunday;
    sunday.name = "Sunday 10:00";
    sunday.weekly_day_of_week = 0;
    sunday.weekly_time_minutes = 10 * 60;
    auto id = env.fx.directory.save_schedule(sunday);
    REQUIRE(id.is_ok());

    // Opens at 09:00, an hour before the start
    auto open = env.fx.checkin.check_in(env.fx.request(env.child, env.room, id.value()));
    REQUIRE(open.is_ok());
    CHECK(open.value().success);

    env.fx.clock.advance(2h);
    auto late = env.fx.add_person("Late", "Comer");
    auto closed = env.fx.checkin.check_in(env.fx.request(late, env.room, id.value()));
    REQUIRE(closed.is_ok());
    CHECK(closed.value().failure == checkin_failure::outside_schedule);
}

TEST_CASE("checkin_service schedule window across midnight", "[checkin_service][schedule]") {
    service_env env;
    const auto sunday = std::chrono::sys_days{std::chrono::year{2026} / 3 / 1};

    SECTION("opens on the evening before an early Monday start") {
        storage::schedule_record monday;
        monday.name = "Monday 00:15";
        monday.weekly_day_of_week = 1;
        monday.weekly_time_minutes = 15;
        auto id = env.fx.directory.save_schedule(monday);
        REQUIRE(id.is_ok());

        env.fx.clock.set(sunday + 23h + 30min);
        auto admitted = env.fx.checkin.check_in(env.fx.request(env.child, env.room, id.value()));
        REQUIRE(admitted.is_ok());
        CHECK(admitted.value().success);

        env.fx.clock.set(sunday + 23h);
        auto early = env.fx.add_person("Early", "Bird");
        auto refused = env.fx.checkin.check_in(env.fx.request(early, env.room, id.value()));
        REQUIRE(refused.is_ok());
        CHECK(refused.value().failure == checkin_failure::outside_schedule);
    }

    SECTION("stays open past midnight after a late Sunday start") {
        storage::schedule_record late_sunday;
        late_sunday.name = "Sunday 23:50";
        late_sunday.weekly_day_of_week = 0;
        late_sunday.weekly_time_minutes = 23 * 60 + 50;
        auto id = env.fx.directory.save_schedule(late_sunday);
        REQUIRE(id.is_ok());

        env.fx.clock.set(sunday + 24h + 10min);
        auto admitted = env.fx.checkin.check_in(env.fx.request(env.child, env.room, id.value()));
        REQUIRE(admitted.is_ok());
        CHECK(admitted.value().success);

        env.fx.clock.set(sunday + 24h + 30min);
        auto late = env.fx.add_person("Late", "Comer");
        auto refused = env.fx.checkin.check_in(env.fx.request(late, env.room, id.value()));
        REQUIRE(refused.is_ok());
        CHECK(refused.value().failure == checkin_failure::outside_schedule);
    }
}

TEST_CASE("checkin_service first-time flag", "[checkin_service][first_time]") {
    service_env env;

    auto first = env.check_in(env.child);
    REQUIRE(first.success);
    CHECK(first.is_first_time);

    auto checked_out = env.fx.checkin.check_out(first.attendance_id);
    REQUIRE(checked_out.is_ok());
    REQUIRE(checked_out.value());

    env.fx.clock.advance(std::chrono::days{7});
    auto second = env.check_in(env.child);
    REQUIRE(second.success);
    CHECK_FALSE(second.is_first_time);
}

// ============================================================================
// Capacity Tests
// ============================================================================

TEST_CASE("checkin_service enforces hard capacity", "[checkin_service][capacity]") {
    testing::checkin_fixture fx;
    auto room = fx.add_location("Nursery", 2);
    auto schedule = fx.add_schedule();

    auto a = fx.checkin.check_in(fx.request(fx.add_person("A", "One"), room, schedule));
    auto b = fx.checkin.check_in(fx.request(fx.add_person("B", "Two"), room, schedule));
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    CHECK(a.value().success);
    CHECK(b.value().success);
    CHECK(b.value().capacity_warning);

    auto c = fx.checkin.check_in(fx.request(fx.add_person("C", "Three"), room, schedule));
    REQUIRE(c.is_ok());
    CHECK_FALSE(c.value().success);
    CHECK(c.value().failure == checkin_failure::at_capacity);
    CHECK(c.value().message == "Nursery is at capacity (2/2)");

    SECTION("checking out frees a slot") {
        REQUIRE(fx.checkin.check_out(a.value().attendance_id).value());
        auto d = fx.checkin.check_in(fx.request(fx.add_person("D", "Four"), room, schedule));
        REQUIRE(d.is_ok());
        CHECK(d.value().success);
    }
}

TEST_CASE("checkin_service concurrent admissions never exceed capacity",
          "[checkin_service][capacity][concurrency]") {
    testing::checkin_fixture fx;
    constexpr int capacity = 5;
    constexpr int contenders = 20;
    auto room = fx.add_location("Small Room", capacity);
    auto schedule = fx.add_schedule();

    std::vector<std::int64_t> people;
    for (int i = 0; i < contenders; ++i) {
        people.push_back(fx.add_person("Kid", "Number" + std::to_string(i)));
    }

    std::atomic<int> admitted{0};
    std::atomic<int> refused{0};
    std::vector<std::thread> threads;
    for (auto person : people) {
        threads.emplace_back([&, person] {
            auto result = fx.checkin.check_in(fx.request(person, room, schedule));
            if (result.is_ok() && result.value().success) {
                ++admitted;
            } else if (result.is_ok() &&
                       result.value().failure == checkin_failure::at_capacity) {
                ++refused;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(admitted.load() == capacity);
    CHECK(refused.load() == contenders - capacity);
    CHECK(fx.attendance.count_open_for_location(room, "2026-03-01").value() == capacity);
}

TEST_CASE("checkin_service concurrent duplicates admit once",
          "[checkin_service][concurrency]") {
    service_env env;

    std::atomic<int> admitted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto result = env.fx.checkin.check_in(
                env.fx.request(env.child, env.room, env.schedule));
            if (result.is_ok() && result.value().success) {
                ++admitted;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(admitted.load() == 1);
}

TEST_CASE("checkin_service issues distinct codes", "[checkin_service][codes]") {
    testing::checkin_fixture fx;
    auto room = fx.add_location("Big Room");
    auto schedule = fx.add_schedule();

    std::set<std::string> codes;
    for (int i = 0; i < 30; ++i) {
        auto result = fx.admit(fx.add_person("Kid", "N" + std::to_string(i)), room, schedule);
        REQUIRE(result.security_code.has_value());
        CHECK(codes.insert(*result.security_code).second);
    }
}

TEST_CASE("checkin_service location_capacity", "[checkin_service][capacity]") {
    service_env env;

    auto empty = env.fx.checkin.location_capacity(env.fx.codec.encode(env.room));
    REQUIRE(empty.is_ok());
    CHECK(empty.value().current_count == 0);
    CHECK(empty.value().status == capacity_status::available);
    CHECK(empty.value().percentage_full == 0);

    for (int i = 0; i < 8; ++i) {
        env.fx.admit(env.fx.add_person("Kid", "N" + std::to_string(i)), env.room,
                     env.schedule);
    }
    auto warning = env.fx.checkin.location_capacity(env.fx.codec.encode(env.room));
    REQUIRE(warning.is_ok());
    CHECK(warning.value().current_count == 8);
    CHECK(warning.value().status == capacity_status::warning);
    CHECK(warning.value().percentage_full == 80);

    for (int i = 8; i < 10; ++i) {
        env.fx.admit(env.fx.add_person("Kid", "N" + std::to_string(i)), env.room,
                     env.schedule);
    }
    auto full = env.fx.checkin.location_capacity(env.fx.codec.encode(env.room));
    REQUIRE(full.is_ok());
    CHECK(full.value().status == capacity_status::full);
    CHECK(full.value().percentage_full == 100);

    SECTION("unknown location is an error") {
        auto missing = env.fx.checkin.location_capacity(env.fx.codec.encode(9999));
        REQUIRE(missing.is_err());
        CHECK(missing.error().code == error_codes::not_found);
    }

    SECTION("malformed id is an error") {
        auto bad = env.fx.checkin.location_capacity("x");
        REQUIRE(bad.is_err());
        CHECK(bad.error().code == error_codes::invalid_id);
    }
}

// ============================================================================
// Validation Tests
// ============================================================================

TEST_CASE("checkin_service validate_check_in reserves nothing",
          "[checkin_service][validate]") {
    service_env env;
    auto request = env.fx.request(env.child, env.room, env.schedule);

    auto validation = env.fx.checkin.validate_check_in(request);
    REQUIRE(validation.is_ok());
    CHECK(validation.value().allowed);
    CHECK(validation.value().message == "Check-in allowed");
    CHECK(env.fx.attendance.count_open_for_location(env.room, "2026-03-01").value() == 0);

    REQUIRE(env.check_in(env.child).success);
    auto again = env.fx.checkin.validate_check_in(request);
    REQUIRE(again.is_ok());
    CHECK_FALSE(again.value().allowed);
    CHECK(again.value().reason == checkin_failure::already_checked_in);
}

TEST_CASE("checkin_service validate_check_in creates no occurrence",
          "[checkin_service][validate]") {
    service_env env;
    auto evening = env.fx.add_schedule("Sunday Evening");

    SECTION("before anyone has checked in") {
        auto validation = env.fx.checkin.validate_check_in(
            env.fx.request(env.child, env.room, env.schedule));
        REQUIRE(validation.is_ok());
        CHECK(validation.value().allowed);

        auto occurrence = env.fx.attendance.find_occurrence(env.room, env.schedule,
                                                            "2026-03-01");
        REQUIRE(occurrence.is_ok());
        CHECK_FALSE(occurrence.value().has_value());
    }

    SECTION("while present under another schedule") {
        REQUIRE(env.check_in(env.child).success);

        auto validation = env.fx.checkin.validate_check_in(
            env.fx.request(env.child, env.room, evening));
        REQUIRE(validation.is_ok());
        CHECK(validation.value().allowed);

        auto occurrence = env.fx.attendance.find_occurrence(env.room, evening, "2026-03-01");
        REQUIRE(occurrence.is_ok());
        CHECK_FALSE(occurrence.value().has_value());
    }
}

// ============================================================================
// Batch Tests
// ============================================================================

TEST_CASE("checkin_service batch items are independent", "[checkin_service][batch]") {
    service_env env;
    auto sibling = env.fx.add_person("Ana", "Doe");
    auto deceased = env.fx.add_person("Old", "Timer", true, true);

    std::vector<checkin_request> requests{
        env.fx.request(env.child, env.room, env.schedule),
        env.fx.request(deceased, env.room, env.schedule),
        env.fx.request(sibling, env.room, env.schedule),
    };

    auto batch = env.fx.checkin.batch_check_in(requests);
    REQUIRE(batch.results.size() == 3);
    CHECK(batch.success_count == 2);
    CHECK(batch.failure_count == 1);
    CHECK_FALSE(batch.all_succeeded());
    CHECK(batch.results[0].success);
    CHECK(batch.results[1].failure == checkin_failure::person_deceased);
    CHECK(batch.results[2].success);
}

TEST_CASE("checkin_service batch honors cancellation", "[checkin_service][batch][cancel]") {
    service_env env;
    std::stop_source source;
    source.request_stop();

    auto batch = env.fx.checkin.batch_check_in(
        {env.fx.request(env.child, env.room, env.schedule)}, source.get_token());
    REQUIRE(batch.results.size() == 1);
    CHECK(batch.results[0].failure == checkin_failure::cancelled);
    CHECK(env.fx.attendance.count_open_for_location(env.room, "2026-03-01").value() == 0);
}

TEST_CASE("checkin_service busy location is a transient failure",
          "[checkin_service][batch][timeout]") {
    workflow::location_lock_config locks;
    locks.acquire_timeout = 50ms;
    locks.wait_slice = 10ms;
    testing::checkin_fixture fx{locks};
    auto room = fx.add_location("Room");
    auto schedule = fx.add_schedule();
    auto person = fx.add_person("Sam", "Doe");

    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    auto holder = std::async(std::launch::async, [&] {
        return fx.locks.execute_with_location_lock(room, [&]() -> Result<int> {
            entered.set_value();
            release_future.wait();
            return 0;
        });
    });
    entered.get_future().wait();

    auto batch = fx.checkin.batch_check_in({fx.request(person, room, schedule)});
    release.set_value();
    REQUIRE(holder.get().is_ok());

    REQUIRE(batch.results.size() == 1);
    CHECK(batch.results[0].failure == checkin_failure::transient_failure);
}

// ============================================================================
// Check-out and Query Tests
// ============================================================================

TEST_CASE("checkin_service check_out closes once", "[checkin_service][check_out]") {
    service_env env;
    auto admitted = env.check_in(env.child);

    auto first = env.fx.checkin.check_out(admitted.attendance_id);
    REQUIRE(first.is_ok());
    CHECK(first.value());

    auto second = env.fx.checkin.check_out(admitted.attendance_id);
    REQUIRE(second.is_ok());
    CHECK_FALSE(second.value());

    auto unknown = env.fx.checkin.check_out(env.fx.codec.encode(9999));
    REQUIRE(unknown.is_ok());
    CHECK_FALSE(unknown.value());

    auto malformed = env.fx.checkin.check_out("abc");
    REQUIRE(malformed.is_err());
    CHECK(malformed.error().code == error_codes::invalid_id);
}

TEST_CASE("checkin_service current_occupants", "[checkin_service][query]") {
    service_env env;
    auto zoe = env.fx.add_person("Zoe", "Adams");
    auto first = env.check_in(env.child);
    env.check_in(zoe);

    auto occupants = env.fx.checkin.current_occupants(env.fx.codec.encode(env.room));
    REQUIRE(occupants.is_ok());
    REQUIRE(occupants.value().size() == 2);
    CHECK(occupants.value()[0].person.last_name == "Adams");
    CHECK(occupants.value()[1].person.last_name == "Doe");
    CHECK(occupants.value()[1].security_code == *first.security_code);

    REQUIRE(env.fx.checkin.check_out(first.attendance_id).value());
    auto after = env.fx.checkin.current_occupants(env.fx.codec.encode(env.room));
    REQUIRE(after.is_ok());
    CHECK(after.value().size() == 1);
}

TEST_CASE("checkin_service person_history", "[checkin_service][query]") {
    service_env env;
    auto first = env.check_in(env.child);
    REQUIRE(env.fx.checkin.check_out(first.attendance_id).value());

    env.fx.clock.advance(std::chrono::days{7});
    env.check_in(env.child);

    auto history = env.fx.checkin.person_history(env.fx.codec.encode(env.child));
    REQUIRE(history.is_ok());
    REQUIRE(history.value().size() == 2);
    CHECK(history.value()[0].occurrence_date == "2026-03-08");
    CHECK_FALSE(history.value()[0].end_time.has_value());
    CHECK(history.value()[1].occurrence_date == "2026-03-01");
    CHECK(history.value()[1].end_time.has_value());
    CHECK(history.value()[1].location.name == "Toddler Room");

    auto recent = env.fx.checkin.person_history(env.fx.codec.encode(env.child), 3);
    REQUIRE(recent.is_ok());
    CHECK(recent.value().size() == 1);

    auto none = env.fx.checkin.person_history(env.fx.codec.encode(env.child), 0);
    REQUIRE(none.is_ok());
    CHECK(none.value().empty());
}

TEST_CASE("checkin_service batch with a malformed id", "[checkin_service][batch]") {
    service_env env;
    auto request = env.fx.request(env.child, env.room, env.schedule);
    auto broken = request;
    broken.person_id = "??";

    auto batch = env.fx.checkin.batch_check_in({request, broken});
    CHECK(batch.success_count == 1);
    CHECK(batch.failure_count == 1);
    CHECK_FALSE(batch.all_succeeded());
    CHECK(batch.results[1].failure == checkin_failure::invalid_person_id);
}

TEST_CASE("checkin_service single-seat room", "[checkin_service][capacity]") {
    testing::checkin_fixture fx;
    auto room = fx.add_location("Quiet Room", 1);
    auto schedule = fx.add_schedule();
    auto a = fx.add_person("Amy", "Able");
    auto b = fx.add_person("Ben", "Baker");

    auto first = fx.admit(a, room, schedule);

    auto refused = fx.checkin.check_in(fx.request(b, room, schedule));
    REQUIRE(refused.is_ok());
    CHECK(refused.value().failure == checkin_failure::at_capacity);

    REQUIRE(fx.checkin.check_out(first.attendance_id).value());

    auto admitted = fx.checkin.check_in(fx.request(b, room, schedule));
    REQUIRE(admitted.is_ok());
    CHECK(admitted.value().success);
}
