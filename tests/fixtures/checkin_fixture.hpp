/**
 * @file checkin_fixture.hpp
 * @brief In-memory database with the full component graph for tests
 */

#pragma once

#include "../mocks/manual_clock.hpp"

#include <checkin/core/id_codec.hpp>
#include <checkin/security/pickup_rate_limiter.hpp>
#include <checkin/security/security_code_issuer.hpp>
#include <checkin/services/checkin_service.hpp>
#include <checkin/services/pickup_authorization_service.hpp>
#include <checkin/storage/attendance_repository.hpp>
#include <checkin/storage/checkin_database.hpp>
#include <checkin/storage/pickup_repository.hpp>
#include <checkin/storage/sqlite_directory.hpp>
#include <checkin/workflow/location_lock_manager.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace checkin::testing {

/// Open a migrated in-memory database or fail the test
inline auto open_test_database() -> std::unique_ptr<storage::checkin_database> {
    auto db = storage::checkin_database::open(":memory:");
    if (db.is_err()) {
        throw std::runtime_error("Failed to open in-memory database: " +
                                 db.error().message);
    }
    return std::move(db.value());
}

/**
 * @brief Wires every component over one in-memory database
 */
struct checkin_fixture {
    explicit checkin_fixture(workflow::location_lock_config lock_config = {},
                             security::security_code_config code_config = {},
                             services::checkin_service_config service_config = {})
        : db(open_test_database()),
          directory(*db),
          attendance(*db),
          pickups(*db),
          locks(lock_config),
          issuer(attendance, clock, code_config),
          limiter(clock),
          checkin(*db, directory, locks, issuer, clock, codec, service_config),
          pickup(*db, directory, limiter, clock, codec) {}

    auto add_person(const std::string& first, const std::string& last,
                    bool active = true, bool deceased = false) -> std::int64_t {
        storage::person_record person;
        person.first_name = first;
        person.last_name = last;
        person.is_active = active;
        person.is_deceased = deceased;
        return require(directory.save_person(person));
    }

    auto add_location(const std::string& name,
                      std::optional<int> hard_capacity = std::nullopt,
                      std::optional<int> soft_capacity = std::nullopt,
                      bool active = true) -> std::int64_t {
        storage::location_record location;
        location.name = name;
        location.hard_capacity = hard_capacity;
        location.soft_capacity = soft_capacity;
        location.is_active = active;
        return require(directory.save_location(location));
    }

    /// Schedule without a weekly definition, always open
    auto add_schedule(const std::string& name = "Sunday Morning") -> std::int64_t {
        storage::schedule_record schedule;
        schedule.name = name;
        return require(directory.save_schedule(schedule));
    }

    auto request(std::int64_t person, std::int64_t location, std::int64_t schedule)
        -> services::checkin_request {
        return services::checkin_request{codec.encode(person), codec.encode(location),
                                         codec.encode(schedule), {}};
    }

    /// Check a person in and return the successful result
    auto admit(std::int64_t person, std::int64_t location, std::int64_t schedule)
        -> services::checkin_result {
        auto result = checkin.check_in(request(person, location, schedule));
        if (result.is_err() || !result.value().success) {
            throw std::runtime_error("Check-in unexpectedly failed");
        }
        return result.value();
    }

    manual_clock clock;
    core::numeric_id_codec codec;
    std::unique_ptr<storage::checkin_database> db;
    storage::sqlite_directory directory;
    storage::attendance_repository attendance;
    storage::pickup_repository pickups;
    workflow::location_lock_manager locks;
    security::security_code_issuer issuer;
    security::pickup_rate_limiter limiter;
    services::checkin_service checkin;
    services::pickup_authorization_service pickup;

private:
    template <typename T>
    static auto require(const Result<T>& result) -> T {
        if (result.is_err()) {
            throw std::runtime_error("Fixture setup failed: " + result.error().message);
        }
        return result.value();
    }
};

}  // namespace checkin::testing
