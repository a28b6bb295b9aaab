/**
 * @file failing_directory.hpp
 * @brief Directory wrapper that can fail lookups of one person on demand
 */

#pragma once

#include <checkin/core/result.hpp>
#include <checkin/storage/directory_interface.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace checkin::testing {

/**
 * @brief Forwards to a real directory unless told to fail
 *
 * While failing_person is set, find_person for that id returns a
 * database_query_error. Every other lookup is forwarded unchanged.
 */
class failing_directory final : public storage::directory_interface {
public:
    explicit failing_directory(storage::directory_interface& inner) : inner_(inner) {}

    auto find_person(std::int64_t person_id)
        -> Result<std::optional<storage::person_record>> override {
        if (failing_person && *failing_person == person_id) {
            return checkin_error<std::optional<storage::person_record>>(
                error_codes::database_query_error, "Directory unavailable",
                "failing_directory");
        }
        return inner_.find_person(person_id);
    }

    auto find_location(std::int64_t location_id)
        -> Result<std::optional<storage::location_record>> override {
        return inner_.find_location(location_id);
    }

    auto find_schedule(std::int64_t schedule_id)
        -> Result<std::optional<storage::schedule_record>> override {
        return inner_.find_schedule(schedule_id);
    }

    auto find_family_adults(std::int64_t child_id)
        -> Result<std::vector<storage::person_record>> override {
        return inner_.find_family_adults(child_id);
    }

    std::optional<std::int64_t> failing_person;

private:
    storage::directory_interface& inner_;
};

}  // namespace checkin::testing
