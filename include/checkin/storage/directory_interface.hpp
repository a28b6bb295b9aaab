/**
 * @file directory_interface.hpp
 * @brief Read access to people, locations, schedules and families
 */

#pragma once

#include "directory_record.hpp"

#include <checkin/core/result.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace checkin::storage {

/**
 * @brief The directory contract the check-in core relies on
 *
 * Lookups return an empty optional when the key names no record; an
 * error Result means the directory itself failed.
 */
class directory_interface {
public:
    virtual ~directory_interface() = default;

    [[nodiscard]] virtual auto find_person(std::int64_t person_id)
        -> Result<std::optional<person_record>> = 0;

    [[nodiscard]] virtual auto find_location(std::int64_t location_id)
        -> Result<std::optional<location_record>> = 0;

    [[nodiscard]] virtual auto find_schedule(std::int64_t schedule_id)
        -> Result<std::optional<schedule_record>> = 0;

    /**
     * @brief Adults, parents and guardians sharing a family with the child
     *
     * The child is never part of the result.
     */
    [[nodiscard]] virtual auto find_family_adults(std::int64_t child_id)
        -> Result<std::vector<person_record>> = 0;
};

}  // namespace checkin::storage
