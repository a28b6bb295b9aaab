/**
 * @file sqlite_directory.hpp
 * @brief SQLite implementation of the directory
 */

#pragma once

#include "checkin_database.hpp"
#include "directory_interface.hpp"

namespace checkin::storage {

/**
 * @brief Directory backed by the check-in database
 *
 * Besides the lookups the core needs, it offers the save operations used
 * to seed the directory from an outer system or from tests.
 *
 * Thread Safety: All methods are thread-safe.
 */
class sqlite_directory final : public directory_interface {
public:
    explicit sqlite_directory(checkin_database& db);

    [[nodiscard]] auto find_person(std::int64_t person_id)
        -> Result<std::optional<person_record>> override;

    [[nodiscard]] auto find_location(std::int64_t location_id)
        -> Result<std::optional<location_record>> override;

    [[nodiscard]] auto find_schedule(std::int64_t schedule_id)
        -> Result<std::optional<schedule_record>> override;

    [[nodiscard]] auto find_family_adults(std::int64_t child_id)
        -> Result<std::vector<person_record>> override;

    /**
     * @brief Insert (pk == 0) or update a person
     * @return Primary key of the stored row
     */
    [[nodiscard]] auto save_person(const person_record& person) -> Result<std::int64_t>;

    [[nodiscard]] auto save_location(const location_record& location)
        -> Result<std::int64_t>;

    [[nodiscard]] auto save_schedule(const schedule_record& schedule)
        -> Result<std::int64_t>;

    /**
     * @brief Add a person to a family, or change their role in it
     */
    [[nodiscard]] auto add_family_member(std::int64_t family_id,
                                         std::int64_t person_id,
                                         family_role role) -> VoidResult;

private:
    checkin_database& db_;
};

}  // namespace checkin::storage
