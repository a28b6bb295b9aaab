/**
 * @file attendance_repository.hpp
 * @brief Repository for occurrences, attendances and security codes
 *
 * This is the only writer of attendance rows. Occupancy is always derived
 * from open attendance rows; no counter is stored.
 */

#pragma once

#include "attendance_record.hpp"
#include "checkin_database.hpp"

#include <checkin/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace checkin::storage {

/**
 * @brief SQLite repository for attendance data
 *
 * Thread Safety: All methods are thread-safe. Multi-statement sequences
 * that must be atomic are wrapped by the caller in
 * checkin_database::transaction().
 */
class attendance_repository {
public:
    explicit attendance_repository(checkin_database& db);

    // =========================================================================
    // Occurrences
    // =========================================================================

    /**
     * @brief Fetch the occurrence for (location, schedule, date), creating it
     *        if absent
     *
     * Concurrent first calls for the same key all receive the same row.
     *
     * @param occurrence_date Calendar date as "YYYY-MM-DD"
     */
    [[nodiscard]] auto get_or_create_occurrence(std::int64_t location_id,
                                                std::int64_t schedule_id,
                                                std::string_view occurrence_date)
        -> Result<occurrence_record>;

    /**
     * @brief Look up the occurrence for (location, schedule, date) without
     *        creating it
     */
    [[nodiscard]] auto find_occurrence(std::int64_t location_id,
                                       std::int64_t schedule_id,
                                       std::string_view occurrence_date)
        -> Result<std::optional<occurrence_record>>;

    // =========================================================================
    // Attendances
    // =========================================================================

    /**
     * @brief Number of open attendances at a location on a date
     */
    [[nodiscard]] auto count_open_for_location(std::int64_t location_id,
                                               std::string_view occurrence_date)
        -> Result<int>;

    [[nodiscard]] auto has_open_attendance(std::int64_t person_id,
                                           std::int64_t occurrence_id)
        -> Result<bool>;

    /**
     * @brief Whether the person has ever attended the location
     */
    [[nodiscard]] auto has_attended_location(std::int64_t person_id,
                                             std::int64_t location_id)
        -> Result<bool>;

    /**
     * @brief Insert an open attendance
     * @return Primary key, or duplicate_entry when the person already has an
     *         open attendance for the occurrence
     */
    [[nodiscard]] auto insert_attendance(const attendance_record& record)
        -> Result<std::int64_t>;

    /**
     * @brief Close an open attendance
     * @return true when the row was open and is now closed, false when it
     *         does not exist or was already closed
     */
    [[nodiscard]] auto close_attendance(std::int64_t attendance_id,
                                        std::chrono::system_clock::time_point end_time)
        -> Result<bool>;

    [[nodiscard]] auto find_by_id(std::int64_t attendance_id)
        -> Result<std::optional<attendance_record>>;

    /**
     * @brief Open attendances at a location on a date, ordered by the
     *        attendee's last name then first name
     */
    [[nodiscard]] auto find_open_by_location(std::int64_t location_id,
                                             std::string_view occurrence_date)
        -> Result<std::vector<attendance_record>>;

    /**
     * @brief Attendances of a person that started at or after `since`,
     *        most recent first
     */
    [[nodiscard]] auto find_history(std::int64_t person_id,
                                    std::chrono::system_clock::time_point since)
        -> Result<std::vector<attendance_record>>;

    // =========================================================================
    // Security Codes
    // =========================================================================

    /**
     * @brief Store a code for a date
     * @return The stored record, or nullopt when the code is already taken
     *         for that date
     */
    [[nodiscard]] auto insert_security_code(std::string_view issue_date,
                                            std::string_view code,
                                            std::chrono::system_clock::time_point issued_at)
        -> Result<std::optional<security_code_record>>;

    [[nodiscard]] auto count_codes_for_date(std::string_view issue_date)
        -> Result<std::int64_t>;

    [[nodiscard]] auto list_codes_for_date(std::string_view issue_date)
        -> Result<std::vector<std::string>>;

private:
    checkin_database& db_;
};

}  // namespace checkin::storage
