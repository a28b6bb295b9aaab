/**
 * @file pickup_repository.hpp
 * @brief Repository for standing pickup authorizations and the pickup log
 */

#pragma once

#include "checkin_database.hpp"
#include "pickup_record.hpp"

#include <checkin/core/result.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

namespace checkin::storage {

/**
 * @brief SQLite repository for pickup authorization data
 *
 * Authorizations are soft-deleted through is_active. Pickup log rows are
 * append-only; the schema rejects updates and deletes.
 *
 * Thread Safety: All methods are thread-safe.
 */
class pickup_repository {
public:
    explicit pickup_repository(checkin_database& db);

    // =========================================================================
    // Authorizations
    // =========================================================================

    /**
     * @brief Insert a new active authorization
     * @return Primary key, or duplicate_entry when the pair already has an
     *         active authorization
     */
    [[nodiscard]] auto insert_authorization(const authorized_pickup_record& record)
        -> Result<std::int64_t>;

    /**
     * @brief Insert an active authorization for a known person unless one
     *        already exists for the pair
     * @return true when a row was created
     */
    [[nodiscard]] auto insert_if_absent(std::int64_t child_id,
                                        std::int64_t person_id,
                                        pickup_relationship relationship,
                                        authorization_level level,
                                        std::chrono::system_clock::time_point now)
        -> Result<bool>;

    /**
     * @brief Update relationship, level, contact details and active flag
     * @return false when no row has the record's key
     */
    [[nodiscard]] auto update_authorization(const authorized_pickup_record& record)
        -> Result<bool>;

    /**
     * @brief Clear the active flag
     * @return false when the row does not exist or is already inactive
     */
    [[nodiscard]] auto deactivate(std::int64_t pickup_id,
                                  std::chrono::system_clock::time_point now)
        -> Result<bool>;

    [[nodiscard]] auto find_by_id(std::int64_t pickup_id)
        -> Result<std::optional<authorized_pickup_record>>;

    [[nodiscard]] auto find_active_for_child(std::int64_t child_id)
        -> Result<std::vector<authorized_pickup_record>>;

    /**
     * @brief Active authorization matching the pickup person
     *
     * Known people match on person key; named people match on name,
     * case-insensitively, among authorizations without a person key.
     */
    [[nodiscard]] auto find_active_match(std::int64_t child_id,
                                         const pickup_person& person)
        -> Result<std::optional<authorized_pickup_record>>;

    // =========================================================================
    // Pickup Log
    // =========================================================================

    [[nodiscard]] auto insert_log(const pickup_log_record& log) -> Result<std::int64_t>;

    /**
     * @brief Pickup log entries for a child, newest first
     */
    [[nodiscard]] auto find_logs(
        std::int64_t child_id,
        std::optional<std::chrono::system_clock::time_point> from,
        std::optional<std::chrono::system_clock::time_point> to)
        -> Result<std::vector<pickup_log_record>>;

    [[nodiscard]] auto count_logs_for_attendance(std::int64_t attendance_id)
        -> Result<int>;

private:
    checkin_database& db_;
};

}  // namespace checkin::storage
