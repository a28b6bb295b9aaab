/**
 * @file pickup_authorization_service.hpp
 * @brief Release decisions for checked-in children
 *
 * Decides whether a candidate may collect a child, records every release
 * in the append-only pickup log and manages each child's standing list of
 * authorized pickups.
 *
 * Decision policy for a candidate with a valid security code:
 *
 * | Standing authorization | Authorized | Supervisor override |
 * |------------------------|------------|---------------------|
 * | Always                 | yes        | no                  |
 * | EmergencyOnly          | no         | required            |
 * | Never                  | no         | not possible        |
 * | none                   | no         | required            |
 */

#pragma once

#include "pickup_types.hpp"

#include <checkin/core/clock.hpp>
#include <checkin/core/id_codec.hpp>
#include <checkin/core/result.hpp>
#include <checkin/security/pickup_rate_limiter.hpp>
#include <checkin/storage/attendance_repository.hpp>
#include <checkin/storage/checkin_database.hpp>
#include <checkin/storage/directory_interface.hpp>
#include <checkin/storage/pickup_repository.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace checkin::services {

/**
 * @brief Pickup authorization engine
 *
 * Verification outcomes (wrong code, unknown person, blocked person) are
 * values. Error Results are faults: malformed ids (invalid_id), invalid
 * pickup records (argument_error), blocked overrides (invalid_operation)
 * and storage errors.
 *
 * Thread Safety: All methods are thread-safe.
 */
class pickup_authorization_service {
public:
    pickup_authorization_service(storage::checkin_database& db,
                                 storage::directory_interface& directory,
                                 security::pickup_rate_limiter& limiter,
                                 const core::clock_source& clock,
                                 const core::id_codec& codec);

    // =========================================================================
    // Verification
    // =========================================================================

    /**
     * @brief Decide whether a candidate may collect the child of an attendance
     *
     * The security code is checked before the authorization list; a wrong
     * code never reveals list contents.
     */
    [[nodiscard]] auto verify(std::string_view attendance_id,
                              const pickup_candidate& candidate,
                              std::string_view presented_code)
        -> Result<pickup_verification>;

    /**
     * @brief verify() behind the per-(attendance, origin) attempt limiter
     *
     * Only a wrong security code counts as a failed attempt. A correct
     * code clears the counter.
     */
    [[nodiscard]] auto verify_with_rate_limit(std::string_view attendance_id,
                                              const pickup_candidate& candidate,
                                              std::string_view presented_code,
                                              const std::string& origin)
        -> Result<guarded_verification>;

    // =========================================================================
    // Recording
    // =========================================================================

    /**
     * @brief Log a release and close the attendance
     *
     * The log entry and the check-out commit together. A person on the
     * child's Never list can not be released even with an override.
     */
    [[nodiscard]] auto record_pickup(const record_pickup_request& request)
        -> Result<pickup_log_entry>;

    /**
     * @brief Pickup log of a child, newest first
     */
    [[nodiscard]] auto pickup_history(
        std::string_view child_id,
        std::optional<std::chrono::system_clock::time_point> from = std::nullopt,
        std::optional<std::chrono::system_clock::time_point> to = std::nullopt)
        -> Result<std::vector<pickup_log_entry>>;

    // =========================================================================
    // Standing Authorizations
    // =========================================================================

    /**
     * @brief Grant Always/Parent authorizations to the adults of the
     *        child's families
     *
     * Idempotent: pairs that already have an active authorization are left
     * alone.
     *
     * @return Number of authorizations created
     */
    [[nodiscard]] auto auto_populate_standing_authorizations(std::string_view child_id)
        -> Result<int>;

    [[nodiscard]] auto add_authorized_pickup(const add_authorized_pickup_request& request)
        -> Result<authorized_pickup_entry>;

    [[nodiscard]] auto update_authorized_pickup(
        const update_authorized_pickup_request& request)
        -> Result<authorized_pickup_entry>;

    /**
     * @return false when the authorization was already inactive
     */
    [[nodiscard]] auto deactivate_authorized_pickup(std::string_view pickup_id)
        -> Result<bool>;

    [[nodiscard]] auto list_authorized_pickups(std::string_view child_id)
        -> Result<std::vector<authorized_pickup_entry>>;

private:
    [[nodiscard]] auto decode_id(std::string_view external, const char* what) const
        -> Result<std::int64_t>;

    [[nodiscard]] auto to_pickup_person(const pickup_candidate& candidate) const
        -> Result<storage::pickup_person>;

    [[nodiscard]] auto require_person(std::int64_t person_id, const char* what)
        -> Result<storage::person_record>;

    [[nodiscard]] auto describe(const storage::pickup_person& person)
        -> Result<std::string>;

    [[nodiscard]] auto to_entry(const storage::authorized_pickup_record& record) const
        -> authorized_pickup_entry;

    /// Display names a log entry shows
    struct log_names {
        std::string child_name;
        std::string pickup_person_name;
        std::optional<std::string> supervisor_name;
    };

    [[nodiscard]] auto resolve_names(const storage::pickup_log_record& log)
        -> Result<log_names>;

    [[nodiscard]] auto to_entry(const storage::pickup_log_record& log,
                                const log_names& names) const -> pickup_log_entry;

    [[nodiscard]] auto to_entry(const storage::pickup_log_record& log)
        -> Result<pickup_log_entry>;

    storage::checkin_database& db_;
    storage::directory_interface& directory_;
    storage::attendance_repository attendance_;
    storage::pickup_repository pickups_;
    security::pickup_rate_limiter& limiter_;
    const core::clock_source& clock_;
    const core::id_codec& codec_;
};

}  // namespace checkin::services
