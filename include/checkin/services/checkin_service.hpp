/**
 * @file checkin_service.hpp
 * @brief Admission and release of attendees
 *
 * The check-in service validates a request, reserves a slot under the
 * location's lock, creates the attendance and issues its security code.
 * It is the only component that creates or closes attendance rows.
 *
 * @example
 * @code
 * checkin_service service{db, directory, locks, issuer, clock, codec};
 *
 * checkin_request request;
 * request.person_id = "42";
 * request.location_id = "7";
 * request.schedule_id = "3";
 *
 * auto result = service.check_in(request);
 * if (result.is_ok() && result.value().success) {
 *     print_label(*result.value().security_code);
 * }
 * @endcode
 */

#pragma once

#include "checkin_types.hpp"

#include <checkin/core/clock.hpp>
#include <checkin/core/id_codec.hpp>
#include <checkin/core/result.hpp>
#include <checkin/security/security_code_issuer.hpp>
#include <checkin/storage/attendance_repository.hpp>
#include <checkin/storage/checkin_database.hpp>
#include <checkin/storage/directory_interface.hpp>
#include <checkin/workflow/location_lock_manager.hpp>

#include <chrono>
#include <stop_token>
#include <string_view>
#include <variant>
#include <vector>

namespace checkin::services {

/**
 * @brief Tunables of the check-in service
 */
struct checkin_service_config {
    /// Percentage of hard capacity at which a location reports a warning
    int near_capacity_percent{80};

    /// Single check-ins slower than this are logged as warnings
    std::chrono::milliseconds slow_operation_threshold{200};

    /// Batches slower than this are logged as warnings
    std::chrono::milliseconds slow_batch_threshold{500};

    /// History window used when the caller does not name one
    int default_history_days{30};
};

/**
 * @brief Check-in orchestrator
 *
 * Business outcomes (full room, duplicate, inactive person...) are
 * returned as checkin_result values inside an ok Result. Error Results
 * are faults: lock_timeout, operation_cancelled, storage errors and, for
 * operations other than check-in, invalid_id.
 *
 * Thread Safety: All methods are thread-safe.
 */
class checkin_service {
public:
    checkin_service(storage::checkin_database& db,
                    storage::directory_interface& directory,
                    workflow::location_lock_manager& locks,
                    security::security_code_issuer& issuer,
                    const core::clock_source& clock,
                    const core::id_codec& codec,
                    checkin_service_config config = {});

    /**
     * @brief Admit one person to a location for a schedule, today
     *
     * Malformed identifiers are rejected before the location lock is
     * taken. If the stop token fires after the attendance was committed
     * the admission stands.
     */
    [[nodiscard]] auto check_in(const checkin_request& request,
                                std::stop_token stop = {})
        -> Result<checkin_result>;

    /**
     * @brief Admit several people, each independently
     *
     * One item's failure never affects another. Faults for an item are
     * reported as that item's transient_failure, cancelled or
     * system_error outcome.
     */
    [[nodiscard]] auto batch_check_in(const std::vector<checkin_request>& requests,
                                      std::stop_token stop = {})
        -> batch_checkin_result;

    /**
     * @brief Run the admission checks without reserving a slot
     */
    [[nodiscard]] auto validate_check_in(const checkin_request& request)
        -> Result<checkin_validation>;

    /**
     * @brief Close an attendance
     * @return true once; false when missing or already closed
     */
    [[nodiscard]] auto check_out(std::string_view attendance_id) -> Result<bool>;

    /**
     * @brief People currently checked in at a location today, by last name
     */
    [[nodiscard]] auto current_occupants(std::string_view location_id)
        -> Result<std::vector<occupant_entry>>;

    /**
     * @brief Attendances of a person over the last window_days days,
     *        most recent first
     *
     * A window of zero or less yields an empty list.
     */
    [[nodiscard]] auto person_history(std::string_view person_id, int window_days)
        -> Result<std::vector<attendance_summary>>;

    [[nodiscard]] auto person_history(std::string_view person_id)
        -> Result<std::vector<attendance_summary>>;

    /**
     * @brief Current occupancy of a location against its limits
     */
    [[nodiscard]] auto location_capacity(std::string_view location_id)
        -> Result<location_capacity_info>;

    [[nodiscard]] auto get_config() const -> const checkin_service_config&;

private:
    struct resolved_request {
        storage::person_record person;
        storage::location_record location;
        storage::schedule_record schedule;
    };

    /// Decode ids and check person, location and schedule eligibility
    [[nodiscard]] auto resolve(const checkin_request& request,
                               std::chrono::system_clock::time_point now)
        -> Result<std::variant<resolved_request, checkin_result>>;

    [[nodiscard]] auto admit(const resolved_request& resolved,
                             const checkin_options& options,
                             std::stop_token stop)
        -> Result<checkin_result>;

    [[nodiscard]] auto is_warning_level(const storage::location_record& location,
                                        int count) const -> bool;

    [[nodiscard]] auto summarize(const storage::person_record& person) const
        -> person_summary;

    [[nodiscard]] auto summarize(const storage::location_record& location) const
        -> location_summary;

    storage::checkin_database& db_;
    storage::directory_interface& directory_;
    storage::attendance_repository attendance_;
    workflow::location_lock_manager& locks_;
    security::security_code_issuer& issuer_;
    const core::clock_source& clock_;
    const core::id_codec& codec_;
    checkin_service_config config_;
};

}  // namespace checkin::services
