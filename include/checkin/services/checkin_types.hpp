/**
 * @file checkin_types.hpp
 * @brief Request and result types of the check-in service
 *
 * Identifiers in these types are the external, encoded form produced by
 * core::id_codec.
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace checkin::services {

// =============================================================================
// Failure Reasons
// =============================================================================

/**
 * @brief Expected reasons a check-in does not happen
 *
 * These are business outcomes reported inside a successful Result, never
 * as errors.
 */
enum class checkin_failure {
    none,
    invalid_person_id,
    invalid_location_or_schedule_id,
    person_not_found,
    person_deceased,
    person_inactive,
    location_not_found,
    location_inactive,
    schedule_not_found,
    outside_schedule,
    already_checked_in,
    at_capacity,
    cancelled,          ///< Batch only: the caller stopped before this item ran
    transient_failure,  ///< Batch only: the location lock timed out
    system_error        ///< Batch only: storage failed for this item
};

[[nodiscard]] inline auto to_string(checkin_failure failure) -> std::string {
    switch (failure) {
        case checkin_failure::none: return "None";
        case checkin_failure::invalid_person_id: return "InvalidPersonId";
        case checkin_failure::invalid_location_or_schedule_id: return "InvalidLocationOrScheduleId";
        case checkin_failure::person_not_found: return "PersonNotFound";
        case checkin_failure::person_deceased: return "PersonDeceased";
        case checkin_failure::person_inactive: return "PersonInactive";
        case checkin_failure::location_not_found: return "LocationNotFound";
        case checkin_failure::location_inactive: return "LocationInactive";
        case checkin_failure::schedule_not_found: return "ScheduleNotFound";
        case checkin_failure::outside_schedule: return "OutsideSchedule";
        case checkin_failure::already_checked_in: return "AlreadyCheckedIn";
        case checkin_failure::at_capacity: return "AtCapacity";
        case checkin_failure::cancelled: return "Cancelled";
        case checkin_failure::transient_failure: return "TransientFailure";
        case checkin_failure::system_error: return "SystemError";
    }
    return "Unknown";
}

// =============================================================================
// Requests
// =============================================================================

struct checkin_options {
    /// Issue a security code and link it to the attendance
    bool generate_security_code{true};

    /// Free-text note stored on the attendance
    std::string notes;
};

struct checkin_request {
    std::string person_id;
    std::string location_id;
    std::string schedule_id;
    checkin_options options;
};

// =============================================================================
// Results
// =============================================================================

struct person_summary {
    std::string id;
    std::string first_name;
    std::string last_name;
    std::string full_name;
};

struct location_summary {
    std::string id;
    std::string name;
};

/**
 * @brief Outcome of one check-in
 */
struct checkin_result {
    bool success{false};
    checkin_failure failure{checkin_failure::none};

    /// Human-readable reason or confirmation
    std::string message;

    std::string attendance_id;
    std::optional<std::string> security_code;
    std::chrono::system_clock::time_point check_in_time;
    person_summary person;
    location_summary location;
    bool is_first_time{false};

    /// Set when this admission brought the room to its warning level
    bool capacity_warning{false};

    [[nodiscard]] static auto failed(checkin_failure reason, std::string msg)
        -> checkin_result {
        checkin_result result;
        result.failure = reason;
        result.message = std::move(msg);
        return result;
    }
};

/**
 * @brief Outcome of a multi-person check-in
 */
struct batch_checkin_result {
    std::vector<checkin_result> results;
    std::size_t success_count{0};
    std::size_t failure_count{0};

    [[nodiscard]] auto all_succeeded() const noexcept -> bool {
        return failure_count == 0;
    }
};

/**
 * @brief Dry-run answer to "would this check-in be allowed now"
 */
struct checkin_validation {
    bool allowed{false};
    checkin_failure reason{checkin_failure::none};
    std::string message;
};

/**
 * @brief Capacity status of a location
 */
enum class capacity_status { available, warning, full };

[[nodiscard]] inline auto to_string(capacity_status status) -> std::string {
    switch (status) {
        case capacity_status::available: return "Available";
        case capacity_status::warning: return "Warning";
        case capacity_status::full: return "Full";
    }
    return "Available";
}

struct location_capacity_info {
    location_summary location;
    int current_count{0};
    std::optional<int> soft_capacity;
    std::optional<int> hard_capacity;
    capacity_status status{capacity_status::available};

    /// Occupancy relative to the hard capacity (soft when no hard limit), 0 if unlimited
    int percentage_full{0};
};

/**
 * @brief A person currently checked in to a location
 */
struct occupant_entry {
    std::string attendance_id;
    person_summary person;
    std::chrono::system_clock::time_point check_in_time;
    std::string security_code;
    bool is_first_time{false};
};

/**
 * @brief One past or current attendance of a person
 */
struct attendance_summary {
    std::string attendance_id;
    location_summary location;
    std::string occurrence_date;
    std::chrono::system_clock::time_point start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    bool is_first_time{false};
    std::string security_code;
};

}  // namespace checkin::services
