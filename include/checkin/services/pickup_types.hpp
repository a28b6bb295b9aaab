/**
 * @file pickup_types.hpp
 * @brief Request and result types of the pickup authorization service
 */

#pragma once

#include <checkin/storage/pickup_record.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <variant>

namespace checkin::services {

/// A pickup candidate referenced by external person id
struct pickup_person_ref {
    std::string person_id;
};

/**
 * @brief Whoever presents themselves to collect a child
 *
 * Either a person in the directory or a free-text name.
 */
using pickup_candidate = std::variant<pickup_person_ref, storage::named_person>;

/**
 * @brief Decision on whether a candidate may collect a child
 */
struct pickup_verification {
    bool is_authorized{false};
    std::optional<storage::authorization_level> level;
    bool requires_supervisor_override{false};
    std::string message;
    std::optional<std::string> authorized_pickup_id;
    bool attendance_found{false};
    bool security_code_valid{false};
};

/**
 * @brief Verification behind the attempt rate limiter
 *
 * When rate_limited is set no verification ran.
 */
struct guarded_verification {
    bool rate_limited{false};
    std::optional<std::chrono::seconds> retry_after;
    int remaining_attempts{0};
    std::optional<pickup_verification> verification;
    std::string message;
};

/**
 * @brief A release decision to be logged
 */
struct record_pickup_request {
    std::string attendance_id;
    pickup_candidate pickup_person{storage::named_person{}};
    bool was_authorized{false};
    std::optional<std::string> authorized_pickup_id;
    bool supervisor_override{false};
    std::optional<std::string> supervisor_person_id;
    std::string notes;
};

/**
 * @brief One entry of a child's pickup history
 */
struct pickup_log_entry {
    std::string id;
    std::string attendance_id;
    std::string child_id;
    std::string child_name;
    std::string pickup_person_name;
    std::optional<std::string> pickup_person_id;
    bool was_authorized{false};
    std::optional<std::string> authorized_pickup_id;
    bool supervisor_override{false};
    std::optional<std::string> supervisor_name;
    std::chrono::system_clock::time_point checkout_time;
    std::string notes;
};

/**
 * @brief A standing authorization as shown to staff
 */
struct authorized_pickup_entry {
    std::string id;
    std::string child_id;
    std::optional<std::string> person_id;
    std::string name;
    storage::pickup_relationship relationship{storage::pickup_relationship::other};
    storage::authorization_level level{storage::authorization_level::always};
    std::string phone_number;
    std::string custody_notes;
    bool is_active{true};
};

struct add_authorized_pickup_request {
    std::string child_id;
    pickup_candidate person{storage::named_person{}};
    storage::pickup_relationship relationship{storage::pickup_relationship::other};
    storage::authorization_level level{storage::authorization_level::always};
    std::string phone_number;
    std::string custody_notes;
};

/// Fields left unset keep their stored value
struct update_authorized_pickup_request {
    std::string pickup_id;
    std::optional<storage::pickup_relationship> relationship;
    std::optional<storage::authorization_level> level;
    std::optional<std::string> phone_number;
    std::optional<std::string> custody_notes;
    std::optional<bool> is_active;
};

}  // namespace checkin::services
