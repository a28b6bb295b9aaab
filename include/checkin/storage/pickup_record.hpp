/**
 * @file pickup_record.hpp
 * @brief Standing pickup authorizations and the pickup log
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace checkin::storage {

// =============================================================================
// Authorization Level
// =============================================================================

/**
 * @brief Standing policy for a (child, pickup person) pair
 */
enum class authorization_level {
    always,          ///< Released once the security code matches
    emergency_only,  ///< Requires a supervisor override every time
    never            ///< Hard block, cannot be overridden
};

[[nodiscard]] inline auto to_string(authorization_level level) -> std::string {
    switch (level) {
        case authorization_level::always: return "Always";
        case authorization_level::emergency_only: return "EmergencyOnly";
        case authorization_level::never: return "Never";
    }
    return "Never";
}

[[nodiscard]] inline auto parse_authorization_level(std::string_view str)
    -> std::optional<authorization_level> {
    if (str == "Always") return authorization_level::always;
    if (str == "EmergencyOnly") return authorization_level::emergency_only;
    if (str == "Never") return authorization_level::never;
    return std::nullopt;
}

// =============================================================================
// Relationship
// =============================================================================

enum class pickup_relationship {
    parent,
    grandparent,
    sibling,
    aunt_uncle,
    friend_of_family,
    other
};

[[nodiscard]] inline auto to_string(pickup_relationship rel) -> std::string {
    switch (rel) {
        case pickup_relationship::parent: return "Parent";
        case pickup_relationship::grandparent: return "Grandparent";
        case pickup_relationship::sibling: return "Sibling";
        case pickup_relationship::aunt_uncle: return "AuntUncle";
        case pickup_relationship::friend_of_family: return "Friend";
        case pickup_relationship::other: return "Other";
    }
    return "Other";
}

[[nodiscard]] inline auto parse_pickup_relationship(std::string_view str)
    -> std::optional<pickup_relationship> {
    if (str == "Parent") return pickup_relationship::parent;
    if (str == "Grandparent") return pickup_relationship::grandparent;
    if (str == "Sibling") return pickup_relationship::sibling;
    if (str == "AuntUncle") return pickup_relationship::aunt_uncle;
    if (str == "Friend") return pickup_relationship::friend_of_family;
    if (str == "Other") return pickup_relationship::other;
    return std::nullopt;
}

// =============================================================================
// Pickup Person
// =============================================================================

/// A pickup candidate with a full person record
struct known_person {
    std::int64_t person_id{0};
};

/// A pickup candidate identified only by a free-text name
struct named_person {
    std::string name;
};

/**
 * @brief Identity of whoever is collecting a child
 */
using pickup_person = std::variant<known_person, named_person>;

// =============================================================================
// Records
// =============================================================================

/**
 * @brief A standing authorization linking a child to a pickup person
 *
 * Deactivation clears is_active; rows are never deleted.
 */
struct authorized_pickup_record {
    std::int64_t pk{0};
    std::int64_t child_person_id{0};
    pickup_person person{named_person{}};
    pickup_relationship relationship{pickup_relationship::other};
    authorization_level level{authorization_level::always};
    std::string phone_number;
    std::string custody_notes;
    bool is_active{true};
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point modified_at;

    /// Name of the authorized person, filled from the directory for known people
    std::string display_name;
};

/**
 * @brief Immutable record of one release decision
 */
struct pickup_log_record {
    std::int64_t pk{0};
    std::int64_t attendance_id{0};
    std::int64_t child_person_id{0};
    pickup_person person{named_person{}};
    bool was_authorized{false};
    std::optional<std::int64_t> authorized_pickup_id;
    bool supervisor_override{false};
    std::optional<std::int64_t> supervisor_person_id;
    std::string notes;
    std::chrono::system_clock::time_point checkout_time;
};

}  // namespace checkin::storage
