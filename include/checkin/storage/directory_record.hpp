/**
 * @file directory_record.hpp
 * @brief People, locations, schedules and family membership as seen by check-in
 *
 * These records are the read model the check-in core needs from the wider
 * person/group directory. They carry only the fields that affect admission
 * and release decisions.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace checkin::storage {

/**
 * @brief A person who can be checked in, picked up, or supervise
 */
struct person_record {
    /// Primary key (0 for a record not yet stored)
    std::int64_t pk{0};

    std::string first_name;
    std::string last_name;

    /// Preferred name used on rosters, may be empty
    std::string nick_name;

    bool is_active{true};
    bool is_deceased{false};

    /// Name shown on rosters: nick name when present, else first name
    [[nodiscard]] auto display_first_name() const -> const std::string& {
        return nick_name.empty() ? first_name : nick_name;
    }

    [[nodiscard]] auto full_name() const -> std::string {
        if (last_name.empty()) {
            return display_first_name();
        }
        return display_first_name() + " " + last_name;
    }
};

/**
 * @brief A room or area with optional occupancy limits
 *
 * hard_capacity is the enforced limit; soft_capacity only raises a warning.
 * An absent hard capacity means unlimited.
 */
struct location_record {
    std::int64_t pk{0};
    std::string name;
    bool is_active{true};
    std::optional<int> soft_capacity;
    std::optional<int> hard_capacity;
};

/**
 * @brief A recurring schedule that controls when check-in is open
 *
 * A schedule with a weekly day and start time opens for check-in
 * checkin_start_offset minutes before the start and closes
 * checkin_end_offset minutes after it. A schedule without a weekly
 * definition is open at any time while active.
 */
struct schedule_record {
    std::int64_t pk{0};
    std::string name;
    bool is_active{true};

    /// Day of week (0 = Sunday .. 6 = Saturday)
    std::optional<unsigned> weekly_day_of_week;

    /// Start time as minutes after midnight (UTC)
    std::optional<int> weekly_time_minutes;

    int checkin_start_offset{60};
    int checkin_end_offset{30};

    /**
     * @brief Check whether check-in is open at the given instant
     */
    [[nodiscard]] auto is_checkin_open_at(
        std::chrono::system_clock::time_point when) const -> bool {
        if (!is_active) {
            return false;
        }
        if (!weekly_day_of_week || !weekly_time_minutes) {
            return true;
        }

        // A window may cross midnight in either direction
        const auto today = std::chrono::floor<std::chrono::days>(when);
        for (int offset = -1; offset <= 1; ++offset) {
            const std::chrono::sys_days day{today + std::chrono::days{offset}};
            if (std::chrono::weekday{day}.c_encoding() != *weekly_day_of_week) {
                continue;
            }
            auto start = day + std::chrono::minutes{*weekly_time_minutes};
            auto opens = start - std::chrono::minutes{checkin_start_offset};
            auto closes = start + std::chrono::minutes{checkin_end_offset};
            if (when >= opens && when <= closes) {
                return true;
            }
        }
        return false;
    }
};

/**
 * @brief Role of a person inside a family group
 */
enum class family_role { adult, parent, guardian, child };

[[nodiscard]] inline auto to_string(family_role role) -> std::string {
    switch (role) {
        case family_role::adult: return "adult";
        case family_role::parent: return "parent";
        case family_role::guardian: return "guardian";
        case family_role::child: return "child";
    }
    return "child";
}

[[nodiscard]] inline auto parse_family_role(std::string_view str)
    -> std::optional<family_role> {
    if (str == "adult") return family_role::adult;
    if (str == "parent") return family_role::parent;
    if (str == "guardian") return family_role::guardian;
    if (str == "child") return family_role::child;
    return std::nullopt;
}

/// Adults, parents and guardians may be seeded as standing pickups
[[nodiscard]] inline auto is_responsible_adult(family_role role) -> bool {
    return role != family_role::child;
}

}  // namespace checkin::storage
