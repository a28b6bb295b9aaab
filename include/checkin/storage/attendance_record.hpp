/**
 * @file attendance_record.hpp
 * @brief Occurrence, attendance and security code records
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace checkin::storage {

/**
 * @brief One scheduled instance of a location being open
 *
 * Unique per (location, schedule, date). Created on first use and never
 * modified afterwards.
 */
struct occurrence_record {
    std::int64_t pk{0};
    std::int64_t location_id{0};
    std::int64_t schedule_id{0};

    /// Calendar date as "YYYY-MM-DD"
    std::string occurrence_date;
};

/**
 * @brief A day-scoped security code
 */
struct security_code_record {
    std::int64_t pk{0};

    /// Calendar date the code belongs to, "YYYY-MM-DD"
    std::string issue_date;

    std::string code;
    std::chrono::system_clock::time_point issued_at;
};

/**
 * @brief One person's presence interval at an occurrence
 *
 * An attendance is open while end_time is empty. Rows are closed, never
 * deleted.
 */
struct attendance_record {
    std::int64_t pk{0};
    std::int64_t person_id{0};
    std::int64_t occurrence_id{0};

    /// Location of the occurrence, filled by queries that join it
    std::int64_t location_id{0};

    /// Calendar date of the occurrence, filled by queries that join it
    std::string occurrence_date;

    std::chrono::system_clock::time_point start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;

    bool did_attend{true};
    bool is_first_time{false};

    /// Linked security code, if one was issued
    std::optional<std::int64_t> security_code_id;

    /// Code text, filled by queries that join it
    std::string security_code;

    std::string notes;

    [[nodiscard]] auto is_open() const noexcept -> bool {
        return !end_time.has_value();
    }
};

}  // namespace checkin::storage
