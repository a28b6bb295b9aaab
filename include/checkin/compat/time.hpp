/**
 * @file time.hpp
 * @brief Thread-safe calendar conversions shared by storage and services
 *
 * Timestamps are persisted as UTC "YYYY-MM-DD HH:MM:SS" text and calendar
 * dates as "YYYY-MM-DD". These helpers convert between those textual
 * forms and std::chrono types without touching the non-reentrant
 * std::gmtime.
 */

#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

namespace checkin::compat {

/**
 * @brief Cross-platform thread-safe UTC time conversion
 * @return Pointer to result on success, nullptr on failure
 */
inline std::tm* gmtime_safe(const std::time_t* time, std::tm* result) {
#if defined(_WIN32) || defined(_WIN64)
    return gmtime_s(result, time) == 0 ? result : nullptr;
#else
    return gmtime_r(time, result);
#endif
}

/// Inverse of gmtime_safe
inline std::time_t timegm_safe(std::tm* tm) {
#if defined(_WIN32) || defined(_WIN64)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

/// Format a time point as "YYYY-MM-DD HH:MM:SS" (UTC)
[[nodiscard]] inline auto to_timestamp_string(
    std::chrono::system_clock::time_point tp) -> std::string {
    auto time = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (gmtime_safe(&time, &tm) == nullptr) {
        return "";
    }
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

/// Parse "YYYY-MM-DD HH:MM:SS" (UTC); nullopt on malformed input
[[nodiscard]] inline auto from_timestamp_string(std::string_view str)
    -> std::optional<std::chrono::system_clock::time_point> {
    if (str.empty()) {
        return std::nullopt;
    }
    std::string buf(str);
    std::tm tm{};
    if (std::sscanf(buf.c_str(), "%d-%d-%d %d:%d:%d", &tm.tm_year, &tm.tm_mon,
                    &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
        return std::nullopt;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return std::chrono::system_clock::from_time_t(timegm_safe(&tm));
}

/// Format a calendar date as "YYYY-MM-DD"
[[nodiscard]] inline auto to_date_string(std::chrono::year_month_day date)
    -> std::string {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return buf;
}

/// Calendar date (UTC) of a time point
[[nodiscard]] inline auto to_date(std::chrono::system_clock::time_point tp)
    -> std::chrono::year_month_day {
    return std::chrono::year_month_day{
        std::chrono::floor<std::chrono::days>(tp)};
}

/// Midnight (UTC) at the start of a calendar date
[[nodiscard]] inline auto start_of_day(std::chrono::year_month_day date)
    -> std::chrono::system_clock::time_point {
    return std::chrono::sys_days{date};
}

}  // namespace checkin::compat
