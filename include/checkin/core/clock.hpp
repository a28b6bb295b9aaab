/**
 * @file clock.hpp
 * @brief Injectable time source
 *
 * Security-code day scoping, schedule windows and rate-limit windows all
 * read "now" through a clock_source so that they can be driven
 * deterministically in tests.
 */

#pragma once

#include <chrono>

namespace checkin::core {

/**
 * @class clock_source
 * @brief Abstract provider of the current instant and calendar date
 *
 * Thread Safety: implementations must be safe to call concurrently.
 */
class clock_source {
public:
    virtual ~clock_source() = default;

    /// Current instant
    [[nodiscard]] virtual auto now() const -> std::chrono::system_clock::time_point = 0;

    /// Current calendar date (UTC)
    [[nodiscard]] virtual auto today() const -> std::chrono::year_month_day {
        return std::chrono::year_month_day{
            std::chrono::floor<std::chrono::days>(now())};
    }
};

/**
 * @class system_clock_source
 * @brief clock_source backed by std::chrono::system_clock
 */
class system_clock_source final : public clock_source {
public:
    [[nodiscard]] auto now() const -> std::chrono::system_clock::time_point override {
        return std::chrono::system_clock::now();
    }
};

}  // namespace checkin::core
