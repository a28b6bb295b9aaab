/**
 * @file security_code_issuer.hpp
 * @brief Day-scoped security code generation
 *
 * Codes are short strings over an alphabet without visually ambiguous
 * characters. Uniqueness per calendar date is enforced by the
 * attendance_codes table; the issuer retries on collision and never
 * returns a code that was already issued for the same date.
 */

#pragma once

#include <checkin/core/clock.hpp>
#include <checkin/core/result.hpp>
#include <checkin/storage/attendance_record.hpp>
#include <checkin/storage/attendance_repository.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace checkin::security {

/**
 * @brief Security code settings
 */
struct security_code_config {
    /// Characters codes are drawn from (no 0/O, 1/I/L)
    std::string alphabet{"23456789ABCDEFGHJKMNPQRSTUVWXYZ"};

    /// Code length
    std::size_t length{4};

    /// Random draws before falling back to scanning for a free code
    int max_random_attempts{10};
};

/**
 * @brief Issues security codes unique per calendar date
 *
 * Thread Safety: All methods are thread-safe.
 */
class security_code_issuer {
public:
    security_code_issuer(storage::attendance_repository& repository,
                         const core::clock_source& clock,
                         security_code_config config = {});

    /**
     * @brief Issue a code for today
     */
    [[nodiscard]] auto issue() -> Result<storage::security_code_record>;

    /**
     * @brief Issue a code for a specific date
     *
     * @return The stored code; exhausted_keyspace when every code for the
     *         date is taken; invalid_configuration for an unusable
     *         alphabet or length; random_source_failure when the CSPRNG fails
     */
    [[nodiscard]] auto issue(std::chrono::year_month_day date)
        -> Result<storage::security_code_record>;

    /**
     * @brief Number of distinct codes the configuration can produce
     *
     * Saturates at INT64_MAX.
     */
    [[nodiscard]] auto keyspace_size() const noexcept -> std::int64_t;

    [[nodiscard]] auto get_config() const -> const security_code_config&;

    /**
     * @brief Compare two codes in time independent of where they differ
     */
    [[nodiscard]] static auto codes_equal(std::string_view expected,
                                          std::string_view presented) -> bool;

private:
    [[nodiscard]] auto validate_config() const -> VoidResult;

    [[nodiscard]] auto random_code() const -> Result<std::string>;

    [[nodiscard]] auto code_at(std::int64_t index) const -> std::string;

    [[nodiscard]] auto scan_for_free_code(const std::string& issue_date)
        -> Result<storage::security_code_record>;

    storage::attendance_repository& repository_;
    const core::clock_source& clock_;
    security_code_config config_;
};

}  // namespace checkin::security
