/**
 * @file pickup_rate_limiter.hpp
 * @brief Throttling of failed pickup verification attempts
 *
 * Counts failed verifications per (attendance, client origin) in a fixed
 * window that starts at the first failure. Different attendances and
 * different origins are tracked independently. State is in-memory only.
 *
 * @example
 * @code
 * pickup_rate_limiter limiter{clock};
 * if (limiter.is_rate_limited(attendance_id, origin)) {
 *     auto wait = limiter.get_retry_after(attendance_id, origin);
 * }
 * @endcode
 */

#pragma once

#include <checkin/core/clock.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace checkin::security {

/**
 * @brief Rate limit settings
 */
struct rate_limit_config {
    /// Failed attempts that trip the limit
    int max_attempts{5};

    /// Window length measured from the first failure
    std::chrono::minutes window{15};
};

/**
 * @brief Fixed-window failure counter keyed by (attendance, origin)
 *
 * Thread Safety: All methods are thread-safe.
 */
class pickup_rate_limiter {
public:
    explicit pickup_rate_limiter(const core::clock_source& clock,
                                 rate_limit_config config = {});

    /**
     * @brief Count a failed verification, opening a window if none is active
     * @return Number of failures in the active window
     */
    auto record_failed_attempt(std::int64_t attendance_id, const std::string& origin)
        -> int;

    /**
     * @brief True once the active window holds max_attempts failures
     */
    [[nodiscard]] auto is_rate_limited(std::int64_t attendance_id,
                                       const std::string& origin) const -> bool;

    /**
     * @brief Time until the active window ends, when currently limited
     */
    [[nodiscard]] auto get_retry_after(std::int64_t attendance_id,
                                       const std::string& origin) const
        -> std::optional<std::chrono::seconds>;

    /**
     * @brief Failures remaining before the limit trips
     */
    [[nodiscard]] auto remaining_attempts(std::int64_t attendance_id,
                                          const std::string& origin) const -> int;

    /**
     * @brief Clear the counter for the pair
     */
    void reset_attempts(std::int64_t attendance_id, const std::string& origin);

    /**
     * @brief Drop all expired windows
     *
     * Lookups and new failures already drop expired entries; this sweeps
     * keys that are never touched again.
     * @return Number of entries removed
     */
    auto purge_expired() -> std::size_t;

    [[nodiscard]] auto tracked_keys() const -> std::size_t;

    [[nodiscard]] auto get_config() const -> const rate_limit_config&;

private:
    using key_type = std::pair<std::int64_t, std::string>;

    struct attempt_state {
        int failures{0};
        std::chrono::system_clock::time_point window_start;
    };

    [[nodiscard]] auto is_expired(const attempt_state& state,
                                  std::chrono::system_clock::time_point now) const -> bool;

    /// Active state for the key, or nullptr when none; an expired entry is dropped
    [[nodiscard]] auto find_active(const key_type& key,
                                   std::chrono::system_clock::time_point now) const
        -> const attempt_state*;

    /// Caller holds mutex_
    auto purge_expired_locked(std::chrono::system_clock::time_point now) const
        -> std::size_t;

    const core::clock_source& clock_;
    rate_limit_config config_;
    mutable std::mutex mutex_;
    mutable std::map<key_type, attempt_state> attempts_;
};

}  // namespace checkin::security
