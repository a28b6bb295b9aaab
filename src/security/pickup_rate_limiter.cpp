/**
 * @file pickup_rate_limiter.cpp
 * @brief Implementation of the pickup verification rate limiter
 */

#include <checkin/security/pickup_rate_limiter.hpp>

#include <algorithm>

namespace checkin::security {

pickup_rate_limiter::pickup_rate_limiter(const core::clock_source& clock,
                                         rate_limit_config config)
    : clock_(clock), config_(config) {}

auto pickup_rate_limiter::get_config() const -> const rate_limit_config& {
    return config_;
}

auto pickup_rate_limiter::is_expired(const attempt_state& state,
                                     std::chrono::system_clock::time_point now) const
    -> bool {
    return now >= state.window_start + config_.window;
}

auto pickup_rate_limiter::find_active(const key_type& key,
                                      std::chrono::system_clock::time_point now) const
    -> const attempt_state* {
    auto it = attempts_.find(key);
    if (it == attempts_.end()) {
        return nullptr;
    }
    if (is_expired(it->second, now)) {
        attempts_.erase(it);
        return nullptr;
    }
    return &it->second;
}

auto pickup_rate_limiter::purge_expired_locked(
    std::chrono::system_clock::time_point now) const -> std::size_t {
    std::size_t removed = 0;
    for (auto it = attempts_.begin(); it != attempts_.end();) {
        if (is_expired(it->second, now)) {
            it = attempts_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

auto pickup_rate_limiter::record_failed_attempt(std::int64_t attendance_id,
                                                const std::string& origin) -> int {
    const auto now = clock_.now();
    std::lock_guard lock(mutex_);

    purge_expired_locked(now);

    auto& state = attempts_[key_type{attendance_id, origin}];
    if (state.failures == 0) {
        state.window_start = now;
    }
    return ++state.failures;
}

auto pickup_rate_limiter::is_rate_limited(std::int64_t attendance_id,
                                          const std::string& origin) const -> bool {
    const auto now = clock_.now();
    std::lock_guard lock(mutex_);

    const auto* state = find_active(key_type{attendance_id, origin}, now);
    return state != nullptr && state->failures >= config_.max_attempts;
}

auto pickup_rate_limiter::get_retry_after(std::int64_t attendance_id,
                                          const std::string& origin) const
    -> std::optional<std::chrono::seconds> {
    const auto now = clock_.now();
    std::lock_guard lock(mutex_);

    const auto* state = find_active(key_type{attendance_id, origin}, now);
    if (state == nullptr || state->failures < config_.max_attempts) {
        return std::nullopt;
    }
    auto remaining = state->window_start + config_.window - now;
    return std::chrono::ceil<std::chrono::seconds>(remaining);
}

auto pickup_rate_limiter::remaining_attempts(std::int64_t attendance_id,
                                             const std::string& origin) const -> int {
    const auto now = clock_.now();
    std::lock_guard lock(mutex_);

    const auto* state = find_active(key_type{attendance_id, origin}, now);
    if (state == nullptr) {
        return config_.max_attempts;
    }
    return std::max(0, config_.max_attempts - state->failures);
}

void pickup_rate_limiter::reset_attempts(std::int64_t attendance_id,
                                         const std::string& origin) {
    std::lock_guard lock(mutex_);
    attempts_.erase(key_type{attendance_id, origin});
}

auto pickup_rate_limiter::purge_expired() -> std::size_t {
    const auto now = clock_.now();
    std::lock_guard lock(mutex_);
    return purge_expired_locked(now);
}

auto pickup_rate_limiter::tracked_keys() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return attempts_.size();
}

}  // namespace checkin::security
