/**
 * @file location_lock_manager.hpp
 * @brief Per-location mutual exclusion for capacity-checked admissions
 *
 * The lock manager serializes caller-supplied critical sections per
 * location id. It knows nothing about capacity or attendance; the check-in
 * service passes it the "count occupants, compare, insert" sequence.
 *
 * Sections for the same location run one at a time. Sections for
 * different locations never block each other.
 *
 * @example
 * @code
 * location_lock_manager locks;
 * auto result = locks.execute_with_location_lock(location_id, [&]() -> Result<int> {
 *     // read occupancy, compare, insert
 *     return 1;
 * });
 * if (result.is_err() && result.error().code == error_codes::lock_timeout) {
 *     // transient: client may retry with backoff
 * }
 * @endcode
 */

#pragma once

#include <checkin/core/result.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <type_traits>
#include <unordered_map>

namespace checkin::workflow {

// =============================================================================
// Configuration and Statistics
// =============================================================================

/**
 * @brief Configuration for the location lock manager
 */
struct location_lock_config {
    /// Maximum time to wait for a location lock before lock_timeout
    std::chrono::milliseconds acquire_timeout{5000};

    /// Granularity at which a waiting caller re-checks its stop token
    std::chrono::milliseconds wait_slice{50};
};

/**
 * @brief Counters describing lock usage
 */
struct location_lock_stats {
    /// Critical sections that obtained the lock
    std::size_t total_acquisitions{0};

    /// Acquisitions that had to wait for another holder
    std::size_t contention_count{0};

    /// Acquisitions abandoned after acquire_timeout
    std::size_t timeout_count{0};

    /// Acquisitions abandoned because the caller requested a stop
    std::size_t cancelled_count{0};

    /// Locations with a holder or waiter right now
    std::size_t active_entries{0};
};

// =============================================================================
// Location Lock Manager
// =============================================================================

/**
 * @brief Keyed lock table serializing work per location
 *
 * Lock entries are created on demand and removed when the last holder or
 * waiter leaves, so the table only grows with concurrently busy locations.
 *
 * Errors from the critical section are returned unchanged and never
 * retried. Failing to obtain the lock is reported as
 * error_codes::lock_timeout or error_codes::operation_cancelled, before the
 * critical section runs.
 *
 * Thread Safety: All methods are thread-safe.
 */
class location_lock_manager {
public:
    location_lock_manager();
    explicit location_lock_manager(const location_lock_config& config);
    ~location_lock_manager();

    location_lock_manager(const location_lock_manager&) = delete;
    location_lock_manager& operator=(const location_lock_manager&) = delete;
    location_lock_manager(location_lock_manager&&) = delete;
    location_lock_manager& operator=(location_lock_manager&&) = delete;

    /**
     * @brief Run a critical section while holding the location's lock
     *
     * @param location_id Key to serialize on
     * @param critical_section Callable returning a Result<T>
     * @param stop Cancels the wait for the lock; a section that has already
     *        started is never interrupted
     * @return The section's Result, or a lock_timeout / operation_cancelled
     *         error if the lock was not obtained
     */
    template <typename Fn>
    auto execute_with_location_lock(std::int64_t location_id,
                                    Fn&& critical_section,
                                    std::stop_token stop = {})
        -> std::invoke_result_t<Fn> {
        using result_type = std::invoke_result_t<Fn>;

        auto acquired = acquire(location_id, stop);
        if (acquired.is_err()) {
            return result_type(acquired.error());
        }
        lease held{*this, location_id, acquired.value()};
        return std::forward<Fn>(critical_section)();
    }

    /**
     * @brief Check whether a location's lock is currently held or awaited
     */
    [[nodiscard]] auto is_busy(std::int64_t location_id) const -> bool;

    [[nodiscard]] auto get_stats() const -> location_lock_stats;

    [[nodiscard]] auto get_config() const -> const location_lock_config&;

private:
    struct lock_entry {
        std::timed_mutex mutex;
        std::size_t references{0};
    };

    /// Releases the location lock when destroyed
    class lease {
    public:
        lease(location_lock_manager& owner, std::int64_t location_id, lock_entry* entry)
            : owner_(owner), location_id_(location_id), entry_(entry) {}
        ~lease() { owner_.release(location_id_, entry_); }

        lease(const lease&) = delete;
        lease& operator=(const lease&) = delete;

    private:
        location_lock_manager& owner_;
        std::int64_t location_id_;
        lock_entry* entry_;
    };

    [[nodiscard]] auto acquire(std::int64_t location_id, const std::stop_token& stop)
        -> Result<lock_entry*>;

    [[nodiscard]] auto reference(std::int64_t location_id) -> lock_entry*;

    void unreference(std::int64_t location_id);

    void release(std::int64_t location_id, lock_entry* entry);

    location_lock_config config_;

    mutable std::mutex table_mutex_;
    std::unordered_map<std::int64_t, std::unique_ptr<lock_entry>> entries_;

    std::atomic<std::size_t> total_acquisitions_{0};
    std::atomic<std::size_t> contention_count_{0};
    std::atomic<std::size_t> timeout_count_{0};
    std::atomic<std::size_t> cancelled_count_{0};
};

}  // namespace checkin::workflow
