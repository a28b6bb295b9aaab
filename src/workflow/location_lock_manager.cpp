/**
 * @file location_lock_manager.cpp
 * @brief Implementation of the per-location lock table
 */

#include <checkin/workflow/location_lock_manager.hpp>

#include <checkin/compat/format.hpp>
#include <checkin/integration/logger_adapter.hpp>

#include <algorithm>

namespace checkin::workflow {

using integration::logger_adapter;

// =============================================================================
// Construction
// =============================================================================

location_lock_manager::location_lock_manager()
    : location_lock_manager(location_lock_config{}) {}

location_lock_manager::location_lock_manager(const location_lock_config& config)
    : config_(config) {
    if (config_.wait_slice <= std::chrono::milliseconds::zero()) {
        config_.wait_slice = std::chrono::milliseconds{1};
    }
}

location_lock_manager::~location_lock_manager() = default;

// =============================================================================
// Status
// =============================================================================

auto location_lock_manager::is_busy(std::int64_t location_id) const -> bool {
    std::lock_guard lock(table_mutex_);
    return entries_.find(location_id) != entries_.end();
}

auto location_lock_manager::get_stats() const -> location_lock_stats {
    location_lock_stats stats;
    stats.total_acquisitions = total_acquisitions_.load();
    stats.contention_count = contention_count_.load();
    stats.timeout_count = timeout_count_.load();
    stats.cancelled_count = cancelled_count_.load();

    std::lock_guard lock(table_mutex_);
    stats.active_entries = entries_.size();
    return stats;
}

auto location_lock_manager::get_config() const -> const location_lock_config& {
    return config_;
}

// =============================================================================
// Acquisition
// =============================================================================

auto location_lock_manager::reference(std::int64_t location_id) -> lock_entry* {
    std::lock_guard lock(table_mutex_);
    auto& slot = entries_[location_id];
    if (!slot) {
        slot = std::make_unique<lock_entry>();
    }
    ++slot->references;
    return slot.get();
}

void location_lock_manager::unreference(std::int64_t location_id) {
    std::lock_guard lock(table_mutex_);
    auto it = entries_.find(location_id);
    if (it != entries_.end() && --it->second->references == 0) {
        entries_.erase(it);
    }
}

auto location_lock_manager::acquire(std::int64_t location_id,
                                    const std::stop_token& stop)
    -> Result<lock_entry*> {
    if (stop.stop_requested()) {
        ++cancelled_count_;
        return make_error<lock_entry*>(
            error_codes::operation_cancelled,
            checkin::compat::format("Cancelled before locking location {}", location_id),
            "location_lock_manager");
    }

    auto* entry = reference(location_id);

    if (entry->mutex.try_lock()) {
        ++total_acquisitions_;
        return entry;
    }

    ++contention_count_;
    const auto deadline = std::chrono::steady_clock::now() + config_.acquire_timeout;

    while (true) {
        if (stop.stop_requested()) {
            unreference(location_id);
            ++cancelled_count_;
            return make_error<lock_entry*>(
                error_codes::operation_cancelled,
                checkin::compat::format("Cancelled while waiting for location {}",
                                        location_id),
                "location_lock_manager");
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds::zero()) {
            break;
        }

        if (entry->mutex.try_lock_for(std::min(remaining, config_.wait_slice))) {
            ++total_acquisitions_;
            return entry;
        }
    }

    unreference(location_id);
    ++timeout_count_;
    logger_adapter::warn("Timed out after {}ms waiting for location {} lock",
                         config_.acquire_timeout.count(), location_id);
    return make_error<lock_entry*>(
        error_codes::lock_timeout,
        checkin::compat::format("Location {} is busy, retry later", location_id),
        "location_lock_manager");
}

void location_lock_manager::release(std::int64_t location_id, lock_entry* entry) {
    entry->mutex.unlock();
    unreference(location_id);
}

}  // namespace checkin::workflow
