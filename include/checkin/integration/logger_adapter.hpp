/**
 * @file logger_adapter.hpp
 * @brief Application and audit logging on top of logger_system
 *
 * This file provides the logger_adapter facade used by every component of
 * the check-in system. It carries ordinary application logging, a JSON
 * audit trail of admissions and releases, and security event logging for
 * failed or forced pickups.
 */

#pragma once

#include <checkin/compat/format.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

namespace checkin::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @enum security_event_type
 * @brief Security events recorded in the audit trail
 */
enum class security_event_type {
    invalid_security_code,
    rate_limit_exceeded,
    supervisor_override,
    blocked_pickup_attempt,
    capacity_reached
};

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable the JSON audit trail (audit.json)
    bool enable_audit_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{50};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Static logging facade for the check-in system
 *
 * Messages logged before initialize() are dropped. Audit entries are
 * appended as one JSON object per line to audit.json in the configured
 * log directory.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/checkin";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Kiosk ready for location {}", location_id);
 * logger_adapter::log_check_in(person_id, location_id, attendance_id, "7KQ2");
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the audit trail path.
     * A second call without shutdown() is ignored.
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the writers
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(checkin::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, checkin::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(checkin::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, checkin::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(checkin::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, checkin::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(checkin::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, checkin::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(checkin::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, checkin::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(checkin::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, checkin::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     */
    static void log(log_level level, const std::string& message);

    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    // ─────────────────────────────────────────────────────
    // Audit Trail
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record an admission
     * @param security_code Issued code, empty when none was requested
     */
    static void log_check_in(std::int64_t person_id,
                             std::int64_t location_id,
                             std::int64_t attendance_id,
                             const std::string& security_code);

    /**
     * @brief Record a check-out attempt
     * @param closed true when the attendance was open and is now closed
     */
    static void log_check_out(std::int64_t attendance_id, bool closed);

    /**
     * @brief Record a completed release of a child
     *
     * @param pickup_person Display form of the person collecting the child
     * @param supervisor_id Staff member attributed with an override, 0 if none
     */
    static void log_pickup_recorded(std::int64_t attendance_id,
                                    std::int64_t child_id,
                                    const std::string& pickup_person,
                                    bool was_authorized,
                                    bool supervisor_override,
                                    std::int64_t supervisor_id);

    /**
     * @brief Log a security-related event
     *
     * @param type Type of security event
     * @param description Human-readable description
     * @param subject Identifier of the attendance or location concerned
     */
    static void log_security_event(security_event_type type,
                                   const std::string& description,
                                   const std::string& subject = "");

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

    [[nodiscard]] static auto security_event_to_string(security_event_type type)
        -> std::string;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace checkin::integration
