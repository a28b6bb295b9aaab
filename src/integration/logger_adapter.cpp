/**
 * @file logger_adapter.cpp
 * @brief Implementation of the check-in logging and audit adapter
 */

#include <checkin/integration/logger_adapter.hpp>

#include <checkin/compat/time.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

namespace checkin::integration {

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);

        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_audit_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
        }

        logger_ = std::make_unique<kcenon::logger::logger>(
            config.async_mode, config.buffer_size);
        logger_->set_min_level(convert_log_level(config.min_level));

        if (config.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }

        if (config.enable_file) {
            auto log_path = config.log_directory / "checkin.log";
            logger_->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(),
                config.max_file_size_mb * 1024 * 1024,
                config.max_files));
        }

        logger_->start();

        if (config.enable_audit_log) {
            audit_log_path_ = config.log_directory / "audit.json";
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }

        audit_log_path_.clear();
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_ || !is_level_enabled(level)) {
            return;
        }
        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return level != log_level::off &&
               static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void write_audit_log(const std::string& event_type,
                         const std::string& outcome,
                         const std::map<std::string, std::string>& fields) {
        if (!initialized_ || !config_.enable_audit_log) {
            return;
        }

        std::lock_guard lock(audit_mutex_);

        std::ofstream file(audit_log_path_, std::ios::app);
        if (!file) {
            return;
        }

        std::ostringstream json;
        json << "{";
        json << "\"timestamp\":\"" << format_iso8601() << "\",";
        json << "\"event_type\":\"" << escape_json(event_type) << "\",";
        json << "\"outcome\":\"" << escape_json(outcome) << "\"";

        for (const auto& [key, value] : fields) {
            json << ",\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
        }

        json << "}\n";

        file << json.str();
        file.flush();
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace:
                return kcenon::logger::log_level::trace;
            case log_level::debug:
                return kcenon::logger::log_level::debug;
            case log_level::info:
                return kcenon::logger::log_level::info;
            case log_level::warn:
                return kcenon::logger::log_level::warn;
            case log_level::error:
                return kcenon::logger::log_level::error;
            case log_level::fatal:
                return kcenon::logger::log_level::fatal;
            case log_level::off:
            default:
                return kcenon::logger::log_level::off;
        }
    }

    // UTC with millisecond precision, e.g. 2026-03-01T09:15:02.120Z
    [[nodiscard]] static auto format_iso8601() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;

        std::tm tm_val{};
        checkin::compat::gmtime_safe(&time_t_val, &tm_val);

        std::ostringstream oss;
        oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    [[nodiscard]] static auto escape_json(const std::string& str) -> std::string {
        std::ostringstream oss;
        for (char c : str) {
            switch (c) {
                case '"':
                    oss << "\\\"";
                    break;
                case '\\':
                    oss << "\\\\";
                    break;
                case '\n':
                    oss << "\\n";
                    break;
                case '\r':
                    oss << "\\r";
                    break;
                case '\t':
                    oss << "\\t";
                    break;
                default:
                    if (static_cast<unsigned char>(c) < 32) {
                        oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                            << static_cast<int>(c) << std::dec;
                    } else {
                        oss << c;
                    }
                    break;
            }
        }
        return oss.str();
    }

    mutable std::mutex mutex_;
    mutable std::mutex audit_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::filesystem::path audit_log_path_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

// =============================================================================
// Standard Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Audit Trail
// =============================================================================

void logger_adapter::log_check_in(std::int64_t person_id,
                                  std::int64_t location_id,
                                  std::int64_t attendance_id,
                                  const std::string& security_code) {
    info("Checked in person={} location={} attendance={}",
         person_id, location_id, attendance_id);

    std::map<std::string, std::string> fields = {
        {"person_id", std::to_string(person_id)},
        {"location_id", std::to_string(location_id)},
        {"attendance_id", std::to_string(attendance_id)}};
    if (!security_code.empty()) {
        fields["security_code_issued"] = "true";
    }

    write_audit_log("CHECK_IN", "success", fields);
}

void logger_adapter::log_check_out(std::int64_t attendance_id, bool closed) {
    if (closed) {
        info("Checked out attendance={}", attendance_id);
    } else {
        debug("Check-out ignored for attendance={} (missing or closed)", attendance_id);
    }

    write_audit_log("CHECK_OUT", closed ? "success" : "no_change",
                    {{"attendance_id", std::to_string(attendance_id)}});
}

void logger_adapter::log_pickup_recorded(std::int64_t attendance_id,
                                         std::int64_t child_id,
                                         const std::string& pickup_person,
                                         bool was_authorized,
                                         bool supervisor_override,
                                         std::int64_t supervisor_id) {
    info("Pickup recorded: child={} attendance={} by '{}' authorized={} override={}",
         child_id, attendance_id, pickup_person, was_authorized, supervisor_override);

    std::map<std::string, std::string> fields = {
        {"attendance_id", std::to_string(attendance_id)},
        {"child_id", std::to_string(child_id)},
        {"pickup_person", pickup_person},
        {"was_authorized", was_authorized ? "true" : "false"},
        {"supervisor_override", supervisor_override ? "true" : "false"}};
    if (supervisor_override) {
        fields["supervisor_id"] = std::to_string(supervisor_id);
    }

    write_audit_log("PICKUP", "success", fields);
}

void logger_adapter::log_security_event(security_event_type type,
                                        const std::string& description,
                                        const std::string& subject) {
    auto type_str = security_event_to_string(type);

    switch (type) {
        case security_event_type::supervisor_override:
        case security_event_type::capacity_reached:
            info("Security event: {} - {}", type_str, description);
            break;
        case security_event_type::invalid_security_code:
        case security_event_type::rate_limit_exceeded:
        case security_event_type::blocked_pickup_attempt:
            warn("Security event: {} - {}", type_str, description);
            break;
    }

    std::map<std::string, std::string> fields = {
        {"security_event", type_str}, {"description", description}};

    if (!subject.empty()) {
        fields["subject"] = subject;
    }

    write_audit_log("SECURITY", type_str, fields);
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

auto logger_adapter::security_event_to_string(security_event_type type) -> std::string {
    switch (type) {
        case security_event_type::invalid_security_code:
            return "invalid_security_code";
        case security_event_type::rate_limit_exceeded:
            return "rate_limit_exceeded";
        case security_event_type::supervisor_override:
            return "supervisor_override";
        case security_event_type::blocked_pickup_attempt:
            return "blocked_pickup_attempt";
        case security_event_type::capacity_reached:
            return "capacity_reached";
        default:
            return "unknown";
    }
}

// =============================================================================
// Private Helpers
// =============================================================================

void logger_adapter::write_audit_log(
    const std::string& event_type,
    const std::string& outcome,
    const std::map<std::string, std::string>& fields) {
    pimpl_->write_audit_log(event_type, outcome, fields);
}

}  // namespace checkin::integration
