/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <checkin/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

using namespace checkin::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Create a temporary directory for test logs
 */
auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "checkin_logger_test";
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

void cleanup_temp_directory(const std::filesystem::path& path) {
    if (std::filesystem::exists(path)) {
        std::filesystem::remove_all(path);
    }
}

auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        cleanup_temp_directory(log_dir_);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

private:
    std::filesystem::path log_dir_;
};

auto audit_config(const std::filesystem::path& dir) -> logger_config {
    logger_config config;
    config.log_directory = dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_audit_log = true;
    return config;
}

auto read_audit(const std::filesystem::path& dir) -> std::string {
    logger_adapter::flush();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    return read_file_contents(dir / "audit.json");
}

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Basic initialization") {
        logger_config config;
        config.log_directory = temp_dir;
        config.enable_console = false;

        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls are safe") {
        logger_config config;
        config.log_directory = temp_dir;
        config.enable_console = false;

        logger_adapter::initialize(config);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
    }

    SECTION("Logging before initialization is a no-op") {
        REQUIRE_FALSE(logger_adapter::is_initialized());
        logger_adapter::info("dropped {}", 1);
        logger_adapter::log_check_out(1, true);
        CHECK_FALSE(std::filesystem::exists(temp_dir / "audit.json"));
    }

    cleanup_temp_directory(temp_dir);
}

TEST_CASE("logger_adapter level filtering", "[logger_adapter][logging]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_audit_log = false;
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);

    logger_adapter::set_min_level(log_level::warn);
    REQUIRE(logger_adapter::get_min_level() == log_level::warn);
    REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::debug));
    REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
    REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
    REQUIRE(logger_adapter::is_level_enabled(log_level::fatal));
}

// =============================================================================
// Audit Trail Tests
// =============================================================================

TEST_CASE("logger_adapter attendance audit", "[logger_adapter][audit]") {
    auto temp_dir = create_temp_log_directory();
    logger_test_fixture fixture(audit_config(temp_dir));

    SECTION("Check-in never writes the code itself") {
        logger_adapter::log_check_in(11, 22, 33, "K7P2");

        auto content = read_audit(temp_dir);
        REQUIRE(content.find("CHECK_IN") != std::string::npos);
        REQUIRE(content.find("\"attendance_id\"") != std::string::npos);
        REQUIRE(content.find("security_code_issued") != std::string::npos);
        REQUIRE(content.find("K7P2") == std::string::npos);
    }

    SECTION("Check-out outcome") {
        logger_adapter::log_check_out(33, false);

        auto content = read_audit(temp_dir);
        REQUIRE(content.find("CHECK_OUT") != std::string::npos);
        REQUIRE(content.find("no_change") != std::string::npos);
    }

    SECTION("Pickup with override") {
        logger_adapter::log_pickup_recorded(33, 11, "Aunt May", false, true, 44);

        auto content = read_audit(temp_dir);
        REQUIRE(content.find("PICKUP") != std::string::npos);
        REQUIRE(content.find("Aunt May") != std::string::npos);
        REQUIRE(content.find("supervisor_id") != std::string::npos);
    }
}

TEST_CASE("logger_adapter security events", "[logger_adapter][security]") {
    auto temp_dir = create_temp_log_directory();
    logger_test_fixture fixture(audit_config(temp_dir));

    logger_adapter::log_security_event(security_event_type::rate_limit_exceeded,
                                       "Too many failed codes", "33");
    logger_adapter::log_security_event(security_event_type::blocked_pickup_attempt,
                                       "Never list match");

    auto content = read_audit(temp_dir);
    REQUIRE(content.find("SECURITY") != std::string::npos);
    REQUIRE(content.find("rate_limit_exceeded") != std::string::npos);
    REQUIRE(content.find("blocked_pickup_attempt") != std::string::npos);
    REQUIRE(content.find("Never list match") != std::string::npos);
}

TEST_CASE("logger_adapter security event names", "[logger_adapter][security]") {
    CHECK(logger_adapter::security_event_to_string(
              security_event_type::invalid_security_code) == "invalid_security_code");
    CHECK(logger_adapter::security_event_to_string(
              security_event_type::supervisor_override) == "supervisor_override");
    CHECK(logger_adapter::security_event_to_string(
              security_event_type::capacity_reached) == "capacity_reached");
}

TEST_CASE("logger_adapter configuration", "[logger_adapter][config]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.min_level = log_level::debug;
    config.enable_console = false;
    config.max_files = 5;

    logger_test_fixture fixture(config);

    const auto& retrieved = logger_adapter::get_config();
    CHECK(retrieved.log_directory == temp_dir);
    CHECK(retrieved.min_level == log_level::debug);
    CHECK(retrieved.max_files == 5);
}
