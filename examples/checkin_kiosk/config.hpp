/**
 * @file config.hpp
 * @brief Configuration for the check-in kiosk sample
 *
 * Aggregates the configuration of every component the kiosk wires
 * together and fills it from command line arguments.
 */

#ifndef CHECKIN_EXAMPLE_KIOSK_CONFIG_HPP
#define CHECKIN_EXAMPLE_KIOSK_CONFIG_HPP

#include <checkin/integration/logger_adapter.hpp>
#include <checkin/security/pickup_rate_limiter.hpp>
#include <checkin/security/security_code_issuer.hpp>
#include <checkin/services/checkin_service.hpp>
#include <checkin/storage/checkin_database.hpp>
#include <checkin/workflow/location_lock_manager.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace checkin::example {

/**
 * @brief Database location and connection settings
 */
struct kiosk_database_config {
    /// Path to the SQLite database file (":memory:" for a throwaway store)
    std::filesystem::path path{"./checkin.db"};

    storage::checkin_database_config connection;
};

/**
 * @brief Complete kiosk configuration
 */
struct kiosk_config {
    kiosk_database_config database;
    integration::logger_config logging;
    workflow::location_lock_config locks;
    security::security_code_config security_codes;
    security::rate_limit_config rate_limit;
    services::checkin_service_config service;

    /// Client origin reported to the pickup rate limiter
    std::string origin{"kiosk"};

    /// Seed a demo family, room and schedule on start
    bool seed_demo{false};

    /**
     * @brief Parse configuration from command line arguments
     *
     * Supported options:
     *   --db-path <path>          Database path (default: ./checkin.db)
     *   --log-dir <path>          Log directory (default: ./logs)
     *   --log-level <level>       Log level (default: info)
     *   --max-attempts <n>        Failed pickup verifications per window (default: 5)
     *   --window-minutes <n>      Rate limit window in minutes (default: 15)
     *   --near-capacity <pct>     Capacity warning threshold (default: 80)
     *   --origin <name>           Kiosk name used for rate limiting (default: kiosk)
     *   --seed-demo               Create demo data
     *   --help                    Show help message
     *
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[]) -> std::optional<kiosk_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();
};

}  // namespace checkin::example

#endif  // CHECKIN_EXAMPLE_KIOSK_CONFIG_HPP
