/**
 * @file config.cpp
 * @brief Command line parsing for the check-in kiosk sample
 */

#include "config.hpp"

#include <iostream>
#include <stdexcept>
#include <string_view>

namespace checkin::example {

namespace {

auto parse_level(std::string_view level) -> std::optional<integration::log_level> {
    using integration::log_level;
    if (level == "trace") return log_level::trace;
    if (level == "debug") return log_level::debug;
    if (level == "info") return log_level::info;
    if (level == "warn") return log_level::warn;
    if (level == "error") return log_level::error;
    if (level == "fatal") return log_level::fatal;
    if (level == "off") return log_level::off;
    return std::nullopt;
}

/// Parse a positive integer option value, reporting errors to stderr
auto parse_positive(std::string_view option, const char* value) -> std::optional<int> {
    try {
        int parsed = std::stoi(value);
        if (parsed > 0) {
            return parsed;
        }
    } catch (const std::exception&) {
        // reported below
    }
    std::cerr << "Error: " << option << " requires a positive number\n";
    return std::nullopt;
}

}  // namespace

void kiosk_config::print_help() {
    std::cout << R"(
Check-in Kiosk - Secure check-in and pickup station

Usage: checkin_kiosk [OPTIONS]

Options:
  --db-path <path>        SQLite database path (default: ./checkin.db)
  --log-dir <path>        Directory for checkin.log and audit.json (default: ./logs)
  --log-level <level>     Log level: trace, debug, info, warn, error, fatal, off
                          (default: info)
  --max-attempts <n>      Failed pickup verifications allowed per window (default: 5)
  --window-minutes <n>    Rate limit window in minutes (default: 15)
  --near-capacity <pct>   Percentage of hard capacity that raises a warning
                          (default: 80)
  --origin <name>         Kiosk name used for rate limiting (default: kiosk)
  --seed-demo             Create a demo family, room and schedule
  --help, -h              Show this help message

Commands (one per line on stdin):
  checkin <person> <location> <schedule>
  checkout <attendance>
  verify <attendance> <person-id | "name"> <code>
  pickup <attendance> <person-id | "name"> [override <supervisor>]
  occupants <location>
  capacity <location>
  history <person> [days]
  pickups <child>
  authorize <child> <person-id | "name"> <Always|EmergencyOnly|Never>
  populate <child>
  quit

Examples:
  # Throwaway store with demo data
  checkin_kiosk --db-path :memory: --seed-demo

  # Stricter pickup verification
  checkin_kiosk --max-attempts 3 --window-minutes 30

)";
}

auto kiosk_config::parse_args(int argc, char* argv[]) -> std::optional<kiosk_config> {
    kiosk_config config;
    config.logging.log_directory = "./logs";

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        if (arg == "--seed-demo") {
            config.seed_demo = true;
            continue;
        }

        // Remaining options all take a value
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value\n";
            return std::nullopt;
        }
        const char* value = argv[++i];

        if (arg == "--db-path") {
            config.database.path = value;
        } else if (arg == "--log-dir") {
            config.logging.log_directory = value;
        } else if (arg == "--log-level") {
            auto level = parse_level(value);
            if (!level) {
                std::cerr << "Error: Invalid log level: " << value << "\n";
                std::cerr << "Valid levels: trace, debug, info, warn, error, fatal, off\n";
                return std::nullopt;
            }
            config.logging.min_level = *level;
        } else if (arg == "--max-attempts") {
            auto attempts = parse_positive(arg, value);
            if (!attempts) {
                return std::nullopt;
            }
            config.rate_limit.max_attempts = *attempts;
        } else if (arg == "--window-minutes") {
            auto minutes = parse_positive(arg, value);
            if (!minutes) {
                return std::nullopt;
            }
            config.rate_limit.window = std::chrono::minutes{*minutes};
        } else if (arg == "--near-capacity") {
            auto percent = parse_positive(arg, value);
            if (!percent || *percent > 100) {
                std::cerr << "Error: --near-capacity must be between 1 and 100\n";
                return std::nullopt;
            }
            config.service.near_capacity_percent = *percent;
        } else if (arg == "--origin") {
            config.origin = value;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return std::nullopt;
        }
    }

    return config;
}

}  // namespace checkin::example
