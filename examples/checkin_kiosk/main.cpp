/**
 * @file main.cpp
 * @brief Check-in kiosk sample entry point
 *
 * Usage:
 *   checkin_kiosk [options]
 *
 * Options:
 *   --db-path <path>        Database path (default: ./checkin.db)
 *   --log-dir <path>        Log directory (default: ./logs)
 *   --seed-demo             Create demo data
 *   --help                  Show help message
 */

#include "config.hpp"
#include "kiosk_app.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

/// Global pointer to the kiosk for signal handling
std::atomic<checkin::example::kiosk_app*> g_kiosk{nullptr};

void signal_handler(int signal) {
    std::cout << "\nReceived signal " << signal << ", shutting down...\n";

    auto* kiosk = g_kiosk.load();
    if (kiosk) {
        kiosk->request_shutdown();
    }
}

void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto config = checkin::example::kiosk_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    install_signal_handlers();

    checkin::example::kiosk_app kiosk(config.value());
    g_kiosk = &kiosk;

    if (!kiosk.initialize()) {
        std::cerr << "Failed to initialize check-in kiosk\n";
        g_kiosk = nullptr;
        return 1;
    }

    std::cout << "Check-in kiosk ready. Type a command, or 'quit' to exit.\n";
    kiosk.run(std::cin, std::cout);
    kiosk.print_statistics(std::cout);

    g_kiosk = nullptr;
    return 0;
}
