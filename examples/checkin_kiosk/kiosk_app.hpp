/**
 * @file kiosk_app.hpp
 * @brief Check-in kiosk application
 *
 * Owns the database, the directory, the capacity guard, the code issuer,
 * the rate limiter and both services, and drives them from text commands.
 */

#ifndef CHECKIN_EXAMPLE_KIOSK_APP_HPP
#define CHECKIN_EXAMPLE_KIOSK_APP_HPP

#include "config.hpp"

#include <checkin/core/clock.hpp>
#include <checkin/core/id_codec.hpp>
#include <checkin/security/pickup_rate_limiter.hpp>
#include <checkin/security/security_code_issuer.hpp>
#include <checkin/services/checkin_service.hpp>
#include <checkin/services/pickup_authorization_service.hpp>
#include <checkin/storage/attendance_repository.hpp>
#include <checkin/storage/checkin_database.hpp>
#include <checkin/storage/sqlite_directory.hpp>
#include <checkin/workflow/location_lock_manager.hpp>

#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace checkin::example {

class kiosk_app {
public:
    explicit kiosk_app(kiosk_config config);
    ~kiosk_app();

    kiosk_app(const kiosk_app&) = delete;
    kiosk_app& operator=(const kiosk_app&) = delete;

    /**
     * @brief Start logging, open the database and build the services
     * @return true on success
     */
    auto initialize() -> bool;

    /**
     * @brief Read and execute commands until "quit", end of input or shutdown
     */
    void run(std::istream& in, std::ostream& out);

    void request_shutdown();

    void print_statistics(std::ostream& out) const;

private:
    /// Execute one command line; false when the session should end
    auto execute(const std::vector<std::string>& args, std::ostream& out) -> bool;

    auto seed_demo_data() -> bool;

    void cmd_checkin(const std::vector<std::string>& args, std::ostream& out);
    void cmd_checkout(const std::vector<std::string>& args, std::ostream& out);
    void cmd_verify(const std::vector<std::string>& args, std::ostream& out);
    void cmd_pickup(const std::vector<std::string>& args, std::ostream& out);
    void cmd_occupants(const std::vector<std::string>& args, std::ostream& out);
    void cmd_capacity(const std::vector<std::string>& args, std::ostream& out);
    void cmd_history(const std::vector<std::string>& args, std::ostream& out);
    void cmd_pickups(const std::vector<std::string>& args, std::ostream& out);
    void cmd_authorize(const std::vector<std::string>& args, std::ostream& out);
    void cmd_populate(const std::vector<std::string>& args, std::ostream& out);

    kiosk_config config_;
    std::atomic<bool> shutdown_requested_{false};

    core::system_clock_source clock_;
    core::numeric_id_codec codec_;

    std::unique_ptr<storage::checkin_database> db_;
    std::unique_ptr<storage::sqlite_directory> directory_;
    std::unique_ptr<storage::attendance_repository> attendance_;
    std::unique_ptr<workflow::location_lock_manager> locks_;
    std::unique_ptr<security::security_code_issuer> issuer_;
    std::unique_ptr<security::pickup_rate_limiter> limiter_;
    std::unique_ptr<services::checkin_service> checkin_;
    std::unique_ptr<services::pickup_authorization_service> pickup_;
};

}  // namespace checkin::example

#endif  // CHECKIN_EXAMPLE_KIOSK_APP_HPP
