/**
 * @file kiosk_app.cpp
 * @brief Check-in kiosk application implementation
 */

#include "kiosk_app.hpp"

#include <checkin/compat/time.hpp>
#include <checkin/integration/logger_adapter.hpp>

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace checkin::example {

using integration::logger_adapter;

namespace {

/// Split a command line on whitespace, keeping "quoted text" together
auto tokenize(const std::string& line) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> std::quoted(token)) {
        tokens.push_back(token);
    }
    return tokens;
}

void print_error(std::ostream& out, const checkin::error_info& error) {
    out << "  error [" << error.code << "] " << error.message << "\n";
}

}  // namespace

kiosk_app::kiosk_app(kiosk_config config) : config_(std::move(config)) {}

kiosk_app::~kiosk_app() {
    // Services reference the database; release them first
    pickup_.reset();
    checkin_.reset();
    limiter_.reset();
    issuer_.reset();
    locks_.reset();
    attendance_.reset();
    directory_.reset();
    db_.reset();
    logger_adapter::shutdown();
}

auto kiosk_app::initialize() -> bool {
    logger_adapter::initialize(config_.logging);

    auto db = storage::checkin_database::open(config_.database.path.string(),
                                              config_.database.connection);
    if (db.is_err()) {
        std::cerr << "Failed to open database " << config_.database.path << ": "
                  << db.error().message << "\n";
        return false;
    }
    db_ = std::move(db.value());

    directory_ = std::make_unique<storage::sqlite_directory>(*db_);
    attendance_ = std::make_unique<storage::attendance_repository>(*db_);
    locks_ = std::make_unique<workflow::location_lock_manager>(config_.locks);
    issuer_ = std::make_unique<security::security_code_issuer>(
        *attendance_, clock_, config_.security_codes);
    limiter_ = std::make_unique<security::pickup_rate_limiter>(clock_, config_.rate_limit);
    checkin_ = std::make_unique<services::checkin_service>(
        *db_, *directory_, *locks_, *issuer_, clock_, codec_, config_.service);
    pickup_ = std::make_unique<services::pickup_authorization_service>(
        *db_, *directory_, *limiter_, clock_, codec_);

    logger_adapter::info("Kiosk '{}' ready, database {} at schema version {}",
                         config_.origin, db_->path(), db_->schema_version());

    if (config_.seed_demo && !seed_demo_data()) {
        return false;
    }
    return true;
}

auto kiosk_app::seed_demo_data() -> bool {
    storage::person_record parent{0, "Patricia", "Doe", "Pat", true, false};
    storage::person_record child{0, "Samuel", "Doe", "Sam", true, false};
    storage::person_record staff{0, "Morgan", "Lee", "", true, false};

    auto parent_id = directory_->save_person(parent);
    auto child_id = directory_->save_person(child);
    auto staff_id = directory_->save_person(staff);
    if (parent_id.is_err() || child_id.is_err() || staff_id.is_err()) {
        std::cerr << "Failed to seed demo people\n";
        return false;
    }

    storage::location_record room;
    room.name = "Toddler Room";
    room.soft_capacity = 8;
    room.hard_capacity = 10;
    auto room_id = directory_->save_location(room);

    storage::schedule_record service;
    service.name = "Sunday Morning";
    auto schedule_id = directory_->save_schedule(service);
    if (room_id.is_err() || schedule_id.is_err()) {
        std::cerr << "Failed to seed demo room and schedule\n";
        return false;
    }

    constexpr std::int64_t family_id = 1;
    auto parent_member = directory_->add_family_member(
        family_id, parent_id.value(), storage::family_role::parent);
    auto child_member = directory_->add_family_member(
        family_id, child_id.value(), storage::family_role::child);
    if (parent_member.is_err() || child_member.is_err()) {
        std::cerr << "Failed to seed demo family\n";
        return false;
    }

    std::cout << "Demo data: parent=" << parent_id.value()
              << " child=" << child_id.value() << " staff=" << staff_id.value()
              << " location=" << room_id.value() << " schedule=" << schedule_id.value()
              << "\n";
    return true;
}

void kiosk_app::run(std::istream& in, std::ostream& out) {
    std::string line;
    out << "> " << std::flush;
    while (!shutdown_requested_ && std::getline(in, line)) {
        auto args = tokenize(line);
        if (!args.empty() && !execute(args, out)) {
            break;
        }
        out << "> " << std::flush;
    }
    out << "\n";
}

void kiosk_app::request_shutdown() { shutdown_requested_ = true; }

void kiosk_app::print_statistics(std::ostream& out) const {
    if (!locks_) {
        return;
    }
    auto stats = locks_->get_stats();
    out << "Capacity guard: " << stats.total_acquisitions << " acquisitions, "
        << stats.contention_count << " contended, " << stats.timeout_count
        << " timed out, " << stats.cancelled_count << " cancelled\n";
    out << "Rate limiter: " << limiter_->tracked_keys() << " tracked origin(s)\n";
}

auto kiosk_app::execute(const std::vector<std::string>& args, std::ostream& out) -> bool {
    const auto& command = args.front();

    if (command == "quit" || command == "exit") return false;
    if (command == "checkin") cmd_checkin(args, out);
    else if (command == "checkout") cmd_checkout(args, out);
    else if (command == "verify") cmd_verify(args, out);
    else if (command == "pickup") cmd_pickup(args, out);
    else if (command == "occupants") cmd_occupants(args, out);
    else if (command == "capacity") cmd_capacity(args, out);
    else if (command == "history") cmd_history(args, out);
    else if (command == "pickups") cmd_pickups(args, out);
    else if (command == "authorize") cmd_authorize(args, out);
    else if (command == "populate") cmd_populate(args, out);
    else out << "  unknown command '" << command << "' (see --help)\n";
    return true;
}

// =============================================================================
// Commands
// =============================================================================

void kiosk_app::cmd_checkin(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 4) {
        out << "  usage: checkin <person> <location> <schedule>\n";
        return;
    }
    services::checkin_request request{args[1], args[2], args[3], {}};
    auto result = checkin_->check_in(request);
    if (result.is_err()) {
        print_error(out, result.error());
        return;
    }
    const auto& outcome = result.value();
    if (!outcome.success) {
        out << "  " << services::to_string(outcome.failure) << ": " << outcome.message << "\n";
        return;
    }
    out << "  " << outcome.message << "\n"
        << "  attendance " << outcome.attendance_id << ", security code "
        << outcome.security_code.value_or("-") << "\n";
    if (outcome.is_first_time) {
        out << "  first visit, welcome!\n";
    }
    if (outcome.capacity_warning) {
        out << "  warning: room is near capacity\n";
    }
}

void kiosk_app::cmd_checkout(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 2) {
        out << "  usage: checkout <attendance>\n";
        return;
    }
    auto closed = checkin_->check_out(args[1]);
    if (closed.is_err()) {
        print_error(out, closed.error());
        return;
    }
    out << (closed.value() ? "  checked out\n" : "  nothing to check out\n");
}

void kiosk_app::cmd_verify(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 4) {
        out << "  usage: verify <attendance> <person-id | \"name\"> <code>\n";
        return;
    }
    services::pickup_candidate candidate =
        codec_.decode(args[2]) ? services::pickup_candidate{services::pickup_person_ref{args[2]}}
                               : services::pickup_candidate{storage::named_person{args[2]}};

    auto result = pickup_->verify_with_rate_limit(args[1], candidate, args[3], config_.origin);
    if (result.is_err()) {
        print_error(out, result.error());
        return;
    }
    const auto& guarded = result.value();
    out << "  " << guarded.message << "\n";
    if (guarded.verification) {
        out << "  authorized=" << (guarded.verification->is_authorized ? "yes" : "no")
            << " override-required="
            << (guarded.verification->requires_supervisor_override ? "yes" : "no")
            << " attempts-left=" << guarded.remaining_attempts << "\n";
    }
}

void kiosk_app::cmd_pickup(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 3) {
        out << "  usage: pickup <attendance> <person-id | \"name\"> [override <supervisor>]\n";
        return;
    }
    services::record_pickup_request request;
    request.attendance_id = args[1];
    if (codec_.decode(args[2])) {
        request.pickup_person = services::pickup_person_ref{args[2]};
    } else {
        request.pickup_person = storage::named_person{args[2]};
    }
    if (args.size() >= 5 && args[3] == "override") {
        request.supervisor_override = true;
        request.supervisor_person_id = args[4];
    } else {
        request.was_authorized = true;
    }

    auto entry = pickup_->record_pickup(request);
    if (entry.is_err()) {
        print_error(out, entry.error());
        return;
    }
    out << "  " << entry.value().child_name << " released to "
        << entry.value().pickup_person_name << "\n";
}

void kiosk_app::cmd_occupants(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 2) {
        out << "  usage: occupants <location>\n";
        return;
    }
    auto occupants = checkin_->current_occupants(args[1]);
    if (occupants.is_err()) {
        print_error(out, occupants.error());
        return;
    }
    for (const auto& occupant : occupants.value()) {
        out << "  " << std::left << std::setw(24) << occupant.person.full_name
            << occupant.security_code << "  since "
            << compat::to_timestamp_string(occupant.check_in_time) << "\n";
    }
    out << "  " << occupants.value().size() << " checked in\n";
}

void kiosk_app::cmd_capacity(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 2) {
        out << "  usage: capacity <location>\n";
        return;
    }
    auto capacity = checkin_->location_capacity(args[1]);
    if (capacity.is_err()) {
        print_error(out, capacity.error());
        return;
    }
    const auto& info = capacity.value();
    out << "  " << info.location.name << ": " << info.current_count;
    if (info.hard_capacity) {
        out << "/" << *info.hard_capacity;
    }
    out << " (" << info.percentage_full << "%, " << services::to_string(info.status) << ")\n";
}

void kiosk_app::cmd_history(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 2) {
        out << "  usage: history <person> [days]\n";
        return;
    }
    auto history = args.size() >= 3
                       ? checkin_->person_history(args[1], std::atoi(args[2].c_str()))
                       : checkin_->person_history(args[1]);
    if (history.is_err()) {
        print_error(out, history.error());
        return;
    }
    for (const auto& entry : history.value()) {
        out << "  " << entry.occurrence_date << "  " << std::left << std::setw(20)
            << entry.location.name << (entry.end_time ? "closed" : "open") << "\n";
    }
}

void kiosk_app::cmd_pickups(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 2) {
        out << "  usage: pickups <child>\n";
        return;
    }
    auto history = pickup_->pickup_history(args[1]);
    if (history.is_err()) {
        print_error(out, history.error());
        return;
    }
    for (const auto& entry : history.value()) {
        out << "  " << compat::to_timestamp_string(entry.checkout_time) << "  "
            << entry.pickup_person_name
            << (entry.supervisor_override ? "  (override by " +
                                                entry.supervisor_name.value_or("?") + ")"
                                          : std::string{})
            << "\n";
    }
}

void kiosk_app::cmd_authorize(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 4) {
        out << "  usage: authorize <child> <person-id | \"name\"> <Always|EmergencyOnly|Never>\n";
        return;
    }
    auto level = storage::parse_authorization_level(args[3]);
    if (!level) {
        out << "  unknown authorization level '" << args[3] << "'\n";
        return;
    }

    services::add_authorized_pickup_request request;
    request.child_id = args[1];
    if (codec_.decode(args[2])) {
        request.person = services::pickup_person_ref{args[2]};
    } else {
        request.person = storage::named_person{args[2]};
    }
    request.level = *level;

    auto entry = pickup_->add_authorized_pickup(request);
    if (entry.is_err()) {
        print_error(out, entry.error());
        return;
    }
    out << "  " << entry.value().name << " is now " << storage::to_string(entry.value().level)
        << " (authorization " << entry.value().id << ")\n";
}

void kiosk_app::cmd_populate(const std::vector<std::string>& args, std::ostream& out) {
    if (args.size() < 2) {
        out << "  usage: populate <child>\n";
        return;
    }
    auto created = pickup_->auto_populate_standing_authorizations(args[1]);
    if (created.is_err()) {
        print_error(out, created.error());
        return;
    }
    out << "  " << created.value() << " authorization(s) added\n";
}

}  // namespace checkin::example
