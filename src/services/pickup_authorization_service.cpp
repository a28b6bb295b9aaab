/**
 * @file pickup_authorization_service.cpp
 * @brief Implementation of the pickup authorization engine
 */

#include <checkin/services/pickup_authorization_service.hpp>

#include <checkin/compat/format.hpp>
#include <checkin/integration/logger_adapter.hpp>
#include <checkin/security/security_code_issuer.hpp>

#include <algorithm>

namespace checkin::services {

using integration::logger_adapter;
using integration::security_event_type;
using storage::authorization_level;

namespace {

constexpr const char* kModule = "pickup_authorization";

constexpr const char* kAttendanceNotFound = "Attendance record not found";
constexpr const char* kInvalidCode = "Invalid security code";
constexpr const char* kNotOnList =
    "Person not on authorized pickup list. Supervisor approval required.";
constexpr const char* kNeverAuthorized =
    "This person is not authorized to pick up this child.";
constexpr const char* kEmergencyOnly =
    "Emergency-only authorization. Supervisor approval required.";
constexpr const char* kBlockedOverride =
    "Cannot override pickup for a blocked person. This person is on the 'Never' list.";

}  // namespace

pickup_authorization_service::pickup_authorization_service(
    storage::checkin_database& db,
    storage::directory_interface& directory,
    security::pickup_rate_limiter& limiter,
    const core::clock_source& clock,
    const core::id_codec& codec)
    : db_(db),
      directory_(directory),
      attendance_(db),
      pickups_(db),
      limiter_(limiter),
      clock_(clock),
      codec_(codec) {}

// =============================================================================
// Verification
// =============================================================================

auto pickup_authorization_service::verify(std::string_view attendance_id,
                                          const pickup_candidate& candidate,
                                          std::string_view presented_code)
    -> Result<pickup_verification> {
    auto id = decode_id(attendance_id, "attendance");
    if (id.is_err()) {
        return Result<pickup_verification>(id.error());
    }
    auto person = to_pickup_person(candidate);
    if (person.is_err()) {
        return Result<pickup_verification>(person.error());
    }

    auto attendance = attendance_.find_by_id(id.value());
    if (attendance.is_err()) {
        return Result<pickup_verification>(attendance.error());
    }

    pickup_verification verification;
    if (!attendance.value()) {
        verification.message = kAttendanceNotFound;
        return verification;
    }
    verification.attendance_found = true;

    const auto& record = *attendance.value();
    if (!security::security_code_issuer::codes_equal(record.security_code,
                                                     presented_code)) {
        verification.message = kInvalidCode;
        logger_adapter::log_security_event(
            security_event_type::invalid_security_code,
            "Invalid security code presented for pickup",
            codec_.encode(record.pk));
        return verification;
    }
    verification.security_code_valid = true;

    auto match = pickups_.find_active_match(record.person_id, person.value());
    if (match.is_err()) {
        return Result<pickup_verification>(match.error());
    }
    if (!match.value()) {
        verification.requires_supervisor_override = true;
        verification.message = kNotOnList;
        return verification;
    }

    const auto& authorization = *match.value();
    verification.level = authorization.level;
    verification.authorized_pickup_id = codec_.encode(authorization.pk);

    switch (authorization.level) {
        case authorization_level::never:
            verification.message = kNeverAuthorized;
            break;
        case authorization_level::emergency_only:
            verification.requires_supervisor_override = true;
            verification.message = kEmergencyOnly;
            break;
        case authorization_level::always: {
            auto child = require_person(record.person_id, "Child");
            if (child.is_err()) {
                return Result<pickup_verification>(child.error());
            }
            verification.is_authorized = true;
            verification.message = checkin::compat::format(
                "{} is authorized to pick up {}.", authorization.display_name,
                child.value().full_name());
            break;
        }
    }
    return verification;
}

auto pickup_authorization_service::verify_with_rate_limit(
    std::string_view attendance_id,
    const pickup_candidate& candidate,
    std::string_view presented_code,
    const std::string& origin) -> Result<guarded_verification> {
    auto id = decode_id(attendance_id, "attendance");
    if (id.is_err()) {
        return Result<guarded_verification>(id.error());
    }

    guarded_verification guarded;
    if (limiter_.is_rate_limited(id.value(), origin)) {
        guarded.rate_limited = true;
        guarded.retry_after = limiter_.get_retry_after(id.value(), origin);

        auto seconds = guarded.retry_after.value_or(std::chrono::seconds{0}).count();
        auto minutes = std::max<std::int64_t>(1, (seconds + 59) / 60);
        guarded.message = checkin::compat::format(
            "Rate limit exceeded. Try again in {} minute(s).", minutes);

        logger_adapter::log_security_event(
            security_event_type::rate_limit_exceeded,
            checkin::compat::format("Pickup verification blocked for origin '{}'", origin),
            codec_.encode(id.value()));
        return guarded;
    }

    auto verification = verify(attendance_id, candidate, presented_code);
    if (verification.is_err()) {
        return Result<guarded_verification>(verification.error());
    }

    const auto& outcome = verification.value();
    if (outcome.attendance_found && !outcome.security_code_valid) {
        limiter_.record_failed_attempt(id.value(), origin);
    } else if (outcome.security_code_valid) {
        limiter_.reset_attempts(id.value(), origin);
    }

    guarded.remaining_attempts = limiter_.remaining_attempts(id.value(), origin);
    guarded.message = outcome.message;
    guarded.verification = outcome;
    return guarded;
}

// =============================================================================
// Recording
// =============================================================================

auto pickup_authorization_service::record_pickup(const record_pickup_request& request)
    -> Result<pickup_log_entry> {
    auto attendance_id = decode_id(request.attendance_id, "attendance");
    if (attendance_id.is_err()) {
        return Result<pickup_log_entry>(attendance_id.error());
    }
    auto person = to_pickup_person(request.pickup_person);
    if (person.is_err()) {
        return Result<pickup_log_entry>(person.error());
    }

    std::optional<std::int64_t> supervisor_id;
    if (request.supervisor_person_id) {
        auto decoded = decode_id(*request.supervisor_person_id, "supervisor");
        if (decoded.is_err()) {
            return Result<pickup_log_entry>(decoded.error());
        }
        supervisor_id = decoded.value();
    }

    std::optional<std::int64_t> authorization_id;
    if (request.authorized_pickup_id) {
        auto decoded = decode_id(*request.authorized_pickup_id, "authorized pickup");
        if (decoded.is_err()) {
            return Result<pickup_log_entry>(decoded.error());
        }
        authorization_id = decoded.value();
    }

    auto attendance = attendance_.find_by_id(attendance_id.value());
    if (attendance.is_err()) {
        return Result<pickup_log_entry>(attendance.error());
    }
    if (!attendance.value()) {
        return checkin_error<pickup_log_entry>(error_codes::not_found,
                                               kAttendanceNotFound, kModule);
    }
    const auto child_id = attendance.value()->person_id;

    // The Never list wins over any flag combination
    auto match = pickups_.find_active_match(child_id, person.value());
    if (match.is_err()) {
        return Result<pickup_log_entry>(match.error());
    }
    if (match.value() && match.value()->level == authorization_level::never) {
        logger_adapter::log_security_event(
            security_event_type::blocked_pickup_attempt,
            checkin::compat::format("Release refused for blocked pickup person '{}'",
                                    match.value()->display_name),
            codec_.encode(attendance_id.value()));
        return checkin_error<pickup_log_entry>(error_codes::invalid_operation,
                                               kBlockedOverride, kModule);
    }

    if (request.was_authorized && request.supervisor_override) {
        return checkin_error<pickup_log_entry>(
            error_codes::argument_error,
            "SupervisorOverride must be false when WasAuthorized is true", kModule);
    }
    if (!request.was_authorized && !request.supervisor_override) {
        return checkin_error<pickup_log_entry>(
            error_codes::argument_error,
            "SupervisorOverride is required when WasAuthorized is false", kModule);
    }
    if (request.supervisor_override && !supervisor_id) {
        return checkin_error<pickup_log_entry>(
            error_codes::argument_error,
            "SupervisorPersonId is required when SupervisorOverride is true", kModule);
    }

    if (supervisor_id) {
        auto supervisor = require_person(*supervisor_id, "Supervisor");
        if (supervisor.is_err()) {
            return Result<pickup_log_entry>(supervisor.error());
        }
    }
    if (authorization_id) {
        auto authorization = pickups_.find_by_id(*authorization_id);
        if (authorization.is_err()) {
            return Result<pickup_log_entry>(authorization.error());
        }
        if (!authorization.value() || authorization.value()->child_person_id != child_id) {
            return checkin_error<pickup_log_entry>(
                error_codes::argument_error,
                "Authorized pickup does not belong to this child", kModule);
        }
        if (authorization.value()->level == authorization_level::never) {
            logger_adapter::log_security_event(
                security_event_type::blocked_pickup_attempt,
                checkin::compat::format(
                    "Release refused: authorization {} for '{}' is on the Never list",
                    *authorization_id, authorization.value()->display_name),
                codec_.encode(attendance_id.value()));
            return checkin_error<pickup_log_entry>(error_codes::invalid_operation,
                                                   kBlockedOverride, kModule);
        }
    }

    storage::pickup_log_record log;
    log.attendance_id = attendance_id.value();
    log.child_person_id = child_id;
    log.person = person.value();
    log.was_authorized = request.was_authorized;
    log.authorized_pickup_id = authorization_id;
    log.supervisor_override = request.supervisor_override;
    log.supervisor_person_id = supervisor_id;
    log.notes = request.notes;
    log.checkout_time = clock_.now();

    // Names are resolved up front so that nothing can fail after the commit
    auto names = resolve_names(log);
    if (names.is_err()) {
        return Result<pickup_log_entry>(names.error());
    }

    auto stored = db_.transaction([&]() -> Result<std::int64_t> {
        auto inserted = pickups_.insert_log(log);
        if (inserted.is_err()) {
            return inserted;
        }
        auto closed = attendance_.close_attendance(log.attendance_id, log.checkout_time);
        if (closed.is_err()) {
            return Result<std::int64_t>(closed.error());
        }
        return inserted;
    });
    if (stored.is_err()) {
        logger_adapter::error("Failed to record pickup for attendance={}: {}",
                              log.attendance_id, stored.error().message);
        return Result<pickup_log_entry>(stored.error());
    }
    log.pk = stored.value();

    const auto entry = to_entry(log, names.value());

    logger_adapter::log_pickup_recorded(log.attendance_id, child_id,
                                        entry.pickup_person_name,
                                        log.was_authorized, log.supervisor_override,
                                        supervisor_id.value_or(0));
    if (log.supervisor_override) {
        logger_adapter::log_security_event(
            security_event_type::supervisor_override,
            checkin::compat::format("Supervisor {} released {} to '{}'",
                                    entry.supervisor_name.value_or(""),
                                    entry.child_name,
                                    entry.pickup_person_name),
            codec_.encode(log.attendance_id));
    }
    return entry;
}

auto pickup_authorization_service::pickup_history(
    std::string_view child_id,
    std::optional<std::chrono::system_clock::time_point> from,
    std::optional<std::chrono::system_clock::time_point> to)
    -> Result<std::vector<pickup_log_entry>> {
    auto id = decode_id(child_id, "child");
    if (id.is_err()) {
        return Result<std::vector<pickup_log_entry>>(id.error());
    }

    auto logs = pickups_.find_logs(id.value(), from, to);
    if (logs.is_err()) {
        return Result<std::vector<pickup_log_entry>>(logs.error());
    }

    std::vector<pickup_log_entry> entries;
    entries.reserve(logs.value().size());
    for (const auto& log : logs.value()) {
        auto entry = to_entry(log);
        if (entry.is_err()) {
            return Result<std::vector<pickup_log_entry>>(entry.error());
        }
        entries.push_back(entry.value());
    }
    return entries;
}

// =============================================================================
// Standing Authorizations
// =============================================================================

auto pickup_authorization_service::auto_populate_standing_authorizations(
    std::string_view child_id) -> Result<int> {
    auto id = decode_id(child_id, "child");
    if (id.is_err()) {
        return Result<int>(id.error());
    }
    auto child = require_person(id.value(), "Child");
    if (child.is_err()) {
        return Result<int>(child.error());
    }

    auto adults = directory_.find_family_adults(id.value());
    if (adults.is_err()) {
        return Result<int>(adults.error());
    }

    const auto now = clock_.now();
    auto created = db_.transaction([&]() -> Result<int> {
        int count = 0;
        for (const auto& adult : adults.value()) {
            auto inserted = pickups_.insert_if_absent(
                id.value(), adult.pk, storage::pickup_relationship::parent,
                authorization_level::always, now);
            if (inserted.is_err()) {
                return Result<int>(inserted.error());
            }
            if (inserted.value()) {
                ++count;
            }
        }
        return count;
    });

    if (created.is_ok() && created.value() > 0) {
        logger_adapter::info("Added {} standing pickup authorization(s) for {}",
                             created.value(), child.value().full_name());
    }
    return created;
}

auto pickup_authorization_service::add_authorized_pickup(
    const add_authorized_pickup_request& request) -> Result<authorized_pickup_entry> {
    auto child_id = decode_id(request.child_id, "child");
    if (child_id.is_err()) {
        return Result<authorized_pickup_entry>(child_id.error());
    }
    auto child = require_person(child_id.value(), "Child");
    if (child.is_err()) {
        return Result<authorized_pickup_entry>(child.error());
    }

    auto person = to_pickup_person(request.person);
    if (person.is_err()) {
        return Result<authorized_pickup_entry>(person.error());
    }
    if (const auto* known = std::get_if<storage::known_person>(&person.value())) {
        if (known->person_id == child_id.value()) {
            return checkin_error<authorized_pickup_entry>(
                error_codes::argument_error,
                "A child can not be their own authorized pickup", kModule);
        }
        auto authorized = require_person(known->person_id, "Authorized person");
        if (authorized.is_err()) {
            return Result<authorized_pickup_entry>(authorized.error());
        }
    }

    storage::authorized_pickup_record record;
    record.child_person_id = child_id.value();
    record.person = person.value();
    record.relationship = request.relationship;
    record.level = request.level;
    record.phone_number = request.phone_number;
    record.custody_notes = request.custody_notes;
    record.created_at = clock_.now();
    record.modified_at = record.created_at;

    auto inserted = pickups_.insert_authorization(record);
    if (inserted.is_err()) {
        return Result<authorized_pickup_entry>(inserted.error());
    }

    auto stored = pickups_.find_by_id(inserted.value());
    if (stored.is_err()) {
        return Result<authorized_pickup_entry>(stored.error());
    }
    if (!stored.value()) {
        return checkin_error<authorized_pickup_entry>(
            error_codes::not_found, "Authorized pickup vanished after insert", kModule);
    }

    logger_adapter::info("Authorized pickup '{}' ({}) added for {}",
                         stored.value()->display_name, to_string(record.level),
                         child.value().full_name());
    return to_entry(*stored.value());
}

auto pickup_authorization_service::update_authorized_pickup(
    const update_authorized_pickup_request& request) -> Result<authorized_pickup_entry> {
    auto id = decode_id(request.pickup_id, "authorized pickup");
    if (id.is_err()) {
        return Result<authorized_pickup_entry>(id.error());
    }

    auto existing = pickups_.find_by_id(id.value());
    if (existing.is_err()) {
        return Result<authorized_pickup_entry>(existing.error());
    }
    if (!existing.value()) {
        return checkin_error<authorized_pickup_entry>(
            error_codes::not_found, "Authorized pickup not found", kModule);
    }

    auto record = *existing.value();
    if (request.relationship) {
        record.relationship = *request.relationship;
    }
    if (request.level) {
        record.level = *request.level;
    }
    if (request.phone_number) {
        record.phone_number = *request.phone_number;
    }
    if (request.custody_notes) {
        record.custody_notes = *request.custody_notes;
    }
    if (request.is_active) {
        record.is_active = *request.is_active;
    }
    record.modified_at = clock_.now();

    auto updated = pickups_.update_authorization(record);
    if (updated.is_err()) {
        return Result<authorized_pickup_entry>(updated.error());
    }
    if (!updated.value()) {
        return checkin_error<authorized_pickup_entry>(
            error_codes::not_found, "Authorized pickup not found", kModule);
    }

    if (request.level && *request.level != existing.value()->level) {
        logger_adapter::info("Authorized pickup {} changed from {} to {}", id.value(),
                             to_string(existing.value()->level), to_string(record.level));
    }
    return to_entry(record);
}

auto pickup_authorization_service::deactivate_authorized_pickup(std::string_view pickup_id)
    -> Result<bool> {
    auto id = decode_id(pickup_id, "authorized pickup");
    if (id.is_err()) {
        return Result<bool>(id.error());
    }

    auto deactivated = pickups_.deactivate(id.value(), clock_.now());
    if (deactivated.is_ok() && deactivated.value()) {
        logger_adapter::info("Authorized pickup {} deactivated", id.value());
    }
    return deactivated;
}

auto pickup_authorization_service::list_authorized_pickups(std::string_view child_id)
    -> Result<std::vector<authorized_pickup_entry>> {
    auto id = decode_id(child_id, "child");
    if (id.is_err()) {
        return Result<std::vector<authorized_pickup_entry>>(id.error());
    }

    auto records = pickups_.find_active_for_child(id.value());
    if (records.is_err()) {
        return Result<std::vector<authorized_pickup_entry>>(records.error());
    }

    std::vector<authorized_pickup_entry> entries;
    entries.reserve(records.value().size());
    for (const auto& record : records.value()) {
        entries.push_back(to_entry(record));
    }
    return entries;
}

// =============================================================================
// Helpers
// =============================================================================

auto pickup_authorization_service::decode_id(std::string_view external,
                                             const char* what) const
    -> Result<std::int64_t> {
    auto id = codec_.decode(external);
    if (!id) {
        return checkin_error<std::int64_t>(
            error_codes::invalid_id,
            checkin::compat::format("Invalid {} id '{}'", what, external), kModule);
    }
    return *id;
}

auto pickup_authorization_service::to_pickup_person(const pickup_candidate& candidate) const
    -> Result<storage::pickup_person> {
    if (const auto* ref = std::get_if<pickup_person_ref>(&candidate)) {
        auto id = decode_id(ref->person_id, "person");
        if (id.is_err()) {
            return Result<storage::pickup_person>(id.error());
        }
        return storage::pickup_person{storage::known_person{id.value()}};
    }

    const auto& named = std::get<storage::named_person>(candidate);
    if (named.name.find_first_not_of(" \t") == std::string::npos) {
        return checkin_error<storage::pickup_person>(
            error_codes::argument_error, "Pickup person name is required", kModule);
    }
    return storage::pickup_person{named};
}

auto pickup_authorization_service::require_person(std::int64_t person_id, const char* what)
    -> Result<storage::person_record> {
    auto person = directory_.find_person(person_id);
    if (person.is_err()) {
        return Result<storage::person_record>(person.error());
    }
    if (!person.value()) {
        return checkin_error<storage::person_record>(
            error_codes::not_found,
            checkin::compat::format("{} {} not found", what, person_id), kModule);
    }
    return *person.value();
}

auto pickup_authorization_service::describe(const storage::pickup_person& person)
    -> Result<std::string> {
    if (const auto* named = std::get_if<storage::named_person>(&person)) {
        return named->name;
    }
    auto id = std::get<storage::known_person>(person).person_id;
    auto record = directory_.find_person(id);
    if (record.is_err()) {
        return Result<std::string>(record.error());
    }
    if (!record.value()) {
        return codec_.encode(id);
    }
    return record.value()->full_name();
}

auto pickup_authorization_service::to_entry(
    const storage::authorized_pickup_record& record) const -> authorized_pickup_entry {
    authorized_pickup_entry entry;
    entry.id = codec_.encode(record.pk);
    entry.child_id = codec_.encode(record.child_person_id);
    if (const auto* known = std::get_if<storage::known_person>(&record.person)) {
        entry.person_id = codec_.encode(known->person_id);
    }
    entry.name = record.display_name;
    entry.relationship = record.relationship;
    entry.level = record.level;
    entry.phone_number = record.phone_number;
    entry.custody_notes = record.custody_notes;
    entry.is_active = record.is_active;
    return entry;
}

auto pickup_authorization_service::resolve_names(const storage::pickup_log_record& log)
    -> Result<log_names> {
    log_names names;

    auto child = describe(storage::known_person{log.child_person_id});
    if (child.is_err()) {
        return Result<log_names>(child.error());
    }
    names.child_name = child.value();

    auto pickup_name = describe(log.person);
    if (pickup_name.is_err()) {
        return Result<log_names>(pickup_name.error());
    }
    names.pickup_person_name = pickup_name.value();

    if (log.supervisor_person_id) {
        auto supervisor = describe(storage::known_person{*log.supervisor_person_id});
        if (supervisor.is_err()) {
            return Result<log_names>(supervisor.error());
        }
        names.supervisor_name = supervisor.value();
    }
    return names;
}

auto pickup_authorization_service::to_entry(const storage::pickup_log_record& log,
                                            const log_names& names) const
    -> pickup_log_entry {
    pickup_log_entry entry;
    entry.id = codec_.encode(log.pk);
    entry.attendance_id = codec_.encode(log.attendance_id);
    entry.child_id = codec_.encode(log.child_person_id);
    entry.child_name = names.child_name;
    entry.pickup_person_name = names.pickup_person_name;
    if (const auto* known = std::get_if<storage::known_person>(&log.person)) {
        entry.pickup_person_id = codec_.encode(known->person_id);
    }
    entry.was_authorized = log.was_authorized;
    if (log.authorized_pickup_id) {
        entry.authorized_pickup_id = codec_.encode(*log.authorized_pickup_id);
    }
    entry.supervisor_override = log.supervisor_override;
    entry.supervisor_name = names.supervisor_name;
    entry.checkout_time = log.checkout_time;
    entry.notes = log.notes;
    return entry;
}

auto pickup_authorization_service::to_entry(const storage::pickup_log_record& log)
    -> Result<pickup_log_entry> {
    auto names = resolve_names(log);
    if (names.is_err()) {
        return Result<pickup_log_entry>(names.error());
    }
    return to_entry(log, names.value());
}

}  // namespace checkin::services
