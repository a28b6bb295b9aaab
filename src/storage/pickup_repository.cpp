/**
 * @file pickup_repository.cpp
 * @brief Implementation of the pickup repository
 */

#include <checkin/storage/pickup_repository.hpp>

#include "sqlite_helpers.hpp"

namespace checkin::storage {

using namespace detail;

namespace {

constexpr std::string_view kModule = "pickup_repository";

constexpr std::string_view kAuthorizationSelect =
    "SELECT ap.pickup_id, ap.child_person_id, ap.authorized_person_id, "
    "COALESCE(ap.name, ''), ap.relationship, ap.authorization_level, "
    "ap.phone_number, ap.custody_notes, ap.is_active, ap.created_at, ap.modified_at, "
    "COALESCE(TRIM(COALESCE(NULLIF(p.nick_name, ''), p.first_name) || ' ' || p.last_name), "
    "ap.name, '') "
    "FROM authorized_pickups ap "
    "LEFT JOIN people p ON p.person_id = ap.authorized_person_id ";

constexpr std::string_view kLogSelect =
    "SELECT log_id, attendance_id, child_person_id, pickup_person_id, "
    "COALESCE(pickup_person_name, ''), was_authorized, authorized_pickup_id, "
    "supervisor_override, supervisor_person_id, notes, checkout_time "
    "FROM pickup_logs ";

[[nodiscard]] auto to_pickup_person(std::optional<std::int64_t> person_id,
                                    std::string name) -> pickup_person {
    if (person_id) {
        return known_person{*person_id};
    }
    return named_person{std::move(name)};
}

[[nodiscard]] auto parse_authorization_row(sqlite3_stmt* stmt) -> authorized_pickup_record {
    authorized_pickup_record record;
    int col = 0;
    record.pk = get_int64_column(stmt, col++);
    record.child_person_id = get_int64_column(stmt, col++);
    auto person_id = get_optional_int64_column(stmt, col++);
    auto name = get_text_column(stmt, col++);
    record.person = to_pickup_person(person_id, std::move(name));
    record.relationship = parse_pickup_relationship(get_text_column(stmt, col++))
                              .value_or(pickup_relationship::other);
    // Unknown levels fall back to the most restrictive policy
    record.level = parse_authorization_level(get_text_column(stmt, col++))
                       .value_or(authorization_level::never);
    record.phone_number = get_text_column(stmt, col++);
    record.custody_notes = get_text_column(stmt, col++);
    record.is_active = get_bool_column(stmt, col++);
    record.created_at = get_timestamp_column(stmt, col++);
    record.modified_at = get_timestamp_column(stmt, col++);
    record.display_name = get_text_column(stmt, col++);
    return record;
}

[[nodiscard]] auto parse_log_row(sqlite3_stmt* stmt) -> pickup_log_record {
    pickup_log_record log;
    int col = 0;
    log.pk = get_int64_column(stmt, col++);
    log.attendance_id = get_int64_column(stmt, col++);
    log.child_person_id = get_int64_column(stmt, col++);
    auto person_id = get_optional_int64_column(stmt, col++);
    auto name = get_text_column(stmt, col++);
    log.person = to_pickup_person(person_id, std::move(name));
    log.was_authorized = get_bool_column(stmt, col++);
    log.authorized_pickup_id = get_optional_int64_column(stmt, col++);
    log.supervisor_override = get_bool_column(stmt, col++);
    log.supervisor_person_id = get_optional_int64_column(stmt, col++);
    log.notes = get_text_column(stmt, col++);
    log.checkout_time = get_timestamp_column(stmt, col++);
    return log;
}

/// Bind person key and free-text name columns for a pickup person
void bind_pickup_person(sqlite3_stmt* stmt, int idx, const pickup_person& person) {
    if (const auto* known = std::get_if<known_person>(&person)) {
        sqlite3_bind_int64(stmt, idx, known->person_id);
        sqlite3_bind_null(stmt, idx + 1);
    } else {
        sqlite3_bind_null(stmt, idx);
        bind_text(stmt, idx + 1, std::get<named_person>(person).name);
    }
}

[[nodiscard]] auto duplicate_authorization_error(const authorized_pickup_record& record)
    -> Result<std::int64_t> {
    return make_error<std::int64_t>(
        error_codes::duplicate_entry,
        checkin::compat::format(
            "Child {} already has an active authorization for this person",
            record.child_person_id),
        std::string(kModule));
}

}  // namespace

pickup_repository::pickup_repository(checkin_database& db) : db_(db) {}

// =============================================================================
// Authorizations
// =============================================================================

auto pickup_repository::insert_authorization(const authorized_pickup_record& record)
    -> Result<std::int64_t> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "INSERT INTO authorized_pickups (child_person_id, authorized_person_id, name, "
        "relationship, authorization_level, phone_number, custody_notes, is_active, "
        "created_at, modified_at) VALUES (?, ?, ?, ?, ?, ?, ?, 1, ?, ?) "
        "RETURNING pickup_id;", kModule);
    if (stmt.is_err()) {
        return Result<std::int64_t>(stmt.error());
    }
    auto* s = stmt.value().get();

    int idx = 1;
    sqlite3_bind_int64(s, idx++, record.child_person_id);
    bind_pickup_person(s, idx, record.person);
    idx += 2;
    bind_text(s, idx++, to_string(record.relationship));
    bind_text(s, idx++, to_string(record.level));
    bind_text(s, idx++, record.phone_number);
    bind_text(s, idx++, record.custody_notes);
    bind_timestamp(s, idx++, record.created_at);
    bind_timestamp(s, idx++, record.modified_at);

    auto rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        return static_cast<std::int64_t>(sqlite3_column_int64(s, 0));
    }
    if (is_unique_violation(db, rc)) {
        return duplicate_authorization_error(record);
    }
    return step_error<std::int64_t>(db, rc, "Failed to insert authorization", kModule);
}

auto pickup_repository::insert_if_absent(std::int64_t child_id,
                                         std::int64_t person_id,
                                         pickup_relationship relationship,
                                         authorization_level level,
                                         std::chrono::system_clock::time_point now)
    -> Result<bool> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "INSERT INTO authorized_pickups (child_person_id, authorized_person_id, "
        "relationship, authorization_level, is_active, created_at, modified_at) "
        "VALUES (?, ?, ?, ?, 1, ?, ?) "
        "ON CONFLICT(child_person_id, authorized_person_id) "
        "WHERE is_active = 1 AND authorized_person_id IS NOT NULL DO NOTHING "
        "RETURNING pickup_id;", kModule);
    if (stmt.is_err()) {
        return Result<bool>(stmt.error());
    }
    auto* s = stmt.value().get();

    sqlite3_bind_int64(s, 1, child_id);
    sqlite3_bind_int64(s, 2, person_id);
    bind_text(s, 3, to_string(relationship));
    bind_text(s, 4, to_string(level));
    bind_timestamp(s, 5, now);
    bind_timestamp(s, 6, now);

    auto rc = sqlite3_step(s);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return step_error<bool>(db, rc, "Failed to upsert authorization", kModule);
    }
    return rc == SQLITE_ROW;
}

auto pickup_repository::update_authorization(const authorized_pickup_record& record)
    -> Result<bool> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "UPDATE authorized_pickups SET relationship = ?, authorization_level = ?, "
        "phone_number = ?, custody_notes = ?, is_active = ?, modified_at = ? "
        "WHERE pickup_id = ?;", kModule);
    if (stmt.is_err()) {
        return Result<bool>(stmt.error());
    }
    auto* s = stmt.value().get();

    int idx = 1;
    bind_text(s, idx++, to_string(record.relationship));
    bind_text(s, idx++, to_string(record.level));
    bind_text(s, idx++, record.phone_number);
    bind_text(s, idx++, record.custody_notes);
    sqlite3_bind_int(s, idx++, record.is_active ? 1 : 0);
    bind_timestamp(s, idx++, record.modified_at);
    sqlite3_bind_int64(s, idx++, record.pk);

    auto rc = sqlite3_step(s);
    if (is_unique_violation(db, rc)) {
        return make_error<bool>(
            error_codes::duplicate_entry,
            "Another active authorization exists for this person",
            std::string(kModule));
    }
    if (rc != SQLITE_DONE) {
        return step_error<bool>(db, rc, "Failed to update authorization", kModule);
    }
    return sqlite3_changes(db) == 1;
}

auto pickup_repository::deactivate(std::int64_t pickup_id,
                                   std::chrono::system_clock::time_point now)
    -> Result<bool> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "UPDATE authorized_pickups SET is_active = 0, modified_at = ? "
        "WHERE pickup_id = ? AND is_active = 1;", kModule);
    if (stmt.is_err()) {
        return Result<bool>(stmt.error());
    }
    auto* s = stmt.value().get();
    bind_timestamp(s, 1, now);
    sqlite3_bind_int64(s, 2, pickup_id);

    auto rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        return step_error<bool>(db, rc, "Failed to deactivate authorization", kModule);
    }
    return sqlite3_changes(db) == 1;
}

auto pickup_repository::find_by_id(std::int64_t pickup_id)
    -> Result<std::optional<authorized_pickup_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto sql = std::string(kAuthorizationSelect) + "WHERE ap.pickup_id = ?;";
    auto stmt = prepare(db, sql, kModule);
    if (stmt.is_err()) {
        return Result<std::optional<authorized_pickup_record>>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, pickup_id);

    auto rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        return std::optional<authorized_pickup_record>(parse_authorization_row(s));
    }
    if (rc != SQLITE_DONE) {
        return step_error<std::optional<authorized_pickup_record>>(
            db, rc, "Failed to query authorization", kModule);
    }
    return std::optional<authorized_pickup_record>{};
}

auto pickup_repository::find_active_for_child(std::int64_t child_id)
    -> Result<std::vector<authorized_pickup_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto sql = std::string(kAuthorizationSelect) +
               "WHERE ap.child_person_id = ? AND ap.is_active = 1 "
               "ORDER BY ap.pickup_id;";
    auto stmt = prepare(db, sql, kModule);
    if (stmt.is_err()) {
        return Result<std::vector<authorized_pickup_record>>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, child_id);

    std::vector<authorized_pickup_record> records;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        records.push_back(parse_authorization_row(s));
    }
    if (rc != SQLITE_DONE) {
        return step_error<std::vector<authorized_pickup_record>>(
            db, rc, "Failed to list authorizations", kModule);
    }
    return records;
}

auto pickup_repository::find_active_match(std::int64_t child_id,
                                          const pickup_person& person)
    -> Result<std::optional<authorized_pickup_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    const bool is_known = std::holds_alternative<known_person>(person);
    auto sql = std::string(kAuthorizationSelect) +
               "WHERE ap.child_person_id = ? AND ap.is_active = 1 AND " +
               (is_known ? "ap.authorized_person_id = ? "
                         : "ap.authorized_person_id IS NULL AND ap.name = ? COLLATE NOCASE ") +
               "LIMIT 1;";
    auto stmt = prepare(db, sql, kModule);
    if (stmt.is_err()) {
        return Result<std::optional<authorized_pickup_record>>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, child_id);
    if (is_known) {
        sqlite3_bind_int64(s, 2, std::get<known_person>(person).person_id);
    } else {
        bind_text(s, 2, std::get<named_person>(person).name);
    }

    auto rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        return std::optional<authorized_pickup_record>(parse_authorization_row(s));
    }
    if (rc != SQLITE_DONE) {
        return step_error<std::optional<authorized_pickup_record>>(
            db, rc, "Failed to match authorization", kModule);
    }
    return std::optional<authorized_pickup_record>{};
}

// =============================================================================
// Pickup Log
// =============================================================================

auto pickup_repository::insert_log(const pickup_log_record& log) -> Result<std::int64_t> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "INSERT INTO pickup_logs (attendance_id, child_person_id, pickup_person_id, "
        "pickup_person_name, was_authorized, authorized_pickup_id, supervisor_override, "
        "supervisor_person_id, notes, checkout_time) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?) RETURNING log_id;", kModule);
    if (stmt.is_err()) {
        return Result<std::int64_t>(stmt.error());
    }
    auto* s = stmt.value().get();

    int idx = 1;
    sqlite3_bind_int64(s, idx++, log.attendance_id);
    sqlite3_bind_int64(s, idx++, log.child_person_id);
    bind_pickup_person(s, idx, log.person);
    idx += 2;
    sqlite3_bind_int(s, idx++, log.was_authorized ? 1 : 0);
    bind_optional_int64(s, idx++, log.authorized_pickup_id);
    sqlite3_bind_int(s, idx++, log.supervisor_override ? 1 : 0);
    bind_optional_int64(s, idx++, log.supervisor_person_id);
    bind_text(s, idx++, log.notes);
    bind_timestamp(s, idx++, log.checkout_time);

    auto rc = sqlite3_step(s);
    if (rc != SQLITE_ROW) {
        return step_error<std::int64_t>(db, rc, "Failed to insert pickup log", kModule);
    }
    return static_cast<std::int64_t>(sqlite3_column_int64(s, 0));
}

auto pickup_repository::find_logs(
    std::int64_t child_id,
    std::optional<std::chrono::system_clock::time_point> from,
    std::optional<std::chrono::system_clock::time_point> to)
    -> Result<std::vector<pickup_log_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto sql = std::string(kLogSelect) + "WHERE child_person_id = ?";
    if (from) {
        sql += " AND checkout_time >= ?";
    }
    if (to) {
        sql += " AND checkout_time <= ?";
    }
    sql += " ORDER BY checkout_time DESC, log_id DESC;";

    auto stmt = prepare(db, sql, kModule);
    if (stmt.is_err()) {
        return Result<std::vector<pickup_log_record>>(stmt.error());
    }
    auto* s = stmt.value().get();

    int idx = 1;
    sqlite3_bind_int64(s, idx++, child_id);
    if (from) {
        bind_timestamp(s, idx++, *from);
    }
    if (to) {
        bind_timestamp(s, idx++, *to);
    }

    std::vector<pickup_log_record> logs;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        logs.push_back(parse_log_row(s));
    }
    if (rc != SQLITE_DONE) {
        return step_error<std::vector<pickup_log_record>>(
            db, rc, "Failed to query pickup history", kModule);
    }
    return logs;
}

auto pickup_repository::count_logs_for_attendance(std::int64_t attendance_id)
    -> Result<int> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "SELECT COUNT(*) FROM pickup_logs WHERE attendance_id = ?;", kModule);
    if (stmt.is_err()) {
        return Result<int>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, attendance_id);

    auto rc = sqlite3_step(s);
    if (rc != SQLITE_ROW) {
        return step_error<int>(db, rc, "Failed to count pickup logs", kModule);
    }
    return sqlite3_column_int(s, 0);
}

}  // namespace checkin::storage
