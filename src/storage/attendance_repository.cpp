/**
 * @file attendance_repository.cpp
 * @brief Implementation of the attendance repository
 */

#include <checkin/storage/attendance_repository.hpp>

#include "sqlite_helpers.hpp"

namespace checkin::storage {

using namespace detail;

namespace {

constexpr std::string_view kModule = "attendance_repository";

constexpr std::string_view kAttendanceSelect =
    "SELECT a.attendance_id, a.person_id, a.occurrence_id, o.location_id, "
    "o.occurrence_date, a.start_time, a.end_time, a.did_attend, a.is_first_time, "
    "a.code_id, COALESCE(c.code, ''), a.notes "
    "FROM attendances a "
    "JOIN occurrences o ON o.occurrence_id = a.occurrence_id "
    "LEFT JOIN attendance_codes c ON c.code_id = a.code_id ";

[[nodiscard]] auto parse_attendance_row(sqlite3_stmt* stmt) -> attendance_record {
    attendance_record record;
    int col = 0;
    record.pk = get_int64_column(stmt, col++);
    record.person_id = get_int64_column(stmt, col++);
    record.occurrence_id = get_int64_column(stmt, col++);
    record.location_id = get_int64_column(stmt, col++);
    record.occurrence_date = get_text_column(stmt, col++);
    record.start_time = get_timestamp_column(stmt, col++);
    record.end_time = get_optional_timestamp_column(stmt, col++);
    record.did_attend = get_bool_column(stmt, col++);
    record.is_first_time = get_bool_column(stmt, col++);
    record.security_code_id = get_optional_int64_column(stmt, col++);
    record.security_code = get_text_column(stmt, col++);
    record.notes = get_text_column(stmt, col++);
    return record;
}

[[nodiscard]] auto collect_attendances(sqlite3* db, sqlite3_stmt* stmt)
    -> Result<std::vector<attendance_record>> {
    std::vector<attendance_record> records;
    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        records.push_back(parse_attendance_row(stmt));
    }
    if (rc != SQLITE_DONE) {
        return step_error<std::vector<attendance_record>>(
            db, rc, "Failed to query attendances", kModule);
    }
    return records;
}

}  // namespace

attendance_repository::attendance_repository(checkin_database& db) : db_(db) {}

// =============================================================================
// Occurrences
// =============================================================================

auto attendance_repository::get_or_create_occurrence(std::int64_t location_id,
                                                     std::int64_t schedule_id,
                                                     std::string_view occurrence_date)
    -> Result<occurrence_record> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    occurrence_record occurrence;
    occurrence.location_id = location_id;
    occurrence.schedule_id = schedule_id;
    occurrence.occurrence_date = std::string(occurrence_date);

    // Insert first; a concurrent creator makes this a no-op and the
    // select below picks up its row.
    {
        auto stmt = prepare(db,
            "INSERT INTO occurrences (location_id, schedule_id, occurrence_date) "
            "VALUES (?, ?, ?) "
            "ON CONFLICT(location_id, schedule_id, occurrence_date) DO NOTHING "
            "RETURNING occurrence_id;", kModule);
        if (stmt.is_err()) {
            return Result<occurrence_record>(stmt.error());
        }
        auto* s = stmt.value().get();
        sqlite3_bind_int64(s, 1, location_id);
        sqlite3_bind_int64(s, 2, schedule_id);
        bind_text(s, 3, occurrence_date);

        auto rc = sqlite3_step(s);
        if (rc == SQLITE_ROW) {
            occurrence.pk = sqlite3_column_int64(s, 0);
            return occurrence;
        }
        if (rc != SQLITE_DONE) {
            return step_error<occurrence_record>(db, rc, "Failed to create occurrence", kModule);
        }
    }

    auto stmt = prepare(db,
        "SELECT occurrence_id FROM occurrences "
        "WHERE location_id = ? AND schedule_id = ? AND occurrence_date = ?;", kModule);
    if (stmt.is_err()) {
        return Result<occurrence_record>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, location_id);
    sqlite3_bind_int64(s, 2, schedule_id);
    bind_text(s, 3, occurrence_date);

    auto rc = sqlite3_step(s);
    if (rc != SQLITE_ROW) {
        return step_error<occurrence_record>(db, rc, "Failed to load occurrence", kModule);
    }
    occurrence.pk = sqlite3_column_int64(s, 0);
    return occurrence;
}

auto attendance_repository::find_occurrence(std::int64_t location_id,
                                            std::int64_t schedule_id,
                                            std::string_view occurrence_date)
    -> Result<std::optional<occurrence_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "SELECT occurrence_id FROM occurrences "
        "WHERE location_id = ? AND schedule_id = ? AND occurrence_date = ?;", kModule);
    if (stmt.is_err()) {
        return Result<std::optional<occurrence_record>>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, location_id);
    sqlite3_bind_int64(s, 2, schedule_id);
    bind_text(s, 3, occurrence_date);

    auto rc = sqlite3_step(s);
    if (rc == SQLITE_DONE) {
        return std::optional<occurrence_record>{};
    }
    if (rc != SQLITE_ROW) {
        return step_error<std::optional<occurrence_record>>(
            db, rc, "Failed to load occurrence", kModule);
    }

    occurrence_record occurrence;
    occurrence.pk = sqlite3_column_int64(s, 0);
    occurrence.location_id = location_id;
    occurrence.schedule_id = schedule_id;
    occurrence.occurrence_date = std::string(occurrence_date);
    return std::optional<occurrence_record>{std::move(occurrence)};
}

// =============================================================================
// Attendances
// =============================================================================

auto attendance_repository::count_open_for_location(std::int64_t location_id,
                                                    std::string_view occurrence_date)
    -> Result<int> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "SELECT COUNT(*) FROM attendances a "
        "JOIN occurrences o ON o.occurrence_id = a.occurrence_id "
        "WHERE o.location_id = ? AND o.occurrence_date = ? AND a.end_time IS NULL;",
        kModule);
    if (stmt.is_err()) {
        return Result<int>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, location_id);
    bind_text(s, 2, occurrence_date);

    auto rc = sqlite3_step(s);
    if (rc != SQLITE_ROW) {
        return step_error<int>(db, rc, "Failed to count occupants", kModule);
    }
    return sqlite3_column_int(s, 0);
}

auto attendance_repository::has_open_attendance(std::int64_t person_id,
                                                std::int64_t occurrence_id)
    -> Result<bool> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "SELECT 1 FROM attendances "
        "WHERE person_id = ? AND occurrence_id = ? AND end_time IS NULL LIMIT 1;",
        kModule);
    if (stmt.is_err()) {
        return Result<bool>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, person_id);
    sqlite3_bind_int64(s, 2, occurrence_id);

    auto rc = sqlite3_step(s);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return step_error<bool>(db, rc, "Failed to query open attendance", kModule);
    }
    return rc == SQLITE_ROW;
}

auto attendance_repository::has_attended_location(std::int64_t person_id,
                                                  std::int64_t location_id)
    -> Result<bool> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "SELECT 1 FROM attendances a "
        "JOIN occurrences o ON o.occurrence_id = a.occurrence_id "
        "WHERE a.person_id = ? AND o.location_id = ? LIMIT 1;", kModule);
    if (stmt.is_err()) {
        return Result<bool>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, person_id);
    sqlite3_bind_int64(s, 2, location_id);

    auto rc = sqlite3_step(s);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return step_error<bool>(db, rc, "Failed to query attendance history", kModule);
    }
    return rc == SQLITE_ROW;
}

auto attendance_repository::insert_attendance(const attendance_record& record)
    -> Result<std::int64_t> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "INSERT INTO attendances (person_id, occurrence_id, code_id, start_time, "
        "did_attend, is_first_time, notes) VALUES (?, ?, ?, ?, ?, ?, ?) "
        "RETURNING attendance_id;", kModule);
    if (stmt.is_err()) {
        return Result<std::int64_t>(stmt.error());
    }
    auto* s = stmt.value().get();

    int idx = 1;
    sqlite3_bind_int64(s, idx++, record.person_id);
    sqlite3_bind_int64(s, idx++, record.occurrence_id);
    bind_optional_int64(s, idx++, record.security_code_id);
    bind_timestamp(s, idx++, record.start_time);
    sqlite3_bind_int(s, idx++, record.did_attend ? 1 : 0);
    sqlite3_bind_int(s, idx++, record.is_first_time ? 1 : 0);
    bind_text(s, idx++, record.notes);

    auto rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        return static_cast<std::int64_t>(sqlite3_column_int64(s, 0));
    }
    if (is_unique_violation(db, rc)) {
        return make_error<std::int64_t>(
            error_codes::duplicate_entry,
            checkin::compat::format("Person {} already has an open attendance for occurrence {}",
                                    record.person_id, record.occurrence_id),
            std::string(kModule));
    }
    return step_error<std::int64_t>(db, rc, "Failed to insert attendance", kModule);
}

auto attendance_repository::close_attendance(std::int64_t attendance_id,
                                             std::chrono::system_clock::time_point end_time)
    -> Result<bool> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "UPDATE attendances SET end_time = ? "
        "WHERE attendance_id = ? AND end_time IS NULL;", kModule);
    if (stmt.is_err()) {
        return Result<bool>(stmt.error());
    }
    auto* s = stmt.value().get();
    bind_timestamp(s, 1, end_time);
    sqlite3_bind_int64(s, 2, attendance_id);

    auto rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        return step_error<bool>(db, rc, "Failed to close attendance", kModule);
    }
    return sqlite3_changes(db) == 1;
}

auto attendance_repository::find_by_id(std::int64_t attendance_id)
    -> Result<std::optional<attendance_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto sql = std::string(kAttendanceSelect) + "WHERE a.attendance_id = ?;";
    auto stmt = prepare(db, sql, kModule);
    if (stmt.is_err()) {
        return Result<std::optional<attendance_record>>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, attendance_id);

    auto rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        return std::optional<attendance_record>(parse_attendance_row(s));
    }
    if (rc != SQLITE_DONE) {
        return step_error<std::optional<attendance_record>>(
            db, rc, "Failed to query attendance", kModule);
    }
    return std::optional<attendance_record>{};
}

auto attendance_repository::find_open_by_location(std::int64_t location_id,
                                                  std::string_view occurrence_date)
    -> Result<std::vector<attendance_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto sql = std::string(kAttendanceSelect) +
               "JOIN people p ON p.person_id = a.person_id "
               "WHERE o.location_id = ? AND o.occurrence_date = ? AND a.end_time IS NULL "
               "ORDER BY p.last_name COLLATE NOCASE, p.first_name COLLATE NOCASE, "
               "a.attendance_id;";
    auto stmt = prepare(db, sql, kModule);
    if (stmt.is_err()) {
        return Result<std::vector<attendance_record>>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, location_id);
    bind_text(s, 2, occurrence_date);

    return collect_attendances(db, s);
}

auto attendance_repository::find_history(std::int64_t person_id,
                                         std::chrono::system_clock::time_point since)
    -> Result<std::vector<attendance_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto sql = std::string(kAttendanceSelect) +
               "WHERE a.person_id = ? AND a.start_time >= ? "
               "ORDER BY a.start_time DESC, a.attendance_id DESC;";
    auto stmt = prepare(db, sql, kModule);
    if (stmt.is_err()) {
        return Result<std::vector<attendance_record>>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, person_id);
    bind_timestamp(s, 2, since);

    return collect_attendances(db, s);
}

// =============================================================================
// Security Codes
// =============================================================================

auto attendance_repository::insert_security_code(std::string_view issue_date,
                                                 std::string_view code,
                                                 std::chrono::system_clock::time_point issued_at)
    -> Result<std::optional<security_code_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "INSERT INTO attendance_codes (issue_date, code, issued_at) VALUES (?, ?, ?) "
        "ON CONFLICT(issue_date, code) DO NOTHING RETURNING code_id;", kModule);
    if (stmt.is_err()) {
        return Result<std::optional<security_code_record>>(stmt.error());
    }
    auto* s = stmt.value().get();
    bind_text(s, 1, issue_date);
    bind_text(s, 2, code);
    bind_timestamp(s, 3, issued_at);

    auto rc = sqlite3_step(s);
    if (rc == SQLITE_DONE) {
        return std::optional<security_code_record>{};
    }
    if (rc != SQLITE_ROW) {
        return step_error<std::optional<security_code_record>>(
            db, rc, "Failed to store security code", kModule);
    }

    security_code_record record;
    record.pk = sqlite3_column_int64(s, 0);
    record.issue_date = std::string(issue_date);
    record.code = std::string(code);
    record.issued_at = issued_at;
    return std::optional<security_code_record>(std::move(record));
}

auto attendance_repository::count_codes_for_date(std::string_view issue_date)
    -> Result<std::int64_t> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "SELECT COUNT(*) FROM attendance_codes WHERE issue_date = ?;", kModule);
    if (stmt.is_err()) {
        return Result<std::int64_t>(stmt.error());
    }
    auto* s = stmt.value().get();
    bind_text(s, 1, issue_date);

    auto rc = sqlite3_step(s);
    if (rc != SQLITE_ROW) {
        return step_error<std::int64_t>(db, rc, "Failed to count security codes", kModule);
    }
    return static_cast<std::int64_t>(sqlite3_column_int64(s, 0));
}

auto attendance_repository::list_codes_for_date(std::string_view issue_date)
    -> Result<std::vector<std::string>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "SELECT code FROM attendance_codes WHERE issue_date = ?;", kModule);
    if (stmt.is_err()) {
        return Result<std::vector<std::string>>(stmt.error());
    }
    auto* s = stmt.value().get();
    bind_text(s, 1, issue_date);

    std::vector<std::string> codes;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        codes.push_back(get_text_column(s, 0));
    }
    if (rc != SQLITE_DONE) {
        return step_error<std::vector<std::string>>(db, rc, "Failed to list security codes", kModule);
    }
    return codes;
}

}  // namespace checkin::storage
