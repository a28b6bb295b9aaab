/**
 * @file sqlite_directory.cpp
 * @brief Implementation of the SQLite directory
 */

#include <checkin/storage/sqlite_directory.hpp>

#include "sqlite_helpers.hpp"

namespace checkin::storage {

using namespace detail;

namespace {

constexpr std::string_view kModule = "sqlite_directory";

constexpr const char* kPersonColumns =
    "person_id, first_name, last_name, nick_name, is_active, is_deceased";

[[nodiscard]] auto parse_person_row(sqlite3_stmt* stmt, int col = 0) -> person_record {
    person_record person;
    person.pk = get_int64_column(stmt, col++);
    person.first_name = get_text_column(stmt, col++);
    person.last_name = get_text_column(stmt, col++);
    person.nick_name = get_text_column(stmt, col++);
    person.is_active = get_bool_column(stmt, col++);
    person.is_deceased = get_bool_column(stmt, col++);
    return person;
}

/// Bind pk as NULL for new rows so SQLite assigns the key
void bind_pk(sqlite3_stmt* stmt, int idx, std::int64_t pk) {
    if (pk > 0) {
        sqlite3_bind_int64(stmt, idx, pk);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

[[nodiscard]] auto step_returning_pk(sqlite3* db, sqlite3_stmt* stmt,
                                     std::string_view what) -> Result<std::int64_t> {
    auto rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        return step_error<std::int64_t>(db, rc, what, kModule);
    }
    return static_cast<std::int64_t>(sqlite3_column_int64(stmt, 0));
}

}  // namespace

sqlite_directory::sqlite_directory(checkin_database& db) : db_(db) {}

// =============================================================================
// Lookups
// =============================================================================

auto sqlite_directory::find_person(std::int64_t person_id)
    -> Result<std::optional<person_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto sql = std::string("SELECT ") + kPersonColumns +
               " FROM people WHERE person_id = ?;";
    auto stmt = prepare(db, sql, kModule);
    if (stmt.is_err()) {
        return Result<std::optional<person_record>>(stmt.error());
    }
    sqlite3_bind_int64(stmt.value().get(), 1, person_id);

    auto rc = sqlite3_step(stmt.value().get());
    if (rc == SQLITE_ROW) {
        return std::optional<person_record>(parse_person_row(stmt.value().get()));
    }
    if (rc != SQLITE_DONE) {
        return step_error<std::optional<person_record>>(db, rc, "Failed to query person", kModule);
    }
    return std::optional<person_record>{};
}

auto sqlite_directory::find_location(std::int64_t location_id)
    -> Result<std::optional<location_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "SELECT location_id, name, is_active, soft_capacity, hard_capacity "
        "FROM locations WHERE location_id = ?;", kModule);
    if (stmt.is_err()) {
        return Result<std::optional<location_record>>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, location_id);

    auto rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        location_record location;
        location.pk = get_int64_column(s, 0);
        location.name = get_text_column(s, 1);
        location.is_active = get_bool_column(s, 2);
        location.soft_capacity = get_optional_int_column(s, 3);
        location.hard_capacity = get_optional_int_column(s, 4);
        return std::optional<location_record>(std::move(location));
    }
    if (rc != SQLITE_DONE) {
        return step_error<std::optional<location_record>>(db, rc, "Failed to query location", kModule);
    }
    return std::optional<location_record>{};
}

auto sqlite_directory::find_schedule(std::int64_t schedule_id)
    -> Result<std::optional<schedule_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "SELECT schedule_id, name, is_active, weekly_day_of_week, "
        "weekly_time_minutes, checkin_start_offset, checkin_end_offset "
        "FROM schedules WHERE schedule_id = ?;", kModule);
    if (stmt.is_err()) {
        return Result<std::optional<schedule_record>>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, schedule_id);

    auto rc = sqlite3_step(s);
    if (rc == SQLITE_ROW) {
        schedule_record schedule;
        schedule.pk = get_int64_column(s, 0);
        schedule.name = get_text_column(s, 1);
        schedule.is_active = get_bool_column(s, 2);
        if (auto day = get_optional_int_column(s, 3)) {
            schedule.weekly_day_of_week = static_cast<unsigned>(*day);
        }
        schedule.weekly_time_minutes = get_optional_int_column(s, 4);
        schedule.checkin_start_offset = sqlite3_column_int(s, 5);
        schedule.checkin_end_offset = sqlite3_column_int(s, 6);
        return std::optional<schedule_record>(std::move(schedule));
    }
    if (rc != SQLITE_DONE) {
        return step_error<std::optional<schedule_record>>(db, rc, "Failed to query schedule", kModule);
    }
    return std::optional<schedule_record>{};
}

auto sqlite_directory::find_family_adults(std::int64_t child_id)
    -> Result<std::vector<person_record>> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto sql = std::string("SELECT DISTINCT p.person_id, p.first_name, p.last_name, "
                           "p.nick_name, p.is_active, p.is_deceased "
                           "FROM family_members child "
                           "JOIN family_members adult ON adult.family_id = child.family_id "
                           "JOIN people p ON p.person_id = adult.person_id "
                           "WHERE child.person_id = ? AND adult.person_id <> child.person_id "
                           "AND adult.role IN ('adult', 'parent', 'guardian') "
                           "ORDER BY p.person_id;");
    auto stmt = prepare(db, sql, kModule);
    if (stmt.is_err()) {
        return Result<std::vector<person_record>>(stmt.error());
    }
    auto* s = stmt.value().get();
    sqlite3_bind_int64(s, 1, child_id);

    std::vector<person_record> adults;
    int rc;
    while ((rc = sqlite3_step(s)) == SQLITE_ROW) {
        adults.push_back(parse_person_row(s));
    }
    if (rc != SQLITE_DONE) {
        return step_error<std::vector<person_record>>(db, rc, "Failed to query family", kModule);
    }
    return adults;
}

// =============================================================================
// Seeding
// =============================================================================

auto sqlite_directory::save_person(const person_record& person) -> Result<std::int64_t> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db, R"(
        INSERT INTO people (person_id, first_name, last_name, nick_name, is_active, is_deceased)
        VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT(person_id) DO UPDATE SET
            first_name = excluded.first_name,
            last_name = excluded.last_name,
            nick_name = excluded.nick_name,
            is_active = excluded.is_active,
            is_deceased = excluded.is_deceased
        RETURNING person_id;
    )", kModule);
    if (stmt.is_err()) {
        return Result<std::int64_t>(stmt.error());
    }
    auto* s = stmt.value().get();

    int idx = 1;
    bind_pk(s, idx++, person.pk);
    bind_text(s, idx++, person.first_name);
    bind_text(s, idx++, person.last_name);
    bind_text(s, idx++, person.nick_name);
    sqlite3_bind_int(s, idx++, person.is_active ? 1 : 0);
    sqlite3_bind_int(s, idx++, person.is_deceased ? 1 : 0);

    return step_returning_pk(db, s, "Failed to save person");
}

auto sqlite_directory::save_location(const location_record& location)
    -> Result<std::int64_t> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db, R"(
        INSERT INTO locations (location_id, name, is_active, soft_capacity, hard_capacity)
        VALUES (?, ?, ?, ?, ?)
        ON CONFLICT(location_id) DO UPDATE SET
            name = excluded.name,
            is_active = excluded.is_active,
            soft_capacity = excluded.soft_capacity,
            hard_capacity = excluded.hard_capacity
        RETURNING location_id;
    )", kModule);
    if (stmt.is_err()) {
        return Result<std::int64_t>(stmt.error());
    }
    auto* s = stmt.value().get();

    int idx = 1;
    bind_pk(s, idx++, location.pk);
    bind_text(s, idx++, location.name);
    sqlite3_bind_int(s, idx++, location.is_active ? 1 : 0);
    bind_optional_int(s, idx++, location.soft_capacity);
    bind_optional_int(s, idx++, location.hard_capacity);

    return step_returning_pk(db, s, "Failed to save location");
}

auto sqlite_directory::save_schedule(const schedule_record& schedule)
    -> Result<std::int64_t> {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db, R"(
        INSERT INTO schedules (schedule_id, name, is_active, weekly_day_of_week,
                               weekly_time_minutes, checkin_start_offset, checkin_end_offset)
        VALUES (?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(schedule_id) DO UPDATE SET
            name = excluded.name,
            is_active = excluded.is_active,
            weekly_day_of_week = excluded.weekly_day_of_week,
            weekly_time_minutes = excluded.weekly_time_minutes,
            checkin_start_offset = excluded.checkin_start_offset,
            checkin_end_offset = excluded.checkin_end_offset
        RETURNING schedule_id;
    )", kModule);
    if (stmt.is_err()) {
        return Result<std::int64_t>(stmt.error());
    }
    auto* s = stmt.value().get();

    int idx = 1;
    bind_pk(s, idx++, schedule.pk);
    bind_text(s, idx++, schedule.name);
    sqlite3_bind_int(s, idx++, schedule.is_active ? 1 : 0);
    if (schedule.weekly_day_of_week) {
        sqlite3_bind_int(s, idx++, static_cast<int>(*schedule.weekly_day_of_week));
    } else {
        sqlite3_bind_null(s, idx++);
    }
    bind_optional_int(s, idx++, schedule.weekly_time_minutes);
    sqlite3_bind_int(s, idx++, schedule.checkin_start_offset);
    sqlite3_bind_int(s, idx++, schedule.checkin_end_offset);

    return step_returning_pk(db, s, "Failed to save schedule");
}

auto sqlite_directory::add_family_member(std::int64_t family_id,
                                         std::int64_t person_id,
                                         family_role role) -> VoidResult {
    auto guard = db_.lock();
    auto* db = db_.native_handle();

    auto stmt = prepare(db,
        "INSERT INTO family_members (family_id, person_id, role) VALUES (?, ?, ?) "
        "ON CONFLICT(family_id, person_id) DO UPDATE SET role = excluded.role;",
        kModule);
    if (stmt.is_err()) {
        return VoidResult(stmt.error());
    }
    auto* s = stmt.value().get();

    sqlite3_bind_int64(s, 1, family_id);
    sqlite3_bind_int64(s, 2, person_id);
    bind_text(s, 3, to_string(role));

    auto rc = sqlite3_step(s);
    if (rc != SQLITE_DONE) {
        return step_error<std::monostate>(db, rc, "Failed to add family member", kModule);
    }
    return ok();
}

}  // namespace checkin::storage
