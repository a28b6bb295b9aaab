/**
 * @file migration_runner.cpp
 * @brief Implementation of the check-in schema migrations
 */

#include <checkin/storage/migration_runner.hpp>

#include <checkin/compat/format.hpp>

#include <sqlite3.h>

#include <string>

namespace checkin::storage {

// ============================================================================
// Construction
// ============================================================================

migration_runner::migration_runner() {
    migrations_.push_back({1, [this](sqlite3* db) { return migrate_v1(db); }});
    migrations_.push_back({2, [this](sqlite3* db) { return migrate_v2(db); }});
}

// ============================================================================
// Migration Operations
// ============================================================================

auto migration_runner::run_migrations(sqlite3* db) -> VoidResult {
    return run_migrations_to(db, LATEST_VERSION);
}

auto migration_runner::run_migrations_to(sqlite3* db, int target_version)
    -> VoidResult {
    if (target_version > LATEST_VERSION) {
        return checkin_void_error(
            error_codes::database_migration_error,
            checkin::compat::format("Target version {} exceeds latest version {}",
                                    target_version, LATEST_VERSION),
            "storage");
    }

    auto ensure_result = ensure_schema_version_table(db);
    if (ensure_result.is_err()) {
        return ensure_result;
    }

    auto current_version = get_current_version(db);

    while (current_version < target_version) {
        auto next_version = current_version + 1;

        auto begin_result = execute_sql(db, "BEGIN TRANSACTION;");
        if (begin_result.is_err()) {
            return begin_result;
        }

        auto migration_result = apply_migration(db, next_version);
        if (migration_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return migration_result;
        }

        auto commit_result = execute_sql(db, "COMMIT;");
        if (commit_result.is_err()) {
            (void)execute_sql(db, "ROLLBACK;");
            return commit_result;
        }

        current_version = next_version;
    }

    return ok();
}

// ============================================================================
// Version Information
// ============================================================================

auto migration_runner::get_current_version(sqlite3* db) const -> int {
    const char* check_sql =
        "SELECT name FROM sqlite_master WHERE type='table' AND name='schema_version';";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, check_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW) {
        return 0;
    }

    const char* version_sql = "SELECT MAX(version) FROM schema_version;";
    rc = sqlite3_prepare_v2(db, version_sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    int version = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);

    return version;
}

auto migration_runner::get_latest_version() const noexcept -> int {
    return LATEST_VERSION;
}

auto migration_runner::needs_migration(sqlite3* db) const -> bool {
    return get_current_version(db) < LATEST_VERSION;
}

auto migration_runner::get_history(sqlite3* db) const
    -> std::vector<migration_record> {
    std::vector<migration_record> history;

    const char* sql =
        "SELECT version, description, applied_at FROM schema_version ORDER BY version;";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return history;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        migration_record record;
        record.version = sqlite3_column_int(stmt, 0);

        const auto* desc = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
        record.description = desc ? desc : "";

        const auto* applied = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
        record.applied_at = applied ? applied : "";

        history.push_back(std::move(record));
    }

    sqlite3_finalize(stmt);
    return history;
}

// ============================================================================
// Internal Implementation
// ============================================================================

auto migration_runner::ensure_schema_version_table(sqlite3* db) -> VoidResult {
    return execute_sql(db, R"(
        CREATE TABLE IF NOT EXISTS schema_version (
            version     INTEGER PRIMARY KEY,
            description TEXT NOT NULL,
            applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
        );
    )");
}

auto migration_runner::apply_migration(sqlite3* db, int version) -> VoidResult {
    for (const auto& [ver, func] : migrations_) {
        if (ver == version) {
            return func(db);
        }
    }

    return checkin_void_error(
        error_codes::database_migration_error,
        checkin::compat::format("Migration for version {} not found", version),
        "storage");
}

auto migration_runner::record_migration(sqlite3* db, int version,
                                        std::string_view description)
    -> VoidResult {
    const char* sql =
        "INSERT INTO schema_version (version, description) VALUES (?, ?);";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return checkin_void_error(
            error_codes::database_migration_error,
            checkin::compat::format("Failed to prepare statement: {}",
                                    sqlite3_errmsg(db)),
            "storage");
    }

    sqlite3_bind_int(stmt, 1, version);
    sqlite3_bind_text(stmt, 2, description.data(),
                      static_cast<int>(description.size()), SQLITE_TRANSIENT);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return checkin_void_error(
            error_codes::database_migration_error,
            checkin::compat::format("Failed to record migration: {}",
                                    sqlite3_errmsg(db)),
            "storage");
    }

    return ok();
}

auto migration_runner::execute_sql(sqlite3* db, std::string_view sql)
    -> VoidResult {
    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db, std::string(sql).c_str(), nullptr, nullptr, &errmsg);

    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);

        return checkin_void_error(
            error_codes::database_migration_error,
            checkin::compat::format("SQL execution failed: {}", error_str),
            "storage");
    }

    return ok();
}

// ============================================================================
// Migration Implementations
// ============================================================================

auto migration_runner::migrate_v1(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE people (
            person_id    INTEGER PRIMARY KEY AUTOINCREMENT,
            first_name   TEXT NOT NULL,
            last_name    TEXT NOT NULL DEFAULT '',
            nick_name    TEXT NOT NULL DEFAULT '',
            is_active    INTEGER NOT NULL DEFAULT 1,
            is_deceased  INTEGER NOT NULL DEFAULT 0
        );

        CREATE TABLE locations (
            location_id    INTEGER PRIMARY KEY AUTOINCREMENT,
            name           TEXT NOT NULL,
            is_active      INTEGER NOT NULL DEFAULT 1,
            soft_capacity  INTEGER CHECK (soft_capacity IS NULL OR soft_capacity >= 0),
            hard_capacity  INTEGER CHECK (hard_capacity IS NULL OR hard_capacity >= 0)
        );

        CREATE TABLE schedules (
            schedule_id           INTEGER PRIMARY KEY AUTOINCREMENT,
            name                  TEXT NOT NULL,
            is_active             INTEGER NOT NULL DEFAULT 1,
            weekly_day_of_week    INTEGER CHECK (weekly_day_of_week BETWEEN 0 AND 6),
            weekly_time_minutes   INTEGER,
            checkin_start_offset  INTEGER NOT NULL DEFAULT 60,
            checkin_end_offset    INTEGER NOT NULL DEFAULT 30
        );

        CREATE TABLE family_members (
            family_id  INTEGER NOT NULL,
            person_id  INTEGER NOT NULL REFERENCES people(person_id),
            role       TEXT NOT NULL,
            PRIMARY KEY (family_id, person_id)
        );
        CREATE INDEX idx_family_members_person ON family_members(person_id);

        CREATE TABLE occurrences (
            occurrence_id    INTEGER PRIMARY KEY AUTOINCREMENT,
            location_id      INTEGER NOT NULL REFERENCES locations(location_id),
            schedule_id      INTEGER NOT NULL REFERENCES schedules(schedule_id),
            occurrence_date  TEXT NOT NULL,
            created_at       TEXT NOT NULL DEFAULT (datetime('now')),
            UNIQUE (location_id, schedule_id, occurrence_date)
        );
        CREATE INDEX idx_occurrences_location_date
            ON occurrences(location_id, occurrence_date);

        CREATE TABLE attendance_codes (
            code_id     INTEGER PRIMARY KEY AUTOINCREMENT,
            issue_date  TEXT NOT NULL,
            code        TEXT NOT NULL,
            issued_at   TEXT NOT NULL,
            UNIQUE (issue_date, code)
        );

        CREATE TABLE attendances (
            attendance_id  INTEGER PRIMARY KEY AUTOINCREMENT,
            person_id      INTEGER NOT NULL REFERENCES people(person_id),
            occurrence_id  INTEGER NOT NULL REFERENCES occurrences(occurrence_id),
            code_id        INTEGER REFERENCES attendance_codes(code_id),
            start_time     TEXT NOT NULL,
            end_time       TEXT,
            did_attend     INTEGER NOT NULL DEFAULT 1,
            is_first_time  INTEGER NOT NULL DEFAULT 0,
            notes          TEXT NOT NULL DEFAULT ''
        );

        -- At most one open attendance per person and occurrence
        CREATE UNIQUE INDEX idx_attendances_open
            ON attendances(person_id, occurrence_id) WHERE end_time IS NULL;
        CREATE INDEX idx_attendances_occurrence ON attendances(occurrence_id, end_time);
        CREATE INDEX idx_attendances_person ON attendances(person_id, start_time);
    )";

    auto result = execute_sql(db, sql);
    if (result.is_err()) {
        return result;
    }
    return record_migration(db, 1, "Directory, occurrence and attendance tables");
}

auto migration_runner::migrate_v2(sqlite3* db) -> VoidResult {
    const char* sql = R"(
        CREATE TABLE authorized_pickups (
            pickup_id             INTEGER PRIMARY KEY AUTOINCREMENT,
            child_person_id       INTEGER NOT NULL REFERENCES people(person_id),
            authorized_person_id  INTEGER REFERENCES people(person_id),
            name                  TEXT,
            relationship          TEXT NOT NULL,
            authorization_level   TEXT NOT NULL
                CHECK (authorization_level IN ('Always', 'EmergencyOnly', 'Never')),
            phone_number          TEXT NOT NULL DEFAULT '',
            custody_notes         TEXT NOT NULL DEFAULT '',
            is_active             INTEGER NOT NULL DEFAULT 1,
            created_at            TEXT NOT NULL,
            modified_at           TEXT NOT NULL,
            CHECK (authorized_person_id IS NOT NULL OR name IS NOT NULL)
        );

        -- At most one active authorization per (child, person)
        CREATE UNIQUE INDEX idx_authorized_pickups_person
            ON authorized_pickups(child_person_id, authorized_person_id)
            WHERE is_active = 1 AND authorized_person_id IS NOT NULL;
        CREATE UNIQUE INDEX idx_authorized_pickups_name
            ON authorized_pickups(child_person_id, name COLLATE NOCASE)
            WHERE is_active = 1 AND authorized_person_id IS NULL;

        CREATE TABLE pickup_logs (
            log_id                INTEGER PRIMARY KEY AUTOINCREMENT,
            attendance_id         INTEGER NOT NULL REFERENCES attendances(attendance_id),
            child_person_id       INTEGER NOT NULL REFERENCES people(person_id),
            pickup_person_id      INTEGER REFERENCES people(person_id),
            pickup_person_name    TEXT,
            was_authorized        INTEGER NOT NULL,
            authorized_pickup_id  INTEGER REFERENCES authorized_pickups(pickup_id),
            supervisor_override   INTEGER NOT NULL,
            supervisor_person_id  INTEGER REFERENCES people(person_id),
            notes                 TEXT NOT NULL DEFAULT '',
            checkout_time         TEXT NOT NULL
        );
        CREATE INDEX idx_pickup_logs_child ON pickup_logs(child_person_id, checkout_time);

        CREATE TRIGGER trg_pickup_logs_no_update BEFORE UPDATE ON pickup_logs
        BEGIN
            SELECT RAISE(ABORT, 'pickup_logs is append-only');
        END;
        CREATE TRIGGER trg_pickup_logs_no_delete BEFORE DELETE ON pickup_logs
        BEGIN
            SELECT RAISE(ABORT, 'pickup_logs is append-only');
        END;
    )";

    auto result = execute_sql(db, sql);
    if (result.is_err()) {
        return result;
    }
    return record_migration(db, 2, "Authorized pickups and pickup log");
}

}  // namespace checkin::storage
