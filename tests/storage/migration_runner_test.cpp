/**
 * @file migration_runner_test.cpp
 * @brief Unit tests for migration_runner class
 */

#include <catch2/catch_test_macros.hpp>

#include <checkin/storage/migration_runner.hpp>

#include <sqlite3.h>

#include <stdexcept>

using namespace checkin::storage;

// ============================================================================
// Test Utilities
// ============================================================================

namespace {

/// RAII wrapper for a bare SQLite connection
class test_database {
public:
    test_database() {
        if (sqlite3_open(":memory:", &db_) != SQLITE_OK) {
            throw std::runtime_error("Failed to open in-memory database");
        }
    }

    ~test_database() {
        if (db_ != nullptr) {
            sqlite3_close(db_);
        }
    }

    test_database(const test_database&) = delete;
    auto operator=(const test_database&) -> test_database& = delete;

    [[nodiscard]] auto get() const noexcept -> sqlite3* { return db_; }

    [[nodiscard]] auto object_exists(const char* type, const char* name) const -> bool {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, "SELECT 1 FROM sqlite_master WHERE type=? AND name=?;",
                               -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        sqlite3_bind_text(stmt, 1, type, -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmt, 2, name, -1, SQLITE_TRANSIENT);
        auto rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        return rc == SQLITE_ROW;
    }

    [[nodiscard]] auto exec(const char* sql) const -> int {
        return sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

private:
    sqlite3* db_ = nullptr;
};

}  // namespace

// ============================================================================
// Version Tests
// ============================================================================

TEST_CASE("migration_runner initial state", "[migration][version]") {
    test_database db;
    migration_runner runner;

    CHECK(runner.get_current_version(db.get()) == 0);
    CHECK(runner.needs_migration(db.get()));
    CHECK(runner.get_latest_version() == 2);
    CHECK(runner.get_history(db.get()).empty());
}

TEST_CASE("migration_runner run_migrations", "[migration][execute]") {
    test_database db;
    migration_runner runner;

    REQUIRE(runner.run_migrations(db.get()).is_ok());
    CHECK(runner.get_current_version(db.get()) == 2);
    CHECK_FALSE(runner.needs_migration(db.get()));

    auto history = runner.get_history(db.get());
    REQUIRE(history.size() == 2);
    CHECK(history[0].version == 1);
    CHECK(history[1].version == 2);

    SECTION("running again is a no-op") {
        REQUIRE(runner.run_migrations(db.get()).is_ok());
        CHECK(runner.get_history(db.get()).size() == 2);
    }
}

TEST_CASE("migration_runner run_migrations_to", "[migration][targeted]") {
    test_database db;
    migration_runner runner;

    REQUIRE(runner.run_migrations_to(db.get(), 1).is_ok());
    CHECK(runner.get_current_version(db.get()) == 1);
    CHECK(db.object_exists("table", "attendances"));
    CHECK_FALSE(db.object_exists("table", "pickup_logs"));

    REQUIRE(runner.run_migrations(db.get()).is_ok());
    CHECK(db.object_exists("table", "pickup_logs"));
}

// ============================================================================
// Schema Tests
// ============================================================================

TEST_CASE("migration_runner v1 creates attendance schema", "[migration][v1]") {
    test_database db;
    migration_runner runner;
    REQUIRE(runner.run_migrations(db.get()).is_ok());

    for (const auto* table : {"people", "locations", "schedules", "family_members",
                              "occurrences", "attendance_codes", "attendances"}) {
        INFO(table);
        CHECK(db.object_exists("table", table));
    }
    CHECK(db.object_exists("index", "idx_attendances_open"));
}

TEST_CASE("migration_runner v2 creates pickup schema", "[migration][v2]") {
    test_database db;
    migration_runner runner;
    REQUIRE(runner.run_migrations(db.get()).is_ok());

    CHECK(db.object_exists("table", "authorized_pickups"));
    CHECK(db.object_exists("table", "pickup_logs"));
    CHECK(db.object_exists("index", "idx_authorized_pickups_person"));
    CHECK(db.object_exists("index", "idx_authorized_pickups_name"));
    CHECK(db.object_exists("trigger", "trg_pickup_logs_no_update"));
    CHECK(db.object_exists("trigger", "trg_pickup_logs_no_delete"));
}

TEST_CASE("migration_runner schema enforces uniqueness", "[migration][constraints]") {
    test_database db;
    migration_runner runner;
    REQUIRE(runner.run_migrations(db.get()).is_ok());

    SECTION("one code per date") {
        REQUIRE(db.exec("INSERT INTO attendance_codes (issue_date, code, issued_at) "
                        "VALUES ('2026-03-01', 'AB23', '2026-03-01 09:00:00');") ==
                SQLITE_OK);
        CHECK(db.exec("INSERT INTO attendance_codes (issue_date, code, issued_at) "
                      "VALUES ('2026-03-01', 'AB23', '2026-03-01 09:05:00');") ==
              SQLITE_CONSTRAINT);
        CHECK(db.exec("INSERT INTO attendance_codes (issue_date, code, issued_at) "
                      "VALUES ('2026-03-02', 'AB23', '2026-03-02 09:00:00');") ==
              SQLITE_OK);
    }
}
