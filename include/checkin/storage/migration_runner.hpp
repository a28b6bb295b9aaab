/**
 * @file migration_runner.hpp
 * @brief Versioned schema migrations for the check-in database
 *
 * Each migration runs in its own transaction and is recorded in the
 * schema_version table, so that opening an existing database only applies
 * the versions it is missing.
 */

#pragma once

#include "migration_record.hpp"

#include <checkin/core/result.hpp>

#include <functional>
#include <string_view>
#include <utility>
#include <vector>

struct sqlite3;

namespace checkin::storage {

using migration_function = std::function<VoidResult(sqlite3* db)>;

/**
 * @brief Applies schema migrations in order
 *
 * Thread Safety: Not thread-safe; callers hold the database lock.
 */
class migration_runner {
public:
    migration_runner();
    ~migration_runner() = default;

    migration_runner(const migration_runner&) = delete;
    auto operator=(const migration_runner&) -> migration_runner& = delete;
    migration_runner(migration_runner&&) = delete;
    auto operator=(migration_runner&&) -> migration_runner& = delete;

    /**
     * @brief Bring the schema to the latest version
     */
    [[nodiscard]] auto run_migrations(sqlite3* db) -> VoidResult;

    /**
     * @brief Bring the schema to a specific version
     * @return Error if target_version exceeds the latest known version
     */
    [[nodiscard]] auto run_migrations_to(sqlite3* db, int target_version)
        -> VoidResult;

    /// Current schema version (0 for an empty database)
    [[nodiscard]] auto get_current_version(sqlite3* db) const -> int;

    [[nodiscard]] auto get_latest_version() const noexcept -> int;

    [[nodiscard]] auto needs_migration(sqlite3* db) const -> bool;

    [[nodiscard]] auto get_history(sqlite3* db) const
        -> std::vector<migration_record>;

private:
    [[nodiscard]] auto ensure_schema_version_table(sqlite3* db) -> VoidResult;

    [[nodiscard]] auto apply_migration(sqlite3* db, int version) -> VoidResult;

    [[nodiscard]] auto record_migration(sqlite3* db, int version,
                                        std::string_view description)
        -> VoidResult;

    [[nodiscard]] static auto execute_sql(sqlite3* db, std::string_view sql)
        -> VoidResult;

    /// V1: directory, occurrence, attendance and security code tables
    [[nodiscard]] auto migrate_v1(sqlite3* db) -> VoidResult;

    /// V2: standing pickup authorizations and the append-only pickup log
    [[nodiscard]] auto migrate_v2(sqlite3* db) -> VoidResult;

    static constexpr int LATEST_VERSION = 2;

    std::vector<std::pair<int, migration_function>> migrations_;
};

}  // namespace checkin::storage
