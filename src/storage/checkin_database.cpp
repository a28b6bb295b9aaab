/**
 * @file checkin_database.cpp
 * @brief Implementation of the shared SQLite database handle
 */

#include <checkin/storage/checkin_database.hpp>

#include <checkin/compat/format.hpp>

#include <sqlite3.h>

namespace checkin::storage {

auto checkin_database::open(std::string_view db_path)
    -> Result<std::unique_ptr<checkin_database>> {
    return open(db_path, checkin_database_config{});
}

auto checkin_database::open(std::string_view db_path,
                            const checkin_database_config& config)
    -> Result<std::unique_ptr<checkin_database>> {
    sqlite3* db = nullptr;

    // FULLMUTEX: the connection is shared by every worker thread
    auto rc = sqlite3_open_v2(std::string(db_path).c_str(), &db,
                              SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                                  SQLITE_OPEN_FULLMUTEX,
                              nullptr);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return make_error<std::unique_ptr<checkin_database>>(
            error_codes::database_open_error,
            checkin::compat::format("Failed to open database: {}", error_msg),
            "storage");
    }

    sqlite3_busy_timeout(db, static_cast<int>(config.busy_timeout.count()));

    if (config.foreign_keys) {
        rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return make_error<std::unique_ptr<checkin_database>>(
                error_codes::database_open_error,
                "Failed to enable foreign keys", "storage");
        }
    }

    if (config.wal_mode && db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return make_error<std::unique_ptr<checkin_database>>(
                error_codes::database_open_error,
                "Failed to enable WAL mode", "storage");
        }
        (void)sqlite3_exec(db, "PRAGMA synchronous = NORMAL;", nullptr,
                           nullptr, nullptr);
    }

    auto instance = std::unique_ptr<checkin_database>(
        new checkin_database(db, std::string(db_path)));

    auto migration_result = instance->migration_runner_.run_migrations(db);
    if (migration_result.is_err()) {
        return make_error<std::unique_ptr<checkin_database>>(
            error_codes::database_migration_error,
            checkin::compat::format("Migration failed: {}",
                                    migration_result.error().message),
            "storage");
    }

    return instance;
}

checkin_database::checkin_database(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

checkin_database::~checkin_database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

auto checkin_database::schema_version() const -> int {
    auto guard = lock();
    return migration_runner_.get_current_version(db_);
}

auto checkin_database::execute(std::string_view sql) -> VoidResult {
    auto guard = lock();

    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db_, std::string(sql).c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        auto error_str = errmsg ? std::string(errmsg) : "Unknown error";
        sqlite3_free(errmsg);
        return checkin_void_error(
            error_codes::database_transaction_error,
            checkin::compat::format("SQL execution failed: {}", error_str),
            "storage");
    }
    return ok();
}

}  // namespace checkin::storage
