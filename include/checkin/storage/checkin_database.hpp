/**
 * @file checkin_database.hpp
 * @brief SQLite database handle shared by the check-in repositories
 *
 * One connection is shared by all repositories. Every statement and every
 * transaction runs under the connection mutex, so statements issued by
 * other threads never interleave with an open transaction.
 */

#pragma once

#include "migration_runner.hpp"

#include <checkin/core/result.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>

struct sqlite3;

namespace checkin::storage {

/**
 * @brief Connection settings applied when the database is opened
 */
struct checkin_database_config {
    /// Enable WAL journal (ignored for in-memory databases)
    bool wal_mode{true};

    /// How long SQLite waits on a locked file before SQLITE_BUSY
    std::chrono::milliseconds busy_timeout{5000};

    /// Enforce foreign keys
    bool foreign_keys{true};
};

/**
 * @brief Owner of the SQLite connection and its schema
 *
 * Thread Safety: All methods are thread-safe. The connection mutex is
 * recursive so repository calls may be nested inside transaction().
 *
 * @example
 * @code
 * auto db = checkin_database::open(":memory:");
 * if (db.is_ok()) {
 *     attendance_repository attendance{*db.value()};
 * }
 * @endcode
 */
class checkin_database {
public:
    [[nodiscard]] static auto open(std::string_view db_path)
        -> Result<std::unique_ptr<checkin_database>>;

    [[nodiscard]] static auto open(std::string_view db_path,
                                   const checkin_database_config& config)
        -> Result<std::unique_ptr<checkin_database>>;

    ~checkin_database();

    checkin_database(const checkin_database&) = delete;
    auto operator=(const checkin_database&) -> checkin_database& = delete;
    checkin_database(checkin_database&&) = delete;
    auto operator=(checkin_database&&) -> checkin_database& = delete;

    /// Raw connection; use only while holding lock()
    [[nodiscard]] auto native_handle() const noexcept -> sqlite3* { return db_; }

    /// Hold the connection for a sequence of statements
    [[nodiscard]] auto lock() const -> std::unique_lock<std::recursive_mutex> {
        return std::unique_lock<std::recursive_mutex>(mutex_);
    }

    [[nodiscard]] auto path() const -> const std::string& { return path_; }

    [[nodiscard]] auto schema_version() const -> int;

    /**
     * @brief Run fn inside BEGIN IMMEDIATE / COMMIT
     *
     * fn returns a Result; an error rolls the transaction back and is
     * returned unchanged. A call nested inside another transaction on the
     * same thread joins the outer transaction.
     */
    template <typename Fn>
    auto transaction(Fn&& fn) -> std::invoke_result_t<Fn> {
        using result_type = std::invoke_result_t<Fn>;

        auto guard = lock();
        if (transaction_depth_ > 0) {
            ++transaction_depth_;
            auto result = fn();
            --transaction_depth_;
            return result;
        }

        auto begin = execute("BEGIN IMMEDIATE;");
        if (begin.is_err()) {
            return result_type(begin.error());
        }

        ++transaction_depth_;
        auto result = fn();
        --transaction_depth_;

        if (result.is_err()) {
            (void)execute("ROLLBACK;");
            return result;
        }

        auto commit = execute("COMMIT;");
        if (commit.is_err()) {
            (void)execute("ROLLBACK;");
            return result_type(commit.error());
        }
        return result;
    }

    /**
     * @brief Execute SQL without result rows
     */
    [[nodiscard]] auto execute(std::string_view sql) -> VoidResult;

private:
    checkin_database(sqlite3* db, std::string path);

    sqlite3* db_{nullptr};
    std::string path_;
    migration_runner migration_runner_;
    mutable std::recursive_mutex mutex_;
    int transaction_depth_{0};
};

}  // namespace checkin::storage
