/**
 * @file sqlite_helpers.hpp
 * @brief Statement and column helpers shared by the SQLite repositories
 *
 * Internal header; not installed.
 */

#pragma once

#include <checkin/compat/format.hpp>
#include <checkin/compat/time.hpp>
#include <checkin/core/result.hpp>

#include <sqlite3.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace checkin::storage::detail {

struct statement_deleter {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};

/// Finalizes the statement when it goes out of scope
using statement_ptr = std::unique_ptr<sqlite3_stmt, statement_deleter>;

/// Map a SQLite result code to a check-in error code
[[nodiscard]] inline auto to_error_code(int rc) -> int {
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return error_codes::database_constraint_violation;
    }
    return error_codes::database_query_error;
}

/// Whether the failed step broke a UNIQUE constraint or index
[[nodiscard]] inline auto is_unique_violation(sqlite3* db, int rc) -> bool {
    return (rc & 0xff) == SQLITE_CONSTRAINT &&
           sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_UNIQUE;
}

/// Prepare a statement or return a database_query_error
[[nodiscard]] inline auto prepare(sqlite3* db, std::string_view sql,
                                  std::string_view module)
    -> Result<statement_ptr> {
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db, sql.data(), static_cast<int>(sql.size()),
                                 &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return make_error<statement_ptr>(
            error_codes::database_query_error,
            checkin::compat::format("Failed to prepare statement: {}",
                                    sqlite3_errmsg(db)),
            std::string(module));
    }
    return statement_ptr(stmt);
}

/// Build an error Result from the connection's last error
template <typename T>
[[nodiscard]] auto step_error(sqlite3* db, int rc, std::string_view what,
                              std::string_view module) -> Result<T> {
    return make_error<T>(
        to_error_code(rc),
        checkin::compat::format("{}: {}", what, sqlite3_errmsg(db)),
        std::string(module));
}

inline void bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) {
    sqlite3_bind_text(stmt, idx, value.data(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

inline void bind_optional_int64(sqlite3_stmt* stmt, int idx,
                                const std::optional<std::int64_t>& value) {
    if (value) {
        sqlite3_bind_int64(stmt, idx, *value);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

inline void bind_optional_int(sqlite3_stmt* stmt, int idx,
                              const std::optional<int>& value) {
    if (value) {
        sqlite3_bind_int(stmt, idx, *value);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

inline void bind_timestamp(sqlite3_stmt* stmt, int idx,
                           std::chrono::system_clock::time_point tp) {
    bind_text(stmt, idx, checkin::compat::to_timestamp_string(tp));
}

[[nodiscard]] inline auto get_text_column(sqlite3_stmt* stmt, int col) -> std::string {
    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

[[nodiscard]] inline auto get_int64_column(sqlite3_stmt* stmt, int col,
                                           std::int64_t default_val = 0)
    -> std::int64_t {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return default_val;
    }
    return sqlite3_column_int64(stmt, col);
}

[[nodiscard]] inline auto get_optional_int64_column(sqlite3_stmt* stmt, int col)
    -> std::optional<std::int64_t> {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int64(stmt, col);
}

[[nodiscard]] inline auto get_optional_int_column(sqlite3_stmt* stmt, int col)
    -> std::optional<int> {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return sqlite3_column_int(stmt, col);
}

[[nodiscard]] inline auto get_bool_column(sqlite3_stmt* stmt, int col) -> bool {
    return sqlite3_column_int(stmt, col) != 0;
}

[[nodiscard]] inline auto get_timestamp_column(sqlite3_stmt* stmt, int col)
    -> std::chrono::system_clock::time_point {
    return checkin::compat::from_timestamp_string(get_text_column(stmt, col))
        .value_or(std::chrono::system_clock::time_point{});
}

[[nodiscard]] inline auto get_optional_timestamp_column(sqlite3_stmt* stmt, int col)
    -> std::optional<std::chrono::system_clock::time_point> {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return checkin::compat::from_timestamp_string(get_text_column(stmt, col));
}

}  // namespace checkin::storage::detail
