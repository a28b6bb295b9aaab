/**
 * @file result.hpp
 * @brief Result<T> type aliases and error codes for the check-in system
 *
 * Expected business outcomes (a full room, a wrong security code) are
 * values inside an ok Result. Everything returned through the error
 * channel is a fault: malformed input, a contract violation by the
 * caller, lock timeouts or storage failures.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/error/error_codes.h>
#include <kcenon/common/patterns/result.h>

#include <string>
#include <variant>

namespace checkin {

/**
 * @brief Result type alias for check-in operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief Check-in specific error codes
 *
 * Error code range: -700 to -799
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int checkin_base = -700;

    // Input and contract errors (-700 to -719)
    constexpr int invalid_id = checkin_base - 0;
    constexpr int not_found = checkin_base - 1;
    constexpr int argument_error = checkin_base - 2;
    constexpr int invalid_operation = checkin_base - 3;
    constexpr int duplicate_entry = checkin_base - 4;
    constexpr int invalid_configuration = checkin_base - 5;

    // Concurrency errors (-720 to -739)
    constexpr int lock_timeout = checkin_base - 20;
    constexpr int operation_cancelled = checkin_base - 21;

    // Security code errors (-740 to -759)
    constexpr int exhausted_keyspace = checkin_base - 40;
    constexpr int random_source_failure = checkin_base - 41;

    // Database errors (-780 to -799)
    constexpr int database_open_error = checkin_base - 80;
    constexpr int database_query_error = checkin_base - 81;
    constexpr int database_migration_error = checkin_base - 82;
    constexpr int database_transaction_error = checkin_base - 83;
    constexpr int database_constraint_violation = checkin_base - 84;
}  // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create an error Result carrying a check-in error code
 * @tparam T The result value type
 * @param code Error code from checkin::error_codes
 * @param message Error message
 * @param module Component reporting the error
 */
template <typename T>
inline Result<T> checkin_error(int code, const std::string& message,
                               const std::string& module = "checkin") {
    return kcenon::common::make_error<T>(code, message, module);
}

/**
 * @brief Create a void error result
 */
inline VoidResult checkin_void_error(int code, const std::string& message,
                                     const std::string& module = "checkin") {
    return VoidResult(error_info{code, message, module});
}

}  // namespace checkin
