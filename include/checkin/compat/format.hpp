/**
 * @file format.hpp
 * @brief Unified string formatting over std::format or {fmt}
 *
 * std::format is used when the standard library advertises it through
 * __cpp_lib_format; otherwise the fmt library provides the same API.
 *
 * Usage:
 *   #include <checkin/compat/format.hpp>
 *   auto s = checkin::compat::format("Room {} is full", location_id);
 */

#pragma once

#include <version>

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define CHECKIN_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    #define CHECKIN_HAS_STD_FORMAT 1
#else
    #define CHECKIN_HAS_STD_FORMAT 0
#endif

#if CHECKIN_HAS_STD_FORMAT
    #include <format>
    namespace checkin::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    #include <fmt/format.h>
    namespace checkin::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
