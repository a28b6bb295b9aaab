/**
 * @file id_codec.hpp
 * @brief Translation between external opaque identifiers and internal keys
 *
 * Callers outside the process only ever see encoded identifiers. A string
 * that does not decode is an input error (error_codes::invalid_id), which
 * is reported separately from a key that decodes but names no record.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace checkin::core {

/**
 * @class id_codec
 * @brief Abstract identifier codec
 */
class id_codec {
public:
    virtual ~id_codec() = default;

    /// Encode an internal key for external use
    [[nodiscard]] virtual auto encode(std::int64_t id) const -> std::string = 0;

    /**
     * @brief Decode an external identifier
     * @return The internal key, or nullopt when the identifier is malformed
     */
    [[nodiscard]] virtual auto decode(std::string_view external) const
        -> std::optional<std::int64_t> = 0;
};

/**
 * @class numeric_id_codec
 * @brief Identity codec: external identifiers are positive decimal integers
 */
class numeric_id_codec final : public id_codec {
public:
    [[nodiscard]] auto encode(std::int64_t id) const -> std::string override;

    [[nodiscard]] auto decode(std::string_view external) const
        -> std::optional<std::int64_t> override;
};

}  // namespace checkin::core
