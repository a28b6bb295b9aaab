/**
 * @file id_codec.cpp
 * @brief Implementation of the numeric identifier codec
 */

#include <checkin/core/id_codec.hpp>

#include <charconv>

namespace checkin::core {

auto numeric_id_codec::encode(std::int64_t id) const -> std::string {
    return std::to_string(id);
}

auto numeric_id_codec::decode(std::string_view external) const
    -> std::optional<std::int64_t> {
    if (external.empty()) {
        return std::nullopt;
    }

    std::int64_t value = 0;
    const auto* first = external.data();
    const auto* last = external.data() + external.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value <= 0) {
        return std::nullopt;
    }
    return value;
}

}  // namespace checkin::core
