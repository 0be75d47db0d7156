/**
 * @file transfer_types.cpp
 * @brief Parsing of persisted transfer enumerations
 */

#include "kcenon/blob_transfer/core/transfer_types.h"

#include <array>

namespace kcenon::blob_transfer {

namespace {

template <typename Enum, std::size_t N>
auto parse_enum(std::string_view text, const std::array<Enum, N>& values)
    -> std::optional<Enum> {
    for (auto value : values) {
        if (to_string(value) == text) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace

auto parse_transfer_state(std::string_view text)
    -> std::optional<transfer_state> {
    static constexpr std::array<transfer_state, 7> states = {
        transfer_state::pending,  transfer_state::in_progress,
        transfer_state::paused,   transfer_state::canceled,
        transfer_state::failed,   transfer_state::completed,
        transfer_state::deleted};
    return parse_enum(text, states);
}

auto parse_transfer_type(std::string_view text)
    -> std::optional<transfer_type> {
    static constexpr std::array<transfer_type, 2> types = {
        transfer_type::upload, transfer_type::download};
    return parse_enum(text, types);
}

auto parse_transfer_kind(std::string_view text)
    -> std::optional<transfer_kind> {
    static constexpr std::array<transfer_kind, 3> kinds = {
        transfer_kind::block, transfer_kind::blob, transfer_kind::multi_blob};
    return parse_enum(text, kinds);
}

}  // namespace kcenon::blob_transfer
