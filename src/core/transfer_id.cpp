/**
 * @file transfer_id.cpp
 * @brief Implementation of transfer_id generation and serialization
 */

#include "kcenon/blob_transfer/core/types.h"

#include <cctype>
#include <random>
#include <string>

namespace kcenon::blob_transfer {

namespace {

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower >= 'a' && lower <= 'f') return lower - 'a' + 10;
    return -1;
}

}  // namespace

auto transfer_id::generate() -> transfer_id {
    transfer_id id;

    // One engine per thread; entity ids are minted from manager and worker threads
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    for (std::size_t half = 0; half < 2; ++half) {
        auto bits = dis(gen);
        for (std::size_t i = 0; i < 8; ++i) {
            id.bytes[half * 8 + i] = static_cast<uint8_t>(bits >> (i * 8));
        }
    }

    // RFC 4122 version 4, variant 10xx
    id.bytes[6] = static_cast<uint8_t>((id.bytes[6] & 0x0F) | 0x40);
    id.bytes[8] = static_cast<uint8_t>((id.bytes[8] & 0x3F) | 0x80);

    return id;
}

auto transfer_id::to_string() const -> std::string {
    static constexpr char digits[] = "0123456789abcdef";

    // xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx
    std::string text;
    text.reserve(36);
    for (std::size_t i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            text += '-';
        }
        text += digits[bytes[i] >> 4];
        text += digits[bytes[i] & 0x0F];
    }
    return text;
}

auto transfer_id::from_string(std::string_view str)
    -> std::optional<transfer_id> {
    // Canonical 36-character form or 32 bare hex digits
    bool dashed = str.size() == 36;
    if (!dashed && str.size() != 32) {
        return std::nullopt;
    }

    transfer_id id;
    std::size_t pos = 0;
    for (std::size_t i = 0; i < 16; ++i) {
        if (dashed && (i == 4 || i == 6 || i == 8 || i == 10)) {
            if (str[pos] != '-') {
                return std::nullopt;
            }
            ++pos;
        }
        auto high = hex_value(str[pos]);
        auto low = hex_value(str[pos + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        id.bytes[i] = static_cast<uint8_t>((high << 4) | low);
        pos += 2;
    }

    return id;
}

}  // namespace kcenon::blob_transfer
