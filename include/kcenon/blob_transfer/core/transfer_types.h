/**
 * @file transfer_types.h
 * @brief Transfer state machine and value types shared by all modules
 *
 * Defines the transfer state machine, the transfer kinds, per-blob options
 * and the immutable snapshot/progress values handed to observers.
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_TRANSFER_TYPES_H
#define KCENON_BLOB_TRANSFER_CORE_TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "types.h"

namespace kcenon::blob_transfer {

/**
 * @brief Transfer state enumeration
 *
 * pending -> in_progress -> completed is the happy path. Active transfers
 * can be paused and resumed, canceled, or fail. Any state can move to
 * deleted through an explicit remove.
 */
enum class transfer_state : uint8_t {
    pending,      // Queued, no operation has started yet
    in_progress,  // At least one operation is running
    paused,       // Stopped by the user or by connectivity loss
    canceled,     // Stopped for good
    failed,       // Stopped by an error, resumable after reconnect
    completed,    // Finishing operation succeeded
    deleted,      // Removed from the manager and the store
};

[[nodiscard]] constexpr auto to_string(transfer_state state) noexcept
    -> std::string_view {
    switch (state) {
        case transfer_state::pending:
            return "pending";
        case transfer_state::in_progress:
            return "in_progress";
        case transfer_state::paused:
            return "paused";
        case transfer_state::canceled:
            return "canceled";
        case transfer_state::failed:
            return "failed";
        case transfer_state::completed:
            return "completed";
        case transfer_state::deleted:
            return "deleted";
        default:
            return "unknown";
    }
}

[[nodiscard]] auto parse_transfer_state(std::string_view text)
    -> std::optional<transfer_state>;

/**
 * @brief Active states: pending or in_progress
 */
[[nodiscard]] constexpr auto is_active_state(transfer_state state) noexcept
    -> bool {
    return state == transfer_state::pending ||
           state == transfer_state::in_progress;
}

/**
 * @brief Resumable states: paused or failed
 */
[[nodiscard]] constexpr auto is_resumable_state(transfer_state state) noexcept
    -> bool {
    return state == transfer_state::paused || state == transfer_state::failed;
}

/**
 * @brief Terminal states: canceled, completed or deleted
 */
[[nodiscard]] constexpr auto is_terminal_state(transfer_state state) noexcept
    -> bool {
    return state == transfer_state::canceled ||
           state == transfer_state::completed ||
           state == transfer_state::deleted;
}

/**
 * @brief Check whether the state machine allows moving from one state to another
 *
 * Same-state moves are not transitions and return false.
 */
[[nodiscard]] constexpr auto is_valid_transition(transfer_state from,
                                                 transfer_state to) noexcept
    -> bool {
    if (from == to) {
        return false;
    }
    if (to == transfer_state::deleted) {
        return true;
    }

    switch (from) {
        case transfer_state::pending:
            return to == transfer_state::in_progress ||
                   to == transfer_state::paused ||
                   to == transfer_state::canceled ||
                   to == transfer_state::failed;
        case transfer_state::in_progress:
            return to == transfer_state::completed ||
                   to == transfer_state::paused ||
                   to == transfer_state::canceled ||
                   to == transfer_state::failed;
        case transfer_state::paused:
            return to == transfer_state::pending ||
                   to == transfer_state::canceled ||
                   to == transfer_state::failed;
        case transfer_state::failed:
            return to == transfer_state::pending;
        default:
            return false;
    }
}

/**
 * @brief Transfer direction
 */
enum class transfer_type : uint8_t {
    upload,    // Local source -> remote blob
    download,  // Remote blob -> local destination
};

[[nodiscard]] constexpr auto to_string(transfer_type type) noexcept
    -> std::string_view {
    switch (type) {
        case transfer_type::upload:
            return "upload";
        case transfer_type::download:
            return "download";
        default:
            return "unknown";
    }
}

[[nodiscard]] auto parse_transfer_type(std::string_view text)
    -> std::optional<transfer_type>;

/**
 * @brief Entity kind carried by a transfer record
 */
enum class transfer_kind : uint8_t {
    block,
    blob,
    multi_blob,
};

[[nodiscard]] constexpr auto to_string(transfer_kind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case transfer_kind::block:
            return "block";
        case transfer_kind::blob:
            return "blob";
        case transfer_kind::multi_blob:
            return "multi_blob";
        default:
            return "unknown";
    }
}

[[nodiscard]] auto parse_transfer_kind(std::string_view text)
    -> std::optional<transfer_kind>;

/**
 * @brief Block size limits for blob transfers
 */
inline constexpr uint64_t min_block_size = 64 * 1024;
inline constexpr uint64_t default_block_size = 4 * 1024 * 1024;
inline constexpr uint64_t max_block_size = 100 * 1024 * 1024;

/**
 * @brief Per-blob options, persisted with the blob so a helper can be rebuilt
 */
struct blob_transfer_options {
    uint64_t block_size = default_block_size;
    bool overwrite = false;
    bool verify_checksum = true;
    std::string content_type;

    [[nodiscard]] auto operator==(const blob_transfer_options&) const
        -> bool = default;
};

/**
 * @brief One entry of a block plan: a contiguous byte range and its block id
 */
struct block_range {
    uint64_t start = 0;
    uint64_t end = 0;  // exclusive
    std::string block_id;

    [[nodiscard]] auto length() const noexcept -> uint64_t {
        return end > start ? end - start : 0;
    }

    [[nodiscard]] auto operator==(const block_range&) const -> bool = default;
};

/**
 * @brief Aggregated progress of a transfer
 */
struct transfer_progress {
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    uint32_t completed_blocks = 0;
    uint32_t total_blocks = 0;

    [[nodiscard]] auto completion_percentage() const noexcept -> double {
        if (total_bytes == 0) return 0.0;
        return static_cast<double>(bytes_transferred) /
               static_cast<double>(total_bytes) * 100.0;
    }

    [[nodiscard]] auto is_complete() const noexcept -> bool {
        return total_bytes > 0 && bytes_transferred == total_bytes;
    }
};

/**
 * @brief Immutable copy of a transfer entity
 *
 * Handed to observers and returned by queries; never aliases manager state.
 */
struct transfer_snapshot {
    transfer_id id;
    transfer_kind kind = transfer_kind::blob;
    transfer_state state = transfer_state::pending;
    std::optional<transfer_id> parent;
    std::string restoration_id;
    transfer_type type = transfer_type::upload;
    std::string source;
    std::string destination;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    uint32_t total_blocks = 0;
    uint64_t start_range = 0;
    uint64_t end_range = 0;
    std::string error_message;

    [[nodiscard]] auto is_root() const noexcept -> bool {
        return !parent.has_value();
    }
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_TRANSFER_TYPES_H
