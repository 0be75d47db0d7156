/**
 * @file transfer_entities.h
 * @brief Transfer entity records and the id-keyed arena that owns them
 *
 * A transfer is one of three closed kinds: a block (one byte range), a blob
 * (one object, composed of blocks) or a multi-blob (a batch of blobs).
 * Composites own ordered lists of child ids; children point back to their
 * parent by id only. All records live in a transfer_arena.
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_TRANSFER_ENTITIES_H
#define KCENON_BLOB_TRANSFER_CORE_TRANSFER_ENTITIES_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "transfer_types.h"
#include "types.h"

namespace kcenon::blob_transfer {

/**
 * @brief Fields shared by every transfer kind
 */
struct transfer_base {
    transfer_id id;
    transfer_state state = transfer_state::pending;
    std::string restoration_id;
    std::optional<transfer_id> parent;
    std::string error_message;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @brief Leaf transfer: one contiguous byte range of one object
 *
 * bytes_transferred is either 0 or the full range length. The download
 * placeholder block spans 0..1 until the initial probe reports the real
 * first chunk.
 */
struct block_transfer : transfer_base {
    uint64_t start_range = 0;
    uint64_t end_range = 0;
    std::string block_id;
    uint32_t index = 0;
    uint64_t bytes_transferred = 0;

    [[nodiscard]] auto length() const noexcept -> uint64_t {
        return end_range > start_range ? end_range - start_range : 0;
    }

    [[nodiscard]] auto range() const -> block_range {
        return block_range{start_range, end_range, block_id};
    }
};

/**
 * @brief Composite transfer of one object
 */
struct blob_transfer : transfer_base {
    transfer_type type = transfer_type::upload;
    std::string source;
    std::string destination;
    uint64_t total_bytes_to_transfer = 0;
    uint64_t bytes_transferred = 0;
    uint32_t total_blocks = 0;
    bool initial_call_complete = false;
    std::vector<transfer_id> blocks;
    blob_transfer_options options;
    std::string checksum;
};

/**
 * @brief Batch of blob transfers submitted together
 */
struct multi_blob_transfer : transfer_base {
    transfer_type type = transfer_type::upload;
    std::string source;
    std::string destination;
    std::vector<transfer_id> blobs;
};

/**
 * @brief Closed set of transfer kinds
 */
using transfer_record =
    std::variant<block_transfer, blob_transfer, multi_blob_transfer>;

/**
 * @brief Helper for building std::visit overload sets
 */
template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

[[nodiscard]] auto base_of(transfer_record& record) -> transfer_base&;
[[nodiscard]] auto base_of(const transfer_record& record) -> const transfer_base&;
[[nodiscard]] auto kind_of(const transfer_record& record) noexcept -> transfer_kind;

/**
 * @brief Child ids of a composite (empty for blocks)
 */
[[nodiscard]] auto child_ids(const transfer_record& record)
    -> const std::vector<transfer_id>&;

/**
 * @brief Derive a multi-blob state from the states of its blobs
 *
 * All completed -> completed; any active -> in_progress, or pending when
 * none has started; otherwise failed, then paused, then canceled.
 */
[[nodiscard]] auto derive_composite_state(
    const std::vector<transfer_state>& children, bool any_started)
    -> transfer_state;

/**
 * @brief Arena owning every transfer record, keyed by id
 *
 * Keeps the root index (blob and multi-blob records without a parent) in
 * insertion order. Not thread-safe; the transfer manager serializes access.
 */
class transfer_arena {
public:
    transfer_arena() = default;

    /**
     * @brief Insert a record
     * @return false if a record with the same id already exists
     */
    auto insert(transfer_record record) -> bool;

    /**
     * @brief Insert a record and register it as a root
     */
    auto insert_root(transfer_record record) -> bool;

    [[nodiscard]] auto contains(const transfer_id& id) const -> bool;
    [[nodiscard]] auto find(const transfer_id& id) -> transfer_record*;
    [[nodiscard]] auto find(const transfer_id& id) const -> const transfer_record*;

    template <typename T>
    [[nodiscard]] auto find_as(const transfer_id& id) -> T* {
        auto* record = find(id);
        return record ? std::get_if<T>(record) : nullptr;
    }

    template <typename T>
    [[nodiscard]] auto find_as(const transfer_id& id) const -> const T* {
        const auto* record = find(id);
        return record ? std::get_if<T>(record) : nullptr;
    }

    /**
     * @brief Ids of the entity and all its descendants, parent first
     */
    [[nodiscard]] auto subtree(const transfer_id& id) const
        -> std::vector<transfer_id>;

    /**
     * @brief Erase the entity and all its descendants
     *
     * Also unlinks the entity from its parent's child list or from the root
     * index.
     * @return Ids of the erased records, parent first
     */
    auto erase_subtree(const transfer_id& id) -> std::vector<transfer_id>;

    /**
     * @brief Root ids in insertion order
     */
    [[nodiscard]] auto roots() const -> const std::vector<transfer_id>&;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto empty() const -> bool;
    void clear();

    /**
     * @brief Recompute a blob's transferred bytes from its blocks, clamped
     *        to the known total
     */
    void refresh_blob_progress(blob_transfer& blob) const;

    /**
     * @brief Aggregated progress of any entity
     */
    [[nodiscard]] auto progress(const transfer_id& id) const
        -> std::optional<transfer_progress>;

    /**
     * @brief Immutable snapshot of any entity
     */
    [[nodiscard]] auto snapshot(const transfer_id& id) const
        -> std::optional<transfer_snapshot>;

private:
    std::unordered_map<transfer_id, transfer_record> records_;
    std::vector<transfer_id> roots_;
};

/**
 * @brief Synthesize the block id of a download block from its index
 */
[[nodiscard]] auto make_block_id(uint32_t index) -> std::string;

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_TRANSFER_ENTITIES_H
