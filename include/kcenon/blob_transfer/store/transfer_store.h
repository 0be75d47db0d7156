/**
 * @file transfer_store.h
 * @brief Durable store of transfer records
 */

#ifndef KCENON_BLOB_TRANSFER_STORE_TRANSFER_STORE_H
#define KCENON_BLOB_TRANSFER_STORE_TRANSFER_STORE_H

#include <kcenon/blob_transfer/core/transfer_entities.h>
#include <kcenon/blob_transfer/core/types.h>

#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Predicate applied to records by transfer_store::fetch
 *
 * An empty filter matches every record.
 */
using transfer_filter = std::function<bool(const transfer_record&)>;

namespace filters {

/**
 * @brief Records without a parent (roots)
 */
[[nodiscard]] auto has_no_parent() -> transfer_filter;

/**
 * @brief Records whose parent is the given id
 */
[[nodiscard]] auto has_parent(const transfer_id& parent) -> transfer_filter;

[[nodiscard]] auto with_restoration_id(std::string restoration_id) -> transfer_filter;

[[nodiscard]] auto with_state(transfer_state state) -> transfer_filter;

}  // namespace filters

/**
 * @brief Interface of a durable transfer store
 *
 * Records are returned in the order they were first saved. Composite
 * records come back with their child id lists.
 */
class transfer_store {
public:
    virtual ~transfer_store() = default;

    [[nodiscard]] virtual auto fetch(transfer_kind kind,
                                     const transfer_filter& filter = {})
        -> result<std::vector<transfer_record>> = 0;

    /**
     * @brief Insert or replace records by id
     */
    [[nodiscard]] virtual auto save(const std::vector<transfer_record>& records)
        -> result<void> = 0;

    /**
     * @brief Remove a record and every record below it
     */
    [[nodiscard]] virtual auto remove(const transfer_id& id) -> result<void> = 0;

    [[nodiscard]] virtual auto clear() -> result<void> = 0;
};

/**
 * @brief In-memory store; state is lost with the process
 *
 * @note Thread-safe.
 */
class memory_transfer_store : public transfer_store {
public:
    memory_transfer_store() = default;

    [[nodiscard]] auto fetch(transfer_kind kind, const transfer_filter& filter = {})
        -> result<std::vector<transfer_record>> override;
    [[nodiscard]] auto save(const std::vector<transfer_record>& records)
        -> result<void> override;
    [[nodiscard]] auto remove(const transfer_id& id) -> result<void> override;
    [[nodiscard]] auto clear() -> result<void> override;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    struct entry {
        uint64_t sequence = 0;
        transfer_record record;
    };

    mutable std::mutex mutex_;
    std::unordered_map<transfer_id, entry> records_;
    uint64_t next_sequence_ = 0;
};

/**
 * @brief Ids of a record and all records below it, following parent links
 */
template <typename Map, typename ParentOf>
[[nodiscard]] auto collect_cascade(const Map& records, const transfer_id& root,
                                   ParentOf parent_of) -> std::vector<transfer_id> {
    std::vector<transfer_id> ids{root};
    std::unordered_set<transfer_id> seen{root};
    bool grown = true;
    while (grown) {
        grown = false;
        for (const auto& [id, value] : records) {
            auto parent = parent_of(value);
            if (parent && seen.contains(*parent) && !seen.contains(id)) {
                seen.insert(id);
                ids.push_back(id);
                grown = true;
            }
        }
    }
    return ids;
}

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_STORE_TRANSFER_STORE_H
