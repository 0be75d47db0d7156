/**
 * @file transfer_entities.cpp
 * @brief Implementation of the transfer arena and record helpers
 */

#include "kcenon/blob_transfer/core/transfer_entities.h"

#include <algorithm>
#include <cstdio>

namespace kcenon::blob_transfer {

auto base_of(transfer_record& record) -> transfer_base& {
    return std::visit([](auto& entity) -> transfer_base& { return entity; },
                      record);
}

auto base_of(const transfer_record& record) -> const transfer_base& {
    return std::visit(
        [](const auto& entity) -> const transfer_base& { return entity; },
        record);
}

auto kind_of(const transfer_record& record) noexcept -> transfer_kind {
    return std::visit(
        overloaded{
            [](const block_transfer&) { return transfer_kind::block; },
            [](const blob_transfer&) { return transfer_kind::blob; },
            [](const multi_blob_transfer&) { return transfer_kind::multi_blob; },
        },
        record);
}

auto child_ids(const transfer_record& record)
    -> const std::vector<transfer_id>& {
    static const std::vector<transfer_id> no_children;
    return std::visit(
        overloaded{
            [](const block_transfer&) -> const std::vector<transfer_id>& {
                return no_children;
            },
            [](const blob_transfer& blob) -> const std::vector<transfer_id>& {
                return blob.blocks;
            },
            [](const multi_blob_transfer& multi)
                -> const std::vector<transfer_id>& { return multi.blobs; },
        },
        record);
}

auto derive_composite_state(const std::vector<transfer_state>& children,
                            bool any_started) -> transfer_state {
    if (children.empty()) {
        return transfer_state::pending;
    }

    auto count = [&children](auto pred) {
        return std::count_if(children.begin(), children.end(), pred);
    };

    if (count([](transfer_state s) { return s == transfer_state::completed; }) ==
        static_cast<std::ptrdiff_t>(children.size())) {
        return transfer_state::completed;
    }
    if (count([](transfer_state s) { return is_active_state(s); }) > 0) {
        return any_started ? transfer_state::in_progress
                           : transfer_state::pending;
    }
    if (count([](transfer_state s) { return s == transfer_state::failed; }) > 0) {
        return transfer_state::failed;
    }
    if (count([](transfer_state s) { return s == transfer_state::paused; }) > 0) {
        return transfer_state::paused;
    }
    return transfer_state::canceled;
}

auto make_block_id(uint32_t index) -> std::string {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "block-%06u", index);
    return buf;
}

// ============================================================================
// transfer_arena
// ============================================================================

auto transfer_arena::insert(transfer_record record) -> bool {
    auto id = base_of(record).id;
    return records_.emplace(id, std::move(record)).second;
}

auto transfer_arena::insert_root(transfer_record record) -> bool {
    auto id = base_of(record).id;
    if (!insert(std::move(record))) {
        return false;
    }
    roots_.push_back(id);
    return true;
}

auto transfer_arena::contains(const transfer_id& id) const -> bool {
    return records_.find(id) != records_.end();
}

auto transfer_arena::find(const transfer_id& id) -> transfer_record* {
    auto it = records_.find(id);
    return it != records_.end() ? &it->second : nullptr;
}

auto transfer_arena::find(const transfer_id& id) const
    -> const transfer_record* {
    auto it = records_.find(id);
    return it != records_.end() ? &it->second : nullptr;
}

auto transfer_arena::subtree(const transfer_id& id) const
    -> std::vector<transfer_id> {
    std::vector<transfer_id> ids;
    std::vector<transfer_id> stack{id};

    while (!stack.empty()) {
        auto current = stack.back();
        stack.pop_back();

        const auto* record = find(current);
        if (!record) {
            continue;
        }
        ids.push_back(current);

        const auto& children = child_ids(*record);
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    return ids;
}

auto transfer_arena::erase_subtree(const transfer_id& id)
    -> std::vector<transfer_id> {
    auto* record = find(id);
    if (!record) {
        return {};
    }

    auto parent = base_of(*record).parent;
    if (parent) {
        if (auto* parent_record = find(*parent)) {
            std::visit(
                overloaded{
                    [](block_transfer&) {},
                    [&id](blob_transfer& blob) {
                        std::erase(blob.blocks, id);
                        blob.total_blocks =
                            static_cast<uint32_t>(blob.blocks.size());
                    },
                    [&id](multi_blob_transfer& multi) {
                        std::erase(multi.blobs, id);
                    },
                },
                *parent_record);
        }
    } else {
        std::erase(roots_, id);
    }

    auto ids = subtree(id);
    for (const auto& erased : ids) {
        records_.erase(erased);
    }
    return ids;
}

auto transfer_arena::roots() const -> const std::vector<transfer_id>& {
    return roots_;
}

auto transfer_arena::size() const -> std::size_t { return records_.size(); }

auto transfer_arena::empty() const -> bool { return records_.empty(); }

void transfer_arena::clear() {
    records_.clear();
    roots_.clear();
}

void transfer_arena::refresh_blob_progress(blob_transfer& blob) const {
    uint64_t sum = 0;
    for (const auto& block_id : blob.blocks) {
        if (const auto* block = find_as<block_transfer>(block_id)) {
            sum += block->bytes_transferred;
        }
    }
    if (blob.total_bytes_to_transfer > 0) {
        sum = std::min(sum, blob.total_bytes_to_transfer);
    }
    blob.bytes_transferred = sum;
}

auto transfer_arena::progress(const transfer_id& id) const
    -> std::optional<transfer_progress> {
    const auto* record = find(id);
    if (!record) {
        return std::nullopt;
    }

    auto blob_progress = [this](const blob_transfer& blob) {
        transfer_progress p;
        p.bytes_transferred = blob.bytes_transferred;
        p.total_bytes = blob.total_bytes_to_transfer;
        p.total_blocks = blob.total_blocks;
        for (const auto& block_id : blob.blocks) {
            const auto* block = find_as<block_transfer>(block_id);
            if (block && block->state == transfer_state::completed) {
                ++p.completed_blocks;
            }
        }
        return p;
    };

    return std::visit(
        overloaded{
            [](const block_transfer& block) {
                transfer_progress p;
                p.bytes_transferred = block.bytes_transferred;
                p.total_bytes = block.length();
                p.total_blocks = 1;
                p.completed_blocks =
                    block.state == transfer_state::completed ? 1 : 0;
                return p;
            },
            [&blob_progress](const blob_transfer& blob) {
                return blob_progress(blob);
            },
            [this, &blob_progress](const multi_blob_transfer& multi) {
                transfer_progress total;
                for (const auto& blob_id : multi.blobs) {
                    if (const auto* blob = find_as<blob_transfer>(blob_id)) {
                        auto p = blob_progress(*blob);
                        total.bytes_transferred += p.bytes_transferred;
                        total.total_bytes += p.total_bytes;
                        total.completed_blocks += p.completed_blocks;
                        total.total_blocks += p.total_blocks;
                    }
                }
                return total;
            },
        },
        *record);
}

auto transfer_arena::snapshot(const transfer_id& id) const
    -> std::optional<transfer_snapshot> {
    const auto* record = find(id);
    if (!record) {
        return std::nullopt;
    }

    const auto& base = base_of(*record);
    transfer_snapshot snap;
    snap.id = base.id;
    snap.kind = kind_of(*record);
    snap.state = base.state;
    snap.parent = base.parent;
    snap.restoration_id = base.restoration_id;
    snap.error_message = base.error_message;

    std::visit(
        overloaded{
            [this, &snap](const block_transfer& block) {
                snap.start_range = block.start_range;
                snap.end_range = block.end_range;
                snap.bytes_transferred = block.bytes_transferred;
                snap.total_bytes = block.length();
                snap.total_blocks = 1;
                if (block.parent) {
                    if (const auto* blob = find_as<blob_transfer>(*block.parent)) {
                        snap.type = blob->type;
                        snap.source = blob->source;
                        snap.destination = blob->destination;
                    }
                }
            },
            [&snap](const blob_transfer& blob) {
                snap.type = blob.type;
                snap.source = blob.source;
                snap.destination = blob.destination;
                snap.bytes_transferred = blob.bytes_transferred;
                snap.total_bytes = blob.total_bytes_to_transfer;
                snap.total_blocks = blob.total_blocks;
            },
            [this, &snap](const multi_blob_transfer& multi) {
                snap.type = multi.type;
                snap.source = multi.source;
                snap.destination = multi.destination;
                if (auto p = progress(multi.id)) {
                    snap.bytes_transferred = p->bytes_transferred;
                    snap.total_bytes = p->total_bytes;
                    snap.total_blocks = p->total_blocks;
                }
            },
        },
        *record);

    return snap;
}

}  // namespace kcenon::blob_transfer
