/**
 * @file memory_transfer_store.cpp
 * @brief In-memory transfer store and record filters
 */

#include "kcenon/blob_transfer/store/transfer_store.h"

#include <algorithm>

namespace kcenon::blob_transfer {

namespace filters {

auto has_no_parent() -> transfer_filter {
    return [](const transfer_record& record) { return !base_of(record).parent; };
}

auto has_parent(const transfer_id& parent) -> transfer_filter {
    return [parent](const transfer_record& record) {
        const auto& p = base_of(record).parent;
        return p && *p == parent;
    };
}

auto with_restoration_id(std::string restoration_id) -> transfer_filter {
    return [id = std::move(restoration_id)](const transfer_record& record) {
        return base_of(record).restoration_id == id;
    };
}

auto with_state(transfer_state state) -> transfer_filter {
    return [state](const transfer_record& record) {
        return base_of(record).state == state;
    };
}

}  // namespace filters

auto memory_transfer_store::fetch(transfer_kind kind, const transfer_filter& filter)
    -> result<std::vector<transfer_record>> {
    std::lock_guard lock(mutex_);

    std::vector<const entry*> matches;
    for (const auto& [id, e] : records_) {
        if (kind_of(e.record) != kind) {
            continue;
        }
        if (filter && !filter(e.record)) {
            continue;
        }
        matches.push_back(&e);
    }
    std::sort(matches.begin(), matches.end(),
              [](const entry* a, const entry* b) { return a->sequence < b->sequence; });

    std::vector<transfer_record> out;
    out.reserve(matches.size());
    for (const auto* e : matches) {
        out.push_back(e->record);
    }
    return out;
}

auto memory_transfer_store::save(const std::vector<transfer_record>& records)
    -> result<void> {
    std::lock_guard lock(mutex_);
    for (const auto& record : records) {
        const auto& id = base_of(record).id;
        auto it = records_.find(id);
        if (it != records_.end()) {
            it->second.record = record;
        } else {
            records_.emplace(id, entry{next_sequence_++, record});
        }
    }
    return {};
}

auto memory_transfer_store::remove(const transfer_id& id) -> result<void> {
    std::lock_guard lock(mutex_);
    if (!records_.contains(id)) {
        return {};
    }
    auto doomed = collect_cascade(records_, id, [](const entry& e) {
        return base_of(e.record).parent;
    });
    for (const auto& victim : doomed) {
        records_.erase(victim);
    }
    return {};
}

auto memory_transfer_store::clear() -> result<void> {
    std::lock_guard lock(mutex_);
    records_.clear();
    return {};
}

auto memory_transfer_store::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return records_.size();
}

}  // namespace kcenon::blob_transfer
