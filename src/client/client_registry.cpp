/**
 * @file client_registry.cpp
 * @brief Restoration id to storage client lookup
 */

#include "kcenon/blob_transfer/client/client_registry.h"

#include "kcenon/blob_transfer/core/logging.h"

namespace kcenon::blob_transfer {

auto client_registry::register_client(const std::shared_ptr<storage_client>& client)
    -> result<void> {
    if (!client || client->restoration_id().empty()) {
        return unexpected{error{error_code::invalid_restoration_id}};
    }

    const auto& id = client->restoration_id();
    std::lock_guard lock(mutex_);

    auto it = clients_.find(id);
    if (it != clients_.end()) {
        if (auto existing = it->second.lock()) {
            BT_LOG_WARN(log_category::client,
                        "Client already registered for restoration id " + id);
            return unexpected{error{error_code::duplicate_restoration_id,
                                    "a client is already registered for " + id}};
        }
        it->second = client;
    } else {
        clients_.emplace(id, client);
    }

    BT_LOG_INFO(log_category::client, "Registered client for restoration id " + id);
    return {};
}

auto client_registry::find(const std::string& restoration_id)
    -> std::shared_ptr<storage_client> {
    std::lock_guard lock(mutex_);
    auto it = clients_.find(restoration_id);
    if (it == clients_.end()) {
        return nullptr;
    }
    auto client = it->second.lock();
    if (!client) {
        BT_LOG_DEBUG(log_category::client,
                     "Client for restoration id " + restoration_id + " is gone");
        clients_.erase(it);
    }
    return client;
}

auto client_registry::unregister_client(const std::string& restoration_id) -> bool {
    std::lock_guard lock(mutex_);
    return clients_.erase(restoration_id) > 0;
}

auto client_registry::is_registered(const std::string& restoration_id) -> bool {
    return find(restoration_id) != nullptr;
}

auto client_registry::size() -> std::size_t {
    std::lock_guard lock(mutex_);
    prune_locked();
    return clients_.size();
}

void client_registry::prune_locked() {
    std::erase_if(clients_, [](const auto& entry) { return entry.second.expired(); });
}

}  // namespace kcenon::blob_transfer
