/**
 * @file client_registry.h
 * @brief Restoration id to storage client lookup
 */

#ifndef KCENON_BLOB_TRANSFER_CLIENT_CLIENT_REGISTRY_H
#define KCENON_BLOB_TRANSFER_CLIENT_CLIENT_REGISTRY_H

#include <kcenon/blob_transfer/client/storage_client.h>
#include <kcenon/blob_transfer/core/types.h>

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace kcenon::blob_transfer {

/**
 * @brief Non-owning registry of storage clients
 *
 * The application owns its clients. An entry stays resolvable only while
 * the owner keeps the client alive; every lookup checks liveness and prunes
 * entries whose client is gone.
 *
 * @note Thread-safe.
 */
class client_registry {
public:
    client_registry() = default;

    client_registry(const client_registry&) = delete;
    client_registry& operator=(const client_registry&) = delete;

    /**
     * @brief Register a client under its restoration id
     * @return duplicate_restoration_id if a live client already uses the id,
     *         invalid_restoration_id for a null client or empty id
     */
    [[nodiscard]] auto register_client(const std::shared_ptr<storage_client>& client)
        -> result<void>;

    /**
     * @brief Live client for the id, or nullptr
     */
    [[nodiscard]] auto find(const std::string& restoration_id)
        -> std::shared_ptr<storage_client>;

    /**
     * @return true if an entry was removed
     */
    auto unregister_client(const std::string& restoration_id) -> bool;

    [[nodiscard]] auto is_registered(const std::string& restoration_id) -> bool;

    /**
     * @brief Number of live registrations
     */
    [[nodiscard]] auto size() -> std::size_t;

private:
    void prune_locked();

    std::mutex mutex_;
    std::unordered_map<std::string, std::weak_ptr<storage_client>> clients_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CLIENT_CLIENT_REGISTRY_H
