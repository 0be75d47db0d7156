/**
 * @file transfer_manager.h
 * @brief Resumable multi-part transfer manager
 */

#ifndef KCENON_BLOB_TRANSFER_MANAGER_TRANSFER_MANAGER_H
#define KCENON_BLOB_TRANSFER_MANAGER_TRANSFER_MANAGER_H

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "kcenon/blob_transfer/adapters/thread_pool_adapter.h"
#include "kcenon/blob_transfer/client/storage_client.h"
#include "kcenon/blob_transfer/core/transfer_types.h"
#include "kcenon/blob_transfer/core/types.h"
#include "kcenon/blob_transfer/manager/manager_types.h"
#include "kcenon/blob_transfer/manager/transfer_observer.h"
#include "kcenon/blob_transfer/reachability/reachability_monitor.h"
#include "kcenon/blob_transfer/store/transfer_store.h"

namespace kcenon::blob_transfer {

/**
 * @brief Owns every transfer, schedules its operations and persists it
 *
 * Uploads and downloads are split into blocks that run concurrently on an
 * operation queue; a finishing operation (commit or finalize) runs after all
 * blocks of a blob succeeded. Every state change is saved to the durable
 * store so transfers survive a restart and resume from completed blocks.
 *
 * @code
 * auto manager_result = transfer_manager::builder()
 *     .with_max_concurrency(4)
 *     .with_store(std::make_shared<json_transfer_store>())
 *     .build();
 *
 * if (manager_result.has_value()) {
 *     auto& manager = manager_result.value();
 *     manager.register_client(client);
 *     manager.start_managing();
 *     auto id = manager.upload({"backup", "/data/a.bin", "a.bin"});
 * }
 * @endcode
 *
 * @note Thread-safe. Observers and progress handlers are invoked without
 *       the manager lock held.
 */
class transfer_manager {
public:
    /**
     * @brief Builder for transfer_manager
     */
    class builder {
    public:
        builder();

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(transfer_manager_config config) -> builder&;

        /**
         * @brief Set the number of operations in flight (default: 4)
         */
        auto with_max_concurrency(std::size_t max_concurrency) -> builder&;

        /**
         * @brief Set the pool worker count (default: hardware concurrency)
         */
        auto with_worker_count(std::size_t worker_count) -> builder&;

        /**
         * @brief Set the durable store (default: memory_transfer_store)
         */
        auto with_store(std::shared_ptr<transfer_store> store) -> builder&;

        /**
         * @brief Set the reachability source (default: interface monitor)
         */
        auto with_reachability_monitor(std::shared_ptr<reachability_monitor> monitor)
            -> builder&;

        /**
         * @brief Set the state change observer
         */
        auto with_observer(std::shared_ptr<transfer_observer> observer) -> builder&;

        /**
         * @brief Run operations on an existing pool
         */
        auto with_thread_pool(
            std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder&;

        /**
         * @brief Build the manager instance
         * @return Result containing the manager or an error
         */
        [[nodiscard]] auto build() -> result<transfer_manager>;

    private:
        transfer_manager_config config_;
        std::shared_ptr<transfer_store> store_;
        std::shared_ptr<reachability_monitor> monitor_;
        std::shared_ptr<transfer_observer> observer_;
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
    };

    // Non-copyable, movable
    transfer_manager(const transfer_manager&) = delete;
    auto operator=(const transfer_manager&) -> transfer_manager& = delete;
    transfer_manager(transfer_manager&&) noexcept;
    auto operator=(transfer_manager&&) noexcept -> transfer_manager&;
    ~transfer_manager();

    // Client registry
    /**
     * @brief Register an application-owned client
     *
     * The manager does not extend the client's lifetime; once the owner
     * releases it, transfers bound to its restoration id cannot resume.
     * @return duplicate_restoration_id if a live client uses the same id
     */
    [[nodiscard]] auto register_client(const std::shared_ptr<storage_client>& client)
        -> result<void>;

    /**
     * @brief Live client registered under the id, or nullptr
     */
    [[nodiscard]] auto client(const std::string& restoration_id) const
        -> std::shared_ptr<storage_client>;

    auto unregister_client(const std::string& restoration_id) -> bool;

    // Lifecycle
    /**
     * @brief Load persisted transfers (once) and start listening for
     *        reachability changes
     * @return store_corrupted if the store holds orphan records
     */
    [[nodiscard]] auto start_managing() -> result<void>;

    /**
     * @brief Stop listening, pause every transfer and flush the store
     */
    [[nodiscard]] auto stop_managing() -> result<void>;

    [[nodiscard]] auto is_managing() const -> bool;

    // Transfer creation
    /**
     * @brief Upload one file as one remote object
     * @return Id of the new blob transfer
     */
    [[nodiscard]] auto upload(const upload_request& request) -> result<transfer_id>;

    /**
     * @brief Download one remote object to one file
     */
    [[nodiscard]] auto download(const download_request& request) -> result<transfer_id>;

    /**
     * @brief Upload several files as one multi-blob transfer
     * @return Id of the multi-blob transfer; invalid_request for an empty list
     */
    [[nodiscard]] auto upload_multiple(std::span<const upload_request> requests)
        -> result<transfer_id>;

    [[nodiscard]] auto download_multiple(std::span<const download_request> requests)
        -> result<transfer_id>;

    // Transfer control
    /**
     * @brief Cancel a transfer and everything below it
     * @return invalid_state_transition if it already reached a final state
     */
    [[nodiscard]] auto cancel(const transfer_id& id) -> result<void>;

    /**
     * @brief Cancel, forget and delete a transfer and everything below it
     *
     * Removing a block pauses its blob; the blob commits the remaining
     * blocks once resumed.
     */
    [[nodiscard]] auto remove(const transfer_id& id) -> result<void>;

    [[nodiscard]] auto remove_all() -> result<void>;

    /**
     * @brief Pause an active transfer; completed blocks are kept
     */
    [[nodiscard]] auto pause(const transfer_id& id) -> result<void>;

    [[nodiscard]] auto pause_all() -> result<void>;

    /**
     * @brief Resume a paused or failed transfer
     *
     * A block resumes on its own and leaves its blob's state unchanged.
     *
     * @param handler Replaces the progress handler when non-null
     * @return no_client_registered if the client is gone (the blob fails)
     */
    [[nodiscard]] auto resume(const transfer_id& id, progress_handler handler = nullptr)
        -> result<void>;

    /**
     * @brief Resume every resumable transfer, optionally of one client only
     * @return The first error encountered; the remaining transfers are still
     *         resumed
     */
    [[nodiscard]] auto resume_all(const std::optional<std::string>& restoration_id = std::nullopt,
                                  progress_handler handler = nullptr) -> result<void>;

    // Queries
    /**
     * @brief Snapshots of every root transfer in creation order
     */
    [[nodiscard]] auto transfers() const -> std::vector<transfer_snapshot>;

    /**
     * @brief Number of root transfers
     */
    [[nodiscard]] auto count() const -> std::size_t;

    [[nodiscard]] auto find(const transfer_id& id) const
        -> std::optional<transfer_snapshot>;

    /**
     * @brief Snapshots of the blocks of a blob or the blobs of a multi-blob
     */
    [[nodiscard]] auto children(const transfer_id& id) const
        -> std::vector<transfer_snapshot>;

    [[nodiscard]] auto progress(const transfer_id& id) const
        -> std::optional<transfer_progress>;

    // Scheduling
    [[nodiscard]] auto max_concurrency() const -> std::size_t;
    [[nodiscard]] auto set_max_concurrency(std::size_t max_concurrency) -> result<void>;

    void set_observer(std::shared_ptr<transfer_observer> observer);

    /**
     * @brief Block until no operation is queued or running
     * @return false on timeout
     */
    auto wait_until_idle(std::chrono::milliseconds timeout) -> bool;

    /**
     * @brief Wait until every pending store write has been applied
     */
    [[nodiscard]] auto flush() -> result<void>;

private:
    class impl;

    explicit transfer_manager(std::shared_ptr<impl> impl);

    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_MANAGER_TRANSFER_MANAGER_H
