/**
 * @file transfer_manager.cpp
 * @brief Implementation of the transfer manager
 */

#include "kcenon/blob_transfer/manager/transfer_manager.h"

#include "kcenon/blob_transfer/client/client_registry.h"
#include "kcenon/blob_transfer/core/logging.h"
#include "kcenon/blob_transfer/core/operation_queue.h"
#include "kcenon/blob_transfer/core/transfer_entities.h"
#include "kcenon/blob_transfer/manager/transfer_operations.h"
#include "kcenon/blob_transfer/store/store_writer.h"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>

namespace kcenon::blob_transfer {

namespace {

auto no_client_error(const std::string& restoration_id) -> error {
    return error{error_code::no_client_registered,
                 "no client registered for restoration id " + restoration_id};
}

auto common_prefix(const std::vector<std::string>& values) -> std::string {
    if (values.empty()) {
        return {};
    }
    std::string prefix = values.front();
    for (const auto& value : values) {
        auto mismatch = std::mismatch(prefix.begin(), prefix.end(), value.begin(),
                                      value.end());
        prefix.erase(mismatch.first, prefix.end());
    }
    return prefix;
}

/**
 * @brief Observer and progress callbacks collected under the manager lock
 *        and delivered after it is released
 */
struct notification_batch {
    struct state_change {
        transfer_snapshot snapshot;
        std::optional<transfer_progress> progress;
    };

    struct progress_update {
        progress_handler handler;
        transfer_snapshot snapshot;
        transfer_progress progress;
    };

    std::vector<state_change> states;
    std::vector<progress_update> updates;
    std::vector<transfer_id> dirty;
    std::unordered_set<transfer_id> dirty_set;

    void mark_dirty(const transfer_id& id) {
        if (dirty_set.insert(id).second) {
            dirty.push_back(id);
        }
    }
};

}  // namespace

// ============================================================================
// transfer_manager::impl
// ============================================================================

class transfer_manager::impl : public operation_host,
                               public std::enable_shared_from_this<impl> {
public:
    impl(transfer_manager_config config,
         std::shared_ptr<transfer_store> store,
         std::shared_ptr<reachability_monitor> monitor,
         std::shared_ptr<transfer_observer> observer,
         std::shared_ptr<adapters::transfer_thread_pool_interface> pool)
        : config_(std::move(config)),
          writer_(std::move(store)),
          monitor_(std::move(monitor)),
          observer_(std::move(observer)),
          queue_(std::move(pool), config_.max_concurrency) {}

    ~impl() override = default;

    void shutdown() {
        if (is_managing()) {
            auto stopped = stop_managing();
            if (!stopped) {
                BT_LOG_WARN(log_category::manager,
                            "Stop managing failed during shutdown: " +
                                stopped.error().message);
            }
        }
        queue_.cancel_all();
        while (!queue_.wait_until_idle(std::chrono::seconds(1))) {
            BT_LOG_DEBUG(log_category::manager,
                         "Waiting for " + std::to_string(queue_.operation_count()) +
                             " operations to stop");
        }
        writer_.stop();
    }

    // ------------------------------------------------------------------------
    // Client registry
    // ------------------------------------------------------------------------

    auto register_client(const std::shared_ptr<storage_client>& client) -> result<void> {
        auto registered = registry_.register_client(client);
        if (registered) {
            BT_LOG_INFO(log_category::manager,
                        "Registered client " + client->restoration_id() + " at " +
                            client->endpoint());
        }
        return registered;
    }

    auto client(const std::string& restoration_id) -> std::shared_ptr<storage_client> {
        return registry_.find(restoration_id);
    }

    auto unregister_client(const std::string& restoration_id) -> bool {
        return registry_.unregister_client(restoration_id);
    }

    // ------------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------------

    auto start_managing() -> result<void> {
        std::lock_guard lifecycle(lifecycle_mutex_);
        if (is_managing()) {
            return {};
        }

        if (!loaded_) {
            auto loaded = load_context();
            if (!loaded) {
                return loaded;
            }
            loaded_ = true;
        }

        if (monitor_) {
            std::weak_ptr<impl> weak = shared_from_this();
            monitor_->on_status_changed([weak](reachability_status status) {
                if (auto self = weak.lock()) {
                    self->handle_reachability(status);
                }
            });
            auto listening = monitor_->start_listening();
            if (!listening) {
                BT_LOG_WARN(log_category::manager,
                            "Reachability monitoring unavailable: " +
                                listening.error().message);
            }
            std::lock_guard lock(mutex_);
            last_status_ = monitor_->status();
        }

        {
            std::lock_guard lock(mutex_);
            managing_ = true;
        }
        BT_LOG_INFO(log_category::manager, "Started managing transfers");
        return {};
    }

    auto stop_managing() -> result<void> {
        std::lock_guard lifecycle(lifecycle_mutex_);
        {
            std::lock_guard lock(mutex_);
            if (!managing_) {
                return {};
            }
            managing_ = false;
        }

        if (monitor_) {
            monitor_->stop_listening();
            monitor_->on_status_changed(nullptr);
        }

        auto paused = pause_all();
        if (!paused) {
            BT_LOG_WARN(log_category::manager,
                        "Pausing transfers failed: " + paused.error().message);
        }

        BT_LOG_INFO(log_category::manager, "Stopped managing transfers");
        return flush();
    }

    auto is_managing() const -> bool {
        std::lock_guard lock(mutex_);
        return managing_;
    }

    // ------------------------------------------------------------------------
    // Transfer creation
    // ------------------------------------------------------------------------

    auto upload(const upload_request& request) -> result<transfer_id> {
        std::span<const upload_request> one(&request, 1);
        auto helpers = make_uploaders(one);
        if (!helpers) {
            return unexpected(helpers.error());
        }

        notification_batch batch;
        transfer_id id;
        result<void> queued;
        {
            std::lock_guard lock(mutex_);
            id = add_upload_locked(batch, request, helpers.value().front(), std::nullopt);
            queued = queue_or_fail_locked(batch, id);
            persist_locked(batch);
        }
        dispatch(batch);

        if (!queued) {
            return unexpected(queued.error());
        }
        return id;
    }

    auto download(const download_request& request) -> result<transfer_id> {
        std::span<const download_request> one(&request, 1);
        auto helpers = make_downloaders(one);
        if (!helpers) {
            return unexpected(helpers.error());
        }

        notification_batch batch;
        transfer_id id;
        result<void> queued;
        {
            std::lock_guard lock(mutex_);
            id = add_download_locked(batch, request, helpers.value().front(),
                                     std::nullopt);
            queued = queue_or_fail_locked(batch, id);
            persist_locked(batch);
        }
        dispatch(batch);

        if (!queued) {
            return unexpected(queued.error());
        }
        return id;
    }

    auto upload_multiple(std::span<const upload_request> requests) -> result<transfer_id> {
        if (requests.empty()) {
            return unexpected(error{error_code::invalid_request, "no transfers requested"});
        }
        auto helpers = make_uploaders(requests);
        if (!helpers) {
            return unexpected(helpers.error());
        }

        std::vector<std::string> sources;
        std::vector<std::string> destinations;
        for (const auto& request : requests) {
            sources.push_back(request.source);
            destinations.push_back(request.destination);
        }

        notification_batch batch;
        transfer_id multi_id;
        result<void> first_error;
        {
            std::lock_guard lock(mutex_);
            multi_id = add_multi_locked(batch, transfer_type::upload,
                                        requests.front().restoration_id,
                                        common_prefix(sources), common_prefix(destinations));
            std::vector<transfer_id> blob_ids;
            for (std::size_t i = 0; i < requests.size(); ++i) {
                blob_ids.push_back(
                    add_upload_locked(batch, requests[i], helpers.value()[i], multi_id));
            }
            for (const auto& blob_id : blob_ids) {
                auto queued = queue_or_fail_locked(batch, blob_id);
                if (!queued && first_error) {
                    first_error = queued;
                }
            }
            persist_locked(batch);
        }
        dispatch(batch);

        if (!first_error) {
            return unexpected(first_error.error());
        }
        return multi_id;
    }

    auto download_multiple(std::span<const download_request> requests)
        -> result<transfer_id> {
        if (requests.empty()) {
            return unexpected(error{error_code::invalid_request, "no transfers requested"});
        }
        auto helpers = make_downloaders(requests);
        if (!helpers) {
            return unexpected(helpers.error());
        }

        std::vector<std::string> sources;
        std::vector<std::string> destinations;
        for (const auto& request : requests) {
            sources.push_back(request.source);
            destinations.push_back(request.destination);
        }

        notification_batch batch;
        transfer_id multi_id;
        result<void> first_error;
        {
            std::lock_guard lock(mutex_);
            multi_id = add_multi_locked(batch, transfer_type::download,
                                        requests.front().restoration_id,
                                        common_prefix(sources), common_prefix(destinations));
            std::vector<transfer_id> blob_ids;
            for (std::size_t i = 0; i < requests.size(); ++i) {
                blob_ids.push_back(add_download_locked(batch, requests[i],
                                                       helpers.value()[i], multi_id));
            }
            for (const auto& blob_id : blob_ids) {
                auto queued = queue_or_fail_locked(batch, blob_id);
                if (!queued && first_error) {
                    first_error = queued;
                }
            }
            persist_locked(batch);
        }
        dispatch(batch);

        if (!first_error) {
            return unexpected(first_error.error());
        }
        return multi_id;
    }

    // ------------------------------------------------------------------------
    // Transfer control
    // ------------------------------------------------------------------------

    auto cancel(const transfer_id& id) -> result<void> {
        notification_batch batch;
        {
            std::lock_guard lock(mutex_);
            const auto* record = arena_.find(id);
            if (!record) {
                return unexpected(error(error_code::transfer_not_found));
            }
            auto state = base_of(*record).state;
            if (!is_active_state(state) && state != transfer_state::paused) {
                return unexpected(error{error_code::invalid_state_transition,
                                        "cannot cancel a " + std::string(to_string(state)) +
                                            " transfer"});
            }

            for (const auto& sub : arena_.subtree(id)) {
                const auto* sub_record = arena_.find(sub);
                auto sub_state = base_of(*sub_record).state;
                if (is_active_state(sub_state) || sub_state == transfer_state::paused) {
                    cancel_operation_locked(sub);
                    set_state_locked(batch, sub, transfer_state::canceled);
                }
            }
            if (kind_of(*record) == transfer_kind::block && base_of(*record).parent) {
                block_stopped_locked(batch, *base_of(*record).parent);
            }
            persist_locked(batch);
        }
        dispatch(batch);

        BT_LOG_INFO(log_category::manager, "Canceled transfer " + id.to_string());
        return {};
    }

    auto remove(const transfer_id& id) -> result<void> {
        notification_batch batch;
        {
            std::lock_guard lock(mutex_);
            const auto* record = arena_.find(id);
            if (!record) {
                return unexpected(error(error_code::transfer_not_found));
            }
            auto kind = kind_of(*record);
            auto parent = base_of(*record).parent;

            note_deleted_locked(batch, id);
            auto erased = arena_.erase_subtree(id);
            for (const auto& sub : erased) {
                forget_locked(sub);
            }
            writer_.enqueue_remove(id);

            if (parent && arena_.contains(*parent)) {
                batch.mark_dirty(*parent);
                if (kind == transfer_kind::block) {
                    // The commit was planned with the removed block
                    update_blob_progress_locked(batch, *parent);
                    block_stopped_locked(batch, *parent);
                } else {
                    refresh_multi_locked(batch, *parent);
                }
            }
            persist_locked(batch);
        }
        dispatch(batch);

        BT_LOG_INFO(log_category::manager, "Removed transfer " + id.to_string());
        return {};
    }

    auto remove_all() -> result<void> {
        notification_batch batch;
        std::size_t removed = 0;
        {
            std::lock_guard lock(mutex_);
            queue_.cancel_all();
            operations_.clear();
            retired_.clear();

            auto roots = arena_.roots();
            removed = roots.size();
            for (const auto& root : roots) {
                note_deleted_locked(batch, root);
            }
            arena_.clear();
            uploaders_.clear();
            downloaders_.clear();
            handlers_.clear();
            writer_.enqueue_clear();
        }
        dispatch(batch);

        BT_LOG_INFO(log_category::manager,
                    "Removed all transfers (" + std::to_string(removed) + ")");
        return {};
    }

    auto pause(const transfer_id& id) -> result<void> {
        notification_batch batch;
        {
            std::lock_guard lock(mutex_);
            if (!arena_.contains(id)) {
                return unexpected(error(error_code::transfer_not_found));
            }
            pause_locked(batch, id);
            persist_locked(batch);
        }
        dispatch(batch);
        return {};
    }

    auto pause_all() -> result<void> {
        notification_batch batch;
        {
            std::lock_guard lock(mutex_);
            queue_.cancel_all();
            auto roots = arena_.roots();
            for (const auto& root : roots) {
                pause_locked(batch, root);
            }
            for (const auto& [entity, op] : operations_) {
                retire_locked(entity, op);
            }
            operations_.clear();
            persist_locked(batch);
        }
        dispatch(batch);

        BT_LOG_INFO(log_category::manager, "Paused all transfers");
        return {};
    }

    auto resume(const transfer_id& id, progress_handler handler) -> result<void> {
        std::vector<transfer_id> blob_ids;
        bool block_only = false;
        {
            std::lock_guard lock(mutex_);
            const auto* record = arena_.find(id);
            if (!record) {
                return unexpected(error(error_code::transfer_not_found));
            }
            if (kind_of(*record) == transfer_kind::block) {
                auto parent = base_of(*record).parent;
                const auto* blob = parent ? arena_.find_as<blob_transfer>(*parent) : nullptr;
                if (!blob) {
                    BT_LOG_ERROR(log_category::manager,
                                 "Block " + id.to_string() + " has no parent blob");
                    return unexpected(error{error_code::internal_error,
                                            "block without a parent blob"});
                }
                if (blob->initial_call_complete) {
                    block_only = true;
                }
                // Before the initial call the placeholder block is the whole download
                blob_ids.push_back(*parent);
            } else if (const auto* multi = std::get_if<multi_blob_transfer>(record)) {
                blob_ids = multi->blobs;
            } else {
                blob_ids.push_back(id);
            }
        }
        if (block_only) {
            return resume_block(id, std::move(handler));
        }
        return resume_blobs(blob_ids, std::move(handler));
    }

    auto resume_all(const std::optional<std::string>& restoration_id,
                    progress_handler handler) -> result<void> {
        std::vector<transfer_id> blob_ids;
        {
            std::lock_guard lock(mutex_);
            auto matches = [&restoration_id](const blob_transfer& blob) {
                return !restoration_id || blob.restoration_id == *restoration_id;
            };
            for (const auto& root : arena_.roots()) {
                if (const auto* blob = arena_.find_as<blob_transfer>(root)) {
                    if (matches(*blob)) {
                        blob_ids.push_back(root);
                    }
                } else if (const auto* multi = arena_.find_as<multi_blob_transfer>(root)) {
                    for (const auto& child : multi->blobs) {
                        const auto* blob = arena_.find_as<blob_transfer>(child);
                        if (blob && matches(*blob)) {
                            blob_ids.push_back(child);
                        }
                    }
                }
            }
        }
        return resume_blobs(blob_ids, std::move(handler));
    }

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    auto transfers() const -> std::vector<transfer_snapshot> {
        std::lock_guard lock(mutex_);
        std::vector<transfer_snapshot> snapshots;
        for (const auto& root : arena_.roots()) {
            if (auto snap = arena_.snapshot(root)) {
                snapshots.push_back(std::move(*snap));
            }
        }
        return snapshots;
    }

    auto count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return arena_.roots().size();
    }

    auto find(const transfer_id& id) const -> std::optional<transfer_snapshot> {
        std::lock_guard lock(mutex_);
        return arena_.snapshot(id);
    }

    auto children(const transfer_id& id) const -> std::vector<transfer_snapshot> {
        std::lock_guard lock(mutex_);
        std::vector<transfer_snapshot> snapshots;
        const auto* record = arena_.find(id);
        if (!record) {
            return snapshots;
        }
        for (const auto& child : child_ids(*record)) {
            if (auto snap = arena_.snapshot(child)) {
                snapshots.push_back(std::move(*snap));
            }
        }
        return snapshots;
    }

    auto progress(const transfer_id& id) const -> std::optional<transfer_progress> {
        std::lock_guard lock(mutex_);
        return arena_.progress(id);
    }

    // ------------------------------------------------------------------------
    // Scheduling
    // ------------------------------------------------------------------------

    auto max_concurrency() const -> std::size_t { return queue_.max_concurrency(); }

    auto set_max_concurrency(std::size_t max_concurrency) -> result<void> {
        auto updated = queue_.set_max_concurrency(max_concurrency);
        if (updated) {
            std::lock_guard lock(mutex_);
            config_.max_concurrency = max_concurrency;
        }
        return updated;
    }

    void set_observer(std::shared_ptr<transfer_observer> observer) {
        std::lock_guard lock(observer_mutex_);
        observer_ = std::move(observer);
    }

    auto wait_until_idle(std::chrono::milliseconds timeout) -> bool {
        return queue_.wait_until_idle(timeout);
    }

    auto flush() -> result<void> {
        if (!config_.persist_on_progress) {
            std::lock_guard lock(mutex_);
            save_all_locked();
        }
        return writer_.flush();
    }

    // ------------------------------------------------------------------------
    // operation_host
    // ------------------------------------------------------------------------

    void on_operation_started(const transfer_operation& op,
                              const transfer_id& entity) override {
        notification_batch batch;
        {
            std::lock_guard lock(mutex_);
            if (!is_current_locked(op, entity)) {
                return;
            }

            std::optional<transfer_id> blob_id = entity;
            if (const auto* block = arena_.find_as<block_transfer>(entity)) {
                if (block->state == transfer_state::pending) {
                    set_state_locked(batch, entity, transfer_state::in_progress);
                }
                blob_id = block->parent;
            }
            if (blob_id) {
                const auto* blob = arena_.find_as<blob_transfer>(*blob_id);
                if (blob && blob->state == transfer_state::pending) {
                    set_state_locked(batch, *blob_id, transfer_state::in_progress);
                }
            }
            persist_locked(batch);
        }
        dispatch(batch);
    }

    void on_block_finished(const transfer_operation& op, const transfer_id& block_id,
                           const operation_outcome& outcome, uint64_t bytes) override {
        notification_batch batch;
        {
            std::lock_guard lock(mutex_);
            release_retired_locked(op, block_id);
            if (!is_current_locked(op, block_id)) {
                return;
            }
            operations_.erase(block_id);

            auto* block = arena_.find_as<block_transfer>(block_id);
            if (!block) {
                return;
            }
            auto blob_id = block->parent;

            switch (outcome.status) {
                case operation_status::succeeded: {
                    if (bytes != block->length()) {
                        BT_LOG_DEBUG(log_category::manager,
                                     "Block " + block->block_id + " reported " +
                                         std::to_string(bytes) + " of " +
                                         std::to_string(block->length()) + " bytes");
                    }
                    // Blocks count whole or not at all; a failed block starts over
                    block->bytes_transferred = block->length();
                    set_state_locked(batch, block_id, transfer_state::completed);
                    if (blob_id) {
                        update_blob_progress_locked(batch, *blob_id);
                    }
                    break;
                }
                case operation_status::failed:
                    BT_LOG_WARN(log_category::manager,
                                "Block " + block->block_id + " failed: " +
                                    outcome.err.message);
                    set_state_locked(batch, block_id, transfer_state::failed,
                                     outcome.err.message);
                    break;
                case operation_status::canceled:
                case operation_status::skipped:
                    if (is_active_state(block->state)) {
                        set_state_locked(batch, block_id, transfer_state::paused);
                    }
                    break;
                default:
                    break;
            }
            persist_locked(batch);
        }
        dispatch(batch);
    }

    void on_probe_finished(const transfer_operation& op, const transfer_id& block_id,
                           const operation_outcome& outcome,
                           const std::optional<download_probe>& probe) override {
        notification_batch batch;
        {
            std::lock_guard lock(mutex_);
            release_retired_locked(op, block_id);
            if (!is_current_locked(op, block_id)) {
                return;
            }
            operations_.erase(block_id);

            auto* block = arena_.find_as<block_transfer>(block_id);
            if (!block || !block->parent) {
                return;
            }
            auto blob_id = *block->parent;

            if (outcome.succeeded() && probe) {
                apply_probe_locked(batch, blob_id, block_id, *probe);
                auto queued = queue_or_fail_locked(batch, blob_id);
                if (!queued) {
                    BT_LOG_ERROR(log_category::manager,
                                 "Queueing blocks failed: " + queued.error().message);
                }
            } else if (outcome.status == operation_status::failed) {
                BT_LOG_ERROR(log_category::manager,
                             "Initial download failed for " + blob_id.to_string() + ": " +
                                 outcome.err.message);
                set_state_locked(batch, block_id, transfer_state::failed,
                                 outcome.err.message);
                set_state_locked(batch, blob_id, transfer_state::failed,
                                 outcome.err.message);
            } else if (is_active_state(block->state)) {
                set_state_locked(batch, block_id, transfer_state::paused);
            }
            persist_locked(batch);
        }
        dispatch(batch);
    }

    void on_blob_finished(const transfer_operation& op, const transfer_id& blob_id,
                          const operation_outcome& outcome) override {
        notification_batch batch;
        {
            std::lock_guard lock(mutex_);
            release_retired_locked(op, blob_id);
            if (!is_current_locked(op, blob_id)) {
                return;
            }
            operations_.erase(blob_id);

            auto* blob = arena_.find_as<blob_transfer>(blob_id);
            if (!blob) {
                return;
            }

            switch (outcome.status) {
                case operation_status::succeeded:
                    update_blob_progress_locked(batch, blob_id);
                    set_state_locked(batch, blob_id, transfer_state::completed);
                    uploaders_.erase(blob_id);
                    downloaders_.erase(blob_id);
                    BT_LOG_INFO(log_category::manager,
                                std::string(to_string(blob->type)) + " completed: " +
                                    blob->destination);
                    break;
                case operation_status::failed:
                    BT_LOG_ERROR(log_category::manager,
                                 std::string(to_string(blob->type)) + " failed: " +
                                     outcome.err.message);
                    set_state_locked(batch, blob_id, transfer_state::failed,
                                     outcome.err.message);
                    break;
                case operation_status::canceled:
                case operation_status::skipped:
                    if (is_active_state(blob->state)) {
                        settle_unfinished_blob_locked(batch, blob_id);
                    }
                    break;
                default:
                    break;
            }
            persist_locked(batch);
        }
        dispatch(batch);
    }

private:
    // ------------------------------------------------------------------------
    // Helper construction (runs without the manager lock)
    // ------------------------------------------------------------------------

    auto make_uploaders(std::span<const upload_request> requests)
        -> result<std::vector<std::shared_ptr<blob_uploader>>> {
        std::vector<std::shared_ptr<blob_uploader>> helpers;
        for (const auto& request : requests) {
            if (request.source.empty() || request.destination.empty()) {
                return unexpected(error{error_code::invalid_request,
                                        "upload needs a source and a destination"});
            }
            auto owner = registry_.find(request.restoration_id);
            if (!owner) {
                return unexpected(no_client_error(request.restoration_id));
            }
            auto helper = owner->create_uploader(request.source, request.destination,
                                                 request.options);
            if (!helper) {
                BT_LOG_ERROR(log_category::manager,
                             "Cannot create uploader for " + request.source + ": " +
                                 helper.error().message);
                return unexpected(helper.error());
            }
            helpers.push_back(std::move(helper.value()));
        }
        return helpers;
    }

    auto make_downloaders(std::span<const download_request> requests)
        -> result<std::vector<std::shared_ptr<blob_downloader>>> {
        std::vector<std::shared_ptr<blob_downloader>> helpers;
        for (const auto& request : requests) {
            if (request.source.empty() || request.destination.empty()) {
                return unexpected(error{error_code::invalid_request,
                                        "download needs a source and a destination"});
            }
            auto owner = registry_.find(request.restoration_id);
            if (!owner) {
                return unexpected(no_client_error(request.restoration_id));
            }
            auto helper = owner->create_downloader(request.source, request.destination,
                                                   request.options);
            if (!helper) {
                BT_LOG_ERROR(log_category::manager,
                             "Cannot create downloader for " + request.source + ": " +
                                 helper.error().message);
                return unexpected(helper.error());
            }
            helpers.push_back(std::move(helper.value()));
        }
        return helpers;
    }

    // ------------------------------------------------------------------------
    // Entity creation
    // ------------------------------------------------------------------------

    auto add_multi_locked(notification_batch& batch, transfer_type type,
                          const std::string& restoration_id, std::string source,
                          std::string destination) -> transfer_id {
        multi_blob_transfer multi;
        multi.id = transfer_id::generate();
        multi.restoration_id = restoration_id;
        multi.created_at = std::chrono::system_clock::now();
        multi.type = type;
        multi.source = std::move(source);
        multi.destination = std::move(destination);

        auto id = multi.id;
        arena_.insert_root(std::move(multi));
        batch.mark_dirty(id);
        return id;
    }

    auto make_blob(const std::string& restoration_id, transfer_type type,
                   const std::string& source, const std::string& destination,
                   const blob_transfer_options& options,
                   const std::optional<transfer_id>& parent) -> blob_transfer {
        blob_transfer blob;
        blob.id = transfer_id::generate();
        blob.restoration_id = restoration_id;
        blob.parent = parent;
        blob.created_at = std::chrono::system_clock::now();
        blob.type = type;
        blob.source = source;
        blob.destination = destination;
        blob.options = options;
        return blob;
    }

    auto make_block(const blob_transfer& blob, const block_range& range, uint32_t index)
        -> block_transfer {
        block_transfer block;
        block.id = transfer_id::generate();
        block.restoration_id = blob.restoration_id;
        block.parent = blob.id;
        block.created_at = std::chrono::system_clock::now();
        block.start_range = range.start;
        block.end_range = range.end;
        block.block_id = range.block_id.empty() ? make_block_id(index) : range.block_id;
        block.index = index;
        return block;
    }

    void insert_blob_locked(notification_batch& batch, blob_transfer blob) {
        auto id = blob.id;
        auto parent = blob.parent;
        if (parent) {
            arena_.insert(std::move(blob));
            if (auto* multi = arena_.find_as<multi_blob_transfer>(*parent)) {
                multi->blobs.push_back(id);
            }
        } else {
            arena_.insert_root(std::move(blob));
        }
        batch.mark_dirty(id);
        note_state_locked(batch, id);
    }

    auto add_upload_locked(notification_batch& batch, const upload_request& request,
                           std::shared_ptr<blob_uploader> uploader,
                           const std::optional<transfer_id>& parent) -> transfer_id {
        auto blob = make_blob(request.restoration_id, transfer_type::upload,
                              request.source, request.destination, request.options,
                              parent);

        uint32_t index = 0;
        for (const auto& range : uploader->block_list()) {
            auto block = make_block(blob, range, index++);
            blob.blocks.push_back(block.id);
            blob.total_bytes_to_transfer += block.length();
            batch.mark_dirty(block.id);
            arena_.insert(std::move(block));
        }
        blob.total_blocks = index;
        blob.initial_call_complete = true;

        auto id = blob.id;
        uploaders_[id] = std::move(uploader);
        if (request.on_progress) {
            handlers_[id] = request.on_progress;
        }
        insert_blob_locked(batch, std::move(blob));

        BT_LOG_INFO(log_category::manager,
                    "Upload created: " + request.source + " -> " + request.destination +
                        " (" + std::to_string(index) + " blocks)");
        return id;
    }

    auto add_download_locked(notification_batch& batch, const download_request& request,
                             std::shared_ptr<blob_downloader> downloader,
                             const std::optional<transfer_id>& parent) -> transfer_id {
        auto blob = make_blob(request.restoration_id, transfer_type::download,
                              request.source, request.destination, request.options,
                              parent);

        // Placeholder until the initial call reports the real first chunk
        auto placeholder = make_block(blob, block_range{0, 1, make_block_id(0)}, 0);
        blob.blocks.push_back(placeholder.id);
        blob.total_blocks = 1;
        batch.mark_dirty(placeholder.id);
        arena_.insert(std::move(placeholder));

        auto id = blob.id;
        downloaders_[id] = std::move(downloader);
        if (request.on_progress) {
            handlers_[id] = request.on_progress;
        }
        insert_blob_locked(batch, std::move(blob));

        BT_LOG_INFO(log_category::manager,
                    "Download created: " + request.source + " -> " + request.destination);
        return id;
    }

    void apply_probe_locked(notification_batch& batch, const transfer_id& blob_id,
                            const transfer_id& block_id, const download_probe& probe) {
        auto* blob = arena_.find_as<blob_transfer>(blob_id);
        auto* block = arena_.find_as<block_transfer>(block_id);
        if (!blob || !block) {
            return;
        }

        blob->total_bytes_to_transfer = probe.object_size;
        blob->checksum = probe.checksum;

        block->start_range = probe.first_chunk.start;
        block->end_range = probe.first_chunk.end;
        block->block_id = probe.first_chunk.block_id.empty() ? make_block_id(0)
                                                             : probe.first_chunk.block_id;
        block->bytes_transferred = block->length();
        set_state_locked(batch, block_id, transfer_state::completed);

        std::vector<block_transfer> added;
        auto index = static_cast<uint32_t>(blob->blocks.size());
        for (const auto& range : probe.remaining_blocks) {
            added.push_back(make_block(*blob, range, index++));
        }
        for (auto& next : added) {
            blob->blocks.push_back(next.id);
            batch.mark_dirty(next.id);
            arena_.insert(std::move(next));
        }
        blob->total_blocks = static_cast<uint32_t>(blob->blocks.size());
        blob->initial_call_complete = true;
        batch.mark_dirty(blob_id);

        if (auto it = downloaders_.find(blob_id); it != downloaders_.end()) {
            it->second->set_total_size(probe.object_size);
        }
        update_blob_progress_locked(batch, blob_id);

        BT_LOG_DEBUG(log_category::manager,
                     "Object size " + std::to_string(probe.object_size) + ", " +
                         std::to_string(blob->total_blocks) + " blocks for " +
                         blob->source);
    }

    // ------------------------------------------------------------------------
    // Scheduling
    // ------------------------------------------------------------------------

    /**
     * @brief Build and queue the operations of an active blob
     *
     * Uploads: block operations plus the commit depending on all of them.
     * Downloads before the initial call: the probe on the first active block.
     * Downloads after it: block operations plus the finalize.
     */
    auto queue_operations_locked(const transfer_id& blob_id) -> result<void> {
        const auto* blob = arena_.find_as<blob_transfer>(blob_id);
        if (!blob) {
            return unexpected(error(error_code::transfer_not_found));
        }
        if (!is_active_state(blob->state)) {
            return {};
        }

        // A finishing operation planned before a block was stopped or removed
        cancel_operation_locked(blob_id);

        std::weak_ptr<operation_host> host = shared_from_this();
        std::vector<std::shared_ptr<entity_operation>> ops;

        if (blob->type == transfer_type::upload) {
            auto it = uploaders_.find(blob_id);
            if (it == uploaders_.end()) {
                return unexpected(no_client_error(blob->restoration_id));
            }
            auto uploader = it->second;

            std::vector<std::string> block_ids;
            std::vector<std::shared_ptr<entity_operation>> block_ops;
            std::vector<std::shared_ptr<entity_operation>> running;
            for (const auto& id : blob->blocks) {
                const auto* block = arena_.find_as<block_transfer>(id);
                if (!block) {
                    continue;
                }
                block_ids.push_back(block->block_id);
                if (!is_active_state(block->state)) {
                    continue;
                }
                if (auto live = operations_.find(id); live != operations_.end()) {
                    running.push_back(live->second);
                    continue;
                }
                block_ops.push_back(std::make_shared<block_upload_operation>(
                    id, block->range(), uploader, host));
            }

            auto commit = std::make_shared<upload_commit_operation>(
                blob_id, std::move(block_ids), uploader, host);
            for (const auto& op : block_ops) {
                commit->add_dependency(op);
            }
            for (const auto& op : running) {
                commit->add_dependency(op);
            }
            ops.push_back(commit);
            ops.insert(ops.end(), block_ops.begin(), block_ops.end());
        } else {
            auto it = downloaders_.find(blob_id);
            if (it == downloaders_.end()) {
                return unexpected(no_client_error(blob->restoration_id));
            }
            auto downloader = it->second;

            if (!blob->initial_call_complete) {
                const block_transfer* first = nullptr;
                for (const auto& id : blob->blocks) {
                    const auto* block = arena_.find_as<block_transfer>(id);
                    if (block && is_active_state(block->state)) {
                        first = block;
                        break;
                    }
                }
                if (!first) {
                    return unexpected(error{error_code::internal_error,
                                            "download has no block for its initial call"});
                }
                if (operations_.contains(first->id)) {
                    return {};
                }
                ops.push_back(std::make_shared<download_probe_operation>(
                    first->id, downloader, host));
            } else {
                auto finalize = std::make_shared<download_finalize_operation>(
                    blob_id, blob->destination,
                    blob->options.verify_checksum ? blob->checksum : std::string{},
                    downloader, host);
                ops.push_back(finalize);
                for (const auto& id : blob->blocks) {
                    const auto* block = arena_.find_as<block_transfer>(id);
                    if (!block || !is_active_state(block->state)) {
                        continue;
                    }
                    if (auto live = operations_.find(id); live != operations_.end()) {
                        finalize->add_dependency(live->second);
                        continue;
                    }
                    auto op = std::make_shared<block_download_operation>(
                        id, block->range(), downloader, host);
                    finalize->add_dependency(op);
                    ops.push_back(op);
                }
            }
        }

        for (const auto& op : ops) {
            follow_retired_locked(*op);
        }
        std::vector<std::shared_ptr<transfer_operation>> batch(ops.begin(), ops.end());
        auto added = queue_.add(batch);
        if (!added) {
            return added;
        }
        for (const auto& op : ops) {
            operations_[op->entity()] = op;
        }

        BT_LOG_DEBUG(log_category::manager,
                     "Queued " + std::to_string(ops.size()) + " operations for " +
                         blob_id.to_string());
        return {};
    }

    auto queue_or_fail_locked(notification_batch& batch, const transfer_id& blob_id)
        -> result<void> {
        auto queued = queue_operations_locked(blob_id);
        if (!queued) {
            const auto* blob = arena_.find_as<blob_transfer>(blob_id);
            if (blob && is_active_state(blob->state)) {
                set_state_locked(batch, blob_id, transfer_state::failed,
                                 queued.error().message);
            }
        }
        return queued;
    }

    /**
     * @brief Queue a lone block operation for a blob whose finishing step is not planned
     */
    auto queue_block_locked(const blob_transfer& blob, const block_transfer& block)
        -> result<void> {
        std::weak_ptr<operation_host> host = shared_from_this();
        std::shared_ptr<entity_operation> op;
        if (blob.type == transfer_type::upload) {
            auto it = uploaders_.find(blob.id);
            if (it == uploaders_.end()) {
                return unexpected(no_client_error(blob.restoration_id));
            }
            op = std::make_shared<block_upload_operation>(block.id, block.range(),
                                                          it->second, host);
        } else {
            auto it = downloaders_.find(blob.id);
            if (it == downloaders_.end()) {
                return unexpected(no_client_error(blob.restoration_id));
            }
            op = std::make_shared<block_download_operation>(block.id, block.range(),
                                                            it->second, host);
        }

        follow_retired_locked(*op);
        auto added = queue_.add(op);
        if (!added) {
            return added;
        }
        operations_[block.id] = op;
        return {};
    }

    void cancel_operation_locked(const transfer_id& id) {
        auto it = operations_.find(id);
        if (it == operations_.end()) {
            return;
        }
        queue_.cancel(it->second);
        retire_locked(id, it->second);
        operations_.erase(it);
    }

    /**
     * @brief Keep a cancelled operation that is still executing
     *
     * Its replacement must not start before it has reported.
     */
    void retire_locked(const transfer_id& id, const std::shared_ptr<entity_operation>& op) {
        if (op->status() == operation_status::executing) {
            retired_[id] = op;
        }
    }

    void follow_retired_locked(entity_operation& op) {
        if (auto it = retired_.find(op.entity()); it != retired_.end()) {
            op.add_predecessor(it->second);
        }
    }

    void release_retired_locked(const transfer_operation& op, const transfer_id& id) {
        auto it = retired_.find(id);
        if (it != retired_.end() && it->second.get() == &op) {
            retired_.erase(it);
        }
    }

    /**
     * @brief Cancel a blob's commit or finalize, keeping it current
     *
     * Its canceled report settles the blob.
     */
    void stop_finishing_locked(const transfer_id& blob_id) {
        if (auto it = operations_.find(blob_id); it != operations_.end()) {
            queue_.cancel(it->second);
        }
    }

    /**
     * @brief A block of an active blob was paused, canceled or removed
     */
    void block_stopped_locked(notification_batch& batch, const transfer_id& blob_id) {
        const auto* blob = arena_.find_as<blob_transfer>(blob_id);
        if (!blob || !is_active_state(blob->state)) {
            return;
        }
        if (operations_.contains(blob_id)) {
            stop_finishing_locked(blob_id);
        } else {
            settle_unfinished_blob_locked(batch, blob_id);
        }
    }

    auto is_current_locked(const transfer_operation& op, const transfer_id& id) const
        -> bool {
        auto it = operations_.find(id);
        return it != operations_.end() && it->second.get() == &op;
    }

    // ------------------------------------------------------------------------
    // State changes
    // ------------------------------------------------------------------------

    auto set_state_locked(notification_batch& batch, const transfer_id& id,
                          transfer_state state, const std::string& message = {})
        -> bool {
        auto* record = arena_.find(id);
        if (!record) {
            return false;
        }
        auto& base = base_of(*record);
        if (!is_valid_transition(base.state, state)) {
            if (base.state != state) {
                BT_LOG_WARN(log_category::manager,
                            "Ignoring transition " + std::string(to_string(base.state)) +
                                " -> " + std::string(to_string(state)) + " for " +
                                id.to_string());
            }
            return false;
        }

        auto previous = base.state;
        base.state = state;
        if (state == transfer_state::failed) {
            base.error_message = message;
        } else if (state == transfer_state::pending) {
            base.error_message.clear();
        }
        batch.mark_dirty(id);

        if (get_logger().is_enabled(log_level::debug)) {
            auto ctx = make_log_context(id);
            ctx.kind = std::string(to_string(kind_of(*record)));
            ctx.state = std::string(to_string(state));
            ctx.restoration_id = base.restoration_id;
            if (!message.empty()) {
                ctx.error_message = message;
            }
            BT_LOG_DEBUG_CTX(log_category::manager,
                             "State " + std::string(to_string(previous)) + " -> " +
                                 std::string(to_string(state)),
                             ctx);
        }

        note_state_locked(batch, id);

        if (kind_of(*record) == transfer_kind::blob && base.parent) {
            refresh_multi_locked(batch, *base.parent);
        }
        return true;
    }

    void refresh_multi_locked(notification_batch& batch, const transfer_id& multi_id) {
        auto* multi = arena_.find_as<multi_blob_transfer>(multi_id);
        if (!multi) {
            return;
        }

        std::vector<transfer_state> states;
        bool any_started = false;
        for (const auto& child : multi->blobs) {
            if (const auto* blob = arena_.find_as<blob_transfer>(child)) {
                states.push_back(blob->state);
                any_started = any_started || blob->state != transfer_state::pending ||
                              blob->bytes_transferred > 0;
            }
        }

        auto derived = derive_composite_state(states, any_started);
        if (derived == multi->state) {
            return;
        }
        multi->state = derived;
        batch.mark_dirty(multi_id);
        note_state_locked(batch, multi_id);
    }

    void update_blob_progress_locked(notification_batch& batch, const transfer_id& blob_id) {
        auto* blob = arena_.find_as<blob_transfer>(blob_id);
        if (!blob) {
            return;
        }
        arena_.refresh_blob_progress(*blob);
        batch.mark_dirty(blob_id);

        if (auto it = uploaders_.find(blob_id); it != uploaders_.end()) {
            it->second->set_progress(blob->bytes_transferred);
        }
        if (auto it = downloaders_.find(blob_id); it != downloaders_.end()) {
            it->second->set_progress(blob->bytes_transferred);
        }

        auto handler = handlers_.find(blob_id);
        if (handler == handlers_.end() || !handler->second) {
            return;
        }
        auto snap = arena_.snapshot(blob_id);
        auto prog = arena_.progress(blob_id);
        if (snap && prog) {
            batch.updates.push_back({handler->second, std::move(*snap), *prog});
        }
    }

    void note_state_locked(notification_batch& batch, const transfer_id& id) {
        auto snap = arena_.snapshot(id);
        if (!snap) {
            return;
        }
        auto owner = snap->kind == transfer_kind::block && snap->parent ? *snap->parent : id;
        batch.states.push_back({std::move(*snap), arena_.progress(owner)});
    }

    void note_deleted_locked(notification_batch& batch, const transfer_id& id) {
        for (const auto& sub : arena_.subtree(id)) {
            cancel_operation_locked(sub);
            auto* record = arena_.find(sub);
            base_of(*record).state = transfer_state::deleted;
            if (kind_of(*record) != transfer_kind::block || sub == id) {
                note_state_locked(batch, sub);
            }
        }
    }

    void forget_locked(const transfer_id& id) {
        uploaders_.erase(id);
        downloaders_.erase(id);
        handlers_.erase(id);
    }

    void pause_locked(notification_batch& batch, const transfer_id& id) {
        auto* record = arena_.find(id);
        if (!record) {
            return;
        }

        std::visit(
            overloaded{
                [&](block_transfer& block) {
                    if (is_active_state(block.state)) {
                        cancel_operation_locked(id);
                        set_state_locked(batch, id, transfer_state::paused);
                        if (block.parent) {
                            block_stopped_locked(batch, *block.parent);
                        }
                    }
                },
                [&](blob_transfer& blob) {
                    if (!is_active_state(blob.state)) {
                        return;
                    }
                    cancel_operation_locked(id);
                    set_state_locked(batch, id, transfer_state::paused);
                    auto blocks = blob.blocks;
                    for (const auto& block : blocks) {
                        pause_locked(batch, block);
                    }
                },
                [&](multi_blob_transfer& multi) {
                    auto blobs = multi.blobs;
                    for (const auto& blob : blobs) {
                        pause_locked(batch, blob);
                    }
                },
            },
            *record);
    }

    /**
     * @brief Final state of a blob whose finishing operation did not run
     *
     * A failed block fails the blob with the block's error; a canceled block
     * cancels it and its remaining blocks; otherwise the blocks were stopped
     * and the blob is paused.
     */
    void settle_unfinished_blob_locked(notification_batch& batch,
                                       const transfer_id& blob_id) {
        const auto* blob = arena_.find_as<blob_transfer>(blob_id);
        const block_transfer* failed = nullptr;
        bool any_canceled = false;
        for (const auto& id : blob->blocks) {
            const auto* block = arena_.find_as<block_transfer>(id);
            if (!block) {
                continue;
            }
            if (block->state == transfer_state::failed && !failed) {
                failed = block;
            }
            any_canceled = any_canceled || block->state == transfer_state::canceled;
        }

        if (failed) {
            auto message = failed->error_message;
            set_state_locked(batch, blob_id, transfer_state::failed, message);
        } else if (any_canceled) {
            set_state_locked(batch, blob_id, transfer_state::canceled);
            auto blocks = blob->blocks;
            for (const auto& id : blocks) {
                const auto* block = arena_.find_as<block_transfer>(id);
                if (block && (is_active_state(block->state) ||
                              block->state == transfer_state::paused)) {
                    cancel_operation_locked(id);
                    set_state_locked(batch, id, transfer_state::canceled);
                }
            }
        } else {
            set_state_locked(batch, blob_id, transfer_state::paused);
        }
    }

    struct reconnect_request {
        transfer_id id;
        std::string restoration_id;
        transfer_type type;
        std::string source;
        std::string destination;
        blob_transfer_options options;
    };

    struct connected_helpers {
        std::unordered_map<transfer_id, std::shared_ptr<blob_uploader>> uploaders;
        std::unordered_map<transfer_id, std::shared_ptr<blob_downloader>> downloaders;
        std::unordered_map<transfer_id, error> errors;
    };

    static auto reconnect_request_for(const blob_transfer& blob) -> reconnect_request {
        return {blob.id, blob.restoration_id, blob.type, blob.source, blob.destination,
                blob.options};
    }

    /**
     * @brief Create helpers for blobs that lost theirs; called without the lock
     */
    auto connect_helpers(const std::vector<reconnect_request>& reconnects)
        -> connected_helpers {
        connected_helpers connected;
        for (const auto& request : reconnects) {
            auto owner = registry_.find(request.restoration_id);
            if (!owner) {
                connected.errors.emplace(request.id, no_client_error(request.restoration_id));
                continue;
            }
            if (request.type == transfer_type::upload) {
                auto helper = owner->create_uploader(request.source, request.destination,
                                                     request.options);
                if (!helper) {
                    connected.errors.emplace(request.id, helper.error());
                    continue;
                }
                connected.uploaders.emplace(request.id, std::move(helper.value()));
            } else {
                auto helper = owner->create_downloader(request.source, request.destination,
                                                       request.options);
                if (!helper) {
                    connected.errors.emplace(request.id, helper.error());
                    continue;
                }
                connected.downloaders.emplace(request.id, std::move(helper.value()));
            }
        }
        return connected;
    }

    /**
     * @brief Resume one block on its own
     *
     * The blob keeps its state; resuming the blob later plans its commit or
     * finalize around the running block.
     */
    auto resume_block(const transfer_id& id, progress_handler handler) -> result<void> {
        std::vector<reconnect_request> reconnects;
        {
            std::lock_guard lock(mutex_);
            const auto* block = arena_.find_as<block_transfer>(id);
            if (!block) {
                return unexpected(error(error_code::transfer_not_found));
            }
            if (!is_resumable_state(block->state) || !block->parent) {
                return {};
            }
            const auto* blob = arena_.find_as<blob_transfer>(*block->parent);
            if (blob && !uploaders_.contains(blob->id) && !downloaders_.contains(blob->id)) {
                reconnects.push_back(reconnect_request_for(*blob));
            }
        }

        auto connected = connect_helpers(reconnects);

        notification_batch batch;
        result<void> outcome;
        {
            std::lock_guard lock(mutex_);
            const auto* block = arena_.find_as<block_transfer>(id);
            if (!block) {
                return unexpected(error(error_code::transfer_not_found));
            }
            if (!is_resumable_state(block->state) || !block->parent) {
                return {};
            }
            const auto* blob = arena_.find_as<blob_transfer>(*block->parent);
            if (!blob) {
                return unexpected(error{error_code::internal_error,
                                        "block without a parent blob"});
            }
            if (handler) {
                handlers_[blob->id] = handler;
            }

            if (auto failure = connected.errors.find(blob->id);
                failure != connected.errors.end()) {
                BT_LOG_ERROR(log_category::manager,
                             "Cannot resume block " + block->block_id + ": " +
                                 failure->second.message);
                return unexpected(failure->second);
            }
            install_helper_locked(*blob, connected.uploaders, connected.downloaders);

            set_state_locked(batch, id, transfer_state::pending);
            auto queued = queue_block_locked(*blob, *block);
            if (!queued) {
                set_state_locked(batch, id, transfer_state::failed, queued.error().message);
                outcome = queued;
            } else {
                BT_LOG_DEBUG(log_category::manager, "Resumed block " + block->block_id);
            }
            persist_locked(batch);
        }
        dispatch(batch);
        return outcome;
    }

    auto resume_blobs(const std::vector<transfer_id>& blob_ids, progress_handler handler)
        -> result<void> {
        std::vector<reconnect_request> reconnects;
        {
            std::lock_guard lock(mutex_);
            for (const auto& id : blob_ids) {
                const auto* blob = arena_.find_as<blob_transfer>(id);
                if (!blob || !is_resumable_state(blob->state)) {
                    continue;
                }
                if (uploaders_.contains(id) || downloaders_.contains(id)) {
                    continue;
                }
                reconnects.push_back(reconnect_request_for(*blob));
            }
        }

        auto connected = connect_helpers(reconnects);

        notification_batch batch;
        result<void> first_error;
        std::size_t resumed = 0;
        {
            std::lock_guard lock(mutex_);
            for (const auto& id : blob_ids) {
                auto* blob = arena_.find_as<blob_transfer>(id);
                if (!blob || !is_resumable_state(blob->state)) {
                    continue;
                }
                if (handler) {
                    handlers_[id] = handler;
                }

                if (auto failure = connected.errors.find(id);
                    failure != connected.errors.end()) {
                    BT_LOG_ERROR(log_category::manager,
                                 "Cannot resume " + id.to_string() + ": " +
                                     failure->second.message);
                    if (blob->state == transfer_state::failed) {
                        blob->error_message = failure->second.message;
                        batch.mark_dirty(id);
                        note_state_locked(batch, id);
                    } else {
                        set_state_locked(batch, id, transfer_state::failed,
                                         failure->second.message);
                    }
                    if (first_error) {
                        first_error = unexpected(failure->second);
                    }
                    continue;
                }

                install_helper_locked(*blob, connected.uploaders, connected.downloaders);

                set_state_locked(batch, id, transfer_state::pending);
                auto blocks = blob->blocks;
                for (const auto& block_id : blocks) {
                    const auto* block = arena_.find_as<block_transfer>(block_id);
                    if (block && is_resumable_state(block->state)) {
                        set_state_locked(batch, block_id, transfer_state::pending);
                    }
                }

                auto queued = queue_or_fail_locked(batch, id);
                if (!queued) {
                    if (first_error) {
                        first_error = queued;
                    }
                    continue;
                }
                ++resumed;
            }
            persist_locked(batch);
        }
        dispatch(batch);

        if (resumed > 0) {
            BT_LOG_INFO(log_category::manager,
                        "Resumed " + std::to_string(resumed) + " transfers");
        }
        return first_error;
    }

    void install_helper_locked(
        const blob_transfer& blob,
        std::unordered_map<transfer_id, std::shared_ptr<blob_uploader>>& new_uploaders,
        std::unordered_map<transfer_id, std::shared_ptr<blob_downloader>>& new_downloaders) {
        if (auto it = new_uploaders.find(blob.id); it != new_uploaders.end()) {
            it->second->set_progress(blob.bytes_transferred);
            uploaders_.try_emplace(blob.id, std::move(it->second));
        }
        if (auto it = new_downloaders.find(blob.id); it != new_downloaders.end()) {
            if (blob.initial_call_complete) {
                it->second->set_total_size(blob.total_bytes_to_transfer);
            }
            it->second->set_progress(blob.bytes_transferred);
            downloaders_.try_emplace(blob.id, std::move(it->second));
        }
    }

    // ------------------------------------------------------------------------
    // Persistence
    // ------------------------------------------------------------------------

    void persist_locked(const notification_batch& batch) {
        if (!config_.persist_on_progress || batch.dirty.empty()) {
            return;
        }
        std::vector<transfer_record> records;
        records.reserve(batch.dirty.size());
        for (const auto& id : batch.dirty) {
            if (const auto* record = arena_.find(id)) {
                records.push_back(*record);
            }
        }
        writer_.enqueue_save(std::move(records));
    }

    void save_all_locked() {
        std::vector<transfer_record> records;
        for (const auto& root : arena_.roots()) {
            for (const auto& id : arena_.subtree(root)) {
                if (const auto* record = arena_.find(id)) {
                    records.push_back(*record);
                }
            }
        }
        writer_.enqueue_save(std::move(records));
    }

    /**
     * @brief Load persisted transfers into the arena
     *
     * Blocks without a parent blob, or whose parent is missing, mean the
     * store is corrupted. Transfers that were active when the process
     * stopped come back paused.
     */
    auto load_context() -> result<void> {
        auto flushed = writer_.flush();
        if (!flushed) {
            BT_LOG_WARN(log_category::store,
                        "Pending store writes failed: " + flushed.error().message);
        }
        const auto& store = writer_.store();

        auto orphans = store->fetch(transfer_kind::block, filters::has_no_parent());
        if (!orphans) {
            return unexpected(orphans.error());
        }
        if (!orphans.value().empty()) {
            BT_LOG_FATAL(log_category::store,
                         "Durable store holds " + std::to_string(orphans.value().size()) +
                             " blocks without a parent blob");
            return unexpected(error{error_code::store_corrupted,
                                    "block records without a parent blob"});
        }

        auto blocks = store->fetch(transfer_kind::block);
        if (!blocks) {
            return unexpected(blocks.error());
        }
        auto blobs = store->fetch(transfer_kind::blob);
        if (!blobs) {
            return unexpected(blobs.error());
        }
        auto multis = store->fetch(transfer_kind::multi_blob);
        if (!multis) {
            return unexpected(multis.error());
        }

        std::unordered_set<transfer_id> blob_ids;
        std::unordered_set<transfer_id> multi_ids;
        for (const auto& record : blobs.value()) {
            blob_ids.insert(base_of(record).id);
        }
        for (const auto& record : multis.value()) {
            multi_ids.insert(base_of(record).id);
        }
        for (const auto& record : blocks.value()) {
            const auto& base = base_of(record);
            if (!blob_ids.contains(*base.parent)) {
                BT_LOG_FATAL(log_category::store,
                             "Block " + base.id.to_string() + " points to missing blob " +
                                 base.parent->to_string());
                return unexpected(error{error_code::store_corrupted,
                                        "block record with a missing parent blob"});
            }
        }
        for (const auto& record : blobs.value()) {
            const auto& base = base_of(record);
            if (base.parent && !multi_ids.contains(*base.parent)) {
                BT_LOG_FATAL(log_category::store,
                             "Blob " + base.id.to_string() +
                                 " points to missing multi-blob " +
                                 base.parent->to_string());
                return unexpected(error{error_code::store_corrupted,
                                        "blob record with a missing parent multi-blob"});
            }
        }

        std::vector<transfer_id> blob_order;
        for (const auto& record : blobs.value()) {
            blob_order.push_back(base_of(record).id);
        }

        notification_batch batch;
        std::size_t loaded = 0;
        {
            std::lock_guard lock(mutex_);
            std::unordered_set<transfer_id> inserted;

            struct root_entry {
                std::chrono::system_clock::time_point created_at;
                transfer_record record;
            };
            std::vector<root_entry> roots;

            auto take = [&](transfer_record record) {
                auto& base = base_of(record);
                auto id = base.id;
                if (arena_.contains(id)) {
                    return;
                }
                if (is_active_state(base.state)) {
                    base.state = transfer_state::paused;
                    batch.mark_dirty(id);
                }
                // Child lists are rebuilt from parent links below
                std::visit(overloaded{
                               [](block_transfer&) {},
                               [](blob_transfer& blob) { blob.blocks.clear(); },
                               [](multi_blob_transfer& multi) { multi.blobs.clear(); },
                           },
                           record);
                inserted.insert(id);
                if (base.parent) {
                    arena_.insert(std::move(record));
                } else {
                    auto created_at = base.created_at;
                    roots.push_back({created_at, std::move(record)});
                }
            };

            for (auto& record : multis.value()) {
                take(std::move(record));
            }
            for (auto& record : blobs.value()) {
                take(std::move(record));
            }
            for (auto& record : blocks.value()) {
                take(std::move(record));
            }

            // Oldest first; equal timestamps keep the store order
            std::stable_sort(roots.begin(), roots.end(),
                             [](const root_entry& a, const root_entry& b) {
                                 return a.created_at < b.created_at;
                             });
            for (auto& root : roots) {
                arena_.insert_root(std::move(root.record));
            }

            std::vector<block_transfer*> loaded_blocks;
            for (const auto& id : inserted) {
                if (auto* block = arena_.find_as<block_transfer>(id)) {
                    loaded_blocks.push_back(block);
                }
            }
            std::sort(loaded_blocks.begin(), loaded_blocks.end(),
                      [](const block_transfer* a, const block_transfer* b) {
                          return a->index < b->index;
                      });
            for (auto* block : loaded_blocks) {
                auto* blob = arena_.find_as<blob_transfer>(*block->parent);
                if (blob && inserted.contains(blob->id)) {
                    blob->blocks.push_back(block->id);
                }
            }

            for (const auto& id : blob_order) {
                auto* blob = arena_.find_as<blob_transfer>(id);
                if (!blob || !inserted.contains(id)) {
                    continue;
                }
                blob->total_blocks = static_cast<uint32_t>(blob->blocks.size());
                arena_.refresh_blob_progress(*blob);
                if (blob->parent) {
                    auto* multi = arena_.find_as<multi_blob_transfer>(*blob->parent);
                    if (multi && inserted.contains(multi->id)) {
                        multi->blobs.push_back(id);
                    }
                }
            }

            loaded = inserted.size();
            persist_locked(batch);
        }

        BT_LOG_INFO(log_category::store,
                    "Loaded " + std::to_string(loaded) + " transfer records");
        return {};
    }

    // ------------------------------------------------------------------------
    // Notifications
    // ------------------------------------------------------------------------

    void dispatch(const notification_batch& batch) {
        std::shared_ptr<transfer_observer> observer;
        {
            std::lock_guard lock(observer_mutex_);
            observer = observer_;
        }
        if (observer) {
            for (const auto& change : batch.states) {
                observer->on_transfer_state_changed(change.snapshot, change.snapshot.state,
                                                    change.progress);
            }
        }
        for (const auto& update : batch.updates) {
            update.handler(update.snapshot, update.progress);
        }
    }

    void handle_reachability(reachability_status status) {
        {
            std::lock_guard lock(mutex_);
            if (status == last_status_) {
                return;
            }
            last_status_ = status;
        }

        BT_LOG_INFO(log_category::manager,
                    "Network " + std::string(to_string(status)));

        if (status == reachability_status::unreachable) {
            if (config_.pause_on_unreachable) {
                auto paused = pause_all();
                if (!paused) {
                    BT_LOG_WARN(log_category::manager,
                                "Pause on network loss failed: " + paused.error().message);
                }
            }
            return;
        }

        if (is_reachable(status) && config_.resume_on_reachable) {
            auto resumed = resume_all(std::nullopt, nullptr);
            if (!resumed) {
                BT_LOG_WARN(log_category::manager,
                            "Resume on reconnect incomplete: " + resumed.error().message);
            }
        }
    }

    transfer_manager_config config_;
    client_registry registry_;
    store_writer writer_;
    std::shared_ptr<reachability_monitor> monitor_;

    std::shared_ptr<transfer_observer> observer_;
    std::mutex observer_mutex_;

    std::mutex lifecycle_mutex_;
    mutable std::mutex mutex_;
    transfer_arena arena_;
    std::unordered_map<transfer_id, std::shared_ptr<entity_operation>> operations_;
    // Cancelled operations still executing, by entity
    std::unordered_map<transfer_id, std::shared_ptr<entity_operation>> retired_;
    std::unordered_map<transfer_id, std::shared_ptr<blob_uploader>> uploaders_;
    std::unordered_map<transfer_id, std::shared_ptr<blob_downloader>> downloaders_;
    std::unordered_map<transfer_id, progress_handler> handlers_;
    bool managing_ = false;
    bool loaded_ = false;
    reachability_status last_status_ = reachability_status::unknown;

    operation_queue queue_;
};

// ============================================================================
// transfer_manager::builder
// ============================================================================

transfer_manager::builder::builder() = default;

auto transfer_manager::builder::with_config(transfer_manager_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto transfer_manager::builder::with_max_concurrency(std::size_t max_concurrency)
    -> builder& {
    config_.max_concurrency = max_concurrency;
    return *this;
}

auto transfer_manager::builder::with_worker_count(std::size_t worker_count) -> builder& {
    config_.worker_count = worker_count;
    return *this;
}

auto transfer_manager::builder::with_store(std::shared_ptr<transfer_store> store)
    -> builder& {
    store_ = std::move(store);
    return *this;
}

auto transfer_manager::builder::with_reachability_monitor(
    std::shared_ptr<reachability_monitor> monitor) -> builder& {
    monitor_ = std::move(monitor);
    return *this;
}

auto transfer_manager::builder::with_observer(std::shared_ptr<transfer_observer> observer)
    -> builder& {
    observer_ = std::move(observer);
    return *this;
}

auto transfer_manager::builder::with_thread_pool(
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool) -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto transfer_manager::builder::build() -> result<transfer_manager> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected(valid.error());
    }

    get_logger().initialize();

    auto store = store_ ? store_ : std::make_shared<memory_transfer_store>();
    auto monitor = monitor_ ? monitor_ : std::make_shared<interface_reachability_monitor>();
    auto pool = pool_ ? pool_
                      : adapters::transfer_pool_factory::create(config_.worker_count,
                                                                config_.pool_name);
    if (!pool || !pool->is_running()) {
        return unexpected(error{error_code::not_initialized, "thread pool is not running"});
    }

    BT_LOG_INFO(log_category::manager,
                "Transfer manager created (max_concurrency=" +
                    std::to_string(config_.max_concurrency) + ", workers=" +
                    std::to_string(pool->worker_count()) + ")");

    return transfer_manager(std::make_shared<impl>(config_, std::move(store),
                                                   std::move(monitor), observer_,
                                                   std::move(pool)));
}

// ============================================================================
// transfer_manager
// ============================================================================

transfer_manager::transfer_manager(std::shared_ptr<impl> impl) : impl_(std::move(impl)) {}

transfer_manager::transfer_manager(transfer_manager&&) noexcept = default;

auto transfer_manager::operator=(transfer_manager&& other) noexcept -> transfer_manager& {
    if (this != &other) {
        if (impl_) {
            impl_->shutdown();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

transfer_manager::~transfer_manager() {
    if (impl_) {
        impl_->shutdown();
    }
}

auto transfer_manager::register_client(const std::shared_ptr<storage_client>& client)
    -> result<void> {
    return impl_->register_client(client);
}

auto transfer_manager::client(const std::string& restoration_id) const
    -> std::shared_ptr<storage_client> {
    return impl_->client(restoration_id);
}

auto transfer_manager::unregister_client(const std::string& restoration_id) -> bool {
    return impl_->unregister_client(restoration_id);
}

auto transfer_manager::start_managing() -> result<void> {
    return impl_->start_managing();
}

auto transfer_manager::stop_managing() -> result<void> {
    return impl_->stop_managing();
}

auto transfer_manager::is_managing() const -> bool {
    return impl_->is_managing();
}

auto transfer_manager::upload(const upload_request& request) -> result<transfer_id> {
    return impl_->upload(request);
}

auto transfer_manager::download(const download_request& request) -> result<transfer_id> {
    return impl_->download(request);
}

auto transfer_manager::upload_multiple(std::span<const upload_request> requests)
    -> result<transfer_id> {
    return impl_->upload_multiple(requests);
}

auto transfer_manager::download_multiple(std::span<const download_request> requests)
    -> result<transfer_id> {
    return impl_->download_multiple(requests);
}

auto transfer_manager::cancel(const transfer_id& id) -> result<void> {
    return impl_->cancel(id);
}

auto transfer_manager::remove(const transfer_id& id) -> result<void> {
    return impl_->remove(id);
}

auto transfer_manager::remove_all() -> result<void> {
    return impl_->remove_all();
}

auto transfer_manager::pause(const transfer_id& id) -> result<void> {
    return impl_->pause(id);
}

auto transfer_manager::pause_all() -> result<void> {
    return impl_->pause_all();
}

auto transfer_manager::resume(const transfer_id& id, progress_handler handler)
    -> result<void> {
    return impl_->resume(id, std::move(handler));
}

auto transfer_manager::resume_all(const std::optional<std::string>& restoration_id,
                                  progress_handler handler) -> result<void> {
    return impl_->resume_all(restoration_id, std::move(handler));
}

auto transfer_manager::transfers() const -> std::vector<transfer_snapshot> {
    return impl_->transfers();
}

auto transfer_manager::count() const -> std::size_t {
    return impl_->count();
}

auto transfer_manager::find(const transfer_id& id) const
    -> std::optional<transfer_snapshot> {
    return impl_->find(id);
}

auto transfer_manager::children(const transfer_id& id) const
    -> std::vector<transfer_snapshot> {
    return impl_->children(id);
}

auto transfer_manager::progress(const transfer_id& id) const
    -> std::optional<transfer_progress> {
    return impl_->progress(id);
}

auto transfer_manager::max_concurrency() const -> std::size_t {
    return impl_->max_concurrency();
}

auto transfer_manager::set_max_concurrency(std::size_t max_concurrency) -> result<void> {
    return impl_->set_max_concurrency(max_concurrency);
}

void transfer_manager::set_observer(std::shared_ptr<transfer_observer> observer) {
    impl_->set_observer(std::move(observer));
}

auto transfer_manager::wait_until_idle(std::chrono::milliseconds timeout) -> bool {
    return impl_->wait_until_idle(timeout);
}

auto transfer_manager::flush() -> result<void> {
    return impl_->flush();
}

}  // namespace kcenon::blob_transfer
