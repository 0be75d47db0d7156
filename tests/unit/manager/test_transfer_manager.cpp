/**
 * @file test_transfer_manager.cpp
 * @brief Unit tests for transfer_manager scheduling, control and persistence
 */

#include <gtest/gtest.h>

#include <kcenon/blob_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/blob_transfer/manager/transfer_manager.h>
#include <kcenon/blob_transfer/reachability/reachability_monitor.h>
#include <kcenon/blob_transfer/store/transfer_store.h>

#include "../store/store_test_records.h"
#include "../test_fakes.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::blob_transfer::test {

namespace {

constexpr uint64_t object_size = 3 * min_block_size;

}  // namespace

class TransferManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<fake_storage_state>();
        state_->object_size = object_size;
        client_ = std::make_shared<fake_storage_client>("photos", state_);
        observer_ = std::make_shared<recording_observer>();
        monitor_ = std::make_shared<manual_reachability_monitor>();
        store_ = std::make_shared<memory_transfer_store>();
        pool_ = std::make_shared<adapters::worker_transfer_pool>(8, "manager_test_pool");

        ASSERT_NO_FATAL_FAILURE(restart());
    }

    void TearDown() override {
        state_->open_gate();
        manager_.reset();
    }

    /**
     * @brief Replace the manager with a new one on the same store
     */
    void restart(transfer_manager_config config = transfer_manager_config{}) {
        state_->open_gate();
        manager_.reset();

        auto built = transfer_manager::builder()
                         .with_config(config)
                         .with_store(store_)
                         .with_reachability_monitor(monitor_)
                         .with_observer(observer_)
                         .with_thread_pool(pool_)
                         .build();
        ASSERT_TRUE(built.has_value()) << built.error().message;
        manager_.emplace(std::move(built).value());

        ASSERT_TRUE(manager_->register_client(client_).has_value());
        auto started = manager_->start_managing();
        ASSERT_TRUE(started.has_value()) << started.error().message;
    }

    auto manager() -> transfer_manager& { return *manager_; }

    auto upload_request_for(const std::string& name) const -> upload_request {
        upload_request request;
        request.restoration_id = "photos";
        request.source = "/data/" + name;
        request.destination = "backup/" + name;
        request.options.block_size = min_block_size;
        return request;
    }

    auto download_request_for(const std::string& name) const -> download_request {
        download_request request;
        request.restoration_id = "photos";
        request.source = "backup/" + name;
        request.destination = "/restore/" + name;
        request.options.block_size = min_block_size;
        return request;
    }

    auto state_of(const transfer_id& id) -> std::optional<transfer_state> {
        auto snap = manager_->find(id);
        if (!snap) {
            return std::nullopt;
        }
        return snap->state;
    }

    auto wait_state(const transfer_id& id, transfer_state state) -> bool {
        return wait_for([&]() { return state_of(id) == state; });
    }

    auto children_settled(const transfer_id& id) -> bool {
        auto children = manager_->children(id);
        return std::none_of(children.begin(), children.end(),
                            [](const transfer_snapshot& c) { return is_active_state(c.state); });
    }

    auto stored(transfer_kind kind) -> std::vector<transfer_record> {
        auto records = store_->fetch(kind);
        EXPECT_TRUE(records.has_value());
        return records.has_value() ? records.value() : std::vector<transfer_record>{};
    }

    std::shared_ptr<fake_storage_state> state_;
    std::shared_ptr<fake_storage_client> client_;
    std::shared_ptr<recording_observer> observer_;
    std::shared_ptr<manual_reachability_monitor> monitor_;
    std::shared_ptr<memory_transfer_store> store_;
    std::shared_ptr<adapters::worker_transfer_pool> pool_;
    std::optional<transfer_manager> manager_;
};

// =============================================================================
// Builder and registry Tests
// =============================================================================

TEST_F(TransferManagerTest, BuilderRejectsZeroConcurrency) {
    auto built = transfer_manager::builder()
                     .with_max_concurrency(0)
                     .with_thread_pool(pool_)
                     .with_reachability_monitor(monitor_)
                     .build();
    ASSERT_FALSE(built.has_value());
    EXPECT_EQ(built.error().code, error_code::config_invalid_concurrency);
}

TEST_F(TransferManagerTest, RegisterDuplicateClient) {
    log_capture capture;
    auto twin = std::make_shared<fake_storage_client>("photos");

    auto registered = manager().register_client(twin);
    ASSERT_FALSE(registered.has_value());
    EXPECT_EQ(registered.error().code, error_code::duplicate_restoration_id);
    EXPECT_EQ(manager().client("photos"), client_);
}

TEST_F(TransferManagerTest, SetMaxConcurrency) {
    auto rejected = manager().set_max_concurrency(0);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, error_code::config_invalid_concurrency);
    EXPECT_EQ(manager().max_concurrency(), 4u);

    EXPECT_TRUE(manager().set_max_concurrency(2).has_value());
    EXPECT_EQ(manager().max_concurrency(), 2u);
}

TEST_F(TransferManagerTest, StartManagingIsIdempotent) {
    EXPECT_TRUE(manager().is_managing());
    EXPECT_TRUE(manager().start_managing().has_value());
    EXPECT_TRUE(monitor_->is_listening());

    EXPECT_TRUE(manager().stop_managing().has_value());
    EXPECT_FALSE(manager().is_managing());
    EXPECT_FALSE(monitor_->is_listening());
}

// =============================================================================
// Upload Tests
// =============================================================================

TEST_F(TransferManagerTest, UploadCompletesWithCommitLast) {
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value()) << id.error().message;

    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));

    auto events = state_->snapshot_events();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(state_->count_events("upload:"), 3u);
    EXPECT_EQ(events.back(), "commit:3");

    auto progress = manager().progress(id.value());
    ASSERT_TRUE(progress.has_value());
    EXPECT_TRUE(progress->is_complete());
    EXPECT_EQ(progress->completed_blocks, 3u);
    EXPECT_EQ(state_->last_progress.load(), object_size);

    ASSERT_TRUE(manager().flush().has_value());
    auto blobs = stored(transfer_kind::blob);
    ASSERT_EQ(blobs.size(), 1u);
    EXPECT_EQ(base_of(blobs[0]).state, transfer_state::completed);
    EXPECT_EQ(stored(transfer_kind::block).size(), 3u);
}

TEST_F(TransferManagerTest, ObserverSeesBlobLifecycle) {
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());

    ASSERT_TRUE(wait_for([&]() {
        auto states = observer_->states_of(id.value());
        return !states.empty() && states.back() == transfer_state::completed;
    }));

    std::vector<transfer_state> expected{transfer_state::pending,
                                         transfer_state::in_progress,
                                         transfer_state::completed};
    EXPECT_EQ(observer_->states_of(id.value()), expected);
}

TEST_F(TransferManagerTest, ProgressHandlerReportsBytes) {
    std::atomic<int> calls{0};
    std::atomic<uint64_t> last{0};
    auto request = upload_request_for("a.bin");
    request.on_progress = [&](const transfer_snapshot&, const transfer_progress& progress) {
        ++calls;
        last = progress.bytes_transferred;
    };

    auto id = manager().upload(request);
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));

    EXPECT_TRUE(wait_for([&]() { return last.load() == object_size; }));
    EXPECT_GE(calls.load(), 3);
}

TEST_F(TransferManagerTest, UploadWithoutClient) {
    auto request = upload_request_for("a.bin");
    request.restoration_id = "nobody";

    auto id = manager().upload(request);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::no_client_registered);
    EXPECT_EQ(manager().count(), 0u);
}

TEST_F(TransferManagerTest, UploadRejectsEmptySource) {
    auto request = upload_request_for("a.bin");
    request.source.clear();

    auto id = manager().upload(request);
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::invalid_request);
}

TEST_F(TransferManagerTest, HelperConstructionFailure) {
    log_capture capture;
    state_->fail_create = true;

    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_FALSE(id.has_value());
    EXPECT_EQ(id.error().code, error_code::helper_construction_failed);
    EXPECT_EQ(manager().count(), 0u);
    EXPECT_GE(capture.count(log_level::error), 1u);
}

TEST_F(TransferManagerTest, MaxConcurrencyIsRespected) {
    ASSERT_TRUE(manager().set_max_concurrency(2).has_value());
    state_->close_gate();

    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for([&]() { return state_->in_flight.load() == 2; }));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(state_->max_in_flight.load(), 2);

    state_->open_gate();
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));
    EXPECT_LE(state_->max_in_flight.load(), 2);
}

// =============================================================================
// Failure and resume Tests
// =============================================================================

TEST_F(TransferManagerTest, FailedBlockFailsBlob) {
    log_capture capture;
    {
        std::lock_guard lock(state_->mutex);
        state_->failing_blocks.insert("block-000001");
    }

    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::failed));
    ASSERT_TRUE(wait_for([&]() { return children_settled(id.value()); }));

    auto snap = manager().find(id.value());
    ASSERT_TRUE(snap.has_value());
    EXPECT_NE(snap->error_message.find("injected failure for block-000001"),
              std::string::npos);
    EXPECT_EQ(snap->bytes_transferred, 2 * min_block_size);
    EXPECT_EQ(state_->count_events("commit"), 0u);

    auto blocks = manager().children(id.value());
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[1].state, transfer_state::failed);
    EXPECT_EQ(blocks[1].bytes_transferred, 0u);
    EXPECT_EQ(blocks[0].bytes_transferred, min_block_size);

    {
        std::lock_guard lock(state_->mutex);
        state_->failing_blocks.clear();
        state_->events.clear();
    }

    ASSERT_TRUE(manager().resume(id.value()).has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));

    auto events = state_->snapshot_events();
    std::vector<std::string> expected{"upload:block-000001", "commit:3"};
    EXPECT_EQ(events, expected);
    EXPECT_EQ(state_->uploaders_created.load(), 1);
    EXPECT_TRUE(manager().find(id.value())->error_message.empty());
}

TEST_F(TransferManagerTest, CommitFailureFailsBlob) {
    log_capture capture;
    state_->fail_commit = true;

    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::failed));
    EXPECT_EQ(manager().find(id.value())->error_message, "injected commit failure");
}

TEST_F(TransferManagerTest, PauseAndResume) {
    state_->close_gate();
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for([&]() { return state_->in_flight.load() == 3; }));

    ASSERT_TRUE(manager().pause(id.value()).has_value());
    EXPECT_EQ(state_of(id.value()), transfer_state::paused);
    for (const auto& block : manager().children(id.value())) {
        EXPECT_EQ(block.state, transfer_state::paused);
    }
    ASSERT_TRUE(wait_for([&]() { return state_->in_flight.load() == 0; }));
    EXPECT_EQ(state_->count_events("upload:"), 0u);

    state_->open_gate();
    ASSERT_TRUE(manager().resume(id.value()).has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));
    EXPECT_EQ(state_->count_events("upload:"), 3u);
    EXPECT_EQ(state_->uploaders_created.load(), 1);
}

TEST_F(TransferManagerTest, PausingBlockPausesBlobUntilResumed) {
    state_->close_gate();
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for([&]() { return state_->in_flight.load() == 3; }));

    auto blocks = manager().children(id.value());
    ASSERT_EQ(blocks.size(), 3u);
    ASSERT_TRUE(manager().pause(blocks[0].id).has_value());
    EXPECT_EQ(state_of(blocks[0].id), transfer_state::paused);

    state_->open_gate();
    ASSERT_TRUE(wait_state(id.value(), transfer_state::paused));
    ASSERT_TRUE(wait_for([&]() { return children_settled(id.value()); }));
    EXPECT_EQ(state_->count_events("commit"), 0u);

    ASSERT_TRUE(manager().resume(id.value()).has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));
    EXPECT_EQ(state_->count_events("upload:block-000000"), 1u);
}

TEST_F(TransferManagerTest, BlockPausedAfterItsBytesLandedDoesNotCommit) {
    state_->hold("block-000000");
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for([&]() {
        return state_->in_flight.load() == 1 && state_->count_events("upload:") == 2;
    }));

    auto blocks = manager().children(id.value());
    ASSERT_EQ(blocks.size(), 3u);
    ASSERT_TRUE(manager().pause(blocks[0].id).has_value());

    // The storage call finishes after the pause
    state_->release("block-000000");
    ASSERT_TRUE(wait_for([&]() { return state_->count_events("upload:block-000000") == 1; }));
    ASSERT_TRUE(wait_state(id.value(), transfer_state::paused));
    EXPECT_TRUE(manager().wait_until_idle(std::chrono::seconds(5)));

    EXPECT_EQ(state_->count_events("commit"), 0u);
    EXPECT_EQ(state_of(id.value()), transfer_state::paused);
    EXPECT_EQ(state_of(blocks[0].id), transfer_state::paused);

    ASSERT_TRUE(manager().resume(id.value()).has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));
    EXPECT_EQ(state_->count_events("upload:block-000000"), 2u);
    EXPECT_EQ(state_->snapshot_events().back(), "commit:3");
}

TEST_F(TransferManagerTest, CancelingBlockCancelsBlob) {
    state_->hold("block-000000");
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for([&]() {
        return state_->in_flight.load() == 1 && state_->count_events("upload:") == 2;
    }));

    auto blocks = manager().children(id.value());
    ASSERT_EQ(blocks.size(), 3u);
    ASSERT_TRUE(manager().cancel(blocks[0].id).has_value());
    EXPECT_EQ(state_of(blocks[0].id), transfer_state::canceled);

    state_->release("block-000000");
    ASSERT_TRUE(wait_state(id.value(), transfer_state::canceled));
    EXPECT_TRUE(manager().wait_until_idle(std::chrono::seconds(5)));
    EXPECT_EQ(state_->count_events("commit"), 0u);
    EXPECT_EQ(state_of(id.value()), transfer_state::canceled);
}

TEST_F(TransferManagerTest, ResumeRightAfterPauseWaitsForRunningBlock) {
    state_->hold("block-000000");
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for([&]() {
        return state_->in_flight.load() == 1 && state_->count_events("upload:") == 2;
    }));

    ASSERT_TRUE(manager().pause(id.value()).has_value());
    ASSERT_TRUE(manager().resume(id.value()).has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(state_->in_flight.load(), 1);
    EXPECT_EQ(state_->count_events("upload:block-000000"), 0u);

    state_->release("block-000000");
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));
    EXPECT_EQ(state_->max_block_overlap.load(), 1);
    EXPECT_EQ(state_->count_events("upload:block-000000"), 2u);
    EXPECT_EQ(state_->snapshot_events().back(), "commit:3");
}

TEST_F(TransferManagerTest, ResumeFailedBlockRunsOnlyThatBlock) {
    log_capture capture;
    {
        std::lock_guard lock(state_->mutex);
        state_->failing_blocks.insert("block-000001");
    }
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::failed));
    ASSERT_TRUE(wait_for([&]() { return children_settled(id.value()); }));
    EXPECT_TRUE(manager().wait_until_idle(std::chrono::seconds(5)));
    {
        std::lock_guard lock(state_->mutex);
        state_->failing_blocks.clear();
        state_->events.clear();
    }

    auto blocks = manager().children(id.value());
    ASSERT_EQ(blocks.size(), 3u);
    ASSERT_TRUE(manager().resume(blocks[1].id).has_value());
    ASSERT_TRUE(wait_state(blocks[1].id, transfer_state::completed));
    EXPECT_TRUE(manager().wait_until_idle(std::chrono::seconds(5)));

    std::vector<std::string> block_only{"upload:block-000001"};
    EXPECT_EQ(state_->snapshot_events(), block_only);
    EXPECT_EQ(state_of(id.value()), transfer_state::failed);
    EXPECT_EQ(manager().find(id.value())->bytes_transferred, object_size);

    ASSERT_TRUE(manager().resume(id.value()).has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));
    std::vector<std::string> committed{"upload:block-000001", "commit:3"};
    EXPECT_EQ(state_->snapshot_events(), committed);
}

TEST_F(TransferManagerTest, ResumeBlockReconnectsLoadedBlob) {
    log_capture capture;
    auto blob = make_blob("photos");
    blob.state = transfer_state::paused;
    blob.options.block_size = min_block_size;
    std::vector<transfer_record> records{blob};
    for (uint32_t i = 0; i < 3; ++i) {
        auto block = make_block(blob, i);
        block.state = transfer_state::paused;
        records.push_back(block);
    }
    ASSERT_TRUE(store_->save(records).has_value());
    ASSERT_NO_FATAL_FAILURE(restart());

    auto blocks = manager().children(blob.id);
    ASSERT_EQ(blocks.size(), 3u);

    state_->fail_create = true;
    auto refused = manager().resume(blocks[1].id);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, error_code::helper_construction_failed);
    EXPECT_EQ(state_of(blocks[1].id), transfer_state::paused);

    state_->fail_create = false;
    ASSERT_TRUE(manager().resume(blocks[1].id).has_value());
    ASSERT_TRUE(wait_state(blocks[1].id, transfer_state::completed));
    EXPECT_EQ(state_->uploaders_created.load(), 1);
    EXPECT_EQ(state_->count_events("upload:"), 1u);
    EXPECT_EQ(state_of(blocks[0].id), transfer_state::paused);
    EXPECT_EQ(state_of(blob.id), transfer_state::paused);
}

TEST_F(TransferManagerTest, StopManagingPausesTransfers) {
    state_->close_gate();
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for([&]() { return state_->in_flight.load() == 3; }));

    ASSERT_TRUE(manager().stop_managing().has_value());
    EXPECT_FALSE(manager().is_managing());
    EXPECT_EQ(state_of(id.value()), transfer_state::paused);

    auto blobs = stored(transfer_kind::blob);
    ASSERT_EQ(blobs.size(), 1u);
    EXPECT_EQ(base_of(blobs[0]).state, transfer_state::paused);
}

// =============================================================================
// Cancel and remove Tests
// =============================================================================

TEST_F(TransferManagerTest, CancelCascades) {
    state_->close_gate();
    std::vector<upload_request> requests{upload_request_for("a.bin"),
                                         upload_request_for("b.bin")};
    auto multi = manager().upload_multiple(requests);
    ASSERT_TRUE(multi.has_value()) << multi.error().message;

    ASSERT_TRUE(manager().cancel(multi.value()).has_value());
    EXPECT_EQ(state_of(multi.value()), transfer_state::canceled);
    for (const auto& blob : manager().children(multi.value())) {
        EXPECT_EQ(blob.state, transfer_state::canceled);
        for (const auto& block : manager().children(blob.id)) {
            EXPECT_EQ(block.state, transfer_state::canceled);
        }
    }

    auto again = manager().cancel(multi.value());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::invalid_state_transition);

    state_->open_gate();
    EXPECT_TRUE(manager().wait_until_idle(std::chrono::seconds(5)));
    EXPECT_EQ(state_->count_events("commit"), 0u);
}

TEST_F(TransferManagerTest, CancelCompletedFails) {
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));

    auto canceled = manager().cancel(id.value());
    ASSERT_FALSE(canceled.has_value());
    EXPECT_EQ(canceled.error().code, error_code::invalid_state_transition);
}

TEST_F(TransferManagerTest, UnknownIdIsNotFound) {
    auto missing = transfer_id::generate();
    EXPECT_EQ(manager().cancel(missing).error().code, error_code::transfer_not_found);
    EXPECT_EQ(manager().pause(missing).error().code, error_code::transfer_not_found);
    EXPECT_EQ(manager().resume(missing).error().code, error_code::transfer_not_found);
    EXPECT_EQ(manager().remove(missing).error().code, error_code::transfer_not_found);
    EXPECT_FALSE(manager().find(missing).has_value());
    EXPECT_TRUE(manager().children(missing).empty());
}

TEST_F(TransferManagerTest, RemoveDeletesSubtree) {
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));

    auto blocks = manager().children(id.value());
    ASSERT_EQ(blocks.size(), 3u);

    ASSERT_TRUE(manager().remove(id.value()).has_value());
    EXPECT_FALSE(manager().find(id.value()).has_value());
    EXPECT_FALSE(manager().find(blocks[1].id).has_value());
    EXPECT_EQ(manager().count(), 0u);

    auto states = observer_->states_of(id.value());
    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.back(), transfer_state::deleted);

    ASSERT_TRUE(manager().flush().has_value());
    EXPECT_EQ(store_->size(), 0u);
}

TEST_F(TransferManagerTest, RemoveBlockCommitsTheRest) {
    state_->close_gate();
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for([&]() { return state_->in_flight.load() == 3; }));

    auto blocks = manager().children(id.value());
    ASSERT_EQ(blocks.size(), 3u);
    ASSERT_TRUE(manager().remove(blocks[2].id).has_value());
    EXPECT_FALSE(manager().find(blocks[2].id).has_value());

    auto removed_states = observer_->states_of(blocks[2].id);
    ASSERT_FALSE(removed_states.empty());
    EXPECT_EQ(removed_states.back(), transfer_state::deleted);

    state_->open_gate();
    ASSERT_TRUE(wait_state(id.value(), transfer_state::paused));
    ASSERT_TRUE(wait_for([&]() { return children_settled(id.value()); }));
    EXPECT_EQ(state_->count_events("commit"), 0u);
    EXPECT_EQ(manager().children(id.value()).size(), 2u);
    EXPECT_EQ(manager().find(id.value())->total_blocks, 2u);

    ASSERT_TRUE(manager().resume(id.value()).has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));
    EXPECT_EQ(state_->snapshot_events().back(), "commit:2");

    ASSERT_TRUE(manager().flush().has_value());
    EXPECT_EQ(stored(transfer_kind::block).size(), 2u);
}

TEST_F(TransferManagerTest, RemoveAllClearsStore) {
    auto first = manager().upload(upload_request_for("a.bin"));
    auto second = manager().upload(upload_request_for("b.bin"));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(wait_state(first.value(), transfer_state::completed));
    ASSERT_TRUE(wait_state(second.value(), transfer_state::completed));
    ASSERT_EQ(manager().count(), 2u);

    ASSERT_TRUE(manager().remove_all().has_value());
    EXPECT_EQ(manager().count(), 0u);
    EXPECT_TRUE(manager().transfers().empty());

    ASSERT_TRUE(manager().flush().has_value());
    EXPECT_EQ(store_->size(), 0u);
}

// =============================================================================
// Multi-blob Tests
// =============================================================================

TEST_F(TransferManagerTest, MultiDerivesStateFromBlobs) {
    std::vector<upload_request> requests{upload_request_for("a.bin"),
                                         upload_request_for("b.bin")};
    auto multi = manager().upload_multiple(requests);
    ASSERT_TRUE(multi.has_value());
    ASSERT_TRUE(wait_state(multi.value(), transfer_state::completed));

    auto snap = manager().find(multi.value());
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->kind, transfer_kind::multi_blob);
    EXPECT_EQ(snap->source, "/data/");
    EXPECT_EQ(snap->destination, "backup/");
    EXPECT_EQ(snap->restoration_id, "photos");

    auto blobs = manager().children(multi.value());
    ASSERT_EQ(blobs.size(), 2u);
    for (const auto& blob : blobs) {
        EXPECT_EQ(blob.state, transfer_state::completed);
        ASSERT_TRUE(blob.parent.has_value());
        EXPECT_EQ(*blob.parent, multi.value());
    }

    auto progress = manager().progress(multi.value());
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->total_bytes, 2 * object_size);
    EXPECT_TRUE(progress->is_complete());
    EXPECT_EQ(manager().count(), 1u);
}

TEST_F(TransferManagerTest, EmptyMultiUploadRejected) {
    std::vector<upload_request> none;
    auto multi = manager().upload_multiple(none);
    ASSERT_FALSE(multi.has_value());
    EXPECT_EQ(multi.error().code, error_code::invalid_request);
}

// =============================================================================
// Download Tests
// =============================================================================

TEST_F(TransferManagerTest, DownloadProbeExpandsBlocks) {
    auto id = manager().download(download_request_for("a.bin"));
    ASSERT_TRUE(id.has_value()) << id.error().message;
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));

    auto events = state_->snapshot_events();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front(), "probe");
    EXPECT_EQ(events.back(), "complete");
    EXPECT_EQ(state_->count_events("download:"), 2u);
    EXPECT_EQ(state_->last_total_size.load(), object_size);

    auto blocks = manager().children(id.value());
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].end_range, min_block_size);
    EXPECT_EQ(blocks[2].end_range, object_size);

    auto snap = manager().find(id.value());
    EXPECT_EQ(snap->total_bytes, object_size);
    EXPECT_EQ(snap->bytes_transferred, object_size);
}

TEST_F(TransferManagerTest, DownloadMissingRemoteFails) {
    log_capture capture;
    state_->remote_missing = true;

    auto id = manager().download(download_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::failed));
    EXPECT_EQ(manager().find(id.value())->error_message, "no such object");
    EXPECT_EQ(state_->count_events("download:"), 0u);
}

TEST_F(TransferManagerTest, DownloadFinalizeFailure) {
    log_capture capture;
    state_->fail_complete = true;

    auto id = manager().download(download_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::failed));
    EXPECT_EQ(manager().find(id.value())->error_message, "injected rename failure");
}

TEST_F(TransferManagerTest, DownloadMultiple) {
    std::vector<download_request> requests{download_request_for("a.bin"),
                                           download_request_for("b.bin")};
    auto multi = manager().download_multiple(requests);
    ASSERT_TRUE(multi.has_value());
    ASSERT_TRUE(wait_state(multi.value(), transfer_state::completed));
    EXPECT_EQ(state_->count_events("probe"), 2u);
    EXPECT_EQ(manager().find(multi.value())->destination, "/restore/");
}

// =============================================================================
// Ordering Tests
// =============================================================================

TEST_F(TransferManagerTest, DownloadPlansBlocksOnlyAfterInitialCall) {
    state_->hold("initial");
    auto id = manager().download(download_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for([&]() { return state_->count_events("probe") == 1; }));
    ASSERT_TRUE(wait_state(id.value(), transfer_state::in_progress));

    EXPECT_EQ(manager().children(id.value()).size(), 1u);
    EXPECT_EQ(state_->count_events("download:"), 0u);
    EXPECT_EQ(state_->count_events("complete"), 0u);

    state_->release("initial");
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));
    EXPECT_EQ(manager().children(id.value()).size(), 3u);
    EXPECT_EQ(state_->snapshot_events().back(), "complete");
}

TEST_F(TransferManagerTest, CommitWaitsForLastBlock) {
    state_->hold("block-000002");
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for([&]() { return state_->count_events("upload:") == 2; }));

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(state_->count_events("commit"), 0u);
    EXPECT_EQ(state_of(id.value()), transfer_state::in_progress);
    auto progress = manager().progress(id.value());
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->completed_blocks, 2u);

    state_->release("block-000002");
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));
    EXPECT_EQ(state_->snapshot_events().back(), "commit:3");
}

TEST_F(TransferManagerTest, LoadCountsOnlyRoots) {
    auto now = std::chrono::system_clock::now();

    auto single = make_blob("photos");
    single.state = transfer_state::completed;
    single.created_at = now - std::chrono::hours(2);
    std::vector<transfer_record> records{single, make_block(single, 0),
                                         make_block(single, 1)};

    auto multi = make_multi("photos");
    multi.state = transfer_state::completed;
    multi.created_at = now - std::chrono::hours(1);
    records.push_back(multi);
    for (int i = 0; i < 2; ++i) {
        auto child = make_blob("photos", multi.id);
        child.type = multi.type;
        child.state = transfer_state::completed;
        records.push_back(child);
        records.push_back(make_block(child, 0));
    }
    ASSERT_TRUE(store_->save(records).has_value());

    ASSERT_NO_FATAL_FAILURE(restart());

    EXPECT_EQ(manager().count(), 2u);
    auto roots = manager().transfers();
    ASSERT_EQ(roots.size(), 2u);
    EXPECT_EQ(roots[0].id, single.id);
    EXPECT_EQ(roots[1].id, multi.id);
    EXPECT_EQ(manager().children(single.id).size(), 2u);
    EXPECT_EQ(manager().children(multi.id).size(), 2u);
}

// =============================================================================
// Persistence Tests
// =============================================================================

TEST_F(TransferManagerTest, LoadedActiveComesBackPaused) {
    auto blob = make_blob("photos");
    blob.state = transfer_state::in_progress;
    blob.total_bytes_to_transfer = object_size;
    blob.options.block_size = min_block_size;
    std::vector<transfer_record> records{blob};
    for (uint32_t i = 0; i < 3; ++i) {
        auto block = make_block(blob, i);
        block.state = i == 0 ? transfer_state::completed : transfer_state::in_progress;
        block.bytes_transferred = i == 0 ? min_block_size : 0;
        records.push_back(block);
    }
    ASSERT_TRUE(store_->save(records).has_value());

    ASSERT_NO_FATAL_FAILURE(restart());

    EXPECT_EQ(state_of(blob.id), transfer_state::paused);
    auto blocks = manager().children(blob.id);
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].state, transfer_state::completed);
    EXPECT_EQ(blocks[1].state, transfer_state::paused);
    EXPECT_EQ(manager().find(blob.id)->bytes_transferred, min_block_size);

    ASSERT_TRUE(manager().resume(blob.id).has_value());
    ASSERT_TRUE(wait_state(blob.id, transfer_state::completed));
    EXPECT_EQ(state_->uploaders_created.load(), 1);
    EXPECT_EQ(state_->count_events("upload:block-000000"), 0u);
    EXPECT_EQ(state_->count_events("upload:"), 2u);
}

TEST_F(TransferManagerTest, ResumeWithoutClientFails) {
    log_capture capture;
    auto blob = make_blob("gone");
    blob.state = transfer_state::paused;
    std::vector<transfer_record> records{blob, make_block(blob, 0)};
    ASSERT_TRUE(store_->save(records).has_value());

    ASSERT_NO_FATAL_FAILURE(restart());
    ASSERT_EQ(state_of(blob.id), transfer_state::paused);

    auto resumed = manager().resume(blob.id);
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().code, error_code::no_client_registered);
    EXPECT_EQ(state_of(blob.id), transfer_state::failed);
    EXPECT_NE(manager().find(blob.id)->error_message.find("gone"), std::string::npos);
}

TEST_F(TransferManagerTest, OrphanBlockIsCorruption) {
    log_capture capture;
    auto blob = make_blob("photos");
    auto orphan = make_block(blob, 0);
    orphan.parent.reset();
    ASSERT_TRUE(store_->save({transfer_record{orphan}}).has_value());

    manager_.reset();
    auto built = transfer_manager::builder()
                     .with_store(store_)
                     .with_reachability_monitor(monitor_)
                     .with_thread_pool(pool_)
                     .build();
    ASSERT_TRUE(built.has_value());

    auto started = built.value().start_managing();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, error_code::store_corrupted);
    EXPECT_GE(capture.count(log_level::fatal), 1u);
    EXPECT_FALSE(built.value().is_managing());
}

TEST_F(TransferManagerTest, BlockWithMissingBlobIsCorruption) {
    log_capture capture;
    auto blob = make_blob("photos");
    ASSERT_TRUE(store_->save({transfer_record{make_block(blob, 0)}}).has_value());

    manager_.reset();
    auto built = transfer_manager::builder()
                     .with_store(store_)
                     .with_reachability_monitor(monitor_)
                     .with_thread_pool(pool_)
                     .build();
    ASSERT_TRUE(built.has_value());

    auto started = built.value().start_managing();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, error_code::store_corrupted);
}

TEST_F(TransferManagerTest, PersistOnlyOnFlushWhenConfigured) {
    transfer_manager_config config;
    config.persist_on_progress = false;
    ASSERT_NO_FATAL_FAILURE(restart(config));

    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));
    EXPECT_EQ(store_->size(), 0u);

    ASSERT_TRUE(manager().flush().has_value());
    EXPECT_EQ(store_->size(), 4u);
}

// =============================================================================
// Reachability Tests
// =============================================================================

TEST_F(TransferManagerTest, ReachabilityPausesAndResumes) {
    state_->close_gate();
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for([&]() { return state_->in_flight.load() == 3; }));

    monitor_->set_status(reachability_status::unreachable);
    EXPECT_EQ(state_of(id.value()), transfer_state::paused);

    state_->open_gate();
    monitor_->set_status(reachability_status::reachable_wan);
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));
    EXPECT_EQ(state_->count_events("upload:"), 3u);
}

TEST_F(TransferManagerTest, ReachabilityIgnoredWhenDisabled) {
    transfer_manager_config config;
    config.pause_on_unreachable = false;
    ASSERT_NO_FATAL_FAILURE(restart(config));

    state_->close_gate();
    auto id = manager().upload(upload_request_for("a.bin"));
    ASSERT_TRUE(id.has_value());
    ASSERT_TRUE(wait_for([&]() { return state_->in_flight.load() == 3; }));

    monitor_->set_status(reachability_status::unreachable);
    EXPECT_NE(state_of(id.value()), transfer_state::paused);

    state_->open_gate();
    ASSERT_TRUE(wait_state(id.value(), transfer_state::completed));
}

}  // namespace kcenon::blob_transfer::test
