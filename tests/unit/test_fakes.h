/**
 * @file test_fakes.h
 * @brief Controllable storage client and observers shared by unit tests
 */

#ifndef KCENON_BLOB_TRANSFER_TEST_FAKES_H
#define KCENON_BLOB_TRANSFER_TEST_FAKES_H

#include <kcenon/blob_transfer/client/storage_client.h>
#include <kcenon/blob_transfer/core/logging.h>
#include <kcenon/blob_transfer/core/transfer_entities.h>
#include <kcenon/blob_transfer/manager/transfer_observer.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::blob_transfer::test {

/**
 * @brief Poll a predicate until it holds or the timeout expires
 */
inline auto wait_for(const std::function<bool()>& predicate,
                     std::chrono::milliseconds timeout = std::chrono::seconds(5)) -> bool {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

/**
 * @brief Behaviour and call log shared by a fake client and its helpers
 *
 * Block transfers wait while the gate is closed, so a test can hold
 * operations in flight and pause, cancel or remove them. A held name (a block
 * id, or "initial" for the first download call) waits until released and
 * then succeeds even if it was cancelled, like a request already on the wire.
 */
struct fake_storage_state {
    std::mutex mutex;
    std::condition_variable gate_cv;
    bool gate_open = true;
    std::set<std::string> held;

    uint64_t object_size = 0;       ///< Upload source size and download object size
    std::string object_checksum;    ///< Reported by the download probe
    std::set<std::string> failing_blocks;
    bool fail_commit = false;
    bool fail_complete = false;
    bool remote_missing = false;
    bool fail_create = false;

    std::vector<std::string> events;
    std::atomic<int> uploaders_created{0};
    std::atomic<int> downloaders_created{0};
    std::atomic<int> in_flight{0};
    std::atomic<int> max_in_flight{0};
    std::atomic<uint64_t> last_progress{0};
    std::atomic<uint64_t> last_total_size{0};
    std::map<std::string, int> active_by_block;
    std::atomic<int> max_block_overlap{0};

    void close_gate() {
        std::lock_guard lock(mutex);
        gate_open = false;
    }

    void open_gate() {
        {
            std::lock_guard lock(mutex);
            gate_open = true;
        }
        gate_cv.notify_all();
    }

    void hold(const std::string& name) {
        std::lock_guard lock(mutex);
        held.insert(name);
    }

    void release(const std::string& name) {
        {
            std::lock_guard lock(mutex);
            held.erase(name);
        }
        gate_cv.notify_all();
    }

    void wait_while_held(const std::string& name) {
        std::unique_lock lock(mutex);
        while (held.contains(name)) {
            gate_cv.wait_for(lock, std::chrono::milliseconds(5));
        }
    }

    void record(std::string event) {
        std::lock_guard lock(mutex);
        events.push_back(std::move(event));
    }

    auto snapshot_events() -> std::vector<std::string> {
        std::lock_guard lock(mutex);
        return events;
    }

    auto count_events(const std::string& prefix) -> std::size_t {
        std::lock_guard lock(mutex);
        return static_cast<std::size_t>(
            std::count_if(events.begin(), events.end(), [&prefix](const std::string& e) {
                return e.rfind(prefix, 0) == 0;
            }));
    }

    /**
     * @brief Run a block transfer through the gate
     */
    auto transfer_block(const std::string& kind, const block_range& block,
                        const std::atomic<bool>& cancelled) -> result<uint64_t> {
        auto now = ++in_flight;
        auto seen = max_in_flight.load();
        while (now > seen && !max_in_flight.compare_exchange_weak(seen, now)) {
        }

        bool was_held = false;
        {
            std::unique_lock lock(mutex);
            auto overlap = ++active_by_block[block.block_id];
            auto most = max_block_overlap.load();
            while (overlap > most && !max_block_overlap.compare_exchange_weak(most, overlap)) {
            }
            while (held.contains(block.block_id)) {
                was_held = true;
                gate_cv.wait_for(lock, std::chrono::milliseconds(5));
            }
            while (!was_held && !gate_open && !cancelled.load()) {
                gate_cv.wait_for(lock, std::chrono::milliseconds(5));
            }
            --active_by_block[block.block_id];
        }
        --in_flight;

        if (cancelled.load() && !was_held) {
            return unexpected(error{error_code::operation_cancelled});
        }
        bool fails = false;
        {
            std::lock_guard lock(mutex);
            fails = failing_blocks.contains(block.block_id);
        }
        if (fails) {
            record(kind + "-failed:" + block.block_id);
            return unexpected(error{error_code::request_failed,
                                    "injected failure for " + block.block_id});
        }
        record(kind + ":" + block.block_id);
        return block.length();
    }
};

inline auto plan_ranges(uint64_t begin, uint64_t end, uint64_t block_size,
                        uint32_t first_index) -> std::vector<block_range> {
    std::vector<block_range> ranges;
    uint32_t index = first_index;
    for (uint64_t offset = begin; offset < end; offset += block_size) {
        ranges.push_back(block_range{offset, std::min(end, offset + block_size),
                                     make_block_id(index++)});
    }
    return ranges;
}

class fake_uploader : public blob_uploader {
public:
    fake_uploader(std::shared_ptr<fake_storage_state> state, blob_transfer_options options)
        : state_(std::move(state)), options_(std::move(options)) {}

    [[nodiscard]] auto block_list() const -> std::vector<block_range> override {
        return plan_ranges(0, state_->object_size, options_.block_size, 0);
    }

    [[nodiscard]] auto upload_block(const block_range& block,
                                    const std::atomic<bool>& cancelled)
        -> result<uint64_t> override {
        return state_->transfer_block("upload", block, cancelled);
    }

    [[nodiscard]] auto commit(const std::vector<std::string>& block_ids,
                              const std::atomic<bool>&) -> result<void> override {
        state_->record("commit:" + std::to_string(block_ids.size()));
        if (state_->fail_commit) {
            return unexpected(error{error_code::commit_failed, "injected commit failure"});
        }
        return {};
    }

    void set_progress(uint64_t bytes_transferred) override {
        state_->last_progress = bytes_transferred;
    }

private:
    std::shared_ptr<fake_storage_state> state_;
    blob_transfer_options options_;
};

class fake_downloader : public blob_downloader {
public:
    fake_downloader(std::shared_ptr<fake_storage_state> state, blob_transfer_options options)
        : state_(std::move(state)), options_(std::move(options)) {}

    [[nodiscard]] auto initial_download(const std::atomic<bool>&)
        -> result<download_probe> override {
        state_->record("probe");
        state_->wait_while_held("initial");
        if (state_->remote_missing) {
            return unexpected(error{error_code::remote_not_found, "no such object"});
        }
        download_probe probe;
        probe.object_size = state_->object_size;
        probe.first_chunk = block_range{
            0, std::min(state_->object_size, options_.block_size), make_block_id(0)};
        probe.remaining_blocks =
            plan_ranges(probe.first_chunk.end, probe.object_size, options_.block_size, 1);
        probe.checksum = state_->object_checksum;
        return probe;
    }

    [[nodiscard]] auto download_block(const block_range& block,
                                      const std::atomic<bool>& cancelled)
        -> result<uint64_t> override {
        return state_->transfer_block("download", block, cancelled);
    }

    [[nodiscard]] auto complete(const std::atomic<bool>&) -> result<void> override {
        state_->record("complete");
        if (state_->fail_complete) {
            return unexpected(error{error_code::file_write_error, "injected rename failure"});
        }
        return {};
    }

    void set_progress(uint64_t bytes_transferred) override {
        state_->last_progress = bytes_transferred;
    }

    void set_total_size(uint64_t total_bytes) override {
        state_->last_total_size = total_bytes;
    }

private:
    std::shared_ptr<fake_storage_state> state_;
    blob_transfer_options options_;
};

/**
 * @brief Storage client whose helpers report to a fake_storage_state
 */
class fake_storage_client : public storage_client {
public:
    explicit fake_storage_client(std::string restoration_id,
                                 std::shared_ptr<fake_storage_state> state =
                                     std::make_shared<fake_storage_state>())
        : restoration_id_(std::move(restoration_id)), state_(std::move(state)) {}

    [[nodiscard]] auto restoration_id() const -> const std::string& override {
        return restoration_id_;
    }

    [[nodiscard]] auto endpoint() const -> std::string override {
        return "fake://" + restoration_id_;
    }

    [[nodiscard]] auto create_uploader(const std::string&, const std::string&,
                                       const blob_transfer_options& options)
        -> result<std::shared_ptr<blob_uploader>> override {
        if (state_->fail_create) {
            return unexpected(error{error_code::helper_construction_failed,
                                    "injected helper failure"});
        }
        ++state_->uploaders_created;
        return std::shared_ptr<blob_uploader>(
            std::make_shared<fake_uploader>(state_, options));
    }

    [[nodiscard]] auto create_downloader(const std::string&, const std::string&,
                                         const blob_transfer_options& options)
        -> result<std::shared_ptr<blob_downloader>> override {
        if (state_->fail_create) {
            return unexpected(error{error_code::helper_construction_failed,
                                    "injected helper failure"});
        }
        ++state_->downloaders_created;
        return std::shared_ptr<blob_downloader>(
            std::make_shared<fake_downloader>(state_, options));
    }

    [[nodiscard]] auto state() const -> const std::shared_ptr<fake_storage_state>& {
        return state_;
    }

private:
    std::string restoration_id_;
    std::shared_ptr<fake_storage_state> state_;
};

/**
 * @brief Observer keeping every notification
 */
class recording_observer : public transfer_observer {
public:
    struct entry {
        transfer_snapshot snapshot;
        transfer_state state;
        std::optional<transfer_progress> progress;
    };

    void on_transfer_state_changed(const transfer_snapshot& snapshot, transfer_state state,
                                   const std::optional<transfer_progress>& progress) override {
        std::lock_guard lock(mutex_);
        entries_.push_back({snapshot, state, progress});
    }

    auto entries() -> std::vector<entry> {
        std::lock_guard lock(mutex_);
        return entries_;
    }

    auto states_of(const transfer_id& id) -> std::vector<transfer_state> {
        std::lock_guard lock(mutex_);
        std::vector<transfer_state> states;
        for (const auto& e : entries_) {
            if (e.snapshot.id == id) {
                states.push_back(e.state);
            }
        }
        return states;
    }

private:
    std::mutex mutex_;
    std::vector<entry> entries_;
};

/**
 * @brief Collect log records for the lifetime of the object
 */
class log_capture {
public:
    log_capture() {
        get_logger().set_console_output(false);
        get_logger().set_callback([this](const log_record& record) {
            std::lock_guard lock(mutex_);
            records_.push_back(record);
        });
    }

    ~log_capture() {
        get_logger().set_callback(nullptr);
        get_logger().set_console_output(true);
    }

    log_capture(const log_capture&) = delete;
    log_capture& operator=(const log_capture&) = delete;

    auto count(log_level level) -> std::size_t {
        std::lock_guard lock(mutex_);
        return static_cast<std::size_t>(std::count_if(
            records_.begin(), records_.end(),
            [level](const log_record& r) { return r.level == level; }));
    }

    auto records() -> std::vector<log_record> {
        std::lock_guard lock(mutex_);
        return records_;
    }

private:
    std::mutex mutex_;
    std::vector<log_record> records_;
};

}  // namespace kcenon::blob_transfer::test

#endif  // KCENON_BLOB_TRANSFER_TEST_FAKES_H
