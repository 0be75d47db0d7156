/**
 * @file store_writer.cpp
 * @brief Background store writer implementation
 */

#include "kcenon/blob_transfer/store/store_writer.h"

#include "kcenon/blob_transfer/core/logging.h"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace kcenon::blob_transfer {

class store_writer::impl {
public:
    struct mutation {
        enum class kind { save, remove, clear } op = kind::save;
        std::vector<transfer_record> records;
        transfer_id id;
    };

    explicit impl(std::shared_ptr<transfer_store> store) : store_(std::move(store)) {
        worker_ = std::thread([this] { run(); });
    }

    ~impl() { stop(); }

    void enqueue(mutation m) {
        {
            std::lock_guard lock(mutex_);
            if (running_) {
                queue_.push_back(std::move(m));
                ++enqueued_;
                cv_.notify_all();
                return;
            }
        }
        // Stopped: apply on the caller's thread
        std::lock_guard apply_lock(apply_mutex_);
        record_failure(apply(m));
    }

    auto flush() -> result<void> {
        std::unique_lock lock(mutex_);
        auto target = enqueued_;
        done_cv_.wait(lock, [&] { return applied_ >= target || !running_; });

        auto failure = std::move(first_failure_);
        first_failure_.reset();
        if (failure) {
            return unexpected(std::move(*failure));
        }
        return {};
    }

    void stop() {
        {
            std::lock_guard lock(mutex_);
            if (!running_ || stopping_) {
                return;
            }
            stopping_ = true;
            cv_.notify_all();
        }
        if (worker_.joinable()) {
            worker_.join();
        }
        std::lock_guard lock(mutex_);
        running_ = false;
        done_cv_.notify_all();
    }

    auto pending() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return queue_.size();
    }

    auto store() const -> const std::shared_ptr<transfer_store>& { return store_; }

private:
    void run() {
        for (;;) {
            mutation next;
            {
                std::unique_lock lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (queue_.empty()) {
                    return;
                }
                next = std::move(queue_.front());
                queue_.pop_front();
            }

            result<void> applied;
            {
                std::lock_guard apply_lock(apply_mutex_);
                applied = apply(next);
            }

            std::lock_guard lock(mutex_);
            if (!applied && !first_failure_) {
                first_failure_ = applied.error();
            }
            ++applied_;
            done_cv_.notify_all();
        }
    }

    auto apply(const mutation& m) -> result<void> {
        result<void> applied;
        switch (m.op) {
            case mutation::kind::save:
                applied = store_->save(m.records);
                break;
            case mutation::kind::remove:
                applied = store_->remove(m.id);
                break;
            case mutation::kind::clear:
                applied = store_->clear();
                break;
        }
        if (!applied) {
            BT_LOG_ERROR(log_category::store,
                         "Durable store write failed: " + applied.error().message);
        }
        return applied;
    }

    void record_failure(const result<void>& applied) {
        if (applied) {
            return;
        }
        std::lock_guard lock(mutex_);
        if (!first_failure_) {
            first_failure_ = applied.error();
        }
    }

    std::shared_ptr<transfer_store> store_;
    std::thread worker_;

    mutable std::mutex mutex_;
    std::mutex apply_mutex_;
    std::condition_variable cv_;
    std::condition_variable done_cv_;
    std::deque<mutation> queue_;
    uint64_t enqueued_ = 0;
    uint64_t applied_ = 0;
    bool running_ = true;
    bool stopping_ = false;
    std::optional<error> first_failure_;
};

store_writer::store_writer(std::shared_ptr<transfer_store> store)
    : impl_(std::make_unique<impl>(store ? std::move(store)
                                         : std::make_shared<memory_transfer_store>())) {}

store_writer::~store_writer() = default;

void store_writer::enqueue_save(std::vector<transfer_record> records) {
    if (records.empty()) {
        return;
    }
    impl::mutation m;
    m.op = impl::mutation::kind::save;
    m.records = std::move(records);
    impl_->enqueue(std::move(m));
}

void store_writer::enqueue_remove(const transfer_id& id) {
    impl::mutation m;
    m.op = impl::mutation::kind::remove;
    m.id = id;
    impl_->enqueue(std::move(m));
}

void store_writer::enqueue_clear() {
    impl::mutation m;
    m.op = impl::mutation::kind::clear;
    impl_->enqueue(std::move(m));
}

auto store_writer::flush() -> result<void> {
    return impl_->flush();
}

void store_writer::stop() {
    impl_->stop();
}

auto store_writer::pending() const -> std::size_t {
    return impl_->pending();
}

auto store_writer::store() const -> const std::shared_ptr<transfer_store>& {
    return impl_->store();
}

}  // namespace kcenon::blob_transfer
