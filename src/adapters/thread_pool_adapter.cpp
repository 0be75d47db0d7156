// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Thread pool adapter implementation for blob_transfer
 */

#include "kcenon/blob_transfer/adapters/thread_pool_adapter.h"

#include <condition_variable>
#include <deque>
#include <stdexcept>
#include <thread>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace kcenon::blob_transfer::adapters {

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

auto default_worker_count(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

}  // namespace

// ============================================================================
// thread_system_transfer_adapter implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that runs one queued transfer task on a thread_system worker
 */
class transfer_job : public kcenon::thread::job {
public:
    explicit transfer_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_transfer_adapter::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    stage_tracker tracker;
};

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_transfer_adapter::~thread_system_transfer_adapter() = default;

std::shared_ptr<thread_system_transfer_adapter>
thread_system_transfer_adapter::create_default(size_t worker_count,
                                               const std::string& pool_name) {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_transfer_adapter>(
        std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_transfer_adapter::submit(
    std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped_task = [task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    pimpl_->pool->enqueue(
        std::make_unique<transfer_job>(std::move(wrapped_task), "transfer_task"));
    return future;
}

std::future<void> thread_system_transfer_adapter::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->tracker.increment(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto* tracker = &pimpl_->tracker;
    auto wrapped_task = [task = std::move(task), promise, tracker,
                         stage = stage_name]() {
        tracker->decrement(stage);
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    pimpl_->pool->enqueue(
        std::make_unique<transfer_job>(std::move(wrapped_task), stage_name));
    return future;
}

size_t thread_system_transfer_adapter::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_transfer_adapter::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_transfer_adapter::pending_tasks() const {
    if (pimpl_->pool) {
        auto queue = pimpl_->pool->get_job_queue();
        return queue ? queue->size() : 0;
    }
    return 0;
}

size_t thread_system_transfer_adapter::pending_tasks(
    const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

std::shared_ptr<kcenon::thread::thread_pool>
thread_system_transfer_adapter::underlying_pool() const {
    return pimpl_->pool;
}

std::string thread_system_transfer_adapter::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// worker_transfer_pool implementation
// ============================================================================

struct worker_transfer_pool::impl {
    std::string pool_name;
    size_t worker_count{0};
    std::vector<std::thread> workers;

    struct queued_task {
        std::packaged_task<void()> task;
        std::string stage;
    };
    std::deque<queued_task> tasks;
    mutable std::mutex mutex;
    std::condition_variable cv;
    bool stopping{false};
    stage_tracker tracker;

    void run() {
        for (;;) {
            queued_task next;
            {
                std::unique_lock lock(mutex);
                cv.wait(lock, [this] { return stopping || !tasks.empty(); });
                if (tasks.empty()) {
                    return;
                }
                next = std::move(tasks.front());
                tasks.pop_front();
            }
            if (!next.stage.empty()) {
                tracker.decrement(next.stage);
            }
            next.task();
        }
    }

    auto enqueue(std::function<void()> task, std::string stage)
        -> std::future<void> {
        std::packaged_task<void()> packaged(std::move(task));
        auto future = packaged.get_future();
        {
            std::lock_guard lock(mutex);
            if (stopping) {
                std::promise<void> rejected;
                rejected.set_exception(std::make_exception_ptr(
                    std::runtime_error(pool_name + " is stopped")));
                return rejected.get_future();
            }
            if (!stage.empty()) {
                tracker.increment(stage);
            }
            tasks.push_back(queued_task{std::move(packaged), std::move(stage)});
        }
        cv.notify_one();
        return future;
    }
};

worker_transfer_pool::worker_transfer_pool(size_t worker_count,
                                           const std::string& pool_name)
    : pimpl_(std::make_shared<impl>()) {
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = default_worker_count(worker_count);
    pimpl_->workers.reserve(pimpl_->worker_count);
    for (size_t i = 0; i < pimpl_->worker_count; ++i) {
        pimpl_->workers.emplace_back([p = pimpl_] { p->run(); });
    }
}

worker_transfer_pool::~worker_transfer_pool() {
    shutdown();
}

void worker_transfer_pool::shutdown() {
    {
        std::lock_guard lock(pimpl_->mutex);
        pimpl_->stopping = true;
    }
    pimpl_->cv.notify_all();

    for (auto& worker : pimpl_->workers) {
        if (!worker.joinable()) {
            continue;
        }
        // A task may release the last owner of the pool from a worker thread
        if (worker.get_id() == std::this_thread::get_id()) {
            worker.detach();
        } else {
            worker.join();
        }
    }
    pimpl_->workers.clear();
}

std::future<void> worker_transfer_pool::submit(std::function<void()> task) {
    return pimpl_->enqueue(std::move(task), {});
}

std::future<void> worker_transfer_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    return pimpl_->enqueue(std::move(task), stage_name);
}

size_t worker_transfer_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool worker_transfer_pool::is_running() const {
    std::lock_guard lock(pimpl_->mutex);
    return !pimpl_->stopping;
}

size_t worker_transfer_pool::pending_tasks() const {
    std::lock_guard lock(pimpl_->mutex);
    return pimpl_->tasks.size();
}

size_t worker_transfer_pool::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker.count(stage_name);
}

// ============================================================================
// transfer_pool_factory implementation
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::create_default(worker_count,
                                                          pool_name);
#else
    return std::make_shared<worker_transfer_pool>(worker_count, pool_name);
#endif
}

}  // namespace kcenon::blob_transfer::adapters
