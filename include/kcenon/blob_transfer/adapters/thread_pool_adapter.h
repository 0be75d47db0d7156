// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Thread pool adapter for blob_transfer
 *
 * Operation queue workers run on a transfer_thread_pool_interface. With
 * thread_system the adapter wraps kcenon::thread::thread_pool; without it a
 * standalone pool of std::thread workers is used.
 *
 * Features:
 * - Stage-based task tracking (one stage per operation type)
 * - Seamless integration with thread_system when available
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::blob_transfer::adapters {

/**
 * @brief Interface for thread pool operations in blob_transfer
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task tracked under a stage name
     * @param task The task to execute
     * @param stage_name Stage name (e.g., "block_upload")
     * @return Future for the task completion
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    /**
     * @brief Get the number of worker threads
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Check if the pool accepts tasks
     */
    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Get total pending task count
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;

    /**
     * @brief Get pending task count for a specific stage
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter that wraps thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_transfer_adapter(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "blob_transfer_pool",
        size_t worker_count = 0);

    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Create a started pool with worker_count workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "blob_transfer_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;
    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Standalone pool of std::thread workers
 *
 * Tasks run in submission order. The destructor stops accepting tasks, runs
 * the ones already queued and joins the workers.
 */
class worker_transfer_pool : public transfer_thread_pool_interface {
public:
    /**
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     * @param pool_name Name for identification in logs
     */
    explicit worker_transfer_pool(size_t worker_count = 0,
                                  const std::string& pool_name = "blob_transfer_pool");
    ~worker_transfer_pool() override;

    worker_transfer_pool(const worker_transfer_pool&) = delete;
    worker_transfer_pool& operator=(const worker_transfer_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    /**
     * @brief Stop accepting tasks, drain the queue and join the workers
     */
    void shutdown();

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the best available pool
 *
 * 1. thread_system_transfer_adapter (when KCENON_WITH_THREAD_SYSTEM)
 * 2. worker_transfer_pool (fallback)
 */
class transfer_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "blob_transfer_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::blob_transfer::adapters
