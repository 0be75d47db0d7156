/**
 * @file operation_queue.h
 * @brief Dependency-graph scheduler for transfer operations
 *
 * Operations are nodes of an explicit graph; an edge a -> b means b runs only
 * after a succeeded. Ready nodes dispatch by priority, then in submission
 * order, up to max_concurrency at a time. When a dependency ends failed,
 * canceled or skipped, every transitive dependent is reported as skipped and
 * never executed. A predecessor edge only orders: the follower waits until the
 * predecessor finished, whatever its outcome.
 */

#ifndef KCENON_BLOB_TRANSFER_CORE_OPERATION_QUEUE_H
#define KCENON_BLOB_TRANSFER_CORE_OPERATION_QUEUE_H

#include <kcenon/blob_transfer/adapters/thread_pool_adapter.h>
#include <kcenon/blob_transfer/core/types.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::blob_transfer {

/**
 * @brief Lifecycle of a queued operation
 */
enum class operation_status : uint8_t {
    pending,    ///< Waiting for dependencies or a free slot
    executing,  ///< Running on a worker
    succeeded,  ///< execute() returned a value
    failed,     ///< execute() returned an error
    canceled,   ///< Cancelled before or during execution
    skipped     ///< A dependency did not succeed; never executed
};

[[nodiscard]] constexpr auto to_string(operation_status status) noexcept
    -> std::string_view {
    switch (status) {
        case operation_status::pending: return "pending";
        case operation_status::executing: return "executing";
        case operation_status::succeeded: return "succeeded";
        case operation_status::failed: return "failed";
        case operation_status::canceled: return "canceled";
        case operation_status::skipped: return "skipped";
    }
    return "unknown";
}

enum class operation_priority : uint8_t { low = 0, normal = 1, high = 2 };

/**
 * @brief Final status of an operation and the error that caused it
 *
 * err is empty (success) for succeeded operations. A skipped operation
 * carries the error of the first dependency that did not succeed.
 */
struct operation_outcome {
    operation_status status = operation_status::pending;
    error err;

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return status == operation_status::succeeded;
    }
};

class operation_queue;

/**
 * @brief Abstract unit of work scheduled by operation_queue
 *
 * execute() blocks on a worker thread and should poll is_cancelled().
 * on_finished() is the completion path: it runs exactly once per queued
 * operation, including canceled and skipped ones, and never on the thread
 * that called operation_queue::add() or cancel().
 */
class transfer_operation : public std::enable_shared_from_this<transfer_operation> {
public:
    transfer_operation(std::string stage, std::string name,
                       operation_priority priority = operation_priority::normal);
    virtual ~transfer_operation() = default;

    transfer_operation(const transfer_operation&) = delete;
    transfer_operation& operator=(const transfer_operation&) = delete;

    [[nodiscard]] auto stage() const -> const std::string& { return stage_; }
    [[nodiscard]] auto name() const -> const std::string& { return name_; }
    [[nodiscard]] auto priority() const noexcept -> operation_priority {
        return priority_;
    }

    /**
     * @brief Declare that this operation runs only after dep succeeded
     *
     * Must be called before the operation is added to a queue.
     */
    void add_dependency(std::shared_ptr<transfer_operation> dep);

    [[nodiscard]] auto dependencies() const
        -> const std::vector<std::shared_ptr<transfer_operation>>& {
        return dependencies_;
    }

    /**
     * @brief Declare that this operation starts only after prev finished
     *
     * The outcome of prev does not matter. A predecessor that is not queued
     * when this operation is added is treated as finished. Must be called
     * before the operation is added to a queue.
     */
    void add_predecessor(std::shared_ptr<transfer_operation> prev);

    [[nodiscard]] auto predecessors() const
        -> const std::vector<std::shared_ptr<transfer_operation>>& {
        return predecessors_;
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Flag handed to blocking client calls for cooperative cancellation
     */
    [[nodiscard]] auto cancel_flag() const noexcept -> const std::atomic<bool>& {
        return cancelled_;
    }

    [[nodiscard]] auto status() const noexcept -> operation_status {
        return status_.load(std::memory_order_acquire);
    }

protected:
    /**
     * @brief Perform the work; runs on a worker thread
     */
    virtual auto execute() -> result<void> = 0;

    /**
     * @brief Called on the worker right before execute()
     */
    virtual void on_started() {}

    /**
     * @brief Completion path, called exactly once
     */
    virtual void on_finished(const operation_outcome& outcome) = 0;

private:
    friend class operation_queue;

    void request_cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    void set_status(operation_status status) noexcept {
        status_.store(status, std::memory_order_release);
    }

    std::string stage_;
    std::string name_;
    operation_priority priority_;
    std::vector<std::shared_ptr<transfer_operation>> dependencies_;
    std::vector<std::shared_ptr<transfer_operation>> predecessors_;
    std::atomic<bool> cancelled_{false};
    std::atomic<operation_status> status_{operation_status::pending};
};

/**
 * @brief Scheduler executing transfer_operation graphs on a thread pool
 *
 * @code
 * operation_queue queue(adapters::transfer_pool_factory::create(), 4);
 * finish->add_dependency(block_a);
 * finish->add_dependency(block_b);
 * auto added = queue.add({finish, block_a, block_b});
 * @endcode
 *
 * @note Thread-safe. Destruction cancels everything and waits until every
 *       completion has been reported.
 */
class operation_queue {
public:
    static constexpr std::size_t default_max_concurrency = 4;

    explicit operation_queue(
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
        std::size_t max_concurrency = default_max_concurrency);
    ~operation_queue();

    operation_queue(const operation_queue&) = delete;
    operation_queue& operator=(const operation_queue&) = delete;

    /**
     * @brief Add one operation
     * @return invalid_dependency if a dependency is neither queued nor finished
     */
    [[nodiscard]] auto add(std::shared_ptr<transfer_operation> op) -> result<void>;

    /**
     * @brief Add a batch; dependencies may point inside the batch
     *
     * Either every operation is added or none is.
     */
    [[nodiscard]] auto add(const std::vector<std::shared_ptr<transfer_operation>>& ops)
        -> result<void>;

    /**
     * @brief Cancel one operation; non-blocking
     *
     * A pending operation is reported as canceled without executing. An
     * executing one sees is_cancelled() and is reported as canceled however
     * execute() returns, so its dependents are skipped.
     */
    void cancel(const std::shared_ptr<transfer_operation>& op);

    /**
     * @brief Cancel every queued and executing operation; non-blocking
     */
    void cancel_all();

    /**
     * @brief Change the in-flight cap; affects future dispatch only
     * @return config_invalid_concurrency when max_concurrency is 0
     */
    [[nodiscard]] auto set_max_concurrency(std::size_t max_concurrency) -> result<void>;
    [[nodiscard]] auto max_concurrency() const -> std::size_t;

    /**
     * @brief Operations not yet finished (pending or executing)
     */
    [[nodiscard]] auto operation_count() const -> std::size_t;
    [[nodiscard]] auto executing_count() const -> std::size_t;

    /**
     * @brief Block until no operation is queued and every completion ran
     * @return false on timeout
     */
    auto wait_until_idle(std::chrono::milliseconds timeout) -> bool;

private:
    class impl;

    static auto run_execute(transfer_operation& op) -> result<void>;
    static void run_started(transfer_operation& op);
    static void run_finished(transfer_operation& op, const operation_outcome& outcome);
    static void mark_cancelled(transfer_operation& op) noexcept;
    static void mark_status(transfer_operation& op, operation_status status) noexcept;

    std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
    std::shared_ptr<impl> impl_;
};

}  // namespace kcenon::blob_transfer

#endif  // KCENON_BLOB_TRANSFER_CORE_OPERATION_QUEUE_H
