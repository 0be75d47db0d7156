/**
 * @file operation_queue.cpp
 * @brief Dependency-graph scheduler implementation
 */

#include "kcenon/blob_transfer/core/operation_queue.h"

#include "kcenon/blob_transfer/core/logging.h"

#include <condition_variable>
#include <exception>
#include <map>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace kcenon::blob_transfer {

namespace {

constexpr const char* report_stage = "operation_report";

}  // namespace

// ============================================================================
// transfer_operation
// ============================================================================

transfer_operation::transfer_operation(std::string stage, std::string name,
                                       operation_priority priority)
    : stage_(std::move(stage)), name_(std::move(name)), priority_(priority) {}

void transfer_operation::add_dependency(std::shared_ptr<transfer_operation> dep) {
    if (dep && dep.get() != this) {
        dependencies_.push_back(std::move(dep));
    }
}

void transfer_operation::add_predecessor(std::shared_ptr<transfer_operation> prev) {
    if (prev && prev.get() != this) {
        predecessors_.push_back(std::move(prev));
    }
}

// ============================================================================
// operation_queue::impl
// ============================================================================

class operation_queue::impl : public std::enable_shared_from_this<impl> {
public:
    impl(adapters::transfer_thread_pool_interface* pool, std::size_t max_concurrency)
        : pool_(pool), max_concurrency_(max_concurrency) {}

    auto add(const std::vector<std::shared_ptr<transfer_operation>>& ops)
        -> result<void> {
        std::lock_guard lock(mutex_);

        std::unordered_set<transfer_operation*> in_batch;
        for (const auto& op : ops) {
            if (!op) {
                return unexpected{error{error_code::invalid_dependency,
                                        "null operation"}};
            }
            if (nodes_.contains(op.get()) || in_batch.contains(op.get())) {
                return unexpected{error{error_code::invalid_dependency,
                                        "operation already queued: " + op->name()}};
            }
            if (op->status() != operation_status::pending) {
                return unexpected{error{error_code::invalid_dependency,
                                        "operation already finished: " + op->name()}};
            }
            in_batch.insert(op.get());
        }

        // Validate every edge before touching the graph
        for (const auto& op : ops) {
            for (const auto& dep : op->dependencies()) {
                if (nodes_.contains(dep.get()) || in_batch.contains(dep.get())) {
                    continue;
                }
                if (dep->status() == operation_status::pending) {
                    return unexpected{error{
                        error_code::invalid_dependency,
                        op->name() + " depends on " + dep->name() +
                            " which was never queued"}};
                }
            }
        }

        for (const auto& op : ops) {
            node n;
            n.op = op;
            n.seq = next_seq_++;
            nodes_.emplace(op.get(), std::move(n));
        }

        std::vector<std::pair<std::shared_ptr<transfer_operation>, error>> doomed;
        for (const auto& op : ops) {
            auto& n = nodes_.at(op.get());
            std::optional<error> failed_dep;
            for (const auto& dep : op->dependencies()) {
                auto it = nodes_.find(dep.get());
                if (it != nodes_.end()) {
                    ++n.remaining;
                    it->second.dependents.push_back(op);
                    continue;
                }
                if (dep->status() != operation_status::succeeded && !failed_dep) {
                    failed_dep = error{error_code::dependency_failed,
                                       dep->name() + " did not succeed"};
                }
            }
            for (const auto& prev : op->predecessors()) {
                auto it = nodes_.find(prev.get());
                if (it != nodes_.end()) {
                    ++n.remaining;
                    it->second.followers.push_back(op);
                }
            }
            if (failed_dep) {
                doomed.emplace_back(op, std::move(*failed_dep));
            }
        }

        for (auto& [op, err] : doomed) {
            if (nodes_.contains(op.get())) {
                drop(op.get(), operation_status::skipped, err);
            }
        }

        for (const auto& op : ops) {
            auto it = nodes_.find(op.get());
            if (it != nodes_.end() && it->second.remaining == 0) {
                make_ready(it->second);
            }
        }

        BT_LOG_DEBUG(log_category::queue,
                     "Queued " + std::to_string(ops.size()) + " operation(s), " +
                         std::to_string(nodes_.size()) + " in graph");
        pump();
        return {};
    }

    void cancel(transfer_operation* op) {
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(op);
        if (it == nodes_.end()) {
            return;
        }
        operation_queue::mark_cancelled(*op);
        if (!it->second.dispatched) {
            drop(op, operation_status::canceled, error{error_code::operation_cancelled});
            pump();
        }
    }

    void cancel_all() {
        std::lock_guard lock(mutex_);
        std::vector<transfer_operation*> targets;
        targets.reserve(nodes_.size());
        for (auto& [key, n] : nodes_) {
            operation_queue::mark_cancelled(*key);
            if (!n.dispatched) {
                targets.push_back(key);
            }
        }
        for (auto* op : targets) {
            if (nodes_.contains(op)) {
                drop(op, operation_status::canceled,
                     error{error_code::operation_cancelled}, true);
            }
        }
        if (!targets.empty()) {
            BT_LOG_DEBUG(log_category::queue,
                         "Cancelled " + std::to_string(targets.size()) +
                             " pending operation(s)");
        }
    }

    void set_max_concurrency(std::size_t value) {
        std::lock_guard lock(mutex_);
        max_concurrency_ = value;
        pump();
    }

    [[nodiscard]] auto max_concurrency() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return max_concurrency_;
    }

    [[nodiscard]] auto operation_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return nodes_.size();
    }

    [[nodiscard]] auto executing_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return executing_;
    }

    auto wait_until_idle(std::chrono::milliseconds timeout) -> bool {
        std::unique_lock lock(mutex_);
        return idle_cv_.wait_for(lock, timeout, [this] { return is_idle(); });
    }

    void wait_until_idle() {
        std::unique_lock lock(mutex_);
        idle_cv_.wait(lock, [this] { return is_idle(); });
    }

private:
    struct node {
        std::shared_ptr<transfer_operation> op;
        std::size_t remaining = 0;
        std::vector<std::shared_ptr<transfer_operation>> dependents;
        std::vector<std::shared_ptr<transfer_operation>> followers;
        uint64_t seq = 0;
        bool dispatched = false;
    };

    // Higher priority first, then submission order
    using ready_key = std::pair<int, uint64_t>;

    [[nodiscard]] auto is_idle() const -> bool {
        return nodes_.empty() && pending_reports_ == 0;
    }

    static auto key_of(const node& n) -> ready_key {
        return {-static_cast<int>(n.op->priority()), n.seq};
    }

    void make_ready(node& n) {
        ready_.emplace(key_of(n), n.op.get());
    }

    /**
     * @brief Count a finished predecessor against each of its followers
     */
    void release_followers(const node& n) {
        for (const auto& follower : n.followers) {
            auto it = nodes_.find(follower.get());
            if (it != nodes_.end() && it->second.remaining > 0 &&
                --it->second.remaining == 0) {
                make_ready(it->second);
            }
        }
    }

    /**
     * @brief Remove a node that will never execute and report it
     *
     * Dependents are dropped too: as skipped, or as canceled when the whole
     * queue is being cancelled.
     */
    void drop(transfer_operation* op, operation_status status, const error& err,
              bool cancel_dependents = false) {
        auto it = nodes_.find(op);
        if (it == nodes_.end() || it->second.dispatched) {
            return;
        }
        node n = std::move(it->second);
        ready_.erase(key_of(n));
        nodes_.erase(it);

        operation_queue::mark_status(*op, status);
        post_report(n.op, operation_outcome{status, err});
        release_followers(n);

        auto dependent_status =
            cancel_dependents ? operation_status::canceled : operation_status::skipped;
        for (const auto& dependent : n.dependents) {
            if (cancel_dependents) {
                operation_queue::mark_cancelled(*dependent);
            }
            drop(dependent.get(), dependent_status, err, cancel_dependents);
        }
    }

    void post_report(std::shared_ptr<transfer_operation> op, operation_outcome outcome) {
        ++pending_reports_;
        auto self = shared_from_this();
        if (!pool_->is_running()) {
            BT_LOG_ERROR(log_category::queue,
                         "Thread pool stopped; dropping report for " + op->name());
            --pending_reports_;
            return;
        }
        pool_->submit_to_stage(
            [self, op = std::move(op), outcome = std::move(outcome)] {
                operation_queue::run_finished(*op, outcome);
                std::lock_guard lock(self->mutex_);
                --self->pending_reports_;
                self->idle_cv_.notify_all();
            },
            report_stage);
    }

    void pump() {
        while (executing_ < max_concurrency_ && !ready_.empty()) {
            auto first = ready_.begin();
            auto* op = first->second;
            ready_.erase(first);

            auto& n = nodes_.at(op);
            n.dispatched = true;
            ++executing_;
            operation_queue::mark_status(*op, operation_status::executing);

            auto self = shared_from_this();
            if (!pool_->is_running()) {
                BT_LOG_ERROR(log_category::queue,
                             "Thread pool stopped; cannot run " + op->name());
                n.dispatched = false;
                --executing_;
                drop(op, operation_status::failed, error{error_code::queue_stopped});
                continue;
            }
            pool_->submit_to_stage([self, shared = n.op] { self->run(shared); },
                                   op->stage());
        }
        if (is_idle()) {
            idle_cv_.notify_all();
        }
    }

    void run(const std::shared_ptr<transfer_operation>& op) {
        operation_outcome outcome;
        if (op->is_cancelled()) {
            outcome = {operation_status::canceled, error{error_code::operation_cancelled}};
        } else {
            operation_queue::run_started(*op);
            auto executed = operation_queue::run_execute(*op);
            if (op->is_cancelled()) {
                outcome = {operation_status::canceled,
                           executed ? error{error_code::operation_cancelled}
                                    : executed.error()};
            } else if (executed) {
                outcome = {operation_status::succeeded, error{}};
            } else {
                outcome = {operation_status::failed, executed.error()};
            }
        }

        if (outcome.status == operation_status::failed) {
            BT_LOG_WARN(log_category::queue,
                        op->name() + " failed: " + outcome.err.message);
        }

        operation_queue::run_finished(*op, outcome);
        finalize(op.get(), outcome);
    }

    void finalize(transfer_operation* op, const operation_outcome& outcome) {
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(op);
        if (it == nodes_.end()) {
            return;
        }
        node n = std::move(it->second);
        nodes_.erase(it);
        --executing_;
        operation_queue::mark_status(*op, outcome.status);
        release_followers(n);

        for (const auto& dependent : n.dependents) {
            auto dep_it = nodes_.find(dependent.get());
            if (dep_it == nodes_.end()) {
                continue;
            }
            if (!outcome.succeeded()) {
                error err = outcome.err ? outcome.err
                                        : error{error_code::dependency_failed};
                drop(dependent.get(), operation_status::skipped, err);
                continue;
            }
            if (dep_it->second.remaining > 0 && --dep_it->second.remaining == 0) {
                make_ready(dep_it->second);
            }
        }

        pump();
    }

    adapters::transfer_thread_pool_interface* pool_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<transfer_operation*, node> nodes_;
    std::map<ready_key, transfer_operation*> ready_;
    std::size_t max_concurrency_;
    std::size_t executing_ = 0;
    std::size_t pending_reports_ = 0;
    uint64_t next_seq_ = 0;
};

// ============================================================================
// operation_queue
// ============================================================================

operation_queue::operation_queue(
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
    std::size_t max_concurrency)
    : pool_(pool ? std::move(pool) : adapters::transfer_pool_factory::create()),
      impl_(std::make_shared<impl>(pool_.get(),
                                   max_concurrency > 0 ? max_concurrency
                                                       : default_max_concurrency)) {}

operation_queue::~operation_queue() {
    impl_->cancel_all();
    impl_->wait_until_idle();
}

auto operation_queue::add(std::shared_ptr<transfer_operation> op) -> result<void> {
    return impl_->add({std::move(op)});
}

auto operation_queue::add(const std::vector<std::shared_ptr<transfer_operation>>& ops)
    -> result<void> {
    return impl_->add(ops);
}

void operation_queue::cancel(const std::shared_ptr<transfer_operation>& op) {
    if (op) {
        impl_->cancel(op.get());
    }
}

void operation_queue::cancel_all() {
    impl_->cancel_all();
}

auto operation_queue::set_max_concurrency(std::size_t max_concurrency) -> result<void> {
    if (max_concurrency == 0) {
        return unexpected{error{error_code::config_invalid_concurrency}};
    }
    impl_->set_max_concurrency(max_concurrency);
    return {};
}

auto operation_queue::max_concurrency() const -> std::size_t {
    return impl_->max_concurrency();
}

auto operation_queue::operation_count() const -> std::size_t {
    return impl_->operation_count();
}

auto operation_queue::executing_count() const -> std::size_t {
    return impl_->executing_count();
}

auto operation_queue::wait_until_idle(std::chrono::milliseconds timeout) -> bool {
    return impl_->wait_until_idle(timeout);
}

auto operation_queue::run_execute(transfer_operation& op) -> result<void> {
    try {
        return op.execute();
    } catch (const std::exception& e) {
        BT_LOG_ERROR(log_category::queue,
                     op.name() + " threw: " + std::string(e.what()));
        return unexpected{error{error_code::internal_error, e.what()}};
    }
}

void operation_queue::run_started(transfer_operation& op) {
    op.on_started();
}

void operation_queue::run_finished(transfer_operation& op,
                                   const operation_outcome& outcome) {
    try {
        op.on_finished(outcome);
    } catch (const std::exception& e) {
        BT_LOG_ERROR(log_category::queue,
                     op.name() + " completion threw: " + std::string(e.what()));
    }
}

void operation_queue::mark_cancelled(transfer_operation& op) noexcept {
    op.request_cancel();
}

void operation_queue::mark_status(transfer_operation& op,
                                  operation_status status) noexcept {
    op.set_status(status);
}

}  // namespace kcenon::blob_transfer
