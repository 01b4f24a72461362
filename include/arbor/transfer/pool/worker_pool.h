// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool.h
 * @brief Bounded worker pool with per-attempt timeout, retries and metrics
 */

#ifndef ARBOR_TRANSFER_POOL_WORKER_POOL_H
#define ARBOR_TRANSFER_POOL_WORKER_POOL_H

#include <arbor/transfer/pool/task.h>
#include <arbor/transfer/pool/task_group.h>
#include <arbor/transfer/pool/task_metrics.h>
#include <arbor/transfer/pool/worker_pool_config.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arbor::transfer {

class pool_context;

/**
 * @brief Executes tasks on a bounded set of workers
 *
 * Lifecycle: created -> running -> shutting down -> stopped. The pool
 * starts implicitly on the first submission.
 *
 * Every accepted task gets up to config().total_attempts() attempts. An
 * attempt fails when the operation returns an error, throws, or exceeds
 * task_timeout. Attempt k failing delays the next attempt by
 * retry_backoff_base * k. Each accepted task increments total_tasks once
 * and exactly one of completed_tasks or failed_tasks once.
 *
 * @code
 * auto pool = worker_pool::builder()
 *     .with_max_workers(8)
 *     .with_task_timeout(std::chrono::seconds(30))
 *     .build();
 *
 * if (pool) {
 *     auto results = pool.value().submit_batch(std::move(tasks));
 * }
 * @endcode
 */
class worker_pool {
public:
    /**
     * @brief Builder for worker_pool
     */
    class builder {
    public:
        builder() = default;

        /**
         * @brief Set the number of concurrently executing attempts
         * @param count Worker count (default: 16)
         */
        auto with_max_workers(std::size_t count) -> builder&;

        /**
         * @brief Set the worker flavor
         */
        auto with_execution_mode(execution_mode mode) -> builder&;

        /**
         * @brief Set the per-attempt timeout
         * @param timeout Timeout, or std::nullopt for none (default: 300s)
         */
        auto with_task_timeout(std::optional<std::chrono::milliseconds> timeout) -> builder&;

        /**
         * @brief Set total attempts per task (default: 3)
         */
        auto with_retry_attempts(uint32_t attempts) -> builder&;

        /**
         * @brief Set the base delay of the linear backoff (default: 1s)
         */
        auto with_retry_backoff(std::chrono::milliseconds base) -> builder&;

        /**
         * @brief Set how many jobs may queue behind the running ones
         */
        auto with_queue_capacity(std::size_t capacity) -> builder&;

        auto with_name(std::string name) -> builder&;

        /**
         * @brief Start from a complete configuration
         */
        auto with_config(worker_pool_config config) -> builder&;

        [[nodiscard]] auto build() -> result<worker_pool>;

    private:
        worker_pool_config config_;
    };

    /**
     * @brief Create a pool from a configuration
     * @return The pool, or invalid_configuration
     */
    [[nodiscard]] static auto create(const worker_pool_config& config = {})
        -> result<worker_pool>;

    // Non-copyable, movable
    worker_pool(const worker_pool&) = delete;
    auto operator=(const worker_pool&) -> worker_pool& = delete;
    worker_pool(worker_pool&&) noexcept;
    auto operator=(worker_pool&&) noexcept -> worker_pool&;

    /**
     * @brief Shuts down with wait = true
     */
    ~worker_pool();

    /**
     * @brief Create the workers
     *
     * Starting a running pool logs a warning and succeeds. Starting a pool
     * that has been shut down returns pool_unavailable.
     */
    auto start() -> result<void>;

    /**
     * @brief Execute one task and block until its final outcome
     */
    [[nodiscard]] auto submit(task t) -> task_result;

    [[nodiscard]] auto submit(std::string task_id, std::shared_ptr<operation> op)
        -> task_result;

    /**
     * @brief Execute tasks concurrently and block until all of them finish
     * @param tasks Tasks to run
     * @param on_complete Called once per task as it finishes, in completion order
     * @return One result per task, in the order of @p tasks
     */
    [[nodiscard]] auto submit_batch(std::vector<task> tasks,
                                    task_completion_callback on_complete = {})
        -> std::vector<task_result>;

    /**
     * @brief Create an empty group for incremental submission
     */
    [[nodiscard]] auto create_group(task_completion_callback on_complete = {}) -> task_group;

    /**
     * @brief Stop accepting tasks and release the workers
     * @param wait true to block until every accepted task finished
     *
     * With wait == false queued attempts are dropped and pending retries
     * fail with "pool shutting down". Attempts already running are left to
     * finish on their own. Idempotent.
     */
    void shutdown(bool wait = true);

    /**
     * @brief Add bytes handled by a caller to the throughput counter
     */
    void record_bytes_processed(uint64_t bytes);

    [[nodiscard]] auto get_metrics() const -> metrics_snapshot;
    [[nodiscard]] auto config() const -> const worker_pool_config&;
    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto is_shutting_down() const -> bool;

private:
    explicit worker_pool(std::shared_ptr<pool_context> context);

    std::shared_ptr<pool_context> context_;
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_POOL_WORKER_POOL_H
