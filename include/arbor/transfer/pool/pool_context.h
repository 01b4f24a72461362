// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file pool_context.h
 * @brief Shared state between a worker_pool and the task groups it creates
 *
 * A pool_context is owned jointly by the worker_pool, every task_group and
 * every attempt job still held by the executor. It carries:
 * - the executor and its lifecycle flags
 * - the metrics
 * - the admission counters (queued jobs and accepted submissions)
 * - a pool-wide completion signal that task groups wait on
 */

#ifndef ARBOR_TRANSFER_POOL_POOL_CONTEXT_H
#define ARBOR_TRANSFER_POOL_POOL_CONTEXT_H

#include <arbor/transfer/adapters/thread_pool_adapter.h>
#include <arbor/transfer/pool/task.h>
#include <arbor/transfer/pool/task_metrics.h>
#include <arbor/transfer/pool/worker_pool_config.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>

namespace arbor::transfer {

/**
 * @brief Result of trying to hand an attempt to the executor
 */
enum class launch_status {
    launched,     ///< the attempt is queued or running
    saturated,    ///< every job slot is taken; retry after the next signal
    unavailable,  ///< the executor has been released
};

class pool_context : public std::enable_shared_from_this<pool_context> {
public:
    using clock = std::chrono::steady_clock;

    explicit pool_context(worker_pool_config cfg);

    pool_context(const pool_context&) = delete;
    pool_context& operator=(const pool_context&) = delete;

    // ------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------

    /**
     * @brief Create the executor if it does not exist yet
     * @return Success, or pool_unavailable after shutdown
     */
    auto start() -> result<void>;

    /**
     * @brief Same as start(), without the warning when already started
     */
    auto ensure_started() -> result<void>;

    /**
     * @brief Stop admitting work and release the executor
     * @param wait Block until accepted submissions have finished
     *
     * With @p wait set, returns once every accepted submission reached its
     * final outcome, or once no group is being driven and every attempt
     * held by the executor has run. Submissions parked in an undriven group
     * settle on its next drive: finished attempts keep their result and
     * pending retries fail with pool_unavailable.
     */
    void shutdown(bool wait);

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto is_shutting_down() const -> bool;

    // ------------------------------------------------------------------
    // Admission
    // ------------------------------------------------------------------

    /**
     * @brief Account for a new submission unless the pool is shutting down
     * @return false when the submission must be rejected
     */
    [[nodiscard]] auto try_begin_submission() -> bool;

    /**
     * @brief Account for a submission reaching its final outcome
     */
    void end_submission();

    /**
     * @brief Account for a thread driving a task group
     *
     * While any group is driven, shutdown(true) keeps the executor so that
     * pending retries of that group can still run.
     */
    void begin_drive();
    void end_drive();

    /**
     * @brief Hand one attempt of @p op to the executor
     * @param op Operation to execute
     * @param out Receives the attempt's future when launched
     *
     * At most max_workers + queue_capacity attempts are held by the
     * executor at a time.
     */
    [[nodiscard]] auto try_launch(const std::shared_ptr<operation>& op,
                                  std::future<result<task_payload>>& out) -> launch_status;

    // ------------------------------------------------------------------
    // Completion signal
    // ------------------------------------------------------------------

    [[nodiscard]] auto signal_generation() const -> uint64_t;

    /**
     * @brief Wake every waiter
     */
    void notify();

    /**
     * @brief Block until the signal moves past @p seen or @p deadline passes
     */
    void wait_for_signal(uint64_t seen, clock::time_point deadline);

    // ------------------------------------------------------------------
    // Accessors
    // ------------------------------------------------------------------

    [[nodiscard]] auto config() const -> const worker_pool_config& { return config_; }
    [[nodiscard]] auto metrics() -> task_metrics& { return metrics_; }
    [[nodiscard]] auto metrics() const -> const task_metrics& { return metrics_; }
    [[nodiscard]] auto active_submissions() const -> uint64_t;
    [[nodiscard]] auto snapshot() const -> metrics_snapshot;

    /**
     * @brief Return a job slot taken by try_launch()
     *
     * Called once per launched attempt, when the job finishes or is dropped.
     */
    void release_job_slot();

private:
    auto start_executor(bool warn_if_started) -> result<void>;
    [[nodiscard]] auto current_executor() const
        -> std::shared_ptr<adapters::transfer_executor_interface>;

    const worker_pool_config config_;
    task_metrics metrics_;

    // Executor lifecycle
    mutable std::mutex state_mutex_;
    std::shared_ptr<adapters::transfer_executor_interface> executor_;
    bool shutting_down_ = false;
    bool released_ = false;

    // Admission counters and completion signal
    mutable std::mutex signal_mutex_;
    std::condition_variable signal_cv_;
    uint64_t generation_ = 0;
    std::size_t outstanding_jobs_ = 0;
    uint64_t active_submissions_ = 0;
    std::size_t active_drivers_ = 0;
    bool admission_closed_ = false;
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_POOL_POOL_CONTEXT_H
