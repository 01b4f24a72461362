// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_group.h
 * @brief Set of tasks submitted together and collected by ticket
 *
 * A task_group is driven by the thread that owns it. While that thread
 * waits on a ticket it also advances every other task of the group:
 * it notices finished attempts, enforces per-attempt timeouts and launches
 * retries once their backoff has elapsed. Attempts themselves run on the
 * pool's workers.
 *
 * @code
 * auto group = pool.create_group();
 * auto first = group.add({"a", op_a});
 * auto second = group.add({"b", op_b});
 * auto a = group.wait(first);
 * auto rest = group.wait_all();
 * @endcode
 */

#ifndef ARBOR_TRANSFER_POOL_TASK_GROUP_H
#define ARBOR_TRANSFER_POOL_TASK_GROUP_H

#include <arbor/transfer/pool/task.h>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <vector>

namespace arbor::transfer {

class pool_context;
class worker_pool;

/**
 * @brief Tasks sharing a driver and a completion callback
 *
 * Not thread-safe: add(), wait() and wait_all() must be called from one
 * thread at a time. Different groups may be driven concurrently.
 */
class task_group {
public:
    using ticket = std::size_t;

    ~task_group();

    task_group(task_group&&) noexcept;
    auto operator=(task_group&&) noexcept -> task_group&;

    task_group(const task_group&) = delete;
    auto operator=(const task_group&) -> task_group& = delete;

    /**
     * @brief Submit a task
     * @return Ticket identifying the task within this group
     *
     * The first attempt is launched immediately when a job slot is free.
     * A task added after the pool started shutting down finishes at once
     * with error "pool shutting down" and is not counted in the metrics.
     */
    auto add(task t) -> ticket;

    /**
     * @brief Block until the task behind @p id reaches its final outcome
     *
     * Each ticket can be collected once; collecting it again yields an
     * invalid_task failure. Collected tasks are released from the group.
     */
    [[nodiscard]] auto wait(ticket id) -> task_result;

    /**
     * @brief Block until every task finished
     * @return Uncollected results in the order the tasks were added
     */
    [[nodiscard]] auto wait_all() -> std::vector<task_result>;

    /**
     * @brief Finish every unfinished task as cancelled
     *
     * Attempts already handed to workers keep running; their outcome is
     * discarded.
     */
    void cancel();

    /**
     * @brief Advance the group without blocking
     */
    void poll();

    [[nodiscard]] auto is_finished(ticket id) const -> bool;

    /// Tasks added so far
    [[nodiscard]] auto size() const -> std::size_t;

    /// Tasks that have not reached a final outcome
    [[nodiscard]] auto unfinished() const -> std::size_t;

    /**
     * @brief Add @p bytes to the owning pool's byte counter
     */
    void record_bytes_processed(uint64_t bytes);

private:
    friend class worker_pool;

    task_group(std::shared_ptr<pool_context> context, task_completion_callback on_complete);

    struct entry;

    template <typename Predicate>
    void drive_until(Predicate done);

    void advance(entry& e);
    void launch(entry& e);
    void attempt_failed(entry& e, error err);
    void finish(entry& e, task_result outcome, bool counted);
    void prune_live();

    std::shared_ptr<pool_context> context_;
    task_completion_callback on_complete_;

    // Uncollected tasks by ticket
    std::map<ticket, std::unique_ptr<entry>> entries_;

    // Unfinished tickets in the order they were added
    std::vector<ticket> live_;

    ticket next_ticket_ = 0;
    std::size_t unfinished_ = 0;

    // Earliest deadline or retry time seen by the current scan
    std::chrono::steady_clock::time_point next_wake_;
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_POOL_TASK_GROUP_H
