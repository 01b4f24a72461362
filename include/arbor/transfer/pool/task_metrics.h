// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_metrics.h
 * @brief Counters kept by the worker pool and their snapshot
 */

#ifndef ARBOR_TRANSFER_POOL_TASK_METRICS_H
#define ARBOR_TRANSFER_POOL_TASK_METRICS_H

#include <arbor/transfer/pool/worker_pool_config.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace arbor::transfer {

/**
 * @brief Point-in-time view of the pool metrics
 */
struct metrics_snapshot {
    uint64_t total_tasks = 0;
    uint64_t completed_tasks = 0;
    uint64_t failed_tasks = 0;

    /// Accepted tasks that have not reached a final outcome yet
    uint64_t active_tasks = 0;

    /// Percentage of completed tasks (0..100), 0 when nothing was submitted
    double success_rate = 0.0;

    /// total_bytes_processed / elapsed_time, 0 when no time has elapsed
    double throughput_bytes_per_sec = 0.0;

    uint64_t total_bytes_processed = 0;

    /// Seconds since the pool was created
    double elapsed_time = 0.0;

    std::size_t max_workers = 0;
    execution_mode mode = execution_mode::thread;

    /**
     * @brief Serialize as a flat JSON object
     */
    [[nodiscard]] auto to_json() const -> std::string;
};

/**
 * @brief Thread-safe pool counters
 *
 * Counters only grow. completed + failed never exceeds total.
 */
class task_metrics {
public:
    using clock = std::chrono::steady_clock;

    task_metrics() : start_time_(clock::now()) {}

    void record_submitted() { total_tasks_.fetch_add(1, std::memory_order_relaxed); }
    void record_completed() { completed_tasks_.fetch_add(1, std::memory_order_relaxed); }
    void record_failed() { failed_tasks_.fetch_add(1, std::memory_order_relaxed); }

    void record_bytes(uint64_t bytes) {
        total_bytes_processed_.fetch_add(bytes, std::memory_order_relaxed);
    }

    [[nodiscard]] auto total_tasks() const -> uint64_t {
        return total_tasks_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] auto completed_tasks() const -> uint64_t {
        return completed_tasks_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] auto failed_tasks() const -> uint64_t {
        return failed_tasks_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] auto total_bytes_processed() const -> uint64_t {
        return total_bytes_processed_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto start_time() const -> clock::time_point { return start_time_; }

    [[nodiscard]] auto success_rate() const -> double;
    [[nodiscard]] auto elapsed_time() const -> std::chrono::duration<double>;
    [[nodiscard]] auto throughput() const -> double;

    /**
     * @brief Build a snapshot tagged with pool configuration values
     */
    [[nodiscard]] auto snapshot(uint64_t active_tasks, std::size_t max_workers,
                                execution_mode mode) const -> metrics_snapshot;

private:
    std::atomic<uint64_t> total_tasks_{0};
    std::atomic<uint64_t> completed_tasks_{0};
    std::atomic<uint64_t> failed_tasks_{0};
    std::atomic<uint64_t> total_bytes_processed_{0};
    clock::time_point start_time_;
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_POOL_TASK_METRICS_H
