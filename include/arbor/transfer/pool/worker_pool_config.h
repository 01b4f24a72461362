// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool_config.h
 * @brief Configuration of the bounded worker pool
 */

#ifndef ARBOR_TRANSFER_POOL_WORKER_POOL_CONFIG_H
#define ARBOR_TRANSFER_POOL_WORKER_POOL_CONFIG_H

#include <arbor/transfer/core/types.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

namespace arbor::transfer {

/**
 * @brief Flavor of workers backing the pool
 *
 * Both modes execute on the executor's worker threads. The mode is kept
 * for reporting and for picking a sizing preset.
 */
enum class execution_mode {
    thread,   ///< I/O-bound work
    process,  ///< CPU-bound work
};

[[nodiscard]] constexpr auto to_string(execution_mode mode) -> const char* {
    switch (mode) {
        case execution_mode::thread:
            return "thread";
        case execution_mode::process:
            return "process";
        default:
            return "unknown";
    }
}

/**
 * @brief Worker pool configuration
 *
 * Defaults:
 * - max_workers: 16
 * - task_timeout: 300 seconds
 * - retry_attempts: 3 (total attempts per task, including the first)
 * - retry_backoff_base: 1 second (attempt k failing waits base * k)
 * - queue_capacity: 1000
 */
struct worker_pool_config {
    /// Maximum number of attempts executing at the same time
    std::size_t max_workers = 16;

    /// Worker flavor
    execution_mode mode = execution_mode::thread;

    /// Per-attempt timeout; std::nullopt disables it
    std::optional<std::chrono::milliseconds> task_timeout = std::chrono::seconds(300);

    /// Total attempts per task; values below one behave as one
    uint32_t retry_attempts = 3;

    /// Base delay of the linear backoff between attempts
    std::chrono::milliseconds retry_backoff_base{1000};

    /// Jobs allowed to wait behind the running ones
    std::size_t queue_capacity = 1000;

    /// Name used for the executor and in log messages
    std::string pool_name = "arbor_worker_pool";

    /**
     * @brief Attempts a task receives before it is reported as failed
     */
    [[nodiscard]] auto total_attempts() const -> uint32_t {
        return std::max<uint32_t>(retry_attempts, 1);
    }

    /**
     * @brief Backoff before the attempt that follows failed attempt @p attempt
     * @param attempt 1-based index of the attempt that just failed
     */
    [[nodiscard]] auto backoff_after(uint32_t attempt) const -> std::chrono::milliseconds {
        return retry_backoff_base * static_cast<std::chrono::milliseconds::rep>(attempt);
    }

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_workers == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "max_workers must be positive"});
        }
        if (queue_capacity == 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "queue_capacity must be positive"});
        }
        if (task_timeout && task_timeout->count() <= 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "task_timeout must be positive when set"});
        }
        if (retry_backoff_base.count() < 0) {
            return unexpected(error{error_code::invalid_configuration,
                                    "retry_backoff_base must not be negative"});
        }
        return {};
    }

    /**
     * @brief Preset for file I/O: many threads, generous timeout
     */
    [[nodiscard]] static auto io_bound(std::size_t workers = 32) -> worker_pool_config {
        worker_pool_config config;
        config.max_workers = workers;
        config.mode = execution_mode::thread;
        config.task_timeout = std::chrono::seconds(600);
        return config;
    }

    /**
     * @brief Preset for hashing and other CPU work: one worker per core
     */
    [[nodiscard]] static auto cpu_bound() -> worker_pool_config {
        worker_pool_config config;
        auto hw = std::thread::hardware_concurrency();
        config.max_workers = hw > 0 ? hw : 4;
        config.mode = execution_mode::process;
        config.task_timeout = std::chrono::seconds(300);
        return config;
    }
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_POOL_WORKER_POOL_CONFIG_H
