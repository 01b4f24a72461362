// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Executor adapter behind the worker pool
 *
 * The worker pool never owns threads directly. It hands attempt jobs to a
 * transfer_executor_interface, which is backed by thread_system when it is
 * available and by a fixed-size standalone executor otherwise.
 *
 * Both implementations run at most worker_count() jobs at a time and keep
 * the rest queued in FIFO order.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "../config/feature_flags.h"
#include "../core/types.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace arbor::transfer::adapters {

/**
 * @brief Interface for the executor that runs worker pool jobs
 *
 * A job handed to submit() is either run exactly once or destroyed without
 * being run (when the executor shuts down without waiting). Callers rely on
 * the destructor of the job's captures to observe the latter.
 */
class transfer_executor_interface {
public:
    virtual ~transfer_executor_interface() = default;

    /**
     * @brief Queue a job for execution
     * @param job The job to run
     * @return Success, or pool_unavailable once the executor is shut down
     */
    virtual auto submit(std::function<void()> job) -> result<void> = 0;

    /**
     * @brief Stop accepting jobs and release the workers
     * @param wait true to run every queued job first, false to drop them
     *
     * With wait == false running jobs are not interrupted, but the call does
     * not block on them either.
     */
    virtual void shutdown(bool wait) = 0;

    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;
    [[nodiscard]] virtual auto is_running() const -> bool = 0;

    /**
     * @brief Number of queued jobs that have not started yet
     */
    [[nodiscard]] virtual auto pending_tasks() const -> std::size_t = 0;

    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Executor backed by thread_system's thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_executor : public transfer_executor_interface {
public:
    thread_system_executor(std::shared_ptr<kcenon::thread::thread_pool> pool,
                           std::string pool_name, std::size_t worker_count);
    ~thread_system_executor() override;

    thread_system_executor(const thread_system_executor&) = delete;
    thread_system_executor& operator=(const thread_system_executor&) = delete;

    /**
     * @brief Create a started thread_pool with @p worker_count workers
     */
    [[nodiscard]] static auto create(std::size_t worker_count, const std::string& pool_name)
        -> result<std::shared_ptr<thread_system_executor>>;

    auto submit(std::function<void()> job) -> result<void> override;
    void shutdown(bool wait) override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    [[nodiscard]] auto name() const -> std::string override;

    [[nodiscard]] auto underlying_pool() const -> std::shared_ptr<kcenon::thread::thread_pool>;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fixed-size executor on plain std::thread workers
 *
 * Used when thread_system is not available. Workers share the queue state
 * through a shared pointer, so shutdown(false) can detach workers that are
 * still busy with a long job.
 */
class standalone_executor : public transfer_executor_interface {
public:
    standalone_executor(std::size_t worker_count, std::string pool_name);
    ~standalone_executor() override;

    standalone_executor(const standalone_executor&) = delete;
    standalone_executor& operator=(const standalone_executor&) = delete;

    auto submit(std::function<void()> job) -> result<void> override;
    void shutdown(bool wait) override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto is_running() const -> bool override;
    [[nodiscard]] auto pending_tasks() const -> std::size_t override;
    [[nodiscard]] auto name() const -> std::string override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Selects the executor implementation
 *
 * 1. thread_system_executor (when KCENON_WITH_THREAD_SYSTEM)
 * 2. standalone_executor (fallback)
 */
class executor_factory {
public:
    /**
     * @brief Create and start an executor
     * @param worker_count Number of workers (0 = hardware concurrency)
     * @param pool_name Name for identification in logs
     */
    [[nodiscard]] static auto create(std::size_t worker_count, const std::string& pool_name)
        -> result<std::shared_ptr<transfer_executor_interface>>;

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace arbor::transfer::adapters
