// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Executor adapter implementation
 */

#include "arbor/transfer/adapters/thread_pool_adapter.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace arbor::transfer::adapters {

namespace {

auto resolve_worker_count(std::size_t requested) -> std::size_t {
    if (requested > 0) {
        return requested;
    }
    auto hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 4;
}

}  // namespace

// ============================================================================
// thread_system_executor implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "transfer_attempt")
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

struct thread_system_executor::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    std::size_t worker_count{0};
    std::atomic<bool> running{true};
};

thread_system_executor::thread_system_executor(
    std::shared_ptr<kcenon::thread::thread_pool> pool, std::string pool_name,
    std::size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = std::move(pool_name);
    pimpl_->worker_count = worker_count;
}

thread_system_executor::~thread_system_executor() {
    if (pimpl_ && pimpl_->running.load()) {
        shutdown(true);
    }
}

auto thread_system_executor::create(std::size_t worker_count, const std::string& pool_name)
    -> result<std::shared_ptr<thread_system_executor>> {
    worker_count = resolve_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (std::size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    auto started = pool->start();
    if (started.is_err()) {
        return unexpected(error{error_code::internal_error,
                                "failed to start thread pool '" + pool_name + "'"});
    }

    return std::make_shared<thread_system_executor>(std::move(pool), pool_name, worker_count);
}

auto thread_system_executor::submit(std::function<void()> job) -> result<void> {
    if (!pimpl_->running.load()) {
        return unexpected(error{error_code::pool_unavailable});
    }

    auto wrapped = std::make_unique<function_job>(std::move(job));
    auto enqueue_result = pimpl_->pool->enqueue(std::move(wrapped));
    if (!enqueue_result.is_ok()) {
        return unexpected(error{error_code::pool_unavailable,
                                "failed to enqueue job on '" + pimpl_->pool_name + "'"});
    }
    return {};
}

void thread_system_executor::shutdown(bool wait) {
    if (!pimpl_->running.exchange(false)) {
        return;
    }

    if (!wait) {
        // Dropping queued jobs releases whatever they captured
        auto queue = pimpl_->pool->get_job_queue();
        if (queue) {
            queue->stop();
            queue->clear();
        }
    }
    pimpl_->pool->stop(!wait);
}

auto thread_system_executor::worker_count() const -> std::size_t {
    return pimpl_->worker_count;
}

auto thread_system_executor::is_running() const -> bool {
    return pimpl_->running.load();
}

auto thread_system_executor::pending_tasks() const -> std::size_t {
    auto queue = pimpl_->pool->get_job_queue();
    return queue ? queue->size() : 0;
}

auto thread_system_executor::name() const -> std::string {
    return pimpl_->pool_name;
}

auto thread_system_executor::underlying_pool() const
    -> std::shared_ptr<kcenon::thread::thread_pool> {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// standalone_executor implementation
// ============================================================================

namespace {

/**
 * @brief Queue shared between the executor and its worker threads
 */
struct job_queue_state {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::function<void()>> jobs;
    bool stopping = false;

    void worker_loop() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this] { return stopping || !jobs.empty(); });
                if (stopping && jobs.empty()) {
                    return;
                }
                job = std::move(jobs.front());
                jobs.pop_front();
            }
            job();
        }
    }
};

}  // namespace

struct standalone_executor::impl {
    std::shared_ptr<job_queue_state> state = std::make_shared<job_queue_state>();
    std::vector<std::thread> workers;
    std::string pool_name;
    std::size_t worker_count{0};
    std::atomic<bool> running{true};
};

standalone_executor::standalone_executor(std::size_t worker_count, std::string pool_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool_name = std::move(pool_name);
    worker_count = resolve_worker_count(worker_count);
    pimpl_->worker_count = worker_count;
    pimpl_->workers.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        // Workers own a reference to the queue so they may outlive the executor
        auto state = pimpl_->state;
        pimpl_->workers.emplace_back([state] { state->worker_loop(); });
    }
}

standalone_executor::~standalone_executor() {
    if (pimpl_) {
        shutdown(true);
    }
}

auto standalone_executor::submit(std::function<void()> job) -> result<void> {
    {
        std::lock_guard<std::mutex> lock(pimpl_->state->mutex);
        if (pimpl_->state->stopping) {
            return unexpected(error{error_code::pool_unavailable});
        }
        pimpl_->state->jobs.push_back(std::move(job));
    }
    pimpl_->state->cv.notify_one();
    return {};
}

void standalone_executor::shutdown(bool wait) {
    if (!pimpl_->running.exchange(false)) {
        return;
    }

    std::deque<std::function<void()>> dropped;
    {
        std::lock_guard<std::mutex> lock(pimpl_->state->mutex);
        pimpl_->state->stopping = true;
        if (!wait) {
            dropped.swap(pimpl_->state->jobs);
        }
    }
    pimpl_->state->cv.notify_all();

    // Destroy dropped jobs outside the lock; their captures may call back in
    dropped.clear();

    const auto self = std::this_thread::get_id();
    for (auto& worker : pimpl_->workers) {
        if (!worker.joinable()) {
            continue;
        }
        if (wait && worker.get_id() != self) {
            worker.join();
        } else {
            worker.detach();
        }
    }
    pimpl_->workers.clear();
}

auto standalone_executor::worker_count() const -> std::size_t {
    return pimpl_->worker_count;
}

auto standalone_executor::is_running() const -> bool {
    return pimpl_->running.load();
}

auto standalone_executor::pending_tasks() const -> std::size_t {
    std::lock_guard<std::mutex> lock(pimpl_->state->mutex);
    return pimpl_->state->jobs.size();
}

auto standalone_executor::name() const -> std::string {
    return pimpl_->pool_name;
}

// ============================================================================
// executor_factory implementation
// ============================================================================

auto executor_factory::create(std::size_t worker_count, const std::string& pool_name)
    -> result<std::shared_ptr<transfer_executor_interface>> {
#if KCENON_WITH_THREAD_SYSTEM
    auto created = thread_system_executor::create(worker_count, pool_name);
    if (!created) {
        return unexpected(created.error());
    }
    return std::shared_ptr<transfer_executor_interface>(created.value());
#else
    return std::shared_ptr<transfer_executor_interface>(
        std::make_shared<standalone_executor>(worker_count, pool_name));
#endif
}

}  // namespace arbor::transfer::adapters
