// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file pool_context.cpp
 * @brief Executor lifecycle, admission and completion signal of the pool
 */

#include <arbor/transfer/pool/pool_context.h>

#include <arbor/transfer/core/logging.h>

#include <exception>
#include <string>

namespace arbor::transfer {

namespace {

/**
 * @brief State of one attempt held by the executor
 *
 * The promise is always satisfied: by the job when it runs, or by the
 * destructor when the executor drops the job without running it.
 */
struct attempt_slot {
    explicit attempt_slot(std::shared_ptr<pool_context> ctx) : context(std::move(ctx)) {}

    ~attempt_slot() {
        if (!fulfilled) {
            promise.set_value(unexpected(error{error_code::pool_unavailable}));
        }
        context->release_job_slot();
    }

    attempt_slot(const attempt_slot&) = delete;
    attempt_slot& operator=(const attempt_slot&) = delete;

    void run(operation& op) {
        try {
            promise.set_value(op.execute());
        } catch (const std::exception& e) {
            promise.set_value(unexpected(error{error_code::operation_failed, e.what()}));
        } catch (...) {
            promise.set_value(
                unexpected(error{error_code::operation_failed, "unknown exception"}));
        }
        fulfilled = true;
        context->notify();
    }

    std::promise<result<task_payload>> promise;
    bool fulfilled = false;
    std::shared_ptr<pool_context> context;
};

}  // namespace

pool_context::pool_context(worker_pool_config cfg) : config_(std::move(cfg)) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

auto pool_context::start() -> result<void> {
    return start_executor(true);
}

auto pool_context::ensure_started() -> result<void> {
    return start_executor(false);
}

auto pool_context::start_executor(bool warn_if_started) -> result<void> {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (shutting_down_) {
        return unexpected(error{error_code::pool_unavailable});
    }
    if (executor_) {
        if (warn_if_started) {
            ARBOR_LOG_WARN(log_category::pool,
                           "Worker pool '" + config_.pool_name + "' already started");
        }
        return {};
    }

    auto created = adapters::executor_factory::create(config_.max_workers, config_.pool_name);
    if (!created) {
        ARBOR_LOG_ERROR(log_category::pool,
                        "Failed to start worker pool: " + created.error().message);
        return unexpected(created.error());
    }
    executor_ = created.value();

    ARBOR_LOG_INFO(log_category::pool,
                   "Worker pool started with " + std::to_string(config_.max_workers) + " " +
                       to_string(config_.mode) + " workers");
    return {};
}

void pool_context::shutdown(bool wait) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (shutting_down_) {
            return;
        }
        shutting_down_ = true;
    }

    ARBOR_LOG_INFO(log_category::pool,
                   "Shutting down worker pool '" + config_.pool_name + "'" +
                       (wait ? "" : " without waiting"));

    {
        std::unique_lock<std::mutex> lock(signal_mutex_);
        admission_closed_ = true;
        if (wait) {
            signal_cv_.wait(lock, [this] {
                return active_submissions_ == 0 ||
                       (active_drivers_ == 0 && outstanding_jobs_ == 0);
            });
        }
    }

    std::shared_ptr<adapters::transfer_executor_interface> executor;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        executor = std::move(executor_);
        released_ = true;
    }
    if (executor) {
        executor->shutdown(wait);
    }

    // Wake task groups so pending retries observe the released executor
    notify();

    ARBOR_LOG_INFO(log_category::pool, "Worker pool shutdown complete");
}

auto pool_context::is_running() const -> bool {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return executor_ != nullptr && !shutting_down_;
}

auto pool_context::is_shutting_down() const -> bool {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return shutting_down_;
}

auto pool_context::try_begin_submission() -> bool {
    std::lock_guard<std::mutex> lock(signal_mutex_);
    if (admission_closed_) {
        return false;
    }
    ++active_submissions_;
    return true;
}

void pool_context::end_submission() {
    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        if (active_submissions_ > 0) {
            --active_submissions_;
        }
        ++generation_;
    }
    signal_cv_.notify_all();
}

void pool_context::begin_drive() {
    std::lock_guard<std::mutex> lock(signal_mutex_);
    ++active_drivers_;
}

void pool_context::end_drive() {
    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        if (active_drivers_ > 0) {
            --active_drivers_;
        }
        ++generation_;
    }
    signal_cv_.notify_all();
}

auto pool_context::current_executor() const
    -> std::shared_ptr<adapters::transfer_executor_interface> {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (released_) {
        return nullptr;
    }
    return executor_;
}

auto pool_context::try_launch(const std::shared_ptr<operation>& op,
                              std::future<result<task_payload>>& out) -> launch_status {
    auto executor = current_executor();
    if (!executor) {
        return launch_status::unavailable;
    }

    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        if (outstanding_jobs_ >= config_.max_workers + config_.queue_capacity) {
            return launch_status::saturated;
        }
        ++outstanding_jobs_;
    }

    // From here on the slot owns the job slot and returns it on destruction
    auto slot = std::make_shared<attempt_slot>(shared_from_this());
    auto future = slot->promise.get_future();

    auto submitted = executor->submit([slot, op]() { slot->run(*op); });
    if (!submitted) {
        return launch_status::unavailable;
    }

    out = std::move(future);
    return launch_status::launched;
}

void pool_context::release_job_slot() {
    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        if (outstanding_jobs_ > 0) {
            --outstanding_jobs_;
        }
        ++generation_;
    }
    signal_cv_.notify_all();
}

auto pool_context::signal_generation() const -> uint64_t {
    std::lock_guard<std::mutex> lock(signal_mutex_);
    return generation_;
}

void pool_context::notify() {
    {
        std::lock_guard<std::mutex> lock(signal_mutex_);
        ++generation_;
    }
    signal_cv_.notify_all();
}

void pool_context::wait_for_signal(uint64_t seen, clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(signal_mutex_);
    auto changed = [this, seen] { return generation_ != seen; };
    if (deadline == clock::time_point::max()) {
        signal_cv_.wait(lock, changed);
    } else {
        signal_cv_.wait_until(lock, deadline, changed);
    }
}

auto pool_context::active_submissions() const -> uint64_t {
    std::lock_guard<std::mutex> lock(signal_mutex_);
    return active_submissions_;
}

auto pool_context::snapshot() const -> metrics_snapshot {
    return metrics_.snapshot(active_submissions(), config_.max_workers, config_.mode);
}

}  // namespace arbor::transfer
