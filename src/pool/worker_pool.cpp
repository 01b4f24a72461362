// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool.cpp
 * @brief Implementation of the worker pool facade
 */

#include <arbor/transfer/pool/worker_pool.h>

#include <arbor/transfer/core/logging.h>
#include <arbor/transfer/pool/pool_context.h>

namespace arbor::transfer {

// builder implementation
auto worker_pool::builder::with_max_workers(std::size_t count) -> builder& {
    config_.max_workers = count;
    return *this;
}

auto worker_pool::builder::with_execution_mode(execution_mode mode) -> builder& {
    config_.mode = mode;
    return *this;
}

auto worker_pool::builder::with_task_timeout(std::optional<std::chrono::milliseconds> timeout)
    -> builder& {
    config_.task_timeout = timeout;
    return *this;
}

auto worker_pool::builder::with_retry_attempts(uint32_t attempts) -> builder& {
    config_.retry_attempts = attempts;
    return *this;
}

auto worker_pool::builder::with_retry_backoff(std::chrono::milliseconds base) -> builder& {
    config_.retry_backoff_base = base;
    return *this;
}

auto worker_pool::builder::with_queue_capacity(std::size_t capacity) -> builder& {
    config_.queue_capacity = capacity;
    return *this;
}

auto worker_pool::builder::with_name(std::string name) -> builder& {
    config_.pool_name = std::move(name);
    return *this;
}

auto worker_pool::builder::with_config(worker_pool_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto worker_pool::builder::build() -> result<worker_pool> {
    return worker_pool::create(config_);
}

// worker_pool implementation
auto worker_pool::create(const worker_pool_config& config) -> result<worker_pool> {
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }
    return worker_pool(std::make_shared<pool_context>(config));
}

worker_pool::worker_pool(std::shared_ptr<pool_context> context) : context_(std::move(context)) {}

worker_pool::worker_pool(worker_pool&&) noexcept = default;

auto worker_pool::operator=(worker_pool&& other) noexcept -> worker_pool& {
    if (this != &other) {
        if (context_) {
            context_->shutdown(true);
        }
        context_ = std::move(other.context_);
    }
    return *this;
}

worker_pool::~worker_pool() {
    if (context_) {
        context_->shutdown(true);
    }
}

auto worker_pool::start() -> result<void> {
    return context_->start();
}

auto worker_pool::submit(task t) -> task_result {
    auto group = create_group();
    auto ticket = group.add(std::move(t));
    return group.wait(ticket);
}

auto worker_pool::submit(std::string task_id, std::shared_ptr<operation> op) -> task_result {
    return submit(task{std::move(task_id), std::move(op)});
}

auto worker_pool::submit_batch(std::vector<task> tasks, task_completion_callback on_complete)
    -> std::vector<task_result> {
    if (tasks.empty()) {
        return {};
    }

    const auto count = tasks.size();
    ARBOR_LOG_INFO(log_category::batch, "Submitting batch of " + std::to_string(count) + " tasks");

    auto group = create_group(std::move(on_complete));
    for (auto& t : tasks) {
        (void)group.add(std::move(t));
    }
    auto results = group.wait_all();

    std::size_t successful = 0;
    for (const auto& r : results) {
        if (r.success) {
            ++successful;
        }
    }
    ARBOR_LOG_INFO(log_category::batch, "Batch completed: " + std::to_string(successful) + "/" +
                                            std::to_string(count) + " successful");
    return results;
}

auto worker_pool::create_group(task_completion_callback on_complete) -> task_group {
    return task_group(context_, std::move(on_complete));
}

void worker_pool::shutdown(bool wait) {
    context_->shutdown(wait);
}

void worker_pool::record_bytes_processed(uint64_t bytes) {
    context_->metrics().record_bytes(bytes);
}

auto worker_pool::get_metrics() const -> metrics_snapshot {
    return context_->snapshot();
}

auto worker_pool::config() const -> const worker_pool_config& {
    return context_->config();
}

auto worker_pool::is_running() const -> bool {
    return context_->is_running();
}

auto worker_pool::is_shutting_down() const -> bool {
    return context_->is_shutting_down();
}

}  // namespace arbor::transfer
