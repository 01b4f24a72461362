// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task_group.cpp
 * @brief Attempt scheduling, timeouts and retries for a group of tasks
 */

#include <arbor/transfer/pool/task_group.h>

#include <arbor/transfer/core/logging.h>
#include <arbor/transfer/pool/pool_context.h>

#include <algorithm>
#include <future>
#include <sstream>

namespace arbor::transfer {

namespace {

using clock = std::chrono::steady_clock;

auto format_seconds(std::chrono::milliseconds value) -> std::string {
    std::ostringstream oss;
    oss << static_cast<double>(value.count()) / 1000.0;
    return oss.str();
}

/**
 * @brief Marks the calling thread as driving a group for its lifetime
 */
class drive_scope {
public:
    explicit drive_scope(pool_context& context) : context_(context) { context_.begin_drive(); }
    ~drive_scope() { context_.end_drive(); }

    drive_scope(const drive_scope&) = delete;
    drive_scope& operator=(const drive_scope&) = delete;

private:
    pool_context& context_;
};

auto make_failure(const error& err, uint32_t retries) -> task_result {
    task_result outcome;
    outcome.success = false;
    outcome.error = err.message;
    outcome.code = err.code;
    outcome.retries = retries;
    return outcome;
}

}  // namespace

struct task_group::entry {
    enum class phase {
        pending_launch,  ///< waiting for a free job slot
        running,         ///< attempt handed to the executor
        backing_off,     ///< waiting for the retry time
        finished,
    };

    task work;
    phase state = phase::pending_launch;

    /// 1-based number of the current attempt
    uint32_t attempt = 1;

    clock::time_point submitted_at;
    clock::time_point deadline = clock::time_point::max();
    clock::time_point retry_at;
    std::future<result<task_payload>> future;

    task_result outcome;
};

task_group::task_group(std::shared_ptr<pool_context> context,
                       task_completion_callback on_complete)
    : context_(std::move(context)), on_complete_(std::move(on_complete)) {}

task_group::~task_group() {
    if (context_ && unfinished_ > 0) {
        on_complete_ = nullptr;
        cancel();
    }
}

task_group::task_group(task_group&&) noexcept = default;

auto task_group::operator=(task_group&& other) noexcept -> task_group& {
    if (this != &other) {
        if (context_ && unfinished_ > 0) {
            on_complete_ = nullptr;
            cancel();
        }
        context_ = std::move(other.context_);
        on_complete_ = std::move(other.on_complete_);
        entries_ = std::move(other.entries_);
        live_ = std::move(other.live_);
        next_ticket_ = other.next_ticket_;
        unfinished_ = other.unfinished_;
        next_wake_ = other.next_wake_;
        other.unfinished_ = 0;
    }
    return *this;
}

template <typename Predicate>
void task_group::drive_until(Predicate done) {
    if (done()) {
        return;
    }
    drive_scope scope(*context_);
    while (!done()) {
        // Read the generation before scanning so no completion is missed
        auto seen = context_->signal_generation();
        poll();
        if (done()) {
            return;
        }
        context_->wait_for_signal(seen, next_wake_);
    }
}

auto task_group::add(task t) -> ticket {
    auto id = next_ticket_++;
    auto& e = *entries_.emplace(id, std::make_unique<entry>()).first->second;
    e.work = std::move(t);
    e.submitted_at = clock::now();
    ++unfinished_;

    if (!e.work.op) {
        finish(e, make_failure(error{error_code::invalid_task, "task has no operation"}, 0),
               false);
        return id;
    }

    if (!context_->try_begin_submission()) {
        finish(e, make_failure(error{error_code::pool_unavailable}, 0), false);
        return id;
    }

    if (auto started = context_->ensure_started(); !started) {
        context_->end_submission();
        finish(e, make_failure(started.error(), 0), false);
        return id;
    }

    context_->metrics().record_submitted();
    next_wake_ = clock::time_point::max();
    launch(e);
    if (e.state != entry::phase::finished) {
        live_.push_back(id);
    }
    return id;
}

auto task_group::wait(ticket id) -> task_result {
    if (id >= next_ticket_) {
        return make_failure(error{error_code::invalid_task, "unknown ticket"}, 0);
    }

    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return make_failure(error{error_code::invalid_task, "result already collected"}, 0);
    }

    auto& e = *it->second;
    drive_until([&e] { return e.state == entry::phase::finished; });

    auto outcome = std::move(e.outcome);
    entries_.erase(id);
    return outcome;
}

auto task_group::wait_all() -> std::vector<task_result> {
    drive_until([this] { return unfinished_ == 0; });

    std::vector<task_result> results;
    results.reserve(entries_.size());
    for (auto& item : entries_) {
        results.push_back(std::move(item.second->outcome));
    }
    entries_.clear();
    live_.clear();
    return results;
}

void task_group::cancel() {
    // Indexed loops: a completion callback may add tasks to the group
    for (std::size_t i = 0; i < live_.size(); ++i) {
        auto it = entries_.find(live_[i]);
        if (it == entries_.end() || it->second->state == entry::phase::finished) {
            continue;
        }
        auto& e = *it->second;
        // Abandon the attempt; a late completion lands in an orphaned promise
        e.future = {};
        finish(e, make_failure(error{error_code::task_cancelled}, e.attempt - 1), true);
    }
    live_.clear();
}

void task_group::poll() {
    next_wake_ = clock::time_point::max();
    for (std::size_t i = 0; i < live_.size(); ++i) {
        auto it = entries_.find(live_[i]);
        if (it != entries_.end() && it->second->state != entry::phase::finished) {
            advance(*it->second);
        }
    }
    prune_live();
}

void task_group::prune_live() {
    live_.erase(std::remove_if(live_.begin(), live_.end(),
                               [this](ticket id) {
                                   auto it = entries_.find(id);
                                   return it == entries_.end() ||
                                          it->second->state == entry::phase::finished;
                               }),
                live_.end());
}

auto task_group::is_finished(ticket id) const -> bool {
    if (id >= next_ticket_) {
        return false;
    }
    auto it = entries_.find(id);
    return it == entries_.end() || it->second->state == entry::phase::finished;
}

auto task_group::size() const -> std::size_t {
    return next_ticket_;
}

auto task_group::unfinished() const -> std::size_t {
    return unfinished_;
}

void task_group::record_bytes_processed(uint64_t bytes) {
    context_->metrics().record_bytes(bytes);
}

void task_group::advance(entry& e) {
    auto now = clock::now();

    switch (e.state) {
        case entry::phase::finished:
            return;

        case entry::phase::backing_off:
            if (now < e.retry_at) {
                next_wake_ = std::min(next_wake_, e.retry_at);
                return;
            }
            launch(e);
            return;

        case entry::phase::pending_launch:
            launch(e);
            return;

        case entry::phase::running:
            if (e.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                auto outcome = e.future.get();
                if (outcome) {
                    task_result done;
                    done.success = true;
                    done.result = std::move(outcome.value());
                    done.retries = e.attempt - 1;
                    finish(e, std::move(done), true);
                } else {
                    attempt_failed(e, outcome.error());
                }
                return;
            }
            if (now >= e.deadline) {
                e.future = {};
                attempt_failed(
                    e, error{error_code::task_timeout,
                             "task timeout after " +
                                 format_seconds(*context_->config().task_timeout) + "s"});
                return;
            }
            next_wake_ = std::min(next_wake_, e.deadline);
            return;
    }
}

void task_group::launch(entry& e) {
    std::future<result<task_payload>> future;
    switch (context_->try_launch(e.work.op, future)) {
        case launch_status::launched: {
            e.future = std::move(future);
            e.state = entry::phase::running;
            const auto& timeout = context_->config().task_timeout;
            e.deadline = timeout ? clock::now() + *timeout : clock::time_point::max();
            next_wake_ = std::min(next_wake_, e.deadline);
            return;
        }
        case launch_status::saturated:
            e.state = entry::phase::pending_launch;
            return;
        case launch_status::unavailable:
            finish(e, make_failure(error{error_code::pool_unavailable}, e.attempt - 1), true);
            return;
    }
}

void task_group::attempt_failed(entry& e, error err) {
    const auto& config = context_->config();

    task_log_context ctx;
    ctx.task_id = e.work.id;
    ctx.attempt = e.attempt;
    ctx.error_message = err.message;

    if (e.attempt < config.total_attempts()) {
        auto delay = config.backoff_after(e.attempt);
        ARBOR_LOG_WARN_CTX(log_category::pool,
                           "Task " + e.work.id + " attempt " + std::to_string(e.attempt) +
                               " failed, retrying in " + std::to_string(delay.count()) + "ms",
                           ctx);
        ++e.attempt;
        e.retry_at = clock::now() + delay;
        e.state = entry::phase::backing_off;
        next_wake_ = std::min(next_wake_, e.retry_at);
        return;
    }

    ARBOR_LOG_ERROR_CTX(log_category::pool,
                        "Task " + e.work.id + " failed after " + std::to_string(e.attempt) +
                            " attempts",
                        ctx);
    finish(e, make_failure(err, e.attempt - 1), true);
}

void task_group::finish(entry& e, task_result outcome, bool counted) {
    outcome.task_id = e.work.id;
    outcome.duration = std::chrono::duration<double>(clock::now() - e.submitted_at);

    if (counted) {
        if (outcome.success) {
            context_->metrics().record_completed();
        } else {
            context_->metrics().record_failed();
        }
    }

    e.outcome = std::move(outcome);
    e.state = entry::phase::finished;
    e.future = {};
    --unfinished_;

    if (counted) {
        context_->end_submission();
    }

    if (on_complete_) {
        on_complete_(e.outcome);
    }
}

}  // namespace arbor::transfer
