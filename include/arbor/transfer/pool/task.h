// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file task.h
 * @brief Unit of work submitted to the worker pool and its outcome
 */

#ifndef ARBOR_TRANSFER_POOL_TASK_H
#define ARBOR_TRANSFER_POOL_TASK_H

#include <arbor/transfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>

namespace arbor::transfer {

/**
 * @brief Value produced by a successful operation
 *
 * - std::monostate: no value
 * - file_chunk: bytes read from a file (optionally hashed)
 * - std::string: a digest
 * - uint64_t: a byte count
 */
using task_payload = std::variant<std::monostate, file_chunk, std::string, uint64_t>;

/**
 * @brief Work executed by a pool worker
 *
 * execute() may be invoked more than once for the same task when the pool
 * retries, so it must be safe to repeat. It may run on any worker thread.
 * Exceptions escaping execute() are reported as operation_failed.
 */
class operation {
public:
    virtual ~operation() = default;

    /// Short name of the operation kind, used in logs
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    [[nodiscard]] virtual auto execute() -> result<task_payload> = 0;
};

/**
 * @brief A submitted unit of work
 *
 * The id is only used for logging and results; the pool does not require
 * ids to be unique.
 */
struct task {
    std::string id;
    std::shared_ptr<operation> op;
};

/**
 * @brief Outcome of one task after all of its attempts
 *
 * Exactly one of (success with result) or (failure with error) holds.
 */
struct task_result {
    std::string task_id;
    bool success = false;
    task_payload result;
    std::string error;
    error_code code = error_code::success;

    /// Wall time from submission to the final outcome
    std::chrono::duration<double> duration{0.0};

    /// Attempts made beyond the first
    uint32_t retries = 0;

    /**
     * @brief Access the payload as @p T
     * @return Pointer to the payload, or nullptr if it holds another type
     */
    template <typename T>
    [[nodiscard]] auto payload_as() -> T* {
        return std::get_if<T>(&result);
    }

    template <typename T>
    [[nodiscard]] auto payload_as() const -> const T* {
        return std::get_if<T>(&result);
    }
};

/**
 * @brief Called once per finished task, in completion order
 */
using task_completion_callback = std::function<void(const task_result&)>;

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_POOL_TASK_H
