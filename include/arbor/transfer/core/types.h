// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file types.h
 * @brief Core type definitions for arbor_transfer
 */

#ifndef ARBOR_TRANSFER_CORE_TYPES_H
#define ARBOR_TRANSFER_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arbor::transfer {

/**
 * @brief Error codes for transfer engine operations
 */
enum class error_code {
    success = 0,

    // Worker pool errors (-100 to -119)
    task_timeout = -100,
    operation_failed = -101,
    pool_unavailable = -102,
    invalid_task = -103,
    task_cancelled = -104,

    // File errors (-120 to -139)
    file_not_found = -120,
    file_access_denied = -121,
    file_read_error = -122,
    file_write_error = -123,
    invalid_file_path = -124,
    file_too_large = -125,
    extension_not_allowed = -126,
    size_mismatch = -127,

    // Chunk and integrity errors (-140 to -159)
    checksum_mismatch = -140,
    invalid_chunk_size = -141,
    invalid_chunk_index = -142,
    stream_failure = -143,

    // Session errors (-160 to -179)
    session_not_found = -160,
    session_not_active = -161,
    invalid_state_transition = -162,
    session_already_exists = -163,

    // Configuration errors (-180 to -199)
    invalid_configuration = -180,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::task_timeout:
            return "task timeout";
        case error_code::operation_failed:
            return "operation failed";
        case error_code::pool_unavailable:
            return "pool shutting down";
        case error_code::invalid_task:
            return "invalid task";
        case error_code::task_cancelled:
            return "task cancelled";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::invalid_file_path:
            return "invalid file path";
        case error_code::file_too_large:
            return "file too large";
        case error_code::extension_not_allowed:
            return "file extension not allowed";
        case error_code::size_mismatch:
            return "size mismatch";
        case error_code::checksum_mismatch:
            return "checksum mismatch";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_chunk_index:
            return "invalid chunk index";
        case error_code::stream_failure:
            return "stream failure";
        case error_code::session_not_found:
            return "session not found";
        case error_code::session_not_active:
            return "session not active";
        case error_code::invalid_state_transition:
            return "invalid state transition";
        case error_code::session_already_exists:
            return "session already exists";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Contiguous byte range of a file addressed by index
 *
 * offset = index * chunk_size. The final chunk of a file may be shorter
 * than chunk_size. hash is only filled on the upload path.
 */
struct file_chunk {
    uint64_t index;
    uint64_t offset;
    std::vector<std::byte> data;
    std::string hash;

    file_chunk() : index(0), offset(0) {}
    file_chunk(uint64_t idx, uint64_t off, std::vector<std::byte> bytes)
        : index(idx), offset(off), data(std::move(bytes)) {}

    [[nodiscard]] auto size() const noexcept -> std::size_t { return data.size(); }
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_CORE_TYPES_H
