// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file operations.h
 * @brief File operations executed by pool workers
 *
 * Every operation opens its own file handle, so any number of them may run
 * against the same file at once. Reads and writes address disjoint byte
 * ranges by offset.
 */

#ifndef ARBOR_TRANSFER_POOL_OPERATIONS_H
#define ARBOR_TRANSFER_POOL_OPERATIONS_H

#include <arbor/transfer/pool/task.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace arbor::transfer {

/**
 * @brief Byte range of a file addressed as a chunk
 */
struct read_range_args {
    std::filesystem::path path;
    uint64_t index = 0;
    uint64_t offset = 0;
    std::size_t length = 0;
};

/**
 * @brief Bytes to place at an offset of an existing file
 */
struct write_range_args {
    std::filesystem::path path;
    uint64_t index = 0;
    uint64_t offset = 0;
    std::vector<std::byte> data;
};

/**
 * @brief Reads one chunk; yields a file_chunk without hash
 *
 * A read returning fewer than length bytes fails with file_read_error.
 */
class read_range_operation : public operation {
public:
    explicit read_range_operation(read_range_args args) : args_(std::move(args)) {}

    [[nodiscard]] auto name() const -> std::string override { return "read_range"; }
    [[nodiscard]] auto execute() -> result<task_payload> override;

    [[nodiscard]] auto args() const -> const read_range_args& { return args_; }

    /**
     * @brief Read the range described by @p args
     */
    [[nodiscard]] static auto read(const read_range_args& args) -> result<file_chunk>;

private:
    read_range_args args_;
};

/**
 * @brief Reads one chunk and attaches its SHA-256
 */
class read_and_hash_operation : public operation {
public:
    explicit read_and_hash_operation(read_range_args args) : args_(std::move(args)) {}

    [[nodiscard]] auto name() const -> std::string override { return "read_and_hash"; }
    [[nodiscard]] auto execute() -> result<task_payload> override;

private:
    read_range_args args_;
};

/**
 * @brief Writes one chunk at its offset; yields the byte count
 *
 * The target file must exist. It is opened for update, never truncated.
 */
class write_range_operation : public operation {
public:
    explicit write_range_operation(write_range_args args) : args_(std::move(args)) {}

    [[nodiscard]] auto name() const -> std::string override { return "write_range"; }
    [[nodiscard]] auto execute() -> result<task_payload> override;

private:
    write_range_args args_;
};

/**
 * @brief Computes the SHA-256 of a whole file; yields the hex digest
 */
class hash_file_operation : public operation {
public:
    explicit hash_file_operation(std::filesystem::path path) : path_(std::move(path)) {}

    [[nodiscard]] auto name() const -> std::string override { return "hash_file"; }
    [[nodiscard]] auto execute() -> result<task_payload> override;

private:
    std::filesystem::path path_;
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_POOL_OPERATIONS_H
