// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file chunk_writer.h
 * @brief Parallel chunk hashing and the write-verify-commit integrity pipeline
 */

#ifndef ARBOR_TRANSFER_UPLOAD_CHUNK_WRITER_H
#define ARBOR_TRANSFER_UPLOAD_CHUNK_WRITER_H

#include <arbor/transfer/core/chunk_config.h>
#include <arbor/transfer/core/types.h>
#include <arbor/transfer/pool/task.h>
#include <arbor/transfer/upload/upload_types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <vector>

namespace arbor::transfer {

class worker_pool;

/**
 * @brief Writes files from chunks through the worker pool and verifies them
 *
 * write_file() runs these steps:
 * 1. validate that the chunks cover [0, size) exactly once
 * 2. create the target with the declared size
 * 3. write every chunk at its offset with submit_batch()
 * 4. hash the written file and compare with the declared SHA-256
 * 5. apply mode and timestamps (failures are logged, not fatal)
 *
 * Any failure in steps 2-4 deletes the target before returning the error,
 * so a failed file never remains on disk.
 *
 * The pool must outlive the writer. Two writers must not target the same
 * path at the same time.
 */
class chunk_writer {
public:
    explicit chunk_writer(worker_pool& pool, chunk_config config = chunk_config{});

    /**
     * @brief Read and hash every chunk of @p source in parallel
     * @return One task_result per chunk in index order, each holding a
     *         file_chunk with its hash on success
     *
     * Bytes of successfully hashed chunks are added to the pool's byte counter.
     */
    [[nodiscard]] auto hash_chunks(const std::filesystem::path& source)
        -> result<std::vector<task_result>>;

    /**
     * @brief Write @p chunks to @p target and verify against @p meta
     */
    [[nodiscard]] auto write_file(const std::filesystem::path& target, const file_metadata& meta,
                                  std::vector<file_chunk> chunks) -> result<write_report>;

    /**
     * @brief Split @p content into chunks, then write and verify it
     */
    [[nodiscard]] auto write_file(const std::filesystem::path& target, const file_metadata& meta,
                                  std::span<const std::byte> content) -> result<write_report>;

    /**
     * @brief Apply mode and access/modification times from @p meta
     */
    [[nodiscard]] static auto apply_metadata(const std::filesystem::path& path,
                                             const file_metadata& meta) -> result<void>;

    [[nodiscard]] auto config() const -> const chunk_config& { return config_; }

private:
    auto validate_layout(const file_metadata& meta, const std::vector<file_chunk>& chunks) const
        -> result<void>;
    auto rollback(const std::filesystem::path& target, const error& cause) -> error;

    worker_pool& pool_;
    chunk_config config_;
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_UPLOAD_CHUNK_WRITER_H
