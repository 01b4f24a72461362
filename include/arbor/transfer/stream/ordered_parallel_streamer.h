// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file ordered_parallel_streamer.h
 * @brief Parallel chunk reads delivered strictly in index order
 */

#ifndef ARBOR_TRANSFER_STREAM_ORDERED_PARALLEL_STREAMER_H
#define ARBOR_TRANSFER_STREAM_ORDERED_PARALLEL_STREAMER_H

#include <arbor/transfer/core/chunk_config.h>
#include <arbor/transfer/core/types.h>
#include <arbor/transfer/pool/operations.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>

namespace arbor::transfer {

class worker_pool;

/**
 * @brief Streams a file as chunks read by the worker pool
 *
 * Up to look_ahead chunk reads are in flight at any time. Chunks that
 * complete early are held until every lower index has been delivered, so
 * next() always yields chunk 0, 1, 2, ... with no gaps or duplicates.
 * Concatenating the delivered chunks reproduces the file.
 *
 * The first chunk read that fails after its retries terminates the stream:
 * next() returns stream_failure and the remaining reads are cancelled.
 *
 * @code
 * auto stream = ordered_parallel_streamer::open(pool, "/data/big.bin");
 * while (stream && stream.value().has_next()) {
 *     auto chunk = stream.value().next();
 *     if (!chunk) break;
 *     send(chunk.value().data);
 * }
 * @endcode
 */
class ordered_parallel_streamer {
public:
    /**
     * @brief Creates the operation that reads one chunk
     */
    using operation_factory = std::function<std::shared_ptr<operation>(const read_range_args&)>;

    /**
     * @brief Consumer for drain(); an error stops the stream
     */
    using chunk_sink = std::function<result<void>(const file_chunk&)>;

    struct options {
        /// Bytes per chunk (default: 1MB)
        std::size_t chunk_size = chunk_config::default_chunk_size;

        /// Maximum number of chunk reads in flight (default: 4)
        std::size_t look_ahead = 4;

        /// Overrides the read operation; defaults to read_range_operation
        operation_factory make_operation;
    };

    /**
     * @brief Open @p path for streaming through @p pool
     * @return The streamer, or an error for a missing file or bad options
     *
     * The pool must outlive the streamer.
     */
    [[nodiscard]] static auto open(worker_pool& pool, const std::filesystem::path& path,
                                   options opts) -> result<ordered_parallel_streamer>;

    [[nodiscard]] static auto open(worker_pool& pool, const std::filesystem::path& path)
        -> result<ordered_parallel_streamer>;

    ordered_parallel_streamer(ordered_parallel_streamer&&) noexcept;
    auto operator=(ordered_parallel_streamer&&) noexcept -> ordered_parallel_streamer&;
    ~ordered_parallel_streamer();

    ordered_parallel_streamer(const ordered_parallel_streamer&) = delete;
    auto operator=(const ordered_parallel_streamer&) -> ordered_parallel_streamer& = delete;

    /**
     * @brief Check whether another chunk can be delivered
     */
    [[nodiscard]] auto has_next() const -> bool;

    /**
     * @brief Deliver the next chunk in index order
     *
     * Blocks until that chunk's read finished. Bytes of every delivered
     * chunk are added to the pool's byte counter.
     */
    [[nodiscard]] auto next() -> result<file_chunk>;

    /**
     * @brief Deliver every remaining chunk to @p sink
     * @return Total bytes delivered
     */
    [[nodiscard]] auto drain(const chunk_sink& sink) -> result<uint64_t>;

    [[nodiscard]] auto file_size() const -> uint64_t;
    [[nodiscard]] auto total_chunks() const -> uint64_t;

    /// Index of the chunk next() will deliver
    [[nodiscard]] auto next_index() const -> uint64_t;

    /// Chunk reads launched but not yet delivered
    [[nodiscard]] auto in_flight() const -> std::size_t;

    /// Largest in_flight() observed so far
    [[nodiscard]] auto peak_in_flight() const -> std::size_t;

    [[nodiscard]] auto is_failed() const -> bool;

private:
    struct impl;
    explicit ordered_parallel_streamer(std::unique_ptr<impl> pimpl);

    std::unique_ptr<impl> pimpl_;
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_STREAM_ORDERED_PARALLEL_STREAMER_H
