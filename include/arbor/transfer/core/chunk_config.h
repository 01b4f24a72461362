// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file chunk_config.h
 * @brief Chunk layout of a file: chunk size, chunk count and byte ranges
 */

#ifndef ARBOR_TRANSFER_CORE_CHUNK_CONFIG_H
#define ARBOR_TRANSFER_CORE_CHUNK_CONFIG_H

#include <arbor/transfer/core/types.h>

#include <cstddef>
#include <string>

namespace arbor::transfer {

/**
 * @brief Configuration for chunk operations
 *
 * For a file of size S and chunk size C there are ceil(S / C) chunks.
 * Chunk i covers [i * C, min((i + 1) * C, S)).
 */
struct chunk_config {
    /// Default chunk size (1MB)
    static constexpr std::size_t default_chunk_size = 1024 * 1024;

    /// Maximum allowed chunk size (64MB)
    static constexpr std::size_t max_chunk_size = 64 * 1024 * 1024;

    /// Chunk size to use for splitting
    std::size_t chunk_size = default_chunk_size;

    chunk_config() = default;

    /**
     * @brief Constructor with custom chunk size
     * @param size Chunk size in bytes
     */
    explicit chunk_config(std::size_t size) : chunk_size(size) {}

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size == 0) {
            return unexpected(error{error_code::invalid_chunk_size,
                                    "chunk size must be positive"});
        }
        if (chunk_size > max_chunk_size) {
            return unexpected(error{
                error_code::invalid_chunk_size,
                "chunk size too large (maximum: " + std::to_string(max_chunk_size) + ")"});
        }
        return {};
    }

    /**
     * @brief Calculate number of chunks for a given file size
     * @param file_size Size of the file in bytes
     * @return Number of chunks needed (0 for an empty file)
     */
    [[nodiscard]] auto calculate_chunk_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0) return 0;
        return (file_size + chunk_size - 1) / chunk_size;
    }

    [[nodiscard]] auto chunk_offset(uint64_t index) const -> uint64_t {
        return index * static_cast<uint64_t>(chunk_size);
    }

    /**
     * @brief Length of chunk @p index of a file of @p file_size bytes
     * @return Chunk length, 0 when the index is past the end of the file
     */
    [[nodiscard]] auto chunk_length(uint64_t index, uint64_t file_size) const -> std::size_t {
        auto offset = chunk_offset(index);
        if (offset >= file_size) return 0;
        auto remaining = file_size - offset;
        return remaining < chunk_size ? static_cast<std::size_t>(remaining) : chunk_size;
    }
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_CORE_CHUNK_CONFIG_H
