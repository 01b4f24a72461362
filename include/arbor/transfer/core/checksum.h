// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file checksum.h
 * @brief SHA-256 utilities for chunk and whole-file integrity verification
 */

#ifndef ARBOR_TRANSFER_CORE_CHECKSUM_H
#define ARBOR_TRANSFER_CORE_CHECKSUM_H

#include <arbor/transfer/core/types.h>

#include <cstddef>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>

namespace arbor::transfer {

/**
 * @brief SHA-256 digests backed by OpenSSL EVP
 *
 * All digests are lowercase hex strings.
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return SHA-256 hash as hex string
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return SHA-256 hash as hex string, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Verify SHA-256 hash of a file
     * @param path Path to the file
     * @param expected Expected hash as hex string (case-insensitive)
     * @return true if hash matches, false otherwise
     */
    [[nodiscard]] static auto verify_sha256(
        const std::filesystem::path& path, std::string_view expected) -> bool;

    /**
     * @brief Compare two hex digests ignoring case
     */
    [[nodiscard]] static auto digests_equal(std::string_view lhs, std::string_view rhs) -> bool;

    /// Read buffer size used when hashing files
    static constexpr std::size_t file_buffer_size = 64 * 1024;
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_CORE_CHECKSUM_H
