// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_policy.h
 * @brief Limits and path rules applied to uploaded files
 */

#ifndef ARBOR_TRANSFER_UPLOAD_UPLOAD_POLICY_H
#define ARBOR_TRANSFER_UPLOAD_UPLOAD_POLICY_H

#include <arbor/transfer/core/chunk_config.h>
#include <arbor/transfer/core/types.h>
#include <arbor/transfer/upload/upload_types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace arbor::transfer {

/**
 * @brief Normalize a client-supplied relative path
 *
 * Leading separators and "." segments are dropped, backslashes become
 * forward slashes, and ".." removes the previous segment but never climbs
 * above the root. The result is always relative.
 *
 * @code
 * sanitize_path("/a/./b/../c.txt");  // "a/c.txt"
 * sanitize_path("../../etc/passwd"); // "etc/passwd"
 * @endcode
 */
[[nodiscard]] auto sanitize_path(std::string_view path) -> std::string;

/**
 * @brief Parse a human readable size such as "100MB" or "1.5 GB"
 *
 * Units are B, KB, MB, GB and TB (powers of 1024, case-insensitive). A
 * bare number is bytes.
 */
[[nodiscard]] auto parse_size(std::string_view text) -> result<uint64_t>;

/**
 * @brief Upload limits
 */
struct upload_policy {
    static constexpr uint64_t default_max_file_size = 10ULL * 1024 * 1024 * 1024;
    static constexpr std::size_t default_look_ahead = 4;

    /// Root under which <user>/<session>/ directories are created
    std::filesystem::path upload_root = "uploads";

    uint64_t max_file_size = default_max_file_size;

    /// Extensions (with dot) accepted; empty accepts everything
    std::vector<std::string> allowed_extensions;

    /// Extensions (with dot) rejected; wins over allowed_extensions
    std::vector<std::string> blocked_extensions;

    std::size_t chunk_size = chunk_config::default_chunk_size;
    std::size_t look_ahead = default_look_ahead;

    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Check the extension of @p filename against both lists
     */
    [[nodiscard]] auto is_extension_allowed(std::string_view filename) const -> bool;

    /**
     * @brief Check the declared size and the file name of @p meta
     */
    [[nodiscard]] auto check(const file_metadata& meta) const -> result<void>;
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_UPLOAD_UPLOAD_POLICY_H
