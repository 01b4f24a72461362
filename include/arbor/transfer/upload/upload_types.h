// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_types.h
 * @brief Types shared by the upload pipeline and upload sessions
 */

#ifndef ARBOR_TRANSFER_UPLOAD_UPLOAD_TYPES_H
#define ARBOR_TRANSFER_UPLOAD_UPLOAD_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace arbor::transfer {

/**
 * @brief Client-declared description of one uploaded file
 */
struct file_metadata {
    /// Path relative to the session directory, as sent by the client
    std::string relative_path;

    /// File name on the client
    std::string original_name;

    /// Declared size in bytes
    uint64_t size = 0;

    /// Declared SHA-256 (hex, case-insensitive)
    std::string sha256;

    /// POSIX permission bits to apply
    std::optional<uint32_t> mode;

    /// Modification time to apply
    std::optional<std::chrono::system_clock::time_point> mtime;

    /// Access time to apply; defaults to mtime
    std::optional<std::chrono::system_clock::time_point> atime;
};

/**
 * @brief Outcome of writing one file through the integrity pipeline
 */
struct write_report {
    std::filesystem::path path;
    uint64_t bytes_written = 0;
    uint64_t chunks_written = 0;

    /// Digest of the written file, equal to the declared one
    std::string sha256;

    /// Whether mode and timestamps were applied
    bool metadata_applied = false;
};

/**
 * @brief States of an upload session
 *
 * active -> paused | completed | cancelled | failed
 * paused -> active | cancelled
 */
enum class session_state {
    active,
    paused,
    completed,
    cancelled,
    failed,
};

[[nodiscard]] constexpr auto to_string(session_state state) -> const char* {
    switch (state) {
        case session_state::active:
            return "active";
        case session_state::paused:
            return "paused";
        case session_state::completed:
            return "completed";
        case session_state::cancelled:
            return "cancelled";
        case session_state::failed:
            return "failed";
        default:
            return "unknown";
    }
}

/**
 * @brief Check whether @p state accepts no further transitions
 */
[[nodiscard]] constexpr auto is_terminal(session_state state) -> bool {
    return state == session_state::completed || state == session_state::cancelled ||
           state == session_state::failed;
}

/**
 * @brief Check whether a session may move from @p from to @p to
 */
[[nodiscard]] constexpr auto can_transition(session_state from, session_state to) -> bool {
    switch (from) {
        case session_state::active:
            return to == session_state::paused || to == session_state::completed ||
                   to == session_state::cancelled || to == session_state::failed;
        case session_state::paused:
            return to == session_state::active || to == session_state::cancelled;
        default:
            return false;
    }
}

/**
 * @brief A file that failed within a session
 */
struct session_error {
    std::string file;
    std::string error;
};

/**
 * @brief Progress of a session as reported to clients
 */
struct session_progress {
    uint64_t files_completed = 0;
    uint64_t files_total = 0;
    uint64_t bytes_transferred = 0;
    uint64_t bytes_total = 0;

    /// Completed files as a percentage of total files
    double overall_percent = 0.0;

    /// Bytes per second since the session was created
    double transfer_speed = 0.0;

    /// Seconds until the remaining bytes arrive at the current speed
    std::optional<double> eta_seconds;

    std::string current_file;
    session_state state = session_state::active;
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_UPLOAD_UPLOAD_TYPES_H
