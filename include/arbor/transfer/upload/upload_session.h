// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_session.h
 * @brief Upload session state machine and the registry that owns sessions
 */

#ifndef ARBOR_TRANSFER_UPLOAD_UPLOAD_SESSION_H
#define ARBOR_TRANSFER_UPLOAD_UPLOAD_SESSION_H

#include <arbor/transfer/core/types.h>
#include <arbor/transfer/upload/upload_types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbor::transfer {

/**
 * @brief One client upload of a set of files
 *
 * Counters only grow while the session is active. All members are guarded
 * by a per-session mutex, so handlers for different files of the same
 * session may report concurrently.
 */
class upload_session {
public:
    using clock = std::chrono::system_clock;

    upload_session(std::string id, std::string user_id, uint64_t total_files,
                   uint64_t total_bytes, std::filesystem::path directory);

    upload_session(const upload_session&) = delete;
    upload_session& operator=(const upload_session&) = delete;

    [[nodiscard]] auto id() const -> const std::string& { return id_; }
    [[nodiscard]] auto user_id() const -> const std::string& { return user_id_; }
    [[nodiscard]] auto directory() const -> const std::filesystem::path& { return directory_; }
    [[nodiscard]] auto created_at() const -> clock::time_point { return created_at_; }
    [[nodiscard]] auto total_files() const -> uint64_t { return total_files_; }
    [[nodiscard]] auto total_bytes() const -> uint64_t { return total_bytes_; }

    [[nodiscard]] auto state() const -> session_state;
    [[nodiscard]] auto completed_at() const -> std::optional<clock::time_point>;
    [[nodiscard]] auto completed_files() const -> uint64_t;
    [[nodiscard]] auto transferred_bytes() const -> uint64_t;
    [[nodiscard]] auto current_file() const -> std::string;
    [[nodiscard]] auto errors() const -> std::vector<session_error>;
    [[nodiscard]] auto files() const -> std::vector<file_metadata>;

    /**
     * @brief Move to @p next
     * @return invalid_state_transition when the move is not allowed
     */
    auto transition_to(session_state next) -> result<void>;

    auto pause() -> result<void> { return transition_to(session_state::paused); }
    auto resume() -> result<void> { return transition_to(session_state::active); }

    /**
     * @brief Mark the file currently being received
     */
    void begin_file(const std::string& relative_path);

    /**
     * @brief Count a stored file
     */
    void record_file_completed(const file_metadata& meta);

    /**
     * @brief Append {file, error} to the error list
     */
    void record_file_failed(const std::string& file, const std::string& message);

    /**
     * @brief Speed, ETA and percentage at this instant
     */
    [[nodiscard]] auto progress() const -> session_progress;

    /**
     * @brief Render the session as the manifest.json document
     */
    [[nodiscard]] auto to_manifest_json() const -> std::string;

    /**
     * @brief Write manifest.json into the session directory
     * @return Path of the written manifest
     */
    [[nodiscard]] auto write_manifest() const -> result<std::filesystem::path>;

private:
    const std::string id_;
    const std::string user_id_;
    const uint64_t total_files_;
    const uint64_t total_bytes_;
    const std::filesystem::path directory_;
    const clock::time_point created_at_;

    mutable std::mutex mutex_;
    session_state state_ = session_state::active;
    std::optional<clock::time_point> completed_at_;
    uint64_t completed_files_ = 0;
    uint64_t transferred_bytes_ = 0;
    std::string current_file_;
    std::vector<session_error> errors_;
    std::vector<file_metadata> files_;
};

/**
 * @brief Owner of all live upload sessions
 *
 * Sessions live under <upload_root>/<user_id>/<session_id>/.
 *
 * @code
 * session_registry registry("/srv/uploads");
 * auto session = registry.create("alice", 3, total_bytes);
 * // ... receive files ...
 * auto manifest = registry.complete(session.value()->id());
 * @endcode
 */
class session_registry {
public:
    explicit session_registry(std::filesystem::path upload_root);

    /**
     * @brief Create a session with a fresh id and its directory
     */
    [[nodiscard]] auto create(const std::string& user_id, uint64_t total_files,
                              uint64_t total_bytes) -> result<std::shared_ptr<upload_session>>;

    /**
     * @brief Look up a session
     * @return The session, or nullptr when it does not exist
     */
    [[nodiscard]] auto find(const std::string& session_id) const
        -> std::shared_ptr<upload_session>;

    /**
     * @brief Mark a session completed and persist its manifest
     * @return Path of manifest.json
     */
    [[nodiscard]] auto complete(const std::string& session_id)
        -> result<std::filesystem::path>;

    /**
     * @brief Cancel a session, delete its directory and forget it
     */
    auto cancel(const std::string& session_id) -> result<void>;

    /**
     * @brief Forget a session without touching its files
     */
    auto remove(const std::string& session_id) -> bool;

    [[nodiscard]] auto size() const -> std::size_t;
    [[nodiscard]] auto upload_root() const -> const std::filesystem::path& { return root_; }

    /**
     * @brief Generate a random RFC 4122 version 4 id
     */
    [[nodiscard]] static auto generate_session_id() -> std::string;

private:
    std::filesystem::path root_;
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<upload_session>> sessions_;
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_UPLOAD_UPLOAD_SESSION_H
