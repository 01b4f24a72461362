// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_receiver.h
 * @brief Stores uploaded files into their session directories
 */

#ifndef ARBOR_TRANSFER_UPLOAD_UPLOAD_RECEIVER_H
#define ARBOR_TRANSFER_UPLOAD_UPLOAD_RECEIVER_H

#include <arbor/transfer/core/types.h>
#include <arbor/transfer/upload/chunk_writer.h>
#include <arbor/transfer/upload/upload_policy.h>
#include <arbor/transfer/upload/upload_session.h>
#include <arbor/transfer/upload/upload_types.h>

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace arbor::transfer {

class worker_pool;

/**
 * @brief Handler for one uploaded file of a session
 *
 * receive_file() checks, in order:
 * - the session exists (session_not_found) and is active (session_not_active)
 * - the upload policy accepts the declared size and name
 *
 * Requests rejected by these checks leave the session untouched. Once the
 * file passes them it is written through chunk_writer into
 * <upload_root>/<user>/<session>/<sanitized path>. A successful write counts
 * the file in the session; a failed one appends {file, error} to the
 * session's error list.
 *
 * @code
 * upload_receiver receiver(pool, registry, policy);
 * auto stored = receiver.receive_file(session_id, meta, content);
 * if (!stored) {
 *     respond_error(stored.error().message);
 * }
 * @endcode
 */
class upload_receiver {
public:
    upload_receiver(worker_pool& pool, session_registry& registry, upload_policy policy);

    [[nodiscard]] auto receive_file(const std::string& session_id, const file_metadata& meta,
                                    std::span<const std::byte> content) -> result<write_report>;

    [[nodiscard]] auto receive_file(const std::string& session_id, const file_metadata& meta,
                                    std::vector<file_chunk> chunks) -> result<write_report>;

    [[nodiscard]] auto policy() const -> const upload_policy& { return policy_; }

    /**
     * @brief Where @p relative_path of @p session would be stored
     * @return invalid_file_path when nothing is left after sanitizing
     */
    [[nodiscard]] static auto resolve_target(const upload_session& session,
                                             const std::string& relative_path)
        -> result<std::filesystem::path>;

private:
    auto admit(const std::string& session_id, const file_metadata& meta)
        -> result<std::shared_ptr<upload_session>>;
    auto finish(upload_session& session, const file_metadata& meta,
                result<write_report> outcome) -> result<write_report>;

    session_registry& registry_;
    upload_policy policy_;
    chunk_writer writer_;
};

}  // namespace arbor::transfer

#endif  // ARBOR_TRANSFER_UPLOAD_UPLOAD_RECEIVER_H
