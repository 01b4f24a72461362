// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file upload_receiver.cpp
 * @brief Implementation of the per-file upload handler
 */

#include <arbor/transfer/upload/upload_receiver.h>

#include <arbor/transfer/core/logging.h>

namespace arbor::transfer {

upload_receiver::upload_receiver(worker_pool& pool, session_registry& registry,
                                 upload_policy policy)
    : registry_(registry),
      policy_(std::move(policy)),
      writer_(pool, chunk_config(policy_.chunk_size)) {}

auto upload_receiver::resolve_target(const upload_session& session,
                                     const std::string& relative_path)
    -> result<std::filesystem::path> {
    auto safe = sanitize_path(relative_path);
    if (safe.empty()) {
        return unexpected(
            error{error_code::invalid_file_path, "invalid file path: '" + relative_path + "'"});
    }
    return session.directory() / std::filesystem::path(safe);
}

auto upload_receiver::admit(const std::string& session_id, const file_metadata& meta)
    -> result<std::shared_ptr<upload_session>> {
    auto session = registry_.find(session_id);
    if (!session) {
        return unexpected(
            error{error_code::session_not_found, "session not found: " + session_id});
    }
    if (session->state() != session_state::active) {
        return unexpected(error{error_code::session_not_active,
                                "session " + session_id + " is " + to_string(session->state())});
    }
    if (auto allowed = policy_.check(meta); !allowed) {
        return unexpected(allowed.error());
    }
    return session;
}

auto upload_receiver::finish(upload_session& session, const file_metadata& meta,
                             result<write_report> outcome) -> result<write_report> {
    task_log_context ctx;
    ctx.session_id = session.id();
    ctx.file = meta.relative_path;
    ctx.bytes = meta.size;

    if (!outcome) {
        ctx.error_message = outcome.error().message;
        ARBOR_LOG_ERROR_CTX(log_category::session, "Error uploading " + meta.relative_path, ctx);
        session.record_file_failed(meta.relative_path, outcome.error().message);
        return outcome;
    }

    session.record_file_completed(meta);
    ARBOR_LOG_INFO_CTX(log_category::session, "Uploaded " + meta.relative_path, ctx);
    return outcome;
}

auto upload_receiver::receive_file(const std::string& session_id, const file_metadata& meta,
                                   std::span<const std::byte> content) -> result<write_report> {
    auto session = admit(session_id, meta);
    if (!session) {
        return unexpected(session.error());
    }
    auto target = resolve_target(*session.value(), meta.relative_path);
    if (!target) {
        return unexpected(target.error());
    }

    session.value()->begin_file(meta.relative_path);
    if (content.size() != meta.size) {
        return finish(*session.value(), meta,
                      unexpected(error{error_code::size_mismatch,
                                       "received " + std::to_string(content.size()) +
                                           " bytes, declared " + std::to_string(meta.size)}));
    }
    return finish(*session.value(), meta, writer_.write_file(target.value(), meta, content));
}

auto upload_receiver::receive_file(const std::string& session_id, const file_metadata& meta,
                                   std::vector<file_chunk> chunks) -> result<write_report> {
    auto session = admit(session_id, meta);
    if (!session) {
        return unexpected(session.error());
    }
    auto target = resolve_target(*session.value(), meta.relative_path);
    if (!target) {
        return unexpected(target.error());
    }

    session.value()->begin_file(meta.relative_path);
    return finish(*session.value(), meta,
                  writer_.write_file(target.value(), meta, std::move(chunks)));
}

}  // namespace arbor::transfer
