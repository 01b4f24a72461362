// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file chunk_writer.cpp
 * @brief Implementation of parallel chunk hashing and verified file writes
 */

#include <arbor/transfer/upload/chunk_writer.h>

#include <arbor/transfer/config/feature_flags.h>
#include <arbor/transfer/core/checksum.h>
#include <arbor/transfer/core/logging.h>
#include <arbor/transfer/pool/operations.h>
#include <arbor/transfer/pool/worker_pool.h>

#include <fstream>
#include <system_error>

#if ARBOR_HAS_UTIMENSAT
#include <fcntl.h>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#endif

namespace arbor::transfer {

namespace {

auto temp_path_for(const std::filesystem::path& target) -> std::filesystem::path {
    auto temp = target;
    temp += ".arbor-part";
    return temp;
}

#if ARBOR_HAS_UTIMENSAT
auto to_timespec(std::chrono::system_clock::time_point tp) -> timespec {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::floor<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
    timespec ts{};
    ts.tv_sec = static_cast<time_t>(secs.count());
    ts.tv_nsec = static_cast<long>(nanos.count());
    return ts;
}
#endif

}  // namespace

chunk_writer::chunk_writer(worker_pool& pool, chunk_config config)
    : pool_(pool), config_(config) {}

auto chunk_writer::hash_chunks(const std::filesystem::path& source)
    -> result<std::vector<task_result>> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return unexpected(
            error{error_code::file_not_found, "file not found: " + source.string()});
    }
    auto size = std::filesystem::file_size(source, ec);
    if (ec) {
        return unexpected(error{error_code::file_read_error,
                                "cannot stat " + source.string() + ": " + ec.message()});
    }

    auto count = config_.calculate_chunk_count(size);
    auto label = source.filename().string();

    std::vector<task> tasks;
    tasks.reserve(static_cast<std::size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        read_range_args args;
        args.path = source;
        args.index = i;
        args.offset = config_.chunk_offset(i);
        args.length = config_.chunk_length(i, size);
        tasks.push_back(task{label + "_chunk_" + std::to_string(i),
                             std::make_shared<read_and_hash_operation>(std::move(args))});
    }

    auto results = pool_.submit_batch(std::move(tasks));

    uint64_t hashed_bytes = 0;
    for (const auto& r : results) {
        if (const auto* chunk = r.success ? r.payload_as<file_chunk>() : nullptr) {
            hashed_bytes += chunk->size();
        }
    }
    pool_.record_bytes_processed(hashed_bytes);

    return results;
}

auto chunk_writer::validate_layout(const file_metadata& meta,
                                   const std::vector<file_chunk>& chunks) const -> result<void> {
    auto expected = config_.calculate_chunk_count(meta.size);
    if (chunks.size() != expected) {
        return unexpected(error{error_code::size_mismatch,
                                "expected " + std::to_string(expected) + " chunks, got " +
                                    std::to_string(chunks.size())});
    }

    std::vector<bool> seen(static_cast<std::size_t>(expected), false);
    for (const auto& c : chunks) {
        if (c.index >= expected) {
            return unexpected(error{error_code::invalid_chunk_index,
                                    "chunk index " + std::to_string(c.index) + " out of range"});
        }
        if (seen[static_cast<std::size_t>(c.index)]) {
            return unexpected(error{error_code::invalid_chunk_index,
                                    "duplicate chunk " + std::to_string(c.index)});
        }
        seen[static_cast<std::size_t>(c.index)] = true;

        if (c.offset != config_.chunk_offset(c.index) ||
            c.size() != config_.chunk_length(c.index, meta.size)) {
            return unexpected(error{error_code::size_mismatch,
                                    "chunk " + std::to_string(c.index) +
                                        " does not match the declared file size"});
        }
    }
    return {};
}

auto chunk_writer::rollback(const std::filesystem::path& target, const error& cause) -> error {
    std::error_code ec;
    std::filesystem::remove(temp_path_for(target), ec);

    task_log_context ctx;
    ctx.file = target.string();
    ctx.error_message = cause.message;
    ARBOR_LOG_ERROR_CTX(log_category::writer, "Discarded " + target.filename().string(), ctx);
    return cause;
}

auto chunk_writer::write_file(const std::filesystem::path& target, const file_metadata& meta,
                              std::vector<file_chunk> chunks) -> result<write_report> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (auto layout = validate_layout(meta, chunks); !layout) {
        return unexpected(layout.error());
    }

    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot create directory " +
                                        target.parent_path().string() + ": " + ec.message()});
        }
    }

    // Create the temporary file at its final size so chunks can land in any order
    auto temp = temp_path_for(target);
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return unexpected(error{error_code::file_access_denied,
                                    "cannot create temp file: " + temp.string()});
        }
        if (meta.size > 0) {
            file.seekp(static_cast<std::streamoff>(meta.size - 1));
            file.put('\0');
        }
        if (!file.good()) {
            return unexpected(rollback(
                target, error{error_code::file_write_error, "cannot size " + temp.string()}));
        }
    }

    const auto chunk_count = static_cast<uint64_t>(chunks.size());
    std::vector<task> tasks;
    tasks.reserve(chunks.size());
    for (auto& c : chunks) {
        write_range_args args;
        args.path = temp;
        args.index = c.index;
        args.offset = c.offset;
        args.data = std::move(c.data);
        tasks.push_back(task{meta.relative_path + "_write_" + std::to_string(c.index),
                             std::make_shared<write_range_operation>(std::move(args))});
    }
    chunks.clear();

    uint64_t written = 0;
    for (auto& r : pool_.submit_batch(std::move(tasks))) {
        if (!r.success) {
            return unexpected(rollback(
                target, error{r.code, "chunk write " + r.task_id + " failed: " + r.error}));
        }
        if (const auto* bytes = r.payload_as<uint64_t>()) {
            written += *bytes;
        }
    }
    pool_.record_bytes_processed(written);

    auto digest = pool_.submit(meta.relative_path + "_verify",
                               std::make_shared<hash_file_operation>(temp));
    if (!digest.success) {
        return unexpected(rollback(
            target, error{digest.code, "cannot hash " + temp.string() + ": " + digest.error}));
    }
    const auto* actual = digest.payload_as<std::string>();
    if (actual == nullptr) {
        return unexpected(rollback(
            target, error{error_code::internal_error, "hash task returned no digest"}));
    }

    if (!checksum::digests_equal(*actual, meta.sha256)) {
        task_log_context ctx;
        ctx.file = meta.relative_path;
        ctx.bytes = meta.size;
        ARBOR_LOG_WARN_CTX(log_category::writer,
                           "Checksum mismatch: expected " + meta.sha256 + ", got " + *actual,
                           ctx);
        return unexpected(rollback(target, error{error_code::checksum_mismatch,
                                                 "checksum mismatch: expected " + meta.sha256 +
                                                     ", got " + *actual}));
    }

    // Commit: rename replaces an existing target atomically
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        return unexpected(rollback(target, error{error_code::file_write_error,
                                                 "cannot rename temp file: " + ec.message()}));
    }

    write_report report;
    report.path = target;
    report.bytes_written = written;
    report.chunks_written = chunk_count;
    report.sha256 = *actual;

    if (auto applied = apply_metadata(target, meta); applied) {
        report.metadata_applied = true;
    } else {
        task_log_context ctx;
        ctx.file = target.string();
        ctx.error_message = applied.error().message;
        ARBOR_LOG_WARN_CTX(log_category::writer, "Could not apply file metadata", ctx);
    }

    ARBOR_LOG_DEBUG(log_category::writer, "Stored " + target.string() + " (" +
                                              std::to_string(written) + " bytes)");
    return report;
}

auto chunk_writer::write_file(const std::filesystem::path& target, const file_metadata& meta,
                              std::span<const std::byte> content) -> result<write_report> {
    if (auto valid = config_.validate(); !valid) {
        return unexpected(valid.error());
    }

    std::vector<file_chunk> chunks;
    auto count = config_.calculate_chunk_count(content.size());
    chunks.reserve(static_cast<std::size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        auto offset = config_.chunk_offset(i);
        auto length = config_.chunk_length(i, content.size());
        auto bytes = content.subspan(static_cast<std::size_t>(offset), length);
        chunks.emplace_back(i, offset, std::vector<std::byte>(bytes.begin(), bytes.end()));
    }
    return write_file(target, meta, std::move(chunks));
}

auto chunk_writer::apply_metadata(const std::filesystem::path& path, const file_metadata& meta)
    -> result<void> {
    std::error_code ec;
    if (meta.mode) {
        std::filesystem::permissions(
            path, static_cast<std::filesystem::perms>(*meta.mode & 07777),
            std::filesystem::perm_options::replace, ec);
        if (ec) {
            return unexpected(error{error_code::file_access_denied,
                                    "cannot set mode on " + path.string() + ": " + ec.message()});
        }
    }

    if (meta.mtime) {
        auto atime = meta.atime.value_or(*meta.mtime);
#if ARBOR_HAS_UTIMENSAT
        timespec times[2] = {to_timespec(atime), to_timespec(*meta.mtime)};
        if (::utimensat(AT_FDCWD, path.c_str(), times, 0) != 0) {
            return unexpected(error{error_code::file_access_denied,
                                    "cannot set times on " + path.string() + ": " +
                                        std::strerror(errno)});
        }
#else
        (void)atime;
        std::filesystem::last_write_time(
            path, std::chrono::file_clock::from_sys(*meta.mtime), ec);
        if (ec) {
            return unexpected(error{error_code::file_access_denied,
                                    "cannot set mtime on " + path.string() + ": " +
                                        ec.message()});
        }
#endif
    }
    return {};
}

}  // namespace arbor::transfer
