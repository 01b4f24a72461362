// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file ordered_parallel_streamer.cpp
 * @brief Sliding look-ahead window over pool chunk reads
 */

#include <arbor/transfer/stream/ordered_parallel_streamer.h>

#include <arbor/transfer/core/logging.h>
#include <arbor/transfer/pool/task_group.h>
#include <arbor/transfer/pool/worker_pool.h>

#include <algorithm>
#include <map>
#include <system_error>

namespace arbor::transfer {

struct ordered_parallel_streamer::impl {
    explicit impl(task_group g) : group(std::move(g)) {}

    std::filesystem::path path;
    std::string label;
    chunk_config chunks;
    uint64_t size = 0;
    uint64_t total = 0;
    std::size_t look_ahead = 0;
    operation_factory make_operation;

    task_group group;

    /// Launched, undelivered chunk index -> ticket in group
    std::map<uint64_t, task_group::ticket> pending;

    uint64_t next_to_deliver = 0;
    uint64_t next_to_launch = 0;
    std::size_t peak = 0;
    bool failed = false;

    void top_up() {
        while (pending.size() < look_ahead && next_to_launch < total) {
            auto index = next_to_launch++;

            read_range_args args;
            args.path = path;
            args.index = index;
            args.offset = chunks.chunk_offset(index);
            args.length = chunks.chunk_length(index, size);

            std::shared_ptr<operation> op;
            if (make_operation) {
                op = make_operation(args);
            } else {
                op = std::make_shared<read_range_operation>(args);
            }
            auto ticket = group.add(task{label + "_chunk_" + std::to_string(index), std::move(op)});
            pending.emplace(index, ticket);
        }
        peak = std::max(peak, pending.size());
    }

    auto terminate(const std::string& message) -> error {
        failed = true;
        group.cancel();
        pending.clear();

        task_log_context ctx;
        ctx.file = path.string();
        ctx.chunk_index = next_to_deliver;
        ctx.total_chunks = total;
        ctx.error_message = message;
        ARBOR_LOG_ERROR_CTX(log_category::stream, "Stream terminated", ctx);

        return error{error_code::stream_failure, message};
    }
};

auto ordered_parallel_streamer::open(worker_pool& pool, const std::filesystem::path& path)
    -> result<ordered_parallel_streamer> {
    return open(pool, path, options{});
}

auto ordered_parallel_streamer::open(worker_pool& pool, const std::filesystem::path& path,
                                     options opts) -> result<ordered_parallel_streamer> {
    chunk_config chunks(opts.chunk_size);
    if (auto valid = chunks.validate(); !valid) {
        return unexpected(valid.error());
    }
    if (opts.look_ahead == 0) {
        return unexpected(
            error{error_code::invalid_configuration, "look-ahead must be at least 1"});
    }

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return unexpected(error{error_code::file_not_found, "file not found: " + path.string()});
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(
            error{error_code::invalid_file_path, "not a regular file: " + path.string()});
    }
    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::file_read_error,
                                "cannot stat " + path.string() + ": " + ec.message()});
    }

    auto state = std::make_unique<impl>(pool.create_group());
    state->path = path;
    state->label = path.filename().string();
    state->chunks = chunks;
    state->size = size;
    state->total = chunks.calculate_chunk_count(size);
    state->look_ahead = opts.look_ahead;
    state->make_operation = std::move(opts.make_operation);

    ARBOR_LOG_DEBUG(log_category::stream,
                    "Streaming " + path.string() + ": " + std::to_string(state->total) +
                        " chunks, look-ahead " + std::to_string(state->look_ahead));

    return ordered_parallel_streamer(std::move(state));
}

ordered_parallel_streamer::ordered_parallel_streamer(std::unique_ptr<impl> pimpl)
    : pimpl_(std::move(pimpl)) {}

ordered_parallel_streamer::ordered_parallel_streamer(ordered_parallel_streamer&&) noexcept =
    default;

auto ordered_parallel_streamer::operator=(ordered_parallel_streamer&&) noexcept
    -> ordered_parallel_streamer& = default;

ordered_parallel_streamer::~ordered_parallel_streamer() = default;

auto ordered_parallel_streamer::has_next() const -> bool {
    return !pimpl_->failed && pimpl_->next_to_deliver < pimpl_->total;
}

auto ordered_parallel_streamer::next() -> result<file_chunk> {
    auto& s = *pimpl_;
    if (s.failed) {
        return unexpected(
            error{error_code::stream_failure, "stream terminated after a failed read"});
    }
    if (s.next_to_deliver >= s.total) {
        return unexpected(error{error_code::invalid_chunk_index, "no more chunks available"});
    }

    s.top_up();

    auto it = s.pending.find(s.next_to_deliver);
    if (it == s.pending.end()) {
        return unexpected(s.terminate("chunk " + std::to_string(s.next_to_deliver) +
                                      " was never scheduled"));
    }
    auto index = it->first;
    auto outcome = s.group.wait(it->second);
    s.pending.erase(it);

    if (!outcome.success) {
        return unexpected(
            s.terminate("failed to read chunk " + std::to_string(index) + ": " + outcome.error));
    }

    auto* chunk = outcome.payload_as<file_chunk>();
    if (chunk == nullptr) {
        return unexpected(
            s.terminate("read of chunk " + std::to_string(index) + " produced no data"));
    }
    auto expected = s.chunks.chunk_length(index, s.size);
    if (chunk->index != index || chunk->size() != expected) {
        return unexpected(s.terminate("chunk " + std::to_string(index) + " has " +
                                      std::to_string(chunk->size()) + " bytes, expected " +
                                      std::to_string(expected)));
    }

    ++s.next_to_deliver;
    s.group.record_bytes_processed(chunk->size());

    if (s.next_to_deliver == s.total) {
        ARBOR_LOG_DEBUG(log_category::stream, "Finished streaming " + s.path.string());
    }
    return std::move(*chunk);
}

auto ordered_parallel_streamer::drain(const chunk_sink& sink) -> result<uint64_t> {
    uint64_t delivered = 0;
    while (has_next()) {
        auto chunk = next();
        if (!chunk) {
            return unexpected(chunk.error());
        }
        if (sink) {
            if (auto accepted = sink(chunk.value()); !accepted) {
                return unexpected(pimpl_->terminate("sink rejected chunk " +
                                                    std::to_string(chunk.value().index) +
                                                    ": " + accepted.error().message));
            }
        }
        delivered += chunk.value().size();
    }
    if (pimpl_->failed) {
        return unexpected(
            error{error_code::stream_failure, "stream terminated after a failed read"});
    }
    return delivered;
}

auto ordered_parallel_streamer::file_size() const -> uint64_t {
    return pimpl_->size;
}

auto ordered_parallel_streamer::total_chunks() const -> uint64_t {
    return pimpl_->total;
}

auto ordered_parallel_streamer::next_index() const -> uint64_t {
    return pimpl_->next_to_deliver;
}

auto ordered_parallel_streamer::in_flight() const -> std::size_t {
    return pimpl_->pending.size();
}

auto ordered_parallel_streamer::peak_in_flight() const -> std::size_t {
    return pimpl_->peak;
}

auto ordered_parallel_streamer::is_failed() const -> bool {
    return pimpl_->failed;
}

}  // namespace arbor::transfer
