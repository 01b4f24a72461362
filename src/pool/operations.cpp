// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file operations.cpp
 * @brief Implementation of range reads, range writes and file hashing
 */

#include <arbor/transfer/pool/operations.h>

#include <arbor/transfer/core/checksum.h>

#include <fstream>
#include <span>

namespace arbor::transfer {

auto read_range_operation::read(const read_range_args& args) -> result<file_chunk> {
    std::ifstream file(args.path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + args.path.string()});
    }

    file.seekg(static_cast<std::streamoff>(args.offset), std::ios::beg);
    if (!file.good()) {
        return unexpected(error{error_code::file_read_error,
                                "seek to offset " + std::to_string(args.offset) + " failed"});
    }

    std::vector<std::byte> buffer(args.length);
    if (args.length > 0) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(args.length));
    }
    auto bytes_read = static_cast<std::size_t>(file.gcount());
    if (args.length > 0 && bytes_read != args.length) {
        return unexpected(error{error_code::file_read_error,
                                "short read at offset " + std::to_string(args.offset) +
                                    ": expected " + std::to_string(args.length) +
                                    " bytes, got " + std::to_string(bytes_read)});
    }

    return file_chunk(args.index, args.offset, std::move(buffer));
}

auto read_range_operation::execute() -> result<task_payload> {
    auto chunk = read(args_);
    if (!chunk) {
        return unexpected(chunk.error());
    }
    return task_payload{std::move(chunk.value())};
}

auto read_and_hash_operation::execute() -> result<task_payload> {
    auto chunk = read_range_operation::read(args_);
    if (!chunk) {
        return unexpected(chunk.error());
    }
    auto& c = chunk.value();
    c.hash = checksum::sha256(std::span<const std::byte>(c.data));
    return task_payload{std::move(c)};
}

auto write_range_operation::execute() -> result<task_payload> {
    std::fstream file(args_.path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) {
        return unexpected(error{error_code::file_write_error,
                                "cannot open file for writing: " + args_.path.string()});
    }

    file.seekp(static_cast<std::streamoff>(args_.offset), std::ios::beg);
    if (!file.good()) {
        return unexpected(error{error_code::file_write_error,
                                "seek to offset " + std::to_string(args_.offset) + " failed"});
    }

    file.write(reinterpret_cast<const char*>(args_.data.data()),
               static_cast<std::streamsize>(args_.data.size()));
    file.flush();
    if (!file.good()) {
        return unexpected(error{error_code::file_write_error,
                                "write at offset " + std::to_string(args_.offset) + " failed"});
    }

    return task_payload{static_cast<uint64_t>(args_.data.size())};
}

auto hash_file_operation::execute() -> result<task_payload> {
    auto digest = checksum::sha256_file(path_);
    if (!digest) {
        return unexpected(digest.error());
    }
    return task_payload{std::move(digest.value())};
}

}  // namespace arbor::transfer
