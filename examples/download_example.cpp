/**
 * @file download_example.cpp
 * @brief Ordered parallel download of a file with hash verification
 *
 * This example demonstrates:
 * - Streaming a file in index order with a look-ahead window
 * - Writing chunks to a sink and aborting on a mid-stream failure
 * - Verifying the copy against the source digest
 */

#include <arbor/transfer/transfer.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace arbor::transfer;

void print_usage(const char* program) {
    std::cout << "Download Example - Arbor Transfer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <source> <destination>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -l, --look-ahead <n>    Chunk reads in flight (default: 4)" << std::endl;
    std::cout << "  -c, --chunk <size>      Chunk size, e.g. 4MB (default: 1MB)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    ordered_parallel_streamer::options opts;
    std::filesystem::path source;
    std::filesystem::path destination;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-l" || arg == "--look-ahead") {
            if (++i >= argc) {
                std::cerr << "Error: --look-ahead requires an argument" << std::endl;
                return 1;
            }
            opts.look_ahead = static_cast<std::size_t>(std::stoul(argv[i]));
        } else if (arg == "-c" || arg == "--chunk") {
            if (++i >= argc) {
                std::cerr << "Error: --chunk requires an argument" << std::endl;
                return 1;
            }
            auto parsed = parse_size(argv[i]);
            if (!parsed) {
                std::cerr << "Error: " << parsed.error().message << std::endl;
                return 1;
            }
            opts.chunk_size = static_cast<std::size_t>(parsed.value());
        } else if (source.empty()) {
            source = arg;
        } else if (destination.empty()) {
            destination = arg;
        } else {
            std::cerr << "Error: unexpected argument " << arg << std::endl;
            return 1;
        }
    }

    if (source.empty() || destination.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto pool = worker_pool::builder()
        .with_max_workers(opts.look_ahead * 2)
        .with_name("download_example")
        .build();
    if (!pool) {
        std::cerr << "Failed to create worker pool: " << pool.error().message << std::endl;
        return 1;
    }

    auto stream = ordered_parallel_streamer::open(pool.value(), source, opts);
    if (!stream) {
        std::cerr << "Cannot stream " << source << ": " << stream.error().message << std::endl;
        return 1;
    }

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out) {
        std::cerr << "Cannot open " << destination << std::endl;
        return 1;
    }

    auto delivered = stream.value().drain([&out](const file_chunk& chunk) -> result<void> {
        out.write(reinterpret_cast<const char*>(chunk.data.data()),
                  static_cast<std::streamsize>(chunk.size()));
        if (!out) {
            return unexpected(error{error_code::file_write_error, "write to destination failed"});
        }
        return {};
    });
    out.close();

    if (!delivered) {
        // A truncated copy must not look like a finished download
        std::error_code ec;
        std::filesystem::remove(destination, ec);
        std::cerr << "Download aborted: " << delivered.error().message << std::endl;
        return 1;
    }

    std::cout << "Copied " << delivered.value() << " bytes in "
              << stream.value().total_chunks() << " chunks (peak in flight: "
              << stream.value().peak_in_flight() << ")" << std::endl;

    auto expected = checksum::sha256_file(source);
    if (!expected) {
        std::cerr << "Cannot hash source: " << expected.error().message << std::endl;
        return 1;
    }
    if (!checksum::verify_sha256(destination, expected.value())) {
        std::cerr << "Verification failed: digest mismatch" << std::endl;
        return 1;
    }
    std::cout << "Verified SHA-256 " << expected.value() << std::endl;
    return 0;
}
