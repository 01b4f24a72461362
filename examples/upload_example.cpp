/**
 * @file upload_example.cpp
 * @brief Parallel upload of local files into an upload session
 *
 * This example demonstrates:
 * - Building a worker pool with the fluent builder
 * - Hashing source files chunk by chunk with chunk_writer::hash_chunks
 * - Creating a session and storing files through upload_receiver
 * - Printing session progress and writing manifest.json
 */

#include <arbor/transfer/transfer.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

using namespace arbor::transfer;

namespace {

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

auto read_file(const std::filesystem::path& path) -> std::vector<std::byte> {
    std::ifstream file(path, std::ios::binary);
    std::vector<char> raw((std::istreambuf_iterator<char>(file)),
                          std::istreambuf_iterator<char>());
    std::vector<std::byte> data(raw.size());
    std::transform(raw.begin(), raw.end(), data.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return data;
}

/**
 * @brief Collect regular files under @p input with paths relative to it
 */
auto collect_files(const std::filesystem::path& input)
    -> std::vector<std::pair<std::filesystem::path, std::string>> {
    std::vector<std::pair<std::filesystem::path, std::string>> files;
    if (std::filesystem::is_regular_file(input)) {
        files.emplace_back(input, input.filename().generic_string());
        return files;
    }
    for (const auto& entry : std::filesystem::recursive_directory_iterator(input)) {
        if (entry.is_regular_file()) {
            files.emplace_back(entry.path(),
                               std::filesystem::relative(entry.path(), input).generic_string());
        }
    }
    return files;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Upload Example - Arbor Transfer" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " [options] <file_or_directory>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -r, --root <dir>        Upload root (default: uploads)" << std::endl;
    std::cout << "  -u, --user <name>       User name (default: demo)" << std::endl;
    std::cout << "  -w, --workers <n>       Worker count (default: 8)" << std::endl;
    std::cout << "  -c, --chunk <size>      Chunk size, e.g. 256KB (default: 1MB)" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::filesystem::path root = "uploads";
    std::string user = "demo";
    std::size_t workers = 8;
    uint64_t chunk_size = chunk_config::default_chunk_size;
    std::filesystem::path input;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-r" || arg == "--root") {
            if (++i >= argc) {
                std::cerr << "Error: --root requires an argument" << std::endl;
                return 1;
            }
            root = argv[i];
        } else if (arg == "-u" || arg == "--user") {
            if (++i >= argc) {
                std::cerr << "Error: --user requires an argument" << std::endl;
                return 1;
            }
            user = argv[i];
        } else if (arg == "-w" || arg == "--workers") {
            if (++i >= argc) {
                std::cerr << "Error: --workers requires an argument" << std::endl;
                return 1;
            }
            workers = static_cast<std::size_t>(std::stoul(argv[i]));
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
            chunk_size = parsed.value();
        } else if (input.empty()) {
            input = arg;
        } else {
            std::cerr << "Error: unexpected argument " << arg << std::endl;
            return 1;
        }
    }

    if (input.empty() || !std::filesystem::exists(input)) {
        print_usage(argv[0]);
        return 1;
    }

    auto pool = worker_pool::builder()
        .with_max_workers(workers)
        .with_name("upload_example")
        .build();
    if (!pool) {
        std::cerr << "Failed to create worker pool: " << pool.error().message << std::endl;
        return 1;
    }

    upload_policy policy;
    policy.upload_root = root;
    policy.chunk_size = static_cast<std::size_t>(chunk_size);
    if (auto valid = policy.validate(); !valid) {
        std::cerr << "Invalid policy: " << valid.error().message << std::endl;
        return 1;
    }

    auto files = collect_files(input);
    uint64_t total_bytes = 0;
    for (const auto& [path, relative] : files) {
        total_bytes += std::filesystem::file_size(path);
    }

    session_registry registry(root);
    auto session = registry.create(user, files.size(), total_bytes);
    if (!session) {
        std::cerr << "Failed to create session: " << session.error().message << std::endl;
        return 1;
    }
    const auto session_id = session.value()->id();
    std::cout << "Session " << session_id << ": " << files.size() << " files, "
              << format_bytes(total_bytes) << std::endl;

    chunk_writer hasher(pool.value(), chunk_config(policy.chunk_size));
    upload_receiver receiver(pool.value(), registry, policy);

    for (const auto& [path, relative] : files) {
        auto chunks = hasher.hash_chunks(path);
        if (!chunks) {
            std::cerr << "  " << relative << ": " << chunks.error().message << std::endl;
            continue;
        }
        std::cout << "  " << relative << ": " << chunks.value().size() << " chunks hashed"
                  << std::endl;

        file_metadata meta;
        meta.relative_path = relative;
        meta.original_name = path.filename().string();
        meta.size = std::filesystem::file_size(path);
        meta.mode = static_cast<uint32_t>(std::filesystem::status(path).permissions());
        meta.mtime = std::chrono::file_clock::to_sys(std::filesystem::last_write_time(path));

        auto content = read_file(path);
        meta.sha256 = checksum::sha256(content);

        auto stored = receiver.receive_file(session_id, meta, content);
        if (!stored) {
            std::cerr << "  " << relative << " failed: " << stored.error().message << std::endl;
            continue;
        }

        auto p = session.value()->progress();
        std::cout << "  " << relative << " stored (" << std::fixed << std::setprecision(1)
                  << p.overall_percent << "%, " << format_bytes(
                         static_cast<uint64_t>(p.transfer_speed)) << "/s)" << std::endl;
    }

    auto manifest = registry.complete(session_id);
    if (!manifest) {
        std::cerr << "Failed to complete session: " << manifest.error().message << std::endl;
        return 1;
    }
    std::cout << "Manifest written to " << manifest.value() << std::endl;
    std::cout << pool.value().get_metrics().to_json() << std::endl;

    return session.value()->errors().empty() ? 0 : 2;
}
