/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef ARBOR_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define ARBOR_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <arbor/transfer/pool/task.h>

namespace arbor::transfer::benchmark {

/**
 * @brief Generate random binary data
 * @param size Size in bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::vector<std::byte>;

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    auto create_file(const std::string& name, const std::vector<std::byte>& data)
        -> std::filesystem::path;

    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Operation that burns a fixed amount of CPU and yields nothing
 */
class spin_operation : public operation {
public:
    explicit spin_operation(uint32_t rounds) : rounds_(rounds) {}

    [[nodiscard]] auto name() const -> std::string override { return "spin"; }
    [[nodiscard]] auto execute() -> result<task_payload> override;

private:
    uint32_t rounds_;
};

auto format_bytes(uint64_t bytes) -> std::string;
auto format_throughput(double bytes_per_second) -> std::string;

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 256 * KB;
constexpr std::size_t medium_file = 16 * MB;
constexpr std::size_t large_file = 128 * MB;

constexpr std::size_t small_chunk = 64 * KB;
constexpr std::size_t default_chunk = 1 * MB;
}  // namespace sizes

}  // namespace arbor::transfer::benchmark

#endif  // ARBOR_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
