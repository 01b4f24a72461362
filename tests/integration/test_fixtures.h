/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef ARBOR_TRANSFER_TEST_FIXTURES_H
#define ARBOR_TRANSFER_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <arbor/transfer/transfer.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace arbor::transfer::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_level(log_level::fatal);
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("arbor_transfer_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        source_dir_ = test_dir_ / "source";
        std::filesystem::create_directories(source_dir_);
        upload_root_ = test_dir_ / "uploads";
        std::filesystem::create_directories(upload_root_);
        download_dir_ = test_dir_ / "downloads";
        std::filesystem::create_directories(download_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        get_logger().set_level(log_level::info);
    }

    /**
     * @brief Write @p size pseudo-random bytes to source_dir_/name
     */
    auto create_test_file(const std::string& name, std::size_t size, uint32_t seed = 42)
        -> std::filesystem::path {
        auto path = source_dir_ / name;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(seed);
        std::uniform_int_distribution<> dis(0, 255);

        std::vector<char> buffer(size);
        for (auto& c : buffer) {
            c = static_cast<char>(dis(gen));
        }
        file.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::vector<std::byte> {
        std::ifstream file(path, std::ios::binary);
        std::vector<char> raw((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
        std::vector<std::byte> bytes(raw.size());
        for (std::size_t i = 0; i < raw.size(); ++i) {
            bytes[i] = static_cast<std::byte>(raw[i]);
        }
        return bytes;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path source_dir_;
    std::filesystem::path upload_root_;
    std::filesystem::path download_dir_;
};

/**
 * @brief Test fixture with a running worker pool
 */
class PoolFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();

        auto pool_result = worker_pool::builder()
            .with_max_workers(8)
            .with_task_timeout(std::chrono::milliseconds(10000))
            .with_retry_attempts(2)
            .with_retry_backoff(std::chrono::milliseconds(5))
            .with_name("integration")
            .build();

        ASSERT_TRUE(pool_result.has_value()) << "Failed to create worker pool";
        pool_ = std::make_unique<worker_pool>(std::move(pool_result.value()));
        ASSERT_TRUE(pool_->start().has_value());
    }

    void TearDown() override {
        if (pool_) {
            pool_->shutdown(true);
        }
        pool_.reset();
        TempDirectoryFixture::TearDown();
    }

    std::unique_ptr<worker_pool> pool_;
};

/**
 * @brief Test fixture for upload sessions backed by a pool
 */
class UploadFixture : public PoolFixture {
protected:
    void SetUp() override {
        PoolFixture::SetUp();

        policy_.upload_root = upload_root_;
        policy_.chunk_size = 64 * 1024;
        policy_.max_file_size = 16 * 1024 * 1024;

        registry_ = std::make_unique<session_registry>(upload_root_);
        receiver_ = std::make_unique<upload_receiver>(*pool_, *registry_, policy_);
    }

    void TearDown() override {
        receiver_.reset();
        registry_.reset();
        PoolFixture::TearDown();
    }

    /**
     * @brief Describe a source file the way a client would
     */
    static auto describe(const std::filesystem::path& source, const std::string& relative_path)
        -> file_metadata {
        file_metadata meta;
        meta.relative_path = relative_path;
        meta.original_name = source.filename().string();
        meta.size = std::filesystem::file_size(source);
        auto digest = checksum::sha256_file(source);
        EXPECT_TRUE(digest.has_value());
        if (digest) {
            meta.sha256 = digest.value();
        }
        return meta;
    }

    upload_policy policy_;
    std::unique_ptr<session_registry> registry_;
    std::unique_ptr<upload_receiver> receiver_;
};

/**
 * @brief Test data sizes
 */
namespace test_data {
    constexpr std::size_t small_file_size = 1024;                // 1KB
    constexpr std::size_t medium_file_size = 1024 * 1024 + 17;   // just over 1MB
    constexpr std::size_t large_file_size = 8 * 1024 * 1024;     // 8MB
}

}  // namespace arbor::transfer::test

#endif  // ARBOR_TRANSFER_TEST_FIXTURES_H
