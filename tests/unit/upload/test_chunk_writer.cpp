/**
 * @file test_chunk_writer.cpp
 * @brief Unit tests for chunk hashing and verified file writes
 */

#include <gtest/gtest.h>

#include <arbor/transfer/core/checksum.h>
#include <arbor/transfer/core/logging.h>
#include <arbor/transfer/pool/worker_pool.h>
#include <arbor/transfer/upload/chunk_writer.h>

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace arbor::transfer::test {

using namespace std::chrono_literals;

class ChunkWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_level(log_level::fatal);
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("arbor_test_writer_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);

        auto pool = worker_pool::builder()
            .with_max_workers(4)
            .with_retry_attempts(1)
            .build();
        ASSERT_TRUE(pool.has_value());
        pool_ = std::make_unique<worker_pool>(std::move(pool.value()));
    }

    void TearDown() override {
        pool_.reset();
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        get_logger().set_level(log_level::info);
    }

    static auto make_content(std::size_t size) -> std::vector<std::byte> {
        std::vector<std::byte> data(size);
        std::mt19937 gen(static_cast<uint32_t>(size));
        std::uniform_int_distribution<int> dis(0, 255);
        for (auto& b : data) {
            b = static_cast<std::byte>(dis(gen));
        }
        return data;
    }

    static auto make_metadata(const std::string& name, const std::vector<std::byte>& content)
        -> file_metadata {
        file_metadata meta;
        meta.relative_path = name;
        meta.original_name = name;
        meta.size = content.size();
        meta.sha256 = checksum::sha256(content);
        return meta;
    }

    static auto read_all(const std::filesystem::path& path) -> std::vector<std::byte> {
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
    std::unique_ptr<worker_pool> pool_;
};

// ============================================================================
// write_file
// ============================================================================

TEST_F(ChunkWriterTest, WritesAndVerifiesContent) {
    chunk_writer writer(*pool_, chunk_config(1024));
    auto content = make_content(10 * 1024 + 7);
    auto meta = make_metadata("data.bin", content);
    auto target = test_dir_ / "out" / "data.bin";

    auto report = writer.write_file(target, meta, std::span<const std::byte>(content));

    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(report.value().path, target);
    EXPECT_EQ(report.value().bytes_written, content.size());
    EXPECT_EQ(report.value().chunks_written, 11u);
    EXPECT_EQ(report.value().sha256, meta.sha256);
    EXPECT_EQ(read_all(target), content);
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "out" / "data.bin.arbor-part"));
}

TEST_F(ChunkWriterTest, UppercaseDeclaredDigestIsAccepted) {
    chunk_writer writer(*pool_, chunk_config(512));
    auto content = make_content(2000);
    auto meta = make_metadata("upper.bin", content);
    for (auto& c : meta.sha256) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    auto report =
        writer.write_file(test_dir_ / "upper.bin", meta, std::span<const std::byte>(content));
    EXPECT_TRUE(report.has_value());
}

TEST_F(ChunkWriterTest, EmptyFile) {
    chunk_writer writer(*pool_);
    std::vector<std::byte> content;
    auto meta = make_metadata("empty.txt", content);
    auto target = test_dir_ / "empty.txt";

    auto report = writer.write_file(target, meta, std::span<const std::byte>(content));

    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(report.value().chunks_written, 0u);
    EXPECT_TRUE(std::filesystem::exists(target));
    EXPECT_EQ(std::filesystem::file_size(target), 0u);
}

TEST_F(ChunkWriterTest, ChecksumMismatchDeletesFile) {
    chunk_writer writer(*pool_, chunk_config(1024));
    auto content = make_content(4096);
    auto meta = make_metadata("bad.bin", content);
    meta.sha256 = std::string(64, '0');
    auto target = test_dir_ / "bad.bin";

    auto report = writer.write_file(target, meta, std::span<const std::byte>(content));

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, error_code::checksum_mismatch);
    EXPECT_NE(report.error().message.find(std::string(64, '0')), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "bad.bin.arbor-part"));
}

TEST_F(ChunkWriterTest, MismatchKeepsPreviousFile) {
    chunk_writer writer(*pool_, chunk_config(1024));
    auto target = test_dir_ / "keep.bin";

    auto original = make_content(100);
    ASSERT_TRUE(writer
                    .write_file(target, make_metadata("keep.bin", original),
                                std::span<const std::byte>(original))
                    .has_value());

    auto replacement = make_content(300);
    auto meta = make_metadata("keep.bin", replacement);
    meta.sha256 = checksum::sha256(original);

    auto report = writer.write_file(target, meta, std::span<const std::byte>(replacement));

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, error_code::checksum_mismatch);
    EXPECT_EQ(read_all(target), original);
}

TEST_F(ChunkWriterTest, OverwritesExistingFile) {
    chunk_writer writer(*pool_, chunk_config(64));
    auto target = test_dir_ / "over.bin";
    {
        std::ofstream old(target, std::ios::binary);
        old << "a much longer previous content that must disappear entirely";
    }

    auto content = make_content(10);
    auto report = writer.write_file(target, make_metadata("over.bin", content),
                                    std::span<const std::byte>(content));

    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(read_all(target), content);
}

TEST_F(ChunkWriterTest, FailedCommitKeepsWhatWasAtTarget) {
    chunk_writer writer(*pool_, chunk_config(64));
    auto target = test_dir_ / "taken.bin";
    std::filesystem::create_directories(target);

    auto content = make_content(200);
    auto report = writer.write_file(target, make_metadata("taken.bin", content),
                                    std::span<const std::byte>(content));

    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, error_code::file_write_error);
    EXPECT_TRUE(std::filesystem::is_directory(target));
    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "taken.bin.arbor-part"));
}

TEST_F(ChunkWriterTest, ChunksInAnyOrder) {
    chunk_writer writer(*pool_, chunk_config(100));
    auto content = make_content(450);
    auto meta = make_metadata("shuffled.bin", content);

    std::vector<file_chunk> chunks;
    for (uint64_t i : {4u, 1u, 3u, 0u, 2u}) {
        auto offset = i * 100;
        auto length = std::min<uint64_t>(100, content.size() - offset);
        chunks.emplace_back(i, offset,
                            std::vector<std::byte>(content.begin() + offset,
                                                   content.begin() + offset + length));
    }

    auto target = test_dir_ / "shuffled.bin";
    auto report = writer.write_file(target, meta, std::move(chunks));

    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(read_all(target), content);
}

TEST_F(ChunkWriterTest, RejectsBadLayout) {
    chunk_writer writer(*pool_, chunk_config(100));
    auto content = make_content(250);
    auto meta = make_metadata("layout.bin", content);
    auto target = test_dir_ / "layout.bin";

    auto slice = [&content](uint64_t offset, uint64_t length) {
        return std::vector<std::byte>(content.begin() + offset, content.begin() + offset + length);
    };

    // Missing chunk
    std::vector<file_chunk> missing;
    missing.emplace_back(0, 0, slice(0, 100));
    missing.emplace_back(1, 100, slice(100, 100));
    auto a = writer.write_file(target, meta, std::move(missing));
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().code, error_code::size_mismatch);

    // Duplicate index
    std::vector<file_chunk> duplicate;
    duplicate.emplace_back(0, 0, slice(0, 100));
    duplicate.emplace_back(0, 0, slice(0, 100));
    duplicate.emplace_back(2, 200, slice(200, 50));
    auto b = writer.write_file(target, meta, std::move(duplicate));
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error().code, error_code::invalid_chunk_index);

    // Short middle chunk
    std::vector<file_chunk> short_chunk;
    short_chunk.emplace_back(0, 0, slice(0, 100));
    short_chunk.emplace_back(1, 100, slice(100, 60));
    short_chunk.emplace_back(2, 200, slice(200, 50));
    auto c = writer.write_file(target, meta, std::move(short_chunk));
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error().code, error_code::size_mismatch);

    EXPECT_FALSE(std::filesystem::exists(target));
}

TEST_F(ChunkWriterTest, AppliesModeAndTimes) {
    chunk_writer writer(*pool_);
    auto content = make_content(128);
    auto meta = make_metadata("script.sh", content);
    meta.mode = 0640;
    meta.mtime = std::chrono::system_clock::time_point(std::chrono::seconds(1'600'000'000));
    meta.atime = std::chrono::system_clock::time_point(std::chrono::seconds(1'600'000'100));
    auto target = test_dir_ / "script.sh";

    auto report = writer.write_file(target, meta, std::span<const std::byte>(content));

    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_TRUE(report.value().metadata_applied);

    struct stat st{};
    ASSERT_EQ(::stat(target.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 07777, 0640u);
    EXPECT_EQ(st.st_mtime, 1'600'000'000);
}

TEST_F(ChunkWriterTest, MetadataFailureIsNotFatal) {
    auto missing = test_dir_ / "does_not_exist";
    file_metadata meta;
    meta.mode = 0600;

    auto applied = chunk_writer::apply_metadata(missing, meta);
    ASSERT_FALSE(applied.has_value());
    EXPECT_EQ(applied.error().code, error_code::file_access_denied);
}

TEST_F(ChunkWriterTest, WriteBytesAreCounted) {
    chunk_writer writer(*pool_, chunk_config(1000));
    auto content = make_content(3500);

    ASSERT_TRUE(writer
                    .write_file(test_dir_ / "count.bin", make_metadata("count.bin", content),
                                std::span<const std::byte>(content))
                    .has_value());

    auto m = pool_->get_metrics();
    EXPECT_EQ(m.total_bytes_processed, 3500u);
    // 4 chunk writes and one verification hash
    EXPECT_EQ(m.completed_tasks, 5u);
}

// ============================================================================
// hash_chunks
// ============================================================================

TEST_F(ChunkWriterTest, HashChunksInOrder) {
    chunk_writer writer(*pool_, chunk_config(256));
    auto content = make_content(1000);
    auto source = test_dir_ / "source.bin";
    {
        std::ofstream file(source, std::ios::binary);
        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
    }

    auto results = writer.hash_chunks(source);

    ASSERT_TRUE(results.has_value()) << results.error().message;
    ASSERT_EQ(results.value().size(), 4u);
    for (std::size_t i = 0; i < results.value().size(); ++i) {
        const auto& r = results.value()[i];
        ASSERT_TRUE(r.success) << r.error;
        const auto* chunk = r.payload_as<file_chunk>();
        ASSERT_NE(chunk, nullptr);
        EXPECT_EQ(chunk->index, i);
        EXPECT_EQ(chunk->offset, i * 256);

        auto length = std::min<std::size_t>(256, content.size() - i * 256);
        std::span<const std::byte> expected(content.data() + i * 256, length);
        EXPECT_EQ(chunk->hash, checksum::sha256(expected));
    }
    EXPECT_EQ(pool_->get_metrics().total_bytes_processed, 1000u);
}

TEST_F(ChunkWriterTest, HashChunksMissingSource) {
    chunk_writer writer(*pool_);
    auto results = writer.hash_chunks(test_dir_ / "nope.bin");
    ASSERT_FALSE(results.has_value());
    EXPECT_EQ(results.error().code, error_code::file_not_found);
}

}  // namespace arbor::transfer::test
