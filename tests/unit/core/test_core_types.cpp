/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error codes, result, chunk_config, file_chunk)
 */

#include <gtest/gtest.h>

#include <arbor/transfer/core/chunk_config.h>
#include <arbor/transfer/core/types.h>

#include <string>
#include <unordered_set>

namespace arbor::transfer::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Task errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::task_timeout), -100);
    EXPECT_EQ(static_cast<int>(error_code::task_cancelled), -104);

    // File errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -120);
    EXPECT_EQ(static_cast<int>(error_code::size_mismatch), -127);

    // Integrity and chunk errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::checksum_mismatch), -140);
    EXPECT_EQ(static_cast<int>(error_code::stream_failure), -143);

    // Session errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::session_not_found), -160);
    EXPECT_EQ(static_cast<int>(error_code::session_already_exists), -163);

    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -180);
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -200);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::task_timeout), "task timeout");
    EXPECT_STREQ(to_string(error_code::pool_unavailable), "pool shutting down");
    EXPECT_STREQ(to_string(error_code::checksum_mismatch), "checksum mismatch");
    EXPECT_STREQ(to_string(error_code::session_not_active), "session not active");
}

TEST_F(ErrorCodeTest, AllCodesHaveDistinctNames) {
    const error_code codes[] = {
        error_code::task_timeout,          error_code::operation_failed,
        error_code::pool_unavailable,      error_code::invalid_task,
        error_code::task_cancelled,        error_code::file_not_found,
        error_code::file_access_denied,    error_code::file_read_error,
        error_code::file_write_error,      error_code::invalid_file_path,
        error_code::file_too_large,        error_code::extension_not_allowed,
        error_code::size_mismatch,         error_code::checksum_mismatch,
        error_code::invalid_chunk_size,    error_code::invalid_chunk_index,
        error_code::stream_failure,        error_code::session_not_found,
        error_code::session_not_active,    error_code::invalid_state_transition,
        error_code::session_already_exists, error_code::invalid_configuration,
        error_code::internal_error,
    };

    std::unordered_set<std::string> names;
    for (auto code : codes) {
        std::string name = to_string(code);
        EXPECT_NE(name, "unknown error");
        EXPECT_TRUE(names.insert(name).second) << name;
    }
}

// =============================================================================
// error / result Tests
// =============================================================================

TEST(ErrorTest, DefaultIsSuccess) {
    error e;
    EXPECT_EQ(e.code, error_code::success);
    EXPECT_FALSE(static_cast<bool>(e));
}

TEST(ErrorTest, CodeOnlyUsesDefaultMessage) {
    error e(error_code::stream_failure);
    EXPECT_TRUE(static_cast<bool>(e));
    EXPECT_EQ(e.message, "stream failure");
}

TEST(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, HoldsError) {
    result<int> r = unexpected(error{error_code::file_not_found, "missing"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::file_not_found);
    EXPECT_EQ(r.error().message, "missing");
}

TEST(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected(error{error_code::internal_error});
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::internal_error);
}

// =============================================================================
// chunk_config Tests
// =============================================================================

TEST(ChunkConfigTest, DefaultIsOneMebibyte) {
    chunk_config config;
    EXPECT_EQ(config.chunk_size, 1024u * 1024u);
    EXPECT_TRUE(config.validate().has_value());
}

TEST(ChunkConfigTest, ValidateRejectsZeroAndOversized) {
    auto zero = chunk_config(0).validate();
    ASSERT_FALSE(zero.has_value());
    EXPECT_EQ(zero.error().code, error_code::invalid_chunk_size);

    auto big = chunk_config(chunk_config::max_chunk_size + 1).validate();
    ASSERT_FALSE(big.has_value());
    EXPECT_EQ(big.error().code, error_code::invalid_chunk_size);
}

TEST(ChunkConfigTest, ChunkCountIsCeiling) {
    chunk_config config(4);
    EXPECT_EQ(config.calculate_chunk_count(0), 0u);
    EXPECT_EQ(config.calculate_chunk_count(1), 1u);
    EXPECT_EQ(config.calculate_chunk_count(4), 1u);
    EXPECT_EQ(config.calculate_chunk_count(5), 2u);
    EXPECT_EQ(config.calculate_chunk_count(10), 3u);
}

TEST(ChunkConfigTest, LastChunkIsShort) {
    chunk_config config(4);
    EXPECT_EQ(config.chunk_offset(2), 8u);
    EXPECT_EQ(config.chunk_length(0, 10), 4u);
    EXPECT_EQ(config.chunk_length(2, 10), 2u);
    EXPECT_EQ(config.chunk_length(3, 10), 0u);
}

TEST(FileChunkTest, SizeFollowsData) {
    file_chunk chunk(3, 12, std::vector<std::byte>(5, std::byte{0x7f}));
    EXPECT_EQ(chunk.index, 3u);
    EXPECT_EQ(chunk.offset, 12u);
    EXPECT_EQ(chunk.size(), 5u);
    EXPECT_TRUE(chunk.hash.empty());
}

}  // namespace arbor::transfer::test
