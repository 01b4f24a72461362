/**
 * @file test_upload_policy.cpp
 * @brief Unit tests for path sanitizing, size parsing and upload limits
 */

#include <gtest/gtest.h>

#include <arbor/transfer/upload/upload_policy.h>

#include <string>

namespace arbor::transfer::test {

// ============================================================================
// sanitize_path
// ============================================================================

TEST(SanitizePathTest, KeepsPlainRelativePaths) {
    EXPECT_EQ(sanitize_path("photos/2024/beach.jpg"), "photos/2024/beach.jpg");
    EXPECT_EQ(sanitize_path("file.txt"), "file.txt");
}

TEST(SanitizePathTest, StripsLeadingSeparatorsAndDots) {
    EXPECT_EQ(sanitize_path("/etc/hosts"), "etc/hosts");
    EXPECT_EQ(sanitize_path("///a//b/"), "a/b");
    EXPECT_EQ(sanitize_path("./a/./b"), "a/b");
}

TEST(SanitizePathTest, ParentSegmentsNeverEscape) {
    EXPECT_EQ(sanitize_path("../../etc/passwd"), "etc/passwd");
    EXPECT_EQ(sanitize_path("a/b/../c.txt"), "a/c.txt");
    EXPECT_EQ(sanitize_path("a/../../b"), "b");
}

TEST(SanitizePathTest, BackslashesAreSeparators) {
    EXPECT_EQ(sanitize_path("dir\\sub\\file.bin"), "dir/sub/file.bin");
    EXPECT_EQ(sanitize_path("..\\..\\windows\\system.ini"), "windows/system.ini");
}

TEST(SanitizePathTest, NothingLeft) {
    EXPECT_EQ(sanitize_path(""), "");
    EXPECT_EQ(sanitize_path("/"), "");
    EXPECT_EQ(sanitize_path("../.."), "");
    EXPECT_EQ(sanitize_path("./."), "");
}

// ============================================================================
// parse_size
// ============================================================================

TEST(ParseSizeTest, Units) {
    EXPECT_EQ(parse_size("512").value(), 512u);
    EXPECT_EQ(parse_size("512B").value(), 512u);
    EXPECT_EQ(parse_size("4KB").value(), 4096u);
    EXPECT_EQ(parse_size("100MB").value(), 100ULL * 1024 * 1024);
    EXPECT_EQ(parse_size("2GB").value(), 2ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(parse_size("1TB").value(), 1ULL << 40);
}

TEST(ParseSizeTest, CaseSpacesAndFractions) {
    EXPECT_EQ(parse_size("10mb").value(), 10ULL * 1024 * 1024);
    EXPECT_EQ(parse_size(" 1.5 GB ").value(), 1536ULL * 1024 * 1024);
    EXPECT_EQ(parse_size("0.5KB").value(), 512u);
}

TEST(ParseSizeTest, RejectsGarbage) {
    for (const char* text : {"", "MB", "abc", "12XB", "-5MB", "1..5GB"}) {
        auto parsed = parse_size(text);
        ASSERT_FALSE(parsed.has_value()) << text;
        EXPECT_EQ(parsed.error().code, error_code::invalid_configuration);
    }
}

// ============================================================================
// upload_policy
// ============================================================================

class UploadPolicyTest : public ::testing::Test {
protected:
    static auto make_meta(const std::string& path, uint64_t size) -> file_metadata {
        file_metadata meta;
        meta.relative_path = path;
        meta.original_name = std::filesystem::path(path).filename().string();
        meta.size = size;
        return meta;
    }

    upload_policy policy_;
};

TEST_F(UploadPolicyTest, DefaultsAreValid) {
    EXPECT_EQ(policy_.max_file_size, 10ULL * 1024 * 1024 * 1024);
    EXPECT_EQ(policy_.look_ahead, 4u);
    EXPECT_TRUE(policy_.validate().has_value());
}

TEST_F(UploadPolicyTest, ValidateRejectsZeroes) {
    auto policy = policy_;
    policy.look_ahead = 0;
    EXPECT_FALSE(policy.validate().has_value());

    policy = policy_;
    policy.chunk_size = 0;
    auto chunks = policy.validate();
    ASSERT_FALSE(chunks.has_value());
    EXPECT_EQ(chunks.error().code, error_code::invalid_chunk_size);

    policy = policy_;
    policy.max_file_size = 0;
    EXPECT_FALSE(policy.validate().has_value());
}

TEST_F(UploadPolicyTest, EmptyListsAllowEverything) {
    EXPECT_TRUE(policy_.is_extension_allowed("report.pdf"));
    EXPECT_TRUE(policy_.is_extension_allowed("Makefile"));
}

TEST_F(UploadPolicyTest, AllowListIsCaseInsensitive) {
    policy_.allowed_extensions = {".jpg", ".PNG"};
    EXPECT_TRUE(policy_.is_extension_allowed("a.JPG"));
    EXPECT_TRUE(policy_.is_extension_allowed("b.png"));
    EXPECT_FALSE(policy_.is_extension_allowed("c.gif"));
    EXPECT_FALSE(policy_.is_extension_allowed("noext"));
}

TEST_F(UploadPolicyTest, BlockListWins) {
    policy_.allowed_extensions = {".exe", ".txt"};
    policy_.blocked_extensions = {".exe"};
    EXPECT_FALSE(policy_.is_extension_allowed("setup.EXE"));
    EXPECT_TRUE(policy_.is_extension_allowed("notes.txt"));
}

TEST_F(UploadPolicyTest, CheckRejectsOversizedFile) {
    policy_.max_file_size = 1000;
    EXPECT_TRUE(policy_.check(make_meta("ok.bin", 1000)).has_value());

    auto big = policy_.check(make_meta("big.bin", 1001));
    ASSERT_FALSE(big.has_value());
    EXPECT_EQ(big.error().code, error_code::file_too_large);
}

TEST_F(UploadPolicyTest, CheckRejectsBlockedExtension) {
    policy_.blocked_extensions = {".sh"};
    auto blocked = policy_.check(make_meta("scripts/run.sh", 10));
    ASSERT_FALSE(blocked.has_value());
    EXPECT_EQ(blocked.error().code, error_code::extension_not_allowed);
}

TEST_F(UploadPolicyTest, CheckRejectsEmptyPath) {
    auto meta = make_meta("../..", 10);
    meta.original_name = "x.txt";
    auto rejected = policy_.check(meta);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, error_code::invalid_file_path);
}

}  // namespace arbor::transfer::test
