/**
 * @file test_version.cpp
 * @brief Unit tests for version information
 */

#include <gtest/gtest.h>
#include <arbor/transfer/transfer.h>

namespace arbor::transfer::test {

TEST(VersionTest, Components) {
    EXPECT_EQ(version::major, 0);
    EXPECT_EQ(version::minor, 1);
    EXPECT_EQ(version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_EQ(version::to_string(), "0.1.0");
}

}  // namespace arbor::transfer::test
