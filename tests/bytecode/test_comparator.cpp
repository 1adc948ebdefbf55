/**
 * @file test_comparator.cpp
 * @brief Exact comparison of normalized bytecode
 */

#include "evmverify/bytecode.hpp"

#include <gtest/gtest.h>

namespace evmverify::bytecode::test {

TEST(Comparator, IdenticalCodeMatches)
{
    const Bytes code = {0x60, 0x80, 0x60, 0x40, 0x52};
    auto verdict = compare(code, code);
    EXPECT_TRUE(verdict.matched);
    EXPECT_FALSE(verdict.first_diff_offset);
    EXPECT_TRUE(verdict.deployed_context.empty());
}

TEST(Comparator, EmptyBlobsMatch)
{
    EXPECT_TRUE(compare(Bytes{}, Bytes{}).matched);
}

TEST(Comparator, ReportsFirstDifferingByte)
{
    const Bytes deployed = {0x60, 0x80, 0x60, 0x40, 0x52};
    const Bytes compiled = {0x60, 0x80, 0x60, 0x60, 0x52};
    auto verdict = compare(deployed, compiled);
    EXPECT_FALSE(verdict.matched);
    ASSERT_TRUE(verdict.first_diff_offset);
    EXPECT_EQ(*verdict.first_diff_offset, 3U);
    EXPECT_EQ(verdict.deployed_context, "6080604052");
    EXPECT_EQ(verdict.compiled_context, "6080606052");
}

TEST(Comparator, LengthOnlyDifferenceReportsShorterLength)
{
    const Bytes deployed = {0x01, 0x02, 0x03};
    const Bytes compiled = {0x01, 0x02, 0x03, 0x04};
    auto verdict = compare(deployed, compiled);
    EXPECT_FALSE(verdict.matched);
    ASSERT_TRUE(verdict.first_diff_offset);
    EXPECT_EQ(*verdict.first_diff_offset, 3U);
    EXPECT_EQ(verdict.deployed_size, 3U);
    EXPECT_EQ(verdict.compiled_size, 4U);
    EXPECT_EQ(verdict.compiled_context, "01020304");
}

TEST(Comparator, ContextWindowIsBounded)
{
    Bytes deployed(100, 0x00);
    Bytes compiled(100, 0x00);
    compiled[50] = 0xff;
    auto verdict = compare(deployed, compiled);
    ASSERT_TRUE(verdict.first_diff_offset);
    EXPECT_EQ(*verdict.first_diff_offset, 50U);
    // 16 bytes either side, hex encoded
    EXPECT_EQ(verdict.compiled_context.size(), 64U);
    EXPECT_EQ(verdict.compiled_context.substr(32, 2), "ff");
}

}  // namespace evmverify::bytecode::test
