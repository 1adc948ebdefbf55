/**
 * @file test_types.cpp
 * @brief Construction-time validation of run entities
 */

#include "evmverify/types.hpp"

#include <gtest/gtest.h>

namespace evmverify::test {

TEST(Address, ParsesCaseInsensitiveAndRendersLowercase)
{
    auto address = Address::parse("0x000000000022D473030F116dDEE9F6B43aC78BA3");
    ASSERT_TRUE(address);
    EXPECT_EQ(address->to_string(), "0x000000000022d473030f116ddee9f6b43ac78ba3");
    EXPECT_FALSE(address->is_zero());
}

TEST(Address, RejectsWrongLength)
{
    auto address = Address::parse("0x1234");
    ASSERT_FALSE(address);
    EXPECT_EQ(address.error().code, "InvalidAddress");
}

TEST(Address, RejectsNonHex)
{
    EXPECT_FALSE(Address::parse("0xg00000000022d473030f116ddee9f6b43ac78ba3"));
}

TEST(Address, ZeroAddress)
{
    auto zero = Address::parse("0x0000000000000000000000000000000000000000");
    ASSERT_TRUE(zero);
    EXPECT_TRUE(zero->is_zero());
}

TEST(ContractRequest, RejectsZeroAddress)
{
    auto request = ContractRequest::make("Unused", Address{});
    ASSERT_FALSE(request);
    EXPECT_EQ(request.error().code, "ZeroAddress");
}

TEST(ContractRequest, KeepsAliasAndLeavesCanonicalNameEmpty)
{
    auto address = Address::parse("0x1111111111111111111111111111111111111111");
    ASSERT_TRUE(address);
    auto request = ContractRequest::make("evc", *address);
    ASSERT_TRUE(request);
    EXPECT_EQ(request->alias, "evc");
    EXPECT_TRUE(request->canonical_name.empty());
}

TEST(SemanticVersion, ParsesSolcLongVersion)
{
    auto version = SemanticVersion::parse("v0.8.17+commit.8df45f5f");
    ASSERT_TRUE(version);
    EXPECT_EQ(version->major, 0);
    EXPECT_EQ(version->minor, 8);
    EXPECT_EQ(version->patch, 17);
    EXPECT_EQ(version->build, "commit.8df45f5f");
    EXPECT_EQ(version->short_string(), "0.8.17");
    EXPECT_EQ(version->to_string(), "0.8.17+commit.8df45f5f");
}

TEST(SemanticVersion, ParsesPrerelease)
{
    auto version = SemanticVersion::parse("0.8.26-nightly.2024.5.1+commit.abc");
    ASSERT_TRUE(version);
    EXPECT_EQ(version->prerelease, "nightly.2024.5.1");
    EXPECT_EQ(version->short_string(), "0.8.26");
}

TEST(SemanticVersion, RejectsIncompleteVersion)
{
    EXPECT_FALSE(SemanticVersion::parse("0.8"));
    EXPECT_FALSE(SemanticVersion::parse("0.8.x"));
    EXPECT_FALSE(SemanticVersion::parse(""));
}

TEST(EvmTarget, ParsesCaseInsensitively)
{
    auto target = parse_evm_target("Shanghai");
    ASSERT_TRUE(target);
    EXPECT_EQ(*target, EvmTarget::kShanghai);
    auto camel = parse_evm_target("TANGERINEWHISTLE");
    ASSERT_TRUE(camel);
    EXPECT_EQ(*camel, EvmTarget::kTangerineWhistle);
}

TEST(EvmTarget, EmptyAndDefaultMapToDefault)
{
    auto empty = parse_evm_target("");
    auto named = parse_evm_target("default");
    ASSERT_TRUE(empty);
    ASSERT_TRUE(named);
    EXPECT_EQ(*empty, EvmTarget::kDefault);
    EXPECT_EQ(*named, EvmTarget::kDefault);
}

TEST(EvmTarget, RejectsUnknownTarget)
{
    auto target = parse_evm_target("osaka-next");
    ASSERT_FALSE(target);
    EXPECT_EQ(target.error().code, "InvalidEvmTarget");
}

TEST(CompilerSettings, RejectsNegativeRuns)
{
    auto version = SemanticVersion::parse("0.8.17");
    ASSERT_TRUE(version);
    EXPECT_FALSE(CompilerSettings::make(*version, true, -1, EvmTarget::kLondon, false));
}

TEST(CompilerSettings, EqualityCoversEveryField)
{
    auto version = SemanticVersion::parse("0.8.17");
    ASSERT_TRUE(version);
    auto base = CompilerSettings::make(*version, true, 200, EvmTarget::kLondon, false);
    auto same = CompilerSettings::make(*version, true, 200, EvmTarget::kLondon, false);
    auto via_ir = CompilerSettings::make(*version, true, 200, EvmTarget::kLondon, true);
    auto target = CompilerSettings::make(*version, true, 200, EvmTarget::kParis, false);
    ASSERT_TRUE(base && same && via_ir && target);
    EXPECT_EQ(*base, *same);
    EXPECT_NE(*base, *via_ir);
    EXPECT_NE(*base, *target);
}

TEST(CompilerSettings, JsonForm)
{
    auto version = SemanticVersion::parse("v0.8.17+commit.8df45f5f");
    ASSERT_TRUE(version);
    auto settings = CompilerSettings::make(*version, true, 1000000, EvmTarget::kLondon, true);
    ASSERT_TRUE(settings);
    const auto json = settings->to_json();
    EXPECT_EQ(json.at("compiler_version"), "0.8.17+commit.8df45f5f");
    EXPECT_EQ(json.at("optimizer_runs"), 1000000);
    EXPECT_EQ(json.at("evm_target"), "london");
    EXPECT_EQ(json.at("via_ir"), true);
}

}  // namespace evmverify::test
