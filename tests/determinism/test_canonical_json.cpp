/**
 * @file test_canonical_json.cpp
 * @brief Canonical JSON determinism tests
 */

#include "evmverify/canonical_json.hpp"
#include "evmverify/types.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace evmverify::canonical;
using Json = nlohmann::json;

namespace {

evmverify::CompilerSettings settings_for(int runs)
{
    auto version = evmverify::SemanticVersion::parse("v0.8.24+commit.e11b9ed9");
    auto settings = evmverify::CompilerSettings::make(*version, true, runs,
                                                      evmverify::EvmTarget::kCancun, false);
    return *settings;
}

}  // namespace

TEST(CanonicalJSON, SortsKeysAtEveryLevel)
{
    Json j = {
        {"repository", "org/vaults"},
        {  "settings", {{"via_ir", false}, {"optimizer", true}}}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, R"({"repository":"org/vaults","settings":{"optimizer":true,"via_ir":false}})");
}

TEST(CanonicalJSON, NoWhitespace)
{
    auto canonical = canonicalize(settings_for(200).to_json());
    ASSERT_TRUE(canonical);
    EXPECT_EQ(canonical->find(' '), std::string::npos);
    EXPECT_EQ(canonical->find('\n'), std::string::npos);
}

TEST(CanonicalJSON, FloatRejection)
{
    EXPECT_FALSE(canonicalize(Json{
        {"runs", 200.5}
    }));
    EXPECT_FALSE(validate_for_canonical(Json{
        {"nested", {{"ratio", 0.25}}}
    }));
}

TEST(CanonicalJSON, IntegersAndArraysAllowed)
{
    auto canonical = canonicalize(Json{
        {"offsets", {32, 0, 64}}
    });
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, R"({"offsets":[32,0,64]})");
}

TEST(CanonicalJSON, InsertionOrderDoesNotChangeHash)
{
    Json j1;
    j1["repository"] = "org/vaults";
    j1["ref"] = "v1.2.0";

    Json j2;
    j2["ref"] = "v1.2.0";
    j2["repository"] = "org/vaults";

    auto h1 = hash_canonical(j1);
    auto h2 = hash_canonical(j2);
    ASSERT_TRUE(h1);
    ASSERT_TRUE(h2);
    EXPECT_EQ(*h1, *h2);
    EXPECT_TRUE(h1->starts_with("sha256:"));
}

TEST(CanonicalJSON, SettingsHashTracksEveryField)
{
    auto h200 = hash_canonical(settings_for(200).to_json());
    auto h201 = hash_canonical(settings_for(201).to_json());
    auto again = hash_canonical(settings_for(200).to_json());
    ASSERT_TRUE(h200);
    ASSERT_TRUE(h201);
    ASSERT_TRUE(again);
    EXPECT_EQ(*h200, *again);
    EXPECT_NE(*h200, *h201);
}
