/**
 * @file test_reconciler.cpp
 * @brief foundry.toml patching and restoration
 */

#include "evmverify/outcome.hpp"
#include "evmverify/reconciler.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

namespace evmverify::reconciler::test {

namespace {

CompilerSettings make_settings(EvmTarget target = EvmTarget::kLondon)
{
    auto version = SemanticVersion::parse("v0.8.17+commit.8df45f5f");
    auto settings = CompilerSettings::make(*version, true, 1000000, target, true);
    return *settings;
}

std::string read_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void write_file(const std::filesystem::path& path, const std::string& text)
{
    std::ofstream out(path, std::ios::binary);
    out << text;
}

constexpr const char* kOriginalConfig = R"([profile.default]
src = "src"
solc = "0.8.24"
  optimizer = false
evm_version = "cancun"

[profile.ci]
optimizer_runs = 1
)";

class ReconcilerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_dir = std::filesystem::temp_directory_path()
                / (std::string("evmverify_reconciler_")
                   + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    [[nodiscard]] std::filesystem::path config_path() const { return m_dir / kFoundryConfig; }

    std::filesystem::path m_dir;
};

}  // namespace

TEST(PatchFoundryConfig, RewritesExistingKeysInPlace)
{
    const auto patched = patch_foundry_config(kOriginalConfig, make_settings());
    EXPECT_NE(patched.find("solc = \"0.8.17\"\n"), std::string::npos);
    EXPECT_NE(patched.find("  optimizer = true\n"), std::string::npos);
    EXPECT_NE(patched.find("evm_version = \"london\"\n"), std::string::npos);
    EXPECT_EQ(patched.find("0.8.24"), std::string::npos);
    EXPECT_EQ(patched.find("cancun"), std::string::npos);
    EXPECT_NE(patched.find("src = \"src\"\n"), std::string::npos);
}

TEST(PatchFoundryConfig, InsertsMissingKeysUnderHeader)
{
    const auto patched = patch_foundry_config(kOriginalConfig, make_settings());
    const auto header = patched.find("[profile.default]");
    const auto runs = patched.find("optimizer_runs = 1000000");
    const auto ci = patched.find("[profile.ci]");
    ASSERT_NE(runs, std::string::npos);
    EXPECT_LT(header, runs);
    EXPECT_LT(runs, ci);
    EXPECT_NE(patched.find("via_ir = true"), std::string::npos);
    EXPECT_NE(patched.find("script = \"disabled_script\""), std::string::npos);
    EXPECT_NE(patched.find("test = \"disabled_test\""), std::string::npos);
    // Other profiles are untouched
    EXPECT_NE(patched.find("optimizer_runs = 1\n"), std::string::npos);
}

TEST(PatchFoundryConfig, AppendsMissingSection)
{
    const auto patched = patch_foundry_config("[rpc_endpoints]\nmainnet = \"x\"\n", make_settings());
    EXPECT_TRUE(patched.starts_with("[rpc_endpoints]\nmainnet = \"x\"\n\n[profile.default]\n"));
    EXPECT_NE(patched.find("solc = \"0.8.17\""), std::string::npos);
}

TEST(PatchFoundryConfig, SolcVersionAliasIsRewritten)
{
    const auto patched =
        patch_foundry_config("[profile.default]\nsolc_version = \"0.8.20\"\n", make_settings());
    EXPECT_NE(patched.find("solc_version = \"0.8.17\""), std::string::npos);
    EXPECT_EQ(patched.find("\nsolc = "), std::string::npos);
}

TEST(PatchFoundryConfig, DefaultTargetLeavesEvmVersionAlone)
{
    const auto patched = patch_foundry_config(kOriginalConfig, make_settings(EvmTarget::kDefault));
    EXPECT_NE(patched.find("evm_version = \"cancun\""), std::string::npos);
}

TEST(PatchFoundryConfig, Deterministic)
{
    EXPECT_EQ(patch_foundry_config(kOriginalConfig, make_settings()),
              patch_foundry_config(kOriginalConfig, make_settings()));
}

TEST_F(ReconcilerTest, RestoresAfterSuccessfulBody)
{
    write_file(config_path(), kOriginalConfig);
    const CompilerSettingsReconciler reconciler;
    bool patched_during_body = false;
    auto result = reconciler.with_settings(m_dir, make_settings(), [&]() -> VoidResult {
        patched_during_body = read_file(config_path()).find("0.8.17") != std::string::npos;
        return {};
    });
    ASSERT_TRUE(result);
    EXPECT_TRUE(patched_during_body);
    EXPECT_EQ(read_file(config_path()), kOriginalConfig);
}

TEST_F(ReconcilerTest, RestoresAfterFailedBodyAndKeepsItsError)
{
    write_file(config_path(), kOriginalConfig);
    const CompilerSettingsReconciler reconciler;
    auto result = reconciler.with_settings(m_dir, make_settings(), []() -> VoidResult {
        return std::unexpected(Error::make(std::string(error_code::kBuildFailure), "solc exploded"));
    });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, error_code::kBuildFailure);
    EXPECT_EQ(read_file(config_path()), kOriginalConfig);
}

TEST_F(ReconcilerTest, RestoresWhenBodyThrows)
{
    write_file(config_path(), kOriginalConfig);
    const CompilerSettingsReconciler reconciler;
    EXPECT_THROW(
        {
            [[maybe_unused]] auto result =
                reconciler.with_settings(m_dir, make_settings(), []() -> VoidResult {
                    throw std::runtime_error("interrupted");
                });
        },
        std::runtime_error);
    EXPECT_EQ(read_file(config_path()), kOriginalConfig);
}

TEST_F(ReconcilerTest, CreatedConfigIsRemovedAfterwards)
{
    const CompilerSettingsReconciler reconciler;
    bool existed_during_body = false;
    auto result = reconciler.with_settings(m_dir, make_settings(), [&]() -> VoidResult {
        existed_during_body = std::filesystem::exists(config_path());
        return {};
    });
    ASSERT_TRUE(result);
    EXPECT_TRUE(existed_during_body);
    EXPECT_FALSE(std::filesystem::exists(config_path()));
}

TEST_F(ReconcilerTest, ScopedRestoreOnDestruction)
{
    write_file(config_path(), "original\n");
    {
        auto guard = ScopedFileRestore::capture(config_path());
        ASSERT_TRUE(guard);
        write_file(config_path(), "changed\n");
    }
    EXPECT_EQ(read_file(config_path()), "original\n");
}

TEST_F(ReconcilerTest, MovedGuardRestoresOnce)
{
    write_file(config_path(), "original\n");
    {
        auto guard = ScopedFileRestore::capture(config_path());
        ASSERT_TRUE(guard);
        ScopedFileRestore owner(std::move(*guard));
        write_file(config_path(), "changed\n");
        ASSERT_TRUE(owner.restore());
        write_file(config_path(), "after restore\n");
    }
    EXPECT_EQ(read_file(config_path()), "after restore\n");
}

TEST_F(ReconcilerTest, UnwritableDirectoryIsWorkspaceUnavailable)
{
    const CompilerSettingsReconciler reconciler;
    auto result = reconciler.with_settings(m_dir / "missing" / "dir", make_settings(),
                                           []() -> VoidResult { return {}; });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, error_code::kWorkspaceUnavailable);
}

}  // namespace evmverify::reconciler::test
