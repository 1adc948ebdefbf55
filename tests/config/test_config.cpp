/**
 * @file test_config.cpp
 * @brief Configuration defaults and overlay
 */

#include "evmverify/config.hpp"
#include "evmverify/outcome.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

namespace evmverify::config::test {

TEST(Config, EmptyDocumentKeepsDefaults)
{
    auto config = config_from_json(nlohmann::json::object(), "/etc/evmverify");
    ASSERT_TRUE(config);
    const VerifierConfig defaults;
    EXPECT_EQ(config->explorer_api, defaults.explorer_api);
    EXPECT_EQ(config->fetch_jobs, 8U);
    EXPECT_EQ(config->build_jobs, 2U);
    EXPECT_EQ(config->build_timeout, std::chrono::seconds(900));
    EXPECT_EQ(config->retry.max_attempts, 4);
    EXPECT_FALSE(config->keep_workspaces);
    EXPECT_EQ(config->remote_url_template, "https://github.com/{repo}.git");
    EXPECT_EQ(config->workspace_root.filename(), "evmverify-workspaces");
}

TEST(Config, PresentKeysOverrideDefaults)
{
    const nlohmann::json document = {
        {"explorer_api", "https://explorer.example/api/v2"},
        {"fetch_jobs", 16},
        {"build_jobs", 1},
        {"build_timeout_seconds", 120},
        {"retry", {{"max_attempts", 2}, {"base_delay_ms", 10}, {"max_delay_ms", 20}}},
        {"keep_workspaces", true},
        {"forge", "/opt/foundry/bin/forge"},
    };
    auto config = config_from_json(document, "/etc/evmverify");
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->explorer_api, "https://explorer.example/api/v2");
    EXPECT_EQ(config->fetch_jobs, 16U);
    EXPECT_EQ(config->build_jobs, 1U);
    EXPECT_EQ(config->build_timeout, std::chrono::seconds(120));
    EXPECT_EQ(config->retry.max_attempts, 2);
    EXPECT_EQ(config->retry.base_delay, std::chrono::milliseconds(10));
    EXPECT_EQ(config->retry.max_delay, std::chrono::milliseconds(20));
    EXPECT_TRUE(config->keep_workspaces);
    EXPECT_EQ(config->forge, "/opt/foundry/bin/forge");
    EXPECT_EQ(config->git, "git");
}

TEST(Config, RelativeLocalReposResolveAgainstConfigDirectory)
{
    const nlohmann::json document = {
        {"local_repos", {{"org/vaults", "../vaults"}, {"org/router", "/src/router"}}},
    };
    auto config = config_from_json(document, "/work/config");
    ASSERT_TRUE(config);
    EXPECT_EQ(config->local_repos.at("org/vaults"), std::filesystem::path("/work/config/../vaults"));
    EXPECT_EQ(config->local_repos.at("org/router"), std::filesystem::path("/src/router"));
}

TEST(Config, InvalidValuesAreRejected)
{
    EXPECT_FALSE(config_from_json(nlohmann::json{{"fetch_jobs", 0}}, "."));
    EXPECT_FALSE(config_from_json(nlohmann::json{{"build_jobs", "two"}}, "."));
    auto inverted = config_from_json(
        nlohmann::json{{"retry", {{"base_delay_ms", 500}, {"max_delay_ms", 100}}}}, ".");
    ASSERT_FALSE(inverted);
    EXPECT_EQ(inverted.error().code, error_code::kParseError);
    EXPECT_FALSE(config_from_json(nlohmann::json::array(), "."));
}

class ConfigFileTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_dir = std::filesystem::temp_directory_path() / "evmverify_config_test";
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::filesystem::path m_dir;
};

TEST_F(ConfigFileTest, LoadsValidatedFile)
{
    const auto path = m_dir / "evmverify.json";
    std::ofstream(path) << R"({"build_jobs": 4, "local_repos": {"org/vaults": "vaults"}})";
    auto config = load_config_file(path, EVMVERIFY_SCHEMA_DIR);
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->build_jobs, 4U);
    EXPECT_EQ(config->local_repos.at("org/vaults"), m_dir / "vaults");
}

TEST_F(ConfigFileTest, UnknownKeyFailsSchema)
{
    const auto path = m_dir / "evmverify.json";
    std::ofstream(path) << R"({"build_jobz": 4})";
    auto config = load_config_file(path, EVMVERIFY_SCHEMA_DIR);
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, error_code::kSchemaValidationFailed);
}

TEST_F(ConfigFileTest, TemplateWithoutPlaceholderFailsSchema)
{
    const auto path = m_dir / "evmverify.json";
    std::ofstream(path) << R"({"remote_url_template": "https://github.com/fixed.git"})";
    EXPECT_FALSE(load_config_file(path, EVMVERIFY_SCHEMA_DIR));
}

}  // namespace evmverify::config::test
