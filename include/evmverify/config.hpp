#pragma once

/**
 * @file config.hpp
 * @brief Run configuration (verify_config.v1) with built-in defaults
 */

#include "evmverify/common.hpp"
#include "evmverify/explorer.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

namespace evmverify::config {

struct VerifierConfig
{
    std::string explorer_api = "https://www.hyperscan.com/api/v2";
    std::string rpc_url = "https://rpc.hyperliquid.xyz/evm";
    std::size_t fetch_jobs = 8;
    std::size_t build_jobs = 2;
    std::chrono::seconds build_timeout{900};
    std::chrono::seconds http_timeout{30};
    explorer::RetryPolicy retry;
    std::filesystem::path workspace_root = default_workspace_root();
    bool keep_workspaces = false;
    std::string git = "git";
    std::string forge = "forge";
    std::string remote_url_template = "https://github.com/{repo}.git";
    std::map<std::string, std::filesystem::path> local_repos;
    std::filesystem::path address_dir = "addresses/999";

    /// <temp>/evmverify-workspaces
    [[nodiscard]] static std::filesystem::path default_workspace_root();
};

/**
 * @brief Overlay the keys present in @p document onto the defaults
 *
 * Relative local_repos paths are resolved against @p base_dir.
 */
[[nodiscard]] Result<VerifierConfig> config_from_json(const nlohmann::json& document,
                                                      const std::filesystem::path& base_dir);

/**
 * @brief Load, validate (verify_config.v1) and overlay a config file
 */
[[nodiscard]] Result<VerifierConfig> load_config_file(const std::filesystem::path& path,
                                                      const std::filesystem::path& schema_dir);

}  // namespace evmverify::config
