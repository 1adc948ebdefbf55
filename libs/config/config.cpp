/**
 * @file config.cpp
 * @brief Configuration loading
 */

#include "evmverify/config.hpp"

#include "evmverify/json_io.hpp"
#include "evmverify/outcome.hpp"
#include "evmverify/version.hpp"

#include <cstdint>
#include <format>
#include <system_error>
#include <utility>

namespace evmverify::config {

namespace {

[[nodiscard]] Error config_error(std::string message)
{
    return Error::make(std::string(error_code::kParseError), std::move(message));
}

/**
 * @brief Read a positive integer key; absent keys leave @p out untouched
 */
template <typename T>
[[nodiscard]] VoidResult read_positive(const nlohmann::json& document, const char* key, T& out)
{
    if (!document.contains(key)) {
        return {};
    }
    const auto& value = document.at(key);
    if (!value.is_number_integer() || value.get<std::int64_t>() < 1) {
        return std::unexpected(config_error(std::format("'{}' must be a positive integer", key)));
    }
    out = static_cast<T>(value.get<std::int64_t>());
    return {};
}

void read_string(const nlohmann::json& document, const char* key, std::string& out)
{
    if (document.contains(key) && document.at(key).is_string()) {
        out = document.at(key).get<std::string>();
    }
}

}  // namespace

std::filesystem::path VerifierConfig::default_workspace_root()
{
    std::error_code ec;
    auto temp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        temp = "/tmp";
    }
    return temp / "evmverify-workspaces";
}

Result<VerifierConfig> config_from_json(const nlohmann::json& document,
                                        const std::filesystem::path& base_dir)
{
    if (!document.is_object()) {
        return std::unexpected(config_error("Configuration must be a JSON object"));
    }
    VerifierConfig config;
    read_string(document, "explorer_api", config.explorer_api);
    read_string(document, "rpc_url", config.rpc_url);
    read_string(document, "git", config.git);
    read_string(document, "forge", config.forge);
    read_string(document, "remote_url_template", config.remote_url_template);

    std::int64_t build_timeout = config.build_timeout.count();
    std::int64_t http_timeout = config.http_timeout.count();
    for (auto result : {read_positive(document, "fetch_jobs", config.fetch_jobs),
                        read_positive(document, "build_jobs", config.build_jobs),
                        read_positive(document, "build_timeout_seconds", build_timeout),
                        read_positive(document, "http_timeout_seconds", http_timeout)}) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }
    config.build_timeout = std::chrono::seconds(build_timeout);
    config.http_timeout = std::chrono::seconds(http_timeout);

    if (document.contains("retry")) {
        const auto& retry = document.at("retry");
        int attempts = config.retry.max_attempts;
        std::int64_t base = config.retry.base_delay.count();
        std::int64_t max = config.retry.max_delay.count();
        for (auto result : {read_positive(retry, "max_attempts", attempts),
                            read_positive(retry, "base_delay_ms", base),
                            read_positive(retry, "max_delay_ms", max)}) {
            if (!result) {
                return std::unexpected(result.error());
            }
        }
        if (base > max) {
            return std::unexpected(config_error("retry.base_delay_ms exceeds retry.max_delay_ms"));
        }
        config.retry = explorer::RetryPolicy{.max_attempts = attempts,
                                             .base_delay = std::chrono::milliseconds(base),
                                             .max_delay = std::chrono::milliseconds(max)};
    }

    if (document.contains("workspace_root") && document.at("workspace_root").is_string()) {
        config.workspace_root = document.at("workspace_root").get<std::string>();
    }
    if (document.contains("keep_workspaces") && document.at("keep_workspaces").is_boolean()) {
        config.keep_workspaces = document.at("keep_workspaces").get<bool>();
    }
    if (document.contains("address_dir") && document.at("address_dir").is_string()) {
        config.address_dir = document.at("address_dir").get<std::string>();
    }
    if (document.contains("local_repos") && document.at("local_repos").is_object()) {
        for (const auto& [repository, path] : document.at("local_repos").items()) {
            if (!path.is_string()) {
                return std::unexpected(
                    config_error(std::format("local_repos['{}'] must be a path", repository)));
            }
            std::filesystem::path local = path.get<std::string>();
            config.local_repos[repository] = local.is_absolute() ? local : base_dir / local;
        }
    }
    return config;
}

Result<VerifierConfig> load_config_file(const std::filesystem::path& path,
                                        const std::filesystem::path& schema_dir)
{
    auto document = common::read_validated_json_file(path, schema_dir, kConfigSchemaVersion);
    if (!document) {
        return std::unexpected(document.error());
    }
    return config_from_json(*document, path.parent_path());
}

}  // namespace evmverify::config
