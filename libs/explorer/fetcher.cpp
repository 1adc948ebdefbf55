/**
 * @file fetcher.cpp
 * @brief Explorer / RPC lookups with bounded retry
 */

#include "evmverify/explorer.hpp"

#include "evmverify/outcome.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <system_error>
#include <thread>
#include <utility>

namespace evmverify::explorer {

namespace {

/// forge's default when the explorer omits a run count
constexpr std::int64_t kDefaultOptimizerRuns = 200;

[[nodiscard]] Error permanent(std::string message)
{
    return Error::make(std::string(error_code::kNetworkPermanent), std::move(message));
}

[[nodiscard]] std::string string_field(const nlohmann::json& j, const char* key)
{
    if (!j.is_object()) {
        return {};
    }
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

[[nodiscard]] bool bool_field(const nlohmann::json& j, const char* key, bool fallback)
{
    if (!j.is_object()) {
        return fallback;
    }
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

[[nodiscard]] Result<std::int64_t> runs_field(const nlohmann::json& metadata)
{
    auto it = metadata.find("optimization_runs");
    if (it == metadata.end() || it->is_null()) {
        return kDefaultOptimizerRuns;
    }
    if (it->is_number_integer()) {
        return it->get<std::int64_t>();
    }
    if (it->is_string()) {
        const auto& text = it->get_ref<const std::string&>();
        std::int64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return value;
        }
    }
    return std::unexpected(permanent(
        std::format("Explorer reported unusable optimization_runs: {}", it->dump())));
}

[[nodiscard]] Result<Bytes> decode_code(const std::string& hex, std::string_view what)
{
    auto bytes = common::from_hex(hex);
    if (!bytes) {
        return std::unexpected(
            permanent(std::format("Malformed {} from explorer: {}", what, bytes.error().message)));
    }
    return bytes;
}

}  // namespace

bool is_transient_status(int status) noexcept
{
    return status == 429 || (status >= 500 && status <= 599);
}

std::chrono::milliseconds backoff_ceiling(const RetryPolicy& policy, int attempt) noexcept
{
    auto ceiling = policy.base_delay;
    for (int i = 0; i < attempt && ceiling < policy.max_delay; ++i) {
        ceiling *= 2;
    }
    return std::min(ceiling, policy.max_delay);
}

Result<CompilerSettings> settings_from_metadata(const nlohmann::json& metadata)
{
    auto version = SemanticVersion::parse(string_field(metadata, "compiler_version"));
    if (!version) {
        return std::unexpected(permanent(version.error().message));
    }
    auto runs = runs_field(metadata);
    if (!runs) {
        return std::unexpected(runs.error());
    }

    const nlohmann::json compiler_settings =
        metadata.contains("compiler_settings") ? metadata.at("compiler_settings")
                                               : nlohmann::json::object();
    std::string evm_text = string_field(metadata, "evm_version");
    if (evm_text.empty()) {
        evm_text = string_field(compiler_settings, "evmVersion");
    }
    auto target = parse_evm_target(evm_text);
    if (!target) {
        return std::unexpected(permanent(target.error().message));
    }

    auto settings = CompilerSettings::make(std::move(*version),
                                           bool_field(metadata, "optimization_enabled", false),
                                           *runs,
                                           *target,
                                           bool_field(compiler_settings, "viaIR", false));
    if (!settings) {
        return std::unexpected(permanent(settings.error().message));
    }
    return settings;
}

DeploymentInfoFetcher::DeploymentInfoFetcher(HttpTransport& transport,
                                             ExplorerEndpoints endpoints,
                                             RetryPolicy retry,
                                             Sleeper sleeper,
                                             std::uint64_t seed)
    : m_transport(transport)
    , m_endpoints(std::move(endpoints))
    , m_retry(retry)
    , m_sleeper(std::move(sleeper))
    , m_rng(seed)
{
    if (!m_sleeper) {
        m_sleeper = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::chrono::milliseconds DeploymentInfoFetcher::jittered_delay(int attempt)
{
    const auto ceiling = backoff_ceiling(m_retry, attempt);
    std::uniform_int_distribution<std::chrono::milliseconds::rep> dist(0, ceiling.count());
    std::lock_guard lock(m_rng_mutex);
    return std::chrono::milliseconds(dist(m_rng));
}

Result<HttpResponse> DeploymentInfoFetcher::with_retry(
    const std::string& url,
    const std::function<Result<HttpResponse>()>& send)
{
    const int attempts = std::max(1, m_retry.max_attempts);
    std::string last_failure;
    for (int attempt = 0; attempt < attempts; ++attempt) {
        if (attempt > 0) {
            m_sleeper(jittered_delay(attempt - 1));
        }
        auto response = send();
        if (!response) {
            if (response.error().code != error_code::kNetworkTransient) {
                return response;
            }
            last_failure = response.error().message;
            continue;
        }
        if (!is_transient_status(response->status)) {
            return response;
        }
        last_failure = std::format("HTTP {}", response->status);
    }
    return std::unexpected(Error::make(
        std::string(error_code::kNetworkTransient),
        std::format("{} failed after {} attempts: {}", url, attempts, last_failure)));
}

Result<std::optional<nlohmann::json>> DeploymentInfoFetcher::get_json(const std::string& url)
{
    auto response = with_retry(url, [&] { return m_transport.get(url); });
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status == 404) {
        return std::optional<nlohmann::json>{};
    }
    if (response->status < 200 || response->status > 299) {
        return std::unexpected(permanent(std::format("HTTP {} from {}", response->status, url)));
    }
    try {
        return std::optional<nlohmann::json>(nlohmann::json::parse(response->body));
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(permanent(std::format("Malformed JSON from {}: {}", url, ex.what())));
    }
}

Result<nlohmann::json> DeploymentInfoFetcher::rpc_call(const nlohmann::json& request)
{
    const std::string body = request.dump();
    const auto& url = m_endpoints.rpc_url;
    auto response = with_retry(url, [&] { return m_transport.post_json(url, body); });
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status < 200 || response->status > 299) {
        return std::unexpected(permanent(std::format("HTTP {} from {}", response->status, url)));
    }
    nlohmann::json reply;
    try {
        reply = nlohmann::json::parse(response->body);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(permanent(std::format("Malformed JSON-RPC reply: {}", ex.what())));
    }
    if (!reply.is_object()) {
        return std::unexpected(permanent("Malformed JSON-RPC reply: not an object"));
    }
    if (reply.contains("error")) {
        return std::unexpected(permanent("JSON-RPC error: " + reply.at("error").dump()));
    }
    if (!reply.contains("result")) {
        return std::unexpected(permanent("JSON-RPC reply has no result"));
    }
    return reply.at("result");
}

Result<std::optional<Bytes>> DeploymentInfoFetcher::fetch_runtime_code(const Address& address)
{
    nlohmann::json request = nlohmann::json::object();
    request["jsonrpc"] = "2.0";
    request["id"] = 1;
    request["method"] = "eth_getCode";
    request["params"] = nlohmann::json::array({address.to_string(), "latest"});
    auto result = rpc_call(request);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->is_string()) {
        return std::unexpected(permanent("eth_getCode returned a non-string result"));
    }
    auto code = decode_code(result->get<std::string>(), "eth_getCode result");
    if (!code) {
        return std::unexpected(code.error());
    }
    if (code->empty()) {
        return std::optional<Bytes>{};
    }
    return std::optional<Bytes>(std::move(*code));
}

void DeploymentInfoFetcher::fetch_creation(const Address& address, DeploymentInfo& info)
{
    // Best effort: any failure leaves the deployment comparable by runtime code.
    auto account = get_json(std::format("{}/addresses/{}", m_endpoints.api_base, address.to_string()));
    if (!account || !account->has_value()) {
        return;
    }
    const std::string tx_hash = string_field(**account, "creation_transaction_hash");
    if (tx_hash.empty()) {
        return;
    }
    info.creation_tx = tx_hash;
    if (auto creator = Address::parse(string_field(**account, "creator_address_hash"))) {
        info.deployer = *creator;
    }

    auto tx = get_json(std::format("{}/transactions/{}", m_endpoints.api_base, tx_hash));
    if (!tx || !tx->has_value() || !(*tx)->is_object()) {
        return;
    }
    const auto& payload = **tx;
    if (payload.contains("to") && !payload.at("to").is_null()) {
        info.factory_deployed = true;
        return;
    }
    auto creation = common::from_hex(string_field(payload, "raw_input"));
    if (creation && !creation->empty()) {
        info.creation_bytecode = std::move(*creation);
    }
}

Result<DeploymentInfo> DeploymentInfoFetcher::fetch(const Address& address)
{
    const std::string addr = address.to_string();
    auto metadata = get_json(std::format("{}/smart-contracts/{}", m_endpoints.api_base, addr));
    if (!metadata) {
        return std::unexpected(metadata.error());
    }

    const bool verified = metadata->has_value()
                          && !string_field(**metadata, "compiler_version").empty();
    if (!verified) {
        auto code = fetch_runtime_code(address);
        if (!code) {
            return std::unexpected(code.error());
        }
        if (!code->has_value()) {
            return std::unexpected(
                Error::make(std::string(error_code::kNotAContract),
                            std::format("Address {} has no deployed code", addr)));
        }
        return std::unexpected(
            Error::make(std::string(error_code::kNotVerified),
                        std::format("Contract at {} has no verified source on the explorer", addr)));
    }

    const auto& payload = **metadata;
    auto settings = settings_from_metadata(payload);
    if (!settings) {
        return std::unexpected(settings.error());
    }

    DeploymentInfo info;
    info.verified = true;
    info.contract_name = string_field(payload, "name");
    info.compiler_settings = std::move(*settings);
    if (auto file_path = string_field(payload, "file_path"); !file_path.empty()) {
        info.file_path = std::move(file_path);
    }
    if (info.contract_name.empty()) {
        return std::unexpected(
            permanent(std::format("Verified metadata for {} carries no contract name", addr)));
    }

    if (auto deployed = string_field(payload, "deployed_bytecode"); !deployed.empty()) {
        auto runtime = decode_code(deployed, "deployed_bytecode");
        if (!runtime) {
            return std::unexpected(runtime.error());
        }
        if (!runtime->empty()) {
            info.runtime_bytecode = std::move(*runtime);
        }
    }
    if (!info.runtime_bytecode) {
        auto code = fetch_runtime_code(address);
        if (!code) {
            return std::unexpected(code.error());
        }
        if (!code->has_value()) {
            return std::unexpected(
                Error::make(std::string(error_code::kNotAContract),
                            std::format("Address {} has no deployed code", addr)));
        }
        info.runtime_bytecode = std::move(**code);
    }

    fetch_creation(address, info);
    if (!info.creation_bytecode && !info.factory_deployed) {
        // The explorer's stored creation input stands in when the transaction gave none.
        auto creation = common::from_hex(string_field(payload, "creation_bytecode"));
        if (creation && !creation->empty()) {
            info.creation_bytecode = std::move(*creation);
        }
    }
    return info;
}

}  // namespace evmverify::explorer
