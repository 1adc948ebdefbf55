#pragma once

/**
 * @file explorer.hpp
 * @brief DeploymentInfoFetcher: address -> deployment facts or a classified error
 *
 * The fetcher talks to a Blockscout-style explorer API (verified metadata,
 * creation transaction) and to a JSON-RPC node (eth_getCode). All network
 * access goes through the HttpTransport seam.
 */

#include "evmverify/common.hpp"
#include "evmverify/types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>

#include <nlohmann/json.hpp>

namespace evmverify::explorer {

/**
 * @brief Raw HTTP response
 */
struct HttpResponse
{
    int status = 0;
    std::string body;
};

/**
 * @brief Outbound HTTP capability
 *
 * Implementations return NetworkTransient when no response was received
 * (connection refused, timeout) and NetworkPermanent when a retry cannot
 * help (malformed URL, rejected TLS peer). Must be safe to call from
 * several threads.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    [[nodiscard]] virtual Result<HttpResponse> get(const std::string& url) = 0;
    [[nodiscard]] virtual Result<HttpResponse> post_json(const std::string& url,
                                                         const std::string& body) = 0;
};

/**
 * @brief Bounded retry with exponential backoff and full jitter
 */
struct RetryPolicy
{
    int max_attempts = 4;
    std::chrono::milliseconds base_delay{500};
    std::chrono::milliseconds max_delay{8000};
};

/// 429 and 5xx are worth retrying; every other status is final
[[nodiscard]] bool is_transient_status(int status) noexcept;

/**
 * @brief Upper bound of the jitter window before retry @p attempt (0-based)
 * @return min(max_delay, base_delay * 2^attempt)
 */
[[nodiscard]] std::chrono::milliseconds backoff_ceiling(const RetryPolicy& policy,
                                                        int attempt) noexcept;

struct ExplorerEndpoints
{
    std::string api_base;  ///< e.g. https://www.hyperscan.com/api/v2
    std::string rpc_url;   ///< JSON-RPC endpoint for eth_getCode
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/**
 * @brief Source of deployment facts, called concurrently by fetch workers
 */
class DeploymentInfoSource
{
public:
    virtual ~DeploymentInfoSource() = default;

    [[nodiscard]] virtual Result<DeploymentInfo> fetch(const Address& address) = 0;
};

/**
 * @brief Converts an address into DeploymentInfo
 *
 * Thread-safe: one instance is shared by all fetch workers. A retry delay is
 * slept on the calling worker only.
 */
class DeploymentInfoFetcher final : public DeploymentInfoSource
{
public:
    /**
     * @param sleeper Defaults to std::this_thread::sleep_for
     * @param seed Jitter seed; fixed in tests
     */
    DeploymentInfoFetcher(HttpTransport& transport,
                          ExplorerEndpoints endpoints,
                          RetryPolicy retry,
                          Sleeper sleeper = {},
                          std::uint64_t seed = std::random_device{}());

    /**
     * @brief Fetch deployment facts
     *
     * Errors: NotAContract, NotVerified, NetworkTransient (retries exhausted),
     * NetworkPermanent (non-retryable 4xx or a payload that cannot be used).
     */
    [[nodiscard]] Result<DeploymentInfo> fetch(const Address& address) override;

private:
    /// GET with retry; nullopt on 404
    [[nodiscard]] Result<std::optional<nlohmann::json>> get_json(const std::string& url);
    [[nodiscard]] Result<nlohmann::json> rpc_call(const nlohmann::json& request);
    [[nodiscard]] Result<HttpResponse> with_retry(
        const std::string& url,
        const std::function<Result<HttpResponse>()>& send);
    [[nodiscard]] Result<std::optional<Bytes>> fetch_runtime_code(const Address& address);
    void fetch_creation(const Address& address, DeploymentInfo& info);
    [[nodiscard]] std::chrono::milliseconds jittered_delay(int attempt);

    HttpTransport& m_transport;
    ExplorerEndpoints m_endpoints;
    RetryPolicy m_retry;
    Sleeper m_sleeper;
    std::mutex m_rng_mutex;
    std::mt19937_64 m_rng;
};

/**
 * @brief Extract compiler settings from a verified smart-contract payload
 *
 * Reads compiler_version, optimization_enabled, optimization_runs,
 * evm_version and compiler_settings.viaIR.
 */
[[nodiscard]] Result<CompilerSettings> settings_from_metadata(const nlohmann::json& metadata);

}  // namespace evmverify::explorer
