#pragma once

/**
 * @file types.hpp
 * @brief Typed entities of a verification run
 *
 * All entities are validated at construction through factory functions
 * returning Result; once built they are treated as immutable values.
 */

#include "evmverify/common.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace evmverify {

/**
 * @brief 20-byte account address
 */
class Address
{
public:
    static constexpr std::size_t kSize = 20;

    Address() = default;
    explicit Address(const std::array<std::uint8_t, kSize>& bytes) noexcept
        : m_bytes(bytes)
    {}

    /**
     * @brief Parse "0x" + 40 hex digits (case-insensitive)
     */
    [[nodiscard]] static Result<Address> parse(std::string_view text);

    [[nodiscard]] bool is_zero() const noexcept;

    /// Lowercase "0x"-prefixed rendering
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] const std::array<std::uint8_t, kSize>& bytes() const noexcept { return m_bytes; }

    auto operator<=>(const Address&) const = default;

private:
    std::array<std::uint8_t, kSize> m_bytes{};
};

/**
 * @brief Compiler version, e.g. "v0.8.17+commit.8df45f5f"
 */
struct SemanticVersion
{
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string prerelease;  ///< Text after '-', without the dash
    std::string build;       ///< Text after '+', without the plus

    [[nodiscard]] static Result<SemanticVersion> parse(std::string_view text);

    /// "major.minor.patch"
    [[nodiscard]] std::string short_string() const;

    /// Full form including prerelease and build metadata
    [[nodiscard]] std::string to_string() const;

    bool operator==(const SemanticVersion&) const = default;
};

/**
 * @brief EVM hard-fork target passed to the compiler
 *
 * kDefault means the deployment did not pin a target and the compiler
 * default applies.
 */
enum class EvmTarget {
    kDefault,
    kHomestead,
    kTangerineWhistle,
    kSpuriousDragon,
    kByzantium,
    kConstantinople,
    kPetersburg,
    kIstanbul,
    kBerlin,
    kLondon,
    kParis,
    kShanghai,
    kCancun,
    kPrague
};

[[nodiscard]] Result<EvmTarget> parse_evm_target(std::string_view text);
[[nodiscard]] std::string_view to_string(EvmTarget target) noexcept;

/**
 * @brief Compiler settings of a historical deployment
 *
 * Two settings are equal iff all fields match; together with the source
 * mapping this equality defines the build-grouping fingerprint.
 */
class CompilerSettings
{
public:
    CompilerSettings() = default;

    /**
     * @brief Validate and build settings
     * @param optimizer_runs Must be >= 0
     */
    [[nodiscard]] static Result<CompilerSettings> make(SemanticVersion version,
                                                       bool optimizer_enabled,
                                                       std::int64_t optimizer_runs,
                                                       EvmTarget evm_target,
                                                       bool via_ir);

    [[nodiscard]] const SemanticVersion& version() const noexcept { return m_version; }
    [[nodiscard]] bool optimizer_enabled() const noexcept { return m_optimizer_enabled; }
    [[nodiscard]] std::uint32_t optimizer_runs() const noexcept { return m_optimizer_runs; }
    [[nodiscard]] EvmTarget evm_target() const noexcept { return m_evm_target; }
    [[nodiscard]] bool via_ir() const noexcept { return m_via_ir; }

    /// Integer-only JSON form used for fingerprints and report details
    [[nodiscard]] nlohmann::json to_json() const;

    bool operator==(const CompilerSettings&) const = default;

private:
    SemanticVersion m_version;
    bool m_optimizer_enabled = false;
    std::uint32_t m_optimizer_runs = 0;
    EvmTarget m_evm_target = EvmTarget::kDefault;
    bool m_via_ir = false;
};

/**
 * @brief Where the source of a canonical contract name lives
 */
struct SourceMapping
{
    std::string repository;              ///< "org/repo"
    std::string ref;                     ///< Commit hash or tag
    std::optional<std::string> subpath;  ///< Build directory inside the checkout
    std::optional<std::string> artifact; ///< Artifact name when it differs from the contract name

    bool operator==(const SourceMapping&) const = default;
};

/**
 * @brief One verification request
 *
 * The alias is the caller's label from the input list and is never used for
 * lookups. The canonical name is filled in from verified explorer metadata.
 */
struct ContractRequest
{
    std::string alias;
    std::string canonical_name;
    Address address;

    /**
     * @brief Build a request; the zero address is rejected
     */
    [[nodiscard]] static Result<ContractRequest> make(std::string alias, Address address);
};

/**
 * @brief Which side of a deployment a bytecode blob comes from
 */
enum class BytecodeRole { kCreation, kRuntime };

[[nodiscard]] std::string_view to_string(BytecodeRole role) noexcept;

/**
 * @brief Deployment facts of one address, fetched once per run
 */
struct DeploymentInfo
{
    bool verified = false;
    std::string contract_name;               ///< Canonical name from verified metadata
    std::optional<std::string> file_path;    ///< Source file reported by the explorer
    std::optional<Bytes> creation_bytecode;  ///< Only for direct deployments
    std::optional<Bytes> runtime_bytecode;
    CompilerSettings compiler_settings;
    std::optional<std::string> creation_tx;
    std::optional<Address> deployer;
    bool factory_deployed = false;
};

}  // namespace evmverify
