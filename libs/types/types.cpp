/**
 * @file types.cpp
 * @brief Construction-time validation of run entities
 */

#include "evmverify/types.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cstdint>
#include <format>
#include <ranges>
#include <string>
#include <system_error>
#include <utility>

namespace evmverify {

namespace {

struct EvmTargetName
{
    EvmTarget target;
    std::string_view name;
};

constexpr std::array<EvmTargetName, 14> kEvmTargetNames = {
    {
     {.target = EvmTarget::kDefault, .name = "default"},
     {.target = EvmTarget::kHomestead, .name = "homestead"},
     {.target = EvmTarget::kTangerineWhistle, .name = "tangerineWhistle"},
     {.target = EvmTarget::kSpuriousDragon, .name = "spuriousDragon"},
     {.target = EvmTarget::kByzantium, .name = "byzantium"},
     {.target = EvmTarget::kConstantinople, .name = "constantinople"},
     {.target = EvmTarget::kPetersburg, .name = "petersburg"},
     {.target = EvmTarget::kIstanbul, .name = "istanbul"},
     {.target = EvmTarget::kBerlin, .name = "berlin"},
     {.target = EvmTarget::kLondon, .name = "london"},
     {.target = EvmTarget::kParis, .name = "paris"},
     {.target = EvmTarget::kShanghai, .name = "shanghai"},
     {.target = EvmTarget::kCancun, .name = "cancun"},
     {.target = EvmTarget::kPrague, .name = "prague"},
     }
};

[[nodiscard]] Result<int> parse_component(std::string_view text, std::string_view whole)
{
    int value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc{} || ptr != end || value < 0) {
        return std::unexpected(Error::make(
            "InvalidVersion", std::format("Invalid compiler version component in '{}'", whole)));
    }
    return value;
}

}  // namespace

// ============================================================================
// Address
// ============================================================================

Result<Address> Address::parse(std::string_view text)
{
    std::string_view digits = text;
    if (digits.starts_with("0x") || digits.starts_with("0X")) {
        digits.remove_prefix(2);
    }
    if (digits.size() != kSize * 2) {
        return std::unexpected(Error::make(
            "InvalidAddress",
            std::format("Address '{}' must be 0x followed by 40 hex digits", text)));
    }
    auto bytes = common::from_hex(digits);
    if (!bytes) {
        return std::unexpected(
            Error::make("InvalidAddress",
                        std::format("Address '{}' is not hex: {}", text, bytes.error().message)));
    }
    std::array<std::uint8_t, kSize> raw{};
    std::ranges::copy(*bytes, raw.begin());
    return Address(raw);
}

bool Address::is_zero() const noexcept
{
    return std::ranges::all_of(m_bytes, [](std::uint8_t b) noexcept { return b == 0; });
}

std::string Address::to_string() const
{
    return common::to_hex_prefixed(m_bytes);
}

// ============================================================================
// SemanticVersion
// ============================================================================

Result<SemanticVersion> SemanticVersion::parse(std::string_view text)
{
    std::string_view rest = text;
    if (rest.starts_with('v') || rest.starts_with('V')) {
        rest.remove_prefix(1);
    }

    SemanticVersion version;
    if (auto plus = rest.find('+'); plus != std::string_view::npos) {
        version.build = std::string(rest.substr(plus + 1));
        rest = rest.substr(0, plus);
    }
    if (auto dash = rest.find('-'); dash != std::string_view::npos) {
        version.prerelease = std::string(rest.substr(dash + 1));
        rest = rest.substr(0, dash);
    }

    std::array<int*, 3> slots = {&version.major, &version.minor, &version.patch};
    std::size_t index = 0;
    for (auto part : rest | std::views::split('.')) {
        if (index >= slots.size()) {
            return std::unexpected(Error::make(
                "InvalidVersion", std::format("Compiler version '{}' has too many components", text)));
        }
        auto value = parse_component(std::string_view(part.begin(), part.end()), text);
        if (!value) {
            return std::unexpected(value.error());
        }
        *slots[index++] = *value;
    }
    if (index != slots.size()) {
        return std::unexpected(Error::make(
            "InvalidVersion", std::format("Compiler version '{}' must be major.minor.patch", text)));
    }
    return version;
}

std::string SemanticVersion::short_string() const
{
    return std::format("{}.{}.{}", major, minor, patch);
}

std::string SemanticVersion::to_string() const
{
    std::string out = short_string();
    if (!prerelease.empty()) {
        out += "-" + prerelease;
    }
    if (!build.empty()) {
        out += "+" + build;
    }
    return out;
}

// ============================================================================
// EvmTarget
// ============================================================================

Result<EvmTarget> parse_evm_target(std::string_view text)
{
    if (text.empty()) {
        return EvmTarget::kDefault;
    }
    const std::string lowered = common::to_lower(text);
    for (const auto& entry : kEvmTargetNames) {
        if (common::to_lower(entry.name) == lowered) {
            return entry.target;
        }
    }
    return std::unexpected(
        Error::make("InvalidEvmTarget", std::format("Unknown EVM target '{}'", text)));
}

std::string_view to_string(EvmTarget target) noexcept
{
    for (const auto& entry : kEvmTargetNames) {
        if (entry.target == target) {
            return entry.name;
        }
    }
    return "default";
}

// ============================================================================
// CompilerSettings
// ============================================================================

Result<CompilerSettings> CompilerSettings::make(SemanticVersion version,
                                                bool optimizer_enabled,
                                                std::int64_t optimizer_runs,
                                                EvmTarget evm_target,
                                                bool via_ir)
{
    if (optimizer_runs < 0) {
        return std::unexpected(Error::make(
            "InvalidSettings",
            std::format("Optimizer runs must be non-negative, got {}", optimizer_runs)));
    }
    if (optimizer_runs > std::int64_t{UINT32_MAX}) {
        return std::unexpected(Error::make(
            "InvalidSettings", std::format("Optimizer runs {} out of range", optimizer_runs)));
    }
    CompilerSettings settings;
    settings.m_version = std::move(version);
    settings.m_optimizer_enabled = optimizer_enabled;
    settings.m_optimizer_runs = static_cast<std::uint32_t>(optimizer_runs);
    settings.m_evm_target = evm_target;
    settings.m_via_ir = via_ir;
    return settings;
}

nlohmann::json CompilerSettings::to_json() const
{
    return {
        {"compiler_version",                m_version.to_string()},
        {       "optimizer",                  m_optimizer_enabled},
        {  "optimizer_runs",                     m_optimizer_runs},
        {      "evm_target", std::string(evmverify::to_string(m_evm_target))},
        {          "via_ir",                             m_via_ir}
    };
}

// ============================================================================
// ContractRequest
// ============================================================================

Result<ContractRequest> ContractRequest::make(std::string alias, Address address)
{
    if (address.is_zero()) {
        return std::unexpected(Error::make(
            "ZeroAddress", std::format("Contract '{}' has the zero address", alias)));
    }
    return ContractRequest{.alias = std::move(alias), .canonical_name = {}, .address = address};
}

std::string_view to_string(BytecodeRole role) noexcept
{
    return role == BytecodeRole::kCreation ? "creation" : "runtime";
}

}  // namespace evmverify
