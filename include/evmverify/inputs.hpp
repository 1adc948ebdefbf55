#pragma once

/**
 * @file inputs.hpp
 * @brief Candidate sets: changed-address lists, address files, address directories
 */

#include "evmverify/common.hpp"
#include "evmverify/types.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace evmverify::inputs {

/// Suffix of the address files scanned in verify-all mode
constexpr std::string_view kAddressFileSuffix = "Addresses.json";

/**
 * @brief Requests ready for the engine plus entries removed on the way
 */
struct CandidateSet
{
    std::vector<ContractRequest> requests;
    std::vector<std::string> dropped_zero;  ///< Aliases whose address was zero
};

/**
 * @brief Turn (name, address text) pairs into requests
 *
 * Zero addresses are dropped; a malformed address is a ParseError naming the
 * entry.
 */
[[nodiscard]] Result<CandidateSet> make_candidates(
    const std::vector<std::pair<std::string, std::string>>& entries);

/**
 * @brief [{"name": ..., "address": ...}] validated against changed_addresses.v1
 */
[[nodiscard]] Result<CandidateSet> load_changed_file(const std::filesystem::path& path,
                                                     const std::filesystem::path& schema_dir);

/**
 * @brief Flat {"name": "0x..."} or sectioned {"Section": {"name": "0x..."}} entries
 *
 * Entries keep document order (keys sorted, as parsed).
 */
[[nodiscard]] Result<std::vector<std::pair<std::string, std::string>>> address_entries(
    const nlohmann::json& document, const std::string& origin);

[[nodiscard]] Result<CandidateSet> load_address_file(const std::filesystem::path& path);

/**
 * @brief Every *Addresses.json in @p dir, in file-name order
 */
[[nodiscard]] Result<CandidateSet> load_address_dir(const std::filesystem::path& dir);

}  // namespace evmverify::inputs
