#pragma once

/**
 * @file outcome.hpp
 * @brief Per-contract outcome taxonomy and comparison results
 */

#include "evmverify/common.hpp"
#include "evmverify/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace evmverify {

/**
 * @brief Stable error codes carried in Error::code
 *
 * Per-contract codes become a ComparisonResult; infrastructure codes abort
 * the run.
 */
namespace error_code {

// Per-contract
constexpr std::string_view kNotAContract = "NotAContract";
constexpr std::string_view kNotVerified = "NotVerified";
constexpr std::string_view kNoMapping = "NoMapping";
constexpr std::string_view kNetworkTransient = "NetworkTransient";
constexpr std::string_view kNetworkPermanent = "NetworkPermanent";
constexpr std::string_view kBuildFailure = "BuildFailure";
constexpr std::string_view kTimeout = "Timeout";
constexpr std::string_view kArtifactNotFound = "ArtifactNotFound";
constexpr std::string_view kBytecodeMismatch = "BytecodeMismatch";

// Infrastructure
constexpr std::string_view kIOError = "IOError";
constexpr std::string_view kParseError = "ParseError";
constexpr std::string_view kSchemaValidationFailed = "SchemaValidationFailed";
constexpr std::string_view kWorkspaceUnavailable = "WorkspaceUnavailable";
constexpr std::string_view kCloneFailed = "CloneFailed";
constexpr std::string_view kProcessSpawnFailed = "ProcessSpawnFailed";

}  // namespace error_code

/**
 * @brief Verification status of one contract
 */
enum class Status {
    kVerified,
    kMismatch,
    kUnverified,
    kNoMapping,
    kNotAContract,
    kNetworkError,
    kBuildFailure,
    kTimeout
};

[[nodiscard]] std::string_view to_string(Status status) noexcept;

/**
 * @brief Map a per-contract error code onto a status
 *
 * ArtifactNotFound maps to kBuildFailure.
 * @return nullopt for a code outside the per-contract taxonomy
 */
[[nodiscard]] std::optional<Status> status_for_error(std::string_view code) noexcept;

/**
 * @brief True for infrastructure errors that must abort the run
 */
[[nodiscard]] bool is_fatal(std::string_view code) noexcept;

/**
 * @brief Outcome of verifying one contract
 */
struct ComparisonResult
{
    std::string alias;           ///< Display name from the input list
    std::string canonical_name;  ///< Name from verified metadata; empty when never learned
    Address address;
    Status status = Status::kUnverified;
    std::optional<std::size_t> diff_offset;
    std::string message;                               ///< Empty when verified
    nlohmann::json details = nlohmann::json::object(); ///< Compiler metadata snapshot

    [[nodiscard]] bool verified() const noexcept { return status == Status::kVerified; }

    /// Canonical name when known, else the alias
    [[nodiscard]] const std::string& sort_name() const noexcept
    {
        return canonical_name.empty() ? alias : canonical_name;
    }

    /**
     * @brief Build a failed result from a per-contract error
     * @param stage_status Status of the stage that failed, used when the
     *        error code is not a per-contract code
     */
    [[nodiscard]] static ComparisonResult from_error(const ContractRequest& request,
                                                     const Error& error,
                                                     Status stage_status);
};

}  // namespace evmverify
