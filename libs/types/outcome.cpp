/**
 * @file outcome.cpp
 * @brief Outcome taxonomy mapping
 */

#include "evmverify/outcome.hpp"

#include <array>

namespace evmverify {

namespace {

struct CodeStatus
{
    std::string_view code;
    Status status;
};

constexpr std::array<CodeStatus, 9> kCodeStatuses = {
    {
     {.code = error_code::kNotAContract, .status = Status::kNotAContract},
     {.code = error_code::kNotVerified, .status = Status::kUnverified},
     {.code = error_code::kNoMapping, .status = Status::kNoMapping},
     {.code = error_code::kNetworkTransient, .status = Status::kNetworkError},
     {.code = error_code::kNetworkPermanent, .status = Status::kNetworkError},
     {.code = error_code::kBuildFailure, .status = Status::kBuildFailure},
     {.code = error_code::kArtifactNotFound, .status = Status::kBuildFailure},
     {.code = error_code::kTimeout, .status = Status::kTimeout},
     {.code = error_code::kBytecodeMismatch, .status = Status::kMismatch},
     }
};

constexpr std::array<std::string_view, 6> kFatalCodes = {
    error_code::kIOError,
    error_code::kParseError,
    error_code::kSchemaValidationFailed,
    error_code::kWorkspaceUnavailable,
    error_code::kCloneFailed,
    error_code::kProcessSpawnFailed,
};

}  // namespace

std::string_view to_string(Status status) noexcept
{
    switch (status) {
        case Status::kVerified:
            return "Verified";
        case Status::kMismatch:
            return "Mismatch";
        case Status::kUnverified:
            return "Unverified";
        case Status::kNoMapping:
            return "NoMapping";
        case Status::kNotAContract:
            return "NotAContract";
        case Status::kNetworkError:
            return "NetworkError";
        case Status::kBuildFailure:
            return "BuildFailure";
        case Status::kTimeout:
            return "Timeout";
    }
    return "Unknown";
}

std::optional<Status> status_for_error(std::string_view code) noexcept
{
    for (const auto& entry : kCodeStatuses) {
        if (entry.code == code) {
            return entry.status;
        }
    }
    return std::nullopt;
}

bool is_fatal(std::string_view code) noexcept
{
    for (auto fatal : kFatalCodes) {
        if (fatal == code) {
            return true;
        }
    }
    return false;
}

ComparisonResult ComparisonResult::from_error(const ContractRequest& request,
                                              const Error& error,
                                              Status stage_status)
{
    ComparisonResult result;
    result.alias = request.alias;
    result.canonical_name = request.canonical_name;
    result.address = request.address;
    result.status = status_for_error(error.code).value_or(stage_status);
    result.message = common::sanitize_utf8(error.message);
    result.details = nlohmann::json::object();
    result.details["error_code"] = error.code;
    return result;
}

}  // namespace evmverify
