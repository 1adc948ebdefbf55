#pragma once

/**
 * @file report.hpp
 * @brief ReportAggregator: per-contract outcomes -> verification report
 */

#include "evmverify/common.hpp"
#include "evmverify/outcome.hpp"

#include <cstddef>
#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

namespace evmverify::report {

/**
 * @brief Derived counts; never tracked independently of the sequences
 */
struct Summary
{
    std::size_t total = 0;
    std::size_t verified = 0;
    std::size_t failed = 0;
};

/**
 * @brief Terminal artifact of a run
 *
 * Both sequences are sorted by (canonical name or alias, address).
 */
struct VerificationReport
{
    std::vector<ComparisonResult> verified;
    std::vector<ComparisonResult> failed;

    [[nodiscard]] Summary summary() const noexcept
    {
        return Summary{.total = verified.size() + failed.size(),
                       .verified = verified.size(),
                       .failed = failed.size()};
    }

    /// Overall verdict: true iff nothing failed (an empty run passes)
    [[nodiscard]] bool passed() const noexcept { return failed.empty(); }
};

/**
 * @brief Partition and sort results
 *
 * Policy filtering (skip-unmapped) is the caller's job; every result given
 * here lands in exactly one sequence.
 */
[[nodiscard]] VerificationReport aggregate(std::vector<ComparisonResult> results);

/// One report entry
[[nodiscard]] nlohmann::json entry_to_json(const ComparisonResult& result);

/// Whole report document (verification_report.v1)
[[nodiscard]] nlohmann::json to_json(const VerificationReport& report);

/**
 * @brief Validate against the report schema and write canonical JSON
 * @return IOError or SchemaValidationFailed; both abort the run
 */
[[nodiscard]] VoidResult write_report(const VerificationReport& report,
                                      const std::filesystem::path& path,
                                      const std::filesystem::path& schema_dir);

}  // namespace evmverify::report
