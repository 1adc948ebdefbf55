/**
 * @file report.cpp
 * @brief Report aggregation and serialization
 */

#include "evmverify/report.hpp"

#include "evmverify/json_io.hpp"
#include "evmverify/schema_validate.hpp"
#include "evmverify/version.hpp"

#include <algorithm>
#include <format>
#include <tuple>
#include <utility>

namespace evmverify::report {

namespace {

[[nodiscard]] bool report_order(const ComparisonResult& a, const ComparisonResult& b)
{
    return std::tie(a.sort_name(), a.address, a.alias) < std::tie(b.sort_name(), b.address, b.alias);
}

[[nodiscard]] nlohmann::json entries_to_json(const std::vector<ComparisonResult>& results)
{
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& result : results) {
        entries.push_back(entry_to_json(result));
    }
    return entries;
}

}  // namespace

VerificationReport aggregate(std::vector<ComparisonResult> results)
{
    VerificationReport report;
    for (auto& result : results) {
        if (result.verified()) {
            report.verified.push_back(std::move(result));
        } else {
            report.failed.push_back(std::move(result));
        }
    }
    std::ranges::sort(report.verified, report_order);
    std::ranges::sort(report.failed, report_order);
    return report;
}

nlohmann::json entry_to_json(const ComparisonResult& result)
{
    nlohmann::json entry = {
        {       "address",     result.address.to_string()},
        {          "name",                   result.alias},
        {"canonical_name",          result.canonical_name},
        {        "status", std::string(to_string(result.status))},
        {      "verified",              result.verified()},
        {       "details",                 result.details}
    };
    if (result.verified()) {
        entry["error"] = nullptr;
    } else {
        entry["error"] = result.message.empty() ? std::string(to_string(result.status))
                                                : result.message;
    }
    if (result.diff_offset) {
        entry["diff_offset"] = *result.diff_offset;
    }
    return entry;
}

nlohmann::json to_json(const VerificationReport& report)
{
    const auto summary = report.summary();
    return nlohmann::json{
        {"schema_version",                                        kReportSchemaVersion},
        {          "tool",               {{"name", "evmverify"}, {"version", kVersion}}},
        {      "verified",                              entries_to_json(report.verified)},
        {        "failed",                                entries_to_json(report.failed)},
        {       "summary",
         {{"total", summary.total}, {"verified", summary.verified}, {"failed", summary.failed}}}
    };
}

VoidResult write_report(const VerificationReport& report,
                        const std::filesystem::path& path,
                        const std::filesystem::path& schema_dir)
{
    const auto document = to_json(report);
    if (auto valid = common::validate_against(document, schema_dir, kReportSchemaVersion); !valid) {
        return std::unexpected(Error::make(
            std::string(error_code::kSchemaValidationFailed),
            std::format("Report does not match {}:\n{}", kReportSchemaVersion,
                        valid.error().message)));
    }
    return common::write_canonical_json_file(path, document);
}

}  // namespace evmverify::report
