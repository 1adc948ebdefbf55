/**
 * @file test_report.cpp
 * @brief Aggregation, ordering and report serialization
 */

#include "evmverify/json_io.hpp"
#include "evmverify/outcome.hpp"
#include "evmverify/report.hpp"
#include "evmverify/version.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

namespace evmverify::report::test {

namespace {

ComparisonResult result(const std::string& alias,
                        const std::string& canonical,
                        std::string_view address,
                        Status status,
                        std::string message = {})
{
    ComparisonResult r;
    r.alias = alias;
    r.canonical_name = canonical;
    r.address = Address::parse(address).value();
    r.status = status;
    r.message = std::move(message);
    return r;
}

constexpr std::string_view kAddrA = "0x00000000000000000000000000000000000000a1";
constexpr std::string_view kAddrB = "0x00000000000000000000000000000000000000b2";
constexpr std::string_view kAddrC = "0x00000000000000000000000000000000000000C3";

}  // namespace

TEST(Aggregate, EveryResultLandsInExactlyOneSequence)
{
    std::vector<ComparisonResult> results;
    results.push_back(result("vault", "Vault", kAddrA, Status::kVerified));
    results.push_back(result("router", "Router", kAddrB, Status::kMismatch, "router: mismatch"));
    results.push_back(result("oracle", "", kAddrC, Status::kNotAContract, "oracle: no code"));

    const auto report = aggregate(std::move(results));
    EXPECT_EQ(report.verified.size(), 1U);
    EXPECT_EQ(report.failed.size(), 2U);
    const auto summary = report.summary();
    EXPECT_EQ(summary.total, 3U);
    EXPECT_EQ(summary.verified, 1U);
    EXPECT_EQ(summary.failed, 2U);
    EXPECT_FALSE(report.passed());
}

TEST(Aggregate, EmptyRunPasses)
{
    const auto report = aggregate({});
    EXPECT_TRUE(report.passed());
    EXPECT_EQ(report.summary().total, 0U);
}

TEST(Aggregate, SortsByCanonicalNameThenAddress)
{
    std::vector<ComparisonResult> results;
    results.push_back(result("z-alias", "Alpha", kAddrB, Status::kVerified));
    results.push_back(result("a-alias", "Beta", kAddrA, Status::kVerified));
    results.push_back(result("second", "Alpha", kAddrA, Status::kVerified));
    // Never resolved: sorted by alias
    results.push_back(result("Aardvark", "", kAddrC, Status::kUnverified));
    results.push_back(result("Zebra", "", kAddrA, Status::kUnverified));

    const auto report = aggregate(std::move(results));
    ASSERT_EQ(report.verified.size(), 3U);
    EXPECT_EQ(report.verified[0].alias, "second");
    EXPECT_EQ(report.verified[1].alias, "z-alias");
    EXPECT_EQ(report.verified[2].alias, "a-alias");
    ASSERT_EQ(report.failed.size(), 2U);
    EXPECT_EQ(report.failed[0].alias, "Aardvark");
    EXPECT_EQ(report.failed[1].alias, "Zebra");
}

TEST(EntryToJson, VerifiedEntryHasNullError)
{
    auto r = result("vault", "Vault", kAddrA, Status::kVerified);
    r.details = {{"solc", "0.8.17"}};
    const auto entry = entry_to_json(r);
    EXPECT_EQ(entry.at("address"), std::string(kAddrA));
    EXPECT_EQ(entry.at("name"), "vault");
    EXPECT_EQ(entry.at("canonical_name"), "Vault");
    EXPECT_EQ(entry.at("status"), "Verified");
    EXPECT_TRUE(entry.at("verified").get<bool>());
    EXPECT_TRUE(entry.at("error").is_null());
    EXPECT_EQ(entry.at("details").at("solc"), "0.8.17");
    EXPECT_FALSE(entry.contains("diff_offset"));
}

TEST(EntryToJson, FailedEntryCarriesMessageAndOffset)
{
    auto r = result("router", "Router", kAddrC, Status::kMismatch, "router: bytecode mismatch");
    r.diff_offset = 1234;
    const auto entry = entry_to_json(r);
    EXPECT_EQ(entry.at("address"), "0x00000000000000000000000000000000000000c3");
    EXPECT_EQ(entry.at("error"), "router: bytecode mismatch");
    EXPECT_FALSE(entry.at("verified").get<bool>());
    EXPECT_EQ(entry.at("diff_offset"), 1234);
}

TEST(EntryToJson, FailureWithoutMessageFallsBackToStatus)
{
    const auto entry = entry_to_json(result("t", "", kAddrA, Status::kTimeout));
    EXPECT_EQ(entry.at("error"), "Timeout");
}

TEST(ReportJson, DocumentCarriesSummaryAndTool)
{
    std::vector<ComparisonResult> results;
    results.push_back(result("vault", "Vault", kAddrA, Status::kVerified));
    results.push_back(result("router", "Router", kAddrB, Status::kBuildFailure, "router: failed"));
    const auto document = to_json(aggregate(std::move(results)));
    EXPECT_EQ(document.at("schema_version"), kReportSchemaVersion);
    EXPECT_EQ(document.at("tool").at("name"), "evmverify");
    EXPECT_EQ(document.at("summary").at("total"), 2);
    EXPECT_EQ(document.at("summary").at("verified"), 1);
    EXPECT_EQ(document.at("summary").at("failed"), 1);
    EXPECT_EQ(document.at("verified").size(), 1U);
    EXPECT_EQ(document.at("failed").size(), 1U);
}

class WriteReportTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_dir = std::filesystem::temp_directory_path() / "evmverify_report_test";
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::filesystem::path m_dir;
};

TEST_F(WriteReportTest, WritesSchemaValidDocument)
{
    std::vector<ComparisonResult> results;
    auto mismatch = result("router", "Router", kAddrB, Status::kMismatch, "router: mismatch");
    mismatch.diff_offset = 7;
    results.push_back(std::move(mismatch));
    results.push_back(result("vault", "Vault", kAddrA, Status::kVerified));

    const auto path = m_dir / "report.json";
    auto written = write_report(aggregate(std::move(results)), path, EVMVERIFY_SCHEMA_DIR);
    ASSERT_TRUE(written) << written.error().message;

    auto reread = common::read_validated_json_file(path, EVMVERIFY_SCHEMA_DIR, kReportSchemaVersion);
    ASSERT_TRUE(reread) << reread.error().message;
    EXPECT_EQ(reread->at("failed").at(0).at("diff_offset"), 7);
    EXPECT_EQ(reread->at("verified").at(0).at("name"), "vault");
}

TEST_F(WriteReportTest, UnwritablePathIsIOError)
{
    std::ofstream(m_dir / "occupied") << "not a directory";
    auto written = write_report(aggregate({}), m_dir / "occupied" / "report.json",
                                EVMVERIFY_SCHEMA_DIR);
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error().code, error_code::kIOError);
}

}  // namespace evmverify::report::test
