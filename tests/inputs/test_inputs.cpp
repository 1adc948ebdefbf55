/**
 * @file test_inputs.cpp
 * @brief Candidate-set loading from the three input shapes
 */

#include "evmverify/inputs.hpp"
#include "evmverify/outcome.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <string>
#include <system_error>

#include <gtest/gtest.h>

namespace evmverify::inputs::test {

namespace {

constexpr std::string_view kVault = "0x2222222222222222222222222222222222222222";
constexpr std::string_view kRouter = "0x3333333333333333333333333333333333333333";
constexpr std::string_view kZero = "0x0000000000000000000000000000000000000000";

class InputsTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_dir = std::filesystem::temp_directory_path()
                / (std::string("evmverify_inputs_")
                   + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::filesystem::path write(const std::string& name, const std::string& content)
    {
        const auto path = m_dir / name;
        std::ofstream(path) << content;
        return path;
    }

    std::filesystem::path m_dir;
};

}  // namespace

TEST(MakeCandidates, DropsZeroAddresses)
{
    auto set = make_candidates({{"Vault", std::string(kVault)}, {"Unused", std::string(kZero)}});
    ASSERT_TRUE(set) << set.error().message;
    ASSERT_EQ(set->requests.size(), 1U);
    EXPECT_EQ(set->requests[0].alias, "Vault");
    EXPECT_EQ(set->requests[0].address.to_string(), kVault);
    EXPECT_TRUE(set->requests[0].canonical_name.empty());
    ASSERT_EQ(set->dropped_zero.size(), 1U);
    EXPECT_EQ(set->dropped_zero[0], "Unused");
}

TEST(MakeCandidates, MalformedAddressNamesTheEntry)
{
    auto set = make_candidates({{"Broken", "0x1234"}});
    ASSERT_FALSE(set);
    EXPECT_EQ(set.error().code, error_code::kParseError);
    EXPECT_NE(set.error().message.find("Broken"), std::string::npos);
}

TEST(AddressEntries, FlatAndSectionedShapes)
{
    const nlohmann::json document = {
        {"Vault", std::string(kVault)},
        {"Periphery", {{"Router", std::string(kRouter)}}},
    };
    auto entries = address_entries(document, "CoreAddresses.json");
    ASSERT_TRUE(entries);
    ASSERT_EQ(entries->size(), 2U);
    EXPECT_EQ((*entries)[0].first, "Router");
    EXPECT_EQ((*entries)[1].first, "Vault");
}

TEST(AddressEntries, RejectsNonStringValues)
{
    auto entries = address_entries(nlohmann::json{{"Vault", 42}}, "CoreAddresses.json");
    ASSERT_FALSE(entries);
    EXPECT_EQ(entries.error().code, error_code::kParseError);

    auto nested = address_entries(nlohmann::json{{"Section", {{"Vault", true}}}}, "x.json");
    ASSERT_FALSE(nested);
    EXPECT_NE(nested.error().message.find("Section.Vault"), std::string::npos);

    EXPECT_FALSE(address_entries(nlohmann::json::array(), "x.json"));
}

TEST_F(InputsTest, ChangedFileIsValidatedAndLoaded)
{
    const auto path = write("changed.json", std::format(R"([
        {{"name": "Vault", "address": "{}", "file": "CoreAddresses.json"}},
        {{"name": "Gone", "address": "{}"}}
    ])",
                                                        kVault, kZero));
    auto set = load_changed_file(path, EVMVERIFY_SCHEMA_DIR);
    ASSERT_TRUE(set) << set.error().message;
    ASSERT_EQ(set->requests.size(), 1U);
    EXPECT_EQ(set->requests[0].alias, "Vault");
    EXPECT_EQ(set->dropped_zero.size(), 1U);
}

TEST_F(InputsTest, ChangedFileFailingSchemaIsRejected)
{
    const auto path = write("changed.json", R"([{"address": "0x00"}])");
    auto set = load_changed_file(path, EVMVERIFY_SCHEMA_DIR);
    ASSERT_FALSE(set);
    EXPECT_EQ(set.error().code, error_code::kSchemaValidationFailed);
}

TEST_F(InputsTest, AddressDirectoryReadsMatchingFilesInNameOrder)
{
    write("PeripheryAddresses.json", std::format(R"({{"Router": "{}"}})", kRouter));
    write("CoreAddresses.json", std::format(R"({{"Vault": "{}"}})", kVault));
    write("notes.json", R"({"Ignored": "not an address"})");

    auto set = load_address_dir(m_dir);
    ASSERT_TRUE(set) << set.error().message;
    ASSERT_EQ(set->requests.size(), 2U);
    EXPECT_EQ(set->requests[0].alias, "Vault");
    EXPECT_EQ(set->requests[1].alias, "Router");
}

TEST_F(InputsTest, MissingAddressDirectoryIsIOError)
{
    auto set = load_address_dir(m_dir / "absent");
    ASSERT_FALSE(set);
    EXPECT_EQ(set.error().code, error_code::kIOError);
}

TEST_F(InputsTest, MalformedAddressFileIsParseError)
{
    const auto path = write("CoreAddresses.json", "{ not json");
    auto set = load_address_file(path);
    ASSERT_FALSE(set);
    EXPECT_EQ(set.error().code, error_code::kParseError);
}

}  // namespace evmverify::inputs::test
