/**
 * @file test_forge_toolchain.cpp
 * @brief Artifact decoding and lookup under out/
 */

#include "evmverify/outcome.hpp"
#include "evmverify/toolchain.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace evmverify::toolchain::test {

namespace {

nlohmann::json artifact_json(const std::string& creation, const std::string& runtime)
{
    return nlohmann::json{
        {"bytecode", {{"object", creation}}},
        {"deployedBytecode", {{"object", runtime}}},
    };
}

class ArtifactLookupTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_dir = std::filesystem::temp_directory_path()
                / (std::string("evmverify_toolchain_")
                   + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(m_dir);
        std::filesystem::create_directories(m_dir / "out");
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    void write(const std::filesystem::path& relative, const nlohmann::json& document)
    {
        const auto path = m_dir / "out" / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << document.dump();
    }

    /// A forge stand-in that logs its arguments and then runs @p body
    std::filesystem::path fake_forge(const std::string& body)
    {
        const auto path = m_dir / "forge";
        {
            std::ofstream out(path);
            out << "#!/bin/sh\n"
                << "echo \"$@\" >> '" << log_path().string() << "'\n"
                << body << "\n";
        }
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
        return path;
    }

    [[nodiscard]] std::filesystem::path log_path() const { return m_dir / "forge.log"; }

    [[nodiscard]] std::string logged() const
    {
        std::ifstream in(log_path());
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::filesystem::path m_dir;
    ForgeToolchain m_toolchain;
};

}  // namespace

TEST(ParseArtifact, ReadsBothBytecodesAndImmutables)
{
    auto document = artifact_json("0x6080aa", "0x6080bb");
    document["deployedBytecode"]["immutableReferences"] = {
        {"12", {{{"start", 40}, {"length", 32}}, {{"start", 5}, {"length", 32}}}},
    };
    auto artifact = parse_artifact(document, "Vault");
    ASSERT_TRUE(artifact) << artifact.error().message;
    EXPECT_EQ(artifact->name, "Vault");
    EXPECT_EQ(artifact->creation, (Bytes{0x60, 0x80, 0xaa}));
    EXPECT_EQ(artifact->runtime, (Bytes{0x60, 0x80, 0xbb}));
    ASSERT_EQ(artifact->immutable_ranges.size(), 2U);
    EXPECT_EQ(artifact->immutable_ranges[0].start, 5U);
    EXPECT_EQ(artifact->immutable_ranges[1].start, 40U);
    EXPECT_EQ(artifact->immutable_ranges[1].length, 32U);
}

TEST(ParseArtifact, MissingSectionsGiveEmptyCode)
{
    auto artifact = parse_artifact(nlohmann::json{{"abi", nlohmann::json::array()}}, "IVault");
    ASSERT_TRUE(artifact);
    EXPECT_TRUE(artifact->creation.empty());
    EXPECT_TRUE(artifact->runtime.empty());
    EXPECT_TRUE(artifact->immutable_ranges.empty());
}

TEST(ParseArtifact, UnlinkedLibraryIsBuildFailure)
{
    auto artifact = parse_artifact(
        artifact_json("0x6080__$1234567890abcdef1234567890abcdef12$__00", "0x00"), "Uses");
    ASSERT_FALSE(artifact);
    EXPECT_EQ(artifact.error().code, error_code::kBuildFailure);
}

TEST(ParseArtifact, MalformedHexIsBuildFailure)
{
    auto artifact = parse_artifact(artifact_json("0x60zz", "0x00"), "Broken");
    ASSERT_FALSE(artifact);
    EXPECT_EQ(artifact.error().code, error_code::kBuildFailure);
}

TEST_F(ArtifactLookupTest, MatchesStemCaseInsensitively)
{
    write("Vault.sol/Vault.json", artifact_json("0x01", "0x02"));
    auto artifact = m_toolchain.find_artifact(m_dir, "vault", std::nullopt);
    ASSERT_TRUE(artifact) << artifact.error().message;
    EXPECT_EQ(artifact->runtime, Bytes{0x02});
    EXPECT_EQ(artifact->path, m_dir / "out" / "Vault.sol" / "Vault.json");
}

TEST_F(ArtifactLookupTest, SourceHintBreaksTies)
{
    write("A.sol/Token.json", artifact_json("0x0a", "0x0a"));
    write("B.sol/Token.json", artifact_json("0x0b", "0x0b"));
    auto preferred = m_toolchain.find_artifact(m_dir, "Token", std::string("src/tokens/B.sol"));
    ASSERT_TRUE(preferred);
    EXPECT_EQ(preferred->runtime, Bytes{0x0b});

    auto first = m_toolchain.find_artifact(m_dir, "Token", std::nullopt);
    ASSERT_TRUE(first);
    EXPECT_EQ(first->runtime, Bytes{0x0a});
}

TEST_F(ArtifactLookupTest, EmptyInterfaceArtifactIsSkipped)
{
    write("IToken.sol/Token.json", artifact_json("0x", "0x"));
    write("Token.sol/Token.json", artifact_json("0x01", "0x02"));
    auto artifact = m_toolchain.find_artifact(m_dir, "Token", std::nullopt);
    ASSERT_TRUE(artifact);
    EXPECT_EQ(artifact->path.parent_path().filename(), "Token.sol");
}

TEST_F(ArtifactLookupTest, FallsBackToContractName)
{
    auto document = artifact_json("0x01", "0x03");
    document["contractName"] = "Router";
    write("artifacts/router_v2.json", document);
    auto artifact = m_toolchain.find_artifact(m_dir, "Router", std::nullopt);
    ASSERT_TRUE(artifact);
    EXPECT_EQ(artifact->runtime, Bytes{0x03});
}

TEST_F(ArtifactLookupTest, BuildInfoIsIgnored)
{
    write("build-info/Vault.json", artifact_json("0x01", "0x02"));
    auto artifact = m_toolchain.find_artifact(m_dir, "Vault", std::nullopt);
    ASSERT_FALSE(artifact);
    EXPECT_EQ(artifact.error().code, error_code::kArtifactNotFound);
}

TEST_F(ArtifactLookupTest, MissingOutputIsArtifactNotFound)
{
    std::filesystem::remove_all(m_dir / "out");
    auto artifact = m_toolchain.find_artifact(m_dir, "Vault", std::nullopt);
    ASSERT_FALSE(artifact);
    EXPECT_EQ(artifact.error().code, error_code::kArtifactNotFound);
}

TEST_F(ArtifactLookupTest, BuildReportsFailingCompiler)
{
    ForgeToolchain failing("false");
    auto built = failing.build(m_dir, std::chrono::seconds(10));
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, error_code::kBuildFailure);

    ForgeToolchain succeeding("true");
    EXPECT_TRUE(succeeding.build(m_dir, std::chrono::seconds(10)));
}

TEST_F(ArtifactLookupTest, FullBuildIsForced)
{
    ForgeToolchain forge(fake_forge("exit 0").string());
    ASSERT_TRUE(forge.build(m_dir, std::chrono::seconds(10)));
    EXPECT_EQ(logged(), "build --force\n");
}

TEST_F(ArtifactLookupTest, SingleFileBuildNamesTheSource)
{
    ForgeToolchain forge(fake_forge("exit 0").string());
    ASSERT_TRUE(forge.build_file(m_dir, "src/pools/Pool.sol", std::chrono::seconds(10)));
    EXPECT_EQ(logged(), "build src/pools/Pool.sol --force\n");
}

TEST_F(ArtifactLookupTest, SingleFileBuildFailureIsBuildFailure)
{
    ForgeToolchain forge(fake_forge("echo 'Error: no such file' >&2; exit 1").string());
    auto built = forge.build_file(m_dir, "src/Missing.sol", std::chrono::seconds(10));
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, error_code::kBuildFailure);
    EXPECT_NE(built.error().message.find("src/Missing.sol"), std::string::npos);
    EXPECT_NE(built.error().message.find("no such file"), std::string::npos);
}

TEST_F(ArtifactLookupTest, MultibyteCompilerOutputStaysValidUtf8)
{
    // 3000 bytes of em dashes; the kept tail would start inside a character.
    ForgeToolchain forge(
        fake_forge("i=0\n"
                   "while [ $i -lt 1000 ]; do printf '\\342\\200\\224' >&2; i=$((i+1)); done\n"
                   "exit 1")
            .string());
    auto built = forge.build(m_dir, std::chrono::seconds(10));
    ASSERT_FALSE(built);
    EXPECT_EQ(built.error().code, error_code::kBuildFailure);
    const auto& message = built.error().message;
    EXPECT_NE(message.find("\xE2\x80\x94"), std::string::npos);
    EXPECT_EQ(message.find("\xEF\xBF\xBD"), std::string::npos);
    EXPECT_NO_THROW(static_cast<void>(nlohmann::json(message).dump()));
}

}  // namespace evmverify::toolchain::test
