#pragma once

/**
 * @file toolchain.hpp
 * @brief Compiler toolchain capability: build a tree, look up artifacts
 */

#include "evmverify/bytecode.hpp"
#include "evmverify/common.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace evmverify::toolchain {

/**
 * @brief Compiled output of one contract
 */
struct CompiledArtifact
{
    std::string name;
    std::filesystem::path path;  ///< Artifact file the data came from
    Bytes creation;
    Bytes runtime;
    std::vector<bytecode::ImmutableRange> immutable_ranges;  ///< Offsets into runtime
};

class Toolchain
{
public:
    virtual ~Toolchain() = default;

    /**
     * @brief Compile the tree rooted at @p build_dir
     * @return BuildFailure, Timeout or ProcessSpawnFailed
     */
    [[nodiscard]] virtual VoidResult build(const std::filesystem::path& build_dir,
                                           std::chrono::seconds timeout) = 0;

    /**
     * @brief Compile the single source @p source, relative to @p build_dir
     *
     * Used when a full build produced no artifact for a contract whose
     * source file is known.
     * @return BuildFailure, Timeout or ProcessSpawnFailed
     */
    [[nodiscard]] virtual VoidResult build_file(const std::filesystem::path& build_dir,
                                                const std::string& source,
                                                std::chrono::seconds timeout) = 0;

    /**
     * @brief Locate the artifact of contract @p name after a build
     * @param source_hint Source file reported for the deployment; breaks ties
     *        between equally named contracts
     * @return ArtifactNotFound when no artifact matches
     */
    [[nodiscard]] virtual Result<CompiledArtifact> find_artifact(
        const std::filesystem::path& build_dir,
        std::string_view name,
        const std::optional<std::string>& source_hint) const = 0;
};

/**
 * @brief Decode a forge/solc artifact document
 *
 * Reads bytecode.object, deployedBytecode.object and
 * deployedBytecode.immutableReferences.
 */
[[nodiscard]] Result<CompiledArtifact> parse_artifact(const nlohmann::json& document,
                                                      std::string name);

/**
 * @brief Foundry: `forge build --force`, artifacts under out/
 */
class ForgeToolchain final : public Toolchain
{
public:
    explicit ForgeToolchain(std::string forge = "forge")
        : m_forge(std::move(forge))
    {}

    [[nodiscard]] VoidResult build(const std::filesystem::path& build_dir,
                                   std::chrono::seconds timeout) override;

    /// `forge build <source> --force`
    [[nodiscard]] VoidResult build_file(const std::filesystem::path& build_dir,
                                        const std::string& source,
                                        std::chrono::seconds timeout) override;

    [[nodiscard]] Result<CompiledArtifact> find_artifact(
        const std::filesystem::path& build_dir,
        std::string_view name,
        const std::optional<std::string>& source_hint) const override;

private:
    [[nodiscard]] VoidResult run_forge(const std::vector<std::string>& argv,
                                       const std::filesystem::path& build_dir,
                                       std::chrono::seconds timeout) const;

    std::string m_forge;
};

}  // namespace evmverify::toolchain
