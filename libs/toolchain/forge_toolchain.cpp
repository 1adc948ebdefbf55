/**
 * @file forge_toolchain.cpp
 * @brief Foundry build invocation and artifact lookup
 */

#include "evmverify/toolchain.hpp"

#include "evmverify/json_io.hpp"
#include "evmverify/outcome.hpp"
#include "evmverify/process.hpp"

#include <algorithm>
#include <format>
#include <system_error>
#include <utility>

namespace evmverify::toolchain {

namespace {

constexpr std::string_view kOutDir = "out";
constexpr std::string_view kBuildInfoDir = "build-info";
constexpr std::size_t kErrorTailSize = 2000;

[[nodiscard]] Error build_failure(std::string message)
{
    return Error::make(std::string(error_code::kBuildFailure), std::move(message));
}

[[nodiscard]] std::string tail(std::string_view text)
{
    return common::sanitize_utf8(common::utf8_tail(text, kErrorTailSize));
}

[[nodiscard]] Result<Bytes> bytecode_object(const nlohmann::json& document,
                                            const char* section,
                                            std::string_view name)
{
    if (!document.contains(section) || !document.at(section).is_object()) {
        return Bytes{};
    }
    const auto& object = document.at(section);
    if (!object.contains("object") || !object.at("object").is_string()) {
        return Bytes{};
    }
    const auto& hex = object.at("object").get_ref<const std::string&>();
    if (hex.find("__$") != std::string::npos) {
        return std::unexpected(build_failure(
            std::format("Artifact '{}' has unlinked library references in {}", name, section)));
    }
    auto bytes = common::from_hex(hex);
    if (!bytes) {
        return std::unexpected(build_failure(
            std::format("Artifact '{}' has malformed {}: {}", name, section, bytes.error().message)));
    }
    return bytes;
}

[[nodiscard]] std::vector<bytecode::ImmutableRange> immutable_ranges(const nlohmann::json& document)
{
    std::vector<bytecode::ImmutableRange> ranges;
    if (!document.contains("deployedBytecode")) {
        return ranges;
    }
    const auto& deployed = document.at("deployedBytecode");
    if (!deployed.is_object() || !deployed.contains("immutableReferences")
        || !deployed.at("immutableReferences").is_object()) {
        return ranges;
    }
    for (const auto& [id, references] : deployed.at("immutableReferences").items()) {
        if (!references.is_array()) {
            continue;
        }
        for (const auto& reference : references) {
            if (!reference.is_object() || !reference.contains("start")
                || !reference.contains("length") || !reference.at("start").is_number_unsigned()
                || !reference.at("length").is_number_unsigned()) {
                continue;
            }
            ranges.push_back({.start = reference.at("start").get<std::size_t>(),
                              .length = reference.at("length").get<std::size_t>()});
        }
    }
    std::ranges::sort(ranges, [](const auto& a, const auto& b) { return a.start < b.start; });
    return ranges;
}

/**
 * @brief Artifact files under out/, sorted, excluding build-info
 */
[[nodiscard]] Result<std::vector<std::filesystem::path>> list_artifacts(
    const std::filesystem::path& out_dir)
{
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(out_dir, ec);
    if (ec) {
        return std::unexpected(Error::make(
            std::string(error_code::kArtifactNotFound),
            std::format("No build output in {}: {}", out_dir.string(), ec.message())));
    }
    const std::filesystem::recursive_directory_iterator end;
    while (it != end) {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) && it->path().filename() == kBuildInfoDir) {
            it.disable_recursion_pending();
        } else if (it->is_regular_file(entry_ec) && it->path().extension() == ".json") {
            files.push_back(it->path());
        }
        it.increment(ec);
        if (ec) {
            return std::unexpected(Error::make(
                std::string(error_code::kArtifactNotFound),
                std::format("Cannot scan {}: {}", out_dir.string(), ec.message())));
        }
    }
    std::ranges::sort(files);
    return files;
}

[[nodiscard]] bool matches_hint(const std::filesystem::path& artifact,
                                const std::optional<std::string>& source_hint)
{
    if (!source_hint) {
        return false;
    }
    // forge lays artifacts out as out/<Source.sol>/<Contract>.json
    return artifact.parent_path().filename() == std::filesystem::path(*source_hint).filename();
}

}  // namespace

Result<CompiledArtifact> parse_artifact(const nlohmann::json& document, std::string name)
{
    if (!document.is_object()) {
        return std::unexpected(build_failure(std::format("Artifact '{}' is not an object", name)));
    }
    auto creation = bytecode_object(document, "bytecode", name);
    if (!creation) {
        return std::unexpected(creation.error());
    }
    auto runtime = bytecode_object(document, "deployedBytecode", name);
    if (!runtime) {
        return std::unexpected(runtime.error());
    }
    CompiledArtifact artifact;
    artifact.name = std::move(name);
    artifact.creation = std::move(*creation);
    artifact.runtime = std::move(*runtime);
    artifact.immutable_ranges = immutable_ranges(document);
    return artifact;
}

VoidResult ForgeToolchain::run_forge(const std::vector<std::string>& argv,
                                     const std::filesystem::path& build_dir,
                                     std::chrono::seconds timeout) const
{
    auto result = process::run_process(argv, build_dir, timeout);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->succeeded()) {
        const auto& output = result->stderr_text.empty() ? result->stdout_text
                                                         : result->stderr_text;
        return std::unexpected(build_failure(std::format("'{}' failed in {} (exit {}): {}",
                                                         process::describe_command(argv),
                                                         build_dir.string(), result->exit_code,
                                                         tail(output))));
    }
    return {};
}

VoidResult ForgeToolchain::build(const std::filesystem::path& build_dir,
                                 std::chrono::seconds timeout)
{
    return run_forge({m_forge, "build", "--force"}, build_dir, timeout);
}

VoidResult ForgeToolchain::build_file(const std::filesystem::path& build_dir,
                                      const std::string& source,
                                      std::chrono::seconds timeout)
{
    return run_forge({m_forge, "build", source, "--force"}, build_dir, timeout);
}

Result<CompiledArtifact> ForgeToolchain::find_artifact(
    const std::filesystem::path& build_dir,
    std::string_view name,
    const std::optional<std::string>& source_hint) const
{
    auto files = list_artifacts(build_dir / kOutDir);
    if (!files) {
        return std::unexpected(files.error());
    }
    const std::string wanted = common::to_lower(name);

    std::vector<std::filesystem::path> by_stem;
    for (const auto& file : *files) {
        if (common::to_lower(file.stem().string()) == wanted) {
            by_stem.push_back(file);
        }
    }

    // Hardhat-style artifacts carry contractName; only consulted when no stem matches.
    std::vector<std::filesystem::path> candidates = by_stem;
    if (candidates.empty()) {
        for (const auto& file : *files) {
            auto document = common::read_json_file(file);
            if (!document || !document->is_object()) {
                continue;
            }
            auto it = document->find("contractName");
            if (it != document->end() && it->is_string()
                && common::to_lower(it->get<std::string>()) == wanted) {
                candidates.push_back(file);
            }
        }
    }

    std::stable_partition(candidates.begin(), candidates.end(),
                          [&](const std::filesystem::path& file) {
                              return matches_hint(file, source_hint);
                          });

    for (const auto& file : candidates) {
        auto document = common::read_json_file(file);
        if (!document) {
            return std::unexpected(build_failure(document.error().message));
        }
        auto artifact = parse_artifact(*document, std::string(name));
        if (!artifact) {
            return std::unexpected(artifact.error());
        }
        // Interfaces and abstract contracts compile to empty code.
        if (artifact->runtime.empty() && artifact->creation.empty()) {
            continue;
        }
        artifact->path = file;
        return artifact;
    }
    return std::unexpected(Error::make(
        std::string(error_code::kArtifactNotFound),
        std::format("Artifact not found: {} (searched {})", name, (build_dir / kOutDir).string())));
}

}  // namespace evmverify::toolchain
