/**
 * @file source_mapping.cpp
 * @brief Mapping table loading and lookup
 */

#include "evmverify/source_mapping.hpp"

#include "evmverify/json_io.hpp"
#include "evmverify/outcome.hpp"
#include "evmverify/version.hpp"

#include <format>
#include <optional>
#include <utility>

namespace evmverify::mapping {

namespace {

[[nodiscard]] std::optional<std::string> optional_string(const nlohmann::json& entry,
                                                         const char* key)
{
    auto it = entry.find(key);
    if (it == entry.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

[[nodiscard]] Result<SourceMapping> parse_entry(const std::string& name, const nlohmann::json& entry)
{
    if (!entry.is_object()) {
        return std::unexpected(Error::make(
            std::string(error_code::kParseError),
            std::format("Mapping entry '{}' must be an object", name)));
    }
    auto repository = optional_string(entry, "repo");
    auto ref = optional_string(entry, "commit");
    if (!repository || !ref) {
        return std::unexpected(Error::make(
            std::string(error_code::kParseError),
            std::format("Mapping entry '{}' needs non-empty 'repo' and 'commit'", name)));
    }
    return SourceMapping{
        .repository = std::move(*repository),
        .ref = std::move(*ref),
        .subpath = optional_string(entry, "subpath"),
        .artifact = optional_string(entry, "artifact_name"),
    };
}

}  // namespace

Result<MappingTable> MappingTable::from_json(const nlohmann::json& document)
{
    if (!document.is_object()) {
        return std::unexpected(Error::make(std::string(error_code::kParseError),
                                           "Mapping document must be an object"));
    }
    std::map<std::string, SourceMapping, std::less<>> entries;
    for (const auto& [name, entry] : document.items()) {
        auto mapping = parse_entry(name, entry);
        if (!mapping) {
            return std::unexpected(mapping.error());
        }
        entries.emplace(name, std::move(*mapping));
    }
    return MappingTable(std::move(entries));
}

const SourceMapping* MappingTable::find(std::string_view name) const
{
    auto it = m_entries.find(name);
    return it == m_entries.end() ? nullptr : &it->second;
}

Result<MappingTable> load_mapping_file(const std::filesystem::path& path,
                                       const std::filesystem::path& schema_dir)
{
    auto document = common::read_validated_json_file(path, schema_dir, kMappingSchemaVersion);
    if (!document) {
        return std::unexpected(document.error());
    }
    return MappingTable::from_json(*document);
}

Result<SourceMapping> SourceMappingResolver::resolve(std::string_view canonical_name) const
{
    if (const auto* mapping = m_table.find(canonical_name)) {
        return *mapping;
    }
    return std::unexpected(
        Error::make(std::string(error_code::kNoMapping),
                    std::format("No source mapping for '{}'", canonical_name)));
}

}  // namespace evmverify::mapping
