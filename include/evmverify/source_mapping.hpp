#pragma once

/**
 * @file source_mapping.hpp
 * @brief SourceMappingResolver: canonical contract name -> source location
 */

#include "evmverify/common.hpp"
#include "evmverify/types.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace evmverify::mapping {

/**
 * @brief Immutable name -> SourceMapping table
 *
 * Built once at start-up from contract-mapping.json. Keys are canonical
 * contract names as reported by verified explorer metadata.
 */
class MappingTable
{
public:
    MappingTable() = default;
    explicit MappingTable(std::map<std::string, SourceMapping, std::less<>> entries)
        : m_entries(std::move(entries))
    {}

    /**
     * @brief Build from a document of the form
     *        {"Name": {"repo": "org/repo", "commit": "...", "subpath"?, "artifact_name"?}}
     *
     * Unknown keys inside an entry (compiler fields kept for humans) are ignored.
     */
    [[nodiscard]] static Result<MappingTable> from_json(const nlohmann::json& document);

    /// nullptr when absent; exact, case-sensitive match
    [[nodiscard]] const SourceMapping* find(std::string_view name) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

private:
    std::map<std::string, SourceMapping, std::less<>> m_entries;
};

/**
 * @brief Load and schema-validate a mapping file (contract_mapping.v1)
 */
[[nodiscard]] Result<MappingTable> load_mapping_file(const std::filesystem::path& path,
                                                     const std::filesystem::path& schema_dir);

/**
 * @brief Flat lookup with no guessing
 *
 * Lookups always use the canonical name; the caller keeps the alias for
 * display only.
 */
class SourceMappingResolver
{
public:
    explicit SourceMappingResolver(MappingTable table)
        : m_table(std::move(table))
    {}

    /**
     * @brief Resolve a canonical name
     * @return NoMapping naming the missing key when absent
     */
    [[nodiscard]] Result<SourceMapping> resolve(std::string_view canonical_name) const;

    [[nodiscard]] const MappingTable& table() const noexcept { return m_table; }

private:
    MappingTable m_table;
};

}  // namespace evmverify::mapping
