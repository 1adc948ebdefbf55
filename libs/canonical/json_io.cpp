/**
 * @file json_io.cpp
 * @brief JSON file helpers
 */

#include "evmverify/json_io.hpp"

#include "evmverify/canonical_json.hpp"
#include "evmverify/schema_validate.hpp"

#include <format>
#include <fstream>
#include <system_error>

namespace evmverify::common {

evmverify::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError", std::format("Failed to parse JSON file: {}: {}", path.string(), ex.what())));
    }
    return payload;
}

evmverify::Result<nlohmann::json> read_validated_json_file(const std::filesystem::path& path,
                                                           const std::filesystem::path& schema_dir,
                                                           std::string_view schema_name)
{
    auto payload = read_json_file(path);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    if (auto valid = validate_against(*payload, schema_dir, schema_name); !valid) {
        return std::unexpected(Error::make(
            "SchemaValidationFailed",
            std::format("{} does not match {}:\n{}", path.string(), schema_name,
                        valid.error().message)));
    }
    return payload;
}

evmverify::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                                const nlohmann::json& payload)
{
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(Error::make(
                "IOError",
                std::format("Failed to create directory {}: {}", path.parent_path().string(),
                            ec.message())));
        }
    }
    auto canonical = canonical::canonicalize(payload);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    std::ofstream out(path);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << *canonical << "\n";
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace evmverify::common
