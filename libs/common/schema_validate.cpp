/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "evmverify/schema_validate.hpp"

#include <format>
#include <fstream>
#include <memory>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace evmverify::common {

namespace {

/// valijson resolves draft-07 "definitions"; schemas here use "$defs"
void rewrite_defs(nlohmann::json& schema)
{
    if (schema.is_object()) {
        if (schema.contains("$defs") && !schema.contains("definitions")) {
            schema["definitions"] = schema["$defs"];
        }
        for (auto& [key, value] : schema.items()) {
            if (key == "$ref" && value.is_string()) {
                constexpr std::string_view kPrefix = "#/$defs/";
                const auto& ref = value.get_ref<const std::string&>();
                if (ref.starts_with(kPrefix)) {
                    value = "#/definitions/" + ref.substr(kPrefix.size());
                }
                continue;
            }
            rewrite_defs(value);
        }
        return;
    }
    if (schema.is_array()) {
        for (auto& value : schema) {
            rewrite_defs(value);
        }
    }
}

[[nodiscard]] std::string format_validation_errors(valijson::ValidationResults& results)
{
    std::string out;
    valijson::ValidationResults::Error error;

    while (results.popError(error)) {
        std::string context;
        for (const auto& part : error.context) {
            context += "/" + part;
        }
        if (context.empty()) {
            context = "/";
        }
        if (!out.empty()) {
            out += '\n';
        }
        out += std::format("{}: {}", context, error.description);
    }
    return out;
}

[[nodiscard]] evmverify::Result<nlohmann::json> load_schema(const std::string& schema_path)
{
    std::ifstream in(schema_path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + schema_path));
    }
    nlohmann::json schema;
    try {
        in >> schema;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed",
            std::format("Failed to parse schema JSON {}: {}", schema_path, ex.what())));
    }
    rewrite_defs(schema);
    return schema;
}

}  // namespace

evmverify::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = load_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    valijson::Schema schema;
    valijson::SchemaParser parser;
    try {
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema);
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("SchemaBuildFailed", std::string("Failed to build schema: ") + ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target_adapter(j);

    if (!validator.validate(schema, target_adapter, &results)) {
        std::string error = format_validation_errors(results);
        if (error.empty()) {
            error = "Schema validation failed.";
        }
        return std::unexpected(Error::make("SchemaValidationFailed", std::move(error)));
    }
    return {};
}

evmverify::VoidResult validate_against(const nlohmann::json& j,
                                       const std::filesystem::path& schema_dir,
                                       std::string_view schema_name)
{
    const auto schema_path = schema_dir / (std::string(schema_name) + ".schema.json");
    return validate_json(j, schema_path.string());
}

}  // namespace evmverify::common
