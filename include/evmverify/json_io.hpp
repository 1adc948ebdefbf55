#pragma once

/**
 * @file json_io.hpp
 * @brief Reading and writing JSON documents on disk
 */

#include "evmverify/common.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace evmverify::common {

/**
 * Read and parse a JSON file.
 * Errors: IOError (cannot open), ParseError (malformed JSON).
 */
[[nodiscard]] evmverify::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Read a JSON file and validate it against "<schema_dir>/<schema_name>.schema.json".
 */
[[nodiscard]] evmverify::Result<nlohmann::json> read_validated_json_file(
    const std::filesystem::path& path,
    const std::filesystem::path& schema_dir,
    std::string_view schema_name);

/**
 * Write @p payload in canonical form followed by a newline.
 * Parent directories are created as needed.
 */
[[nodiscard]] evmverify::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                                              const nlohmann::json& payload);

}  // namespace evmverify::common
