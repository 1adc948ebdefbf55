#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for deterministic hashing and reports
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Integers only (no floating point)
 */

#include "evmverify/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace evmverify::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] evmverify::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Compute SHA-256 hash of canonical JSON
 * @param j JSON value
 * @return "sha256:" + hex hash or error
 */
[[nodiscard]] evmverify::Result<std::string> hash_canonical(const nlohmann::json& j);

/**
 * Validate JSON for canonical form requirements (no floating point numbers)
 * @param j JSON value
 * @return Empty on success, error on failure
 */
[[nodiscard]] evmverify::VoidResult validate_for_canonical(const nlohmann::json& j);

}  // namespace evmverify::canonical
