#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error/result types, hashing, hex encoding
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace evmverify {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/// Raw byte blob (bytecode, addresses, hashes)
using Bytes = std::vector<std::uint8_t>;

/// Progress callback; may be invoked from worker threads
using ProgressSink = std::function<void(std::string_view)>;

}  // namespace evmverify

namespace evmverify::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of a byte blob
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::span<const std::uint8_t> data);

/**
 * Compute SHA-256 hash of data with prefix
 * @param data Input bytes
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

// ============================================================================
// Hex Encoding
// ============================================================================

/**
 * Decode a hex string into bytes.
 * - An optional "0x"/"0X" prefix is accepted
 * - Upper and lower case digits are accepted
 * - An odd number of digits is an error
 */
[[nodiscard]] Result<Bytes> from_hex(std::string_view hex);

/**
 * Encode bytes as lowercase hex without prefix
 */
[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> bytes);

/**
 * Encode bytes as lowercase hex with "0x" prefix
 */
[[nodiscard]] std::string to_hex_prefixed(std::span<const std::uint8_t> bytes);

/**
 * Lowercase an ASCII string
 */
[[nodiscard]] std::string to_lower(std::string_view input);

// ============================================================================
// UTF-8 Text
// ============================================================================

/**
 * Drop a multi-byte sequence cut off at the end of @p text
 * @return Prefix of @p text ending on a character boundary
 */
[[nodiscard]] std::string_view utf8_complete_prefix(std::string_view text) noexcept;

/**
 * Last @p max_bytes of @p text at most, starting on a character boundary
 */
[[nodiscard]] std::string utf8_tail(std::string_view text, std::size_t max_bytes);

/**
 * Replace every invalid UTF-8 sequence in @p text with U+FFFD
 *
 * Captured tool output goes through this before it reaches an Error message
 * or a report.
 */
[[nodiscard]] std::string sanitize_utf8(std::string_view text);

}  // namespace evmverify::common
