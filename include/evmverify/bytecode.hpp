#pragma once

/**
 * @file bytecode.hpp
 * @brief Bytecode normalization and exact comparison
 *
 * Normalization removes data that legitimately differs between a deployed
 * blob and a freshly compiled one:
 * - compiler metadata sections (CBOR map followed by a 2-byte length)
 * - ABI-encoded constructor arguments appended to creation code
 * - immutable slots in runtime code, using the compiler's own offsets
 *
 * Comparison afterwards is exact byte equality.
 */

#include "evmverify/common.hpp"
#include "evmverify/types.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace evmverify::bytecode {

/// ABI words are 32 bytes; constructor arguments are a whole number of words
constexpr std::size_t kAbiWordSize = 32;

/**
 * @brief Byte range of one immutable variable inside runtime code
 */
struct ImmutableRange
{
    std::size_t start = 0;
    std::size_t length = 0;

    bool operator==(const ImmutableRange&) const = default;
};

/**
 * @brief Inputs beyond the raw blob that steer normalization
 */
struct NormalizeOptions
{
    BytecodeRole role = BytecodeRole::kRuntime;

    /// Runtime code of the same deployment; locates the end of creation code
    std::optional<Bytes> runtime_reference;

    /// Metadata-stripped length of the compiled creation code (fallback boundary)
    std::optional<std::size_t> reference_length;

    /// Immutable ranges to zero (runtime role only)
    std::vector<ImmutableRange> immutable_ranges;
};

/**
 * @brief Canonical form of a blob plus a record of what was removed
 */
struct NormalizedCode
{
    Bytes bytes;
    std::size_t original_size = 0;
    std::size_t metadata_bytes = 0;          ///< Total bytes of stripped metadata sections
    std::size_t metadata_sections = 0;
    std::size_t constructor_args_size = 0;
    std::size_t immutables_masked = 0;

    /// Lowercase hex, no prefix
    [[nodiscard]] std::string hex() const;
};

/**
 * @brief Location of one metadata section, including its 2-byte length field
 */
struct MetadataSection
{
    std::size_t offset = 0;
    std::size_t size = 0;  ///< CBOR bytes + 2
};

/**
 * Find the metadata section terminating the blob, if any.
 * The trailing length must fit within the blob and frame a decodable CBOR map
 * whose first key is a known metadata key.
 */
[[nodiscard]] std::optional<MetadataSection> find_trailing_metadata(std::span<const std::uint8_t> code);

/**
 * Find every metadata section, embedded or trailing, in ascending offset order.
 * Sections do not overlap.
 */
[[nodiscard]] std::vector<MetadataSection> find_metadata_sections(std::span<const std::uint8_t> code);

/**
 * Strip every metadata section. A blob without metadata is returned unchanged.
 */
[[nodiscard]] Bytes strip_metadata(std::span<const std::uint8_t> code);

/**
 * Determine how many trailing bytes of a (metadata-stripped) creation blob are
 * constructor arguments.
 *
 * When @p runtime_reference is found inside @p creation, everything after its
 * last occurrence is argument data. Otherwise, when @p reference_length is
 * known and the blob exceeds it by a whole number of ABI words, the excess is
 * argument data. This is an alignment heuristic, not an ABI parse; a blob that
 * matches neither rule is reported as having no arguments.
 */
[[nodiscard]] std::size_t constructor_args_size(std::span<const std::uint8_t> creation,
                                                std::span<const std::uint8_t> runtime_reference,
                                                std::optional<std::size_t> reference_length);

/**
 * Zero the given ranges; ranges that do not fit are ignored.
 * @return Number of ranges applied
 */
std::size_t mask_immutables(Bytes& code, std::span<const ImmutableRange> ranges);

/**
 * Normalize a raw blob. Deterministic and idempotent.
 */
[[nodiscard]] NormalizedCode normalize(std::span<const std::uint8_t> raw,
                                       const NormalizeOptions& options);

/**
 * @brief Verdict of an exact comparison
 */
struct Verdict
{
    bool matched = false;
    std::optional<std::size_t> first_diff_offset;  ///< Set iff !matched
    std::size_t deployed_size = 0;
    std::size_t compiled_size = 0;
    std::string deployed_context;  ///< Hex window around the first difference
    std::string compiled_context;
};

/**
 * Compare two normalized blobs byte for byte.
 * On a length-only difference the offset is the shorter length.
 */
[[nodiscard]] Verdict compare(std::span<const std::uint8_t> deployed,
                              std::span<const std::uint8_t> compiled);

}  // namespace evmverify::bytecode
