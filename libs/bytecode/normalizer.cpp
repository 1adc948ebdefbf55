/**
 * @file normalizer.cpp
 * @brief Metadata, constructor-argument and immutable-slot normalization
 */

#include "evmverify/bytecode.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>

namespace evmverify::bytecode {

namespace {

using ByteSpan = std::span<const std::uint8_t>;

/// Keys solc (and older swarm-hash compilers) place first in the metadata map
constexpr std::array<std::string_view, 5> kMetadataKeys = {"ipfs", "bzzr0", "bzzr1", "solc",
                                                          "experimental"};

constexpr std::uint8_t kMajorTypeShift = 5;
constexpr std::uint8_t kAdditionalMask = 0x1F;
constexpr int kMaxNesting = 4;

enum class MajorType : std::uint8_t {
    kUnsigned = 0,
    kNegative = 1,
    kBytes = 2,
    kText = 3,
    kArray = 4,
    kMap = 5,
    kTag = 6,
    kSimple = 7
};

struct ItemHead
{
    MajorType type;
    std::uint64_t argument;
    std::size_t next;  ///< Offset just past the head
};

[[nodiscard]] std::optional<ItemHead> read_head(ByteSpan code, std::size_t pos)
{
    if (pos >= code.size()) {
        return std::nullopt;
    }
    const auto initial = code[pos];
    const auto type = static_cast<MajorType>(initial >> kMajorTypeShift);
    const auto additional = static_cast<std::uint8_t>(initial & kAdditionalMask);
    ++pos;

    if (additional < 24) {
        return ItemHead{.type = type, .argument = additional, .next = pos};
    }
    std::size_t width = 0;
    switch (additional) {
        case 24:
            width = 1;
            break;
        case 25:
            width = 2;
            break;
        case 26:
            width = 4;
            break;
        case 27:
            width = 8;
            break;
        default:
            // Indefinite lengths and reserved values never appear in metadata
            return std::nullopt;
    }
    if (code.size() - pos < width) {
        return std::nullopt;
    }
    std::uint64_t argument = 0;
    for (std::size_t i = 0; i < width; ++i) {
        argument = (argument << 8U) | code[pos + i];
    }
    return ItemHead{.type = type, .argument = argument, .next = pos + width};
}

/**
 * @brief Skip one complete CBOR item
 * @return Offset just past the item, or nullopt if it does not decode
 */
[[nodiscard]] std::optional<std::size_t> skip_item(ByteSpan code, std::size_t pos, int depth)
{
    if (depth > kMaxNesting) {
        return std::nullopt;
    }
    auto head = read_head(code, pos);
    if (!head) {
        return std::nullopt;
    }

    switch (head->type) {
        case MajorType::kUnsigned:
        case MajorType::kNegative:
        case MajorType::kSimple:
            return head->next;
        case MajorType::kBytes:
        case MajorType::kText:
            if (head->argument > code.size() - head->next) {
                return std::nullopt;
            }
            return head->next + static_cast<std::size_t>(head->argument);
        case MajorType::kArray:
        case MajorType::kMap: {
            const std::uint64_t items =
                head->type == MajorType::kMap ? head->argument * 2 : head->argument;
            if (items > code.size()) {
                return std::nullopt;
            }
            std::size_t cursor = head->next;
            for (std::uint64_t i = 0; i < items; ++i) {
                auto next = skip_item(code, cursor, depth + 1);
                if (!next) {
                    return std::nullopt;
                }
                cursor = *next;
            }
            return cursor;
        }
        case MajorType::kTag:
            return skip_item(code, head->next, depth + 1);
    }
    return std::nullopt;
}

[[nodiscard]] bool is_metadata_map_start(ByteSpan code, std::size_t pos)
{
    auto map_head = read_head(code, pos);
    if (!map_head || map_head->type != MajorType::kMap || map_head->argument == 0
        || map_head->argument > 8) {
        return false;
    }
    auto key_head = read_head(code, map_head->next);
    if (!key_head || key_head->type != MajorType::kText
        || key_head->argument > code.size() - key_head->next) {
        return false;
    }
    const std::string_view key(reinterpret_cast<const char*>(code.data() + key_head->next),
                               static_cast<std::size_t>(key_head->argument));
    return std::ranges::find(kMetadataKeys, key) != kMetadataKeys.end();
}

[[nodiscard]] std::size_t read_be16(ByteSpan code, std::size_t pos) noexcept
{
    return (static_cast<std::size_t>(code[pos]) << 8U) | code[pos + 1];
}

/**
 * @brief Check for a metadata section starting at @p pos
 * @return Section including its length field when the map decodes and the
 *         length field that follows it matches the map's encoded size
 */
[[nodiscard]] std::optional<MetadataSection> section_at(ByteSpan code, std::size_t pos)
{
    if (!is_metadata_map_start(code, pos)) {
        return std::nullopt;
    }
    auto end = skip_item(code, pos, 0);
    if (!end || code.size() - *end < 2) {
        return std::nullopt;
    }
    const std::size_t cbor_size = *end - pos;
    if (read_be16(code, *end) != cbor_size) {
        return std::nullopt;
    }
    return MetadataSection{.offset = pos, .size = cbor_size + 2};
}

}  // namespace

std::string NormalizedCode::hex() const
{
    return common::to_hex(bytes);
}

std::optional<MetadataSection> find_trailing_metadata(std::span<const std::uint8_t> code)
{
    if (code.size() < 2) {
        return std::nullopt;
    }
    const std::size_t declared = read_be16(code, code.size() - 2);
    if (declared == 0 || declared > code.size() - 2) {
        return std::nullopt;
    }
    const std::size_t offset = code.size() - 2 - declared;
    auto section = section_at(code, offset);
    if (!section || section->offset + section->size != code.size()) {
        return std::nullopt;
    }
    return section;
}

std::vector<MetadataSection> find_metadata_sections(std::span<const std::uint8_t> code)
{
    std::vector<MetadataSection> sections;
    std::size_t pos = 0;
    while (pos < code.size()) {
        if (auto section = section_at(code, pos)) {
            sections.push_back(*section);
            pos = section->offset + section->size;
            continue;
        }
        ++pos;
    }
    return sections;
}

Bytes strip_metadata(std::span<const std::uint8_t> code)
{
    const auto sections = find_metadata_sections(code);
    if (sections.empty()) {
        return Bytes(code.begin(), code.end());
    }
    Bytes out;
    out.reserve(code.size());
    std::size_t cursor = 0;
    for (const auto& section : sections) {
        out.insert(out.end(), code.begin() + static_cast<std::ptrdiff_t>(cursor),
                   code.begin() + static_cast<std::ptrdiff_t>(section.offset));
        cursor = section.offset + section.size;
    }
    out.insert(out.end(), code.begin() + static_cast<std::ptrdiff_t>(cursor), code.end());
    return out;
}

std::size_t constructor_args_size(std::span<const std::uint8_t> creation,
                                  std::span<const std::uint8_t> runtime_reference,
                                  std::optional<std::size_t> reference_length)
{
    if (!runtime_reference.empty() && runtime_reference.size() <= creation.size()) {
        auto found = std::ranges::find_end(creation, runtime_reference);
        if (!found.empty()) {
            const auto code_end = static_cast<std::size_t>(
                std::distance(creation.begin(), found.end()));
            const std::size_t tail = creation.size() - code_end;
            if (tail % kAbiWordSize == 0) {
                return tail;
            }
        }
    }
    if (reference_length && creation.size() > *reference_length) {
        const std::size_t excess = creation.size() - *reference_length;
        if (excess % kAbiWordSize == 0) {
            return excess;
        }
    }
    return 0;
}

std::size_t mask_immutables(Bytes& code, std::span<const ImmutableRange> ranges)
{
    std::size_t applied = 0;
    for (const auto& range : ranges) {
        if (range.length == 0 || range.start > code.size()
            || range.length > code.size() - range.start) {
            continue;
        }
        std::ranges::fill_n(code.begin() + static_cast<std::ptrdiff_t>(range.start),
                            static_cast<std::ptrdiff_t>(range.length),
                            std::uint8_t{0});
        ++applied;
    }
    return applied;
}

NormalizedCode normalize(std::span<const std::uint8_t> raw, const NormalizeOptions& options)
{
    NormalizedCode result;
    result.original_size = raw.size();

    // Immutable offsets refer to the unstripped code, so mask first.
    Bytes working(raw.begin(), raw.end());
    if (options.role == BytecodeRole::kRuntime) {
        result.immutables_masked = mask_immutables(working, options.immutable_ranges);
    }

    const auto sections = find_metadata_sections(working);
    result.metadata_sections = sections.size();
    for (const auto& section : sections) {
        result.metadata_bytes += section.size;
    }
    result.bytes = strip_metadata(working);

    if (options.role == BytecodeRole::kCreation) {
        Bytes runtime;
        if (options.runtime_reference) {
            runtime = strip_metadata(*options.runtime_reference);
        }
        result.constructor_args_size =
            constructor_args_size(result.bytes, runtime, options.reference_length);
        result.bytes.resize(result.bytes.size() - result.constructor_args_size);
    }
    return result;
}

}  // namespace evmverify::bytecode
