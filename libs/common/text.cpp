/**
 * @file text.cpp
 * @brief UTF-8 boundary handling for captured tool output
 */

#include "evmverify/common.hpp"

#include <nlohmann/json.hpp>

namespace evmverify::common {

namespace {

/// Longest UTF-8 sequence
constexpr std::size_t kMaxSequence = 4;

[[nodiscard]] constexpr bool is_continuation(unsigned char c) noexcept
{
    return (c & 0xC0U) == 0x80U;
}

/**
 * @brief Sequence length announced by a lead byte, 0 for an invalid lead
 */
[[nodiscard]] constexpr std::size_t sequence_length(unsigned char lead) noexcept
{
    if (lead < 0x80U) {
        return 1;
    }
    if ((lead & 0xE0U) == 0xC0U) {
        return 2;
    }
    if ((lead & 0xF0U) == 0xE0U) {
        return 3;
    }
    if ((lead & 0xF8U) == 0xF0U) {
        return 4;
    }
    return 0;
}

}  // namespace

std::string_view utf8_complete_prefix(std::string_view text) noexcept
{
    std::size_t lead = text.size();
    for (std::size_t back = 0; back < kMaxSequence && lead > 0; ++back) {
        --lead;
        const auto c = static_cast<unsigned char>(text[lead]);
        if (is_continuation(c)) {
            continue;
        }
        if (sequence_length(c) > text.size() - lead) {
            return text.substr(0, lead);
        }
        return text;
    }
    return text;
}

std::string utf8_tail(std::string_view text, std::size_t max_bytes)
{
    if (text.size() <= max_bytes) {
        return std::string(text);
    }
    text = text.substr(text.size() - max_bytes);
    for (std::size_t skipped = 0; skipped + 1 < kMaxSequence && !text.empty()
                                  && is_continuation(static_cast<unsigned char>(text.front()));
         ++skipped) {
        text.remove_prefix(1);
    }
    return std::string(text);
}

std::string sanitize_utf8(std::string_view text)
{
    // nlohmann's replace handler substitutes U+FFFD; parsing the dump back unescapes it.
    const nlohmann::json wrapped = std::string(text);
    const std::string encoded =
        wrapped.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return nlohmann::json::parse(encoded).get<std::string>();
}

}  // namespace evmverify::common
