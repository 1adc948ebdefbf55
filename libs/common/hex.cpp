/**
 * @file hex.cpp
 * @brief Hex encoding/decoding for bytecode and addresses
 */

#include "evmverify/common.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <optional>

namespace evmverify::common {

namespace {

constexpr std::array<char, 16> kHexDigits = {
    {'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'}
};

[[nodiscard]] constexpr std::optional<std::uint8_t> nibble(char c) noexcept
{
    if (c >= '0' && c <= '9') {
        return static_cast<std::uint8_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<std::uint8_t>(c - 'a' + 10);
    }
    if (c >= 'A' && c <= 'F') {
        return static_cast<std::uint8_t>(c - 'A' + 10);
    }
    return std::nullopt;
}

}  // namespace

Result<Bytes> from_hex(std::string_view hex)
{
    if (hex.starts_with("0x") || hex.starts_with("0X")) {
        hex.remove_prefix(2);
    }
    if (hex.size() % 2 != 0) {
        return std::unexpected(Error::make(
            "InvalidHex", std::format("Hex string has an odd number of digits ({})", hex.size())));
    }

    Bytes out;
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        auto hi = nibble(hex[i]);
        auto lo = nibble(hex[i + 1]);
        if (!hi || !lo) {
            return std::unexpected(Error::make(
                "InvalidHex", std::format("Invalid hex digit at position {}", hi ? i + 1 : i)));
        }
        out.push_back(static_cast<std::uint8_t>((*hi << 4U) | *lo));
    }
    return out;
}

std::string to_hex(std::span<const std::uint8_t> bytes)
{
    std::string out;
    out.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        out.push_back(kHexDigits[b >> 4U]);
        out.push_back(kHexDigits[b & 0x0FU]);
    }
    return out;
}

std::string to_hex_prefixed(std::span<const std::uint8_t> bytes)
{
    return "0x" + to_hex(bytes);
}

std::string to_lower(std::string_view input)
{
    std::string out(input);
    std::ranges::transform(out, out.begin(), [](unsigned char c) noexcept {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

}  // namespace evmverify::common
