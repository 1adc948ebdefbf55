/**
 * @file sha256.cpp
 * @brief SHA-256 used for build fingerprints and bytecode digests
 *
 * C++23:
 * - Round helpers are constexpr and use std::rotr from <bit>
 * - Big-endian loads go through std::byteswap
 */

#include "evmverify/common.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstring>
#include <ranges>
#include <span>

namespace evmverify::common {

namespace {

constexpr std::array<std::uint32_t, 64> kRoundConstants = {{
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
}};

constexpr std::array<std::uint32_t, 8> kInitialState = {
    {0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19}
};

[[nodiscard]] constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3U);
}

[[nodiscard]] constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10U);
}

[[nodiscard]] std::uint32_t load_be32(const std::uint8_t* p) noexcept
{
    std::uint32_t value{};
    std::memcpy(&value, p, sizeof(value));
    if constexpr (std::endian::native == std::endian::little) {
        return std::byteswap(value);
    } else {
        return value;
    }
}

class Sha256
{
public:
    void update(std::span<const std::uint8_t> data)
    {
        m_total_bytes += data.size();
        for (std::uint8_t byte : data) {
            m_block[m_block_len++] = byte;
            if (m_block_len == m_block.size()) {
                compress();
                m_block_len = 0;
            }
        }
    }

    [[nodiscard]] std::array<std::uint8_t, 32> finish()
    {
        const std::uint64_t bit_length = m_total_bytes * 8U;

        m_block[m_block_len++] = 0x80;
        if (m_block_len > 56) {
            std::ranges::fill(std::span(m_block).subspan(m_block_len), std::uint8_t{0});
            compress();
            m_block_len = 0;
        }
        std::ranges::fill(std::span(m_block).subspan(m_block_len, 56 - m_block_len),
                          std::uint8_t{0});
        for (auto i : std::views::iota(0uz, 8uz)) {
            m_block[56 + i] = static_cast<std::uint8_t>(bit_length >> ((7 - i) * 8U));
        }
        compress();

        std::array<std::uint8_t, 32> digest{};
        for (auto [i, word] : std::views::enumerate(m_state)) {
            const auto base = static_cast<std::size_t>(i) * 4uz;
            digest[base + 0] = static_cast<std::uint8_t>(word >> 24U);
            digest[base + 1] = static_cast<std::uint8_t>(word >> 16U);
            digest[base + 2] = static_cast<std::uint8_t>(word >> 8U);
            digest[base + 3] = static_cast<std::uint8_t>(word);
        }
        return digest;
    }

private:
    void compress() noexcept
    {
        std::array<std::uint32_t, 64> w{};
        for (auto i : std::views::iota(0uz, 16uz)) {
            w[i] = load_be32(&m_block[i * 4uz]);
        }
        for (auto i : std::views::iota(16uz, 64uz)) {
            w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
        }

        auto [a, b, c, d, e, f, g, h] = m_state;
        for (auto i : std::views::iota(0uz, 64uz)) {
            const std::uint32_t choose = (e & f) ^ (~e & g);
            const std::uint32_t majority = (a & b) ^ (a & c) ^ (b & c);
            const std::uint32_t t1 = h + big_sigma1(e) + choose + kRoundConstants[i] + w[i];
            const std::uint32_t t2 = big_sigma0(a) + majority;
            h = g;
            g = f;
            f = e;
            e = d + t1;
            d = c;
            c = b;
            b = a;
            a = t1 + t2;
        }

        m_state[0] += a;
        m_state[1] += b;
        m_state[2] += c;
        m_state[3] += d;
        m_state[4] += e;
        m_state[5] += f;
        m_state[6] += g;
        m_state[7] += h;
    }

    std::array<std::uint32_t, 8> m_state = kInitialState;
    std::array<std::uint8_t, 64> m_block{};
    std::size_t m_block_len = 0;
    std::uint64_t m_total_bytes = 0;
};

}  // namespace

std::string sha256(std::span<const std::uint8_t> data)
{
    Sha256 hasher;
    hasher.update(data);
    const auto digest = hasher.finish();
    return to_hex(digest);
}

std::string sha256(std::string_view data)
{
    return sha256(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

}  // namespace evmverify::common
