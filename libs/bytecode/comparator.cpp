/**
 * @file comparator.cpp
 * @brief Exact comparison of normalized bytecode
 */

#include "evmverify/bytecode.hpp"

#include <algorithm>

namespace evmverify::bytecode {

namespace {

/// Bytes of context shown on each side of the first difference
constexpr std::size_t kContextBytes = 16;

[[nodiscard]] std::string context_window(std::span<const std::uint8_t> code, std::size_t offset)
{
    const std::size_t begin = offset > kContextBytes ? offset - kContextBytes : 0;
    const std::size_t end = std::min(code.size(), offset + kContextBytes);
    if (begin >= end) {
        return {};
    }
    return common::to_hex(code.subspan(begin, end - begin));
}

}  // namespace

Verdict compare(std::span<const std::uint8_t> deployed, std::span<const std::uint8_t> compiled)
{
    Verdict verdict{
        .matched = false,
        .first_diff_offset = std::nullopt,
        .deployed_size = deployed.size(),
        .compiled_size = compiled.size(),
        .deployed_context = {},
        .compiled_context = {},
    };

    auto [deployed_it, compiled_it] = std::ranges::mismatch(deployed, compiled);
    if (deployed_it == deployed.end() && compiled_it == compiled.end()) {
        verdict.matched = true;
        return verdict;
    }

    const auto offset = static_cast<std::size_t>(deployed_it - deployed.begin());
    verdict.first_diff_offset = offset;
    verdict.deployed_context = context_window(deployed, offset);
    verdict.compiled_context = context_window(compiled, offset);
    return verdict;
}

}  // namespace evmverify::bytecode
