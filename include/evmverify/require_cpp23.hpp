#pragma once

/**
 * @file require_cpp23.hpp
 * @brief Compile-time check for the C++23 library features evmverify relies on
 *
 * Included first by the CLI so an old toolchain fails with a readable message
 * instead of a wall of template errors. GCC 14+ or Clang 19+ is required.
 */

#include <expected>
#include <version>

#if !defined(__cplusplus) || __cplusplus < 202'302L
    #error "evmverify requires C++23 or later (__cplusplus >= 202302L)."
#endif

// Result<T> and every fallible API
#if !defined(__cpp_lib_expected) || __cpp_lib_expected < 202'202L
    #error "evmverify requires std::expected (__cpp_lib_expected >= 202202L)."
#endif

// CLI and progress output
#if !defined(__cpp_lib_print) || __cpp_lib_print < 202'207L
    #error "evmverify requires std::print/std::println (__cpp_lib_print >= 202207L)."
#endif

#if !defined(__cpp_lib_format) || __cpp_lib_format < 202'110L
    #error "evmverify requires std::format (__cpp_lib_format >= 202110L)."
#endif

// Argument parsing and canonical JSON
#if !defined(__cpp_lib_ranges_enumerate) || __cpp_lib_ranges_enumerate < 202'302L
    #error "evmverify requires std::views::enumerate (__cpp_lib_ranges_enumerate >= 202302L)."
#endif

// SHA-256 fingerprints
#if !defined(__cpp_lib_bitops) || __cpp_lib_bitops < 201'907L
    #error "evmverify requires std::rotr (__cpp_lib_bitops >= 201907L)."
#endif

#if !defined(__cpp_lib_byteswap) || __cpp_lib_byteswap < 202'110L
    #error "evmverify requires std::byteswap (__cpp_lib_byteswap >= 202110L)."
#endif
