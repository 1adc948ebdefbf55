#pragma once

/**
 * @file process.hpp
 * @brief Subprocess execution with captured output and a hard timeout
 */

#include "evmverify/common.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace evmverify::process {

/// Per-stream capture limit; longer output is truncated
constexpr std::size_t kMaxCapturedBytes = 1024 * 1024;

struct ProcessResult
{
    int exit_code = -1;  ///< 128 + signal number when killed by a signal
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
};

/**
 * @brief Run argv[0] (PATH lookup) in @p cwd
 *
 * The child runs in its own process group; on timeout the whole group is
 * killed so build tools cannot leave compilers running behind.
 *
 * Errors: ProcessSpawnFailed (pipe/fork failed, empty argv), Timeout.
 * A non-zero exit status is not an error; inspect exit_code.
 */
[[nodiscard]] Result<ProcessResult> run_process(const std::vector<std::string>& argv,
                                                const std::filesystem::path& cwd,
                                                std::chrono::seconds timeout);

/// Shell-style rendering of argv for messages
[[nodiscard]] std::string describe_command(const std::vector<std::string>& argv);

}  // namespace evmverify::process
