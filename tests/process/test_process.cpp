/**
 * @file test_process.cpp
 * @brief Subprocess execution with capture and timeout
 */

#include "evmverify/outcome.hpp"
#include "evmverify/process.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace evmverify::process::test {

namespace {

std::vector<std::string> sh(const std::string& script)
{
    return {"/bin/sh", "-c", script};
}

}  // namespace

TEST(RunProcess, CapturesStdoutAndStderr)
{
    auto result = run_process(sh("echo compiled; echo warning >&2"),
                              std::filesystem::temp_directory_path(), std::chrono::seconds(10));
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_TRUE(result->succeeded());
    EXPECT_EQ(result->stdout_text, "compiled\n");
    EXPECT_EQ(result->stderr_text, "warning\n");
}

TEST(RunProcess, NonZeroExitIsNotAnError)
{
    auto result = run_process(sh("exit 3"), std::filesystem::temp_directory_path(),
                              std::chrono::seconds(10));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->exit_code, 3);
    EXPECT_FALSE(result->succeeded());
}

TEST(RunProcess, RunsInRequestedDirectory)
{
    const auto dir = std::filesystem::canonical(std::filesystem::temp_directory_path());
    auto result = run_process(sh("pwd -P"), dir, std::chrono::seconds(10));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->stdout_text, dir.string() + "\n");
}

TEST(RunProcess, MissingDirectoryFailsInChild)
{
    auto result = run_process(sh("true"), "/nonexistent/evmverify/dir", std::chrono::seconds(10));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->exit_code, 126);
}

TEST(RunProcess, MissingProgramExits127)
{
    auto result = run_process({"evmverify-no-such-program"}, std::filesystem::temp_directory_path(),
                              std::chrono::seconds(10));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->exit_code, 127);
}

TEST(RunProcess, TimeoutKillsProcessGroup)
{
    const auto start = std::chrono::steady_clock::now();
    auto result = run_process(sh("sleep 30 & sleep 30"), std::filesystem::temp_directory_path(),
                              std::chrono::seconds(1));
    const auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, error_code::kTimeout);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(RunProcess, EmptyArgvIsSpawnFailure)
{
    auto result = run_process({}, std::filesystem::temp_directory_path(), std::chrono::seconds(1));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, error_code::kProcessSpawnFailed);
}

TEST(RunProcess, LargeOutputIsCapped)
{
    auto result = run_process(sh("head -c 3000000 /dev/zero"), std::filesystem::temp_directory_path(),
                              std::chrono::seconds(20));
    ASSERT_TRUE(result);
    EXPECT_EQ(result->stdout_text.size(), kMaxCapturedBytes);
}

TEST(DescribeCommand, QuotesArgumentsWithSpaces)
{
    EXPECT_EQ(describe_command({"forge", "build", "--force"}), "forge build --force");
    EXPECT_NE(describe_command({"git", "commit", "-m", "two words"}).find("'two words'"),
              std::string::npos);
}

}  // namespace evmverify::process::test
