#pragma once

/**
 * @file reconciler.hpp
 * @brief CompilerSettingsReconciler: scoped foundry.toml patch and restore
 */

#include "evmverify/common.hpp"
#include "evmverify/types.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace evmverify::reconciler {

/// Build configuration file patched inside the build directory
constexpr std::string_view kFoundryConfig = "foundry.toml";

/// Section the patched keys live in
constexpr std::string_view kProfileSection = "[profile.default]";

/**
 * @brief Restores a file to the bytes it had when captured
 *
 * A file that did not exist at capture time is removed on restore. The
 * destructor restores if restore() was never called.
 */
class ScopedFileRestore
{
public:
    [[nodiscard]] static Result<ScopedFileRestore> capture(std::filesystem::path path);

    ScopedFileRestore(const ScopedFileRestore&) = delete;
    ScopedFileRestore& operator=(const ScopedFileRestore&) = delete;
    ScopedFileRestore(ScopedFileRestore&& other) noexcept;
    ScopedFileRestore& operator=(ScopedFileRestore&&) = delete;
    ~ScopedFileRestore();

    /**
     * @brief Restore now and disarm
     * @return WorkspaceUnavailable when the file cannot be written back
     */
    [[nodiscard]] VoidResult restore();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

private:
    ScopedFileRestore(std::filesystem::path path, std::optional<std::string> original)
        : m_path(std::move(path))
        , m_original(std::move(original))
    {}

    std::filesystem::path m_path;
    std::optional<std::string> m_original;  ///< nullopt: file did not exist
    bool m_armed = true;
};

/**
 * @brief Rewrite foundry.toml text so [profile.default] pins @p settings
 *
 * Keys set: solc (or an existing solc_version), optimizer, optimizer_runs,
 * evm_version (skipped for EvmTarget::kDefault), via_ir, script, test.
 * Existing keys are rewritten in place keeping their indentation; missing keys
 * are inserted directly under the section header; a missing section is
 * appended.
 */
[[nodiscard]] std::string patch_foundry_config(std::string_view original,
                                               const CompilerSettings& settings);

/**
 * @brief Applies deployment settings for the duration of a build
 */
class CompilerSettingsReconciler
{
public:
    using Body = std::function<VoidResult()>;

    /**
     * @brief Patch build_dir/foundry.toml, run @p body, restore
     *
     * The configuration is restored on every exit path. A restore failure
     * (WorkspaceUnavailable) takes precedence over the body's result;
     * otherwise the body's result is returned unchanged.
     */
    [[nodiscard]] VoidResult with_settings(const std::filesystem::path& build_dir,
                                           const CompilerSettings& settings,
                                           const Body& body) const;
};

}  // namespace evmverify::reconciler
