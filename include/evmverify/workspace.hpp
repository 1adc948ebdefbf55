#pragma once

/**
 * @file workspace.hpp
 * @brief Source checkouts, one directory per (repository, ref)
 */

#include "evmverify/common.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace evmverify::workspace {

struct Workspace
{
    std::filesystem::path root;
    bool temporary = false;  ///< Created by this run; removed on cleanup
};

/**
 * @brief Hands out checkouts; must be safe to call from several build workers
 */
class WorkspaceProvider
{
public:
    virtual ~WorkspaceProvider() = default;

    /**
     * @brief Checkout of @p repository at @p ref, created at most once per run
     * @return CloneFailed (fatal) when the source cannot be obtained
     */
    [[nodiscard]] virtual Result<Workspace> acquire(const std::string& repository,
                                                    const std::string& ref) = 0;

    /**
     * @brief Replace a reused local checkout with a fresh clone
     *
     * Later acquire() calls for the same (repository, ref) return the clone.
     * A checkout that already is a clone is returned unchanged.
     * @return CloneFailed (fatal) when the source cannot be obtained
     */
    [[nodiscard]] virtual Result<Workspace> acquire_fresh(const std::string& repository,
                                                          const std::string& ref) = 0;
};

struct GitWorkspaceOptions
{
    std::string git = "git";
    std::filesystem::path workspace_root;
    std::string remote_url_template = "https://github.com/{repo}.git";
    std::map<std::string, std::filesystem::path> local_repos;  ///< repository -> checkout
    bool keep_workspaces = false;
    std::chrono::seconds command_timeout{600};
};

/// Substitute {repo} in @p url_template
[[nodiscard]] std::string remote_url(std::string_view url_template, std::string_view repository);

/**
 * @brief True when the checked-out @p head is the commit @p ref names
 *
 * @p ref is a full hash or an abbreviation of at least 7 hex digits.
 */
[[nodiscard]] bool head_matches(std::string_view head, std::string_view ref) noexcept;

/// "org_repo@ref" with path separators replaced
[[nodiscard]] std::string workspace_dir_name(std::string_view repository, std::string_view ref);

/**
 * @brief Local checkouts when HEAD already matches, shallow fetches otherwise
 */
class GitWorkspaceProvider final : public WorkspaceProvider
{
public:
    explicit GitWorkspaceProvider(GitWorkspaceOptions options);
    ~GitWorkspaceProvider() override;

    GitWorkspaceProvider(const GitWorkspaceProvider&) = delete;
    GitWorkspaceProvider& operator=(const GitWorkspaceProvider&) = delete;

    [[nodiscard]] Result<Workspace> acquire(const std::string& repository,
                                            const std::string& ref) override;
    [[nodiscard]] Result<Workspace> acquire_fresh(const std::string& repository,
                                                  const std::string& ref) override;

    /**
     * @brief Remove temporary checkouts unless keep_workspaces is set
     * @return WorkspaceUnavailable when a directory cannot be removed
     */
    [[nodiscard]] VoidResult cleanup();

private:
    struct Slot
    {
        std::mutex mutex;
        std::optional<Result<Workspace>> workspace;
    };

    [[nodiscard]] std::shared_ptr<Slot> slot_for(const std::string& repository,
                                                 const std::string& ref);
    [[nodiscard]] std::optional<Workspace> reuse_local(const std::string& repository,
                                                       const std::string& ref) const;
    [[nodiscard]] Result<Workspace> fetch(const std::string& repository, const std::string& ref) const;
    [[nodiscard]] VoidResult git(const std::filesystem::path& dir,
                                 const std::vector<std::string>& args) const;

    GitWorkspaceOptions m_options;
    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<Slot>> m_slots;
};

}  // namespace evmverify::workspace
