#pragma once

/**
 * @file scheduler.hpp
 * @brief BuildGroupScheduler: one compilation per (repository, ref, settings)
 */

#include "evmverify/common.hpp"
#include "evmverify/reconciler.hpp"
#include "evmverify/toolchain.hpp"
#include "evmverify/types.hpp"
#include "evmverify/workspace.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace evmverify::scheduler {

/// (artifact name, source file reported by the explorer or empty)
using ArtifactKey = std::pair<std::string, std::string>;

/**
 * @brief A contract whose deployment was fetched and whose source was resolved
 */
struct ScheduledContract
{
    ContractRequest request;
    SourceMapping mapping;
    DeploymentInfo deployment;

    /// Artifact to look up after the build: mapping override, else canonical name
    [[nodiscard]] const std::string& artifact_name() const noexcept
    {
        return mapping.artifact ? *mapping.artifact : request.canonical_name;
    }

    /// Equally named contracts from different source files stay apart
    [[nodiscard]] ArtifactKey artifact_key() const
    {
        return {artifact_name(), deployment.file_path.value_or("")};
    }
};

/**
 * @brief Contracts sharing a fingerprint, compiled together exactly once
 */
struct BuildGroup
{
    std::string fingerprint;
    SourceMapping source;  ///< repository, ref, subpath (no artifact override)
    CompilerSettings settings;
    std::vector<ScheduledContract> members;  ///< Input order

    /// Compiled output per member artifact; filled by the one build
    std::map<ArtifactKey, toolchain::CompiledArtifact> compiled_artifacts;
    /// Lookup failure per member artifact (ArtifactNotFound, BuildFailure, Timeout)
    std::map<ArtifactKey, Error> artifact_errors;
    /// Set when the build itself failed; applies to every member
    std::optional<Error> build_error;
    bool built = false;

    [[nodiscard]] std::filesystem::path build_dir(const std::filesystem::path& root) const
    {
        return source.subpath ? root / *source.subpath : root;
    }
};

/**
 * @brief "sha256:..." over the canonical JSON of repository, ref, subpath and settings
 */
[[nodiscard]] Result<std::string> fingerprint(const SourceMapping& source,
                                              const CompilerSettings& settings);

struct BuildOptions
{
    std::size_t build_jobs = 2;
    std::chrono::seconds timeout{900};
};

class BuildGroupScheduler
{
public:
    BuildGroupScheduler(workspace::WorkspaceProvider& workspaces,
                        toolchain::Toolchain& toolchain,
                        BuildOptions options,
                        ProgressSink progress = {});

    /**
     * @brief Partition contracts by structural equality of (repository, ref,
     *        subpath, settings)
     *
     * Groups are ordered by (repository, ref, fingerprint); members keep input order.
     */
    [[nodiscard]] static Result<std::vector<BuildGroup>> schedule(
        std::vector<ScheduledContract> contracts);

    /**
     * @brief Build every group that is not built yet, at most build_jobs at a time
     *
     * Two groups that share a checkout never build concurrently. A per-group
     * failure is recorded in the group and does not affect other groups; the
     * first fatal error (clone, workspace I/O) is returned after running
     * builds finish, and groups not yet started are left unbuilt.
     *
     * A group whose reused local checkout fails to compile is rebuilt once
     * from a fresh clone. A member whose artifact is missing after the build
     * is looked up again after compiling its source file alone.
     */
    [[nodiscard]] VoidResult execute(std::vector<BuildGroup>& groups);

private:
    /// Build one group; returns a fatal error only
    [[nodiscard]] VoidResult build_group(BuildGroup& group);
    /// Build @p group in @p workspace under its settings; returns a fatal error only
    [[nodiscard]] VoidResult build_in(BuildGroup& group, const workspace::Workspace& workspace);
    /// Fill the artifact maps; runs while the patched configuration is in place
    [[nodiscard]] VoidResult collect_artifacts(BuildGroup& group,
                                               const std::filesystem::path& build_dir);

    workspace::WorkspaceProvider& m_workspaces;
    toolchain::Toolchain& m_toolchain;
    reconciler::CompilerSettingsReconciler m_reconciler;
    BuildOptions m_options;
    ProgressSink m_progress;
};

}  // namespace evmverify::scheduler
