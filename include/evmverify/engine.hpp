#pragma once

/**
 * @file engine.hpp
 * @brief Verification run: fetch -> resolve -> group -> build -> normalize -> compare
 */

#include "evmverify/common.hpp"
#include "evmverify/explorer.hpp"
#include "evmverify/outcome.hpp"
#include "evmverify/scheduler.hpp"
#include "evmverify/source_mapping.hpp"
#include "evmverify/toolchain.hpp"
#include "evmverify/types.hpp"
#include "evmverify/workspace.hpp"

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace evmverify::engine {

struct EngineOptions
{
    std::size_t fetch_jobs = 8;
    std::size_t build_jobs = 2;
    std::chrono::seconds build_timeout{900};
    bool skip_unmapped = false;
};

/**
 * @brief Results of a run before aggregation
 */
struct RunOutcome
{
    std::vector<ComparisonResult> results;  ///< Completion order; the report sorts
    std::vector<ComparisonResult> skipped;  ///< Removed by the skip-unmapped policy
    std::size_t builds = 0;                 ///< Build groups executed
};

/**
 * @brief Apply the skip-unmapped policy to a candidate set
 *
 * NoMapping results move to the skipped list when @p skip_unmapped is set;
 * otherwise they stay and count as failures.
 */
void apply_skip_policy(RunOutcome& outcome, bool skip_unmapped);

/**
 * @brief Verify one group member against the group's build output
 */
[[nodiscard]] ComparisonResult verify_member(const scheduler::BuildGroup& group,
                                             const scheduler::ScheduledContract& member);

class Engine
{
public:
    Engine(explorer::DeploymentInfoSource& deployments,
           const mapping::SourceMappingResolver& resolver,
           workspace::WorkspaceProvider& workspaces,
           toolchain::Toolchain& toolchain,
           EngineOptions options,
           ProgressSink progress = {});

    /**
     * @brief Verify every request
     *
     * Per-contract failures become ComparisonResults; only fatal
     * infrastructure errors are returned as an Error.
     */
    [[nodiscard]] Result<RunOutcome> run(const std::vector<ContractRequest>& requests);

private:
    void report(std::string_view message) const;

    explorer::DeploymentInfoSource& m_deployments;
    const mapping::SourceMappingResolver& m_resolver;
    workspace::WorkspaceProvider& m_workspaces;
    toolchain::Toolchain& m_toolchain;
    EngineOptions m_options;
    ProgressSink m_progress;
};

}  // namespace evmverify::engine
