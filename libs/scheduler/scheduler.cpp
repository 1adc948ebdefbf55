/**
 * @file scheduler.cpp
 * @brief Build grouping and execution
 */

#include "evmverify/scheduler.hpp"

#include "evmverify/canonical_json.hpp"
#include "evmverify/outcome.hpp"
#include "evmverify/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <memory>
#include <mutex>
#include <tuple>
#include <utility>

namespace evmverify::scheduler {

namespace {

[[nodiscard]] std::string workspace_key(const SourceMapping& source)
{
    return std::format("{}@{}", source.repository, source.ref);
}

[[nodiscard]] std::string short_ref(const std::string& ref)
{
    constexpr std::size_t kShortRef = 12;
    return ref.substr(0, std::min(ref.size(), kShortRef));
}

}  // namespace

Result<std::string> fingerprint(const SourceMapping& source, const CompilerSettings& settings)
{
    nlohmann::json key = {
        {"repository", source.repository},
        {       "ref",        source.ref},
        {  "settings", settings.to_json()}
    };
    if (source.subpath) {
        key["subpath"] = *source.subpath;
    }
    return canonical::hash_canonical(key);
}

BuildGroupScheduler::BuildGroupScheduler(workspace::WorkspaceProvider& workspaces,
                                         toolchain::Toolchain& toolchain,
                                         BuildOptions options,
                                         ProgressSink progress)
    : m_workspaces(workspaces)
    , m_toolchain(toolchain)
    , m_options(options)
    , m_progress(std::move(progress))
{}

Result<std::vector<BuildGroup>> BuildGroupScheduler::schedule(
    std::vector<ScheduledContract> contracts)
{
    std::vector<BuildGroup> groups;
    std::map<std::string, std::size_t> index_by_fingerprint;

    for (auto& contract : contracts) {
        SourceMapping source{.repository = contract.mapping.repository,
                             .ref = contract.mapping.ref,
                             .subpath = contract.mapping.subpath,
                             .artifact = std::nullopt};
        const auto& settings = contract.deployment.compiler_settings;
        auto key = fingerprint(source, settings);
        if (!key) {
            return std::unexpected(key.error());
        }

        auto [it, inserted] = index_by_fingerprint.try_emplace(*key, groups.size());
        if (inserted) {
            BuildGroup group;
            group.fingerprint = *key;
            group.source = std::move(source);
            group.settings = settings;
            groups.push_back(std::move(group));
        }
        groups[it->second].members.push_back(std::move(contract));
    }

    std::ranges::sort(groups, [](const BuildGroup& a, const BuildGroup& b) {
        return std::tie(a.source.repository, a.source.ref, a.fingerprint)
               < std::tie(b.source.repository, b.source.ref, b.fingerprint);
    });
    return groups;
}

VoidResult BuildGroupScheduler::collect_artifacts(BuildGroup& group,
                                                  const std::filesystem::path& build_dir)
{
    std::vector<const ScheduledContract*> missing;
    for (const auto& member : group.members) {
        const auto key = member.artifact_key();
        if (group.compiled_artifacts.contains(key) || group.artifact_errors.contains(key)) {
            continue;
        }
        auto artifact = m_toolchain.find_artifact(build_dir, key.first, member.deployment.file_path);
        if (artifact) {
            group.compiled_artifacts.emplace(key, std::move(*artifact));
        } else if (artifact.error().code == error_code::kArtifactNotFound
                   && member.deployment.file_path) {
            missing.push_back(&member);
        } else {
            group.artifact_errors.emplace(key, artifact.error());
        }
    }

    // A single-file build replaces out/, so it runs only after every full-build lookup.
    for (const auto* member : missing) {
        const auto key = member->artifact_key();
        if (group.compiled_artifacts.contains(key) || group.artifact_errors.contains(key)) {
            continue;
        }
        const auto& source = *member->deployment.file_path;
        if (m_progress) {
            m_progress(std::format("[build] {} missing, compiling {}", key.first, source));
        }
        if (auto rebuilt = m_toolchain.build_file(build_dir, source, m_options.timeout); !rebuilt) {
            if (is_fatal(rebuilt.error().code)) {
                return std::unexpected(rebuilt.error());
            }
            group.artifact_errors.emplace(key, rebuilt.error());
            continue;
        }
        auto artifact = m_toolchain.find_artifact(build_dir, key.first, source);
        if (artifact) {
            group.compiled_artifacts.emplace(key, std::move(*artifact));
        } else {
            group.artifact_errors.emplace(key, artifact.error());
        }
    }
    return {};
}

VoidResult BuildGroupScheduler::build_in(BuildGroup& group, const workspace::Workspace& workspace)
{
    group.build_error.reset();
    group.compiled_artifacts.clear();
    group.artifact_errors.clear();

    const auto build_dir = group.build_dir(workspace.root);
    auto body = [&]() -> VoidResult {
        if (auto built = m_toolchain.build(build_dir, m_options.timeout); !built) {
            return built;
        }
        // Artifacts are read before the configuration is restored.
        return collect_artifacts(group, build_dir);
    };

    auto result = m_reconciler.with_settings(build_dir, group.settings, body);
    if (!result) {
        if (is_fatal(result.error().code)) {
            return std::unexpected(result.error());
        }
        group.build_error = result.error();
    }
    return {};
}

VoidResult BuildGroupScheduler::build_group(BuildGroup& group)
{
    auto workspace = m_workspaces.acquire(group.source.repository, group.source.ref);
    if (!workspace) {
        if (is_fatal(workspace.error().code)) {
            return std::unexpected(workspace.error());
        }
        group.build_error = workspace.error();
        group.built = true;
        return {};
    }

    if (auto built = build_in(group, *workspace); !built) {
        return built;
    }
    const bool local_failed = !workspace->temporary && group.build_error
                              && group.build_error->code == error_code::kBuildFailure;
    if (local_failed) {
        if (m_progress) {
            m_progress(std::format("[build] local checkout of {} failed, cloning fresh",
                                   group.source.repository));
        }
        auto fresh = m_workspaces.acquire_fresh(group.source.repository, group.source.ref);
        if (!fresh) {
            if (is_fatal(fresh.error().code)) {
                return std::unexpected(fresh.error());
            }
            group.built = true;
            return {};
        }
        if (auto built = build_in(group, *fresh); !built) {
            return built;
        }
    }
    group.built = true;
    return {};
}

VoidResult BuildGroupScheduler::execute(std::vector<BuildGroup>& groups)
{
    // One lock per checkout, created before any worker starts.
    std::map<std::string, std::unique_ptr<std::mutex>> workspace_locks;
    for (const auto& group : groups) {
        auto& lock = workspace_locks[workspace_key(group.source)];
        if (!lock) {
            lock = std::make_unique<std::mutex>();
        }
    }

    std::mutex fatal_mutex;
    std::optional<Error> fatal;
    std::atomic<bool> aborted{false};
    std::atomic<std::size_t> finished{0};
    const std::size_t total = groups.size();

    parallel_for(groups.size(), m_options.build_jobs, [&](std::size_t i) {
        auto& group = groups[i];
        if (group.built || aborted.load()) {
            return;
        }
        std::lock_guard workspace_lock(*workspace_locks.at(workspace_key(group.source)));
        if (m_progress) {
            m_progress(std::format("[build] {}@{} ({} contract(s), solc {})",
                                   group.source.repository, short_ref(group.source.ref),
                                   group.members.size(), group.settings.version().short_string()));
        }
        auto result = build_group(group);
        if (!result) {
            aborted.store(true);
            std::lock_guard lock(fatal_mutex);
            if (!fatal) {
                fatal = result.error();
            }
            return;
        }
        const auto done = ++finished;
        if (m_progress) {
            m_progress(std::format("[build] {}/{} {}@{}: {}", done, total, group.source.repository,
                                   short_ref(group.source.ref),
                                   group.build_error ? group.build_error->message : "ok"));
        }
    });

    if (fatal) {
        return std::unexpected(*fatal);
    }
    return {};
}

}  // namespace evmverify::scheduler
