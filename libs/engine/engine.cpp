/**
 * @file engine.cpp
 * @brief Verification run orchestration
 */

#include "evmverify/engine.hpp"

#include "evmverify/bytecode.hpp"
#include "evmverify/worker_pool.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <optional>
#include <utility>

namespace evmverify::engine {

namespace {

/**
 * @brief Failure result whose message leads with the contract's display name
 * @param stage Status for an error code the taxonomy does not name
 */
[[nodiscard]] ComparisonResult failure(const ContractRequest& request,
                                       const Error& error,
                                       Status stage)
{
    auto result = ComparisonResult::from_error(request, error, stage);
    result.message = std::format("{}: {}", request.alias, result.message);
    return result;
}

[[nodiscard]] nlohmann::json group_details(const scheduler::BuildGroup& group)
{
    nlohmann::json details = group.settings.to_json();
    details["repository"] = group.source.repository;
    details["ref"] = group.source.ref;
    details["fingerprint"] = group.fingerprint;
    if (group.source.subpath) {
        details["subpath"] = *group.source.subpath;
    }
    return details;
}

void merge(nlohmann::json& into, const nlohmann::json& from)
{
    for (const auto& [key, value] : from.items()) {
        into[key] = value;
    }
}

}  // namespace

void apply_skip_policy(RunOutcome& outcome, bool skip_unmapped)
{
    if (!skip_unmapped) {
        return;
    }
    auto unmapped = std::ranges::stable_partition(outcome.results, [](const ComparisonResult& r) {
        return r.status != Status::kNoMapping;
    });
    outcome.skipped.insert(outcome.skipped.end(), std::make_move_iterator(unmapped.begin()),
                           std::make_move_iterator(unmapped.end()));
    outcome.results.erase(unmapped.begin(), unmapped.end());
}

ComparisonResult verify_member(const scheduler::BuildGroup& group,
                               const scheduler::ScheduledContract& member)
{
    const auto& request = member.request;
    const auto& deployment = member.deployment;

    auto with_context = [&](ComparisonResult result) {
        merge(result.details, group_details(group));
        return result;
    };

    if (group.build_error) {
        return with_context(failure(request, *group.build_error, Status::kBuildFailure));
    }
    const auto key = member.artifact_key();
    const auto& name = key.first;
    if (auto it = group.artifact_errors.find(key); it != group.artifact_errors.end()) {
        return with_context(failure(request, it->second, Status::kBuildFailure));
    }
    auto found = group.compiled_artifacts.find(key);
    if (found == group.compiled_artifacts.end()) {
        return with_context(failure(
            request, Error::make(std::string(error_code::kArtifactNotFound),
                                 std::format("Artifact not found: {}", name)),
            Status::kBuildFailure));
    }
    const auto& artifact = found->second;

    // Creation code is compared only for direct deployments; factories leave runtime only.
    const bool use_creation = deployment.creation_bytecode && !deployment.factory_deployed
                              && !artifact.creation.empty();
    const auto role = use_creation ? BytecodeRole::kCreation : BytecodeRole::kRuntime;

    bytecode::NormalizedCode deployed;
    bytecode::NormalizedCode compiled;
    if (use_creation) {
        const auto compiled_stripped = bytecode::strip_metadata(artifact.creation);
        deployed = bytecode::normalize(
            *deployment.creation_bytecode,
            bytecode::NormalizeOptions{.role = role,
                                       .runtime_reference = deployment.runtime_bytecode,
                                       .reference_length = compiled_stripped.size(),
                                       .immutable_ranges = {}});
        compiled = bytecode::normalize(artifact.creation,
                                       bytecode::NormalizeOptions{.role = role,
                                                                  .runtime_reference = std::nullopt,
                                                                  .reference_length = std::nullopt,
                                                                  .immutable_ranges = {}});
    } else {
        if (!deployment.runtime_bytecode) {
            return with_context(failure(
                request, Error::make(std::string(error_code::kNotAContract),
                                     std::format("No runtime code for {}",
                                                 request.address.to_string())),
            Status::kNotAContract));
        }
        const bytecode::NormalizeOptions options{.role = role,
                                                 .runtime_reference = std::nullopt,
                                                 .reference_length = std::nullopt,
                                                 .immutable_ranges = artifact.immutable_ranges};
        deployed = bytecode::normalize(*deployment.runtime_bytecode, options);
        compiled = bytecode::normalize(artifact.runtime, options);
    }

    const auto verdict = bytecode::compare(deployed.bytes, compiled.bytes);

    ComparisonResult result;
    result.alias = request.alias;
    result.canonical_name = request.canonical_name;
    result.address = request.address;
    result.details = group_details(group);
    result.details["artifact"] = name;
    result.details["bytecode_role"] = std::string(to_string(role));
    result.details["deployed_size"] = deployed.original_size;
    result.details["compiled_size"] = compiled.original_size;
    result.details["deployed_stripped_size"] = deployed.bytes.size();
    result.details["compiled_stripped_size"] = compiled.bytes.size();
    result.details["metadata_sections"] = deployed.metadata_sections;
    result.details["constructor_args_size"] = deployed.constructor_args_size;
    result.details["immutables_masked"] = deployed.immutables_masked;
    result.details["factory_deployed"] = deployment.factory_deployed;
    if (deployment.creation_tx) {
        result.details["creation_tx"] = *deployment.creation_tx;
    }

    if (verdict.matched) {
        result.status = Status::kVerified;
        return result;
    }
    result.status = Status::kMismatch;
    result.diff_offset = verdict.first_diff_offset;
    result.details["error_code"] = std::string(error_code::kBytecodeMismatch);
    result.details["first_diff_offset"] = *verdict.first_diff_offset;
    result.details["first_diff_deployed"] = verdict.deployed_context;
    result.details["first_diff_compiled"] = verdict.compiled_context;
    result.message = std::format(
        "{}: bytecode mismatch at byte {} ({} {} bytes deployed vs {} compiled after normalization)",
        request.alias, *verdict.first_diff_offset, to_string(role), verdict.deployed_size,
        verdict.compiled_size);
    return result;
}

Engine::Engine(explorer::DeploymentInfoSource& deployments,
               const mapping::SourceMappingResolver& resolver,
               workspace::WorkspaceProvider& workspaces,
               toolchain::Toolchain& toolchain,
               EngineOptions options,
               ProgressSink progress)
    : m_deployments(deployments)
    , m_resolver(resolver)
    , m_workspaces(workspaces)
    , m_toolchain(toolchain)
    , m_options(options)
    , m_progress(std::move(progress))
{}

void Engine::report(std::string_view message) const
{
    if (m_progress) {
        m_progress(message);
    }
}

Result<RunOutcome> Engine::run(const std::vector<ContractRequest>& requests)
{
    RunOutcome outcome;
    if (requests.empty()) {
        return outcome;
    }

    // Fetch: I/O bound, independent retries per address.
    std::vector<std::optional<Result<DeploymentInfo>>> fetched(requests.size());
    std::atomic<std::size_t> done{0};
    scheduler::parallel_for(requests.size(), m_options.fetch_jobs, [&](std::size_t i) {
        fetched[i] = m_deployments.fetch(requests[i].address);
        const auto count = ++done;
        report(std::format("[fetch] {}/{} {} {}", count, requests.size(), requests[i].alias,
                           fetched[i]->has_value() ? "ok" : fetched[i]->error().code));
    });

    // Resolve by canonical name; the alias is carried for display only.
    std::vector<scheduler::ScheduledContract> scheduled;
    for (std::size_t i = 0; i < requests.size(); ++i) {
        auto request = requests[i];
        auto& info = *fetched[i];
        if (!info) {
            outcome.results.push_back(failure(request, info.error(), Status::kNetworkError));
            continue;
        }
        request.canonical_name = info->contract_name;
        auto mapping = m_resolver.resolve(request.canonical_name);
        if (!mapping) {
            auto result = failure(request, mapping.error(), Status::kNoMapping);
            merge(result.details, info->compiler_settings.to_json());
            outcome.results.push_back(std::move(result));
            continue;
        }
        scheduled.push_back(scheduler::ScheduledContract{.request = std::move(request),
                                                         .mapping = std::move(*mapping),
                                                         .deployment = std::move(*info)});
    }
    apply_skip_policy(outcome, m_options.skip_unmapped);

    auto groups = scheduler::BuildGroupScheduler::schedule(std::move(scheduled));
    if (!groups) {
        return std::unexpected(groups.error());
    }
    report(std::format("[schedule] {} build group(s)", groups->size()));

    scheduler::BuildGroupScheduler builder(
        m_workspaces, m_toolchain,
        scheduler::BuildOptions{.build_jobs = m_options.build_jobs,
                                .timeout = m_options.build_timeout},
        m_progress);
    if (auto executed = builder.execute(*groups); !executed) {
        return std::unexpected(executed.error());
    }
    outcome.builds = groups->size();

    for (const auto& group : *groups) {
        for (const auto& member : group.members) {
            auto result = verify_member(group, member);
            report(std::format("[compare] {} {}", member.request.alias, to_string(result.status)));
            outcome.results.push_back(std::move(result));
        }
    }
    return outcome;
}

}  // namespace evmverify::engine
