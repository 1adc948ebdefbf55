/**
 * @file git_workspace.cpp
 * @brief Git-backed workspace provider
 */

#include "evmverify/workspace.hpp"

#include "evmverify/outcome.hpp"
#include "evmverify/process.hpp"

#include <algorithm>
#include <format>
#include <system_error>
#include <utility>
#include <vector>

namespace evmverify::workspace {

namespace {

/// Bytes of a git error kept in messages
constexpr std::size_t kErrorTailSize = 600;

/// Shortest ref accepted as an abbreviated commit hash
constexpr std::size_t kMinAbbreviatedRef = 7;

[[nodiscard]] std::string tail(std::string_view text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == ' ')) {
        text.remove_suffix(1);
    }
    return common::sanitize_utf8(common::utf8_tail(text, kErrorTailSize));
}

[[nodiscard]] std::string trim_line(std::string text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

[[nodiscard]] Error clone_failed(std::string message)
{
    return Error::make(std::string(error_code::kCloneFailed), std::move(message));
}

}  // namespace

std::string remote_url(std::string_view url_template, std::string_view repository)
{
    constexpr std::string_view kPlaceholder = "{repo}";
    std::string out(url_template);
    for (auto pos = out.find(kPlaceholder); pos != std::string::npos;
         pos = out.find(kPlaceholder, pos + repository.size())) {
        out.replace(pos, kPlaceholder.size(), repository);
    }
    return out;
}

bool head_matches(std::string_view head, std::string_view ref) noexcept
{
    if (head.empty() || ref.empty()) {
        return false;
    }
    return head == ref || (ref.size() >= kMinAbbreviatedRef && head.starts_with(ref));
}

std::string workspace_dir_name(std::string_view repository, std::string_view ref)
{
    std::string name = std::format("{}@{}", repository, ref);
    std::ranges::replace(name, '/', '_');
    std::ranges::replace(name, '\\', '_');
    return name;
}

GitWorkspaceProvider::GitWorkspaceProvider(GitWorkspaceOptions options)
    : m_options(std::move(options))
{}

GitWorkspaceProvider::~GitWorkspaceProvider()
{
    // Destructors cannot propagate; the run calls cleanup() explicitly.
    [[maybe_unused]] auto cleaned = cleanup();
}

VoidResult GitWorkspaceProvider::git(const std::filesystem::path& dir,
                                     const std::vector<std::string>& args) const
{
    std::vector<std::string> argv{m_options.git};
    argv.insert(argv.end(), args.begin(), args.end());
    auto result = process::run_process(argv, dir, m_options.command_timeout);
    if (!result) {
        return std::unexpected(clone_failed(std::format("{} in {}: {}",
                                                        process::describe_command(argv),
                                                        dir.string(), result.error().message)));
    }
    if (!result->succeeded()) {
        return std::unexpected(clone_failed(
            std::format("{} in {} exited with {}: {}", process::describe_command(argv),
                        dir.string(), result->exit_code, tail(result->stderr_text))));
    }
    return {};
}

std::optional<Workspace> GitWorkspaceProvider::reuse_local(const std::string& repository,
                                                           const std::string& ref) const
{
    auto it = m_options.local_repos.find(repository);
    if (it == m_options.local_repos.end()) {
        return std::nullopt;
    }
    auto head = process::run_process({m_options.git, "rev-parse", "HEAD"}, it->second,
                                     m_options.command_timeout);
    if (!head || !head->succeeded()) {
        return std::nullopt;
    }
    const std::string commit = trim_line(head->stdout_text);
    if (!head_matches(commit, ref)) {
        return std::nullopt;
    }
    return Workspace{.root = it->second, .temporary = false};
}

Result<Workspace> GitWorkspaceProvider::fetch(const std::string& repository,
                                              const std::string& ref) const
{
    const auto dir = m_options.workspace_root / workspace_dir_name(repository, ref);
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        return std::unexpected(clone_failed(
            std::format("Cannot clear {}: {}", dir.string(), ec.message())));
    }
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(clone_failed(
            std::format("Cannot create {}: {}", dir.string(), ec.message())));
    }

    const std::string url = remote_url(m_options.remote_url_template, repository);
    const std::vector<std::vector<std::string>> steps = {
        {"init", "-q"},
        {"remote", "add", "origin", url},
        {"fetch", "-q", "--depth", "1", "origin", ref},
        {"checkout", "-q", "FETCH_HEAD"},
        {"submodule", "update", "-q", "--init", "--recursive"},
    };
    for (const auto& step : steps) {
        if (auto done = git(dir, step); !done) {
            return std::unexpected(done.error());
        }
    }
    return Workspace{.root = dir, .temporary = true};
}

std::shared_ptr<GitWorkspaceProvider::Slot> GitWorkspaceProvider::slot_for(
    const std::string& repository,
    const std::string& ref)
{
    std::lock_guard lock(m_mutex);
    auto& entry = m_slots[workspace_dir_name(repository, ref)];
    if (!entry) {
        entry = std::make_shared<Slot>();
    }
    return entry;
}

Result<Workspace> GitWorkspaceProvider::acquire(const std::string& repository,
                                                const std::string& ref)
{
    auto slot = slot_for(repository, ref);

    // Only callers asking for the same checkout wait on each other.
    std::lock_guard slot_lock(slot->mutex);
    if (!slot->workspace) {
        if (auto local = reuse_local(repository, ref)) {
            slot->workspace = Result<Workspace>(std::move(*local));
        } else {
            slot->workspace = fetch(repository, ref);
        }
    }
    return *slot->workspace;
}

Result<Workspace> GitWorkspaceProvider::acquire_fresh(const std::string& repository,
                                                      const std::string& ref)
{
    auto slot = slot_for(repository, ref);
    std::lock_guard slot_lock(slot->mutex);
    if (slot->workspace && slot->workspace->has_value() && (*slot->workspace)->temporary) {
        return *slot->workspace;
    }
    slot->workspace = fetch(repository, ref);
    return *slot->workspace;
}

VoidResult GitWorkspaceProvider::cleanup()
{
    if (m_options.keep_workspaces) {
        return {};
    }
    std::lock_guard lock(m_mutex);
    std::vector<std::string> failures;
    for (auto& [name, slot] : m_slots) {
        std::lock_guard slot_lock(slot->mutex);
        if (!slot->workspace || !slot->workspace->has_value() || !(*slot->workspace)->temporary) {
            continue;
        }
        std::error_code ec;
        std::filesystem::remove_all((*slot->workspace)->root, ec);
        if (ec) {
            failures.push_back(std::format("{}: {}", (*slot->workspace)->root.string(), ec.message()));
            continue;
        }
        slot->workspace.reset();
    }
    if (!failures.empty()) {
        std::string message = "Cannot remove workspaces:";
        for (const auto& failure : failures) {
            message += "\n  " + failure;
        }
        return std::unexpected(
            Error::make(std::string(error_code::kWorkspaceUnavailable), std::move(message)));
    }
    return {};
}

}  // namespace evmverify::workspace
