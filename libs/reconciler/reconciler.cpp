/**
 * @file reconciler.cpp
 * @brief foundry.toml patching with guaranteed restoration
 */

#include "evmverify/reconciler.hpp"

#include "evmverify/outcome.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

namespace evmverify::reconciler {

namespace {

/// Placeholders that keep forge from compiling tests and scripts
constexpr std::string_view kDisabledScript = "\"disabled_script\"";
constexpr std::string_view kDisabledTest = "\"disabled_test\"";

struct ConfigKey
{
    std::string name;
    std::string value;
    bool applied = false;
};

[[nodiscard]] Error unavailable(std::string message)
{
    return Error::make(std::string(error_code::kWorkspaceUnavailable), std::move(message));
}

[[nodiscard]] std::string_view trim(std::string_view text)
{
    constexpr std::string_view kSpace = " \t\r";
    const auto begin = text.find_first_not_of(kSpace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = text.find_last_not_of(kSpace);
    return text.substr(begin, end - begin + 1);
}

[[nodiscard]] bool is_section_header(std::string_view line)
{
    return trim(line).starts_with('[');
}

/**
 * @brief Key of a "key = value" line, empty when the line is not an assignment
 */
[[nodiscard]] std::string_view assignment_key(std::string_view line)
{
    const auto stripped = trim(line);
    const auto end = stripped.find_first_of(" \t=");
    if (end == std::string_view::npos || end == 0) {
        return {};
    }
    const auto rest = trim(stripped.substr(end));
    if (!rest.starts_with('=')) {
        return {};
    }
    return stripped.substr(0, end);
}

[[nodiscard]] std::vector<std::string> split_lines(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        const auto newline = text.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, newline - start));
        start = newline + 1;
    }
    return lines;
}

[[nodiscard]] std::vector<ConfigKey> keys_for(const CompilerSettings& settings)
{
    std::vector<ConfigKey> keys;
    keys.push_back({.name = "solc", .value = std::format("\"{}\"", settings.version().short_string())});
    keys.push_back({.name = "optimizer", .value = settings.optimizer_enabled() ? "true" : "false"});
    keys.push_back({.name = "optimizer_runs", .value = std::to_string(settings.optimizer_runs())});
    if (settings.evm_target() != EvmTarget::kDefault) {
        keys.push_back({.name = "evm_version",
                        .value = std::format("\"{}\"", to_string(settings.evm_target()))});
    }
    keys.push_back({.name = "via_ir", .value = settings.via_ir() ? "true" : "false"});
    keys.push_back({.name = "script", .value = std::string(kDisabledScript)});
    keys.push_back({.name = "test", .value = std::string(kDisabledTest)});
    return keys;
}

[[nodiscard]] ConfigKey* key_for_line(std::vector<ConfigKey>& keys, std::string_view key)
{
    // foundry accepts solc_version as an alias of solc
    const std::string_view lookup = key == "solc_version" ? std::string_view("solc") : key;
    auto it = std::ranges::find_if(keys, [&](const ConfigKey& k) { return k.name == lookup; });
    return it == keys.end() ? nullptr : &*it;
}

[[nodiscard]] Result<std::optional<std::string>> read_optional_file(const std::filesystem::path& path)
{
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        return std::unexpected(
            unavailable(std::format("Cannot stat {}: {}", path.string(), ec.message())));
    }
    if (!exists) {
        return std::optional<std::string>{};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(unavailable("Cannot read " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(unavailable("Cannot read " + path.string()));
    }
    return std::optional<std::string>(buffer.str());
}

[[nodiscard]] VoidResult write_file(const std::filesystem::path& path, std::string_view content)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(unavailable("Cannot open " + path.string() + " for writing"));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        return std::unexpected(unavailable("Cannot write " + path.string()));
    }
    return {};
}

}  // namespace

// ============================================================================
// ScopedFileRestore
// ============================================================================

Result<ScopedFileRestore> ScopedFileRestore::capture(std::filesystem::path path)
{
    auto original = read_optional_file(path);
    if (!original) {
        return std::unexpected(original.error());
    }
    return ScopedFileRestore(std::move(path), std::move(*original));
}

ScopedFileRestore::ScopedFileRestore(ScopedFileRestore&& other) noexcept
    : m_path(std::move(other.m_path))
    , m_original(std::move(other.m_original))
    , m_armed(std::exchange(other.m_armed, false))
{}

ScopedFileRestore::~ScopedFileRestore()
{
    if (m_armed) {
        // Destructors cannot propagate; callers needing the status use restore().
        [[maybe_unused]] auto restored = restore();
    }
}

VoidResult ScopedFileRestore::restore()
{
    m_armed = false;
    if (m_original) {
        return write_file(m_path, *m_original);
    }
    std::error_code ec;
    std::filesystem::remove(m_path, ec);
    if (ec) {
        return std::unexpected(
            unavailable(std::format("Cannot remove {}: {}", m_path.string(), ec.message())));
    }
    return {};
}

// ============================================================================
// Patching
// ============================================================================

std::string patch_foundry_config(std::string_view original, const CompilerSettings& settings)
{
    auto keys = keys_for(settings);
    auto lines = split_lines(original);

    auto header = std::ranges::find_if(
        lines, [](const std::string& line) { return trim(line) == kProfileSection; });
    if (header == lines.end()) {
        if (!lines.empty() && !trim(lines.back()).empty()) {
            lines.emplace_back();
        }
        lines.emplace_back(kProfileSection);
        header = std::prev(lines.end());
    }

    const auto header_index = static_cast<std::size_t>(std::distance(lines.begin(), header));
    for (std::size_t i = header_index + 1; i < lines.size() && !is_section_header(lines[i]); ++i) {
        auto* key = key_for_line(keys, assignment_key(lines[i]));
        if (key == nullptr) {
            continue;
        }
        const auto indent = lines[i].substr(0, lines[i].find_first_not_of(" \t"));
        lines[i] = std::format("{}{} = {}", indent, assignment_key(lines[i]), key->value);
        key->applied = true;
    }

    std::vector<std::string> inserted;
    for (const auto& key : keys) {
        if (!key.applied) {
            inserted.push_back(std::format("{} = {}", key.name, key.value));
        }
    }
    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(header_index + 1), inserted.begin(),
                 inserted.end());

    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

VoidResult CompilerSettingsReconciler::with_settings(const std::filesystem::path& build_dir,
                                                     const CompilerSettings& settings,
                                                     const Body& body) const
{
    const auto config_path = build_dir / kFoundryConfig;
    auto guard = ScopedFileRestore::capture(config_path);
    if (!guard) {
        return std::unexpected(guard.error());
    }
    auto original = read_optional_file(config_path);
    if (!original) {
        return std::unexpected(original.error());
    }
    const std::string patched = patch_foundry_config(original->value_or(""), settings);
    if (auto written = write_file(config_path, patched); !written) {
        if (auto restored = guard->restore(); !restored) {
            return std::unexpected(restored.error());
        }
        return std::unexpected(written.error());
    }

    auto result = body();

    if (auto restored = guard->restore(); !restored) {
        return std::unexpected(restored.error());
    }
    return result;
}

}  // namespace evmverify::reconciler
