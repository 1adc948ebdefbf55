/**
 * @file main.cpp
 * @brief evmverify CLI entry point
 *
 * Commands:
 *   verify     - Verify deployed contracts against their source repositories
 *   normalize  - Print the canonical form of a bytecode blob
 *   version    - Show version information
 */

#include "evmverify/require_cpp23.hpp"

#include "evmverify/bytecode.hpp"
#include "evmverify/common.hpp"
#include "evmverify/config.hpp"
#include "evmverify/engine.hpp"
#include "evmverify/explorer.hpp"
#include "evmverify/http_transport.hpp"
#include "evmverify/inputs.hpp"
#include "evmverify/report.hpp"
#include "evmverify/source_mapping.hpp"
#include "evmverify/toolchain.hpp"
#include "evmverify/version.hpp"
#include "evmverify/workspace.hpp"

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <format>
#include <mutex>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace {

/// Exit status for usage errors and fatal infrastructure errors
constexpr int kExitFatal = 2;
/// Exit status when at least one contract failed verification
constexpr int kExitFailed = 1;

void print_version()
{
    std::println("evmverify {} ({})", evmverify::kVersion, evmverify::kBuildId);
    std::println("  report:  {}", evmverify::kReportSchemaVersion);
    std::println("  mapping: {}", evmverify::kMappingSchemaVersion);
    std::println("  config:  {}", evmverify::kConfigSchemaVersion);
}

void print_help()
{
    std::print(R"(evmverify - Deployed bytecode verification against source repositories

Usage: evmverify <command> [options]

Commands:
  verify      Rebuild contracts from source and compare with on-chain bytecode
  normalize   Print the normalized form of a bytecode blob
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version           Show version information

Run 'evmverify <command> --help' for command-specific options.
)");
}

void print_verify_help()
{
    std::print(R"(Usage: evmverify verify <mode> [options]

Rebuild contracts from their mapped repositories and compare the result with
the bytecode deployed on chain.

Modes (exactly one):
  --all                     Every *Addresses.json in the configured address_dir
  --address ADDR --name N   One contract
  --file FILE               An address file (flat or sectioned)
  --changed-file FILE       A changed-address list ([{name, address}])

Options:
  --mapping FILE            Contract mapping (default: contract-mapping.json)
  --config FILE             Verifier configuration
  --output FILE, -o         Write the JSON report to FILE
  --skip-unmapped           Do not count contracts without a mapping as failures
  --jobs N, -j N            Concurrent explorer lookups
  --build-jobs N            Concurrent builds
  --keep-workspaces         Keep cloned workspaces after the run
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --verbose, -v             Print progress
  --help, -h                Show this help

Exit status:
  0  nothing failed, 1  at least one contract failed, 2  usage or fatal error
)");
}

void print_normalize_help()
{
    std::print(R"(Usage: evmverify normalize [options]

Strip compiler metadata (and constructor arguments for creation code) and
print the result.

Options:
  --bytecode HEX            Bytecode to normalize (required)
  --role runtime|creation   Bytecode role (default: runtime)
  --reference-length N      Stripped length of the matching compiled creation code
  --help, -h                Show this help
)");
}

enum class VerifyMode { kNone, kAll, kAddress, kFile, kChanged };

struct VerifyOptions
{
    std::vector<VerifyMode> modes;
    std::string address;
    std::string name;
    std::string file;
    std::string changed_file;
    std::string mapping;
    std::optional<std::string> config;
    std::optional<std::string> output;
    std::optional<std::size_t> jobs;
    std::optional<std::size_t> build_jobs;
    std::string schema_dir;
    bool skip_unmapped;
    bool keep_workspaces;
    bool verbose;
    bool show_help;
};

struct NormalizeOptions
{
    std::string bytecode;
    evmverify::BytecodeRole role;
    std::optional<std::size_t> reference_length;
    bool show_help;
};

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> evmverify::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(
            evmverify::Error::make("MissingArgument",
                                   std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] evmverify::Result<std::size_t> parse_count_value(std::string_view value,
                                                               std::string_view option,
                                                               std::size_t minimum)
{
    std::size_t parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed < minimum) {
        return std::unexpected(evmverify::Error::make(
            "InvalidArgument", std::format("Invalid {} value: {}", option, value)));
    }
    return parsed;
}

[[nodiscard]] auto set_verify_value(std::string_view arg,
                                    const std::string& value,
                                    VerifyOptions& options) -> evmverify::Result<bool>
{
    if (arg == "--address") {
        options.address = value;
        options.modes.push_back(VerifyMode::kAddress);
    } else if (arg == "--name") {
        options.name = value;
    } else if (arg == "--file") {
        options.file = value;
        options.modes.push_back(VerifyMode::kFile);
    } else if (arg == "--changed-file") {
        options.changed_file = value;
        options.modes.push_back(VerifyMode::kChanged);
    } else if (arg == "--mapping") {
        options.mapping = value;
    } else if (arg == "--config") {
        options.config = value;
    } else if (arg == "--output" || arg == "-o") {
        options.output = value;
    } else if (arg == "--schema-dir") {
        options.schema_dir = value;
    } else if (arg == "--jobs" || arg == "-j") {
        auto parsed = parse_count_value(value, arg, 1);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.jobs = *parsed;
    } else if (arg == "--build-jobs") {
        auto parsed = parse_count_value(value, arg, 1);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.build_jobs = *parsed;
    } else {
        return false;
    }
    return true;
}

[[nodiscard]] bool takes_value(std::string_view arg)
{
    constexpr std::string_view kValued[] = {"--address", "--name",   "--file",       "--changed-file",
                                            "--mapping", "--config", "--output",     "-o",
                                            "--jobs",    "-j",       "--build-jobs", "--schema-dir"};
    return std::ranges::find(kValued, arg) != std::ranges::end(kValued);
}

[[nodiscard]] evmverify::Result<VerifyOptions> parse_verify_args(std::span<char*> args)
{
    VerifyOptions options{.modes = {},
                          .address = std::string{},
                          .name = std::string{},
                          .file = std::string{},
                          .changed_file = std::string{},
                          .mapping = "contract-mapping.json",
                          .config = std::nullopt,
                          .output = std::nullopt,
                          .jobs = std::nullopt,
                          .build_jobs = std::nullopt,
                          .schema_dir = "schemas",
                          .skip_unmapped = false,
                          .keep_workspaces = false,
                          .verbose = false,
                          .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--all") {
            options.modes.push_back(VerifyMode::kAll);
            continue;
        }
        if (arg == "--skip-unmapped") {
            options.skip_unmapped = true;
            continue;
        }
        if (arg == "--keep-workspaces") {
            options.keep_workspaces = true;
            continue;
        }
        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
            continue;
        }
        if (takes_value(arg)) {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto applied = set_verify_value(arg, *value, options);
            if (!applied) {
                return std::unexpected(applied.error());
            }
            skip_next = true;
            continue;
        }
        return std::unexpected(
            evmverify::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
    }
    return options;
}

[[nodiscard]] evmverify::Result<NormalizeOptions> parse_normalize_args(std::span<char*> args)
{
    NormalizeOptions options{.bytecode = std::string{},
                             .role = evmverify::BytecodeRole::kRuntime,
                             .reference_length = std::nullopt,
                             .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--bytecode") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.bytecode = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--role") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            if (*value == "runtime") {
                options.role = evmverify::BytecodeRole::kRuntime;
            } else if (*value == "creation") {
                options.role = evmverify::BytecodeRole::kCreation;
            } else {
                return std::unexpected(evmverify::Error::make(
                    "InvalidArgument", std::format("Invalid --role value: {}", *value)));
            }
            skip_next = true;
            continue;
        }
        if (arg == "--reference-length") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            auto parsed = parse_count_value(*value, arg, 0);
            if (!parsed) {
                return std::unexpected(parsed.error());
            }
            options.reference_length = *parsed;
            skip_next = true;
            continue;
        }
        return std::unexpected(
            evmverify::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
    }
    return options;
}

[[nodiscard]] evmverify::Result<evmverify::config::VerifierConfig> resolve_config(
    const VerifyOptions& options)
{
    evmverify::config::VerifierConfig config;
    if (options.config) {
        auto loaded = evmverify::config::load_config_file(*options.config, options.schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }
    if (options.jobs) {
        config.fetch_jobs = *options.jobs;
    }
    if (options.build_jobs) {
        config.build_jobs = *options.build_jobs;
    }
    if (options.keep_workspaces) {
        config.keep_workspaces = true;
    }
    return config;
}

[[nodiscard]] evmverify::Result<evmverify::inputs::CandidateSet> collect_candidates(
    const VerifyOptions& options,
    const evmverify::config::VerifierConfig& config)
{
    switch (options.modes.front()) {
        case VerifyMode::kAll:
            return evmverify::inputs::load_address_dir(config.address_dir);
        case VerifyMode::kAddress:
            return evmverify::inputs::make_candidates({{options.name, options.address}});
        case VerifyMode::kFile:
            return evmverify::inputs::load_address_file(options.file);
        case VerifyMode::kChanged:
            return evmverify::inputs::load_changed_file(options.changed_file, options.schema_dir);
        case VerifyMode::kNone:
            break;
    }
    return std::unexpected(evmverify::Error::make("InvalidArgument", "No verification mode"));
}

void print_summary(const evmverify::report::VerificationReport& report, std::size_t skipped)
{
    const auto summary = report.summary();
    std::println("[verify] verified: {}  failed: {}  skipped: {}  total: {}", summary.verified,
                 summary.failed, skipped, summary.total);
    for (const auto& failure : report.failed) {
        std::println("  FAIL {} {} [{}] {}", failure.alias, failure.address.to_string(),
                     evmverify::to_string(failure.status), failure.message);
    }
}

int run_verify(const VerifyOptions& options)
{
    auto config = resolve_config(options);
    if (!config) {
        std::println(stderr, "Error: [verify] config: {}", config.error().message);
        return kExitFatal;
    }
    auto table = evmverify::mapping::load_mapping_file(options.mapping, options.schema_dir);
    if (!table) {
        std::println(stderr, "Error: [verify] mapping: {}", table.error().message);
        return kExitFatal;
    }
    auto candidates = collect_candidates(options, *config);
    if (!candidates) {
        std::println(stderr, "Error: [verify] {}", candidates.error().message);
        return kExitFatal;
    }
    for (const auto& alias : candidates->dropped_zero) {
        std::println("[verify] skipping {}: zero address", alias);
    }
    std::println("[verify] {} contract(s), {} mapping entries", candidates->requests.size(),
                 table->size());

    std::mutex print_mutex;
    evmverify::ProgressSink progress;
    if (options.verbose) {
        progress = [&print_mutex](std::string_view line) {
            std::lock_guard lock(print_mutex);
            std::println("{}", line);
        };
    }

    evmverify::explorer::HttplibTransport transport(config->http_timeout);
    evmverify::explorer::DeploymentInfoFetcher fetcher(
        transport,
        evmverify::explorer::ExplorerEndpoints{.api_base = config->explorer_api,
                                               .rpc_url = config->rpc_url},
        config->retry);
    evmverify::workspace::GitWorkspaceProvider workspaces(
        evmverify::workspace::GitWorkspaceOptions{.git = config->git,
                                                  .workspace_root = config->workspace_root,
                                                  .remote_url_template = config->remote_url_template,
                                                  .local_repos = config->local_repos,
                                                  .keep_workspaces = config->keep_workspaces,
                                                  .command_timeout = config->build_timeout});
    evmverify::toolchain::ForgeToolchain forge(config->forge);
    const evmverify::mapping::SourceMappingResolver resolver(std::move(*table));

    evmverify::engine::Engine engine(
        fetcher, resolver, workspaces, forge,
        evmverify::engine::EngineOptions{.fetch_jobs = config->fetch_jobs,
                                         .build_jobs = config->build_jobs,
                                         .build_timeout = config->build_timeout,
                                         .skip_unmapped = options.skip_unmapped},
        progress);
    auto outcome = engine.run(candidates->requests);
    auto cleaned = workspaces.cleanup();
    if (!outcome) {
        std::println(stderr, "Error: [verify] {}", outcome.error().message);
        return kExitFatal;
    }
    if (!cleaned) {
        std::println(stderr, "Error: [verify] {}", cleaned.error().message);
        return kExitFatal;
    }

    for (const auto& skipped : outcome->skipped) {
        std::println("[verify] skipping {}: {}", skipped.alias, skipped.message);
    }
    const auto report = evmverify::report::aggregate(std::move(outcome->results));
    print_summary(report, outcome->skipped.size() + candidates->dropped_zero.size());

    if (options.output) {
        if (auto written = evmverify::report::write_report(report, *options.output, options.schema_dir);
            !written) {
            std::println(stderr, "Error: [verify] report: {}", written.error().message);
            return kExitFatal;
        }
        std::println("  output: {}", *options.output);
    }
    return report.passed() ? 0 : kExitFailed;
}

int run_normalize(const NormalizeOptions& options)
{
    auto raw = evmverify::common::from_hex(options.bytecode);
    if (!raw) {
        std::println(stderr, "Error: [normalize] {}", raw.error().message);
        return kExitFatal;
    }
    const auto normalized = evmverify::bytecode::normalize(
        *raw, evmverify::bytecode::NormalizeOptions{.role = options.role,
                                                    .runtime_reference = std::nullopt,
                                                    .reference_length = options.reference_length,
                                                    .immutable_ranges = {}});
    std::println("[normalize] role: {}", evmverify::to_string(options.role));
    std::println("  original size:      {}", normalized.original_size);
    std::println("  normalized size:    {}", normalized.bytes.size());
    std::println("  metadata sections:  {} ({} bytes)", normalized.metadata_sections,
                 normalized.metadata_bytes);
    if (options.role == evmverify::BytecodeRole::kCreation) {
        std::println("  constructor args:   {} bytes", normalized.constructor_args_size);
    }
    std::println("0x{}", normalized.hex());
    return 0;
}

int cmd_verify(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_verify_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitFatal;
    }
    if (options->show_help) {
        print_verify_help();
        return 0;
    }
    if (options->modes.size() != 1) {
        std::println(stderr, "Error: exactly one of --all, --address, --file, --changed-file is required");
        print_verify_help();
        return kExitFatal;
    }
    if (options->modes.front() == VerifyMode::kAddress && options->name.empty()) {
        std::println(stderr, "Error: --address requires --name");
        print_verify_help();
        return kExitFatal;
    }
    return run_verify(*options);
}

int cmd_normalize(int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_normalize_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return kExitFatal;
    }
    if (options->show_help) {
        print_normalize_help();
        return 0;
    }
    if (options->bytecode.empty()) {
        std::println(stderr, "Error: --bytecode is required");
        print_normalize_help();
        return kExitFatal;
    }
    return run_normalize(*options);
}

}  // namespace

namespace {

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return kExitFatal;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "version") {
            print_version();
            return 0;
        }

        int sub_argc = argc - 2;
        char** sub_argv = argv + 2;

        if (cmd == "verify") {
            return cmd_verify(sub_argc, sub_argv);
        }
        if (cmd == "normalize") {
            return cmd_normalize(sub_argc, sub_argv);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return kExitFatal;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return kExitFatal;
    } catch (...) {
        try {
            std::println(stderr, "Error: unknown exception");
        } catch (...) {
            std::terminate();
        }
        return kExitFatal;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
