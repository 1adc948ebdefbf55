/**
 * @file inputs.cpp
 * @brief Candidate-set loading
 */

#include "evmverify/inputs.hpp"

#include "evmverify/json_io.hpp"
#include "evmverify/outcome.hpp"
#include "evmverify/version.hpp"

#include <algorithm>
#include <format>
#include <system_error>
#include <utility>

namespace evmverify::inputs {

namespace {

[[nodiscard]] Error parse_error(std::string message)
{
    return Error::make(std::string(error_code::kParseError), std::move(message));
}

[[nodiscard]] Result<std::vector<std::pair<std::string, std::string>>> load_entries(
    const std::filesystem::path& path)
{
    auto document = common::read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    return address_entries(*document, path.string());
}

}  // namespace

Result<CandidateSet> make_candidates(const std::vector<std::pair<std::string, std::string>>& entries)
{
    CandidateSet set;
    for (const auto& [name, text] : entries) {
        auto address = Address::parse(text);
        if (!address) {
            return std::unexpected(
                parse_error(std::format("Entry '{}': {}", name, address.error().message)));
        }
        if (address->is_zero()) {
            set.dropped_zero.push_back(name);
            continue;
        }
        auto request = ContractRequest::make(name, *address);
        if (!request) {
            return std::unexpected(request.error());
        }
        set.requests.push_back(std::move(*request));
    }
    return set;
}

Result<std::vector<std::pair<std::string, std::string>>> address_entries(
    const nlohmann::json& document, const std::string& origin)
{
    if (!document.is_object()) {
        return std::unexpected(parse_error(std::format("{}: expected a JSON object", origin)));
    }
    std::vector<std::pair<std::string, std::string>> entries;
    for (const auto& [key, value] : document.items()) {
        if (value.is_string()) {
            entries.emplace_back(key, value.get<std::string>());
            continue;
        }
        if (!value.is_object()) {
            return std::unexpected(parse_error(
                std::format("{}: '{}' must be an address or a section of addresses", origin, key)));
        }
        for (const auto& [name, address] : value.items()) {
            if (!address.is_string()) {
                return std::unexpected(parse_error(
                    std::format("{}: '{}.{}' must be an address string", origin, key, name)));
            }
            entries.emplace_back(name, address.get<std::string>());
        }
    }
    return entries;
}

Result<CandidateSet> load_changed_file(const std::filesystem::path& path,
                                       const std::filesystem::path& schema_dir)
{
    auto document = common::read_validated_json_file(path, schema_dir, kChangedSchemaVersion);
    if (!document) {
        return std::unexpected(document.error());
    }
    std::vector<std::pair<std::string, std::string>> entries;
    for (const auto& item : *document) {
        entries.emplace_back(item.at("name").get<std::string>(),
                             item.at("address").get<std::string>());
    }
    return make_candidates(entries);
}

Result<CandidateSet> load_address_file(const std::filesystem::path& path)
{
    auto entries = load_entries(path);
    if (!entries) {
        return std::unexpected(entries.error());
    }
    return make_candidates(*entries);
}

Result<CandidateSet> load_address_dir(const std::filesystem::path& dir)
{
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.ends_with(kAddressFileSuffix) && it->is_regular_file(ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        return std::unexpected(Error::make(
            std::string(error_code::kIOError),
            std::format("Cannot read address directory {}: {}", dir.string(), ec.message())));
    }
    std::ranges::sort(files);

    std::vector<std::pair<std::string, std::string>> entries;
    for (const auto& file : files) {
        auto loaded = load_entries(file);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        entries.insert(entries.end(), loaded->begin(), loaded->end());
    }
    return make_candidates(entries);
}

}  // namespace evmverify::inputs
