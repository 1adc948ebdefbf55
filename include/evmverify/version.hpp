#pragma once

/**
 * @file version.hpp
 * @brief evmverify version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace evmverify {

/// evmverify version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Schema versions of the documents evmverify reads and writes
constexpr const char* kReportSchemaVersion = "verification_report.v1";
constexpr const char* kMappingSchemaVersion = "contract_mapping.v1";
constexpr const char* kConfigSchemaVersion = "verify_config.v1";
constexpr const char* kChangedSchemaVersion = "changed_addresses.v1";

}  // namespace evmverify
