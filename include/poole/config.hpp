// SPDX-License-Identifier: MIT
// Poole Client - Configuration
// Copyright (c) 2024-2026 Poole Contributors

#pragma once

#include <cstdint>
#include <string>

namespace poole
{

/// Client configuration
struct Config
{
  std::string base_url = "http://localhost";
  uint32_t difficulty_bits = 16;  // Must be divisible by 4
  uint64_t recheck_interval = 512; // Nonces between head checks
  int http_timeout_seconds = 5;
  int policy_backoff_ms = 100;  // Wait after a tainted pool snapshot
  int reject_backoff_ms = 50;   // Wait after a rejected submission
  bool verbose = false;
};

// Named constants
namespace constants
{
constexpr const char *BASE_URL_ENV = "NORTH_POOLE";
constexpr const char *DEFAULT_IDENTITY = "hacker";
constexpr uint64_t DEFAULT_TARGET_COUNT = 10;
constexpr uint32_t MAX_DIFFICULTY_BITS = 256;
constexpr int HTTP_OK = 200;
constexpr const char *VERSION = "1.0.0";
}

/// Overlay process environment onto a configuration
///
/// Reads the ledger base address from NORTH_POOLE when it is set and
/// non-empty. Other fields are left untouched.
///
/// @param config Configuration to update in place
void apply_environment (Config &config);

/// Apply one shared command-line option to a configuration
///
/// Recognized flags: --url, --difficulty, --interval, --timeout.
///
/// @param config Configuration to update in place
/// @param flag Option name including the leading dashes
/// @param value Option argument
/// @return false if the flag is not a shared option
/// @throws std::invalid_argument if the value is not a valid number
bool apply_option (Config &config, const std::string &flag,
                   const std::string &value);

/// Parse a strictly non-negative decimal option value
/// @param flag Option name, used in the error message
/// @param value Text to parse; no sign, no trailing characters
/// @throws std::invalid_argument if the value is not a plain number
uint64_t parse_unsigned (const std::string &flag, const std::string &value);

/// Parse the number of marked blocks to mine for
/// @throws std::invalid_argument if the value is not a positive number
uint64_t parse_target_count (const std::string &value);

/// Check that a marker identity can be written into a block
///
/// The identity must be non-empty valid UTF-8, otherwise the block cannot
/// be serialized.
///
/// @throws std::invalid_argument naming the problem
void validate_identity (const std::string &identity);

/// Check a configuration before any component is built from it
/// @param config Configuration to check
/// @throws std::invalid_argument naming the offending field
void validate_config (const Config &config);

} // namespace poole
