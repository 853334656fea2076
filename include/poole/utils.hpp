// SPDX-License-Identifier: MIT
// Poole Client - Utility Functions
// Copyright (c) 2024-2026 Poole Contributors

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace poole
{

/// Convert byte array to hexadecimal string
/// @param data Pointer to byte data
/// @param len Number of bytes
/// @return Lowercase hexadecimal string
std::string bytes_to_hex (const uint8_t *data, size_t len);

/// Single SHA256 hash, hex encoded
/// @param data Input bytes
/// @return 64-character lowercase hexadecimal digest
std::string sha256_hex (std::string_view data);

/// Count leading '0' characters of a hexadecimal string
size_t leading_zero_digits (std::string_view hex);

} // namespace poole
