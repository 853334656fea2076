// SPDX-License-Identifier: MIT
// Poole Client - Utility Functions Implementation
// Copyright (c) 2024-2026 Poole Contributors

#include "poole/utils.hpp"
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace poole
{

std::string
bytes_to_hex (const uint8_t *data, size_t len)
{
  std::ostringstream ss;
  ss << std::hex << std::setfill ('0');
  for (size_t i = 0; i < len; ++i)
    {
      ss << std::setw (2) << static_cast<int> (data[i]);
    }
  return ss.str ();
}

std::string
sha256_hex (std::string_view data)
{
  uint8_t hash[SHA256_DIGEST_LENGTH];
  SHA256 (reinterpret_cast<const uint8_t *> (data.data ()), data.size (),
          hash);
  return bytes_to_hex (hash, SHA256_DIGEST_LENGTH);
}

size_t
leading_zero_digits (std::string_view hex)
{
  size_t count = 0;
  while (count < hex.size () && hex[count] == '0')
    ++count;
  return count;
}

} // namespace poole
