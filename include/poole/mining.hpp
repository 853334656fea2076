// SPDX-License-Identifier: MIT
// Poole Client - Proof-of-Work Search
// Copyright (c) 2024-2026 Poole Contributors

#pragma once

#include "poole/block.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace poole
{

/// Returns the ledger's current head digest
using StalenessCheck = std::function<std::string ()>;

enum class SearchOutcome
{
  Found,     // block meets difficulty and the head did not move
  Stale,     // head moved away from template.prev_hash
  Cancelled, // cancellation flag seen at a check boundary
};

/// Result of one search attempt
struct SearchResult
{
  SearchOutcome outcome = SearchOutcome::Stale;
  Block block;           // Last evaluated block (winning block if Found)
  std::string hash;      // Digest of `block` when Found
  uint64_t attempts = 0; // Hashes evaluated
};

/// Zero prefix a digest must start with
/// @param difficulty_bits Required leading zero bits (multiple of 4)
/// @return String of difficulty_bits / 4 '0' characters
std::string difficulty_prefix (uint32_t difficulty_bits);

/// Check a hex digest against the difficulty target
///
/// Accepts iff the first difficulty_bits / 4 hex characters are all '0'.
///
/// @param hash_hex Hexadecimal digest
/// @param difficulty_bits Required leading zero bits (multiple of 4)
bool meets_difficulty (std::string_view hash_hex, uint32_t difficulty_bits);

/// Search the nonce space for a block meeting the difficulty target
///
/// Nonces are tried in ascending order from zero. Whenever the next nonce
/// is a multiple of `interval`, the cancellation flag is polled and the
/// head is re-read through `staleness_check`; a head different from
/// template.prev_hash aborts the search. A found block is re-checked once
/// more before it is reported, so a block found as the head moves is
/// reported Stale.
///
/// @param block Template; its nonce is overwritten
/// @param staleness_check Head digest source, may throw LedgerError
/// @param difficulty_bits Required leading zero bits (multiple of 4)
/// @param interval Nonces between staleness checks (> 0)
/// @param cancel Optional cooperative cancellation flag
SearchResult search (Block block, const StalenessCheck &staleness_check,
                     uint32_t difficulty_bits, uint64_t interval,
                     const std::atomic<bool> *cancel = nullptr);

} // namespace poole
