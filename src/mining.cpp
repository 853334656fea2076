// SPDX-License-Identifier: MIT
// Poole Client - Proof-of-Work Search Implementation
// Copyright (c) 2024-2026 Poole Contributors

#include "poole/mining.hpp"
#include "poole/utils.hpp"
#include <stdexcept>

namespace poole
{

std::string
difficulty_prefix (uint32_t difficulty_bits)
{
  return std::string (difficulty_bits / 4, '0');
}

bool
meets_difficulty (std::string_view hash_hex, uint32_t difficulty_bits)
{
  return leading_zero_digits (hash_hex) >= difficulty_bits / 4;
}

SearchResult
search (Block block, const StalenessCheck &staleness_check,
        uint32_t difficulty_bits, uint64_t interval,
        const std::atomic<bool> *cancel)
{
  if (interval == 0)
    {
      throw std::invalid_argument ("staleness check interval must be positive");
    }

  const std::string base_head = block.prev_hash.value_or ("");

  SearchResult result;
  uint64_t nonce = 0;

  for (;;)
    {
      block.nonce = nonce;
      std::string hash = hash_block (block);
      ++result.attempts;

      if (meets_difficulty (hash, difficulty_bits))
        {
          result.hash = std::move (hash);
          break;
        }

      ++nonce;
      if (nonce % interval == 0)
        {
          if (cancel && cancel->load ())
            {
              result.outcome = SearchOutcome::Cancelled;
              result.block = std::move (block);
              return result;
            }
          if (staleness_check () != base_head)
            {
              result.outcome = SearchOutcome::Stale;
              result.block = std::move (block);
              return result;
            }
        }
    }

  // Head may have moved between the last boundary and the winning hash
  result.outcome = staleness_check () == base_head ? SearchOutcome::Found
                                                   : SearchOutcome::Stale;
  result.block = std::move (block);
  return result;
}

} // namespace poole
