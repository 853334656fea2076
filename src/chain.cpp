// SPDX-License-Identifier: MIT
// Poole Client - Chain Reconstruction Implementation
// Copyright (c) 2024-2026 Poole Contributors

#include "poole/chain.hpp"
#include "poole/log.hpp"
#include <algorithm>
#include <set>

namespace poole
{

ChainSnapshot
ChainReader::reconstruct ()
{
  ChainSnapshot snapshot;

  HeadSnapshot head = ledger_.head ();
  std::set<std::string> visited{ head.hash };
  std::optional<std::string> current = head.block.prev_hash;
  snapshot.blocks.push_back (std::move (head.block));
  bool cycle = false;

  // A missing or empty prev_hash marks genesis
  while (current && !current->empty ())
    {
      if (!visited.insert (*current).second)
        {
          log_warn ("Chain walk revisited block " + *current + "; stopping");
          cycle = true;
          break;
        }

      std::optional<Block> block;
      try
        {
          block = ledger_.block_by_hash (*current);
        }
      catch (const LedgerError &e)
        {
          log_debug ("Chain walk stopped at " + *current + ": " + e.what ());
          break;
        }

      if (!block)
        {
          log_debug ("Chain walk stopped at unknown block " + *current);
          break;
        }

      current = block->prev_hash;
      snapshot.blocks.push_back (std::move (*block));
    }

  snapshot.complete = !cycle && (!current || current->empty ());
  std::reverse (snapshot.blocks.begin (), snapshot.blocks.end ());
  return snapshot;
}

size_t
count_marked (const std::vector<Block> &blocks, const std::string &identity)
{
  return static_cast<size_t> (
      std::count_if (blocks.begin (), blocks.end (), [&] (const Block &b) {
        return b.marker && *b.marker == identity;
      }));
}

} // namespace poole
