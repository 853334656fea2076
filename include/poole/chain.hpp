// SPDX-License-Identifier: MIT
// Poole Client - Chain Reconstruction
// Copyright (c) 2024-2026 Poole Contributors

#pragma once

#include "poole/ledger.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace poole
{

/// Chain assembled from the head backwards, oldest block first
struct ChainSnapshot
{
  std::vector<Block> blocks;
  bool complete = false; // true if traversal reached genesis
};

/// Rebuilds the chain by following prev_hash links from the head
class ChainReader
{
public:
  explicit ChainReader (LedgerClient &ledger) : ledger_ (ledger) {}

  /// Reconstruct the chain, oldest first
  ///
  /// A failed or empty backward fetch stops the walk; the blocks fetched
  /// so far are returned and `complete` is false. A prev_hash that points
  /// back to an already visited block also stops the walk and leaves
  /// `complete` false, so no block appears twice. The snapshot is built
  /// from separate reads and may lag the ledger.
  ///
  /// @throws LedgerError if the head itself cannot be fetched
  ChainSnapshot reconstruct ();

private:
  LedgerClient &ledger_;
};

/// Count blocks whose marker equals `identity`
size_t count_marked (const std::vector<Block> &blocks,
                     const std::string &identity);

} // namespace poole
