// SPDX-License-Identifier: MIT
// Poole Client - Ledger Service Interface
// Copyright (c) 2024-2026 Poole Contributors

#pragma once

#include "poole/block.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace poole
{

/// Transport, HTTP status or response decoding failure
class LedgerError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// Current chain tip
struct HeadSnapshot
{
  std::string hash;
  Block block;
};

/// Pending transactions, tagged with the head they were taken against
struct PoolSnapshot
{
  std::string hash;
  std::vector<Transaction> txs;
};

/// Read/write surface of the remote ledger
///
/// The ledger owns the chain and the pool. Callers only ever see
/// snapshots and must re-read to observe changes.
class LedgerClient
{
public:
  virtual ~LedgerClient () = default;

  /// Fetch the current head
  /// @throws LedgerError on failure
  virtual HeadSnapshot head () = 0;

  /// Fetch a block by digest
  /// @return The block, or std::nullopt when the ledger does not know it
  /// @throws LedgerError on failure
  virtual std::optional<Block> block_by_hash (const std::string &hash) = 0;

  /// Fetch the transaction pool
  /// @throws LedgerError on failure
  virtual PoolSnapshot pool () = 0;

  /// Submit a candidate block
  /// @return true if the ledger accepted it as the new head
  virtual bool submit_block (const Block &block) = 0;
};

} // namespace poole
