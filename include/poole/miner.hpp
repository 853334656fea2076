// SPDX-License-Identifier: MIT
// Poole Client - Marked Block Miner
// Copyright (c) 2024-2026 Poole Contributors

#pragma once

#include "poole/config.hpp"
#include "poole/ledger.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace poole
{

using Sleeper = std::function<void (std::chrono::milliseconds)>;

/// Summary of a mining run
struct RunReport
{
  bool reached = false;    // marked_count >= target when run returned
  size_t marked_count = 0; // Marked blocks on the last chain snapshot
  uint64_t accepted = 0;   // Blocks the ledger accepted
  uint64_t rejected = 0;   // Submissions the ledger refused
  uint64_t stale = 0;      // Searches abandoned because the head moved
  uint64_t tainted = 0;    // Pool snapshots skipped by the policy
};

/// Check whether any pending transaction moves value to or from identity
/// @return true if some tx has src == identity or dst == identity
bool touches_identity (const PoolSnapshot &pool, const std::string &identity);

/// Build the template for a marked block
///
/// The only way the miner creates blocks. A marked block never carries
/// transactions.
///
/// @param parent_index Index of the block at head_hash
/// @param head_hash Digest the new block extends
/// @param identity Marker value
Block make_marked_template (uint64_t parent_index,
                            const std::string &head_hash,
                            const std::string &identity);

/// Mines empty blocks marked with an identity until a target count is met
///
/// Each cycle takes a pool snapshot, skips it if any pending transaction
/// touches the identity, searches on the snapshot's head and submits.
/// Stale searches, rejections and transient ledger errors restart the
/// cycle after a short backoff. Only the cancellation flag ends a run
/// early.
class MarkerMiner
{
public:
  /// @param ledger Ledger to read from and submit to
  /// @param config Difficulty, check interval and backoff settings
  /// @param sleeper Backoff implementation; defaults to sleeping
  MarkerMiner (LedgerClient &ledger, const Config &config,
               Sleeper sleeper = nullptr);

  /// Mine until the chain holds target_count blocks marked with identity
  /// @param identity Marker value
  /// @param target_count Number of marked blocks wanted on the chain
  /// @param cancel Optional cancellation flag
  /// @throws std::invalid_argument if identity is empty or not UTF-8
  RunReport run (const std::string &identity, size_t target_count,
                 const std::atomic<bool> *cancel = nullptr);

  /// Mine and submit a single marked block
  /// @return true once a block is accepted, false if cancelled
  bool mine_one (const std::string &identity, RunReport &report,
                 const std::atomic<bool> *cancel = nullptr);

private:
  /// Count marked blocks on a complete chain snapshot
  ///
  /// Failed reads and walks cut short before genesis are retried.
  /// @return std::nullopt if cancelled
  std::optional<size_t> recount (const std::string &identity,
                                 const std::atomic<bool> *cancel);

  void pause (int milliseconds);

  LedgerClient &ledger_;
  Config config_;
  Sleeper sleep_;
};

} // namespace poole
