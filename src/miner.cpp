// SPDX-License-Identifier: MIT
// Poole Client - Marked Block Miner Implementation
// Copyright (c) 2024-2026 Poole Contributors

#include "poole/miner.hpp"
#include "poole/chain.hpp"
#include "poole/log.hpp"
#include "poole/mining.hpp"
#include <algorithm>
#include <thread>

namespace poole
{

namespace
{
bool
cancelled (const std::atomic<bool> *cancel)
{
  return cancel && cancel->load ();
}
}

bool
touches_identity (const PoolSnapshot &pool, const std::string &identity)
{
  return std::any_of (pool.txs.begin (), pool.txs.end (),
                      [&] (const Transaction &tx) {
                        return (tx.src && *tx.src == identity)
                               || (tx.dst && *tx.dst == identity);
                      });
}

Block
make_marked_template (uint64_t parent_index, const std::string &head_hash,
                      const std::string &identity)
{
  Block block;
  block.index = parent_index + 1;
  block.prev_hash = head_hash;
  block.nonce = 0;
  block.marker = identity;
  return block;
}

MarkerMiner::MarkerMiner (LedgerClient &ledger, const Config &config,
                          Sleeper sleeper)
    : ledger_ (ledger), config_ (config), sleep_ (std::move (sleeper))
{
  if (!sleep_)
    {
      sleep_ = [] (std::chrono::milliseconds d) {
        std::this_thread::sleep_for (d);
      };
    }
}

void
MarkerMiner::pause (int milliseconds)
{
  sleep_ (std::chrono::milliseconds (milliseconds));
}

std::optional<size_t>
MarkerMiner::recount (const std::string &identity,
                      const std::atomic<bool> *cancel)
{
  ChainReader reader (ledger_);
  while (!cancelled (cancel))
    {
      try
        {
          ChainSnapshot chain = reader.reconstruct ();
          if (chain.complete)
            return count_marked (chain.blocks, identity);

          // A truncated walk under-counts marked blocks
          log_warn ("Chain read stopped before genesis; retrying count");
          pause (config_.policy_backoff_ms);
        }
      catch (const LedgerError &e)
        {
          log_warn (std::string ("Chain read failed: ") + e.what ());
          pause (config_.policy_backoff_ms);
        }
    }
  return std::nullopt;
}

bool
MarkerMiner::mine_one (const std::string &identity, RunReport &report,
                       const std::atomic<bool> *cancel)
{
  auto check_head = [this] () { return ledger_.pool ().hash; };

  while (!cancelled (cancel))
    {
      SearchResult result;
      try
        {
          PoolSnapshot pool = ledger_.pool ();
          if (pool.hash.empty ())
            {
              log_warn ("Pool snapshot has no head digest; retrying");
              pause (config_.policy_backoff_ms);
              continue;
            }

          if (touches_identity (pool, identity))
            {
              // Wait for a snapshot with no transfer touching the identity
              ++report.tainted;
              log_debug ("Pool touches " + identity + "; waiting");
              pause (config_.policy_backoff_ms);
              continue;
            }

          std::optional<Block> parent = ledger_.block_by_hash (pool.hash);
          if (!parent)
            {
              log_debug ("Head " + pool.hash + " not found; retrying");
              pause (config_.policy_backoff_ms);
              continue;
            }

          Block tmpl = make_marked_template (parent->index, pool.hash,
                                             identity);
          log_debug ("Mining index " + std::to_string (tmpl.index) + " on "
                     + pool.hash);

          result = search (std::move (tmpl), check_head,
                           config_.difficulty_bits, config_.recheck_interval,
                           cancel);
        }
      catch (const LedgerError &e)
        {
          log_warn (std::string ("Ledger unavailable: ") + e.what ());
          pause (config_.policy_backoff_ms);
          continue;
        }

      if (result.outcome == SearchOutcome::Cancelled)
        return false;

      if (result.outcome == SearchOutcome::Stale)
        {
          ++report.stale;
          log_debug ("Head moved after " + std::to_string (result.attempts)
                     + " attempts; restarting");
          continue;
        }

      if (ledger_.submit_block (result.block))
        {
          ++report.accepted;
          log_debug ("Accepted block " + result.hash);
          return true;
        }

      ++report.rejected;
      log_info ("Block rejected; retrying");
      pause (config_.reject_backoff_ms);
    }

  return false;
}

RunReport
MarkerMiner::run (const std::string &identity, size_t target_count,
                  const std::atomic<bool> *cancel)
{
  validate_identity (identity);

  RunReport report;

  std::optional<size_t> count = recount (identity, cancel);
  if (!count)
    return report;

  report.marked_count = *count;
  log_info ("Current nice(" + identity
            + ")=" + std::to_string (report.marked_count)
            + "; target=" + std::to_string (target_count));

  while (report.marked_count < target_count)
    {
      if (!mine_one (identity, report, cancel))
        return report;

      count = recount (identity, cancel);
      if (!count)
        return report;

      report.marked_count = *count;
      log_info ("Accepted empty block; nice(" + identity
                + ") count now " + std::to_string (report.marked_count));
    }

  report.reached = true;
  log_info ("Target reached: nice(" + identity
            + ")=" + std::to_string (report.marked_count));
  return report;
}

} // namespace poole
