// SPDX-License-Identifier: MIT
// Poole Client - Transaction Confirmation Audit Implementation
// Copyright (c) 2024-2026 Poole Contributors

#include "poole/audit.hpp"
#include "poole/chain.hpp"

namespace poole
{

DepthReport
ConfirmationAuditor::check_depth (const std::string &nonce)
{
  DepthReport report;
  report.head_index = ledger_.head ().block.index;

  ChainReader reader (ledger_);
  ChainSnapshot chain = reader.reconstruct ();

  for (const Block &block : chain.blocks)
    {
      for (const Transaction &tx : block.txs)
        {
          if (tx.nonce && *tx.nonce == nonce)
            {
              report.status = DepthStatus::Found;
              report.block_index = block.index;
              // The walk may see a newer head than the first read
              report.confirmations = report.head_index >= block.index
                                         ? report.head_index - block.index
                                         : 0;
              return report;
            }
        }
    }

  report.status = chain.complete ? DepthStatus::NotFound
                                 : DepthStatus::Indeterminate;
  return report;
}

} // namespace poole
