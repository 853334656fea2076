// SPDX-License-Identifier: MIT
// Poole Client - Transaction Confirmation Audit
// Copyright (c) 2024-2026 Poole Contributors

#pragma once

#include "poole/ledger.hpp"
#include <cstdint>
#include <string>

namespace poole
{

enum class DepthStatus
{
  Found,
  NotFound,      // Absent from a chain walked back to genesis
  Indeterminate, // Absent, but the chain walk was cut short
};

/// Where a transaction sits relative to the head
struct DepthReport
{
  DepthStatus status = DepthStatus::NotFound;
  uint64_t block_index = 0;
  uint64_t head_index = 0;
  uint64_t confirmations = 0;
};

/// Locates a transaction by nonce and measures its confirmation depth
class ConfirmationAuditor
{
public:
  explicit ConfirmationAuditor (LedgerClient &ledger) : ledger_ (ledger) {}

  /// Find the earliest block holding a transaction with this nonce
  ///
  /// confirmations = head_index - block_index, where head_index comes
  /// from a head read taken before the chain walk.
  ///
  /// @throws LedgerError if the head cannot be fetched
  DepthReport check_depth (const std::string &nonce);

private:
  LedgerClient &ledger_;
};

} // namespace poole
