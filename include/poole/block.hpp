// SPDX-License-Identifier: MIT
// Poole Client - Block and Transaction Records
// Copyright (c) 2024-2026 Poole Contributors

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace poole
{

/// Pending or mined transaction
///
/// Only the fields the client inspects are typed. Everything else the
/// ledger sends is kept in `payload` and written back unchanged.
struct Transaction
{
  std::optional<std::string> src;
  std::optional<std::string> dst;
  std::optional<std::string> nonce;
  nlohmann::json payload = nlohmann::json::object ();
};

/// Ledger block record
///
/// Wire field names: index, prev_hash, nonce, txs, nice (the marker).
struct Block
{
  uint64_t index = 0;
  std::optional<std::string> prev_hash; // Absent only for genesis
  uint64_t nonce = 0;
  std::vector<Transaction> txs;
  std::optional<std::string> marker;
  nlohmann::json extra = nlohmann::json::object ();
};

void to_json (nlohmann::json &j, const Transaction &tx);
void from_json (const nlohmann::json &j, Transaction &tx);
void to_json (nlohmann::json &j, const Block &block);
void from_json (const nlohmann::json &j, Block &block);

/// Canonical block serialization
///
/// Keys sorted at every depth, compact separators, non-ASCII characters
/// escaped. A genesis block writes prev_hash as null; an unmarked block
/// has no "nice" key.
///
/// @param block Block to serialize
/// @return Canonical JSON text
std::string serialize_block (const Block &block);

/// Block identity: SHA256 of the canonical serialization
/// @param block Block to hash
/// @return 64-character lowercase hexadecimal digest
std::string hash_block (const Block &block);

} // namespace poole
