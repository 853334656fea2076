// SPDX-License-Identifier: MIT
// Poole Client - Block Serialization and Hashing
// Copyright (c) 2024-2026 Poole Contributors

#include "poole/block.hpp"
#include "poole/utils.hpp"

namespace poole
{

namespace
{
const char *const FIELD_INDEX = "index";
const char *const FIELD_PREV_HASH = "prev_hash";
const char *const FIELD_NONCE = "nonce";
const char *const FIELD_TXS = "txs";
const char *const FIELD_MARKER = "nice";

// Take a string field out of an object; non-string values stay behind
std::optional<std::string>
take_string (nlohmann::json &obj, const char *key)
{
  auto it = obj.find (key);
  if (it == obj.end () || !it->is_string ())
    return std::nullopt;

  std::string value = it->get<std::string> ();
  obj.erase (it);
  return value;
}
}

void
to_json (nlohmann::json &j, const Transaction &tx)
{
  j = tx.payload.is_object () ? tx.payload : nlohmann::json::object ();
  if (tx.src)
    j["src"] = *tx.src;
  if (tx.dst)
    j["dst"] = *tx.dst;
  if (tx.nonce)
    j["nonce"] = *tx.nonce;
}

void
from_json (const nlohmann::json &j, Transaction &tx)
{
  nlohmann::json rest = j;
  tx.src = take_string (rest, "src");
  tx.dst = take_string (rest, "dst");
  tx.nonce = take_string (rest, "nonce");
  tx.payload = std::move (rest);
}

void
to_json (nlohmann::json &j, const Block &block)
{
  j = block.extra.is_object () ? block.extra : nlohmann::json::object ();
  j[FIELD_INDEX] = block.index;
  if (block.prev_hash)
    j[FIELD_PREV_HASH] = *block.prev_hash;
  else
    j[FIELD_PREV_HASH] = nullptr;
  j[FIELD_NONCE] = block.nonce;
  j[FIELD_TXS] = block.txs;
  if (block.marker)
    j[FIELD_MARKER] = *block.marker;
}

void
from_json (const nlohmann::json &j, Block &block)
{
  nlohmann::json rest = j;

  block.index = rest.at (FIELD_INDEX).get<uint64_t> ();
  rest.erase (FIELD_INDEX);

  block.nonce = rest.value (FIELD_NONCE, uint64_t (0));
  rest.erase (FIELD_NONCE);

  block.prev_hash = take_string (rest, FIELD_PREV_HASH);
  // A null prev_hash is genesis and is written back as null
  auto prev = rest.find (FIELD_PREV_HASH);
  if (prev != rest.end () && prev->is_null ())
    rest.erase (prev);

  block.txs.clear ();
  auto txs = rest.find (FIELD_TXS);
  if (txs != rest.end ())
    {
      if (txs->is_array ())
        block.txs = txs->get<std::vector<Transaction> > ();
      rest.erase (txs);
    }

  block.marker = take_string (rest, FIELD_MARKER);
  block.extra = std::move (rest);
}

std::string
serialize_block (const Block &block)
{
  nlohmann::json j = block;
  // nlohmann objects are key-ordered maps; dump() is compact by default
  return j.dump (-1, ' ', true);
}

std::string
hash_block (const Block &block)
{
  return sha256_hex (serialize_block (block));
}

} // namespace poole
