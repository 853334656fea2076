// SPDX-License-Identifier: MIT
// Poole Client - HTTP Ledger Client
// Copyright (c) 2024-2026 Poole Contributors

#pragma once

#include "poole/ledger.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace poole
{

/// HTTP/JSON client for the ledger service
///
/// Endpoints: GET /block, GET /block?hash=D, GET /txpool, POST /block.
/// Every request carries the configured timeout.
class RpcLedgerClient : public LedgerClient
{
public:
  /// Construct ledger client
  /// @param base_url Service address (e.g., "http://localhost")
  /// @param timeout_seconds Per-request timeout
  explicit RpcLedgerClient (const std::string &base_url,
                            int timeout_seconds = 5);

  ~RpcLedgerClient () override;

  HeadSnapshot head () override;
  std::optional<Block> block_by_hash (const std::string &hash) override;
  PoolSnapshot pool () override;
  bool submit_block (const Block &block) override;

  /// Check if the ledger answered the last request
  /// @return true if last request completed at the transport level
  bool
  is_connected () const
  {
    return connected_;
  }

private:
  /// Perform one HTTP request
  /// @param path Path appended to the base URL
  /// @param body POST body, or nullptr for GET
  /// @param response Receives the response body
  /// @param hash Optional value for a URL-escaped ?hash= query
  /// @return HTTP status code
  /// @throws LedgerError on transport failure
  long request (const std::string &path, const std::string *body,
                std::string &response, const std::string *hash = nullptr);

  /// GET a path and decode the JSON body
  /// @throws LedgerError on transport failure, HTTP error or bad JSON
  nlohmann::json get_json (const std::string &path,
                           const std::string *hash = nullptr);

  std::string base_url_;
  int timeout_seconds_;
  bool connected_ = false;
};

} // namespace poole
