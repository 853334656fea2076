// SPDX-License-Identifier: MIT
// Poole Client - HTTP Ledger Client Implementation
// Copyright (c) 2024-2026 Poole Contributors

#include "poole/config.hpp"
#include "poole/log.hpp"
#include "poole/rpc.hpp"
#include <curl/curl.h>

namespace poole
{

namespace
{
// CURL write callback
size_t
write_callback (void *contents, size_t size, size_t nmemb, std::string *userp)
{
  userp->append (static_cast<char *> (contents), size * nmemb);
  return size * nmemb;
}

std::string
escape_query (CURL *curl, const std::string &value)
{
  char *escaped
      = curl_easy_escape (curl, value.c_str (), static_cast<int> (value.size ()));
  if (!escaped)
    {
      throw LedgerError ("Failed to escape query parameter");
    }
  std::string result (escaped);
  curl_free (escaped);
  return result;
}
}

RpcLedgerClient::RpcLedgerClient (const std::string &base_url,
                                  int timeout_seconds)
    : base_url_ (base_url), timeout_seconds_ (timeout_seconds)
{
  // Tolerate a trailing slash in the configured address
  while (!base_url_.empty () && base_url_.back () == '/')
    {
      base_url_.pop_back ();
    }
}

RpcLedgerClient::~RpcLedgerClient () = default;

long
RpcLedgerClient::request (const std::string &path, const std::string *body,
                          std::string &response, const std::string *hash)
{
  CURL *curl = curl_easy_init ();
  if (!curl)
    {
      connected_ = false;
      throw LedgerError ("Failed to initialize CURL");
    }

  std::string url = base_url_ + path;
  if (hash)
    {
      try
        {
          url += "?hash=" + escape_query (curl, *hash);
        }
      catch (const LedgerError &)
        {
          curl_easy_cleanup (curl);
          throw;
        }
    }
  struct curl_slist *headers = nullptr;

  curl_easy_setopt (curl, CURLOPT_URL, url.c_str ());
  curl_easy_setopt (curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt (curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt (curl, CURLOPT_TIMEOUT,
                    static_cast<long> (timeout_seconds_));
  curl_easy_setopt (curl, CURLOPT_NOSIGNAL, 1L);

  if (body)
    {
      headers = curl_slist_append (headers, "Content-Type: application/json");
      curl_easy_setopt (curl, CURLOPT_HTTPHEADER, headers);
      curl_easy_setopt (curl, CURLOPT_POSTFIELDS, body->c_str ());
      curl_easy_setopt (curl, CURLOPT_POSTFIELDSIZE,
                        static_cast<long> (body->size ()));
    }

  CURLcode res = curl_easy_perform (curl);
  long status = 0;
  if (res == CURLE_OK)
    {
      curl_easy_getinfo (curl, CURLINFO_RESPONSE_CODE, &status);
    }

  curl_slist_free_all (headers);
  curl_easy_cleanup (curl);

  if (res != CURLE_OK)
    {
      connected_ = false;
      throw LedgerError (std::string ("CURL error: ")
                         + curl_easy_strerror (res));
    }

  connected_ = true;
  return status;
}

nlohmann::json
RpcLedgerClient::get_json (const std::string &path, const std::string *hash)
{
  std::string response;
  long status = request (path, nullptr, response, hash);
  if (status >= 400)
    {
      throw LedgerError ("HTTP " + std::to_string (status) + " for GET "
                         + path);
    }

  try
    {
      return nlohmann::json::parse (response);
    }
  catch (const nlohmann::json::parse_error &e)
    {
      throw LedgerError (std::string ("JSON parse error: ") + e.what ());
    }
}

HeadSnapshot
RpcLedgerClient::head ()
{
  nlohmann::json j = get_json ("/block");
  try
    {
      HeadSnapshot snapshot;
      snapshot.hash = j.at ("hash").get<std::string> ();
      snapshot.block = j.at ("block").get<Block> ();
      return snapshot;
    }
  catch (const nlohmann::json::exception &e)
    {
      throw LedgerError (std::string ("Malformed head response: ")
                         + e.what ());
    }
}

std::optional<Block>
RpcLedgerClient::block_by_hash (const std::string &hash)
{
  nlohmann::json j = get_json ("/block", &hash);
  if (!j.is_object ())
    return std::nullopt;

  auto it = j.find ("block");
  if (it == j.end () || it->is_null () || it->empty ())
    return std::nullopt;

  try
    {
      return it->get<Block> ();
    }
  catch (const nlohmann::json::exception &e)
    {
      throw LedgerError (std::string ("Malformed block response: ")
                         + e.what ());
    }
}

PoolSnapshot
RpcLedgerClient::pool ()
{
  nlohmann::json j = get_json ("/txpool");
  try
    {
      PoolSnapshot snapshot;
      auto hash = j.find ("hash");
      if (hash != j.end () && hash->is_string ())
        snapshot.hash = hash->get<std::string> ();
      auto txs = j.find ("txs");
      if (txs != j.end () && txs->is_array ())
        snapshot.txs = txs->get<std::vector<Transaction> > ();
      return snapshot;
    }
  catch (const nlohmann::json::exception &e)
    {
      throw LedgerError (std::string ("Malformed txpool response: ")
                         + e.what ());
    }
}

bool
RpcLedgerClient::submit_block (const Block &block)
{
  std::string body = nlohmann::json (block).dump ();
  std::string response;

  try
    {
      long status = request ("/block", &body, response);
      if (status != constants::HTTP_OK)
        {
          log_debug ("Block rejected with HTTP " + std::to_string (status)
                     + ": " + response);
          return false;
        }
      return true;
    }
  catch (const LedgerError &e)
    {
      log_warn (std::string ("Block submission failed: ") + e.what ());
      return false;
    }
}

} // namespace poole
