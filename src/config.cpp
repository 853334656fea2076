// SPDX-License-Identifier: MIT
// Poole Client - Configuration Implementation
// Copyright (c) 2024-2026 Poole Contributors

#include "poole/config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace poole
{

void
apply_environment (Config &config)
{
  const char *url = std::getenv (constants::BASE_URL_ENV);
  if (url && *url)
    {
      config.base_url = url;
    }
}

uint64_t
parse_unsigned (const std::string &flag, const std::string &value)
{
  // Digits only: stoull would accept a sign or leading blanks
  if (value.empty ()
      || !std::all_of (value.begin (), value.end (), [] (unsigned char c) {
           return std::isdigit (c) != 0;
         }))
    {
      throw std::invalid_argument (flag + " expects a non-negative number");
    }
  try
    {
      size_t used = 0;
      unsigned long long parsed = std::stoull (value, &used);
      if (used != value.size ())
        throw std::invalid_argument (flag);
      return parsed;
    }
  catch (const std::logic_error &)
    {
      throw std::invalid_argument (flag + " expects a non-negative number");
    }
}

uint64_t
parse_target_count (const std::string &value)
{
  uint64_t target = parse_unsigned ("--target", value);
  if (target == 0)
    {
      throw std::invalid_argument ("--target must be at least 1");
    }
  return target;
}

void
validate_identity (const std::string &identity)
{
  if (identity.empty ())
    {
      throw std::invalid_argument ("identity must not be empty");
    }

  try
    {
      // Serializing rejects invalid UTF-8 the same way hashing a block would
      nlohmann::json marker = identity;
      marker.dump ();
    }
  catch (const nlohmann::json::type_error &e)
    {
      throw std::invalid_argument ("identity is not valid UTF-8: "
                                   + std::string (e.what ()));
    }
}

bool
apply_option (Config &config, const std::string &flag,
              const std::string &value)
{
  if (flag == "--url")
    {
      config.base_url = value;
    }
  else if (flag == "--difficulty")
    {
      config.difficulty_bits
          = static_cast<uint32_t> (parse_unsigned (flag, value));
    }
  else if (flag == "--interval")
    {
      config.recheck_interval = parse_unsigned (flag, value);
    }
  else if (flag == "--timeout")
    {
      config.http_timeout_seconds
          = static_cast<int> (parse_unsigned (flag, value));
    }
  else
    {
      return false;
    }
  return true;
}

void
validate_config (const Config &config)
{
  if (config.base_url.empty ())
    {
      throw std::invalid_argument ("base_url must not be empty");
    }

  if (config.difficulty_bits % 4 != 0
      || config.difficulty_bits > constants::MAX_DIFFICULTY_BITS)
    {
      throw std::invalid_argument (
          "difficulty_bits must be a multiple of 4 no greater than 256");
    }

  if (config.recheck_interval == 0)
    {
      throw std::invalid_argument ("recheck_interval must be positive");
    }

  if (config.http_timeout_seconds <= 0)
    {
      throw std::invalid_argument ("http_timeout_seconds must be positive");
    }

  if (config.policy_backoff_ms < 0 || config.reject_backoff_ms < 0)
    {
      throw std::invalid_argument ("backoff delays must not be negative");
    }
}

} // namespace poole
