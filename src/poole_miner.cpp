// SPDX-License-Identifier: MIT
// Poole Client - Marked Block Miner Entry Point
// Copyright (c) 2024-2026 Poole Contributors

#include "poole/config.hpp"
#include "poole/log.hpp"
#include "poole/miner.hpp"
#include "poole/rpc.hpp"
#include <atomic>
#include <csignal>
#include <curl/curl.h>
#include <iostream>
#include <stdexcept>
#include <string>

namespace
{
std::atomic<bool> g_cancel{ false };

void
handle_signal (int)
{
  g_cancel = true;
}

void
print_usage (const char *argv0)
{
  std::cout << "Usage: " << argv0
            << " [--who ID] [--target N] [--url URL] [--difficulty BITS]\n"
               "       [--interval NONCES] [--timeout SECONDS] [--verbose]\n"
               "\n"
               "Mine empty blocks marked nice=ID until the chain holds N of "
               "them.\n"
               "The ledger address defaults to $NORTH_POOLE.\n";
}
}

int
main (int argc, char **argv)
{
  poole::Config config;
  poole::apply_environment (config);

  std::string who = poole::constants::DEFAULT_IDENTITY;
  uint64_t target = poole::constants::DEFAULT_TARGET_COUNT;

  try
    {
      for (int i = 1; i < argc; ++i)
        {
          std::string arg = argv[i];
          if (arg == "--help" || arg == "-h")
            {
              print_usage (argv[0]);
              return 0;
            }
          if (arg == "--verbose" || arg == "-v")
            {
              config.verbose = true;
              continue;
            }
          if (i + 1 >= argc)
            {
              throw std::invalid_argument ("missing value for " + arg);
            }
          std::string value = argv[++i];
          if (arg == "--who")
            {
              who = value;
            }
          else if (arg == "--target")
            {
              target = poole::parse_target_count (value);
            }
          else if (!poole::apply_option (config, arg, value))
            {
              throw std::invalid_argument ("unknown option " + arg);
            }
        }
      poole::validate_config (config);
      poole::validate_identity (who);
    }
  catch (const std::logic_error &e)
    {
      poole::log_error (e.what ());
      print_usage (argv[0]);
      return 1;
    }

  poole::set_verbose (config.verbose);
  std::signal (SIGINT, handle_signal);
  std::signal (SIGTERM, handle_signal);

  curl_global_init (CURL_GLOBAL_DEFAULT);
  poole::log_info ("Ledger: " + config.base_url + ", difficulty "
                   + std::to_string (config.difficulty_bits) + " bits");

  poole::RpcLedgerClient ledger (config.base_url, config.http_timeout_seconds);
  poole::MarkerMiner miner (ledger, config);
  poole::RunReport report
      = miner.run (who, static_cast<size_t> (target), &g_cancel);

  curl_global_cleanup ();

  poole::log_info ("accepted=" + std::to_string (report.accepted)
                   + " rejected=" + std::to_string (report.rejected)
                   + " stale=" + std::to_string (report.stale)
                   + " tainted=" + std::to_string (report.tainted));

  if (!report.reached)
    {
      poole::log_warn ("Mining cancelled before the target was reached");
      return 130;
    }
  return 0;
}
