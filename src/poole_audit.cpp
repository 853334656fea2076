// SPDX-License-Identifier: MIT
// Poole Client - Confirmation Audit Entry Point
// Copyright (c) 2024-2026 Poole Contributors

#include "poole/audit.hpp"
#include "poole/config.hpp"
#include "poole/log.hpp"
#include "poole/rpc.hpp"
#include <curl/curl.h>
#include <iostream>
#include <stdexcept>
#include <string>

namespace
{
void
print_usage (const char *argv0)
{
  std::cout << "Usage: " << argv0
            << " --nonce NONCE [--url URL] [--timeout SECONDS] [--verbose]\n"
               "\n"
               "Report the block holding a transaction and its confirmation "
               "depth.\n"
               "The ledger address defaults to $NORTH_POOLE.\n";
}
}

int
main (int argc, char **argv)
{
  poole::Config config;
  poole::apply_environment (config);

  std::string nonce;

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
          if (arg == "--nonce")
            {
              nonce = value;
            }
          else if (!poole::apply_option (config, arg, value))
            {
              throw std::invalid_argument ("unknown option " + arg);
            }
        }
      if (nonce.empty ())
        {
          throw std::invalid_argument ("--nonce is required");
        }
      poole::validate_config (config);
    }
  catch (const std::logic_error &e)
    {
      poole::log_error (e.what ());
      print_usage (argv[0]);
      return 1;
    }

  poole::set_verbose (config.verbose);
  curl_global_init (CURL_GLOBAL_DEFAULT);

  int rc = 0;
  try
    {
      poole::RpcLedgerClient ledger (config.base_url,
                                     config.http_timeout_seconds);
      poole::ConfirmationAuditor auditor (ledger);
      poole::DepthReport report = auditor.check_depth (nonce);

      switch (report.status)
        {
        case poole::DepthStatus::Found:
          std::cout << "nonce=" << nonce
                    << "\n  mined_in_block_index=" << report.block_index
                    << "\n  head_index=" << report.head_index
                    << "\n  confirmations=" << report.confirmations
                    << std::endl;
          break;
        case poole::DepthStatus::NotFound:
          std::cout << "nonce=" << nonce
                    << " not found in mined blocks (may still be "
                       "queued/expired)"
                    << std::endl;
          break;
        case poole::DepthStatus::Indeterminate:
          std::cout << "nonce=" << nonce
                    << " not found in the blocks that could be fetched; "
                       "chain walk was incomplete, result indeterminate"
                    << std::endl;
          break;
        }
    }
  catch (const poole::LedgerError &e)
    {
      poole::log_error (std::string ("Ledger request failed: ") + e.what ());
      rc = 2;
    }

  curl_global_cleanup ();
  return rc;
}
