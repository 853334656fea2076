// SPDX-License-Identifier: MIT
// Poole Client - Status Logging Implementation
// Copyright (c) 2024-2026 Poole Contributors

#include "poole/log.hpp"
#include <atomic>
#include <iostream>

namespace poole
{

namespace
{
std::atomic<bool> g_verbose{ false };
}

void
set_verbose (bool verbose)
{
  g_verbose = verbose;
}

bool
is_verbose ()
{
  return g_verbose;
}

void
log_info (const std::string &message)
{
  std::cout << "[INFO] " << message << std::endl;
}

void
log_warn (const std::string &message)
{
  std::cerr << "[WARN] " << message << std::endl;
}

void
log_error (const std::string &message)
{
  std::cerr << "[ERROR] " << message << std::endl;
}

void
log_debug (const std::string &message)
{
  if (g_verbose)
    {
      std::cout << "[DEBUG] " << message << std::endl;
    }
}

} // namespace poole
