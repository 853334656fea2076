// SPDX-License-Identifier: MIT
// Poole Client - Status Logging
// Copyright (c) 2024-2026 Poole Contributors

#pragma once

#include <string>

namespace poole
{

/// Enable or disable [DEBUG] output
void set_verbose (bool verbose);
bool is_verbose ();

/// Status lines: INFO and DEBUG go to stdout, WARN and ERROR to stderr
void log_info (const std::string &message);
void log_warn (const std::string &message);
void log_error (const std::string &message);
void log_debug (const std::string &message);

} // namespace poole
