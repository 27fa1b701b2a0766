// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for kiosk-replay
 */

#include <cstdint>
#include <string>

namespace kiosk {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path = "config/kiosk.json";
    std::string script_path;   ///< Required: JSON replay script
    int verbosity = 0;         ///< Count of -v flags
    std::string log_target;    ///< Empty = use /logging/target from config
    int64_t duration_ms = -1;  ///< -1 = run until the last scripted event settles
    bool help_shown = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help was shown or an error occurred
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace kiosk
