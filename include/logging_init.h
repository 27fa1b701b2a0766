// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace kiosk {
namespace logging {

/**
 * @brief Where log output goes in addition to the console
 */
enum class LogTarget {
    Auto,    ///< Journal if systemd is present, else syslog (Linux) or console only
    Journal, ///< systemd journal
    Syslog,  ///< syslog(3)
    File,    ///< Rotating file
    Console, ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< File target only; empty picks /var/log or XDG data dir
};

/**
 * @brief Install the default "kiosk" logger with console + system sinks
 *
 * Also enables a 32-message backtrace buffer.
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn"/"warning",
 *        "error", "critical", "off"), case sensitive
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/**
 * @brief Map repeated -v flags to a level: 0 warn, 1 info, 2 debug, 3+ trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief CLI verbosity beats the config level, which beats the default
 *
 * @param cli_verbosity Count of -v flags
 * @param config_level Level string from /logging/level (may be empty)
 * @param replay_mode Default to debug instead of warn (kiosk-replay)
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level,
                                            bool replay_mode);

LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace kiosk
