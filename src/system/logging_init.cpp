// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#ifdef KIOSK_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace kiosk {
namespace logging {

namespace {

constexpr const char* LOGGER_NAME = "kiosk";
constexpr const char* SYSTEM_IDENT = "kiosk-core";
constexpr size_t LOG_FILE_MAX_BYTES = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;
constexpr size_t BACKTRACE_MESSAGES = 32;

struct TargetName {
    LogTarget target;
    const char* name;
};

constexpr TargetName TARGET_NAMES[] = {
    {LogTarget::Auto, "auto"},       {LogTarget::Journal, "journal"}, {LogTarget::Syslog, "syslog"},
    {LogTarget::File, "file"},       {LogTarget::Console, "console"},
};

/// Directory of path exists and its owner may write to it
bool directory_accepts_writes(const std::filesystem::path& path) {
    std::filesystem::path dir = path.parent_path().empty() ? "." : path.parent_path();
    std::error_code ec;
    auto status = std::filesystem::status(dir, ec);
    if (ec || !std::filesystem::is_directory(status)) {
        return false;
    }
    return (status.permissions() & std::filesystem::perms::owner_write) !=
           std::filesystem::perms::none;
}

/// $XDG_DATA_HOME/kiosk-core, falling back to ~/.local/share/kiosk-core and /tmp/kiosk-core
std::filesystem::path user_log_dir() {
    std::filesystem::path base = "/tmp";
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && xdg[0] != '\0') {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && home[0] != '\0') {
        base = std::filesystem::path(home) / ".local" / "share";
    }
    return base / SYSTEM_IDENT;
}

/// Explicit path wins; a system-wide kiosk logs to /var/log, a user session to its data dir
std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    const std::filesystem::path system_log = "/var/log/kiosk-core.log";
    if (directory_accepts_writes(system_log)) {
        return system_log.string();
    }

    std::filesystem::path dir = user_log_dir();
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return (dir / "kiosk.log").string();
}

/// Kiosks normally run as a systemd unit; bare Linux gets syslog, anything else the console
LogTarget detect_best_target() {
#if defined(__linux__) && defined(KIOSK_HAS_SYSTEMD)
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
#ifdef __linux__
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
    case LogTarget::Journal:
#if defined(__linux__) && defined(KIOSK_HAS_SYSTEMD)
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(SYSTEM_IDENT);
#else
        // Built without libsystemd: syslog lands in the journal anyway
        [[fallthrough]];
#endif
    case LogTarget::Syslog:
#ifdef __linux__
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(SYSTEM_IDENT, LOG_PID, LOG_USER,
                                                               false);
#else
        return nullptr;
#endif
    case LogTarget::File:
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            resolve_log_file_path(file_path), LOG_FILE_MAX_BYTES, LOG_FILE_COUNT);
    case LogTarget::Console:
    case LogTarget::Auto:
        break;
    }
    return nullptr;
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    std::string sink_error;
    try {
        if (auto sink = make_target_sink(effective_target, config.file_path)) {
            sinks.push_back(std::move(sink));
        }
    } catch (const spdlog::spdlog_ex& e) {
        sink_error = e.what();
        effective_target = LogTarget::Console;
        if (sinks.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);
    spdlog::enable_backtrace(BACKTRACE_MESSAGES);

    if (!sink_error.empty()) {
        spdlog::warn("[Logging] {} sink unavailable, console only: {}",
                     log_target_name(config.target), sink_error);
    }
    spdlog::debug("[Logging] Initialized: target={}, console={}, backtrace={} messages",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no",
                  BACKTRACE_MESSAGES);
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity >= 3)
        return spdlog::level::trace;
    if (verbosity == 2)
        return spdlog::level::debug;
    if (verbosity == 1)
        return spdlog::level::info;
    return spdlog::level::warn;
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level,
                                            bool replay_mode) {
    if (cli_verbosity > 0) {
        return verbosity_to_level(cli_verbosity);
    }
    const auto fallback = replay_mode ? spdlog::level::debug : spdlog::level::warn;
    if (!config_level.empty()) {
        return parse_level(config_level, fallback);
    }
    return fallback;
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& entry : TARGET_NAMES) {
        if (str == entry.name) {
            return entry.target;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& entry : TARGET_NAMES) {
        if (entry.target == target) {
            return entry.name;
        }
    }
    return "unknown";
}

} // namespace logging
} // namespace kiosk
