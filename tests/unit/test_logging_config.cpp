// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

using namespace kiosk;
using namespace kiosk::logging;

namespace {

/// Silence the default logger once a test that re-initialized logging is done
struct QuietLoggerOnExit {
    ~QuietLoggerOnExit() {
        spdlog::default_logger()->set_level(spdlog::level::off);
    }
};

} // namespace

// ============================================================================
// Level parsing
// ============================================================================

TEST_CASE("parse_level: /logging/level names", "[logging][config]") {
    const std::vector<std::pair<std::string, spdlog::level::level_enum>> names = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn}, {"error", spdlog::level::err},
        {"critical", spdlog::level::critical}, {"off", spdlog::level::off},
    };
    for (const auto& [name, level] : names) {
        INFO("level name: " << name);
        REQUIRE(parse_level(name) == level);
    }
}

TEST_CASE("parse_level: unknown names use the caller's default", "[logging][config]") {
    REQUIRE(parse_level("", spdlog::level::debug) == spdlog::level::debug);
    REQUIRE(parse_level("verbose", spdlog::level::warn) == spdlog::level::warn);
    REQUIRE(parse_level("Debug", spdlog::level::info) == spdlog::level::info);
}

TEST_CASE("verbosity_to_level: repeated -v flags", "[logging][config]") {
    REQUIRE(verbosity_to_level(-1) == spdlog::level::warn);
    REQUIRE(verbosity_to_level(0) == spdlog::level::warn);
    REQUIRE(verbosity_to_level(1) == spdlog::level::info);
    REQUIRE(verbosity_to_level(2) == spdlog::level::debug);
    REQUIRE(verbosity_to_level(3) == spdlog::level::trace);
    REQUIRE(verbosity_to_level(7) == spdlog::level::trace);
}

TEST_CASE("resolve_log_level: kiosk-replay and kiosk defaults", "[logging][config]") {
    SECTION("-vv overrides an error level from the config") {
        REQUIRE(resolve_log_level(2, "error", false) == spdlog::level::debug);
    }

    SECTION("config level applies without -v") {
        REQUIRE(resolve_log_level(0, "trace", false) == spdlog::level::trace);
        REQUIRE(resolve_log_level(0, "warn", true) == spdlog::level::warn);
    }

    SECTION("an unparseable config level keeps the mode default") {
        REQUIRE(resolve_log_level(0, "loud", true) == spdlog::level::debug);
        REQUIRE(resolve_log_level(0, "loud", false) == spdlog::level::warn);
    }

    SECTION("replay runs log debug, the kiosk warn") {
        REQUIRE(resolve_log_level(0, "", true) == spdlog::level::debug);
        REQUIRE(resolve_log_level(0, "", false) == spdlog::level::warn);
        REQUIRE(resolve_log_level(1, "", true) == spdlog::level::info);
    }
}

// ============================================================================
// Targets
// ============================================================================

TEST_CASE("parse_log_target: --log-target values", "[logging][config]") {
    for (LogTarget target : {LogTarget::Auto, LogTarget::Journal, LogTarget::Syslog,
                             LogTarget::File, LogTarget::Console}) {
        REQUIRE(parse_log_target(log_target_name(target)) == target);
    }
    REQUIRE(std::string(log_target_name(LogTarget::Journal)) == "journal");
    REQUIRE(std::string(log_target_name(LogTarget::File)) == "file");
}

TEST_CASE("parse_log_target: anything else means auto", "[logging][config]") {
    REQUIRE(parse_log_target("") == LogTarget::Auto);
    REQUIRE(parse_log_target("stderr") == LogTarget::Auto);
    REQUIRE(parse_log_target("Console") == LogTarget::Auto);
}

// ============================================================================
// init()
// ============================================================================

TEST_CASE("init: console target installs the kiosk logger", "[logging][config]") {
    QuietLoggerOnExit quiet;
    LogConfig config;
    config.level = spdlog::level::debug;
    config.target = LogTarget::Console;

    init(config);

    auto logger = spdlog::default_logger();
    REQUIRE(logger->name() == "kiosk");
    REQUIRE(logger->level() == spdlog::level::debug);
    REQUIRE(logger->sinks().size() == 1);
}

TEST_CASE("init: file target writes to the configured path", "[logging][config]") {
    QuietLoggerOnExit quiet;
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("kiosk_log_test_" + std::to_string(stamp));
    fs::create_directories(dir);
    fs::path log_file = dir / "replay.log";

    LogConfig config;
    config.level = spdlog::level::info;
    config.enable_console = false;
    config.target = LogTarget::File;
    config.file_path = log_file.string();

    init(config);
    spdlog::info("[LoggingTest] file sink check");
    spdlog::default_logger()->flush();

    REQUIRE(spdlog::default_logger()->sinks().size() == 1);
    REQUIRE(fs::exists(log_file));
    REQUIRE(fs::file_size(log_file) > 0);

    spdlog::default_logger()->set_level(spdlog::level::off);
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("kiosk"));
    std::error_code ec;
    fs::remove_all(dir, ec);
}
