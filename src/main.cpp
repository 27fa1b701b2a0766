// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief kiosk-replay: drive a headless kiosk from a scripted input timeline
 *
 * Script format:
 * ```json
 * {
 *   "events": [
 *     {"at": 0,    "event": "pointer-down", "detail": {"x": 5, "y": 5}},
 *     {"at": 400,  "event": "activity", "detail": {"type": "touchstart"}},
 *     {"at": 900,  "event": "navigate-view", "detail": {"id": "menu",
 *                  "transition": {"type": "fade", "duration": 300}}},
 *     {"at": 2000, "event": "visibility-changed", "detail": {"hidden": true}}
 *   ]
 * }
 * ```
 * "navigate-page" / "navigate-view" request transitions; every other event
 * is published on the input channel. Time is virtual and advances one
 * orchestrator tick at a time.
 */

#include "cli_args.h"
#include "config.h"
#include "kiosk_app.h"
#include "kiosk_error.h"
#include "logging_init.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <vector>

using namespace kiosk;

namespace {

/// Virtual time left after the last scripted event for transitions to settle
constexpr uint64_t SETTLE_MS = 2000;

struct ScriptEvent {
    uint64_t at_ms = 0;
    std::string event;
    json detail;
};

std::vector<ScriptEvent> load_script(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw ValidationError("Cannot open script " + path);
    }

    json root;
    try {
        root = json::parse(in);
    } catch (const json::exception& e) {
        throw ValidationError("Malformed script " + path + ": " + e.what());
    }

    const json& list = root.is_object() && root.contains("events") ? root["events"] : root;
    if (!list.is_array()) {
        throw ValidationError("Script must be an array of events or {\"events\": [...]}");
    }

    std::vector<ScriptEvent> events;
    for (const auto& entry : list) {
        if (!entry.is_object() || !entry.contains("event") || !entry["event"].is_string()) {
            throw ValidationError("Every script entry needs an \"event\" name");
        }
        ScriptEvent ev;
        try {
            ev.at_ms = entry.value("at", uint64_t{0});
            ev.event = entry["event"].get<std::string>();
            ev.detail = entry.value("detail", json::object());
        } catch (const json::exception& e) {
            throw ValidationError("Malformed script entry: " + std::string(e.what()));
        }
        if (!ev.detail.is_object()) {
            throw ValidationError("Script entry \"detail\" must be an object");
        }
        events.push_back(std::move(ev));
    }
    std::stable_sort(events.begin(), events.end(),
                     [](const ScriptEvent& a, const ScriptEvent& b) { return a.at_ms < b.at_ms; });
    return events;
}

void deliver(KioskApp& app, const ScriptEvent& ev) {
    auto on_error = [event = ev.event](const KioskError& error) {
        spdlog::warn("[Replay] {} failed: {}", event, error.message);
    };

    if (ev.event == "navigate-page" || ev.event == "navigate-view") {
        std::string id = ev.detail.value("id", "");
        TransitionConfig transition;
        if (ev.detail.contains("transition")) {
            transition = transition_config_from_json(ev.detail["transition"]);
        }
        if (ev.event == "navigate-page") {
            app.navigate_to_page(id, transition, nullptr, on_error);
        } else {
            app.navigate_to_view(id, transition, nullptr, on_error);
        }
        return;
    }

    if (!app.publish_input(ev.event, ev.detail)) {
        spdlog::debug("[Replay] Input '{}' had no listener", ev.event);
    }
}

std::vector<Subscription> observe(KioskApp& app, const uint64_t& now) {
    std::vector<Subscription> subs;
    auto log_event = [&now](const char* channel, const char* event) {
        return [&now, channel, event](const json& detail) {
            spdlog::info("[Replay] t={}ms {}:{} {}", now, channel, event, detail.dump());
        };
    };

    Orchestrator& orch = app.orchestrator();
    Channel& nav = orch.create_channel(channels::NAVIGATION);
    for (const char* event : {events::PAGE_CHANGED, events::VIEW_CHANGED, events::VIEW_RE_ENTERED}) {
        subs.push_back(nav.subscribe(event, log_event(channels::NAVIGATION, event)));
    }
    for (const char* name : {channels::IDLE_ACTIVATION, channels::GESTURE_ACTIVATION}) {
        Channel& channel = orch.create_channel(name);
        for (const char* event : {events::ACTIVATED, events::DEACTIVATED}) {
            subs.push_back(channel.subscribe(event, log_event(name, event)));
        }
    }
    return subs;
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help_shown ? 0 : 1;
    }

    Config config;
    // Config logs before logging::init; keep those quiet unless asked for
    spdlog::set_level(logging::verbosity_to_level(args.verbosity));
    config.init(args.config_path);

    logging::LogConfig log_config;
    log_config.level = logging::resolve_log_level(
        args.verbosity, config.get<std::string>("/logging/level", ""), true);
    log_config.target = logging::parse_log_target(
        args.log_target.empty() ? config.get<std::string>("/logging/target", "auto")
                                : args.log_target);
    log_config.file_path = config.get<std::string>("/logging/file", "");
    logging::init(log_config);

    std::vector<ScriptEvent> script;
    try {
        script = load_script(args.script_path);
    } catch (const ValidationError& e) {
        spdlog::error("[Replay] {}", e.what());
        return 2;
    }

    uint64_t now = 0;
    KioskApp app([&now]() { return now; });
    try {
        app.apply_config(config);
    } catch (const KioskException& e) {
        spdlog::error("[Replay] Invalid configuration: {}", e.what());
        return 2;
    } catch (const json::exception& e) {
        spdlog::error("[Replay] Invalid configuration value: {}", e.what());
        return 2;
    }

    auto subscriptions = observe(app, now);

    uint64_t end_ms = 0;
    if (args.duration_ms >= 0) {
        end_ms = static_cast<uint64_t>(args.duration_ms);
    } else {
        end_ms = (script.empty() ? 0 : script.back().at_ms) + SETTLE_MS;
    }

    spdlog::info("[Replay] {} scripted events over {}ms of virtual time", script.size(), end_ms);

    app.start();
    const uint64_t step = app.tick_interval_ms();
    size_t next = 0;
    while (true) {
        while (next < script.size() && script[next].at_ms <= now) {
            try {
                deliver(app, script[next]);
            } catch (const KioskException& e) {
                spdlog::error("[Replay] Event {} ('{}') rejected: {}", next, script[next].event,
                              e.what());
            } catch (const json::exception& e) {
                spdlog::error("[Replay] Event {} ('{}') malformed: {}", next, script[next].event,
                              e.what());
            }
            ++next;
        }
        app.pump();
        if (now >= end_ms) {
            break;
        }
        now = std::min(now + step, end_ms);
    }
    app.stop();

    auto page = app.navigation().get_current_page_id();
    auto view = app.navigation().get_current_view_id();
    spdlog::info("[Replay] Finished at t={}ms: page={}, view={}, screensaver={}, settings={}", now,
                 page.value_or("-"), view.value_or("-"), app.idle().is_active() ? "on" : "off",
                 app.gesture().is_active() ? "on" : "off");
    printf("page=%s view=%s\n", page.value_or("-").c_str(), view.value_or("-").c_str());
    return 0;
}
