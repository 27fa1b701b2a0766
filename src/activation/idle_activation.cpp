// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "idle_activation.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace kiosk {

namespace {

std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> result;
    if (!j.contains(key)) {
        return result;
    }
    const json& list = j[key];
    if (!list.is_array()) {
        throw ValidationError(std::string(key) + " must be an array of strings");
    }
    for (const auto& item : list) {
        if (!item.is_string()) {
            throw ValidationError(std::string(key) + " must be an array of strings");
        }
        result.push_back(item.get<std::string>());
    }
    return result;
}

} // namespace

// ============================================================================
// Config parsing
// ============================================================================

IdleActivationConfig idle_config_from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("idle activation config must be an object");
    }

    IdleActivationConfig config;
    try {
        config.view_id = j.value("view", "");
        config.timeout_seconds = j.value("timeoutSeconds", 0.0);
        if (j.contains("transitionConfig")) {
            config.transition = transition_config_from_json(j["transitionConfig"]);
        }
        if (j.contains("exitBehavior") && !j["exitBehavior"].is_null()) {
            config.exit_behavior = parse_exit_behavior(j["exitBehavior"].get<std::string>());
        }
        if (j.contains("startingViewId") && j["startingViewId"].is_string()) {
            config.starting_view_id = j["startingViewId"].get<std::string>();
        }
        if (j.contains("activityEvents")) {
            config.activity_events = string_list(j, "activityEvents");
        }
        config.exclude_selectors = string_list(j, "excludeSelectors");
        if (j.contains("maintenanceTimeoutMinutes") && j["maintenanceTimeoutMinutes"].is_number()) {
            config.maintenance_threshold_minutes = j["maintenanceTimeoutMinutes"].get<double>();
        }
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Malformed idle activation config: ") + e.what());
    }
    return config;
}

bool activity_matches_selector(const ActivityEvent& event, const std::string& selector) {
    if (selector.empty()) {
        return false;
    }
    if (selector[0] == '#') {
        return !event.target_id.empty() && event.target_id == selector.substr(1);
    }
    if (selector[0] == '.') {
        std::string name = selector.substr(1);
        return std::find(event.classes.begin(), event.classes.end(), name) != event.classes.end();
    }
    return !event.tag.empty() && event.tag == selector;
}

// ============================================================================
// Machine
// ============================================================================

const std::vector<std::string>& IdleActivationMachine::default_activity_events() {
    static const std::vector<std::string> events = {
        "mousemove", "mousedown", "click", "keydown", "keypress",
        "touchstart", "touchmove", "wheel", "scroll",
    };
    return events;
}

IdleActivationMachine::IdleActivationMachine(Orchestrator& orchestrator,
                                             NavigationCoordinator& navigation)
    : ActivationMachine(orchestrator, navigation, channels::IDLE_ACTIVATION, "idle",
                        "[IdleActivation]"),
      idle_timer_(orchestrator.scheduler()), maintenance_timer_(orchestrator.scheduler()) {
    state_.init_if_absent(state_keys::LAST_MAINTENANCE, scheduler_.now_ms());
}

IdleActivationMachine::~IdleActivationMachine() {
    idle_timer_.reset();
    maintenance_timer_.reset();
}

void IdleActivationMachine::register_config(const IdleActivationConfig& config) {
    validate_common(config);
    if (!(config.timeout_seconds > 0)) {
        throw ValidationError("timeoutSeconds must be greater than 0");
    }
    if (config.timeout_seconds > MAX_TIMEOUT_SECONDS) {
        throw ValidationError(fmt::format("timeoutSeconds must not exceed {}", MAX_TIMEOUT_SECONDS));
    }
    if (config.maintenance_threshold_minutes && *config.maintenance_threshold_minutes <= 0) {
        throw ValidationError("maintenanceTimeoutMinutes must be greater than 0");
    }

    if (is_registered()) {
        idle_timer_.reset();
        stop_maintenance();
        clear_registration();
    }

    config_ = config;
    if (!config_.activity_events) {
        config_.activity_events = default_activity_events();
    }
    install_common(config_, TransitionConfig::snap());

    subscribe_input();
    restart_idle_timer();

    spdlog::info("[IdleActivation] Registered '{}' with {}s timeout and '{}' exit behavior",
                 config_.view_id, config_.timeout_seconds,
                 exit_behavior_name(common().exit_behavior.value_or(ExitBehavior::Reset)));
}

void IdleActivationMachine::register_from_json(const json& config) {
    register_config(idle_config_from_json(config));
}

void IdleActivationMachine::subscribe_input() {
    Channel& input = orchestrator_.create_channel(channels::INPUT);
    input_subscriptions_.push_back(input.subscribe(events::ACTIVITY, [this](const json& detail) {
        ActivityEvent event;
        event.type = detail.value("type", "");
        event.target_id = detail.value("targetId", "");
        event.tag = detail.value("tag", "");
        if (detail.contains("classes") && detail["classes"].is_array()) {
            for (const auto& c : detail["classes"]) {
                if (c.is_string()) {
                    event.classes.push_back(c.get<std::string>());
                }
            }
        }
        handle_activity(event);
    }));
    input_subscriptions_.push_back(
        input.subscribe(events::VISIBILITY_CHANGED, [this](const json& detail) {
            handle_visibility_change(detail.value("hidden", false));
        }));
}

bool IdleActivationMachine::is_qualifying(const ActivityEvent& event) const {
    const auto& types = *config_.activity_events;
    if (std::find(types.begin(), types.end(), event.type) == types.end()) {
        return false;
    }
    for (const auto& selector : config_.exclude_selectors) {
        if (activity_matches_selector(event, selector)) {
            spdlog::trace("[IdleActivation] '{}' ignored (matches '{}')", event.type, selector);
            return false;
        }
    }
    return true;
}

void IdleActivationMachine::handle_activity(const ActivityEvent& event) {
    if (!is_registered() || !is_qualifying(event)) {
        return;
    }
    if (is_active()) {
        deactivate();
    } else {
        restart_idle_timer();
    }
}

void IdleActivationMachine::handle_visibility_change(bool hidden) {
    if (!is_registered()) {
        return;
    }
    if (hidden) {
        pause_idle_timer();
    } else {
        restart_idle_timer();
    }
}

void IdleActivationMachine::restart_idle_timer() {
    if (!is_registered()) {
        return;
    }
    auto delay_ms = static_cast<uint32_t>(std::llround(config_.timeout_seconds * 1000.0));
    idle_timer_.start_timeout(delay_ms, [this]() {
        idle_timer_.clear();
        activate();
    });
    spdlog::trace("[IdleActivation] Activity timer reset for {} seconds", config_.timeout_seconds);
}

void IdleActivationMachine::pause_idle_timer() {
    idle_timer_.reset();
    spdlog::trace("[IdleActivation] Activity timer paused");
}

void IdleActivationMachine::force_activate() {
    idle_timer_.reset();
    activate();
}

void IdleActivationMachine::reset_timer() {
    if (!is_active()) {
        restart_idle_timer();
    }
}

bool IdleActivationMachine::defer_activation() {
    if (config_.blocker && config_.blocker()) {
        restart_idle_timer();
        return true;
    }
    return false;
}

void IdleActivationMachine::on_activated() {
    start_maintenance();
    check_maintenance();
}

void IdleActivationMachine::on_activation_rolled_back() {
    stop_maintenance();
    restart_idle_timer();
}

void IdleActivationMachine::on_deactivating() {
    stop_maintenance();
}

void IdleActivationMachine::on_deactivated() {
    restart_idle_timer();
}

void IdleActivationMachine::on_exit_without_target() {
    restart_idle_timer();
}

void IdleActivationMachine::on_view_tracked() {
    restart_idle_timer();
}

// ============================================================================
// Maintenance
// ============================================================================

void IdleActivationMachine::start_maintenance() {
    if (!config_.maintenance_threshold_minutes) {
        return;
    }
    maintenance_timer_.start_interval(MAINTENANCE_CHECK_INTERVAL_MS,
                                      [this]() { check_maintenance(); });
    spdlog::debug("[IdleActivation] Maintenance check interval started");
}

void IdleActivationMachine::stop_maintenance() {
    if (maintenance_timer_.armed()) {
        maintenance_timer_.reset();
        spdlog::debug("[IdleActivation] Maintenance check interval stopped");
    }
}

void IdleActivationMachine::check_maintenance() {
    if (!is_active() || !config_.maintenance_threshold_minutes) {
        return;
    }

    uint64_t now = scheduler_.now_ms();
    if (!state_.has(state_keys::LAST_MAINTENANCE)) {
        state_.set(state_keys::LAST_MAINTENANCE, now);
        return;
    }
    auto last = state_.get<uint64_t>(state_keys::LAST_MAINTENANCE, now);
    double elapsed_minutes = now > last ? static_cast<double>(now - last) / 60000.0 : 0.0;
    if (elapsed_minutes < *config_.maintenance_threshold_minutes) {
        return;
    }

    spdlog::info("[IdleActivation] Maintenance threshold of {} min elapsed",
                 *config_.maintenance_threshold_minutes);
    if (config_.on_maintenance) {
        try {
            config_.on_maintenance();
        } catch (const std::exception& e) {
            spdlog::error("[IdleActivation] Maintenance callback threw: {}", e.what());
        }
    }
    state_.set(state_keys::LAST_MAINTENANCE, now);
}

} // namespace kiosk
