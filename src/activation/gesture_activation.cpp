// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gesture_activation.h"

#include <spdlog/spdlog.h>

namespace kiosk {

GestureActivationConfig gesture_config_from_json(const json& j) {
    if (!j.is_object()) {
        throw ValidationError("gesture activation config must be an object");
    }

    GestureActivationConfig config;
    try {
        config.view_id = j.value("view", "");
        if (j.contains("transitionConfig")) {
            config.transition = transition_config_from_json(j["transitionConfig"]);
        }
        if (j.contains("exitBehavior") && !j["exitBehavior"].is_null()) {
            config.exit_behavior = parse_exit_behavior(j["exitBehavior"].get<std::string>());
        }
        if (j.contains("startingViewId") && j["startingViewId"].is_string()) {
            config.starting_view_id = j["startingViewId"].get<std::string>();
        }
        if (j.contains("cornerTouchRadius") && !j["cornerTouchRadius"].is_null()) {
            config.corner_radius = j["cornerTouchRadius"].get<int>();
        }
        if (j.contains("touchTimeout") && !j["touchTimeout"].is_null()) {
            config.touch_timeout_ms = j["touchTimeout"].get<int>();
        }
        config.debug_mode = j.value("debugMode", false);
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Malformed gesture activation config: ") + e.what());
    }
    return config;
}

const char* corner_name(Corner corner) {
    switch (corner) {
    case Corner::TopLeft:
        return "top-left";
    case Corner::TopRight:
        return "top-right";
    case Corner::BottomRight:
        return "bottom-right";
    case Corner::None:
        return "none";
    }
    return "none";
}

GestureSequenceMachine::GestureSequenceMachine(Orchestrator& orchestrator,
                                               NavigationCoordinator& navigation)
    : ActivationMachine(orchestrator, navigation, channels::GESTURE_ACTIVATION, "gesture",
                        "[GestureActivation]"),
      sequence_timer_(orchestrator.scheduler()) {}

GestureSequenceMachine::~GestureSequenceMachine() {
    sequence_timer_.reset();
}

void GestureSequenceMachine::register_config(const GestureActivationConfig& config) {
    validate_common(config);
    if (config.corner_radius && *config.corner_radius <= 0) {
        throw ValidationError("cornerTouchRadius must be greater than 0");
    }
    if (config.touch_timeout_ms && *config.touch_timeout_ms <= 0) {
        throw ValidationError("touchTimeout must be greater than 0");
    }

    if (is_registered()) {
        clear_registration();
        reset_sequence();
    }

    config_ = config;
    install_common(config_,
                   TransitionConfig::animated(TransitionType::Fade, DEFAULT_TRANSITION_MS));
    subscribe_input();
    reset_sequence();

    spdlog::info("[GestureActivation] Registered '{}' (radius: {}px, timeout: {}ms)",
                 config_.view_id, corner_radius(), touch_timeout_ms());
}

void GestureSequenceMachine::register_from_json(const json& config) {
    register_config(gesture_config_from_json(config));
}

void GestureSequenceMachine::subscribe_input() {
    Channel& input = orchestrator_.create_channel(channels::INPUT);
    input_subscriptions_.push_back(
        input.subscribe(events::POINTER_DOWN, [this](const json& detail) {
            if (!detail.contains("x") || !detail.contains("y") || !detail["x"].is_number() ||
                !detail["y"].is_number()) {
                spdlog::warn("[GestureActivation] pointer-down without coordinates");
                return;
            }
            handle_pointer_down(detail["x"].get<double>(), detail["y"].get<double>());
        }));
}

void GestureSequenceMachine::set_viewport_size(int width, int height) {
    viewport_width_ = width;
    viewport_height_ = height;
    spdlog::debug("[GestureActivation] Viewport {}x{}", width, height);
}

Corner GestureSequenceMachine::detect_corner(double x, double y) const {
    const double radius = corner_radius();
    const double width = viewport_width_;
    const double height = viewport_height_;

    if (x < radius && y < radius) {
        return Corner::TopLeft;
    }
    if (x > width - radius && y < radius) {
        return Corner::TopRight;
    }
    if (x > width - radius && y > height - radius) {
        return Corner::BottomRight;
    }
    return Corner::None;
}

Corner GestureSequenceMachine::expected_corner() const {
    switch (step_) {
    case 1:
        return Corner::TopRight;
    case 2:
        return Corner::BottomRight;
    default:
        return Corner::TopLeft;
    }
}

void GestureSequenceMachine::handle_pointer_down(double x, double y) {
    if (!is_registered()) {
        return;
    }

    const uint64_t now = scheduler_.now_ms();
    if (last_event_ms_ && now - *last_event_ms_ < DEBOUNCE_MS) {
        spdlog::trace("[GestureActivation] Ignoring duplicate event within debounce window");
        return;
    }
    last_event_ms_ = now;

    const auto timeout = static_cast<uint64_t>(touch_timeout_ms());
    if (step_ > 0 && now - last_step_ms_ > timeout) {
        spdlog::trace("[GestureActivation] Touch sequence timed out, resetting");
        reset_sequence();
    }

    Corner corner = detect_corner(x, y);
    if (config_.debug_mode) {
        spdlog::info("[GestureActivation] Touch ({}, {}) -> {} (step {})", x, y,
                     corner_name(corner), step_);
    }

    if (corner == Corner::None) {
        if (step_ > 0) {
            spdlog::trace("[GestureActivation] Touch outside corner zones, resetting sequence");
            reset_sequence();
        }
        return;
    }

    Corner expected = expected_corner();
    if (corner != expected) {
        spdlog::trace("[GestureActivation] Wrong corner touched: expected {}, got {}",
                      corner_name(expected), corner_name(corner));
        reset_sequence();
        return;
    }

    ++step_;
    last_step_ms_ = now;
    spdlog::trace("[GestureActivation] Correct corner touched: {} (step {}/3)", corner_name(corner),
                  step_);

    if (step_ == 3) {
        spdlog::debug("[GestureActivation] Touch sequence complete");
        activate();
        reset_sequence();
        return;
    }

    // Abandoned sequences reset on their own; one past the timeout so a touch
    // landing exactly on it is still judged by the check above
    sequence_timer_.start_timeout(static_cast<uint32_t>(timeout) + 1, [this]() {
        sequence_timer_.clear();
        if (step_ > 0) {
            spdlog::trace("[GestureActivation] Sequence abandoned, resetting");
            reset_sequence();
        }
    });
}

void GestureSequenceMachine::reset_sequence() {
    step_ = 0;
    last_step_ms_ = 0;
    last_event_ms_.reset();
    sequence_timer_.reset();
}

void GestureSequenceMachine::force_activate() {
    reset_sequence();
    activate();
}

} // namespace kiosk
