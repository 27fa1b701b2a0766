// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "transition_config.h"

#include "kiosk_error.h"

#include <spdlog/spdlog.h>

namespace kiosk {

TransitionConfig normalize_transition_config(const TransitionConfig& config) {
    if (!config.type) {
        spdlog::warn("[Transition] Invalid transition config, falling back to snap navigation");
        return TransitionConfig::snap();
    }

    TransitionType type = *config.type;
    if (type != TransitionType::Snap && type != TransitionType::Custom) {
        if (!config.duration_ms || *config.duration_ms <= 0) {
            spdlog::warn("[Transition] Invalid duration for {} transition, falling back to snap "
                         "navigation",
                         transition_type_name(type));
            return TransitionConfig::snap();
        }
    }
    return config;
}

const char* transition_type_name(TransitionType type) {
    switch (type) {
    case TransitionType::Slide:
        return "slide";
    case TransitionType::Fade:
        return "fade";
    case TransitionType::Scale:
        return "scale";
    case TransitionType::Flip:
        return "flip";
    case TransitionType::Snap:
        return "snap";
    case TransitionType::Custom:
        return "custom";
    }
    return "snap";
}

const char* transition_direction_name(TransitionDirection direction) {
    switch (direction) {
    case TransitionDirection::Left:
        return "left";
    case TransitionDirection::Right:
        return "right";
    case TransitionDirection::Up:
        return "up";
    case TransitionDirection::Down:
        return "down";
    }
    return "left";
}

TransitionType parse_transition_type(const std::string& name) {
    if (name == "slide")
        return TransitionType::Slide;
    if (name == "fade")
        return TransitionType::Fade;
    if (name == "scale")
        return TransitionType::Scale;
    if (name == "flip")
        return TransitionType::Flip;
    if (name == "snap")
        return TransitionType::Snap;
    if (name == "custom")
        return TransitionType::Custom;
    throw ValidationError("Unknown transition type '" + name + "'");
}

TransitionDirection parse_transition_direction(const std::string& name) {
    if (name == "left")
        return TransitionDirection::Left;
    if (name == "right")
        return TransitionDirection::Right;
    if (name == "up")
        return TransitionDirection::Up;
    if (name == "down")
        return TransitionDirection::Down;
    throw ValidationError("Unknown transition direction '" + name + "'");
}

TransitionConfig transition_config_from_json(const json& j) {
    TransitionConfig config;
    if (!j.is_object()) {
        return config;
    }

    try {
        if (j.contains("type") && !j["type"].is_null()) {
            config.type = parse_transition_type(j["type"].get<std::string>());
        }
        if (j.contains("direction") && !j["direction"].is_null()) {
            config.direction = parse_transition_direction(j["direction"].get<std::string>());
        }
        if (j.contains("duration") && j["duration"].is_number()) {
            config.duration_ms = j["duration"].get<int>();
        }
        if (j.contains("easing") && j["easing"].is_string()) {
            config.easing = j["easing"].get<std::string>();
        }
        if (j.contains("customStyle") && j["customStyle"].is_string()) {
            config.custom_style = j["customStyle"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw ValidationError(std::string("Malformed transition config: ") + e.what());
    }
    return config;
}

json transition_config_to_json(const TransitionConfig& config) {
    json j = json::object();
    if (config.type) {
        j["type"] = transition_type_name(*config.type);
    }
    if (config.direction) {
        j["direction"] = transition_direction_name(*config.direction);
    }
    if (config.duration_ms) {
        j["duration"] = *config.duration_ms;
    }
    if (config.easing) {
        j["easing"] = *config.easing;
    }
    if (config.custom_style) {
        j["customStyle"] = *config.custom_style;
    }
    return j;
}

} // namespace kiosk
