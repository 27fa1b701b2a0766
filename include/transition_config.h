// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace kiosk {

using json = nlohmann::json;

enum class TransitionType { Slide, Fade, Scale, Flip, Snap, Custom };

enum class TransitionDirection { Left, Right, Up, Down };

/**
 * @brief How a page or view change is animated
 *
 * Every field except type is optional. An absent type, or an animated type
 * (slide/fade/scale/flip) without a positive duration, normalizes to snap.
 */
struct TransitionConfig {
    std::optional<TransitionType> type;
    std::optional<TransitionDirection> direction;
    std::optional<int> duration_ms;
    std::optional<std::string> easing;
    std::optional<std::string> custom_style; ///< "property: value; ..." applied by custom type

    static TransitionConfig snap() {
        TransitionConfig config;
        config.type = TransitionType::Snap;
        return config;
    }

    static TransitionConfig animated(TransitionType t, int duration) {
        TransitionConfig config;
        config.type = t;
        config.duration_ms = duration;
        return config;
    }

    bool is_snap() const {
        return type == TransitionType::Snap;
    }

    bool operator==(const TransitionConfig& other) const {
        return type == other.type && direction == other.direction &&
               duration_ms == other.duration_ms && easing == other.easing &&
               custom_style == other.custom_style;
    }

    bool operator!=(const TransitionConfig& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Fall back to snap for configs that cannot be animated
 *
 * Logs a warning whenever the config is replaced.
 */
TransitionConfig normalize_transition_config(const TransitionConfig& config);

const char* transition_type_name(TransitionType type);
const char* transition_direction_name(TransitionDirection direction);

/**
 * @throws ValidationError for unknown names
 */
TransitionType parse_transition_type(const std::string& name);
TransitionDirection parse_transition_direction(const std::string& name);

/**
 * @brief Parse {"type", "direction", "duration", "easing", "customStyle"}
 *
 * Missing keys stay unset. Null or non-object input yields an empty config.
 * @throws ValidationError on unknown type/direction strings
 */
TransitionConfig transition_config_from_json(const json& j);

json transition_config_to_json(const TransitionConfig& config);

} // namespace kiosk
