// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "activation_machine.h"
#include "scheduler.h"

#include <optional>

namespace kiosk {

/**
 * @brief Hidden-settings configuration
 */
struct GestureActivationConfig : ActivationConfig {
    std::optional<int> corner_radius;    ///< px, default 100
    std::optional<int> touch_timeout_ms; ///< max gap between steps, default 3000
    bool debug_mode = false;             ///< Log every corner classification at info
};

/**
 * @brief Parse {"view", "transitionConfig", "exitBehavior", "startingViewId",
 *        "cornerTouchRadius", "touchTimeout", "debugMode"}
 * @throws ValidationError on malformed fields
 */
GestureActivationConfig gesture_config_from_json(const json& j);

enum class Corner { None, TopLeft, TopRight, BottomRight };

const char* corner_name(Corner corner);

/**
 * @brief Three-corner touch recognizer (top-left, top-right, bottom-right)
 *
 * Each step must land in the expected corner zone within touch_timeout_ms of
 * the previous step. Touches closer than DEBOUNCE_MS to the previous accepted
 * touch are dropped as duplicates of one physical press.
 */
class GestureSequenceMachine : public ActivationMachine {
  public:
    static constexpr int DEFAULT_CORNER_RADIUS = 100;
    static constexpr int DEFAULT_TOUCH_TIMEOUT_MS = 3000;
    static constexpr uint64_t DEBOUNCE_MS = 50;
    static constexpr int DEFAULT_TRANSITION_MS = 500;

    GestureSequenceMachine(Orchestrator& orchestrator, NavigationCoordinator& navigation);
    ~GestureSequenceMachine() override;

    /**
     * @brief Validate and install a config, replacing any previous registration
     * @throws ValidationError
     */
    void register_config(const GestureActivationConfig& config);

    /**
     * @brief Feed one pointer-down at viewport coordinates
     */
    void handle_pointer_down(double x, double y);

    /**
     * @brief Classify a point against the corner zones of the current viewport
     */
    Corner detect_corner(double x, double y) const;

    void set_viewport_size(int width, int height);

    void force_activate();
    void reset_sequence();

    /// Number of corners matched so far (0..2)
    int step() const {
        return step_;
    }

    int corner_radius() const {
        return config_.corner_radius.value_or(DEFAULT_CORNER_RADIUS);
    }

    int touch_timeout_ms() const {
        return config_.touch_timeout_ms.value_or(DEFAULT_TOUCH_TIMEOUT_MS);
    }

  protected:
    void register_from_json(const json& config) override;

  private:
    Corner expected_corner() const;
    void subscribe_input();

    GestureActivationConfig config_;
    int viewport_width_ = 800;
    int viewport_height_ = 480;

    int step_ = 0;
    uint64_t last_step_ms_ = 0;
    std::optional<uint64_t> last_event_ms_;
    TimerGuard sequence_timer_;
};

} // namespace kiosk
