// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "activation_machine.h"
#include "scheduler.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kiosk {

/**
 * @brief Screensaver configuration
 */
struct IdleActivationConfig : ActivationConfig {
    double timeout_seconds = 0;                           ///< (0, MAX_TIMEOUT_SECONDS]
    std::optional<std::vector<std::string>> activity_events; ///< Unset: default list
    std::vector<std::string> exclude_selectors;           ///< "#id", ".class" or bare tag
    std::function<bool()> blocker;                        ///< true vetoes activation
    std::optional<double> maintenance_threshold_minutes;  ///< Unset: no maintenance
    std::function<void()> on_maintenance;
};

/**
 * @brief One user-activity report (input channel "activity" event)
 */
struct ActivityEvent {
    std::string type;
    std::string target_id;
    std::vector<std::string> classes;
    std::string tag;
};

/**
 * @brief Parse {"view", "timeoutSeconds", "transitionConfig", "exitBehavior",
 *        "startingViewId", "activityEvents", "excludeSelectors", "maintenanceTimeoutMinutes"}
 *
 * Callbacks cannot be expressed in JSON and stay empty.
 * @throws ValidationError on malformed fields
 */
IdleActivationConfig idle_config_from_json(const json& j);

/**
 * @brief Whether an activity target matches a "#id", ".class" or tag selector
 */
bool activity_matches_selector(const ActivityEvent& event, const std::string& selector);

/**
 * @brief Idle-timeout screensaver
 *
 * Inactive: qualifying activity restarts the idle timer; when it fires
 * (and the blocker does not veto) the screensaver view is activated.
 * Active: qualifying activity exits to the return/reset target. While Active
 * a maintenance check runs every MAINTENANCE_CHECK_INTERVAL_MS.
 *
 * Input arrives on the "input" channel (activity, visibility-changed) or
 * through handle_activity()/handle_visibility_change().
 */
class IdleActivationMachine : public ActivationMachine {
  public:
    static constexpr uint32_t MAINTENANCE_CHECK_INTERVAL_MS = 600000;
    /// Longest timeout a scheduler delay can hold
    static constexpr double MAX_TIMEOUT_SECONDS = UINT32_MAX / 1000;

    static const std::vector<std::string>& default_activity_events();

    IdleActivationMachine(Orchestrator& orchestrator, NavigationCoordinator& navigation);
    ~IdleActivationMachine() override;

    /**
     * @brief Validate and install a config, replacing any previous registration
     * @throws ValidationError
     */
    void register_config(const IdleActivationConfig& config);

    void handle_activity(const ActivityEvent& event);
    void handle_visibility_change(bool hidden);

    /**
     * @brief Activate now, bypassing the idle timer (the blocker still applies)
     */
    void force_activate();

    /**
     * @brief Restart the idle countdown (ignored while Active)
     */
    void reset_timer();

    bool idle_timer_armed() const {
        return idle_timer_.armed();
    }

    bool maintenance_armed() const {
        return maintenance_timer_.armed();
    }

    const IdleActivationConfig& config() const {
        return config_;
    }

  protected:
    bool defer_activation() override;
    void on_activated() override;
    void on_activation_rolled_back() override;
    void on_deactivating() override;
    void on_deactivated() override;
    void on_exit_without_target() override;
    void on_view_tracked() override;
    void register_from_json(const json& config) override;

  private:
    void restart_idle_timer();
    void pause_idle_timer();
    bool is_qualifying(const ActivityEvent& event) const;
    void start_maintenance();
    void stop_maintenance();
    void check_maintenance();
    void subscribe_input();

    IdleActivationConfig config_;
    TimerGuard idle_timer_;
    TimerGuard maintenance_timer_;
};

} // namespace kiosk
