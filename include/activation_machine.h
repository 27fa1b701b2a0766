// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file activation_machine.h
 * @brief Shared Inactive/Active protocol for views entered by a trigger
 *
 * @pattern Template method: subclasses supply the trigger (idle timeout, corner
 *          gesture) and hooks; the base runs activation, exit and rollback
 * @threading Main thread only
 * @gotchas Transition results arrive asynchronously. A request coalesced away by a
 *          newer one (SUPERSEDED) is not a failure and never rolls state back.
 */

#pragma once

#include "kiosk_error.h"
#include "navigation_coordinator.h"
#include "orchestrator.h"
#include "subscription.h"
#include "transition_config.h"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kiosk {

enum class ExitBehavior {
    Reset,  ///< Leave to the configured starting view
    Return, ///< Leave to the view that was current before activation
};

const char* exit_behavior_name(ExitBehavior behavior);

/**
 * @throws ValidationError for anything but "reset" / "return"
 */
ExitBehavior parse_exit_behavior(const std::string& name);

/**
 * @brief Fields shared by idle and gesture activation
 */
struct ActivationConfig {
    std::string view_id;                      ///< Required
    VisualElement* view_element = nullptr;    ///< Registered directly when set, else by id
    std::optional<TransitionConfig> transition;
    std::optional<ExitBehavior> exit_behavior; ///< Unset means reset
    std::optional<std::string> starting_view_id; ///< Required when exit_behavior is explicitly reset
    std::function<void()> on_activate;
    std::function<void()> on_deactivate;
};

class ActivationMachine {
  public:
    virtual ~ActivationMachine();

    ActivationMachine(const ActivationMachine&) = delete;
    ActivationMachine& operator=(const ActivationMachine&) = delete;

    bool is_active() const {
        return active_;
    }

    bool is_registered() const {
        return registered_;
    }

    /**
     * @brief View that was current before the last activation (or last tracked change)
     */
    const std::optional<std::string>& last_active_view_id() const {
        return last_active_view_id_;
    }

    /**
     * @brief Leave the activated view now (no-op when inactive)
     */
    void force_deactivate();

    /// "idle", "gesture"
    const std::string& state_prefix() const {
        return state_prefix_;
    }

  protected:
    /**
     * @param channel_name Channel carrying register/activate/deactivate and notifications
     * @param state_prefix Prefix of the isActive / lastActiveViewId state keys
     * @param log_tag Prefix for log lines, e.g. "[IdleActivation]"
     */
    ActivationMachine(Orchestrator& orchestrator, NavigationCoordinator& navigation,
                      const std::string& channel_name, std::string state_prefix,
                      std::string log_tag);

    /**
     * @brief Shared validation (view required, exit behavior rules)
     * @throws ValidationError
     */
    void validate_common(const ActivationConfig& config) const;

    /**
     * @brief Store the common config with defaults applied and register the view
     */
    void install_common(const ActivationConfig& config, const TransitionConfig& default_transition);

    /**
     * @brief Forget the current registration and clear Active
     */
    void clear_registration();

    /**
     * @brief Run the activation protocol
     */
    void activate();

    /**
     * @brief Run the exit protocol
     */
    void deactivate();

    // Hooks
    virtual bool defer_activation() {
        return false;
    }
    virtual void on_activated() {}
    virtual void on_activation_rolled_back() {}
    virtual void on_deactivating() {}
    virtual void on_deactivated() {}
    virtual void on_exit_without_target() {}
    virtual void on_view_tracked() {}

    /**
     * @brief Parse and apply a config received as a channel "register" event
     */
    virtual void register_from_json(const json& config) = 0;

    const ActivationConfig& common() const {
        return common_;
    }

    void publish_if_observed(const char* event_name, const json& detail);

    Orchestrator& orchestrator_;
    NavigationCoordinator& navigation_;
    Scheduler& scheduler_;
    StateStore& state_;
    Channel& channel_;
    std::string log_tag_;
    std::vector<Subscription> input_subscriptions_; ///< Rebuilt on every registration

  private:
    void set_active(bool active);
    void set_last_active(const std::string& view_id);
    void handle_view_changed(const json& detail);

    std::string state_prefix_;
    ActivationConfig common_;
    bool registered_ = false;
    bool active_ = false;
    std::optional<std::string> last_active_view_id_;
    uint64_t generation_ = 0; ///< Bumped per activate/deactivate, stale results are ignored
    std::vector<Subscription> subscriptions_;
    SubscriptionLifetime alive_ = std::make_shared<bool>(true);
};

} // namespace kiosk
