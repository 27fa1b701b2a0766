// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "activation_machine.h"

#include <spdlog/spdlog.h>

#include <exception>

namespace kiosk {

const char* exit_behavior_name(ExitBehavior behavior) {
    return behavior == ExitBehavior::Return ? "return" : "reset";
}

ExitBehavior parse_exit_behavior(const std::string& name) {
    if (name == "reset") {
        return ExitBehavior::Reset;
    }
    if (name == "return") {
        return ExitBehavior::Return;
    }
    throw ValidationError("exitBehavior must be either \"reset\" or \"return\"");
}

ActivationMachine::ActivationMachine(Orchestrator& orchestrator, NavigationCoordinator& navigation,
                                     const std::string& channel_name, std::string state_prefix,
                                     std::string log_tag)
    : orchestrator_(orchestrator), navigation_(navigation), scheduler_(orchestrator.scheduler()),
      state_(orchestrator.state()), channel_(orchestrator.create_channel(channel_name)),
      log_tag_(std::move(log_tag)), state_prefix_(std::move(state_prefix)) {
    state_.init_if_absent(state_prefix_ + ".isActive", false);
    state_.init_if_absent(state_prefix_ + ".lastActiveViewId", nullptr);

    subscriptions_.push_back(channel_.subscribe(events::REGISTER, [this](const json& detail) {
        try {
            register_from_json(detail.value("config", json::object()));
        } catch (const ValidationError& e) {
            spdlog::error("{} Registration rejected: {}", log_tag_, e.what());
        }
    }));
    subscriptions_.push_back(
        channel_.subscribe(events::ACTIVATE, [this](const json&) { activate(); }));
    subscriptions_.push_back(
        channel_.subscribe(events::DEACTIVATE, [this](const json&) { deactivate(); }));

    Channel& nav = orchestrator.create_channel(channels::NAVIGATION);
    subscriptions_.push_back(nav.subscribe(
        events::VIEW_CHANGED, [this](const json& detail) { handle_view_changed(detail); }));
}

ActivationMachine::~ActivationMachine() {
    alive_.reset();
}

void ActivationMachine::validate_common(const ActivationConfig& config) const {
    if (config.view_id.empty()) {
        throw ValidationError("view is required");
    }
    if (config.exit_behavior == ExitBehavior::Reset &&
        (!config.starting_view_id || config.starting_view_id->empty())) {
        throw ValidationError("startingViewId is required when exitBehavior is \"reset\"");
    }
}

void ActivationMachine::install_common(const ActivationConfig& config,
                                       const TransitionConfig& default_transition) {
    common_ = config;
    if (!common_.exit_behavior) {
        common_.exit_behavior = ExitBehavior::Reset;
    }
    if (!common_.transition) {
        common_.transition = default_transition;
    }
    registered_ = true;

    if (common_.view_element) {
        navigation_.register_view(common_.view_id, *common_.view_element);
    } else {
        Channel& nav = orchestrator_.create_channel(channels::NAVIGATION);
        nav.publish(events::REGISTER_VIEW, {{"view", common_.view_id}});
    }
}

void ActivationMachine::clear_registration() {
    input_subscriptions_.clear();
    registered_ = false;
    ++generation_;
    set_active(false);
}

void ActivationMachine::set_active(bool active) {
    active_ = active;
    state_.set(state_prefix_ + ".isActive", active);
}

void ActivationMachine::set_last_active(const std::string& view_id) {
    last_active_view_id_ = view_id;
    state_.set(state_prefix_ + ".lastActiveViewId", view_id);
}

void ActivationMachine::handle_view_changed(const json& detail) {
    if (active_) {
        return;
    }
    const json& new_view = detail.contains("newViewId") ? detail["newViewId"] : json();
    if (!new_view.is_string()) {
        return;
    }
    std::string view_id = new_view.get<std::string>();
    if (registered_ && view_id == common_.view_id) {
        return;
    }
    set_last_active(view_id);
    on_view_tracked();
}

void ActivationMachine::activate() {
    if (!registered_ || active_) {
        return;
    }
    if (defer_activation()) {
        spdlog::debug("{} Activation blocked", log_tag_);
        return;
    }

    spdlog::info("{} Activating '{}'", log_tag_, common_.view_id);

    auto current = navigation_.get_current_view_id();
    if (current && *current != common_.view_id) {
        set_last_active(*current);
    }
    set_active(true);

    uint64_t generation = ++generation_;
    std::weak_ptr<bool> alive = alive_;
    const std::string view_id = common_.view_id;

    navigation_.request_view_transition(
        view_id, *common_.transition, PriorityClass::Immediate,
        [this, alive, view_id]() {
            if (alive.expired()) {
                return;
            }
            publish_if_observed(events::ACTIVATED,
                                {{"viewId", view_id},
                                 {"previousViewId", last_active_view_id_
                                                        ? json(*last_active_view_id_)
                                                        : json(nullptr)}});
        },
        [this, alive, generation](const KioskError& error) {
            if (alive.expired()) {
                return;
            }
            if (error.type == KioskErrorType::SUPERSEDED) {
                spdlog::debug("{} Activation request superseded", log_tag_);
                return;
            }
            spdlog::error("{} Failed to activate: {}", log_tag_, error.message);
            if (generation == generation_ && active_) {
                set_active(false);
                on_activation_rolled_back();
            }
        });

    if (common_.on_activate) {
        try {
            common_.on_activate();
        } catch (const std::exception& e) {
            spdlog::error("{} Activate callback threw: {}", log_tag_, e.what());
        }
    }
    on_activated();
}

void ActivationMachine::deactivate() {
    if (!registered_ || !active_) {
        return;
    }

    ExitBehavior behavior = common_.exit_behavior.value_or(ExitBehavior::Reset);
    spdlog::info("{} Exiting with '{}' behavior", log_tag_, exit_behavior_name(behavior));

    on_deactivating();
    if (common_.on_deactivate) {
        try {
            common_.on_deactivate();
        } catch (const std::exception& e) {
            spdlog::error("{} Deactivate callback threw: {}", log_tag_, e.what());
        }
    }
    set_active(false);

    std::optional<std::string> target;
    if (behavior == ExitBehavior::Return && last_active_view_id_) {
        target = last_active_view_id_;
    } else if (behavior == ExitBehavior::Reset && common_.starting_view_id) {
        target = common_.starting_view_id;
    }

    if (!target) {
        spdlog::warn("{} No target view available for exit", log_tag_);
        on_exit_without_target();
        return;
    }

    uint64_t generation = ++generation_;
    std::weak_ptr<bool> alive = alive_;
    const std::string target_id = *target;

    navigation_.request_view_transition(
        target_id, *common_.transition, PriorityClass::Immediate,
        [this, alive, target_id, behavior]() {
            if (alive.expired()) {
                return;
            }
            publish_if_observed(events::DEACTIVATED, {{"targetViewId", target_id},
                                                      {"exitBehavior", exit_behavior_name(behavior)}});
            on_deactivated();
        },
        [this, alive, generation](const KioskError& error) {
            if (alive.expired()) {
                return;
            }
            if (error.type == KioskErrorType::SUPERSEDED) {
                spdlog::debug("{} Exit request superseded", log_tag_);
                return;
            }
            spdlog::error("{} Failed to exit: {}", log_tag_, error.message);
            if (generation == generation_ && !active_) {
                set_active(true);
            }
        });
}

void ActivationMachine::force_deactivate() {
    deactivate();
}

void ActivationMachine::publish_if_observed(const char* event_name, const json& detail) {
    if (channel_.listener_count(event_name) == 0) {
        spdlog::trace("{} No listener for '{}'", log_tag_, event_name);
        return;
    }
    channel_.publish(event_name, detail);
}

} // namespace kiosk
