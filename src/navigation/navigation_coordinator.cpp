// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "navigation_coordinator.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <exception>

namespace kiosk {

namespace {

constexpr uint32_t PAGE_HIDE_DELAY_MS = 50;

json optional_id_json(const std::optional<std::string>& id) {
    return id ? json(*id) : json(nullptr);
}

std::optional<std::string> id_from_json(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return std::nullopt;
}

} // namespace

const char* navigation_axis_name(NavigationAxis axis) {
    return axis == NavigationAxis::Page ? "Page" : "View";
}

/**
 * @brief One accepted transition, shared by the animation continuations
 *
 * Holds the isTransitioning flag. release_flag() is idempotent; the
 * destructor releases it if the run is dropped without settling (e.g. the
 * coordinator is destroyed mid-animation).
 */
struct NavigationCoordinator::Run {
    Run(StateStore& state_store, NavigationAxis run_axis, std::string target,
        TransitionConfig transition, CompletionCallback done, ErrorCallback error)
        : state(state_store), axis(run_axis), target_id(std::move(target)),
          config(std::move(transition)), on_done(std::move(done)), on_error(std::move(error)) {}

    ~Run() {
        release_flag();
    }

    Run(const Run&) = delete;
    Run& operator=(const Run&) = delete;

    void acquire_flag() {
        holds_flag = true;
        state.set(state_keys::IS_TRANSITIONING, true);
    }

    void release_flag() {
        if (!holds_flag) {
            return;
        }
        holds_flag = false;
        try {
            state.set(state_keys::IS_TRANSITIONING, false);
        } catch (const std::exception& e) {
            spdlog::error("[NavigationCoordinator] isTransitioning observer threw: {}", e.what());
        }
    }

    StateStore& state;
    NavigationAxis axis;
    std::string target_id;
    std::optional<std::string> previous_id;
    TransitionConfig config;
    VisualElement* target = nullptr;
    VisualElement* previous = nullptr;
    CompletionCallback on_done;
    ErrorCallback on_error;
    bool holds_flag = false;
    bool settled = false;
};

NavigationCoordinator::NavigationCoordinator(Orchestrator& orchestrator, ElementProvider* provider)
    : orchestrator_(orchestrator), state_(orchestrator.state()),
      scheduler_(orchestrator.scheduler()),
      channel_(orchestrator.create_channel(channels::NAVIGATION)), provider_(provider),
      animator_(orchestrator.scheduler()) {
    state_.init_if_absent(state_keys::CURRENT_PAGE_ID, nullptr);
    state_.init_if_absent(state_keys::CURRENT_VIEW_ID, nullptr);
    state_.init_if_absent(state_keys::IS_TRANSITIONING, false);

    subscriptions_.push_back(channel_.subscribe(
        events::REQUEST_PAGE_TRANSITION,
        [this](const json& detail) { on_request_dispatched(NavigationAxis::Page, detail); }));
    subscriptions_.push_back(channel_.subscribe(
        events::REQUEST_VIEW_TRANSITION,
        [this](const json& detail) { on_request_dispatched(NavigationAxis::View, detail); }));

    auto register_from_event = [this](NavigationAxis axis, const json& detail) {
        const char* key = axis == NavigationAxis::Page ? "page" : "view";
        std::string id = detail.value(key, "");
        VisualElement* element = provider_ ? provider_->find_element(id) : nullptr;
        if (!element) {
            spdlog::error("[NavigationCoordinator] Cannot register {} '{}': no element", key, id);
            return;
        }
        if (axis == NavigationAxis::Page) {
            register_page(id, *element);
        } else {
            register_view(id, *element);
        }
    };
    subscriptions_.push_back(channel_.subscribe(
        events::REGISTER_PAGE, [register_from_event](const json& detail) {
            register_from_event(NavigationAxis::Page, detail);
        }));
    subscriptions_.push_back(channel_.subscribe(
        events::REGISTER_VIEW, [register_from_event](const json& detail) {
            register_from_event(NavigationAxis::View, detail);
        }));

    spdlog::debug("[NavigationCoordinator] Initialized");
}

NavigationCoordinator::~NavigationCoordinator() {
    subscriptions_.clear();
    if (!pending_requests_.empty() || !deferred_.empty()) {
        spdlog::debug("[NavigationCoordinator] Destroyed with {} pending and {} deferred request(s)",
                      pending_requests_.size(), deferred_.size());
    }
}

// ============================================================================
// Registration
// ============================================================================

void NavigationCoordinator::register_page(const std::string& page_id, VisualElement& element) {
    if (pages_.find(page_id) == pages_.end()) {
        page_order_.push_back(page_id);
    }
    pages_[page_id] = &element;
    element.add_class("nav-item");
    element.add_class("nav-page");

    if (!state_.has(state_keys::CURRENT_PAGE_ID)) {
        state_.set(state_keys::CURRENT_PAGE_ID, page_id);
        show_page(element);
        spdlog::debug("[NavigationCoordinator] Page '{}' registered (current)", page_id);
    } else {
        hide_page(element);
        spdlog::debug("[NavigationCoordinator] Page '{}' registered", page_id);
    }
}

void NavigationCoordinator::register_view(const std::string& view_id, VisualElement& element) {
    if (views_.find(view_id) == views_.end()) {
        view_order_.push_back(view_id);
    }
    views_[view_id] = &element;
    element.add_class("nav-item");
    element.add_class("nav-view");
    hide_view(element);
    spdlog::debug("[NavigationCoordinator] View '{}' registered", view_id);
}

// ============================================================================
// Requests
// ============================================================================

QueueItemId NavigationCoordinator::request_page_transition(const std::string& page_id,
                                                           const TransitionConfig& config,
                                                           PriorityClass priority,
                                                           CompletionCallback on_done,
                                                           ErrorCallback on_error) {
    return request_transition(NavigationAxis::Page, page_id, config, priority,
                              std::move(on_done), std::move(on_error));
}

QueueItemId NavigationCoordinator::request_view_transition(const std::string& view_id,
                                                           const TransitionConfig& config,
                                                           PriorityClass priority,
                                                           CompletionCallback on_done,
                                                           ErrorCallback on_error) {
    return request_transition(NavigationAxis::View, view_id, config, priority,
                              std::move(on_done), std::move(on_error));
}

QueueItemId NavigationCoordinator::request_transition(NavigationAxis axis,
                                                      const std::string& target_id,
                                                      const TransitionConfig& config,
                                                      PriorityClass priority,
                                                      CompletionCallback on_done,
                                                      ErrorCallback on_error) {
    const bool is_page = axis == NavigationAxis::Page;
    std::string request_id = fmt::format("nav-{}", next_request_id_++);

    json payload = {{is_page ? "pageId" : "viewId", target_id},
                    {"config", transition_config_to_json(config)},
                    {"requestId", request_id}};

    QueueItemId item_id = orchestrator_.enqueue(
        is_page ? events::REQUEST_PAGE_TRANSITION : events::REQUEST_VIEW_TRANSITION,
        channels::NAVIGATION, priority, payload);

    if (on_done || on_error) {
        pending_requests_[request_id] =
            PendingRequest{axis, target_id, item_id, std::move(on_done), std::move(on_error)};
    }
    spdlog::trace("[NavigationCoordinator] {} request {} for '{}' queued as #{}",
                  navigation_axis_name(axis), request_id, target_id, item_id);

    resolve_superseded(axis);
    return item_id;
}

void NavigationCoordinator::resolve_superseded(NavigationAxis axis) {
    std::vector<PendingRequest> superseded;
    for (auto it = pending_requests_.begin(); it != pending_requests_.end();) {
        if (it->second.axis == axis && !orchestrator_.is_queued(it->second.item_id)) {
            superseded.push_back(std::move(it->second));
            it = pending_requests_.erase(it);
        } else {
            ++it;
        }
    }
    for (const auto& request : superseded) {
        spdlog::debug("[NavigationCoordinator] Request for '{}' superseded", request.target_id);
        report_error(request.on_error, KioskError::superseded(request.target_id));
    }
}

void NavigationCoordinator::on_request_dispatched(NavigationAxis axis, const json& detail) {
    const bool is_page = axis == NavigationAxis::Page;
    std::string target_id = detail.value(is_page ? "pageId" : "viewId", "");

    CompletionCallback on_done;
    ErrorCallback on_error;
    if (detail.contains("requestId") && detail["requestId"].is_string()) {
        auto it = pending_requests_.find(detail["requestId"].get<std::string>());
        if (it != pending_requests_.end()) {
            on_done = std::move(it->second.on_done);
            on_error = std::move(it->second.on_error);
            pending_requests_.erase(it);
        }
    }

    TransitionConfig config;
    try {
        config = transition_config_from_json(detail.value("config", json::object()));
    } catch (const ValidationError& e) {
        spdlog::warn("[NavigationCoordinator] {}", e.what());
    }

    perform_transition(axis, target_id, config, std::move(on_done), std::move(on_error));
}

// ============================================================================
// Transition protocol
// ============================================================================

void NavigationCoordinator::perform_transition(NavigationAxis axis, const std::string& target_id,
                                               const TransitionConfig& config,
                                               CompletionCallback on_done,
                                               ErrorCallback on_error) {
    if (transitioning_) {
        for (auto it = deferred_.begin(); it != deferred_.end(); ++it) {
            if (it->axis == axis) {
                DeferredTransition dropped = std::move(*it);
                deferred_.erase(it);
                report_error(dropped.on_error, KioskError::superseded(dropped.target_id));
                break;
            }
        }
        spdlog::debug("[NavigationCoordinator] Transition in progress, holding {} '{}'",
                      navigation_axis_name(axis), target_id);
        deferred_.push_back(
            DeferredTransition{axis, target_id, config, std::move(on_done), std::move(on_error)});
        return;
    }

    VisualElement* target = find_element(axis, target_id);
    if (!target) {
        spdlog::error("[NavigationCoordinator] {} with id \"{}\" not found",
                      navigation_axis_name(axis), target_id);
        report_error(on_error, KioskError::not_found(navigation_axis_name(axis), target_id));
        return;
    }

    auto current = current_id(axis);
    if (current && *current == target_id) {
        if (axis == NavigationAxis::View) {
            spdlog::trace("[NavigationCoordinator] Already on view {}, emitting re-entry event",
                          target_id);
            notify(events::VIEW_RE_ENTERED, {{"viewId", target_id}});
        }
        report_done(on_done, target_id);
        return;
    }

    auto run = std::make_shared<Run>(state_, axis, target_id, config, std::move(on_done),
                                     std::move(on_error));
    run->previous_id = current;
    run->target = target;
    begin_run(run);
}

void NavigationCoordinator::begin_run(const std::shared_ptr<Run>& run) {
    transitioning_ = true;
    spdlog::trace("[NavigationCoordinator] Starting navigation from {} to {}",
                  run->previous_id.value_or("(none)"), run->target_id);

    try {
        run->acquire_flag();
        run->config = normalize_transition_config(run->config);

        if (run->axis == NavigationAxis::Page) {
            show_page(*run->target);
        } else {
            show_view(*run->target, !run->config.is_snap());
        }

        run->previous = run->previous_id ? find_element(run->axis, *run->previous_id) : nullptr;
        if (!run->previous) {
            enter_target(run);
            return;
        }

        animator_.animate_out(
            *run->previous, run->config,
            [this, run]() {
                if (run->settled) {
                    return;
                }
                try {
                    if (run->axis == NavigationAxis::Page) {
                        hide_page(*run->previous);
                    } else {
                        hide_view(*run->previous);
                    }
                    enter_target(run);
                } catch (const std::exception& e) {
                    fail_run(run, e.what());
                }
            },
            [this, run](const std::string& what) { fail_run(run, what); });
    } catch (const std::exception& e) {
        fail_run(run, e.what());
    }
}

void NavigationCoordinator::enter_target(const std::shared_ptr<Run>& run) {
    animator_.animate_in(
        *run->target, run->config, [this, run]() { complete_run(run); },
        [this, run](const std::string& what) { fail_run(run, what); });
}

void NavigationCoordinator::complete_run(const std::shared_ptr<Run>& run) {
    if (run->settled) {
        return;
    }
    run->settled = true;

    try {
        if (run->axis == NavigationAxis::Page) {
            state_.set(state_keys::CURRENT_PAGE_ID, run->target_id);
            state_.set(state_keys::CURRENT_VIEW_ID, nullptr);
            notify(events::PAGE_CHANGED, {{"newPageId", run->target_id},
                                          {"previousPageId", optional_id_json(run->previous_id)}});
        } else {
            state_.set(state_keys::CURRENT_VIEW_ID, run->target_id);
            notify(events::VIEW_CHANGED, {{"newViewId", run->target_id},
                                          {"previousViewId", optional_id_json(run->previous_id)}});
        }
    } catch (const std::exception& e) {
        spdlog::error("[NavigationCoordinator] Observer of navigation state threw: {}", e.what());
    }

    run->release_flag();
    transitioning_ = false;
    spdlog::trace("[NavigationCoordinator] Navigation to {} completed successfully",
                  run->target_id);

    report_done(run->on_done, run->target_id);
    run_next_deferred();
}

void NavigationCoordinator::fail_run(const std::shared_ptr<Run>& run, const std::string& what) {
    if (run->settled) {
        return;
    }
    run->settled = true;

    // Flag first: the error callback may immediately request another transition
    run->release_flag();
    transitioning_ = false;

    spdlog::error("[NavigationCoordinator] Navigation to {} failed: {}", run->target_id, what);
    report_error(run->on_error, KioskError::animation_failed(run->target_id, what));
    run_next_deferred();
}

void NavigationCoordinator::run_next_deferred() {
    if (transitioning_ || deferred_.empty()) {
        return;
    }
    DeferredTransition next = std::move(deferred_.front());
    deferred_.pop_front();
    perform_transition(next.axis, next.target_id, next.config, std::move(next.on_done),
                       std::move(next.on_error));
}

// ============================================================================
// Element visibility
// ============================================================================

void NavigationCoordinator::show_page(VisualElement& element) {
    hide_timers_.erase(&element);
    element.remove_class("nav-hidden");
    element.remove_class("out");
    element.add_class("in");
    element.set_style("display", "block");
}

void NavigationCoordinator::hide_page(VisualElement& element) {
    element.add_class("nav-hidden");

    // display:none shortly after, unless the page was shown again meanwhile
    VisualElement* target = &element;
    auto& timer = hide_timers_[target];
    timer = TimerGuard(scheduler_);
    timer.start_timeout(PAGE_HIDE_DELAY_MS, [this, target]() {
        auto it = hide_timers_.find(target);
        if (it != hide_timers_.end()) {
            it->second.clear();
        }
        try {
            if (target->has_class("nav-hidden")) {
                target->set_style("display", "none");
            }
        } catch (const std::exception& e) {
            spdlog::warn("[NavigationCoordinator] Deferred hide of '{}' failed: {}",
                         target->element_id(), e.what());
        }
    });
}

void NavigationCoordinator::show_view(VisualElement& element, bool animate) {
    element.set_style("display", "block");
    element.remove_class("nav-hidden");
    element.set_style("visibility", "visible");
    if (!animate) {
        element.set_style("opacity", "1");
        element.set_style("transform", "none");
    }
}

void NavigationCoordinator::hide_view(VisualElement& element) {
    element.add_class("nav-hidden");
    element.set_style("display", "none");
    element.set_style("visibility", "hidden");
}

// ============================================================================
// Helpers
// ============================================================================

VisualElement* NavigationCoordinator::find_element(NavigationAxis axis,
                                                   const std::string& id) const {
    const auto& registry = axis == NavigationAxis::Page ? pages_ : views_;
    auto it = registry.find(id);
    return it == registry.end() ? nullptr : it->second;
}

std::optional<std::string> NavigationCoordinator::current_id(NavigationAxis axis) const {
    return id_from_json(state_.get(axis == NavigationAxis::Page ? state_keys::CURRENT_PAGE_ID
                                                                : state_keys::CURRENT_VIEW_ID));
}

void NavigationCoordinator::notify(const char* event_name, const json& detail) {
    if (channel_.listener_count(event_name) == 0) {
        spdlog::trace("[NavigationCoordinator] No listener for '{}'", event_name);
        return;
    }
    channel_.publish(event_name, detail);
}

void NavigationCoordinator::report_error(const ErrorCallback& on_error, const KioskError& error) {
    if (!on_error) {
        spdlog::error("[NavigationCoordinator] {}: {}", error.get_type_string(), error.message);
        return;
    }
    try {
        on_error(error);
    } catch (const std::exception& e) {
        spdlog::error("[NavigationCoordinator] Error callback for '{}' threw: {}", error.target,
                      e.what());
    }
}

void NavigationCoordinator::report_done(const CompletionCallback& on_done,
                                        const std::string& target_id) {
    if (!on_done) {
        return;
    }
    try {
        on_done();
    } catch (const std::exception& e) {
        spdlog::error("[NavigationCoordinator] Completion callback for '{}' threw: {}", target_id,
                      e.what());
    }
}

std::optional<std::string> NavigationCoordinator::get_current_page_id() const {
    return current_id(NavigationAxis::Page);
}

std::optional<std::string> NavigationCoordinator::get_current_view_id() const {
    return current_id(NavigationAxis::View);
}

bool NavigationCoordinator::is_transitioning() const {
    return state_.get<bool>(state_keys::IS_TRANSITIONING, false);
}

std::vector<std::string> NavigationCoordinator::registered_pages() const {
    return page_order_;
}

std::vector<std::string> NavigationCoordinator::registered_views() const {
    return view_order_;
}

Subscription NavigationCoordinator::subscribe_current_page(IdCallback callback) {
    return state_.subscribe(state_keys::CURRENT_PAGE_ID,
                            [callback = std::move(callback)](const json& value, const std::string&) {
                                callback(id_from_json(value));
                            });
}

Subscription NavigationCoordinator::subscribe_current_view(IdCallback callback) {
    return state_.subscribe(state_keys::CURRENT_VIEW_ID,
                            [callback = std::move(callback)](const json& value, const std::string&) {
                                callback(id_from_json(value));
                            });
}

Subscription NavigationCoordinator::subscribe_transitioning(std::function<void(bool)> callback) {
    return state_.subscribe(state_keys::IS_TRANSITIONING,
                            [callback = std::move(callback)](const json& value, const std::string&) {
                                callback(value.is_boolean() && value.get<bool>());
                            });
}

} // namespace kiosk
