// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "element_animator.h"
#include "kiosk_error.h"
#include "orchestrator.h"
#include "subscription.h"
#include "transition_config.h"
#include "visual_element.h"

#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kiosk {

enum class NavigationAxis { Page, View };

const char* navigation_axis_name(NavigationAxis axis);

/**
 * @brief Owner of the current page/view and the exclusive transition flag
 *
 * Manages the navigation system including:
 * - Page and view registration (direct or via register-page/register-view events)
 * - Queued transition requests on the "navigation" channel
 * - Enter/exit animation protocol through ElementAnimator
 * - navigation.* keys in the StateStore
 *
 * Every transition request goes through the Orchestrator queue; nothing
 * navigates synchronously. Only one transition runs at a time: a request
 * dispatched while another is animating waits until the running one settles
 * (a later request for the same axis supersedes a waiting one).
 *
 * Usage:
 *   NavigationCoordinator nav(orchestrator, &registry);
 *   nav.register_page("main", main_element);
 *   nav.register_view("home", home_element);
 *   nav.request_view_transition("home", TransitionConfig::animated(TransitionType::Fade, 300));
 */
class NavigationCoordinator {
  public:
    /**
     * @param orchestrator Queue and channel registry (also supplies StateStore and Scheduler)
     * @param provider Element lookup for channel registrations; may be nullptr
     */
    explicit NavigationCoordinator(Orchestrator& orchestrator,
                                   ElementProvider* provider = nullptr);
    ~NavigationCoordinator();

    NavigationCoordinator(const NavigationCoordinator&) = delete;
    NavigationCoordinator& operator=(const NavigationCoordinator&) = delete;

    // ========================================================================
    // Registration
    // ========================================================================

    /**
     * @brief Register a page element
     *
     * The first page registered becomes current and is shown; every other
     * page starts hidden. Re-registering an id replaces its element.
     */
    void register_page(const std::string& page_id, VisualElement& element);

    /**
     * @brief Register a view element (always starts hidden)
     */
    void register_view(const std::string& view_id, VisualElement& element);

    void set_element_provider(ElementProvider* provider) {
        provider_ = provider;
    }

    // ========================================================================
    // Requests
    // ========================================================================

    /**
     * @brief Queue a page transition
     *
     * @param page_id Target page
     * @param config Animation (default snap)
     * @param priority Queue priority (default immediate)
     * @param on_done Called after the transition completed (or target was already current)
     * @param on_error Called with NOT_FOUND, ANIMATION_FAILED or SUPERSEDED
     * @return Queue item id of the request
     */
    QueueItemId request_page_transition(const std::string& page_id,
                                        const TransitionConfig& config = TransitionConfig::snap(),
                                        PriorityClass priority = PriorityClass::Immediate,
                                        CompletionCallback on_done = nullptr,
                                        ErrorCallback on_error = nullptr);

    /**
     * @brief Queue a view transition
     *
     * Same contract as request_page_transition(). A request for the view that
     * is already current publishes view-re-entered and completes.
     */
    QueueItemId request_view_transition(const std::string& view_id,
                                        const TransitionConfig& config = TransitionConfig::snap(),
                                        PriorityClass priority = PriorityClass::Immediate,
                                        CompletionCallback on_done = nullptr,
                                        ErrorCallback on_error = nullptr);

    /**
     * @brief Run a transition now (called on dispatch of a request)
     *
     * If another transition is still animating, this one is held and run
     * when it settles.
     */
    void perform_transition(NavigationAxis axis, const std::string& target_id,
                            const TransitionConfig& config, CompletionCallback on_done,
                            ErrorCallback on_error);

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<std::string> get_current_page_id() const;
    std::optional<std::string> get_current_view_id() const;
    bool is_transitioning() const;

    std::vector<std::string> registered_pages() const;
    std::vector<std::string> registered_views() const;

    using IdCallback = std::function<void(const std::optional<std::string>& id)>;

    Subscription subscribe_current_page(IdCallback callback);
    Subscription subscribe_current_view(IdCallback callback);
    Subscription subscribe_transitioning(std::function<void(bool)> callback);

    /**
     * @brief Number of requests dispatched but waiting for the running transition
     */
    size_t deferred_count() const {
        return deferred_.size();
    }

  private:
    struct PendingRequest {
        NavigationAxis axis;
        std::string target_id;
        QueueItemId item_id = 0;
        CompletionCallback on_done;
        ErrorCallback on_error;
    };

    struct DeferredTransition {
        NavigationAxis axis;
        std::string target_id;
        TransitionConfig config;
        CompletionCallback on_done;
        ErrorCallback on_error;
    };

    struct Run;

    QueueItemId request_transition(NavigationAxis axis, const std::string& target_id,
                                   const TransitionConfig& config, PriorityClass priority,
                                   CompletionCallback on_done, ErrorCallback on_error);
    void on_request_dispatched(NavigationAxis axis, const json& detail);
    void resolve_superseded(NavigationAxis axis);

    void begin_run(const std::shared_ptr<Run>& run);
    void enter_target(const std::shared_ptr<Run>& run);
    void complete_run(const std::shared_ptr<Run>& run);
    void fail_run(const std::shared_ptr<Run>& run, const std::string& what);
    void run_next_deferred();

    VisualElement* find_element(NavigationAxis axis, const std::string& id) const;
    std::optional<std::string> current_id(NavigationAxis axis) const;

    void show_page(VisualElement& element);
    void hide_page(VisualElement& element);
    void show_view(VisualElement& element, bool animate);
    void hide_view(VisualElement& element);

    void notify(const char* event_name, const json& detail);

    static void report_error(const ErrorCallback& on_error, const KioskError& error);
    static void report_done(const CompletionCallback& on_done, const std::string& target_id);

    Orchestrator& orchestrator_;
    StateStore& state_;
    Scheduler& scheduler_;
    Channel& channel_;
    ElementProvider* provider_;
    ElementAnimator animator_;

    std::map<std::string, VisualElement*> pages_;
    std::vector<std::string> page_order_;
    std::map<std::string, VisualElement*> views_;
    std::vector<std::string> view_order_;

    std::map<std::string, PendingRequest> pending_requests_; ///< By requestId
    uint64_t next_request_id_ = 1;
    std::deque<DeferredTransition> deferred_;
    bool transitioning_ = false;

    std::map<VisualElement*, TimerGuard> hide_timers_;
    std::vector<Subscription> subscriptions_;
};

} // namespace kiosk
