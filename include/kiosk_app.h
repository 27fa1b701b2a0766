// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "gesture_activation.h"
#include "headless_element.h"
#include "idle_activation.h"
#include "navigation_coordinator.h"
#include "orchestrator.h"
#include "scheduler.h"
#include "state_store.h"

#include <memory>
#include <string>

namespace kiosk {

class Config;

/**
 * @brief Wires the kiosk runtime together
 *
 * Owns, in construction order: StateStore, LoopScheduler, Orchestrator,
 * NavigationCoordinator, IdleActivationMachine, GestureSequenceMachine.
 * Shutdown runs in reverse.
 *
 * Elements come from an ElementProvider. Without one, the app keeps its own
 * HeadlessElementRegistry and creates a HeadlessElement for every page and
 * view it is asked to add.
 *
 * Usage:
 *   KioskApp app;
 *   app.add_page("home");
 *   app.add_view("welcome");
 *   app.start();
 *   for (;;) app.pump();
 */
class KioskApp {
  public:
    explicit KioskApp(LoopScheduler::TimeSource time_source = {});
    explicit KioskApp(ElementProvider& provider, LoopScheduler::TimeSource time_source = {});
    ~KioskApp();

    // Non-copyable, non-movable
    KioskApp(const KioskApp&) = delete;
    KioskApp& operator=(const KioskApp&) = delete;
    KioskApp(KioskApp&&) = delete;
    KioskApp& operator=(KioskApp&&) = delete;

    /**
     * @brief Build pages, views and activation machines from a Config
     *
     * Reads /orchestrator, /viewport, /pages, /views, /idle, /gesture,
     * /start_page and /start_view.
     *
     * @throws ValidationError if a section is malformed
     */
    void apply_config(Config& config);

    /**
     * @brief Register a page; the first one registered becomes current
     * @throws NotFoundError if an external provider has no element for it
     */
    void add_page(const std::string& page_id);

    /**
     * @brief Register a view (hidden until navigated to)
     * @throws NotFoundError if an external provider has no element for it
     */
    void add_view(const std::string& view_id);

    /**
     * @brief Install the idle screensaver
     * @throws ValidationError
     */
    void add_screensaver(const IdleActivationConfig& config);

    /**
     * @brief Install the corner-gesture hidden settings view
     * @throws ValidationError
     */
    void add_hidden_settings(const GestureActivationConfig& config);

    QueueItemId navigate_to_page(const std::string& page_id,
                                 const TransitionConfig& config = TransitionConfig::snap(),
                                 CompletionCallback on_done = nullptr,
                                 ErrorCallback on_error = nullptr);

    QueueItemId navigate_to_view(const std::string& view_id,
                                 const TransitionConfig& config = TransitionConfig::snap(),
                                 CompletionCallback on_done = nullptr,
                                 ErrorCallback on_error = nullptr);

    /**
     * @brief Begin periodic ticking (driven by pump())
     */
    void start();

    /**
     * @brief Stop ticking. Idempotent.
     */
    void stop();

    /**
     * @brief Run due timers (the tick timer included)
     * @return Number of timer callbacks run
     */
    size_t pump();

    /**
     * @brief Deliver one input event (activity, pointer-down, visibility-changed)
     * @return true if anything listened
     */
    bool publish_input(const std::string& event_name, const json& detail);

    void set_viewport_size(int width, int height);

    StateStore& state() {
        return *state_;
    }
    LoopScheduler& scheduler() {
        return *scheduler_;
    }
    Orchestrator& orchestrator() {
        return *orchestrator_;
    }
    NavigationCoordinator& navigation() {
        return *navigation_;
    }
    IdleActivationMachine& idle() {
        return *idle_;
    }
    GestureSequenceMachine& gesture() {
        return *gesture_;
    }

    /// Null when an external ElementProvider was supplied
    HeadlessElementRegistry* headless_elements() {
        return headless_.get();
    }

    uint32_t tick_interval_ms() const {
        return tick_ms_;
    }

  private:
    void init_subsystems(LoopScheduler::TimeSource time_source);
    VisualElement& resolve_element(const std::string& id, const char* kind);

    std::unique_ptr<HeadlessElementRegistry> headless_;
    ElementProvider* provider_ = nullptr;

    std::unique_ptr<StateStore> state_;
    std::unique_ptr<LoopScheduler> scheduler_;
    std::unique_ptr<Orchestrator> orchestrator_;
    std::unique_ptr<NavigationCoordinator> navigation_;
    std::unique_ptr<IdleActivationMachine> idle_;
    std::unique_ptr<GestureSequenceMachine> gesture_;

    uint32_t tick_ms_ = Orchestrator::DEFAULT_TICK_MS;
};

} // namespace kiosk
