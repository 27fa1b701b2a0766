// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file orchestrator.h
 * @brief Channel registry plus prioritized, time-aware work queue
 *
 * All cross-subsystem communication goes through either a direct
 * Channel::publish() or a queued dispatch via Orchestrator::enqueue().
 *
 * Architecture:
 * 1. Producers enqueue (event, channel, priority, payload)
 * 2. Once per host tick, tick() selects the best eligible item and publishes
 *    it on its channel, then keeps going while eligible items remain
 * 3. Handlers run synchronously inside publish()
 *
 * Ordering: scheduled > immediate > animation > default. A scheduled item is
 * held until now >= eligible_at. Within a class, ascending eligible_at, ties
 * broken by enqueue order.
 *
 * Coalescing: a new navigation request (request-page-transition or
 * request-view-transition on the navigation channel) removes every queued
 * item with the same channel/event pair before it is appended.
 *
 * @code
 * LoopScheduler scheduler;
 * StateStore state;
 * Orchestrator orchestrator(scheduler, state);
 * orchestrator.start();            // tick() every 16ms via the scheduler
 *
 * auto& bus = orchestrator.create_channel("demo");
 * auto sub = bus.subscribe("ping", [](const json&) { spdlog::info("pong"); });
 * orchestrator.enqueue("ping", "demo", PriorityClass::Immediate);
 *
 * while (running) scheduler.run_due();
 * @endcode
 */

#pragma once

#include "channel.h"
#include "kiosk_error.h"
#include "queue_item.h"
#include "scheduler.h"
#include "state_store.h"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kiosk {

/// Reserved channel and event names
namespace channels {
constexpr const char* NAVIGATION = "navigation";
constexpr const char* IDLE_ACTIVATION = "idle-activation";
constexpr const char* GESTURE_ACTIVATION = "gesture-activation";
constexpr const char* INPUT = "input";
constexpr const char* STATE = "state";
} // namespace channels

namespace events {
constexpr const char* REQUEST_PAGE_TRANSITION = "request-page-transition";
constexpr const char* REQUEST_VIEW_TRANSITION = "request-view-transition";
constexpr const char* REGISTER_PAGE = "register-page";
constexpr const char* REGISTER_VIEW = "register-view";
constexpr const char* PAGE_CHANGED = "page-changed";
constexpr const char* VIEW_CHANGED = "view-changed";
constexpr const char* VIEW_RE_ENTERED = "view-re-entered";

constexpr const char* REGISTER = "register";
constexpr const char* ACTIVATE = "activate";
constexpr const char* DEACTIVATE = "deactivate";
constexpr const char* ACTIVATED = "activated";
constexpr const char* DEACTIVATED = "deactivated";

constexpr const char* ACTIVITY = "activity";
constexpr const char* POINTER_DOWN = "pointer-down";
constexpr const char* VISIBILITY_CHANGED = "visibility-changed";

constexpr const char* STATE_UPDATE = "state-update";
} // namespace events

class Orchestrator {
  public:
    static constexpr uint32_t DEFAULT_TICK_MS = 16;
    static constexpr size_t DEFAULT_MAX_DISPATCH_PER_TICK = 1000;

    /**
     * @brief Construct orchestrator
     *
     * Creates the "state" channel and routes its state-update events into
     * the StateStore (see use_global_state()).
     */
    Orchestrator(Scheduler& scheduler, StateStore& state);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ========================================================================
    // Channel registry
    // ========================================================================

    /**
     * @brief Create channel, or return the existing one with that name
     */
    Channel& create_channel(const std::string& name);

    /**
     * @brief Find channel by name
     * @return Channel pointer, or nullptr if not registered
     */
    Channel* lookup_channel(const std::string& name);

    // ========================================================================
    // Queue
    // ========================================================================

    /**
     * @brief Append a work item to the queue
     *
     * @param event_name Event published on dispatch
     * @param channel_name Channel the event is published on
     * @param priority Priority class
     * @param payload Event detail
     * @param eligible_at Earliest dispatch time in ms (defaults to now)
     * @param expiry Optional expiry metadata
     * @return Generated item id
     */
    QueueItemId enqueue(const std::string& event_name, const std::string& channel_name,
                        PriorityClass priority = PriorityClass::Default,
                        const json& payload = json::object(),
                        std::optional<uint64_t> eligible_at = std::nullopt,
                        std::optional<uint64_t> expiry = std::nullopt);

    /**
     * @brief Change eligible_at of a pending item
     *
     * @return true if updated, false if the item was already dispatched or superseded
     * @throws NotFoundError if id was never issued
     */
    bool reschedule(QueueItemId id, uint64_t new_eligible_at);

    /**
     * @brief One host tick: dispatch every eligible item, highest priority first
     *
     * Never throws. No-op once stopped or when called re-entrantly.
     *
     * @return Number of items dispatched
     */
    size_t tick();

    /**
     * @brief Drive tick() from a periodic scheduler timer
     */
    void start(uint32_t tick_interval_ms = DEFAULT_TICK_MS);

    /**
     * @brief Permanently halt dispatch (idempotent)
     *
     * Items still queued are never dispatched. In-flight work is unaffected.
     */
    void stop();

    bool is_stopped() const {
        return stopped_;
    }

    size_t pending_count() const {
        return queue_.size();
    }

    bool is_queued(QueueItemId id) const;

    /**
     * @brief Copy of a pending item, or nullopt once dispatched/superseded
     */
    std::optional<QueueItem> find_item(QueueItemId id) const;

    /**
     * @brief Cap on items dispatched by one tick()
     * @throws ValidationError if limit is 0
     */
    void set_max_dispatch_per_tick(size_t limit);

    size_t max_dispatch_per_tick() const {
        return max_dispatch_per_tick_;
    }

    // ========================================================================
    // Queue-routed global state
    // ========================================================================

    /**
     * @brief Setter for a state key whose writes are routed through the queue
     *
     * Each call enqueues an immediate state-update item; the value lands in
     * the StateStore when that item dispatches. The initial value is
     * enqueued the same way.
     */
    std::function<void(const json&)> use_global_state(const std::string& key,
                                                      const json& initial_value);

    /**
     * @brief Receive a CONTRACT error for every queued item that could not be delivered
     *
     * Undelivered items are always logged; the handler is optional.
     */
    void set_error_handler(ErrorCallback handler) {
        error_handler_ = std::move(handler);
    }

    Scheduler& scheduler() {
        return scheduler_;
    }

    StateStore& state() {
        return state_;
    }

  private:
    /**
     * @brief Remove and return the best eligible item
     */
    std::optional<QueueItem> take_next_eligible(uint64_t now);

    void dispatch(const QueueItem& item);
    void report_undelivered(const QueueItem& item, const std::string& problem);

    static bool is_coalesced_pair(const std::string& channel_name, const std::string& event_name);

    Scheduler& scheduler_;
    StateStore& state_;

    std::map<std::string, std::unique_ptr<Channel>> channels_;
    std::vector<QueueItem> queue_; ///< Enqueue order
    QueueItemId next_item_id_ = 1;
    uint64_t next_sequence_ = 0;

    bool stopped_ = false;
    bool in_tick_ = false;
    size_t max_dispatch_per_tick_ = DEFAULT_MAX_DISPATCH_PER_TICK;
    TimerGuard tick_timer_;
    ErrorCallback error_handler_;
    Subscription state_update_sub_;
};

} // namespace kiosk
