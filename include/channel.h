// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "subscription.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace kiosk {

using json = nlohmann::json;

/**
 * @brief Named publish/subscribe endpoint for one category of event
 *
 * Any number of handlers may listen to the same event name; publish()
 * invokes them synchronously in registration order. Publishing to a name
 * without live handlers is a reported (non-fatal) contract violation.
 *
 * Channels are created and owned by the Orchestrator.
 *
 * @code
 * Channel& nav = orchestrator.create_channel("navigation");
 * auto sub = nav.subscribe("view-changed", [](const json& detail) {
 *     spdlog::info("now on {}", detail.value("newViewId", ""));
 * });
 * nav.publish("view-changed", {{"newViewId", "home"}, {"previousViewId", nullptr}});
 * @endcode
 */
class Channel {
  public:
    using Handler = std::function<void(const json& detail)>;

    explicit Channel(std::string name);
    ~Channel();

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Register a handler for event_name
     * @return RAII token; destroying it cancels the handler
     */
    Subscription subscribe(const std::string& event_name, Handler handler);

    /**
     * @brief Register a handler that cancels itself before its first invocation
     */
    Subscription subscribe_once(const std::string& event_name, Handler handler);

    /**
     * @brief Invoke all live handlers for event_name, in registration order
     *
     * A handler that throws is logged and does not stop the remaining
     * handlers. No handlers registered: logged as a contract failure.
     *
     * @return false when no handler was registered for event_name
     */
    bool publish(const std::string& event_name, const json& detail = json::object());

    /**
     * @brief Revoke the earliest-registered live handler for event_name
     * @return true if a handler was revoked
     */
    bool cancel(const std::string& event_name);

    /**
     * @brief Number of live handlers for event_name
     */
    size_t listener_count(const std::string& event_name) const;

    const std::string& name() const {
        return name_;
    }

  private:
    struct Listener {
        uint64_t id;
        std::string event_name;
        Handler handler;
        bool once;
    };

    Subscription add_listener(const std::string& event_name, Handler handler, bool once);
    bool remove_listener(uint64_t id);

    std::string name_;
    std::vector<Listener> listeners_; ///< Registration order
    uint64_t next_listener_id_ = 1;
    SubscriptionLifetime alive_ = std::make_shared<bool>(true);
};

} // namespace kiosk
