// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "subscription.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiosk {

using json = nlohmann::json;

/**
 * @brief Explicit shared state context
 *
 * Constructed once by the host and passed by reference into every component.
 * Values are JSON so heterogeneous keys (ids, flags, timestamps) share one map.
 *
 * Each key has an ordered list of subscribers that are invoked synchronously,
 * in subscription order, on every set() of that key.
 *
 * Ownership convention: a key is written only by the component that owns it
 * (e.g. navigation.* by NavigationCoordinator). Other components read or
 * subscribe.
 *
 * Thread safety: main thread only.
 */
class StateStore {
  public:
    using Callback = std::function<void(const json& value, const std::string& key)>;

    StateStore();
    ~StateStore();

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    /**
     * @brief Get value at key, or null when the key is absent
     */
    json get(const std::string& key) const;

    /**
     * @brief Get typed value with default fallback
     *
     * Returns default_value when the key is absent, null, or holds a value
     * that does not convert to T.
     */
    template <typename T> T get(const std::string& key, const T& default_value) const {
        auto it = values_.find(key);
        if (it == values_.end() || it->second.is_null()) {
            return default_value;
        }
        try {
            return it->second.template get<T>();
        } catch (const json::exception& e) {
            log_type_mismatch(key, e.what());
            return default_value;
        }
    }

    /**
     * @brief Store value and notify subscribers of key
     */
    void set(const std::string& key, const json& value);

    /**
     * @brief Check whether key holds a non-null value
     */
    bool has(const std::string& key) const;

    /**
     * @brief Set key only if it has no value yet
     * @return true if the value was written
     */
    bool init_if_absent(const std::string& key, const json& value);

    /**
     * @brief Remove key (subscribers are notified with null)
     */
    void remove(const std::string& key);

    /**
     * @brief Subscribe to changes of one key
     * @return RAII token; destroy or reset() to unsubscribe
     */
    Subscription subscribe(const std::string& key, Callback callback);

    /**
     * @brief Number of live subscribers for key
     */
    size_t subscriber_count(const std::string& key) const;

  private:
    struct Subscriber {
        uint64_t id;
        Callback callback;
    };

    void unsubscribe(const std::string& key, uint64_t id);
    static void log_type_mismatch(const std::string& key, const char* what);

    std::unordered_map<std::string, json> values_;
    std::unordered_map<std::string, std::vector<Subscriber>> subscribers_;
    uint64_t next_subscriber_id_ = 1;
    SubscriptionLifetime alive_ = std::make_shared<bool>(true);
};

/// Well-known state keys
namespace state_keys {
constexpr const char* CURRENT_PAGE_ID = "navigation.currentPageId";
constexpr const char* CURRENT_VIEW_ID = "navigation.currentViewId";
constexpr const char* IS_TRANSITIONING = "navigation.isTransitioning";
constexpr const char* LAST_MAINTENANCE = "lastMaintenance";
} // namespace state_keys

} // namespace kiosk
