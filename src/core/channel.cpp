// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "channel.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace kiosk {

Channel::Channel(std::string name) : name_(std::move(name)) {
    spdlog::trace("[Channel] '{}' created", name_);
}

Channel::~Channel() {
    alive_.reset();
}

Subscription Channel::subscribe(const std::string& event_name, Handler handler) {
    return add_listener(event_name, std::move(handler), false);
}

Subscription Channel::subscribe_once(const std::string& event_name, Handler handler) {
    return add_listener(event_name, std::move(handler), true);
}

Subscription Channel::add_listener(const std::string& event_name, Handler handler, bool once) {
    uint64_t id = next_listener_id_++;
    listeners_.push_back(Listener{id, event_name, std::move(handler), once});
    spdlog::trace("[Channel] '{}' listener {} added for '{}'{}", name_, id, event_name,
                  once ? " (once)" : "");
    return Subscription([this, id]() { remove_listener(id); }, alive_);
}

bool Channel::remove_listener(uint64_t id) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [id](const Listener& l) { return l.id == id; });
    if (it == listeners_.end()) {
        return false;
    }
    listeners_.erase(it);
    return true;
}

bool Channel::publish(const std::string& event_name, const json& detail) {
    // Snapshot matching ids; handlers may add or cancel listeners while we run
    std::vector<uint64_t> ids;
    for (const auto& listener : listeners_) {
        if (listener.event_name == event_name) {
            ids.push_back(listener.id);
        }
    }

    if (ids.empty()) {
        spdlog::error("[Channel] Failed to dispatch event. Channel '{}' has no listener for "
                      "event '{}'",
                      name_, event_name);
        return false;
    }

    spdlog::trace("[Channel] '{}' publishing '{}' to {} listener(s)", name_, event_name,
                  ids.size());

    for (uint64_t id : ids) {
        auto it = std::find_if(listeners_.begin(), listeners_.end(),
                               [id](const Listener& l) { return l.id == id; });
        if (it == listeners_.end()) {
            continue; // cancelled by an earlier handler
        }

        Handler handler = it->handler;
        if (it->once) {
            listeners_.erase(it);
        }

        try {
            handler(detail);
        } catch (const std::exception& e) {
            spdlog::error("[Channel] Handler for '{}:{}' threw: {}", name_, event_name, e.what());
        }
    }
    return true;
}

bool Channel::cancel(const std::string& event_name) {
    auto it = std::find_if(listeners_.begin(), listeners_.end(),
                           [&event_name](const Listener& l) { return l.event_name == event_name; });
    if (it == listeners_.end()) {
        spdlog::debug("[Channel] '{}' has no listener for '{}' to cancel", name_, event_name);
        return false;
    }
    listeners_.erase(it);
    spdlog::trace("[Channel] Listener for '{}' removed from channel '{}'", event_name, name_);
    return true;
}

size_t Channel::listener_count(const std::string& event_name) const {
    return static_cast<size_t>(
        std::count_if(listeners_.begin(), listeners_.end(),
                      [&event_name](const Listener& l) { return l.event_name == event_name; }));
}

} // namespace kiosk
