// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "state_store.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace kiosk {

StateStore::StateStore() = default;

StateStore::~StateStore() {
    // Expire the token so outstanding Subscriptions skip their cancel call
    alive_.reset();
}

json StateStore::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return nullptr;
    }
    return it->second;
}

void StateStore::set(const std::string& key, const json& value) {
    values_[key] = value;
    spdlog::trace("[StateStore] {} = {}", key, value.dump());

    auto it = subscribers_.find(key);
    if (it == subscribers_.end()) {
        return;
    }

    // Snapshot ids: callbacks may subscribe/unsubscribe while we iterate
    std::vector<uint64_t> ids;
    ids.reserve(it->second.size());
    for (const auto& sub : it->second) {
        ids.push_back(sub.id);
    }

    for (uint64_t id : ids) {
        auto list_it = subscribers_.find(key);
        if (list_it == subscribers_.end()) {
            break;
        }
        auto& list = list_it->second;
        auto sub_it = std::find_if(list.begin(), list.end(),
                                   [id](const Subscriber& s) { return s.id == id; });
        if (sub_it == list.end()) {
            continue;
        }
        Callback callback = sub_it->callback;
        callback(value, key);
    }
}

bool StateStore::has(const std::string& key) const {
    auto it = values_.find(key);
    return it != values_.end() && !it->second.is_null();
}

bool StateStore::init_if_absent(const std::string& key, const json& value) {
    if (values_.count(key) > 0) {
        return false;
    }
    set(key, value);
    return true;
}

void StateStore::remove(const std::string& key) {
    if (values_.erase(key) > 0) {
        auto it = subscribers_.find(key);
        if (it != subscribers_.end()) {
            auto snapshot = it->second;
            for (const auto& sub : snapshot) {
                sub.callback(nullptr, key);
            }
        }
    }
}

Subscription StateStore::subscribe(const std::string& key, Callback callback) {
    uint64_t id = next_subscriber_id_++;
    subscribers_[key].push_back(Subscriber{id, std::move(callback)});
    return Subscription([this, key, id]() { unsubscribe(key, id); }, alive_);
}

size_t StateStore::subscriber_count(const std::string& key) const {
    auto it = subscribers_.find(key);
    return it == subscribers_.end() ? 0 : it->second.size();
}

void StateStore::unsubscribe(const std::string& key, uint64_t id) {
    auto it = subscribers_.find(key);
    if (it == subscribers_.end()) {
        return;
    }
    auto& list = it->second;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [id](const Subscriber& s) { return s.id == id; }),
               list.end());
    if (list.empty()) {
        subscribers_.erase(it);
    }
}

void StateStore::log_type_mismatch(const std::string& key, const char* what) {
    spdlog::warn("[StateStore] Value at '{}' has unexpected type: {}", key, what);
}

} // namespace kiosk
