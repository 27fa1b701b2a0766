// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "orchestrator.h"

#include "kiosk_error.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace kiosk {

Orchestrator::Orchestrator(Scheduler& scheduler, StateStore& state)
    : scheduler_(scheduler), state_(state), tick_timer_(scheduler) {
    Channel& state_channel = create_channel(channels::STATE);
    state_update_sub_ = state_channel.subscribe(events::STATE_UPDATE, [this](const json& detail) {
        if (!detail.contains("key") || !detail["key"].is_string()) {
            spdlog::warn("[Orchestrator] state-update without key: {}", detail.dump());
            return;
        }
        state_.set(detail["key"].get<std::string>(), detail.value("value", json()));
    });
}

Orchestrator::~Orchestrator() {
    tick_timer_.reset();
    state_update_sub_.reset();
}

Channel& Orchestrator::create_channel(const std::string& name) {
    auto it = channels_.find(name);
    if (it != channels_.end()) {
        spdlog::debug("[Orchestrator] Channel '{}' already exists, reusing it", name);
        return *it->second;
    }
    auto channel = std::make_unique<Channel>(name);
    Channel& ref = *channel;
    channels_.emplace(name, std::move(channel));
    spdlog::debug("[Orchestrator] Channel '{}' created", name);
    return ref;
}

Channel* Orchestrator::lookup_channel(const std::string& name) {
    auto it = channels_.find(name);
    return it == channels_.end() ? nullptr : it->second.get();
}

bool Orchestrator::is_coalesced_pair(const std::string& channel_name,
                                     const std::string& event_name) {
    return channel_name == channels::NAVIGATION &&
           (event_name == events::REQUEST_PAGE_TRANSITION ||
            event_name == events::REQUEST_VIEW_TRANSITION);
}

QueueItemId Orchestrator::enqueue(const std::string& event_name, const std::string& channel_name,
                                  PriorityClass priority, const json& payload,
                                  std::optional<uint64_t> eligible_at,
                                  std::optional<uint64_t> expiry) {
    if (is_coalesced_pair(channel_name, event_name)) {
        auto before = queue_.size();
        queue_.erase(std::remove_if(queue_.begin(), queue_.end(),
                                    [&](const QueueItem& item) {
                                        return item.channel_name == channel_name &&
                                               item.event_name == event_name;
                                    }),
                     queue_.end());
        if (queue_.size() != before) {
            spdlog::debug("[Orchestrator] Coalesced {} queued '{}' item(s)",
                          before - queue_.size(), event_name);
        }
    }

    QueueItem item;
    item.id = next_item_id_++;
    item.channel_name = channel_name;
    item.event_name = event_name;
    item.priority = priority;
    item.eligible_at = eligible_at.value_or(scheduler_.now_ms());
    item.expiry = expiry;
    item.payload = payload.is_null() ? json::object() : payload;
    item.sequence = next_sequence_++;

    spdlog::trace("[Orchestrator] Enqueued #{} {}:{} ({}, eligible_at={})", item.id,
                  channel_name, event_name, priority_name(priority), item.eligible_at);

    QueueItemId id = item.id;
    queue_.push_back(std::move(item));
    return id;
}

bool Orchestrator::reschedule(QueueItemId id, uint64_t new_eligible_at) {
    if (id == 0 || id >= next_item_id_) {
        throw NotFoundError("Queue item #" + std::to_string(id) + " was never enqueued");
    }
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [id](const QueueItem& item) { return item.id == id; });
    if (it == queue_.end()) {
        spdlog::debug("[Orchestrator] Queue item #{} already dispatched, not rescheduled", id);
        return false;
    }
    it->eligible_at = new_eligible_at;
    spdlog::trace("[Orchestrator] Rescheduled #{} to {}", id, new_eligible_at);
    return true;
}

std::optional<QueueItem> Orchestrator::take_next_eligible(uint64_t now) {
    auto best = queue_.end();
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (it->priority == PriorityClass::Scheduled && it->eligible_at > now) {
            continue;
        }
        if (best == queue_.end()) {
            best = it;
            continue;
        }
        auto rank = static_cast<int>(it->priority);
        auto best_rank = static_cast<int>(best->priority);
        if (rank != best_rank) {
            if (rank < best_rank) {
                best = it;
            }
            continue;
        }
        if (it->eligible_at != best->eligible_at) {
            if (it->eligible_at < best->eligible_at) {
                best = it;
            }
            continue;
        }
        if (it->sequence < best->sequence) {
            best = it;
        }
    }

    if (best == queue_.end()) {
        return std::nullopt;
    }
    QueueItem item = std::move(*best);
    queue_.erase(best);
    return item;
}

void Orchestrator::dispatch(const QueueItem& item) {
    Channel* channel = lookup_channel(item.channel_name);
    if (!channel) {
        spdlog::error("[Orchestrator] Channel '{}' not found, dropping '{}' (#{})",
                      item.channel_name, item.event_name, item.id);
        report_undelivered(item, "channel not found");
        return;
    }
    spdlog::trace("[Orchestrator] Dispatching #{} {}:{}", item.id, item.channel_name,
                  item.event_name);
    if (!channel->publish(item.event_name, item.payload)) {
        report_undelivered(item, "no listener");
    }
}

void Orchestrator::report_undelivered(const QueueItem& item, const std::string& problem) {
    if (!error_handler_) {
        return;
    }
    try {
        error_handler_(KioskError::contract(item.channel_name, item.event_name, problem));
    } catch (const std::exception& e) {
        spdlog::error("[Orchestrator] Error handler threw for #{}: {}", item.id, e.what());
    }
}

size_t Orchestrator::tick() {
    if (stopped_ || in_tick_) {
        return 0;
    }
    in_tick_ = true;

    size_t dispatched = 0;
    while (!stopped_ && dispatched < max_dispatch_per_tick_) {
        auto item = take_next_eligible(scheduler_.now_ms());
        if (!item) {
            break;
        }
        dispatch(*item);
        ++dispatched;
    }

    if (dispatched >= max_dispatch_per_tick_ && !queue_.empty()) {
        spdlog::warn("[Orchestrator] Dispatch limit of {} reached in one tick, {} item(s) deferred",
                     max_dispatch_per_tick_, queue_.size());
    }

    in_tick_ = false;
    return dispatched;
}

void Orchestrator::set_max_dispatch_per_tick(size_t limit) {
    if (limit == 0) {
        throw ValidationError("max_dispatch_per_tick must be greater than 0");
    }
    max_dispatch_per_tick_ = limit;
}

void Orchestrator::start(uint32_t tick_interval_ms) {
    if (stopped_) {
        spdlog::warn("[Orchestrator] start() after stop() ignored");
        return;
    }
    tick_timer_.start_interval(tick_interval_ms, [this]() { tick(); });
    spdlog::debug("[Orchestrator] Ticking every {}ms", tick_interval_ms);
}

void Orchestrator::stop() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    tick_timer_.reset();
    spdlog::debug("[Orchestrator] Stopped with {} item(s) still queued", queue_.size());
}

bool Orchestrator::is_queued(QueueItemId id) const {
    return std::any_of(queue_.begin(), queue_.end(),
                       [id](const QueueItem& item) { return item.id == id; });
}

std::optional<QueueItem> Orchestrator::find_item(QueueItemId id) const {
    auto it = std::find_if(queue_.begin(), queue_.end(),
                           [id](const QueueItem& item) { return item.id == id; });
    if (it == queue_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::function<void(const json&)> Orchestrator::use_global_state(const std::string& key,
                                                                const json& initial_value) {
    auto setter = [this, key](const json& value) {
        enqueue(events::STATE_UPDATE, channels::STATE, PriorityClass::Immediate,
                {{"key", key}, {"value", value}});
    };
    setter(initial_value);
    return setter;
}

} // namespace kiosk
