// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace kiosk {

using json = nlohmann::json;
using QueueItemId = uint64_t;

/**
 * @brief Dispatch-order bucket, highest first
 *
 * Enumerator values are the rank used for ordering (lower dispatches first).
 */
enum class PriorityClass {
    Scheduled = 0, ///< Held until eligible_at, then ahead of everything else
    Immediate = 1,
    Animation = 2,
    Default = 3,
};

/**
 * @brief Parse a priority name ("scheduled", "immediate", "animation", "default")
 *
 * Unrecognized names map to Default, matching the queue's treatment of
 * unknown priorities.
 */
PriorityClass parse_priority(const std::string& name);

const char* priority_name(PriorityClass priority);

/**
 * @brief One pending unit of work in the Orchestrator queue
 */
struct QueueItem {
    QueueItemId id = 0;
    std::string channel_name;
    std::string event_name;
    PriorityClass priority = PriorityClass::Default;
    uint64_t eligible_at = 0;             ///< ms, Scheduler clock
    std::optional<uint64_t> expiry;       ///< Carried metadata, never enforced by the queue
    json payload = json::object();
    uint64_t sequence = 0;                ///< Enqueue order, breaks eligible_at ties
};

} // namespace kiosk
