// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "queue_item.h"

namespace kiosk {

PriorityClass parse_priority(const std::string& name) {
    if (name == "scheduled") {
        return PriorityClass::Scheduled;
    }
    if (name == "immediate") {
        return PriorityClass::Immediate;
    }
    if (name == "animation") {
        return PriorityClass::Animation;
    }
    return PriorityClass::Default;
}

const char* priority_name(PriorityClass priority) {
    switch (priority) {
    case PriorityClass::Scheduled:
        return "scheduled";
    case PriorityClass::Immediate:
        return "immediate";
    case PriorityClass::Animation:
        return "animation";
    case PriorityClass::Default:
        return "default";
    }
    return "default";
}

} // namespace kiosk
