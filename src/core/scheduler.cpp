// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "scheduler.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <vector>

namespace kiosk {

namespace {

uint64_t steady_now_ms() {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

} // namespace

LoopScheduler::LoopScheduler() : time_source_(steady_now_ms) {}

LoopScheduler::LoopScheduler(TimeSource time_source) : time_source_(std::move(time_source)) {
    if (!time_source_) {
        time_source_ = steady_now_ms;
    }
}

uint64_t LoopScheduler::now_ms() const {
    return time_source_();
}

TimerId LoopScheduler::set_timeout(uint32_t delay_ms, TimerCallback callback) {
    return add_timer(delay_ms, 0, std::move(callback));
}

TimerId LoopScheduler::set_interval(uint32_t period_ms, TimerCallback callback) {
    if (period_ms == 0) {
        spdlog::warn("[LoopScheduler] Interval of 0ms requested, using 1ms");
        period_ms = 1;
    }
    return add_timer(period_ms, period_ms, std::move(callback));
}

TimerId LoopScheduler::add_timer(uint32_t delay_ms, uint32_t period_ms, TimerCallback callback) {
    if (!callback) {
        spdlog::warn("[LoopScheduler] Ignoring timer without callback");
        return INVALID_TIMER;
    }
    TimerId id = next_id_++;
    timers_[id] = Timer{now_ms() + delay_ms, period_ms, std::move(callback)};
    spdlog::trace("[LoopScheduler] Timer {} armed (delay={}ms, period={}ms)", id, delay_ms,
                  period_ms);
    return id;
}

bool LoopScheduler::cancel(TimerId id) {
    if (id == INVALID_TIMER) {
        return false;
    }
    return timers_.erase(id) > 0;
}

uint64_t LoopScheduler::next_due() const {
    uint64_t earliest = 0;
    for (const auto& [id, timer] : timers_) {
        if (earliest == 0 || timer.due_ms < earliest) {
            earliest = timer.due_ms;
        }
    }
    return earliest;
}

size_t LoopScheduler::run_due() {
    const uint64_t now = now_ms();

    // Snapshot due timers first: anything armed by a callback waits for the next pump
    std::vector<std::pair<uint64_t, TimerId>> due;
    for (const auto& [id, timer] : timers_) {
        if (timer.due_ms <= now) {
            due.emplace_back(timer.due_ms, id);
        }
    }
    std::sort(due.begin(), due.end());

    size_t fired = 0;
    for (const auto& [due_ms, id] : due) {
        auto it = timers_.find(id);
        if (it == timers_.end()) {
            continue; // cancelled by an earlier callback
        }

        TimerCallback callback;
        if (it->second.period_ms > 0) {
            callback = it->second.callback;
            uint64_t next = it->second.due_ms + it->second.period_ms;
            it->second.due_ms = (next <= now) ? now + it->second.period_ms : next;
        } else {
            callback = std::move(it->second.callback);
            timers_.erase(it);
        }

        callback();
        ++fired;
    }
    return fired;
}

} // namespace kiosk
