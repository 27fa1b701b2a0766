// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "scheduler.h"

#include "lvgl/lvgl.h"

#include <vector>

namespace kiosk {

class KioskApp;
class LvglElementRegistry;

/**
 * @brief Time source over lv_tick_get() that survives its 32-bit wrap
 */
LoopScheduler::TimeSource lvgl_time_source();

/**
 * @brief Pump scheduler from an lv_timer (the orchestrator tick rides on it)
 *
 * @param scheduler Must outlive the returned timer
 * @param period_ms lv_timer period
 * @return The created timer; delete it with lv_timer_delete() before the scheduler goes away
 */
lv_timer_t* lvgl_bind_scheduler(LoopScheduler& scheduler, uint32_t period_ms = 5);

/**
 * @brief Feeds LVGL input devices into the kiosk input channel
 *
 * Pointer presses publish pointer-down {x, y} and activity {type: "touchstart",
 * targetId}; keypad presses publish activity {type: "keydown"}. targetId is
 * resolved through registry when given.
 *
 * Callbacks are attached on construction and removed on destruction, so the
 * binding must not outlive app or the input devices it bound.
 */
class LvglInputBinding {
  public:
    explicit LvglInputBinding(KioskApp& app, LvglElementRegistry* registry = nullptr);
    ~LvglInputBinding();

    LvglInputBinding(const LvglInputBinding&) = delete;
    LvglInputBinding& operator=(const LvglInputBinding&) = delete;

    /**
     * @brief Detach from every bound input device (idempotent)
     */
    void unbind();

    size_t bound_count() const {
        return bound_.size();
    }

    KioskApp& app() const {
        return app_;
    }

    LvglElementRegistry* registry() const {
        return registry_;
    }

  private:
    struct Bound {
        lv_indev_t* indev;
        lv_event_cb_t callback;
    };

    KioskApp& app_;
    LvglElementRegistry* registry_;
    std::vector<Bound> bound_;
};

} // namespace kiosk
