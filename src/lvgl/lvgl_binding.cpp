// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_binding.h"

#include "kiosk_app.h"
#include "lvgl_visual_element.h"

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace kiosk {

namespace {

void pointer_pressed_cb(lv_event_t* e) {
    auto* binding = static_cast<LvglInputBinding*>(lv_event_get_user_data(e));
    lv_indev_t* indev = static_cast<lv_indev_t*>(lv_event_get_target(e));
    if (!binding || !indev) {
        return;
    }

    lv_point_t point;
    lv_indev_get_point(indev, &point);

    json activity = {{"type", "touchstart"}};
    if (binding->registry()) {
        std::string target = binding->registry()->id_for(lv_indev_get_active_obj());
        if (!target.empty()) {
            activity["targetId"] = target;
        }
    }

    binding->app().publish_input(events::ACTIVITY, activity);
    binding->app().publish_input(events::POINTER_DOWN, {{"x", point.x}, {"y", point.y}});
}

void key_pressed_cb(lv_event_t* e) {
    auto* binding = static_cast<LvglInputBinding*>(lv_event_get_user_data(e));
    if (binding) {
        binding->app().publish_input(events::ACTIVITY, {{"type", "keydown"}});
    }
}

} // namespace

LoopScheduler::TimeSource lvgl_time_source() {
    struct Clock {
        uint32_t last;
        uint64_t total;
    };
    auto clock = std::make_shared<Clock>(Clock{lv_tick_get(), 0});
    return [clock]() {
        uint32_t now = lv_tick_get();
        clock->total += static_cast<uint32_t>(now - clock->last);
        clock->last = now;
        return clock->total;
    };
}

lv_timer_t* lvgl_bind_scheduler(LoopScheduler& scheduler, uint32_t period_ms) {
    lv_timer_t* timer = lv_timer_create(
        [](lv_timer_t* t) {
            auto* s = static_cast<LoopScheduler*>(lv_timer_get_user_data(t));
            s->run_due();
        },
        period_ms, &scheduler);
    spdlog::debug("[LvglBinding] Scheduler pumped every {}ms", period_ms);
    return timer;
}

LvglInputBinding::LvglInputBinding(KioskApp& app, LvglElementRegistry* registry)
    : app_(app), registry_(registry) {
    for (lv_indev_t* indev = lv_indev_get_next(nullptr); indev; indev = lv_indev_get_next(indev)) {
        lv_event_cb_t callback = nullptr;
        switch (lv_indev_get_type(indev)) {
        case LV_INDEV_TYPE_POINTER:
            callback = pointer_pressed_cb;
            break;
        case LV_INDEV_TYPE_KEYPAD:
        case LV_INDEV_TYPE_ENCODER:
            callback = key_pressed_cb;
            break;
        default:
            break;
        }
        if (callback) {
            lv_indev_add_event_cb(indev, callback, LV_EVENT_PRESSED, this);
            bound_.push_back({indev, callback});
        }
    }
    spdlog::info("[LvglBinding] Bound {} input device(s)", bound_.size());
}

LvglInputBinding::~LvglInputBinding() {
    unbind();
}

void LvglInputBinding::unbind() {
    for (const auto& b : bound_) {
        lv_indev_remove_event_cb_with_user_data(b.indev, b.callback, this);
    }
    if (!bound_.empty()) {
        spdlog::debug("[LvglBinding] Unbound {} input device(s)", bound_.size());
    }
    bound_.clear();
}

} // namespace kiosk
