// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_visual_element.h"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace kiosk {

namespace {

// LVGL scale units: 256 = 100%
constexpr int32_t SCALE_NONE = 256;
constexpr int32_t SCALE_SMALL = 205;

lv_anim_path_cb_t path_for_easing(const std::string& easing) {
    if (easing == "linear")
        return lv_anim_path_linear;
    if (easing == "ease-in")
        return lv_anim_path_ease_in;
    if (easing == "ease-out")
        return lv_anim_path_ease_out;
    return lv_anim_path_ease_in_out;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.compare(0, strlen(prefix), prefix) == 0;
}

// "translateX(-100%)" / "translateY(20px)": value in px, % of extent
bool parse_translate(const std::string& value, const char* fn, int32_t extent, int32_t& out) {
    if (!starts_with(value, fn)) {
        return false;
    }
    const char* arg = value.c_str() + strlen(fn);
    char* end = nullptr;
    double v = strtod(arg, &end);
    if (end == arg) {
        return false;
    }
    out = (*end == '%') ? static_cast<int32_t>(v * extent / 100.0) : static_cast<int32_t>(v);
    return true;
}

} // namespace

LvglVisualElement::LvglVisualElement(std::string id, lv_obj_t* obj)
    : id_(std::move(id)), obj_(obj) {
    if (obj_) {
        lv_obj_set_style_transform_pivot_x(obj_, LV_PCT(50), LV_PART_MAIN);
        lv_obj_set_style_transform_pivot_y(obj_, LV_PCT(50), LV_PART_MAIN);
    }
}

LvglVisualElement::~LvglVisualElement() {
    transition_end_ = nullptr;
    for (auto& entry : running_) {
        lv_anim_delete(entry.first, nullptr);
    }
    running_.clear();
}

void LvglVisualElement::detach() {
    for (auto& entry : running_) {
        lv_anim_delete(entry.first, nullptr);
    }
    running_.clear();
    obj_ = nullptr;
}

// ============================================================================
// Classes
// ============================================================================

void LvglVisualElement::add_class(const std::string& name) {
    if (!classes_.insert(name).second) {
        return;
    }
    if (!obj_) {
        return;
    }
    if (name.find("-active") != std::string::npos) {
        apply_active(name);
    } else if (name.find("-out") != std::string::npos) {
        apply_exit(name);
    } else if (name.find("-in") != std::string::npos) {
        apply_start_state(name);
    }
}

void LvglVisualElement::remove_class(const std::string& name) {
    // Geometry stays where the animation left it; hide/show reset it
    classes_.erase(name);
}

bool LvglVisualElement::has_class(const std::string& name) const {
    return classes_.count(name) > 0;
}

void LvglVisualElement::apply_start_state(const std::string& name) {
    const int32_t w = lv_obj_get_width(obj_);
    const int32_t h = lv_obj_get_height(obj_);

    if (name == "slide-in-left") {
        set_prop(Prop::TranslateX, -w);
    } else if (name == "slide-in-right") {
        set_prop(Prop::TranslateX, w);
    } else if (name == "slide-in-up") {
        set_prop(Prop::TranslateY, h);
    } else if (name == "slide-in-down") {
        set_prop(Prop::TranslateY, -h);
    } else if (name == "fade-in") {
        set_prop(Prop::Opa, LV_OPA_TRANSP);
    } else if (name == "scale-in") {
        set_prop(Prop::Scale, SCALE_SMALL);
        set_prop(Prop::Opa, LV_OPA_TRANSP);
    } else if (name == "flip-in") {
        set_prop(Prop::ScaleX, 0);
    }
}

void LvglVisualElement::apply_exit(const std::string& name) {
    const int32_t w = lv_obj_get_width(obj_);
    const int32_t h = lv_obj_get_height(obj_);

    if (name == "slide-out-left") {
        start_anim(Prop::TranslateX, 0, -w);
    } else if (name == "slide-out-right") {
        start_anim(Prop::TranslateX, 0, w);
    } else if (name == "slide-out-up") {
        start_anim(Prop::TranslateY, 0, -h);
    } else if (name == "slide-out-down") {
        start_anim(Prop::TranslateY, 0, h);
    } else if (name == "fade-out") {
        start_anim(Prop::Opa, lv_obj_get_style_opa(obj_, LV_PART_MAIN), LV_OPA_TRANSP);
    } else if (name == "scale-out") {
        start_anim(Prop::Scale, SCALE_NONE, SCALE_SMALL);
        start_anim(Prop::Opa, lv_obj_get_style_opa(obj_, LV_PART_MAIN), LV_OPA_TRANSP);
    } else if (name == "flip-out") {
        start_anim(Prop::ScaleX, SCALE_NONE, 0);
    }
}

void LvglVisualElement::apply_active(const std::string& name) {
    if (name == "slide-active") {
        int32_t x = lv_obj_get_style_translate_x(obj_, LV_PART_MAIN);
        int32_t y = lv_obj_get_style_translate_y(obj_, LV_PART_MAIN);
        if (x != 0) {
            start_anim(Prop::TranslateX, x, 0);
        }
        if (y != 0 || x == 0) {
            start_anim(Prop::TranslateY, y, 0);
        }
    } else if (name == "fade-active") {
        start_anim(Prop::Opa, lv_obj_get_style_opa(obj_, LV_PART_MAIN), LV_OPA_COVER);
    } else if (name == "scale-active") {
        start_anim(Prop::Scale, SCALE_SMALL, SCALE_NONE);
        start_anim(Prop::Opa, lv_obj_get_style_opa(obj_, LV_PART_MAIN), LV_OPA_COVER);
    } else if (name == "flip-active") {
        start_anim(Prop::ScaleX, 0, SCALE_NONE);
    }
}

// ============================================================================
// Styles
// ============================================================================

void LvglVisualElement::set_style(const std::string& property, const std::string& value) {
    styles_[property] = value;
    if (!obj_) {
        return;
    }

    const bool animate = transition_ms_ > 0 && static_cast<bool>(transition_end_);

    if (property == "transition") {
        unsigned ms = 0;
        char easing[32] = {0};
        if (value != "none" && sscanf(value.c_str(), "all %ums %31s", &ms, easing) >= 1) {
            transition_ms_ = ms;
            path_ = path_for_easing(easing);
        } else {
            transition_ms_ = 0;
        }
    } else if (property == "display") {
        set_hidden(value == "none");
    } else if (property == "visibility") {
        set_hidden(value == "hidden");
    } else if (property == "opacity") {
        auto opa = static_cast<int32_t>(strtod(value.c_str(), nullptr) * LV_OPA_COVER);
        opa = opa < 0 ? 0 : (opa > LV_OPA_COVER ? LV_OPA_COVER : opa);
        if (animate) {
            start_anim(Prop::Opa, lv_obj_get_style_opa(obj_, LV_PART_MAIN), opa);
        } else {
            set_prop(Prop::Opa, opa);
        }
    } else if (property == "transform") {
        int32_t target = 0;
        if (value == "none") {
            set_prop(Prop::TranslateX, 0);
            set_prop(Prop::TranslateY, 0);
            set_prop(Prop::Scale, SCALE_NONE);
            set_prop(Prop::ScaleX, SCALE_NONE);
        } else if (parse_translate(value, "translateX(", lv_obj_get_width(obj_), target)) {
            if (animate) {
                start_anim(Prop::TranslateX, lv_obj_get_style_translate_x(obj_, LV_PART_MAIN),
                           target);
            } else {
                set_prop(Prop::TranslateX, target);
            }
        } else if (parse_translate(value, "translateY(", lv_obj_get_height(obj_), target)) {
            if (animate) {
                start_anim(Prop::TranslateY, lv_obj_get_style_translate_y(obj_, LV_PART_MAIN),
                           target);
            } else {
                set_prop(Prop::TranslateY, target);
            }
        } else if (starts_with(value, "scale(")) {
            auto scale = static_cast<int32_t>(strtod(value.c_str() + 6, nullptr) * SCALE_NONE);
            if (animate) {
                start_anim(Prop::Scale, SCALE_NONE, scale);
            } else {
                set_prop(Prop::Scale, scale);
            }
        } else {
            spdlog::debug("[LvglVisualElement] '{}': unsupported transform '{}'", id_, value);
        }
    }
}

std::string LvglVisualElement::get_style(const std::string& property) const {
    auto it = styles_.find(property);
    return it == styles_.end() ? std::string() : it->second;
}

void LvglVisualElement::set_hidden(bool hidden) {
    if (hidden) {
        lv_obj_add_flag(obj_, LV_OBJ_FLAG_HIDDEN);
    } else {
        lv_obj_remove_flag(obj_, LV_OBJ_FLAG_HIDDEN);
    }
}

// ============================================================================
// Animation
// ============================================================================

void LvglVisualElement::on_transition_end(std::function<void()> callback) {
    transition_end_ = std::move(callback);
}

void LvglVisualElement::clear_transition_end() {
    transition_end_ = nullptr;
}

void LvglVisualElement::set_prop(Prop prop, int32_t value) {
    switch (prop) {
    case Prop::TranslateX:
        lv_obj_set_style_translate_x(obj_, value, LV_PART_MAIN);
        break;
    case Prop::TranslateY:
        lv_obj_set_style_translate_y(obj_, value, LV_PART_MAIN);
        break;
    case Prop::Opa:
        lv_obj_set_style_opa(obj_, static_cast<lv_opa_t>(value), LV_PART_MAIN);
        break;
    case Prop::Scale:
        lv_obj_set_style_transform_scale(obj_, value, LV_PART_MAIN);
        break;
    case Prop::ScaleX:
        lv_obj_set_style_transform_scale_x(obj_, value, LV_PART_MAIN);
        break;
    }
}

void LvglVisualElement::start_anim(Prop prop, int32_t from, int32_t to) {
    // One run per property
    for (auto it = running_.begin(); it != running_.end();) {
        if (it->first->prop == prop) {
            lv_anim_delete(it->first, nullptr);
            it = running_.erase(it);
        } else {
            ++it;
        }
    }

    if (transition_ms_ == 0) {
        set_prop(prop, to);
        return;
    }

    auto ctx = std::make_unique<AnimContext>(AnimContext{this, prop});
    AnimContext* raw = ctx.get();
    running_.emplace(raw, std::move(ctx));

    lv_anim_t anim;
    lv_anim_init(&anim);
    lv_anim_set_var(&anim, raw);
    lv_anim_set_values(&anim, from, to);
    lv_anim_set_duration(&anim, transition_ms_);
    lv_anim_set_path_cb(&anim, path_);
    lv_anim_set_exec_cb(&anim, anim_exec_cb);
    lv_anim_set_completed_cb(&anim, anim_completed_cb);
    lv_anim_start(&anim);
}

void LvglVisualElement::anim_exec_cb(void* var, int32_t value) {
    auto* ctx = static_cast<AnimContext*>(var);
    if (ctx->self->obj_) {
        ctx->self->set_prop(ctx->prop, value);
    }
}

void LvglVisualElement::anim_completed_cb(lv_anim_t* anim) {
    auto* ctx = static_cast<AnimContext*>(anim->var);
    LvglVisualElement* self = ctx->self;
    self->running_.erase(ctx);
    if (self->running_.empty()) {
        self->handle_anim_completed();
    }
}

void LvglVisualElement::handle_anim_completed() {
    if (!transition_end_) {
        return;
    }
    auto callback = std::move(transition_end_);
    transition_end_ = nullptr;
    callback();
}

// ============================================================================
// LvglElementRegistry
// ============================================================================

LvglVisualElement& LvglElementRegistry::add(const std::string& id, lv_obj_t* obj) {
    auto element = std::make_unique<LvglVisualElement>(id, obj);
    LvglVisualElement& ref = *element;
    elements_[id] = std::move(element);
    spdlog::debug("[LvglElementRegistry] Added '{}'", id);
    return ref;
}

VisualElement* LvglElementRegistry::find_element(const std::string& id) {
    auto it = elements_.find(id);
    return it == elements_.end() ? nullptr : it->second.get();
}

std::string LvglElementRegistry::id_for(lv_obj_t* obj) const {
    for (lv_obj_t* cur = obj; cur; cur = lv_obj_get_parent(cur)) {
        for (const auto& entry : elements_) {
            if (entry.second->obj() == cur) {
                return entry.first;
            }
        }
    }
    return std::string();
}

} // namespace kiosk
