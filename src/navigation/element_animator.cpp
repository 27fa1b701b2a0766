// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "element_animator.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <exception>

namespace kiosk {

namespace {

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\n");
    if (first == std::string::npos) {
        return {};
    }
    auto last = s.find_last_not_of(" \t\n");
    return s.substr(first, last - first + 1);
}

const char* exit_class(const TransitionConfig& config) {
    switch (*config.type) {
    case TransitionType::Slide:
        switch (config.direction.value_or(TransitionDirection::Left)) {
        case TransitionDirection::Left:
            return "slide-out-left";
        case TransitionDirection::Right:
            return "slide-out-right";
        case TransitionDirection::Up:
            return "slide-out-up";
        case TransitionDirection::Down:
            return "slide-out-down";
        }
        return "slide-out-left";
    case TransitionType::Fade:
        return "fade-out";
    case TransitionType::Scale:
        return "scale-out";
    case TransitionType::Flip:
        return "flip-out";
    default:
        return nullptr;
    }
}

const char* enter_class(const TransitionConfig& config) {
    switch (*config.type) {
    case TransitionType::Slide:
        switch (config.direction.value_or(TransitionDirection::Right)) {
        case TransitionDirection::Left:
            return "slide-in-left";
        case TransitionDirection::Right:
            return "slide-in-right";
        case TransitionDirection::Up:
            return "slide-in-up";
        case TransitionDirection::Down:
            return "slide-in-down";
        }
        return "slide-in-right";
    case TransitionType::Fade:
        return "fade-in";
    case TransitionType::Scale:
        return "scale-in";
    case TransitionType::Flip:
        return "flip-in";
    default:
        return nullptr;
    }
}

const char* active_class(TransitionType type) {
    switch (type) {
    case TransitionType::Slide:
        return "slide-active";
    case TransitionType::Fade:
        return "fade-active";
    case TransitionType::Scale:
        return "scale-active";
    case TransitionType::Flip:
        return "flip-active";
    default:
        return nullptr;
    }
}

} // namespace

ElementAnimator::ElementAnimator(Scheduler& scheduler) : scheduler_(scheduler) {}

ElementAnimator::~ElementAnimator() {
    for (auto& [id, pending] : pending_) {
        try {
            pending->element->clear_transition_end();
        } catch (const std::exception& e) {
            spdlog::warn("[ElementAnimator] Failed to disarm '{}' on shutdown: {}",
                         pending->element->element_id(), e.what());
        }
    }
}

const std::vector<std::string>& ElementAnimator::animation_classes() {
    static const std::vector<std::string> classes = {
        "slide-out-left", "slide-out-right", "slide-out-up", "slide-out-down",
        "slide-in-left",  "slide-in-right",  "slide-in-up",  "slide-in-down",
        "slide-active",   "fade-out",        "fade-in",      "fade-active",
        "scale-out",      "scale-in",        "scale-active", "flip-out",
        "flip-in",        "flip-active",
    };
    return classes;
}

void ElementAnimator::clear_animation_classes(VisualElement& element) {
    for (const auto& name : animation_classes()) {
        element.remove_class(name);
    }
}

void ElementAnimator::apply_custom_style(VisualElement& element, const std::string& style) {
    size_t start = 0;
    while (start < style.size()) {
        size_t end = style.find(';', start);
        if (end == std::string::npos) {
            end = style.size();
        }
        std::string decl = style.substr(start, end - start);
        size_t colon = decl.find(':');
        if (colon != std::string::npos) {
            std::string property = trim(decl.substr(0, colon));
            std::string value = trim(decl.substr(colon + 1));
            if (!property.empty()) {
                element.set_style(property, value);
            }
        }
        start = end + 1;
    }
}

uint64_t ElementAnimator::begin(VisualElement& element, const TransitionConfig& config,
                                CompletionCallback done, FailCallback fail) {
    int duration = config.duration_ms.value_or(DEFAULT_DURATION_MS);
    if (duration <= 0) {
        duration = DEFAULT_DURATION_MS;
    }
    element.set_style("transition", fmt::format("all {}ms {}", duration,
                                                config.easing.value_or("ease-in-out")));

    uint64_t id = next_id_++;
    auto pending = std::make_unique<Pending>();
    pending->element = &element;
    pending->fallback = TimerGuard(scheduler_);
    pending->frame = TimerGuard(scheduler_);
    pending->done = std::move(done);
    pending->fail = std::move(fail);
    pending_.emplace(id, std::move(pending));

    try {
        element.on_transition_end([this, id]() { settle(id); });
    } catch (const std::exception&) {
        pending_.erase(id);
        throw;
    }
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return id;
    }
    it->second->fallback.start_timeout(static_cast<uint32_t>(duration) + FALLBACK_GRACE_MS, [this, id]() {
        auto it = pending_.find(id);
        if (it != pending_.end()) {
            it->second->fallback.clear();
            spdlog::debug("[ElementAnimator] '{}' transition end not seen, fallback fired",
                          it->second->element->element_id());
        }
        settle(id);
    });
    return id;
}

void ElementAnimator::animate_out(VisualElement& element, const TransitionConfig& config,
                                  CompletionCallback done, FailCallback fail) {
    TransitionType type = config.type.value_or(TransitionType::Snap);
    spdlog::trace("[ElementAnimator] '{}' out ({})", element.element_id(),
                  transition_type_name(type));

    if (type == TransitionType::Snap) {
        element.set_style("transition", "none");
        element.set_style("opacity", "0");
        element.set_style("visibility", "hidden");
        if (done) {
            done();
        }
        return;
    }

    uint64_t id = begin(element, config, std::move(done), std::move(fail));
    try {
        if (type == TransitionType::Custom) {
            if (config.custom_style) {
                apply_custom_style(element, *config.custom_style);
            }
        } else {
            element.add_class(exit_class(config));
        }
    } catch (const std::exception&) {
        // Caller reports it; drop our bookkeeping so the timers never fire
        pending_.erase(id);
        throw;
    }
}

void ElementAnimator::animate_in(VisualElement& element, const TransitionConfig& config,
                                 CompletionCallback done, FailCallback fail) {
    TransitionType type = config.type.value_or(TransitionType::Snap);
    spdlog::trace("[ElementAnimator] '{}' in ({})", element.element_id(),
                  transition_type_name(type));

    if (type == TransitionType::Snap) {
        element.set_style("transition", "none");
        element.set_style("opacity", "1");
        element.set_style("visibility", "visible");
        element.set_style("transform", "none");
        clear_animation_classes(element);
        if (done) {
            done();
        }
        return;
    }

    uint64_t id = begin(element, config, std::move(done), std::move(fail));
    const char* start_class = enter_class(config);
    try {
        if (start_class) {
            element.add_class(start_class);
        }
    } catch (const std::exception&) {
        pending_.erase(id);
        throw;
    }

    // An element may report the end as soon as a class lands
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return;
    }

    // Next pump: move from the start state to the active state
    std::string start_name = start_class ? start_class : "";
    it->second->frame.start_timeout(0, [this, id, type, start_name]() {
        auto found = pending_.find(id);
        if (found == pending_.end()) {
            return;
        }
        found->second->frame.clear();
        VisualElement* target = found->second->element;
        try {
            if (!start_name.empty()) {
                target->remove_class(start_name);
            }
            const char* active = active_class(type);
            if (active && pending_.count(id) > 0) {
                target->add_class(active);
            }
        } catch (const std::exception& e) {
            abort(id, e.what());
        }
    });
}

void ElementAnimator::settle(uint64_t id) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return; // the other signal already settled it
    }
    std::unique_ptr<Pending> pending = std::move(it->second);
    pending_.erase(it);
    pending->fallback.reset();
    pending->frame.reset();

    try {
        pending->element->clear_transition_end();
        clear_animation_classes(*pending->element);
    } catch (const std::exception& e) {
        spdlog::error("[ElementAnimator] Cleanup of '{}' failed: {}",
                      pending->element->element_id(), e.what());
        if (pending->fail) {
            pending->fail(e.what());
        }
        return;
    }

    if (pending->done) {
        pending->done();
    }
}

void ElementAnimator::abort(uint64_t id, const std::string& what) {
    auto it = pending_.find(id);
    if (it == pending_.end()) {
        return;
    }
    std::unique_ptr<Pending> pending = std::move(it->second);
    pending_.erase(it);
    pending->fallback.reset();
    pending->frame.reset();

    spdlog::error("[ElementAnimator] Animation of '{}' failed: {}",
                  pending->element->element_id(), what);
    try {
        pending->element->clear_transition_end();
    } catch (const std::exception& e) {
        spdlog::warn("[ElementAnimator] Failed to disarm '{}': {}",
                     pending->element->element_id(), e.what());
    }
    if (pending->fail) {
        pending->fail(what);
    }
}

} // namespace kiosk
