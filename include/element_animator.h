// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file element_animator.h
 * @brief Enter/exit animation protocol for one VisualElement
 *
 * @pattern Class-driven animation with a timer fallback: the element's transition-end
 *          signal and a (duration + 50ms) timer race, first one settles
 * @threading Main thread only
 * @gotchas animate_in/animate_out may throw synchronously when the element throws.
 *          Failures after the call returns are reported through the fail callback.
 */

#pragma once

#include "kiosk_error.h"
#include "scheduler.h"
#include "transition_config.h"
#include "visual_element.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace kiosk {

class ElementAnimator {
  public:
    using FailCallback = std::function<void(const std::string& what)>;

    /// Extra time given to the transition-end signal before the fallback fires
    static constexpr uint32_t FALLBACK_GRACE_MS = 50;
    /// Duration used by custom transitions without an explicit duration
    static constexpr int DEFAULT_DURATION_MS = 300;

    explicit ElementAnimator(Scheduler& scheduler);
    ~ElementAnimator();

    ElementAnimator(const ElementAnimator&) = delete;
    ElementAnimator& operator=(const ElementAnimator&) = delete;

    /**
     * @brief Play the exit animation; done runs once the element is fully out
     *
     * Snap completes synchronously.
     */
    void animate_out(VisualElement& element, const TransitionConfig& config,
                     CompletionCallback done, FailCallback fail);

    /**
     * @brief Play the enter animation; done runs once the element is fully in
     *
     * The start-state class is swapped for the active class one scheduler
     * pump later so the renderer sees both states.
     */
    void animate_in(VisualElement& element, const TransitionConfig& config,
                    CompletionCallback done, FailCallback fail);

    /**
     * @brief Number of animations waiting for their transition end or fallback
     */
    size_t active_count() const {
        return pending_.size();
    }

    /**
     * @brief Remove every animation state class from element
     */
    static void clear_animation_classes(VisualElement& element);

    static const std::vector<std::string>& animation_classes();

  private:
    struct Pending {
        VisualElement* element = nullptr;
        TimerGuard fallback;
        TimerGuard frame;
        CompletionCallback done;
        FailCallback fail;
    };

    uint64_t begin(VisualElement& element, const TransitionConfig& config,
                   CompletionCallback done, FailCallback fail);
    void settle(uint64_t id);
    void abort(uint64_t id, const std::string& what);

    static void apply_custom_style(VisualElement& element, const std::string& style);

    Scheduler& scheduler_;
    std::map<uint64_t, std::unique_ptr<Pending>> pending_;
    uint64_t next_id_ = 1;
};

} // namespace kiosk
