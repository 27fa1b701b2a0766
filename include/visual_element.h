// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file visual_element.h
 * @brief Rendering collaborator contract for pages and views
 *
 * @pattern Abstract interface; HeadlessElement records calls, LvglVisualElement drives lv_obj_t
 * @threading Main thread only
 * @gotchas on_transition_end() is one-shot and replaces any previously armed callback.
 *          Implementations must not invoke it synchronously from inside on_transition_end().
 */

#pragma once

#include <functional>
#include <string>

namespace kiosk {

/**
 * @brief One renderable page or view as seen by the navigation layer
 *
 * State classes ("nav-hidden", "fade-in", "slide-out-left", ...) and inline
 * styles ("display", "visibility", "opacity", "transform", "transition") are
 * the whole vocabulary the coordinator uses. How a class is realized on
 * screen is up to the implementation.
 */
class VisualElement {
  public:
    virtual ~VisualElement() = default;

    virtual const std::string& element_id() const = 0;

    virtual void add_class(const std::string& name) = 0;
    virtual void remove_class(const std::string& name) = 0;
    virtual bool has_class(const std::string& name) const = 0;

    virtual void set_style(const std::string& property, const std::string& value) = 0;

    /**
     * @brief Current inline style value, empty when unset
     */
    virtual std::string get_style(const std::string& property) const = 0;

    /**
     * @brief Arm a one-shot "visual transition finished" callback
     */
    virtual void on_transition_end(std::function<void()> callback) = 0;

    /**
     * @brief Disarm the pending transition-finished callback, if any
     */
    virtual void clear_transition_end() = 0;
};

/**
 * @brief Element lookup used when pages/views are registered by id over a channel
 */
class ElementProvider {
  public:
    virtual ~ElementProvider() = default;

    /**
     * @return Element with that id, or nullptr when unknown
     */
    virtual VisualElement* find_element(const std::string& id) = 0;
};

} // namespace kiosk
