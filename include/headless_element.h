// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "visual_element.h"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace kiosk {

/**
 * @brief VisualElement without a display
 *
 * Keeps class/style state in memory and records every call so tests and the
 * replay tool can inspect what the navigation layer did. The transition-end
 * signal only fires when fire_transition_end() is called.
 */
class HeadlessElement : public VisualElement {
  public:
    explicit HeadlessElement(std::string id);

    const std::string& element_id() const override {
        return id_;
    }

    void add_class(const std::string& name) override;
    void remove_class(const std::string& name) override;
    bool has_class(const std::string& name) const override;

    void set_style(const std::string& property, const std::string& value) override;
    std::string get_style(const std::string& property) const override;

    void on_transition_end(std::function<void()> callback) override;
    void clear_transition_end() override;

    /**
     * @brief Simulate the end of a visual transition
     * @return true if an armed callback was invoked
     */
    bool fire_transition_end();

    bool transition_end_armed() const {
        return static_cast<bool>(transition_end_);
    }

    /**
     * @brief Whether the element is currently shown (no nav-hidden class, display not none)
     */
    bool is_visible() const;

    const std::set<std::string>& classes() const {
        return classes_;
    }

    /// "add:fade-in", "remove:fade-in", "style:opacity=1", "arm", "disarm"
    const std::vector<std::string>& calls() const {
        return calls_;
    }

    void clear_calls() {
        calls_.clear();
    }

  private:
    std::string id_;
    std::set<std::string> classes_;
    std::map<std::string, std::string> styles_;
    std::function<void()> transition_end_;
    std::vector<std::string> calls_;
};

/**
 * @brief ElementProvider that owns a set of HeadlessElements
 */
class HeadlessElementRegistry : public ElementProvider {
  public:
    /**
     * @brief Create (or return the existing) element for id
     */
    HeadlessElement& create(const std::string& id);

    VisualElement* find_element(const std::string& id) override;

    HeadlessElement* find_headless(const std::string& id);

    std::vector<std::string> ids() const;

  private:
    std::map<std::string, std::unique_ptr<HeadlessElement>> elements_;
};

} // namespace kiosk
