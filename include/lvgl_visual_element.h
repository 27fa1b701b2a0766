// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "visual_element.h"

#include "lvgl/lvgl.h"

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace kiosk {

/**
 * @file lvgl_visual_element.h
 * @brief VisualElement backed by an lv_obj_t
 *
 * @pattern Animation classes map to lv_anim runs on translate/opa/scale
 *          styles; the run's completed callback is the transition-end signal.
 * @threading LVGL thread only
 * @gotchas The element does not own the lv_obj_t. Destroy the element before
 *          deleting the object, or call detach() from an LV_EVENT_DELETE handler.
 */
class LvglVisualElement : public VisualElement {
  public:
    LvglVisualElement(std::string id, lv_obj_t* obj);
    ~LvglVisualElement() override;

    LvglVisualElement(const LvglVisualElement&) = delete;
    LvglVisualElement& operator=(const LvglVisualElement&) = delete;

    const std::string& element_id() const override {
        return id_;
    }

    void add_class(const std::string& name) override;
    void remove_class(const std::string& name) override;
    bool has_class(const std::string& name) const override;

    /**
     * @brief Understands display, visibility, opacity (0..1), transform ("none")
     *        and transition ("all <n>ms <easing>" or "none"); other properties
     *        are only recorded
     */
    void set_style(const std::string& property, const std::string& value) override;
    std::string get_style(const std::string& property) const override;

    void on_transition_end(std::function<void()> callback) override;
    void clear_transition_end() override;

    lv_obj_t* obj() const {
        return obj_;
    }

    /// Forget the object (it is being deleted by LVGL)
    void detach();

  private:
    enum class Prop { TranslateX, TranslateY, Opa, Scale, ScaleX };

    void start_anim(Prop prop, int32_t from, int32_t to);
    void set_prop(Prop prop, int32_t value);
    void apply_start_state(const std::string& name);
    void apply_exit(const std::string& name);
    void apply_active(const std::string& name);
    void handle_anim_completed();
    void set_hidden(bool hidden);

    static void anim_exec_cb(void* var, int32_t value);
    static void anim_completed_cb(lv_anim_t* anim);

    std::string id_;
    lv_obj_t* obj_;
    std::set<std::string> classes_;
    std::map<std::string, std::string> styles_;
    std::function<void()> transition_end_;

    uint32_t transition_ms_ = 0;
    lv_anim_path_cb_t path_ = lv_anim_path_ease_in_out;

    /// One per running lv_anim; lets the static callbacks find their element
    struct AnimContext {
        LvglVisualElement* self;
        Prop prop;
    };
    std::map<AnimContext*, std::unique_ptr<AnimContext>> running_;
};

/**
 * @brief Id-to-element map over LVGL objects
 */
class LvglElementRegistry : public ElementProvider {
  public:
    /**
     * @brief Wrap obj under id (replaces a previous element with that id)
     */
    LvglVisualElement& add(const std::string& id, lv_obj_t* obj);

    VisualElement* find_element(const std::string& id) override;

    /**
     * @brief Id of the registered element that is obj or its nearest ancestor
     * @return Empty string if none
     */
    std::string id_for(lv_obj_t* obj) const;

  private:
    std::map<std::string, std::unique_ptr<LvglVisualElement>> elements_;
};

} // namespace kiosk
