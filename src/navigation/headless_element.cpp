// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "headless_element.h"

#include <spdlog/spdlog.h>

namespace kiosk {

HeadlessElement::HeadlessElement(std::string id) : id_(std::move(id)) {}

void HeadlessElement::add_class(const std::string& name) {
    classes_.insert(name);
    calls_.push_back("add:" + name);
}

void HeadlessElement::remove_class(const std::string& name) {
    if (classes_.erase(name) > 0) {
        calls_.push_back("remove:" + name);
    }
}

bool HeadlessElement::has_class(const std::string& name) const {
    return classes_.count(name) > 0;
}

void HeadlessElement::set_style(const std::string& property, const std::string& value) {
    styles_[property] = value;
    calls_.push_back("style:" + property + "=" + value);
}

std::string HeadlessElement::get_style(const std::string& property) const {
    auto it = styles_.find(property);
    return it == styles_.end() ? std::string() : it->second;
}

void HeadlessElement::on_transition_end(std::function<void()> callback) {
    transition_end_ = std::move(callback);
    calls_.push_back("arm");
}

void HeadlessElement::clear_transition_end() {
    if (transition_end_) {
        transition_end_ = nullptr;
        calls_.push_back("disarm");
    }
}

bool HeadlessElement::fire_transition_end() {
    if (!transition_end_) {
        return false;
    }
    // One-shot: disarm before invoking so the callback may re-arm
    auto callback = std::move(transition_end_);
    transition_end_ = nullptr;
    spdlog::trace("[HeadlessElement] '{}' transition end", id_);
    callback();
    return true;
}

bool HeadlessElement::is_visible() const {
    return !has_class("nav-hidden") && get_style("display") != "none";
}

HeadlessElement& HeadlessElementRegistry::create(const std::string& id) {
    auto it = elements_.find(id);
    if (it != elements_.end()) {
        return *it->second;
    }
    auto element = std::make_unique<HeadlessElement>(id);
    HeadlessElement& ref = *element;
    elements_.emplace(id, std::move(element));
    return ref;
}

VisualElement* HeadlessElementRegistry::find_element(const std::string& id) {
    return find_headless(id);
}

HeadlessElement* HeadlessElementRegistry::find_headless(const std::string& id) {
    auto it = elements_.find(id);
    return it == elements_.end() ? nullptr : it->second.get();
}

std::vector<std::string> HeadlessElementRegistry::ids() const {
    std::vector<std::string> result;
    result.reserve(elements_.size());
    for (const auto& [id, element] : elements_) {
        result.push_back(id);
    }
    return result;
}

} // namespace kiosk
