// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "kiosk_app.h"

#include "config.h"

#include <spdlog/spdlog.h>

namespace kiosk {

namespace {

// "/pages" and "/views" entries are either "id" or {"id": "..."}
std::vector<std::string> id_list(const json& list, const char* section) {
    std::vector<std::string> ids;
    if (list.is_null()) {
        return ids;
    }
    if (!list.is_array()) {
        throw ValidationError(std::string(section) + " must be an array");
    }
    for (const auto& entry : list) {
        if (entry.is_string()) {
            ids.push_back(entry.get<std::string>());
        } else if (entry.is_object() && entry.contains("id") && entry["id"].is_string()) {
            ids.push_back(entry["id"].get<std::string>());
        } else {
            throw ValidationError(std::string(section) + " entries must be ids or {\"id\": ...}");
        }
    }
    return ids;
}

} // namespace

KioskApp::KioskApp(LoopScheduler::TimeSource time_source)
    : headless_(std::make_unique<HeadlessElementRegistry>()) {
    provider_ = headless_.get();
    init_subsystems(std::move(time_source));
}

KioskApp::KioskApp(ElementProvider& provider, LoopScheduler::TimeSource time_source)
    : provider_(&provider) {
    init_subsystems(std::move(time_source));
}

KioskApp::~KioskApp() {
    spdlog::debug("[KioskApp] Shutting down");
    if (orchestrator_) {
        orchestrator_->stop();
    }
    // Reverse of construction; machines hold references into everything below them
    gesture_.reset();
    idle_.reset();
    navigation_.reset();
    orchestrator_.reset();
    scheduler_.reset();
    state_.reset();
}

void KioskApp::init_subsystems(LoopScheduler::TimeSource time_source) {
    state_ = std::make_unique<StateStore>();
    scheduler_ = std::make_unique<LoopScheduler>(std::move(time_source));
    orchestrator_ = std::make_unique<Orchestrator>(*scheduler_, *state_);
    orchestrator_->create_channel(channels::INPUT);
    navigation_ = std::make_unique<NavigationCoordinator>(*orchestrator_, provider_);
    idle_ = std::make_unique<IdleActivationMachine>(*orchestrator_, *navigation_);
    gesture_ = std::make_unique<GestureSequenceMachine>(*orchestrator_, *navigation_);
    spdlog::debug("[KioskApp] Subsystems initialized ({} elements)",
                  headless_ ? "headless" : "external");
}

VisualElement& KioskApp::resolve_element(const std::string& id, const char* kind) {
    if (VisualElement* element = provider_->find_element(id)) {
        return *element;
    }
    if (headless_) {
        return headless_->create(id);
    }
    throw NotFoundError(std::string("No element for ") + kind + " '" + id + "'");
}

void KioskApp::add_page(const std::string& page_id) {
    navigation_->register_page(page_id, resolve_element(page_id, "page"));
}

void KioskApp::add_view(const std::string& view_id) {
    navigation_->register_view(view_id, resolve_element(view_id, "view"));
}

void KioskApp::add_screensaver(const IdleActivationConfig& config) {
    IdleActivationConfig resolved = config;
    if (!resolved.view_element && !resolved.view_id.empty()) {
        resolved.view_element = &resolve_element(resolved.view_id, "view");
    }
    idle_->register_config(resolved);
}

void KioskApp::add_hidden_settings(const GestureActivationConfig& config) {
    GestureActivationConfig resolved = config;
    if (!resolved.view_element && !resolved.view_id.empty()) {
        resolved.view_element = &resolve_element(resolved.view_id, "view");
    }
    gesture_->register_config(resolved);
}

void KioskApp::apply_config(Config& config) {
    int tick_ms =
        config.get<int>("/orchestrator/tick_ms", static_cast<int>(Orchestrator::DEFAULT_TICK_MS));
    if (tick_ms <= 0) {
        spdlog::warn("[KioskApp] /orchestrator/tick_ms must be positive, using {}",
                     Orchestrator::DEFAULT_TICK_MS);
        tick_ms = static_cast<int>(Orchestrator::DEFAULT_TICK_MS);
    }
    tick_ms_ = static_cast<uint32_t>(tick_ms);

    int max_dispatch = config.get<int>("/orchestrator/max_dispatch_per_tick",
                                       static_cast<int>(Orchestrator::DEFAULT_MAX_DISPATCH_PER_TICK));
    if (max_dispatch <= 0) {
        spdlog::warn("[KioskApp] /orchestrator/max_dispatch_per_tick must be positive, using {}",
                     Orchestrator::DEFAULT_MAX_DISPATCH_PER_TICK);
        max_dispatch = static_cast<int>(Orchestrator::DEFAULT_MAX_DISPATCH_PER_TICK);
    }
    orchestrator_->set_max_dispatch_per_tick(static_cast<size_t>(max_dispatch));

    set_viewport_size(config.get<int>("/viewport/width", 800),
                      config.get<int>("/viewport/height", 480));

    for (const auto& id : id_list(config.get<json>("/pages", json::array()), "/pages")) {
        add_page(id);
    }
    for (const auto& id : id_list(config.get<json>("/views", json::array()), "/views")) {
        add_view(id);
    }

    json idle = config.get<json>("/idle", json());
    if (idle.is_object()) {
        add_screensaver(idle_config_from_json(idle));
    }
    json gesture = config.get<json>("/gesture", json());
    if (gesture.is_object()) {
        add_hidden_settings(gesture_config_from_json(gesture));
    }

    auto start_page = config.get<std::string>("/start_page", "");
    if (!start_page.empty() && navigation_->get_current_page_id() != start_page) {
        navigate_to_page(start_page);
    }
    auto start_view = config.get<std::string>("/start_view", "");
    if (!start_view.empty()) {
        navigate_to_view(start_view);
    }

    spdlog::info("[KioskApp] Configured {} pages, {} views (tick {}ms)",
                 navigation_->registered_pages().size(), navigation_->registered_views().size(),
                 tick_ms_);
}

QueueItemId KioskApp::navigate_to_page(const std::string& page_id, const TransitionConfig& config,
                                       CompletionCallback on_done, ErrorCallback on_error) {
    return navigation_->request_page_transition(page_id, config, PriorityClass::Immediate,
                                                std::move(on_done), std::move(on_error));
}

QueueItemId KioskApp::navigate_to_view(const std::string& view_id, const TransitionConfig& config,
                                       CompletionCallback on_done, ErrorCallback on_error) {
    return navigation_->request_view_transition(view_id, config, PriorityClass::Immediate,
                                                std::move(on_done), std::move(on_error));
}

void KioskApp::start() {
    spdlog::info("[KioskApp] Starting (tick {}ms)", tick_ms_);
    orchestrator_->start(tick_ms_);
}

void KioskApp::stop() {
    orchestrator_->stop();
}

size_t KioskApp::pump() {
    return scheduler_->run_due();
}

bool KioskApp::publish_input(const std::string& event_name, const json& detail) {
    Channel& input = orchestrator_->create_channel(channels::INPUT);
    if (input.listener_count(event_name) == 0) {
        spdlog::trace("[KioskApp] No listener for input '{}'", event_name);
        return false;
    }
    return input.publish(event_name, detail);
}

void KioskApp::set_viewport_size(int width, int height) {
    gesture_->set_viewport_size(width, height);
}

} // namespace kiosk
