// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "headless_element.h"
#include "idle_activation.h"

#include "test_helpers/manual_clock.h"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace kiosk;

namespace {

constexpr uint64_t MINUTE_MS = 60000;

class IdleFixture {
  public:
    IdleFixture()
        : scheduler(clock.source()), orchestrator(scheduler, state), nav(orchestrator, &registry),
          idle(orchestrator, nav) {
        for (const char* id : {"home", "about", "screensaver"}) {
            nav.register_view(id, registry.create(id));
        }
        nav.request_view_transition("home");
        orchestrator.tick();
        orchestrator.start(16);

        Channel& channel = orchestrator.create_channel(channels::IDLE_ACTIVATION);
        subs.push_back(channel.subscribe(events::ACTIVATED, [this](const json& detail) {
            activated.push_back(detail);
        }));
        subs.push_back(channel.subscribe(events::DEACTIVATED, [this](const json& detail) {
            deactivated.push_back(detail);
        }));
    }

    static IdleActivationConfig make_config() {
        IdleActivationConfig config;
        config.view_id = "screensaver";
        config.timeout_seconds = 60;
        config.exit_behavior = ExitBehavior::Reset;
        config.starting_view_id = "home";
        return config;
    }

    void activity(const std::string& type, const json& extra = json::object()) {
        json detail = extra;
        detail["type"] = type;
        orchestrator.create_channel(channels::INPUT).publish(events::ACTIVITY, detail);
    }

    void go_to_view(const std::string& id) {
        nav.request_view_transition(id);
        clock.advance(scheduler, 100);
    }

  protected:
    ManualClock clock;
    HeadlessElementRegistry registry;
    LoopScheduler scheduler;
    StateStore state;
    Orchestrator orchestrator;
    NavigationCoordinator nav;
    IdleActivationMachine idle;
    std::vector<Subscription> subs;
    std::vector<json> activated;
    std::vector<json> deactivated;
};

} // namespace

TEST_CASE_METHOD(IdleFixture, "IdleActivation: silence for the timeout activates once",
                 "[activation][idle]") {
    idle.register_config(make_config());
    REQUIRE(idle.idle_timer_armed());

    clock.advance(scheduler, 59999);
    REQUIRE_FALSE(idle.is_active());

    clock.advance(scheduler, 1);
    REQUIRE(idle.is_active());
    REQUIRE(state.get("idle.isActive") == true);

    clock.advance(scheduler, 100);
    REQUIRE(nav.get_current_view_id() == std::string("screensaver"));
    REQUIRE(activated.size() == 1);
    REQUIRE(activated[0]["viewId"] == "screensaver");
    REQUIRE(activated[0]["previousViewId"] == "home");

    clock.advance(scheduler, 5 * MINUTE_MS);
    REQUIRE(activated.size() == 1);
    REQUIRE(idle.is_active());
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: activity restarts the countdown",
                 "[activation][idle]") {
    idle.register_config(make_config());

    clock.advance(scheduler, 50000);
    activity("mousemove");
    clock.advance(scheduler, 50000);
    REQUIRE_FALSE(idle.is_active());

    clock.advance(scheduler, 10000);
    REQUIRE(idle.is_active());
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: only configured event types count",
                 "[activation][idle]") {
    auto config = make_config();

    SECTION("defaults ignore unknown types") {
        idle.register_config(config);
        clock.advance(scheduler, 50000);
        activity("focus");
    }

    SECTION("explicit list replaces the defaults") {
        config.activity_events = std::vector<std::string>{"keydown"};
        idle.register_config(config);
        clock.advance(scheduler, 50000);
        activity("mousemove");
    }

    clock.advance(scheduler, 10000);
    REQUIRE(idle.is_active());
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: activity on an excluded target is ignored",
                 "[activation][idle]") {
    auto config = make_config();
    config.exclude_selectors = {"#ticker", ".passive", "video"};
    idle.register_config(config);
    clock.advance(scheduler, 50000);

    activity("click", {{"targetId", "ticker"}});
    activity("click", {{"classes", json::array({"card", "passive"})}});
    activity("click", {{"tag", "video"}});
    clock.advance(scheduler, 10000);
    REQUIRE(idle.is_active());
}

TEST_CASE("IdleActivation: selector matching", "[activation][idle]") {
    ActivityEvent event;
    event.target_id = "banner";
    event.classes = {"card", "wide"};
    event.tag = "div";

    REQUIRE(activity_matches_selector(event, "#banner"));
    REQUIRE_FALSE(activity_matches_selector(event, "#other"));
    REQUIRE(activity_matches_selector(event, ".wide"));
    REQUIRE_FALSE(activity_matches_selector(event, ".narrow"));
    REQUIRE(activity_matches_selector(event, "div"));
    REQUIRE_FALSE(activity_matches_selector(event, "span"));
    REQUIRE_FALSE(activity_matches_selector(event, ""));

    ActivityEvent anonymous;
    REQUIRE_FALSE(activity_matches_selector(anonymous, "#"));
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: activity while active exits", "[activation][idle]") {
    auto config = make_config();

    SECTION("reset goes to the starting view") {
        go_to_view("about");
        idle.register_config(config);
        clock.advance(scheduler, MINUTE_MS + 100);
        REQUIRE(nav.get_current_view_id() == std::string("screensaver"));

        activity("touchstart");
        REQUIRE_FALSE(idle.is_active());
        clock.advance(scheduler, 100);

        REQUIRE(nav.get_current_view_id() == std::string("home"));
        REQUIRE(deactivated.size() == 1);
        REQUIRE(deactivated[0]["targetViewId"] == "home");
        REQUIRE(deactivated[0]["exitBehavior"] == "reset");
    }

    SECTION("return goes back to the previous view") {
        go_to_view("about");
        config.exit_behavior = ExitBehavior::Return;
        config.starting_view_id.reset();
        idle.register_config(config);
        clock.advance(scheduler, MINUTE_MS + 100);
        REQUIRE(idle.last_active_view_id() == std::string("about"));

        activity("keydown");
        clock.advance(scheduler, 100);

        REQUIRE(nav.get_current_view_id() == std::string("about"));
        REQUIRE(deactivated.size() == 1);
        REQUIRE(deactivated[0]["exitBehavior"] == "return");
    }

    SECTION("the countdown starts again after the exit") {
        idle.register_config(config);
        clock.advance(scheduler, MINUTE_MS + 100);
        activity("click");
        clock.advance(scheduler, 100);
        REQUIRE(idle.idle_timer_armed());

        clock.advance(scheduler, MINUTE_MS);
        REQUIRE(idle.is_active());
        REQUIRE(activated.size() == 2);
    }
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: lifecycle callbacks run", "[activation][idle]") {
    int activations = 0;
    int deactivations = 0;
    auto config = make_config();
    config.on_activate = [&]() { activations++; };
    config.on_deactivate = [&]() { deactivations++; };
    idle.register_config(config);

    idle.force_activate();
    clock.advance(scheduler, 100);
    idle.force_deactivate();
    clock.advance(scheduler, 100);

    REQUIRE(activations == 1);
    REQUIRE(deactivations == 1);
    REQUIRE(nav.get_current_view_id() == std::string("home"));
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: blocker vetoes activation", "[activation][idle]") {
    bool blocked = true;
    auto config = make_config();
    config.blocker = [&]() { return blocked; };
    idle.register_config(config);

    clock.advance(scheduler, MINUTE_MS + 100);
    REQUIRE_FALSE(idle.is_active());
    REQUIRE(idle.idle_timer_armed());
    REQUIRE(nav.get_current_view_id() == std::string("home"));

    SECTION("force_activate is vetoed too") {
        idle.force_activate();
        REQUIRE_FALSE(idle.is_active());
    }

    SECTION("activation proceeds once unblocked") {
        blocked = false;
        clock.advance(scheduler, MINUTE_MS);
        REQUIRE(idle.is_active());
    }
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: hidden display pauses the countdown",
                 "[activation][idle]") {
    idle.register_config(make_config());
    Channel& input = orchestrator.create_channel(channels::INPUT);

    clock.advance(scheduler, 30000);
    input.publish(events::VISIBILITY_CHANGED, {{"hidden", true}});
    REQUIRE_FALSE(idle.idle_timer_armed());

    clock.advance(scheduler, 10 * MINUTE_MS);
    REQUIRE_FALSE(idle.is_active());

    input.publish(events::VISIBILITY_CHANGED, {{"hidden", false}});
    clock.advance(scheduler, MINUTE_MS - 1);
    REQUIRE_FALSE(idle.is_active());
    clock.advance(scheduler, 1);
    REQUIRE(idle.is_active());
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: maintenance runs while active", "[activation][idle]") {
    int maintenance = 0;
    auto config = make_config();
    config.maintenance_threshold_minutes = 15;
    config.on_maintenance = [&]() { maintenance++; };
    idle.register_config(config);
    REQUIRE_FALSE(idle.maintenance_armed());

    clock.advance(scheduler, MINUTE_MS);
    REQUIRE(idle.is_active());
    REQUIRE(idle.maintenance_armed());
    REQUIRE(maintenance == 0);

    // First check at 10 minutes is under the threshold, the second is over it
    clock.advance(scheduler, 10 * MINUTE_MS);
    REQUIRE(maintenance == 0);
    clock.advance(scheduler, 10 * MINUTE_MS);
    REQUIRE(maintenance == 1);

    clock.advance(scheduler, 10 * MINUTE_MS);
    REQUIRE(maintenance == 1);
    clock.advance(scheduler, 10 * MINUTE_MS);
    REQUIRE(maintenance == 2);

    activity("click");
    REQUIRE_FALSE(idle.maintenance_armed());
    clock.advance(scheduler, 100);
    REQUIRE(maintenance == 2);
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: failed activation rolls back", "[activation][idle]") {
    auto config = make_config();
    config.view_id = "nowhere";
    idle.register_config(config);

    clock.advance(scheduler, MINUTE_MS);
    REQUIRE(idle.is_active());

    clock.advance(scheduler, 100);
    REQUIRE_FALSE(idle.is_active());
    REQUIRE(state.get("idle.isActive") == false);
    REQUIRE(idle.idle_timer_armed());
    REQUIRE(activated.empty());
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: failed exit keeps the screensaver active",
                 "[activation][idle]") {
    auto config = make_config();
    config.starting_view_id = "lobby";
    idle.register_config(config);

    idle.force_activate();
    clock.advance(scheduler, 100);
    REQUIRE(nav.get_current_view_id() == std::string("screensaver"));

    activity("mousedown");
    REQUIRE_FALSE(idle.is_active());

    clock.advance(scheduler, 100);
    REQUIRE(idle.is_active());
    REQUIRE(state.get("idle.isActive") == true);
    REQUIRE(nav.get_current_view_id() == std::string("screensaver"));
    REQUIRE(deactivated.empty());
    REQUIRE_FALSE(nav.is_transitioning());
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: reset exit without a starting view stays put",
                 "[activation][idle]") {
    auto config = make_config();
    config.exit_behavior.reset();
    config.starting_view_id.reset();
    idle.register_config(config);

    idle.force_activate();
    clock.advance(scheduler, 100);
    idle.force_deactivate();
    clock.advance(scheduler, 100);

    REQUIRE_FALSE(idle.is_active());
    REQUIRE(nav.get_current_view_id() == std::string("screensaver"));
    REQUIRE(deactivated.empty());
    REQUIRE(idle.idle_timer_armed());
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: register event on the channel", "[activation][idle]") {
    Channel& channel = orchestrator.create_channel(channels::IDLE_ACTIVATION);

    channel.publish(events::REGISTER,
                    {{"config",
                      {{"view", "screensaver"},
                       {"timeoutSeconds", 5},
                       {"exitBehavior", "return"},
                       {"transitionConfig", {{"type", "fade"}, {"duration", 200}}}}}});
    REQUIRE(idle.is_registered());
    REQUIRE(idle.config().timeout_seconds == 5);

    clock.advance(scheduler, 5000);
    REQUIRE(idle.is_active());

    SECTION("activate and deactivate events") {
        clock.advance(scheduler, 1000);
        channel.publish(events::DEACTIVATE);
        REQUIRE_FALSE(idle.is_active());
        clock.advance(scheduler, 1000);
        channel.publish(events::ACTIVATE);
        REQUIRE(idle.is_active());
    }

    SECTION("an invalid registration is rejected and logged") {
        channel.publish(events::REGISTER, {{"config", {{"view", "screensaver"}}}});
        REQUIRE(idle.config().timeout_seconds == 5);
    }
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: longest timeout is accepted", "[activation][idle]") {
    auto config = make_config();
    config.timeout_seconds = IdleActivationMachine::MAX_TIMEOUT_SECONDS;
    idle.register_config(config);
    orchestrator.stop(); // leave only the idle timer on the scheduler

    const uint64_t timeout_ms = static_cast<uint64_t>(UINT32_MAX / 1000) * 1000;
    clock.advance(scheduler, timeout_ms - 1);
    REQUIRE_FALSE(idle.is_active());
    REQUIRE(idle.idle_timer_armed());

    clock.advance(scheduler, 1);
    REQUIRE(idle.is_active());
}

TEST_CASE_METHOD(IdleFixture, "IdleActivation: configuration is validated", "[activation][idle]") {
    auto config = make_config();

    SECTION("timeout must be positive") {
        config.timeout_seconds = 0;
        REQUIRE_THROWS_AS(idle.register_config(config), ValidationError);
    }

    SECTION("timeout must fit a scheduler delay") {
        config.timeout_seconds = 5e6;
        REQUIRE_THROWS_AS(idle.register_config(config), ValidationError);
    }

    SECTION("view is required") {
        config.view_id.clear();
        REQUIRE_THROWS_AS(idle.register_config(config), ValidationError);
    }

    SECTION("explicit reset needs a starting view") {
        config.starting_view_id.reset();
        REQUIRE_THROWS_AS(idle.register_config(config), ValidationError);
    }

    SECTION("maintenance threshold must be positive") {
        config.maintenance_threshold_minutes = 0;
        REQUIRE_THROWS_AS(idle.register_config(config), ValidationError);
    }

    REQUIRE_FALSE(idle.is_registered());
}

TEST_CASE("IdleActivation: JSON config parsing", "[activation][idle]") {
    json j = {{"view", "saver"},
              {"timeoutSeconds", 90},
              {"exitBehavior", "reset"},
              {"startingViewId", "home"},
              {"activityEvents", json::array({"click", "keydown"})},
              {"excludeSelectors", json::array({"#clock"})},
              {"maintenanceTimeoutMinutes", 30}};

    IdleActivationConfig config = idle_config_from_json(j);
    REQUIRE(config.view_id == "saver");
    REQUIRE(config.timeout_seconds == 90);
    REQUIRE(config.exit_behavior == ExitBehavior::Reset);
    REQUIRE(config.starting_view_id == std::string("home"));
    REQUIRE(config.activity_events->size() == 2);
    REQUIRE(config.exclude_selectors == std::vector<std::string>{"#clock"});
    REQUIRE(config.maintenance_threshold_minutes == 30.0);

    SECTION("bad values are rejected") {
        REQUIRE_THROWS_AS(idle_config_from_json({{"exitBehavior", "stay"}}), ValidationError);
        REQUIRE_THROWS_AS(idle_config_from_json({{"activityEvents", "click"}}), ValidationError);
        REQUIRE_THROWS_AS(idle_config_from_json({{"excludeSelectors", json::array({1, 2})}}),
                          ValidationError);
        REQUIRE_THROWS_AS(idle_config_from_json(json::array()), ValidationError);
    }
}
