// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "gesture_activation.h"
#include "headless_element.h"

#include "test_helpers/manual_clock.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace kiosk;

namespace {

class GestureFixture {
  public:
    GestureFixture()
        : scheduler(clock.source()), orchestrator(scheduler, state), nav(orchestrator, &registry),
          gesture(orchestrator, nav) {
        for (const char* id : {"home", "settings"}) {
            nav.register_view(id, registry.create(id));
        }
        nav.request_view_transition("home");
        orchestrator.tick();
        orchestrator.start(16);

        Channel& channel = orchestrator.create_channel(channels::GESTURE_ACTIVATION);
        subs.push_back(channel.subscribe(events::ACTIVATED, [this](const json& detail) {
            activated.push_back(detail);
        }));
    }

    static GestureActivationConfig make_config() {
        GestureActivationConfig config;
        config.view_id = "settings";
        config.exit_behavior = ExitBehavior::Return;
        return config;
    }

    /// Touch at (x, y), then let 100ms pass
    void touch(double x, double y) {
        orchestrator.create_channel(channels::INPUT)
            .publish(events::POINTER_DOWN, {{"x", x}, {"y", y}});
        clock.advance(scheduler, 100);
    }

    void top_left() {
        touch(5, 5);
    }
    void top_right() {
        touch(795, 5);
    }
    void bottom_right() {
        touch(795, 475);
    }

  protected:
    ManualClock clock;
    HeadlessElementRegistry registry;
    LoopScheduler scheduler;
    StateStore state;
    Orchestrator orchestrator;
    NavigationCoordinator nav;
    GestureSequenceMachine gesture;
    std::vector<Subscription> subs;
    std::vector<json> activated;
};

} // namespace

TEST_CASE_METHOD(GestureFixture, "GestureActivation: corner classification", "[activation][gesture]") {
    gesture.register_config(make_config());

    REQUIRE(gesture.detect_corner(5, 5) == Corner::TopLeft);
    REQUIRE(gesture.detect_corner(99, 99) == Corner::TopLeft);
    REQUIRE(gesture.detect_corner(100, 5) == Corner::None);
    REQUIRE(gesture.detect_corner(795, 5) == Corner::TopRight);
    REQUIRE(gesture.detect_corner(795, 475) == Corner::BottomRight);
    REQUIRE(gesture.detect_corner(5, 475) == Corner::None);
    REQUIRE(gesture.detect_corner(400, 240) == Corner::None);

    SECTION("follows the viewport size") {
        gesture.set_viewport_size(1024, 600);
        REQUIRE(gesture.detect_corner(795, 5) == Corner::None);
        REQUIRE(gesture.detect_corner(1000, 590) == Corner::BottomRight);
    }

    SECTION("follows the configured radius") {
        auto config = make_config();
        config.corner_radius = 20;
        gesture.register_config(config);
        REQUIRE(gesture.detect_corner(50, 50) == Corner::None);
        REQUIRE(gesture.detect_corner(10, 10) == Corner::TopLeft);
    }
}

TEST_CASE_METHOD(GestureFixture, "GestureActivation: three corners in order activate once",
                 "[activation][gesture]") {
    gesture.register_config(make_config());

    top_left();
    REQUIRE(gesture.step() == 1);
    top_right();
    REQUIRE(gesture.step() == 2);
    bottom_right();

    REQUIRE(gesture.is_active());
    REQUIRE(gesture.step() == 0);
    REQUIRE(state.get("gesture.isActive") == true);

    clock.advance(scheduler, 2000);
    REQUIRE(nav.get_current_view_id() == std::string("settings"));
    REQUIRE(activated.size() == 1);
    REQUIRE(activated[0]["previousViewId"] == "home");

    SECTION("repeating the gesture while active does nothing") {
        top_left();
        top_right();
        bottom_right();
        clock.advance(scheduler, 2000);
        REQUIRE(activated.size() == 1);
    }

    SECTION("force_deactivate returns to the previous view") {
        gesture.force_deactivate();
        clock.advance(scheduler, 2000);
        REQUIRE_FALSE(gesture.is_active());
        REQUIRE(nav.get_current_view_id() == std::string("home"));
    }
}

TEST_CASE_METHOD(GestureFixture, "GestureActivation: wrong corner resets the sequence",
                 "[activation][gesture]") {
    gesture.register_config(make_config());

    SECTION("skipping a corner") {
        top_left();
        bottom_right();
        REQUIRE(gesture.step() == 0);
    }

    SECTION("starting anywhere but top-left") {
        top_right();
        REQUIRE(gesture.step() == 0);
    }

    SECTION("touching outside the corners") {
        top_left();
        touch(400, 240);
        REQUIRE(gesture.step() == 0);
    }

    SECTION("repeating the first corner") {
        top_left();
        top_left();
        REQUIRE(gesture.step() == 0);
    }

    top_right();
    bottom_right();
    REQUIRE_FALSE(gesture.is_active());
}

TEST_CASE_METHOD(GestureFixture, "GestureActivation: sequence expires after the touch timeout",
                 "[activation][gesture]") {
    gesture.register_config(make_config());
    REQUIRE(gesture.touch_timeout_ms() == 3000);

    top_left();
    REQUIRE(gesture.step() == 1);

    SECTION("abandoned sequence resets on its own") {
        clock.advance(scheduler, 3000);
        REQUIRE(gesture.step() == 0);
    }

    SECTION("late second touch starts over") {
        clock.advance(scheduler, 3000);
        top_right();
        REQUIRE(gesture.step() == 0);
    }

    SECTION("a touch right at the timeout still counts") {
        clock.advance(scheduler, 2900);
        top_right();
        REQUIRE(gesture.step() == 2);
        bottom_right();
        REQUIRE(gesture.is_active());
    }
}

TEST_CASE_METHOD(GestureFixture, "GestureActivation: duplicate touches are debounced",
                 "[activation][gesture]") {
    gesture.register_config(make_config());
    Channel& input = orchestrator.create_channel(channels::INPUT);

    input.publish(events::POINTER_DOWN, {{"x", 5}, {"y", 5}});
    clock.advance(scheduler, 20);
    input.publish(events::POINTER_DOWN, {{"x", 795}, {"y", 5}});
    REQUIRE(gesture.step() == 1);

    clock.advance(scheduler, 30);
    input.publish(events::POINTER_DOWN, {{"x", 795}, {"y", 5}});
    REQUIRE(gesture.step() == 2);
}

TEST_CASE_METHOD(GestureFixture, "GestureActivation: pointer-down without coordinates is ignored",
                 "[activation][gesture]") {
    gesture.register_config(make_config());
    Channel& input = orchestrator.create_channel(channels::INPUT);

    input.publish(events::POINTER_DOWN, {{"x", 5}});
    input.publish(events::POINTER_DOWN, {{"x", "left"}, {"y", 5}});
    REQUIRE(gesture.step() == 0);
}

TEST_CASE_METHOD(GestureFixture, "GestureActivation: unregistered machine ignores touches",
                 "[activation][gesture]") {
    gesture.handle_pointer_down(5, 5);
    REQUIRE(gesture.step() == 0);
    gesture.force_activate();
    REQUIRE_FALSE(gesture.is_active());
}

TEST_CASE_METHOD(GestureFixture, "GestureActivation: activation uses a fade by default",
                 "[activation][gesture]") {
    gesture.register_config(make_config());
    HeadlessElement* home = registry.find_headless("home");

    gesture.force_activate();
    clock.advance(scheduler, 100);
    REQUIRE(nav.is_transitioning());
    REQUIRE(home->get_style("transition") == "all 500ms ease-in-out");

    clock.advance(scheduler, 2 * (GestureSequenceMachine::DEFAULT_TRANSITION_MS +
                                  ElementAnimator::FALLBACK_GRACE_MS));
    REQUIRE_FALSE(nav.is_transitioning());
    REQUIRE(nav.get_current_view_id() == std::string("settings"));
}

TEST_CASE_METHOD(GestureFixture, "GestureActivation: failed exit keeps the hidden view active",
                 "[activation][gesture]") {
    std::vector<json> deactivated;
    Subscription sub = orchestrator.create_channel(channels::GESTURE_ACTIVATION)
                           .subscribe(events::DEACTIVATED,
                                      [&](const json& detail) { deactivated.push_back(detail); });

    auto config = make_config();
    config.exit_behavior = ExitBehavior::Reset;
    config.starting_view_id = "lobby";
    gesture.register_config(config);

    gesture.force_activate();
    clock.advance(scheduler, 2000);
    REQUIRE(nav.get_current_view_id() == std::string("settings"));

    gesture.force_deactivate();
    clock.advance(scheduler, 2000);

    REQUIRE(gesture.is_active());
    REQUIRE(state.get("gesture.isActive") == true);
    REQUIRE(nav.get_current_view_id() == std::string("settings"));
    REQUIRE(deactivated.empty());
}

TEST_CASE_METHOD(GestureFixture, "GestureActivation: configuration is validated",
                 "[activation][gesture]") {
    auto config = make_config();

    SECTION("radius must be positive") {
        config.corner_radius = 0;
        REQUIRE_THROWS_AS(gesture.register_config(config), ValidationError);
    }

    SECTION("timeout must be positive") {
        config.touch_timeout_ms = -1;
        REQUIRE_THROWS_AS(gesture.register_config(config), ValidationError);
    }

    SECTION("explicit reset needs a starting view") {
        config.exit_behavior = ExitBehavior::Reset;
        REQUIRE_THROWS_AS(gesture.register_config(config), ValidationError);
    }

    REQUIRE_FALSE(gesture.is_registered());
}

TEST_CASE("GestureActivation: JSON config parsing", "[activation][gesture]") {
    json j = {{"view", "service"},
              {"cornerTouchRadius", 60},
              {"touchTimeout", 1500},
              {"debugMode", true},
              {"exitBehavior", "return"}};

    GestureActivationConfig config = gesture_config_from_json(j);
    REQUIRE(config.view_id == "service");
    REQUIRE(config.corner_radius == 60);
    REQUIRE(config.touch_timeout_ms == 1500);
    REQUIRE(config.debug_mode);
    REQUIRE(config.exit_behavior == ExitBehavior::Return);

    REQUIRE_THROWS_AS(gesture_config_from_json({{"cornerTouchRadius", "big"}}), ValidationError);
    REQUIRE_THROWS_AS(gesture_config_from_json(json("nope")), ValidationError);
    REQUIRE(std::string(corner_name(Corner::BottomRight)) == "bottom-right");
}
