// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "channel.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace kiosk;

// ============================================================================
// subscribe / publish
// ============================================================================

TEST_CASE("Channel: handlers run in registration order", "[core][channel]") {
    Channel channel("test");
    std::vector<int> order;

    auto a = channel.subscribe("ping", [&](const json&) { order.push_back(1); });
    auto b = channel.subscribe("ping", [&](const json&) { order.push_back(2); });
    auto c = channel.subscribe("ping", [&](const json&) { order.push_back(3); });

    REQUIRE(channel.publish("ping"));
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("Channel: handler receives the detail payload", "[core][channel]") {
    Channel channel("test");
    json received;
    auto sub = channel.subscribe("data", [&](const json& detail) { received = detail; });

    channel.publish("data", {{"x", 5}, {"y", "z"}});

    REQUIRE(received["x"] == 5);
    REQUIRE(received["y"] == "z");
}

TEST_CASE("Channel: publish without listeners reports failure", "[core][channel]") {
    Channel channel("lonely");
    auto sub = channel.subscribe("other", [](const json&) {});

    REQUIRE_FALSE(channel.publish("nobody-home"));
    REQUIRE(channel.publish("other"));
}

TEST_CASE("Channel: events are isolated by name", "[core][channel]") {
    Channel channel("test");
    int a_count = 0;
    int b_count = 0;
    auto a = channel.subscribe("a", [&](const json&) { a_count++; });
    auto b = channel.subscribe("b", [&](const json&) { b_count++; });

    channel.publish("a");
    channel.publish("a");

    REQUIRE(a_count == 2);
    REQUIRE(b_count == 0);
}

// ============================================================================
// Lifetime
// ============================================================================

TEST_CASE("Channel: destroying the subscription cancels the handler", "[core][channel]") {
    Channel channel("test");
    int count = 0;

    {
        auto sub = channel.subscribe("tick", [&](const json&) { count++; });
        channel.publish("tick");
        REQUIRE(channel.listener_count("tick") == 1);
    }

    REQUIRE(channel.listener_count("tick") == 0);
    REQUIRE_FALSE(channel.publish("tick"));
    REQUIRE(count == 1);
}

TEST_CASE("Channel: subscription outliving its channel is harmless", "[core][channel]") {
    Subscription sub;
    {
        Channel channel("short-lived");
        sub = channel.subscribe("x", [](const json&) {});
        REQUIRE(static_cast<bool>(sub));
    }
    REQUIRE_FALSE(static_cast<bool>(sub));
    sub.reset();
}

TEST_CASE("Channel: subscribe_once fires a single time", "[core][channel]") {
    Channel channel("test");
    int once = 0;
    int always = 0;
    auto a = channel.subscribe_once("evt", [&](const json&) { once++; });
    auto b = channel.subscribe("evt", [&](const json&) { always++; });

    channel.publish("evt");
    channel.publish("evt");

    REQUIRE(once == 1);
    REQUIRE(always == 2);
    REQUIRE(channel.listener_count("evt") == 1);
}

TEST_CASE("Channel: cancel revokes the earliest handler", "[core][channel]") {
    Channel channel("test");
    std::vector<std::string> seen;
    auto first = channel.subscribe("evt", [&](const json&) { seen.push_back("first"); });
    auto second = channel.subscribe("evt", [&](const json&) { seen.push_back("second"); });

    REQUIRE(channel.cancel("evt"));
    channel.publish("evt");

    REQUIRE(seen == std::vector<std::string>{"second"});
    REQUIRE_FALSE(channel.cancel("missing"));
}

// ============================================================================
// Re-entrancy
// ============================================================================

TEST_CASE("Channel: handler cancelled by an earlier handler is skipped", "[core][channel]") {
    Channel channel("test");
    bool second_ran = false;
    Subscription second;

    auto first = channel.subscribe("evt", [&](const json&) { second.reset(); });
    second = channel.subscribe("evt", [&](const json&) { second_ran = true; });

    channel.publish("evt");
    REQUIRE_FALSE(second_ran);
}

TEST_CASE("Channel: handler added during publish waits for the next publish", "[core][channel]") {
    Channel channel("test");
    int late_calls = 0;
    Subscription late;

    auto first = channel.subscribe("evt", [&](const json&) {
        if (!late) {
            late = channel.subscribe("evt", [&](const json&) { late_calls++; });
        }
    });

    channel.publish("evt");
    REQUIRE(late_calls == 0);
    channel.publish("evt");
    REQUIRE(late_calls == 1);
}

TEST_CASE("Channel: throwing handler does not stop the others", "[core][channel]") {
    Channel channel("test");
    bool after = false;
    auto bad = channel.subscribe("evt", [](const json&) { throw std::runtime_error("boom"); });
    auto good = channel.subscribe("evt", [&](const json&) { after = true; });

    REQUIRE(channel.publish("evt"));
    REQUIRE(after);
}
