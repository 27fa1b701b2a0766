// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "state_store.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace kiosk;

TEST_CASE("StateStore: unknown key reads as null", "[core][state]") {
    StateStore store;
    REQUIRE(store.get("missing").is_null());
    REQUIRE_FALSE(store.has("missing"));
    REQUIRE(store.get<int>("missing", 7) == 7);
}

TEST_CASE("StateStore: set then get", "[core][state]") {
    StateStore store;
    store.set("count", 3);
    store.set("name", "home");

    REQUIRE(store.get("count") == 3);
    REQUIRE(store.get<std::string>("name", "") == "home");
    REQUIRE(store.has("count"));
}

TEST_CASE("StateStore: null value counts as absent for has()", "[core][state]") {
    StateStore store;
    store.set("current", nullptr);
    REQUIRE_FALSE(store.has("current"));
}

TEST_CASE("StateStore: typed get falls back on type mismatch", "[core][state]") {
    StateStore store;
    store.set("flag", "not-a-bool");
    REQUIRE(store.get<bool>("flag", true));
}

TEST_CASE("StateStore: init_if_absent only writes once", "[core][state]") {
    StateStore store;
    REQUIRE(store.init_if_absent("k", 1));
    REQUIRE_FALSE(store.init_if_absent("k", 2));
    REQUIRE(store.get("k") == 1);

    SECTION("an explicit null still counts as present") {
        store.set("n", nullptr);
        REQUIRE_FALSE(store.init_if_absent("n", 5));
        REQUIRE(store.get("n").is_null());
    }
}

TEST_CASE("StateStore: subscribers see every write in order", "[core][state]") {
    StateStore store;
    std::vector<int> seen;
    std::vector<std::string> keys;

    auto sub = store.subscribe("v", [&](const json& value, const std::string& key) {
        seen.push_back(value.get<int>());
        keys.push_back(key);
    });

    store.set("v", 1);
    store.set("other", 99);
    store.set("v", 2);

    REQUIRE(seen == std::vector<int>{1, 2});
    REQUIRE(keys == std::vector<std::string>{"v", "v"});
}

TEST_CASE("StateStore: subscribers run in subscription order", "[core][state]") {
    StateStore store;
    std::vector<char> order;
    auto a = store.subscribe("k", [&](const json&, const std::string&) { order.push_back('a'); });
    auto b = store.subscribe("k", [&](const json&, const std::string&) { order.push_back('b'); });

    store.set("k", true);
    REQUIRE(order == std::vector<char>{'a', 'b'});
}

TEST_CASE("StateStore: dropped subscription stops notifications", "[core][state]") {
    StateStore store;
    int calls = 0;
    {
        auto sub = store.subscribe("k", [&](const json&, const std::string&) { calls++; });
        store.set("k", 1);
        REQUIRE(store.subscriber_count("k") == 1);
    }
    store.set("k", 2);
    REQUIRE(calls == 1);
    REQUIRE(store.subscriber_count("k") == 0);
}

TEST_CASE("StateStore: remove notifies with null", "[core][state]") {
    StateStore store;
    store.set("k", 5);
    json last = 0;
    auto sub = store.subscribe("k", [&](const json& value, const std::string&) { last = value; });

    store.remove("k");
    REQUIRE(last.is_null());
    REQUIRE(store.get("k").is_null());
}
