// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace kiosk {

// Test fixture for Config class testing
class ConfigTestFixture {
  public:
    ConfigTestFixture() {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        temp_dir = fs::temp_directory_path() / ("kiosk_config_test_" + std::to_string(stamp));
        fs::create_directories(temp_dir);
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        fs::remove_all(temp_dir, ec);
    }

  protected:
    Config config;
    fs::path temp_dir;

    // Helper methods to access protected members
    void set_data_null(const std::string& json_ptr) {
        config.data[json::json_pointer(json_ptr)] = nullptr;
    }

    void setup_default_config() {
        config.data = {{"config_version", 1},
                       {"logging", {{"level", "debug"}, {"target", "console"}, {"file", ""}}},
                       {"orchestrator", {{"tick_ms", 20}, {"max_dispatch_per_tick", 50}}},
                       {"viewport", {{"width", 1024}, {"height", 600}}},
                       {"pages", json::array({"main", "settings"})},
                       {"views", json::array()},
                       {"start_page", "main"}};
    }

    json& data() {
        return config.data;
    }

    std::string write_file(const std::string& name, const std::string& contents) {
        fs::path path = temp_dir / name;
        std::ofstream out(path);
        out << contents;
        return path.string();
    }

    static std::string read_file(const std::string& path) {
        std::ifstream in(path);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
};

} // namespace kiosk

using namespace kiosk;

// ============================================================================
// get() / set()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() returns existing values", "[core][config][get]") {
    setup_default_config();

    REQUIRE(config.get<std::string>("/logging/level") == "debug");
    REQUIRE(config.get<int>("/orchestrator/tick_ms") == 20);
    REQUIRE(config.get<std::string>("/start_page") == "main");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() throws on missing path", "[core][config][get]") {
    setup_default_config();

    REQUIRE_THROWS_AS(config.get<std::string>("/missing/key"), json::exception);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default uses the default only when missing",
                 "[core][config][get]") {
    setup_default_config();

    REQUIRE(config.get<int>("/viewport/width", 800) == 1024);
    REQUIRE(config.get<int>("/viewport/depth", 32) == 32);
    REQUIRE(config.get<std::string>("/start_view", "") == "");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with default still throws on a type mismatch",
                 "[core][config][get]") {
    setup_default_config();
    set_data_null("/start_page");

    REQUIRE_THROWS_AS(config.get<std::string>("/start_page", "home"), json::exception);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates intermediate objects",
                 "[core][config][set]") {
    setup_default_config();

    config.set<int>("/gesture/cornerTouchRadius", 80);
    config.set<std::string>("/start_view", "welcome");

    REQUIRE(config.get<int>("/gesture/cornerTouchRadius") == 80);
    REQUIRE(config.get<std::string>("/start_view") == "welcome");
    REQUIRE(config.contains("/gesture"));
    REQUIRE_FALSE(config.contains("/idle/view"));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get_json() returns a mutable sub-document",
                 "[core][config]") {
    setup_default_config();

    json& pages = config.get_json("/pages");
    REQUIRE(pages.size() == 2);
    pages.push_back("about");
    REQUIRE(config.get_json("/pages").size() == 3);
}

// ============================================================================
// init() / save()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: separate instances do not share state",
                 "[core][config]") {
    setup_default_config();
    Config other;
    other.set<std::string>("/start_page", "kiosk");

    REQUIRE(config.get<std::string>("/start_page") == "main");
    REQUIRE(other.get<std::string>("/start_page") == "kiosk");
    REQUIRE_THROWS(other.get<int>("/orchestrator/tick_ms"));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() creates a default file when missing",
                 "[core][config][init]") {
    std::string path = (temp_dir / "nested" / "kiosk.json").string();

    config.init(path);

    REQUIRE(fs::exists(path));
    REQUIRE(config.get_path() == path);
    REQUIRE(data() == Config::get_default_config());

    json on_disk = json::parse(read_file(path));
    REQUIRE(on_disk == Config::get_default_config());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() loads an existing file", "[core][config][init]") {
    std::string path = write_file("kiosk.json", R"({
        "config_version": 1,
        "logging": {"level": "info", "target": "console", "file": ""},
        "orchestrator": {"tick_ms": 10, "max_dispatch_per_tick": 100},
        "viewport": {"width": 1280, "height": 720},
        "pages": ["main"], "views": ["home"],
        "start_page": "main", "start_view": "home",
        "idle": {"view": "saver", "timeoutSeconds": 30},
        "gesture": null
    })");

    config.init(path);

    REQUIRE(config.get<int>("/orchestrator/tick_ms") == 10);
    REQUIRE(config.get<std::string>("/idle/view") == "saver");
    REQUIRE(config.get_json("/gesture").is_null());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() fills in missing sections and keys",
                 "[core][config][init]") {
    std::string path = write_file("kiosk.json", R"({"logging": {"level": "trace"}})");

    config.init(path);

    REQUIRE(config.get<std::string>("/logging/level") == "trace");
    REQUIRE(config.get<std::string>("/logging/target") == "auto");
    REQUIRE(config.get<int>("/orchestrator/tick_ms") == 16);
    REQUIRE(config.get<int>("/config_version") == CURRENT_CONFIG_VERSION);

    json on_disk = json::parse(read_file(path));
    REQUIRE(on_disk["viewport"]["width"] == 800);
    REQUIRE(on_disk["logging"]["level"] == "trace");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() replaces a corrupt file with defaults",
                 "[core][config][init]") {
    SECTION("unparseable") {
        std::string path = write_file("kiosk.json", "{ not json");
        config.init(path);

        REQUIRE(fs::exists(path + ".corrupt"));
        REQUIRE(read_file(path + ".corrupt") == "{ not json");
    }

    SECTION("not an object") {
        std::string path = write_file("kiosk.json", "[1, 2, 3]");
        config.init(path);

        REQUIRE(fs::exists(path + ".corrupt"));
    }

    REQUIRE(data() == Config::get_default_config());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() persists changes", "[core][config][save]") {
    std::string path = (temp_dir / "kiosk.json").string();
    config.init(path);

    config.set<std::string>("/start_page", "settings");
    REQUIRE(config.save());
    REQUIRE_FALSE(fs::exists(path + ".tmp"));

    Config reloaded;
    reloaded.init(path);
    REQUIRE(reloaded.get<std::string>("/start_page") == "settings");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() fails when the directory is gone",
                 "[core][config][save]") {
    std::string path = (temp_dir / "sub" / "kiosk.json").string();
    config.init(path);
    REQUIRE(fs::exists(path));

    fs::remove_all(temp_dir / "sub");
    REQUIRE_FALSE(config.save());
}
