// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <sys/stat.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace fs = std::filesystem;

namespace kiosk {

namespace {

/// Fill in top-level sections missing from a loaded config. Returns true if any were added.
bool merge_missing_sections(json& data, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!data.contains(it.key())) {
            spdlog::debug("[Config] Adding missing section '{}'", it.key());
            data[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && data[it.key()].is_object()) {
            // One level deep: new keys inside existing sections
            for (auto inner = it.value().begin(); inner != it.value().end(); ++inner) {
                if (!data[it.key()].contains(inner.key())) {
                    data[it.key()][inner.key()] = inner.value();
                    modified = true;
                }
            }
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

json Config::get_default_config() {
    return {
        {"config_version", CURRENT_CONFIG_VERSION},
        {"logging", {{"level", "warn"}, {"target", "auto"}, {"file", ""}}},
        {"orchestrator", {{"tick_ms", 16}, {"max_dispatch_per_tick", 1000}}},
        {"viewport", {{"width", 800}, {"height", 480}}},
        {"pages", json::array()},
        {"views", json::array()},
        {"start_page", ""},
        {"start_view", ""},
        {"idle", nullptr},
        {"gesture", nullptr},
    };
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        bool parsed = false;
        try {
            std::ifstream in(config_path);
            data = json::parse(in);
            parsed = data.is_object();
            if (!parsed) {
                spdlog::error("[Config] {} does not contain a JSON object", config_path);
            }
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
        }

        if (!parsed) {
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }

        if (merge_missing_sections(data, get_default_config())) {
            config_modified = true;
        }
        if (data.value("config_version", 0) < CURRENT_CONFIG_VERSION) {
            data["config_version"] = CURRENT_CONFIG_VERSION;
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
            if (ec) {
                spdlog::warn("[Config] Could not create {}: {}", config_dir.string(),
                             ec.message());
            }
        }
        data = get_default_config();
        config_modified = true;
    }

    if (config_modified && !save()) {
        spdlog::warn("[Config] Continuing with in-memory config");
    }

    spdlog::debug("[Config] initialized: version={}", data.value("config_version", 0));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::contains(const std::string& json_path) const {
    return data.contains(json::json_pointer(json_path));
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    const std::string tmp_path = path + ".tmp";
    try {
        std::ofstream o(tmp_path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", tmp_path);
            return false;
        }
        o.close();

        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            spdlog::error("[Config] Failed to replace {} with {}", path, tmp_path);
            std::remove(tmp_path.c_str());
            return false;
        }

        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace kiosk
