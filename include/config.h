// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __KIOSK_CONFIG_H__
#define __KIOSK_CONFIG_H__

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <string>

namespace kiosk {

using json = nlohmann::json;

/// Current on-disk config schema version
constexpr int CURRENT_CONFIG_VERSION = 1;

/**
 * @brief Application configuration manager
 *
 * Loads and manages kiosk configuration from a JSON file. The host owns one
 * instance and hands it to KioskApp::apply_config().
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from the orchestrator thread only.
 *
 * Example usage:
 * ```cpp
 * Config config;
 * config.init("/etc/kiosk/kiosk.json");
 *
 * int tick = config.get<int>("/orchestrator/tick_ms", 16);
 *
 * config.set<std::string>("/start_page", "home");
 * config.save();
 * ```
 */
class Config {
  private:
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A file that fails to
     * parse is moved aside to "<path>.corrupt" and replaced by defaults.
     * Missing top-level sections are filled in from the defaults.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            return data[ptr].template get<T>();
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths. In-memory only until save().
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Mutable JSON sub-object at path (created as null if absent)
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Whether a JSON pointer path exists
     */
    bool contains(const std::string& json_path) const;

    /**
     * @brief Write the config to disk (temp file + rename)
     * @return false if the file could not be written
     */
    bool save();

    std::string get_path();

    /**
     * @brief Default configuration document
     */
    static json get_default_config();
};

} // namespace kiosk

#endif // __KIOSK_CONFIG_H__
