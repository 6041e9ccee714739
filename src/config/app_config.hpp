// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

/*************************************************

Date: 2026-10-18

Description: Application configuration (theme server, cache, logging)

**************************************************/

#ifndef LIVETHEMES_CONFIG_APP_CONFIG_HPP
#define LIVETHEMES_CONFIG_APP_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "logging/log.hpp"

namespace livethemes::config {

/// Environment variable that turns on development mode when set to "true".
inline constexpr const char* DEV_MODE_ENV = "LIVE_THEMES_DEBUG_MODE";

/**
 * @brief Application configuration
 *
 * Every field has a default, so an empty or missing config file yields a
 * working configuration. The file may contain comments and trailing commas.
 */
struct AppConfig {
    std::string baseUrl{"https://vscode-live-themes.ekinertac.com"};
    std::string cacheFile{".live-themes/cache.json"};
    std::chrono::hours cacheTtl{24};
    /// Bypass the theme list cache
    bool devMode{false};
    std::chrono::milliseconds requestTimeout{30000};
    std::string userAgent{"live-themes/1.0"};
    log::LogConfig logging;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    /**
     * @throws SettingsException if a present field has the wrong type or a
     *         log level name is unknown
     */
    [[nodiscard]] static auto fromJson(const nlohmann::json& j) -> AppConfig;
};

/**
 * @brief Load the configuration file, falling back to defaults
 *
 * A missing file is not an error. The development mode environment
 * variable is applied after the file is read.
 *
 * @throws SettingsException if the file cannot be read or parsed
 */
[[nodiscard]] auto loadAppConfig(const std::filesystem::path& path)
    -> AppConfig;

/**
 * @brief Whether DEV_MODE_ENV is set to "true"
 */
[[nodiscard]] auto devModeFromEnvironment() -> bool;

}  // namespace livethemes::config

#endif  // LIVETHEMES_CONFIG_APP_CONFIG_HPP
