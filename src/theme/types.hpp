// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#ifndef LIVETHEMES_THEME_TYPES_HPP
#define LIVETHEMES_THEME_TYPES_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace livethemes::theme {

/**
 * @brief One color theme file shipped inside an extension
 */
struct ThemeFile {
    std::string name;
    std::string file;  ///< Path of the file relative to the theme server

    bool operator==(const ThemeFile&) const = default;
};

struct Publisher {
    std::string displayName;
    std::string publisherName;

    bool operator==(const Publisher&) const = default;
};

/**
 * @brief Marketplace extension that provides a theme
 */
struct ExtensionInfo {
    std::string extensionId;
    std::string extensionName;
    std::string latestVersion;
    std::string downloadUrl;

    bool operator==(const ExtensionInfo&) const = default;
};

/**
 * @brief Theme list entry as served by the theme server
 */
struct Theme {
    std::vector<std::string> categories;
    std::string displayName;
    Publisher publisher;
    std::vector<std::string> tags;
    ExtensionInfo extension;
    std::vector<ThemeFile> themeFiles;
    std::string vsixPath;
    std::string themeDir;

    bool operator==(const Theme&) const = default;
};

// nlohmann::json ADL hooks. from_json throws ThemeFormatException when a
// required field is missing or has the wrong type.
void to_json(nlohmann::json& j, const ThemeFile& file);
void from_json(const nlohmann::json& j, ThemeFile& file);

void to_json(nlohmann::json& j, const Publisher& publisher);
void from_json(const nlohmann::json& j, Publisher& publisher);

void to_json(nlohmann::json& j, const ExtensionInfo& extension);
void from_json(const nlohmann::json& j, ExtensionInfo& extension);

void to_json(nlohmann::json& j, const Theme& theme);
void from_json(const nlohmann::json& j, Theme& theme);

/**
 * @brief Parse a theme list document (a JSON array of themes)
 * @throws ThemeFormatException if the document is not an array of themes
 */
[[nodiscard]] auto themesFromJson(const nlohmann::json& j)
    -> std::vector<Theme>;

}  // namespace livethemes::theme

#endif  // LIVETHEMES_THEME_TYPES_HPP
