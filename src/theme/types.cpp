// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "types.hpp"

#include <spdlog/fmt/fmt.h>

#include "exception/exception.hpp"

namespace livethemes::theme {

namespace {

auto requireString(const nlohmann::json& j, const char* key) -> std::string {
    if (!j.is_object() || !j.contains(key) || !j[key].is_string()) {
        throw ThemeFormatException(
            fmt::format("Missing or non-string field '{}'", key));
    }
    return j[key].get<std::string>();
}

auto optionalString(const nlohmann::json& j, const char* key) -> std::string {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return {};
}

auto stringList(const nlohmann::json& j, const char* key)
    -> std::vector<std::string> {
    std::vector<std::string> values;
    if (!j.contains(key) || j[key].is_null()) {
        return values;
    }
    if (!j[key].is_array()) {
        throw ThemeFormatException(
            fmt::format("Field '{}' must be an array", key));
    }
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

}  // namespace

void to_json(nlohmann::json& j, const ThemeFile& file) {
    j = {{"name", file.name}, {"file", file.file}};
}

void from_json(const nlohmann::json& j, ThemeFile& file) {
    file.name = requireString(j, "name");
    file.file = requireString(j, "file");
}

void to_json(nlohmann::json& j, const Publisher& publisher) {
    j = {{"displayName", publisher.displayName},
         {"publisherName", publisher.publisherName}};
}

void from_json(const nlohmann::json& j, Publisher& publisher) {
    publisher.displayName = optionalString(j, "displayName");
    publisher.publisherName = optionalString(j, "publisherName");
}

void to_json(nlohmann::json& j, const ExtensionInfo& extension) {
    j = {{"extensionId", extension.extensionId},
         {"extensionName", extension.extensionName},
         {"latestVersion", extension.latestVersion},
         {"downloadUrl", extension.downloadUrl}};
}

void from_json(const nlohmann::json& j, ExtensionInfo& extension) {
    extension.extensionId = optionalString(j, "extensionId");
    extension.extensionName = optionalString(j, "extensionName");
    extension.latestVersion = optionalString(j, "latestVersion");
    extension.downloadUrl = optionalString(j, "downloadUrl");
}

void to_json(nlohmann::json& j, const Theme& theme) {
    j = {{"categories", theme.categories},
         {"displayName", theme.displayName},
         {"publisher", theme.publisher},
         {"tags", theme.tags},
         {"extension", theme.extension},
         {"theme_files", theme.themeFiles},
         {"vsix_path", theme.vsixPath},
         {"theme_dir", theme.themeDir}};
}

void from_json(const nlohmann::json& j, Theme& theme) {
    theme.displayName = requireString(j, "displayName");
    theme.categories = stringList(j, "categories");
    theme.tags = stringList(j, "tags");

    if (j.contains("publisher") && j["publisher"].is_object()) {
        theme.publisher = j["publisher"].get<Publisher>();
    }
    if (j.contains("extension") && j["extension"].is_object()) {
        theme.extension = j["extension"].get<ExtensionInfo>();
    }

    theme.themeFiles.clear();
    if (j.contains("theme_files") && j["theme_files"].is_array()) {
        for (const auto& file : j["theme_files"]) {
            theme.themeFiles.push_back(file.get<ThemeFile>());
        }
    }

    theme.vsixPath = optionalString(j, "vsix_path");
    theme.themeDir = optionalString(j, "theme_dir");
}

auto themesFromJson(const nlohmann::json& j) -> std::vector<Theme> {
    if (!j.is_array()) {
        throw ThemeFormatException(
            fmt::format("Theme list must be an array, got {}", j.type_name()));
    }

    std::vector<Theme> themes;
    themes.reserve(j.size());
    for (const auto& item : j) {
        themes.push_back(item.get<Theme>());
    }
    return themes;
}

}  // namespace livethemes::theme
