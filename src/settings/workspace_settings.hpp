// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

/*************************************************

Date: 2026-10-18

Description: Writes theme colors into an editor workspace settings file

**************************************************/

#ifndef LIVETHEMES_SETTINGS_WORKSPACE_SETTINGS_HPP
#define LIVETHEMES_SETTINGS_WORKSPACE_SETTINGS_HPP

#include <filesystem>

#include <nlohmann/json.hpp>

#include "theme/colors.hpp"

namespace livethemes::settings {

inline constexpr const char* TOKEN_COLORS_KEY =
    "editor.tokenColorCustomizations";
inline constexpr const char* WORKBENCH_COLORS_KEY =
    "workbench.colorCustomizations";

/**
 * @brief Editor workspace settings file (`.vscode/settings.json`)
 *
 * The file may contain comments and trailing commas when read; it is
 * written back as strict, indented JSON. The values of the two color keys
 * found before the first theme is applied are kept in a sidecar backup file
 * so they can be restored by a later run.
 */
class WorkspaceSettings {
public:
    explicit WorkspaceSettings(std::filesystem::path settingsFile);

    /**
     * @brief Read the settings file; a missing file is an empty object
     * @throws SettingsException if the file is unreadable or not an object
     */
    void load();

    /**
     * @brief Write the settings file, creating parent directories
     * @throws SettingsException on I/O failure
     */
    void save() const;

    /**
     * @brief Persist the current color settings to the backup file
     * @return false if a backup already exists and was kept
     */
    auto backupOriginal() -> bool;

    /**
     * @brief Replace the color settings with the theme's colors
     */
    void apply(const theme::ThemeColors& colors);

    /**
     * @brief Put back the backed-up color settings and delete the backup
     * @return false if there is no backup
     * @throws SettingsException if the backup file is unreadable
     */
    auto restoreOriginal() -> bool;

    [[nodiscard]] auto hasBackup() const -> bool;

    [[nodiscard]] auto document() const noexcept -> const nlohmann::json& {
        return document_;
    }

    [[nodiscard]] auto settingsFile() const noexcept
        -> const std::filesystem::path& {
        return settingsFile_;
    }

    [[nodiscard]] auto backupFile() const noexcept
        -> const std::filesystem::path& {
        return backupFile_;
    }

private:
    void setOrErase(const char* key, const nlohmann::json& value);

    std::filesystem::path settingsFile_;
    std::filesystem::path backupFile_;
    nlohmann::json document_ = nlohmann::json::object();
};

}  // namespace livethemes::settings

#endif  // LIVETHEMES_SETTINGS_WORKSPACE_SETTINGS_HPP
