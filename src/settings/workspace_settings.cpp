// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "workspace_settings.hpp"

#include <fstream>
#include <sstream>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "json/relaxed_json.hpp"

namespace livethemes::settings {

namespace {

auto readFile(const std::filesystem::path& path) -> std::string {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw SettingsException(
            fmt::format("Cannot open {}", path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw SettingsException(fmt::format(
                "Cannot create {}: {}", path.parent_path().string(),
                ec.message()));
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw SettingsException(fmt::format("Cannot write {}", path.string()));
    }
    out << content;
    if (!out) {
        throw SettingsException(
            fmt::format("Failed writing {}", path.string()));
    }
}

auto readObject(const std::filesystem::path& path) -> nlohmann::json {
    nlohmann::json parsed;
    try {
        parsed = json::parseRelaxedJson(readFile(path));
    } catch (const RelaxedJsonParseException& e) {
        throw SettingsException(fmt::format("{}:{}:{}: {}", path.string(),
                                            e.line(), e.column(), e.what()));
    }
    if (!parsed.is_object()) {
        throw SettingsException(
            fmt::format("{} must contain a JSON object", path.string()));
    }
    return parsed;
}

auto valueOrNull(const nlohmann::json& object, const char* key)
    -> nlohmann::json {
    auto it = object.find(key);
    return it != object.end() ? *it : nlohmann::json(nullptr);
}

}  // namespace

WorkspaceSettings::WorkspaceSettings(std::filesystem::path settingsFile)
    : settingsFile_(std::move(settingsFile)) {
    backupFile_ = settingsFile_;
    backupFile_ += ".live-themes-backup.json";
}

void WorkspaceSettings::load() {
    std::error_code ec;
    if (!std::filesystem::exists(settingsFile_, ec)) {
        spdlog::debug("{} does not exist, starting from empty settings",
                      settingsFile_.string());
        document_ = nlohmann::json::object();
        return;
    }
    document_ = readObject(settingsFile_);
}

void WorkspaceSettings::save() const {
    writeFile(settingsFile_, document_.dump(4) + "\n");
    spdlog::info("Wrote {}", settingsFile_.string());
}

auto WorkspaceSettings::hasBackup() const -> bool {
    std::error_code ec;
    return std::filesystem::exists(backupFile_, ec);
}

auto WorkspaceSettings::backupOriginal() -> bool {
    if (hasBackup()) {
        spdlog::debug("Keeping existing backup {}", backupFile_.string());
        return false;
    }

    nlohmann::json backup = {
        {TOKEN_COLORS_KEY, valueOrNull(document_, TOKEN_COLORS_KEY)},
        {WORKBENCH_COLORS_KEY, valueOrNull(document_, WORKBENCH_COLORS_KEY)}};
    writeFile(backupFile_, backup.dump(4) + "\n");
    spdlog::info("Backed up original colors to {}", backupFile_.string());
    return true;
}

void WorkspaceSettings::apply(const theme::ThemeColors& colors) {
    nlohmann::json tokenCustomizations = nlohmann::json::object();
    if (!colors.tokenColors.is_null()) {
        tokenCustomizations["textMateRules"] = colors.tokenColors;
    }
    document_[TOKEN_COLORS_KEY] = std::move(tokenCustomizations);
    setOrErase(WORKBENCH_COLORS_KEY, colors.colors);
}

auto WorkspaceSettings::restoreOriginal() -> bool {
    if (!hasBackup()) {
        return false;
    }

    const auto backup = readObject(backupFile_);
    setOrErase(TOKEN_COLORS_KEY, valueOrNull(backup, TOKEN_COLORS_KEY));
    setOrErase(WORKBENCH_COLORS_KEY, valueOrNull(backup, WORKBENCH_COLORS_KEY));

    std::error_code ec;
    std::filesystem::remove(backupFile_, ec);
    if (ec) {
        spdlog::warn("Failed to remove backup {}: {}", backupFile_.string(),
                     ec.message());
    }
    spdlog::info("Restored original colors from {}", backupFile_.string());
    return true;
}

void WorkspaceSettings::setOrErase(const char* key,
                                   const nlohmann::json& value) {
    if (value.is_null()) {
        document_.erase(key);
    } else {
        document_[key] = value;
    }
}

}  // namespace livethemes::settings
