/**
 * @file test_workspace_settings.cpp
 * @brief Unit tests for applying and restoring workspace color settings
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "exception/exception.hpp"
#include "settings/workspace_settings.hpp"

using namespace livethemes::settings;
using livethemes::SettingsException;
using livethemes::theme::ThemeColors;

namespace livethemes::settings::test {

class WorkspaceSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info =
            ::testing::UnitTest::GetInstance()->current_test_info();
        testDir_ = std::filesystem::temp_directory_path() /
                   (std::string("live_themes_settings_") + info->name());
        std::filesystem::remove_all(testDir_);
        settingsFile_ = testDir_ / ".vscode" / "settings.json";
    }

    void TearDown() override { std::filesystem::remove_all(testDir_); }

    void writeSettings(const std::string& content) {
        std::filesystem::create_directories(settingsFile_.parent_path());
        std::ofstream out(settingsFile_, std::ios::binary);
        out << content;
    }

    static auto readJson(const std::filesystem::path& path) -> nlohmann::json {
        std::ifstream in(path);
        return nlohmann::json::parse(in);
    }

    static auto nightOwl() -> ThemeColors {
        ThemeColors colors;
        colors.colors = {{"editor.background", "#011627"}};
        colors.tokenColors = nlohmann::json::array(
            {{{"scope", "comment"}, {"settings", {{"fontStyle", "italic"}}}}});
        return colors;
    }

    static auto dracula() -> ThemeColors {
        ThemeColors colors;
        colors.colors = {{"editor.background", "#282a36"}};
        colors.tokenColors = nlohmann::json::array();
        return colors;
    }

    std::filesystem::path testDir_;
    std::filesystem::path settingsFile_;
};

// ============================================================================
// Load and Save Tests
// ============================================================================

TEST_F(WorkspaceSettingsTest, BackupFileSitsNextToSettings) {
    WorkspaceSettings settings(settingsFile_);
    EXPECT_EQ(settings.backupFile().parent_path().string(),
              settingsFile_.parent_path().string());
    EXPECT_EQ(settings.backupFile().filename().string(),
              "settings.json.live-themes-backup.json");
}

TEST_F(WorkspaceSettingsTest, MissingFileLoadsEmptyObject) {
    WorkspaceSettings settings(settingsFile_);
    settings.load();
    EXPECT_TRUE(settings.document().is_object());
    EXPECT_TRUE(settings.document().empty());
}

TEST_F(WorkspaceSettingsTest, LoadAcceptsCommentsAndTrailingCommas) {
    writeSettings(R"({
        // editor preferences
        "editor.fontSize": 14,
        "files.autoSave": "afterDelay",
    })");

    WorkspaceSettings settings(settingsFile_);
    settings.load();
    EXPECT_EQ(settings.document()["editor.fontSize"], 14);
}

TEST_F(WorkspaceSettingsTest, LoadRejectsNonObject) {
    writeSettings("[]");
    WorkspaceSettings settings(settingsFile_);
    EXPECT_THROW(settings.load(), SettingsException);
}

TEST_F(WorkspaceSettingsTest, LoadReportsSyntaxErrors) {
    writeSettings("{\n  \"a\": }");
    WorkspaceSettings settings(settingsFile_);
    try {
        settings.load();
        FAIL() << "Expected SettingsException";
    } catch (const SettingsException& e) {
        EXPECT_NE(std::string(e.what()).find("settings.json:2:"),
                  std::string::npos)
            << e.what();
    }
}

TEST_F(WorkspaceSettingsTest, SaveCreatesDirectories) {
    WorkspaceSettings settings(settingsFile_);
    settings.load();
    settings.apply(nightOwl());
    settings.save();

    ASSERT_TRUE(std::filesystem::exists(settingsFile_));
    auto saved = readJson(settingsFile_);
    EXPECT_EQ(saved[WORKBENCH_COLORS_KEY]["editor.background"], "#011627");
}

// ============================================================================
// Apply Tests
// ============================================================================

TEST_F(WorkspaceSettingsTest, ApplyWritesBothKeys) {
    WorkspaceSettings settings(settingsFile_);
    settings.load();
    settings.apply(nightOwl());

    const auto& doc = settings.document();
    EXPECT_EQ(doc[WORKBENCH_COLORS_KEY]["editor.background"], "#011627");
    ASSERT_TRUE(doc[TOKEN_COLORS_KEY].contains("textMateRules"));
    EXPECT_EQ(doc[TOKEN_COLORS_KEY]["textMateRules"].size(), 1u);
}

TEST_F(WorkspaceSettingsTest, ApplyKeepsUnrelatedSettings) {
    writeSettings(R"({"editor.fontSize": 14})");
    WorkspaceSettings settings(settingsFile_);
    settings.load();
    settings.apply(nightOwl());

    EXPECT_EQ(settings.document()["editor.fontSize"], 14);
}

TEST_F(WorkspaceSettingsTest, ApplyWithoutTokenColors) {
    WorkspaceSettings settings(settingsFile_);
    settings.load();
    ThemeColors colors;
    colors.colors = {{"editor.background", "#000000"}};
    settings.apply(colors);

    EXPECT_TRUE(settings.document()[TOKEN_COLORS_KEY].is_object());
    EXPECT_TRUE(settings.document()[TOKEN_COLORS_KEY].empty());
}

TEST_F(WorkspaceSettingsTest, ApplyWithoutColorsRemovesWorkbenchKey) {
    writeSettings(R"({"workbench.colorCustomizations": {"foo": "#fff"}})");
    WorkspaceSettings settings(settingsFile_);
    settings.load();
    settings.apply(ThemeColors{});

    EXPECT_FALSE(settings.document().contains(WORKBENCH_COLORS_KEY));
}

// ============================================================================
// Backup and Restore Tests
// ============================================================================

TEST_F(WorkspaceSettingsTest, BackupCapturesOriginalColors) {
    writeSettings(R"({
        "workbench.colorCustomizations": {"editor.background": "#ffffff"}
    })");
    WorkspaceSettings settings(settingsFile_);
    settings.load();

    EXPECT_TRUE(settings.backupOriginal());
    EXPECT_TRUE(settings.hasBackup());

    auto backup = readJson(settings.backupFile());
    EXPECT_EQ(backup[WORKBENCH_COLORS_KEY]["editor.background"], "#ffffff");
    EXPECT_TRUE(backup[TOKEN_COLORS_KEY].is_null());
}

TEST_F(WorkspaceSettingsTest, BackupIsNeverOverwritten) {
    writeSettings(R"({"workbench.colorCustomizations": {"a": "#111111"}})");

    WorkspaceSettings first(settingsFile_);
    first.load();
    ASSERT_TRUE(first.backupOriginal());
    first.apply(nightOwl());
    first.save();

    WorkspaceSettings second(settingsFile_);
    second.load();
    EXPECT_FALSE(second.backupOriginal());
    second.apply(dracula());
    second.save();

    auto backup = readJson(second.backupFile());
    EXPECT_EQ(backup[WORKBENCH_COLORS_KEY]["a"], "#111111");
}

TEST_F(WorkspaceSettingsTest, RestoreWithoutBackupFails) {
    WorkspaceSettings settings(settingsFile_);
    settings.load();
    EXPECT_FALSE(settings.restoreOriginal());
}

TEST_F(WorkspaceSettingsTest, RestoreAfterSeveralApplies) {
    writeSettings(R"({
        "editor.fontSize": 14,
        "workbench.colorCustomizations": {"editor.background": "#ffffff"}
    })");

    WorkspaceSettings settings(settingsFile_);
    settings.load();
    settings.backupOriginal();
    settings.apply(nightOwl());
    settings.save();

    settings.backupOriginal();
    settings.apply(dracula());
    settings.save();

    ASSERT_TRUE(settings.restoreOriginal());
    settings.save();

    auto restored = readJson(settingsFile_);
    EXPECT_EQ(restored["editor.fontSize"], 14);
    EXPECT_EQ(restored[WORKBENCH_COLORS_KEY]["editor.background"], "#ffffff");
    EXPECT_FALSE(restored.contains(TOKEN_COLORS_KEY));
    EXPECT_FALSE(settings.hasBackup());
}

TEST_F(WorkspaceSettingsTest, RestoreRemovesKeysThatDidNotExist) {
    WorkspaceSettings settings(settingsFile_);
    settings.load();
    settings.backupOriginal();
    settings.apply(nightOwl());

    ASSERT_TRUE(settings.restoreOriginal());
    EXPECT_FALSE(settings.document().contains(WORKBENCH_COLORS_KEY));
    EXPECT_FALSE(settings.document().contains(TOKEN_COLORS_KEY));
}

}  // namespace livethemes::settings::test
