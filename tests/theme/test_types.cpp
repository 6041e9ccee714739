/**
 * @file test_types.cpp
 * @brief Unit tests for theme list JSON mapping
 */

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "exception/exception.hpp"
#include "theme/types.hpp"

using namespace livethemes::theme;
using livethemes::ThemeFormatException;

namespace livethemes::theme::test {

class ThemeTypesTest : public ::testing::Test {
protected:
    static auto sampleThemeJson() -> nlohmann::json {
        return nlohmann::json::parse(R"({
            "categories": ["Themes"],
            "displayName": "Night Owl",
            "publisher": {"displayName": "sarah.drasner", "publisherName": "sdras"},
            "tags": ["dark", "theme"],
            "extension": {
                "extensionId": "a1b2",
                "extensionName": "night-owl",
                "latestVersion": "2.0.1",
                "downloadUrl": "https://example.com/night-owl.vsix"
            },
            "theme_files": [
                {"name": "Night Owl", "file": "themes/sdras/night-owl/Night Owl-color-theme.json"},
                {"name": "Light Owl", "file": "themes/sdras/night-owl/Night Owl-light-color-theme.json"}
            ],
            "vsix_path": "vsix/sdras.night-owl.vsix",
            "theme_dir": "themes/sdras/night-owl"
        })");
    }
};

// ============================================================================
// Deserialization Tests
// ============================================================================

TEST_F(ThemeTypesTest, FromJsonReadsAllFields) {
    auto theme = sampleThemeJson().get<Theme>();

    EXPECT_EQ(theme.displayName, "Night Owl");
    EXPECT_EQ(theme.categories, std::vector<std::string>{"Themes"});
    EXPECT_EQ(theme.publisher.displayName, "sarah.drasner");
    EXPECT_EQ(theme.publisher.publisherName, "sdras");
    EXPECT_EQ(theme.tags.size(), 2u);
    EXPECT_EQ(theme.extension.latestVersion, "2.0.1");
    ASSERT_EQ(theme.themeFiles.size(), 2u);
    EXPECT_EQ(theme.themeFiles[1].name, "Light Owl");
    EXPECT_EQ(theme.vsixPath, "vsix/sdras.night-owl.vsix");
    EXPECT_EQ(theme.themeDir, "themes/sdras/night-owl");
}

TEST_F(ThemeTypesTest, OptionalFieldsDefaultToEmpty) {
    auto theme = nlohmann::json{{"displayName", "Minimal"}}.get<Theme>();

    EXPECT_EQ(theme.displayName, "Minimal");
    EXPECT_TRUE(theme.categories.empty());
    EXPECT_TRUE(theme.tags.empty());
    EXPECT_TRUE(theme.themeFiles.empty());
    EXPECT_TRUE(theme.publisher.displayName.empty());
    EXPECT_TRUE(theme.vsixPath.empty());
}

TEST_F(ThemeTypesTest, NullListsAreEmpty) {
    auto theme = nlohmann::json{{"displayName", "Nulls"},
                                {"categories", nullptr},
                                {"tags", nullptr}}
                     .get<Theme>();
    EXPECT_TRUE(theme.categories.empty());
    EXPECT_TRUE(theme.tags.empty());
}

TEST_F(ThemeTypesTest, MissingDisplayNameThrows) {
    auto j = sampleThemeJson();
    j.erase("displayName");
    EXPECT_THROW(j.get<Theme>(), ThemeFormatException);
}

TEST_F(ThemeTypesTest, NonArrayTagsThrows) {
    auto j = sampleThemeJson();
    j["tags"] = "dark";
    EXPECT_THROW(j.get<Theme>(), ThemeFormatException);
}

TEST_F(ThemeTypesTest, ThemeFileRequiresNameAndFile) {
    EXPECT_THROW((nlohmann::json{{"name", "x"}}.get<ThemeFile>()),
                 ThemeFormatException);
    EXPECT_THROW((nlohmann::json{{"file", "x.json"}}.get<ThemeFile>()),
                 ThemeFormatException);
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST_F(ThemeTypesTest, ToJsonUsesWireKeys) {
    nlohmann::json j = sampleThemeJson().get<Theme>();

    EXPECT_TRUE(j.contains("theme_files"));
    EXPECT_TRUE(j.contains("vsix_path"));
    EXPECT_TRUE(j.contains("theme_dir"));
    EXPECT_EQ(j["publisher"]["publisherName"], "sdras");
}

TEST_F(ThemeTypesTest, JsonRoundTrip) {
    auto original = sampleThemeJson().get<Theme>();
    nlohmann::json j = original;
    EXPECT_EQ(j.get<Theme>(), original);
}

// ============================================================================
// Theme List Tests
// ============================================================================

TEST_F(ThemeTypesTest, ThemesFromJsonArray) {
    auto list = nlohmann::json::array(
        {sampleThemeJson(), nlohmann::json{{"displayName", "Second"}}});

    auto themes = themesFromJson(list);
    ASSERT_EQ(themes.size(), 2u);
    EXPECT_EQ(themes[0].displayName, "Night Owl");
    EXPECT_EQ(themes[1].displayName, "Second");
}

TEST_F(ThemeTypesTest, ThemesFromEmptyArray) {
    EXPECT_TRUE(themesFromJson(nlohmann::json::array()).empty());
}

TEST_F(ThemeTypesTest, ThemesFromNonArrayThrows) {
    EXPECT_THROW(themesFromJson(nlohmann::json::object()),
                 ThemeFormatException);
}

}  // namespace livethemes::theme::test
