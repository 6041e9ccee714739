// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "theme_service.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "json/relaxed_json.hpp"

namespace livethemes::service {

namespace {
auto equalsIgnoreCase(const std::string& a, const std::string& b) -> bool {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](unsigned char x, unsigned char y) {
                          return std::tolower(x) == std::tolower(y);
                      });
}
}  // namespace

ThemeService::ThemeService(std::shared_ptr<client::ContentFetcher> fetcher,
                           std::shared_ptr<cache::ThemeCache> cache)
    : fetcher_(std::move(fetcher)), cache_(std::move(cache)) {
    if (!fetcher_) {
        throw LiveThemesException("ThemeService requires a content fetcher");
    }
}

auto ThemeService::fetchThemes(const std::string& listFile)
    -> std::vector<theme::Theme> {
    spdlog::info("Fetching theme list '{}'", listFile);
    const auto body = fetcher_->get("/themes/" + listFile + ".json");
    auto themes = theme::themesFromJson(json::parseRelaxedJson(body));
    spdlog::info("Fetched {} themes from '{}'", themes.size(), listFile);
    return themes;
}

auto ThemeService::fetchThemeFile(const std::string& fileUrl)
    -> nlohmann::json {
    spdlog::info("Fetching theme file {}", fileUrl);
    const auto body = fetcher_->get(fileUrl);
    return json::parseRelaxedJson(
        body, {.whitespace = true, .trailingCommas = true});
}

auto ThemeService::getThemes(const std::string& listFile)
    -> std::vector<theme::Theme> {
    if (cache_) {
        if (auto cached = cache_->get(listFile)) {
            return std::move(*cached);
        }
    }

    auto themes = fetchThemes(listFile);

    if (cache_) {
        cache_->put(listFile, themes);
    }
    return themes;
}

auto ThemeService::findTheme(const std::string& listFile,
                             const std::string& displayName)
    -> std::optional<theme::Theme> {
    auto themes = getThemes(listFile);

    auto it = std::find_if(themes.begin(), themes.end(),
                           [&](const theme::Theme& theme) {
                               return theme.displayName == displayName;
                           });
    if (it == themes.end()) {
        it = std::find_if(themes.begin(), themes.end(),
                          [&](const theme::Theme& theme) {
                              return equalsIgnoreCase(theme.displayName,
                                                      displayName);
                          });
    }
    if (it == themes.end()) {
        spdlog::debug("No theme named '{}' in '{}'", displayName, listFile);
        return std::nullopt;
    }
    return std::move(*it);
}

}  // namespace livethemes::service
