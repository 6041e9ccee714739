// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#ifndef LIVETHEMES_SERVICE_THEME_SERVICE_HPP
#define LIVETHEMES_SERVICE_THEME_SERVICE_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cache/theme_cache.hpp"
#include "client/content_fetcher.hpp"
#include "theme/types.hpp"

namespace livethemes::service {

/**
 * @brief Downloads theme lists and theme files from the theme server
 */
class ThemeService {
public:
    /**
     * @param fetcher Source of response bodies
     * @param cache Theme list cache, or nullptr to always fetch
     */
    ThemeService(std::shared_ptr<client::ContentFetcher> fetcher,
                 std::shared_ptr<cache::ThemeCache> cache);

    /**
     * @brief Download the theme list /themes/<listFile>.json
     * @throws NetworkException, RelaxedJsonParseException,
     *         ThemeFormatException
     */
    [[nodiscard]] auto fetchThemes(const std::string& listFile)
        -> std::vector<theme::Theme>;

    /**
     * @brief Download and parse one theme file
     *
     * Theme files are written by hand and often contain comments and
     * trailing commas; both are stripped before strict parsing.
     *
     * @throws NetworkException, RelaxedJsonParseException
     */
    [[nodiscard]] auto fetchThemeFile(const std::string& fileUrl)
        -> nlohmann::json;

    /**
     * @brief Theme list from the cache if fresh, otherwise downloaded and
     *        cached
     */
    [[nodiscard]] auto getThemes(const std::string& listFile)
        -> std::vector<theme::Theme>;

    /**
     * @brief Look up a theme of a list by display name
     *
     * An exact match wins over a case-insensitive one.
     */
    [[nodiscard]] auto findTheme(const std::string& listFile,
                                 const std::string& displayName)
        -> std::optional<theme::Theme>;

private:
    std::shared_ptr<client::ContentFetcher> fetcher_;
    std::shared_ptr<cache::ThemeCache> cache_;
};

}  // namespace livethemes::service

#endif  // LIVETHEMES_SERVICE_THEME_SERVICE_HPP
