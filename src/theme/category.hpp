// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#ifndef LIVETHEMES_THEME_CATEGORY_HPP
#define LIVETHEMES_THEME_CATEGORY_HPP

#include <optional>
#include <span>
#include <string_view>

namespace livethemes::theme {

/**
 * @brief A sorted theme list published by the theme server
 */
struct ThemeCategory {
    std::string_view listFile;  ///< Served as /themes/<listFile>.json
    std::string_view label;     ///< "$(icon) Title | Description"
};

/**
 * @brief All categories in menu order
 */
[[nodiscard]] auto allCategories() noexcept -> std::span<const ThemeCategory>;

/**
 * @brief Look up a category by list file name
 */
[[nodiscard]] auto findCategory(std::string_view listFile)
    -> std::optional<ThemeCategory>;

inline constexpr std::string_view DEFAULT_CATEGORY = "byrating";

}  // namespace livethemes::theme

#endif  // LIVETHEMES_THEME_CATEGORY_HPP
