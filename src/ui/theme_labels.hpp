// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#ifndef LIVETHEMES_UI_THEME_LABELS_HPP
#define LIVETHEMES_UI_THEME_LABELS_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "theme/types.hpp"

namespace livethemes::ui {

/// "1 Theme", "3 Themes"
[[nodiscard]] auto fileCountLabel(std::size_t count) -> std::string;

/**
 * @brief One aligned `name | publisher` line per theme, followed by the
 *        number of theme files it ships
 *
 * The publisher's display name is used when present, its publisher id
 * otherwise.
 */
[[nodiscard]] auto themeLabels(const std::vector<theme::Theme>& themes)
    -> std::vector<std::string>;

/**
 * @brief One aligned `name | file` line per theme file of @p theme
 *
 * The file column is the path `apply` accepts.
 */
[[nodiscard]] auto themeFileLabels(const theme::Theme& theme)
    -> std::vector<std::string>;

}  // namespace livethemes::ui

#endif  // LIVETHEMES_UI_THEME_LABELS_HPP
