// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#ifndef LIVETHEMES_THEME_COLORS_HPP
#define LIVETHEMES_THEME_COLORS_HPP

#include <nlohmann/json.hpp>

namespace livethemes::theme {

/**
 * @brief The parts of a theme document that get applied to the editor
 *
 * Either member may be null when the theme does not define it.
 */
struct ThemeColors {
    nlohmann::json colors;       ///< Workbench color map (object)
    nlohmann::json tokenColors;  ///< TextMate token rules (array)
};

/**
 * @brief Extract colors and token rules from a parsed theme document
 * @throws ThemeFormatException if the document is not an object, or if
 *         "colors" is not an object or "tokenColors" is not an array
 */
[[nodiscard]] auto extractColors(const nlohmann::json& document)
    -> ThemeColors;

}  // namespace livethemes::theme

#endif  // LIVETHEMES_THEME_COLORS_HPP
