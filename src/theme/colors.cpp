// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "colors.hpp"

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace livethemes::theme {

auto extractColors(const nlohmann::json& document) -> ThemeColors {
    if (!document.is_object()) {
        throw ThemeFormatException("Theme document must be a JSON object");
    }

    ThemeColors result;

    if (auto it = document.find("colors");
        it != document.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw ThemeFormatException("Theme 'colors' must be an object");
        }
        result.colors = *it;
    }

    if (auto it = document.find("tokenColors");
        it != document.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw ThemeFormatException("Theme 'tokenColors' must be an array");
        }
        result.tokenColors = *it;
    }

    spdlog::debug("Extracted {} workbench colors and {} token rules",
                  result.colors.size(), result.tokenColors.size());
    return result;
}

}  // namespace livethemes::theme
