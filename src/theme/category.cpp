// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "category.hpp"

#include <algorithm>
#include <array>

namespace livethemes::theme {

namespace {
constexpr std::array<ThemeCategory, 7> CATEGORIES{{
    {"byrating",
     "$(star-full) By Rating | You can find most interesting themes here"},
    {"trendingweekly",
     "$(arrow-up) Trending Weekly | A bit more interesting than most "
     "installed"},
    {"mostinstalled", "$(package) Most Installed | Most installed but boring "
                      "themes"},
    {"publisher", "$(organization) Publisher | Find Themes by Publisher"},
    {"publisheddate",
     "$(calendar) Published Date | Find Themes by Published Date"},
    {"updatedate", "$(sync) Update Date | Find Themes by Update Date"},
    {"byname", "$(symbol-key) Sorted by Name | Find Themes by Name"},
}};
}  // namespace

auto allCategories() noexcept -> std::span<const ThemeCategory> {
    return CATEGORIES;
}

auto findCategory(std::string_view listFile) -> std::optional<ThemeCategory> {
    auto it = std::find_if(CATEGORIES.begin(), CATEGORIES.end(),
                           [listFile](const ThemeCategory& category) {
                               return category.listFile == listFile;
                           });
    if (it == CATEGORIES.end()) {
        return std::nullopt;
    }
    return *it;
}

}  // namespace livethemes::theme
