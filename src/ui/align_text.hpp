// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#ifndef LIVETHEMES_UI_ALIGN_TEXT_HPP
#define LIVETHEMES_UI_ALIGN_TEXT_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace livethemes::ui {

/// Width the text parts of a label are spread over, excluding the icon.
inline constexpr std::size_t LABEL_TEXT_WIDTH = 67;

/**
 * @brief Spread the " | "-separated parts of a menu label across a line
 *
 * A label looks like `$(icon) Left | Right`. The optional icon is kept in
 * front followed by one space; the parts are separated by an equal number of
 * spaces so that they fill LABEL_TEXT_WIDTH columns. When the spaces do not
 * divide evenly every gap gets one more. Labels without a separator are
 * returned unchanged. Every gap has at least one space.
 */
[[nodiscard]] auto formatLabel(std::string_view label) -> std::string;

/**
 * @brief Apply formatLabel to every label
 */
[[nodiscard]] auto alignText(const std::vector<std::string>& labels)
    -> std::vector<std::string>;

}  // namespace livethemes::ui

#endif  // LIVETHEMES_UI_ALIGN_TEXT_HPP
