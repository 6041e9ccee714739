// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#ifndef LIVETHEMES_JSON_RELAXED_JSON_HPP
#define LIVETHEMES_JSON_RELAXED_JSON_HPP

#include <cstddef>
#include <string_view>

#include <nlohmann/json.hpp>

#include "strip_comments.hpp"

namespace livethemes::json {

/**
 * @brief 1-based line and column of a byte offset
 */
struct TextPosition {
    std::size_t line = 1;
    std::size_t column = 1;
};

/**
 * @brief Compute the line and column of @p offset in @p text
 *
 * `\n` starts a new line; a `\r` directly before it belongs to the previous
 * line. Offsets past the end are clamped to the end of the text.
 */
[[nodiscard]] auto lineColumnAt(std::string_view text, std::size_t offset)
    -> TextPosition;

/**
 * @brief Strip comments and trailing commas, then parse as strict JSON
 *
 * @param text Relaxed JSON document
 * @param options Strip options, trailing commas enabled by default
 * @return Parsed document
 * @throws RelaxedJsonParseException if the stripped text is not valid JSON
 */
[[nodiscard]] auto parseRelaxedJson(
    std::string_view text,
    const StripOptions& options = {.whitespace = true, .trailingCommas = true})
    -> nlohmann::json;

}  // namespace livethemes::json

#endif  // LIVETHEMES_JSON_RELAXED_JSON_HPP
