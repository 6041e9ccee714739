// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

/*************************************************

Date: 2026-10-18

Description: Comment and trailing comma stripper for relaxed JSON

**************************************************/

#ifndef LIVETHEMES_JSON_STRIP_COMMENTS_HPP
#define LIVETHEMES_JSON_STRIP_COMMENTS_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace livethemes::json {

/**
 * @brief Options controlling how comments and trailing commas are removed
 */
struct StripOptions {
    /// Replace stripped characters with spaces so that line and column
    /// numbers of the result match the input. Line breaks are always kept.
    bool whitespace = true;
    /// Also strip commas that are followed only by `}` or `]`.
    bool trailingCommas = false;
};

/**
 * @brief Lexical state of the scanner
 */
enum class ScanState : uint8_t {
    Normal,
    InString,
    InLineComment,
    InBlockComment
};

/**
 * @brief Turn a relaxed JSON document into strict JSON text
 *
 * Removes line and block comments (and, optionally, trailing commas)
 * outside of string literals. String contents are copied through untouched.
 * Any input produces some output; the result is not validated.
 *
 * With `whitespace` enabled the result has exactly the same length as the
 * input, so positions reported by a JSON parser on the result also apply to
 * the original text.
 *
 * @param input Raw document text
 * @param options Stripping options
 * @return Text with comments (and trailing commas) removed
 */
[[nodiscard]] auto stripComments(std::string_view input,
                                 const StripOptions& options = {})
    -> std::string;

namespace detail {

/**
 * @brief Count consecutive backslashes immediately before @p pos
 */
[[nodiscard]] auto countPrecedingBackslashes(std::string_view text,
                                             std::size_t pos) noexcept
    -> std::size_t;

/**
 * @brief Whether the quote at @p pos is escaped by an odd backslash run
 */
[[nodiscard]] inline auto isEscapedQuote(std::string_view text,
                                         std::size_t pos) noexcept -> bool {
    return countPrecedingBackslashes(text, pos) % 2 == 1;
}

/**
 * @brief JSON insignificant whitespace
 */
[[nodiscard]] constexpr auto isJsonWhitespace(char c) noexcept -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

}  // namespace detail

}  // namespace livethemes::json

#endif  // LIVETHEMES_JSON_STRIP_COMMENTS_HPP
