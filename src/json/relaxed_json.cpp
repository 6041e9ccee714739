// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "relaxed_json.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "exception/exception.hpp"

namespace livethemes::json {

auto lineColumnAt(std::string_view text, std::size_t offset) -> TextPosition {
    TextPosition position;
    const auto end = std::min(offset, text.size());
    for (std::size_t i = 0; i < end; ++i) {
        if (text[i] == '\n') {
            ++position.line;
            position.column = 1;
        } else {
            ++position.column;
        }
    }
    return position;
}

auto parseRelaxedJson(std::string_view text, const StripOptions& options)
    -> nlohmann::json {
    const std::string stripped = stripComments(text, options);

    try {
        return nlohmann::json::parse(stripped);
    } catch (const nlohmann::json::parse_error& e) {
        // nlohmann reports the byte count read so far, one past the offending
        // character.
        const std::size_t offset = e.byte > 0 ? e.byte - 1 : 0;
        const auto position = lineColumnAt(stripped, offset);
        spdlog::debug("Relaxed JSON parse failed at {}:{}: {}", position.line,
                      position.column, e.what());
        throw RelaxedJsonParseException(e.what(), offset, position.line,
                                        position.column);
    }
}

}  // namespace livethemes::json
