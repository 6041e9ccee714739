// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "align_text.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace livethemes::ui {

namespace {

constexpr std::string_view PART_SEPARATOR = " | ";

auto trim(std::string_view text) -> std::string_view {
    auto isSpace = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    };
    while (!text.empty() && isSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && isSpace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

// Length of a leading "$(name)" icon, or 0 if the label has none.
auto iconLength(std::string_view label) -> std::size_t {
    if (!label.starts_with("$(")) {
        return 0;
    }
    auto close = label.find(')', 2);
    if (close == std::string_view::npos || close == 2) {
        return 0;
    }
    return close + 1;
}

auto splitParts(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find(PART_SEPARATOR, start);
        if (pos == std::string_view::npos) {
            parts.push_back(trim(text.substr(start)));
            break;
        }
        parts.push_back(trim(text.substr(start, pos - start)));
        start = pos + PART_SEPARATOR.size();
    }
    return parts;
}

}  // namespace

auto formatLabel(std::string_view label) -> std::string {
    if (label.find(PART_SEPARATOR) == std::string_view::npos) {
        return std::string(label);
    }

    const auto iconEnd = iconLength(label);
    const auto icon = label.substr(0, iconEnd);
    // Parts are trimmed after splitting, so empty parts are kept.
    const auto parts = splitParts(label.substr(iconEnd));
    if (parts.size() < 2) {
        return std::string(label);
    }

    std::size_t textLength = 0;
    for (const auto& part : parts) {
        textLength += part.size();
    }

    const std::size_t gaps = parts.size() - 1;
    std::size_t gapWidth = 1;
    if (textLength < LABEL_TEXT_WIDTH) {
        const std::size_t totalSpace = LABEL_TEXT_WIDTH - textLength;
        gapWidth = totalSpace / gaps + (totalSpace % gaps > 0 ? 1 : 0);
        gapWidth = std::max<std::size_t>(gapWidth, 1);
    }
    const std::string gap(gapWidth, ' ');

    std::string result(icon);
    result.push_back(' ');
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += gap;
        }
        result += parts[i];
    }
    return result;
}

auto alignText(const std::vector<std::string>& labels)
    -> std::vector<std::string> {
    std::vector<std::string> aligned;
    aligned.reserve(labels.size());
    std::transform(labels.begin(), labels.end(), std::back_inserter(aligned),
                   [](const std::string& label) { return formatLabel(label); });
    return aligned;
}

}  // namespace livethemes::ui
