// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "theme_labels.hpp"

#include <spdlog/fmt/fmt.h>

#include "align_text.hpp"

namespace livethemes::ui {

auto fileCountLabel(std::size_t count) -> std::string {
    return fmt::format("{} {}", count, count == 1 ? "Theme" : "Themes");
}

auto themeLabels(const std::vector<theme::Theme>& themes)
    -> std::vector<std::string> {
    std::vector<std::string> labels;
    labels.reserve(themes.size());
    for (const auto& entry : themes) {
        const auto& publisher = entry.publisher.displayName.empty()
                                    ? entry.publisher.publisherName
                                    : entry.publisher.displayName;
        labels.push_back(entry.displayName + " | " + publisher);
    }

    auto aligned = alignText(labels);
    for (std::size_t i = 0; i < aligned.size(); ++i) {
        aligned[i] += "  (" + fileCountLabel(themes[i].themeFiles.size()) + ")";
    }
    return aligned;
}

auto themeFileLabels(const theme::Theme& theme) -> std::vector<std::string> {
    std::vector<std::string> labels;
    labels.reserve(theme.themeFiles.size());
    for (const auto& file : theme.themeFiles) {
        labels.push_back(file.name + " | " + file.file);
    }
    return alignText(labels);
}

}  // namespace livethemes::ui
