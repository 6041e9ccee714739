// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

/*************************************************

Date: 2026-10-18

Description: Console and log file setup for the live-themes tool

**************************************************/

#ifndef LIVETHEMES_LOGGING_LOG_HPP
#define LIVETHEMES_LOGGING_LOG_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace livethemes::log {

inline constexpr const char* LOGGER_NAME = "live-themes";

/**
 * @brief Logging setup read from the "logging" section of the config file
 */
struct LogConfig {
    spdlog::level::level_enum consoleLevel{spdlog::level::info};
    /// Log file path; empty disables the file sink
    std::string file;
    spdlog::level::level_enum fileLevel{spdlog::level::debug};
    std::size_t maxFileSize{1024 * 1024};
    std::size_t maxFiles{3};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v"};
};

/**
 * @brief Level for a name such as "debug" or "warning"
 *
 * Accepts trace, debug, info, warn|warning, error|err, critical|fatal and
 * off|none.
 */
[[nodiscard]] auto parseLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum>;

[[nodiscard]] auto levelName(spdlog::level::level_enum level) -> std::string;

/**
 * @brief Install the live-themes logger as the spdlog default logger
 *
 * Console output goes to stderr so that command output on stdout can be
 * piped. When @c config.file is set, a rotating file sink is added and its
 * directory created.
 *
 * @throws SettingsException if the log file cannot be opened
 */
void init(const LogConfig& config);

/**
 * @brief Flush and close the log file, leaving a plain stderr logger behind
 */
void shutdown();

}  // namespace livethemes::log

#endif  // LIVETHEMES_LOGGING_LOG_HPP
