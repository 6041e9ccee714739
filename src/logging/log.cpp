// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "log.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "exception/exception.hpp"

namespace livethemes::log {

auto parseLevel(std::string_view name)
    -> std::optional<spdlog::level::level_enum> {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error" || name == "err") return spdlog::level::err;
    if (name == "critical" || name == "fatal") return spdlog::level::critical;
    if (name == "off" || name == "none") return spdlog::level::off;
    return std::nullopt;
}

auto levelName(spdlog::level::level_enum level) -> std::string {
    const auto name = spdlog::level::to_string_view(level);
    return std::string(name.data(), name.size());
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_level(config.consoleLevel);
    sinks.push_back(console);

    auto loggerLevel = config.consoleLevel;
    if (!config.file.empty()) {
        const std::filesystem::path path(config.file);
        try {
            if (path.has_parent_path()) {
                std::filesystem::create_directories(path.parent_path());
            }
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file, config.maxFileSize, config.maxFiles);
            file->set_level(config.fileLevel);
            sinks.push_back(file);
        } catch (const std::filesystem::filesystem_error& e) {
            throw SettingsException(fmt::format("Cannot create log directory "
                                                "for {}: {}",
                                                config.file, e.what()));
        } catch (const spdlog::spdlog_ex& e) {
            throw SettingsException(
                fmt::format("Cannot open log file {}: {}", config.file,
                            e.what()));
        }
        loggerLevel = std::min(loggerLevel, config.fileLevel);
    }

    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(),
                                                   sinks.end());
    logger->set_level(loggerLevel);
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);

    spdlog::debug("Logging to stderr at {}{}", levelName(config.consoleLevel),
                  config.file.empty() ? "" : " and to " + config.file);
}

void shutdown() {
    if (auto current = spdlog::default_logger()) {
        current->flush();
    }
    // Replacing the default logger releases the file sink
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        LOGGER_NAME, std::make_shared<spdlog::sinks::stderr_color_sink_mt>()));
}

}  // namespace livethemes::log
