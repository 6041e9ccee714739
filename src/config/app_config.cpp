// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "app_config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string_view>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "exception/exception.hpp"
#include "json/relaxed_json.hpp"

namespace livethemes::config {

namespace {

auto levelValue(const nlohmann::json& section, const char* key,
                spdlog::level::level_enum fallback)
    -> spdlog::level::level_enum {
    if (!section.contains(key)) {
        return fallback;
    }
    const auto name = section[key].get<std::string>();
    auto level = log::parseLevel(name);
    if (!level) {
        throw SettingsException(
            fmt::format("Unknown log level '{}' for logging.{}", name, key));
    }
    return *level;
}

auto loggingToJson(const log::LogConfig& logging) -> nlohmann::json {
    return {{"level", log::levelName(logging.consoleLevel)},
            {"file", logging.file},
            {"fileLevel", log::levelName(logging.fileLevel)},
            {"maxFileSize", logging.maxFileSize},
            {"maxFiles", logging.maxFiles},
            {"pattern", logging.pattern}};
}

auto loggingFromJson(const nlohmann::json& section) -> log::LogConfig {
    if (!section.is_object()) {
        throw SettingsException("\"logging\" must be a JSON object");
    }
    log::LogConfig logging;
    logging.consoleLevel = levelValue(section, "level", logging.consoleLevel);
    logging.file = section.value("file", logging.file);
    logging.fileLevel = levelValue(section, "fileLevel", logging.fileLevel);
    logging.maxFileSize = section.value("maxFileSize", logging.maxFileSize);
    logging.maxFiles = section.value("maxFiles", logging.maxFiles);
    logging.pattern = section.value("pattern", logging.pattern);
    return logging;
}

}  // namespace

auto AppConfig::toJson() const -> nlohmann::json {
    return {{"baseUrl", baseUrl},
            {"cacheFile", cacheFile},
            {"cacheTtlHours", cacheTtl.count()},
            {"devMode", devMode},
            {"requestTimeoutMs", requestTimeout.count()},
            {"userAgent", userAgent},
            {"logging", loggingToJson(logging)}};
}

auto AppConfig::fromJson(const nlohmann::json& j) -> AppConfig {
    if (!j.is_object()) {
        throw SettingsException("Configuration root must be a JSON object");
    }

    AppConfig config;
    try {
        config.baseUrl = j.value("baseUrl", config.baseUrl);
        config.cacheFile = j.value("cacheFile", config.cacheFile);
        config.cacheTtl =
            std::chrono::hours{j.value("cacheTtlHours", config.cacheTtl.count())};
        config.devMode = j.value("devMode", config.devMode);
        config.requestTimeout = std::chrono::milliseconds{
            j.value("requestTimeoutMs", config.requestTimeout.count())};
        config.userAgent = j.value("userAgent", config.userAgent);
        if (j.contains("logging")) {
            config.logging = loggingFromJson(j["logging"]);
        }
    } catch (const nlohmann::json::type_error& e) {
        throw SettingsException(
            fmt::format("Invalid configuration value: {}", e.what()));
    }

    while (!config.baseUrl.empty() && config.baseUrl.back() == '/') {
        config.baseUrl.pop_back();
    }
    return config;
}

auto loadAppConfig(const std::filesystem::path& path) -> AppConfig {
    AppConfig config;

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw SettingsException(
                fmt::format("Cannot open config file {}", path.string()));
        }
        std::ostringstream buffer;
        buffer << file.rdbuf();

        try {
            config = AppConfig::fromJson(json::parseRelaxedJson(buffer.str()));
        } catch (const RelaxedJsonParseException& e) {
            throw SettingsException(
                fmt::format("{}:{}:{}: {}", path.string(), e.line(),
                            e.column(), e.what()));
        }
        spdlog::debug("Loaded configuration from {}", path.string());
    } else {
        spdlog::debug("No config file at {}, using defaults", path.string());
    }

    if (devModeFromEnvironment()) {
        config.devMode = true;
    }
    return config;
}

auto devModeFromEnvironment() -> bool {
    const char* value = std::getenv(DEV_MODE_ENV);
    return value != nullptr && std::string_view(value) == "true";
}

}  // namespace livethemes::config
