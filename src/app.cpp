// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "atom/utils/argsview.hpp"

#include "cache/theme_cache.hpp"
#include "client/http_client.hpp"
#include "config/app_config.hpp"
#include "exception/exception.hpp"
#include "json/relaxed_json.hpp"
#include "json/strip_comments.hpp"
#include "logging/log.hpp"
#include "service/theme_service.hpp"
#include "settings/workspace_settings.hpp"
#include "theme/category.hpp"
#include "theme/colors.hpp"
#include "ui/align_text.hpp"
#include "ui/theme_labels.hpp"

using namespace std::string_literals;
namespace fs = std::filesystem;
using namespace livethemes;
using atom::utils::ArgumentParser;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_RUNTIME = 1;
constexpr int EXIT_USAGE = 2;

constexpr const char* DEFAULT_CONFIG_FILE = ".live-themes/config.json";
constexpr const char* DEFAULT_SETTINGS_FILE = ".vscode/settings.json";

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void printUsage(std::ostream& out) {
    out << "Usage: live-themes <command> [options]\n"
           "\n"
           "Commands:\n"
           "  strip [--file FILE] [--compact true] [--trailing-commas true]\n"
           "                       Print FILE (or stdin) with comments removed\n"
           "  validate --file FILE Check that FILE parses once comments and\n"
           "                       trailing commas are removed\n"
           "  categories           List the theme categories\n"
           "  list [--category CATEGORY]\n"
           "                       List the themes of a category\n"
           "  files --theme NAME [--category CATEGORY]\n"
           "                       List the theme files of a theme\n"
           "  apply --url FILE_URL [--settings PATH]\n"
           "                       Download a theme file and apply its colors\n"
           "  restore [--settings PATH]\n"
           "                       Restore the colors saved by the first apply\n"
           "\n"
           "Options accepted by every command:\n"
           "  -c, --config FILE    Config file (default "
        << DEFAULT_CONFIG_FILE
        << ")\n"
           "  -v, --verbose true   Log debug messages\n";
}

/**
 * @brief Register the options of @p command on @p parser
 * @throws UsageError for an unknown command
 */
void addCommandArguments(ArgumentParser& parser, const std::string& command) {
    using ArgType = ArgumentParser::ArgType;

    parser.addArgument("config", ArgType::STRING, false,
                       std::string(DEFAULT_CONFIG_FILE),
                       "Path to the config file", {"c"});
    parser.addArgument("verbose", ArgType::BOOLEAN, false, false,
                       "Log debug messages", {"v"});

    if (command == "strip") {
        parser.addArgument("file", ArgType::STRING, false, ""s,
                           "File to strip, stdin when omitted", {"f"});
        parser.addArgument("compact", ArgType::BOOLEAN, false, false,
                           "Remove comments instead of blanking them", {});
        parser.addArgument("trailing-commas", ArgType::BOOLEAN, false, false,
                           "Also remove trailing commas", {});
    } else if (command == "validate") {
        parser.addArgument("file", ArgType::STRING, false, ""s,
                           "File to validate", {"f"});
    } else if (command == "list") {
        parser.addArgument("category", ArgType::STRING, false,
                           std::string(theme::DEFAULT_CATEGORY),
                           "Theme list to show", {"l"});
    } else if (command == "files") {
        parser.addArgument("theme", ArgType::STRING, false, ""s,
                           "Display name of the theme", {"t"});
        parser.addArgument("category", ArgType::STRING, false,
                           std::string(theme::DEFAULT_CATEGORY),
                           "Theme list the theme is in", {"l"});
    } else if (command == "apply") {
        parser.addArgument("url", ArgType::STRING, false, ""s,
                           "Theme file URL or server path", {"u"});
        parser.addArgument("settings", ArgType::STRING, false,
                           std::string(DEFAULT_SETTINGS_FILE),
                           "Workspace settings file", {"s"});
    } else if (command == "restore") {
        parser.addArgument("settings", ArgType::STRING, false,
                           std::string(DEFAULT_SETTINGS_FILE),
                           "Workspace settings file", {"s"});
    } else if (command != "categories") {
        throw UsageError("Unknown command '" + command + "'");
    }
}

auto stringOption(ArgumentParser& parser, const std::string& name)
    -> std::string {
    return parser.get<std::string>(name).value_or("");
}

auto requiredOption(ArgumentParser& parser, const std::string& name)
    -> std::string {
    auto value = stringOption(parser, name);
    if (value.empty()) {
        throw UsageError("--" + name + " is required");
    }
    return value;
}

auto flagOption(ArgumentParser& parser, const std::string& name) -> bool {
    return parser.get<bool>(name).value_or(false);
}

auto readInput(const std::optional<std::string>& file) -> std::string {
    std::ostringstream buffer;
    if (!file || *file == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream in(*file, std::ios::binary);
    if (!in) {
        throw LiveThemesException("Cannot open " + *file);
    }
    buffer << in.rdbuf();
    return buffer.str();
}

/**
 * @brief Initialize logging from the application configuration
 */
void setupLoggingFromConfig(const config::AppConfig& appConfig, bool verbose) {
    auto logConfig = appConfig.logging;
    if (verbose) {
        logConfig.consoleLevel = spdlog::level::debug;
    }
    log::init(logConfig);
}

auto makeService(const config::AppConfig& appConfig)
    -> service::ThemeService {
    client::HttpClientConfig httpConfig;
    httpConfig.baseUrl = appConfig.baseUrl;
    httpConfig.timeout = appConfig.requestTimeout;
    httpConfig.userAgent = appConfig.userAgent;

    std::shared_ptr<cache::ThemeCache> themeCache;
    if (appConfig.devMode) {
        spdlog::debug("Development mode: theme list cache disabled");
    } else {
        themeCache = std::make_shared<cache::ThemeCache>(
            appConfig.cacheFile, appConfig.cacheTtl);
    }

    return service::ThemeService(
        std::make_shared<client::HttpClient>(std::move(httpConfig)),
        std::move(themeCache));
}

auto categoryOption(ArgumentParser& parser) -> std::string {
    auto listFile = stringOption(parser, "category");
    if (!theme::findCategory(listFile)) {
        throw UsageError("Unknown category '" + listFile + "'");
    }
    return listFile;
}

auto runStrip(ArgumentParser& parser) -> int {
    json::StripOptions options;
    options.whitespace = !flagOption(parser, "compact");
    options.trailingCommas = flagOption(parser, "trailing-commas");

    std::optional<std::string> file;
    if (auto path = stringOption(parser, "file"); !path.empty()) {
        file = std::move(path);
    }

    std::cout << json::stripComments(readInput(file), options);
    return EXIT_OK;
}

auto runValidate(ArgumentParser& parser) -> int {
    const auto file = requiredOption(parser, "file");

    try {
        auto document = json::parseRelaxedJson(readInput(file));
        std::cout << file << ": ok (" << document.type_name() << ")\n";
        return EXIT_OK;
    } catch (const RelaxedJsonParseException& e) {
        std::cerr << file << ":" << e.line() << ":" << e.column() << ": "
                  << e.what() << "\n";
        return EXIT_FAILURE_RUNTIME;
    }
}

auto runCategories() -> int {
    std::vector<std::string> labels;
    std::vector<std::string> names;
    for (const auto& category : theme::allCategories()) {
        labels.emplace_back(category.label);
        names.emplace_back(category.listFile);
    }
    auto aligned = ui::alignText(labels);
    for (size_t i = 0; i < aligned.size(); ++i) {
        std::cout << aligned[i] << "  [" << names[i] << "]\n";
    }
    return EXIT_OK;
}

auto runList(ArgumentParser& parser, const config::AppConfig& appConfig)
    -> int {
    const auto listFile = categoryOption(parser);

    auto service = makeService(appConfig);
    for (const auto& line : ui::themeLabels(service.getThemes(listFile))) {
        std::cout << line << "\n";
    }
    return EXIT_OK;
}

auto runFiles(ArgumentParser& parser, const config::AppConfig& appConfig)
    -> int {
    const auto name = requiredOption(parser, "theme");
    const auto listFile = categoryOption(parser);

    auto service = makeService(appConfig);
    auto found = service.findTheme(listFile, name);
    if (!found) {
        std::cerr << "No theme named '" << name << "' in " << listFile
                  << "\n";
        return EXIT_FAILURE_RUNTIME;
    }

    std::cout << found->displayName << " ("
              << ui::fileCountLabel(found->themeFiles.size()) << ")\n";
    for (const auto& line : ui::themeFileLabels(*found)) {
        std::cout << line << "\n";
    }
    return EXIT_OK;
}

auto runApply(ArgumentParser& parser, const config::AppConfig& appConfig)
    -> int {
    const auto url = requiredOption(parser, "url");
    const fs::path settingsFile = stringOption(parser, "settings");

    auto service = makeService(appConfig);
    auto colors = theme::extractColors(service.fetchThemeFile(url));

    settings::WorkspaceSettings workspace(settingsFile);
    workspace.load();
    workspace.backupOriginal();
    workspace.apply(colors);
    workspace.save();

    std::cout << "Applied " << url << " to " << workspace.settingsFile().string()
              << "\n";
    return EXIT_OK;
}

auto runRestore(ArgumentParser& parser) -> int {
    const fs::path settingsFile = stringOption(parser, "settings");

    settings::WorkspaceSettings workspace(settingsFile);
    workspace.load();
    if (!workspace.restoreOriginal()) {
        std::cerr << "No backup found for "
                  << workspace.settingsFile().string() << "\n";
        return EXIT_FAILURE_RUNTIME;
    }
    workspace.save();
    std::cout << "Restored " << workspace.settingsFile().string() << "\n";
    return EXIT_OK;
}

auto run(const std::vector<std::string>& args) -> int {
    if (args.size() < 2) {
        throw UsageError("Missing command");
    }
    const auto& command = args[1];
    if (command == "help" || command == "--help" || command == "-h") {
        printUsage(std::cout);
        return EXIT_OK;
    }

    ArgumentParser parser("live-themes "s + command);
    parser.addDescription("Live Themes command line interface:");
    addCommandArguments(parser, command);

    // The command word is not an option of its own parser
    std::vector<std::string> commandArgs{args.front()};
    commandArgs.insert(commandArgs.end(), args.begin() + 2, args.end());
    try {
        parser.parse(static_cast<int>(commandArgs.size()), commandArgs);
    } catch (const std::exception& e) {
        throw UsageError(e.what());
    }

    const auto appConfig =
        config::loadAppConfig(stringOption(parser, "config"));
    setupLoggingFromConfig(appConfig, flagOption(parser, "verbose"));

    if (command == "strip") {
        return runStrip(parser);
    }
    if (command == "validate") {
        return runValidate(parser);
    }
    if (command == "categories") {
        return runCategories();
    }
    if (command == "list") {
        return runList(parser, appConfig);
    }
    if (command == "files") {
        return runFiles(parser, appConfig);
    }
    if (command == "apply") {
        return runApply(parser, appConfig);
    }
    return runRestore(parser);
}

}  // namespace

int main(int argc, char** argv) {
    int status = EXIT_OK;
    try {
        status = run(std::vector<std::string>(argv, argv + argc));
    } catch (const UsageError& e) {
        std::cerr << "live-themes: " << e.what() << "\n\n";
        printUsage(std::cerr);
        status = EXIT_USAGE;
    } catch (const LiveThemesException& e) {
        spdlog::debug("Raised at {}:{}", e.location().file_name(),
                      e.location().line());
        std::cerr << "live-themes: " << e.what() << "\n";
        status = EXIT_FAILURE_RUNTIME;
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled exception: {}", e.what());
        std::cerr << "live-themes: " << e.what() << "\n";
        status = EXIT_FAILURE_RUNTIME;
    }

    log::shutdown();
    return status;
}
