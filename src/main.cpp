#include "Addonkit/CliParser.hpp"
#include "Addonkit/ConfigParser.hpp"
#include "Addonkit/Core.hpp"
#include "Addonkit/Logger.hpp"
#include <filesystem>
#include <iostream>

#if defined(_WIN32)
#include <io.h>
#include <cstdio>
#else
#include <unistd.h>
#endif

// ANSI colors only when both console streams are terminals.
static bool consoleIsTerminal() {
#if defined(_WIN32)
    return _isatty(_fileno(stdout)) && _isatty(_fileno(stderr));
#else
    return ::isatty(STDOUT_FILENO) && ::isatty(STDERR_FILENO);
#endif
}

// Loads addonkit.yml (or --config) and applies logging options.
static Addonkit::Settings loadSettings(const Addonkit::Commands& commands) {
    std::string config_path = commands.config_path;
    if (config_path.empty()) {
        config_path = (std::filesystem::path(commands.directory) / Addonkit::kDefaultConfigFile).string();
    }

    Addonkit::Settings settings = Addonkit::Settings::fromConfig(Addonkit::ConfigParser(config_path));

    Addonkit::Logger& logger = Addonkit::Logger::getInstance();
    Addonkit::LogLevel level = Addonkit::LogLevel::INFO;
    Addonkit::Logger::parseLevel(settings.log_level, level);
    if (commands.verbose) {
        level = Addonkit::LogLevel::DEBUG;
    } else if (commands.quiet) {
        level = Addonkit::LogLevel::WARNING;
    }
    logger.setConsoleLogLevel(level);
    logger.setColors(consoleIsTerminal());

    if (!logger.openLogFile(settings.log_file)) {
        LOG_WARNING("addonkit", "Cannot open log file '" + settings.log_file + "'; logging to console only");
    }
    return settings;
}

int main(int argc, char** argv) {
    // CliParser defines and parses all command-line arguments using CLI11.
    Addonkit::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return parser.handleParseError(e);
    }

    try {
        Addonkit::Settings settings = loadSettings(parser.getCommands());
        Addonkit::Core core(parser.getCommands(), settings);
        int exit_code = core.run();
        Addonkit::Logger::getInstance().flush();
        return exit_code;
    } catch (const std::exception& e) {
        LOG_CRITICAL("addonkit", e.what());
        Addonkit::Logger::getInstance().flush();
        return 1;
    }
}
