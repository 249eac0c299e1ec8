// =================================================================
// include/Addonkit/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace Addonkit {

// A simple struct to hold parsed command information.
struct Commands {
    std::string active_command; // Name of the subcommand triggered

    // Global options
    std::string directory = "."; // Project root, or parent directory for 'new'
    std::string config_path;     // Explicit --config file
    bool verbose = false;
    bool quiet = false;

    // Options for 'new'
    std::string project_name;

    // Options for 'build': "debug" or "release"
    std::string build_mode;

    // Options for 'clean': "all" also removes downloaded dependencies
    std::string clean_scope;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all CLI commands, options, and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

    /**
     * @brief Prints the message for a failed parse and maps it to an exit
     *        code: 0 for --help and --version, 1 for every usage error.
     */
    int handleParseError(const CLI::ParseError& error, std::ostream& out = std::cout,
                         std::ostream& err = std::cerr) const;

private:
    void setupNewCommand(CLI::App& app);
    void setupInitCommand(CLI::App& app);
    void setupBuildCommand(CLI::App& app);
    void setupTestCommand(CLI::App& app);
    void setupCleanCommand(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;
};

} // namespace Addonkit
