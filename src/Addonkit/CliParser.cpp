// =================================================================
// src/Addonkit/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Addonkit/CliParser.hpp"
#include "Addonkit/Version.hpp"

namespace Addonkit {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("addonkit: scaffold, build and test native Node.js addons with CMake and Ninja.",
                                       kToolName);
    m_app->set_version_flag("--version", kToolVersion);
    m_app->require_subcommand(1);

    m_app->add_option("-C,--directory", m_commands.directory,
                      "Project directory (for 'new': where the project is created)")
        ->check(CLI::ExistingDirectory);
    m_app->add_option("--config", m_commands.config_path, "Configuration file (default: addonkit.yml)")
        ->check(CLI::ExistingFile);
    auto* verbose = m_app->add_flag("-v,--verbose", m_commands.verbose, "Print debug output");
    m_app->add_flag("-q,--quiet", m_commands.quiet, "Only print warnings and errors")->excludes(verbose);

    // Set command callback to store which subcommand was used
    m_app->callback([this]() {
        for (auto* subcommand : m_app->get_subcommands()) {
            if (subcommand->parsed()) {
                m_commands.active_command = subcommand->get_name();
                break;
            }
        }
    });

    setupNewCommand(*m_app);
    setupInitCommand(*m_app);
    setupBuildCommand(*m_app);
    setupTestCommand(*m_app);
    setupCleanCommand(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

int CliParser::handleParseError(const CLI::ParseError& error, std::ostream& out, std::ostream& err) const {
    int code = m_app->exit(error, out, err);
    return code == 0 ? 0 : 1;
}

void CliParser::setupNewCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("new", "Creates a new addon project and fetches its dependencies.");
    sub->alias("create");
    // Validated by the command itself so an empty name gets the same message as a missing one.
    sub->add_option("name", m_commands.project_name, "Name of the project directory and addon.");
}

void CliParser::setupInitCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("init", "Downloads Node.js headers (and node.lib on Windows) for the running Node.js.");
    sub->alias("install");
}

void CliParser::setupBuildCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("build", "Configures the project with CMake and compiles it with Ninja.");
    sub->add_option("mode", m_commands.build_mode, "Build type: 'release' (default) or 'debug'.")
        ->check(CLI::IsMember({"debug", "release"}));
}

void CliParser::setupTestCommand(CLI::App& app) {
    app.add_subcommand("test", "Loads the built addon with Node.js and prints what it exports.");
}

void CliParser::setupCleanCommand(CLI::App& app) {
    auto* sub = app.add_subcommand("clean", "Removes the build directory.");
    sub->add_option("scope", m_commands.clean_scope, "'all' also removes downloaded dependencies.")
        ->check(CLI::IsMember({"all"}));
}

} // namespace Addonkit
