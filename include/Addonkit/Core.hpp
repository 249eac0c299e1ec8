// =================================================================
// include/Addonkit/Core.hpp
// =================================================================
// Defines the core application orchestrator: one handler per
// subcommand, each returning the process exit code.

#pragma once

#include "Addonkit/CliParser.hpp"
#include "Addonkit/ConfigParser.hpp"
#include <filesystem>
#include <memory>
#include <string>

// Forward declarations to reduce header dependencies
namespace Addonkit {
    class ProcessRunner;
    class ProjectGenerator;
    class ProjectLayout;
    class SysInteraction;
    class ToolLocator;
    struct RuntimeRelease;
}

namespace Addonkit {

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     * @param settings Effective configuration.
     * @param runner Used for every external program; replaceable in tests.
     */
    Core(const Commands& commands, const Settings& settings,
         std::shared_ptr<const ProcessRunner> runner = nullptr);

    /**
     * @brief Destructor must be declared here and defined in the .cpp file.
     * This is required because we are using unique_ptr with forward-declared types.
     */
    ~Core();

    /**
     * @brief Runs the handler for the parsed subcommand.
     * @return An integer exit code (0 for success).
     */
    int run();

private:
    // Command Handlers
    int handleNew();
    int handleInit();
    int handleBuild();
    int handleTest();
    int handleClean();

    RuntimeRelease detectRelease() const;
    void checkBuildPreconditions(const ProjectLayout& layout, const RuntimeRelease& release) const;
    void initializeRepository(const ProjectLayout& layout, const ProjectGenerator& generator) const;

    const Commands& m_commands;
    Settings m_settings;
    std::filesystem::path m_directory;
    std::shared_ptr<const ProcessRunner> m_runner;
    std::unique_ptr<SysInteraction> m_sys;
    std::unique_ptr<ToolLocator> m_tools;
};

} // namespace Addonkit
