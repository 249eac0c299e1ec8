// =================================================================
// src/Addonkit/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Addonkit/Core.hpp"
#include "Addonkit/CMakeProbe.hpp"
#include "Addonkit/DependencyInstaller.hpp"
#include "Addonkit/Errors.hpp"
#include "Addonkit/Logger.hpp"
#include "Addonkit/ProcessRunner.hpp"
#include "Addonkit/ProjectGenerator.hpp"
#include "Addonkit/ProjectLayout.hpp"
#include "Addonkit/RollbackHandler.hpp"
#include "Addonkit/RuntimeRelease.hpp"
#include "Addonkit/SysInteraction.hpp"
#include "Addonkit/ToolLocator.hpp"
#include <exception>
#include <future>
#include <vector>

namespace fs = std::filesystem;

namespace Addonkit {

Core::Core(const Commands& commands, const Settings& settings, std::shared_ptr<const ProcessRunner> runner)
    : m_commands(commands),
      m_settings(settings),
      m_directory(fs::absolute(commands.directory).lexically_normal()),
      m_runner(runner ? std::move(runner) : std::make_shared<ProcessRunner>()),
      m_sys(std::make_unique<SysInteraction>()),
      m_tools(std::make_unique<ToolLocator>(*m_runner))
{
}

Core::~Core() = default;

int Core::run() {
    if (m_commands.active_command == "new") {
        return handleNew();
    } else if (m_commands.active_command == "init") {
        return handleInit();
    } else if (m_commands.active_command == "build") {
        return handleBuild();
    } else if (m_commands.active_command == "test") {
        return handleTest();
    } else if (m_commands.active_command == "clean") {
        return handleClean();
    }

    return RollbackHandler().handle(UsageError(
        "None of the possible commands 'new', 'init', 'build', 'test', or 'clean' were specified."));
}

int Core::handleNew() {
    const std::string& name = m_commands.project_name;
    if (name.empty()) {
        return RollbackHandler().handle(UsageError("A project name is required: addonkit new <name>"));
    }
    if (!ProjectGenerator::isValidName(name)) {
        return RollbackHandler().handle(UsageError(
            "Invalid project name '" + name + "': use letters, digits, '_', '-' and '.'"));
    }

    const fs::path root = m_directory / name;
    if (fs::exists(root)) {
        return RollbackHandler().handle(PreconditionError("'" + root.string() + "' already exists."));
    }
    if (!m_sys->createDirectory(root)) {
        return RollbackHandler().handle(std::runtime_error("Could not create directory '" + root.string() + "'."));
    }

    LOG_INFO("New", "Generating sample project '" + name + "'...");

    // From here on every failure removes the project directory again.
    RollbackHandler on_failure({root});
    try {
        ProjectLayout layout(root);

        m_tools->require("cmake");
        const std::string cmake_version = CMakeProbe(*m_runner).version();
        const RuntimeRelease release = detectRelease();

        DependencyInstaller installer(layout, release, m_settings.dist_url);
        auto installation = std::async(std::launch::async, [&installer]() { installer.install(); });

        ProjectGenerator generator(layout, release, m_settings.napi_version);
        std::exception_ptr scaffold_error;
        try {
            generator.generate(name, cmake_version);
        } catch (...) {
            // Rethrown once the download has finished with the directory.
            scaffold_error = std::current_exception();
        }
        installation.wait();
        if (scaffold_error) {
            std::rethrow_exception(scaffold_error);
        }
        installation.get();

        initializeRepository(layout, generator);
    } catch (const std::exception& e) {
        return on_failure.handle(e);
    }

    LOG_INFO("New", "Success. Next: cd " + name + " && addonkit build && addonkit test");
    return 0;
}

int Core::handleInit() {
    ProjectLayout layout(m_directory);
    try {
        const RuntimeRelease release = detectRelease();
        DependencyInstaller(layout, release, m_settings.dist_url).install();
    } catch (const std::exception& e) {
        return RollbackHandler().handle(e);
    }

    LOG_INFO("Install", "Success");
    return 0;
}

int Core::handleBuild() {
    ProjectLayout layout(m_directory);
    try {
        const RuntimeRelease release = detectRelease();
        checkBuildPreconditions(layout, release);
    } catch (const std::exception& e) {
        return RollbackHandler().handle(e);
    }

    const std::string build_type = m_commands.build_mode == "debug" ? "Debug" : "Release";
    LOG_INFO("Build", "Building project (" + build_type + ")...");

    // A failed configure or compile leaves nothing behind, forcing a full
    // reconfiguration next time.
    RollbackHandler on_failure({layout.buildDir()});
    try {
        m_sys->createDirectories(layout.buildDir());

        StepRunner steps(*m_runner);
        steps.add("configure", {"cmake",
                                {"-D", "CMAKE_BUILD_TYPE=" + build_type, "-G", "Ninja", layout.root().string()},
                                layout.buildDir()});
        steps.add("compile", {"ninja", {}, layout.buildDir()});
        steps.run();
    } catch (const std::exception& e) {
        return on_failure.handle(e);
    }

    LOG_INFO("Build", "Success");
    return 0;
}

int Core::handleTest() {
    ProjectLayout layout(m_directory);
    try {
        const std::string node = m_tools->locate(m_settings.node_executable);

        // The addon is loaded through package.json "main" and whatever it
        // exports is printed.
        ProcessSpec smoke_test{node, {"-p", "require(process.argv[1])", layout.root().string()}, layout.root(), false};
        LOG_INFO("Test", "Running " + smoke_test.describe());
        return m_runner->run(smoke_test).exit_code;
    } catch (const std::exception& e) {
        return RollbackHandler().handle(e);
    }
}

int Core::handleClean() {
    ProjectLayout layout(m_directory);
    const bool all = m_commands.clean_scope == "all";
    LOG_INFO("Clean", all ? "Removing build output and downloaded dependencies..." : "Removing build output...");

    try {
        m_sys->removePath(layout.buildDir(), true);
        if (all) {
            for (const auto& header_dir : layout.downloadedHeaderDirs()) {
                m_sys->removePath(header_dir, true);
            }
            m_sys->removePath(layout.libDir(), true);
        }
    } catch (const std::exception& e) {
        return RollbackHandler().handle(e);
    }

    LOG_INFO("Clean", "Success");
    return 0;
}

RuntimeRelease Core::detectRelease() const {
    return RuntimeRelease::detect(*m_runner, m_settings.node_executable);
}

void Core::checkBuildPreconditions(const ProjectLayout& layout, const RuntimeRelease& release) const {
    auto cmake_found = std::async(std::launch::async, [this]() { return m_tools->isAvailable("cmake"); });
    auto ninja_found = std::async(std::launch::async, [this]() { return m_tools->isAvailable("ninja"); });
    const bool headers_found = m_sys->directoryExists(layout.includeDir(release));
    const bool library_found = !release.isWindows() || m_sys->fileExists(layout.libFile());

    std::vector<std::string> problems;
    if (!cmake_found.get()) {
        problems.push_back("Could not find 'cmake' in the path.");
    }
    if (!ninja_found.get()) {
        problems.push_back("Could not find 'ninja' in the path.");
    }
    if (!headers_found) {
        problems.push_back("Missing header files in '" + layout.includeDir(release).string() +
                           "'. Run 'addonkit init' first.");
    }
    if (!library_found) {
        problems.push_back("Missing library file '" + layout.libFile().string() + "'. Run 'addonkit init' first.");
    }

    if (!problems.empty()) {
        std::string message = problems.front();
        for (size_t i = 1; i < problems.size(); i++) {
            message += "\n" + problems[i];
        }
        throw PreconditionError(message);
    }
}

void Core::initializeRepository(const ProjectLayout& layout, const ProjectGenerator& generator) const {
    if (!m_tools->isAvailable("git")) {
        LOG_WARNING("New", "'git' not found; skipping repository and .gitignore");
        return;
    }

    try {
        ProcessResult result = m_runner->runChecked({"git", {"init"}, layout.root()});
        LOG_DEBUG("New", result.std_out);
    } catch (const ProcessError& e) {
        RollbackHandler({layout.gitDir()}, true).handle(e);
        LOG_WARNING("New", "'git init' failed; skipping .gitignore", e.what());
        return;
    }

    generator.writeIgnoreFile();
}

} // namespace Addonkit
