// =================================================================
// include/Addonkit/ToolLocator.hpp
// =================================================================
// Checks whether executables such as cmake, ninja, git and node can
// be found on the search path.

#pragma once

#include "Addonkit/ProcessRunner.hpp"
#include <string>

namespace Addonkit {

class ToolLocator {
public:
    explicit ToolLocator(const ProcessRunner& runner) : m_runner(runner) {}

    /**
     * @brief Reports whether the search path resolves a tool. Only the exit
     *        status of the locator is inspected; a locator that cannot be
     *        started counts as "not available".
     */
    bool isAvailable(const std::string& tool) const;

    /**
     * @brief Resolves the full path of a tool.
     * @return First line printed by the locator.
     * @throws ToolNotFoundError if the tool is not on the search path.
     */
    std::string locate(const std::string& tool) const;

    /**
     * @brief Throws ToolNotFoundError unless the tool is available.
     */
    void require(const std::string& tool) const;

    /**
     * @brief The locator program: `which` on POSIX systems and
     *        %SystemRoot%\System32\where.exe on Windows.
     * @throws ConfigurationError on Windows when SystemRoot is not set.
     */
    static std::string locatorProgram();

private:
    const ProcessRunner& m_runner;
};

} // namespace Addonkit
