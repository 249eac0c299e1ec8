// =================================================================
// src/Addonkit/ToolLocator.cpp
// =================================================================
// Implementation for locating executables on the search path.

#include "Addonkit/ToolLocator.hpp"
#include "Addonkit/Errors.hpp"
#include "Addonkit/Logger.hpp"
#include <cstdlib>

namespace Addonkit {

std::string ToolLocator::locatorProgram() {
#if defined(_WIN32)
    const char* system_root = std::getenv("SystemRoot");
    if (system_root == nullptr || *system_root == '\0') {
        throw ConfigurationError("SystemRoot is not set; cannot find where.exe");
    }
    return std::string(system_root) + "\\System32\\where.exe";
#else
    return "which";
#endif
}

bool ToolLocator::isAvailable(const std::string& tool) const {
    try {
        ProcessResult result = m_runner.run({locatorProgram(), {tool}});
        LOG_DEBUG("ToolLocator", tool + (result.exit_code == 0 ? " found" : " not found"));
        return result.exit_code == 0;
    } catch (const ProcessError& e) {
        LOG_DEBUG("ToolLocator", "Locator failed for " + tool, e.what());
        return false;
    }
}

std::string ToolLocator::locate(const std::string& tool) const {
    ProcessResult result;
    try {
        result = m_runner.run({locatorProgram(), {tool}});
    } catch (const ProcessError& e) {
        LOG_DEBUG("ToolLocator", "Locator failed for " + tool, e.what());
        throw ToolNotFoundError(tool);
    }

    std::string first_line = result.std_out.substr(0, result.std_out.find('\n'));
    while (!first_line.empty() && (first_line.back() == '\r' || first_line.back() == ' ')) {
        first_line.pop_back();
    }
    if (result.exit_code != 0 || first_line.empty()) {
        throw ToolNotFoundError(tool);
    }
    return first_line;
}

void ToolLocator::require(const std::string& tool) const {
    if (!isAvailable(tool)) {
        throw ToolNotFoundError(tool);
    }
}

} // namespace Addonkit
