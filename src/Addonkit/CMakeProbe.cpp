// =================================================================
// src/Addonkit/CMakeProbe.cpp
// =================================================================

#include "Addonkit/CMakeProbe.hpp"
#include "Addonkit/Errors.hpp"
#include "Addonkit/Logger.hpp"
#include <regex>

namespace Addonkit {

std::string CMakeProbe::version() const {
    ProcessResult result = m_runner.runChecked({"cmake", {"--version"}});
    std::string version = parseVersion(result.std_out);
    if (version.empty()) {
        throw ProcessError("Could not read a version from 'cmake --version'");
    }
    LOG_DEBUG("CMake", "Found cmake " + version);
    return version;
}

std::string CMakeProbe::parseVersion(const std::string& output) {
    static const std::regex version_pattern(R"((\d+\.\d+\.\d+))");
    std::smatch match;
    if (std::regex_search(output, match, version_pattern)) {
        return match[1].str();
    }
    return "";
}

} // namespace Addonkit
