// =================================================================
// include/Addonkit/CMakeProbe.hpp
// =================================================================
// Reads the version of the cmake found on the search path.

#pragma once

#include "Addonkit/ProcessRunner.hpp"
#include <string>

namespace Addonkit {

class CMakeProbe {
public:
    explicit CMakeProbe(const ProcessRunner& runner) : m_runner(runner) {}

    /**
     * @brief Runs `cmake --version` and returns the version it reports.
     * @throws ProcessError if cmake fails, or if no version is printed.
     */
    std::string version() const;

    /**
     * @brief Extracts the first X.Y.Z token from version output.
     * @return The version, or an empty string if there is none.
     */
    static std::string parseVersion(const std::string& output);

private:
    const ProcessRunner& m_runner;
};

} // namespace Addonkit
