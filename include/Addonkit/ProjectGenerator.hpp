// =================================================================
// include/Addonkit/ProjectGenerator.hpp
// =================================================================
// Writes the scaffold of a new addon project: CMakeLists.txt,
// src/module.c, package.json and .gitignore.

#pragma once

#include "Addonkit/ProjectLayout.hpp"
#include "Addonkit/RuntimeRelease.hpp"
#include "Addonkit/SysInteraction.hpp"
#include <string>

namespace Addonkit {

class ProjectGenerator {
public:
    /**
     * @param layout Paths of the project being generated.
     * @param release Runtime whose headers the build configuration uses.
     * @param napi_version Value of NAPI_VERSION in the build configuration.
     */
    ProjectGenerator(const ProjectLayout& layout, const RuntimeRelease& release, int napi_version);

    /**
     * @brief Creates src/ and writes the build configuration, the source
     *        stub and the manifest.
     * @param name Project and target name.
     * @param cmake_version Minimum CMake version to require.
     */
    void generate(const std::string& name, const std::string& cmake_version) const;

    /**
     * @brief Writes .gitignore. Only called once a repository exists.
     */
    void writeIgnoreFile() const;

    std::string cmakeListsContent(const std::string& name, const std::string& cmake_version) const;
    std::string sourceContent(const std::string& name) const;
    std::string manifestContent(const std::string& name) const;
    std::string ignoreContent() const;

    /**
     * @brief Whether a name can be used for the project directory, the
     *        CMake project and the package: letters, digits, '_', '-' and
     *        '.', not starting with '.' or '-'.
     */
    static bool isValidName(const std::string& name);

private:
    std::string relativeToRoot(const std::filesystem::path& path) const;

    const ProjectLayout& m_layout;
    RuntimeRelease m_release;
    int m_napi_version;
    SysInteraction m_sys;
};

} // namespace Addonkit
