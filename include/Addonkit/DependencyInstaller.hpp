// =================================================================
// include/Addonkit/DependencyInstaller.hpp
// =================================================================
// Fetches the files a native addon compiles and links against: the
// Node.js headers and, on Windows, the node.lib import library.

#pragma once

#include "Addonkit/ProjectLayout.hpp"
#include "Addonkit/RuntimeRelease.hpp"
#include "Addonkit/SysInteraction.hpp"
#include <string>

namespace Addonkit {

class DependencyInstaller {
public:
    DependencyInstaller(const ProjectLayout& layout, const RuntimeRelease& release, std::string dist_url);

    /**
     * @brief Downloads the headers and, for Windows releases, the import
     *        library. Overwrites anything previously downloaded.
     *
     * On failure the directories being populated are removed and the error
     * is rethrown for the caller to report.
     */
    void install() const;

    void installHeaders() const;
    void installImportLibrary() const;

private:
    const ProjectLayout& m_layout;
    RuntimeRelease m_release;
    std::string m_dist_url;
    SysInteraction m_sys;
};

} // namespace Addonkit
