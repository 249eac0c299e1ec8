// =================================================================
// include/Addonkit/ProjectLayout.hpp
// =================================================================
// Every path the commands read or write, derived from an explicit
// project root. Nothing here depends on the process working directory.

#pragma once

#include "Addonkit/RuntimeRelease.hpp"
#include <filesystem>
#include <vector>

namespace Addonkit {

class ProjectLayout {
public:
    explicit ProjectLayout(std::filesystem::path root);

    const std::filesystem::path& root() const { return m_root; }

    std::filesystem::path buildDir() const { return m_root / "build"; }
    std::filesystem::path srcDir() const { return m_root / "src"; }
    std::filesystem::path libDir() const { return m_root / "libs"; }
    std::filesystem::path libFile() const { return libDir() / "node.lib"; }

    std::filesystem::path cmakeFile() const { return m_root / "CMakeLists.txt"; }
    std::filesystem::path sourceFile() const { return srcDir() / "module.c"; }
    std::filesystem::path manifestFile() const { return m_root / "package.json"; }
    std::filesystem::path ignoreFile() const { return m_root / ".gitignore"; }
    std::filesystem::path gitDir() const { return m_root / ".git"; }

    std::filesystem::path headerDir(const RuntimeRelease& release) const;
    std::filesystem::path includeDir(const RuntimeRelease& release) const;

    /// Built addon as referenced by the manifest, e.g. build/name.node.
    std::filesystem::path artifact(const std::string& name) const;

    /**
     * @brief Header directories of any release found in the project, i.e.
     *        "node-v*" directories that contain include/node.
     */
    std::vector<std::filesystem::path> downloadedHeaderDirs() const;

private:
    std::filesystem::path m_root;
};

} // namespace Addonkit
