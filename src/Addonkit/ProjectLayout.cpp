// =================================================================
// src/Addonkit/ProjectLayout.cpp
// =================================================================

#include "Addonkit/ProjectLayout.hpp"
#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace Addonkit {

ProjectLayout::ProjectLayout(fs::path root) : m_root(std::move(root)) {}

fs::path ProjectLayout::headerDir(const RuntimeRelease& release) const {
    return m_root / release.headerDirName();
}

fs::path ProjectLayout::includeDir(const RuntimeRelease& release) const {
    return headerDir(release) / "include" / "node";
}

fs::path ProjectLayout::artifact(const std::string& name) const {
    return buildDir() / (name + ".node");
}

std::vector<fs::path> ProjectLayout::downloadedHeaderDirs() const {
    std::vector<fs::path> found;
    std::error_code ec;
    for (fs::directory_iterator it(m_root, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& candidate = it->path();
        if (candidate.filename().string().rfind("node-v", 0) != 0) {
            continue;
        }
        std::error_code probe;
        if (fs::is_directory(candidate, probe) && fs::is_directory(candidate / "include" / "node", probe)) {
            found.push_back(candidate);
        }
    }
    std::sort(found.begin(), found.end());
    return found;
}

} // namespace Addonkit
