// =================================================================
// src/Addonkit/DependencyInstaller.cpp
// =================================================================

#include "Addonkit/DependencyInstaller.hpp"
#include "Addonkit/ArchiveExtractor.hpp"
#include "Addonkit/Downloader.hpp"
#include "Addonkit/Logger.hpp"
#include "Addonkit/RollbackHandler.hpp"

namespace Addonkit {

DependencyInstaller::DependencyInstaller(const ProjectLayout& layout, const RuntimeRelease& release,
                                         std::string dist_url)
    : m_layout(layout), m_release(release), m_dist_url(std::move(dist_url)) {}

void DependencyInstaller::install() const {
    LOG_INFO("Install", "Fetching Node.js " + m_release.version + " dependencies...");
    installHeaders();
    if (m_release.isWindows()) {
        installImportLibrary();
    }
}

void DependencyInstaller::installHeaders() const {
    try {
        Downloader downloader(m_release.baseUrl(m_dist_url));
        TarGzSink sink(m_layout.root());
        downloader.fetch(m_release.headersArchiveName(), sink);
        LOG_INFO("Install", "Extracted " + std::to_string(sink.entriesExtracted()) + " header files into " +
                            m_release.headerDirName());
    } catch (const std::exception& e) {
        RollbackHandler({m_layout.headerDir(m_release)}, true).handle(e);
        throw;
    }
}

void DependencyInstaller::installImportLibrary() const {
    try {
        m_sys.createDirectories(m_layout.libDir());
        Downloader downloader(m_release.baseUrl(m_dist_url));
        {
            FileSink sink(m_layout.libFile());
            downloader.fetch(m_release.importLibraryPath(), sink);
        }
        LOG_INFO("Install", "Downloaded " + m_release.importLibraryPath());
    } catch (const std::exception& e) {
        RollbackHandler({m_layout.headerDir(m_release), m_layout.libDir()}, true).handle(e);
        throw;
    }
}

} // namespace Addonkit
