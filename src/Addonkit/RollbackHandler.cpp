// =================================================================
// src/Addonkit/RollbackHandler.cpp
// =================================================================

#include "Addonkit/RollbackHandler.hpp"
#include "Addonkit/Logger.hpp"

namespace Addonkit {

RollbackHandler::RollbackHandler(std::vector<std::filesystem::path> paths, bool quiet)
    : m_paths(std::move(paths)), m_quiet(quiet) {}

int RollbackHandler::handle(const std::exception& error) const {
    if (!m_quiet) {
        LOG_ERROR("addonkit", error.what());
    }

    if (!m_paths.empty()) {
        if (!m_quiet) {
            LOG_INFO("addonkit", "Cleaning up...");
        }
        for (const auto& path : m_paths) {
            try {
                m_sys.removePath(path, true);
            } catch (const std::exception& e) {
                LOG_DEBUG("addonkit", "Could not clean " + path.string(), e.what());
            }
        }
    }
    return 1;
}

} // namespace Addonkit
