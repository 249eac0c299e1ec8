// =================================================================
// include/Addonkit/RollbackHandler.hpp
// =================================================================
// Failure handling shared by the commands: report the error, undo
// what the failed step created, and produce the exit status.

#pragma once

#include "Addonkit/SysInteraction.hpp"
#include <exception>
#include <filesystem>
#include <vector>

namespace Addonkit {

class RollbackHandler {
public:
    /**
     * @param paths Paths created by the step being guarded; removed on failure.
     * @param quiet Suppresses error reporting. Used by nested cleanups that
     *        rethrow so the outer handler reports and decides the exit status.
     */
    explicit RollbackHandler(std::vector<std::filesystem::path> paths = {}, bool quiet = false);

    /**
     * @brief Reports the error, removes every path best-effort and returns
     *        the exit status (always 1).
     *
     * Failures while removing are logged at debug level and swallowed so they
     * never hide the original error.
     */
    int handle(const std::exception& error) const;

    const std::vector<std::filesystem::path>& paths() const { return m_paths; }

private:
    std::vector<std::filesystem::path> m_paths;
    bool m_quiet;
    SysInteraction m_sys;
};

} // namespace Addonkit
