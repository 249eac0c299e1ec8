// =================================================================
// include/Addonkit/RuntimeRelease.hpp
// =================================================================
// Identity of the Node.js runtime the project is built against. It is
// not stored anywhere; every invocation asks the runtime again.

#pragma once

#include "Addonkit/ProcessRunner.hpp"
#include <string>

namespace Addonkit {

struct RuntimeRelease {
    std::string version;   ///< e.g. "v18.17.0"
    std::string platform;  ///< process.platform, e.g. "linux", "win32"
    std::string arch;      ///< process.arch, e.g. "x64", "ia32", "arm64"

    bool isWindows() const { return platform == "win32"; }

    /**
     * @brief Distribution directory name for the Windows import library:
     *        "win-x64", "win-x86" or "win-arm64".
     */
    std::string windowsArch() const;

    /// Directory the header archive extracts to, e.g. "node-v18.17.0".
    std::string headerDirName() const;

    /// File name of the header archive, e.g. "node-v18.17.0-headers.tar.gz".
    std::string headersArchiveName() const;

    /// Path of node.lib relative to the release base URL.
    std::string importLibraryPath() const;

    /// Release base URL under the distribution URL.
    std::string baseUrl(const std::string& dist_url) const;

    /**
     * @brief Parses "<version> <platform> <arch>" as printed by the probe.
     * @throws ConfigurationError if the text does not look like a release.
     */
    static RuntimeRelease parse(const std::string& probe_output);

    /**
     * @brief Asks a Node.js executable for its release identity.
     * @throws ProcessError if the executable cannot be run.
     */
    static RuntimeRelease detect(const ProcessRunner& runner, const std::string& node_executable);
};

} // namespace Addonkit
