// =================================================================
// src/Addonkit/RuntimeRelease.cpp
// =================================================================

#include "Addonkit/RuntimeRelease.hpp"
#include "Addonkit/Errors.hpp"
#include "Addonkit/Logger.hpp"
#include <regex>
#include <sstream>

namespace Addonkit {

std::string RuntimeRelease::windowsArch() const {
    if (arch == "x64") {
        return "win-x64";
    }
    if (arch == "arm64") {
        return "win-arm64";
    }
    return "win-x86";
}

std::string RuntimeRelease::headerDirName() const {
    return "node-" + version;
}

std::string RuntimeRelease::headersArchiveName() const {
    return "node-" + version + "-headers.tar.gz";
}

std::string RuntimeRelease::importLibraryPath() const {
    return windowsArch() + "/node.lib";
}

std::string RuntimeRelease::baseUrl(const std::string& dist_url) const {
    return dist_url + "/" + version;
}

RuntimeRelease RuntimeRelease::parse(const std::string& probe_output) {
    std::istringstream stream(probe_output);
    RuntimeRelease release;
    stream >> release.version >> release.platform >> release.arch;

    static const std::regex version_pattern(R"(v\d+\.\d+\.\d+(-[0-9A-Za-z.]+)?)");
    if (!std::regex_match(release.version, version_pattern) || release.platform.empty() || release.arch.empty()) {
        throw ConfigurationError("Unexpected Node.js release description: '" + probe_output + "'");
    }
    return release;
}

RuntimeRelease RuntimeRelease::detect(const ProcessRunner& runner, const std::string& node_executable) {
    ProcessResult result = runner.runChecked(
        {node_executable, {"-p", "[process.version, process.platform, process.arch].join(' ')"}});
    RuntimeRelease release = parse(result.std_out);
    LOG_DEBUG("Runtime", "Node.js " + release.version + " (" + release.platform + ", " + release.arch + ")");
    return release;
}

} // namespace Addonkit
