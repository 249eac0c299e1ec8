// =================================================================
// tests/RuntimeReleaseTest.cpp
// =================================================================
// Unit tests for RuntimeRelease and ProjectLayout.

#include "TestSupport.hpp"
#include "Addonkit/Errors.hpp"
#include "Addonkit/Logger.hpp"
#include "Addonkit/ProjectLayout.hpp"
#include "Addonkit/RuntimeRelease.hpp"
#include <iostream>

namespace fs = std::filesystem;
using Addonkit::RuntimeRelease;

class RuntimeReleaseTest {
public:
    void testParse() {
        std::cout << "Testing release parsing..." << std::endl;

        RuntimeRelease release = RuntimeRelease::parse("v18.17.0 linux x64\n");
        assert(release.version == "v18.17.0");
        assert(release.platform == "linux");
        assert(release.arch == "x64");
        assert(!release.isWindows());

        RuntimeRelease nightly = RuntimeRelease::parse("v21.0.0-nightly20230801 win32 arm64");
        assert(nightly.version == "v21.0.0-nightly20230801");
        assert(nightly.isWindows());

        std::cout << "✓ Release parsing test passed" << std::endl;
    }

    void testParseRejectsGarbage() {
        std::cout << "Testing malformed release descriptions..." << std::endl;

        for (const std::string text : {"", "18.17.0 linux x64", "v18.17.0", "v18 linux x64", "node: not found"}) {
            bool threw = false;
            try {
                RuntimeRelease::parse(text);
            } catch (const Addonkit::ConfigurationError&) {
                threw = true;
            }
            assert(threw && "Malformed description must be rejected");
        }

        std::cout << "✓ Malformed release descriptions test passed" << std::endl;
    }

    void testDownloadNames() {
        std::cout << "Testing download names..." << std::endl;

        RuntimeRelease release{"v18.17.0", "win32", "x64"};
        assert(release.headerDirName() == "node-v18.17.0");
        assert(release.headersArchiveName() == "node-v18.17.0-headers.tar.gz");
        assert(release.importLibraryPath() == "win-x64/node.lib");
        assert(release.baseUrl("https://nodejs.org/dist") == "https://nodejs.org/dist/v18.17.0");

        std::cout << "✓ Download names test passed" << std::endl;
    }

    void testWindowsArchitectures() {
        std::cout << "Testing Windows architecture mapping..." << std::endl;

        assert((RuntimeRelease{"v1.0.0", "win32", "x64"}.windowsArch() == "win-x64"));
        assert((RuntimeRelease{"v1.0.0", "win32", "arm64"}.windowsArch() == "win-arm64"));
        assert((RuntimeRelease{"v1.0.0", "win32", "ia32"}.windowsArch() == "win-x86"));

        std::cout << "✓ Windows architecture mapping test passed" << std::endl;
    }

    void testDetectUsesNode() {
        std::cout << "Testing release detection..." << std::endl;

        TestSupport::ScriptedRunner runner([](const Addonkit::ProcessSpec& spec) {
            if (spec.program == "/opt/node" && spec.args.size() == 2 && spec.args[0] == "-p") {
                return TestSupport::exitWith(0, "v20.5.1 darwin arm64\n");
            }
            return TestSupport::exitWith(127, "", "unexpected");
        });

        RuntimeRelease release = RuntimeRelease::detect(runner, "/opt/node");
        assert(release.version == "v20.5.1");
        assert(release.platform == "darwin");
        assert(release.arch == "arm64");

        TestSupport::ScriptedRunner broken([](const Addonkit::ProcessSpec&) {
            return TestSupport::exitWith(1, "", "node: bad option");
        });
        bool threw = false;
        try {
            RuntimeRelease::detect(broken, "node");
        } catch (const Addonkit::ProcessError& e) {
            threw = std::string(e.what()) == "node: bad option";
        }
        assert(threw);

        std::cout << "✓ Release detection test passed" << std::endl;
    }

    void testProjectLayout() {
        std::cout << "Testing project layout..." << std::endl;

        const fs::path root = "test_layout";
        fs::remove_all(root);
        Addonkit::ProjectLayout layout(root);
        RuntimeRelease release{"v18.17.0", "linux", "x64"};

        assert(layout.buildDir() == root / "build");
        assert(layout.libFile() == root / "libs" / "node.lib");
        assert(layout.sourceFile() == root / "src" / "module.c");
        assert(layout.includeDir(release) == root / "node-v18.17.0" / "include" / "node");
        assert(layout.artifact("demo") == root / "build" / "demo.node");

        assert(layout.downloadedHeaderDirs().empty() && "Missing root has no downloads");

        fs::create_directories(root / "node-v18.17.0" / "include" / "node");
        fs::create_directories(root / "node-v16.0.0" / "include" / "node");
        fs::create_directories(root / "node-vendor");
        fs::create_directories(root / "src");

        auto dirs = layout.downloadedHeaderDirs();
        assert(dirs.size() == 2);
        assert(dirs[0].filename() == "node-v16.0.0");
        assert(dirs[1].filename() == "node-v18.17.0");

        fs::remove_all(root);
        std::cout << "✓ Project layout test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running RuntimeRelease unit tests..." << std::endl;

        testParse();
        testParseRejectsGarbage();
        testDownloadNames();
        testWindowsArchitectures();
        testDetectUsesNode();
        testProjectLayout();

        std::cout << "All RuntimeRelease tests passed!" << std::endl;
    }
};

int main() {
    try {
        Addonkit::Logger::getInstance().setConsoleLogLevel(Addonkit::LogLevel::CRITICAL);

        RuntimeReleaseTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
