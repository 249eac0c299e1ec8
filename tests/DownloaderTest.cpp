// =================================================================
// tests/DownloaderTest.cpp
// =================================================================
// Tests for Downloader and DependencyInstaller against a local
// HTTP server.

#include "TestSupport.hpp"
#include "Addonkit/ArchiveExtractor.hpp"
#include "Addonkit/DependencyInstaller.hpp"
#include "Addonkit/Downloader.hpp"
#include "Addonkit/Errors.hpp"
#include "Addonkit/Logger.hpp"
#include <iostream>

namespace fs = std::filesystem;
using Addonkit::DependencyInstaller;
using Addonkit::DownloadError;
using Addonkit::Downloader;
using Addonkit::ProjectLayout;
using Addonkit::RuntimeRelease;

class DownloaderTest {
private:
    std::string test_dir;
    TestSupport::LocalServer server;

    void resetTestDir() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
        fs::create_directories(test_dir);
    }

    std::string distUrl() const { return server.url() + "/dist"; }

    // Port 9 (discard) is not expected to accept connections on loopback.
    static std::string unreachableDistUrl() { return "http://127.0.0.1:9/dist"; }

public:
    DownloaderTest() : test_dir("test_downloader") {
        server.serve("/dist/v1.0.0/node-v1.0.0-headers.tar.gz", TestSupport::headersArchive("v1.0.0"));
        server.serve("/dist/v1.0.0/win-x64/node.lib", "IMPORT-LIBRARY");
        server.serve("/dist/v2.0.0/node-v2.0.0-headers.tar.gz", TestSupport::headersArchive("v2.0.0"));
        server.serve("/dist/v3.0.0/node-v3.0.0-headers.tar.gz", "this is not gzip");
    }

    ~DownloaderTest() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

    void testSplitUrl() {
        std::cout << "Testing URL splitting..." << std::endl;

        std::string origin, path;
        Downloader::splitUrl("https://nodejs.org/dist/v18.17.0/SHASUMS256.txt", origin, path);
        assert(origin == "https://nodejs.org");
        assert(path == "/dist/v18.17.0/SHASUMS256.txt");

        Downloader::splitUrl("http://127.0.0.1:8080", origin, path);
        assert(origin == "http://127.0.0.1:8080");
        assert(path == "/");

        bool threw = false;
        try {
            Downloader::splitUrl("nodejs.org/dist", origin, path);
        } catch (const DownloadError&) {
            threw = true;
        }
        assert(threw);

        std::cout << "✓ URL splitting test passed" << std::endl;
    }

    void testFetchToFile() {
        std::cout << "Testing file download..." << std::endl;

        resetTestDir();

        Downloader downloader(distUrl() + "/v1.0.0");
        assert(downloader.urlFor("win-x64/node.lib") == distUrl() + "/v1.0.0/win-x64/node.lib");
        {
            Addonkit::FileSink sink(test_dir + "/node.lib");
            downloader.fetch("win-x64/node.lib", sink);
            assert(sink.bytesWritten() == 14);
        }
        assert(TestSupport::readFile(test_dir + "/node.lib") == "IMPORT-LIBRARY");

        std::cout << "✓ File download test passed" << std::endl;
    }

    void testHttpErrorStatus() {
        std::cout << "Testing HTTP error status..." << std::endl;

        resetTestDir();

        Downloader downloader(distUrl() + "/v9.9.9");
        bool threw = false;
        try {
            Addonkit::FileSink sink(test_dir + "/missing.tar.gz");
            downloader.fetch("node-v9.9.9-headers.tar.gz", sink);
        } catch (const DownloadError& e) {
            threw = std::string(e.what()).find("404") != std::string::npos;
        }
        assert(threw && "A 404 must be reported with its status");

        std::cout << "✓ HTTP error status test passed" << std::endl;
    }

    void testConnectionFailure() {
        std::cout << "Testing connection failure..." << std::endl;

        resetTestDir();

        Downloader downloader(unreachableDistUrl() + "/v1.0.0");
        bool threw = false;
        try {
            Addonkit::FileSink sink(test_dir + "/node.lib");
            downloader.fetch("win-x64/node.lib", sink);
        } catch (const DownloadError& e) {
            threw = std::string(e.what()).find("127.0.0.1:9") != std::string::npos;
        }
        assert(threw && "Transport errors name the URL");

        std::cout << "✓ Connection failure test passed" << std::endl;
    }

    void testInstallHeaders() {
        std::cout << "Testing header installation..." << std::endl;

        resetTestDir();

        ProjectLayout layout(test_dir);
        RuntimeRelease release{"v1.0.0", "linux", "x64"};
        DependencyInstaller(layout, release, distUrl()).install();

        assert(fs::is_directory(layout.includeDir(release)));
        assert(fs::exists(layout.includeDir(release) / "node_api.h"));
        assert(!fs::exists(layout.libDir()) && "No import library outside Windows");

        // Installing again overwrites in place.
        DependencyInstaller(layout, release, distUrl()).install();
        assert(fs::exists(layout.includeDir(release) / "node_api.h"));

        std::cout << "✓ Header installation test passed" << std::endl;
    }

    void testInstallWindowsLibrary() {
        std::cout << "Testing import library installation..." << std::endl;

        resetTestDir();

        ProjectLayout layout(test_dir);
        RuntimeRelease release{"v1.0.0", "win32", "x64"};
        DependencyInstaller(layout, release, distUrl()).install();

        assert(fs::is_directory(layout.includeDir(release)));
        assert(TestSupport::readFile(layout.libFile()) == "IMPORT-LIBRARY");

        std::cout << "✓ Import library installation test passed" << std::endl;
    }

    void testFailedLibraryRollsBackHeaders() {
        std::cout << "Testing rollback after a failed import library..." << std::endl;

        resetTestDir();

        // v2.0.0 publishes headers but no win-arm64 library.
        ProjectLayout layout(test_dir);
        RuntimeRelease release{"v2.0.0", "win32", "arm64"};
        bool threw = false;
        try {
            DependencyInstaller(layout, release, distUrl()).install();
        } catch (const DownloadError&) {
            threw = true;
        }
        assert(threw);
        assert(!fs::exists(layout.headerDir(release)));
        assert(!fs::exists(layout.libDir()));
        assert(fs::exists(test_dir) && "The project root itself is left alone");

        std::cout << "✓ Rollback after a failed import library test passed" << std::endl;
    }

    void testFailedHeadersLeaveNothing() {
        std::cout << "Testing rollback after failed headers..." << std::endl;

        resetTestDir();
        ProjectLayout layout(test_dir);

        RuntimeRelease corrupt{"v3.0.0", "linux", "x64"};
        bool threw = false;
        try {
            DependencyInstaller(layout, corrupt, distUrl()).install();
        } catch (const Addonkit::ArchiveError&) {
            threw = true;
        }
        assert(threw && "A body that is not gzip is an archive error");
        assert(!fs::exists(layout.headerDir(corrupt)));

        RuntimeRelease unreachable{"v1.0.0", "linux", "x64"};
        threw = false;
        try {
            DependencyInstaller(layout, unreachable, unreachableDistUrl()).install();
        } catch (const DownloadError&) {
            threw = true;
        }
        assert(threw);
        assert(!fs::exists(layout.headerDir(unreachable)));

        std::cout << "✓ Rollback after failed headers test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Downloader unit tests..." << std::endl;

        testSplitUrl();
        testFetchToFile();
        testHttpErrorStatus();
        testConnectionFailure();
        testInstallHeaders();
        testInstallWindowsLibrary();
        testFailedLibraryRollsBackHeaders();
        testFailedHeadersLeaveNothing();

        std::cout << "All Downloader tests passed!" << std::endl;
    }
};

int main() {
    try {
        Addonkit::Logger::getInstance().setConsoleLogLevel(Addonkit::LogLevel::CRITICAL);

        DownloaderTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
