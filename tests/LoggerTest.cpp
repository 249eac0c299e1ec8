// =================================================================
// tests/LoggerTest.cpp
// =================================================================
// Unit tests for Logger console and file output.

#include "TestSupport.hpp"
#include "Addonkit/Logger.hpp"
#include <iostream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;
using Addonkit::LogLevel;
using Addonkit::Logger;

/**
 * @brief Redirects std::cout and std::cerr into strings while alive
 */
class CapturedConsole {
public:
    CapturedConsole()
        : m_old_out(std::cout.rdbuf(m_out.rdbuf())), m_old_err(std::cerr.rdbuf(m_err.rdbuf())) {}

    ~CapturedConsole() {
        std::cout.rdbuf(m_old_out);
        std::cerr.rdbuf(m_old_err);
    }

    std::string out() const { return m_out.str(); }
    std::string err() const { return m_err.str(); }

private:
    std::ostringstream m_out;
    std::ostringstream m_err;
    std::streambuf* m_old_out;
    std::streambuf* m_old_err;
};

class LoggerTest {
private:
    Logger& logger = Logger::getInstance();

    void reset() {
        logger.openLogFile("");
        logger.setConsoleLogging(true);
        logger.setConsoleLogLevel(LogLevel::DEBUG);
        logger.setColors(false);
    }

public:
    void testPlainOutputHasNoColors() {
        std::cout << "Testing uncolored console output..." << std::endl;

        reset();
        std::string out;
        {
            CapturedConsole console;
            LOG_INFO("Build", "Success");
            out = console.out();
        }
        assert(out == "[INFO] Build: Success\n");
        assert(out.find('\033') == std::string::npos);

        std::cout << "✓ Uncolored console output test passed" << std::endl;
    }

    void testColoredOutput() {
        std::cout << "Testing colored console output..." << std::endl;

        reset();
        logger.setColors(true);
        std::string out;
        {
            CapturedConsole console;
            LOG_DEBUG("Sys", "Removed build");
            out = console.out();
        }
        assert(out.find(Logger::getLevelColor(LogLevel::DEBUG)) == 0);
        assert(out.find("\033[0m") != std::string::npos);
        assert(out.find("Sys: Removed build") != std::string::npos);

        reset();
        std::cout << "✓ Colored console output test passed" << std::endl;
    }

    void testWarningsGoToStandardError() {
        std::cout << "Testing console stream selection..." << std::endl;

        reset();
        std::string out, err;
        {
            CapturedConsole console;
            LOG_INFO("New", "Generating");
            LOG_WARNING("New", "'git' not found");
            LOG_ERROR("addonkit", "Download failed", "HTTP 404");
            out = console.out();
            err = console.err();
        }
        assert(out == "[INFO] New: Generating\n");
        assert(err == "[WARN] New: 'git' not found\n[ERROR] addonkit: Download failed (HTTP 404)\n");

        std::cout << "✓ Console stream selection test passed" << std::endl;
    }

    void testConsoleLevelAndDisable() {
        std::cout << "Testing console filtering..." << std::endl;

        reset();
        logger.setConsoleLogLevel(LogLevel::WARNING);
        std::string out, err;
        {
            CapturedConsole console;
            LOG_DEBUG("Test", "hidden");
            LOG_INFO("Test", "hidden");
            LOG_WARNING("Test", "shown");
            logger.setConsoleLogging(false);
            LOG_CRITICAL("Test", "silenced");
            out = console.out();
            err = console.err();
        }
        assert(out.empty());
        assert(err == "[WARN] Test: shown\n");

        reset();
        std::cout << "✓ Console filtering test passed" << std::endl;
    }

    void testLogFile() {
        std::cout << "Testing log file output..." << std::endl;

        reset();
        const std::string path = "test_logger.log";
        fs::remove(path);

        assert(logger.openLogFile(path));
        logger.setConsoleLogging(false);
        LOG_DEBUG("Download", "Fetching", "attempt 1");
        logger.openLogFile(path);
        LOG_INFO("Download", "Done");
        logger.openLogFile("");

        const std::string content = TestSupport::readFile(path);
        static const std::regex line_pattern(
            R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3} \[DEBUG\] Download: Fetching \(attempt 1\)\n)"
            R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3} \[INFO\] Download: Done\n)");
        assert(std::regex_match(content, line_pattern) && "Reopening appends timestamped lines");
        assert(content.find('\033') == std::string::npos);

        assert(!logger.openLogFile("test_logger_missing_dir/x.log"));

        fs::remove(path);
        reset();
        std::cout << "✓ Log file output test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Logger unit tests..." << std::endl;

        testPlainOutputHasNoColors();
        testColoredOutput();
        testWarningsGoToStandardError();
        testConsoleLevelAndDisable();
        testLogFile();

        std::cout << "All Logger tests passed!" << std::endl;
    }
};

int main() {
    try {
        LoggerTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
