// =================================================================
// tests/CliParserTest.cpp
// =================================================================
// Unit tests for CliParser: subcommands, aliases, argument checks and
// the exit codes of rejected command lines.

#include "TestSupport.hpp"
#include "Addonkit/CliParser.hpp"
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;
using Addonkit::CliParser;
using Addonkit::Commands;

class CliParserTest {
private:
    struct Outcome {
        bool rejected = false;
        int exit_code = 0;
        std::string output;
        Commands commands;
    };

    // Parses argv the way main() does; the program name is prepended.
    static Outcome parse(const std::vector<std::string>& args) {
        std::vector<const char*> argv{"addonkit"};
        for (const auto& arg : args) {
            argv.push_back(arg.c_str());
        }

        CliParser parser;
        auto app = parser.setupCli();
        Outcome outcome;
        try {
            app->parse(static_cast<int>(argv.size()), argv.data());
        } catch (const CLI::ParseError& e) {
            std::ostringstream out, err;
            outcome.rejected = true;
            outcome.exit_code = parser.handleParseError(e, out, err);
            outcome.output = out.str() + err.str();
        }
        outcome.commands = parser.getCommands();
        return outcome;
    }

    static void assertUsageError(const std::vector<std::string>& args) {
        Outcome outcome = parse(args);
        assert(outcome.rejected);
        assert(outcome.exit_code == 1);
        assert(!outcome.output.empty() && "A usage message is printed");
    }

public:
    void testNoCommandIsUsageError() {
        std::cout << "Testing invocation without a command..." << std::endl;

        assertUsageError({});
        assertUsageError({"-v"});

        std::cout << "✓ Invocation without a command test passed" << std::endl;
    }

    void testNewAndAlias() {
        std::cout << "Testing 'new' and 'create'..." << std::endl;

        Outcome outcome = parse({"new", "demo"});
        assert(!outcome.rejected);
        assert(outcome.commands.active_command == "new");
        assert(outcome.commands.project_name == "demo");
        assert(outcome.commands.directory == ".");

        outcome = parse({"create", "foo"});
        assert(!outcome.rejected);
        assert(outcome.commands.active_command == "new");
        assert(outcome.commands.project_name == "foo");

        // The missing name is reported by the command, not the parser.
        outcome = parse({"new"});
        assert(!outcome.rejected);
        assert(outcome.commands.active_command == "new");
        assert(outcome.commands.project_name.empty());

        std::cout << "✓ 'new' and 'create' test passed" << std::endl;
    }

    void testInitAndAlias() {
        std::cout << "Testing 'init' and 'install'..." << std::endl;

        assert(parse({"init"}).commands.active_command == "init");
        Outcome outcome = parse({"install"});
        assert(!outcome.rejected);
        assert(outcome.commands.active_command == "init");

        assertUsageError({"install", "extra"});

        std::cout << "✓ 'init' and 'install' test passed" << std::endl;
    }

    void testBuildModes() {
        std::cout << "Testing 'build' modes..." << std::endl;

        Outcome outcome = parse({"build"});
        assert(outcome.commands.active_command == "build");
        assert(outcome.commands.build_mode.empty());

        outcome = parse({"build", "debug"});
        assert(!outcome.rejected);
        assert(outcome.commands.build_mode == "debug");

        assert(parse({"build", "release"}).commands.build_mode == "release");
        assertUsageError({"build", "bogus"});

        std::cout << "✓ 'build' modes test passed" << std::endl;
    }

    void testCleanScopes() {
        std::cout << "Testing 'clean' scopes..." << std::endl;

        Outcome outcome = parse({"clean"});
        assert(outcome.commands.active_command == "clean");
        assert(outcome.commands.clean_scope.empty());

        outcome = parse({"clean", "all"});
        assert(!outcome.rejected);
        assert(outcome.commands.clean_scope == "all");

        assertUsageError({"clean", "x"});
        assertUsageError({"clean", "everything"});

        std::cout << "✓ 'clean' scopes test passed" << std::endl;
    }

    void testTest() {
        std::cout << "Testing 'test'..." << std::endl;

        assert(parse({"test"}).commands.active_command == "test");
        assertUsageError({"test", "now"});

        std::cout << "✓ 'test' test passed" << std::endl;
    }

    void testUnknownCommand() {
        std::cout << "Testing unknown commands..." << std::endl;

        assertUsageError({"frobnicate"});
        assertUsageError({"--no-such-flag", "init"});

        std::cout << "✓ Unknown commands test passed" << std::endl;
    }

    void testGlobalOptions() {
        std::cout << "Testing global options..." << std::endl;

        fs::create_directories("test_cli_parser");
        TestSupport::writeFile("test_cli_parser/custom.yml", "napi_version: 6\n");

        Outcome outcome = parse({"-C", "test_cli_parser", "--config", "test_cli_parser/custom.yml", "-v", "build"});
        assert(!outcome.rejected);
        assert(outcome.commands.directory == "test_cli_parser");
        assert(outcome.commands.config_path == "test_cli_parser/custom.yml");
        assert(outcome.commands.verbose);
        assert(!outcome.commands.quiet);

        assert(parse({"--quiet", "clean"}).commands.quiet);

        assertUsageError({"-C", "test_cli_parser/missing", "init"});
        assertUsageError({"--config", "test_cli_parser/missing.yml", "init"});
        assertUsageError({"-v", "-q", "init"});

        fs::remove_all("test_cli_parser");
        std::cout << "✓ Global options test passed" << std::endl;
    }

    void testHelpAndVersionExitZero() {
        std::cout << "Testing --help and --version..." << std::endl;

        Outcome help = parse({"--help"});
        assert(help.rejected);
        assert(help.exit_code == 0);
        assert(help.output.find("new") != std::string::npos);

        Outcome version = parse({"--version"});
        assert(version.rejected);
        assert(version.exit_code == 0);
        assert(version.output.find("1.0.0") != std::string::npos);

        std::cout << "✓ --help and --version test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running CliParser unit tests..." << std::endl;

        testNoCommandIsUsageError();
        testNewAndAlias();
        testInitAndAlias();
        testBuildModes();
        testCleanScopes();
        testTest();
        testUnknownCommand();
        testGlobalOptions();
        testHelpAndVersionExitZero();

        std::cout << "All CliParser tests passed!" << std::endl;
    }
};

int main() {
    try {
        CliParserTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
