// =================================================================
// include/Addonkit/ProcessRunner.hpp
// =================================================================
// Defines how external programs (cmake, ninja, git, node, which) are
// started and how their exit status is turned into success or failure.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace Addonkit {

/**
 * @brief Description of one program invocation. No shell is involved: the
 *        program is looked up on the search path and receives args verbatim.
 */
struct ProcessSpec {
    std::string program;
    std::vector<std::string> args;
    std::filesystem::path working_directory;  ///< Empty means the current directory
    bool capture_output = true;                ///< False relays stdout/stderr to ours

    std::string describe() const;
};

struct ProcessResult {
    int exit_code = 0;
    std::string std_out;
    std::string std_err;
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Runs a program to completion.
     * @return Exit code plus captured output (empty in relay mode).
     * @throws ProcessError if the program cannot be started.
     */
    virtual ProcessResult run(const ProcessSpec& spec) const;

    /**
     * @brief Runs a program and requires a zero exit code.
     *
     * A non-zero exit throws ProcessError carrying the captured standard
     * error, or "'<program>' exited with code N" when there was none.
     */
    ProcessResult runChecked(const ProcessSpec& spec) const;

    /**
     * @brief Throws the ProcessError runChecked() would for this result.
     */
    static void ensureSuccess(const ProcessSpec& spec, const ProcessResult& result);
};

/**
 * @brief Runs named steps in order and stops at the first failure
 */
class StepRunner {
public:
    explicit StepRunner(const ProcessRunner& runner) : m_runner(runner) {}

    StepRunner& add(const std::string& name, ProcessSpec spec);

    /**
     * @brief Executes every step; the first failing step's ProcessError
     *        propagates and later steps are not started. Standard output of
     *        a failing step is logged since compilers report errors there.
     */
    void run() const;

    size_t size() const { return m_steps.size(); }

private:
    struct Step {
        std::string name;
        ProcessSpec spec;
    };

    const ProcessRunner& m_runner;
    std::vector<Step> m_steps;
};

} // namespace Addonkit
