// =================================================================
// src/Addonkit/ProcessRunner.cpp
// =================================================================
// Implementation for spawning external programs.

#include "Addonkit/ProcessRunner.hpp"
#include "Addonkit/Errors.hpp"
#include "Addonkit/Logger.hpp"
#include <cstring>
#include <sstream>

#if defined(_WIN32)
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef NOGDI
#define NOGDI
#endif
#include <windows.h>
#include <thread>
#else
#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace Addonkit {

std::string ProcessSpec::describe() const {
    std::string text = program;
    for (const auto& arg : args) {
        if (arg.find(' ') != std::string::npos) {
            text += " \"" + arg + "\"";
        } else {
            text += " " + arg;
        }
    }
    return text;
}

#if defined(_WIN32)

// Quotes one argument following the CommandLineToArgvW rules.
static std::string quoteArgument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
        return arg;
    }

    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            backslashes++;
        } else if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted += c;
            backslashes = 0;
        } else {
            quoted.append(backslashes, '\\');
            quoted += c;
            backslashes = 0;
        }
    }
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

static std::string lastErrorMessage() {
    DWORD code = GetLastError();
    char* buffer = nullptr;
    FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                   nullptr, code, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
    std::string message = buffer ? buffer : ("error " + std::to_string(code));
    if (buffer) {
        LocalFree(buffer);
    }
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return message;
}

static void drainPipe(HANDLE pipe, std::string& sink) {
    char buffer[4096];
    DWORD read = 0;
    while (ReadFile(pipe, buffer, sizeof(buffer), &read, nullptr) && read > 0) {
        sink.append(buffer, read);
    }
}

ProcessResult ProcessRunner::run(const ProcessSpec& spec) const {
    LOG_DEBUG("Process", "Running: " + spec.describe());

    std::string command_line = quoteArgument(spec.program);
    for (const auto& arg : spec.args) {
        command_line += " " + quoteArgument(arg);
    }

    SECURITY_ATTRIBUTES attributes{};
    attributes.nLength = sizeof(attributes);
    attributes.bInheritHandle = TRUE;

    HANDLE out_read = nullptr, out_write = nullptr, err_read = nullptr, err_write = nullptr;
    STARTUPINFOA startup{};
    startup.cb = sizeof(startup);

    if (spec.capture_output) {
        if (!CreatePipe(&out_read, &out_write, &attributes, 0) ||
            !CreatePipe(&err_read, &err_write, &attributes, 0)) {
            throw ProcessError("Failed to start '" + spec.program + "': " + lastErrorMessage());
        }
        SetHandleInformation(out_read, HANDLE_FLAG_INHERIT, 0);
        SetHandleInformation(err_read, HANDLE_FLAG_INHERIT, 0);
        startup.dwFlags = STARTF_USESTDHANDLES;
        startup.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
        startup.hStdOutput = out_write;
        startup.hStdError = err_write;
    }

    PROCESS_INFORMATION info{};
    std::string working_directory = spec.working_directory.string();
    BOOL started = CreateProcessA(nullptr, &command_line[0], nullptr, nullptr, TRUE, 0, nullptr,
                                  working_directory.empty() ? nullptr : working_directory.c_str(),
                                  &startup, &info);
    std::string start_error = started ? "" : lastErrorMessage();

    if (spec.capture_output) {
        CloseHandle(out_write);
        CloseHandle(err_write);
    }

    if (!started) {
        if (spec.capture_output) {
            CloseHandle(out_read);
            CloseHandle(err_read);
        }
        throw ProcessError("Failed to start '" + spec.program + "': " + start_error);
    }

    ProcessResult result;
    if (spec.capture_output) {
        std::thread err_reader(drainPipe, err_read, std::ref(result.std_err));
        drainPipe(out_read, result.std_out);
        err_reader.join();
        CloseHandle(out_read);
        CloseHandle(err_read);
    }

    WaitForSingleObject(info.hProcess, INFINITE);
    DWORD exit_code = 0;
    GetExitCodeProcess(info.hProcess, &exit_code);
    CloseHandle(info.hThread);
    CloseHandle(info.hProcess);

    result.exit_code = static_cast<int>(exit_code);
    return result;
}

#else

namespace {

// Owns a pipe's two descriptors and closes whatever is still open. Both
// ends are close-on-exec so children spawned from other threads never
// inherit them; dup2() in the child clears the flag on the copies.
class Pipe {
public:
    Pipe() {
        if (::pipe(m_fds) != 0) {
            m_fds[0] = m_fds[1] = -1;
            return;
        }
        ::fcntl(m_fds[0], F_SETFD, FD_CLOEXEC);
        ::fcntl(m_fds[1], F_SETFD, FD_CLOEXEC);
    }
    ~Pipe() {
        closeRead();
        closeWrite();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool valid() const { return m_fds[0] >= 0 && m_fds[1] >= 0; }
    int readEnd() const { return m_fds[0]; }
    int writeEnd() const { return m_fds[1]; }

    void closeRead() {
        if (m_fds[0] >= 0) {
            ::close(m_fds[0]);
            m_fds[0] = -1;
        }
    }
    void closeWrite() {
        if (m_fds[1] >= 0) {
            ::close(m_fds[1]);
            m_fds[1] = -1;
        }
    }

private:
    int m_fds[2];
};

} // namespace

ProcessResult ProcessRunner::run(const ProcessSpec& spec) const {
    LOG_DEBUG("Process", "Running: " + spec.describe());

    // Everything the child needs is prepared before fork().
    std::vector<std::string> arguments;
    arguments.push_back(spec.program);
    arguments.insert(arguments.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& arg : arguments) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);
    std::string working_directory = spec.working_directory.string();

    Pipe out_pipe, err_pipe, exec_status;
    if (!exec_status.valid() || (spec.capture_output && (!out_pipe.valid() || !err_pipe.valid()))) {
        throw ProcessError("Failed to start '" + spec.program + "': " + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        throw ProcessError("Failed to start '" + spec.program + "': " + std::strerror(errno));
    }

    if (pid == 0) {
        if (!working_directory.empty() && ::chdir(working_directory.c_str()) != 0) {
            int error = errno;
            ssize_t ignored = ::write(exec_status.writeEnd(), &error, sizeof(error));
            (void)ignored;
            ::_exit(127);
        }
        if (spec.capture_output) {
            ::dup2(out_pipe.writeEnd(), STDOUT_FILENO);
            ::dup2(err_pipe.writeEnd(), STDERR_FILENO);
        }
        ::execvp(argv[0], argv.data());
        int error = errno;
        ssize_t ignored = ::write(exec_status.writeEnd(), &error, sizeof(error));
        (void)ignored;
        ::_exit(127);
    }

    exec_status.closeWrite();
    out_pipe.closeWrite();
    err_pipe.closeWrite();

    ProcessResult result;
    if (spec.capture_output) {
        struct pollfd fds[2] = {{out_pipe.readEnd(), POLLIN, 0}, {err_pipe.readEnd(), POLLIN, 0}};
        std::string* sinks[2] = {&result.std_out, &result.std_err};
        int open_streams = 2;
        char buffer[4096];

        while (open_streams > 0) {
            if (::poll(fds, 2, -1) < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            for (int i = 0; i < 2; i++) {
                if (fds[i].fd < 0 || fds[i].revents == 0) {
                    continue;
                }
                ssize_t count = ::read(fds[i].fd, buffer, sizeof(buffer));
                if (count > 0) {
                    sinks[i]->append(buffer, static_cast<size_t>(count));
                } else if (count == 0 || errno != EINTR) {
                    fds[i].fd = -1;
                    open_streams--;
                }
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw ProcessError("Failed to wait for '" + spec.program + "': " + std::strerror(errno));
        }
    }

    int exec_error = 0;
    ssize_t reported = ::read(exec_status.readEnd(), &exec_error, sizeof(exec_error));
    if (reported == static_cast<ssize_t>(sizeof(exec_error))) {
        throw ProcessError("Failed to start '" + spec.program + "': " + std::strerror(exec_error));
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }
    return result;
}

#endif

ProcessResult ProcessRunner::runChecked(const ProcessSpec& spec) const {
    ProcessResult result = run(spec);
    ensureSuccess(spec, result);
    return result;
}

void ProcessRunner::ensureSuccess(const ProcessSpec& spec, const ProcessResult& result) {
    if (result.exit_code == 0) {
        return;
    }

    std::string diagnostics = result.std_err;
    while (!diagnostics.empty() && (diagnostics.back() == '\n' || diagnostics.back() == '\r')) {
        diagnostics.pop_back();
    }
    if (!diagnostics.empty()) {
        throw ProcessError(diagnostics, result.exit_code);
    }
    throw ProcessError("'" + spec.program + "' exited with code " + std::to_string(result.exit_code),
                       result.exit_code);
}

StepRunner& StepRunner::add(const std::string& name, ProcessSpec spec) {
    m_steps.push_back({name, std::move(spec)});
    return *this;
}

void StepRunner::run() const {
    for (const auto& step : m_steps) {
        LOG_INFO("Step", "Running " + step.name + ": " + step.spec.describe());
        ProcessResult result = m_runner.run(step.spec);
        if (result.exit_code != 0 && !result.std_out.empty()) {
            LOG_INFO(step.name, result.std_out);
        } else if (!result.std_out.empty()) {
            LOG_DEBUG(step.name, result.std_out);
        }
        ProcessRunner::ensureSuccess(step.spec, result);
    }
}

} // namespace Addonkit
