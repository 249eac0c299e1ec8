// =================================================================
// include/Addonkit/Errors.hpp
// =================================================================
// Exception types raised by addonkit operations. Command handlers in
// Core catch these at their boundary and turn them into exit codes.

#pragma once

#include <stdexcept>
#include <string>

namespace Addonkit {

class AddonkitError : public std::runtime_error {
public:
    explicit AddonkitError(const std::string& message) : std::runtime_error(message) {}
};

/// Missing or malformed command-line input.
class UsageError : public AddonkitError {
public:
    using AddonkitError::AddonkitError;
};

/// Something required before a command may run is absent.
class PreconditionError : public AddonkitError {
public:
    using AddonkitError::AddonkitError;
};

class ToolNotFoundError : public PreconditionError {
public:
    explicit ToolNotFoundError(const std::string& tool)
        : PreconditionError("Could not find '" + tool + "' in the path."), m_tool(tool) {}

    const std::string& tool() const { return m_tool; }

private:
    std::string m_tool;
};

class ConfigurationError : public AddonkitError {
public:
    using AddonkitError::AddonkitError;
};

/// An external program could not be started or exited with a non-zero status.
class ProcessError : public AddonkitError {
public:
    explicit ProcessError(const std::string& message, int exit_code = -1)
        : AddonkitError(message), m_exit_code(exit_code) {}

    int exitCode() const { return m_exit_code; }

private:
    int m_exit_code;
};

class DownloadError : public AddonkitError {
public:
    using AddonkitError::AddonkitError;
};

class ArchiveError : public AddonkitError {
public:
    using AddonkitError::AddonkitError;
};

class InvalidPathError : public AddonkitError {
public:
    using AddonkitError::AddonkitError;
};

} // namespace Addonkit
