// =================================================================
// include/Addonkit/Logger.hpp
// =================================================================
// Header for console and file logging.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace Addonkit {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< Progress of a command
    WARNING,    ///< Something was skipped or degraded
    ERROR,      ///< A command failed
    CRITICAL    ///< The tool itself cannot continue
};

/**
 * @brief Log entry structure
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string component;
    std::string message;
    std::string context;

    LogEntry(LogLevel lvl, const std::string& comp, const std::string& msg, const std::string& ctx = "")
        : timestamp(std::chrono::system_clock::now()), level(lvl), component(comp), message(msg), context(ctx) {}
};

/**
 * @brief Process-wide logger writing to the console and optionally to a file
 *
 * Entries below the console level are dropped from the terminal but still
 * reach the log file when one is configured. WARNING and above go to stderr.
 * All public members are safe to call from several threads.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Open a log file in append mode
     * @param log_file Path of the file; an empty path disables file logging
     * @return True if the file could be opened (or was disabled)
     */
    bool openLogFile(const std::string& log_file);

    /**
     * @brief Set minimum log level for console output
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     */
    void setConsoleLogging(bool enabled);

    /**
     * @brief Enable or disable ANSI colors on the console. Callers turn
     *        colors off when output is not a terminal.
     */
    void setColors(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Parse a level name such as "debug" or "WARN"
     * @param name Level name, case-insensitive
     * @param level Receives the parsed level
     * @return False if the name is not a known level
     */
    static bool parseLevel(const std::string& name, LogLevel& level);

    /**
     * @brief Get log level name as string
     */
    static std::string getLevelName(LogLevel level);

    /**
     * @brief Get log level color for console output
     * @return ANSI color code
     */
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex m_mutex;
    LogLevel m_console_level = LogLevel::INFO;
    bool m_console_enabled = true;
    bool m_colors = true;

    std::unique_ptr<std::ofstream> m_log_file;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color, bool include_timestamp) const;
    static std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
};

// Convenience macros for logging: (component, message[, context])
#define LOG_DEBUG(component, ...) \
    Addonkit::Logger::getInstance().debug(component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    Addonkit::Logger::getInstance().info(component, __VA_ARGS__)

#define LOG_WARNING(component, ...) \
    Addonkit::Logger::getInstance().warning(component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    Addonkit::Logger::getInstance().error(component, __VA_ARGS__)

#define LOG_CRITICAL(component, ...) \
    Addonkit::Logger::getInstance().critical(component, __VA_ARGS__)

} // namespace Addonkit
