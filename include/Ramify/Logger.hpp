// =================================================================
// include/Ramify/Logger.hpp
// =================================================================
// Header for process-wide logging of delegation activity.

#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <memory>
#include <mutex>

namespace Ramify {

/**
 * @brief Log levels for message classification
 */
enum class LogLevel {
    DEBUG,      ///< Detailed debug information
    INFO,       ///< General information
    WARNING,    ///< Warning conditions
    ERROR,      ///< Error conditions
    CRITICAL    ///< Critical conditions
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
 * @brief Thread-safe logging system shared by coordinators and workers
 *
 * Console output is always available. File output with rotation is
 * enabled by calling initialize() with a log directory.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Enable rotating file output
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".ramify/logs",
                   size_t max_log_size = 10 * 1024 * 1024,  // 10MB
                   size_t max_log_files = 5);

    /**
     * @brief Set minimum log level for console output
     * @param level Minimum level to display on console
     */
    void setConsoleLogLevel(LogLevel level);

    /**
     * @brief Set minimum log level for file output
     * @param level Minimum level to write to files
     */
    void setFileLogLevel(LogLevel level);

    /**
     * @brief Enable or disable console logging
     * @param enabled True to enable console output
     */
    void setConsoleLogging(bool enabled);

    void debug(const std::string& component, const std::string& message, const std::string& context = "");
    void info(const std::string& component, const std::string& message, const std::string& context = "");
    void warning(const std::string& component, const std::string& message, const std::string& context = "");
    void error(const std::string& component, const std::string& message, const std::string& context = "");
    void critical(const std::string& component, const std::string& message, const std::string& context = "");

    /**
     * @brief Log the start of a delegation call
     * @param function_name Name of the delegation tool
     * @param session_id Context session id (empty for a root call)
     * @param recursion_level Current depth of the context session
     * @param parallel Whether the call fans out to several children
     */
    void logDelegationStart(const std::string& function_name, const std::string& session_id,
                            int recursion_level, bool parallel);

    /**
     * @brief Log a state change of a child session coordinator
     * @param session_id Child session id
     * @param from Previous state name
     * @param to New state name
     */
    void logChildTransition(const std::string& session_id, const std::string& from, const std::string& to);

    /**
     * @brief Log the aggregate numbers of a parallel run
     * @param strategy Result strategy name
     * @param total Number of work items
     * @param completed Number of successful items
     * @param failed Number of failed items
     * @param duration_ms Run duration in milliseconds
     */
    void logParallelSummary(const std::string& strategy, size_t total, size_t completed,
                            size_t failed, long duration_ms);

    /**
     * @brief Log session start
     * @param command Command being executed
     * @param target Configuration file or other target of the command
     */
    void logSessionStart(const std::string& command, const std::string& target);

    /**
     * @brief Log session end
     * @param command Command that was executed
     * @param exit_code Exit code
     * @param duration_ms Session duration in milliseconds
     */
    void logSessionEnd(const std::string& command, int exit_code, long duration_ms);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    static std::string getLevelName(LogLevel level);
    static std::string getLevelColor(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::mutex m_mutex;
    std::string m_log_dir;
    size_t m_max_log_size = 10 * 1024 * 1024;
    size_t m_max_log_files = 5;
    LogLevel m_console_level = LogLevel::INFO;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_enabled = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    void ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging; an optional third argument is the context
#define LOG_DEBUG(component, ...) \
    Ramify::Logger::getInstance().debug(component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    Ramify::Logger::getInstance().info(component, __VA_ARGS__)

#define LOG_WARNING(component, ...) \
    Ramify::Logger::getInstance().warning(component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    Ramify::Logger::getInstance().error(component, __VA_ARGS__)

#define LOG_CRITICAL(component, ...) \
    Ramify::Logger::getInstance().critical(component, __VA_ARGS__)

} // namespace Ramify
