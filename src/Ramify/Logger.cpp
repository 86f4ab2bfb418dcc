// =================================================================
// src/Ramify/Logger.cpp
// =================================================================
// Implementation for the delegation logging system.

#include "Ramify/Logger.hpp"
#include <algorithm>
#include <iostream>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Ramify {

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::initialize(const std::string& log_dir, size_t max_log_size, size_t max_log_files) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_log_dir = log_dir;
        m_max_log_size = max_log_size;
        m_max_log_files = max_log_files;
        m_current_log_size = 0;

        ensureLogDirectory();

        m_current_log_filename = generateLogFilename();
        m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename, std::ios::app);
        m_file_enabled = m_current_log_file->is_open();
    }

    if (m_file_enabled) {
        info("Logger", "File logging initialized", m_log_dir);
    } else {
        warning("Logger", "Cannot open log file, continuing with console output only", m_current_log_filename);
    }
}

void Logger::setConsoleLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_level = level;
}

void Logger::setFileLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_file_level = level;
}

void Logger::setConsoleLogging(bool enabled) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_console_enabled = enabled;
}

void Logger::debug(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::DEBUG, component, message, context));
}

void Logger::info(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::INFO, component, message, context));
}

void Logger::warning(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::WARNING, component, message, context));
}

void Logger::error(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::ERROR, component, message, context));
}

void Logger::critical(const std::string& component, const std::string& message, const std::string& context) {
    logEntry(LogEntry(LogLevel::CRITICAL, component, message, context));
}

void Logger::logDelegationStart(const std::string& function_name, const std::string& session_id,
                                int recursion_level, bool parallel) {
    std::ostringstream context;
    context << "Session: " << (session_id.empty() ? "<root>" : session_id) << ", ";
    context << "Level: " << recursion_level << ", ";
    context << "Mode: " << (parallel ? "parallel" : "single");

    info("Delegation", "Delegation started: " + function_name, context.str());
}

void Logger::logChildTransition(const std::string& session_id, const std::string& from, const std::string& to) {
    debug("ChildSession", "Session " + session_id + ": " + from + " -> " + to);
}

void Logger::logParallelSummary(const std::string& strategy, size_t total, size_t completed,
                                size_t failed, long duration_ms) {
    std::ostringstream context;
    context << "Strategy: " << strategy << ", ";
    context << "Total: " << total << ", ";
    context << "Completed: " << completed << ", ";
    context << "Failed: " << failed << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (completed > 0) {
        info("ParallelOrchestrator", "Parallel run finished", context.str());
    } else {
        error("ParallelOrchestrator", "Parallel run finished without any successful item", context.str());
    }
}

void Logger::logSessionStart(const std::string& command, const std::string& target) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Target: " << target;

    info("Session", "Session started", context.str());
}

void Logger::logSessionEnd(const std::string& command, int exit_code, long duration_ms) {
    std::ostringstream context;
    context << "Command: " << command << ", ";
    context << "Exit code: " << exit_code << ", ";
    context << "Duration: " << duration_ms << "ms";

    if (exit_code == 0) {
        info("Session", "Session completed successfully", context.str());
    } else {
        error("Session", "Session completed with errors", context.str());
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_current_log_file && m_current_log_file->is_open()) {
        m_current_log_file->flush();
    }
}

std::string Logger::getLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRIT";
        default: return "UNKNOWN";
    }
}

std::string Logger::getLevelColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[90m";     // Dark gray
        case LogLevel::INFO: return "\033[36m";      // Cyan
        case LogLevel::WARNING: return "\033[33m";   // Yellow
        case LogLevel::ERROR: return "\033[31m";     // Red
        case LogLevel::CRITICAL: return "\033[91m";  // Bright red
        default: return "\033[0m";                   // Reset
    }
}

void Logger::logEntry(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(m_mutex);
    writeToConsole(entry);
    writeToFile(entry);
}

void Logger::writeToConsole(const LogEntry& entry) {
    if (!m_console_enabled || entry.level < m_console_level) {
        return;
    }

    std::string formatted = formatEntry(entry, true);
    std::cout << formatted << std::endl;
}

void Logger::writeToFile(const LogEntry& entry) {
    if (!m_file_enabled || !m_current_log_file || entry.level < m_file_level) {
        return;
    }

    rotateLogsIfNeeded();

    std::string formatted = formatEntry(entry, false);
    *m_current_log_file << formatted << std::endl;
    m_current_log_size += formatted.length() + 1;

    // Flush critical and error messages immediately
    if (entry.level >= LogLevel::ERROR) {
        m_current_log_file->flush();
    }
}

std::string Logger::formatEntry(const LogEntry& entry, bool include_color) {
    std::ostringstream formatted;

    formatted << formatTimestamp(entry.timestamp) << " ";

    if (include_color) {
        formatted << getLevelColor(entry.level);
    }
    formatted << "[" << getLevelName(entry.level) << "]";
    if (include_color) {
        formatted << "\033[0m";
    }
    formatted << " ";

    formatted << entry.component << ": ";
    formatted << entry.message;

    if (!entry.context.empty()) {
        formatted << " (" << entry.context << ")";
    }

    return formatted.str();
}

void Logger::rotateLogsIfNeeded() {
    if (m_current_log_size < m_max_log_size) {
        return;
    }

    m_current_log_file.reset();

    m_current_log_filename = generateLogFilename();
    m_current_log_file = std::make_unique<std::ofstream>(m_current_log_filename);
    m_current_log_size = 0;

    // Clean up old log files
    try {
        std::vector<std::filesystem::path> log_files;
        for (const auto& entry : std::filesystem::directory_iterator(m_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                log_files.push_back(entry.path());
            }
        }

        // Newest first
        std::sort(log_files.begin(), log_files.end(),
                 [](const std::filesystem::path& a, const std::filesystem::path& b) {
                     return std::filesystem::last_write_time(a) > std::filesystem::last_write_time(b);
                 });

        for (size_t i = m_max_log_files; i < log_files.size(); i++) {
            std::filesystem::remove(log_files[i]);
        }

    } catch (const std::exception& e) {
        std::cerr << "[WARN] Log rotation failed: " << e.what() << std::endl;
    }
}

std::string Logger::formatTimestamp(const std::chrono::system_clock::time_point& time_point) {
    auto time_t = std::chrono::system_clock::to_time_t(time_point);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t), "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

void Logger::ensureLogDirectory() {
    try {
        std::filesystem::create_directories(m_log_dir);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Cannot create log directory: " << e.what() << std::endl;
        m_log_dir = ".";
    }
}

std::string Logger::generateLogFilename() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::ostringstream filename;
    filename << m_log_dir << "/ramify_";
    filename << std::put_time(std::localtime(&time_t), "%Y%m%d_%H%M%S");
    filename << ".log";

    return filename.str();
}

} // namespace Ramify
