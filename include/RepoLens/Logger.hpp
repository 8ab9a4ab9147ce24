// =================================================================
// include/RepoLens/Logger.hpp
// =================================================================
// Header for component-tagged logging with console and file output.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

namespace RepoLens {

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
 * @brief Process-wide logger shared by the library and the CLI
 *
 * Until initialize() is called the logger only writes WARNING and above to
 * the console and never touches the filesystem, so library users and tests
 * get no log directories created behind their back. Safe to call from the
 * analyzer's worker threads.
 */
class Logger {
public:
    /**
     * @brief Get the singleton logger instance
     * @return Reference to logger instance
     */
    static Logger& getInstance();

    /**
     * @brief Enable file logging
     * @param log_dir Directory for log files
     * @param max_log_size Maximum size per log file (bytes)
     * @param max_log_files Maximum number of log files to keep
     */
    void initialize(const std::string& log_dir = ".repolens/logs",
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
     * @brief Log repository scan results
     * @param root Scanned root directory
     * @param file_count Files placed in the tree
     * @param directory_count Directories placed in the tree
     * @param skipped_count Files skipped by ignore rules
     * @param duration_ms Scan duration in milliseconds
     */
    void logScanSummary(const std::string& root, size_t file_count, size_t directory_count,
                        size_t skipped_count, long duration_ms);

    /**
     * @brief Log relationship analysis results
     * @param analyzed_files Files whose content was analyzed
     * @param relationship_count Relationships emitted
     * @param duration_ms Analysis duration in milliseconds
     * @param cancelled Whether the run was cancelled before completion
     */
    void logAnalysisSummary(size_t analyzed_files, size_t relationship_count,
                            long duration_ms, bool cancelled);

    /**
     * @brief Flush all log buffers
     */
    void flush();

    /**
     * @brief Parse a level name ("debug", "info", "warning", ...)
     * @param name Level name, case-insensitive
     * @param fallback Level returned for unknown names
     */
    static LogLevel parseLevel(const std::string& name, LogLevel fallback = LogLevel::INFO);

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

    // Prevent copying
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string m_log_dir;
    size_t m_max_log_size = 0;
    size_t m_max_log_files = 0;
    LogLevel m_console_level = LogLevel::WARNING;
    LogLevel m_file_level = LogLevel::DEBUG;
    bool m_console_enabled = true;
    bool m_file_enabled = false;

    std::unique_ptr<std::ofstream> m_current_log_file;
    std::string m_current_log_filename;
    size_t m_current_log_size = 0;

    std::mutex m_mutex;

    void logEntry(const LogEntry& entry);
    void writeToConsole(const LogEntry& entry);
    void writeToFile(const LogEntry& entry);
    std::string formatEntry(const LogEntry& entry, bool include_color = false);
    void rotateLogsIfNeeded();
    std::string formatTimestamp(const std::chrono::system_clock::time_point& time_point);
    bool ensureLogDirectory();
    std::string generateLogFilename();
};

// Convenience macros for logging
#define LOG_DEBUG(component, message) \
    RepoLens::Logger::getInstance().debug(component, message)

#define LOG_INFO(component, message) \
    RepoLens::Logger::getInstance().info(component, message)

#define LOG_WARNING(component, message) \
    RepoLens::Logger::getInstance().warning(component, message)

#define LOG_ERROR(component, message) \
    RepoLens::Logger::getInstance().error(component, message)

#define LOG_CRITICAL(component, message) \
    RepoLens::Logger::getInstance().critical(component, message)

} // namespace RepoLens
